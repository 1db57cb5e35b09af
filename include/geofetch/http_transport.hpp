#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace geofetch {

class CancellationToken;

// Inclusive byte interval, as sent in "Range: bytes=<start>-<end>".
struct ByteRange {
    std::uint64_t start{0};
    std::uint64_t end{0};

    [[nodiscard]] std::uint64_t length() const noexcept { return end - start + 1; }
};

struct HttpRequest {
    std::string url;
    std::optional<ByteRange> range;
    std::chrono::seconds connect_timeout{30};
    std::chrono::seconds low_speed_time{60};
};

enum class TransportStatus {
    Ok,
    Timeout,
    ConnectionFailed,
    SinkRejected,
    Cancelled,
    Failed
};

struct HttpResponse {
    long status{0};
    TransportStatus transport{TransportStatus::Ok};
    std::string error;
    std::uint64_t body_bytes{0};
};

class HttpTransport {
public:
    using BodySink = std::function<bool(const char* data, std::size_t size)>;

    virtual ~HttpTransport() = default;

    // Performs one GET. Body bytes reach `sink` only while the status is the
    // expected success status (206 for a ranged request, 200 otherwise); on any
    // other status the body is dropped and the transfer abandoned. A sink
    // returning false aborts the transfer with SinkRejected.
    [[nodiscard]] virtual HttpResponse get(const HttpRequest& request,
                                           const BodySink& sink,
                                           const CancellationToken& cancel) = 0;
};

} // namespace geofetch
