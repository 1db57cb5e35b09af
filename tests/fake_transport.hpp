#pragma once

#include "geofetch/http_transport.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace geofetch::testing {

// In-memory object server. Bodies are a deterministic function of URL and
// offset; failures are scripted per URL and range start.
class FakeTransport final : public HttpTransport {
public:
    struct Request {
        std::string url;
        std::optional<ByteRange> range;
    };

    void addObject(const std::string& url, std::uint64_t size);
    // The next `times` requests for url (and range start, if given) answer `status`
    // without a body. Status 0 simulates a dropped connection.
    void failNext(const std::string& url, std::optional<std::uint64_t> range_start, long status, int times = 1);
    // The next `times` matching requests deliver one byte less than asked for.
    void shortBodyNext(const std::string& url, std::optional<std::uint64_t> range_start, int times = 1);
    // Range headers are ignored for url: every request is answered 200 with the full body.
    void ignoreRanges(const std::string& url);
    void setLatency(std::chrono::milliseconds latency);

    [[nodiscard]] HttpResponse get(const HttpRequest& request,
                                   const BodySink& sink,
                                   const CancellationToken& cancel) override;

    [[nodiscard]] std::vector<Request> requests() const;
    [[nodiscard]] std::size_t requestCount() const;
    [[nodiscard]] std::size_t requestCount(const std::string& url) const;
    [[nodiscard]] std::size_t peakConcurrentRequests() const;
    [[nodiscard]] std::size_t peakConcurrentObjects() const;
    // Number of distinct threads that have issued a request.
    [[nodiscard]] std::size_t callerThreads() const;

    [[nodiscard]] static char byteAt(const std::string& url, std::uint64_t offset);
    // True when `file` holds exactly the object body served for url.
    [[nodiscard]] static bool matches(const std::filesystem::path& file, const std::string& url, std::uint64_t size);

private:
    using ScriptKey = std::pair<std::string, std::optional<std::uint64_t>>;

    [[nodiscard]] bool consume(std::map<ScriptKey, std::vector<long>>& script, const ScriptKey& exact,
                               const ScriptKey& any, long& out);

    mutable std::mutex mutex_;
    std::map<std::string, std::uint64_t> objects_;
    std::map<ScriptKey, std::vector<long>> failures_;
    std::map<ScriptKey, std::vector<long>> short_bodies_;
    std::map<std::string, bool> ignore_ranges_;
    std::chrono::milliseconds latency_{0};

    std::vector<Request> requests_;
    std::size_t in_flight_{0};
    std::size_t peak_in_flight_{0};
    std::map<std::string, std::size_t> objects_in_flight_;
    std::size_t peak_objects_in_flight_{0};
    std::set<std::thread::id> callers_;
};

} // namespace geofetch::testing
