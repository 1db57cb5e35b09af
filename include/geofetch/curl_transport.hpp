#pragma once

#include "http_transport.hpp"

namespace geofetch {

// libcurl easy-handle transport, one handle per request. The first instance
// initializes libcurl for the process; throws std::runtime_error if that fails.
class CurlTransport final : public HttpTransport {
public:
    CurlTransport();

    [[nodiscard]] HttpResponse get(const HttpRequest& request,
                                   const BodySink& sink,
                                   const CancellationToken& cancel) override;
};

} // namespace geofetch
