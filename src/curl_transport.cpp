#include "geofetch/curl_transport.hpp"
#include "geofetch/cancellation.hpp"

#include <cstdlib>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

#include <curl/curl.h>
#include <fmt/format.h>

namespace geofetch {

namespace {

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

std::once_flag g_curl_init;

void initCurlOnce() {
    std::call_once(g_curl_init, [] {
        const CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (rc != CURLE_OK) {
            throw std::runtime_error(fmt::format("curl_global_init failed: {}", curl_easy_strerror(rc)));
        }
        std::atexit(curl_global_cleanup);
    });
}

struct TransferContext {
    CURL* curl{nullptr};
    const HttpTransport::BodySink* sink{nullptr};
    const CancellationToken* cancel{nullptr};
    long expected_status{200};
    long status{0};
    std::uint64_t delivered{0};
    bool status_rejected{false};
    bool sink_rejected{false};
};

size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<TransferContext*>(userdata);
    if (!ctx || !ctx->sink) {
        return 0;
    }

    const size_t total = size * nmemb;
    if (total == 0) {
        return 0;
    }

    // Error and unexpected-status bodies never reach the destination file.
    curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &ctx->status);
    if (ctx->status != ctx->expected_status) {
        ctx->status_rejected = true;
        return 0;
    }

    if (!(*ctx->sink)(ptr, total)) {
        ctx->sink_rejected = true;
        return 0;
    }

    ctx->delivered += total;
    return total;
}

int progressCallback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const auto* ctx = static_cast<TransferContext*>(clientp);
    return (ctx && ctx->cancel && ctx->cancel->isCancelled()) ? 1 : 0;
}

TransportStatus classify(CURLcode code) {
    switch (code) {
    case CURLE_OK:
        return TransportStatus::Ok;
    case CURLE_OPERATION_TIMEDOUT:
        return TransportStatus::Timeout;
    case CURLE_COULDNT_RESOLVE_PROXY:
    case CURLE_COULDNT_RESOLVE_HOST:
    case CURLE_COULDNT_CONNECT:
    case CURLE_SEND_ERROR:
    case CURLE_RECV_ERROR:
    case CURLE_GOT_NOTHING:
    case CURLE_PARTIAL_FILE:
    case CURLE_SSL_CONNECT_ERROR:
        return TransportStatus::ConnectionFailed;
    case CURLE_ABORTED_BY_CALLBACK:
        return TransportStatus::Cancelled;
    default:
        return TransportStatus::Failed;
    }
}

} // namespace

CurlTransport::CurlTransport() { initCurlOnce(); }

HttpResponse CurlTransport::get(const HttpRequest& request,
                                const BodySink& sink,
                                const CancellationToken& cancel) {
    HttpResponse response;

    CurlHandle curl{curl_easy_init(), &curl_easy_cleanup};
    if (!curl) {
        response.transport = TransportStatus::Failed;
        response.error = "Failed to allocate curl handle";
        return response;
    }

    TransferContext ctx;
    ctx.curl = curl.get();
    ctx.sink = &sink;
    ctx.cancel = &cancel;
    ctx.expected_status = request.range ? 206 : 200;

    std::string range;
    if (request.range) {
        range = fmt::format("{}-{}", request.range->start, request.range->end);
        curl_easy_setopt(curl.get(), CURLOPT_RANGE, range.c_str());
    }

    curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &writeCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, &progressCallback);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &ctx);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, static_cast<long>(request.connect_timeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_TIME, static_cast<long>(request.low_speed_time.count()));

    const CURLcode res = curl_easy_perform(curl.get());

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    response.body_bytes = ctx.delivered;

    if (res == CURLE_OK) {
        return response;
    }
    if (ctx.status_rejected || res == CURLE_HTTP_RETURNED_ERROR) {
        // The status code carries the outcome.
        response.error = fmt::format("HTTP {}", response.status);
        return response;
    }
    if (ctx.sink_rejected) {
        response.transport = TransportStatus::SinkRejected;
        response.error = "Response body rejected by writer";
        return response;
    }

    response.transport = classify(res);
    response.error = fmt::format("curl error: {}", curl_easy_strerror(res));
    return response;
}

} // namespace geofetch
