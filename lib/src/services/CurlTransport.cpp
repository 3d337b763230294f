#include "CurlTransport.h"

#include <algorithm>

namespace mediadrop {

namespace {

HttpClient::Config MakeConfig(bool verify_tls) {
    HttpClient::Config config;
    config.timeout_ms = 120000;
    config.verify_tls = verify_tls;
    return config;
}

} // namespace

CurlTransport::CurlTransport(bool verify_tls)
    : http_(MakeConfig(verify_tls)) {
}

TransportResult CurlTransport::Put(const std::string& url, const ByteBuffer& payload,
                                   const std::string& content_type,
                                   const TransferOptions& options) {
    const uint32_t timeout_ms = std::max(kMinTimeoutMs, options.timeout_ms);
    HttpResponse response = http_.Put(url, payload, content_type, timeout_ms, options.cancel);

    TransportResult result;
    result.status_code = response.status_code;
    result.timed_out = response.timed_out;
    result.cancelled = response.cancelled;
    result.ok = response.IsSuccess();
    if (!response.TransportOk()) {
        result.error = response.error;
    } else if (!result.ok && !response.body.empty()) {
        result.error = response.body.substr(0, 200);
    }
    return result;
}

} // namespace mediadrop
