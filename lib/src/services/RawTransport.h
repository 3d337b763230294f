#pragma once

#include <cstdint>
#include <string>

#include "media/MediaSource.h"
#include "sync/CancellationToken.h"

namespace mediadrop {

struct TransferOptions {
    uint32_t timeout_ms = 120000;
    CancellationToken cancel;
};

struct TransportResult {
    bool ok = false;
    int status_code = 0;        // HTTP status, 0 if no response
    bool timed_out = false;
    bool cancelled = false;
    std::string error;

    std::string Describe() const;
};

/**
 * RawTransport
 *
 * Single-shot PUT of a payload to a credentialed URL. Implementations must
 * return once timeout_ms has elapsed and should return promptly after
 * cancellation; failures are reported in the result, not thrown.
 */
class RawTransport {
public:
    virtual ~RawTransport() = default;

    virtual TransportResult Put(const std::string& url, const ByteBuffer& payload,
                                const std::string& content_type,
                                const TransferOptions& options) = 0;
};

inline std::string TransportResult::Describe() const {
    if (ok) return "HTTP " + std::to_string(status_code);
    if (cancelled) return "cancelled";
    if (timed_out) return "timed out";
    if (status_code != 0) {
        return "HTTP " + std::to_string(status_code) + (error.empty() ? "" : ": " + error);
    }
    return error.empty() ? "transport error" : error;
}

} // namespace mediadrop
