#pragma once

#include "protocols/http/HttpClient.h"
#include "services/RawTransport.h"

namespace mediadrop {

/**
 * CurlTransport
 *
 * RawTransport over HttpClient: PUTs the payload to the signed URL with the
 * item's content type. The timeout is raised to a 10 s floor so tiny
 * timeouts cannot fail every transfer.
 */
class CurlTransport : public RawTransport {
public:
    static constexpr uint32_t kMinTimeoutMs = 10000;

    explicit CurlTransport(bool verify_tls = true);

    TransportResult Put(const std::string& url, const ByteBuffer& payload,
                        const std::string& content_type,
                        const TransferOptions& options) override;

    void SetLogCallback(LogCallback callback) { http_.SetLogCallback(std::move(callback)); }

private:
    HttpClient http_;
};

} // namespace mediadrop
