#pragma once

#include <cstdint>
#include <map>
#include <string>

#include "MediaTypes.h"
#include "media/MediaSource.h"
#include "sync/CancellationToken.h"

namespace mediadrop {

/// Response of one curl transfer
struct HttpResponse {
    int status_code = 0;          // 0 if no response was received
    std::map<std::string, std::string> headers;
    std::string body;
    bool timed_out = false;
    bool cancelled = false;
    std::string error;            // curl error text, empty when a response arrived

    bool TransportOk() const { return error.empty() && status_code != 0; }
    bool IsSuccess() const { return TransportOk() && status_code >= 200 && status_code < 300; }

    /// Case-insensitive header lookup
    std::string Header(const std::string& name) const;
};

/**
 * HttpClient
 *
 * Shared HTTP client for the upload worker and the signed object-store URLs,
 * built on libcurl.
 *
 * Features:
 * - One easy handle per request, so concurrent workers never share a handle
 * - Per-request timeout
 * - Cooperative cancellation polled from curl's progress callback
 * - Query-string escaping for multipart part requests
 */
class HttpClient {
public:
    struct Config {
        std::string base_url;            // Worker base URL (e.g., "https://api.example.com")
        uint32_t timeout_ms = 30000;     // Default request timeout (signing, multipart control)
        std::string user_agent = "mediadrop/1.0";
        bool verify_tls = true;
    };

    /**
     * Constructor
     * @param config Client configuration
     */
    explicit HttpClient(const Config& config);

    // Non-copyable
    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    /**
     * POST a JSON document to a worker path
     * @param path Path below base_url (e.g., "/r2/sign-upload")
     * @param json_body Serialized request body
     * @return HTTP response
     */
    HttpResponse PostJson(const std::string& path, const std::string& json_body);

    /**
     * PUT raw bytes to an absolute URL
     * @param url Full URL (signed URL or worker URL with query)
     * @param payload Request body
     * @param content_type Content-Type header, omitted if empty
     * @param timeout_ms Request timeout, 0 for the configured default
     * @param cancel Aborts the transfer when signalled
     */
    HttpResponse Put(const std::string& url, const ByteBuffer& payload,
                     const std::string& content_type, uint32_t timeout_ms,
                     const CancellationToken& cancel);

    /**
     * Build full URL for a worker request
     * @param server Base server URL
     * @param path Request path
     * @param query_params Optional query parameters (values are URL-escaped)
     * @return Full URL
     */
    static std::string BuildURL(
        const std::string& server,
        const std::string& path,
        const std::map<std::string, std::string>& query_params = {});

    /// URL-escape one query value
    static std::string Escape(const std::string& value);

    void SetLogCallback(LogCallback callback) { log_callback_ = std::move(callback); }

    const Config& GetConfig() const { return config_; }

private:
    struct Request {
        std::string method;
        std::string url;
        const void* body = nullptr;
        size_t body_size = 0;
        std::map<std::string, std::string> headers;
        uint32_t timeout_ms = 0;
        const CancellationToken* cancel = nullptr;
    };

    HttpResponse Perform(const Request& request);

    void Log(const std::string& message);

    Config config_;
    LogCallback log_callback_;
};

} // namespace mediadrop
