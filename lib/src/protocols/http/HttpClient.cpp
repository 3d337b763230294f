#include "HttpClient.h"
#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <vector>

namespace mediadrop {

namespace {

std::once_flag g_curl_init_flag;

void EnsureCurlInitialized() {
    std::call_once(g_curl_init_flag, []() {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw std::runtime_error("Failed to initialize libcurl");
        }
    });
}

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return value;
}

struct CurlHandleDeleter {
    void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};

struct SlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

// libcurl write callback - accumulates response body
size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total_size = size * nmemb;
    auto* buffer = static_cast<std::string*>(userp);
    buffer->append(static_cast<const char*>(contents), total_size);
    return total_size;
}

// libcurl header callback - captures response headers
size_t HeaderCallback(char* buffer, size_t size, size_t nitems, void* userp) {
    size_t total_size = size * nitems;
    auto* headers = static_cast<std::map<std::string, std::string>*>(userp);

    std::string header_line(buffer, total_size);

    // Remove trailing \r\n
    while (!header_line.empty() &&
           (header_line.back() == '\r' || header_line.back() == '\n')) {
        header_line.pop_back();
    }

    if (header_line.empty()) {
        return total_size;
    }

    // Parse "Key: Value" format
    size_t colon_pos = header_line.find(':');
    if (colon_pos != std::string::npos) {
        std::string key = header_line.substr(0, colon_pos);
        std::string value = header_line.substr(colon_pos + 1);

        size_t first = value.find_first_not_of(" \t");
        value = (first != std::string::npos) ? value.substr(first) : std::string();

        (*headers)[key] = value;
    }

    return total_size;
}

// libcurl progress callback - non-zero return aborts the transfer
int CancelCallback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const auto* cancel = static_cast<const CancellationToken*>(clientp);
    return (cancel && cancel->IsCancelled()) ? 1 : 0;
}

} // namespace

std::string HttpResponse::Header(const std::string& name) const {
    const std::string wanted = ToLower(name);
    for (const auto& [key, value] : headers) {
        if (ToLower(key) == wanted) {
            return value;
        }
    }
    return std::string();
}

HttpClient::HttpClient(const Config& config)
    : config_(config) {
    EnsureCurlInitialized();
}

HttpResponse HttpClient::PostJson(const std::string& path, const std::string& json_body) {
    Request request;
    request.method = "POST";
    request.url = BuildURL(config_.base_url, path);
    request.body = json_body.data();
    request.body_size = json_body.size();
    request.headers["Content-Type"] = "application/json";
    request.headers["Accept"] = "application/json";
    request.timeout_ms = config_.timeout_ms;
    return Perform(request);
}

HttpResponse HttpClient::Put(const std::string& url, const ByteBuffer& payload,
                             const std::string& content_type, uint32_t timeout_ms,
                             const CancellationToken& cancel) {
    Request request;
    request.method = "PUT";
    request.url = url;
    request.body = payload.data();
    request.body_size = payload.size();
    if (!content_type.empty()) {
        request.headers["Content-Type"] = content_type;
    }
    request.timeout_ms = timeout_ms != 0 ? timeout_ms : config_.timeout_ms;
    request.cancel = &cancel;
    return Perform(request);
}

HttpResponse HttpClient::Perform(const Request& request) {
    HttpResponse response;

    std::unique_ptr<CURL, CurlHandleDeleter> handle(curl_easy_init());
    if (!handle) {
        response.error = "libcurl initialization failed";
        Log("libcurl error: " + response.error);
        return response;
    }
    CURL* curl = handle.get();

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, HeaderCallback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout_ms));
    curl_easy_setopt(curl, CURLOPT_USERAGENT, config_.user_agent.c_str());

    if (!config_.verify_tls) {
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 0L);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 0L);
    }

    // Body is sent as-is; POSTFIELDS with a custom request works for PUT too
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request.body_size));
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body_size ? request.body : "");

    std::vector<std::string> header_lines;
    for (const auto& [name, value] : request.headers) {
        header_lines.push_back(name + ": " + value);
    }
    // Suppress the "Expect: 100-continue" round-trip on large PUT bodies
    header_lines.push_back("Expect:");

    std::unique_ptr<curl_slist, SlistDeleter> header_list;
    for (const auto& line : header_lines) {
        curl_slist* appended = curl_slist_append(header_list.get(), line.c_str());
        if (!appended) {
            response.error = "failed to build request headers";
            return response;
        }
        header_list.release();
        header_list.reset(appended);
    }
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list.get());

    if (request.cancel) {
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, CancelCallback);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA, request.cancel);
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    }

    CURLcode res = curl_easy_perform(curl);

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);

    if (res != CURLE_OK) {
        response.error = curl_easy_strerror(res);
        response.timed_out = (res == CURLE_OPERATION_TIMEDOUT);
        response.cancelled = (res == CURLE_ABORTED_BY_CALLBACK);
        response.status_code = 0;
        if (!response.cancelled) {
            Log("libcurl error: " + response.error + " (" + request.method + ")");
        }
        return response;
    }

    response.status_code = static_cast<int>(http_code);
    return response;
}

std::string HttpClient::BuildURL(
    const std::string& server,
    const std::string& path,
    const std::map<std::string, std::string>& query_params) {

    // Remove trailing slash from server
    std::string base = server;
    if (!base.empty() && base.back() == '/') {
        base.pop_back();
    }

    // Ensure path starts with /
    std::string full_path = path;
    if (full_path.empty() || full_path[0] != '/') {
        full_path = "/" + full_path;
    }

    std::string url = base + full_path;

    if (!query_params.empty()) {
        url += "?";
        bool first = true;
        for (const auto& [key, value] : query_params) {
            if (!first) url += "&";
            url += Escape(key) + "=" + Escape(value);
            first = false;
        }
    }

    return url;
}

std::string HttpClient::Escape(const std::string& value) {
    EnsureCurlInitialized();
    char* escaped = curl_easy_escape(nullptr, value.c_str(), static_cast<int>(value.size()));
    if (!escaped) {
        throw std::runtime_error("curl_easy_escape failed");
    }
    std::string result(escaped);
    curl_free(escaped);
    return result;
}

void HttpClient::Log(const std::string& message) {
    if (log_callback_) {
        log_callback_("[HttpClient] " + message);
    }
}

} // namespace mediadrop
