#include "WorkerApiClient.h"

#include <algorithm>
#include <stdexcept>

namespace mediadrop {

using json = nlohmann::json;

namespace {

HttpClient::Config MakeHttpConfig(const WorkerApiClient::Config& config) {
    HttpClient::Config http;
    http.base_url = config.base_url;
    http.timeout_ms = config.sign_timeout_ms;
    http.verify_tls = config.verify_tls;
    return http;
}

std::string RequireString(const json& object, const char* field, const std::string& what) {
    auto it = object.find(field);
    if (it == object.end() || !it->is_string() || it->get<std::string>().empty()) {
        throw ServiceError(what + ": response is missing \"" + field + "\"");
    }
    return it->get<std::string>();
}

} // namespace

WorkerApiClient::WorkerApiClient(const Config& config)
    : config_(config), http_(MakeHttpConfig(config)) {
    if (config_.base_url.empty()) {
        throw std::invalid_argument("WorkerApiClient: base URL is empty");
    }
}

void WorkerApiClient::SetLogCallback(LogCallback callback) {
    log_callback_ = callback;
    http_.SetLogCallback(std::move(callback));
}

std::vector<SignedUrl> WorkerApiClient::SignBatch(const std::vector<SignRequest>& requests) {
    if (requests.empty()) {
        return {};
    }
    HttpResponse response = PostChecked("/r2/sign-upload-batch", BuildSignBatchBody(requests),
                                        "batch sign");
    return ParseSignBatchResponse(response.body);
}

std::string WorkerApiClient::SignOne(const std::string& path, const std::string& content_type) {
    json body = {{"path", path}, {"contentType", content_type}};
    HttpResponse response = PostChecked("/r2/sign-upload", body, "sign " + path);
    return ParseSignResponse(response.body);
}

MultipartSession WorkerApiClient::InitMultipart(const std::string& key, const std::string& content_type) {
    json body = {{"key", key}, {"contentType", content_type}};
    HttpResponse response = PostChecked("/r2/multipart/init", body, "multipart init");
    MultipartSession session = ParseInitResponse(response.body, key);
    Log("Multipart session " + session.upload_id + " opened for " + session.key);
    return session;
}

std::string WorkerApiClient::UploadPart(const MultipartSession& session, uint32_t part_number,
                                        const ByteBuffer& bytes) {
    const std::string url = HttpClient::BuildURL(config_.base_url, "/r2/multipart/part", {
        {"key", session.key},
        {"uploadId", session.upload_id},
        {"partNumber", std::to_string(part_number)},
    });

    // Parts are never cancelled mid-flight; the uploader checks between parts
    CancellationToken no_cancel;
    HttpResponse response = http_.Put(url, bytes, std::string(), config_.part_timeout_ms, no_cancel);
    if (!response.IsSuccess()) {
        throw ServiceError("part " + std::to_string(part_number) + ": " + DescribeFailure(response),
                           response.status_code);
    }
    return ParsePartResponse(response.body);
}

void WorkerApiClient::CompleteMultipart(const MultipartSession& session,
                                        const std::vector<CompletedPart>& parts) {
    PostChecked("/r2/multipart/complete", BuildCompleteBody(session, parts), "multipart complete");
}

void WorkerApiClient::AbortMultipart(const MultipartSession& session) {
    json body = {{"key", session.key}, {"uploadId", session.upload_id}};
    PostChecked("/r2/multipart/abort", body, "multipart abort");
    Log("Multipart session " + session.upload_id + " aborted");
}

json WorkerApiClient::BuildSignBatchBody(const std::vector<SignRequest>& requests) {
    json items = json::array();
    for (const auto& request : requests) {
        items.push_back({{"path", request.path}, {"contentType", request.content_type}});
    }
    return json{{"items", items}};
}

std::vector<SignedUrl> WorkerApiClient::ParseSignBatchResponse(const std::string& body) {
    json parsed = ParseJson(body, "batch sign");
    auto urls = parsed.find("urls");
    if (urls == parsed.end() || !urls->is_array()) {
        throw ServiceError("batch sign: response is missing \"urls\"");
    }

    std::vector<SignedUrl> result;
    result.reserve(urls->size());
    for (const auto& entry : *urls) {
        // The worker drops entries it could not sign
        if (!entry.is_object()) {
            continue;
        }
        auto path = entry.find("path");
        auto url = entry.find("url");
        if (path == entry.end() || url == entry.end() || !path->is_string() || !url->is_string()) {
            continue;
        }
        result.push_back(SignedUrl{path->get<std::string>(), url->get<std::string>()});
    }
    return result;
}

std::string WorkerApiClient::ParseSignResponse(const std::string& body) {
    return RequireString(ParseJson(body, "sign"), "url", "sign");
}

MultipartSession WorkerApiClient::ParseInitResponse(const std::string& body,
                                                    const std::string& requested_key) {
    json parsed = ParseJson(body, "multipart init");
    MultipartSession session;
    session.upload_id = RequireString(parsed, "uploadId", "multipart init");
    session.key = parsed.value("key", requested_key);
    if (session.key.empty()) {
        session.key = requested_key;
    }
    return session;
}

std::string WorkerApiClient::ParsePartResponse(const std::string& body) {
    return RequireString(ParseJson(body, "upload part"), "etag", "upload part");
}

json WorkerApiClient::BuildCompleteBody(const MultipartSession& session,
                                        const std::vector<CompletedPart>& parts) {
    std::vector<CompletedPart> ordered = parts;
    std::sort(ordered.begin(), ordered.end(), [](const CompletedPart& a, const CompletedPart& b) {
        return a.part_number < b.part_number;
    });

    json list = json::array();
    for (const auto& part : ordered) {
        list.push_back({{"partNumber", part.part_number}, {"etag", part.etag}});
    }
    return json{{"key", session.key}, {"uploadId", session.upload_id}, {"parts", list}};
}

std::string WorkerApiClient::DescribeFailure(const HttpResponse& response) {
    if (!response.TransportOk()) {
        if (response.timed_out) return "timed out";
        return response.error.empty() ? "no response" : response.error;
    }

    std::string message = "HTTP " + std::to_string(response.status_code);
    json parsed = json::parse(response.body, nullptr, false);
    if (!parsed.is_discarded() && parsed.is_object()) {
        auto error = parsed.find("error");
        if (error != parsed.end() && error->is_string()) {
            message += ": " + error->get<std::string>();
        }
    }
    return message;
}

HttpResponse WorkerApiClient::PostChecked(const std::string& path, const json& body,
                                          const std::string& what) {
    HttpResponse response = http_.PostJson(path, body.dump());
    if (!response.IsSuccess()) {
        throw ServiceError(what + " failed: " + DescribeFailure(response), response.status_code);
    }
    return response;
}

json WorkerApiClient::ParseJson(const std::string& body, const std::string& what) {
    json parsed = json::parse(body, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        throw ServiceError(what + ": malformed JSON response");
    }
    return parsed;
}

void WorkerApiClient::Log(const std::string& message) {
    if (log_callback_) {
        log_callback_("[WorkerApiClient] " + message);
    }
}

} // namespace mediadrop
