#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "MediaTypes.h"
#include "protocols/http/HttpClient.h"
#include "services/AuthorizationService.h"
#include "services/MultipartStorageService.h"

namespace mediadrop {

/**
 * WorkerApiClient
 *
 * Talks to the upload worker that fronts the object store:
 *
 *   POST /r2/sign-upload            {path, contentType}         -> {url}
 *   POST /r2/sign-upload-batch      {items:[{path, contentType}]} -> {urls:[{path, url}]}
 *   POST /r2/multipart/init         {key, contentType}          -> {uploadId, key}
 *   PUT  /r2/multipart/part?key=&uploadId=&partNumber=  (bytes) -> {etag, partNumber}
 *   POST /r2/multipart/complete     {key, uploadId, parts:[{partNumber, etag}]}
 *   POST /r2/multipart/abort        {key, uploadId}
 *
 * Every failure (transport error, non-2xx, malformed JSON) throws
 * ServiceError carrying the HTTP status when one was received. The worker's
 * {"error": "..."} body, if any, becomes the message.
 *
 * Safe to call from several threads: each call performs its own request.
 */
class WorkerApiClient : public AuthorizationService, public MultipartStorageService {
public:
    struct Config {
        std::string base_url;
        uint32_t sign_timeout_ms = 30000;     // Signing and multipart control calls
        uint32_t part_timeout_ms = 120000;    // One multipart part PUT
        bool verify_tls = true;
    };

    explicit WorkerApiClient(const Config& config);

    // AuthorizationService
    std::vector<SignedUrl> SignBatch(const std::vector<SignRequest>& requests) override;
    std::string SignOne(const std::string& path, const std::string& content_type) override;

    // MultipartStorageService
    MultipartSession InitMultipart(const std::string& key, const std::string& content_type) override;
    std::string UploadPart(const MultipartSession& session, uint32_t part_number,
                           const ByteBuffer& bytes) override;
    void CompleteMultipart(const MultipartSession& session,
                           const std::vector<CompletedPart>& parts) override;
    void AbortMultipart(const MultipartSession& session) override;

    void SetLogCallback(LogCallback callback);

    // Wire format helpers
    static nlohmann::json BuildSignBatchBody(const std::vector<SignRequest>& requests);
    static std::vector<SignedUrl> ParseSignBatchResponse(const std::string& body);
    static std::string ParseSignResponse(const std::string& body);
    static MultipartSession ParseInitResponse(const std::string& body, const std::string& requested_key);
    static std::string ParsePartResponse(const std::string& body);
    static nlohmann::json BuildCompleteBody(const MultipartSession& session,
                                            const std::vector<CompletedPart>& parts);

    /// Message for a failed response: the worker's "error" field, else "HTTP <status>"
    static std::string DescribeFailure(const HttpResponse& response);

private:
    /// POST a JSON body, throwing ServiceError unless the reply is 2xx
    HttpResponse PostChecked(const std::string& path, const nlohmann::json& body,
                             const std::string& what);

    static nlohmann::json ParseJson(const std::string& body, const std::string& what);

    void Log(const std::string& message);

    Config config_;
    HttpClient http_;
    LogCallback log_callback_;
};

} // namespace mediadrop
