#pragma once

#include <map>
#include <string>
#include <vector>

#include "MediaTypes.h"
#include "services/AuthorizationService.h"
#include "sync/CancellationToken.h"
#include "sync/ProgressReporter.h"

namespace mediadrop {

/// Credentials for a batch, keyed by primary key
struct AuthorizationTable {
    std::map<std::string, std::string> credentials;   // primary key -> signed URL
    std::map<std::string, TransferResult> resolved;   // primary key -> terminal result from the degrade path
    bool cancelled = false;                           // Stopped at a chunk boundary
    size_t batch_requests = 0;
    size_t individual_requests = 0;

    const std::string* Find(const std::string& primary_key) const;
};

/**
 * BatchAuthorizer
 *
 * Requests write credentials in groups (default 100 keys per request)
 * instead of one request per file.
 *
 * If a group request fails outright, that group degrades to one SignOne per
 * key. A key that cannot be signed individually becomes a terminal Failed
 * result for its item only; the rest of the group and batch continue.
 */
class BatchAuthorizer {
public:
    BatchAuthorizer(AuthorizationService& service, size_t batch_size = 100);

    /**
     * Sign the primary key of every KeySet
     * @param keys Keys in plan order
     * @param cancel Checked before each group
     * @param progress Ticked for every key that ends terminal here (may be null)
     */
    AuthorizationTable Authorize(const std::vector<KeySet>& keys,
                                 const CancellationToken& cancel,
                                 ProgressReporter* progress);

    /**
     * Sign one key outside any batch (legacy fallback, single files)
     * @throws whatever the service throws
     */
    std::string AuthorizeOne(const std::string& key, const std::string& content_type);

    void SetLogCallback(LogCallback callback) { log_callback_ = std::move(callback); }

    size_t BatchSize() const { return batch_size_; }

private:
    void DegradeChunk(const std::vector<KeySet>& keys, size_t begin, size_t end,
                      AuthorizationTable& table, ProgressReporter* progress);

    void Log(const std::string& message);

    AuthorizationService& service_;
    size_t batch_size_;
    LogCallback log_callback_;
};

} // namespace mediadrop
