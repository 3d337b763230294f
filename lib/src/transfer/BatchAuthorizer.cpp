#include "BatchAuthorizer.h"

#include <algorithm>

namespace mediadrop {

const std::string* AuthorizationTable::Find(const std::string& primary_key) const {
    auto it = credentials.find(primary_key);
    return it == credentials.end() ? nullptr : &it->second;
}

BatchAuthorizer::BatchAuthorizer(AuthorizationService& service, size_t batch_size)
    : service_(service), batch_size_(std::max<size_t>(1, batch_size)) {
}

AuthorizationTable BatchAuthorizer::Authorize(const std::vector<KeySet>& keys,
                                              const CancellationToken& cancel,
                                              ProgressReporter* progress) {
    AuthorizationTable table;

    for (size_t begin = 0; begin < keys.size(); begin += batch_size_) {
        if (cancel.IsCancelled()) {
            Log("Cancelled before signing keys " + std::to_string(begin) + ".." +
                std::to_string(keys.size()));
            table.cancelled = true;
            break;
        }

        const size_t end = std::min(keys.size(), begin + batch_size_);

        std::vector<SignRequest> requests;
        requests.reserve(end - begin);
        for (size_t i = begin; i < end; ++i) {
            requests.push_back({keys[i].primary_key, keys[i].content_type});
        }

        try {
            table.batch_requests++;
            std::vector<SignedUrl> urls = service_.SignBatch(requests);
            for (auto& signed_url : urls) {
                table.credentials[signed_url.path] = std::move(signed_url.url);
            }
            if (urls.size() < requests.size()) {
                Log("Batch sign returned " + std::to_string(urls.size()) + " of " +
                    std::to_string(requests.size()) + " URLs");
            }
        } catch (const std::exception& e) {
            Log("Batch sign failed for keys " + std::to_string(begin) + ".." + std::to_string(end) +
                ", signing individually: " + e.what());
            DegradeChunk(keys, begin, end, table, progress);
        }
    }

    return table;
}

void BatchAuthorizer::DegradeChunk(const std::vector<KeySet>& keys, size_t begin, size_t end,
                                   AuthorizationTable& table, ProgressReporter* progress) {
    for (size_t i = begin; i < end; ++i) {
        const KeySet& key_set = keys[i];
        try {
            table.individual_requests++;
            table.credentials[key_set.primary_key] =
                service_.SignOne(key_set.primary_key, key_set.content_type);
        } catch (const std::exception& e) {
            Log("Individual sign failed for " + key_set.primary_key + ": " + e.what());

            TransferResult result;
            result.key = key_set.primary_key;
            result.outcome = TransferOutcome::Failed;
            result.error_detail = std::string("authorization failed: ") + e.what();
            table.resolved[key_set.primary_key] = std::move(result);

            if (progress) {
                progress->Tick();
            }
        }
    }
}

std::string BatchAuthorizer::AuthorizeOne(const std::string& key, const std::string& content_type) {
    return service_.SignOne(key, content_type);
}

void BatchAuthorizer::Log(const std::string& message) {
    if (log_callback_) {
        log_callback_("[BatchAuthorizer] " + message);
    }
}

} // namespace mediadrop
