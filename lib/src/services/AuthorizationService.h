#pragma once

#include <string>
#include <vector>

namespace mediadrop {

struct SignRequest {
    std::string path;
    std::string content_type;
};

struct SignedUrl {
    std::string path;
    std::string url;
};

/**
 * AuthorizationService
 *
 * Issues short-lived write credentials (signed upload URLs), one per key.
 * Both calls throw ServiceError (or any std::exception) on failure.
 */
class AuthorizationService {
public:
    virtual ~AuthorizationService() = default;

    /// One round-trip for many keys. Keys missing from the reply are unsigned.
    virtual std::vector<SignedUrl> SignBatch(const std::vector<SignRequest>& requests) = 0;

    virtual std::string SignOne(const std::string& path, const std::string& content_type) = 0;
};

} // namespace mediadrop
