#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "media/MediaSource.h"

namespace mediadrop {

/// Identifies one open multipart upload
struct MultipartSession {
    std::string key;
    std::string upload_id;
};

struct CompletedPart {
    uint32_t part_number = 0;   // 1-based
    std::string etag;
};

/**
 * MultipartStorageService
 *
 * Object-store multipart protocol: parts are uploaded independently and the
 * object only appears after CompleteMultipart. Every call throws on failure.
 */
class MultipartStorageService {
public:
    virtual ~MultipartStorageService() = default;

    virtual MultipartSession InitMultipart(const std::string& key, const std::string& content_type) = 0;

    /// @return ETag of the stored part
    virtual std::string UploadPart(const MultipartSession& session, uint32_t part_number,
                                   const ByteBuffer& bytes) = 0;

    /// @param parts Ordered by part number
    virtual void CompleteMultipart(const MultipartSession& session,
                                   const std::vector<CompletedPart>& parts) = 0;

    virtual void AbortMultipart(const MultipartSession& session) = 0;
};

} // namespace mediadrop
