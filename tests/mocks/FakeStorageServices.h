#pragma once

/**
 * In-process fakes for the upload collaborators.
 *
 * Signed URLs have the form "fake://put/<key>", so the transport can tell
 * which key a PUT is aimed at. All fakes are thread-safe.
 */

#include "lib/src/MediaTypes.h"
#include "lib/src/services/AuthorizationService.h"
#include "lib/src/services/MultipartStorageService.h"
#include "lib/src/services/RawTransport.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace mediadrop {
namespace testing {

inline const std::string kUrlPrefix = "fake://put/";

inline std::string KeyFromUrl(const std::string& url) {
    return url.rfind(kUrlPrefix, 0) == 0 ? url.substr(kUrlPrefix.size()) : url;
}

/// Legacy keys use the unpadded episode folder, e.g. ".../show_1/..."
inline bool IsLegacyKey(const std::string& key, const std::string& legacy_folder) {
    return key.find("/" + legacy_folder + "/") != std::string::npos;
}

class FakeAuthorizationService : public AuthorizationService {
public:
    bool fail_batch = false;              // Every SignBatch throws
    size_t drop_from_batch = 0;           // Omit the last N entries of each batch reply
    std::set<std::string> fail_sign_one;  // Keys SignOne refuses

    std::vector<SignedUrl> SignBatch(const std::vector<SignRequest>& requests) override {
        std::lock_guard<std::mutex> lock(mutex_);
        batch_calls_++;
        batch_sizes_.push_back(requests.size());
        if (fail_batch) {
            throw ServiceError("batch endpoint unavailable", 503);
        }
        std::vector<SignedUrl> urls;
        size_t keep = requests.size() > drop_from_batch ? requests.size() - drop_from_batch : 0;
        for (size_t i = 0; i < keep; ++i) {
            urls.push_back({requests[i].path, kUrlPrefix + requests[i].path});
        }
        return urls;
    }

    std::string SignOne(const std::string& path, const std::string&) override {
        std::lock_guard<std::mutex> lock(mutex_);
        single_calls_++;
        signed_one_.push_back(path);
        if (fail_sign_one.count(path)) {
            throw ServiceError("sign refused for " + path, 403);
        }
        return kUrlPrefix + path;
    }

    size_t BatchCalls() const { std::lock_guard<std::mutex> lock(mutex_); return batch_calls_; }
    size_t SingleCalls() const { std::lock_guard<std::mutex> lock(mutex_); return single_calls_; }
    std::vector<size_t> BatchSizes() const { std::lock_guard<std::mutex> lock(mutex_); return batch_sizes_; }
    std::vector<std::string> SignedOne() const { std::lock_guard<std::mutex> lock(mutex_); return signed_one_; }

private:
    mutable std::mutex mutex_;
    size_t batch_calls_ = 0;
    size_t single_calls_ = 0;
    std::vector<size_t> batch_sizes_;
    std::vector<std::string> signed_one_;
};

class FakeTransport : public RawTransport {
public:
    /// Return true to fail the PUT for this key
    std::function<bool(const std::string& key)> fail_if;
    std::chrono::milliseconds delay{0};   // Simulated transfer time (interrupted by cancellation)

    TransportResult Put(const std::string& url, const ByteBuffer& payload,
                        const std::string& content_type,
                        const TransferOptions& options) override {
        const std::string key = KeyFromUrl(url);
        size_t now = ++in_flight_;
        size_t peak = peak_.load();
        while (now > peak && !peak_.compare_exchange_weak(peak, now)) {
        }

        TransportResult result;
        bool cancelled = delay.count() > 0 && options.cancel.WaitFor(delay);
        --in_flight_;

        std::lock_guard<std::mutex> lock(mutex_);
        attempts_.push_back(key);
        if (cancelled) {
            result.cancelled = true;
            result.error = "aborted";
        } else if (fail_if && fail_if(key)) {
            result.status_code = 500;
            result.error = "injected failure";
        } else {
            result.ok = true;
            result.status_code = 200;
            stored_[key] = payload;
            content_types_[key] = content_type;
        }
        return result;
    }

    size_t PeakInFlight() const { return peak_.load(); }
    size_t Attempts() const { std::lock_guard<std::mutex> lock(mutex_); return attempts_.size(); }
    std::map<std::string, ByteBuffer> Stored() const { std::lock_guard<std::mutex> lock(mutex_); return stored_; }
    std::string ContentType(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = content_types_.find(key);
        return it == content_types_.end() ? std::string() : it->second;
    }

private:
    mutable std::mutex mutex_;
    std::atomic<size_t> in_flight_{0};
    std::atomic<size_t> peak_{0};
    std::vector<std::string> attempts_;
    std::map<std::string, ByteBuffer> stored_;
    std::map<std::string, std::string> content_types_;
};

class FakeMultipartService : public MultipartStorageService {
public:
    std::set<std::string> fail_init;                 // Keys whose InitMultipart throws
    std::function<bool(const std::string& key, uint32_t part)> fail_part;  // Always fail these
    std::map<uint32_t, int> transient_part_failures; // Part number -> failures before success
    bool fail_complete = false;
    std::function<void(uint32_t part)> on_part;      // Called after each stored part

    MultipartSession InitMultipart(const std::string& key, const std::string&) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail_init.count(key)) {
            throw ServiceError("init refused", 500);
        }
        MultipartSession session{key, "upload-" + std::to_string(++next_id_)};
        parts_[session.upload_id] = {};
        opened_.push_back(session.upload_id);
        return session;
    }

    std::string UploadPart(const MultipartSession& session, uint32_t part_number,
                           const ByteBuffer& bytes) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            part_attempts_++;
            if (fail_part && fail_part(session.key, part_number)) {
                throw ServiceError("part rejected", 500);
            }
            auto transient = transient_part_failures.find(part_number);
            if (transient != transient_part_failures.end() && transient->second > 0) {
                transient->second--;
                throw ServiceError("transient part failure", 503);
            }
            parts_[session.upload_id][part_number] = bytes;
        }
        if (on_part) on_part(part_number);
        return "etag-" + std::to_string(part_number);
    }

    void CompleteMultipart(const MultipartSession& session,
                           const std::vector<CompletedPart>& parts) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail_complete) {
            throw ServiceError("complete refused", 500);
        }
        ByteBuffer object;
        uint32_t expected = 1;
        for (const auto& part : parts) {
            if (part.part_number != expected++ || part.etag != "etag-" + std::to_string(part.part_number)) {
                throw ServiceError("parts out of order", 400);
            }
            const ByteBuffer& bytes = parts_[session.upload_id][part.part_number];
            object.insert(object.end(), bytes.begin(), bytes.end());
        }
        objects_[session.key] = object;
        completed_.push_back(session.upload_id);
    }

    void AbortMultipart(const MultipartSession& session) override {
        std::lock_guard<std::mutex> lock(mutex_);
        aborted_.push_back(session.upload_id);
        parts_.erase(session.upload_id);
    }

    std::map<std::string, ByteBuffer> Objects() const { std::lock_guard<std::mutex> lock(mutex_); return objects_; }
    size_t Opened() const { std::lock_guard<std::mutex> lock(mutex_); return opened_.size(); }
    size_t Aborted() const { std::lock_guard<std::mutex> lock(mutex_); return aborted_.size(); }
    size_t Completed() const { std::lock_guard<std::mutex> lock(mutex_); return completed_.size(); }
    size_t PartAttempts() const { std::lock_guard<std::mutex> lock(mutex_); return part_attempts_; }

private:
    mutable std::mutex mutex_;
    uint64_t next_id_ = 0;
    size_t part_attempts_ = 0;
    std::map<std::string, std::map<uint32_t, ByteBuffer>> parts_;
    std::map<std::string, ByteBuffer> objects_;
    std::vector<std::string> opened_;
    std::vector<std::string> aborted_;
    std::vector<std::string> completed_;
};

/// Deterministic payload of `size` bytes
inline ByteBuffer MakeBytes(size_t size, uint8_t seed = 1) {
    ByteBuffer bytes(size);
    for (size_t i = 0; i < size; ++i) {
        bytes[i] = static_cast<uint8_t>((i * 31 + seed) & 0xFF);
    }
    return bytes;
}

inline MediaItem MakeItem(const std::string& name, size_t size, const std::string& mime) {
    return MediaItem::FromSource(std::make_shared<MemoryMediaSource>(name, MakeBytes(size)), mime);
}

/// Records every progress callback; the callback already runs under a lock
struct ProgressLog {
    std::vector<std::pair<uint64_t, uint64_t>> calls;

    ProgressCallback Callback() {
        return [this](uint64_t done, uint64_t total) { calls.emplace_back(done, total); };
    }

    bool Monotonic() const {
        for (size_t i = 1; i < calls.size(); ++i) {
            if (calls[i].first < calls[i - 1].first) return false;
        }
        return true;
    }

    uint64_t Last() const { return calls.empty() ? 0 : calls.back().first; }
};

} // namespace testing
} // namespace mediadrop
