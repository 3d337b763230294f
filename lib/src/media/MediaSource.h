#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace mediadrop {

using ByteBuffer = std::vector<uint8_t>;

/**
 * MediaSource
 *
 * Opaque handle to the bytes of one input file. Reads are ranged so the
 * multipart path never holds more than one part per worker in memory.
 *
 * Implementations must allow concurrent Read() calls from several part
 * workers.
 */
class MediaSource {
public:
    virtual ~MediaSource() = default;

    /// File name used for identifier inference (no directory component)
    virtual std::string Name() const = 0;

    virtual uint64_t Size() const = 0;

    /**
     * Read a byte range
     * @param offset First byte
     * @param length Number of bytes; clamped to the end of the source
     * @return Bytes read
     * @throws std::runtime_error if the underlying storage cannot be read
     */
    virtual ByteBuffer Read(uint64_t offset, uint64_t length) const = 0;

    ByteBuffer ReadAll() const { return Read(0, Size()); }
};

using MediaSourcePtr = std::shared_ptr<const MediaSource>;

/**
 * FileMediaSource
 *
 * A file on local disk. Size is captured at construction; each Read() opens
 * its own stream so concurrent readers never share a file position.
 */
class FileMediaSource : public MediaSource {
public:
    /**
     * @param path Path to an existing regular file
     * @throws std::runtime_error if the file does not exist
     */
    explicit FileMediaSource(std::string path);

    std::string Name() const override;
    uint64_t Size() const override { return size_; }
    ByteBuffer Read(uint64_t offset, uint64_t length) const override;

    const std::string& Path() const { return path_; }

private:
    std::string path_;
    uint64_t size_ = 0;
};

/// In-memory bytes (generated media, tests)
class MemoryMediaSource : public MediaSource {
public:
    MemoryMediaSource(std::string name, ByteBuffer data);

    std::string Name() const override { return name_; }
    uint64_t Size() const override { return data_.size(); }
    ByteBuffer Read(uint64_t offset, uint64_t length) const override;

private:
    std::string name_;
    ByteBuffer data_;
};

} // namespace mediadrop
