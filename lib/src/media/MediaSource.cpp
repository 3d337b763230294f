#include "MediaSource.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace mediadrop {

FileMediaSource::FileMediaSource(std::string path)
    : path_(std::move(path)) {

    std::error_code ec;
    if (!fs::is_regular_file(path_, ec)) {
        throw std::runtime_error("Not a regular file: " + path_);
    }
    size_ = fs::file_size(path_, ec);
    if (ec) {
        throw std::runtime_error("Cannot stat " + path_ + ": " + ec.message());
    }
}

std::string FileMediaSource::Name() const {
    return fs::path(path_).filename().string();
}

ByteBuffer FileMediaSource::Read(uint64_t offset, uint64_t length) const {
    if (offset >= size_) {
        return {};
    }
    length = std::min(length, size_ - offset);

    std::ifstream in(path_, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Cannot open " + path_);
    }
    in.seekg(static_cast<std::streamoff>(offset));

    ByteBuffer buffer(static_cast<size_t>(length));
    in.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(length));
    if (static_cast<uint64_t>(in.gcount()) != length) {
        throw std::runtime_error("Short read from " + path_ + " at offset " + std::to_string(offset));
    }
    return buffer;
}

MemoryMediaSource::MemoryMediaSource(std::string name, ByteBuffer data)
    : name_(std::move(name)), data_(std::move(data)) {
}

ByteBuffer MemoryMediaSource::Read(uint64_t offset, uint64_t length) const {
    if (offset >= data_.size()) {
        return {};
    }
    uint64_t end = std::min<uint64_t>(data_.size(), offset + length);
    return ByteBuffer(data_.begin() + static_cast<std::ptrdiff_t>(offset),
                      data_.begin() + static_cast<std::ptrdiff_t>(end));
}

} // namespace mediadrop
