#include "swiftstore/storage/chunk_reader.hpp"
#include "swiftstore/storage/errors.hpp"

#include <algorithm>
#include <stdexcept>
#include <system_error>

namespace swiftstore {

// ============================================================================
// BoundedRangeReader
// ============================================================================

BoundedRangeReader::BoundedRangeReader(const std::filesystem::path& path,
                                       uint64_t start, uint64_t end,
                                       size_t block_size)
    : path_(path)
    , segment_{start, end} {
    if (end < start) {
        throw std::invalid_argument("range end precedes start");
    }
    if (block_size == 0) {
        throw std::invalid_argument("block size must be > 0");
    }

    file_.open(path_, std::ios::binary);
    if (!file_) {
        throw StorageError("Failed to open file: " + path_.string());
    }
    file_.seekg(static_cast<std::streamoff>(start));
    if (!file_) {
        file_.close();
        throw StorageError("Failed to seek to offset " + std::to_string(start) +
                           " in " + path_.string());
    }

    buffer_.resize(block_size);
    if (segment_.length() == 0) {
        file_.close();
    }
}

std::span<const uint8_t> BoundedRangeReader::next_block() {
    uint64_t remaining = segment_.length() - bytes_read_;
    if (remaining == 0) {
        if (file_.is_open()) file_.close();
        return {};
    }

    size_t want = static_cast<size_t>(std::min<uint64_t>(buffer_.size(), remaining));
    file_.read(reinterpret_cast<char*>(buffer_.data()), static_cast<std::streamsize>(want));
    auto got = static_cast<size_t>(file_.gcount());
    if (got != want) {
        file_.close();
        throw StorageError("Short read from " + path_.string() + " at offset " +
                           std::to_string(segment_.start + bytes_read_) +
                           " (file changed during upload?)");
    }

    bytes_read_ += got;
    if (bytes_read_ == segment_.length()) {
        file_.close();
    }
    return std::span<const uint8_t>(buffer_.data(), got);
}

// ============================================================================
// ChunkedFileSegmenter
// ============================================================================

ChunkedFileSegmenter::ChunkedFileSegmenter(const std::filesystem::path& path,
                                           uint64_t chunk_size,
                                           size_t block_size)
    : path_(path)
    , chunk_size_(chunk_size)
    , block_size_(block_size) {
    if (chunk_size_ == 0) {
        throw std::invalid_argument("chunk size must be > 0");
    }

    std::error_code ec;
    total_ = std::filesystem::file_size(path_, ec);
    if (ec) {
        throw StorageError("Cannot determine size of " + path_.string() + ": " + ec.message());
    }
}

std::unique_ptr<BoundedRangeReader> ChunkedFileSegmenter::next() {
    if (done()) {
        return nullptr;
    }

    uint64_t start = cursor_;
    uint64_t end = std::min(start + chunk_size_, total_);
    cursor_ = end;
    return std::make_unique<BoundedRangeReader>(path_, start, end, block_size_);
}

uint64_t ChunkedFileSegmenter::segment_count() const {
    return (total_ + chunk_size_ - 1) / chunk_size_;
}

std::vector<Segment> ChunkedFileSegmenter::plan(uint64_t total, uint64_t chunk_size) {
    if (chunk_size == 0) {
        throw std::invalid_argument("chunk size must be > 0");
    }
    std::vector<Segment> segments;
    segments.reserve(static_cast<size_t>((total + chunk_size - 1) / chunk_size));
    for (uint64_t off = 0; off < total; off += chunk_size) {
        segments.push_back({off, std::min(off + chunk_size, total)});
    }
    return segments;
}

}  // namespace swiftstore
