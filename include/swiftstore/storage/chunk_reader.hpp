#pragma once

#include "swiftstore/core/constants.hpp"
#include "swiftstore/storage/byte_source.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <vector>

namespace swiftstore {

// Byte range [start, end) of a source file
struct Segment {
    uint64_t start = 0;
    uint64_t end = 0;

    uint64_t length() const { return end - start; }
    bool operator==(const Segment&) const = default;
};

/// Streams one segment of a file in small fixed-size blocks.
///
/// The file is opened and positioned on construction. next_block() never
/// returns more than end - start bytes in total, and closes the file as soon
/// as the bound is reached. Destroying a reader that was not drained closes
/// the file too.
class BoundedRangeReader : public ByteSource {
public:
    BoundedRangeReader(const std::filesystem::path& path,
                       uint64_t start, uint64_t end,
                       size_t block_size = constants::DEFAULT_READ_BLOCK_SIZE);

    BoundedRangeReader(const BoundedRangeReader&) = delete;
    BoundedRangeReader& operator=(const BoundedRangeReader&) = delete;

    std::span<const uint8_t> next_block() override;
    std::optional<uint64_t> size_hint() const override { return segment_.length(); }

    const Segment& segment() const { return segment_; }
    uint64_t bytes_read() const { return bytes_read_; }
    bool is_open() const { return file_.is_open(); }

private:
    std::filesystem::path path_;
    Segment segment_;
    std::ifstream file_;
    std::vector<uint8_t> buffer_;
    uint64_t bytes_read_ = 0;
};

/// Splits a file into consecutive chunk_size segments.
///
/// Lazy and single-pass: next() hands out one BoundedRangeReader per segment
/// and returns nullptr once the whole file is covered. The last segment is
/// clipped to the file size, so a size that is an exact multiple of the chunk
/// size ends with a full chunk rather than an empty one. Build a new
/// segmenter for another pass.
class ChunkedFileSegmenter {
public:
    ChunkedFileSegmenter(const std::filesystem::path& path,
                         uint64_t chunk_size,
                         size_t block_size = constants::DEFAULT_READ_BLOCK_SIZE);

    std::unique_ptr<BoundedRangeReader> next();

    bool done() const { return cursor_ >= total_; }
    uint64_t total_size() const { return total_; }
    uint64_t chunk_size() const { return chunk_size_; }

    // ceil(total / chunk_size)
    uint64_t segment_count() const;

    // Segment boundaries for a file of total bytes, without touching the file
    static std::vector<Segment> plan(uint64_t total, uint64_t chunk_size);

private:
    std::filesystem::path path_;
    uint64_t total_;
    uint64_t chunk_size_;
    size_t block_size_;
    uint64_t cursor_ = 0;
};

} // namespace swiftstore
