#pragma once

#include <cstdint>
#include <functional>
#include <istream>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace swiftstore {

// Forward-only producer of request body bytes.
//
// next_block() returns the next block, valid until the following call.
// An empty block marks the end of the data; after that every call returns
// an empty block.
class ByteSource {
public:
    virtual ~ByteSource() = default;

    virtual std::span<const uint8_t> next_block() = 0;

    // Total length when known up front (enables Content-Length instead of
    // chunked transfer encoding)
    virtual std::optional<uint64_t> size_hint() const { return std::nullopt; }
};

// A single in-memory buffer, returned as one block
class BufferSource : public ByteSource {
public:
    BufferSource() = default;
    explicit BufferSource(std::vector<uint8_t> data) : data_(std::move(data)) {}
    explicit BufferSource(const std::string& data) : data_(data.begin(), data.end()) {}

    std::span<const uint8_t> next_block() override;
    std::optional<uint64_t> size_hint() const override { return data_.size(); }

private:
    std::vector<uint8_t> data_;
    bool consumed_ = false;
};

// Reads a caller-owned std::istream in fixed-size blocks. Length unknown.
class StreamSource : public ByteSource {
public:
    explicit StreamSource(std::istream& in, size_t block_size = 8192);

    std::span<const uint8_t> next_block() override;

private:
    std::istream& in_;
    std::vector<uint8_t> buffer_;
    bool done_ = false;
};

// Adapts a caller-supplied generator. The generator fills `block` and returns
// true, or returns false once it has nothing more to give. Empty blocks are
// skipped.
class GeneratorSource : public ByteSource {
public:
    using Generator = std::function<bool(std::vector<uint8_t>& block)>;

    explicit GeneratorSource(Generator generator) : generator_(std::move(generator)) {}

    std::span<const uint8_t> next_block() override;

private:
    Generator generator_;
    std::vector<uint8_t> block_;
    bool done_ = false;
};

} // namespace swiftstore
