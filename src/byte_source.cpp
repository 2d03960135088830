#include "swiftstore/storage/byte_source.hpp"
#include "swiftstore/storage/errors.hpp"

#include <stdexcept>

namespace swiftstore {

std::span<const uint8_t> BufferSource::next_block() {
    if (consumed_ || data_.empty()) {
        consumed_ = true;
        return {};
    }
    consumed_ = true;
    return std::span<const uint8_t>(data_);
}

StreamSource::StreamSource(std::istream& in, size_t block_size)
    : in_(in) {
    if (block_size == 0) {
        throw std::invalid_argument("block size must be > 0");
    }
    buffer_.resize(block_size);
}

std::span<const uint8_t> StreamSource::next_block() {
    if (done_) return {};

    in_.read(reinterpret_cast<char*>(buffer_.data()),
             static_cast<std::streamsize>(buffer_.size()));
    auto got = in_.gcount();

    if (in_.bad()) {
        done_ = true;
        throw StorageError("Failed to read from input stream");
    }
    if (got <= 0) {
        done_ = true;
        return {};
    }
    if (in_.eof()) {
        // Short final block; the next call reports the end
        done_ = true;
    }
    return std::span<const uint8_t>(buffer_.data(), static_cast<size_t>(got));
}

std::span<const uint8_t> GeneratorSource::next_block() {
    while (!done_) {
        block_.clear();
        if (!generator_(block_)) {
            done_ = true;
            break;
        }
        if (!block_.empty()) {
            return std::span<const uint8_t>(block_);
        }
    }
    return {};
}

}  // namespace swiftstore
