#pragma once

#include "swiftstore/core/constants.hpp"
#include "swiftstore/storage/byte_source.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

struct evp_md_ctx_st;

namespace swiftstore {

/// Tee between a body source and the transport.
///
/// Every block pulled through next_block() is added to a running digest
/// before it is handed on, so the bytes are read once and hashed once.
/// Once the inner source is exhausted, hexdigest() returns the lowercase hex
/// digest of exactly the bytes that were handed out.
class HashingUploadPipe : public ByteSource {
public:
    /// @param source     Inner source; must outlive the pipe.
    /// @param algorithm  OpenSSL digest name ("md5", "sha256", ...).
    /// @throws std::invalid_argument for an unknown algorithm.
    explicit HashingUploadPipe(ByteSource& source,
                               const std::string& algorithm = constants::DEFAULT_HASH_ALGORITHM);
    ~HashingUploadPipe() override;

    HashingUploadPipe(const HashingUploadPipe&) = delete;
    HashingUploadPipe& operator=(const HashingUploadPipe&) = delete;

    std::span<const uint8_t> next_block() override;
    std::optional<uint64_t> size_hint() const override { return source_.size_hint(); }

    bool exhausted() const { return exhausted_; }
    uint64_t bytes_transferred() const { return bytes_transferred_; }
    const std::string& algorithm() const { return algorithm_; }

    /// Finalized digest. Throws std::logic_error before the source is drained.
    const std::string& hexdigest();

    /// One-shot digest of a buffer.
    static std::string digest(std::span<const uint8_t> data,
                              const std::string& algorithm = constants::DEFAULT_HASH_ALGORITHM);

private:
    struct CtxDeleter {
        void operator()(evp_md_ctx_st* ctx) const;
    };

    ByteSource& source_;
    std::string algorithm_;
    std::unique_ptr<evp_md_ctx_st, CtxDeleter> ctx_;
    uint64_t bytes_transferred_ = 0;
    bool exhausted_ = false;
    std::optional<std::string> digest_;
};

} // namespace swiftstore
