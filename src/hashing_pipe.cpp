#include "swiftstore/storage/hashing_pipe.hpp"

#include <openssl/evp.h>

#include <stdexcept>

namespace swiftstore {

namespace {

const EVP_MD* lookup_digest(const std::string& algorithm) {
    const EVP_MD* md = EVP_get_digestbyname(algorithm.c_str());
    if (!md) {
        throw std::invalid_argument("Unknown hash algorithm: " + algorithm);
    }
    return md;
}

std::string to_hex(const unsigned char* data, unsigned int len) {
    static const char* digits = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (unsigned int i = 0; i < len; ++i) {
        out += digits[data[i] >> 4];
        out += digits[data[i] & 0x0F];
    }
    return out;
}

}  // namespace

void HashingUploadPipe::CtxDeleter::operator()(evp_md_ctx_st* ctx) const {
    EVP_MD_CTX_free(ctx);
}

HashingUploadPipe::HashingUploadPipe(ByteSource& source, const std::string& algorithm)
    : source_(source)
    , algorithm_(algorithm)
    , ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }
    if (EVP_DigestInit_ex(ctx_.get(), lookup_digest(algorithm_), nullptr) != 1) {
        throw std::runtime_error("EVP_DigestInit_ex failed for " + algorithm_);
    }
}

HashingUploadPipe::~HashingUploadPipe() = default;

std::span<const uint8_t> HashingUploadPipe::next_block() {
    if (exhausted_) return {};

    auto block = source_.next_block();
    if (block.empty()) {
        exhausted_ = true;
        return {};
    }

    if (EVP_DigestUpdate(ctx_.get(), block.data(), block.size()) != 1) {
        throw std::runtime_error("EVP_DigestUpdate failed");
    }
    bytes_transferred_ += block.size();
    return block;
}

const std::string& HashingUploadPipe::hexdigest() {
    if (!digest_) {
        if (!exhausted_) {
            throw std::logic_error("digest requested before the source was drained");
        }
        unsigned char md[EVP_MAX_MD_SIZE];
        unsigned int len = 0;
        if (EVP_DigestFinal_ex(ctx_.get(), md, &len) != 1) {
            throw std::runtime_error("EVP_DigestFinal_ex failed");
        }
        digest_ = to_hex(md, len);
    }
    return *digest_;
}

std::string HashingUploadPipe::digest(std::span<const uint8_t> data, const std::string& algorithm) {
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_Digest(data.data(), data.size(), md, &len, lookup_digest(algorithm), nullptr) != 1) {
        throw std::runtime_error("EVP_Digest failed for " + algorithm);
    }
    return to_hex(md, len);
}

}  // namespace swiftstore
