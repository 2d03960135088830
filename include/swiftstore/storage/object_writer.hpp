#pragma once

#include "swiftstore/core/constants.hpp"
#include "swiftstore/net/http.hpp"
#include "swiftstore/storage/byte_source.hpp"
#include "swiftstore/storage/transport.hpp"
#include "swiftstore/storage/types.hpp"

#include <map>
#include <string>

namespace swiftstore {

class TransferMetrics;

/// Issues one object PUT, streaming the body through a HashingUploadPipe.
///
/// Status handling: 417 means the server rejected the content type; any
/// status other than 201 is unexpected. With verification on, the server
/// ETag must be present and equal to the local digest. On a mismatch the
/// object has already been stored.
///
/// Safe to share between threads if the transport is.
class ObjectWriter {
public:
    explicit ObjectWriter(Transport& transport,
                          std::string hash_algorithm = constants::DEFAULT_HASH_ALGORITHM,
                          TransferMetrics* metrics = nullptr);

    UploadResult put(const Container& container,
                     const std::string& object_name,
                     ByteSource& source,
                     const std::string& content_type,
                     const std::map<std::string, std::string>& meta_data,
                     bool verify_hash,
                     const net::HttpHeaders& extra_headers = {});

    const std::string& hash_algorithm() const { return hash_algorithm_; }

private:
    Transport& transport_;
    std::string hash_algorithm_;
    TransferMetrics* metrics_;
};

} // namespace swiftstore
