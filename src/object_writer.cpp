#include "swiftstore/storage/object_writer.hpp"
#include "swiftstore/metrics.hpp"
#include "swiftstore/storage/errors.hpp"
#include "swiftstore/storage/hashing_pipe.hpp"
#include "swiftstore/storage/naming.hpp"
#include "swiftstore/storage/response_parser.hpp"

namespace swiftstore {

ObjectWriter::ObjectWriter(Transport& transport, std::string hash_algorithm,
                           TransferMetrics* metrics)
    : transport_(transport)
    , hash_algorithm_(std::move(hash_algorithm))
    , metrics_(metrics) {}

UploadResult ObjectWriter::put(const Container& container,
                               const std::string& object_name,
                               ByteSource& source,
                               const std::string& content_type,
                               const std::map<std::string, std::string>& meta_data,
                               bool verify_hash,
                               const net::HttpHeaders& extra_headers) {
    TransportRequest request;
    request.method = net::HttpMethod::PUT;
    request.path = "/" + clean_container_name(container.name) + "/" + clean_object_name(object_name);
    request.headers = extra_headers;
    for (const auto& [key, value] : meta_data) {
        request.headers.set("X-Object-Meta-" + key, value);
    }
    if (!content_type.empty()) {
        request.headers.set_content_type(content_type);
    }

    HashingUploadPipe pipe(source, hash_algorithm_);
    request.body = &pipe;

    auto response = transport_.request(request);

    if (response.status == static_cast<int>(net::HttpStatus::ExpectationFailed)) {
        throw StorageError("Missing content-type header");
    }
    if (response.status != static_cast<int>(net::HttpStatus::Created)) {
        throw UnexpectedStatusError(response.status);
    }

    // A sized body can be sent without reading the end-of-data marker
    if (!pipe.exhausted() && !pipe.next_block().empty()) {
        throw StorageError("Request body for " + object_name + " was not fully sent");
    }

    UploadResult result;
    result.object_name = object_name;
    result.bytes_transferred = pipe.bytes_transferred();
    result.local_hash = pipe.hexdigest();
    result.server_hash = strip_etag_quotes(response.headers.get("etag").value_or(""));

    if (verify_hash) {
        if (result.server_hash.empty()) {
            throw StorageError("Server didn't return etag");
        }
        if (result.server_hash != result.local_hash) {
            if (metrics_) metrics_->hash_mismatches().Increment();
            throw ObjectHashMismatchError(object_name, result.local_hash, result.server_hash);
        }
    }
    return result;
}

}  // namespace swiftstore
