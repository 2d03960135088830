#pragma once

#include "swiftstore/core/constants.hpp"
#include "swiftstore/storage/byte_source.hpp"
#include "swiftstore/storage/listing.hpp"
#include "swiftstore/storage/object_writer.hpp"
#include "swiftstore/storage/transport.hpp"
#include "swiftstore/storage/types.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace swiftstore {

class TransferMetrics;

struct StorageClientOptions {
    std::string hash_algorithm = constants::DEFAULT_HASH_ALGORITHM;
    uint64_t multipart_chunk_size = constants::DEFAULT_MULTIPART_CHUNK_SIZE;
    size_t read_block_size = constants::DEFAULT_READ_BLOCK_SIZE;
    size_t part_concurrency = constants::DEFAULT_PART_CONCURRENCY;
    bool verbose = false;
};

/// Container and object operations against one Swift account.
///
/// Every call issues its requests synchronously and maps response statuses
/// to the StorageError hierarchy. Nothing is retried. The transport (and the
/// metrics, when given) must outlive the client and every LazyList it hands
/// out.
class StorageClient {
public:
    explicit StorageClient(Transport& transport,
                           StorageClientOptions options = {},
                           TransferMetrics* metrics = nullptr);

    // --- Containers ---

    std::vector<Container> list_containers();
    LazyList<Container> iterate_containers();

    Container get_container(const std::string& container_name);
    Container create_container(const std::string& container_name);

    /// Only empty containers can be deleted.
    bool delete_container(const Container& container);

    // --- Objects ---

    LazyList<Object> list_container_objects(const Container& container);

    Object get_object(const std::string& container_name, const std::string& object_name);

    Object upload_object(const std::filesystem::path& file_path,
                         const Container& container,
                         const std::string& object_name,
                         const UploadOptions& options = {},
                         bool verify_hash = true);

    /// Upload from a source of unknown length (chunked transfer encoding
    /// unless the source reports a size).
    Object upload_object_via_stream(ByteSource& source,
                                    const Container& container,
                                    const std::string& object_name,
                                    const UploadOptions& options = {},
                                    bool verify_hash = true);

    /// Single PUT below chunk_size, manifest upload at or above it.
    /// chunk_size defaults to the client's multipart_chunk_size.
    Object multipart_upload_object(const std::filesystem::path& file_path,
                                   const Container& container,
                                   const std::string& object_name,
                                   const UploadOptions& options = {},
                                   bool verify_hash = true,
                                   std::optional<uint64_t> chunk_size = std::nullopt);

    /// Download to destination (a file path, or a directory to place the
    /// object's base name in). Returns false when the received size does not
    /// match obj.size; the partial file is removed if delete_on_failure.
    bool download_object(const Object& obj,
                         const std::filesystem::path& destination,
                         bool overwrite_existing = false,
                         bool delete_on_failure = true);

    using ChunkCallback = std::function<void(std::span<const uint8_t> chunk)>;

    /// Stream the object body to callback in pieces of chunk_size bytes
    /// (the last one may be shorter). Returns the bytes delivered.
    uint64_t download_object_as_stream(const Object& obj,
                                       size_t chunk_size,
                                       const ChunkCallback& callback);

    bool delete_object(const Object& obj);

    AccountMetadata get_account_metadata();

    // --- CDN / static website ---

    bool enable_container_cdn(const Container& container,
                              std::optional<uint32_t> ttl_seconds = std::nullopt);
    std::string get_container_cdn_url(const Container& container);
    std::string get_object_cdn_url(const Object& obj);

    bool enable_static_website(const Container& container,
                               const std::string& index_file = "index.html");
    bool set_error_page(const Container& container,
                        const std::string& file_name = "error.html");

    const StorageClientOptions& options() const { return options_; }

private:
    Object instrumented_upload(const std::function<Object()>& upload);

    Transport& transport_;
    StorageClientOptions options_;
    TransferMetrics* metrics_;
    ObjectWriter writer_;
};

} // namespace swiftstore
