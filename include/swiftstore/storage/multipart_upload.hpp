#pragma once

#include "swiftstore/core/constants.hpp"
#include "swiftstore/storage/chunk_reader.hpp"
#include "swiftstore/storage/object_writer.hpp"
#include "swiftstore/storage/types.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace swiftstore {

struct MultipartOptions {
    // Files of at least this many bytes are split into parts of this size
    uint64_t chunk_size = constants::DEFAULT_MULTIPART_CHUNK_SIZE;

    // File read granularity inside a part
    size_t block_size = constants::DEFAULT_READ_BLOCK_SIZE;

    // Parts in flight at once (1 = strictly sequential)
    size_t concurrency = constants::DEFAULT_PART_CONCURRENCY;

    bool verify_hash = true;
    UploadOptions upload;
    bool verbose = false;
};

enum class MultipartState {
    Idle,
    UploadingPart,
    Finalizing,
    Done,
    Failed
};

const char* multipart_state_to_string(MultipartState state);

/// Uploads a file as one object, splitting it into a manifest object when it
/// reaches the chunk size.
///
/// Parts are stored as "<object>/00000000", "<object>/00000001", ... with an
/// opaque content type, then a zero-byte PUT of "<object>" carrying
/// X-Object-Manifest: <container>/<object>/ makes the server present their
/// concatenation. Verification of the manifest PUT covers its own empty body
/// only, not the assembled object.
///
/// Nothing is retried or cleaned up. After a failure, uploaded_parts() names
/// the parts that reached the server, in index order.
///
/// One-shot: run() may be called once per coordinator.
class MultipartUploadCoordinator {
public:
    MultipartUploadCoordinator(ObjectWriter& writer,
                               Container container,
                               std::string object_name,
                               std::filesystem::path file_path,
                               MultipartOptions options = {});

    Object run();

    MultipartState state() const { return state_; }

    // Index of the part being uploaded (first part of the batch when
    // concurrent). After a failure, the index of the failed part; empty
    // once the manifest stage starts
    std::optional<uint64_t> current_part() const { return current_part_; }

    const std::vector<std::string>& uploaded_parts() const { return uploaded_parts_; }

    // False when the file was small enough for a single PUT
    bool used_multipart() const { return used_multipart_; }

    uint64_t bytes_transferred() const { return bytes_transferred_; }

private:
    Object upload_single(uint64_t size);
    Object upload_parts();
    void upload_sequential(ChunkedFileSegmenter& segmenter);
    void upload_batched(ChunkedFileSegmenter& segmenter);
    Object finalize();

    ObjectWriter& writer_;
    Container container_;
    std::string object_name_;
    std::filesystem::path file_path_;
    MultipartOptions options_;

    MultipartState state_ = MultipartState::Idle;
    std::optional<uint64_t> current_part_;
    std::vector<std::string> uploaded_parts_;
    bool used_multipart_ = false;
    uint64_t bytes_transferred_ = 0;
};

} // namespace swiftstore
