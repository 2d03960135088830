#include "swiftstore/storage/multipart_upload.hpp"
#include "swiftstore/storage/errors.hpp"
#include "swiftstore/storage/naming.hpp"

#include <algorithm>
#include <exception>
#include <future>
#include <iostream>
#include <stdexcept>
#include <system_error>

namespace swiftstore {

const char* multipart_state_to_string(MultipartState state) {
    switch (state) {
        case MultipartState::Idle: return "idle";
        case MultipartState::UploadingPart: return "uploading_part";
        case MultipartState::Finalizing: return "finalizing";
        case MultipartState::Done: return "done";
        case MultipartState::Failed: return "failed";
    }
    return "unknown";
}

MultipartUploadCoordinator::MultipartUploadCoordinator(ObjectWriter& writer,
                                                       Container container,
                                                       std::string object_name,
                                                       std::filesystem::path file_path,
                                                       MultipartOptions options)
    : writer_(writer)
    , container_(std::move(container))
    , object_name_(std::move(object_name))
    , file_path_(std::move(file_path))
    , options_(std::move(options)) {
    if (options_.chunk_size == 0) {
        throw std::invalid_argument("chunk size must be > 0");
    }
    options_.concurrency = std::clamp<size_t>(options_.concurrency, 1, constants::MAX_PART_CONCURRENCY);
}

Object MultipartUploadCoordinator::run() {
    if (state_ != MultipartState::Idle) {
        throw std::logic_error("multipart upload already ran");
    }

    try {
        std::error_code ec;
        uint64_t size = std::filesystem::file_size(file_path_, ec);
        if (ec) {
            throw StorageError("Cannot determine size of " + file_path_.string() + ": " + ec.message());
        }

        Object obj = size < options_.chunk_size ? upload_single(size) : upload_parts();
        current_part_.reset();
        state_ = MultipartState::Done;
        return obj;
    } catch (...) {
        // current_part_ keeps the index of the part that failed
        if (options_.verbose) {
            std::cerr << "[multipart] " << container_.name << "/" << object_name_
                      << " failed while " << multipart_state_to_string(state_);
            if (current_part_) std::cerr << " (part " << *current_part_ << ")";
            std::cerr << "\n";
        }
        state_ = MultipartState::Failed;
        throw;
    }
}

Object MultipartUploadCoordinator::upload_single(uint64_t size) {
    state_ = MultipartState::UploadingPart;
    current_part_ = 0;

    std::string content_type = options_.upload.content_type.empty()
        ? guess_content_type(object_name_) : options_.upload.content_type;

    BoundedRangeReader reader(file_path_, 0, size, options_.block_size);
    auto result = writer_.put(container_, object_name_, reader, content_type,
                              options_.upload.meta_data, options_.verify_hash);
    bytes_transferred_ = result.bytes_transferred;

    Object obj;
    obj.name = object_name_;
    obj.container = container_;
    obj.size = result.bytes_transferred;
    obj.hash = result.server_hash;
    obj.meta_data = options_.upload.meta_data;
    obj.content_type = content_type;
    return obj;
}

Object MultipartUploadCoordinator::upload_parts() {
    used_multipart_ = true;

    ChunkedFileSegmenter segmenter(file_path_, options_.chunk_size, options_.block_size);
    if (options_.verbose) {
        std::cout << "[multipart] " << container_.name << "/" << object_name_ << ": "
                  << segmenter.total_size() << " bytes in " << segmenter.segment_count()
                  << " parts of " << options_.chunk_size << " bytes"
                  << " (concurrency " << options_.concurrency << ")\n";
    }

    if (options_.concurrency == 1) {
        upload_sequential(segmenter);
    } else {
        upload_batched(segmenter);
    }
    return finalize();
}

void MultipartUploadCoordinator::upload_sequential(ChunkedFileSegmenter& segmenter) {
    uint64_t index = 0;
    while (auto reader = segmenter.next()) {
        state_ = MultipartState::UploadingPart;
        current_part_ = index;

        std::string name = part_name(object_name_, index);
        auto result = writer_.put(container_, name, *reader, constants::DEFAULT_CONTENT_TYPE,
                                  {}, options_.verify_hash);
        bytes_transferred_ += result.bytes_transferred;
        uploaded_parts_.push_back(name);

        if (options_.verbose) {
            std::cout << "[multipart] uploaded " << name << " (" << result.bytes_transferred
                      << " bytes)\n";
        }
        ++index;
    }
}

void MultipartUploadCoordinator::upload_batched(ChunkedFileSegmenter& segmenter) {
    uint64_t index = 0;

    while (!segmenter.done()) {
        state_ = MultipartState::UploadingPart;
        current_part_ = index;

        std::vector<std::string> names;
        std::vector<std::future<UploadResult>> futures;

        for (size_t i = 0; i < options_.concurrency && !segmenter.done(); ++i) {
            std::string name = part_name(object_name_, index++);
            auto reader = segmenter.next();
            names.push_back(name);
            futures.push_back(std::async(std::launch::async,
                [this, name, reader = std::move(reader)]() {
                    return writer_.put(container_, name, *reader, constants::DEFAULT_CONTENT_TYPE,
                                       {}, options_.verify_hash);
                }));
        }

        // Wait for the whole batch; the lowest failing index wins
        const uint64_t batch_start = *current_part_;
        std::exception_ptr first_error;
        for (size_t i = 0; i < futures.size(); ++i) {
            try {
                auto result = futures[i].get();
                bytes_transferred_ += result.bytes_transferred;
                uploaded_parts_.push_back(names[i]);
            } catch (...) {
                if (!first_error) {
                    first_error = std::current_exception();
                    current_part_ = batch_start + i;
                }
            }
        }

        if (first_error) {
            std::rethrow_exception(first_error);
        }

        if (options_.verbose) {
            std::cout << "[multipart] uploaded " << uploaded_parts_.size() << "/"
                      << segmenter.segment_count() << " parts\n";
        }
    }
}

Object MultipartUploadCoordinator::finalize() {
    state_ = MultipartState::Finalizing;
    current_part_.reset();

    std::string content_type = options_.upload.content_type.empty()
        ? guess_content_type(object_name_) : options_.upload.content_type;

    net::HttpHeaders headers;
    headers.set("X-Object-Manifest",
                clean_container_name(container_.name) + "/" + clean_object_name(object_name_) + "/");

    BufferSource empty;
    auto result = writer_.put(container_, object_name_, empty, content_type,
                              options_.upload.meta_data, options_.verify_hash, headers);

    if (options_.verbose) {
        std::cout << "[multipart] manifest written for " << container_.name << "/"
                  << object_name_ << " (" << uploaded_parts_.size() << " parts)\n";
    }

    Object obj;
    obj.name = object_name_;
    obj.container = container_;
    obj.size = bytes_transferred_;
    obj.hash = result.server_hash;
    obj.meta_data = options_.upload.meta_data;
    obj.content_type = content_type;
    return obj;
}

}  // namespace swiftstore
