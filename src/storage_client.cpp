#include "swiftstore/storage/storage_client.hpp"
#include "swiftstore/metrics.hpp"
#include "swiftstore/storage/errors.hpp"
#include "swiftstore/storage/multipart_upload.hpp"
#include "swiftstore/storage/naming.hpp"
#include "swiftstore/storage/response_parser.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>

namespace swiftstore {

namespace {

constexpr int kOk = static_cast<int>(net::HttpStatus::OK);
constexpr int kCreated = static_cast<int>(net::HttpStatus::Created);
constexpr int kAccepted = static_cast<int>(net::HttpStatus::Accepted);
constexpr int kNoContent = static_cast<int>(net::HttpStatus::NoContent);
constexpr int kNotFound = static_cast<int>(net::HttpStatus::NotFound);
constexpr int kConflict = static_cast<int>(net::HttpStatus::Conflict);

std::string container_path(const std::string& container_name) {
    return "/" + clean_container_name(container_name);
}

std::string object_path(const std::string& container_name, const std::string& object_name) {
    return container_path(container_name) + "/" + clean_object_name(object_name);
}

std::string resolve_content_type(const UploadOptions& options, const std::string& object_name) {
    return options.content_type.empty() ? guess_content_type(object_name) : options.content_type;
}

Object object_from_upload(const UploadResult& result, const Container& container,
                          const UploadOptions& options, const std::string& content_type) {
    Object obj;
    obj.name = result.object_name;
    obj.container = container;
    obj.size = result.bytes_transferred;
    obj.hash = result.server_hash;
    obj.meta_data = options.meta_data;
    obj.content_type = content_type;
    return obj;
}

}  // namespace

StorageClient::StorageClient(Transport& transport, StorageClientOptions options,
                             TransferMetrics* metrics)
    : transport_(transport)
    , options_(std::move(options))
    , metrics_(metrics)
    , writer_(transport, options_.hash_algorithm, metrics) {}

// ============================================================================
// Containers
// ============================================================================

std::vector<Container> StorageClient::list_containers() {
    return iterate_containers().to_vector();
}

LazyList<Container> StorageClient::iterate_containers() {
    return LazyList<Container>(std::make_shared<ContainerPageSource>(transport_, metrics_));
}

Container StorageClient::get_container(const std::string& container_name) {
    TransportRequest request;
    request.method = net::HttpMethod::HEAD;
    request.path = container_path(container_name);

    auto response = transport_.request(request);
    if (response.status == kNoContent || response.status == kOk) {
        return headers_to_container(container_name, response.headers);
    }
    if (response.status == kNotFound) {
        throw ContainerDoesNotExistError(container_name);
    }
    throw UnexpectedStatusError(response.status);
}

Container StorageClient::create_container(const std::string& container_name) {
    TransportRequest request;
    request.method = net::HttpMethod::PUT;
    request.path = container_path(container_name);

    auto response = transport_.request(request);
    if (response.status == kCreated) {
        Container container;
        container.name = container_name;
        return container;
    }
    if (response.status == kAccepted) {
        // Swift answers 202 when the container was already there
        throw ContainerAlreadyExistsError(container_name);
    }
    throw UnexpectedStatusError(response.status);
}

bool StorageClient::delete_container(const Container& container) {
    TransportRequest request;
    request.method = net::HttpMethod::DELETE;
    request.path = container_path(container.name);

    auto response = transport_.request(request);
    switch (response.status) {
        case kNoContent:
            return true;
        case kNotFound:
            throw ContainerDoesNotExistError(container.name);
        case kConflict:
            throw ContainerIsNotEmptyError(container.name);
        default:
            throw UnexpectedStatusError(response.status);
    }
}

// ============================================================================
// Objects
// ============================================================================

LazyList<Object> StorageClient::list_container_objects(const Container& container) {
    return LazyList<Object>(std::make_shared<ObjectPageSource>(transport_, container, metrics_));
}

Object StorageClient::get_object(const std::string& container_name, const std::string& object_name) {
    Container container = get_container(container_name);

    TransportRequest request;
    request.method = net::HttpMethod::HEAD;
    request.path = object_path(container_name, object_name);

    auto response = transport_.request(request);
    if (response.status == kOk || response.status == kNoContent) {
        return headers_to_object(object_name, container, response.headers);
    }
    if (response.status == kNotFound) {
        throw ObjectDoesNotExistError(object_name);
    }
    throw UnexpectedStatusError(response.status);
}

Object StorageClient::instrumented_upload(const std::function<Object()>& upload) {
    if (!metrics_) {
        return upload();
    }

    ScopedInFlight in_flight(metrics_->transfers_in_flight());
    ScopedTimer timer(metrics_->upload_duration());
    try {
        Object obj = upload();
        metrics_->uploads_success().Increment();
        metrics_->upload_bytes_total().Increment(static_cast<double>(obj.size));
        return obj;
    } catch (...) {
        metrics_->uploads_failure().Increment();
        throw;
    }
}

Object StorageClient::upload_object(const std::filesystem::path& file_path,
                                    const Container& container,
                                    const std::string& object_name,
                                    const UploadOptions& options,
                                    bool verify_hash) {
    return instrumented_upload([&]() {
        std::error_code ec;
        uint64_t size = std::filesystem::file_size(file_path, ec);
        if (ec) {
            throw StorageError("Cannot determine size of " + file_path.string() + ": " + ec.message());
        }

        BoundedRangeReader reader(file_path, 0, size, options_.read_block_size);
        std::string content_type = resolve_content_type(options, object_name);
        auto result = writer_.put(container, object_name, reader, content_type,
                                  options.meta_data, verify_hash);

        if (options_.verbose) {
            std::cout << "[swiftstore] uploaded " << container.name << "/" << object_name
                      << " (" << result.bytes_transferred << " bytes, etag "
                      << result.server_hash << ")\n";
        }
        return object_from_upload(result, container, options, content_type);
    });
}

Object StorageClient::upload_object_via_stream(ByteSource& source,
                                               const Container& container,
                                               const std::string& object_name,
                                               const UploadOptions& options,
                                               bool verify_hash) {
    return instrumented_upload([&]() {
        std::string content_type = resolve_content_type(options, object_name);
        auto result = writer_.put(container, object_name, source, content_type,
                                  options.meta_data, verify_hash);

        if (options_.verbose) {
            std::cout << "[swiftstore] streamed " << container.name << "/" << object_name
                      << " (" << result.bytes_transferred << " bytes)\n";
        }
        return object_from_upload(result, container, options, content_type);
    });
}

Object StorageClient::multipart_upload_object(const std::filesystem::path& file_path,
                                              const Container& container,
                                              const std::string& object_name,
                                              const UploadOptions& options,
                                              bool verify_hash,
                                              std::optional<uint64_t> chunk_size) {
    return instrumented_upload([&]() {
        MultipartOptions mp;
        mp.chunk_size = chunk_size.value_or(options_.multipart_chunk_size);
        mp.block_size = options_.read_block_size;
        mp.concurrency = options_.part_concurrency;
        mp.verify_hash = verify_hash;
        mp.upload = options;
        mp.verbose = options_.verbose;

        MultipartUploadCoordinator coordinator(writer_, container, object_name, file_path, mp);
        try {
            Object obj = coordinator.run();
            if (metrics_) {
                metrics_->parts_uploaded().Increment(
                    static_cast<double>(coordinator.uploaded_parts().size()));
            }
            return obj;
        } catch (const StorageError& e) {
            if (metrics_) {
                metrics_->parts_uploaded().Increment(
                    static_cast<double>(coordinator.uploaded_parts().size()));
            }
            if (!coordinator.uploaded_parts().empty()) {
                std::cerr << "[multipart] " << container.name << "/" << object_name << " failed after "
                          << coordinator.uploaded_parts().size() << " parts, "
                          << "uploaded parts are left in place: " << e.what() << "\n";
            }
            throw;
        }
    });
}

bool StorageClient::download_object(const Object& obj,
                                    const std::filesystem::path& destination,
                                    bool overwrite_existing,
                                    bool delete_on_failure) {
    std::filesystem::path target = destination;
    if (std::filesystem::is_directory(target)) {
        target /= std::filesystem::path(obj.name).filename();
    }

    if (std::filesystem::exists(target) && !overwrite_existing) {
        throw StorageError("Overwrite existing is false and the destination file already exists: " +
                           target.string());
    }

    std::optional<ScopedInFlight> in_flight;
    std::optional<ScopedTimer> timer;
    if (metrics_) {
        in_flight.emplace(metrics_->transfers_in_flight());
        timer.emplace(metrics_->download_duration());
    }

    std::ofstream out;
    bool opened = false;
    uint64_t received = 0;
    auto open_target = [&]() {
        out.open(target, std::ios::binary | std::ios::trunc);
        opened = true;
        if (!out) {
            throw StorageError("Failed to open " + target.string() + " for writing");
        }
    };

    // Only a file this call created or truncated is removed
    auto discard = [&]() {
        if (out.is_open()) out.close();
        if (opened && delete_on_failure) {
            std::error_code ec;
            std::filesystem::remove(target, ec);
        }
        if (metrics_) metrics_->downloads_failure().Increment();
    };

    TransportRequest request;
    request.method = net::HttpMethod::GET;
    request.path = object_path(obj.container.name, obj.name);
    request.response_sink = [&](const uint8_t* data, size_t size) -> bool {
        if (!out.is_open()) open_target();
        out.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
        if (!out) {
            throw StorageError("Failed to write " + target.string());
        }
        received += size;
        return true;
    };

    TransportResponse response;
    try {
        response = transport_.request(request);
    } catch (const StorageError&) {
        discard();
        throw;
    }

    // Other 2xx statuses have already streamed into the file
    if (response.status == kNotFound) {
        discard();
        throw ObjectDoesNotExistError(obj.name);
    }
    if (response.status != kOk) {
        discard();
        throw UnexpectedStatusError(response.status);
    }

    // Zero-byte objects never reach the sink
    if (!out.is_open()) open_target();
    out.close();
    if (!out.good()) {
        discard();
        throw StorageError("Failed to write " + target.string());
    }

    // obj.size is 0 when the size was never learned (e.g. name-only objects)
    if (obj.size != 0 && received != obj.size) {
        if (options_.verbose) {
            std::cerr << "[swiftstore] size mismatch for " << obj.name << ": expected "
                      << obj.size << ", received " << received << "\n";
        }
        discard();
        return false;
    }

    if (metrics_) {
        metrics_->downloads_success().Increment();
        metrics_->download_bytes_total().Increment(static_cast<double>(received));
    }
    if (options_.verbose) {
        std::cout << "[swiftstore] downloaded " << obj.container.name << "/" << obj.name
                  << " to " << target << " (" << received << " bytes)\n";
    }
    return true;
}

uint64_t StorageClient::download_object_as_stream(const Object& obj,
                                                  size_t chunk_size,
                                                  const ChunkCallback& callback) {
    if (chunk_size == 0) {
        chunk_size = constants::DEFAULT_DOWNLOAD_CHUNK_SIZE;
    }

    std::optional<ScopedInFlight> in_flight;
    std::optional<ScopedTimer> timer;
    if (metrics_) {
        in_flight.emplace(metrics_->transfers_in_flight());
        timer.emplace(metrics_->download_duration());
    }

    std::vector<uint8_t> pending;
    pending.reserve(chunk_size);
    uint64_t delivered = 0;

    TransportRequest request;
    request.method = net::HttpMethod::GET;
    request.path = object_path(obj.container.name, obj.name);
    request.response_sink = [&](const uint8_t* data, size_t size) -> bool {
        while (size > 0) {
            size_t n = std::min(size, chunk_size - pending.size());
            pending.insert(pending.end(), data, data + n);
            data += n;
            size -= n;
            if (pending.size() == chunk_size) {
                callback(pending);
                delivered += pending.size();
                pending.clear();
            }
        }
        return true;
    };

    TransportResponse response;
    try {
        response = transport_.request(request);
    } catch (const StorageError&) {
        if (metrics_) metrics_->downloads_failure().Increment();
        throw;
    }

    if (response.status == kNotFound) {
        if (metrics_) metrics_->downloads_failure().Increment();
        throw ObjectDoesNotExistError(obj.name);
    }
    if (response.status != kOk) {
        if (metrics_) metrics_->downloads_failure().Increment();
        throw UnexpectedStatusError(response.status);
    }

    if (!pending.empty()) {
        callback(pending);
        delivered += pending.size();
    }

    if (metrics_) {
        metrics_->downloads_success().Increment();
        metrics_->download_bytes_total().Increment(static_cast<double>(delivered));
    }
    return delivered;
}

bool StorageClient::delete_object(const Object& obj) {
    TransportRequest request;
    request.method = net::HttpMethod::DELETE;
    request.path = object_path(obj.container.name, obj.name);

    auto response = transport_.request(request);
    if (response.status == kNoContent) {
        return true;
    }
    if (response.status == kNotFound) {
        throw ObjectDoesNotExistError(obj.name);
    }
    throw UnexpectedStatusError(response.status);
}

AccountMetadata StorageClient::get_account_metadata() {
    TransportRequest request;
    request.method = net::HttpMethod::HEAD;

    auto response = transport_.request(request);
    if (response.status != kNoContent && response.status != kOk) {
        throw UnexpectedStatusError(response.status);
    }

    auto count = [&](const char* name) -> uint64_t {
        auto value = response.headers.get(name);
        if (!value) {
            throw MalformedResponseError(std::string("Missing ") + name + " header", "");
        }
        try {
            return std::stoull(*value);
        } catch (const std::exception&) {
            throw MalformedResponseError(std::string("Invalid ") + name + " header: " + *value, "");
        }
    };

    AccountMetadata meta;
    meta.container_count = count("x-account-container-count");
    meta.object_count = count("x-account-object-count");
    meta.bytes_used = count("x-account-bytes-used");
    return meta;
}

// ============================================================================
// CDN / static website
// ============================================================================

bool StorageClient::enable_container_cdn(const Container& container,
                                         std::optional<uint32_t> ttl_seconds) {
    TransportRequest request;
    request.method = net::HttpMethod::PUT;
    request.path = container_path(container.name);
    request.cdn = true;
    request.headers.set("X-CDN-Enabled", "True");
    if (ttl_seconds) {
        request.headers.set("X-TTL", std::to_string(*ttl_seconds));
    }

    auto response = transport_.request(request);
    return response.status == kCreated || response.status == kAccepted;
}

std::string StorageClient::get_container_cdn_url(const Container& container) {
    TransportRequest request;
    request.method = net::HttpMethod::HEAD;
    request.path = container_path(container.name);
    request.cdn = true;

    auto response = transport_.request(request);
    if (response.status == kNoContent) {
        auto uri = response.headers.get("x-cdn-uri");
        if (!uri) {
            throw MalformedResponseError("Missing x-cdn-uri header", "");
        }
        return *uri;
    }
    if (response.status == kNotFound) {
        throw ContainerDoesNotExistError(container.name);
    }
    throw UnexpectedStatusError(response.status);
}

std::string StorageClient::get_object_cdn_url(const Object& obj) {
    return get_container_cdn_url(obj.container) + "/" + obj.name;
}

bool StorageClient::enable_static_website(const Container& container, const std::string& index_file) {
    TransportRequest request;
    request.method = net::HttpMethod::POST;
    request.path = container_path(container.name);
    request.headers.set("X-Container-Meta-Web-Index", index_file);

    auto response = transport_.request(request);
    return response.status == kCreated || response.status == kAccepted ||
           response.status == kNoContent;
}

bool StorageClient::set_error_page(const Container& container, const std::string& file_name) {
    TransportRequest request;
    request.method = net::HttpMethod::POST;
    request.path = container_path(container.name);
    request.headers.set("X-Container-Meta-Web-Error", file_name);

    auto response = transport_.request(request);
    return response.status == kCreated || response.status == kAccepted ||
           response.status == kNoContent;
}

}  // namespace swiftstore
