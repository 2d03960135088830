#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace swiftstore {

// A container as last reported by the server.
// object_count and bytes are server aggregates and only eventually consistent.
struct Container {
    std::string name;
    uint64_t object_count = 0;
    uint64_t bytes = 0;
};

// An object in a container. Built from an upload result, a HEAD response or a
// listing entry; never updated in place.
struct Object {
    std::string name;
    Container container;
    uint64_t size = 0;
    std::string hash;  // Hex digest as reported by the server
    std::map<std::string, std::string> meta_data;
    std::string content_type;
    std::optional<std::chrono::system_clock::time_point> last_modified;
};

// Account-wide counters from HEAD on the storage URL
struct AccountMetadata {
    uint64_t container_count = 0;
    uint64_t object_count = 0;
    uint64_t bytes_used = 0;
};

// Options for upload operations
struct UploadOptions {
    std::string content_type;  // Empty = guess from the object name
    std::map<std::string, std::string> meta_data;  // Sent as X-Object-Meta-<key>
};

// Outcome of one PUT carrying object data
struct UploadResult {
    std::string object_name;
    uint64_t bytes_transferred = 0;
    std::string local_hash;
    std::string server_hash;
};

} // namespace swiftstore
