#pragma once

#include <cstddef>
#include <cstdint>

namespace swiftstore::constants {

// API
constexpr const char* AUTH_TOKEN_HEADER = "X-Auth-Token";
constexpr const char* DEFAULT_USER_AGENT = "swiftstore/1.0";

// Content types
constexpr const char* DEFAULT_CONTENT_TYPE = "application/octet-stream";
constexpr const char* JSON_CONTENT_TYPE = "application/json";
constexpr const char* DEFAULT_REQUEST_CONTENT_TYPE = "application/json; charset=UTF-8";

// Naming
constexpr size_t MAX_CONTAINER_NAME_LENGTH = 256;
constexpr int PART_NUMBER_WIDTH = 8;  // name/00000000

// Transfer defaults
constexpr uint64_t DEFAULT_MULTIPART_CHUNK_SIZE = 32 * 1024 * 1024;  // 32MB
constexpr size_t DEFAULT_READ_BLOCK_SIZE = 8192;                      // 8KB
constexpr size_t DEFAULT_DOWNLOAD_CHUNK_SIZE = 64 * 1024;            // 64KB
constexpr size_t DEFAULT_PART_CONCURRENCY = 1;
constexpr size_t MAX_PART_CONCURRENCY = 64;
constexpr const char* DEFAULT_HASH_ALGORITHM = "md5";

// HTTP defaults
constexpr int DEFAULT_CONNECT_TIMEOUT_SECONDS = 10;
constexpr int DEFAULT_REQUEST_TIMEOUT_SECONDS = 300;
constexpr size_t DEFAULT_MAX_RESPONSE_SIZE = 64 * 1024 * 1024;      // 64MB (buffered bodies only)

// Metrics
constexpr size_t DEFAULT_METRICS_INTERVAL_SECONDS = 15;

} // namespace swiftstore::constants
