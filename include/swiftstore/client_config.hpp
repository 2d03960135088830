#pragma once

#include "swiftstore/core/constants.hpp"
#include "swiftstore/storage/storage_client.hpp"
#include "swiftstore/storage/transport.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace swiftstore {

/// Configuration for the swiftstore client and CLI.
/// The storage URL and token are issued by the auth service out of band.
struct ClientConfig {
    // Endpoint
    std::string storage_url;   // e.g. https://storage.example.com/v1/AUTH_acct
    std::string cdn_url;       // Optional CDN management endpoint
    std::string auth_token;
    std::string user_agent = constants::DEFAULT_USER_AGENT;

    // HTTP
    size_t connect_timeout_secs = constants::DEFAULT_CONNECT_TIMEOUT_SECONDS;
    size_t request_timeout_secs = constants::DEFAULT_REQUEST_TIMEOUT_SECONDS;
    bool verify_ssl = true;
    std::filesystem::path ca_bundle;

    // Transfers
    uint64_t multipart_chunk_size = constants::DEFAULT_MULTIPART_CHUNK_SIZE;
    size_t read_block_size = constants::DEFAULT_READ_BLOCK_SIZE;
    bool verify_hash = true;
    std::string hash_algorithm = constants::DEFAULT_HASH_ALGORITHM;
    size_t part_concurrency = constants::DEFAULT_PART_CONCURRENCY;

    bool verbose = false;

    // Prometheus metrics (textfile collector)
    std::filesystem::path metrics_file;    // e.g. /var/lib/node_exporter/textfile/swiftstore.prom
    size_t metrics_interval_secs = constants::DEFAULT_METRICS_INTERVAL_SECONDS;

    /// Parse options from the command line. Arguments that are not options
    /// are appended to `positional` in order (rejected when it is null).
    /// Returns empty optional on error (prints usage to stderr).
    static std::optional<ClientConfig> from_args(int argc, char* argv[],
                                                 std::vector<std::string>* positional = nullptr);

    /// Load configuration from a JSON file, overlaying onto current values.
    bool load_json(const std::filesystem::path& path);

    /// Fill storage URL, token and CDN URL from the environment where unset.
    void apply_env();

    /// Validate required fields. Returns error message or empty string.
    std::string validate() const;

    CurlTransportConfig transport_config() const;
    StorageClientOptions client_options() const;
};

}  // namespace swiftstore
