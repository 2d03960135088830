#include "swiftstore/client_config.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace swiftstore {

namespace {

void print_usage() {
    std::cerr <<
        "Usage: swiftstore <command> [args] [options]\n"
        "\n"
        "Commands:\n"
        "  containers                        List containers\n"
        "  list <container>                  List objects in a container\n"
        "  stat <container> [object]         Show container or object metadata\n"
        "  create <container>                Create a container\n"
        "  delete <container> [object]       Delete an empty container, or an object\n"
        "  upload <container> <file>         Upload a file (manifest upload above the chunk size)\n"
        "      --name <object>               Object name (default: file name)\n"
        "  download <container> <object> <dest>\n"
        "      --overwrite                   Replace an existing destination file\n"
        "  account                           Show account counters\n"
        "\n"
        "Endpoint:\n"
        "  --storage-url <url>               Storage URL (or SWIFTSTORE_STORAGE_URL / OS_STORAGE_URL)\n"
        "  --auth-token <token>              Auth token (or SWIFTSTORE_AUTH_TOKEN / OS_AUTH_TOKEN)\n"
        "  --cdn-url <url>                   CDN management URL (or SWIFTSTORE_CDN_URL)\n"
        "  --user-agent <ua>                 User-Agent header\n"
        "\n"
        "HTTP:\n"
        "  --connect-timeout <secs>          Connect timeout (default: 10)\n"
        "  --request-timeout <secs>          Whole-request timeout (default: 300)\n"
        "  --ca-cert <path>                  CA bundle for SSL\n"
        "  --no-verify-ssl                   Skip SSL verification\n"
        "\n"
        "Transfers:\n"
        "  --config <path>                   JSON config file\n"
        "  --chunk-size-mb <N>               Multipart chunk size in MB (default: 32)\n"
        "  --chunk-size-bytes <N>            Multipart chunk size in bytes\n"
        "  --block-size <N>                  File read block size (default: 8192)\n"
        "  --part-concurrency <N>            Parts uploaded at once (default: 1)\n"
        "  --hash-algorithm <name>           Digest used for verification (default: md5)\n"
        "  --no-verify-hash                  Do not compare ETags with local digests\n"
        "  --verbose                         Verbose output\n"
        "  --metrics-file <path>             Prometheus .prom file for node_exporter textfile collector\n"
        "  --metrics-interval <secs>         Metrics write interval (default: 15)\n"
        "  --help                            Show this help\n";
}

}  // namespace

std::optional<ClientConfig> ClientConfig::from_args(int argc, char* argv[],
                                                    std::vector<std::string>* positional) {
    ClientConfig config;

    auto next_arg = [&](int& i, const char* name) -> const char* {
        if (i + 1 >= argc) {
            std::cerr << "Error: " << name << " requires an argument\n";
            return nullptr;
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        try {
            if (arg == "--storage-url") {
                auto* v = next_arg(i, "--storage-url");
                if (!v) return std::nullopt;
                config.storage_url = v;
            } else if (arg == "--auth-token") {
                auto* v = next_arg(i, "--auth-token");
                if (!v) return std::nullopt;
                config.auth_token = v;
            } else if (arg == "--cdn-url") {
                auto* v = next_arg(i, "--cdn-url");
                if (!v) return std::nullopt;
                config.cdn_url = v;
            } else if (arg == "--user-agent") {
                auto* v = next_arg(i, "--user-agent");
                if (!v) return std::nullopt;
                config.user_agent = v;
            } else if (arg == "--connect-timeout") {
                auto* v = next_arg(i, "--connect-timeout");
                if (!v) return std::nullopt;
                config.connect_timeout_secs = std::stoull(v);
            } else if (arg == "--request-timeout") {
                auto* v = next_arg(i, "--request-timeout");
                if (!v) return std::nullopt;
                config.request_timeout_secs = std::stoull(v);
            } else if (arg == "--ca-cert") {
                auto* v = next_arg(i, "--ca-cert");
                if (!v) return std::nullopt;
                config.ca_bundle = v;
            } else if (arg == "--no-verify-ssl") {
                config.verify_ssl = false;
            } else if (arg == "--config") {
                auto* v = next_arg(i, "--config");
                if (!v) return std::nullopt;
                if (!config.load_json(v)) return std::nullopt;
            } else if (arg == "--chunk-size-mb") {
                auto* v = next_arg(i, "--chunk-size-mb");
                if (!v) return std::nullopt;
                config.multipart_chunk_size = std::stoull(v) * 1024ULL * 1024;
            } else if (arg == "--chunk-size-bytes") {
                auto* v = next_arg(i, "--chunk-size-bytes");
                if (!v) return std::nullopt;
                config.multipart_chunk_size = std::stoull(v);
            } else if (arg == "--block-size") {
                auto* v = next_arg(i, "--block-size");
                if (!v) return std::nullopt;
                config.read_block_size = std::stoull(v);
            } else if (arg == "--part-concurrency") {
                auto* v = next_arg(i, "--part-concurrency");
                if (!v) return std::nullopt;
                config.part_concurrency = std::stoull(v);
            } else if (arg == "--hash-algorithm") {
                auto* v = next_arg(i, "--hash-algorithm");
                if (!v) return std::nullopt;
                config.hash_algorithm = v;
            } else if (arg == "--no-verify-hash") {
                config.verify_hash = false;
            } else if (arg == "--verbose") {
                config.verbose = true;
            } else if (arg == "--metrics-file") {
                auto* v = next_arg(i, "--metrics-file");
                if (!v) return std::nullopt;
                config.metrics_file = v;
            } else if (arg == "--metrics-interval") {
                auto* v = next_arg(i, "--metrics-interval");
                if (!v) return std::nullopt;
                config.metrics_interval_secs = std::stoull(v);
            } else if (arg == "--help" || arg == "-h") {
                print_usage();
                return std::nullopt;
            } else if (arg.compare(0, 2, "--") != 0 && positional) {
                positional->push_back(arg);
            } else {
                std::cerr << "Error: unknown option: " << arg << "\n";
                return std::nullopt;
            }
        } catch (const std::exception&) {
            std::cerr << "Error: invalid value for " << arg << "\n";
            return std::nullopt;
        }
    }

    config.apply_env();
    return config;
}

bool ClientConfig::load_json(const std::filesystem::path& path) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            std::cerr << "Error: cannot open config file: " << path << "\n";
            return false;
        }
        auto j = nlohmann::json::parse(ifs);

        if (j.contains("storage_url")) storage_url = j["storage_url"].get<std::string>();
        if (j.contains("cdn_url")) cdn_url = j["cdn_url"].get<std::string>();
        if (j.contains("auth_token")) auth_token = j["auth_token"].get<std::string>();
        if (j.contains("user_agent")) user_agent = j["user_agent"].get<std::string>();
        if (j.contains("connect_timeout")) connect_timeout_secs = j["connect_timeout"].get<size_t>();
        if (j.contains("request_timeout")) request_timeout_secs = j["request_timeout"].get<size_t>();
        if (j.contains("verify_ssl")) verify_ssl = j["verify_ssl"].get<bool>();
        if (j.contains("ca_cert")) ca_bundle = j["ca_cert"].get<std::string>();
        if (j.contains("chunk_size_mb"))
            multipart_chunk_size = j["chunk_size_mb"].get<uint64_t>() * 1024ULL * 1024;
        if (j.contains("chunk_size_bytes")) multipart_chunk_size = j["chunk_size_bytes"].get<uint64_t>();
        if (j.contains("block_size")) read_block_size = j["block_size"].get<size_t>();
        if (j.contains("verify_hash")) verify_hash = j["verify_hash"].get<bool>();
        if (j.contains("hash_algorithm")) hash_algorithm = j["hash_algorithm"].get<std::string>();
        if (j.contains("part_concurrency")) part_concurrency = j["part_concurrency"].get<size_t>();
        if (j.contains("verbose")) verbose = j["verbose"].get<bool>();
        if (j.contains("metrics_file")) metrics_file = j["metrics_file"].get<std::string>();
        if (j.contains("metrics_interval")) metrics_interval_secs = j["metrics_interval"].get<size_t>();

        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error parsing config: " << e.what() << "\n";
        return false;
    }
}

void ClientConfig::apply_env() {
    auto fill = [](std::string& field, const char* primary, const char* fallback) {
        if (!field.empty()) return;
        if (const char* v = std::getenv(primary)) {
            field = v;
        } else if (fallback) {
            if (const char* fv = std::getenv(fallback)) field = fv;
        }
    };
    fill(storage_url, "SWIFTSTORE_STORAGE_URL", "OS_STORAGE_URL");
    fill(auth_token, "SWIFTSTORE_AUTH_TOKEN", "OS_AUTH_TOKEN");
    fill(cdn_url, "SWIFTSTORE_CDN_URL", nullptr);
}

std::string ClientConfig::validate() const {
    if (storage_url.empty()) return "storage_url is required (--storage-url)";
    if (storage_url.compare(0, 7, "http://") != 0 && storage_url.compare(0, 8, "https://") != 0)
        return "storage_url must be an http(s) URL: " + storage_url;
    if (!cdn_url.empty() && cdn_url.compare(0, 7, "http://") != 0 &&
        cdn_url.compare(0, 8, "https://") != 0)
        return "cdn_url must be an http(s) URL: " + cdn_url;
    if (auth_token.empty()) return "auth_token is required (--auth-token)";
    if (multipart_chunk_size == 0) return "chunk size must be > 0";
    if (read_block_size == 0) return "block size must be > 0";
    if (part_concurrency == 0 || part_concurrency > constants::MAX_PART_CONCURRENCY)
        return "part_concurrency must be between 1 and " +
               std::to_string(constants::MAX_PART_CONCURRENCY);
    if (hash_algorithm.empty()) return "hash_algorithm must not be empty";
    if (connect_timeout_secs == 0 || request_timeout_secs == 0) return "timeouts must be > 0";
    if (!ca_bundle.empty() && !std::filesystem::exists(ca_bundle))
        return "CA bundle does not exist: " + ca_bundle.string();
    return {};
}

CurlTransportConfig ClientConfig::transport_config() const {
    CurlTransportConfig tc;
    tc.storage_url = storage_url;
    tc.cdn_url = cdn_url;
    tc.auth_token = auth_token;
    tc.user_agent = user_agent;
    tc.connect_timeout = std::chrono::seconds(connect_timeout_secs);
    tc.request_timeout = std::chrono::seconds(request_timeout_secs);
    tc.verify_ssl = verify_ssl;
    tc.ca_bundle = ca_bundle.string();
    tc.verbose = verbose;
    return tc;
}

StorageClientOptions ClientConfig::client_options() const {
    StorageClientOptions opts;
    opts.hash_algorithm = hash_algorithm;
    opts.multipart_chunk_size = multipart_chunk_size;
    opts.read_block_size = read_block_size;
    opts.part_concurrency = part_concurrency;
    opts.verbose = verbose;
    return opts;
}

}  // namespace swiftstore
