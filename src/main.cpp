#include "swiftstore/client_config.hpp"
#include "swiftstore/metrics.hpp"
#include "swiftstore/storage/storage_client.hpp"
#include "swiftstore/storage/transport.hpp"

#include <chrono>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {

std::string mask_secret(const std::string& value) {
    if (value.size() <= 4) return "****";
    return value.substr(0, 4) + "****";
}

std::string format_time(const std::optional<std::chrono::system_clock::time_point>& tp) {
    if (!tp) return "-";
    std::time_t t = std::chrono::system_clock::to_time_t(*tp);
    std::tm tm = {};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

void print_object(const swiftstore::Object& obj) {
    std::cout << "  name: " << obj.name << "\n"
              << "  container: " << obj.container.name << "\n"
              << "  size: " << obj.size << "\n"
              << "  hash: " << obj.hash << "\n"
              << "  content-type: " << obj.content_type << "\n"
              << "  last-modified: " << format_time(obj.last_modified) << "\n";
    for (const auto& [k, v] : obj.meta_data) {
        std::cout << "  meta-" << k << ": " << v << "\n";
    }
}

bool require_args(const std::vector<std::string>& args, size_t count, const char* usage) {
    if (args.size() < count) {
        std::cerr << "Usage: swiftstore " << usage << "\n";
        return false;
    }
    return true;
}

int run_command(swiftstore::StorageClient& client,
                const swiftstore::ClientConfig& config,
                const std::vector<std::string>& args,
                const std::string& upload_name,
                bool overwrite) {
    const std::string& command = args[0];

    if (command == "containers") {
        for (const auto& c : client.iterate_containers()) {
            std::cout << c.name << "\t" << c.object_count << "\t" << c.bytes << "\n";
        }
    } else if (command == "list") {
        if (!require_args(args, 2, "list <container>")) return 1;
        swiftstore::Container container{args[1]};
        for (const auto& obj : client.list_container_objects(container)) {
            std::cout << obj.name << "\t" << obj.size << "\t" << obj.hash << "\t"
                      << format_time(obj.last_modified) << "\n";
        }
    } else if (command == "stat") {
        if (!require_args(args, 2, "stat <container> [object]")) return 1;
        if (args.size() >= 3) {
            print_object(client.get_object(args[1], args[2]));
        } else {
            auto c = client.get_container(args[1]);
            std::cout << "  name: " << c.name << "\n"
                      << "  objects: " << c.object_count << "\n"
                      << "  bytes: " << c.bytes << "\n";
        }
    } else if (command == "create") {
        if (!require_args(args, 2, "create <container>")) return 1;
        auto c = client.create_container(args[1]);
        std::cout << "Created container " << c.name << "\n";
    } else if (command == "delete") {
        if (!require_args(args, 2, "delete <container> [object]")) return 1;
        swiftstore::Container container{args[1]};
        if (args.size() >= 3) {
            swiftstore::Object obj;
            obj.name = args[2];
            obj.container = container;
            client.delete_object(obj);
            std::cout << "Deleted " << args[1] << "/" << args[2] << "\n";
        } else {
            client.delete_container(container);
            std::cout << "Deleted container " << args[1] << "\n";
        }
    } else if (command == "upload") {
        if (!require_args(args, 3, "upload <container> <file> [--name <object>]")) return 1;
        std::filesystem::path file = args[2];
        std::string name = upload_name.empty() ? file.filename().string() : upload_name;
        swiftstore::Container container{args[1]};
        auto obj = client.multipart_upload_object(file, container, name, {}, config.verify_hash);
        std::cout << "Uploaded " << container.name << "/" << obj.name << " ("
                  << obj.size << " bytes, etag " << obj.hash << ")\n";
    } else if (command == "download") {
        if (!require_args(args, 4, "download <container> <object> <dest> [--overwrite]")) return 1;
        auto obj = client.get_object(args[1], args[2]);
        if (!client.download_object(obj, args[3], overwrite, true)) {
            std::cerr << "Download of " << args[1] << "/" << args[2]
                      << " was incomplete (expected " << obj.size << " bytes)\n";
            return 1;
        }
        std::cout << "Downloaded " << args[1] << "/" << args[2] << " to " << args[3] << "\n";
    } else if (command == "account") {
        auto meta = client.get_account_metadata();
        std::cout << "  containers: " << meta.container_count << "\n"
                  << "  objects: " << meta.object_count << "\n"
                  << "  bytes: " << meta.bytes_used << "\n";
    } else {
        std::cerr << "Error: unknown command: " << command << " (see --help)\n";
        return 1;
    }
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    // Command-specific flags are pulled out before the shared option parser
    std::string upload_name;
    bool overwrite = false;
    std::vector<char*> filtered{argv[0]};
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--name" && i + 1 < argc) {
            upload_name = argv[++i];
        } else if (arg == "--overwrite") {
            overwrite = true;
        } else {
            filtered.push_back(argv[i]);
        }
    }

    std::vector<std::string> args;
    auto config_opt = swiftstore::ClientConfig::from_args(static_cast<int>(filtered.size()),
                                                          filtered.data(), &args);
    if (!config_opt) {
        return 1;
    }
    auto config = std::move(*config_opt);

    if (args.empty()) {
        std::cerr << "Error: no command given (see --help)\n";
        return 1;
    }

    auto err = config.validate();
    if (!err.empty()) {
        std::cerr << "Configuration error: " << err << "\n";
        return 1;
    }

    if (config.verbose) {
        std::cout << "[swiftstore] storage-url: " << config.storage_url << "\n";
        if (!config.cdn_url.empty()) {
            std::cout << "[swiftstore] cdn-url: " << config.cdn_url << "\n";
        }
        std::cout << "[swiftstore] auth-token: " << mask_secret(config.auth_token) << "\n";
        std::cout << "[swiftstore] chunk-size: " << config.multipart_chunk_size << " bytes\n";
        std::cout << "[swiftstore] part-concurrency: " << config.part_concurrency << "\n";
        std::cout << "[swiftstore] hash: " << config.hash_algorithm
                  << (config.verify_hash ? " (verified)" : " (not verified)") << "\n";
    }

    std::unique_ptr<swiftstore::TransferMetrics> metrics;
    if (!config.metrics_file.empty()) {
        metrics = std::make_unique<swiftstore::TransferMetrics>(
            config.metrics_file, std::chrono::seconds(config.metrics_interval_secs),
            std::map<std::string, std::string>{{"command", args[0]}});
        metrics->start();
    }

    swiftstore::CurlTransport transport(config.transport_config());
    swiftstore::StorageClient client(transport, config.client_options(), metrics.get());

    int rc = 1;
    try {
        rc = run_command(client, config, args, upload_name, overwrite);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
    }

    if (metrics) {
        metrics->stop();
    }
    return rc;
}
