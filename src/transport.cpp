#include "swiftstore/storage/transport.hpp"
#include "swiftstore/core/constants.hpp"
#include "swiftstore/storage/errors.hpp"

#include <algorithm>
#include <cstring>
#include <iostream>

namespace swiftstore {

CurlTransport::CurlTransport(const CurlTransportConfig& config)
    : config_(config) {
    // Strip trailing slashes so paths can always start with "/"
    while (!config_.storage_url.empty() && config_.storage_url.back() == '/') {
        config_.storage_url.pop_back();
    }
    while (!config_.cdn_url.empty() && config_.cdn_url.back() == '/') {
        config_.cdn_url.pop_back();
    }

    net::HttpClientConfig http_config;
    http_config.user_agent = config_.user_agent;
    http_config.verify_ssl_by_default = config_.verify_ssl;
    http_config.default_ca_bundle = config_.ca_bundle;
    http_config.default_connect_timeout =
        std::chrono::duration_cast<std::chrono::milliseconds>(config_.connect_timeout);
    http_config.default_total_timeout =
        std::chrono::duration_cast<std::chrono::milliseconds>(config_.request_timeout);
    http_config.max_response_size = constants::DEFAULT_MAX_RESPONSE_SIZE;
    http_client_ = std::make_unique<net::HttpClient>(http_config);
}

std::string CurlTransport::build_url(const TransportRequest& request) const {
    const std::string& base = request.cdn ? config_.cdn_url : config_.storage_url;
    if (base.empty()) {
        throw StorageError("Could not find specified endpoint");
    }

    std::string url = base + request.path;

    // Every request asks for JSON bodies
    auto params = request.params;
    params["format"] = "json";

    url += "?";
    bool first = true;
    for (const auto& [k, v] : params) {
        if (!first) url += "&";
        url += net::url_encode(k) + "=" + net::url_encode(v);
        first = false;
    }
    return url;
}

TransportResponse CurlTransport::request(const TransportRequest& request) {
    net::HttpRequest http_request;
    http_request.method = request.method;
    http_request.url = build_url(request);
    http_request.headers = request.headers;
    http_request.headers.set(constants::AUTH_TOKEN_HEADER, config_.auth_token);

    if ((request.method == net::HttpMethod::POST || request.method == net::HttpMethod::PUT) &&
        !http_request.headers.has("Content-Type")) {
        http_request.headers.set_content_type(constants::DEFAULT_REQUEST_CONTENT_TYPE);
    }

    // Drain the body source on demand; a block may span several curl reads
    std::span<const uint8_t> pending;
    if (request.body) {
        ByteSource* body = request.body;
        http_request.body_size = body->size_hint();
        http_request.body_reader = [body, &pending](uint8_t* dest, size_t max_bytes) -> size_t {
            size_t written = 0;
            while (written < max_bytes) {
                if (pending.empty()) {
                    pending = body->next_block();
                    if (pending.empty()) break;
                }
                size_t n = std::min(max_bytes - written, pending.size());
                std::memcpy(dest + written, pending.data(), n);
                pending = pending.subspan(n);
                written += n;
            }
            return written;
        };
    }
    http_request.response_sink = request.response_sink;

    auto response = http_client_->execute(http_request);

    if (config_.verbose) {
        std::cerr << "[http] " << net::http_method_to_string(request.method) << " "
                  << http_request.url << " -> " << response.status_code
                  << " (" << response.total_time.count() << " ms)\n";
    }

    if (!response.error.empty()) {
        if (response.is_network_error) {
            throw TransportError(response.error);
        }
        // Oversized buffered body or a sink that stopped the transfer
        throw StorageError(response.error);
    }

    TransportResponse result;
    result.status = response.status_code;
    result.headers = std::move(response.headers);
    result.body = std::move(response.body);
    return result;
}

}  // namespace swiftstore
