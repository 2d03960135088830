#pragma once

#include "swiftstore/net/http.hpp"
#include "swiftstore/storage/byte_source.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace swiftstore {

// One request against the storage (or CDN) endpoint.
// path is relative to the endpoint and already quoted ("/container/object").
struct TransportRequest {
    net::HttpMethod method = net::HttpMethod::GET;
    std::string path;
    net::HttpHeaders headers;
    std::map<std::string, std::string> params;

    // Streamed request body; nullptr sends an empty body
    ByteSource* body = nullptr;

    // Receives 2xx response bodies as they arrive instead of buffering them
    net::BodySink response_sink;

    // Route to the CDN management endpoint
    bool cdn = false;
};

struct TransportResponse {
    int status = 0;
    net::HttpHeaders headers;
    std::vector<uint8_t> body;  // Empty when streamed to a sink

    std::string body_string() const { return std::string(body.begin(), body.end()); }
};

/// The request/response primitive every storage operation is built on.
///
/// Implementations resolve the endpoint and attach authentication. They
/// report every HTTP status as-is; mapping statuses to errors is left to the
/// caller. Failures without a status raise TransportError.
class Transport {
public:
    virtual ~Transport() = default;

    virtual TransportResponse request(const TransportRequest& request) = 0;
};

struct CurlTransportConfig {
    std::string storage_url;   // e.g. https://storage.example.com/v1/AUTH_acct
    std::string cdn_url;       // Empty = CDN operations unavailable
    std::string auth_token;
    std::string user_agent = "swiftstore/1.0";
    std::chrono::seconds connect_timeout{10};
    std::chrono::seconds request_timeout{300};
    bool verify_ssl = true;
    std::string ca_bundle;
    bool verbose = false;
};

/// Transport over libcurl, authenticated with a pre-issued X-Auth-Token.
class CurlTransport : public Transport {
public:
    explicit CurlTransport(const CurlTransportConfig& config);

    TransportResponse request(const TransportRequest& request) override;

    // Full URL for a request (exposed for logging and tests)
    std::string build_url(const TransportRequest& request) const;

private:
    CurlTransportConfig config_;
    std::unique_ptr<net::HttpClient> http_client_;
};

} // namespace swiftstore
