#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace swiftstore::net {

// HTTP methods
enum class HttpMethod {
    GET,
    POST,
    PUT,
    DELETE,
    HEAD
};

const char* http_method_to_string(HttpMethod method);

// Status codes the storage layer maps explicitly
enum class HttpStatus {
    OK = 200,
    Created = 201,
    Accepted = 202,
    NoContent = 204,
    NotFound = 404,
    Conflict = 409,
    ExpectationFailed = 417
};

bool is_success_status(int status);

// HTTP headers (case-insensitive)
class HttpHeaders {
public:
    void set(const std::string& name, const std::string& value);
    void add(const std::string& name, const std::string& value);
    void remove(const std::string& name);

    std::optional<std::string> get(const std::string& name) const;
    bool has(const std::string& name) const;

    // Iteration (names are lowercase)
    using HeaderPair = std::pair<std::string, std::string>;
    std::vector<HeaderPair> all() const;

    void set_content_type(const std::string& content_type);
    std::optional<std::string> content_type() const;
    std::optional<uint64_t> content_length() const;

private:
    // Headers stored as lowercase name -> values
    std::map<std::string, std::vector<std::string>> headers_;

    static std::string normalize_name(const std::string& name);
};

// Pulls the next bytes of a streamed request body into dest.
// Returns the number of bytes written; 0 signals end of body.
using BodyReader = std::function<size_t(uint8_t* dest, size_t max_bytes)>;

// Receives response body bytes as they arrive. Return false to abort.
using BodySink = std::function<bool(const uint8_t* data, size_t size)>;

// HTTP request
struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    HttpHeaders headers;

    // Buffered body; ignored when body_reader is set
    std::vector<uint8_t> body;

    // Streamed body. body_size unset means chunked transfer encoding.
    BodyReader body_reader;
    std::optional<uint64_t> body_size;

    // Streamed response. Only 2xx bodies are handed to the sink, any other
    // status is buffered into HttpResponse::body.
    BodySink response_sink;

    // Timeouts (0 = client default)
    std::chrono::milliseconds connect_timeout{0};
    std::chrono::milliseconds total_timeout{0};

    // SSL options
    bool verify_ssl = true;
    std::string ca_bundle_path;  // Empty = system default
};

// HTTP response
struct HttpResponse {
    int status_code = 0;
    HttpHeaders headers;
    std::vector<uint8_t> body;

    std::chrono::milliseconds total_time{0};

    std::string body_string() const;

    // Error info (for failed requests)
    std::string error;
    bool is_network_error = false;  // True if error was network-level, not HTTP status
};

// HTTP client configuration
struct HttpClientConfig {
    std::chrono::milliseconds default_connect_timeout{10000};
    std::chrono::milliseconds default_total_timeout{300000};

    // Limit for buffered response bodies (0 = unlimited)
    size_t max_response_size = 64 * 1024 * 1024;

    bool verify_ssl_by_default = true;
    std::string default_ca_bundle;

    bool tcp_keepalive = true;
    std::string user_agent = "swiftstore/1.0";

    // Verbose curl logging (for debugging)
    bool verbose = false;
};

// Blocking HTTP client. One curl easy handle per request, so a single
// client may be shared between threads.
class HttpClient {
public:
    explicit HttpClient(const HttpClientConfig& config = {});
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;
    HttpClient(HttpClient&&) noexcept;
    HttpClient& operator=(HttpClient&&) noexcept;

    // Synchronous request. Never throws for HTTP statuses.
    HttpResponse execute(const HttpRequest& request);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

// Percent-encode everything except unreserved characters (query values)
std::string url_encode(const std::string& str);

// Percent-encode everything except unreserved characters and `safe`
// (path segments; "/" kept by default)
std::string url_quote(const std::string& str, const std::string& safe = "/");

} // namespace swiftstore::net
