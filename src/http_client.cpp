#include "swiftstore/net/http.hpp"
#include <curl/curl.h>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace swiftstore::net {

// ============================================================================
// Environment-based configuration helpers
// ============================================================================

// Get request timeout from environment or use default
static std::optional<std::chrono::seconds> get_request_timeout_override() {
    if (const char* env = std::getenv("SWIFTSTORE_REQUEST_TIMEOUT")) {
        try {
            unsigned long secs = std::stoul(env);
            // Sanity check: at least 5 seconds, at most 1 day
            if (secs >= 5 && secs <= 86400) {
                return std::chrono::seconds(secs);
            }
            std::cerr << "warning: SWIFTSTORE_REQUEST_TIMEOUT=" << env
                      << " out of range [5,86400], using default\n";
        } catch (const std::exception&) {
            std::cerr << "warning: invalid SWIFTSTORE_REQUEST_TIMEOUT=" << env
                      << ", using default\n";
        }
    }
    return std::nullopt;
}

// ============================================================================
// Utility functions
// ============================================================================

const char* http_method_to_string(HttpMethod method) {
    switch (method) {
        case HttpMethod::GET: return "GET";
        case HttpMethod::POST: return "POST";
        case HttpMethod::PUT: return "PUT";
        case HttpMethod::DELETE: return "DELETE";
        case HttpMethod::HEAD: return "HEAD";
    }
    return "GET";
}

bool is_success_status(int status) {
    return status >= 200 && status < 300;
}

static bool is_unreserved(unsigned char c) {
    return std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~';
}

std::string url_encode(const std::string& str) {
    return url_quote(str, "");
}

std::string url_quote(const std::string& str, const std::string& safe) {
    std::ostringstream encoded;
    encoded << std::hex << std::uppercase;

    for (unsigned char c : str) {
        if (is_unreserved(c) || safe.find(static_cast<char>(c)) != std::string::npos) {
            encoded << c;
        } else {
            encoded << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }

    return encoded.str();
}

// ============================================================================
// HttpHeaders
// ============================================================================

std::string HttpHeaders::normalize_name(const std::string& name) {
    std::string result = name;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

void HttpHeaders::set(const std::string& name, const std::string& value) {
    headers_[normalize_name(name)] = {value};
}

void HttpHeaders::add(const std::string& name, const std::string& value) {
    headers_[normalize_name(name)].push_back(value);
}

void HttpHeaders::remove(const std::string& name) {
    headers_.erase(normalize_name(name));
}

std::optional<std::string> HttpHeaders::get(const std::string& name) const {
    auto it = headers_.find(normalize_name(name));
    if (it != headers_.end() && !it->second.empty()) {
        return it->second[0];
    }
    return std::nullopt;
}

bool HttpHeaders::has(const std::string& name) const {
    return headers_.find(normalize_name(name)) != headers_.end();
}

std::vector<HttpHeaders::HeaderPair> HttpHeaders::all() const {
    std::vector<HeaderPair> result;
    for (const auto& [name, values] : headers_) {
        for (const auto& value : values) {
            result.emplace_back(name, value);
        }
    }
    return result;
}

void HttpHeaders::set_content_type(const std::string& content_type) {
    set("Content-Type", content_type);
}

std::optional<std::string> HttpHeaders::content_type() const {
    return get("Content-Type");
}

std::optional<uint64_t> HttpHeaders::content_length() const {
    auto val = get("Content-Length");
    if (val) {
        try {
            return std::stoull(*val);
        } catch (const std::invalid_argument&) {
            // Invalid Content-Length header format
        } catch (const std::out_of_range&) {
            // Content-Length value out of range
        }
    }
    return std::nullopt;
}

// ============================================================================
// HttpResponse
// ============================================================================

std::string HttpResponse::body_string() const {
    return std::string(body.begin(), body.end());
}

// ============================================================================
// CURL callback functions
// ============================================================================

// Context for response accumulation. 2xx bodies go to the sink when one is
// set; everything else is buffered up to max_size.
struct WriteCallbackContext {
    CURL* curl = nullptr;
    std::vector<uint8_t>* response = nullptr;
    const BodySink* sink = nullptr;
    size_t max_size = 0;
    bool size_exceeded = false;
    bool sink_aborted = false;
    std::exception_ptr error;
};

static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<WriteCallbackContext*>(userdata);
    size_t bytes = size * nmemb;

    long status = 0;
    curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &status);

    if (ctx->sink && *ctx->sink && is_success_status(static_cast<int>(status))) {
        try {
            if (!(*ctx->sink)(reinterpret_cast<const uint8_t*>(ptr), bytes)) {
                ctx->sink_aborted = true;
                return 0;
            }
        } catch (...) {
            ctx->error = std::current_exception();
            return 0;
        }
        return bytes;
    }

    // Check if adding this data would exceed the limit
    if (ctx->max_size > 0 && ctx->response->size() + bytes > ctx->max_size) {
        ctx->size_exceeded = true;
        return 0;  // Return 0 to signal error and abort transfer
    }

    ctx->response->insert(ctx->response->end(), ptr, ptr + bytes);
    return bytes;
}

static size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* headers = static_cast<HttpHeaders*>(userdata);
    size_t bytes = size * nitems;

    std::string line(buffer, bytes);

    // Remove trailing CRLF
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.pop_back();
    }

    // A new status line starts a new header block (100-continue, redirects)
    if (line.starts_with("HTTP/")) {
        *headers = HttpHeaders{};
        return bytes;
    }
    if (line.empty()) {
        return bytes;
    }

    size_t colon = line.find(':');
    if (colon != std::string::npos) {
        std::string name = line.substr(0, colon);
        std::string value = line.substr(colon + 1);

        // Trim leading whitespace from value
        size_t start = value.find_first_not_of(" \t");
        value = start != std::string::npos ? value.substr(start) : std::string{};

        headers->add(name, value);
    }

    return bytes;
}

struct ReadCallbackContext {
    const uint8_t* data = nullptr;   // buffered body
    size_t size = 0;
    size_t pos = 0;
    const BodyReader* reader = nullptr;  // streamed body
    std::exception_ptr error;
};

static size_t read_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* rd = static_cast<ReadCallbackContext*>(userdata);
    size_t max_bytes = size * nitems;

    if (rd->reader) {
        try {
            return (*rd->reader)(reinterpret_cast<uint8_t*>(buffer), max_bytes);
        } catch (...) {
            rd->error = std::current_exception();
            return CURL_READFUNC_ABORT;
        }
    }

    size_t remaining = rd->size - rd->pos;
    size_t to_copy = std::min(max_bytes, remaining);
    if (to_copy > 0) {
        std::memcpy(buffer, rd->data + rd->pos, to_copy);
        rd->pos += to_copy;
    }
    return to_copy;
}

// ============================================================================
// HttpClient Implementation
// ============================================================================

class HttpClient::Impl {
public:
    explicit Impl(const HttpClientConfig& config)
        : config_(config) {
        // Initialize CURL globally (thread-safe)
        static std::once_flag curl_init_flag;
        std::call_once(curl_init_flag, []() {
            curl_global_init(CURL_GLOBAL_ALL);
        });

        if (auto timeout = get_request_timeout_override()) {
            config_.default_total_timeout =
                std::chrono::duration_cast<std::chrono::milliseconds>(*timeout);
        }
    }

    HttpResponse execute(const HttpRequest& request) {
        HttpResponse response;

        std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> handle(
            curl_easy_init(), &curl_easy_cleanup);
        if (!handle) {
            response.error = "Failed to create CURL handle";
            response.is_network_error = true;
            return response;
        }
        CURL* curl = handle.get();

        curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());

        switch (request.method) {
            case HttpMethod::GET:
                curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
                break;
            case HttpMethod::POST:
                curl_easy_setopt(curl, CURLOPT_POST, 1L);
                break;
            case HttpMethod::PUT:
                curl_easy_setopt(curl, CURLOPT_UPLOAD, 1L);
                break;
            case HttpMethod::DELETE:
                curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "DELETE");
                break;
            case HttpMethod::HEAD:
                curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
                break;
        }

        // Request body
        ReadCallbackContext read_ctx;
        bool streamed = static_cast<bool>(request.body_reader);
        bool chunked = false;
        if (streamed) {
            read_ctx.reader = &request.body_reader;
            chunked = !request.body_size.has_value();
        } else {
            read_ctx.data = request.body.data();
            read_ctx.size = request.body.size();
        }

        if (request.method == HttpMethod::PUT) {
            curl_easy_setopt(curl, CURLOPT_READFUNCTION, read_callback);
            curl_easy_setopt(curl, CURLOPT_READDATA, &read_ctx);
            if (streamed) {
                if (!chunked) {
                    curl_easy_setopt(curl, CURLOPT_INFILESIZE_LARGE,
                                     static_cast<curl_off_t>(*request.body_size));
                }
            } else {
                // Also covers the empty-body PUT: an explicit Content-Length: 0
                // avoids a 411 (Length Required).
                curl_easy_setopt(curl, CURLOPT_INFILESIZE_LARGE,
                                 static_cast<curl_off_t>(request.body.size()));
            }
        } else if (request.method == HttpMethod::POST) {
            if (streamed) {
                curl_easy_setopt(curl, CURLOPT_READFUNCTION, read_callback);
                curl_easy_setopt(curl, CURLOPT_READDATA, &read_ctx);
                if (!chunked) {
                    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                                     static_cast<curl_off_t>(*request.body_size));
                }
            } else {
                curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.data());
                curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                                 static_cast<curl_off_t>(request.body.size()));
            }
        }

        // Headers
        std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headers_list(
            nullptr, &curl_slist_free_all);
        auto append_header = [&](const std::string& header) {
            curl_slist* next = curl_slist_append(headers_list.get(), header.c_str());
            if (next) {
                headers_list.release();
                headers_list.reset(next);
            }
        };
        for (const auto& [name, value] : request.headers.all()) {
            append_header(name + ": " + value);
        }
        if (chunked) {
            append_header("Transfer-Encoding: chunked");
        }
        // Don't wait for 100-continue on uploads
        append_header("Expect:");
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers_list.get());

        if (!config_.user_agent.empty()) {
            curl_easy_setopt(curl, CURLOPT_USERAGENT, config_.user_agent.c_str());
        }

        // Response callbacks
        std::vector<uint8_t> response_body;
        WriteCallbackContext write_ctx;
        write_ctx.curl = curl;
        write_ctx.response = &response_body;
        write_ctx.sink = request.response_sink ? &request.response_sink : nullptr;
        write_ctx.max_size = config_.max_response_size;
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &write_ctx);

        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);

        // Timeouts
        auto connect_timeout = request.connect_timeout.count() > 0
            ? request.connect_timeout : config_.default_connect_timeout;
        auto total_timeout = request.total_timeout.count() > 0
            ? request.total_timeout : config_.default_total_timeout;
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(connect_timeout.count()));
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(total_timeout.count()));

        if (config_.tcp_keepalive) {
            curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
        }

        // SSL options
        bool ssl_verify_enabled = request.verify_ssl && config_.verify_ssl_by_default;
        if (!ssl_verify_enabled) {
            static std::atomic<bool> ssl_warning_shown{false};
            if (!ssl_warning_shown.exchange(true)) {
                std::cerr << "SECURITY WARNING: SSL verification disabled via configuration.\n"
                          << "This exposes connections to man-in-the-middle attacks.\n";
            }
        }
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, ssl_verify_enabled ? 1L : 0L);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, ssl_verify_enabled ? 2L : 0L);

        if (!request.ca_bundle_path.empty()) {
            curl_easy_setopt(curl, CURLOPT_CAINFO, request.ca_bundle_path.c_str());
        } else if (!config_.default_ca_bundle.empty()) {
            curl_easy_setopt(curl, CURLOPT_CAINFO, config_.default_ca_bundle.c_str());
        }

        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 10L);

        if (config_.verbose) {
            curl_easy_setopt(curl, CURLOPT_VERBOSE, 1L);
        }

        // Execute
        auto start_time = std::chrono::steady_clock::now();
        CURLcode res = curl_easy_perform(curl);
        auto end_time = std::chrono::steady_clock::now();

        response.total_time = std::chrono::duration_cast<std::chrono::milliseconds>(
            end_time - start_time);

        // Body producer/consumer failures belong to the caller
        if (read_ctx.error) {
            std::rethrow_exception(read_ctx.error);
        }
        if (write_ctx.error) {
            std::rethrow_exception(write_ctx.error);
        }

        long status = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
        response.status_code = static_cast<int>(status);

        if (res == CURLE_OK) {
            response.body = std::move(response_body);
        } else if (res == CURLE_WRITE_ERROR && write_ctx.size_exceeded) {
            response.error = "Response body exceeded maximum size limit of " +
                             std::to_string(config_.max_response_size) + " bytes";
            response.is_network_error = false;
        } else if (res == CURLE_WRITE_ERROR && write_ctx.sink_aborted) {
            response.error = "Response body rejected by sink";
            response.is_network_error = false;
        } else {
            response.error = curl_easy_strerror(res);
            response.is_network_error = true;
        }

        return response;
    }

private:
    HttpClientConfig config_;
};

// ============================================================================
// HttpClient public interface
// ============================================================================

HttpClient::HttpClient(const HttpClientConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

HttpClient::~HttpClient() = default;

HttpClient::HttpClient(HttpClient&&) noexcept = default;
HttpClient& HttpClient::operator=(HttpClient&&) noexcept = default;

HttpResponse HttpClient::execute(const HttpRequest& request) {
    return impl_->execute(request);
}

} // namespace swiftstore::net
