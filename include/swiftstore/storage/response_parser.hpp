#pragma once

#include "swiftstore/net/http.hpp"
#include "swiftstore/storage/transport.hpp"
#include "swiftstore/storage/types.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace swiftstore {

// "Sat, 01 Jan 2011 00:00:00 GMT" (Last-Modified header)
std::optional<std::chrono::system_clock::time_point> parse_http_date(const std::string& value);

// "2011-01-01T00:00:00.000000" (listing entries, always UTC)
std::optional<std::chrono::system_clock::time_point> parse_iso_timestamp(const std::string& value);

// ETag values may arrive quoted
std::string strip_etag_quotes(const std::string& etag);

/// Decode a response body that must be JSON.
/// @throws StorageError if the response has no content type.
/// @throws MalformedResponseError if the content type is not JSON or the
///         body does not parse.
nlohmann::json parse_json_body(const TransportResponse& response);

Container headers_to_container(const std::string& name, const net::HttpHeaders& headers);

Object headers_to_object(const std::string& name, const Container& container,
                         const net::HttpHeaders& headers);

// Listing entries. Throw MalformedResponseError on entries of the wrong shape.
std::vector<Container> json_to_containers(const nlohmann::json& body);
std::vector<Object> json_to_objects(const nlohmann::json& body, const Container& container);

} // namespace swiftstore
