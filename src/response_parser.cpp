#include "swiftstore/storage/response_parser.hpp"
#include "swiftstore/core/constants.hpp"
#include "swiftstore/storage/errors.hpp"

#include <cctype>
#include <cstdio>
#include <cstring>
#include <ctime>

namespace swiftstore {

namespace {

constexpr const char* OBJECT_META_PREFIX = "x-object-meta-";

std::optional<std::chrono::system_clock::time_point> to_time_point(int year, int month, int day,
                                                                   int hour, int min, int sec) {
    std::tm tm = {};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = min;
    tm.tm_sec = sec;
    tm.tm_isdst = 0;
    time_t tt = timegm(&tm);
    if (tt == -1) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(tt);
}

// Numeric header, 0 when absent
uint64_t header_count(const net::HttpHeaders& headers, const std::string& name) {
    auto value = headers.get(name);
    if (!value || value->empty()) {
        return 0;
    }
    try {
        return std::stoull(*value);
    } catch (const std::exception&) {
        throw MalformedResponseError("Invalid numeric header " + name + ": " + *value, *value);
    }
}

}  // namespace

std::optional<std::chrono::system_clock::time_point> parse_http_date(const std::string& value) {
    static const char* months[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                   "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};
    char weekday[4] = {};
    char month_name[4] = {};
    int day, year, hour, min, sec;
    if (sscanf(value.c_str(), "%3s %d %3s %d %d:%d:%d",
               weekday, &day, month_name, &year, &hour, &min, &sec) != 7) {
        return std::nullopt;
    }
    for (int m = 0; m < 12; ++m) {
        if (std::strcmp(month_name, months[m]) == 0) {
            return to_time_point(year, m + 1, day, hour, min, sec);
        }
    }
    return std::nullopt;
}

std::optional<std::chrono::system_clock::time_point> parse_iso_timestamp(const std::string& value) {
    int year, month, day, hour, min, sec;
    int consumed = 0;
    if (sscanf(value.c_str(), "%d-%d-%dT%d:%d:%d%n",
               &year, &month, &day, &hour, &min, &sec, &consumed) != 6) {
        return std::nullopt;
    }

    // Fraction of any length, scaled to microseconds (extra digits dropped)
    int micros = 0;
    size_t pos = static_cast<size_t>(consumed);
    if (pos < value.size() && value[pos] == '.') {
        int digits = 0;
        for (++pos; pos < value.size() && std::isdigit(static_cast<unsigned char>(value[pos])); ++pos) {
            if (digits < 6) {
                micros = micros * 10 + (value[pos] - '0');
                ++digits;
            }
        }
        for (; digits < 6; ++digits) micros *= 10;
    }

    auto tp = to_time_point(year, month, day, hour, min, sec);
    if (tp && micros > 0) {
        *tp += std::chrono::microseconds(micros);
    }
    return tp;
}

std::string strip_etag_quotes(const std::string& etag) {
    if (etag.size() >= 2 && etag.front() == '"' && etag.back() == '"') {
        return etag.substr(1, etag.size() - 2);
    }
    return etag;
}

nlohmann::json parse_json_body(const TransportResponse& response) {
    auto content_type = response.headers.content_type();
    if (!content_type) {
        throw StorageError("Missing content-type header");
    }
    if (content_type->find(constants::JSON_CONTENT_TYPE) == std::string::npos) {
        throw MalformedResponseError("Expected JSON response, got " + *content_type,
                                     response.body_string());
    }

    auto parsed = nlohmann::json::parse(response.body.begin(), response.body.end(),
                                        nullptr, false);
    if (parsed.is_discarded()) {
        throw MalformedResponseError("Failed to parse JSON", response.body_string());
    }
    return parsed;
}

Container headers_to_container(const std::string& name, const net::HttpHeaders& headers) {
    Container container;
    container.name = name;
    container.object_count = header_count(headers, "x-container-object-count");
    container.bytes = header_count(headers, "x-container-bytes-used");
    return container;
}

Object headers_to_object(const std::string& name, const Container& container,
                         const net::HttpHeaders& headers) {
    Object obj;
    obj.name = name;
    obj.container = container;
    obj.size = header_count(headers, "content-length");
    obj.hash = strip_etag_quotes(headers.get("etag").value_or(""));
    obj.content_type = headers.content_type().value_or("");
    if (auto lm = headers.get("last-modified")) {
        obj.last_modified = parse_http_date(*lm);
    }

    const size_t prefix_len = std::strlen(OBJECT_META_PREFIX);
    for (const auto& [key, value] : headers.all()) {
        if (key.compare(0, prefix_len, OBJECT_META_PREFIX) == 0) {
            obj.meta_data[key.substr(prefix_len)] = value;
        }
    }
    return obj;
}

std::vector<Container> json_to_containers(const nlohmann::json& body) {
    if (!body.is_array()) {
        throw MalformedResponseError("Container listing is not an array", body.dump());
    }

    std::vector<Container> containers;
    containers.reserve(body.size());
    try {
        for (const auto& entry : body) {
            Container c;
            c.name = entry.at("name").get<std::string>();
            c.object_count = entry.value("count", uint64_t{0});
            c.bytes = entry.value("bytes", uint64_t{0});
            containers.push_back(std::move(c));
        }
    } catch (const nlohmann::json::exception& e) {
        throw MalformedResponseError(std::string("Bad container entry: ") + e.what(), body.dump());
    }
    return containers;
}

std::vector<Object> json_to_objects(const nlohmann::json& body, const Container& container) {
    if (!body.is_array()) {
        throw MalformedResponseError("Object listing is not an array", body.dump());
    }

    std::vector<Object> objects;
    objects.reserve(body.size());
    try {
        for (const auto& entry : body) {
            Object obj;
            obj.name = entry.at("name").get<std::string>();
            obj.container = container;
            obj.size = entry.value("bytes", uint64_t{0});
            obj.hash = entry.value("hash", std::string{});
            obj.content_type = entry.value("content_type", std::string{});
            auto lm = entry.value("last_modified", std::string{});
            if (!lm.empty()) {
                obj.last_modified = parse_iso_timestamp(lm);
            }
            objects.push_back(std::move(obj));
        }
    } catch (const nlohmann::json::exception& e) {
        throw MalformedResponseError(std::string("Bad object entry: ") + e.what(), body.dump());
    }
    return objects;
}

}  // namespace swiftstore
