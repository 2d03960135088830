#include "swiftstore/storage/naming.hpp"
#include "swiftstore/core/constants.hpp"
#include "swiftstore/net/http.hpp"
#include "swiftstore/storage/errors.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <unordered_map>

namespace swiftstore {

std::string clean_container_name(const std::string& name) {
    std::string cleaned = name;
    if (!cleaned.empty() && cleaned.front() == '/') {
        cleaned.erase(0, 1);
    }
    cleaned = net::url_quote(cleaned);

    if (cleaned.empty()) {
        throw InvalidContainerNameError("Container name cannot be empty", cleaned);
    }
    if (cleaned.find('/') != std::string::npos) {
        throw InvalidContainerNameError("Container name cannot contain slashes", cleaned);
    }
    if (cleaned.size() > constants::MAX_CONTAINER_NAME_LENGTH) {
        throw InvalidContainerNameError("Container name cannot be longer than " +
                                        std::to_string(constants::MAX_CONTAINER_NAME_LENGTH) +
                                        " bytes", cleaned);
    }
    return cleaned;
}

std::string clean_object_name(const std::string& name) {
    return net::url_quote(name);
}

std::string part_name(const std::string& object_name, uint64_t index) {
    char suffix[32];
    std::snprintf(suffix, sizeof(suffix), "/%0*llu", constants::PART_NUMBER_WIDTH,
                  static_cast<unsigned long long>(index));
    return object_name + suffix;
}

std::string guess_content_type(const std::string& object_name) {
    static const std::unordered_map<std::string, std::string> types = {
        {"txt", "text/plain"},
        {"html", "text/html"},
        {"htm", "text/html"},
        {"css", "text/css"},
        {"csv", "text/csv"},
        {"xml", "application/xml"},
        {"js", "application/javascript"},
        {"json", "application/json"},
        {"pdf", "application/pdf"},
        {"zip", "application/zip"},
        {"gz", "application/gzip"},
        {"tar", "application/x-tar"},
        {"png", "image/png"},
        {"jpg", "image/jpeg"},
        {"jpeg", "image/jpeg"},
        {"gif", "image/gif"},
        {"svg", "image/svg+xml"},
        {"mp3", "audio/mpeg"},
        {"mp4", "video/mp4"},
    };

    auto slash = object_name.rfind('/');
    auto dot = object_name.rfind('.');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
        return constants::DEFAULT_CONTENT_TYPE;
    }

    std::string ext = object_name.substr(dot + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    auto it = types.find(ext);
    if (it == types.end()) {
        return constants::DEFAULT_CONTENT_TYPE;
    }
    return it->second;
}

}  // namespace swiftstore
