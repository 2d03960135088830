#pragma once

#include <cstdint>
#include <string>

namespace swiftstore {

// URL-quote a container name for use as a path segment.
// A leading "/" is dropped. Throws InvalidContainerNameError when the quoted
// name is empty, still contains "/", or exceeds 256 bytes.
std::string clean_container_name(const std::string& name);

// URL-quote an object name ("/" is kept, pseudo-directories are allowed)
std::string clean_object_name(const std::string& name);

// Name of part `index` of a multipart object: "<object>/00000003"
std::string part_name(const std::string& object_name, uint64_t index);

// Content type for an object name, from its extension.
// Falls back to application/octet-stream.
std::string guess_content_type(const std::string& object_name);

} // namespace swiftstore
