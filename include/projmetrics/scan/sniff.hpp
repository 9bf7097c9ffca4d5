#pragma once

#include <cstddef>
#include <filesystem>

namespace projmetrics {

constexpr size_t SNIFF_BYTES = 8192;

// A prefix is text when it contains no NUL byte.
bool is_text_prefix(const char* data, size_t len);

// Read up to sniff_bytes from the start of the file and test the prefix.
// Open or read failures report false, the same as binary content.
bool is_text_file(const std::filesystem::path& path, size_t sniff_bytes = SNIFF_BYTES);

} // namespace projmetrics
