#pragma once

#include <string>

namespace projmetrics {

// Match a single name (no '/') against a wildcard pattern.
// Supports: * (any run of chars), ? (one char), [abc], [a-z], [!0-9]
bool wildcard_match(const std::string& pattern, const std::string& name,
                    bool ignore_case = false);

// Match a relative path against a pattern, segment by segment (both
// normalized to forward slashes). '**' matches zero or more segments.
bool glob_match(const std::string& pattern, const std::string& path,
                bool ignore_case = false);

// True if the pattern uses any wildcard syntax
bool has_wildcards(const std::string& pattern);

} // namespace projmetrics
