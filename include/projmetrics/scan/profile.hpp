#pragma once

#include <projmetrics/result.hpp>
#include <string>
#include <unordered_set>

namespace projmetrics {

// Language-focused view of a tree. Biases the report's extension order
// and optional filtering; never changes classification.
enum class Profile { All, Java, Python, Js };

const char* profile_name(Profile p);
Result<Profile> parse_profile(const std::string& name);

// Extensions of interest for the profile. Empty for Profile::All.
const std::unordered_set<std::string>& profile_extensions(Profile p);

} // namespace projmetrics
