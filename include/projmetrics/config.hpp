#pragma once

#include <projmetrics/result.hpp>
#include <projmetrics/scan/comment_rules.hpp>
#include <projmetrics/scan/profile.hpp>
#include <projmetrics/scan/scanner.hpp>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace projmetrics {

// One configuration layer. Unset optionals leave the lower layer's value
// in place when layers are merged.
struct Config {
    // [scan]
    std::optional<bool> include_hidden;
    std::optional<bool> default_excludes;
    std::vector<std::string> exclude_dirs;   // accumulates across layers
    std::optional<int64_t> jobs;

    // [report]
    std::optional<Profile> profile;
    std::optional<int64_t> top;
    std::optional<bool> test_ratio;
    std::optional<bool> only_profile_exts;

    // [rules] extension -> family, added to the built-in table
    std::map<std::string, RuleFamily> rules;

    // Load from a TOML config file
    static Result<Config> load(const std::filesystem::path& path);

    // Parse from TOML string; source_name appears in error messages
    static Result<Config> parse(const std::string& toml_str,
                                const std::string& source_name = "<config>");

    // Merge another config on top (other's set values override this)
    void merge(const Config& other);

    // global -> project -> command line
    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& project,
                            const Config& cli);

    // Resolve into scan settings; unset fields take their defaults
    ScanOptions to_scan_options(const std::filesystem::path& root) const;
    size_t top_n() const;
};

// ~/.projmetrics/config.toml, or "" if no home directory is known
std::string global_config_path();

// <root>/.projmetrics.toml
std::filesystem::path project_config_path(const std::filesystem::path& root);

} // namespace projmetrics
