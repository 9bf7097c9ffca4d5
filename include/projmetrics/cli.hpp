#pragma once

#include <projmetrics/config.hpp>
#include <projmetrics/log.hpp>
#include <projmetrics/result.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace projmetrics {

struct CliArgs {
    // Settings given on the command line; the top configuration layer
    Config overrides;

    std::filesystem::path root = ".";
    std::optional<std::filesystem::path> config_path;
    bool no_config = false;
    std::vector<std::filesystem::path> exclude_self;
    std::optional<log::Level> log_level;

    bool help = false;
    bool version = false;
};

// Parse arguments, excluding the program name
Result<CliArgs> parse_args(const std::vector<std::string>& args);

const char* usage_text();
const char* version_string();

} // namespace projmetrics
