#include <projmetrics/config.hpp>
#include <toml++/toml.hpp>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <thread>

namespace projmetrics {

constexpr size_t DEFAULT_TOP = 10;

static MetricsError type_error(const std::string& source, const std::string& key,
                               const char* expected) {
    return MetricsError{MetricsError::Config,
        "'" + key + "' must be " + expected, "", source, 0};
}

// Read an optional typed key from a table; a key of the wrong type is an error.
template<typename T>
static Result<std::optional<T>> read_key(const toml::table& tbl, const char* key,
                                         const std::string& section,
                                         const std::string& source,
                                         const char* expected) {
    auto node = tbl[key];
    if (!node) return Result<std::optional<T>>::ok(std::nullopt);
    auto v = node.value<T>();
    if (!v) return type_error(source, section + "." + key, expected);
    return Result<std::optional<T>>::ok(std::optional<T>(*v));
}

static Status parse_scan(const toml::table& scan, Config& cfg, const std::string& source) {
    auto hidden = read_key<bool>(scan, "include-hidden", "scan", source, "a boolean");
    PROJMETRICS_TRY(hidden);
    cfg.include_hidden = hidden.value();

    auto defaults = read_key<bool>(scan, "default-excludes", "scan", source, "a boolean");
    PROJMETRICS_TRY(defaults);
    cfg.default_excludes = defaults.value();

    auto jobs = read_key<int64_t>(scan, "jobs", "scan", source, "an integer");
    PROJMETRICS_TRY(jobs);
    if (jobs.value() && *jobs.value() < 0) {
        return MetricsError{MetricsError::Config,
            "'scan.jobs' must not be negative", "use 0 for one job per core", source, 0};
    }
    cfg.jobs = jobs.value();

    if (auto node = scan["exclude-dirs"]) {
        auto arr = node.as_array();
        if (!arr) return type_error(source, "scan.exclude-dirs", "an array of strings");
        for (const auto& el : *arr) {
            auto s = el.value<std::string>();
            if (!s) return type_error(source, "scan.exclude-dirs", "an array of strings");
            cfg.exclude_dirs.push_back(*s);
        }
    }
    return ok_status();
}

static Status parse_report(const toml::table& report, Config& cfg, const std::string& source) {
    auto profile = read_key<std::string>(report, "profile", "report", source, "a string");
    PROJMETRICS_TRY(profile);
    if (profile.value()) {
        auto p = parse_profile(*profile.value());
        if (p.is_err()) {
            return MetricsError{MetricsError::Config,
                "'report.profile': " + p.error().message, p.error().hint, source, 0};
        }
        cfg.profile = p.value();
    }

    auto top = read_key<int64_t>(report, "top", "report", source, "an integer");
    PROJMETRICS_TRY(top);
    cfg.top = top.value();

    auto ratio = read_key<bool>(report, "test-ratio", "report", source, "a boolean");
    PROJMETRICS_TRY(ratio);
    cfg.test_ratio = ratio.value();

    auto only = read_key<bool>(report, "only-profile-exts", "report", source, "a boolean");
    PROJMETRICS_TRY(only);
    cfg.only_profile_exts = only.value();
    return ok_status();
}

static Status parse_rules(const toml::table& rules, Config& cfg, const std::string& source) {
    for (const auto& [key, val] : rules) {
        std::string ext(key.str());
        auto name = val.value<std::string>();
        if (!name) return type_error(source, "rules." + ext, "a rule family name");

        auto family = parse_rule_family(*name);
        if (family.is_err()) {
            return MetricsError{MetricsError::Config,
                "'rules." + ext + "': " + family.error().message,
                family.error().hint, source, 0};
        }
        cfg.rules[normalize_extension(ext)] = family.value();
    }
    return ok_status();
}

Result<Config> Config::parse(const std::string& toml_str, const std::string& source_name) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str, source_name);
    } catch (const toml::parse_error& e) {
        return MetricsError{MetricsError::Parse,
            std::string("config TOML parse error: ") + std::string(e.description()),
            "", source_name, static_cast<int>(e.source().begin.line)};
    }

    Config cfg;

    if (auto node = doc["scan"]) {
        auto scan = node.as_table();
        if (!scan) return type_error(source_name, "scan", "a table");
        PROJMETRICS_TRY(parse_scan(*scan, cfg, source_name));
    }

    if (auto node = doc["report"]) {
        auto report = node.as_table();
        if (!report) return type_error(source_name, "report", "a table");
        PROJMETRICS_TRY(parse_report(*report, cfg, source_name));
    }

    if (auto node = doc["rules"]) {
        auto rules = node.as_table();
        if (!rules) return type_error(source_name, "rules", "a table");
        PROJMETRICS_TRY(parse_rules(*rules, cfg, source_name));
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::filesystem::path& path) {
    // An ifstream opens a directory without complaint and reads nothing
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return MetricsError{MetricsError::IO,
            "config path is not a readable file: " + path.string(),
            "pass a TOML file to --config"};
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return MetricsError{MetricsError::IO,
            "cannot open config file: " + path.string()};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.bad()) {
        return MetricsError{MetricsError::IO,
            "error reading config file: " + path.string()};
    }
    return Config::parse(ss.str(), path.string());
}

void Config::merge(const Config& other) {
    if (other.include_hidden) include_hidden = other.include_hidden;
    if (other.default_excludes) default_excludes = other.default_excludes;
    if (other.jobs) jobs = other.jobs;
    exclude_dirs.insert(exclude_dirs.end(),
                        other.exclude_dirs.begin(), other.exclude_dirs.end());

    if (other.profile) profile = other.profile;
    if (other.top) top = other.top;
    if (other.test_ratio) test_ratio = other.test_ratio;
    if (other.only_profile_exts) only_profile_exts = other.only_profile_exts;

    for (const auto& [ext, family] : other.rules) {
        rules[ext] = family;
    }
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& project,
                         const Config& cli) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (project.has_value()) result.merge(project.value());
    result.merge(cli);
    return result;
}

ScanOptions Config::to_scan_options(const std::filesystem::path& root) const {
    ScanOptions opts;
    opts.root = root;
    opts.profile = profile.value_or(Profile::All);
    opts.only_profile_exts = only_profile_exts.value_or(false);
    opts.test_ratio = test_ratio.value_or(false);

    opts.walk.include_hidden = include_hidden.value_or(false);
    opts.walk.default_excludes = default_excludes.value_or(true);
    opts.walk.exclude_dirs = exclude_dirs;

    for (const auto& [ext, family] : rules) {
        opts.rules.set(ext, family);
    }

    int64_t j = jobs.value_or(1);
    if (j == 0) {
        j = static_cast<int64_t>(std::thread::hardware_concurrency());
        if (j == 0) j = 1;
    }
    opts.jobs = static_cast<size_t>(j < 1 ? 1 : j);
    return opts;
}

size_t Config::top_n() const {
    if (!top) return DEFAULT_TOP;
    return *top < 0 ? 0 : static_cast<size_t>(*top);
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.projmetrics/config.toml";
}

std::filesystem::path project_config_path(const std::filesystem::path& root) {
    return root / ".projmetrics.toml";
}

} // namespace projmetrics
