#include <projmetrics/cli.hpp>
#include <cerrno>
#include <cstdlib>

namespace projmetrics {

const char* version_string() {
    return "0.3.0";
}

const char* usage_text() {
    return
        "usage: projmetrics [--java | --python | --js | --all] [--root DIR]\n"
        "                   [--include-hidden] [--no-default-excludes]\n"
        "                   [--exclude-dir NAME]... [--top N] [--only-profile-exts]\n"
        "                   [--test-ratio] [-j N] [--exclude-self PATH]...\n"
        "                   [--config FILE | --no-config] [-v | -q | --log-level LEVEL]\n"
        "\n"
        "Project metrics: files, bytes, LOC (with basic comment heuristics).\n"
        "\n"
        "options:\n"
        "  --java, --python, --js, --all\n"
        "                        profile of extensions to focus on (default: all)\n"
        "  --root DIR            directory to scan (default: .)\n"
        "  --include-hidden      include dot-files and dot-directories\n"
        "  --no-default-excludes do not skip build/VCS/tooling directories\n"
        "  --exclude-dir NAME    skip directories with this name or pattern (repeatable)\n"
        "  --top N               number of largest/longest files to list (default: 10)\n"
        "  --only-profile-exts   count only files with the profile's extensions\n"
        "  --test-ratio          report test vs non-test files and lines\n"
        "  -j, --jobs N          classify files on N threads (0: one per core)\n"
        "  --exclude-self PATH   never count this file (repeatable)\n"
        "  --config FILE         project config file (default: ROOT/.projmetrics.toml)\n"
        "  --no-config           ignore global and project config files\n"
        "  -v, --verbose         more logging (-vv for trace)\n"
        "  -q, --quiet           only log errors\n"
        "  --log-level LEVEL     trace, debug, info, warn, error or off\n"
        "  -h, --help            show this help and exit\n"
        "  --version             show the version and exit\n";
}

static Result<int64_t> parse_int(const std::string& flag, const std::string& text) {
    if (text.empty()) {
        return MetricsError{MetricsError::InvalidArg,
            "argument " + flag + ": expected an integer"};
    }
    errno = 0;
    char* end = nullptr;
    long long v = std::strtoll(text.c_str(), &end, 10);
    if (errno == ERANGE || end == nullptr || *end != '\0') {
        return MetricsError{MetricsError::InvalidArg,
            "argument " + flag + ": invalid int value: '" + text + "'"};
    }
    return Result<int64_t>::ok(static_cast<int64_t>(v));
}

namespace {

// Walks the argument list, splitting "--flag=value" forms.
class ArgCursor {
public:
    explicit ArgCursor(const std::vector<std::string>& args) : args_(args) {}

    bool done() const { return i_ >= args_.size(); }

    // Next flag; an attached "=value" is held for value()
    std::string next_flag() {
        std::string arg = args_[i_++];
        attached_.reset();
        if (arg.size() > 2 && arg.compare(0, 2, "--") == 0) {
            auto eq = arg.find('=');
            if (eq != std::string::npos) {
                attached_ = arg.substr(eq + 1);
                return arg.substr(0, eq);
            }
        }
        return arg;
    }

    Result<std::string> value(const std::string& flag) {
        if (attached_) {
            std::string v = *attached_;
            attached_.reset();
            return Result<std::string>::ok(v);
        }
        if (done()) {
            return MetricsError{MetricsError::InvalidArg,
                "argument " + flag + ": expected one argument"};
        }
        return Result<std::string>::ok(args_[i_++]);
    }

    bool has_attached() const { return attached_.has_value(); }

private:
    const std::vector<std::string>& args_;
    size_t i_ = 0;
    std::optional<std::string> attached_;
};

} // namespace

Result<CliArgs> parse_args(const std::vector<std::string>& args) {
    CliArgs out;
    std::string profile_flag;
    int verbosity = 0;
    ArgCursor cur(args);

    while (!cur.done()) {
        std::string flag = cur.next_flag();

        if (flag == "--java" || flag == "--python" || flag == "--js" || flag == "--all") {
            if (!profile_flag.empty() && profile_flag != flag) {
                return MetricsError{MetricsError::InvalidArg,
                    "argument " + flag + ": not allowed with argument " + profile_flag,
                    "choose a single profile"};
            }
            profile_flag = flag;
            out.overrides.profile = parse_profile(flag.substr(2)).value();
        } else if (flag == "--root") {
            auto v = cur.value(flag);
            PROJMETRICS_TRY(v);
            out.root = v.value();
        } else if (flag == "--include-hidden") {
            out.overrides.include_hidden = true;
        } else if (flag == "--no-default-excludes") {
            out.overrides.default_excludes = false;
        } else if (flag == "--exclude-dir") {
            auto v = cur.value(flag);
            PROJMETRICS_TRY(v);
            out.overrides.exclude_dirs.push_back(v.value());
        } else if (flag == "--top") {
            auto v = cur.value(flag);
            PROJMETRICS_TRY(v);
            auto n = parse_int(flag, v.value());
            PROJMETRICS_TRY(n);
            out.overrides.top = n.value();
        } else if (flag == "--only-profile-exts") {
            out.overrides.only_profile_exts = true;
        } else if (flag == "--test-ratio") {
            out.overrides.test_ratio = true;
        } else if (flag == "-j" || flag == "--jobs") {
            auto v = cur.value(flag);
            PROJMETRICS_TRY(v);
            auto n = parse_int(flag, v.value());
            PROJMETRICS_TRY(n);
            if (n.value() < 0) {
                return MetricsError{MetricsError::InvalidArg,
                    "argument " + flag + ": must not be negative",
                    "use 0 for one job per core"};
            }
            out.overrides.jobs = n.value();
        } else if (flag == "--exclude-self") {
            auto v = cur.value(flag);
            PROJMETRICS_TRY(v);
            out.exclude_self.emplace_back(v.value());
        } else if (flag == "--config") {
            auto v = cur.value(flag);
            PROJMETRICS_TRY(v);
            out.config_path = v.value();
        } else if (flag == "--no-config") {
            out.no_config = true;
        } else if (flag == "-v" || flag == "--verbose") {
            verbosity++;
        } else if (flag == "-vv") {
            verbosity += 2;
        } else if (flag == "-q" || flag == "--quiet") {
            out.log_level = log::Error;
        } else if (flag == "--log-level") {
            auto v = cur.value(flag);
            PROJMETRICS_TRY(v);
            auto lvl = log::parse_level(v.value());
            PROJMETRICS_TRY(lvl);
            out.log_level = lvl.value();
        } else if (flag == "-h" || flag == "--help") {
            out.help = true;
        } else if (flag == "--version") {
            out.version = true;
        } else {
            return MetricsError{MetricsError::InvalidArg,
                "unrecognized argument: " + flag,
                "run 'projmetrics --help' for usage"};
        }

        if (cur.has_attached()) {
            return MetricsError{MetricsError::InvalidArg,
                "argument " + flag + ": ignored explicit argument"};
        }
    }

    if (verbosity > 0 && !out.log_level) {
        out.log_level = verbosity == 1 ? log::Debug : log::Trace;
    }

    if (out.no_config && out.config_path) {
        return MetricsError{MetricsError::InvalidArg,
            "argument --config: not allowed with argument --no-config"};
    }

    return Result<CliArgs>::ok(std::move(out));
}

} // namespace projmetrics
