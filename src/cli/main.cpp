#include <projmetrics/cli.hpp>
#include <projmetrics/config.hpp>
#include <projmetrics/log.hpp>
#include <projmetrics/scan/report.hpp>
#include <projmetrics/scan/scanner.hpp>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <set>

using namespace projmetrics;
namespace fs = std::filesystem;

static constexpr int EXIT_USAGE = 2;

// The running executable plus the wrapper named in PROJMETRICS_EXCLUDE_SELF.
// Resolved once here and handed to the walker.
static std::set<fs::path> tool_files(const char* argv0, const CliArgs& args) {
    std::set<fs::path> files;
    std::error_code ec;

    auto exe = fs::read_symlink("/proc/self/exe", ec);
    if (!ec) {
        files.insert(exe);
    } else if (argv0 && fs::exists(argv0, ec)) {
        files.insert(fs::weakly_canonical(argv0, ec));
    }

    std::vector<fs::path> extra = args.exclude_self;
    if (const char* wrapper = std::getenv("PROJMETRICS_EXCLUDE_SELF")) {
        if (*wrapper) extra.emplace_back(wrapper);
    }
    for (const auto& p : extra) {
        auto canon = fs::weakly_canonical(p, ec);
        if (ec) {
            log::debug("cannot resolve %s: %s", p.string().c_str(), ec.message().c_str());
            continue;
        }
        files.insert(canon);
    }
    return files;
}

static Result<Config> load_layers(const CliArgs& args) {
    if (args.no_config) {
        return Result<Config>::ok(Config::effective({}, {}, args.overrides));
    }

    std::optional<Config> global;
    std::string global_path = global_config_path();
    std::error_code ec;
    if (!global_path.empty() && fs::exists(global_path, ec)) {
        log::debug("loading global config %s", global_path.c_str());
        auto g = Config::load(global_path);
        PROJMETRICS_TRY(g);
        global = std::move(g).value();
    }

    std::optional<Config> project;
    if (args.config_path) {
        auto p = Config::load(*args.config_path);
        PROJMETRICS_TRY(p);
        project = std::move(p).value();
    } else {
        fs::path path = project_config_path(args.root);
        if (fs::exists(path, ec)) {
            log::debug("loading project config %s", path.string().c_str());
            auto p = Config::load(path);
            PROJMETRICS_TRY(p);
            project = std::move(p).value();
        }
    }

    return Result<Config>::ok(Config::effective(global, project, args.overrides));
}

int main(int argc, char** argv) {
    std::vector<std::string> raw(argv + 1, argv + argc);
    auto parsed = parse_args(raw);
    if (parsed.is_err()) {
        std::cerr << usage_text() << "\n" << parsed.error().format() << "\n";
        return EXIT_USAGE;
    }
    const CliArgs& args = parsed.value();

    if (args.help) {
        std::cout << usage_text();
        return 0;
    }
    if (args.version) {
        std::cout << "projmetrics " << version_string() << "\n";
        return 0;
    }
    if (args.log_level) {
        log::set_level(*args.log_level);
    }

    auto cfg = load_layers(args);
    if (cfg.is_err()) {
        std::cerr << cfg.error().format() << "\n";
        return 1;
    }

    ScanOptions opts = cfg.value().to_scan_options(args.root);
    opts.walk.self_exclude = tool_files(argc > 0 ? argv[0] : nullptr, args);

    auto report = Scanner(std::move(opts)).run();
    if (report.is_err()) {
        std::cerr << report.error().format() << "\n";
        return 1;
    }

    render_report(report.value(), cfg.value().top_n(), std::cout);
    return 0;
}
