#include <projmetrics/scan/scanner.hpp>
#include <projmetrics/scan/classifier.hpp>
#include <projmetrics/scan/test_detect.hpp>
#include <projmetrics/scan/thread_pool.hpp>
#include <projmetrics/log.hpp>
#include <algorithm>
#include <memory>
#include <mutex>
#include <optional>
#include <system_error>

namespace fs = std::filesystem;

namespace projmetrics {

namespace {

struct FileOutcome {
    const WalkEntry* entry = nullptr;
    std::optional<LineCounts> counts;
    bool is_test = false;
};

// Owns the report while files are folded in; safe to call from workers.
class Accumulator {
public:
    explicit Accumulator(ScanReport& report) : report_(report) {}

    void add(const FileOutcome& out) {
        std::lock_guard<std::mutex> lock(mutex_);
        const WalkEntry& e = *out.entry;
        if (!out.counts) {
            report_.totals.record_unreadable();
            return;
        }
        report_.totals.record_lines(e.ext, *out.counts);
        report_.files.push_back({e.rel, e.size_bytes, out.counts->total});
        if (report_.test_ratio) {
            report_.tests.record(out.is_test, *out.counts);
        }
    }

private:
    ScanReport& report_;
    std::mutex mutex_;
};

} // namespace

Scanner::Scanner(ScanOptions opts) : opts_(std::move(opts)) {}

static FileOutcome scan_one(const WalkEntry& entry, const ScanOptions& opts) {
    FileOutcome out;
    out.entry = &entry;

    auto r = classify_file(entry.path, entry.ext, opts.rules);
    if (r.is_err()) {
        if (log::enabled(log::Debug)) {
            log::debug("skipped %s", r.error().summary().c_str());
        }
        return out;
    }

    out.counts = r.value();
    if (opts.test_ratio) {
        out.is_test = is_test_file(entry.rel, opts.profile);
    }
    return out;
}

Result<ScanReport> Scanner::run() const {
    std::error_code ec;
    fs::path root = fs::canonical(opts_.root, ec);
    if (ec) {
        return MetricsError{MetricsError::NotFound,
            "root directory does not exist: " + opts_.root.string(),
            "pass an existing directory with --root"};
    }

    ScanReport report;
    report.root = root;
    report.profile = opts_.profile;
    report.test_ratio = opts_.test_ratio;
    report.self_excluded = opts_.walk.self_exclude.size();

    const auto& profile_exts = profile_extensions(opts_.profile);
    report.restrict_to_profile = opts_.only_profile_exts && !profile_exts.empty();

    Walker walker(root, opts_.walk);
    auto walked = walker.collect();
    if (walked.is_err()) return std::move(walked).error();

    // File and byte totals include unreadable files, so they are recorded
    // here; line data is folded in as each file is classified.
    std::vector<WalkEntry> entries;
    for (auto& e : walked.value()) {
        if (report.restrict_to_profile && !profile_exts.count(e.ext)) continue;
        report.totals.record_file(e.ext, e.size_bytes);
        entries.push_back(std::move(e));
    }

    log::debug("scanning %zu files under %s with %zu job(s)",
               entries.size(), root.string().c_str(), opts_.jobs);

    Accumulator acc(report);
    std::unique_ptr<ThreadPool> pool;
    if (opts_.jobs > 1 && entries.size() > 1) {
        try {
            pool = std::make_unique<ThreadPool>(std::min(opts_.jobs, entries.size()));
        } catch (const std::system_error& e) {
            log::warn("cannot start worker threads (%s), scanning on one thread", e.what());
        }
    }

    if (pool) {
        for (const auto& e : entries) {
            pool->enqueue([&acc, &e, this] { acc.add(scan_one(e, opts_)); });
        }
        // Waits for the queue to drain
        pool.reset();
    } else {
        for (const auto& e : entries) {
            acc.add(scan_one(e, opts_));
        }
    }

    std::sort(report.files.begin(), report.files.end(),
              [](const FileMetrics& a, const FileMetrics& b) { return a.rel_path < b.rel_path; });

    log::debug("%llu files, %llu unreadable, %llu lines",
               static_cast<unsigned long long>(report.totals.files),
               static_cast<unsigned long long>(report.totals.unreadable_files),
               static_cast<unsigned long long>(report.totals.lines.total));

    return Result<ScanReport>::ok(std::move(report));
}

} // namespace projmetrics
