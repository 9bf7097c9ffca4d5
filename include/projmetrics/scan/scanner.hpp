#pragma once

#include <projmetrics/result.hpp>
#include <projmetrics/scan/aggregate.hpp>
#include <projmetrics/scan/comment_rules.hpp>
#include <projmetrics/scan/profile.hpp>
#include <projmetrics/scan/walker.hpp>
#include <filesystem>
#include <vector>

namespace projmetrics {

struct ScanOptions {
    std::filesystem::path root = ".";
    Profile profile = Profile::All;
    WalkOptions walk;
    RuleTable rules;
    bool only_profile_exts = false;
    bool test_ratio = false;
    // Worker threads for classification; 1 scans on the calling thread
    size_t jobs = 1;
};

struct ScanReport {
    std::filesystem::path root;
    Profile profile = Profile::All;
    bool restrict_to_profile = false;
    bool test_ratio = false;
    size_t self_excluded = 0;

    Totals totals;
    TestTotals tests;
    // Readable files only
    std::vector<FileMetrics> files;
};

class Scanner {
public:
    explicit Scanner(ScanOptions opts);

    // Fails only if the root is missing or not a directory. Per-file
    // problems are counted in the report, never returned.
    Result<ScanReport> run() const;

private:
    ScanOptions opts_;
};

} // namespace projmetrics
