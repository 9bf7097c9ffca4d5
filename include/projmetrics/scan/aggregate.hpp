#pragma once

#include <projmetrics/scan/line_counts.hpp>
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace projmetrics {

struct FileMetrics {
    std::filesystem::path rel_path;
    uint64_t size_bytes = 0;
    uint64_t lines_total = 0;
};

struct Totals {
    uint64_t files = 0;
    uint64_t bytes = 0;
    uint64_t unreadable_files = 0;
    LineCounts lines;
    std::map<std::string, uint64_t> by_ext_files;
    std::map<std::string, LineCounts> by_ext_lines;

    // Every accepted file, readable or not
    void record_file(const std::string& ext, uint64_t size);
    // A readable file's line counts
    void record_lines(const std::string& ext, const LineCounts& counts);
    void record_unreadable();

    void merge(const Totals& other);
};

struct TestTotals {
    uint64_t test_files = 0;
    uint64_t non_test_files = 0;
    LineCounts test_lines;
    LineCounts non_test_lines;

    void record(bool is_test, const LineCounts& counts);
    void merge(const TestTotals& other);
};

// Largest first; ties ordered by path so the result does not depend on
// the order files were scanned in.
std::vector<FileMetrics> top_by_size(std::vector<FileMetrics> files, size_t n);
std::vector<FileMetrics> top_by_lines(std::vector<FileMetrics> files, size_t n);

} // namespace projmetrics
