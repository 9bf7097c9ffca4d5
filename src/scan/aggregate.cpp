#include <projmetrics/scan/aggregate.hpp>
#include <algorithm>

namespace projmetrics {

void Totals::record_file(const std::string& ext, uint64_t size) {
    files++;
    bytes += size;
    by_ext_files[ext]++;
}

void Totals::record_lines(const std::string& ext, const LineCounts& counts) {
    lines.merge(counts);
    by_ext_lines[ext].merge(counts);
}

void Totals::record_unreadable() {
    unreadable_files++;
}

void Totals::merge(const Totals& other) {
    files += other.files;
    bytes += other.bytes;
    unreadable_files += other.unreadable_files;
    lines.merge(other.lines);
    for (const auto& [ext, n] : other.by_ext_files) {
        by_ext_files[ext] += n;
    }
    for (const auto& [ext, lc] : other.by_ext_lines) {
        by_ext_lines[ext].merge(lc);
    }
}

void TestTotals::record(bool is_test, const LineCounts& counts) {
    if (is_test) {
        test_files++;
        test_lines.merge(counts);
    } else {
        non_test_files++;
        non_test_lines.merge(counts);
    }
}

void TestTotals::merge(const TestTotals& other) {
    test_files += other.test_files;
    non_test_files += other.non_test_files;
    test_lines.merge(other.test_lines);
    non_test_lines.merge(other.non_test_lines);
}

template<typename Key>
static std::vector<FileMetrics> top_by(std::vector<FileMetrics> files, size_t n, Key key) {
    auto before = [&](const FileMetrics& a, const FileMetrics& b) {
        if (key(a) != key(b)) return key(a) > key(b);
        return a.rel_path < b.rel_path;
    };
    if (n < files.size()) {
        std::partial_sort(files.begin(), files.begin() + static_cast<std::ptrdiff_t>(n),
                          files.end(), before);
        files.resize(n);
    } else {
        std::sort(files.begin(), files.end(), before);
    }
    return files;
}

std::vector<FileMetrics> top_by_size(std::vector<FileMetrics> files, size_t n) {
    return top_by(std::move(files), n, [](const FileMetrics& f) { return f.size_bytes; });
}

std::vector<FileMetrics> top_by_lines(std::vector<FileMetrics> files, size_t n) {
    return top_by(std::move(files), n, [](const FileMetrics& f) { return f.lines_total; });
}

} // namespace projmetrics
