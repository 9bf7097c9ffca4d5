#include <projmetrics/scan/report.hpp>
#include <algorithm>
#include <cstdio>
#include <iomanip>

namespace projmetrics {

std::string human_bytes(uint64_t n) {
    static const char* const UNITS[] = {"B", "KB", "MB", "GB", "TB"};
    constexpr size_t UNIT_COUNT = sizeof(UNITS) / sizeof(UNITS[0]);

    double x = static_cast<double>(n);
    size_t u = 0;
    while (x >= 1024.0 && u + 1 < UNIT_COUNT) {
        x /= 1024.0;
        u++;
    }

    if (u == 0) return std::to_string(n) + " B";
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.1f %s", x, UNITS[u]);
    return buf;
}

std::string pct(uint64_t numer, uint64_t denom) {
    if (denom == 0) return "0.0%";
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1f%%",
                  static_cast<double>(numer) * 100.0 / static_cast<double>(denom));
    return buf;
}

std::vector<std::string> extension_order(const ScanReport& report) {
    const auto& by_files = report.totals.by_ext_files;
    const auto& profile_exts = profile_extensions(report.profile);
    bool profile_first = !profile_exts.empty() && !report.restrict_to_profile;

    std::vector<std::string> exts;
    exts.reserve(by_files.size());
    for (const auto& kv : by_files) exts.push_back(kv.first);

    std::sort(exts.begin(), exts.end(), [&](const std::string& a, const std::string& b) {
        if (profile_first) {
            bool a_in = profile_exts.count(a) > 0;
            bool b_in = profile_exts.count(b) > 0;
            if (a_in != b_in) return a_in;
        }
        uint64_t na = by_files.at(a), nb = by_files.at(b);
        if (na != nb) return na > nb;
        return a < b;
    });
    return exts;
}

static void render_test_ratio(const TestTotals& t, std::ostream& out) {
    uint64_t total_files = t.test_files + t.non_test_files;
    uint64_t total_loc = t.test_lines.total + t.non_test_lines.total;
    uint64_t total_code = t.test_lines.code + t.non_test_lines.code;

    out << "\nTest ratio (heuristic):\n";
    out << "  Test files:     " << t.test_files << " (" << pct(t.test_files, total_files) << ")\n";
    out << "  Non-test files: " << t.non_test_files << " (" << pct(t.non_test_files, total_files) << ")\n";
    out << "  Test LOC:       " << t.test_lines.total << " (" << pct(t.test_lines.total, total_loc) << ")\n";
    out << "  Non-test LOC:   " << t.non_test_lines.total << " (" << pct(t.non_test_lines.total, total_loc) << ")\n";
    out << "  Test code LOC:  " << t.test_lines.code << " (" << pct(t.test_lines.code, total_code) << ")\n";
    out << "  Non-test code:  " << t.non_test_lines.code << " (" << pct(t.non_test_lines.code, total_code) << ")\n";
}

static void render_extensions(const ScanReport& report, std::ostream& out) {
    out << "\nBy extension:\n";
    for (const auto& ext : extension_order(report)) {
        out << "  " << std::left << std::setw(10) << ext << std::right
            << " files=" << std::setw(6) << report.totals.by_ext_files.at(ext);

        auto it = report.totals.by_ext_lines.find(ext);
        if (it == report.totals.by_ext_lines.end()) {
            out << "  lines=   (binary/unreadable)\n";
            continue;
        }
        const LineCounts& lc = it->second;
        out << "  lines=" << std::setw(9) << lc.total
            << "  code=" << std::setw(9) << lc.code
            << "  cmt=" << std::setw(9) << lc.comment
            << "  blank=" << std::setw(9) << lc.blank << "\n";
    }
}

static void render_top(const ScanReport& report, size_t top_n, std::ostream& out) {
    out << "\nTop " << top_n << " largest files:\n";
    for (const auto& fm : top_by_size(report.files, top_n)) {
        out << "  " << std::setw(9) << human_bytes(fm.size_bytes)
            << "  " << fm.rel_path.generic_string() << "\n";
    }

    out << "\nTop " << top_n << " longest files (by total lines):\n";
    for (const auto& fm : top_by_lines(report.files, top_n)) {
        out << "  " << std::setw(9) << fm.lines_total
            << " lines  " << fm.rel_path.generic_string() << "\n";
    }
}

void render_report(const ScanReport& report, size_t top_n, std::ostream& out) {
    const Totals& t = report.totals;

    out << "\nRoot: " << report.root.string() << "\n";
    out << "Profile: " << profile_name(report.profile) << "\n";
    out << "Files counted: " << t.files << "\n";
    out << "Total size: " << human_bytes(t.bytes) << "\n";
    out << "Text files skipped (binary/unreadable): " << t.unreadable_files << "\n";
    out << "Tool files excluded: " << report.self_excluded << "\n";

    out << "\nLine counts (heuristic):\n";
    out << "  Total:   " << t.lines.total << "\n";
    out << "  Code:    " << t.lines.code << "\n";
    out << "  Comment: " << t.lines.comment << "\n";
    out << "  Blank:   " << t.lines.blank << "\n";

    if (report.test_ratio) {
        render_test_ratio(report.tests, out);
    }

    render_extensions(report, out);

    if (top_n > 0) {
        render_top(report, top_n, out);
    }

    out << "\n";
}

} // namespace projmetrics
