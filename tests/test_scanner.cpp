#include <catch2/catch.hpp>
#include <projmetrics/scan/scanner.hpp>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>

using namespace projmetrics;
namespace fs = std::filesystem;

// RAII temp directory
struct TempDir {
    fs::path path;

    TempDir() {
        static std::atomic<int> counter{0};
        path = fs::temp_directory_path() / ("projmetrics_scan_test_" + std::to_string(
            std::chrono::steady_clock::now().time_since_epoch().count()) +
            "_" + std::to_string(counter++));
        fs::create_directories(path);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }

    void write_file(const std::string& rel, const std::string& content) {
        fs::path full = path / rel;
        fs::create_directories(full.parent_path());
        std::ofstream f(full, std::ios::binary);
        f << content;
    }
};

// A small mixed tree: three source files, one test, one binary, one plain
static void setup_tree(TempDir& td) {
    td.write_file("src/main.c", "int main() {\n  // hi\n  return 0;\n}\n");
    td.write_file("src/util.py", "# c\n\nx = 1\n");
    td.write_file("tests/test_util.py", "def test_x():\n    assert True\n");
    td.write_file("data.bin", std::string("\x01\x02\0\x03", 4));
    td.write_file("README.md", "hello\n");
    td.write_file(".hidden/x.c", "int x;\n");
    td.write_file("node_modules/a.js", "var a;\n");
}

static ScanReport scan(const ScanOptions& opts) {
    auto r = Scanner(opts).run();
    REQUIRE(r.is_ok());
    return std::move(r).value();
}

TEST_CASE("scan totals", "[scanner]") {
    TempDir td;
    setup_tree(td);

    ScanOptions opts;
    opts.root = td.path;
    auto report = scan(opts);

    const Totals& t = report.totals;
    REQUIRE(t.files == 5);
    REQUIRE(t.unreadable_files == 1);
    REQUIRE(t.lines.total == 10);
    REQUIRE(t.lines.code == 7);
    REQUIRE(t.lines.comment == 2);
    REQUIRE(t.lines.blank == 1);
    REQUIRE(t.lines.balanced());

    REQUIRE(t.by_ext_files.at(".py") == 2);
    REQUIRE(t.by_ext_files.at(".bin") == 1);
    REQUIRE(t.by_ext_lines.count(".bin") == 0);
    REQUIRE(t.by_ext_lines.at(".c").comment == 1);

    REQUIRE(report.root.generic_string() == fs::canonical(td.path).generic_string());
    REQUIRE_FALSE(report.restrict_to_profile);
}

TEST_CASE("scan lists readable files sorted by path", "[scanner]") {
    TempDir td;
    setup_tree(td);

    ScanOptions opts;
    opts.root = td.path;
    auto report = scan(opts);

    REQUIRE(report.files.size() == 4);
    REQUIRE(report.files[0].rel_path.generic_string() == "README.md");
    REQUIRE(report.files[1].rel_path.generic_string() == "src/main.c");
    REQUIRE(report.files[1].lines_total == 4);
    REQUIRE(report.files[2].rel_path.generic_string() == "src/util.py");
    REQUIRE(report.files[3].rel_path.generic_string() == "tests/test_util.py");
}

TEST_CASE("scan test ratio", "[scanner]") {
    TempDir td;
    setup_tree(td);

    ScanOptions opts;
    opts.root = td.path;
    opts.profile = Profile::Python;
    opts.test_ratio = true;
    auto report = scan(opts);

    REQUIRE(report.test_ratio);
    REQUIRE(report.tests.test_files == 1);
    REQUIRE(report.tests.non_test_files == 3);
    REQUIRE(report.tests.test_lines.total == 2);
    REQUIRE(report.tests.non_test_lines.total == 8);
}

TEST_CASE("scan without test ratio leaves test totals empty", "[scanner]") {
    TempDir td;
    setup_tree(td);

    ScanOptions opts;
    opts.root = td.path;
    auto report = scan(opts);
    REQUIRE(report.tests.test_files == 0);
    REQUIRE(report.tests.non_test_files == 0);
}

TEST_CASE("scan restricted to profile extensions", "[scanner]") {
    TempDir td;
    setup_tree(td);

    ScanOptions opts;
    opts.root = td.path;
    opts.profile = Profile::Python;
    opts.only_profile_exts = true;
    auto report = scan(opts);

    REQUIRE(report.restrict_to_profile);
    REQUIRE(report.totals.files == 3);
    REQUIRE(report.totals.unreadable_files == 0);
    REQUIRE(report.totals.by_ext_files.count(".c") == 0);

    // Profile::All names no extensions, so nothing is filtered
    opts.profile = Profile::All;
    auto all = scan(opts);
    REQUIRE_FALSE(all.restrict_to_profile);
    REQUIRE(all.totals.files == 5);
}

TEST_CASE("scan with overridden rules", "[scanner]") {
    TempDir td;
    setup_tree(td);

    ScanOptions opts;
    opts.root = td.path;
    opts.rules.set(".c", RuleFamily::None);
    auto report = scan(opts);
    REQUIRE(report.totals.by_ext_lines.at(".c").comment == 0);
    REQUIRE(report.totals.by_ext_lines.at(".c").code == 4);
}

TEST_CASE("scan excludes tool files", "[scanner]") {
    TempDir td;
    setup_tree(td);

    ScanOptions opts;
    opts.root = td.path;
    opts.walk.self_exclude.insert(td.path / "data.bin");
    auto report = scan(opts);
    REQUIRE(report.self_excluded == 1);
    REQUIRE(report.totals.files == 4);
    REQUIRE(report.totals.unreadable_files == 0);
}

TEST_CASE("parallel scan matches sequential scan", "[scanner]") {
    TempDir td;
    for (int i = 0; i < 40; i++) {
        std::string body;
        for (int k = 0; k <= i; k++) {
            body += (k % 3 == 0) ? "// note\n" : (k % 3 == 1) ? "\n" : "call();\n";
        }
        td.write_file("pkg" + std::to_string(i % 4) + "/f" + std::to_string(i) + ".c", body);
    }
    td.write_file("blob.dat", std::string(100, '\0'));

    ScanOptions opts;
    opts.root = td.path;
    opts.test_ratio = true;
    auto seq = scan(opts);
    opts.jobs = 4;
    auto par = scan(opts);

    REQUIRE(par.totals.files == seq.totals.files);
    REQUIRE(par.totals.bytes == seq.totals.bytes);
    REQUIRE(par.totals.unreadable_files == seq.totals.unreadable_files);
    REQUIRE(par.totals.lines == seq.totals.lines);
    REQUIRE(par.totals.by_ext_files == seq.totals.by_ext_files);
    REQUIRE(par.totals.by_ext_lines == seq.totals.by_ext_lines);
    REQUIRE(par.tests.non_test_lines == seq.tests.non_test_lines);

    REQUIRE(par.files.size() == seq.files.size());
    for (size_t i = 0; i < seq.files.size(); i++) {
        REQUIRE(par.files[i].rel_path.generic_string() == seq.files[i].rel_path.generic_string());
        REQUIRE(par.files[i].lines_total == seq.files[i].lines_total);
    }
    REQUIRE(seq.totals.unreadable_files == 1);
}

TEST_CASE("scan of missing root fails", "[scanner]") {
    ScanOptions opts;
    opts.root = "/nonexistent_dir_xyz_123";
    auto r = Scanner(opts).run();
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == MetricsError::NotFound);
}

TEST_CASE("scan of empty directory", "[scanner]") {
    TempDir td;
    ScanOptions opts;
    opts.root = td.path;
    auto report = scan(opts);
    REQUIRE(report.totals.files == 0);
    REQUIRE(report.totals.lines == LineCounts{});
    REQUIRE(report.files.empty());
}
