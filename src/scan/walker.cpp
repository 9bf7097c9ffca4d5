#include <projmetrics/scan/walker.hpp>
#include <projmetrics/scan/comment_rules.hpp>
#include <projmetrics/glob.hpp>
#include <projmetrics/log.hpp>
#include <algorithm>

namespace fs = std::filesystem;

namespace projmetrics {

const std::unordered_set<std::string>& default_exclude_dirs() {
    static const std::unordered_set<std::string> dirs = {
        ".git", ".hg", ".svn",
        "node_modules",
        "target", "build", "dist", "out",
        ".idea", ".vscode",
        ".venv", "venv", "__pycache__",
        ".pytest_cache", ".mypy_cache",
        ".gradle", ".mvn",
        "coverage", ".coverage",
    };
    return dirs;
}

bool should_skip_dir(const std::string& name, const std::string& rel_dir,
                     const WalkOptions& opts) {
    if (!opts.include_hidden && !name.empty() && name[0] == '.') return true;

    for (const auto& pat : opts.exclude_dirs) {
        if (pat.find('/') != std::string::npos) {
            if (glob_match(pat, rel_dir)) return true;
        } else if (has_wildcards(pat)) {
            if (wildcard_match(pat, name)) return true;
        } else if (pat == name) {
            return true;
        }
    }

    if (opts.default_excludes && default_exclude_dirs().count(name)) return true;
    return false;
}

static fs::path canonical_or_self(const fs::path& p) {
    std::error_code ec;
    auto c = fs::weakly_canonical(p, ec);
    return ec ? p : c;
}

Walker::Walker(fs::path root, WalkOptions opts)
    : root_(std::move(root)), opts_(std::move(opts)) {
    std::set<fs::path> canon;
    for (const auto& p : opts_.self_exclude) {
        auto c = canonical_or_self(p);
        self_names_.insert(c.filename().string());
        canon.insert(std::move(c));
    }
    opts_.self_exclude = std::move(canon);
}

bool Walker::is_self(const fs::directory_entry& entry) const {
    if (opts_.self_exclude.empty()) return false;
    // Only files sharing a name with a tool file, or links that may point
    // at one, are worth resolving
    std::error_code ec;
    if (!self_names_.count(entry.path().filename().string()) && !entry.is_symlink(ec)) {
        return false;
    }
    return opts_.self_exclude.count(canonical_or_self(entry.path())) > 0;
}

Status Walker::walk(const std::function<void(const WalkEntry&)>& visit) const {
    std::error_code ec;
    if (!fs::is_directory(root_, ec)) {
        return MetricsError{MetricsError::NotFound,
            "root is not a directory: " + root_.string(),
            "pass an existing directory with --root"};
    }
    walk_dir(root_, fs::path(), visit);
    return ok_status();
}

Result<std::vector<WalkEntry>> Walker::collect() const {
    std::vector<WalkEntry> entries;
    PROJMETRICS_TRY(walk([&](const WalkEntry& e) { entries.push_back(e); }));
    return Result<std::vector<WalkEntry>>::ok(std::move(entries));
}

void Walker::walk_dir(const fs::path& dir, const fs::path& rel,
                      const std::function<void(const WalkEntry&)>& visit) const {
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        log::debug("skipping directory %s: %s", dir.string().c_str(), ec.message().c_str());
        return;
    }

    std::vector<fs::directory_entry> children;
    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            log::debug("error listing %s: %s", dir.string().c_str(), ec.message().c_str());
            break;
        }
        children.push_back(*it);
    }
    std::sort(children.begin(), children.end(),
              [](const fs::directory_entry& a, const fs::directory_entry& b) {
                  return a.path().filename() < b.path().filename();
              });

    for (const auto& child : children) {
        std::string name = child.path().filename().string();
        fs::path child_rel = rel / name;

        std::error_code type_ec;
        if (child.is_directory(type_ec)) {
            // Symlinked directories are listed but never descended into
            if (child.is_symlink(type_ec)) continue;
            std::string rel_dir = child_rel.generic_string();
            if (should_skip_dir(name, rel_dir, opts_)) {
                log::trace("pruned %s", rel_dir.c_str());
                continue;
            }
            walk_dir(child.path(), child_rel, visit);
            continue;
        }

        if (!opts_.include_hidden && !name.empty() && name[0] == '.') continue;
        if (is_self(child)) {
            log::debug("excluding tool file %s", child_rel.generic_string().c_str());
            continue;
        }

        std::error_code stat_ec;
        auto st = fs::status(child.path(), stat_ec);
        if (stat_ec) {
            log::debug("cannot stat %s: %s", child.path().string().c_str(),
                       stat_ec.message().c_str());
            continue;
        }
        if (!fs::is_regular_file(st)) {
            log::debug("skipping non-regular file %s", child.path().string().c_str());
            continue;
        }
        auto size = fs::file_size(child.path(), stat_ec);
        if (stat_ec) {
            log::debug("cannot stat %s: %s", child.path().string().c_str(),
                       stat_ec.message().c_str());
            continue;
        }

        WalkEntry entry;
        entry.path = child.path();
        entry.rel = child_rel;
        entry.ext = ext_key(child.path());
        entry.size_bytes = static_cast<uint64_t>(size);
        visit(entry);
    }
}

} // namespace projmetrics
