#pragma once

#include <projmetrics/result.hpp>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <set>
#include <string>
#include <unordered_set>
#include <vector>

namespace projmetrics {

// Directory names pruned unless default excludes are turned off
const std::unordered_set<std::string>& default_exclude_dirs();

struct WalkOptions {
    bool include_hidden = false;
    bool default_excludes = true;
    // Directory names, or wildcard patterns. A pattern containing '/' is
    // matched against the directory path relative to the root.
    std::vector<std::string> exclude_dirs;
    // Files never reported, e.g. the tool's own executable
    std::set<std::filesystem::path> self_exclude;
};

struct WalkEntry {
    std::filesystem::path path;  // root / rel
    std::filesystem::path rel;
    std::string ext;             // ext_key() of the name
    uint64_t size_bytes = 0;
};

// Pure pruning predicate for a directory entry
bool should_skip_dir(const std::string& name, const std::string& rel_dir,
                     const WalkOptions& opts);

class Walker {
public:
    Walker(std::filesystem::path root, WalkOptions opts);

    // Visit every accepted regular file. Entries in a directory are visited
    // in name order. Fails only when the root is not a readable directory;
    // unreadable subdirectories and files that cannot be stat'ed are
    // skipped and logged.
    Status walk(const std::function<void(const WalkEntry&)>& visit) const;

    Result<std::vector<WalkEntry>> collect() const;

    const std::filesystem::path& root() const { return root_; }

private:
    void walk_dir(const std::filesystem::path& dir, const std::filesystem::path& rel,
                  const std::function<void(const WalkEntry&)>& visit) const;
    bool is_self(const std::filesystem::directory_entry& entry) const;

    std::filesystem::path root_;
    WalkOptions opts_;
    std::set<std::string> self_names_;
};

} // namespace projmetrics
