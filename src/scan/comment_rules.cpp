#include <projmetrics/scan/comment_rules.hpp>
#include <cctype>

namespace projmetrics {

// ---------------------------------------------------------------------------
// Extension table
// ---------------------------------------------------------------------------

const std::unordered_map<std::string, RuleFamily>& builtin_rules() {
    static const std::unordered_map<std::string, RuleFamily> table = {
        // JVM
        {".java",   RuleFamily::CLike},
        {".kt",     RuleFamily::CLike},
        {".groovy", RuleFamily::CLike},
        // Web
        {".js",     RuleFamily::CLike},
        {".jsx",    RuleFamily::CLike},
        {".ts",     RuleFamily::CLike},
        {".tsx",    RuleFamily::CLike},
        {".css",    RuleFamily::CLike},
        {".scss",   RuleFamily::CLike},
        // C family
        {".c",      RuleFamily::CLike},
        {".cc",     RuleFamily::CLike},
        {".cpp",    RuleFamily::CLike},
        {".h",      RuleFamily::CLike},
        {".hpp",    RuleFamily::CLike},
        // Shell and config
        {".sh",     RuleFamily::Hash},
        {".zsh",    RuleFamily::Hash},
        {".bash",   RuleFamily::Hash},
        {".yaml",   RuleFamily::Hash},
        {".yml",    RuleFamily::Hash},
        {".toml",   RuleFamily::Hash},
        {".ini",    RuleFamily::Hash},
        {".cfg",    RuleFamily::Hash},
        // Python
        {".py",     RuleFamily::PythonTriple},
        {".pyi",    RuleFamily::PythonTriple},
    };
    return table;
}

const char* rule_family_name(RuleFamily f) {
    switch (f) {
    case RuleFamily::None:         return "none";
    case RuleFamily::Hash:         return "hash";
    case RuleFamily::CLike:        return "c-like";
    case RuleFamily::PythonTriple: return "python-triple";
    }
    return "?";
}

Result<RuleFamily> parse_rule_family(const std::string& name) {
    for (auto f : {RuleFamily::None, RuleFamily::Hash,
                   RuleFamily::CLike, RuleFamily::PythonTriple}) {
        if (name == rule_family_name(f)) {
            return Result<RuleFamily>::ok(f);
        }
    }
    return MetricsError{MetricsError::InvalidArg,
        "unknown rule family '" + name + "'",
        "expected one of: none, hash, c-like, python-triple"};
}

std::string normalize_extension(const std::string& ext) {
    if (ext.empty()) return ext;
    std::string out;
    out.reserve(ext.size() + 1);
    if (ext[0] != '.') out.push_back('.');
    for (char c : ext) {
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
}

std::string extension_of(const std::filesystem::path& path) {
    std::string name = path.filename().string();
    auto dot = name.rfind('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 == name.size()) {
        return "";
    }
    return normalize_extension(name.substr(dot));
}

std::string ext_key(const std::filesystem::path& path) {
    auto ext = extension_of(path);
    return ext.empty() ? "(no_ext)" : ext;
}

// ---------------------------------------------------------------------------
// RuleTable
// ---------------------------------------------------------------------------

RuleTable::RuleTable() : rules_(builtin_rules()) {}

RuleFamily RuleTable::lookup(const std::string& ext) const {
    auto it = rules_.find(normalize_extension(ext));
    if (it == rules_.end()) return RuleFamily::None;
    return it->second;
}

void RuleTable::set(const std::string& ext, RuleFamily family) {
    rules_[normalize_extension(ext)] = family;
}

} // namespace projmetrics
