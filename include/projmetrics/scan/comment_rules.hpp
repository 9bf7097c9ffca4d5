#pragma once

#include <projmetrics/result.hpp>
#include <filesystem>
#include <string>
#include <unordered_map>

namespace projmetrics {

// Comment syntax an extension is scanned with.
enum class RuleFamily {
    None,          // every non-blank line is code
    Hash,          // '#' line comments
    CLike,         // '//' line comments and '/* */' blocks, no nesting
    PythonTriple,  // ''' / """ spans on top of the Hash rule
};

const char* rule_family_name(RuleFamily f);
Result<RuleFamily> parse_rule_family(const std::string& name);

// Lowercase and ensure a leading dot: "PY" -> ".py". Empty stays empty.
std::string normalize_extension(const std::string& ext);

// Lowercased final suffix of the file name (".py"), or "" when the name
// has none. Dot-files (".bashrc") and names ending in '.' have no suffix.
std::string extension_of(const std::filesystem::path& path);

// extension_of(), with "(no_ext)" standing in for an empty suffix
std::string ext_key(const std::filesystem::path& path);

// Built-in extension -> family mapping
const std::unordered_map<std::string, RuleFamily>& builtin_rules();

class RuleTable {
public:
    // Starts from builtin_rules()
    RuleTable();

    // Extensions absent from the table map to RuleFamily::None
    RuleFamily lookup(const std::string& ext) const;

    // Add or replace a mapping
    void set(const std::string& ext, RuleFamily family);

    size_t size() const { return rules_.size(); }

private:
    std::unordered_map<std::string, RuleFamily> rules_;
};

} // namespace projmetrics
