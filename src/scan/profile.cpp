#include <projmetrics/scan/profile.hpp>

namespace projmetrics {

const char* profile_name(Profile p) {
    switch (p) {
    case Profile::All:    return "all";
    case Profile::Java:   return "java";
    case Profile::Python: return "python";
    case Profile::Js:     return "js";
    }
    return "?";
}

Result<Profile> parse_profile(const std::string& name) {
    for (auto p : {Profile::All, Profile::Java, Profile::Python, Profile::Js}) {
        if (name == profile_name(p)) {
            return Result<Profile>::ok(p);
        }
    }
    return MetricsError{MetricsError::InvalidArg,
        "unknown profile '" + name + "'",
        "expected one of: all, java, python, js"};
}

const std::unordered_set<std::string>& profile_extensions(Profile p) {
    static const std::unordered_set<std::string> none;
    static const std::unordered_set<std::string> java = {
        ".java", ".kt", ".groovy", ".gradle", ".xml", ".properties",
        ".yml", ".yaml", ".md", ".txt",
    };
    static const std::unordered_set<std::string> python = {
        ".py", ".pyi", ".toml", ".ini", ".cfg", ".yml", ".yaml", ".md", ".txt",
    };
    static const std::unordered_set<std::string> js = {
        ".js", ".jsx", ".ts", ".tsx", ".json", ".css", ".scss", ".html",
        ".md", ".txt", ".yml", ".yaml",
    };

    switch (p) {
    case Profile::All:    return none;
    case Profile::Java:   return java;
    case Profile::Python: return python;
    case Profile::Js:     return js;
    }
    return none;
}

} // namespace projmetrics
