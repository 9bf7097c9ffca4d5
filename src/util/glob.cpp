#include <projmetrics/glob.hpp>
#include <cctype>
#include <vector>

namespace projmetrics {

// ---- Helpers ----

static char fold(char c, bool ignore_case) {
    if (!ignore_case) return c;
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

static std::vector<std::string> split_path(const std::string& p) {
    std::vector<std::string> segs;
    std::string cur;
    for (char c : p) {
        if (c == '/' || c == '\\') {
            // Collapse empty segments from repeated or trailing slashes
            if (!cur.empty()) segs.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty()) segs.push_back(cur);
    return segs;
}

// Match a character class starting at pat[pi] == '['. On return pi points
// just past the closing ']'. An unterminated class matches a literal '['.
static bool match_class(const std::string& pat, size_t& pi, char c, bool ignore_case) {
    size_t start = pi;
    size_t i = pi + 1;
    bool negate = false;
    if (i < pat.size() && pat[i] == '!') {
        negate = true;
        i++;
    }

    bool matched = false;
    bool first = true;
    while (i < pat.size() && (first || pat[i] != ']')) {
        first = false;
        char lo = fold(pat[i], ignore_case);
        if (i + 2 < pat.size() && pat[i + 1] == '-' && pat[i + 2] != ']') {
            char hi = fold(pat[i + 2], ignore_case);
            if (c >= lo && c <= hi) matched = true;
            i += 3;
        } else {
            if (c == lo) matched = true;
            i++;
        }
    }

    if (i >= pat.size()) {
        pi = start + 1;
        return c == '[';
    }
    pi = i + 1;
    return negate ? !matched : matched;
}

// ---- Public API ----

bool has_wildcards(const std::string& pattern) {
    return pattern.find_first_of("*?[") != std::string::npos;
}

bool wildcard_match(const std::string& pattern, const std::string& name,
                    bool ignore_case) {
    size_t pi = 0, si = 0;
    // Backtrack point: position after the last '*' and the name index it
    // was tried against.
    size_t star_pi = std::string::npos, star_si = 0;

    while (si < name.size()) {
        char sc = fold(name[si], ignore_case);

        if (pi < pattern.size()) {
            char pc = pattern[pi];
            if (pc == '*') {
                star_pi = ++pi;
                star_si = si;
                continue;
            }
            if (pc == '?') {
                pi++;
                si++;
                continue;
            }
            if (pc == '[') {
                size_t next = pi;
                if (match_class(pattern, next, sc, ignore_case)) {
                    pi = next;
                    si++;
                    continue;
                }
            } else if (fold(pc, ignore_case) == sc) {
                pi++;
                si++;
                continue;
            }
        }

        if (star_pi == std::string::npos) return false;
        pi = star_pi;
        si = ++star_si;
    }

    while (pi < pattern.size() && pattern[pi] == '*') pi++;
    return pi == pattern.size();
}

static bool match_segments(const std::vector<std::string>& pat, size_t pi,
                           const std::vector<std::string>& path, size_t si,
                           bool ignore_case) {
    while (pi < pat.size()) {
        if (pat[pi] == "**") {
            while (pi < pat.size() && pat[pi] == "**") pi++;
            if (pi == pat.size()) return true;
            for (size_t k = si; k <= path.size(); k++) {
                if (match_segments(pat, pi, path, k, ignore_case)) return true;
            }
            return false;
        }
        if (si == path.size()) return false;
        if (!wildcard_match(pat[pi], path[si], ignore_case)) return false;
        pi++;
        si++;
    }
    return si == path.size();
}

bool glob_match(const std::string& pattern, const std::string& path,
                bool ignore_case) {
    return match_segments(split_path(pattern), 0, split_path(path), 0, ignore_case);
}

} // namespace projmetrics
