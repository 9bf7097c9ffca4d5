#include <projmetrics/scan/classifier.hpp>
#include <projmetrics/scan/sniff.hpp>
#include <projmetrics/scan/text.hpp>
#include <projmetrics/log.hpp>
#include <fstream>

namespace projmetrics {

static const std::string LINE_COMMENT = "//";
static const std::string BLOCK_OPEN = "/*";
static const std::string BLOCK_CLOSE = "*/";
static const std::string TRIPLE_SINGLE = "'''";
static const std::string TRIPLE_DOUBLE = "\"\"\"";

static bool starts_with(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

static bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

static const std::string& delim_text(TripleDelim d) {
    return d == TripleDelim::Single ? TRIPLE_SINGLE : TRIPLE_DOUBLE;
}

// ---------------------------------------------------------------------------
// Per-family rules
// ---------------------------------------------------------------------------

static LineKind hash_rule(const std::string& trimmed) {
    return trimmed[0] == '#' ? LineKind::Comment : LineKind::Code;
}

static LineKind c_like_rule(const std::string& trimmed, ScanState& state) {
    if (state.in_block_comment) {
        // No nesting: the first close token ends the block
        if (trimmed.find(BLOCK_CLOSE) != std::string::npos) {
            state.in_block_comment = false;
        }
        return LineKind::Comment;
    }
    if (starts_with(trimmed, LINE_COMMENT)) {
        return LineKind::Comment;
    }
    if (starts_with(trimmed, BLOCK_OPEN)) {
        if (trimmed.find(BLOCK_CLOSE) == std::string::npos) {
            state.in_block_comment = true;
        }
        return LineKind::Comment;
    }
    return LineKind::Code;
}

static LineKind python_rule(const std::string& trimmed, ScanState& state) {
    if (state.in_triple_quote) {
        if (ends_with(trimmed, delim_text(state.triple_delim))) {
            state.in_triple_quote = false;
            state.triple_delim = TripleDelim::None;
        }
        return LineKind::Comment;
    }

    // Only a delimiter standing alone opens a span. `"""text"""` on one
    // line does not; it falls through to the '#' rule.
    if (trimmed == TRIPLE_SINGLE || trimmed == TRIPLE_DOUBLE) {
        state.in_triple_quote = true;
        state.triple_delim = trimmed == TRIPLE_SINGLE ? TripleDelim::Single
                                                      : TripleDelim::Double;
        return LineKind::Comment;
    }

    return hash_rule(trimmed);
}

LineKind classify_line(RuleFamily family, const std::string& trimmed, ScanState& state) {
    if (trimmed.empty()) return LineKind::Blank;

    switch (family) {
    case RuleFamily::PythonTriple: return python_rule(trimmed, state);
    case RuleFamily::CLike:        return c_like_rule(trimmed, state);
    case RuleFamily::Hash:         return hash_rule(trimmed);
    case RuleFamily::None:         return LineKind::Code;
    }
    return LineKind::Code;
}

// ---------------------------------------------------------------------------
// LineClassifier
// ---------------------------------------------------------------------------

LineClassifier::LineClassifier(RuleFamily family) : family_(family) {}

LineKind LineClassifier::feed(const std::string& line) {
    counts_.total++;
    LineKind kind = classify_line(family_, trim_whitespace(line), state_);
    switch (kind) {
    case LineKind::Blank:   counts_.blank++;   break;
    case LineKind::Comment: counts_.comment++; break;
    case LineKind::Code:    counts_.code++;    break;
    }
    return kind;
}

LineCounts classify_lines(RuleFamily family, const std::vector<std::string>& lines) {
    LineClassifier classifier(family);
    for (const auto& line : lines) {
        classifier.feed(line);
    }
    return classifier.counts();
}

Result<LineCounts> classify_stream(RuleFamily family, std::istream& in,
                                   const std::string& source_name) {
    LineClassifier classifier(family);
    LineReader reader(in);
    std::string raw;
    size_t anomalies = 0;

    while (reader.next(raw)) {
        size_t replaced = 0;
        classifier.feed(decode_utf8_lossy(raw, replaced));
        anomalies += replaced;
    }

    if (reader.failed()) {
        return MetricsError{MetricsError::Unreadable,
            "read error after " + std::to_string(classifier.counts().total) + " lines",
            "", source_name, 0};
    }

    if (anomalies > 0) {
        log::trace("%s: replaced %zu invalid UTF-8 sequence(s)",
                   source_name.c_str(), anomalies);
    }
    if (classifier.state().in_block_comment || classifier.state().in_triple_quote) {
        log::trace("%s: comment block still open at end of file", source_name.c_str());
    }

    return Result<LineCounts>::ok(classifier.counts());
}

Result<LineCounts> classify(const std::string& ext, std::istream& in,
                            const RuleTable& rules) {
    return classify_stream(rules.lookup(ext), in);
}

Result<LineCounts> classify_file(const std::filesystem::path& path, RuleFamily family) {
    if (!is_text_file(path)) {
        return MetricsError{MetricsError::Unreadable,
            "binary or unreadable file", "", path.string(), 0};
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return MetricsError{MetricsError::Unreadable,
            "cannot open file", "", path.string(), 0};
    }
    return classify_stream(family, file, path.string());
}

Result<LineCounts> classify_file(const std::filesystem::path& path, const std::string& ext,
                                 const RuleTable& rules) {
    return classify_file(path, rules.lookup(ext));
}

} // namespace projmetrics
