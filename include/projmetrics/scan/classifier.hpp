#pragma once

#include <projmetrics/result.hpp>
#include <projmetrics/scan/comment_rules.hpp>
#include <projmetrics/scan/line_counts.hpp>
#include <filesystem>
#include <istream>
#include <string>
#include <vector>

namespace projmetrics {

enum class TripleDelim { None, Single, Double };  // ''' and """

// Comment-block state carried from one line to the next within a single
// file. Each scan owns its own; nothing is shared across files.
struct ScanState {
    bool in_block_comment = false;
    bool in_triple_quote = false;
    TripleDelim triple_delim = TripleDelim::None;
};

enum class LineKind { Blank, Comment, Code };

// Classify one already-trimmed line and advance `state`. Blank lines never
// change the state.
LineKind classify_line(RuleFamily family, const std::string& trimmed, ScanState& state);

// Forward-only line classifier for one file.
class LineClassifier {
public:
    explicit LineClassifier(RuleFamily family);

    // Feed the next raw line (without its terminator); the line is trimmed
    // before classification.
    LineKind feed(const std::string& line);

    const LineCounts& counts() const { return counts_; }
    const ScanState& state() const { return state_; }
    RuleFamily family() const { return family_; }

private:
    RuleFamily family_;
    ScanState state_;
    LineCounts counts_;
};

LineCounts classify_lines(RuleFamily family, const std::vector<std::string>& lines);

// Read lines from `in` (universal newlines, lossy UTF-8) and classify them.
// A stream failure mid-read yields an Unreadable error.
Result<LineCounts> classify_stream(RuleFamily family, std::istream& in,
                                   const std::string& source_name = "<input>");

// Same as classify_stream, choosing the family from the extension.
Result<LineCounts> classify(const std::string& ext, std::istream& in,
                            const RuleTable& rules);

// Sniff the file, then classify it. Binary content or any I/O failure
// yields an Unreadable error.
Result<LineCounts> classify_file(const std::filesystem::path& path, RuleFamily family);
Result<LineCounts> classify_file(const std::filesystem::path& path, const std::string& ext,
                                 const RuleTable& rules);

} // namespace projmetrics
