#pragma once

#include <cstddef>
#include <istream>
#include <string>
#include <vector>

namespace projmetrics {

// Replace every invalid UTF-8 sequence with U+FFFD. Each maximal invalid
// subpart becomes one replacement character. `replaced` receives the
// number of substitutions made.
std::string decode_utf8_lossy(const std::string& bytes, size_t& replaced);

// Strip leading and trailing whitespace: ASCII whitespace, the 0x1c-0x1f
// separators, and the Unicode space characters encoded as UTF-8.
std::string trim_whitespace(const std::string& s);

// Splits a byte stream into lines. "\n", "\r\n" and a lone "\r" all end a
// line; the terminator is not included. A trailing unterminated line is
// returned; an empty stream yields no lines.
class LineReader {
public:
    explicit LineReader(std::istream& in, size_t chunk_size = 64 * 1024);

    // False at end of input or after a stream failure
    bool next(std::string& line);

    // True if the underlying stream reported an unrecoverable error
    bool failed() const { return failed_; }

private:
    bool fill();

    std::istream& in_;
    std::vector<char> buf_;
    size_t pos_ = 0;
    size_t len_ = 0;
    bool eof_ = false;
    bool failed_ = false;
    bool pending_cr_ = false;
};

} // namespace projmetrics
