#include <projmetrics/scan/text.hpp>

namespace projmetrics {

// ---------------------------------------------------------------------------
// UTF-8 decoding
// ---------------------------------------------------------------------------

static const char REPLACEMENT[] = "\xEF\xBF\xBD";

static bool is_cont(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

// Length of the valid sequence starting at i, or 0 if invalid. When
// invalid, `consumed` is the length of the maximal subpart to replace.
static size_t valid_sequence(const std::string& s, size_t i, size_t& consumed) {
    auto b0 = static_cast<unsigned char>(s[i]);
    consumed = 1;
    if (b0 < 0x80) return 1;

    size_t need = 0;
    unsigned char lo = 0x80, hi = 0xBF;
    if (b0 >= 0xC2 && b0 <= 0xDF) {
        need = 1;
    } else if (b0 == 0xE0) {
        need = 2; lo = 0xA0;
    } else if ((b0 >= 0xE1 && b0 <= 0xEC) || b0 == 0xEE || b0 == 0xEF) {
        need = 2;
    } else if (b0 == 0xED) {
        need = 2; hi = 0x9F;
    } else if (b0 == 0xF0) {
        need = 3; lo = 0x90;
    } else if (b0 >= 0xF1 && b0 <= 0xF3) {
        need = 3;
    } else if (b0 == 0xF4) {
        need = 3; hi = 0x8F;
    } else {
        return 0;
    }

    for (size_t k = 1; k <= need; k++) {
        if (i + k >= s.size()) return 0;
        auto c = static_cast<unsigned char>(s[i + k]);
        bool ok = (k == 1) ? (c >= lo && c <= hi) : is_cont(c);
        if (!ok) return 0;
        consumed = k + 1;
    }
    return need + 1;
}

std::string decode_utf8_lossy(const std::string& bytes, size_t& replaced) {
    replaced = 0;
    std::string out;
    out.reserve(bytes.size());

    size_t i = 0;
    while (i < bytes.size()) {
        size_t consumed = 0;
        size_t n = valid_sequence(bytes, i, consumed);
        if (n > 0) {
            out.append(bytes, i, n);
            i += n;
        } else {
            out += REPLACEMENT;
            replaced++;
            i += consumed;
        }
    }
    return out;
}

// ---------------------------------------------------------------------------
// Whitespace
// ---------------------------------------------------------------------------

static bool is_ascii_space(unsigned char c) {
    return c == ' ' || (c >= 0x09 && c <= 0x0D) || (c >= 0x1C && c <= 0x1F);
}

// Byte length of a Unicode whitespace character encoded at s[i], or 0.
static size_t unicode_space_at(const std::string& s, size_t i) {
    auto at = [&](size_t k) -> unsigned char {
        return i + k < s.size() ? static_cast<unsigned char>(s[i + k]) : 0;
    };
    unsigned char b0 = at(0), b1 = at(1), b2 = at(2);
    if (b0 == 0xC2 && (b1 == 0x85 || b1 == 0xA0)) return 2;       // NEL, NBSP
    if (b0 == 0xE1 && b1 == 0x9A && b2 == 0x80) return 3;           // U+1680
    if (b0 == 0xE2 && b1 == 0x80) {
        if (b2 >= 0x80 && b2 <= 0x8A) return 3;                     // U+2000..200A
        if (b2 == 0xA8 || b2 == 0xA9 || b2 == 0xAF) return 3;       // U+2028 2029 202F
    }
    if (b0 == 0xE2 && b1 == 0x81 && b2 == 0x9F) return 3;           // U+205F
    if (b0 == 0xE3 && b1 == 0x80 && b2 == 0x80) return 3;           // U+3000
    return 0;
}

// Byte length of a whitespace character ending just before s[end], or 0.
static size_t unicode_space_before(const std::string& s, size_t end) {
    for (size_t len : {size_t(2), size_t(3)}) {
        if (end >= len && unicode_space_at(s, end - len) == len) return len;
    }
    return 0;
}

std::string trim_whitespace(const std::string& s) {
    size_t begin = 0;
    while (begin < s.size()) {
        if (is_ascii_space(static_cast<unsigned char>(s[begin]))) {
            begin++;
            continue;
        }
        size_t n = unicode_space_at(s, begin);
        if (n == 0) break;
        begin += n;
    }

    size_t end = s.size();
    while (end > begin) {
        if (is_ascii_space(static_cast<unsigned char>(s[end - 1]))) {
            end--;
            continue;
        }
        size_t n = unicode_space_before(s, end);
        if (n == 0 || end - n < begin) break;
        end -= n;
    }

    return s.substr(begin, end - begin);
}

// ---------------------------------------------------------------------------
// LineReader
// ---------------------------------------------------------------------------

LineReader::LineReader(std::istream& in, size_t chunk_size)
    : in_(in), buf_(chunk_size > 0 ? chunk_size : 1) {}

bool LineReader::fill() {
    if (eof_ || failed_) return false;
    in_.read(buf_.data(), static_cast<std::streamsize>(buf_.size()));
    if (in_.bad()) {
        failed_ = true;
        return false;
    }
    pos_ = 0;
    len_ = static_cast<size_t>(in_.gcount());
    if (len_ < buf_.size()) eof_ = true;
    return len_ > 0;
}

bool LineReader::next(std::string& line) {
    line.clear();
    bool have_any = false;

    for (;;) {
        if (pos_ == len_ && !fill()) {
            // End of input: emit the trailing unterminated line, if any
            return have_any && !failed_;
        }

        char c = buf_[pos_];

        // "\r\n" across a chunk boundary: the '\r' already ended the line
        if (pending_cr_) {
            pending_cr_ = false;
            if (c == '\n') {
                pos_++;
                continue;
            }
        }

        pos_++;
        if (c == '\n') return true;
        if (c == '\r') {
            pending_cr_ = true;
            return true;
        }
        line.push_back(c);
        have_any = true;
    }
}

} // namespace projmetrics
