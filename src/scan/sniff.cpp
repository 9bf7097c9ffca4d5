#include <projmetrics/scan/sniff.hpp>
#include <cstring>
#include <fstream>
#include <vector>

namespace projmetrics {

bool is_text_prefix(const char* data, size_t len) {
    if (len == 0) return true;
    return std::memchr(data, '\0', len) == nullptr;
}

bool is_text_file(const std::filesystem::path& path, size_t sniff_bytes) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) return false;

    std::vector<char> buf(sniff_bytes);
    file.read(buf.data(), static_cast<std::streamsize>(buf.size()));
    if (file.bad()) return false;

    // A short file sets failbit/eofbit; gcount() is what was actually read
    return is_text_prefix(buf.data(), static_cast<size_t>(file.gcount()));
}

} // namespace projmetrics
