#include <projmetrics/error.hpp>
#include <sstream>

namespace projmetrics {

static const char* const CODE_NAMES[] = {
    "IO", "Parse", "Config", "InvalidArg", "NotFound", "Unreadable",
};

const char* MetricsError::code_name(Code c) {
    auto i = static_cast<size_t>(c);
    if (i >= sizeof(CODE_NAMES) / sizeof(CODE_NAMES[0])) return "Unknown";
    return CODE_NAMES[i];
}

std::string MetricsError::location() const {
    if (file.empty()) return "";
    if (line <= 0) return file;
    return file + ":" + std::to_string(line);
}

std::string MetricsError::summary() const {
    std::string loc = location();
    return loc.empty() ? message : loc + ": " + message;
}

std::string MetricsError::format() const {
    std::ostringstream out;
    out << "error[" << code_name(code) << "]: " << message;
    if (!hint.empty()) out << "\n  hint: " << hint;
    std::string loc = location();
    if (!loc.empty()) out << "\n  --> " << loc;
    return out.str();
}

} // namespace projmetrics
