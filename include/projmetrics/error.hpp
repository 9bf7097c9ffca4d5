#pragma once

#include <string>

namespace projmetrics {

// Every failure carries a code plus an optional hint and source location.
struct MetricsError {
    enum Code {
        IO,
        Parse,
        Config,
        InvalidArg,
        NotFound,
        Unreadable
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;

    MetricsError() = default;
    MetricsError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    MetricsError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    MetricsError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    // Multi-line form for the terminal: code, message, hint, location
    std::string format() const;
    // "file:line: message" on one line, for log output
    std::string summary() const;
    // "file:line", "file", or "" when no file is attached
    std::string location() const;

    static const char* code_name(Code c);
};

} // namespace projmetrics
