#pragma once

#include <projmetrics/scan/scanner.hpp>
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace projmetrics {

// "512 B", "1.5 KB", ... up to TB
std::string human_bytes(uint64_t n);

// One-decimal percentage; "0.0%" when denom is zero
std::string pct(uint64_t numer, uint64_t denom);

// Extensions in report order: most files first, ties by name. When the
// profile names extensions and the scan was not restricted to them, the
// profile's extensions are listed first.
std::vector<std::string> extension_order(const ScanReport& report);

void render_report(const ScanReport& report, size_t top_n, std::ostream& out);

} // namespace projmetrics
