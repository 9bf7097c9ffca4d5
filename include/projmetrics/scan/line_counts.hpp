#pragma once

#include <cstdint>

namespace projmetrics {

// Per-file (or aggregated) line tallies. After a file is classified
// total == blank + comment + code.
struct LineCounts {
    uint64_t total = 0;
    uint64_t blank = 0;
    uint64_t comment = 0;
    uint64_t code = 0;

    // Field-wise sum; associative and commutative.
    void merge(const LineCounts& other);

    bool balanced() const { return total == blank + comment + code; }

    bool operator==(const LineCounts& o) const;
    bool operator!=(const LineCounts& o) const;
};

LineCounts merged(LineCounts a, const LineCounts& b);

} // namespace projmetrics
