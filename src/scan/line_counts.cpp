#include <projmetrics/scan/line_counts.hpp>

namespace projmetrics {

void LineCounts::merge(const LineCounts& other) {
    total += other.total;
    blank += other.blank;
    comment += other.comment;
    code += other.code;
}

bool LineCounts::operator==(const LineCounts& o) const {
    return total == o.total && blank == o.blank &&
           comment == o.comment && code == o.code;
}

bool LineCounts::operator!=(const LineCounts& o) const {
    return !(*this == o);
}

LineCounts merged(LineCounts a, const LineCounts& b) {
    a.merge(b);
    return a;
}

} // namespace projmetrics
