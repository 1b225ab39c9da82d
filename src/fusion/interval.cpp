#include "fusion/interval.hpp"
#include <algorithm>
#include <cmath>

namespace speakerfusion {
namespace fusion {

double overlap(double aStart, double aEnd, double bStart, double bEnd) {
    return std::max(0.0, std::min(aEnd, bEnd) - std::max(aStart, bStart));
}

bool isValidInterval(double start, double end) {
    return std::isfinite(start) && std::isfinite(end) && end > start;
}

} // namespace fusion
} // namespace speakerfusion
