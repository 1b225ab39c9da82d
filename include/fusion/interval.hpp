#pragma once

namespace speakerfusion {
namespace fusion {

/// Latest accepted segment or turn bound, in seconds (about 31 years)
constexpr double kMaxTimestampSeconds = 1.0e9;

/**
 * Length of the intersection of the half-open intervals [aStart, aEnd) and
 * [bStart, bEnd). Zero when they are disjoint, touch, or either is empty.
 */
double overlap(double aStart, double aEnd, double bStart, double bEnd);

/**
 * True when both bounds are finite and end > start
 */
bool isValidInterval(double start, double end);

} // namespace fusion
} // namespace speakerfusion
