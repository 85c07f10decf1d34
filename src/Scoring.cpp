#include "Scoring.hpp"
#include <algorithm>

double range_score(double value, double min, double max) {
    if (value < min) return std::max(0.0, 1.0 - (min - value) / min);
    if (value > max) return std::max(0.0, 1.0 - (value - max) / max);
    return 1.0;
}
