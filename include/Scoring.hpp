#pragma once

/**
 * @brief 1 inside [min, max]; linear falloff by relative overshoot past the
 * nearer bound outside it, floored at 0.
 * Shared by the feature, estimator and frame-quality scores.
 */
double range_score(double value, double min, double max);
