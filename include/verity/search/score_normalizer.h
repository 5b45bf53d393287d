#pragma once

#include <cstddef>
#include <span>
#include <vector>

namespace verity::search::normalize {

/**
 * Score statistics for one signal, accumulated in double precision
 */
struct ScoreStats {
    double min = 0.0;
    double max = 0.0;
    double mean = 0.0;
    double stddev = 0.0; // Population standard deviation
    double median = 0.0;
    size_t count = 0;
};

ScoreStats computeScoreStats(std::span<const double> scores);

/**
 * Z-score normalization over the list: zero mean, unit population variance. Lists with fewer than
 * two scores, or with zero variance, normalize to all zeros.
 */
std::vector<double> zScore(std::span<const double> scores);

// Similarity proxy for a distance; larger is better
inline double semanticFromDistance(double distance) {
    return -distance;
}

} // namespace verity::search::normalize
