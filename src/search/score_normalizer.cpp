#include <verity/search/score_normalizer.h>

#include <algorithm>
#include <cmath>
#include <numeric>

namespace verity::search::normalize {

ScoreStats computeScoreStats(std::span<const double> scores) {
    ScoreStats stats;
    stats.count = scores.size();
    if (scores.empty()) {
        return stats;
    }

    auto [minIt, maxIt] = std::minmax_element(scores.begin(), scores.end());
    stats.min = *minIt;
    stats.max = *maxIt;

    const double n = static_cast<double>(scores.size());
    stats.mean = std::accumulate(scores.begin(), scores.end(), 0.0) / n;

    double sqSum = 0.0;
    for (double s : scores) {
        double diff = s - stats.mean;
        sqSum += diff * diff;
    }
    stats.stddev = std::sqrt(sqSum / n);

    std::vector<double> sorted(scores.begin(), scores.end());
    std::sort(sorted.begin(), sorted.end());
    size_t mid = sorted.size() / 2;
    stats.median = sorted.size() % 2 == 0 ? (sorted[mid - 1] + sorted[mid]) / 2.0 : sorted[mid];
    return stats;
}

std::vector<double> zScore(std::span<const double> scores) {
    std::vector<double> out(scores.size(), 0.0);
    if (scores.size() < 2) {
        return out;
    }

    auto stats = computeScoreStats(scores);
    // Relative guard: rounding can leave a tiny nonzero spread on constant input
    const double scale = std::max(std::abs(stats.mean), 1.0);
    if (!(stats.stddev > 1e-12 * scale)) {
        return out;
    }
    for (size_t i = 0; i < scores.size(); ++i) {
        out[i] = (scores[i] - stats.mean) / stats.stddev;
    }
    return out;
}

} // namespace verity::search::normalize
