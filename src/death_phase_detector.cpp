#include "death_phase_detector.hpp"
#include <algorithm> // For std::max
#include <limits>
#include <stdexcept>
#include <string>

namespace growth_fit {

void
validate(const DeathPhaseOptions &options) {
    if (!(options.relative_tolerance >= 0.0) || options.relative_tolerance >= 1.0) {
        throw std::invalid_argument("Death phase relative_tolerance must lie in [0, 1), got " +
                                    std::to_string(options.relative_tolerance) + ".");
    }
    if (options.min_decline_points == 0) {
        throw std::invalid_argument("Death phase min_decline_points must be at least 1.");
    }
}

std::vector<bool>
detect_death_phase(const Series &series, const DeathPhaseOptions &options) {
    validate(options);

    std::vector<bool> flags(series.size(), false);
    if (series.size() < 2) { return flags; }

    // Work on observed points only; missing densities are transparent.
    std::vector<size_t> observed;
    observed.reserve(series.size());
    for (size_t i = 0; i < series.size(); ++i) {
        if (series[i].has_density()) { observed.push_back(i); }
    }
    const size_t m = observed.size();
    if (m < 2) { return flags; }

    // prior_max[p] = max density over observed points before position p
    std::vector<double> prior_max(m, -std::numeric_limits<double>::infinity());
    for (size_t p = 1; p < m; ++p) {
        prior_max[p] = std::max(prior_max[p - 1], series[observed[p - 1]].density);
    }

    // Scanning backwards, the tail from p stays a decline exactly while its maximum is
    // below the threshold derived from prior_max[p]. Both sides are monotone in p, so the
    // first failure ends the scan.
    size_t start = m;
    double tail_max = -std::numeric_limits<double>::infinity();
    for (size_t p = m - 1; p >= 1; --p) {
        tail_max = std::max(tail_max, series[observed[p]].density);
        const double threshold = prior_max[p] - options.relative_tolerance * prior_max[p];
        if (!(tail_max < threshold)) { break; }
        start = p;
    }

    if (start == m || m - start < options.min_decline_points) { return flags; }

    std::fill(flags.begin() + static_cast<std::ptrdiff_t>(observed[start]), flags.end(), true);
    return flags;
}

std::vector<AnnotatedObservation>
annotate_death_phase(const Series &series, const DeathPhaseOptions &options) {
    const std::vector<bool> flags = detect_death_phase(series, options);
    std::vector<AnnotatedObservation> annotated;
    annotated.reserve(series.size());
    for (size_t i = 0; i < series.size(); ++i) { annotated.push_back({ series[i], flags[i] }); }
    return annotated;
}

Series
fittable_observations(const std::vector<AnnotatedObservation> &annotated) {
    Series usable;
    usable.reserve(annotated.size());
    for (const auto &row : annotated) {
        if (!row.death_phase && row.observation.has_density()) { usable.push_back(row.observation); }
    }
    return usable;
}

} // namespace growth_fit
