#ifndef DEATH_PHASE_DETECTOR_HPP
#define DEATH_PHASE_DETECTOR_HPP

#include "growth_data.hpp"
#include <cstddef>
#include <vector>

namespace growth_fit {

/**
 * @brief Options controlling what counts as a sustained terminal decline.
 */
struct DeathPhaseOptions {
    /// A point is a decline candidate when density < M - relative_tolerance * M, with M the
    /// maximum observed before it. 0 means any strict decrease counts.
    double relative_tolerance = 0.0;

    /// Minimum number of observed (non-missing) points the death phase must contain.
    std::size_t min_decline_points = 1;
};

/**
 * @brief Throws std::invalid_argument if the options are out of range.
 */
void
validate(const DeathPhaseOptions &options);

/**
 * @brief Flags the trailing observations that belong to a post-peak decline.
 *
 * The death phase begins at the first index i such that every observation from i to the
 * end of the series lies below the maximum observed before i (by more than the relative
 * tolerance). A dip that later rebounds to the prior maximum or above is therefore never
 * flagged, and the returned flags are always a run of false followed by a run of true.
 *
 * Missing densities neither raise the running maximum nor break a decline. The flagged
 * suffix always starts on an observed point.
 *
 * @param series Observations sorted ascending by time.
 * @param options Detection options.
 * @return One flag per observation, in input order.
 * @throws std::invalid_argument If the options are invalid.
 */
std::vector<bool>
detect_death_phase(const Series &series, const DeathPhaseOptions &options = DeathPhaseOptions());

/**
 * @brief Pairs each observation with its death-phase flag.
 */
std::vector<AnnotatedObservation>
annotate_death_phase(const Series &series, const DeathPhaseOptions &options = DeathPhaseOptions());

/**
 * @brief Returns the observations usable for fitting: not flagged and not missing.
 */
Series
fittable_observations(const std::vector<AnnotatedObservation> &annotated);

} // namespace growth_fit

#endif // DEATH_PHASE_DETECTOR_HPP
