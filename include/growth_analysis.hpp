#ifndef GROWTH_ANALYSIS_HPP
#define GROWTH_ANALYSIS_HPP

#include "analysis_config.hpp"
#include "curve_sampler.hpp"
#include "death_phase_detector.hpp"
#include "growth_data.hpp"
#include "logistic_fitter.hpp"
#include <cstddef>
#include <functional>
#include <iostream>
#include <map>
#include <system_error>
#include <thread>
#include <vector>

namespace growth_fit {

/**
 * @brief Everything computed for one group: its annotated series and its fit.
 */
struct GroupAnalysis {
    std::vector<AnnotatedObservation> annotated;
    FitResult fit;
};

/// One entry per input group, failed groups included.
using BatchResult = std::map<GroupKey, GroupAnalysis>;

/**
 * @brief Detects the death phase, drops flagged and missing points and fits one group.
 *
 * Never throws for data-dependent problems; those end up in GroupAnalysis::fit.
 */
GroupAnalysis
analyze_group(const Series &series, const AnalysisOptions &options);

/**
 * @brief Runs analyze_group for every group.
 *
 * Groups are independent. With num_threads > 1 a pool of std::thread workers pulls group
 * indices from an atomic counter and writes each result into its own preallocated slot;
 * the map is assembled after all workers have joined. An exception escaping one group is
 * recorded as a NonConvergence failure for that group only.
 *
 * @throws std::invalid_argument If the options are invalid (checked once up front).
 */
BatchResult
analyze_groups(const GroupedSeries &groups, const AnalysisOptions &options = AnalysisOptions());

/**
 * @brief One row of the long-form fitted-curve table.
 */
struct CurveRow {
    GroupKey key;
    CurvePoint point;
};

/**
 * @brief Samples every converged group at num_points evenly spaced times on [t_min, t_max].
 *
 * Failed groups are skipped.
 */
std::vector<CurveRow>
sample_fitted_curves(const BatchResult &batch, double t_min, double t_max, std::size_t num_points);

/**
 * @brief Samples every converged group over the time span of its own observations.
 */
std::vector<CurveRow>
sample_fitted_curves_over_data(const BatchResult &batch, std::size_t num_points);

namespace detail {

/**
 * @brief Runs drain on up to num_workers threads created by spawn and joins them.
 *
 * drain must keep pulling work until none is left, so any subset of workers finishes the
 * whole job. If spawn throws std::system_error, the threads already running are kept; if
 * none could be started, drain runs on the calling thread.
 *
 * @return Number of threads that were started.
 */
template<typename Spawn>
std::size_t
run_worker_pool(std::size_t num_workers, Spawn &&spawn, const std::function<void()> &drain) {
    std::vector<std::thread> pool;
    pool.reserve(num_workers);
    try {
        for (std::size_t w = 0; w < num_workers; ++w) { pool.push_back(spawn(drain)); }
    } catch (const std::system_error &e) {
        std::cerr << "[analyze_groups] Warning: started " << pool.size() << " of " << num_workers
                  << " worker thread(s): " << e.what() << std::endl;
    }
    if (pool.empty()) { drain(); }
    for (auto &worker : pool) { worker.join(); }
    return pool.size();
}

} // namespace detail

} // namespace growth_fit

#endif // GROWTH_ANALYSIS_HPP
