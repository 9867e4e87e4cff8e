#include "growth_analysis.hpp"
#include <algorithm> // For std::min, std::minmax_element
#include <atomic>
#include <exception>
#include <functional>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <utility> // For std::move

namespace growth_fit {

namespace {

GroupAnalysis
run_group(const Series &series, const DeathPhaseOptions &death_options, const LogisticFitter &fitter) {
    GroupAnalysis analysis;
    analysis.annotated = annotate_death_phase(series, death_options);
    analysis.fit = fitter.fit(fittable_observations(analysis.annotated));
    return analysis;
}

// Wraps run_group so that a failure stays local to its group.
GroupAnalysis
run_group_isolated(const Series &series, const DeathPhaseOptions &death_options, const LogisticFitter &fitter) {
    try {
        return run_group(series, death_options, fitter);
    } catch (const std::exception &e) {
        GroupAnalysis analysis;
        analysis.annotated.reserve(series.size());
        for (const auto &obs : series) { analysis.annotated.push_back({ obs, false }); }
        analysis.fit = FitResult::failure(FitStatus::NonConvergence, std::string("Analysis aborted: ") + e.what());
        return analysis;
    }
}

std::size_t
resolve_worker_count(std::size_t requested, std::size_t num_groups) {
    std::size_t workers = requested;
    if (workers == 0) { workers = std::max<std::size_t>(1, std::thread::hardware_concurrency()); }
    return std::max<std::size_t>(1, std::min(workers, num_groups));
}

} // namespace

GroupAnalysis
analyze_group(const Series &series, const AnalysisOptions &options) {
    validate(options);
    const LogisticFitter fitter(options.fit);
    return run_group_isolated(series, options.death_phase, fitter);
}

BatchResult
analyze_groups(const GroupedSeries &groups, const AnalysisOptions &options) {
    validate(options);
    const LogisticFitter fitter(options.fit);

    // Stable index order so each worker owns exactly one slot per group.
    std::vector<const GroupKey *> keys;
    std::vector<const Series *> series;
    keys.reserve(groups.size());
    series.reserve(groups.size());
    for (const auto &pair : groups) {
        keys.push_back(&pair.first);
        series.push_back(&pair.second);
    }
    std::vector<GroupAnalysis> slots(groups.size());

    const std::size_t workers = resolve_worker_count(options.num_threads, groups.size());
    std::mutex log_mutex;

    auto process_group = [&](std::size_t i) {
        slots[i] = run_group_isolated(*series[i], options.death_phase, fitter);
        if (options.verbose) {
            std::lock_guard<std::mutex> lock(log_mutex);
            const FitResult &fit = slots[i].fit;
            if (fit.converged()) {
                std::cout << "  [analyze_groups] " << *keys[i] << ": r=" << fit.parameters.r
                          << ", K=" << fit.parameters.K << ", N0=" << fit.parameters.N0 << std::endl;
            } else {
                std::cerr << "  [analyze_groups] " << *keys[i] << ": " << to_string(fit.status) << " (" << fit.reason
                          << ")" << std::endl;
            }
        }
    };

    if (options.verbose) {
        std::cout << "[analyze_groups] Processing " << groups.size() << " group(s) with " << workers << " worker(s)..."
                  << std::endl;
    }

    if (workers > 1) {
        std::atomic<std::size_t> next_group{ 0 };
        auto drain = [&]() {
            while (true) {
                const std::size_t i = next_group.fetch_add(1);
                if (i >= slots.size()) { break; }
                process_group(i);
            }
        };
        detail::run_worker_pool(workers, [](const std::function<void()> &work) { return std::thread(work); }, drain);
    } else {
        for (std::size_t i = 0; i < slots.size(); ++i) { process_group(i); }
    }

    BatchResult batch;
    for (std::size_t i = 0; i < slots.size(); ++i) { batch.emplace(*keys[i], std::move(slots[i])); }

    if (options.verbose) {
        std::size_t converged = 0;
        for (const auto &pair : batch) {
            if (pair.second.fit.converged()) { ++converged; }
        }
        std::cout << "[analyze_groups] Done: " << converged << " of " << batch.size() << " group(s) converged."
                  << std::endl;
    }
    return batch;
}

std::vector<CurveRow>
sample_fitted_curves(const BatchResult &batch, double t_min, double t_max, std::size_t num_points) {
    std::vector<CurveRow> rows;
    for (const auto &pair : batch) {
        if (!pair.second.fit.converged()) { continue; }
        for (const CurvePoint &point : sample_curve(pair.second.fit, t_min, t_max, num_points)) {
            rows.push_back({ pair.first, point });
        }
    }
    return rows;
}

std::vector<CurveRow>
sample_fitted_curves_over_data(const BatchResult &batch, std::size_t num_points) {
    std::vector<CurveRow> rows;
    for (const auto &pair : batch) {
        const GroupAnalysis &analysis = pair.second;
        if (!analysis.fit.converged() || analysis.annotated.empty()) { continue; }
        // Series are time-ordered, so the span runs from the first to the last observation.
        const double t_min = analysis.annotated.front().observation.time;
        const double t_max = analysis.annotated.back().observation.time;
        for (const CurvePoint &point : sample_curve(analysis.fit, t_min, t_max, num_points)) {
            rows.push_back({ pair.first, point });
        }
    }
    return rows;
}

} // namespace growth_fit
