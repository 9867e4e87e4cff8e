#ifndef ANALYSIS_CONFIG_HPP
#define ANALYSIS_CONFIG_HPP

#include "death_phase_detector.hpp"
#include "logistic_fitter.hpp"
#include <cstddef>
#include <nlohmann/json.hpp>
#include <string>

namespace growth_fit {

/**
 * @brief Settings for a batch run over all groups.
 */
struct AnalysisOptions {
    DeathPhaseOptions death_phase;
    FitOptions fit;

    /// 1 runs groups sequentially, 0 uses std::thread::hardware_concurrency().
    std::size_t num_threads = 1;
    bool verbose = false;
};

/**
 * @brief Validates every nested option set.
 * @throws std::invalid_argument On the first out-of-range value.
 */
void
validate(const AnalysisOptions &options);

/**
 * @brief Builds options from a JSON document, starting from the defaults.
 *
 * Recognized layout (every key optional):
 * @code
 * {
 *   "death_phase": { "relative_tolerance": 0.0, "min_decline_points": 1 },
 *   "fit": { "min_observations": 3, "positive_floor": 1e-6, "capacity_scale": 1.05,
 *            "max_iterations": 200, "max_solver_time_seconds": 10.0,
 *            "function_tolerance": 1e-10, "gradient_tolerance": 1e-12,
 *            "parameter_tolerance": 1e-10, "compute_covariance": true, "verbose": false },
 *   "batch": { "num_threads": 1, "verbose": false }
 * }
 * @endcode
 * Unknown keys produce a warning on std::cerr.
 * @throws std::runtime_error If a value has the wrong type.
 * @throws std::invalid_argument If the resulting options are out of range.
 */
AnalysisOptions
parse_analysis_options(const nlohmann::json &config);

/**
 * @brief Reads and parses a JSON configuration file.
 * @throws std::runtime_error If the file cannot be opened or is not valid JSON.
 */
AnalysisOptions
load_analysis_options(const std::string &path);

/**
 * @brief Serializes options back to the layout read by parse_analysis_options.
 */
nlohmann::json
to_json(const AnalysisOptions &options);

} // namespace growth_fit

#endif // ANALYSIS_CONFIG_HPP
