#ifndef LOGISTIC_FITTER_HPP
#define LOGISTIC_FITTER_HPP

#include "growth_data.hpp"
#include "logistic_model.hpp"
#include <Eigen/Core>
#include <ceres/ceres.h>
#include <optional>
#include <string>

namespace growth_fit {

/**
 * @brief Outcome category of a single group fit.
 */
enum class FitStatus {
    Converged,
    InsufficientData,     ///< Fewer than the minimum number of usable observations.
    NonConvergence,       ///< Solver ran out of iterations/time or failed numerically.
    DegenerateParameters, ///< Non-finite, non-positive or non-identifiable parameters.
};

std::string
to_string(FitStatus status);

/**
 * @brief Solver settings and initial-guess knobs for the logistic fit.
 */
struct FitOptions {
    std::size_t min_observations = 3;

    // Initial guesses
    double positive_floor = 1e-6; ///< Lower bound for N0 / r guesses and all fitted parameters.
    double capacity_scale = 1.05; ///< K guess = max observed density * capacity_scale.

    // Ceres budget and tolerances
    int max_iterations = 200;
    double max_solver_time_seconds = 10.0;
    double function_tolerance = 1e-10;
    double gradient_tolerance = 1e-12;
    double parameter_tolerance = 1e-10;

    bool compute_covariance = true;
    bool verbose = false; ///< Print progress and the Ceres brief report.
};

/**
 * @brief Throws std::invalid_argument if the options are out of range.
 */
void
validate(const FitOptions &options);

/**
 * @brief Result of fitting one group. Immutable once returned by the fitter.
 *
 * Only a Converged result carries meaningful parameters; every other status carries a
 * human-readable reason instead.
 */
struct FitResult {
    FitStatus status = FitStatus::InsufficientData;
    std::string reason;

    LogisticParameters parameters;
    std::optional<LogisticParameters> standard_errors;
    std::optional<Eigen::Matrix3d> covariance; ///< Order: r, K, N0.

    std::size_t num_observations = 0; ///< Usable points given to the solver.
    int iterations = 0;
    double final_cost = 0.0; ///< Ceres cost, 0.5 * sum of squared residuals.
    double rmse = 0.0;

    bool converged() const { return status == FitStatus::Converged; }

    /// ln(2) / r
    double doubling_time() const;

    /// Time at which density reaches K / 2 and growth is fastest.
    double inflection_time() const;

    /// r * K / 4, the slope of the curve at its inflection point.
    double max_growth_rate() const;

    static FitResult failure(FitStatus status, std::string reason, std::size_t num_observations = 0);
};

/**
 * @brief Fits N(t) = K*N0*exp(r*t) / (K + N0*(exp(r*t) - 1)) to a growth series.
 *
 * Uses Ceres Solver with automatic differentiation to minimize the sum of squared
 * residuals over every observation with a density. r, K and N0 are bounded below by
 * FitOptions::positive_floor and K additionally by the largest observed density.
 *
 * Data-dependent problems never throw: they are reported through FitResult::status.
 */
class LogisticFitter {
  public:
    explicit LogisticFitter(FitOptions options = FitOptions());

    /**
     * @brief Fits one series. Missing densities are skipped.
     * @param series Observations sorted by time, death phase already removed.
     */
    FitResult fit(const Series &series) const;

    /**
     * @brief Initial parameter guesses the solver starts from.
     *
     * N0 from the first density, K from the maximum density scaled by capacity_scale and r
     * from a log-linear regression over the pre-inflection points.
     * @param series Observations with densities only; must not be empty.
     */
    LogisticParameters initial_guess(const Series &series) const;

    const FitOptions &options() const { return options_; }

  private:
    FitOptions options_;

    // One residual per observation: model(t) - measured density.
    struct LogisticResidual {
        LogisticResidual(double time, double density)
          : time_(time)
          , density_(density) {}

        template<typename T>
        bool operator()(const T *const params, T *residual) const {
            residual[0] = logistic_density(time_, params[0], params[1], params[2]) - T(density_);
            return true;
        }

        static ceres::CostFunction *Create(double time, double density) {
            return new ceres::AutoDiffCostFunction<LogisticResidual, 1, 3>(new LogisticResidual(time, density));
        }

      private:
        const double time_;
        const double density_;
    };

    void estimate_uncertainty(ceres::Problem &problem, double *params, FitResult &result) const;
};

/**
 * @brief Convenience wrapper around LogisticFitter::fit.
 */
FitResult
fit_logistic(const Series &series, const FitOptions &options = FitOptions());

} // namespace growth_fit

#endif // LOGISTIC_FITTER_HPP
