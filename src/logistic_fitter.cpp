// src/logistic_fitter.cpp

#include "logistic_fitter.hpp"
#include <Eigen/Dense>
#include <algorithm> // For std::minmax_element
#include <cstddef>
#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <utility> // For std::move
#include <vector>

namespace growth_fit {

std::string
to_string(FitStatus status) {
    switch (status) {
        case FitStatus::Converged:
            return "converged";
        case FitStatus::InsufficientData:
            return "insufficient_data";
        case FitStatus::NonConvergence:
            return "non_convergence";
        case FitStatus::DegenerateParameters:
            return "degenerate_parameters";
    }
    return "unknown";
}

void
validate(const FitOptions &options) {
    if (options.min_observations < 3) {
        throw std::invalid_argument("FitOptions::min_observations must be at least 3 (three free parameters).");
    }
    if (!(options.positive_floor > 0.0)) {
        throw std::invalid_argument("FitOptions::positive_floor must be positive.");
    }
    if (!(options.capacity_scale >= 1.0)) {
        throw std::invalid_argument("FitOptions::capacity_scale must be >= 1.");
    }
    if (options.max_iterations <= 0) { throw std::invalid_argument("FitOptions::max_iterations must be positive."); }
    if (!(options.max_solver_time_seconds > 0.0)) {
        throw std::invalid_argument("FitOptions::max_solver_time_seconds must be positive.");
    }
    if (!(options.function_tolerance > 0.0) || !(options.gradient_tolerance > 0.0) ||
        !(options.parameter_tolerance > 0.0)) {
        throw std::invalid_argument("FitOptions solver tolerances must be positive.");
    }
}

// --- FitResult ---

FitResult
FitResult::failure(FitStatus status, std::string reason, std::size_t num_observations) {
    FitResult result;
    result.status = status;
    result.reason = std::move(reason);
    result.num_observations = num_observations;
    const double nan = std::numeric_limits<double>::quiet_NaN();
    result.parameters = { nan, nan, nan };
    result.final_cost = nan;
    result.rmse = nan;
    return result;
}

double
FitResult::doubling_time() const {
    if (!converged()) { return std::numeric_limits<double>::quiet_NaN(); }
    return std::log(2.0) / parameters.r;
}

double
FitResult::inflection_time() const {
    if (!converged() || parameters.K <= parameters.N0) { return std::numeric_limits<double>::quiet_NaN(); }
    return std::log((parameters.K - parameters.N0) / parameters.N0) / parameters.r;
}

double
FitResult::max_growth_rate() const {
    if (!converged()) { return std::numeric_limits<double>::quiet_NaN(); }
    return parameters.r * parameters.K / 4.0;
}

// --- LogisticFitter ---

LogisticFitter::LogisticFitter(FitOptions options)
  : options_(std::move(options)) {
    validate(options_);
}

LogisticParameters
LogisticFitter::initial_guess(const Series &series) const {
    if (series.empty()) { throw std::invalid_argument("Cannot compute initial guess for an empty series."); }

    const double floor = options_.positive_floor;
    double max_density = series.front().density;
    for (const auto &obs : series) { max_density = std::max(max_density, obs.density); }

    LogisticParameters guess;
    guess.N0 = std::max(series.front().density, floor);
    guess.K = std::max(max_density * options_.capacity_scale, floor * options_.capacity_scale);

    // Early (pre-inflection) portion: leading run of positive densities up to K/2.
    std::vector<const Observation *> early;
    for (const auto &obs : series) {
        if (obs.density > guess.K / 2.0) { break; }
        if (obs.density > 0.0) { early.push_back(&obs); }
    }
    if (early.size() < 2) {
        std::vector<const Observation *> positive;
        for (const auto &obs : series) {
            if (obs.density > 0.0) { positive.push_back(&obs); }
        }
        const size_t half = std::max<size_t>(2, (positive.size() + 1) / 2);
        early.assign(positive.begin(), positive.begin() + static_cast<std::ptrdiff_t>(std::min(half, positive.size())));
    }

    guess.r = floor;
    if (early.size() >= 2 && early.back()->time > early.front()->time) {
        Eigen::MatrixXd A(early.size(), 2);
        Eigen::VectorXd b(early.size());
        for (size_t i = 0; i < early.size(); ++i) {
            A(i, 0) = 1.0;
            A(i, 1) = early[i]->time;
            b(i) = std::log(early[i]->density);
        }
        const Eigen::VectorXd coeffs = A.colPivHouseholderQr().solve(b);
        if (std::isfinite(coeffs(1))) { guess.r = std::max(coeffs(1), floor); }
    }
    return guess;
}

FitResult
LogisticFitter::fit(const Series &series) const {
    Series usable;
    usable.reserve(series.size());
    for (const auto &obs : series) {
        if (obs.has_density() && std::isfinite(obs.density) && std::isfinite(obs.time)) { usable.push_back(obs); }
    }
    const size_t n = usable.size();

    if (n < options_.min_observations) {
        return FitResult::failure(FitStatus::InsufficientData,
                                  "Only " + std::to_string(n) + " usable observation(s); at least " +
                                    std::to_string(options_.min_observations) + " are required.",
                                  n);
    }

    const auto density_less = [](const Observation &a, const Observation &b) { return a.density < b.density; };
    const auto range = std::minmax_element(usable.begin(), usable.end(), density_less);
    const double min_density = range.first->density;
    const double max_density = range.second->density;
    if (max_density - min_density <= 1e-12 * std::max(1.0, std::abs(max_density))) {
        return FitResult::failure(
          FitStatus::DegenerateParameters, "Density is constant across the series; growth rate is not identifiable.", n);
    }

    const LogisticParameters guess = initial_guess(usable);
    double params[3] = { guess.r, guess.K, guess.N0 };

    if (options_.verbose) {
        std::cout << "  [LogisticFitter] Fitting " << n << " observations. Initial guess r=" << guess.r
                  << ", K=" << guess.K << ", N0=" << guess.N0 << std::endl;
    }

    ceres::Problem problem;
    for (const auto &obs : usable) {
        problem.AddResidualBlock(LogisticResidual::Create(obs.time, obs.density), nullptr, params);
    }

    const double floor = options_.positive_floor;
    problem.SetParameterLowerBound(params, 0, floor);
    problem.SetParameterLowerBound(params, 1, std::max(max_density, floor));
    problem.SetParameterLowerBound(params, 2, floor);

    ceres::Solver::Options solver_options;
    solver_options.minimizer_type = ceres::TRUST_REGION;
    solver_options.trust_region_strategy_type = ceres::LEVENBERG_MARQUARDT;
    solver_options.linear_solver_type = ceres::DENSE_QR; // Three parameters
    solver_options.max_num_iterations = options_.max_iterations;
    solver_options.max_solver_time_in_seconds = options_.max_solver_time_seconds;
    solver_options.function_tolerance = options_.function_tolerance;
    solver_options.gradient_tolerance = options_.gradient_tolerance;
    solver_options.parameter_tolerance = options_.parameter_tolerance;
    solver_options.num_threads = 1;
    solver_options.minimizer_progress_to_stdout = false;
    solver_options.logging_type = ceres::SILENT;

    ceres::Solver::Summary summary;
    ceres::Solve(solver_options, &problem, &summary);

    if (options_.verbose) { std::cout << "  [LogisticFitter] Ceres Summary: " << summary.BriefReport() << std::endl; }

    const int iterations = static_cast<int>(summary.iterations.size());
    if (summary.termination_type != ceres::CONVERGENCE) {
        FitResult result = FitResult::failure(FitStatus::NonConvergence,
                                              std::string("Solver terminated with ") +
                                                ceres::TerminationTypeToString(summary.termination_type) + " after " +
                                                std::to_string(iterations) + " iteration(s): " + summary.message,
                                              n);
        result.iterations = iterations;
        return result;
    }

    const double r = params[0];
    const double K = params[1];
    const double N0 = params[2];
    if (!std::isfinite(r) || !std::isfinite(K) || !std::isfinite(N0) || r <= 0.0 || K <= 0.0 || N0 <= 0.0) {
        return FitResult::failure(FitStatus::DegenerateParameters,
                                  "Fitted parameters are non-finite or non-positive (r=" + std::to_string(r) +
                                    ", K=" + std::to_string(K) + ", N0=" + std::to_string(N0) + ").",
                                  n);
    }
    if (r <= floor * (1.0 + 1e-9)) {
        return FitResult::failure(
          FitStatus::DegenerateParameters, "Growth rate collapsed to its positivity floor; r is not identifiable.", n);
    }
    if (K < max_density * (1.0 - 1e-12)) {
        return FitResult::failure(FitStatus::DegenerateParameters,
                                  "Carrying capacity " + std::to_string(K) + " lies below the observed maximum " +
                                    std::to_string(max_density) + ".",
                                  n);
    }

    FitResult result;
    result.status = FitStatus::Converged;
    result.parameters = { r, K, N0 };
    result.num_observations = n;
    result.iterations = iterations;
    result.final_cost = summary.final_cost;
    result.rmse = std::sqrt(2.0 * summary.final_cost / static_cast<double>(n));

    if (options_.compute_covariance && n > 3) { estimate_uncertainty(problem, params, result); }

    if (options_.verbose) {
        std::cout << "  [LogisticFitter] Converged: r=" << r << ", K=" << K << ", N0=" << N0
                  << ", rmse=" << result.rmse << std::endl;
    }
    return result;
}

void
LogisticFitter::estimate_uncertainty(ceres::Problem &problem, double *params, FitResult &result) const {
    ceres::Covariance::Options cov_options;
    cov_options.algorithm_type = ceres::DENSE_SVD;
    cov_options.num_threads = 1;
    ceres::Covariance covariance(cov_options);

    std::vector<std::pair<const double *, const double *>> blocks = { { params, params } };
    if (!covariance.Compute(blocks, &problem)) {
        if (options_.verbose) {
            std::cerr << "  [LogisticFitter] Warning: covariance is not available (rank-deficient Jacobian)."
                      << std::endl;
        }
        return;
    }

    Eigen::Matrix<double, 3, 3, Eigen::RowMajor> cov;
    if (!covariance.GetCovarianceBlock(params, params, cov.data())) { return; }

    // Ceres returns (J^T J)^-1; scale by the residual variance estimate.
    const double dof = static_cast<double>(result.num_observations) - 3.0;
    const double sigma2 = 2.0 * result.final_cost / dof;
    const Eigen::Matrix3d scaled = cov * sigma2;
    if (!scaled.allFinite() || (scaled.diagonal().array() < 0.0).any()) { return; }

    result.covariance = scaled;
    result.standard_errors = LogisticParameters{ std::sqrt(scaled(0, 0)), std::sqrt(scaled(1, 1)),
                                                 std::sqrt(scaled(2, 2)) };
}

FitResult
fit_logistic(const Series &series, const FitOptions &options) {
    return LogisticFitter(options).fit(series);
}

} // namespace growth_fit
