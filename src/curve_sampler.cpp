#include "curve_sampler.hpp"
#include <algorithm> // For std::max, std::min
#include <cmath>
#include <stdexcept>
#include <string>

namespace growth_fit {

namespace {

void
check_sampling_request(const FitResult &fit, double t_min, double t_max) {
    if (!fit.converged()) {
        throw std::invalid_argument("Cannot sample a curve from a fit with status '" + to_string(fit.status) + "'.");
    }
    if (!std::isfinite(t_min) || !std::isfinite(t_max)) {
        throw std::invalid_argument("Curve sampling bounds must be finite.");
    }
    if (t_min > t_max) {
        throw std::invalid_argument("Curve sampling requires t_min <= t_max (got " + std::to_string(t_min) + " > " +
                                    std::to_string(t_max) + ").");
    }
}

} // namespace

ReconstructedCurve::ReconstructedCurve(const LogisticParameters &params,
                                       double t_min,
                                       double spacing,
                                       std::size_t num_points,
                                       double t_max)
  : params_(params)
  , t_min_(t_min)
  , spacing_(spacing)
  , num_points_(num_points)
  , t_max_(t_max) {}

CurvePoint
ReconstructedCurve::at(std::size_t i) const {
    if (i >= num_points_) {
        throw std::out_of_range("Curve sample index " + std::to_string(i) + " out of range (size " +
                                std::to_string(num_points_) + ").");
    }
    double t = t_min_;
    if (num_points_ > 1 && i + 1 == num_points_) {
        t = t_max_;
    } else if (std::isfinite(spacing_)) {
        t = t_min_ + static_cast<double>(i) * spacing_;
    } else {
        // The domain width overflows a double; interpolate between the two bounds instead.
        const double fraction = static_cast<double>(i) / static_cast<double>(num_points_ - 1);
        t = t_min_ * (1.0 - fraction) + t_max_ * fraction;
    }
    return { t, logistic_density(t, params_) };
}

std::vector<CurvePoint>
ReconstructedCurve::to_vector() const {
    return std::vector<CurvePoint>(begin(), end());
}

ReconstructedCurve
sample_curve(const FitResult &fit, double t_min, double t_max, std::size_t num_points) {
    check_sampling_request(fit, t_min, t_max);
    if (num_points == 0) { throw std::invalid_argument("Curve sampling requires at least one point."); }

    const double spacing = num_points > 1 ? (t_max - t_min) / static_cast<double>(num_points - 1) : 0.0;
    return ReconstructedCurve(fit.parameters, t_min, spacing, num_points, num_points > 1 ? t_max : t_min);
}

ReconstructedCurve
sample_curve_with_step(const FitResult &fit, double t_min, double t_max, double step) {
    check_sampling_request(fit, t_min, t_max);
    if (!std::isfinite(step) || step <= 0.0) {
        throw std::invalid_argument("Curve sampling step must be positive and finite.");
    }

    // Allow the last step to land on t_max despite rounding in (t_max - t_min) / step.
    const double span = (t_max - t_min) / step;
    if (!std::isfinite(span) || span >= static_cast<double>(max_curve_points)) {
        throw std::invalid_argument("Curve sampling step " + std::to_string(step) + " yields more than " +
                                    std::to_string(max_curve_points) + " points.");
    }
    const auto num_points = static_cast<std::size_t>(std::floor(span + 1e-9 * std::max(1.0, span))) + 1;
    const double last = t_min + static_cast<double>(num_points - 1) * step;
    return ReconstructedCurve(fit.parameters, t_min, step, num_points, std::min(last, t_max));
}

} // namespace growth_fit
