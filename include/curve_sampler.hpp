#ifndef CURVE_SAMPLER_HPP
#define CURVE_SAMPLER_HPP

#include "logistic_fitter.hpp"
#include "logistic_model.hpp"
#include <cstddef>
#include <iterator>
#include <vector>

namespace growth_fit {

/// Upper bound on the number of points sample_curve_with_step may produce.
constexpr std::size_t max_curve_points = 100000000;

struct CurvePoint {
    double time = 0.0;
    double density = 0.0; ///< Model prediction N(time).
};

/**
 * @brief Evenly spaced samples of a fitted logistic curve.
 *
 * A lightweight range: it stores only the parameters and the sampling grid, and every
 * iteration recomputes the points from the closed-form model. Iterating twice yields
 * identical points. The domain is not clamped to the fitted data, so extrapolation is the
 * caller's choice.
 */
class ReconstructedCurve {
  public:
    class const_iterator {
      public:
        using iterator_category = std::input_iterator_tag;
        using value_type = CurvePoint;
        using difference_type = std::ptrdiff_t;
        using pointer = const CurvePoint *;
        using reference = CurvePoint;

        const_iterator() = default;

        CurvePoint operator*() const { return curve_->at(index_); }

        const_iterator &operator++() {
            ++index_;
            return *this;
        }

        const_iterator operator++(int) {
            const_iterator previous = *this;
            ++index_;
            return previous;
        }

        bool operator==(const const_iterator &other) const { return curve_ == other.curve_ && index_ == other.index_; }
        bool operator!=(const const_iterator &other) const { return !(*this == other); }

      private:
        friend class ReconstructedCurve;
        const_iterator(const ReconstructedCurve *curve, std::size_t index)
          : curve_(curve)
          , index_(index) {}

        const ReconstructedCurve *curve_ = nullptr;
        std::size_t index_ = 0;
    };

    /**
     * @param params Fitted parameters.
     * @param t_min First sample time.
     * @param spacing Distance between consecutive samples (0 allowed for a single point).
     * @param num_points Number of samples.
     * @param t_max Exact time of the last sample, used to avoid accumulated rounding.
     */
    ReconstructedCurve(const LogisticParameters &params,
                       double t_min,
                       double spacing,
                       std::size_t num_points,
                       double t_max);

    const_iterator begin() const { return const_iterator(this, 0); }
    const_iterator end() const { return const_iterator(this, num_points_); }

    std::size_t size() const { return num_points_; }
    bool empty() const { return num_points_ == 0; }

    /// Sample i, computed on demand.
    CurvePoint at(std::size_t i) const;

    const LogisticParameters &parameters() const { return params_; }

    /// Materializes every sample.
    std::vector<CurvePoint> to_vector() const;

  private:
    LogisticParameters params_;
    double t_min_;
    double spacing_;
    std::size_t num_points_;
    double t_max_;
};

/**
 * @brief Samples a converged fit at num_points evenly spaced times on [t_min, t_max].
 *
 * The first sample is exactly t_min and the last exactly t_max. A single point is
 * placed at t_min.
 * @throws std::invalid_argument If the fit did not converge, num_points is 0, a bound is
 *         not finite or t_min > t_max.
 */
ReconstructedCurve
sample_curve(const FitResult &fit, double t_min, double t_max, std::size_t num_points);

/**
 * @brief Samples a converged fit at t_min, t_min + step, ... up to t_max.
 * @throws std::invalid_argument As sample_curve, or if step is not positive and finite, or
 *         if the grid would exceed max_curve_points.
 */
ReconstructedCurve
sample_curve_with_step(const FitResult &fit, double t_min, double t_max, double step);

} // namespace growth_fit

#endif // CURVE_SAMPLER_HPP
