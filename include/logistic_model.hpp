#ifndef LOGISTIC_MODEL_HPP
#define LOGISTIC_MODEL_HPP

#include <cmath> // For exp

namespace growth_fit {

/**
 * @brief Parameters of the three-parameter logistic growth law.
 */
struct LogisticParameters {
    double r = 0.0;  ///< Intrinsic growth rate (1 / time unit of the data).
    double K = 0.0;  ///< Carrying capacity (density units).
    double N0 = 0.0; ///< Density at t = 0 (density units).
};

/**
 * @brief Logistic growth law N(t) = K*N0*exp(r*t) / (K + N0*(exp(r*t) - 1)).
 *
 * Evaluated as K*N0 / (N0 + (K - N0)*exp(-r*t)), which is the same function but does not
 * overflow for large r*t. Templated so Ceres can evaluate it with Jet types; the
 * unqualified exp() picks up the Jet overload through ADL.
 */
template<typename T>
T
logistic_density(double t, const T &r, const T &K, const T &N0) {
    using std::exp;
    return K * N0 / (N0 + (K - N0) * exp(-r * T(t)));
}

inline double
logistic_density(double t, const LogisticParameters &params) {
    return logistic_density<double>(t, params.r, params.K, params.N0);
}

} // namespace growth_fit

#endif // LOGISTIC_MODEL_HPP
