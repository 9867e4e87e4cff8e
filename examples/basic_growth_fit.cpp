#include "growth_fit.hpp"
#include <cmath>
#include <iostream>
#include <vector>

int
main() {
    std::cout << "--- Basic Logistic Growth Fit Example ---" << '\n';

    // --- 1. Generate a synthetic growth curve with a decline at the end ---
    growth_fit::LogisticParameters const truth{ 0.45, 1.2, 0.02 };
    growth_fit::Series series;

    std::cout << "Generating data with r=" << truth.r << ", K=" << truth.K << ", N0=" << truth.N0 << '\n';
    std::cout << "Time\tDensity" << '\n';
    for (int i = 0; i <= 16; ++i) {
        double const t = 1.5 * i;
        double density = growth_fit::logistic_density(t, truth);
        // Last three readings decline: the culture is dying off.
        if (i >= 14) { density *= 1.0 - 0.08 * (i - 13); }
        series.emplace_back(t, density);
        std::cout << t << "\t" << density << '\n';
    }
    std::cout << '\n';

    // --- 2. Flag and drop the death phase ---
    auto const annotated = growth_fit::annotate_death_phase(series);
    for (const auto &row : annotated) {
        if (row.death_phase) { std::cout << "Death phase at t=" << row.observation.time << '\n'; }
    }
    growth_fit::Series const usable = growth_fit::fittable_observations(annotated);

    // --- 3. Fit ---
    growth_fit::FitOptions options;
    options.verbose = true;
    growth_fit::LogisticFitter const fitter(options);
    growth_fit::FitResult const fit = fitter.fit(usable);

    if (!fit.converged()) {
        std::cout << "\nFit failed (" << growth_fit::to_string(fit.status) << "): " << fit.reason << '\n';
        return 1;
    }

    std::cout << "\nFit successful!" << '\n';
    std::cout << "Estimated r = " << fit.parameters.r << " (true " << truth.r << ")" << '\n';
    std::cout << "Estimated K = " << fit.parameters.K << " (true " << truth.K << ")" << '\n';
    std::cout << "Estimated N0 = " << fit.parameters.N0 << " (true " << truth.N0 << ")" << '\n';
    std::cout << "Doubling time = " << fit.doubling_time() << '\n';

    // --- 4. Reconstruct the fitted curve ---
    std::cout << "\nTime\tFitted density" << '\n';
    for (const auto &point : growth_fit::sample_curve(fit, 0.0, 24.0, 9)) {
        std::cout << point.time << "\t" << point.density << '\n';
    }

    return 0;
}
