#ifndef SERIES_BUILDER_HPP
#define SERIES_BUILDER_HPP

#include "growth_data.hpp"
#include <istream>
#include <string>
#include <vector>

namespace growth_fit {

/**
 * @brief One row of a tidy (long-form) growth table.
 */
struct TidyRow {
    GroupKey key;
    double time = 0.0;
    double density = 0.0; ///< NaN when the measurement is missing.
};

/**
 * @brief Column names looked up in the CSV header.
 */
struct TidyColumns {
    std::string organism = "organism";
    std::string experiment = "experiment";
    std::string replicate = "replicate";
    std::string time = "time";
    std::string density = "density";
};

/**
 * @brief Splits tidy rows into per-group series ordered by time.
 *
 * Sorting is stable, so rows sharing a timestamp keep their input order.
 * @throws std::invalid_argument On non-finite or negative time, or negative density.
 */
GroupedSeries
build_grouped_series(const std::vector<TidyRow> &rows);

/**
 * @brief Parses a long-form CSV table with a header row.
 *
 * Empty, "NA" and "NaN" density cells become missing values. Extra columns are ignored.
 * @throws std::runtime_error If a required column is absent or a row cannot be parsed.
 */
std::vector<TidyRow>
read_tidy_csv(std::istream &input, const TidyColumns &columns = TidyColumns());

/**
 * @brief Opens the file and forwards to read_tidy_csv(std::istream&).
 * @throws std::runtime_error If the file cannot be opened.
 */
std::vector<TidyRow>
read_tidy_csv(const std::string &path, const TidyColumns &columns = TidyColumns());

} // namespace growth_fit

#endif // SERIES_BUILDER_HPP
