#ifndef REPORT_WRITER_HPP
#define REPORT_WRITER_HPP

#include "growth_analysis.hpp"
#include <fstream>
#include <nlohmann/json.hpp>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace growth_fit {

/**
 * @brief Output formatting knobs shared by the table writers.
 */
struct ReportOptions {
    /// Multiplies r and its standard error on output only, e.g. 24 to report a fit made on
    /// hourly data as a per-day rate. The fitted values themselves are never changed.
    double rate_scale = 1.0;
    std::string missing_marker = "NA";
};

/// Writes organism,experiment,replicate,time,density,death_phase
void
write_annotated_series_csv(std::ostream &os, const BatchResult &batch, const ReportOptions &options = ReportOptions());

/**
 * @brief Writes one row per group, failed groups included.
 *
 * Failed rows carry the failure status and the missing marker in every numeric column.
 */
void
write_fit_table_csv(std::ostream &os, const BatchResult &batch, const ReportOptions &options = ReportOptions());

/// Writes organism,experiment,replicate,time,predicted_density
void
write_curve_csv(std::ostream &os, const std::vector<CurveRow> &rows);

/**
 * @brief JSON array with one object per group; missing values are null.
 */
nlohmann::json
fit_summary_json(const BatchResult &batch, const ReportOptions &options = ReportOptions());

/**
 * @brief Opens path for writing and calls writer(stream).
 * @throws std::runtime_error If the file cannot be opened or the write fails.
 */
template<typename Writer>
void
write_report_file(const std::string &path, Writer &&writer) {
    std::ofstream file(path);
    if (!file.is_open()) { throw std::runtime_error("Cannot open output file: " + path); }
    writer(file);
    file.flush();
    if (!file) { throw std::runtime_error("Failed while writing output file: " + path); }
}

} // namespace growth_fit

#endif // REPORT_WRITER_HPP
