#include "report_writer.hpp"
#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>
#include <utility> // For std::move

namespace growth_fit {

namespace {

std::string
csv_field(const std::string &value) {
    if (value.find_first_of(",\"\n") == std::string::npos) { return value; }
    std::string quoted = "\"";
    for (char c : value) {
        if (c == '"') { quoted += '"'; }
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

std::string
format_number(double value, const std::string &missing_marker) {
    if (!std::isfinite(value)) { return missing_marker; }
    std::ostringstream ss;
    ss << std::setprecision(std::numeric_limits<double>::max_digits10) << value;
    return ss.str();
}

void
write_key(std::ostream &os, const GroupKey &key) {
    os << csv_field(key.organism_id) << ',' << csv_field(key.experiment_id) << ',' << csv_field(key.replicate_id);
}

nlohmann::json
number_or_null(double value) {
    if (!std::isfinite(value)) { return nullptr; }
    return value;
}

} // namespace

void
write_annotated_series_csv(std::ostream &os, const BatchResult &batch, const ReportOptions &options) {
    os << "organism,experiment,replicate,time,density,death_phase\n";
    for (const auto &pair : batch) {
        for (const auto &row : pair.second.annotated) {
            write_key(os, pair.first);
            os << ',' << format_number(row.observation.time, options.missing_marker) << ','
               << format_number(row.observation.density, options.missing_marker) << ','
               << (row.death_phase ? "true" : "false") << '\n';
        }
    }
}

void
write_fit_table_csv(std::ostream &os, const BatchResult &batch, const ReportOptions &options) {
    const std::string &na = options.missing_marker;
    os << "organism,experiment,replicate,status,r,K,N0,r_se,K_se,N0_se,rmse,n_obs,iterations,reason\n";
    for (const auto &pair : batch) {
        const FitResult &fit = pair.second.fit;
        write_key(os, pair.first);
        os << ',' << to_string(fit.status);
        if (fit.converged()) {
            os << ',' << format_number(fit.parameters.r * options.rate_scale, na) << ','
               << format_number(fit.parameters.K, na) << ',' << format_number(fit.parameters.N0, na);
            if (fit.standard_errors) {
                os << ',' << format_number(fit.standard_errors->r * options.rate_scale, na) << ','
                   << format_number(fit.standard_errors->K, na) << ',' << format_number(fit.standard_errors->N0, na);
            } else {
                os << ',' << na << ',' << na << ',' << na;
            }
            os << ',' << format_number(fit.rmse, na);
        } else {
            for (int i = 0; i < 7; ++i) { os << ',' << na; }
        }
        os << ',' << fit.num_observations << ',' << fit.iterations << ',' << csv_field(fit.reason) << '\n';
    }
}

void
write_curve_csv(std::ostream &os, const std::vector<CurveRow> &rows) {
    os << "organism,experiment,replicate,time,predicted_density\n";
    for (const auto &row : rows) {
        write_key(os, row.key);
        os << ',' << format_number(row.point.time, "NA") << ',' << format_number(row.point.density, "NA") << '\n';
    }
}

nlohmann::json
fit_summary_json(const BatchResult &batch, const ReportOptions &options) {
    nlohmann::json summary = nlohmann::json::array();
    for (const auto &pair : batch) {
        const FitResult &fit = pair.second.fit;
        nlohmann::json entry;
        entry["organism"] = pair.first.organism_id;
        entry["experiment"] = pair.first.experiment_id;
        entry["replicate"] = pair.first.replicate_id;
        entry["status"] = to_string(fit.status);
        entry["n_obs"] = fit.num_observations;
        entry["iterations"] = fit.iterations;
        entry["reason"] = fit.reason;

        if (fit.converged()) {
            entry["r"] = number_or_null(fit.parameters.r * options.rate_scale);
            entry["K"] = number_or_null(fit.parameters.K);
            entry["N0"] = number_or_null(fit.parameters.N0);
            entry["rmse"] = number_or_null(fit.rmse);
            entry["doubling_time"] = number_or_null(fit.doubling_time() / options.rate_scale);
            entry["inflection_time"] = number_or_null(fit.inflection_time() / options.rate_scale);
        } else {
            for (const char *key : { "r", "K", "N0", "rmse", "doubling_time", "inflection_time" }) {
                entry[key] = nullptr;
            }
        }
        if (fit.converged() && fit.standard_errors) {
            entry["r_se"] = number_or_null(fit.standard_errors->r * options.rate_scale);
            entry["K_se"] = number_or_null(fit.standard_errors->K);
            entry["N0_se"] = number_or_null(fit.standard_errors->N0);
        } else {
            entry["r_se"] = nullptr;
            entry["K_se"] = nullptr;
            entry["N0_se"] = nullptr;
        }
        summary.push_back(std::move(entry));
    }
    return summary;
}

} // namespace growth_fit
