// Command-line driver: tidy CSV in, annotated series / fit table / fitted curves out.

#include "analysis_config.hpp"
#include "growth_analysis.hpp"
#include "report_writer.hpp"
#include "series_builder.hpp"
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

struct CommandLine {
    std::string input_path;
    std::string config_path;
    std::string out_dir = ".";
    long threads = -1; // -1: keep the configured value
    std::size_t curve_points = 200;
    double rate_scale = 1.0;
    bool quiet = false;
};

void
print_usage(const char *program) {
    std::cerr << "Usage: " << program << " <input.csv> [--config <file.json>] [--out-dir <dir>]\n"
              << "       [--threads <n>] [--curve-points <n>] [--rate-scale <factor>] [--quiet]\n"
              << "\n"
              << "input.csv needs the columns organism, experiment, replicate, time, density.\n"
              << "Writes annotated_series.csv, fit_table.csv, fit_summary.json and fitted_curves.csv.\n";
}

std::string
require_value(int argc, char **argv, int &i) {
    if (i + 1 >= argc) { throw std::invalid_argument(std::string("Missing value for ") + argv[i]); }
    return argv[++i];
}

CommandLine
parse_command_line(int argc, char **argv) {
    CommandLine cmd;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config") {
            cmd.config_path = require_value(argc, argv, i);
        } else if (arg == "--out-dir") {
            cmd.out_dir = require_value(argc, argv, i);
        } else if (arg == "--threads") {
            cmd.threads = std::stol(require_value(argc, argv, i));
            if (cmd.threads < 0) { throw std::invalid_argument("--threads must be >= 0"); }
        } else if (arg == "--curve-points") {
            const long points = std::stol(require_value(argc, argv, i));
            if (points < 1) { throw std::invalid_argument("--curve-points must be >= 1"); }
            cmd.curve_points = static_cast<std::size_t>(points);
        } else if (arg == "--rate-scale") {
            cmd.rate_scale = std::stod(require_value(argc, argv, i));
            if (!(cmd.rate_scale > 0.0)) { throw std::invalid_argument("--rate-scale must be positive"); }
        } else if (arg == "--quiet") {
            cmd.quiet = true;
        } else if (!arg.empty() && arg[0] == '-') {
            throw std::invalid_argument("Unknown option: " + arg);
        } else if (cmd.input_path.empty()) {
            cmd.input_path = arg;
        } else {
            throw std::invalid_argument("Unexpected argument: " + arg);
        }
    }
    if (cmd.input_path.empty()) { throw std::invalid_argument("No input CSV given."); }
    return cmd;
}

} // namespace

int
main(int argc, char **argv) {
    CommandLine cmd;
    try {
        cmd = parse_command_line(argc, argv);
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << '\n';
        print_usage(argv[0]);
        return 1;
    }

    try {
        growth_fit::AnalysisOptions options;
        if (!cmd.config_path.empty()) { options = growth_fit::load_analysis_options(cmd.config_path); }
        if (cmd.threads >= 0) { options.num_threads = static_cast<std::size_t>(cmd.threads); }
        options.verbose = !cmd.quiet;

        if (!cmd.quiet) { std::cout << "Reading " << cmd.input_path << "..." << '\n'; }
        const std::vector<growth_fit::TidyRow> rows = growth_fit::read_tidy_csv(cmd.input_path);
        const growth_fit::GroupedSeries groups = growth_fit::build_grouped_series(rows);
        if (!cmd.quiet) { std::cout << "Loaded " << rows.size() << " rows in " << groups.size() << " group(s)." << '\n'; }

        const growth_fit::BatchResult batch = growth_fit::analyze_groups(groups, options);

        growth_fit::ReportOptions report_options;
        report_options.rate_scale = cmd.rate_scale;
        const std::string prefix = cmd.out_dir + "/";

        growth_fit::write_report_file(prefix + "annotated_series.csv", [&](std::ostream &os) {
            growth_fit::write_annotated_series_csv(os, batch, report_options);
        });
        growth_fit::write_report_file(prefix + "fit_table.csv", [&](std::ostream &os) {
            growth_fit::write_fit_table_csv(os, batch, report_options);
        });
        growth_fit::write_report_file(prefix + "fit_summary.json", [&](std::ostream &os) {
            os << growth_fit::fit_summary_json(batch, report_options).dump(2) << '\n';
        });
        const std::vector<growth_fit::CurveRow> curves =
          growth_fit::sample_fitted_curves_over_data(batch, cmd.curve_points);
        growth_fit::write_report_file(prefix + "fitted_curves.csv",
                                      [&](std::ostream &os) { growth_fit::write_curve_csv(os, curves); });

        if (!cmd.quiet) { std::cout << "Wrote results to " << cmd.out_dir << '\n'; }
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }

    return 0;
}
