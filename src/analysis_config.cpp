#include "analysis_config.hpp"
#include <cstddef>
#include <fstream>
#include <iostream>
#include <set>
#include <stdexcept>

namespace growth_fit {

namespace {

void
warn_unknown_keys(const nlohmann::json &section, const std::string &section_name, const std::set<std::string> &known) {
    for (auto it = section.begin(); it != section.end(); ++it) {
        if (!known.count(it.key())) {
            std::cerr << "Warning: ignoring unknown config key '" << section_name << it.key() << "'." << std::endl;
        }
    }
}

// Copies section[key] into target when present, converting nlohmann type errors.
template<typename T>
void
read_value(const nlohmann::json &section, const std::string &section_name, const char *key, T &target) {
    auto it = section.find(key);
    if (it == section.end()) { return; }
    try {
        target = it->template get<T>();
    } catch (const nlohmann::json::exception &e) {
        throw std::runtime_error("Config key '" + section_name + key + "' has the wrong type: " + e.what());
    }
}

// Counts and thread numbers: nlohmann would wrap a negative integer around, so demand an
// unsigned JSON integer.
void
read_value(const nlohmann::json &section, const std::string &section_name, const char *key, std::size_t &target) {
    auto it = section.find(key);
    if (it == section.end()) { return; }
    if (!it->is_number_unsigned()) {
        throw std::runtime_error("Config key '" + section_name + key + "' must be a non-negative integer, got " +
                                 it->dump() + ".");
    }
    target = it->get<std::size_t>();
}

const nlohmann::json *
find_section(const nlohmann::json &config, const char *name) {
    auto it = config.find(name);
    if (it == config.end()) { return nullptr; }
    if (!it->is_object()) { throw std::runtime_error(std::string("Config section '") + name + "' must be an object."); }
    return &(*it);
}

} // namespace

void
validate(const AnalysisOptions &options) {
    validate(options.death_phase);
    validate(options.fit);
}

AnalysisOptions
parse_analysis_options(const nlohmann::json &config) {
    if (!config.is_object()) { throw std::runtime_error("Config document must be a JSON object."); }
    warn_unknown_keys(config, "", { "death_phase", "fit", "batch" });

    AnalysisOptions options;

    if (const nlohmann::json *section = find_section(config, "death_phase")) {
        const std::string prefix = "death_phase.";
        warn_unknown_keys(*section, prefix, { "relative_tolerance", "min_decline_points" });
        read_value(*section, prefix, "relative_tolerance", options.death_phase.relative_tolerance);
        read_value(*section, prefix, "min_decline_points", options.death_phase.min_decline_points);
    }

    if (const nlohmann::json *section = find_section(config, "fit")) {
        const std::string prefix = "fit.";
        warn_unknown_keys(*section,
                          prefix,
                          { "min_observations",
                            "positive_floor",
                            "capacity_scale",
                            "max_iterations",
                            "max_solver_time_seconds",
                            "function_tolerance",
                            "gradient_tolerance",
                            "parameter_tolerance",
                            "compute_covariance",
                            "verbose" });
        FitOptions &fit = options.fit;
        read_value(*section, prefix, "min_observations", fit.min_observations);
        read_value(*section, prefix, "positive_floor", fit.positive_floor);
        read_value(*section, prefix, "capacity_scale", fit.capacity_scale);
        read_value(*section, prefix, "max_iterations", fit.max_iterations);
        read_value(*section, prefix, "max_solver_time_seconds", fit.max_solver_time_seconds);
        read_value(*section, prefix, "function_tolerance", fit.function_tolerance);
        read_value(*section, prefix, "gradient_tolerance", fit.gradient_tolerance);
        read_value(*section, prefix, "parameter_tolerance", fit.parameter_tolerance);
        read_value(*section, prefix, "compute_covariance", fit.compute_covariance);
        read_value(*section, prefix, "verbose", fit.verbose);
    }

    if (const nlohmann::json *section = find_section(config, "batch")) {
        const std::string prefix = "batch.";
        warn_unknown_keys(*section, prefix, { "num_threads", "verbose" });
        read_value(*section, prefix, "num_threads", options.num_threads);
        read_value(*section, prefix, "verbose", options.verbose);
    }

    validate(options);
    return options;
}

AnalysisOptions
load_analysis_options(const std::string &path) {
    std::ifstream file(path);
    if (!file.is_open()) { throw std::runtime_error("Cannot open config file: " + path); }

    nlohmann::json config;
    try {
        config = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error &e) {
        throw std::runtime_error("Config file " + path + " is not valid JSON: " + e.what());
    }
    return parse_analysis_options(config);
}

nlohmann::json
to_json(const AnalysisOptions &options) {
    nlohmann::json config;
    config["death_phase"] = { { "relative_tolerance", options.death_phase.relative_tolerance },
                              { "min_decline_points", options.death_phase.min_decline_points } };
    config["fit"] = { { "min_observations", options.fit.min_observations },
                      { "positive_floor", options.fit.positive_floor },
                      { "capacity_scale", options.fit.capacity_scale },
                      { "max_iterations", options.fit.max_iterations },
                      { "max_solver_time_seconds", options.fit.max_solver_time_seconds },
                      { "function_tolerance", options.fit.function_tolerance },
                      { "gradient_tolerance", options.fit.gradient_tolerance },
                      { "parameter_tolerance", options.fit.parameter_tolerance },
                      { "compute_covariance", options.fit.compute_covariance },
                      { "verbose", options.fit.verbose } };
    config["batch"] = { { "num_threads", options.num_threads }, { "verbose", options.verbose } };
    return config;
}

} // namespace growth_fit
