#include "analysis_config.hpp"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <stdexcept>

using growth_fit::AnalysisOptions;
using growth_fit::parse_analysis_options;
using json = nlohmann::json;

TEST(AnalysisConfigTest, EmptyDocumentGivesDefaults) {
    AnalysisOptions options = parse_analysis_options(json::object());
    EXPECT_DOUBLE_EQ(options.death_phase.relative_tolerance, 0.0);
    EXPECT_EQ(options.death_phase.min_decline_points, 1u);
    EXPECT_EQ(options.fit.min_observations, 3u);
    EXPECT_DOUBLE_EQ(options.fit.capacity_scale, 1.05);
    EXPECT_EQ(options.fit.max_iterations, 200);
    EXPECT_TRUE(options.fit.compute_covariance);
    EXPECT_EQ(options.num_threads, 1u);
    EXPECT_FALSE(options.verbose);
}

TEST(AnalysisConfigTest, PartialDocumentOverridesOnlyGivenKeys) {
    json config = json::parse(R"({
        "death_phase": { "relative_tolerance": 0.02 },
        "fit": { "max_iterations": 50, "compute_covariance": false },
        "batch": { "num_threads": 4 },
        "comment": "unknown keys are ignored"
    })");

    AnalysisOptions options = parse_analysis_options(config);
    EXPECT_DOUBLE_EQ(options.death_phase.relative_tolerance, 0.02);
    EXPECT_EQ(options.death_phase.min_decline_points, 1u);
    EXPECT_EQ(options.fit.max_iterations, 50);
    EXPECT_FALSE(options.fit.compute_covariance);
    EXPECT_DOUBLE_EQ(options.fit.positive_floor, 1e-6);
    EXPECT_EQ(options.num_threads, 4u);
}

TEST(AnalysisConfigTest, WrongTypesThrowRuntimeError) {
    EXPECT_THROW(parse_analysis_options(json::parse(R"({ "fit": { "max_iterations": "many" } })")),
                 std::runtime_error);
    EXPECT_THROW(parse_analysis_options(json::parse(R"({ "death_phase": 3 })")), std::runtime_error);
    EXPECT_THROW(parse_analysis_options(json::array()), std::runtime_error);
}

TEST(AnalysisConfigTest, CountsMustBeNonNegativeIntegers) {
    // A negative count must not wrap around into a huge value that passes validation.
    EXPECT_THROW(parse_analysis_options(json::parse(R"({ "death_phase": { "min_decline_points": -1 } })")),
                 std::runtime_error);
    EXPECT_THROW(parse_analysis_options(json::parse(R"({ "fit": { "min_observations": -3 } })")),
                 std::runtime_error);
    EXPECT_THROW(parse_analysis_options(json::parse(R"({ "batch": { "num_threads": -2 } })")), std::runtime_error);
    EXPECT_THROW(parse_analysis_options(json::parse(R"({ "batch": { "num_threads": 2.5 } })")), std::runtime_error);

    AnalysisOptions options = parse_analysis_options(
      json::parse(R"({ "death_phase": { "min_decline_points": 2 }, "batch": { "num_threads": 0 } })"));
    EXPECT_EQ(options.death_phase.min_decline_points, 2u);
    EXPECT_EQ(options.num_threads, 0u);
}

TEST(AnalysisConfigTest, OutOfRangeValuesThrowInvalidArgument) {
    EXPECT_THROW(parse_analysis_options(json::parse(R"({ "death_phase": { "relative_tolerance": 1.5 } })")),
                 std::invalid_argument);
    EXPECT_THROW(parse_analysis_options(json::parse(R"({ "fit": { "min_observations": 2 } })")),
                 std::invalid_argument);
    EXPECT_THROW(parse_analysis_options(json::parse(R"({ "fit": { "positive_floor": -1.0 } })")),
                 std::invalid_argument);
}

TEST(AnalysisConfigTest, SerializedOptionsParseBackUnchanged) {
    AnalysisOptions options;
    options.death_phase.relative_tolerance = 0.1;
    options.death_phase.min_decline_points = 3;
    options.fit.max_iterations = 77;
    options.fit.capacity_scale = 1.2;
    options.num_threads = 0;
    options.verbose = true;

    AnalysisOptions parsed = parse_analysis_options(growth_fit::to_json(options));
    EXPECT_DOUBLE_EQ(parsed.death_phase.relative_tolerance, 0.1);
    EXPECT_EQ(parsed.death_phase.min_decline_points, 3u);
    EXPECT_EQ(parsed.fit.max_iterations, 77);
    EXPECT_DOUBLE_EQ(parsed.fit.capacity_scale, 1.2);
    EXPECT_EQ(parsed.num_threads, 0u);
    EXPECT_TRUE(parsed.verbose);
}

TEST(AnalysisConfigTest, MissingFileThrows) {
    EXPECT_THROW(growth_fit::load_analysis_options("/nonexistent/growth_fit.json"), std::runtime_error);
}
