#include "series_builder.hpp"
#include "report_writer.hpp"
#include <cmath>
#include <gtest/gtest.h>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <vector>

using growth_fit::build_grouped_series;
using growth_fit::GroupedSeries;
using growth_fit::GroupKey;
using growth_fit::read_tidy_csv;
using growth_fit::TidyRow;

TEST(SeriesBuilderTest, GroupsRowsByKeyAndSortsByTime) {
    const GroupKey a("ecoli", "exp1", "r1");
    const GroupKey b("ecoli", "exp1", "r2");
    std::vector<TidyRow> rows = { { a, 2.0, 0.3 }, { b, 0.0, 0.05 }, { a, 0.0, 0.1 }, { a, 1.0, 0.2 } };

    GroupedSeries grouped = build_grouped_series(rows);
    ASSERT_EQ(grouped.size(), 2u);
    ASSERT_EQ(grouped.at(a).size(), 3u);
    EXPECT_DOUBLE_EQ(grouped.at(a)[0].time, 0.0);
    EXPECT_DOUBLE_EQ(grouped.at(a)[1].time, 1.0);
    EXPECT_DOUBLE_EQ(grouped.at(a)[2].time, 2.0);
    EXPECT_DOUBLE_EQ(grouped.at(a)[2].density, 0.3);
    ASSERT_EQ(grouped.at(b).size(), 1u);

    // Map order follows the key ordering, not input order.
    EXPECT_EQ(grouped.begin()->first, a);
}

TEST(SeriesBuilderTest, DuplicateTimestampsKeepInputOrder) {
    const GroupKey key("yeast", "e", "1");
    std::vector<TidyRow> rows = { { key, 1.0, 0.4 }, { key, 0.0, 0.1 }, { key, 1.0, 0.5 }, { key, 1.0, 0.45 } };

    const auto series = build_grouped_series(rows).at(key);
    ASSERT_EQ(series.size(), 4u);
    EXPECT_DOUBLE_EQ(series[1].density, 0.4);
    EXPECT_DOUBLE_EQ(series[2].density, 0.5);
    EXPECT_DOUBLE_EQ(series[3].density, 0.45);
}

TEST(SeriesBuilderTest, RejectsInvalidTimesAndDensities) {
    const GroupKey key("o", "e", "r");
    EXPECT_THROW(build_grouped_series({ { key, -1.0, 0.1 } }), std::invalid_argument);
    EXPECT_THROW(build_grouped_series({ { key, std::numeric_limits<double>::infinity(), 0.1 } }),
                 std::invalid_argument);
    EXPECT_THROW(build_grouped_series({ { key, 1.0, -0.2 } }), std::invalid_argument);

    // Missing densities are kept.
    auto grouped = build_grouped_series({ { key, 1.0, std::numeric_limits<double>::quiet_NaN() } });
    ASSERT_EQ(grouped.at(key).size(), 1u);
    EXPECT_FALSE(grouped.at(key)[0].has_density());
}

TEST(SeriesBuilderTest, ReadsTidyCsvWithMissingValues) {
    std::istringstream input("organism,experiment,replicate,time,density,plate\n"
                             "ecoli,exp1,r1,0,0.05,p1\n"
                             "ecoli,exp1,r1,1,NA,p1\n"
                             "\n"
                             "ecoli,exp1,r1,2,,p1\n"
                             "\"ecoli\", exp1 ,r2,0.5,1e-2,p2\n");

    std::vector<TidyRow> rows = read_tidy_csv(input);
    ASSERT_EQ(rows.size(), 4u);
    EXPECT_EQ(rows[0].key, GroupKey("ecoli", "exp1", "r1"));
    EXPECT_DOUBLE_EQ(rows[0].density, 0.05);
    EXPECT_TRUE(std::isnan(rows[1].density));
    EXPECT_TRUE(std::isnan(rows[2].density));
    EXPECT_DOUBLE_EQ(rows[2].time, 2.0);
    EXPECT_EQ(rows[3].key, GroupKey("ecoli", "exp1", "r2"));
    EXPECT_DOUBLE_EQ(rows[3].density, 0.01);
}

TEST(SeriesBuilderTest, CustomColumnNames) {
    growth_fit::TidyColumns columns;
    columns.time = "hours";
    columns.density = "od600";
    std::istringstream input("od600,hours,replicate,experiment,organism\n0.2,3,a,b,c\n");

    std::vector<TidyRow> rows = read_tidy_csv(input, columns);
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].key, GroupKey("c", "b", "a"));
    EXPECT_DOUBLE_EQ(rows[0].time, 3.0);
    EXPECT_DOUBLE_EQ(rows[0].density, 0.2);
}

TEST(SeriesBuilderTest, MalformedCsvThrows) {
    std::istringstream empty("");
    EXPECT_THROW(read_tidy_csv(empty), std::runtime_error);

    std::istringstream missing_column("organism,experiment,time,density\nx,y,0,0.1\n");
    EXPECT_THROW(read_tidy_csv(missing_column), std::runtime_error);

    std::istringstream bad_number("organism,experiment,replicate,time,density\nx,y,z,0,0.1abc\n");
    EXPECT_THROW(read_tidy_csv(bad_number), std::runtime_error);

    std::istringstream missing_time("organism,experiment,replicate,time,density\nx,y,z,NA,0.1\n");
    EXPECT_THROW(read_tidy_csv(missing_time), std::runtime_error);

    std::istringstream short_row("organism,experiment,replicate,time,density\nx,y,z,0\n");
    EXPECT_THROW(read_tidy_csv(short_row), std::runtime_error);

    // Extra cells would shift every later column, so they are rejected too.
    std::istringstream long_row("organism,experiment,replicate,time,density\na,b,c,1,0.5,extra,9\n");
    EXPECT_THROW(read_tidy_csv(long_row), std::runtime_error);

    // An unquoted comma inside a name splits it into an extra cell.
    std::istringstream unquoted_comma("organism,experiment,replicate,time,density\nA, B,E,1,2,0.5\n");
    EXPECT_THROW(read_tidy_csv(unquoted_comma), std::runtime_error);

    std::istringstream unterminated("organism,experiment,replicate,time,density\n\"A,B,E,1,0.5\n");
    EXPECT_THROW(read_tidy_csv(unterminated), std::runtime_error);

    EXPECT_THROW(read_tidy_csv(std::string("/nonexistent/growth_table.csv")), std::runtime_error);
}

TEST(SeriesBuilderTest, QuotedFieldsKeepCommasAndQuotes) {
    std::istringstream input("organism,experiment,replicate,time,density\n"
                             "\"S. acidocaldarius, DSM639\",exp1,r1,2,0.5\n"
                             "\"strain \"\"wild\"\"\", \"exp,2\" ,r1,3,0.6\n");

    std::vector<TidyRow> rows = read_tidy_csv(input);
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].key, GroupKey("S. acidocaldarius, DSM639", "exp1", "r1"));
    EXPECT_DOUBLE_EQ(rows[0].time, 2.0);
    EXPECT_DOUBLE_EQ(rows[0].density, 0.5);
    EXPECT_EQ(rows[1].key, GroupKey("strain \"wild\"", "exp,2", "r1"));
    EXPECT_DOUBLE_EQ(rows[1].time, 3.0);
}

TEST(SeriesBuilderTest, ReadsBackAnnotatedSeriesWrittenByReportWriter) {
    const GroupKey tricky("S. acidocaldarius, DSM639", "exp \"A\"", "r1");
    const GroupKey plain("ecoli", "exp1", "r2");

    growth_fit::BatchResult batch;
    batch[tricky].annotated = { { { 0.0, 0.05 }, false }, { { 1.5, 0.125 }, false }, { { 3.0, 0.1 }, true } };
    batch[plain].annotated = { { { 0.25, std::numeric_limits<double>::quiet_NaN() }, false },
                               { { 0.75, 0.3 }, false } };

    std::stringstream csv;
    growth_fit::write_annotated_series_csv(csv, batch);

    std::vector<TidyRow> rows = read_tidy_csv(csv);
    ASSERT_EQ(rows.size(), 5u);
    const GroupedSeries grouped = build_grouped_series(rows);
    ASSERT_EQ(grouped.size(), 2u);

    for (const auto &pair : batch) {
        ASSERT_EQ(grouped.count(pair.first), 1u) << pair.first;
        const auto &series = grouped.at(pair.first);
        ASSERT_EQ(series.size(), pair.second.annotated.size());
        for (std::size_t i = 0; i < series.size(); ++i) {
            const auto &expected = pair.second.annotated[i].observation;
            EXPECT_EQ(series[i].time, expected.time);
            if (expected.has_density()) {
                EXPECT_EQ(series[i].density, expected.density);
            } else {
                EXPECT_FALSE(series[i].has_density());
            }
        }
    }
}
