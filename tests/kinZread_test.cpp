#include <gtest/gtest.h>
#include <cmath>
#include <sstream>
#include "kinZread.hpp"
#include "kinZtime.hpp"
#include "kinZtest_util.hpp"

TEST(kinZread, parses_header_rows_and_blank_cells) {
    std::istringstream input(
        "# exported geometric model parameters\n"
        "time,height,orthoaxis1\n"
        "2021-10-28T00:00:00.000000,2.31,0.84\n"
        "\n"
        "2021-10-28T06:00:00.500000,2.75,\n"
        "2021-10-28T12:00:00, ,0.97\n");
    const ParameterTable table = parse_parameter_table(input, "inline");
    ASSERT_TRUE(table.success) << table.error_message;

    ASSERT_EQ(table.parameter_names.size(), 2u);
    EXPECT_EQ(table.parameter_names[0], "height");
    EXPECT_EQ(table.parameter_names[1], "orthoaxis1");
    ASSERT_EQ(table.times.size(), 3u);
    EXPECT_EQ(table.times[0], test_origin());
    EXPECT_EQ(format_timestamp(table.times[1]), "2021-10-28T06:00:00.500000");

    ASSERT_EQ(table.columns.size(), 2u);
    EXPECT_DOUBLE_EQ(table.columns[0][0], 2.31);
    EXPECT_DOUBLE_EQ(table.columns[0][1], 2.75);
    EXPECT_TRUE(std::isnan(table.columns[0][2]));
    EXPECT_DOUBLE_EQ(table.columns[1][0], 0.84);
    EXPECT_TRUE(std::isnan(table.columns[1][1]));
    EXPECT_DOUBLE_EQ(table.columns[1][2], 0.97);

    EXPECT_EQ(find_parameter(table, "orthoaxis1"), 1);
    EXPECT_EQ(find_parameter(table, "tilt"), -1);

    const SampleSeries height = series_for_parameter(table, 0);
    ASSERT_EQ(height.size(), 2u);
    EXPECT_EQ(height.times[1], table.times[1]);
    const SampleSeries axis = series_for_parameter(table, 1);
    ASSERT_EQ(axis.size(), 2u);
    EXPECT_EQ(axis.times[1], table.times[2]);
    EXPECT_TRUE(series_for_parameter(table, 5).empty());
}

TEST(kinZread, reports_line_of_the_error) {
    std::istringstream bad_number("time,height\n2021-10-28T00:00:00,2.3\n2021-10-28T01:00:00,abc\n");
    ParameterTable table = parse_parameter_table(bad_number, "t.csv");
    EXPECT_FALSE(table.success);
    EXPECT_EQ(table.error_message.rfind("t.csv:3:", 0), 0u) << table.error_message;

    std::istringstream bad_time("time,height\n2021-10-28 00:00,2.3\n");
    table = parse_parameter_table(bad_time, "t.csv");
    EXPECT_FALSE(table.success);
    EXPECT_EQ(table.error_message.rfind("t.csv:2:", 0), 0u) << table.error_message;

    std::istringstream wrong_count("time,height,tilt\n2021-10-28T00:00:00,2.3\n");
    table = parse_parameter_table(wrong_count, "t.csv");
    EXPECT_FALSE(table.success);
    EXPECT_TRUE(table.times.empty());
}

TEST(kinZread, rejects_bad_headers) {
    std::istringstream no_time("height,tilt\n");
    EXPECT_FALSE(parse_parameter_table(no_time, "t.csv").success);

    std::istringstream duplicate("time,height,height\n");
    EXPECT_FALSE(parse_parameter_table(duplicate, "t.csv").success);

    std::istringstream empty_name("time,,height\n");
    EXPECT_FALSE(parse_parameter_table(empty_name, "t.csv").success);

    std::istringstream only_comments("# nothing here\n\n");
    EXPECT_FALSE(parse_parameter_table(only_comments, "t.csv").success);
}

TEST(kinZread, make_sample_series_drops_missing_values) {
    const std::vector<TimePoint> times = times_at_days({0.0, 0.1, 0.2, 0.3});
    const SampleSeries series = make_sample_series(times, {1.0, std::nan(""), 3.0, 4.0});
    ASSERT_EQ(series.size(), 3u);
    EXPECT_EQ(series.times[1], times[2]);
    EXPECT_DOUBLE_EQ(series.values[1], 3.0);
}
