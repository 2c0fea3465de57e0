#include <gtest/gtest.h>
#include <cmath>
#include "kinZtime.hpp"
#include "kinZtest_util.hpp"

TEST(kinZtime, linspace_ends_exactly_at_stop) {
    const std::vector<double> v = linspace(0.0, 0.3, 120);
    ASSERT_EQ(v.size(), 120u);
    EXPECT_EQ(v.front(), 0.0);
    EXPECT_EQ(v.back(), 0.3);
    for (size_t i = 1; i < v.size(); ++i) {
        EXPECT_GT(v[i], v[i - 1]);
    }
    EXPECT_TRUE(linspace(1.0, 2.0, 0).empty());
    ASSERT_EQ(linspace(1.0, 2.0, 1).size(), 1u);
}

TEST(kinZtime, offsets_are_days_since_first_sample) {
    const NormalizedTimeAxis axis = normalize_time_axis(times_at_days({0.0, 0.25, 0.5, 1.5}));
    ASSERT_TRUE(axis.success) << axis.message;
    ASSERT_EQ(axis.offsets.size(), 4u);
    EXPECT_DOUBLE_EQ(axis.offsets[0], 0.0);
    EXPECT_DOUBLE_EQ(axis.offsets[1], 0.25);
    EXPECT_DOUBLE_EQ(axis.offsets[2], 0.5);
    EXPECT_DOUBLE_EQ(axis.offsets[3], 1.5);
    EXPECT_EQ(axis.origin, test_origin());
}

TEST(kinZtime, evaluation_axis_spans_the_samples) {
    const std::vector<TimePoint> times = times_at_days({0.0, 0.1, 0.4, 0.7});
    const NormalizedTimeAxis axis = normalize_time_axis(times);
    ASSERT_TRUE(axis.success) << axis.message;
    ASSERT_EQ(axis.evaluation_offsets.size(), kEvaluationPointCount);
    ASSERT_EQ(axis.evaluation_axis.size(), kEvaluationPointCount);
    EXPECT_EQ(axis.evaluation_offsets.front(), 0.0);
    EXPECT_EQ(axis.evaluation_offsets.back(), axis.offsets.back());
    EXPECT_EQ(axis.evaluation_axis.front(), times.front());
    const auto diff = axis.evaluation_axis.back() - times.back();
    EXPECT_LE(std::abs(std::chrono::duration_cast<std::chrono::microseconds>(diff).count()), 1);
}

TEST(kinZtime, degenerate_axes_are_rejected) {
    NormalizedTimeAxis axis = normalize_time_axis(times_at_days({0.2}));
    EXPECT_FALSE(axis.success);
    EXPECT_EQ(axis.error, FitError::DegenerateInput);

    axis = normalize_time_axis({});
    EXPECT_FALSE(axis.success);
    EXPECT_EQ(axis.error, FitError::DegenerateInput);

    axis = normalize_time_axis(times_at_days({0.5, 0.5, 0.5}));
    EXPECT_FALSE(axis.success);
    EXPECT_EQ(axis.error, FitError::DegenerateInput);

    axis = normalize_time_axis(times_at_days({0.0, 0.5, 0.3}));
    EXPECT_FALSE(axis.success);
    EXPECT_EQ(axis.error, FitError::DegenerateInput);
}

TEST(kinZtime, denormalize_inverts_offset) {
    const TimePoint origin = test_origin();
    const TimePoint t = denormalize_offset(origin, 1.25);
    EXPECT_EQ(t - origin, std::chrono::duration_cast<TimePoint::duration>(std::chrono::hours(30)));
    EXPECT_DOUBLE_EQ(offset_in_days(origin, t), 1.25);
}

TEST(kinZtime, parse_and_format_timestamps) {
    TimePoint t;
    ASSERT_TRUE(parse_timestamp("2021-10-28T00:00:00", t));
    EXPECT_EQ(t, test_origin());

    ASSERT_TRUE(parse_timestamp("2021-10-28T15:30:12.5", t));
    EXPECT_EQ(format_timestamp(t), "2021-10-28T15:30:12.500000");

    ASSERT_TRUE(parse_timestamp("2021-10-28 15:30:12.123456Z", t));
    EXPECT_EQ(format_timestamp(t), "2021-10-28T15:30:12.123456");

    ASSERT_TRUE(parse_timestamp("2020-02-29T23:59:59", t));
    EXPECT_EQ(format_timestamp(t), "2020-02-29T23:59:59.000000");

    ASSERT_TRUE(parse_timestamp("1969-12-31T23:59:59.25", t));
    EXPECT_EQ(format_timestamp(t), "1969-12-31T23:59:59.250000");
}

TEST(kinZtime, invalid_timestamps_are_rejected) {
    TimePoint t;
    EXPECT_FALSE(parse_timestamp("", t));
    EXPECT_FALSE(parse_timestamp("2021-02-29T00:00:00", t));
    EXPECT_FALSE(parse_timestamp("2021-13-01T00:00:00", t));
    EXPECT_FALSE(parse_timestamp("2021-10-28T24:00:00", t));
    EXPECT_FALSE(parse_timestamp("2021-10-28X10:00:00", t));
    EXPECT_FALSE(parse_timestamp("2021-10-28T10:00:00.", t));
    EXPECT_FALSE(parse_timestamp("2021-10-28T10:00:00 junk", t));
}
