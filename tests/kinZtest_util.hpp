#ifndef KINZTEST_UTIL_HPP
#define KINZTEST_UTIL_HPP

#include <chrono>
#include <cmath>
#include <vector>
#include "kinZtypes.hpp"

// 2021-10-28T00:00:00 UTC
inline TimePoint test_origin() {
    return TimePoint(std::chrono::seconds(1635379200LL));
}

inline std::vector<TimePoint> times_at_days(const std::vector<double>& days) {
    std::vector<TimePoint> times;
    for (double d : days) {
        const long long us = std::llround(d * 86400.0e6);
        times.push_back(test_origin() + std::chrono::duration_cast<TimePoint::duration>(std::chrono::microseconds(us)));
    }
    return times;
}

inline SampleSeries series_at_days(const std::vector<double>& days, const std::vector<double>& values) {
    SampleSeries series;
    series.times = times_at_days(days);
    series.values = values;
    return series;
}

#endif // KINZTEST_UTIL_HPP
