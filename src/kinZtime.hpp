#ifndef KINZTIME_HPP
#define KINZTIME_HPP

#include <cstddef>
#include <string>
#include <vector>
#include "kinZtypes.hpp"

// Number of points of the resampled axis shared by every fit and its bands.
constexpr size_t kEvaluationPointCount = 120;

// Offsets are day-resolution date numbers relative to the first timestamp.
struct NormalizedTimeAxis {
    TimePoint origin{};
    std::vector<double> offsets;                // one per input timestamp, offsets[0] == 0
    std::vector<double> evaluation_offsets;     // kEvaluationPointCount points over [min, max] of offsets
    std::vector<TimePoint> evaluation_axis;     // evaluation_offsets mapped back to timestamps
    bool success = false;
    FitError error = FitError::None;
    std::string message;
};

// Fails with DegenerateInput for fewer than 2 timestamps, identical timestamps,
// or timestamps that are not strictly increasing.
NormalizedTimeAxis normalize_time_axis(const std::vector<TimePoint>& timestamps);

double offset_in_days(TimePoint origin, TimePoint t);

// Inverse of offset_in_days, rounded to the clock resolution.
TimePoint denormalize_offset(TimePoint origin, double offset_days);

// Evenly spaced values over [start, stop]; the last value is exactly stop.
std::vector<double> linspace(double start, double stop, size_t count);

// UTC timestamps as written in parameter tables: YYYY-MM-DDTHH:MM:SS[.ffffff][Z].
// A space is accepted in place of the 'T'. Fractional digits beyond microseconds are truncated.
bool parse_timestamp(const std::string& text, TimePoint& out);
std::string format_timestamp(TimePoint t);

#endif // KINZTIME_HPP
