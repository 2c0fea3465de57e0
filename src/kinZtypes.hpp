#ifndef KINZTYPES_HPP
#define KINZTYPES_HPP

#include <cstddef>
#include <chrono>
#include <string>
#include <vector>

// Event times. Microsecond resolution is what the parameter tables carry.
using TimePoint = std::chrono::system_clock::time_point;

// Time series of one geometric parameter (height, axis radius, tilt, ...).
// Values are unitless magnitudes; missing measurements are simply not present.
struct SampleSeries {
    std::vector<TimePoint> times;
    std::vector<double> values;

    size_t size() const { return times.size(); }
    bool empty() const { return times.empty(); }
};

// Builds a series from parallel columns, dropping entries whose value is NaN.
// Extra entries in the longer column are ignored.
SampleSeries make_sample_series(const std::vector<TimePoint>& times, const std::vector<double>& values);

enum class FitError {
    None,
    DegenerateInput,       // fewer than 2 samples, identical or unordered timestamps
    UnderdeterminedFit,    // order >= N - 1
    NumericalFitFailure,   // singular least-squares or spline system
    InvalidConfiguration,  // order/smoothing out of range, mismatched columns
};

const char* fit_error_name(FitError error);

#endif // KINZTYPES_HPP
