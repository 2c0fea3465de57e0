#include "kinZtypes.hpp"
#include <algorithm> // For std::min
#include <cmath>     // For std::isnan

SampleSeries make_sample_series(const std::vector<TimePoint>& times, const std::vector<double>& values) {
    SampleSeries series;
    const size_t n = std::min(times.size(), values.size());
    series.times.reserve(n);
    series.values.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        if (std::isnan(values[i])) {
            continue;
        }
        series.times.push_back(times[i]);
        series.values.push_back(values[i]);
    }
    return series;
}

const char* fit_error_name(FitError error) {
    switch (error) {
    case FitError::None:
        return "None";
    case FitError::DegenerateInput:
        return "DegenerateInput";
    case FitError::UnderdeterminedFit:
        return "UnderdeterminedFit";
    case FitError::NumericalFitFailure:
        return "NumericalFitFailure";
    case FitError::InvalidConfiguration:
        return "InvalidConfiguration";
    }
    return "Unknown";
}
