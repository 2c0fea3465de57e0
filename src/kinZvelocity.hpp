#ifndef KINZVELOCITY_HPP
#define KINZVELOCITY_HPP

#include <vector>
#include "kinZfitting.hpp"

// Nominal solar radius (IAU 2015) in km.
constexpr double kSolarRadiusKm = 695700.0;
constexpr double kSecondsPerDay = 86400.0;
// Rsun/day -> km/s
constexpr double kRsunPerDayToKmPerSecond = kSolarRadiusKm / kSecondsPerDay;

// Speed curve derived from a height-like fit, on the fit's evaluation axis.
// Spline fits also carry the speed bounds of the smoothing sweep; polynomial fits do not.
struct VelocityResult {
    std::vector<TimePoint> evaluation_axis;
    std::vector<double> evaluation_offsets;
    std::vector<double> speed;
    std::vector<double> upper_band;
    std::vector<double> lower_band;
    bool has_envelope = false;
    std::vector<double> envelope_upper;
    std::vector<double> envelope_lower;
};

// d(values)/d(offsets) in km/s for values in Rsun and offsets in days.
std::vector<double> derive_speed(const std::vector<double>& values, const std::vector<double>& offsets);

VelocityResult derive_velocity(const FitResult& fit);

#endif // KINZVELOCITY_HPP
