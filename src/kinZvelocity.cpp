#include "kinZvelocity.hpp"
#include "kinZgradient.hpp"

namespace {

std::vector<double> scaled(const std::vector<double>& values, double factor) {
    std::vector<double> out(values.size());
    for (size_t i = 0; i < values.size(); ++i) {
        out[i] = factor * values[i];
    }
    return out;
}

} // namespace

std::vector<double> derive_speed(const std::vector<double>& values, const std::vector<double>& offsets) {
    return scaled(numerical_gradient(values, offsets), kRsunPerDayToKmPerSecond);
}

VelocityResult derive_velocity(const FitResult& fit) {
    const FitCurve& curve = fit_curve(fit);

    VelocityResult velocity;
    velocity.evaluation_axis = curve.evaluation_axis;
    velocity.evaluation_offsets = curve.evaluation_offsets;
    velocity.speed = derive_speed(curve.fitted_curve, curve.evaluation_offsets);
    velocity.upper_band = derive_speed(curve.upper_band, curve.evaluation_offsets);
    velocity.lower_band = derive_speed(curve.lower_band, curve.evaluation_offsets);

    // The sweep already holds derivatives; only the unit changes.
    if (const SplineFit* spline = std::get_if<SplineFit>(&fit)) {
        velocity.has_envelope = true;
        velocity.envelope_upper = scaled(spline->secondary_upper_deriv, kRsunPerDayToKmPerSecond);
        velocity.envelope_lower = scaled(spline->secondary_lower_deriv, kRsunPerDayToKmPerSecond);
    }
    return velocity;
}
