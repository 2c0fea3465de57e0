#ifndef KINZSPLINE_HPP
#define KINZSPLINE_HPP

#include <string>
#include <vector>
#include "kinZtypes.hpp"

// How the smoothing spline solver finished.
// MaxIterations and BracketLost are warnings: the returned spline is usable,
// but its residual sum is not within tolerance of the smoothing factor.
enum class SplineSolverStatus {
    Converged,      // |fp - s| <= 0.001 * s
    Polynomial,     // no interior knots needed, least squares polynomial of the spline degree
    Interpolating,  // s == 0
    MaxIterations,  // smoothing parameter search ran out of iterations
    BracketLost,    // smoothing parameter search lost its bracket
};

const char* spline_status_name(SplineSolverStatus status);

// False for MaxIterations and BracketLost.
bool spline_reached_target(SplineSolverStatus status);

// B-spline representation: knots t[0..n-1], coefficients c[0..n-degree-2].
// The first and last degree+1 knots coincide with the ends of the data.
struct SmoothingSpline {
    std::vector<double> knots;
    std::vector<double> coefficients;
    int degree = 3;
    double smoothing = 0.0;
    double residual = 0.0; // sum of squared residuals at the data points
    SplineSolverStatus status = SplineSolverStatus::Converged;
};

struct SplineFitOutcome {
    SmoothingSpline spline;
    bool success = false;
    FitError error = FitError::None;
    std::string message;
};

// Smoothing spline of the given degree (1..5) through (x, y).
// The spline has the fewest knots for which the residual sum of squares can be
// brought down to `smoothing`; s == 0 interpolates the data.
// x must be strictly increasing and hold more points than the degree.
SplineFitOutcome fit_smoothing_spline(
    const std::vector<double>& x,
    const std::vector<double>& y,
    int degree,
    double smoothing
);

// Evaluation outside [t[degree], t[n-degree-1]] extends the end pieces.
double evaluate_spline(const SmoothingSpline& spline, double x);
std::vector<double> evaluate_spline(const SmoothingSpline& spline, const std::vector<double>& x);

#endif // KINZSPLINE_HPP
