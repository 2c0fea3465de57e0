#ifndef KINZFITTING_HPP
#define KINZFITTING_HPP

#include <string>
#include <variant>
#include <vector>
#include <Eigen/Dense>
#include "kinZtypes.hpp"
#include "kinZtime.hpp"
#include "kinZspline.hpp"

enum class FitKind {
    Polynomial,
    Spline,
};

const char* fit_kind_name(FitKind kind);

struct FitConfiguration {
    FitKind kind = FitKind::Polynomial;
    int order = 1;          // polynomial degree, or spline degree (1..5)
    double smoothing = 0.0; // spline smoothing factor, unused for polynomials
};

// The envelope search refits the spline with smoothing i / kEnvelopeSweepDivisor
// for i = 0 .. kEnvelopeSweepCount - 1, i.e. [0, 0.99] in steps of 0.01.
constexpr int kEnvelopeSweepCount = 100;
constexpr double kEnvelopeSweepDivisor = 100.0;

// Fitted curve and its uncertainty band on the shared evaluation axis.
struct FitCurve {
    std::vector<TimePoint> evaluation_axis;
    std::vector<double> evaluation_offsets; // same axis in days since the first sample
    std::vector<double> fitted_curve;
    std::vector<double> upper_band;
    std::vector<double> lower_band;
};

// Bands are the polynomial re-evaluated with coefficients + sigma and
// coefficients - sigma, a coefficient-space perturbation rather than a
// pointwise confidence interval.
struct PolynomialFit {
    FitCurve curve;
    std::vector<double> coefficients; // highest power first
    Eigen::MatrixXd covariance;
    std::vector<double> sigma;        // sqrt(diag(covariance))
};

// Bands are fitted_curve +/- the standard deviation of the residuals.
// The secondary bands are the pointwise extrema over the smoothing sweep,
// of the curve and of its numerical derivative. Refits whose residual sum did not
// reach its smoothing factor still take part; their smoothing values are listed.
struct SplineFit {
    FitCurve curve;
    SmoothingSpline spline;
    double sigma = 0.0;
    std::vector<double> secondary_upper;
    std::vector<double> secondary_lower;
    std::vector<double> secondary_upper_deriv;
    std::vector<double> secondary_lower_deriv;
    std::vector<double> unconverged_sweep_smoothing;
};

using FitResult = std::variant<PolynomialFit, SplineFit>;

// Either a complete result (success == true) or an error kind with a message.
struct FitOutcome {
    FitResult result;
    bool success = false;
    FitError error = FitError::None;
    std::string message;
};

FitKind fit_kind(const FitResult& result);
const FitCurve& fit_curve(const FitResult& result);

// True when the series is long enough for the configured order (order < N - 1).
// Callers that get false draw the raw samples instead of calling fit_parameter.
bool can_fit(size_t sample_count, const FitConfiguration& config);

// Fits one parameter time series. Pure function of its inputs.
FitOutcome fit_parameter(const SampleSeries& series, const FitConfiguration& config);

// Ordinary least squares polynomial with the scaled coefficient covariance
// (residual variance with N - order - 1 degrees of freedom).
struct PolynomialLeastSquares {
    std::vector<double> coefficients; // highest power first
    Eigen::MatrixXd covariance;
    double residual = 0.0;            // sum of squared residuals
    bool success = false;
    FitError error = FitError::None;
    std::string message;
};

PolynomialLeastSquares polynomial_least_squares(
    const std::vector<double>& x,
    const std::vector<double>& y,
    int order
);

// Horner evaluation, coefficients highest power first.
double evaluate_polynomial(const std::vector<double>& coefficients, double x);
std::vector<double> evaluate_polynomial(const std::vector<double>& coefficients, const std::vector<double>& x);

// Strategies on normalized offsets. `axis` supplies the evaluation axis.
FitOutcome fit_polynomial_strategy(
    const std::vector<double>& x,
    const std::vector<double>& y,
    int order,
    const NormalizedTimeAxis& axis
);

FitOutcome fit_spline_strategy(
    const std::vector<double>& x,
    const std::vector<double>& y,
    int order,
    double smoothing,
    const NormalizedTimeAxis& axis
);

// Population standard deviation ignoring NaN entries; 0 when nothing is left.
double nan_standard_deviation(const std::vector<double>& values);

#endif // KINZFITTING_HPP
