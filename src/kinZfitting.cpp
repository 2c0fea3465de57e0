#include "kinZfitting.hpp"
#include "kinZgradient.hpp"
#include <algorithm> // For std::max, std::min
#include <cmath>     // For std::sqrt, std::isfinite, std::isnan
#include <limits>    // For std::numeric_limits
#include <utility>   // For std::move

namespace {

FitOutcome make_fit_failure(FitError error, const std::string& message) {
    FitOutcome outcome;
    outcome.success = false;
    outcome.error = error;
    outcome.message = message;
    return outcome;
}

FitCurve make_curve(const NormalizedTimeAxis& axis) {
    FitCurve curve;
    curve.evaluation_axis = axis.evaluation_axis;
    curve.evaluation_offsets = axis.evaluation_offsets;
    return curve;
}

std::vector<double> perturbed_coefficients(const std::vector<double>& coefficients, const std::vector<double>& sigma, double sign) {
    std::vector<double> perturbed(coefficients.size());
    for (size_t i = 0; i < coefficients.size(); ++i) {
        perturbed[i] = coefficients[i] + sign * sigma[i];
    }
    return perturbed;
}

} // namespace

const char* fit_kind_name(FitKind kind) {
    return kind == FitKind::Spline ? "spline" : "poly";
}

FitKind fit_kind(const FitResult& result) {
    return std::holds_alternative<SplineFit>(result) ? FitKind::Spline : FitKind::Polynomial;
}

const FitCurve& fit_curve(const FitResult& result) {
    if (const SplineFit* spline = std::get_if<SplineFit>(&result)) {
        return spline->curve;
    }
    return std::get<PolynomialFit>(result).curve;
}

bool can_fit(size_t sample_count, const FitConfiguration& config) {
    return config.order >= 1 && sample_count >= 1 &&
           sample_count - 1 > static_cast<size_t>(config.order);
}

double evaluate_polynomial(const std::vector<double>& coefficients, double x) {
    double value = 0.0;
    for (double c : coefficients) {
        value = value * x + c;
    }
    return value;
}

std::vector<double> evaluate_polynomial(const std::vector<double>& coefficients, const std::vector<double>& x) {
    std::vector<double> values;
    values.reserve(x.size());
    for (double xi : x) {
        values.push_back(evaluate_polynomial(coefficients, xi));
    }
    return values;
}

double nan_standard_deviation(const std::vector<double>& values) {
    double sum = 0.0;
    size_t count = 0;
    for (double v : values) {
        if (std::isnan(v)) continue;
        sum += v;
        count++;
    }
    if (count == 0) return 0.0;
    const double mean = sum / static_cast<double>(count);
    double sum_sq = 0.0;
    for (double v : values) {
        if (std::isnan(v)) continue;
        sum_sq += (v - mean) * (v - mean);
    }
    return std::sqrt(sum_sq / static_cast<double>(count));
}

PolynomialLeastSquares polynomial_least_squares(
    const std::vector<double>& x,
    const std::vector<double>& y,
    int order) {

    PolynomialLeastSquares result;
    const size_t n = x.size();

    if (order < 1 || n != y.size()) {
        result.error = FitError::InvalidConfiguration;
        result.message = "Polynomial order must be >= 1 and x, y must have the same size.";
        return result;
    }
    const size_t ncoef = static_cast<size_t>(order) + 1;
    if (n <= ncoef) {
        // The covariance scale needs at least one residual degree of freedom.
        result.error = FitError::UnderdeterminedFit;
        result.message = "Order " + std::to_string(order) + " polynomial needs more than " +
                         std::to_string(ncoef) + " points, got " + std::to_string(n) + ".";
        return result;
    }

    const Eigen::Index rows = static_cast<Eigen::Index>(n);
    const Eigen::Index cols = static_cast<Eigen::Index>(ncoef);

    // Vandermonde matrix, highest power first, columns scaled to unit norm.
    Eigen::MatrixXd lhs(rows, cols);
    for (Eigen::Index i = 0; i < rows; ++i) {
        double power = 1.0;
        for (Eigen::Index j = cols - 1; j >= 0; --j) {
            lhs(i, j) = power;
            power *= x[static_cast<size_t>(i)];
        }
    }
    const Eigen::VectorXd scale = lhs.colwise().norm().transpose();
    if (!(scale.minCoeff() > 0.0) || !scale.allFinite()) {
        result.error = FitError::NumericalFitFailure;
        result.message = "Design matrix has a zero or non-finite column.";
        return result;
    }
    for (Eigen::Index j = 0; j < cols; ++j) {
        lhs.col(j) /= scale[j];
    }

    const Eigen::VectorXd rhs = Eigen::Map<const Eigen::VectorXd>(y.data(), rows);
    Eigen::JacobiSVD<Eigen::MatrixXd> svd(lhs, Eigen::ComputeThinU | Eigen::ComputeThinV);
    svd.setThreshold(static_cast<double>(n) * std::numeric_limits<double>::epsilon());
    if (svd.rank() < cols) {
        result.error = FitError::NumericalFitFailure;
        result.message = "Least squares design matrix is rank deficient (rank " + std::to_string(svd.rank()) +
                         " of " + std::to_string(cols) + ").";
        return result;
    }

    const Eigen::VectorXd c_scaled = svd.solve(rhs);
    result.residual = (rhs - lhs * c_scaled).squaredNorm();

    const Eigen::MatrixXd vbase = (lhs.transpose() * lhs).inverse();
    const double fac = result.residual / static_cast<double>(n - ncoef);
    result.covariance = vbase.cwiseQuotient(scale * scale.transpose()) * fac;

    const Eigen::VectorXd coefficients = c_scaled.cwiseQuotient(scale);
    if (!coefficients.allFinite() || !result.covariance.allFinite()) {
        result.error = FitError::NumericalFitFailure;
        result.message = "Least squares solution is not finite.";
        return result;
    }
    result.coefficients.assign(coefficients.data(), coefficients.data() + coefficients.size());

    result.success = true;
    result.message = std::to_string(n) + "-point least squares polynomial fit of order " + std::to_string(order) + " successful.";
    return result;
}

FitOutcome fit_polynomial_strategy(
    const std::vector<double>& x,
    const std::vector<double>& y,
    int order,
    const NormalizedTimeAxis& axis) {

    const PolynomialLeastSquares lsq = polynomial_least_squares(x, y, order);
    if (!lsq.success) {
        return make_fit_failure(lsq.error, lsq.message);
    }

    PolynomialFit fit;
    fit.curve = make_curve(axis);
    fit.coefficients = lsq.coefficients;
    fit.covariance = lsq.covariance;
    fit.sigma.resize(lsq.coefficients.size());
    for (size_t i = 0; i < fit.sigma.size(); ++i) {
        const Eigen::Index d = static_cast<Eigen::Index>(i);
        fit.sigma[i] = std::sqrt(lsq.covariance(d, d));
    }

    const std::vector<double>& xe = fit.curve.evaluation_offsets;
    fit.curve.fitted_curve = evaluate_polynomial(fit.coefficients, xe);
    fit.curve.upper_band = evaluate_polynomial(perturbed_coefficients(fit.coefficients, fit.sigma, 1.0), xe);
    fit.curve.lower_band = evaluate_polynomial(perturbed_coefficients(fit.coefficients, fit.sigma, -1.0), xe);

    FitOutcome outcome;
    outcome.result = std::move(fit);
    outcome.success = true;
    outcome.message = lsq.message;
    return outcome;
}

FitOutcome fit_spline_strategy(
    const std::vector<double>& x,
    const std::vector<double>& y,
    int order,
    double smoothing,
    const NormalizedTimeAxis& axis) {

    SplineFitOutcome primary = fit_smoothing_spline(x, y, order, smoothing);
    if (!primary.success) {
        return make_fit_failure(primary.error, primary.message);
    }

    SplineFit fit;
    fit.curve = make_curve(axis);
    fit.spline = std::move(primary.spline);

    const std::vector<double> at_samples = evaluate_spline(fit.spline, x);
    std::vector<double> residuals(y.size());
    for (size_t i = 0; i < y.size(); ++i) {
        residuals[i] = y[i] - at_samples[i];
    }
    fit.sigma = nan_standard_deviation(residuals);

    const std::vector<double>& xe = fit.curve.evaluation_offsets;
    fit.curve.fitted_curve = evaluate_spline(fit.spline, xe);
    fit.curve.upper_band.resize(xe.size());
    fit.curve.lower_band.resize(xe.size());
    for (size_t j = 0; j < xe.size(); ++j) {
        fit.curve.upper_band[j] = fit.curve.fitted_curve[j] + fit.sigma;
        fit.curve.lower_band[j] = fit.curve.fitted_curve[j] - fit.sigma;
    }

    // Envelope search over the smoothing factor, seeded with the primary fit.
    fit.secondary_upper = fit.curve.fitted_curve;
    fit.secondary_lower = fit.curve.fitted_curve;
    fit.secondary_upper_deriv = numerical_gradient(fit.curve.fitted_curve, xe);
    fit.secondary_lower_deriv = fit.secondary_upper_deriv;

    for (int i = 0; i < kEnvelopeSweepCount; ++i) {
        const double s = static_cast<double>(i) / kEnvelopeSweepDivisor;
        const SplineFitOutcome refit = fit_smoothing_spline(x, y, order, s);
        if (!refit.success) {
            return make_fit_failure(refit.error, "Envelope refit with smoothing " + std::to_string(s) + " failed: " + refit.message);
        }
        if (!spline_reached_target(refit.spline.status)) {
            fit.unconverged_sweep_smoothing.push_back(s);
        }
        const std::vector<double> curve = evaluate_spline(refit.spline, xe);
        const std::vector<double> deriv = numerical_gradient(curve, xe);
        for (size_t j = 0; j < xe.size(); ++j) {
            fit.secondary_upper[j] = std::max(fit.secondary_upper[j], curve[j]);
            fit.secondary_lower[j] = std::min(fit.secondary_lower[j], curve[j]);
            fit.secondary_upper_deriv[j] = std::max(fit.secondary_upper_deriv[j], deriv[j]);
            fit.secondary_lower_deriv[j] = std::min(fit.secondary_lower_deriv[j], deriv[j]);
        }
    }

    FitOutcome outcome;
    outcome.message = primary.message;
    outcome.result = std::move(fit);
    outcome.success = true;
    return outcome;
}

FitOutcome fit_parameter(const SampleSeries& series, const FitConfiguration& config) {
    if (config.order < 1) {
        return make_fit_failure(FitError::InvalidConfiguration, "Fit order must be >= 1, got " + std::to_string(config.order) + ".");
    }
    if (config.kind == FitKind::Spline) {
        if (config.order > 5) {
            return make_fit_failure(FitError::InvalidConfiguration, "Spline order must be <= 5, got " + std::to_string(config.order) + ".");
        }
        if (!std::isfinite(config.smoothing) || config.smoothing < 0.0) {
            return make_fit_failure(FitError::InvalidConfiguration, "Smoothing factor must be a finite non-negative number.");
        }
    }
    if (series.times.size() != series.values.size()) {
        return make_fit_failure(FitError::InvalidConfiguration, "Sample series has " + std::to_string(series.times.size()) +
                                " timestamps but " + std::to_string(series.values.size()) + " values.");
    }

    const NormalizedTimeAxis axis = normalize_time_axis(series.times);
    if (!axis.success) {
        return make_fit_failure(axis.error, axis.message);
    }
    for (size_t i = 0; i < series.values.size(); ++i) {
        if (!std::isfinite(series.values[i])) {
            return make_fit_failure(FitError::DegenerateInput, "Sample " + std::to_string(i) + " has a non-finite value.");
        }
    }
    if (!can_fit(series.size(), config)) {
        return make_fit_failure(FitError::UnderdeterminedFit,
                                "Insufficient samples: order " + std::to_string(config.order) + " needs more than " +
                                std::to_string(config.order + 1) + " samples, got " + std::to_string(series.size()) + ".");
    }

    if (config.kind == FitKind::Spline) {
        return fit_spline_strategy(axis.offsets, series.values, config.order, config.smoothing, axis);
    }
    return fit_polynomial_strategy(axis.offsets, series.values, config.order, axis);
}
