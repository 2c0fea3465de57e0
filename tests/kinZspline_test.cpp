#include <gtest/gtest.h>
#include <cmath>
#include "kinZspline.hpp"
#include "kinZfitting.hpp"

namespace {

const double kPi = 3.14159265358979323846;

void noisy_sine(size_t m, std::vector<double>& x, std::vector<double>& y) {
    x.clear();
    y.clear();
    for (size_t i = 0; i < m; ++i) {
        const double xi = 2.0 * kPi * static_cast<double>(i) / static_cast<double>(m - 1);
        x.push_back(xi);
        y.push_back(std::sin(xi) + ((i % 2 == 0) ? 0.05 : -0.05));
    }
}

double residual_sum(const SmoothingSpline& spline, const std::vector<double>& x, const std::vector<double>& y) {
    double rss = 0.0;
    for (size_t i = 0; i < x.size(); ++i) {
        const double r = y[i] - evaluate_spline(spline, x[i]);
        rss += r * r;
    }
    return rss;
}

} // namespace

TEST(kinZspline, interpolating_spline_reproduces_the_data) {
    std::vector<double> x, y;
    noisy_sine(9, x, y);
    for (int degree = 1; degree <= 5; ++degree) {
        const SplineFitOutcome outcome = fit_smoothing_spline(x, y, degree, 0.0);
        ASSERT_TRUE(outcome.success) << "degree " << degree << ": " << outcome.message;
        EXPECT_EQ(outcome.spline.status, SplineSolverStatus::Interpolating);
        EXPECT_EQ(outcome.spline.knots.size(), x.size() + degree + 1);
        for (size_t i = 0; i < x.size(); ++i) {
            EXPECT_NEAR(evaluate_spline(outcome.spline, x[i]), y[i], 1e-9) << "degree " << degree << " at " << i;
        }
    }
}

TEST(kinZspline, linear_interpolation_between_samples) {
    const std::vector<double> x = {0.0, 1.0, 3.0};
    const std::vector<double> y = {0.0, 2.0, 0.0};
    const SplineFitOutcome outcome = fit_smoothing_spline(x, y, 1, 0.0);
    ASSERT_TRUE(outcome.success) << outcome.message;
    EXPECT_NEAR(evaluate_spline(outcome.spline, 0.5), 1.0, 1e-12);
    EXPECT_NEAR(evaluate_spline(outcome.spline, 2.0), 1.0, 1e-12);
    // End pieces are extended outside the data range.
    EXPECT_NEAR(evaluate_spline(outcome.spline, -1.0), -2.0, 1e-12);
    EXPECT_NEAR(evaluate_spline(outcome.spline, 4.0), -1.0, 1e-12);
}

TEST(kinZspline, large_smoothing_gives_least_squares_polynomial) {
    std::vector<double> x, y;
    noisy_sine(15, x, y);
    const SplineFitOutcome outcome = fit_smoothing_spline(x, y, 3, 1.0e6);
    ASSERT_TRUE(outcome.success) << outcome.message;
    EXPECT_EQ(outcome.spline.status, SplineSolverStatus::Polynomial);
    EXPECT_EQ(outcome.spline.knots.size(), 8u);

    const PolynomialLeastSquares poly = polynomial_least_squares(x, y, 3);
    ASSERT_TRUE(poly.success) << poly.message;
    for (double xi = 0.0; xi <= 2.0 * kPi; xi += 0.1) {
        EXPECT_NEAR(evaluate_spline(outcome.spline, xi), evaluate_polynomial(poly.coefficients, xi), 1e-8);
    }
    EXPECT_NEAR(outcome.spline.residual, poly.residual, 1e-8);
}

TEST(kinZspline, residual_sum_matches_smoothing_factor) {
    std::vector<double> x, y;
    noisy_sine(25, x, y);
    const double s = 25 * 0.05 * 0.05;
    const SplineFitOutcome outcome = fit_smoothing_spline(x, y, 3, s);
    ASSERT_TRUE(outcome.success) << outcome.message;
    EXPECT_EQ(outcome.spline.status, SplineSolverStatus::Converged);
    EXPECT_GT(outcome.spline.knots.size(), 8u);
    EXPECT_NEAR(outcome.spline.residual, s, 0.001 * s);
    EXPECT_NEAR(residual_sum(outcome.spline, x, y), outcome.spline.residual, 1e-9);
}

TEST(kinZspline, smaller_smoothing_follows_the_data_closer) {
    std::vector<double> x, y;
    noisy_sine(25, x, y);
    const SplineFitOutcome loose = fit_smoothing_spline(x, y, 3, 0.5);
    const SplineFitOutcome tight = fit_smoothing_spline(x, y, 3, 0.02);
    ASSERT_TRUE(loose.success) << loose.message;
    ASSERT_TRUE(tight.success) << tight.message;
    EXPECT_LT(residual_sum(tight.spline, x, y), residual_sum(loose.spline, x, y));
}

TEST(kinZspline, invalid_input) {
    const std::vector<double> x = {0.0, 1.0, 2.0, 3.0};
    const std::vector<double> y = {0.0, 1.0, 0.0, 1.0};

    SplineFitOutcome outcome = fit_smoothing_spline(x, y, 0, 0.1);
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.error, FitError::InvalidConfiguration);

    outcome = fit_smoothing_spline(x, y, 6, 0.1);
    EXPECT_EQ(outcome.error, FitError::InvalidConfiguration);

    outcome = fit_smoothing_spline(x, y, 3, -1.0);
    EXPECT_EQ(outcome.error, FitError::InvalidConfiguration);

    outcome = fit_smoothing_spline(x, {0.0, 1.0}, 3, 0.1);
    EXPECT_EQ(outcome.error, FitError::InvalidConfiguration);

    outcome = fit_smoothing_spline({0.0, 1.0, 2.0}, {0.0, 1.0, 2.0}, 3, 0.1);
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.error, FitError::UnderdeterminedFit);

    outcome = fit_smoothing_spline({0.0, 2.0, 1.0, 3.0}, y, 1, 0.1);
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.error, FitError::DegenerateInput);
}
