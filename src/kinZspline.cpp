#include "kinZspline.hpp"
#include <Eigen/Dense>
#include <algorithm> // For std::upper_bound, std::min, std::max
#include <cmath>     // For std::abs, std::isfinite
#include <cstddef>   // For std::ptrdiff_t

namespace {

constexpr int kMaxDegree = 5;
constexpr double kRelativeTolerance = 0.001; // |fp - s| accepted below this fraction of s
constexpr int kMaxSmoothingIterations = 20;

// Step factors of the smoothing parameter search
constexpr double con1 = 0.1;
constexpr double con9 = 0.9;
constexpr double con4 = 0.04;

// Index l with t[l] <= x < t[l+1], restricted to k <= l <= n-k-2.
size_t find_knot_interval(const std::vector<double>& t, int k, double x) {
    const size_t n = t.size();
    const auto first = t.begin() + (k + 1);
    const auto last = t.begin() + static_cast<std::ptrdiff_t>(n - k - 1);
    const auto it = std::upper_bound(first, last, x);
    const size_t l = static_cast<size_t>(it - t.begin()) - 1;
    return std::min(std::max(l, static_cast<size_t>(k)), n - k - 2);
}

// Values of the k+1 B-splines that do not vanish on [t[l], t[l+1]], at x.
// h[i] belongs to coefficient l-k+i (Cox-de Boor recursion).
void bspline_basis(const std::vector<double>& t, int k, double x, size_t l, double* h) {
    double hh[kMaxDegree + 1];
    h[0] = 1.0;
    for (int j = 1; j <= k; ++j) {
        for (int i = 0; i < j; ++i) {
            hh[i] = h[i];
        }
        h[0] = 0.0;
        for (int i = 1; i <= j; ++i) {
            const size_t li = l + i;
            const size_t lj = li - j;
            if (t[li] == t[lj]) {
                h[i] = 0.0;
                continue;
            }
            const double f = hh[i - 1] / (t[li] - t[lj]);
            h[i - 1] += f * (t[li] - x);
            h[i] = f * (x - t[lj]);
        }
    }
}

std::vector<double> assemble_knots(double xb, double xe, const std::vector<double>& interior, int k) {
    std::vector<double> t;
    t.reserve(interior.size() + 2 * (k + 1));
    t.insert(t.end(), k + 1, xb);
    t.insert(t.end(), interior.begin(), interior.end());
    t.insert(t.end(), k + 1, xe);
    return t;
}

// Interior knots of the interpolating spline: data points for odd degree,
// midpoints between data points for even degree.
std::vector<double> interpolation_knots(const std::vector<double>& x, int k) {
    std::vector<double> interior;
    const size_t m = x.size();
    const size_t count = m - (k + 1);
    const size_t k3 = k / 2;
    interior.reserve(count);
    for (size_t l = 0; l < count; ++l) {
        const size_t j = k3 + 1 + l;
        if (k % 2 == 1) {
            interior.push_back(x[j]);
        } else {
            interior.push_back((x[j] + x[j - 1]) * 0.5);
        }
    }
    return interior;
}

Eigen::MatrixXd observation_matrix(const std::vector<double>& t, int k, const std::vector<double>& x) {
    const size_t nk1 = t.size() - k - 1;
    Eigen::MatrixXd a = Eigen::MatrixXd::Zero(static_cast<Eigen::Index>(x.size()), static_cast<Eigen::Index>(nk1));
    double h[kMaxDegree + 1];
    for (size_t i = 0; i < x.size(); ++i) {
        const size_t l = find_knot_interval(t, k, x[i]);
        bspline_basis(t, k, x[i], l, h);
        for (int j = 0; j <= k; ++j) {
            a(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(l - k + j)) = h[j];
        }
    }
    return a;
}

// Jumps of the k-th derivative of every B-spline at the interior knots, one row per knot,
// scaled by powers of the mean knot interval.
Eigen::MatrixXd discontinuity_matrix(const std::vector<double>& t, int k) {
    const size_t n = t.size();
    const size_t k1 = k + 1;
    const size_t nk1 = n - k1;
    const size_t nrint = nk1 - k;
    const double fac = static_cast<double>(nrint) / (t[nk1] - t[k]);

    Eigen::MatrixXd b = Eigen::MatrixXd::Zero(static_cast<Eigen::Index>(nrint - 1), static_cast<Eigen::Index>(nk1));
    double h[2 * (kMaxDegree + 1)];
    for (size_t l = k1; l < nk1; ++l) {
        const size_t row = l - k1;
        for (size_t j = 0; j < k1; ++j) {
            h[j] = t[l] - t[l + j - k1];
            h[j + k1] = t[l] - t[l + j + 1];
        }
        for (size_t j = 0; j <= k1; ++j) {
            double prod = h[j];
            for (size_t i = 1; i <= static_cast<size_t>(k); ++i) {
                prod *= h[j + i] * fac;
            }
            const size_t col = row + j;
            b(static_cast<Eigen::Index>(row), static_cast<Eigen::Index>(col)) = (t[col + k1] - t[col]) / prod;
        }
    }
    return b;
}

struct LeastSquaresSpline {
    std::vector<double> coefficients;
    std::vector<double> squared_residuals;
    double fp = 0.0;
};

void store_solution(const Eigen::MatrixXd& a, const Eigen::VectorXd& y, const Eigen::VectorXd& c, LeastSquaresSpline& out) {
    const Eigen::VectorXd r = y - a * c;
    out.coefficients.assign(c.data(), c.data() + c.size());
    out.squared_residuals.resize(static_cast<size_t>(r.size()));
    for (Eigen::Index i = 0; i < r.size(); ++i) {
        out.squared_residuals[static_cast<size_t>(i)] = r[i] * r[i];
    }
    out.fp = r.squaredNorm();
}

// Plain least squares spline on fixed knots; false if the knots leave the system rank deficient.
bool solve_least_squares(const Eigen::MatrixXd& a, const Eigen::VectorXd& y, LeastSquaresSpline& out) {
    Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr(a);
    if (qr.rank() < a.cols()) {
        return false;
    }
    const Eigen::VectorXd c = qr.solve(y);
    if (!c.allFinite()) {
        return false;
    }
    store_solution(a, y, c, out);
    return true;
}

// Least squares with the derivative jumps appended as observations of weight 1/p.
bool solve_penalized(const Eigen::MatrixXd& a, const Eigen::MatrixXd& b, const Eigen::VectorXd& y, double p, LeastSquaresSpline& out) {
    const double pinv = 1.0 / p;
    Eigen::MatrixXd stacked(a.rows() + b.rows(), a.cols());
    stacked << a, b * pinv;
    Eigen::VectorXd rhs = Eigen::VectorXd::Zero(stacked.rows());
    rhs.head(y.size()) = y;

    const Eigen::VectorXd c = stacked.householderQr().solve(rhs);
    if (!c.allFinite()) {
        return false;
    }
    store_solution(a, y, c, out);
    return true;
}

// Share of the residual sum per knot interval. A data point that starts a new
// interval splits its term between the two neighbouring intervals.
std::vector<double> interval_residuals(const std::vector<double>& x, const std::vector<double>& r2,
                                       const std::vector<double>& t, int k, size_t nrint) {
    std::vector<double> fpint(nrint, 0.0);
    const size_t last_interior = t.size() - k - 2;
    size_t l = k + 1;
    size_t interval = 0;
    double fpart = 0.0;
    for (size_t it = 0; it < x.size(); ++it) {
        bool entered = false;
        if (l <= last_interior && x[it] >= t[l]) {
            entered = true;
            ++l;
        }
        const double term = r2[it];
        fpart += term;
        if (entered) {
            const double store = term * 0.5;
            fpint[interval] = fpart - store;
            ++interval;
            fpart = store;
        }
    }
    fpint[nrint - 1] = fpart;
    return fpint;
}

// Adds one knot at the middle data point of the interval with the largest residual share.
// nrdata holds the number of data points strictly inside each interval.
bool insert_knot(const std::vector<double>& x, std::vector<double>& interior,
                 std::vector<double>& fpint, std::vector<size_t>& nrdata) {
    double fpmax = 0.0;
    bool found = false;
    size_t number = 0;
    size_t maxpt = 0;
    size_t maxbeg = 0;
    size_t jbegin = 0;
    for (size_t j = 0; j < fpint.size(); ++j) {
        const size_t jpoint = nrdata[j];
        if (fpmax < fpint[j] && jpoint != 0) {
            fpmax = fpint[j];
            number = j;
            maxpt = jpoint;
            maxbeg = jbegin;
            found = true;
        }
        jbegin += jpoint + 1;
    }
    if (!found) {
        return false;
    }

    const size_t ihalf = maxpt / 2 + 1;
    const size_t nrx = maxbeg + ihalf;
    const size_t left = ihalf - 1;
    const size_t right = maxpt - ihalf;
    const double am = static_cast<double>(maxpt);

    interior.insert(interior.begin() + static_cast<std::ptrdiff_t>(number), x[nrx]);
    fpint[number] = fpmax * static_cast<double>(left) / am;
    fpint.insert(fpint.begin() + static_cast<std::ptrdiff_t>(number + 1), fpmax * static_cast<double>(right) / am);
    nrdata[number] = left;
    nrdata.insert(nrdata.begin() + static_cast<std::ptrdiff_t>(number + 1), right);
    return true;
}

// Rational interpolation for the root of f(p) = fp(p) - s through (p1,f1), (p2,f2), (p3,f3).
// p3 < 0 stands for p3 = infinity. Keeps f1 > 0 and f3 < 0 for the next step.
double rational_root(double& p1, double& f1, double p2, double f2, double& p3, double& f3) {
    double p;
    if (p3 > 0.0) {
        const double h1 = f1 * (f2 - f3);
        const double h2 = f2 * (f3 - f1);
        const double h3 = f3 * (f1 - f2);
        p = -(p1 * p2 * h3 + p2 * p3 * h1 + p3 * p1 * h2) / (p1 * h1 + p2 * h2 + p3 * h3);
    } else {
        p = (p1 * (f1 - f3) * f2 - p2 * (f2 - f3) * f1) / ((f1 - f2) * f3);
    }
    if (f2 < 0.0) {
        p3 = p2;
        f3 = f2;
    } else {
        p1 = p2;
        f1 = f2;
    }
    return p;
}

SplineFitOutcome make_failure(FitError error, const std::string& message) {
    SplineFitOutcome outcome;
    outcome.success = false;
    outcome.error = error;
    outcome.message = message;
    return outcome;
}

SplineFitOutcome make_success(const std::vector<double>& knots, const LeastSquaresSpline& lsq,
                              int k, double s, SplineSolverStatus status) {
    SplineFitOutcome outcome;
    outcome.spline.knots = knots;
    outcome.spline.coefficients = lsq.coefficients;
    outcome.spline.degree = k;
    outcome.spline.smoothing = s;
    outcome.spline.residual = lsq.fp;
    outcome.spline.status = status;
    outcome.success = true;
    outcome.message = std::string("Smoothing spline fit finished (") + spline_status_name(status) + ").";
    return outcome;
}

} // namespace

const char* spline_status_name(SplineSolverStatus status) {
    switch (status) {
    case SplineSolverStatus::Converged:
        return "converged";
    case SplineSolverStatus::Polynomial:
        return "polynomial";
    case SplineSolverStatus::Interpolating:
        return "interpolating";
    case SplineSolverStatus::MaxIterations:
        return "maximum iterations reached";
    case SplineSolverStatus::BracketLost:
        return "smoothing parameter bracket lost";
    }
    return "unknown";
}

bool spline_reached_target(SplineSolverStatus status) {
    return status != SplineSolverStatus::MaxIterations && status != SplineSolverStatus::BracketLost;
}

SplineFitOutcome fit_smoothing_spline(
    const std::vector<double>& x,
    const std::vector<double>& y,
    int degree,
    double smoothing) {

    const int k = degree;
    if (k < 1 || k > kMaxDegree) {
        return make_failure(FitError::InvalidConfiguration, "Spline degree must be between 1 and 5, got " + std::to_string(k) + ".");
    }
    if (x.size() != y.size()) {
        return make_failure(FitError::InvalidConfiguration, "x and y must have the same size.");
    }
    if (!std::isfinite(smoothing) || smoothing < 0.0) {
        return make_failure(FitError::InvalidConfiguration, "Smoothing factor must be a finite non-negative number.");
    }
    const size_t m = x.size();
    if (m <= static_cast<size_t>(k)) {
        return make_failure(FitError::UnderdeterminedFit,
                            "A degree " + std::to_string(k) + " spline needs more than " + std::to_string(k) +
                            " points, got " + std::to_string(m) + ".");
    }
    for (size_t i = 0; i < m; ++i) {
        if (!std::isfinite(x[i]) || !std::isfinite(y[i])) {
            return make_failure(FitError::DegenerateInput, "Non-finite sample at index " + std::to_string(i) + ".");
        }
        if (i > 0 && x[i] <= x[i - 1]) {
            return make_failure(FitError::DegenerateInput, "x must be strictly increasing (index " + std::to_string(i) + ").");
        }
    }

    const size_t k1 = k + 1;
    const size_t nmin = 2 * k1;
    const size_t nmax = m + k1;
    const double xb = x.front();
    const double xe = x.back();
    const double s = smoothing;
    const double acc = kRelativeTolerance * s;
    const Eigen::VectorXd yv = Eigen::Map<const Eigen::VectorXd>(y.data(), static_cast<Eigen::Index>(m));

    LeastSquaresSpline lsq;

    if (s == 0.0) {
        const std::vector<double> knots = assemble_knots(xb, xe, interpolation_knots(x, k), k);
        if (!solve_least_squares(observation_matrix(knots, k, x), yv, lsq)) {
            return make_failure(FitError::NumericalFitFailure, "Interpolating spline system is singular.");
        }
        return make_success(knots, lsq, k, s, SplineSolverStatus::Interpolating);
    }

    // Part 1: knot placement. Start from the least squares polynomial and add knots
    // until the least squares spline on the current knots gets below s.
    std::vector<double> interior;
    std::vector<size_t> nrdata(1, m - 2);
    std::vector<double> knots;
    Eigen::MatrixXd a;
    bool interpolating_knots = false;
    bool first_increase = true;
    size_t nplus = 0;
    double fp0 = 0.0;
    double fpold = 0.0;
    double fpms = 0.0;

    for (size_t iter = 0; iter < m; ++iter) {
        knots = assemble_knots(xb, xe, interior, k);
        a = observation_matrix(knots, k, x);
        if (!solve_least_squares(a, yv, lsq)) {
            return make_failure(FitError::NumericalFitFailure,
                                "Least squares spline system is singular with " + std::to_string(knots.size()) + " knots.");
        }
        if (interior.empty()) {
            fp0 = lsq.fp;
        }

        fpms = lsq.fp - s;
        if (std::abs(fpms) < acc) {
            return make_success(knots, lsq, k, s, interior.empty() ? SplineSolverStatus::Polynomial : SplineSolverStatus::Converged);
        }
        if (fpms < 0.0) {
            break;
        }
        if (interpolating_knots) {
            // Interpolation cannot get any closer; only reachable when s is below rounding noise.
            return make_success(knots, lsq, k, s, SplineSolverStatus::Interpolating);
        }

        if (first_increase) {
            nplus = 1;
            first_increase = false;
        } else {
            size_t npl1 = nplus * 2;
            if (fpold - lsq.fp > acc) {
                npl1 = static_cast<size_t>(static_cast<double>(nplus) * fpms / (fpold - lsq.fp));
            }
            nplus = std::min(nplus * 2, std::max({npl1, nplus / 2, static_cast<size_t>(1)}));
        }
        fpold = lsq.fp;

        std::vector<double> fpint = interval_residuals(x, lsq.squared_residuals, knots, k, interior.size() + 1);
        for (size_t l = 0; l < nplus; ++l) {
            if (!insert_knot(x, interior, fpint, nrdata) || interior.size() + nmin >= nmax) {
                interior = interpolation_knots(x, k);
                interpolating_knots = true;
                break;
            }
        }
    }

    if (fpms >= 0.0) {
        return make_success(knots, lsq, k, s, SplineSolverStatus::MaxIterations);
    }
    if (interior.empty()) {
        return make_success(knots, lsq, k, s, SplineSolverStatus::Polynomial);
    }

    // Part 2: with the knots fixed, search the smoothing parameter p so that fp(p) = s.
    // p -> 0 gives the polynomial (fp0), p -> infinity the least squares spline found above.
    const Eigen::MatrixXd b = discontinuity_matrix(knots, k);
    const Eigen::HouseholderQR<Eigen::MatrixXd> qr(a);
    const double diag_sum = qr.matrixQR().diagonal().cwiseAbs().sum();
    if (!(diag_sum > 0.0)) {
        return make_failure(FitError::NumericalFitFailure, "Observation matrix has a zero diagonal.");
    }

    double p = static_cast<double>(a.cols()) / diag_sum;
    double p1 = 0.0;
    double f1 = fp0 - s;
    double p3 = -1.0;
    double f3 = fpms;
    bool ich1 = false;
    bool ich3 = false;

    for (int iter = 1; iter <= kMaxSmoothingIterations; ++iter) {
        if (!solve_penalized(a, b, yv, p, lsq)) {
            return make_failure(FitError::NumericalFitFailure, "Penalized spline system is singular (p = " + std::to_string(p) + ").");
        }
        fpms = lsq.fp - s;
        if (std::abs(fpms) < acc) {
            return make_success(knots, lsq, k, s, SplineSolverStatus::Converged);
        }
        if (iter == kMaxSmoothingIterations) {
            break;
        }

        const double p2 = p;
        const double f2 = fpms;
        if (!ich3) {
            if (f2 - f3 <= acc) {
                // p too large
                p3 = p2;
                f3 = f2;
                p *= con4;
                if (p <= p1) {
                    p = p1 * con9 + p2 * con1;
                }
                continue;
            }
            if (f2 < 0.0) {
                ich3 = true;
            }
        }
        if (!ich1) {
            if (f1 - f2 <= acc) {
                // p too small
                p1 = p2;
                f1 = f2;
                p /= con4;
                if (p3 >= 0.0 && p >= p3) {
                    p = p2 * con1 + p3 * con9;
                }
                continue;
            }
            if (f2 > 0.0) {
                ich1 = true;
            }
        }
        if (f2 >= f1 || f2 <= f3) {
            return make_success(knots, lsq, k, s, SplineSolverStatus::BracketLost);
        }
        p = rational_root(p1, f1, p2, f2, p3, f3);
    }

    return make_success(knots, lsq, k, s, SplineSolverStatus::MaxIterations);
}

double evaluate_spline(const SmoothingSpline& spline, double x) {
    const int k = spline.degree;
    double h[kMaxDegree + 1];
    const size_t l = find_knot_interval(spline.knots, k, x);
    bspline_basis(spline.knots, k, x, l, h);
    double sp = 0.0;
    for (int j = 0; j <= k; ++j) {
        sp += spline.coefficients[l - k + j] * h[j];
    }
    return sp;
}

std::vector<double> evaluate_spline(const SmoothingSpline& spline, const std::vector<double>& x) {
    std::vector<double> values;
    values.reserve(x.size());
    for (double xi : x) {
        values.push_back(evaluate_spline(spline, xi));
    }
    return values;
}
