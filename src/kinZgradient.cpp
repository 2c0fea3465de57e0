#include "kinZgradient.hpp"

std::vector<double> numerical_gradient(
    const std::vector<double>& y,
    const std::vector<double>& x) {

    const size_t n = y.size();
    std::vector<double> dydx;
    if (n < 2 || x.size() != n) {
        return dydx;
    }
    dydx.resize(n);

    for (size_t i = 1; i + 1 < n; ++i) {
        const double dx1 = x[i] - x[i - 1];
        const double dx2 = x[i + 1] - x[i];
        const double a = -dx2 / (dx1 * (dx1 + dx2));
        const double b = (dx2 - dx1) / (dx1 * dx2);
        const double c = dx1 / (dx2 * (dx1 + dx2));
        dydx[i] = a * y[i - 1] + b * y[i] + c * y[i + 1];
    }

    dydx[0] = (y[1] - y[0]) / (x[1] - x[0]);
    dydx[n - 1] = (y[n - 1] - y[n - 2]) / (x[n - 1] - x[n - 2]);
    return dydx;
}
