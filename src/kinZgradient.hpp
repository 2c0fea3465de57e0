#ifndef KINZGRADIENT_HPP
#define KINZGRADIENT_HPP

#include <cstddef>
#include <vector>

// Numerical derivative dy/dx on a possibly non-uniform axis.
// Interior points use the second-order central difference for uneven spacing,
// the two end points use one-sided first differences.
// Returns an empty vector if the sizes differ or fewer than 2 points are given.
std::vector<double> numerical_gradient(
    const std::vector<double>& y,
    const std::vector<double>& x
);

#endif // KINZGRADIENT_HPP
