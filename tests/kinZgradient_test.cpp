#include <gtest/gtest.h>
#include "kinZgradient.hpp"

TEST(kinZgradient, exact_for_quadratics_on_uneven_grid) {
    const std::vector<double> x = {0.0, 1.0, 3.0, 4.0, 7.0};
    std::vector<double> y;
    for (double xi : x) y.push_back(xi * xi);

    const std::vector<double> d = numerical_gradient(y, x);
    ASSERT_EQ(d.size(), x.size());
    EXPECT_NEAR(d[0], 1.0, 1e-12);  // (1 - 0) / 1
    EXPECT_NEAR(d[1], 2.0, 1e-12);
    EXPECT_NEAR(d[2], 6.0, 1e-12);
    EXPECT_NEAR(d[3], 8.0, 1e-12);
    EXPECT_NEAR(d[4], 11.0, 1e-12); // (49 - 16) / 3
}

TEST(kinZgradient, two_points) {
    const std::vector<double> d = numerical_gradient({1.0, 4.0}, {0.0, 2.0});
    ASSERT_EQ(d.size(), 2u);
    EXPECT_DOUBLE_EQ(d[0], 1.5);
    EXPECT_DOUBLE_EQ(d[1], 1.5);
}

TEST(kinZgradient, invalid_input_gives_empty_result) {
    EXPECT_TRUE(numerical_gradient({1.0}, {0.0}).empty());
    EXPECT_TRUE(numerical_gradient({1.0, 2.0, 3.0}, {0.0, 1.0}).empty());
}
