#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include "kinZoutput.hpp"
#include "kinZtest_util.hpp"

namespace {

size_t count_lines(const std::string& text, bool comments) {
    std::istringstream stream(text);
    std::string line;
    size_t count = 0;
    while (std::getline(stream, line)) {
        if (!line.empty() && (line[0] == '#') == comments) count++;
    }
    return count;
}

FitOutcome polynomial_fit() {
    FitConfiguration config;
    config.order = 1;
    return fit_parameter(series_at_days({0.0, 0.1, 0.2, 0.3}, {1.0, 1.4, 1.9, 2.2}), config);
}

} // namespace

TEST(kinZoutput, polynomial_table) {
    FitConfiguration config;
    config.order = 1;
    const FitOutcome outcome = polynomial_fit();
    ASSERT_TRUE(outcome.success) << outcome.message;

    std::ostringstream out;
    print_fit_table(out, "height", config, outcome.result);
    const std::string text = out.str();
    EXPECT_EQ(text.rfind("# Parameter: height\n# Fit: poly order 1\n", 0), 0u) << text;
    EXPECT_NE(text.find("# time, offset_days, fit, upper, lower\n"), std::string::npos);
    EXPECT_EQ(count_lines(text, false), kEvaluationPointCount);
    EXPECT_NE(text.find("\n2021-10-28T00:00:00.000000, 0, "), std::string::npos);
}

TEST(kinZoutput, spline_tables_carry_envelope_columns) {
    FitConfiguration config;
    config.kind = FitKind::Spline;
    config.order = 2;
    config.smoothing = 0.1;
    const FitOutcome outcome = fit_parameter(
        series_at_days({0.0, 0.05, 0.1, 0.15, 0.2, 0.25}, {1.0, 1.3, 1.5, 1.9, 2.2, 2.7}), config);
    ASSERT_TRUE(outcome.success) << outcome.message;

    std::ostringstream fit_out;
    print_fit_table(fit_out, "height", config, outcome.result);
    EXPECT_NE(fit_out.str().find("envelope_upper, envelope_lower"), std::string::npos);
    EXPECT_NE(fit_out.str().find("# Fit: spline order 2 smoothing 0.1"), std::string::npos);
    const SplineFit& fit = std::get<SplineFit>(outcome.result);
    EXPECT_NE(fit_out.str().find("# Unconverged envelope refits: " + std::to_string(fit.unconverged_sweep_smoothing.size()) + "\n"),
              std::string::npos);
    EXPECT_EQ(count_lines(fit_out.str(), false), kEvaluationPointCount);

    std::ostringstream speed_out;
    print_velocity_table(speed_out, "height", derive_velocity(outcome.result));
    EXPECT_NE(speed_out.str().find("envelope_upper_kms, envelope_lower_kms"), std::string::npos);
    EXPECT_EQ(count_lines(speed_out.str(), false), kEvaluationPointCount);
}

TEST(kinZoutput, writes_files) {
    namespace fs = std::filesystem;
    const fs::path dir = fs::temp_directory_path() / "kinZoutput_test";
    fs::create_directories(dir);

    const FitOutcome outcome = polynomial_fit();
    ASSERT_TRUE(outcome.success);
    FitConfiguration config;
    config.order = 1;

    const fs::path fit_path = dir / "height_fit.txt";
    ASSERT_TRUE(write_fit_to_text(fit_path.string(), "height", config, outcome.result));
    const fs::path speed_path = dir / "height_speed.txt";
    ASSERT_TRUE(write_velocity_to_text(speed_path.string(), "height", derive_velocity(outcome.result)));
    const fs::path samples_path = dir / "tilt_samples.txt";
    ASSERT_TRUE(write_samples_to_text(samples_path.string(), "tilt", series_at_days({0.0, 0.5}, {10.0, 12.0})));

    std::ifstream in(samples_path);
    std::stringstream buffer;
    buffer << in.rdbuf();
    EXPECT_NE(buffer.str().find("2021-10-28T12:00:00.000000, 12"), std::string::npos) << buffer.str();
    EXPECT_TRUE(fs::file_size(fit_path) > 0);
    EXPECT_TRUE(fs::file_size(speed_path) > 0);

    EXPECT_FALSE(write_fit_to_text((dir / "missing" / "x.txt").string(), "height", config, outcome.result));

    fs::remove_all(dir);
}
