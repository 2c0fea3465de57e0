#ifndef KINZOUTPUT_HPP
#define KINZOUTPUT_HPP

#include <ostream>
#include <string>
#include "kinZfitting.hpp"
#include "kinZvelocity.hpp"

// Text tables, one row per evaluation point. Return false if the file cannot be written.

// Columns: time, offset_days, fit, upper, lower[, envelope_upper, envelope_lower]
bool write_fit_to_text(
    const std::string& output_path,
    const std::string& parameter_name,
    const FitConfiguration& config,
    const FitResult& fit);

// Columns: time, offset_days, speed_kms, upper_kms, lower_kms[, envelope_upper_kms, envelope_lower_kms]
bool write_velocity_to_text(
    const std::string& output_path,
    const std::string& parameter_name,
    const VelocityResult& velocity);

// Raw samples of a parameter that could not be fitted. Columns: time, value
bool write_samples_to_text(
    const std::string& output_path,
    const std::string& parameter_name,
    const SampleSeries& samples);

// Stream versions used by the file writers.
void print_fit_table(std::ostream& out, const std::string& parameter_name, const FitConfiguration& config, const FitResult& fit);
void print_velocity_table(std::ostream& out, const std::string& parameter_name, const VelocityResult& velocity);

#endif // KINZOUTPUT_HPP
