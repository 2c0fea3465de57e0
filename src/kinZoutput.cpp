#include "kinZoutput.hpp"
#include <fstream>
#include <iostream>
#include <iomanip>

namespace {

bool open_for_writing(const std::string& output_path, std::ofstream& outfile) {
    outfile.open(output_path);
    if (!outfile) {
        std::cerr << "Error: Cannot open file for writing: " << output_path << std::endl;
        return false;
    }
    outfile << std::setprecision(10);
    return true;
}

} // namespace

void print_fit_table(std::ostream& out, const std::string& parameter_name, const FitConfiguration& config, const FitResult& fit) {
    const FitCurve& curve = fit_curve(fit);
    const SplineFit* spline = std::get_if<SplineFit>(&fit);

    out << "# Parameter: " << parameter_name << std::endl;
    out << "# Fit: " << fit_kind_name(config.kind) << " order " << config.order;
    if (config.kind == FitKind::Spline) {
        out << " smoothing " << config.smoothing;
    }
    out << std::endl;

    if (spline) {
        out << "# Residual sigma: " << spline->sigma << std::endl;
        out << "# Spline knots: " << spline->spline.knots.size()
            << ", residual sum: " << spline->spline.residual
            << ", solver: " << spline_status_name(spline->spline.status) << std::endl;
        out << "# Unconverged envelope refits: " << spline->unconverged_sweep_smoothing.size() << std::endl;
        out << "# time, offset_days, fit, upper, lower, envelope_upper, envelope_lower" << std::endl;
    } else {
        const PolynomialFit& poly = std::get<PolynomialFit>(fit);
        out << "# Coefficients (highest power first) +/- sigma:";
        for (size_t i = 0; i < poly.coefficients.size(); ++i) {
            out << " " << poly.coefficients[i] << "+/-" << poly.sigma[i];
        }
        out << std::endl;
        out << "# time, offset_days, fit, upper, lower" << std::endl;
    }

    for (size_t j = 0; j < curve.evaluation_offsets.size(); ++j) {
        out << format_timestamp(curve.evaluation_axis[j]) << ", "
            << curve.evaluation_offsets[j] << ", "
            << curve.fitted_curve[j] << ", "
            << curve.upper_band[j] << ", "
            << curve.lower_band[j];
        if (spline) {
            out << ", " << spline->secondary_upper[j]
                << ", " << spline->secondary_lower[j];
        }
        out << "\n";
    }
    out << std::flush;
}

void print_velocity_table(std::ostream& out, const std::string& parameter_name, const VelocityResult& velocity) {
    out << "# Parameter: " << parameter_name << " (speed, km/s)" << std::endl;
    if (velocity.has_envelope) {
        out << "# time, offset_days, speed_kms, upper_kms, lower_kms, envelope_upper_kms, envelope_lower_kms" << std::endl;
    } else {
        out << "# time, offset_days, speed_kms, upper_kms, lower_kms" << std::endl;
    }
    for (size_t j = 0; j < velocity.evaluation_offsets.size(); ++j) {
        out << format_timestamp(velocity.evaluation_axis[j]) << ", "
            << velocity.evaluation_offsets[j] << ", "
            << velocity.speed[j] << ", "
            << velocity.upper_band[j] << ", "
            << velocity.lower_band[j];
        if (velocity.has_envelope) {
            out << ", " << velocity.envelope_upper[j]
                << ", " << velocity.envelope_lower[j];
        }
        out << "\n";
    }
    out << std::flush;
}

bool write_fit_to_text(
    const std::string& output_path,
    const std::string& parameter_name,
    const FitConfiguration& config,
    const FitResult& fit) {
    std::ofstream outfile;
    if (!open_for_writing(output_path, outfile)) {
        return false;
    }
    print_fit_table(outfile, parameter_name, config, fit);
    return static_cast<bool>(outfile);
}

bool write_velocity_to_text(
    const std::string& output_path,
    const std::string& parameter_name,
    const VelocityResult& velocity) {
    std::ofstream outfile;
    if (!open_for_writing(output_path, outfile)) {
        return false;
    }
    print_velocity_table(outfile, parameter_name, velocity);
    return static_cast<bool>(outfile);
}

bool write_samples_to_text(
    const std::string& output_path,
    const std::string& parameter_name,
    const SampleSeries& samples) {
    std::ofstream outfile;
    if (!open_for_writing(output_path, outfile)) {
        return false;
    }
    outfile << "# Parameter: " << parameter_name << " (raw samples, not fitted)" << std::endl;
    outfile << "# time, value" << std::endl;
    for (size_t i = 0; i < samples.size(); ++i) {
        outfile << format_timestamp(samples.times[i]) << ", " << samples.values[i] << "\n";
    }
    outfile << std::flush;
    return static_cast<bool>(outfile);
}
