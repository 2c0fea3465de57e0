#include <iostream>
#include <iomanip>
#include <string>
#include <vector>
#include <filesystem> // For output paths (C++17)
#include "kinZargs.hpp"
#include "kinZlogger.hpp"
#include "kinZread.hpp"
#include "kinZkinematics.hpp"
#include "kinZoutput.hpp"

namespace {

void log_fit_summary(Logger& logger, const ParameterKinematics& p, bool print_speed) {
    logger << "--- " << p.name << " (" << p.samples.size() << " samples) ---" << std::endl;

    if (p.state == ParameterFitState::InsufficientSamples) {
        logger.warning(p.name + ": " + p.fit.message + " Raw samples are kept unfitted.");
        return;
    }
    if (p.state == ParameterFitState::Failed) {
        logger.error(p.name + ": " + fit_error_name(p.fit.error) + ": " + p.fit.message);
        return;
    }

    const FitCurve& curve = fit_curve(p.fit.result);
    const size_t last = curve.fitted_curve.size() - 1;

    if (const SplineFit* spline = std::get_if<SplineFit>(&p.fit.result)) {
        logger << "  Spline degree " << spline->spline.degree << ", smoothing " << spline->spline.smoothing
               << ", " << spline->spline.knots.size() << " knots, solver " << spline_status_name(spline->spline.status) << std::endl;
        logger << "  Residual sigma: " << spline->sigma << std::endl;
        if (!spline_reached_target(spline->spline.status)) {
            logger.warning(p.name + ": residual sum " + std::to_string(spline->spline.residual) +
                           " is not within tolerance of the smoothing factor.");
        }
        if (!spline->unconverged_sweep_smoothing.empty()) {
            std::string values;
            for (double s : spline->unconverged_sweep_smoothing) {
                values += (values.empty() ? "" : ", ") + std::to_string(s);
            }
            logger.warning(p.name + ": " + std::to_string(spline->unconverged_sweep_smoothing.size()) +
                           " envelope refits did not reach their smoothing factor (s = " + values + ").");
        }
    } else {
        const PolynomialFit& poly = std::get<PolynomialFit>(p.fit.result);
        logger << "  Coefficients (highest power first):";
        for (size_t i = 0; i < poly.coefficients.size(); ++i) {
            logger << " " << poly.coefficients[i] << " +/- " << poly.sigma[i];
        }
        logger << std::endl;
    }

    logger << "  Start: " << format_timestamp(curve.evaluation_axis.front()) << "  fit " << curve.fitted_curve.front()
           << " [" << curve.lower_band.front() << ", " << curve.upper_band.front() << "]" << std::endl;
    logger << "  End:   " << format_timestamp(curve.evaluation_axis[last]) << "  fit " << curve.fitted_curve[last]
           << " [" << curve.lower_band[last] << ", " << curve.upper_band[last] << "]" << std::endl;

    if (print_speed) {
        const VelocityResult& v = p.velocity;
        logger << "  Speed at start: " << v.speed.front() << " km/s, at end: " << v.speed[last] << " km/s";
        if (v.has_envelope) {
            logger << " (envelope at end [" << v.envelope_lower[last] << ", " << v.envelope_upper[last] << "])";
        }
        logger << std::endl;
    }
}

} // namespace

int main(int argc, char* argv[]) {

    ProgramOptions params;
    Logger logger;

    // --help / --version / 引数エラーの場合は parse_arguments がメッセージを出力する
    if (!parse_arguments(argc, argv, params)) {
        return 1;
    }

    // 出力ディレクトリの作成
    post_process_options(params);

    namespace fs = std::filesystem;
    const std::string input_basename = fs::path(params.input_filename).stem().string();

    std::string text_log_file_full_path_str;
    if (params.enable_text_output && !params.output_dir_final.empty()) {
        text_log_file_full_path_str = (fs::path(params.output_dir_final) / (input_basename + "_kinZfit_result.txt")).string();
    }

    if (!logger.setup(!params.noconsole, params.enable_text_output, text_log_file_full_path_str)) {
        std::cerr << "Warning: continuing without a log file." << std::endl;
    }

    if (params.enable_text_output && !params.output_dir_final.empty()) {
        logger << "Output directory for all files: " << params.output_dir_final << std::endl;
    }

    // === Step 1: パラメータテーブルの読み込み ===
    const ParameterTable table = read_parameter_table(params.input_filename, logger, params.output_header_info);
    if (!table.success) {
        return 1;
    }
    if (table.times.empty()) {
        logger.error("No data rows in " + params.input_filename);
        return 1;
    }

    // === Step 2: 各パラメータのフィッティング ===
    logger.setprecision(6);
    logger << "Fit: " << fit_kind_name(params.fit.kind) << " order " << params.fit.order;
    if (params.fit.kind == FitKind::Spline) {
        logger << " smoothing " << params.fit.smoothing;
    }
    logger << std::endl;

    const KinematicsReport report = fit_kinematics(table, params.fit, params.parameters);
    if (!report.success) {
        logger.error(report.message);
        return 1;
    }

    for (const ParameterKinematics& p : report.parameters) {
        log_fit_summary(logger, p, params.speed);
    }
    logger.info(report.message);

    // === Step 3: テキスト出力 ===
    bool write_ok = true;
    if (params.enable_text_output && !params.output_dir_final.empty()) {
        const fs::path out_dir(params.output_dir_final);
        for (const ParameterKinematics& p : report.parameters) {
            const std::string prefix = input_basename + "_" + p.name;
            if (p.state == ParameterFitState::Fitted) {
                const std::string fit_path = (out_dir / (prefix + "_fit.txt")).string();
                write_ok = write_fit_to_text(fit_path, p.name, params.fit, p.fit.result) && write_ok;
                if (params.speed) {
                    const std::string speed_path = (out_dir / (prefix + "_speed.txt")).string();
                    write_ok = write_velocity_to_text(speed_path, p.name, p.velocity) && write_ok;
                }
            } else if (p.state == ParameterFitState::InsufficientSamples) {
                const std::string samples_path = (out_dir / (prefix + "_samples.txt")).string();
                write_ok = write_samples_to_text(samples_path, p.name, p.samples) && write_ok;
            }
        }
    }

    if (count_parameters(report, ParameterFitState::Failed) > 0 || !write_ok) {
        return 1;
    }
    return 0;
}
