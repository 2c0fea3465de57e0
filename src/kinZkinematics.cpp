#include "kinZkinematics.hpp"
#include <utility> // For std::move

const char* parameter_state_name(ParameterFitState state) {
    switch (state) {
    case ParameterFitState::Fitted:
        return "fitted";
    case ParameterFitState::InsufficientSamples:
        return "insufficient samples";
    case ParameterFitState::Failed:
        return "failed";
    }
    return "unknown";
}

KinematicsReport fit_kinematics(
    const ParameterTable& table,
    const FitConfiguration& config,
    const std::vector<std::string>& selected_parameters) {

    KinematicsReport report;
    report.config = config;

    std::vector<size_t> columns;
    if (selected_parameters.empty()) {
        for (size_t p = 0; p < table.parameter_names.size(); ++p) {
            columns.push_back(p);
        }
    } else {
        for (const std::string& name : selected_parameters) {
            const int column = find_parameter(table, name);
            if (column < 0) {
                report.message = "Unknown parameter '" + name + "'.";
                return report;
            }
            columns.push_back(static_cast<size_t>(column));
        }
    }

    for (size_t column : columns) {
        ParameterKinematics entry;
        entry.name = table.parameter_names[column];
        entry.samples = series_for_parameter(table, column);

        if (!can_fit(entry.samples.size(), config)) {
            entry.state = ParameterFitState::InsufficientSamples;
            entry.fit.error = FitError::UnderdeterminedFit;
            entry.fit.message = std::to_string(entry.samples.size()) + " samples are not enough for order " +
                                std::to_string(config.order) + ".";
            report.parameters.push_back(std::move(entry));
            continue;
        }

        entry.fit = fit_parameter(entry.samples, config);
        if (entry.fit.success) {
            entry.state = ParameterFitState::Fitted;
            entry.velocity = derive_velocity(entry.fit.result);
        } else {
            entry.state = ParameterFitState::Failed;
        }
        report.parameters.push_back(std::move(entry));
    }

    report.success = true;
    report.message = std::to_string(count_parameters(report, ParameterFitState::Fitted)) + " of " +
                     std::to_string(report.parameters.size()) + " parameters fitted.";
    return report;
}

size_t count_parameters(const KinematicsReport& report, ParameterFitState state) {
    size_t count = 0;
    for (const ParameterKinematics& p : report.parameters) {
        if (p.state == state) count++;
    }
    return count;
}
