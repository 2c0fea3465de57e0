#ifndef KINZKINEMATICS_HPP
#define KINZKINEMATICS_HPP

#include <string>
#include <vector>
#include "kinZfitting.hpp"
#include "kinZvelocity.hpp"
#include "kinZread.hpp"

enum class ParameterFitState {
    Fitted,
    InsufficientSamples, // too few samples for the order; draw the raw samples as a line
    Failed,
};

const char* parameter_state_name(ParameterFitState state);

struct ParameterKinematics {
    std::string name;
    SampleSeries samples;
    ParameterFitState state = ParameterFitState::Failed;
    FitOutcome fit;          // result valid when state == Fitted, error details when Failed
    VelocityResult velocity; // valid when state == Fitted
};

struct KinematicsReport {
    FitConfiguration config;
    std::vector<ParameterKinematics> parameters;
    bool success = false;
    std::string message;
};

// Fits every selected parameter of the table with the same configuration.
// An empty selection means every column. A failing parameter does not stop the others;
// an unknown parameter name fails the whole report.
KinematicsReport fit_kinematics(
    const ParameterTable& table,
    const FitConfiguration& config,
    const std::vector<std::string>& selected_parameters
);

size_t count_parameters(const KinematicsReport& report, ParameterFitState state);

#endif // KINZKINEMATICS_HPP
