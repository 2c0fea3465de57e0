#ifndef KINZREAD_HPP
#define KINZREAD_HPP

#include <string>
#include <vector>
#include "kinZtypes.hpp"
#include "kinZlogger.hpp"

// Parameter table handed over by the geometric-model layer:
//   time,height,orthoaxis1
//   2021-10-28T15:30:00.000000,2.31,0.84
//   2021-10-28T15:42:00.000000,2.75,
// Blank cells are missing measurements (stored as NaN).
struct ParameterTable {
    std::vector<std::string> parameter_names;
    std::vector<TimePoint> times;
    std::vector<std::vector<double>> columns; // columns[p][row], one per parameter name
    bool success = false;
    std::string error_message;
};

// Reads a parameter table from a text file. Lines starting with '#' and empty lines are skipped.
ParameterTable read_parameter_table(const std::string& filepath, Logger& logger, bool output_header_info_flag);

// Same parser on an in-memory stream; `source_name` only appears in error messages.
ParameterTable parse_parameter_table(std::istream& input, const std::string& source_name);

// Column index of a parameter, or -1.
int find_parameter(const ParameterTable& table, const std::string& name);

// Series of one parameter with its missing cells dropped.
SampleSeries series_for_parameter(const ParameterTable& table, size_t column);

#endif // KINZREAD_HPP
