#include "kinZread.hpp"
#include "kinZtime.hpp"
#include <fstream>
#include <iostream>  // For std::cerr in case logger console is off
#include <limits>    // For std::numeric_limits
#include <sstream>
#include <stdexcept> // For std::invalid_argument, std::out_of_range

namespace {

std::string trim(const std::string& s) {
    const char* whitespace = " \t\r\n";
    const size_t begin = s.find_first_not_of(whitespace);
    if (begin == std::string::npos) {
        return "";
    }
    const size_t end = s.find_last_not_of(whitespace);
    return s.substr(begin, end - begin + 1);
}

std::vector<std::string> split_cells(const std::string& line) {
    std::vector<std::string> cells;
    std::string cell;
    std::istringstream stream(line);
    while (std::getline(stream, cell, ',')) {
        cells.push_back(trim(cell));
    }
    // "a,b," has a trailing blank cell that getline does not report
    if (!line.empty() && line.back() == ',') {
        cells.push_back("");
    }
    return cells;
}

bool cell_to_double(const std::string& s, double& value) {
    try {
        size_t processed_chars;
        value = std::stod(s, &processed_chars);
        return processed_chars == s.length();
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

ParameterTable fail_at(ParameterTable& table, const std::string& source_name, size_t line_number, const std::string& what) {
    table.success = false;
    table.error_message = source_name + ":" + std::to_string(line_number) + ": " + what;
    table.parameter_names.clear();
    table.times.clear();
    table.columns.clear();
    return table;
}

} // namespace

ParameterTable parse_parameter_table(std::istream& input, const std::string& source_name) {
    ParameterTable table;
    std::string line;
    size_t line_number = 0;
    bool header_seen = false;

    while (std::getline(input, line)) {
        ++line_number;
        const std::string content = trim(line);
        if (content.empty() || content[0] == '#') {
            continue;
        }
        const std::vector<std::string> cells = split_cells(content);

        if (!header_seen) {
            if (cells.size() < 2 || cells[0] != "time") {
                return fail_at(table, source_name, line_number, "header must be 'time,<parameter>,...'");
            }
            for (size_t c = 1; c < cells.size(); ++c) {
                if (cells[c].empty()) {
                    return fail_at(table, source_name, line_number, "empty parameter name in column " + std::to_string(c + 1));
                }
                for (size_t p = 0; p < table.parameter_names.size(); ++p) {
                    if (table.parameter_names[p] == cells[c]) {
                        return fail_at(table, source_name, line_number, "duplicate parameter '" + cells[c] + "'");
                    }
                }
                table.parameter_names.push_back(cells[c]);
            }
            table.columns.resize(table.parameter_names.size());
            header_seen = true;
            continue;
        }

        if (cells.size() != table.parameter_names.size() + 1) {
            return fail_at(table, source_name, line_number,
                           "expected " + std::to_string(table.parameter_names.size() + 1) +
                           " cells, found " + std::to_string(cells.size()));
        }
        TimePoint t;
        if (!parse_timestamp(cells[0], t)) {
            return fail_at(table, source_name, line_number, "invalid timestamp '" + cells[0] + "'");
        }
        table.times.push_back(t);
        for (size_t p = 0; p < table.parameter_names.size(); ++p) {
            const std::string& cell = cells[p + 1];
            double value = std::numeric_limits<double>::quiet_NaN();
            if (!cell.empty() && !cell_to_double(cell, value)) {
                return fail_at(table, source_name, line_number, "invalid number '" + cell + "' for " + table.parameter_names[p]);
            }
            table.columns[p].push_back(value);
        }
    }

    if (!header_seen) {
        return fail_at(table, source_name, line_number, "no header line found");
    }
    table.success = true;
    return table;
}

ParameterTable read_parameter_table(const std::string& filepath, Logger& logger, bool output_header_info_flag) {
    std::ifstream infile(filepath);
    if (!infile) {
        ParameterTable result;
        result.error_message = "Error opening file: " + filepath;
        logger.error(result.error_message);
        return result;
    }

    ParameterTable result = parse_parameter_table(infile, filepath);
    if (!result.success) {
        logger.error(result.error_message);
        return result;
    }

    if (output_header_info_flag) {
        logger << "=== Parameter table (from kinZread) ===\n";
        logger << "File: " << filepath << "\n";
        logger << "Rows: " << result.times.size() << "\n";
        if (!result.times.empty()) {
            logger << "First time: " << format_timestamp(result.times.front()) << "\n";
            logger << "Last time:  " << format_timestamp(result.times.back()) << "\n";
        }
        for (size_t p = 0; p < result.parameter_names.size(); ++p) {
            const SampleSeries series = series_for_parameter(result, p);
            logger << "Parameter " << result.parameter_names[p] << ": " << series.size() << " samples\n";
        }
        logger << std::flush;
    }
    return result;
}

int find_parameter(const ParameterTable& table, const std::string& name) {
    for (size_t p = 0; p < table.parameter_names.size(); ++p) {
        if (table.parameter_names[p] == name) {
            return static_cast<int>(p);
        }
    }
    return -1;
}

SampleSeries series_for_parameter(const ParameterTable& table, size_t column) {
    if (column >= table.columns.size()) {
        return SampleSeries();
    }
    return make_sample_series(table.times, table.columns[column]);
}
