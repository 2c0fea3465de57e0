#include "kinZlogger.hpp"

Logger::Logger() : console_stream(&std::cout), file_output_enabled(false), console_output_enabled(true) {
}

bool Logger::setup(bool enable_console, bool enable_file, const std::string& file_path) {
    console_output_enabled = enable_console;
    console_stream = enable_console ? &std::cout : nullptr;

    if (file_stream.is_open()) {
        file_stream.close();
    }
    file_output_enabled = false;
    log_file_path.clear();

    if (!enable_file || file_path.empty()) {
        return !enable_file;
    }

    file_stream.open(file_path);
    if (!file_stream.is_open()) {
        std::cerr << "Error: Could not open log file: " << file_path << std::endl;
        return false;
    }
    file_output_enabled = true;
    log_file_path = file_path;
    return true;
}

Logger& Logger::operator<<(StandardEndlManipulator manip) {
    if (console_enabled()) manip(*console_stream);
    if (file_enabled()) manip(file_stream);
    return *this;
}

Logger& Logger::operator<<(StandardFlagManipulator manip) {
    if (console_enabled()) manip(*console_stream);
    if (file_enabled()) manip(file_stream);
    return *this;
}

Logger& Logger::setprecision(int n) {
    if (console_enabled()) *console_stream << std::setprecision(n);
    if (file_enabled()) file_stream << std::setprecision(n);
    return *this;
}

void Logger::info(const std::string& message) {
    write_line("", message, false);
}

void Logger::warning(const std::string& message) {
    write_line("Warning: ", message, true);
}

void Logger::error(const std::string& message) {
    write_line("Error: ", message, true);
}

void Logger::write_line(const char* prefix, const std::string& message, bool always_reach_stderr) {
    if (console_enabled()) {
        *console_stream << prefix << message << std::endl;
    } else if (always_reach_stderr) {
        std::cerr << prefix << message << std::endl;
    }
    if (file_enabled()) {
        file_stream << prefix << message << std::endl;
    }
}

Logger::~Logger() {
    if (file_stream.is_open()) {
        file_stream.close();
    }
}
