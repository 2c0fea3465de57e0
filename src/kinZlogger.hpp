#ifndef KINZLOGGER_HPP
#define KINZLOGGER_HPP

#include <iostream>
#include <fstream>
#include <string>
#include <iomanip> // For std::setprecision

// Console + file mirror used by the kinZfit driver.
// Everything written with operator<< goes to every enabled sink.
// Warnings and errors additionally go to std::cerr when the console sink is off,
// so that --noconsole never hides a failure.
class Logger {
public:
    Logger();
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    // Returns false when the log file could not be opened (console output stays as requested).
    bool setup(bool enable_console, bool enable_file, const std::string& file_path);

    bool console_enabled() const { return console_output_enabled && console_stream != nullptr; }
    bool file_enabled() const { return file_output_enabled && file_stream.is_open(); }
    const std::string& file_path() const { return log_file_path; }

    template<typename T>
    Logger& operator<<(const T& val);

    typedef std::ostream& (*StandardEndlManipulator)(std::ostream&);
    typedef std::ios_base& (*StandardFlagManipulator)(std::ios_base&);

    Logger& operator<<(StandardEndlManipulator manip); // std::endl, std::flush
    Logger& operator<<(StandardFlagManipulator manip); // std::fixed, std::scientific

    Logger& setprecision(int n);

    // One-line messages with a severity prefix.
    void info(const std::string& message);
    void warning(const std::string& message);
    void error(const std::string& message);

private:
    void write_line(const char* prefix, const std::string& message, bool always_reach_stderr);

    std::ostream* console_stream = nullptr;
    std::ofstream file_stream;
    std::string log_file_path;
    bool file_output_enabled = false;
    bool console_output_enabled = true;
};

template<typename T>
Logger& Logger::operator<<(const T& val) {
    if (console_enabled()) {
        *console_stream << val;
    }
    if (file_enabled()) {
        file_stream << val;
    }
    return *this;
}

#endif // KINZLOGGER_HPP
