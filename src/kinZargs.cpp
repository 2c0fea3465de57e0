#include "kinZargs.hpp"
#include <iostream> // For std::cerr
#include <filesystem> // For directory creation
#include <string>
#include <vector>
#include <stdexcept>  // For std::invalid_argument, std::out_of_range

namespace {

// ヘルパー関数: 文字列をdoubleに変換 (エラーチェック付き)
bool string_to_double(const std::string& s, double& value) {
    try {
        size_t processed_chars;
        value = std::stod(s, &processed_chars);
        return processed_chars == s.length();
    } catch (const std::invalid_argument&) {
        std::cerr << "Error: invalid number: " << s << std::endl;
        return false;
    } catch (const std::out_of_range&) {
        std::cerr << "Error: number out of range: " << s << std::endl;
        return false;
    }
}

// ヘルパー関数: 文字列をintに変換 (エラーチェック付き)
bool string_to_int(const std::string& s, int& value) {
    try {
        size_t processed_chars;
        value = std::stoi(s, &processed_chars);
        return processed_chars == s.length();
    } catch (const std::invalid_argument&) {
        std::cerr << "Error: invalid integer: " << s << std::endl;
        return false;
    } catch (const std::out_of_range&) {
        std::cerr << "Error: integer out of range: " << s << std::endl;
        return false;
    }
}

bool is_option(const char* arg) {
    return arg[0] == '-' && arg[1] == '-';
}

void print_help() {
    std::cout << "kinZfit:" << std::endl;
    std::cout << ">> Fits the time evolution of geometric model parameters (height, axis radii, ...)" << std::endl;
    std::cout << ">> of a solar eruptive event and derives speeds with uncertainty bands." << std::endl;
    std::cout << "" << std::endl;
    std::cout << "Usage: kinZfit --input <table.csv> [options]" << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "    --input <file>        Parameter table: time,<param>,... (required)" << std::endl;
    std::cout << "    --type <poly|spline>  Fit strategy (default: poly)" << std::endl;
    std::cout << "    --order <n>           Polynomial degree or spline degree 1..5 (default: 2)" << std::endl;
    std::cout << "    --smooth <s>          Spline smoothing factor, >= 0 (default: 0.1)" << std::endl;
    std::cout << "    --param <name> ...    Parameters to fit (default: every column)" << std::endl;
    std::cout << "    --speed               Derive speed curves (km/s) from the fits" << std::endl;
    std::cout << "    --output              Write log and tables to 'kinZ/kinZfit' next to the input file" << std::endl;
    std::cout << "    --header              Print a summary of the parameter table" << std::endl;
    std::cout << "    --noconsole           Suppress console output (errors still go to stderr)" << std::endl;
    std::cout << "    --help                Show this message and exit" << std::endl;
    std::cout << "    --version             Show version information and exit" << std::endl;
}

void print_version() {
    std::cout << "kinZfit v1.0" << std::endl;
}

} // namespace

bool parse_arguments(int argc, char* argv[], ProgramOptions& params) {
    if (argc == 1) { // 引数なしの場合
        print_help();
        return false;
    }

    bool smoothing_set = false;
    params.fit.kind = FitKind::Polynomial;
    params.fit.order = 2;
    params.fit.smoothing = 0.1;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            print_help();
            return false;
        } else if (arg == "--version") {
            print_version();
            return false;
        } else if (arg == "--input") {
            if (i + 1 < argc) {
                params.input_filename = argv[++i];
                if (!std::filesystem::exists(params.input_filename) || !std::filesystem::is_regular_file(params.input_filename)) {
                    std::cerr << "Error: input file not found or not a regular file: " << params.input_filename << std::endl;
                    return false;
                }
            } else {
                std::cerr << "Error: --input requires a file name." << std::endl;
                return false;
            }
        } else if (arg == "--type") {
            if (i + 1 < argc) {
                const std::string type = argv[++i];
                if (type == "poly") {
                    params.fit.kind = FitKind::Polynomial;
                } else if (type == "spline") {
                    params.fit.kind = FitKind::Spline;
                } else {
                    std::cerr << "Error: --type must be 'poly' or 'spline', got: " << type << std::endl;
                    return false;
                }
            } else {
                std::cerr << "Error: --type requires 'poly' or 'spline'." << std::endl;
                return false;
            }
        } else if (arg == "--order") {
            if (i + 1 < argc) {
                if (!string_to_int(argv[++i], params.fit.order)) return false;
                if (params.fit.order < 1) {
                    std::cerr << "Error: --order must be a positive integer." << std::endl;
                    return false;
                }
            } else {
                std::cerr << "Error: --order requires an integer." << std::endl;
                return false;
            }
        } else if (arg == "--smooth") {
            if (i + 1 < argc) {
                if (!string_to_double(argv[++i], params.fit.smoothing)) return false;
                if (!(params.fit.smoothing >= 0.0)) {
                    std::cerr << "Error: --smooth must be non-negative." << std::endl;
                    return false;
                }
                smoothing_set = true;
            } else {
                std::cerr << "Error: --smooth requires a number." << std::endl;
                return false;
            }
        } else if (arg == "--param") {
            // 次の引数が "--" で始まらない限り，パラメータ名として解釈
            const size_t before = params.parameters.size();
            while (i + 1 < argc && !is_option(argv[i + 1])) {
                params.parameters.push_back(argv[++i]);
            }
            if (params.parameters.size() == before) {
                std::cerr << "Error: --param requires at least one parameter name." << std::endl;
                return false;
            }
        } else if (arg == "--speed") {
            params.speed = true;
        } else if (arg == "--output") {
            params.enable_text_output = true;
        } else if (arg == "--header") {
            params.output_header_info = true;
        } else if (arg == "--noconsole") {
            params.noconsole = true;
        } else {
            std::cerr << "Error: unknown option: " << arg << std::endl;
            std::cout << "Run kinZfit --help to list the options." << std::endl;
            return false;
        }
    }

    // 必須オプションのチェック
    if (params.input_filename.empty()) {
        std::cerr << "Error: --input is required." << std::endl;
        return false;
    }
    if (params.fit.kind == FitKind::Spline && params.fit.order > 5) {
        std::cerr << "Error: spline order must be between 1 and 5, got " << params.fit.order << "." << std::endl;
        return false;
    }
    if (params.fit.kind == FitKind::Polynomial && smoothing_set) {
        std::cerr << "Warning: --smooth is ignored for polynomial fits." << std::endl;
    }

    return true;
}

void post_process_options(ProgramOptions& params) {
    if (!params.enable_text_output) {
        return;
    }
    namespace fs = std::filesystem;
    fs::path absolute_input_path = fs::absolute(fs::path(params.input_filename));
    fs::path base_output_dir = absolute_input_path.parent_path();

    params.output_dir_final = (base_output_dir / "kinZ" / "kinZfit").string();
    try {
        fs::create_directories(params.output_dir_final);
    } catch (const fs::filesystem_error& e) {
        std::cerr << "Error: failed to create output directory '" << params.output_dir_final << "': " << e.what() << std::endl;
        params.enable_text_output = false; // Disable if dir creation fails
        params.output_dir_final.clear();
    }
}
