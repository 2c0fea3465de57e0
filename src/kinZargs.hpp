#ifndef KINZARGS_HPP
#define KINZARGS_HPP

#include <string>
#include <vector>
#include "kinZfitting.hpp"

// ProgramOptions 構造体の定義
struct ProgramOptions {
    std::string input_filename;
    FitConfiguration fit;                 // --type, --order, --smooth
    std::vector<std::string> parameters;  // --param, empty = every column
    bool speed = false;                   // also derive speed curves
    bool enable_text_output = false;      // --output
    bool noconsole = false;
    bool output_header_info = false;
    std::string output_dir_final;
};

// 引数を解析し、ProgramOptions 構造体に設定する関数
// 成功した場合は true、ヘルプ/バージョン表示やエラーの場合は false を返す
bool parse_arguments(int argc, char* argv[], ProgramOptions& params);

// パース後にオプションを最終処理する関数 (出力ディレクトリの作成)
void post_process_options(ProgramOptions& params);

#endif // KINZARGS_HPP
