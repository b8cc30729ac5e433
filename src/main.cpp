#include "codegen/cpp_header.hpp"
#include "common/config.hpp"
#include "common/debug_messages.hpp"
#include "common/error.hpp"
#include "common/source.hpp"
#include "driver/compiler.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace errtree {

constexpr const char* kVersion = "0.1.0";

// コマンドラインオプション
enum class Command { None, Check, Doc, Header, Help };

struct Options {
    Command command = Command::None;
    std::string input_file;
    std::string output_file;  // -o オプション
    std::string config_file;  // --config=
    std::string ns;           // --namespace=
    bool unique_codes = false;
    bool debug = false;
    std::string debug_level = "info";
};

// ヘルプメッセージを表示
void print_help(const char* program_name) {
    std::cout << "errtree エラー分類コンパイラ v" << kVersion << "\n\n";
    std::cout << "使用方法:\n";
    std::cout << "  " << program_name << " <コマンド> [オプション] <ファイル>\n\n";
    std::cout << "コマンド:\n";
    std::cout << "  check <file>          分類をコンパイルして検証のみ行う\n";
    std::cout << "  doc <file>            ドキュメント一覧を出力\n";
    std::cout << "  header <file>         C++ヘッダーを生成\n";
    std::cout << "  help                  このヘルプを表示\n\n";
    std::cout << "オプション:\n";
    std::cout << "  -o <file>             出力ファイル名を指定\n";
    std::cout << "  --config=<path>       設定ファイル (既定: .errtree.yml を探索)\n";
    std::cout << "  --namespace=<ns>      生成ヘッダーの名前空間\n";
    std::cout << "  --unique-codes        同じコードの再利用をエラーにする\n";
    std::cout << "  --debug, -d           デバッグ出力を有効化\n";
    std::cout << "  -d=<level>            デバッグレベル（trace/debug/info/warn/error）\n\n";
    std::cout << "その他のオプション:\n";
    std::cout << "  --lang=ja             日本語デバッグメッセージ\n";
    std::cout << "  --version             バージョン情報を表示\n\n";
    std::cout << "例:\n";
    std::cout << "  " << program_name << " check errors.etree\n";
    std::cout << "  " << program_name << " header --namespace=app::errors -o errors.hpp errors.etree\n";
}

// コマンドラインオプションをパース
Options parse_options(int argc, char* argv[]) {
    Options opts;

    if (argc < 2) {
        return opts;  // コマンドなし
    }

    // 最初の引数でコマンドを判定
    std::string cmd = argv[1];
    if (cmd == "check") {
        opts.command = Command::Check;
    } else if (cmd == "doc") {
        opts.command = Command::Doc;
    } else if (cmd == "header") {
        opts.command = Command::Header;
    } else if (cmd == "help" || cmd == "--help" || cmd == "-h") {
        opts.command = Command::Help;
        return opts;
    } else if (cmd == "--version") {
        std::cout << "errtreec v" << kVersion << "\n";
        std::exit(0);
    } else {
        std::cerr << "不明なコマンド: " << cmd << "\n";
        std::cerr << "'errtreec help' でヘルプを表示\n";
        std::exit(1);
    }

    // 残りの引数を処理
    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-o") {
            if (i + 1 < argc) {
                opts.output_file = argv[++i];
            } else {
                std::cerr << "-o オプションには出力ファイル名が必要です\n";
                std::exit(1);
            }
        } else if (arg.starts_with("--config=")) {
            opts.config_file = arg.substr(9);
        } else if (arg.starts_with("--namespace=")) {
            opts.ns = arg.substr(12);
        } else if (arg == "--unique-codes") {
            opts.unique_codes = true;
        } else if (arg == "--debug" || arg == "-d") {
            opts.debug = true;
            debug::set_debug_mode(true);
        } else if (arg.starts_with("-d=")) {
            opts.debug = true;
            opts.debug_level = arg.substr(3);
            debug::set_debug_mode(true);
            debug::set_level(debug::parse_level(opts.debug_level));
        } else if (arg == "--lang=ja") {
            debug::set_lang(1);
        } else if (arg[0] != '-') {
            if (opts.input_file.empty()) {
                opts.input_file = arg;
            } else {
                std::cerr << "複数の入力ファイルは指定できません\n";
                std::exit(1);
            }
        } else {
            std::cerr << "不明なオプション: " << arg << "\n";
            std::cerr << "'errtreec help' でヘルプを表示\n";
            std::exit(1);
        }
    }

    return opts;
}

// ファイルを読み込む
bool read_file(const std::string& filename, std::string& out) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        return false;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    out = buffer.str();
    return true;
}

// 出力先（-o があればファイル、なければ標準出力）に書き込む
bool write_output(const Options& opts, const std::string& content) {
    if (opts.output_file.empty()) {
        std::cout << content;
        return true;
    }
    std::ofstream file(opts.output_file);
    if (!file.is_open()) {
        std::cerr << "エラー: 出力ファイルを開けません: " << opts.output_file << "\n";
        return false;
    }
    file << content;
    return true;
}

}  // namespace errtree

int main(int argc, char* argv[]) {
    using namespace errtree;

    // オプションをパース
    Options opts = parse_options(argc, argv);

    if (opts.command == Command::Help) {
        print_help(argv[0]);
        return 0;
    }

    if (opts.command == Command::None || opts.input_file.empty()) {
        if (argc == 1) {
            std::cerr << "エラー: コマンドが指定されていません\n";
            std::cerr << "'errtreec help' でヘルプを表示\n";
        } else {
            std::cerr << "エラー: 入力ファイルが指定されていません\n";
        }
        return 1;
    }

    // 設定ファイル
    ConfigLoader config;
    if (!opts.config_file.empty()) {
        if (!config.load(opts.config_file)) {
            std::cerr << "エラー: 設定ファイルを読み込めません: " << opts.config_file << "\n";
            return 1;
        }
    } else {
        config.find_and_load(".");
    }
    const Settings& settings = config.settings();

    // コマンドラインが設定ファイルより優先
    CompileOptions compile_options;
    compile_options.unique_codes = settings.unique_codes || opts.unique_codes;
    compile_options.unique_identifiers = settings.unique_identifiers;

    std::string code;
    if (!read_file(opts.input_file, code)) {
        std::cerr << "エラー: ファイルを開けません: " << opts.input_file << "\n";
        return 1;
    }
    auto source = std::make_shared<const SourceFile>(opts.input_file, std::move(code));

    std::vector<CompiledTaxonomyPtr> taxonomies;
    try {
        Compiler compiler(compile_options);
        taxonomies = compiler.compile(source);
    } catch (const CompileError& e) {
        std::cerr << format_compile_error(e, *source);
        return 1;
    }

    switch (opts.command) {
        case Command::Check: {
            size_t variants = 0;
            for (const auto& taxonomy : taxonomies) {
                variants += taxonomy->variants.size();
            }
            std::cout << opts.input_file << ": " << taxonomies.size() << " taxonomies, "
                      << variants << " variants\n";
            return 0;
        }
        case Command::Doc: {
            std::string out;
            for (const auto& taxonomy : taxonomies) {
                if (!out.empty())
                    out += "\n";
                out += "# " + taxonomy->name + "\n\n" + taxonomy->doc_text();
            }
            return write_output(opts, out) ? 0 : 1;
        }
        case Command::Header: {
            codegen::CppHeaderMaterializer::Options header_options;
            header_options.ns = opts.ns.empty() ? settings.header_namespace : opts.ns;
            codegen::CppHeaderMaterializer materializer(header_options);

            std::string out;
            for (const auto& taxonomy : taxonomies) {
                if (!out.empty())
                    out += "\n";
                out += materializer.materialize(*taxonomy);
            }
            return write_output(opts, out) ? 0 : 1;
        }
        default:
            break;
    }
    return 1;
}
