// ============================================================
// 設定システム - 実装
// ============================================================

#include "config.hpp"

#include "debug.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace errtree {

bool ConfigLoader::load(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    if (parse(buffer.str())) {
        config_path_ = filepath;
        loaded_ = true;
        debug::log(debug::Stage::Driver, debug::Level::Info, "Loaded config: " + filepath);
        return true;
    }
    return false;
}

bool ConfigLoader::find_and_load(const std::string& start_path) {
    std::error_code ec;
    fs::path current = fs::absolute(start_path, ec);
    if (ec) {
        return false;
    }

    // 最大10レベルまで親ディレクトリを探索
    for (int i = 0; i < 10; ++i) {
        fs::path config_file = current / kFileName;
        if (fs::exists(config_file, ec)) {
            return load(config_file.string());
        }

        fs::path parent = current.parent_path();
        if (parent == current) {
            break;  // ルートに到達
        }
        current = parent;
    }

    return false;
}

bool ConfigLoader::parse(const std::string& content) {
    // 簡易YAMLパーサー
    // サポート形式:
    // compile:
    //   unique_codes: true
    // header:
    //   namespace: app::errors

    std::istringstream stream(content);
    std::string line;
    std::string section;

    while (std::getline(stream, line)) {
        std::string trimmed = trim(line);
        if (trimmed.empty() || trimmed[0] == '#') {
            continue;
        }

        size_t indent = 0;
        for (char c : line) {
            if (c == ' ')
                indent++;
            else if (c == '\t')
                indent += 2;  // タブは2スペースとして扱う
            else
                break;
        }

        size_t colon_pos = trimmed.find(':');
        if (colon_pos == std::string::npos) {
            continue;
        }
        std::string key = trim(trimmed.substr(0, colon_pos));
        std::string value = trim(trimmed.substr(colon_pos + 1));

        if (indent == 0) {
            section = key;
        } else if (!section.empty() && !value.empty()) {
            apply(section, key, value);
        }
    }

    return true;  // 空の設定も有効
}

void ConfigLoader::apply(const std::string& section, const std::string& key,
                         const std::string& value) {
    if (section == "compile") {
        if (key == "unique_codes") {
            settings_.unique_codes = parse_bool(value, settings_.unique_codes);
            return;
        }
        if (key == "unique_identifiers") {
            settings_.unique_identifiers = parse_bool(value, settings_.unique_identifiers);
            return;
        }
    } else if (section == "header") {
        if (key == "namespace") {
            settings_.header_namespace = value;
            return;
        }
    }
    debug::log(debug::Stage::Driver, debug::Level::Warn,
               "Unknown config key: " + section + "." + key);
}

bool ConfigLoader::parse_bool(const std::string& value, bool fallback) {
    if (value == "true" || value == "yes" || value == "on")
        return true;
    if (value == "false" || value == "no" || value == "off")
        return false;
    return fallback;
}

std::string ConfigLoader::trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos)
        return "";
    size_t end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

}  // namespace errtree
