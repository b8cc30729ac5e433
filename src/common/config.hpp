// ============================================================
// 設定システム
// ============================================================
// .errtree.yml からコンパイル・ヘッダー生成の設定を読み込む

#pragma once

#include <string>

namespace errtree {

/// 設定ファイルの内容
struct Settings {
    // compile:
    bool unique_codes = false;
    bool unique_identifiers = true;

    // header:
    std::string header_namespace;
};

/// 設定ローダー
class ConfigLoader {
   public:
    static constexpr const char* kFileName = ".errtree.yml";

    /// 設定ファイルを読み込み
    bool load(const std::string& filepath);

    /// 設定ファイルを探す（カレントディレクトリから親に向かって）
    bool find_and_load(const std::string& start_path = ".");

    /// 文字列から設定を解析
    bool parse(const std::string& content);

    const Settings& settings() const { return settings_; }

    /// 設定が読み込まれているか
    bool is_loaded() const { return loaded_; }

    /// 設定ファイルのパスを取得
    const std::string& config_path() const { return config_path_; }

   private:
    void apply(const std::string& section, const std::string& key, const std::string& value);

    static bool parse_bool(const std::string& value, bool fallback);

    // 行をトリム
    static std::string trim(const std::string& str);

    Settings settings_;
    std::string config_path_;
    bool loaded_ = false;
};

}  // namespace errtree
