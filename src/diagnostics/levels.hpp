#pragma once

// ============================================================
// 重大度定義
// ============================================================

#include <optional>
#include <string_view>

namespace errtree {
namespace diagnostics {

/// エラーバリアントの重大度
enum class Severity {
    Error = 0,  // 失敗として扱う
    Warn = 1,   // 警告
};

/// 重大度を文字列に変換
inline const char* severity_to_string(Severity severity) {
    switch (severity) {
        case Severity::Error:
            return "error";
        case Severity::Warn:
            return "warning";
    }
    return "unknown";
}

/// コードの先頭に付く記号 (E / W)
inline char severity_marker(Severity severity) {
    switch (severity) {
        case Severity::Error:
            return 'E';
        case Severity::Warn:
            return 'W';
    }
    return '?';
}

/// 重大度に対応するANSI色コード
inline const char* severity_to_color(Severity severity) {
    switch (severity) {
        case Severity::Error:
            return "\033[31m";  // 赤
        case Severity::Warn:
            return "\033[33m";  // 黄
    }
    return "\033[0m";
}

/// `kind` 属性のリテラルを解析
inline std::optional<Severity> parse_severity(std::string_view text) {
    if (text == "Error" || text == "error")
        return Severity::Error;
    if (text == "Warn" || text == "warn")
        return Severity::Warn;
    return std::nullopt;
}

}  // namespace diagnostics
}  // namespace errtree
