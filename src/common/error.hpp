#pragma once

#include "span.hpp"

#include <stdexcept>
#include <string>

namespace errtree {

class SourceFile;

/// コンパイルエラー（すべて致命的）
class CompileError : public std::runtime_error {
   public:
    enum class Kind {
        Parse,      // DSLの構文エラー
        Attribute,  // 未知のキー、不正なリテラル
        Template,   // 解決できない・範囲外のプレースホルダー
        Emission,   // 必須メッセージの欠落、重複
    };

    CompileError(Kind kind, const std::string& message, Span span)
        : std::runtime_error(format_error(kind, message)),
          kind_(kind),
          message_(message),
          span_(span) {}

    Kind kind() const { return kind_; }
    Span span() const { return span_; }

    /// 種別を含まないメッセージ本体
    const std::string& message() const { return message_; }

   private:
    Kind kind_;
    std::string message_;
    Span span_;

    static std::string format_error(Kind kind, const std::string& message);
};

/// 種別を文字列に変換
const char* error_kind_to_string(CompileError::Kind kind);

/// エラー表示用のフォーマット済み文字列を生成（ファイル:行:列、ソース行、キャレット）
std::string format_compile_error(const CompileError& error, const SourceFile& source);

}  // namespace errtree
