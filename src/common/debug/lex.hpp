#pragma once

#include "../debug.hpp"

#include <string>

namespace errtree::debug::lex {

/// Lexer メッセージID
enum class Id {
    Start,
    End,
    Ident,
    Number,
    String,
    RawString,
    Punct,
    CommentSkip,
    UnterminatedString,
    UnterminatedComment,
    InvalidChar,
};

/// メッセージテーブル [en, ja]
inline const char* messages[][2] = {
    {"Starting lexical analysis", "字句解析を開始"},
    {"Completed lexical analysis", "字句解析を完了"},
    {"Identifier", "識別子"},
    {"Integer literal", "整数リテラル"},
    {"String literal", "文字列リテラル"},
    {"Raw string literal", "生文字列リテラル"},
    {"Punctuation", "記号"},
    {"Skipping comment", "コメントをスキップ"},
    {"Unterminated string literal", "文字列リテラルが閉じられていません"},
    {"Unterminated block comment", "ブロックコメントが閉じられていません"},
    {"Invalid character", "不正な文字"},
};

inline const char* get(Id id) {
    return messages[static_cast<int>(id)][::errtree::debug::g_lang];
}

inline void log(Id id, ::errtree::debug::Level level = ::errtree::debug::Level::Debug) {
    if (!::errtree::debug::enabled(level))
        return;
    ::errtree::debug::log(::errtree::debug::Stage::Lexer, level, get(id));
}

inline void log(Id id, const std::string& detail,
                ::errtree::debug::Level level = ::errtree::debug::Level::Debug) {
    if (!::errtree::debug::enabled(level))
        return;
    ::errtree::debug::log(::errtree::debug::Stage::Lexer, level,
                          std::string(get(id)) + ": " + detail);
}

}  // namespace errtree::debug::lex
