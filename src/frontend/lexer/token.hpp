#pragma once

#include "common/span.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace errtree {

/// トークンの種類
enum class TokenKind {
    // リテラル
    IntLiteral,     // 01, 42
    StringLiteral,  // "msg", r"msg", r#"msg"#

    // 識別子
    Ident,  // FileNotFound, path

    // キーワード
    KwPub,  // 可視性

    // 区切り
    Hash,        // #
    LParen,      // (
    RParen,      // )
    LBrace,      // {
    RBrace,      // }
    LBracket,    // [
    RBracket,    // ]
    Lt,          // <
    Gt,          // >
    Comma,       // ,
    Colon,       // :
    ColonColon,  // ::
    Eq,          // =
    Punct,       // 型テキスト中のその他の記号 (& ' * ! など)

    // 特殊
    Eof,
    Error,
};

/// トークン種別を文字列に変換
const char* token_kind_to_string(TokenKind kind);

/// トークン
///
/// 識別子・リテラルはソース上のテキスト（文字列リテラルはエスケープ解除後の値）を保持する。
/// Errorトークンはエラーメッセージを保持する。
struct Token {
    TokenKind kind;
    uint32_t start;  // 開始位置
    uint32_t end;    // 終了位置
    std::string value;

    Token(TokenKind k, uint32_t s, uint32_t e) : kind(k), start(s), end(e) {}

    Token(TokenKind k, uint32_t s, uint32_t e, std::string v)
        : kind(k), start(s), end(e), value(std::move(v)) {}

    std::string_view get_string() const { return value; }

    Span span() const { return Span{start, end}; }
};

}  // namespace errtree
