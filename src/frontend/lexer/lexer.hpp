#pragma once

#include "token.hpp"

#include <string_view>
#include <vector>

namespace errtree {

/// エラー分類DSLのレキサー
class Lexer {
   public:
    explicit Lexer(std::string_view source) : source_(source), pos_(0) {}

    /// ソース全体をトークン化する（末尾は必ずEof）
    ///
    /// 字句エラーはErrorトークンとして返し、そこでトークン化を打ち切る。
    std::vector<Token> tokenize();

   private:
    Token next_token();
    void skip_whitespace_and_comments();
    Token scan_identifier(uint32_t start);
    Token scan_number(uint32_t start);
    Token scan_string(uint32_t start);
    Token scan_raw_string(uint32_t start);
    char scan_escape_char();
    Token scan_operator(uint32_t start, char c);

    bool is_at_end() const { return pos_ >= source_.size(); }
    char peek() const { return is_at_end() ? '\0' : source_[pos_]; }
    char peek_next() const { return pos_ + 1 < source_.size() ? source_[pos_ + 1] : '\0'; }
    char advance() { return source_[pos_++]; }
    bool match(char expected) {
        if (is_at_end() || source_[pos_] != expected)
            return false;
        ++pos_;
        return true;
    }

    static bool is_alpha(char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
    }
    static bool is_digit(char c) { return c >= '0' && c <= '9'; }
    static bool is_alnum(char c) { return is_alpha(c) || is_digit(c); }

    Token make_token(TokenKind kind) { return Token(kind, pos_, pos_); }
    Token error_token(uint32_t start, std::string message) {
        return Token(TokenKind::Error, start, pos_, std::move(message));
    }

    std::string_view source_;
    uint32_t pos_;
    // ブロックコメントが閉じられていない場合の開始位置
    int64_t unterminated_comment_ = -1;
};

}  // namespace errtree
