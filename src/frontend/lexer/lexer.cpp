// レキサー実装（トークン化、スキャン）
#include "lexer.hpp"

#include "common/debug/lex.hpp"

#include <fmt/format.h>

namespace errtree {

const char* token_kind_to_string(TokenKind kind) {
    switch (kind) {
        case TokenKind::IntLiteral:
            return "integer literal";
        case TokenKind::StringLiteral:
            return "string literal";
        case TokenKind::Ident:
            return "identifier";
        case TokenKind::KwPub:
            return "'pub'";
        case TokenKind::Hash:
            return "'#'";
        case TokenKind::LParen:
            return "'('";
        case TokenKind::RParen:
            return "')'";
        case TokenKind::LBrace:
            return "'{'";
        case TokenKind::RBrace:
            return "'}'";
        case TokenKind::LBracket:
            return "'['";
        case TokenKind::RBracket:
            return "']'";
        case TokenKind::Lt:
            return "'<'";
        case TokenKind::Gt:
            return "'>'";
        case TokenKind::Comma:
            return "','";
        case TokenKind::Colon:
            return "':'";
        case TokenKind::ColonColon:
            return "'::'";
        case TokenKind::Eq:
            return "'='";
        case TokenKind::Punct:
            return "punctuation";
        case TokenKind::Eof:
            return "end of input";
        case TokenKind::Error:
            return "invalid token";
    }
    return "unknown";
}

// トークン化（メインループ）
std::vector<Token> Lexer::tokenize() {
    debug::lex::log(debug::lex::Id::Start);

    std::vector<Token> tokens;
    while (true) {
        Token tok = next_token();
        bool stop = tok.kind == TokenKind::Eof || tok.kind == TokenKind::Error;
        tokens.push_back(std::move(tok));
        if (stop)
            break;
    }

    debug::lex::log(debug::lex::Id::End, std::to_string(tokens.size()) + " tokens");
    return tokens;
}

Token Lexer::next_token() {
    skip_whitespace_and_comments();
    if (unterminated_comment_ >= 0) {
        debug::lex::log(debug::lex::Id::UnterminatedComment, "", debug::Level::Error);
        return error_token(static_cast<uint32_t>(unterminated_comment_),
                           "unterminated block comment");
    }
    if (is_at_end())
        return make_token(TokenKind::Eof);

    uint32_t start = pos_;
    char c = advance();

    // r"..." / r#"..."#
    if (c == 'r' && (peek() == '"' || (peek() == '#' && (peek_next() == '"' || peek_next() == '#'))))
        return scan_raw_string(start);
    if (is_alpha(c))
        return scan_identifier(start);
    if (is_digit(c))
        return scan_number(start);
    if (c == '"')
        return scan_string(start);

    return scan_operator(start, c);
}

void Lexer::skip_whitespace_and_comments() {
    while (!is_at_end()) {
        char c = peek();
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
            advance();
        } else if (c == '/' && peek_next() == '/') {
            debug::lex::log(debug::lex::Id::CommentSkip, "line", debug::Level::Trace);
            while (!is_at_end() && peek() != '\n')
                advance();
        } else if (c == '/' && peek_next() == '*') {
            debug::lex::log(debug::lex::Id::CommentSkip, "block", debug::Level::Trace);
            uint32_t start = pos_;
            advance();
            advance();
            bool closed = false;
            while (!is_at_end()) {
                if (peek() == '*' && peek_next() == '/') {
                    advance();
                    advance();
                    closed = true;
                    break;
                }
                advance();
            }
            if (!closed) {
                unterminated_comment_ = start;
                return;
            }
        } else {
            break;
        }
    }
}

Token Lexer::scan_identifier(uint32_t start) {
    while (!is_at_end() && is_alnum(peek()))
        advance();
    std::string text(source_.substr(start, pos_ - start));

    if (text == "pub") {
        return Token(TokenKind::KwPub, start, pos_, std::move(text));
    }

    debug::lex::log(debug::lex::Id::Ident, text, debug::Level::Trace);
    return Token(TokenKind::Ident, start, pos_, std::move(text));
}

Token Lexer::scan_number(uint32_t start) {
    // コード断片では先頭の0が意味を持つため、テキストのまま保持する
    while (!is_at_end() && is_digit(peek()))
        advance();
    std::string text(source_.substr(start, pos_ - start));
    debug::lex::log(debug::lex::Id::Number, text, debug::Level::Trace);
    return Token(TokenKind::IntLiteral, start, pos_, std::move(text));
}

Token Lexer::scan_string(uint32_t start) {
    std::string value;
    while (!is_at_end() && peek() != '"') {
        if (peek() == '\\') {
            advance();
            if (!is_at_end())
                value += scan_escape_char();
        } else {
            value += advance();
        }
    }
    if (is_at_end()) {
        debug::lex::log(debug::lex::Id::UnterminatedString, "", debug::Level::Error);
        return error_token(start, "unterminated string literal");
    }
    advance();
    debug::lex::log(debug::lex::Id::String, "\"...\"", debug::Level::Trace);
    return Token(TokenKind::StringLiteral, start, pos_, std::move(value));
}

Token Lexer::scan_raw_string(uint32_t start) {
    size_t hashes = 0;
    while (match('#'))
        ++hashes;
    if (!match('"')) {
        return error_token(start, "malformed raw string literal");
    }

    std::string terminator = "\"" + std::string(hashes, '#');
    size_t close = source_.find(terminator, pos_);
    if (close == std::string_view::npos) {
        pos_ = static_cast<uint32_t>(source_.size());
        debug::lex::log(debug::lex::Id::UnterminatedString, "raw", debug::Level::Error);
        return error_token(start, "unterminated raw string literal");
    }
    std::string value(source_.substr(pos_, close - pos_));
    pos_ = static_cast<uint32_t>(close + terminator.size());
    debug::lex::log(debug::lex::Id::RawString, "r\"...\"", debug::Level::Trace);
    return Token(TokenKind::StringLiteral, start, pos_, std::move(value));
}

char Lexer::scan_escape_char() {
    char c = advance();
    switch (c) {
        case 'n':
            return '\n';
        case 't':
            return '\t';
        case 'r':
            return '\r';
        case '\\':
            return '\\';
        case '"':
            return '"';
        case '\'':
            return '\'';
        case '0':
            return '\0';
        default:
            return c;
    }
}

Token Lexer::scan_operator(uint32_t start, char c) {
    auto make = [&](TokenKind kind) {
        debug::lex::log(debug::lex::Id::Punct, token_kind_to_string(kind), debug::Level::Trace);
        return Token(kind, start, pos_, std::string(source_.substr(start, pos_ - start)));
    };

    switch (c) {
        case '#':
            return make(TokenKind::Hash);
        case '(':
            return make(TokenKind::LParen);
        case ')':
            return make(TokenKind::RParen);
        case '{':
            return make(TokenKind::LBrace);
        case '}':
            return make(TokenKind::RBrace);
        case '[':
            return make(TokenKind::LBracket);
        case ']':
            return make(TokenKind::RBracket);
        case '<':
            return make(TokenKind::Lt);
        case '>':
            return make(TokenKind::Gt);
        case ',':
            return make(TokenKind::Comma);
        case '=':
            return make(TokenKind::Eq);
        case ':':
            return match(':') ? make(TokenKind::ColonColon) : make(TokenKind::Colon);
        case '&':
        case '\'':
        case '*':
        case '!':
        case '?':
        case '.':
        case ';':
        case '+':
        case '-':
        case '/':
        case '|':
        case '$':
        case '@':
        case '%':
        case '^':
        case '~':
            return make(TokenKind::Punct);
        default:
            debug::lex::log(debug::lex::Id::InvalidChar, std::string(1, c), debug::Level::Error);
            return error_token(start, fmt::format("unexpected character '{}'", c));
    }
}

}  // namespace errtree
