// ============================================================
// Parser 実装 - 型テキストとジェネリクス
// ============================================================

#include "parser.hpp"

namespace errtree {

namespace {

bool is_open(TokenKind kind) {
    return kind == TokenKind::LParen || kind == TokenKind::LBracket ||
           kind == TokenKind::LBrace || kind == TokenKind::Lt;
}

bool is_close(TokenKind kind) {
    return kind == TokenKind::RParen || kind == TokenKind::RBracket ||
           kind == TokenKind::RBrace || kind == TokenKind::Gt;
}

}  // namespace

// "->" の '>' は閉じ括弧ではない
bool Parser::is_arrow_head() const {
    const Token& tok = tokens_[pos_];
    if (tok.kind != TokenKind::Gt || pos_ == 0)
        return false;
    const Token& prev = tokens_[pos_ - 1];
    return prev.kind == TokenKind::Punct && prev.get_string() == "-" && prev.end == tok.start;
}

std::string Parser::capture_type(TokenKind close) {
    const uint32_t start = current().start;
    uint32_t end = start;
    int depth = 0;

    while (true) {
        const Token& tok = current();
        if (tok.kind == TokenKind::Eof || tok.kind == TokenKind::Error) {
            error_here("type");
        }
        if (depth == 0 && (tok.kind == TokenKind::Comma || tok.kind == close)) {
            break;
        }

        if (is_open(tok.kind)) {
            ++depth;
        } else if (is_close(tok.kind) && !is_arrow_head()) {
            if (depth == 0) {
                error_here("type");
            }
            --depth;
        }
        end = tok.end;
        advance();
    }

    if (end == start) {
        error_here("type");
    }
    return std::string(text(start, end));
}

std::string Parser::capture_balanced(TokenKind open, TokenKind close) {
    const Token& first = expect(open, open == TokenKind::Lt ? "'<'" : "'('");
    const uint32_t start = first.start;
    int depth = 1;

    while (depth > 0) {
        const Token& tok = current();
        if (tok.kind == TokenKind::Eof || tok.kind == TokenKind::Error) {
            error_here(close == TokenKind::Gt ? "'>'" : "')'");
        }
        if (tok.kind == open) {
            ++depth;
        } else if (tok.kind == close && !is_arrow_head()) {
            --depth;
        }
        advance();
    }
    return std::string(text(start, tokens_[pos_ - 1].end));
}

std::string Parser::parse_generics() {
    return capture_balanced(TokenKind::Lt, TokenKind::Gt);
}

}  // namespace errtree
