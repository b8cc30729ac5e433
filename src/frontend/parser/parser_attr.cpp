// ============================================================
// Parser 実装 - 属性
// ============================================================

#include "common/debug/par.hpp"
#include "parser.hpp"

namespace errtree {

ast::AttrList Parser::parse_attributes() {
    ast::AttrList attrs;
    while (check(TokenKind::Hash)) {
        parse_attribute(attrs);
    }
    return attrs;
}

void Parser::parse_attribute(ast::AttrList& out) {
    advance();  // '#'
    expect(TokenKind::LBracket, "'['");

    // #[diag(key = value, flag, ...)]
    if (check(TokenKind::Ident) && current().get_string() == "diag" &&
        peek_at(1).kind == TokenKind::LParen) {
        advance();
        advance();
        while (!check(TokenKind::RParen)) {
            out.push_back(parse_attribute_item());
            if (check(TokenKind::Comma)) {
                advance();
            } else if (!check(TokenKind::RParen)) {
                error_here("',' or ')'");
            }
        }
        advance();
    } else {
        // #[key = value] / #[flag]
        out.push_back(parse_attribute_item());
    }

    expect(TokenKind::RBracket, "']'");
}

ast::Attribute Parser::parse_attribute_item() {
    if (!check(TokenKind::Ident)) {
        error_here("attribute key");
    }
    const Token& key = advance();

    ast::Attribute attr;
    attr.key = std::string(key.get_string());
    attr.span = key.span();

    if (check(TokenKind::Eq)) {
        advance();
        if (check(TokenKind::StringLiteral)) {
            attr.value.kind = ast::Literal::Kind::String;
        } else if (check(TokenKind::IntLiteral)) {
            attr.value.kind = ast::Literal::Kind::Integer;
        } else {
            error_here("literal");
        }
        const Token& lit = advance();
        attr.value.text = lit.value;
        attr.value.span = lit.span();
        attr.span = attr.span.merge(lit.span());
    }

    debug::par::log(debug::par::Id::Attribute, attr.key, debug::Level::Trace);
    return attr;
}

}  // namespace errtree
