// ============================================================
// Parser 実装 - 分類・グループ・リーフ
// ============================================================

#include "common/debug/par.hpp"
#include "frontend/lexer/lexer.hpp"
#include "parser.hpp"

#include <fmt/format.h>

namespace errtree {

ast::TaxonomyFile parse_source(std::string_view source) {
    Lexer lexer(source);
    Parser parser(lexer.tokenize(), source);
    return parser.parse();
}

ast::TaxonomyFile Parser::parse() {
    debug::par::log(debug::par::Id::Start);

    ast::TaxonomyFile file;
    do {
        file.taxonomies.push_back(parse_taxonomy());
    } while (!is_at_end());

    debug::par::log(debug::par::Id::End,
                    std::to_string(file.taxonomies.size()) + " taxonomies");
    return file;
}

ast::Taxonomy Parser::parse_taxonomy() {
    ast::Taxonomy taxonomy;
    taxonomy.attrs = parse_attributes();
    taxonomy.visibility = parse_visibility();

    if (!check(TokenKind::Ident)) {
        error_here("taxonomy name");
    }
    const Token& name = advance();
    taxonomy.name = std::string(name.get_string());
    taxonomy.span = name.span();
    debug::par::log(debug::par::Id::Taxonomy, taxonomy.name);

    if (check(TokenKind::Lt)) {
        taxonomy.generics = parse_generics();
    }

    expect(TokenKind::LBrace, "'{'");
    taxonomy.roots = parse_nodes();
    expect(TokenKind::RBrace, "'}'");
    return taxonomy;
}

std::string Parser::parse_visibility() {
    if (!check(TokenKind::KwPub)) {
        return "";
    }
    advance();
    if (check(TokenKind::LParen)) {
        return "pub" + capture_balanced(TokenKind::LParen, TokenKind::RParen);
    }
    return "pub";
}

std::vector<ast::ErrorTreePtr> Parser::parse_nodes() {
    std::vector<ast::ErrorTreePtr> nodes;
    while (!check(TokenKind::RBrace)) {
        nodes.push_back(parse_node());
        if (check(TokenKind::Comma)) {
            advance();
        } else if (!check(TokenKind::RBrace)) {
            error_here("',' or '}'");
        }
    }
    return nodes;
}

ast::ErrorTreePtr Parser::parse_node() {
    ast::AttrList attrs = parse_attributes();

    // 識別子で始まればリーフ、ブレースならグループ
    if (check(TokenKind::Ident)) {
        return parse_leaf(std::move(attrs));
    }
    if (check(TokenKind::LBrace)) {
        return parse_group(std::move(attrs));
    }
    error_here("variant name or '{'");
}

ast::ErrorTreePtr Parser::parse_group(ast::AttrList attrs) {
    const Token& open = advance();
    debug::par::log(debug::par::Id::Group, "", debug::Level::Trace);

    ast::Group group;
    group.span = open.span();
    group.attrs = std::move(attrs);
    group.children = parse_nodes();
    expect(TokenKind::RBrace, "'}'");
    return std::make_unique<ast::ErrorTree>(std::move(group));
}

ast::ErrorTreePtr Parser::parse_leaf(ast::AttrList attrs) {
    const Token& ident = advance();
    debug::par::log(debug::par::Id::Leaf, std::string(ident.get_string()), debug::Level::Trace);

    ast::Leaf leaf;
    leaf.span = ident.span();
    leaf.attrs = std::move(attrs);
    leaf.ident = std::string(ident.get_string());

    if (check(TokenKind::LBrace)) {
        advance();
        leaf.fields.kind = ast::FieldShape::Kind::Named;
        parse_fields(leaf, TokenKind::RBrace);
        expect(TokenKind::RBrace, "'}'");
    } else if (check(TokenKind::LParen)) {
        advance();
        leaf.fields.kind = ast::FieldShape::Kind::Positional;
        parse_fields(leaf, TokenKind::RParen);
        expect(TokenKind::RParen, "')'");
    } else {
        leaf.fields.kind = ast::FieldShape::Kind::Unit;
    }
    return std::make_unique<ast::ErrorTree>(std::move(leaf));
}

void Parser::parse_fields(ast::Leaf& leaf, TokenKind close) {
    const bool named = leaf.fields.kind == ast::FieldShape::Kind::Named;

    while (!check(close)) {
        ast::AttrList field_attrs = parse_attributes();
        const size_t index = leaf.fields.fields.size();

        // spanマーカー以外のフィールド属性は受け付けない
        for (const auto& attr : field_attrs) {
            if (attr.key != "span") {
                throw CompileError(CompileError::Kind::Attribute,
                                   fmt::format("unknown field attribute `{}`", attr.key),
                                   attr.span);
            }
            if (attr.value.kind != ast::Literal::Kind::None) {
                throw CompileError(CompileError::Kind::Attribute,
                                   "the `span` marker takes no value", attr.span);
            }
            if (leaf.span_field.has_value()) {
                error(attr.span,
                      fmt::format("duplicate `span` marker in variant `{}`", leaf.ident));
            }
            debug::par::log(debug::par::Id::SpanMarker, std::to_string(index),
                            debug::Level::Trace);
            leaf.span_field = index;
        }

        ast::Field field;
        uint32_t start = current().start;
        if (named) {
            if (!check(TokenKind::Ident)) {
                error_here("field name");
            }
            field.name = std::string(advance().get_string());
            expect(TokenKind::Colon, "':'");
        }
        field.type_text = capture_type(close);
        field.span = Span{start, tokens_[pos_ - 1].end};
        debug::par::log(debug::par::Id::Field, field.name + ": " + field.type_text,
                        debug::Level::Trace);
        leaf.fields.fields.push_back(std::move(field));

        if (check(TokenKind::Comma)) {
            advance();
        } else if (!check(close)) {
            error_here(named ? "',' or '}'" : "',' or ')'");
        }
    }
}

const Token& Parser::expect(TokenKind kind, const char* what) {
    if (!check(kind)) {
        error_here(what);
    }
    return advance();
}

void Parser::error_here(const std::string& expected) const {
    const Token& tok = current();
    if (tok.kind == TokenKind::Error) {
        error(tok.span(), tok.value);
    }
    std::string found = token_kind_to_string(tok.kind);
    if (tok.kind == TokenKind::Ident || tok.kind == TokenKind::Punct) {
        found += fmt::format(" `{}`", tok.get_string());
    }
    error(tok.span(), fmt::format("expected {}, found {}", expected, found));
}

void Parser::error(Span span, const std::string& message) {
    debug::par::log(debug::par::Id::Error, message, debug::Level::Error);
    throw CompileError(CompileError::Kind::Parse, message, span);
}

}  // namespace errtree
