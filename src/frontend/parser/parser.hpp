#pragma once

#include "common/error.hpp"
#include "frontend/ast/tree.hpp"
#include "frontend/lexer/token.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace errtree {

// ============================================================
// パーサ
// ============================================================
//
// taxonomy := attrs* visibility? name generics? '{' node* '}'
// node     := attrs* ( identifier field-shape? | '{' node* '}' ) ','
// attrs    := '#[' key '=' literal ']' | '#[' flag ']' | '#[diag(' item, ... ')]'
//
// 最初のエラーでCompileError(Parse)を送出し、回復は行わない。
class Parser {
   public:
    Parser(std::vector<Token> tokens, std::string_view source)
        : tokens_(std::move(tokens)), source_(source), pos_(0) {}

    /// ファイル全体を解析
    ast::TaxonomyFile parse();

   private:
    ast::Taxonomy parse_taxonomy();
    std::string parse_visibility();
    std::string parse_generics();

    std::vector<ast::ErrorTreePtr> parse_nodes();
    ast::ErrorTreePtr parse_node();
    ast::ErrorTreePtr parse_leaf(ast::AttrList attrs);
    ast::ErrorTreePtr parse_group(ast::AttrList attrs);
    void parse_fields(ast::Leaf& leaf, TokenKind close);

    ast::AttrList parse_attributes();
    void parse_attribute(ast::AttrList& out);
    ast::Attribute parse_attribute_item();

    // 区切りのバランスを取りながら、ソーステキストをそのまま取り出す
    std::string capture_type(TokenKind close);
    std::string capture_balanced(TokenKind open, TokenKind close);
    bool is_arrow_head() const;

    // トークン操作
    const Token& current() const { return tokens_[pos_]; }
    const Token& peek_at(size_t offset) const {
        size_t index = pos_ + offset;
        return index < tokens_.size() ? tokens_[index] : tokens_.back();
    }
    bool check(TokenKind kind) const { return current().kind == kind; }
    bool is_at_end() const { return check(TokenKind::Eof); }
    const Token& advance() {
        const Token& tok = tokens_[pos_];
        if (pos_ + 1 < tokens_.size())
            ++pos_;
        return tok;
    }
    const Token& expect(TokenKind kind, const char* what);

    [[noreturn]] void error_here(const std::string& expected) const;
    [[noreturn]] static void error(Span span, const std::string& message);

    std::string_view text(uint32_t start, uint32_t end) const {
        return source_.substr(start, end - start);
    }

    std::vector<Token> tokens_;
    std::string_view source_;
    size_t pos_;
};

/// ソースを字句解析・構文解析する
ast::TaxonomyFile parse_source(std::string_view source);

}  // namespace errtree
