#include "../../src/frontend/lexer/lexer.hpp"

#include <gtest/gtest.h>

using namespace errtree;

class LexerTest : public ::testing::Test {
   protected:
    std::vector<Token> tokenize(const std::string& source) {
        Lexer lexer(source);
        return lexer.tokenize();
    }
};

// 基本的なトークン化
TEST_F(LexerTest, EmptySource) {
    auto tokens = tokenize("");
    ASSERT_EQ(tokens.size(), 1);
    EXPECT_EQ(tokens[0].kind, TokenKind::Eof);
}

TEST_F(LexerTest, Identifier) {
    auto tokens = tokenize("FileNotFound path _inner");
    ASSERT_EQ(tokens.size(), 4);  // 3 identifiers, Eof
    EXPECT_EQ(tokens[0].kind, TokenKind::Ident);
    EXPECT_EQ(tokens[0].get_string(), "FileNotFound");
    EXPECT_EQ(tokens[1].get_string(), "path");
    EXPECT_EQ(tokens[2].get_string(), "_inner");
}

TEST_F(LexerTest, PubKeyword) {
    auto tokens = tokenize("pub public");
    EXPECT_EQ(tokens[0].kind, TokenKind::KwPub);
    EXPECT_EQ(tokens[1].kind, TokenKind::Ident);
}

// 整数リテラルは先頭の0を保持する
TEST_F(LexerTest, IntegerLiteralKeepsLeadingZeros) {
    auto tokens = tokenize("01 007 42");
    EXPECT_EQ(tokens[0].kind, TokenKind::IntLiteral);
    EXPECT_EQ(tokens[0].get_string(), "01");
    EXPECT_EQ(tokens[1].get_string(), "007");
    EXPECT_EQ(tokens[2].get_string(), "42");
}

TEST_F(LexerTest, StringLiteralEscapes) {
    auto tokens = tokenize(R"("a\nb\t\"c\"\\")");
    ASSERT_EQ(tokens[0].kind, TokenKind::StringLiteral);
    EXPECT_EQ(tokens[0].get_string(), "a\nb\t\"c\"\\");
}

TEST_F(LexerTest, RawStrings) {
    auto tokens = tokenize(R"__(r"C:\path" r#"say "hi""#)__");
    ASSERT_EQ(tokens[0].kind, TokenKind::StringLiteral);
    EXPECT_EQ(tokens[0].get_string(), "C:\\path");
    ASSERT_EQ(tokens[1].kind, TokenKind::StringLiteral);
    EXPECT_EQ(tokens[1].get_string(), "say \"hi\"");
}

TEST_F(LexerTest, Punctuation) {
    auto tokens = tokenize("#[ ] ( ) { } < > , : :: = & '");
    EXPECT_EQ(tokens[0].kind, TokenKind::Hash);
    EXPECT_EQ(tokens[1].kind, TokenKind::LBracket);
    EXPECT_EQ(tokens[2].kind, TokenKind::RBracket);
    EXPECT_EQ(tokens[3].kind, TokenKind::LParen);
    EXPECT_EQ(tokens[4].kind, TokenKind::RParen);
    EXPECT_EQ(tokens[5].kind, TokenKind::LBrace);
    EXPECT_EQ(tokens[6].kind, TokenKind::RBrace);
    EXPECT_EQ(tokens[7].kind, TokenKind::Lt);
    EXPECT_EQ(tokens[8].kind, TokenKind::Gt);
    EXPECT_EQ(tokens[9].kind, TokenKind::Comma);
    EXPECT_EQ(tokens[10].kind, TokenKind::Colon);
    EXPECT_EQ(tokens[11].kind, TokenKind::ColonColon);
    EXPECT_EQ(tokens[12].kind, TokenKind::Eq);
    EXPECT_EQ(tokens[13].kind, TokenKind::Punct);
    EXPECT_EQ(tokens[14].kind, TokenKind::Punct);
}

// コメント
TEST_F(LexerTest, Comments) {
    auto tokens = tokenize("a // line\n/* block\n comment */ b");
    ASSERT_EQ(tokens.size(), 3);
    EXPECT_EQ(tokens[0].get_string(), "a");
    EXPECT_EQ(tokens[1].get_string(), "b");
}

// 位置情報
TEST_F(LexerTest, TokenSpans) {
    auto tokens = tokenize("ab  \"x\"");
    EXPECT_EQ(tokens[0].start, 0u);
    EXPECT_EQ(tokens[0].end, 2u);
    EXPECT_EQ(tokens[1].start, 4u);
    EXPECT_EQ(tokens[1].end, 7u);
}

// エラー
TEST_F(LexerTest, UnterminatedString) {
    auto tokens = tokenize("a \"never closed");
    ASSERT_EQ(tokens.size(), 2);
    EXPECT_EQ(tokens[1].kind, TokenKind::Error);
    EXPECT_EQ(tokens[1].start, 2u);
    EXPECT_EQ(tokens[1].value, "unterminated string literal");
}

TEST_F(LexerTest, UnterminatedBlockComment) {
    auto tokens = tokenize("a /* open");
    ASSERT_EQ(tokens.size(), 2);
    EXPECT_EQ(tokens[1].kind, TokenKind::Error);
    EXPECT_EQ(tokens[1].start, 2u);
}

TEST_F(LexerTest, InvalidCharacterStopsTokenization) {
    auto tokens = tokenize("a ` b");
    ASSERT_EQ(tokens.size(), 2);
    EXPECT_EQ(tokens[1].kind, TokenKind::Error);
    EXPECT_EQ(tokens[1].value, "unexpected character '`'");
}
