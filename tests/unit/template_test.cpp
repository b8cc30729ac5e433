#include "../../src/format/template.hpp"

#include "../../src/common/error.hpp"

#include <gtest/gtest.h>

using namespace errtree;
using diagnostics::FieldValues;

// ============================================================
// テストヘルパー
// ============================================================
class TemplateTest : public ::testing::Test {
   protected:
    static ast::FieldShape named(std::vector<std::string> names) {
        ast::FieldShape shape;
        shape.kind = ast::FieldShape::Kind::Named;
        for (auto& name : names) {
            shape.fields.push_back(ast::Field{std::move(name), "String", Span{0, 0}});
        }
        return shape;
    }

    static ast::FieldShape positional(size_t count) {
        ast::FieldShape shape;
        shape.kind = ast::FieldShape::Kind::Positional;
        for (size_t i = 0; i < count; ++i) {
            shape.fields.push_back(ast::Field{"", "String", Span{0, 0}});
        }
        return shape;
    }

    static ast::FieldShape unit() { return ast::FieldShape{}; }

    static CompiledTemplate compile(const ast::FieldShape& shape, const std::string& text) {
        return TemplateCompiler(shape).compile(text, Span{10, 20});
    }

    static CompileError compile_error(const ast::FieldShape& shape, const std::string& text) {
        try {
            compile(shape, text);
        } catch (const CompileError& e) {
            return e;
        }
        ADD_FAILURE() << "expected a CompileError for \"" << text << "\"";
        return CompileError(CompileError::Kind::Parse, "", Span{0, 0});
    }
};

// ============================================================
// 解析
// ============================================================
TEST_F(TemplateTest, NamedReference) {
    auto tmpl = compile(named({"path"}), "File {path} not found.");
    ASSERT_EQ(tmpl.segments().size(), 3u);
    EXPECT_EQ(tmpl.segments()[0].kind, TemplateSegment::Kind::Literal);
    EXPECT_EQ(tmpl.segments()[0].text, "File ");
    EXPECT_EQ(tmpl.segments()[1].kind, TemplateSegment::Kind::Placeholder);
    EXPECT_EQ(tmpl.segments()[1].field_index, 0u);
    EXPECT_EQ(tmpl.segments()[1].text, "path");
    EXPECT_EQ(tmpl.segments()[2].text, " not found.");
    EXPECT_EQ(tmpl.source(), "File {path} not found.");
    EXPECT_EQ(tmpl.span(), (Span{10, 20}));
}

TEST_F(TemplateTest, PositionalReferenceOnNamedShape) {
    auto tmpl = compile(named({"a", "b"}), "{1} then {0}");
    EXPECT_EQ(tmpl.referenced_fields(), (std::vector<size_t>{1, 0}));
    EXPECT_EQ(tmpl.segments()[0].text, "b");
}

TEST_F(TemplateTest, ImplicitIndicesCountUp) {
    auto tmpl = compile(positional(3), "{} {} {2} {}");
    EXPECT_EQ(tmpl.referenced_fields(), (std::vector<size_t>{0, 1, 2, 2}));
    EXPECT_EQ(tmpl.segments()[0].text, "_0");
}

TEST_F(TemplateTest, EscapedBracesAreLiteral) {
    auto tmpl = compile(unit(), "{{0}} not found.");
    EXPECT_TRUE(tmpl.is_static());
    EXPECT_EQ(tmpl.render({}), "{0} not found.");

    auto mixed = compile(named({"x"}), "{{{x}}}");
    EXPECT_EQ(mixed.referenced_fields(), (std::vector<size_t>{0}));
    EXPECT_EQ(mixed.render({std::string("v")}), "{v}");
}

TEST_F(TemplateTest, FormatSuffixIsKept) {
    auto tmpl = compile(named({"count"}), "{count:>5}");
    ASSERT_EQ(tmpl.segments().size(), 1u);
    EXPECT_EQ(tmpl.segments()[0].spec, ">5");

    auto positional_spec = compile(positional(1), "{:08.3}");
    EXPECT_EQ(positional_spec.segments()[0].field_index, 0u);
    EXPECT_EQ(positional_spec.segments()[0].spec, "08.3");
}

TEST_F(TemplateTest, PlainTextHasNoPlaceholders) {
    auto tmpl = compile(unit(), "access denied.");
    EXPECT_TRUE(tmpl.is_static());
    EXPECT_TRUE(tmpl.referenced_fields().empty());
}

// ============================================================
// エラー
// ============================================================
TEST_F(TemplateTest, PositionalOutOfRange) {
    auto error = compile_error(positional(1), "{1}");
    EXPECT_EQ(error.kind(), CompileError::Kind::Template);
    EXPECT_EQ(error.span(), (Span{10, 20}));
    EXPECT_EQ(error.message(), "positional placeholder `{1}` is out of range (1 fields)");
}

TEST_F(TemplateTest, ImplicitOutOfRange) {
    auto error = compile_error(positional(1), "{} {}");
    EXPECT_EQ(error.kind(), CompileError::Kind::Template);
}

TEST_F(TemplateTest, UnknownName) {
    auto error = compile_error(named({"path"}), "{file}");
    EXPECT_EQ(error.message(), "unknown field `file` in placeholder");
}

TEST_F(TemplateTest, NameOnPositionalShape) {
    auto error = compile_error(positional(2), "{path}");
    EXPECT_EQ(error.message(), "named placeholder `{path}` in a variant with positional fields");
}

TEST_F(TemplateTest, UnitAcceptsNoPlaceholders) {
    EXPECT_EQ(compile_error(unit(), "{}").kind(), CompileError::Kind::Template);
    EXPECT_EQ(compile_error(unit(), "{0}").kind(), CompileError::Kind::Template);
}

TEST_F(TemplateTest, UnterminatedPlaceholder) {
    auto error = compile_error(named({"a"}), "value {a");
    EXPECT_EQ(error.message(), "unterminated placeholder in \"value {a\"");
}

TEST_F(TemplateTest, StrayClosingBrace) {
    auto error = compile_error(unit(), "oops }");
    EXPECT_EQ(error.message(), "unmatched `}` in \"oops }\"");
}

TEST_F(TemplateTest, MalformedReference) {
    EXPECT_EQ(compile_error(named({"a"}), "{a-b}").message(), "malformed placeholder `{a-b}`");
    EXPECT_EQ(compile_error(named({"a"}), "{1a}").kind(), CompileError::Kind::Template);
    EXPECT_EQ(compile_error(named({"a"}), "{ a}").kind(), CompileError::Kind::Template);
}

// ============================================================
// 描画
// ============================================================
TEST_F(TemplateTest, RenderSubstitutesValues) {
    auto tmpl = compile(named({"path", "code"}), "File {path} failed with {code}.");
    FieldValues values{std::string("a.txt"), int64_t{2}};
    EXPECT_EQ(tmpl.render(values), "File a.txt failed with 2.");
}

TEST_F(TemplateTest, RenderAppliesFormatSuffix) {
    auto tmpl = compile(positional(2), "[{:>4}] {:.2}");
    FieldValues values{int64_t{7}, 3.14159};
    EXPECT_EQ(tmpl.render(values), "[   7] 3.14");
}

TEST_F(TemplateTest, FloatPrecisionCountsFractionDigits) {
    auto tmpl = compile(positional(2), "{:.2}|{:8.3}");
    FieldValues values{123.456, 2.5};
    EXPECT_EQ(tmpl.render(values), "123.46|   2.500");
}

TEST_F(TemplateTest, InapplicableSuffixFallsBackToPlainValue) {
    auto tmpl = compile(positional(1), "{:d}");
    FieldValues values{std::string("text")};
    EXPECT_EQ(tmpl.render(values), "text");
}

TEST_F(TemplateTest, RenderBoolAndSpan) {
    auto file = std::make_shared<const SourceFile>("in.txt", "let x = 1;");
    auto tmpl = compile(positional(2), "{} at `{}`");
    FieldValues values{true, SourceSpan(file, 4, 5)};
    EXPECT_EQ(tmpl.render(values), "true at `x`");
}
