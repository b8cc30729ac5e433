#include "../../src/diagnostics/error_value.hpp"
#include "../../src/diagnostics/renderer.hpp"
#include "../../src/driver/compiler.hpp"

#include <gtest/gtest.h>

using namespace errtree;
using namespace errtree::diagnostics;

class RendererTest : public ::testing::Test {
   protected:
    void SetUp() override {
        taxonomy = Compiler().compile_text(R"(
            FileErrors {
                #[diag(number = "01", msg = "File {path} not found.", label = "this file")]
                FileNotFound { path: String, #[span] at: Span },
                #[diag(number = "02", msg = "access denied.")]
                AccessDenied,
                #[diag(kind = "Warn", number = "10", msg = "{0} is deprecated")]
                Deprecated(String),
            }
        )")[0];
        source = std::make_shared<const SourceFile>("main.txt", "let a = 1;\nopen a.txt\nclose\n");
    }

    ErrorValuePtr file_not_found() {
        return ErrorValue::make(taxonomy, "FileNotFound",
                                {std::string("a.txt"), SourceSpan(source, 16, 21)});
    }

    static RenderOptions plain(size_t context_lines) {
        RenderOptions options;
        options.color = false;
        options.context_lines = context_lines;
        return options;
    }

    CompiledTaxonomyPtr taxonomy;
    std::shared_ptr<const SourceFile> source;
};

TEST_F(RendererTest, SnippetWithContext) {
    TextRenderer renderer(plain(1));
    EXPECT_EQ(renderer.render_to_string(*file_not_found()),
              "error[E01]: File a.txt not found.\n"
              " --> main.txt:2:6\n"
              "  |\n"
              "1 | let a = 1;\n"
              "2 | open a.txt\n"
              "  |      ^^^^^ this file\n"
              "3 | close\n");
}

TEST_F(RendererTest, SnippetWithoutContext) {
    TextRenderer renderer(plain(0));
    EXPECT_EQ(renderer.render_to_string(*file_not_found()),
              "error[E01]: File a.txt not found.\n"
              " --> main.txt:2:6\n"
              "  |\n"
              "2 | open a.txt\n"
              "  |      ^^^^^ this file\n");
}

TEST_F(RendererTest, UnknownSpanPrintsHeaderOnly) {
    TextRenderer renderer(plain(1));
    auto err = ErrorValue::make(taxonomy, "AccessDenied", {});
    EXPECT_EQ(renderer.render_to_string(*err), "error[E02]: access denied.\n");
}

TEST_F(RendererTest, WarningHeader) {
    TextRenderer renderer(plain(1));
    auto err = ErrorValue::make(taxonomy, "Deprecated", {std::string("old_api")});
    EXPECT_EQ(renderer.render_to_string(*err), "warning[W10]: old_api is deprecated\n");
}

TEST_F(RendererTest, ColorUsesSeverityColor) {
    TextRenderer renderer;
    std::string out = renderer.render_to_string(*file_not_found());
    EXPECT_NE(out.find("\033[31merror"), std::string::npos);
    EXPECT_NE(out.find("\033[0m"), std::string::npos);
}
