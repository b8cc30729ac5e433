#pragma once

// ============================================================
// テキストレンダラー - 診断を端末向けに整形
// ============================================================

#include "facade.hpp"

#include <cstddef>
#include <iosfwd>
#include <string>

namespace errtree {
namespace diagnostics {

/// 表示オプション
struct RenderOptions {
    size_t context_lines = 1;  // 前後に表示する行数
    bool color = true;         // ANSI色を使う
};

/// 診断をテキストで出力する
///
///   error[E01]: File a.txt not found.
///    --> input.txt:2:5
///     |
///   1 | ...
///   2 | open a.txt
///     |      ^^^^^ label
class TextRenderer {
   public:
    explicit TextRenderer(RenderOptions options = {}) : options_(options) {}

    void render(const DiagnosticFacade& diag, std::ostream& out) const;

    std::string render_to_string(const DiagnosticFacade& diag) const;

   private:
    void render_snippet(const DiagnosticFacade& diag, const SourceSpan& span,
                        std::ostream& out) const;

    const char* style(const char* code) const { return options_.color ? code : ""; }

    RenderOptions options_;
};

}  // namespace diagnostics
}  // namespace errtree
