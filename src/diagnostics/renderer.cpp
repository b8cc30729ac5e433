#include "renderer.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <ostream>
#include <sstream>
#include <string_view>

namespace errtree {
namespace diagnostics {

namespace {

constexpr const char* kReset = "\033[0m";
constexpr const char* kBold = "\033[1m";
constexpr const char* kBlue = "\033[34m";

// 行末の改行を取り除く
std::string_view strip_newline(std::string_view line) {
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
        line.remove_suffix(1);
    }
    return line;
}

}  // namespace

void TextRenderer::render(const DiagnosticFacade& diag, std::ostream& out) const {
    const char* color = style(severity_to_color(diag.kind()));
    const char* bold = style(kBold);
    const char* reset = style(kReset);

    // 重大度とコード
    out << bold << color << severity_to_string(diag.kind()) << "[" << diag.code() << "]" << reset
        << bold << ": " << diag.primary_message() << reset << "\n";

    SourceSpan span = diag.primary_span();
    if (span.is_known()) {
        render_snippet(diag, span, out);
    }
}

std::string TextRenderer::render_to_string(const DiagnosticFacade& diag) const {
    std::ostringstream out;
    render(diag, out);
    return out.str();
}

void TextRenderer::render_snippet(const DiagnosticFacade& diag, const SourceSpan& span,
                                  std::ostream& out) const {
    const char* color = style(severity_to_color(diag.kind()));
    const char* blue = style(kBlue);
    const char* bold = style(kBold);
    const char* reset = style(kReset);

    const std::string& text = span.source_text();
    const Indexer& index = span.source_index();

    const size_t start = std::min(span.start(), text.size());
    const size_t end = std::min(std::max(span.end(), start), text.size());
    const LineColumn loc = index.line_col_at(start);

    ByteRange context = index.span_with_context_lines(start, end, options_.context_lines,
                                                      options_.context_lines);
    size_t last_line = context.end > context.start ? index.line_col_at(context.end - 1).line
                                                   : loc.line;
    const size_t gutter = std::to_string(last_line + 1).size();
    const std::string pad(gutter, ' ');

    // ファイル:行:列 (1始まり)
    out << pad << blue << "--> " << reset << span.uri() << ":" << loc.line + 1 << ":"
        << loc.column + 1 << "\n";
    out << pad << " " << blue << "|" << reset << "\n";

    size_t pos = context.start;
    while (pos < context.end) {
        ByteRange line = index.line_span_at(pos);
        if (line.end <= line.start)
            break;
        const size_t line_no = index.line_col_at(line.start).line;
        std::string_view content =
            strip_newline(std::string_view(text).substr(line.start, line.end - line.start));

        out << blue << fmt::format("{:>{}}", line_no + 1, gutter) << " |" << reset << " "
            << content << "\n";

        // キャレット
        if (line_no == loc.line) {
            const size_t line_end = line.start + content.size();
            const size_t caret_end = std::min(end, line_end);
            const size_t width = caret_end > start ? caret_end - start : 1;
            std::string label = diag.primary_label();

            out << pad << " " << blue << "|" << reset << " " << std::string(loc.column, ' ')
                << bold << color << std::string(width, '^');
            if (!label.empty()) {
                out << " " << label;
            }
            out << reset << "\n";
        }
        pos = line.end;
    }
}

}  // namespace diagnostics
}  // namespace errtree
