// ============================================================
// CompileError 実装
// ============================================================

#include "error.hpp"

#include "source.hpp"

#include <fmt/format.h>

#include <algorithm>

namespace errtree {

const char* error_kind_to_string(CompileError::Kind kind) {
    switch (kind) {
        case CompileError::Kind::Parse:
            return "parse";
        case CompileError::Kind::Attribute:
            return "attribute";
        case CompileError::Kind::Template:
            return "template";
        case CompileError::Kind::Emission:
            return "emission";
    }
    return "unknown";
}

std::string CompileError::format_error(Kind kind, const std::string& message) {
    return fmt::format("{} error: {}", error_kind_to_string(kind), message);
}

std::string format_compile_error(const CompileError& error, const SourceFile& source) {
    auto loc = source.indexer().line_col_at(error.span().start);
    auto line_text = source.get_line(loc.line);

    std::string result;
    if (!source.uri().empty()) {
        result += source.uri() + ":";
    }
    // 表示は1始まり
    result += fmt::format("{}:{}: {}\n", loc.line + 1, loc.column + 1, error.what());
    if (!line_text.empty()) {
        size_t width = std::max<size_t>(1, error.span().length());
        if (loc.column + width > line_text.size()) {
            width = line_text.size() > loc.column ? line_text.size() - loc.column : 1;
        }
        result += fmt::format("  {}\n", line_text);
        result += fmt::format("  {}{}\n", std::string(loc.column, ' '), std::string(width, '^'));
    }
    return result;
}

}  // namespace errtree
