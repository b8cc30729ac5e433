#include "template.hpp"

#include "common/debug/tmpl.hpp"
#include "common/error.hpp"
#include "diagnostics/facade.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <charconv>
#include <regex>
#include <type_traits>

namespace errtree {

namespace {

// プレースホルダー内部の書式: 参照（数値 | 識別子 | 空） と任意の ':' 書式指定
const std::regex& placeholder_pattern() {
    static const std::regex pattern(R"(^([0-9]+|[A-Za-z_][A-Za-z0-9_]*)?(?::(.*))?$)");
    return pattern;
}

[[noreturn]] void template_error(Span span, const std::string& message) {
    debug::tmpl::log(debug::tmpl::Id::Error, message, debug::Level::Error);
    throw CompileError(CompileError::Kind::Template, message, span);
}

bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

}  // namespace

// ============================================================
// TemplateCompiler
// ============================================================

CompiledTemplate TemplateCompiler::compile(const std::string& text, Span span) const {
    debug::tmpl::log(debug::tmpl::Id::Compile, text, debug::Level::Trace);

    std::vector<TemplateSegment> segments;
    std::string literal;
    size_t implicit_index = 0;
    size_t pos = 0;

    auto flush = [&]() {
        if (!literal.empty()) {
            segments.push_back(TemplateSegment::literal(std::move(literal)));
            literal.clear();
        }
    };

    while (pos < text.size()) {
        char c = text[pos];
        if (c == '{') {
            if (pos + 1 < text.size() && text[pos + 1] == '{') {
                debug::tmpl::log(debug::tmpl::Id::Escape, "{{", debug::Level::Trace);
                literal += '{';
                pos += 2;
                continue;
            }

            size_t close = text.find('}', pos + 1);
            if (close == std::string::npos) {
                template_error(span, fmt::format("unterminated placeholder in \"{}\"", text));
            }
            std::string content = text.substr(pos + 1, close - pos - 1);
            if (content.find('{') != std::string::npos) {
                template_error(span, fmt::format("malformed placeholder `{{{}}}`", content));
            }

            std::smatch match;
            if (!std::regex_match(content, match, placeholder_pattern())) {
                template_error(span, fmt::format("malformed placeholder `{{{}}}`", content));
            }
            std::string reference = match[1].str();
            std::string spec = match[2].matched ? match[2].str() : "";

            size_t index = resolve(reference, implicit_index, span);
            debug::tmpl::log(debug::tmpl::Id::Placeholder,
                             fmt::format("{{{}}} -> field {}", content, index),
                             debug::Level::Trace);

            flush();
            segments.push_back(
                TemplateSegment::placeholder(shape_.member_name(index), index, std::move(spec)));
            pos = close + 1;
        } else if (c == '}') {
            if (pos + 1 < text.size() && text[pos + 1] == '}') {
                debug::tmpl::log(debug::tmpl::Id::Escape, "}}", debug::Level::Trace);
                literal += '}';
                pos += 2;
                continue;
            }
            template_error(span, fmt::format("unmatched `}}` in \"{}\"", text));
        } else {
            literal += c;
            ++pos;
        }
    }
    flush();

    return CompiledTemplate(text, span, std::move(segments));
}

size_t TemplateCompiler::resolve(const std::string& reference, size_t& implicit_index,
                                 Span span) const {
    const size_t count = shape_.count();

    if (shape_.kind == ast::FieldShape::Kind::Unit) {
        template_error(span, fmt::format("placeholder `{{{}}}` in a variant without fields",
                                         reference));
    }

    // {} は暗黙の位置参照
    if (reference.empty()) {
        size_t index = implicit_index++;
        if (index >= count) {
            template_error(span, fmt::format("implicit placeholder #{} is out of range ({} fields)",
                                             index, count));
        }
        return index;
    }

    if (is_digit(reference[0])) {
        size_t index = 0;
        auto [ptr, ec] =
            std::from_chars(reference.data(), reference.data() + reference.size(), index);
        if (ec != std::errc() || ptr != reference.data() + reference.size() || index >= count) {
            template_error(span, fmt::format("positional placeholder `{{{}}}` is out of range "
                                             "({} fields)",
                                             reference, count));
        }
        return index;
    }

    if (shape_.kind != ast::FieldShape::Kind::Named) {
        template_error(span, fmt::format("named placeholder `{{{}}}` in a variant with {} fields",
                                         reference, ast::shape_kind_to_string(shape_.kind)));
    }
    auto index = shape_.find(reference);
    if (!index) {
        template_error(span, fmt::format("unknown field `{}` in placeholder", reference));
    }
    return *index;
}

// ============================================================
// CompiledTemplate
// ============================================================

bool CompiledTemplate::is_static() const {
    for (const auto& segment : segments_) {
        if (segment.kind == TemplateSegment::Kind::Placeholder)
            return false;
    }
    return true;
}

std::vector<size_t> CompiledTemplate::referenced_fields() const {
    std::vector<size_t> result;
    for (const auto& segment : segments_) {
        if (segment.kind == TemplateSegment::Kind::Placeholder)
            result.push_back(segment.field_index);
    }
    return result;
}

std::string CompiledTemplate::render(const diagnostics::FieldValues& values) const {
    std::string out;
    for (const auto& segment : segments_) {
        if (segment.kind == TemplateSegment::Kind::Literal) {
            out += segment.text;
        } else if (segment.field_index < values.size()) {
            out += render_field_value(values[segment.field_index], segment.spec);
        } else {
            // 値が足りない場合はプレースホルダーのまま残す
            out += "{" + segment.text + "}";
        }
    }
    return out;
}

// ============================================================
// 値の文字列化
// ============================================================

namespace {

template <typename T>
std::string format_with_spec(const T& value, const std::string& spec) {
    if (spec.empty()) {
        return fmt::format("{}", value);
    }
    try {
        return fmt::format(fmt::runtime("{:" + spec + "}"), value);
    } catch (const fmt::format_error& e) {
        debug::tmpl::log(debug::tmpl::Id::SpecFallback, fmt::format("`{}`: {}", spec, e.what()),
                         debug::Level::Warn);
        return fmt::format("{}", value);
    }
}

/// 型指定のない精度 (".2" など) を持つか
bool has_bare_precision(const std::string& spec) {
    size_t dot = spec.rfind('.');
    if (dot == std::string::npos || dot + 1 >= spec.size())
        return false;
    for (size_t i = dot + 1; i < spec.size(); ++i) {
        if (spec[i] < '0' || spec[i] > '9')
            return false;
    }
    return true;
}

std::string span_text(const SourceSpan& span) {
    if (!span.is_known())
        return "<unknown>";
    const auto& text = span.source_text();
    size_t start = std::min(span.start(), text.size());
    size_t end = std::min(std::max(span.end(), start), text.size());
    return text.substr(start, end - start);
}

}  // namespace

std::string render_field_value(const diagnostics::FieldValue& value, const std::string& spec) {
    return std::visit(
        [&](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, SourceSpan>) {
                return format_with_spec(span_text(v), spec);
            } else if constexpr (std::is_same_v<T, diagnostics::DiagnosticPtr>) {
                return format_with_spec(v ? v->primary_message() : std::string(), spec);
            } else if constexpr (std::is_same_v<T, double>) {
                // 浮動小数点の精度は有効桁数ではなく小数点以下の桁数
                return format_with_spec(v, has_bare_precision(spec) ? spec + "f" : spec);
            } else {
                return format_with_spec(v, spec);
            }
        },
        value);
}

}  // namespace errtree
