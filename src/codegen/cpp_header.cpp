#include "cpp_header.hpp"

#include "common/debug.hpp"

#include <fmt/format.h>

#include <cctype>

namespace errtree::codegen {

namespace {

// コメント内に置けるよう改行を空白に置き換える
std::string one_line(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        out += (c == '\n' || c == '\r') ? ' ' : c;
    }
    return out;
}

// フィールド形状の説明（ドキュメントコメント用）
std::string describe_fields(const ast::FieldShape& shape) {
    std::string out;
    switch (shape.kind) {
        case ast::FieldShape::Kind::Named:
            for (const auto& field : shape.fields) {
                if (!out.empty())
                    out += ", ";
                out += field.name + ": " + field.type_text;
            }
            return "{ " + out + " }";
        case ast::FieldShape::Kind::Positional:
            for (const auto& field : shape.fields) {
                if (!out.empty())
                    out += ", ";
                out += field.type_text;
            }
            return "(" + out + ")";
        case ast::FieldShape::Kind::Unit:
            return "";
    }
    return "";
}

}  // namespace

std::string CppHeaderMaterializer::escape_string(const std::string& text) {
    std::string out;
    out.reserve(text.size() + 2);
    for (unsigned char c : text) {
        switch (c) {
            case '\\':
                out += "\\\\";
                break;
            case '"':
                out += "\\\"";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                if (c < 0x20) {
                    // 8進は最大3桁で終わるので後続の文字を取り込まない
                    out += fmt::format("\\{:03o}", c);
                } else {
                    out += static_cast<char>(c);
                }
                break;
        }
    }
    return out;
}

std::string CppHeaderMaterializer::materialize(const CompiledTaxonomy& taxonomy) {
    debug::log(debug::Stage::Emit, debug::Level::Debug,
               fmt::format("materializing C++ header for {}", taxonomy.name));
    output.str("");
    output.clear();
    indent_level = 0;

    emit_prologue(taxonomy);
    emit_enum(taxonomy);
    emit_line("");
    emit_info_table(taxonomy);
    emit_epilogue(taxonomy);
    return output.str();
}

std::string CppHeaderMaterializer::guard_name(const CompiledTaxonomy& taxonomy) const {
    std::string guard;
    for (char c : opts.ns + "_" + taxonomy.name) {
        guard += std::isalnum(static_cast<unsigned char>(c))
                     ? static_cast<char>(std::toupper(static_cast<unsigned char>(c)))
                     : '_';
    }
    return guard + "_HPP";
}

void CppHeaderMaterializer::emit_prologue(const CompiledTaxonomy& taxonomy) {
    emit_line("// Generated by errtreec. Do not edit.");
    if (opts.include_guard) {
        emit_line("#ifndef " + guard_name(taxonomy));
        emit_line("#define " + guard_name(taxonomy));
    } else {
        emit_line("#pragma once");
    }
    emit_line("");
    emit_line("#include <array>");
    emit_line("#include <cstddef>");
    emit_line("#include <string_view>");
    emit_line("");
    if (!opts.ns.empty()) {
        emit_line("namespace " + opts.ns + " {");
        emit_line("");
    }
}

void CppHeaderMaterializer::emit_enum(const CompiledTaxonomy& taxonomy) {
    emit_line("/// " + taxonomy.name);
    if (!taxonomy.doc.empty()) {
        emit_line("///");
        for (const auto& line : taxonomy.doc) {
            emit_line("/// " + one_line(line));
        }
    }
    emit_line(fmt::format("enum class {} {{", taxonomy.name));
    indent_level++;
    for (const auto& variant : taxonomy.variants) {
        std::string fields = describe_fields(variant.field_shape);
        if (!fields.empty()) {
            emit_line("/// " + one_line(fields));
        }
        emit_line(fmt::format("{},  // `{}`: {}", variant.identifier, variant.string_code,
                              one_line(variant.message.source())));
    }
    indent_level--;
    emit_line("};");
}

void CppHeaderMaterializer::emit_info_table(const CompiledTaxonomy& taxonomy) {
    const std::string info = taxonomy.name + "Info";

    emit_line(fmt::format("struct {} {{", info));
    indent_level++;
    emit_line("std::string_view name;");
    emit_line("char kind;  // 'E' or 'W'");
    emit_line("std::string_view number;");
    emit_line("std::string_view code;");
    emit_line("std::string_view message;");
    emit_line("std::string_view label;");
    emit_line("std::string_view span_field;  // empty when the location is unknown");
    indent_level--;
    emit_line("};");
    emit_line("");

    emit_line(fmt::format("inline constexpr std::array<{}, {}> k{}Table = {{{{", info,
                          taxonomy.variants.size(), taxonomy.name));
    indent_level++;
    for (const auto& variant : taxonomy.variants) {
        std::string span_field =
            variant.span_rule.kind == SpanRule::Kind::FromField ? variant.span_rule.name : "";
        emit_line(fmt::format("{{\"{}\", '{}', \"{}\", \"{}\", \"{}\", \"{}\", \"{}\"}},",
                              variant.identifier, diagnostics::severity_marker(variant.severity),
                              variant.numeric_code, variant.string_code,
                              escape_string(variant.message.source()),
                              escape_string(variant.label.source()), span_field));
    }
    indent_level--;
    emit_line("}};");
    emit_line("");

    emit_line(fmt::format("inline constexpr const {}& info({} value) {{", info, taxonomy.name));
    indent_level++;
    emit_line(fmt::format("return k{}Table[static_cast<std::size_t>(value)];", taxonomy.name));
    indent_level--;
    emit_line("}");
}

void CppHeaderMaterializer::emit_epilogue(const CompiledTaxonomy& taxonomy) {
    if (!opts.ns.empty()) {
        emit_line("");
        emit_line("}  // namespace " + opts.ns);
    }
    if (opts.include_guard) {
        emit_line("");
        emit_line("#endif  // " + guard_name(taxonomy));
    }
}

}  // namespace errtree::codegen
