#include "emitter.hpp"

#include "common/debug/emit.hpp"
#include "common/error.hpp"

#include <fmt/format.h>

namespace errtree {

namespace {

[[noreturn]] void emission_error(Span span, const std::string& message) {
    debug::emit::log(debug::emit::Id::Error, message, debug::Level::Error);
    throw CompileError(CompileError::Kind::Emission, message, span);
}

SpanRule span_rule_for(const ast::Leaf& leaf, const Config& config) {
    if (!config.span_field)
        return SpanRule::none();

    switch (leaf.fields.kind) {
        case ast::FieldShape::Kind::Named:
        case ast::FieldShape::Kind::Positional:
            return SpanRule::from_field(config.span_field->name, config.span_field->index);
        case ast::FieldShape::Kind::Unit:
            break;
    }
    return SpanRule::none();
}

std::string code_of(const Config& config) {
    return std::string(1, diagnostics::severity_marker(config.severity())) + config.number;
}

}  // namespace

CompiledTaxonomy Emitter::emit(const ast::Taxonomy& taxonomy) {
    debug::emit::log(debug::emit::Id::Start, taxonomy.name);
    seen_identifiers_.clear();
    seen_codes_.clear();

    CompiledTaxonomy result;
    result.name = taxonomy.name;
    result.visibility = taxonomy.visibility;
    result.generics = taxonomy.generics;

    TreeWalker walker(taxonomy);
    while (auto visited = walker.next_node()) {
        const ast::ErrorTree& node = *visited->node;
        const Config& config = visited->config;

        if (const auto* leaf = node.as_leaf()) {
            VariantDescriptor variant = emit_leaf(*leaf, config);
            check_unique(variant);
            result.variants.push_back(std::move(variant));
        }

        std::string line = doc_line(node, config);
        debug::emit::log(debug::emit::Id::DocLine, line, debug::Level::Trace);
        result.doc.push_back(std::move(line));
    }

    debug::emit::log(debug::emit::Id::End,
                     fmt::format("{} ({} variants)", taxonomy.name, result.variants.size()));
    return result;
}

VariantDescriptor Emitter::emit_leaf(const ast::Leaf& leaf, const Config& config) {
    if (!config.msg) {
        emission_error(leaf.span, fmt::format("variant `{}` has no message", leaf.ident));
    }

    TemplateCompiler compiler(leaf.fields);

    VariantDescriptor variant;
    variant.identifier = leaf.ident;
    variant.field_shape = leaf.fields;
    variant.severity = config.severity();
    variant.numeric_code = config.number;
    variant.string_code = code_of(config);
    variant.message = compiler.compile(config.msg->text, config.msg->span);
    // ラベルがなければメッセージをそのまま使う
    variant.label = config.label ? compiler.compile(config.label->text, config.label->span)
                                 : variant.message;
    variant.span_rule = span_rule_for(leaf, config);
    variant.nested = config.nested;
    variant.span = leaf.span;

    debug::emit::log(debug::emit::Id::Variant,
                     fmt::format("{} {}", variant.string_code, variant.identifier));
    return variant;
}

std::string Emitter::doc_line(const ast::ErrorTree& node, const Config& config) const {
    std::string indent(config.depth > 2 ? 2 * static_cast<size_t>(config.depth - 2) : 0, ' ');
    std::string code = code_of(config);

    if (const auto* leaf = node.as_leaf()) {
        return fmt::format("{}- `{}`(**{}**): {}", indent, code, leaf->ident, config.msg->text);
    }
    // グループは自身が宣言したメッセージのみ表示する
    if (config.msg_declared) {
        return fmt::format("{}- `{}`: {}", indent, code, config.msg->text);
    }
    return fmt::format("{}- `{}`", indent, code);
}

void Emitter::check_unique(const VariantDescriptor& variant) {
    if (options_.unique_identifiers) {
        if (!seen_identifiers_.insert(variant.identifier).second) {
            debug::emit::log(debug::emit::Id::Duplicate, variant.identifier, debug::Level::Warn);
            emission_error(variant.span,
                           fmt::format("duplicate variant identifier `{}`", variant.identifier));
        }
    }
    if (options_.unique_codes) {
        if (!seen_codes_.insert(variant.string_code).second) {
            debug::emit::log(debug::emit::Id::Duplicate, variant.string_code, debug::Level::Warn);
            emission_error(variant.span,
                           fmt::format("duplicate code `{}` (variant `{}`)", variant.string_code,
                                       variant.identifier));
        }
    }
}

}  // namespace errtree
