#include "attributes.hpp"

#include "common/debug/res.hpp"
#include "common/error.hpp"

#include <fmt/format.h>

namespace errtree {

namespace {

[[noreturn]] void attribute_error(Span span, const std::string& message) {
    debug::res::log(debug::res::Id::Abort, message, debug::Level::Error);
    throw CompileError(CompileError::Kind::Attribute, message, span);
}

const std::string& expect_string(const ast::Attribute& attr) {
    if (attr.value.kind == ast::Literal::Kind::None) {
        attribute_error(attr.span, fmt::format("`{}` requires a value", attr.key));
    }
    if (attr.value.kind != ast::Literal::Kind::String) {
        attribute_error(attr.value.span,
                        fmt::format("`{}` expects a string literal", attr.key));
    }
    return attr.value.text;
}

bool is_digits(const std::string& text) {
    for (char c : text) {
        if (c < '0' || c > '9')
            return false;
    }
    return true;
}

}  // namespace

Config Config::root(const ast::AttrList& attrs, Span span) {
    Config config;
    config.span = span;
    config.apply(attrs);
    return config;
}

Config Config::derive(const ast::ErrorTree& node) const {
    Config config = *this;
    config.depth = depth + 1;
    config.span = node.span();
    config.msg_declared = false;
    config.nested = false;
    config.span_field.reset();
    config.apply(node.attrs());

    if (const auto* leaf = node.as_leaf()) {
        if (leaf->span_field) {
            size_t index = *leaf->span_field;
            config.span_field = SpanField{index, leaf->fields.member_name(index)};
        }
        if (config.nested && leaf->fields.count() != 1) {
            attribute_error(leaf->span,
                            fmt::format("nested variant `{}` must have exactly one field, found {}",
                                        leaf->ident, leaf->fields.count()));
        }
    }
    return config;
}

void Config::apply(const ast::AttrList& attrs) {
    for (const auto& attr : attrs) {
        if (attr.key == "kind") {
            const auto& text = expect_string(attr);
            auto severity = diagnostics::parse_severity(text);
            if (!severity) {
                attribute_error(attr.value.span,
                                fmt::format("invalid kind `{}`, expected `Error` or `Warn`", text));
            }
            kind = *severity;
        } else if (attr.key == "number") {
            if (attr.value.kind == ast::Literal::Kind::None) {
                attribute_error(attr.span, "`number` requires a value");
            }
            if (!is_digits(attr.value.text)) {
                attribute_error(attr.value.span,
                                fmt::format("invalid number `{}`, expected digits", attr.value.text));
            }
            number += attr.value.text;
        } else if (attr.key == "msg") {
            msg = TemplateSource{expect_string(attr), attr.value.span};
            msg_declared = true;
        } else if (attr.key == "label") {
            label = TemplateSource{expect_string(attr), attr.value.span};
        } else if (attr.key == "nested") {
            if (attr.value.kind != ast::Literal::Kind::None) {
                attribute_error(attr.span, "`nested` is a flag and takes no value");
            }
            nested = true;
        } else if (attr.key == "span") {
            attribute_error(attr.span, "the `span` marker is only allowed on fields");
        } else {
            attribute_error(attr.span, fmt::format("unknown attribute `{}`", attr.key));
        }
        debug::res::log(debug::res::Id::Merge, attr.key, debug::Level::Trace);
    }
}

}  // namespace errtree
