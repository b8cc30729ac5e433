#include "error_value.hpp"

#include "common/debug.hpp"

#include <fmt/format.h>

#include <stdexcept>

namespace errtree {
namespace diagnostics {

ErrorValuePtr ErrorValue::make(std::shared_ptr<const CompiledTaxonomy> taxonomy,
                               const std::string& identifier, FieldValues values) {
    if (!taxonomy) {
        throw std::invalid_argument("ErrorValue::make: taxonomy is null");
    }
    const VariantDescriptor* variant = taxonomy->find_by_ident(identifier);
    if (!variant) {
        throw std::invalid_argument(
            fmt::format("unknown variant `{}` in taxonomy `{}`", identifier, taxonomy->name));
    }

    const size_t expected = variant->field_shape.count();
    if (values.size() != expected) {
        throw std::invalid_argument(fmt::format("variant `{}` expects {} field values, got {}",
                                                identifier, expected, values.size()));
    }

    if (variant->span_rule.kind == SpanRule::Kind::FromField) {
        const auto& value = values[variant->span_rule.index];
        if (!std::holds_alternative<SourceSpan>(value)) {
            throw std::invalid_argument(fmt::format("field `{}` of `{}` must be a span, got {}",
                                                    variant->span_rule.name, identifier,
                                                    field_value_type_name(value)));
        }
    }

    if (variant->nested) {
        const auto* nested = std::get_if<DiagnosticPtr>(&values[0]);
        if (!nested || !*nested) {
            throw std::invalid_argument(
                fmt::format("nested variant `{}` requires a diagnostic value, got {}", identifier,
                            field_value_type_name(values[0])));
        }
    }

    debug::log(debug::Stage::Runtime, debug::Level::Trace,
               fmt::format("{} {}", variant->string_code, identifier));
    return std::make_shared<const ErrorValue>(Private{}, std::move(taxonomy), variant,
                                              std::move(values));
}

SourceSpan ErrorValue::primary_span() const {
    if (variant_->span_rule.kind == SpanRule::Kind::Default) {
        return SourceSpan();
    }
    return std::get<SourceSpan>(values_[variant_->span_rule.index]);
}

std::string ErrorValue::primary_message() const {
    return variant_->message.render(values_);
}

std::string ErrorValue::primary_label() const {
    return variant_->label.render(values_);
}

const FieldValue* ErrorValue::field(const std::string& name) const {
    const auto& shape = variant_->field_shape;
    for (size_t i = 0; i < shape.count(); ++i) {
        if (shape.member_name(i) == name)
            return &values_[i];
    }
    return nullptr;
}

}  // namespace diagnostics
}  // namespace errtree
