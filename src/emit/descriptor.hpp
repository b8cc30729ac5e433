#pragma once

// ============================================================
// バリアント記述子 - コンパイル結果
// ============================================================

#include "diagnostics/levels.hpp"
#include "format/template.hpp"
#include "frontend/ast/tree.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace errtree {

/// 主要な位置の求め方
struct SpanRule {
    enum class Kind {
        Default,    // 位置不明
        FromField,  // spanマーカーの付いたフィールドから取る
    };

    Kind kind = Kind::Default;
    std::string name;  // FromField: フィールドの参照名
    size_t index = 0;  // FromField: フィールドの位置

    static SpanRule none() { return SpanRule{}; }
    static SpanRule from_field(std::string name, size_t index) {
        return SpanRule{Kind::FromField, std::move(name), index};
    }
};

/// リーフ一つ分のコンパイル結果
struct VariantDescriptor {
    std::string identifier;
    ast::FieldShape field_shape;
    diagnostics::Severity severity = diagnostics::Severity::Error;
    std::string numeric_code;  // "01"
    std::string string_code;   // "E01"
    CompiledTemplate message;
    CompiledTemplate label;
    SpanRule span_rule;
    bool nested = false;
    Span span{0, 0};
};

/// 分類一つ分のコンパイル結果（不変）
struct CompiledTaxonomy {
    std::string name;
    std::string visibility;
    std::string generics;
    std::vector<VariantDescriptor> variants;  // 宣言順
    std::vector<std::string> doc;             // ドキュメント行（宣言順）

    const VariantDescriptor* find_by_ident(const std::string& identifier) const {
        for (const auto& variant : variants) {
            if (variant.identifier == identifier)
                return &variant;
        }
        return nullptr;
    }

    const VariantDescriptor* find_by_code(const std::string& code) const {
        for (const auto& variant : variants) {
            if (variant.string_code == code)
                return &variant;
        }
        return nullptr;
    }

    /// ドキュメントを改行区切りで結合
    std::string doc_text() const {
        std::string out;
        for (const auto& line : doc) {
            out += line;
            out += '\n';
        }
        return out;
    }
};

using CompiledTaxonomyPtr = std::shared_ptr<const CompiledTaxonomy>;

}  // namespace errtree
