#pragma once

// ============================================================
// エラー値 - 記述子とフィールド値を束縛したファサード実装
// ============================================================

#include "emit/descriptor.hpp"
#include "facade.hpp"
#include "field_value.hpp"

#include <memory>
#include <string>

namespace errtree {
namespace diagnostics {

class ErrorValue;
using ErrorValuePtr = std::shared_ptr<const ErrorValue>;

/// コンパイル済み分類の一バリアントを具体的な値で実体化したもの
class ErrorValue : public DiagnosticFacade {
    // make() 以外からの構築を禁じるためのタグ
    struct Private {
        explicit Private() = default;
    };

   public:
    /// バリアントを識別子で選び、宣言順のフィールド値を束縛する
    ///
    /// 未知の識別子、値の数の不一致、spanフィールドへの位置以外の値、
    /// 入れ子バリアントへの診断以外の値はstd::invalid_argumentを送出する。
    static ErrorValuePtr make(std::shared_ptr<const CompiledTaxonomy> taxonomy,
                              const std::string& identifier, FieldValues values);

    Severity kind() const override { return variant_->severity; }
    std::string numeric_code() const override { return variant_->numeric_code; }
    std::string code() const override { return variant_->string_code; }
    SourceSpan primary_span() const override;
    std::string primary_message() const override;
    std::string primary_label() const override;

    const std::string& identifier() const { return variant_->identifier; }
    const VariantDescriptor& descriptor() const { return *variant_; }
    const CompiledTaxonomy& taxonomy() const { return *taxonomy_; }
    const FieldValues& values() const { return values_; }

    /// 名前（位置フィールドは "_0" など）でフィールド値を取得
    const FieldValue* field(const std::string& name) const;

    ErrorValue(Private, std::shared_ptr<const CompiledTaxonomy> taxonomy,
               const VariantDescriptor* variant, FieldValues values)
        : taxonomy_(std::move(taxonomy)), variant_(variant), values_(std::move(values)) {}

   private:
    std::shared_ptr<const CompiledTaxonomy> taxonomy_;
    const VariantDescriptor* variant_;
    FieldValues values_;
};

}  // namespace diagnostics
}  // namespace errtree
