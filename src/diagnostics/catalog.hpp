#pragma once

// ============================================================
// 分類カタログ - コンパイル済み分類を名前で管理
// ============================================================

#include "emit/descriptor.hpp"
#include "error_value.hpp"

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace errtree {
namespace diagnostics {

/// コンパイル済み分類のカタログ
class TaxonomyCatalog {
   public:
    /// 分類を登録（同名が既にあればfalse）
    bool add(CompiledTaxonomyPtr taxonomy);

    /// 名前で分類を取得
    CompiledTaxonomyPtr get(const std::string& name) const;

    /// 表示用コード（"E01"）でバリアントを検索
    ///
    /// 複数の分類に同じコードがある場合は登録順で最初のもの。
    const VariantDescriptor* find_code(const std::string& code) const;

    /// 分類名と識別子からエラー値を生成
    ErrorValuePtr make(const std::string& taxonomy, const std::string& identifier,
                       FieldValues values) const;

    /// 登録順の分類一覧
    const std::vector<CompiledTaxonomyPtr>& all() const { return order_; }

    size_t size() const { return order_.size(); }

   private:
    std::unordered_map<std::string, CompiledTaxonomyPtr> by_name_;
    std::vector<CompiledTaxonomyPtr> order_;
};

}  // namespace diagnostics
}  // namespace errtree
