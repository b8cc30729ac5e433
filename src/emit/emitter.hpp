#pragma once

// ============================================================
// 記述子エミッタ - 走査結果を記述子とドキュメントに畳み込む
// ============================================================

#include "descriptor.hpp"
#include "resolve/walker.hpp"

#include <string>
#include <unordered_set>

namespace errtree {

/// コンパイルオプション
struct CompileOptions {
    bool unique_codes = false;        // 同じコードの再利用をエラーにする
    bool unique_identifiers = true;   // 同じ識別子の再利用をエラーにする
};

/// 記述子エミッタ
class Emitter {
   public:
    explicit Emitter(CompileOptions options = {}) : options_(options) {}

    /// 分類をコンパイルする
    ///
    /// 最初のエラー（属性・テンプレート・出力）でCompileErrorを送出する。
    CompiledTaxonomy emit(const ast::Taxonomy& taxonomy);

   private:
    VariantDescriptor emit_leaf(const ast::Leaf& leaf, const Config& config);
    std::string doc_line(const ast::ErrorTree& node, const Config& config) const;
    void check_unique(const VariantDescriptor& variant);

    CompileOptions options_;
    std::unordered_set<std::string> seen_identifiers_;
    std::unordered_set<std::string> seen_codes_;
};

}  // namespace errtree
