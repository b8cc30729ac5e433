#pragma once

// ============================================================
// コンパイラドライバ - 字句解析から記述子生成まで
// ============================================================

#include "common/source.hpp"
#include "emit/emitter.hpp"

#include <memory>
#include <vector>

namespace errtree {

/// ソースファイルに含まれる全分類をコンパイルする
class Compiler {
   public:
    explicit Compiler(CompileOptions options = {}) : options_(options) {}

    /// 最初のエラーでCompileErrorを送出する
    std::vector<CompiledTaxonomyPtr> compile(const std::shared_ptr<const SourceFile>& source) const;

    /// ソース文字列から直接コンパイル（URIなし）
    std::vector<CompiledTaxonomyPtr> compile_text(const std::string& text) const;

    const CompileOptions& options() const { return options_; }

   private:
    CompileOptions options_;
};

}  // namespace errtree
