#pragma once

#include "emit/descriptor.hpp"

#include <string>

namespace errtree::codegen {

// コンパイル済み分類をテキストに変換するインターフェース
class Materializer {
   public:
    virtual ~Materializer() = default;

    virtual std::string materialize(const CompiledTaxonomy& taxonomy) = 0;

    // 出力ファイルの既定の拡張子
    virtual const char* extension() const = 0;
};

}  // namespace errtree::codegen
