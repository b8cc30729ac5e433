#pragma once

#include "materializer.hpp"

#include <sstream>
#include <string>

namespace errtree::codegen {

// C++ヘッダー生成器
//
// enum class と constexpr の記述子テーブルを持つ自己完結したヘッダーを出力する。
class CppHeaderMaterializer : public Materializer {
   public:
    struct Options {
        std::string ns = "";         // 出力先の名前空間（空なら名前空間なし）
        bool include_guard = false;  // #pragma once の代わりにインクルードガード
    };

    CppHeaderMaterializer() = default;
    explicit CppHeaderMaterializer(Options options) : opts(std::move(options)) {}

    std::string materialize(const CompiledTaxonomy& taxonomy) override;
    const char* extension() const override { return ".hpp"; }

    // C++文字列リテラルとしてエスケープ
    static std::string escape_string(const std::string& text);

   private:
    Options opts;
    std::ostringstream output;
    int indent_level = 0;

    // インデント付き出力
    void emit_line(const std::string& line) {
        if (!line.empty()) {
            for (int i = 0; i < indent_level; ++i) {
                output << "    ";
            }
        }
        output << line << "\n";
    }

    void emit_prologue(const CompiledTaxonomy& taxonomy);
    void emit_enum(const CompiledTaxonomy& taxonomy);
    void emit_info_table(const CompiledTaxonomy& taxonomy);
    void emit_epilogue(const CompiledTaxonomy& taxonomy);

    std::string guard_name(const CompiledTaxonomy& taxonomy) const;
};

}  // namespace errtree::codegen
