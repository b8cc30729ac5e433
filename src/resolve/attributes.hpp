#pragma once

// ============================================================
// 属性の解決 - ノードごとの継承済み設定
// ============================================================

#include "common/span.hpp"
#include "diagnostics/levels.hpp"
#include "frontend/ast/tree.hpp"

#include <optional>
#include <string>

namespace errtree {

/// テンプレート文字列とその位置
struct TemplateSource {
    std::string text;
    Span span;
};

/// spanマーカーの付いたフィールド
struct SpanField {
    size_t index;
    std::string name;  // 位置フィールドでは "_<index>"
};

/// 継承を適用したノードの設定
///
/// 不変の値として扱い、子ノードはコピーして上書きした新しいConfigを受け取る。
struct Config {
    std::optional<diagnostics::Severity> kind;
    std::string number;  // ルートから順に連結したコード断片
    std::optional<TemplateSource> msg;
    bool msg_declared = false;  // このノード自身がmsgを宣言したか
    std::optional<TemplateSource> label;
    std::optional<SpanField> span_field;
    int depth = 1;
    bool nested = false;
    Span span{0, 0};

    /// 重大度（未指定ならError）
    diagnostics::Severity severity() const { return kind.value_or(diagnostics::Severity::Error); }

    /// 分類ルートの設定
    static Config root(const ast::AttrList& attrs, Span span);

    /// 子ノードの設定を導出する
    ///
    /// 不正な属性はCompileError(Attribute)を送出する。
    Config derive(const ast::ErrorTree& node) const;

   private:
    void apply(const ast::AttrList& attrs);
};

}  // namespace errtree
