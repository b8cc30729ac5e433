#pragma once

// ============================================================
// メッセージテンプレート - プレースホルダーの解析と検証
// ============================================================

#include "common/span.hpp"
#include "diagnostics/field_value.hpp"
#include "frontend/ast/tree.hpp"

#include <string>
#include <vector>

namespace errtree {

/// テンプレートの構成要素
struct TemplateSegment {
    enum class Kind {
        Literal,      // そのまま出力するテキスト
        Placeholder,  // フィールド参照
    };

    Kind kind;
    std::string text;        // Literal: テキスト, Placeholder: フィールドの参照名
    size_t field_index = 0;  // Placeholder: 参照先フィールドの位置
    std::string spec;        // Placeholder: ':' 以降の書式指定（なければ空）

    static TemplateSegment literal(std::string text) {
        return TemplateSegment{Kind::Literal, std::move(text), 0, ""};
    }
    static TemplateSegment placeholder(std::string name, size_t index, std::string spec) {
        return TemplateSegment{Kind::Placeholder, std::move(name), index, std::move(spec)};
    }
};

/// コンパイル済みテンプレート
class CompiledTemplate {
   public:
    CompiledTemplate() = default;
    CompiledTemplate(std::string source, Span span, std::vector<TemplateSegment> segments)
        : source_(std::move(source)), span_(span), segments_(std::move(segments)) {}

    /// テンプレートの元テキスト
    const std::string& source() const { return source_; }
    Span span() const { return span_; }
    const std::vector<TemplateSegment>& segments() const { return segments_; }

    /// プレースホルダーを含まないか
    bool is_static() const;

    /// 参照しているフィールド位置（出現順）
    std::vector<size_t> referenced_fields() const;

    /// フィールド値を埋め込んで文字列を生成
    ///
    /// 入れ子の診断はそのprimary_message()で置き換える。
    std::string render(const diagnostics::FieldValues& values) const;

   private:
    std::string source_;
    Span span_{0, 0};
    std::vector<TemplateSegment> segments_;
};

/// テンプレートをリーフのフィールド形状に対してコンパイルする
class TemplateCompiler {
   public:
    explicit TemplateCompiler(const ast::FieldShape& shape) : shape_(shape) {}

    /// 不正なテンプレートはCompileError(Template)を送出する
    CompiledTemplate compile(const std::string& text, Span span) const;

   private:
    size_t resolve(const std::string& reference, size_t& implicit_index, Span span) const;

    const ast::FieldShape& shape_;
};

/// 単一の値を書式指定つきで文字列化する
std::string render_field_value(const diagnostics::FieldValue& value, const std::string& spec);

}  // namespace errtree
