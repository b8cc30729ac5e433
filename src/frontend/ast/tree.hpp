#pragma once

// ============================================================
// エラー分類木 - パーサの出力
// ============================================================

#include "common/span.hpp"

#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace errtree::ast {

/// 属性値のリテラル
struct Literal {
    enum class Kind {
        None,     // #[nested] のように値なし
        String,   // "..."
        Integer,  // 01
    };

    Kind kind = Kind::None;
    std::string text;  // 文字列はエスケープ解除後、整数はソース上の表記
    Span span{0, 0};
};

/// ノードに付いた生の属性（解釈前）
struct Attribute {
    std::string key;
    Literal value;
    Span span;
};

using AttrList = std::vector<Attribute>;

/// リーフのフィールド宣言
struct Field {
    std::string name;       // 位置フィールドでは空
    std::string type_text;  // 型のソーステキスト
    Span span;
};

/// リーフのフィールド形状
struct FieldShape {
    enum class Kind {
        Named,       // { path: Path, ... }
        Positional,  // (Path, ...)
        Unit,        // フィールドなし
    };

    Kind kind = Kind::Unit;
    std::vector<Field> fields;

    size_t count() const { return fields.size(); }

    /// 名前付きフィールドを検索
    std::optional<size_t> find(const std::string& name) const {
        if (kind != Kind::Named)
            return std::nullopt;
        for (size_t i = 0; i < fields.size(); ++i) {
            if (fields[i].name == name)
                return i;
        }
        return std::nullopt;
    }

    /// フィールドの参照名（位置フィールドは "_0", "_1", ...）
    std::string member_name(size_t index) const {
        if (kind == Kind::Named)
            return fields[index].name;
        return "_" + std::to_string(index);
    }
};

inline const char* shape_kind_to_string(FieldShape::Kind kind) {
    switch (kind) {
        case FieldShape::Kind::Named:
            return "named";
        case FieldShape::Kind::Positional:
            return "positional";
        case FieldShape::Kind::Unit:
            return "unit";
    }
    return "unknown";
}

struct ErrorTree;
using ErrorTreePtr = std::unique_ptr<ErrorTree>;

/// 内部ノード：子孫に属性を継承させる
struct Group {
    Span span;
    AttrList attrs;
    std::vector<ErrorTreePtr> children;
};

/// 終端ノード：具体的なエラーバリアント
struct Leaf {
    Span span;
    AttrList attrs;
    std::string ident;
    FieldShape fields;
    std::optional<size_t> span_field;  // spanマーカー付きフィールドの位置
};

/// エラー分類木のノード
struct ErrorTree {
    std::variant<Group, Leaf> node;

    explicit ErrorTree(Group group) : node(std::move(group)) {}
    explicit ErrorTree(Leaf leaf) : node(std::move(leaf)) {}

    bool is_group() const { return std::holds_alternative<Group>(node); }
    bool is_leaf() const { return std::holds_alternative<Leaf>(node); }

    const Group* as_group() const { return std::get_if<Group>(&node); }
    const Leaf* as_leaf() const { return std::get_if<Leaf>(&node); }

    const AttrList& attrs() const {
        if (auto* group = as_group())
            return group->attrs;
        return std::get<Leaf>(node).attrs;
    }

    Span span() const {
        if (auto* group = as_group())
            return group->span;
        return std::get<Leaf>(node).span;
    }
};

/// 名前付きのエラー分類（トップレベル）
struct Taxonomy {
    Span span;              // 名前の位置
    AttrList attrs;         // ルート属性
    std::string visibility; // "pub", "pub(crate)" など（なければ空）
    std::string name;
    std::string generics;   // "<T: Display>" など（なければ空）
    std::vector<ErrorTreePtr> roots;
};

/// ソースファイル全体
struct TaxonomyFile {
    std::vector<Taxonomy> taxonomies;
};

}  // namespace errtree::ast
