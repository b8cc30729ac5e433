#pragma once

// ============================================================
// 分類木の走査 - 明示的スタックによる前順走査
// ============================================================

#include "attributes.hpp"
#include "frontend/ast/tree.hpp"

#include <optional>
#include <vector>

namespace errtree {

/// 走査で得られるノードと、その解決済み設定
struct VisitedNode {
    const ast::ErrorTree* node;
    Config config;
};

/// 分類木を前順・深さ優先で一つずつ取り出すウォーカー
///
/// 再帰を使わず (兄弟カーソル, 継承Config) のフレームをスタックに積む。
/// 最初のエラーでスタックを破棄し、以降は何も返さない。
class TreeWalker {
   public:
    explicit TreeWalker(const ast::Taxonomy& taxonomy);

    /// 次のノード（グループとリーフの両方）
    std::optional<VisitedNode> next_node();

    /// 次のリーフ
    std::optional<VisitedNode> next_leaf();

    /// 分類ルートの設定（ルート属性の解決後）
    const Config& root_config();

   private:
    struct Frame {
        const std::vector<ast::ErrorTreePtr>* nodes;
        size_t next;
        Config config;
    };

    void start();

    const ast::Taxonomy& taxonomy_;
    std::vector<Frame> stack_;
    std::optional<Config> root_;
    bool started_ = false;
    bool finished_ = false;
};

}  // namespace errtree
