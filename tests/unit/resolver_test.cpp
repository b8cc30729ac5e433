#include "../../src/frontend/parser/parser.hpp"
#include "../../src/resolve/walker.hpp"

#include <gtest/gtest.h>

using namespace errtree;
using diagnostics::Severity;

// ============================================================
// テストヘルパー
// ============================================================
class ResolverTest : public ::testing::Test {
   protected:
    ast::TaxonomyFile file;

    ast::Taxonomy& load(const std::string& source) {
        file = parse_source(source);
        return file.taxonomies.front();
    }

    // 全ノードを走査して設定を集める
    std::vector<VisitedNode> walk_all(const std::string& source) {
        TreeWalker walker(load(source));
        std::vector<VisitedNode> nodes;
        while (auto visited = walker.next_node()) {
            nodes.push_back(std::move(*visited));
        }
        return nodes;
    }

    std::vector<VisitedNode> walk_leaves(const std::string& source) {
        TreeWalker walker(load(source));
        std::vector<VisitedNode> nodes;
        while (auto visited = walker.next_leaf()) {
            nodes.push_back(std::move(*visited));
        }
        return nodes;
    }

    CompileError walk_error(const std::string& source) {
        try {
            walk_all(source);
        } catch (const CompileError& e) {
            return e;
        }
        ADD_FAILURE() << "expected a CompileError";
        return CompileError(CompileError::Kind::Parse, "", Span{0, 0});
    }

    static std::string ident(const VisitedNode& node) {
        const auto* leaf = node.node->as_leaf();
        return leaf ? leaf->ident : "<group>";
    }
};

// ============================================================
// 走査順
// ============================================================
TEST_F(ResolverTest, PreOrderDepthFirst) {
    auto nodes = walk_all(R"(
        E {
            A,
            { B, { C }, D },
            F,
        }
    )");

    std::vector<std::string> order;
    for (const auto& node : nodes) {
        order.push_back(ident(node));
    }
    EXPECT_EQ(order, (std::vector<std::string>{"A", "<group>", "B", "<group>", "C", "D", "F"}));
}

TEST_F(ResolverTest, LeafOnlyView) {
    auto leaves = walk_leaves("E { A, { B, { C } }, D }");
    ASSERT_EQ(leaves.size(), 4u);
    EXPECT_EQ(ident(leaves[0]), "A");
    EXPECT_EQ(ident(leaves[1]), "B");
    EXPECT_EQ(ident(leaves[2]), "C");
    EXPECT_EQ(ident(leaves[3]), "D");
}

TEST_F(ResolverTest, DepthStartsAtRoot) {
    TreeWalker walker(load("E { { { Deep } }, Top }"));
    EXPECT_EQ(walker.root_config().depth, 1);

    std::vector<int> depths;
    while (auto visited = walker.next_node()) {
        depths.push_back(visited->config.depth);
    }
    EXPECT_EQ(depths, (std::vector<int>{2, 3, 4, 2}));
}

// ============================================================
// 継承
// ============================================================
TEST_F(ResolverTest, NumberConcatenatesRootToLeaf) {
    auto leaves = walk_leaves(R"(
        #[number = "1"]
        E {
            #[number = "2"]
            {
                #[number = "3"]
                {
                    #[number = 4]
                    Leaf,
                    Bare,
                },
            },
        }
    )");
    ASSERT_EQ(leaves.size(), 2u);
    EXPECT_EQ(leaves[0].config.number, "1234");
    EXPECT_EQ(leaves[1].config.number, "123");
}

TEST_F(ResolverTest, SeveralFragmentsOnOneNode) {
    auto leaves = walk_leaves(R"(E { #[number = "0"] #[number = ""] #[number = "7"] Leaf })");
    EXPECT_EQ(leaves[0].config.number, "07");
}

TEST_F(ResolverTest, KindNearestAncestorWins) {
    auto leaves = walk_leaves(R"(
        E {
            Default,
            #[kind = "warn"]
            {
                Warned,
                #[kind = "Error"]
                Overridden,
            },
        }
    )");
    ASSERT_EQ(leaves.size(), 3u);
    EXPECT_FALSE(leaves[0].config.kind.has_value());
    EXPECT_EQ(leaves[0].config.severity(), Severity::Error);
    EXPECT_EQ(leaves[1].config.severity(), Severity::Warn);
    EXPECT_EQ(leaves[2].config.severity(), Severity::Error);
}

TEST_F(ResolverTest, MsgAndLabelInherit) {
    auto nodes = walk_all(R"(
        E {
            #[msg = "group message"]
            #[label = "group label"]
            {
                Inherits,
                #[msg = "own"]
                Overrides,
            },
        }
    )");
    ASSERT_EQ(nodes.size(), 3u);

    EXPECT_TRUE(nodes[0].config.msg_declared);
    EXPECT_EQ(nodes[1].config.msg->text, "group message");
    EXPECT_FALSE(nodes[1].config.msg_declared);
    EXPECT_EQ(nodes[1].config.label->text, "group label");
    EXPECT_EQ(nodes[2].config.msg->text, "own");
    EXPECT_TRUE(nodes[2].config.msg_declared);
    EXPECT_EQ(nodes[2].config.label->text, "group label");
}

TEST_F(ResolverTest, ParentConfigIsNotMutated) {
    auto nodes = walk_all(R"(
        E {
            #[number = "1"]
            {
                #[number = "2"] #[kind = "Warn"] A,
                B,
            },
        }
    )");
    ASSERT_EQ(nodes.size(), 3u);
    EXPECT_EQ(nodes[1].config.number, "12");
    EXPECT_EQ(nodes[2].config.number, "1");
    EXPECT_EQ(nodes[2].config.severity(), Severity::Error);
}

// nested はそのノード限り。グループに付けても子の葉には伝わらない
TEST_F(ResolverTest, NestedIsNotInherited) {
    auto leaves = walk_leaves(R"(
        E {
            #[nested]
            { #[nested] Wrapped(Inner), Other { inner: Inner, extra: u8 }, Unit },
            Plain(Inner),
        }
    )");
    ASSERT_EQ(leaves.size(), 4u);
    EXPECT_TRUE(leaves[0].config.nested);
    EXPECT_FALSE(leaves[1].config.nested);
    EXPECT_FALSE(leaves[2].config.nested);
    EXPECT_FALSE(leaves[3].config.nested);
}

TEST_F(ResolverTest, SpanFieldIsResolvedPerLeaf) {
    auto leaves = walk_leaves(R"(
        E {
            Named { name: String, #[span] at: Span },
            Positional(#[span] Span),
            None,
        }
    )");
    ASSERT_EQ(leaves.size(), 3u);
    ASSERT_TRUE(leaves[0].config.span_field.has_value());
    EXPECT_EQ(leaves[0].config.span_field->index, 1u);
    EXPECT_EQ(leaves[0].config.span_field->name, "at");
    ASSERT_TRUE(leaves[1].config.span_field.has_value());
    EXPECT_EQ(leaves[1].config.span_field->name, "_0");
    EXPECT_FALSE(leaves[2].config.span_field.has_value());
}

// ============================================================
// エラー
// ============================================================
TEST_F(ResolverTest, UnknownKey) {
    auto error = walk_error(R"(E { #[colour = "red"] Leaf })");
    EXPECT_EQ(error.kind(), CompileError::Kind::Attribute);
    EXPECT_EQ(error.message(), "unknown attribute `colour`");
    EXPECT_EQ(error.span().start, 6u);
}

TEST_F(ResolverTest, MalformedSeverity) {
    auto error = walk_error(R"(E { #[kind = "Fatal"] Leaf })");
    EXPECT_EQ(error.kind(), CompileError::Kind::Attribute);
    EXPECT_EQ(error.message(), "invalid kind `Fatal`, expected `Error` or `Warn`");
}

TEST_F(ResolverTest, MalformedNumber) {
    auto error = walk_error(R"(E { #[number = "1a"] Leaf })");
    EXPECT_EQ(error.kind(), CompileError::Kind::Attribute);
    EXPECT_EQ(error.message(), "invalid number `1a`, expected digits");
}

TEST_F(ResolverTest, WronglyTypedValues) {
    EXPECT_EQ(walk_error("E { #[msg = 1] Leaf }").message(), "`msg` expects a string literal");
    EXPECT_EQ(walk_error("E { #[kind] Leaf }").message(), "`kind` requires a value");
    EXPECT_EQ(walk_error(R"(E { #[nested = "yes"] Leaf(A) })").message(),
              "`nested` is a flag and takes no value");
}

TEST_F(ResolverTest, SpanMarkerOnNode) {
    auto error = walk_error("E { #[span] Leaf }");
    EXPECT_EQ(error.kind(), CompileError::Kind::Attribute);
    EXPECT_EQ(error.message(), "the `span` marker is only allowed on fields");
}

TEST_F(ResolverTest, NestedLeafNeedsExactlyOneField) {
    auto error = walk_error("E { { #[nested] Ok(A), #[nested] Bad(A, B) } }");
    EXPECT_EQ(error.kind(), CompileError::Kind::Attribute);
    EXPECT_EQ(error.message(), "nested variant `Bad` must have exactly one field, found 2");
}

TEST_F(ResolverTest, ErrorInRootAttributes) {
    auto error = walk_error(R"(#[kind = "bad"] E { Leaf })");
    EXPECT_EQ(error.kind(), CompileError::Kind::Attribute);
}

// 最初のエラーで走査を打ち切り、以降は何も返さない
TEST_F(ResolverTest, WalkAbortsAfterFirstError) {
    TreeWalker walker(load(R"(E { Good, #[bogus] Bad, AlsoGood })"));

    auto first = walker.next_node();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(ident(*first), "Good");

    EXPECT_THROW(walker.next_node(), CompileError);
    EXPECT_FALSE(walker.next_node().has_value());
    EXPECT_FALSE(walker.next_leaf().has_value());
}
