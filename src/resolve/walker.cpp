#include "walker.hpp"

#include "common/debug/res.hpp"
#include "common/error.hpp"

namespace errtree {

TreeWalker::TreeWalker(const ast::Taxonomy& taxonomy) : taxonomy_(taxonomy) {}

void TreeWalker::start() {
    started_ = true;
    debug::res::log(debug::res::Id::WalkStart, taxonomy_.name);
    try {
        root_ = Config::root(taxonomy_.attrs, taxonomy_.span);
    } catch (const CompileError&) {
        finished_ = true;
        throw;
    }
    stack_.push_back(Frame{&taxonomy_.roots, 0, *root_});
}

const Config& TreeWalker::root_config() {
    if (!started_)
        start();
    return *root_;
}

std::optional<VisitedNode> TreeWalker::next_node() {
    if (!started_)
        start();
    if (finished_)
        return std::nullopt;

    while (!stack_.empty()) {
        Frame& frame = stack_.back();
        if (frame.next >= frame.nodes->size()) {
            stack_.pop_back();
            debug::res::log(debug::res::Id::PopFrame, debug::Level::Trace);
            continue;
        }

        const ast::ErrorTree& node = *(*frame.nodes)[frame.next++];
        Config config;
        try {
            config = frame.config.derive(node);
        } catch (const CompileError&) {
            stack_.clear();
            finished_ = true;
            debug::res::log(debug::res::Id::Abort, debug::Level::Debug);
            throw;
        }

        if (const auto* group = node.as_group()) {
            debug::res::log(debug::res::Id::VisitGroup, std::to_string(config.depth),
                            debug::Level::Trace);
            // frameはここで無効になり得るので、以降は参照しない
            stack_.push_back(Frame{&group->children, 0, config});
            debug::res::log(debug::res::Id::PushFrame, debug::Level::Trace);
        } else {
            debug::res::log(debug::res::Id::VisitLeaf, node.as_leaf()->ident, debug::Level::Trace);
        }
        return VisitedNode{&node, std::move(config)};
    }

    finished_ = true;
    debug::res::log(debug::res::Id::WalkEnd, taxonomy_.name);
    return std::nullopt;
}

std::optional<VisitedNode> TreeWalker::next_leaf() {
    while (auto visited = next_node()) {
        if (visited->node->is_leaf())
            return visited;
    }
    return std::nullopt;
}

}  // namespace errtree
