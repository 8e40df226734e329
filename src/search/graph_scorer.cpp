#include <rlcf/graph/graph_store.h>
#include <rlcf/search/graph_scorer.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <map>

namespace rlcf::search {

namespace {

constexpr double kScoreEpsilon = 1e-12;

bool lexicographicallyBefore(const GraphPath& a, const GraphPath& b) {
    if (a.anchor != b.anchor)
        return a.anchor < b.anchor;
    const auto n = std::min(a.steps.size(), b.steps.size());
    for (std::size_t i = 0; i < n; ++i) {
        if (a.steps[i].to != b.steps[i].to)
            return a.steps[i].to < b.steps[i].to;
        if (a.steps[i].relation != b.steps[i].relation)
            return a.steps[i].relation < b.steps[i].relation;
    }
    return a.steps.size() < b.steps.size();
}

} // namespace

bool preferPath(const GraphPath& a, const GraphPath& b) {
    const double sa = a.score();
    const double sb = b.score();
    if (std::abs(sa - sb) > kScoreEpsilon)
        return sa > sb;
    if (a.hops() != b.hops())
        return a.hops() < b.hops();
    return lexicographicallyBefore(a, b);
}

GraphTraversalScorer::GraphTraversalScorer(std::shared_ptr<const graph::GraphStore> graph,
                                           GraphScoringConfig config)
    : graph_(std::move(graph)), config_(config) {}

Result<GraphScoreResult> GraphTraversalScorer::scoreFrom(const std::vector<NodeId>& anchors,
                                                         const RelationWeightFn& weightOf,
                                                         const std::atomic<bool>* cancel) const {
    if (!graph_)
        return Error{ErrorCode::InvalidState, "GraphTraversalScorer: no graph store set"};

    const auto t0 = std::chrono::steady_clock::now();
    GraphScoreResult result;

    // Layer 0: anchors themselves. std::map keeps expansion order deterministic.
    std::map<NodeId, GraphPath> frontier;
    for (const auto& a : anchors) {
        if (!graph_->hasNode(a)) {
            spdlog::debug("[GraphScorer] anchor '{}' not in graph; ignored", a);
            continue;
        }
        GraphPath p;
        p.anchor = a;
        p.target = a;
        auto it = frontier.find(a);
        if (it == frontier.end() || preferPath(p, it->second))
            frontier[a] = p;
    }
    for (const auto& [node, path] : frontier)
        result.best.emplace(node, path);

    auto relax = [&](std::map<NodeId, GraphPath>& next, const GraphPath& base,
                     const NodeId& to, const std::string& relation, double w) {
        GraphPath cand = base;
        cand.steps.push_back(PathStep{base.target, to, relation, w});
        cand.target = to;
        cand.product *= w;
        auto it = next.find(to);
        if (it == next.end()) {
            next.emplace(to, std::move(cand));
        } else if (preferPath(cand, it->second)) {
            it->second = std::move(cand);
        }
    };

    for (std::size_t hop = 1; hop <= config_.max_hops && !frontier.empty(); ++hop) {
        std::map<NodeId, GraphPath> next;
        std::size_t expanded = 0;
        for (const auto& [node, path] : frontier) {
            if (cancel && cancel->load(std::memory_order_acquire))
                return Error{ErrorCode::OperationCancelled, "graph scoring cancelled"};
            if (timedOut(t0) || expanded >= config_.max_frontier) {
                result.truncated = true;
                break;
            }
            ++expanded;

            for (const auto& e : graph_->outgoing(node)) {
                auto w = weightOf(e.relation);
                if (!w || !(*w > 0.0))
                    continue;
                relax(next, path, e.to, e.relation, std::min(1.0, *w));
            }
            if (config_.follow_incoming_edges) {
                for (const auto& e : graph_->incoming(node)) {
                    auto w = weightOf(e.relation);
                    if (!w || !(*w > 0.0))
                        continue;
                    relax(next, path, e.from, e.relation, std::min(1.0, *w));
                }
            }
        }

        for (const auto& [node, path] : next) {
            auto it = result.best.find(node);
            if (it == result.best.end()) {
                result.best.emplace(node, path);
            } else if (preferPath(path, it->second)) {
                it->second = path;
            }
        }
        frontier = std::move(next);
        if (result.truncated)
            break;
    }

    if (result.truncated) {
        spdlog::debug("[GraphScorer] traversal truncated after {} ms with {} nodes reached",
                      std::chrono::duration_cast<std::chrono::milliseconds>(
                          std::chrono::steady_clock::now() - t0)
                          .count(),
                      result.best.size());
    }
    return result;
}

Result<double> GraphTraversalScorer::scoreNode(const std::vector<NodeId>& anchors,
                                               const NodeId& node,
                                               const RelationWeightFn& weightOf) const {
    auto r = scoreFrom(anchors, weightOf);
    if (!r)
        return r.error();
    const auto& best = r.value().best;
    auto it = best.find(node);
    return it == best.end() ? 0.0 : it->second.score();
}

} // namespace rlcf::search
