#pragma once

#include <rlcf/core/types.h>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace rlcf::graph {
class GraphStore;
}

namespace rlcf::search {

/**
 * Configuration for graph traversal scoring.
 *
 * max_hops      - path length limit; nodes further than this score 0
 * budget        - best-effort time budget (0 = unlimited); exceeding it stops expansion
 * max_frontier  - cap on nodes expanded per hop
 */
struct GraphScoringConfig {
    std::size_t max_hops = 3;
    bool follow_incoming_edges = true; // traverse relations in both directions
    std::chrono::milliseconds budget{0};
    std::size_t max_frontier = 50'000;
};

struct PathStep {
    NodeId from;
    NodeId to;
    std::string relation;
    double weight = 0.0; // traversal weight applied on this edge
};

/**
 * Best path from an anchor to a node. score = product / (1 + hops).
 */
struct GraphPath {
    NodeId anchor;
    NodeId target;
    std::vector<PathStep> steps;
    double product = 1.0;

    std::size_t hops() const { return steps.size(); }
    double score() const { return product / (1.0 + static_cast<double>(steps.size())); }
};

/**
 * Weight lookup for one strategy: nullopt means the relation is not traversed.
 */
using RelationWeightFn = std::function<std::optional<double>(const std::string& relation)>;

struct GraphScoreResult {
    std::unordered_map<NodeId, GraphPath> best; // reached nodes only
    bool truncated = false;                     // budget or frontier cap hit
};

/**
 * Weighted path scorer.
 *
 * A node's score is the maximum over anchors of (product of edge weights along the
 * path) / (1 + hops), within max_hops. Ties prefer fewer hops, then the
 * lexicographically smaller anchor id. An anchor scores 1.0 at hop 0. Unreached
 * nodes are absent from the result and score 0.
 */
class GraphTraversalScorer {
public:
    GraphTraversalScorer(std::shared_ptr<const graph::GraphStore> graph, GraphScoringConfig config);

    void setConfig(const GraphScoringConfig& cfg) { config_ = cfg; }
    const GraphScoringConfig& getConfig() const { return config_; }

    /**
     * Scores every node reachable from the anchors.
     *
     * @param cancel optional caller cancellation flag; OperationCancelled when set.
     */
    Result<GraphScoreResult> scoreFrom(const std::vector<NodeId>& anchors,
                                       const RelationWeightFn& weightOf,
                                       const std::atomic<bool>* cancel = nullptr) const;

    // Convenience: score of a single node (0 when unreachable).
    Result<double> scoreNode(const std::vector<NodeId>& anchors, const NodeId& node,
                             const RelationWeightFn& weightOf) const;

private:
    bool timedOut(std::chrono::steady_clock::time_point t0) const {
        if (config_.budget.count() <= 0)
            return false;
        return (std::chrono::steady_clock::now() - t0) >= config_.budget;
    }

    std::shared_ptr<const graph::GraphStore> graph_;
    GraphScoringConfig config_;
};

// True when a is the better of two paths to the same node at the same hop count.
bool preferPath(const GraphPath& a, const GraphPath& b);

} // namespace rlcf::search
