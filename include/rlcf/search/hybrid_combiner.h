#pragma once

#include <rlcf/core/types.h>
#include <rlcf/search/graph_scorer.h>
#include <rlcf/vector/vector_searcher.h>

#include <optional>
#include <string>
#include <vector>

namespace rlcf::bridge {
class BridgeIndex;
}

namespace rlcf::search {

struct CombinerConfig {
    // Graph score for a chunk with no bridge links. Linked chunks that are simply
    // unreachable from the anchors still score 0.
    double neutral_graph_score = 0.5;
};

/**
 * Bridge link that produced a candidate's graph score.
 */
struct LinkUsed {
    NodeId nodeId;
    std::string relationType;
    double weight = 0.0;
};

/**
 * One candidate under one strategy.
 */
struct ScoredCandidate {
    ChunkId chunkId;
    double vectorScore = 0.0;
    double graphScore = 0.0;
    double finalScore = 0.0; // alpha * vector + (1 - alpha) * graph
    bool linked = false;     // false => graphScore is the neutral default
    std::optional<LinkUsed> link;
    std::optional<GraphPath> path;

    std::size_t hops() const { return path ? path->hops() : 0; }
};

/**
 * Hybrid score fusion for one strategy.
 *
 * For each vector candidate the linked graph nodes are resolved through the
 * bridge index; the graph score is the best (link weight x node path score) over
 * its links. Output is ordered by final score, then fewer hops, then chunk id.
 */
class HybridCombiner {
public:
    explicit HybridCombiner(CombinerConfig config = {}) : config_(config) {}

    const CombinerConfig& getConfig() const { return config_; }

    Result<std::vector<ScoredCandidate>> combine(const std::vector<vector::VectorMatch>& matches,
                                                 const GraphScoreResult& nodeScores,
                                                 const bridge::BridgeIndex& bridge,
                                                 double alpha) const;

private:
    CombinerConfig config_;
};

// Deterministic ranking order shared by per-strategy lists.
bool rankBefore(const ScoredCandidate& a, const ScoredCandidate& b);

} // namespace rlcf::search
