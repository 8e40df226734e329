#include <rlcf/bridge/bridge_index.h>
#include <rlcf/search/hybrid_combiner.h>

#include <algorithm>

namespace rlcf::search {

bool rankBefore(const ScoredCandidate& a, const ScoredCandidate& b) {
    if (a.finalScore != b.finalScore)
        return a.finalScore > b.finalScore;
    if (a.hops() != b.hops())
        return a.hops() < b.hops();
    return a.chunkId < b.chunkId;
}

Result<std::vector<ScoredCandidate>>
HybridCombiner::combine(const std::vector<vector::VectorMatch>& matches,
                        const GraphScoreResult& nodeScores, const bridge::BridgeIndex& bridge,
                        double alpha) const {
    alpha = clamp01(alpha);
    const double neutral = clamp01(config_.neutral_graph_score);

    std::vector<ScoredCandidate> out;
    out.reserve(matches.size());
    for (const auto& m : matches) {
        ScoredCandidate c;
        c.chunkId = m.chunkId;
        c.vectorScore = clamp01(m.similarity);

        auto links = bridge.getNodesForChunk(m.chunkId);
        if (!links)
            return links.error();

        if (links.value().empty()) {
            c.graphScore = neutral;
        } else {
            c.linked = true;
            for (const auto& link : links.value()) {
                auto it = nodeScores.best.find(link.nodeId);
                if (it == nodeScores.best.end())
                    continue;
                const double s = clamp01(link.weight * it->second.score());
                bool better = !c.link || s > c.graphScore;
                if (!better && c.link && s == c.graphScore && c.path) {
                    better = it->second.hops() < c.path->hops() ||
                             (it->second.hops() == c.path->hops() && link.nodeId < c.link->nodeId);
                }
                if (better) {
                    c.graphScore = s;
                    c.link = LinkUsed{link.nodeId, link.relationType, link.weight};
                    c.path = it->second;
                }
            }
        }
        c.finalScore = alpha * c.vectorScore + (1.0 - alpha) * c.graphScore;
        out.push_back(std::move(c));
    }

    std::sort(out.begin(), out.end(), rankBefore);
    return out;
}

} // namespace rlcf::search
