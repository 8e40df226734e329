#pragma once

#include <rlcf/core/types.h>
#include <rlcf/learning/gating_network.h>
#include <rlcf/search/graph_scorer.h>
#include <rlcf/search/hybrid_combiner.h>
#include <rlcf/vector/vector_searcher.h>
#include <rlcf/weights/parameters.h>
#include <rlcf/weights/weight_schema.h>

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace rlcf::bridge {
class BridgeIndex;
}

namespace rlcf::graph {
class GraphStore;
}

namespace rlcf::weights {
struct ParameterSnapshot;
}

namespace rlcf::search {

/**
 * Configuration for hybrid retrieval
 */
struct RetrievalConfig {
    std::size_t top_k = 10;                          // Final results per list
    std::size_t over_retrieve_factor = 3;            // Vector candidates = top_k * factor
    std::chrono::milliseconds strategy_timeout{2000}; // Per-strategy deadline
    std::size_t num_threads = 0;                     // 0 = one worker per strategy
    double min_strategy_weight = 0.05;               // Skip strategies gated below this

    CombinerConfig combiner;
    GraphScoringConfig graph;

    bool isValid() const {
        return top_k > 0 && over_retrieve_factor > 0 && strategy_timeout.count() > 0 &&
               min_strategy_weight >= 0.0 && min_strategy_weight < 1.0 &&
               combiner.neutral_graph_score >= 0.0 && combiner.neutral_graph_score <= 1.0;
    }
};

struct RetrieveRequest {
    Embedding queryEmbedding;
    std::vector<NodeId> anchorNodes;
    std::string domain;
    std::size_t topK = 0; // 0 = config top_k
    weights::QueryType queryType = weights::QueryType::Unknown;
    vector::ChunkFilter filter;
    std::shared_ptr<std::atomic<bool>> cancel; // optional caller cancellation
};

enum class StrategyStatus { Ok, TimedOut, Failed, Skipped };

const char* strategyStatusName(StrategyStatus status) noexcept;

/**
 * Ranked list for one strategy plus what was used to produce it.
 */
struct StrategyResult {
    weights::StrategyId strategy = weights::StrategyId::Literal;
    double gateWeight = 0.0;
    double alpha = 0.0;
    StrategyStatus status = StrategyStatus::Skipped;
    std::string error;
    bool graphTruncated = false;
    std::vector<ScoredCandidate> ranked;
};

struct CombinedCandidate {
    ChunkId chunkId;
    double hybridScore = 0.0;  // gate-weighted final score across strategies
    double vectorScore = 0.0;
    double graphScore = 0.0;   // gate-weighted graph score
    double rerankScore = 0.0;
    std::array<double, weights::kRerankFeatureCount> features{};
};

/**
 * Everything credit assignment needs later: the query, the gate distribution,
 * the parameter generation read, and the weights and paths behind every result.
 */
struct RetrievalTrace {
    std::string traceId;
    TimePoint completedAt{};
    std::uint64_t parameterGeneration = 0;
    Embedding queryEmbedding;
    weights::QueryType queryType = weights::QueryType::Unknown;
    std::string domain;
    std::vector<NodeId> anchorNodes;
    learning::GateDistribution gate{};
    weights::StrategyId selectedStrategy = weights::StrategyId::Literal;
    std::vector<StrategyResult> strategies;
    std::vector<CombinedCandidate> combined;
};

struct RetrieveResponse {
    std::vector<StrategyResult> perStrategy;
    std::vector<CombinedCandidate> combined;
    std::shared_ptr<const RetrievalTrace> trace;
};

/**
 * Runs gating, fans out one task per active strategy (graph traversal + hybrid
 * fusion over a shared vector candidate set), joins with a per-strategy timeout
 * and builds the combined ranking. Never writes shared state.
 */
class RetrievalEngine {
public:
    RetrievalEngine(std::shared_ptr<vector::VectorSearcher> vectors,
                    std::shared_ptr<const graph::GraphStore> graph,
                    std::shared_ptr<const bridge::BridgeIndex> bridge,
                    RetrievalConfig config = {});
    ~RetrievalEngine();

    RetrievalEngine(const RetrievalEngine&) = delete;
    RetrievalEngine& operator=(const RetrievalEngine&) = delete;

    /**
     * Timed-out strategies are reported with status TimedOut and omitted from the
     * combined ranking. Fails only when every active strategy failed or timed out,
     * when the vector search fails, or on caller cancellation.
     */
    Result<RetrieveResponse> retrieve(const RetrieveRequest& request,
                                      std::shared_ptr<const weights::ParameterSnapshot> snapshot);

    const RetrievalConfig& getConfig() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace rlcf::search
