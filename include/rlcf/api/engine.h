#pragma once

#include <rlcf/bridge/bridge_index.h>
#include <rlcf/config/engine_config.h>
#include <rlcf/core/types.h>
#include <rlcf/graph/graph_store.h>
#include <rlcf/learning/authority_calculator.h>
#include <rlcf/learning/decay_manager.h>
#include <rlcf/learning/feedback.h>
#include <rlcf/learning/policy_updater.h>
#include <rlcf/search/retrieval_engine.h>
#include <rlcf/vector/vector_searcher.h>
#include <rlcf/weights/change_log.h>
#include <rlcf/weights/parameter_store.h>

#include <boost/asio/any_io_executor.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace rlcf::api {

/**
 * Optional collaborators. Anything left empty is created in memory.
 */
struct EngineComponents {
    std::shared_ptr<vector::VectorSearcher> vectors;
    std::shared_ptr<graph::GraphStore> graph;
    std::function<TimePoint()> clock;
    boost::asio::any_io_executor executor; // required for background decay only
};

struct FeedbackAck {
    std::string feedbackId;
    bool accepted = false;
    bool duplicate = false; // id seen before; nothing was applied again
    learning::Rewards rewards;
    learning::UpdateReport update;
    bool consensusReached = false;
    std::size_t validationsScheduled = 0;
};

struct RollbackReport {
    std::uint64_t targetSequence = 0;
    std::size_t keysReverted = 0;
    std::size_t keysFailed = 0;
};

/**
 * Entry point of the library: ingestion of structure, hybrid retrieval, feedback
 * learning, authority, decay and rollback over one parameter store.
 *
 * Thread-safe. Retrieval runs against the latest parameter snapshot while
 * feedback commits per-key; nothing here takes a global write lock.
 */
class Engine {
public:
    static Result<std::unique_ptr<Engine>> create(config::EngineConfig config,
                                                  EngineComponents components = {});

    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    // Ingestion (structure only; bridge weights are learned here)
    Result<void> addChunk(vector::Chunk chunk);
    Result<void> addNode(const graph::GraphNode& node);
    Result<void> addEdge(const graph::GraphEdge& edge);
    Result<bridge::BridgeMapping> upsertMapping(const bridge::BridgeMapping& mapping);

    /**
     * Runs every active strategy and returns per-strategy lists, the combined
     * ranking and the trace. The trace stays resolvable by id for feedback until
     * trace_capacity newer traces have been recorded.
     */
    Result<search::RetrieveResponse> retrieve(const search::RetrieveRequest& request);

    std::shared_ptr<const search::RetrievalTrace> findTrace(const std::string& traceId) const;

    /**
     * Validates the event, decomposes rewards, applies the authority-weighted policy
     * update and records a consensus vote. Validation outcomes produced by consensus
     * are applied asynchronously. Re-submitting a known id returns duplicate=true.
     */
    Result<FeedbackAck> ingestFeedback(const learning::FeedbackEvent& event);

    // Outcome from an external validator; applied asynchronously.
    Result<void> submitValidation(learning::ValidationOutcome outcome);
    void waitForAuthorityUpdates();

    std::shared_ptr<const weights::ParameterSnapshot> getParameterSnapshot() const;
    double getAuthority(const UserId& user, learning::FeedbackLevel level,
                        const std::string& domain) const;
    learning::AuthorityBreakdown authorityBreakdown(const UserId& user,
                                                    learning::FeedbackLevel level,
                                                    const std::string& domain) const;
    Result<void> setBaselineCredential(const UserId& user, double credential);

    // Pages older entries from storage; NotFound when they are no longer retained.
    Result<std::vector<weights::ChangeLogEntry>> changeLog(std::uint64_t afterSequence = 0,
                                                           std::size_t limit = 0) const;

    // Reverts every parameter and bridge weight changed after sequence.
    Result<RollbackReport> rollbackTo(std::uint64_t sequence);

    learning::SweepReport runDecaySweep(std::optional<TimePoint> at = std::nullopt);
    Result<void> startDecay();
    void stopDecay();

    const bridge::BridgeIndex& bridgeIndex() const;
    const config::EngineConfig& config() const;

private:
    Engine();

    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace rlcf::api
