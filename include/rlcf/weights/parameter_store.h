#pragma once

#include <rlcf/core/types.h>
#include <rlcf/core/versioned_store.h>
#include <rlcf/weights/change_log.h>
#include <rlcf/weights/parameters.h>
#include <rlcf/weights/weight_schema.h>

#include <array>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace rlcf::weights {

struct ParameterStoreConfig {
    double alpha_default = 0.7;   // initial vector/graph mix per strategy
    double alpha_min = 0.3;       // alpha lower bound
    double alpha_max = 0.9;       // alpha upper bound
    double gating_param_bound = 1.0; // |theta_gating| bound

    bool isValid() const {
        return alpha_min >= 0.0 && alpha_max <= 1.0 && alpha_min <= alpha_max &&
               alpha_default >= alpha_min && alpha_default <= alpha_max &&
               gating_param_bound > 0.0;
    }
};

/**
 * Immutable view of every learned parameter at one store generation. Retrieval
 * works exclusively against a snapshot, so in-flight updates are never observed
 * half-applied.
 */
struct ParameterSnapshot {
    std::uint64_t generation = 0;
    std::array<std::map<std::string, double>, kStrategyCount> traversal;
    std::array<double, kStrategyCount> alpha{};
    std::shared_ptr<const GatingParameters> gating; // null until first initialised
    RerankParameters rerank;

    // nullopt when the strategy does not traverse this relation
    std::optional<double> traversalWeight(StrategyId s, const std::string& relation) const;
};

struct TraversalKey {
    StrategyId strategy = StrategyId::Literal;
    std::string relation;

    bool operator==(const TraversalKey& o) const {
        return strategy == o.strategy && relation == o.relation;
    }
};

struct TraversalKeyHash {
    std::size_t operator()(const TraversalKey& k) const noexcept {
        return std::hash<std::string>{}(k.relation) * 31u + strategyIndex(k.strategy);
    }
};

struct ScalarChange {
    ParameterRef ref;
    double before = 0.0;
    double after = 0.0;
    std::uint64_t version = 0;
    bool changed = false;
};

/**
 * Row handed to persistence after every commit. value is serialized the same way
 * as change-log values.
 */
struct ParameterRow {
    ParameterRef ref;
    std::string value;
    std::uint64_t version = 0;
    TimePoint lastReinforced{};
    TimePoint lastDecayed{};
};

/**
 * Keyed store for theta_traverse, alpha, theta_gating and theta_rerank.
 *
 * Each logical key (one relation weight, one alpha, the gating blob, the rerank
 * blob) is versioned independently; writers use compare-and-swap with retry so
 * concurrent feedback never loses an update. Every commit is appended to the
 * change log and handed to the persistence hook.
 */
class ParameterStore {
public:
    using Clock = std::function<TimePoint()>;
    using PersistHook = std::function<void(const ParameterRow&)>;
    using GatingUpdate = std::function<std::optional<GatingParameters>(const GatingParameters&)>;
    using RerankUpdate = std::function<std::optional<RerankParameters>(const RerankParameters&)>;

    ParameterStore(ParameterStoreConfig config, std::shared_ptr<ChangeLog> changeLog,
                   Clock clock = {});
    ~ParameterStore();

    ParameterStore(const ParameterStore&) = delete;
    ParameterStore& operator=(const ParameterStore&) = delete;

    // Seeds every traversal prior, alpha and rerank default not yet present.
    void bootstrapPriors();

    // Installs gating parameters unless already present. Returns true when installed.
    bool ensureGating(GatingParameters initial);

    std::shared_ptr<const ParameterSnapshot> snapshot() const;
    std::uint64_t generation() const;

    std::optional<core::Versioned<TraversalWeight>> traversal(StrategyId s,
                                                              const std::string& relation) const;
    std::vector<TraversalKey> traversalKeys() const;
    std::optional<core::Versioned<double>> alpha(StrategyId s) const;

    // NotFound when the strategy does not declare the relation.
    Result<ScalarChange> adjustTraversal(StrategyId s, const std::string& relation, double delta,
                                         const std::string& feedbackId);

    Result<ScalarChange> adjustAlpha(StrategyId s, double delta, const std::string& feedbackId);

    // The update function may run more than once; returning nullopt skips the commit.
    Result<bool> updateGating(const GatingUpdate& fn, const std::string& feedbackId);
    Result<bool> updateRerank(const RerankUpdate& fn, const std::string& feedbackId);

    /**
     * Pulls one traversal weight toward its prior:
     *   w' = r^d * w + (1 - r^d) * prior, d = days since the later of the last
     *   reinforcement and the last decay.
     * Skipped (nullopt) when the key was reinforced within grace.
     */
    Result<std::optional<ScalarChange>> decayTraversal(StrategyId s, const std::string& relation,
                                                       TimePoint now, double rate,
                                                       std::chrono::hours grace);

    // Commits a recorded value verbatim (rollback). Bridge refs are rejected.
    Result<void> restore(const ParameterRef& ref, const std::string& value,
                         const std::string& feedbackId);

    // Persistence loaders; only newer versions replace in-memory state.
    void loadTraversal(StrategyId s, const std::string& relation, TraversalWeight w,
                       std::uint64_t version);
    void loadAlpha(StrategyId s, double value, std::uint64_t version);
    void loadGating(GatingParameters params, std::uint64_t version);
    void loadRerank(RerankParameters params, std::uint64_t version);

    void setPersistHook(PersistHook hook);
    void setRetryPolicy(const core::RetryPolicy& policy);

    const ParameterStoreConfig& config() const;
    std::uint64_t conflictCount() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace rlcf::weights
