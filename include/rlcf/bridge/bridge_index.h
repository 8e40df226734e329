#pragma once

#include <rlcf/core/types.h>
#include <rlcf/core/versioned_store.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace rlcf::graph {
class GraphStore;
}

namespace rlcf::vector {
class ChunkCatalog;
}

namespace rlcf::weights {
class ChangeLog;
}

namespace rlcf::bridge {

/**
 * Weighted link between a content chunk and a graph node. Structure comes from
 * ingestion; weight is the only field learned here.
 */
struct BridgeMapping {
    ChunkId chunkId;
    NodeId nodeId;
    std::string relationType; // e.g. "defines", "mentions"
    double weight = 1.0;      // [0,1], learned
    double confidence = 1.0;  // [0,1], from ingestion
    std::string source;       // Origin/system of the link
    TimePoint createdAt{};
    TimePoint updatedAt{};
};

struct MappingKey {
    ChunkId chunkId;
    NodeId nodeId;
    std::string relationType;

    bool operator==(const MappingKey& o) const {
        return chunkId == o.chunkId && nodeId == o.nodeId && relationType == o.relationType;
    }
};

struct MappingKeyHash {
    std::size_t operator()(const MappingKey& k) const noexcept;
};

/**
 * Outcome of a weight update on one mapping.
 */
struct WeightChange {
    MappingKey key;
    double before = 0.0;
    double after = 0.0;
    std::uint64_t version = 0;
    bool changed = false;
};

/**
 * Persistent many-to-many chunk <-> node index.
 *
 * Reads are lock-light; weight writes go through per-mapping optimistic
 * versioning so concurrent deltas on the same link serialize instead of
 * overwriting each other.
 */
class BridgeIndex {
public:
    // Called after every committed change (structure or weight) with the new version.
    using PersistHook = std::function<void(const BridgeMapping&, std::uint64_t version)>;
    using Clock = std::function<TimePoint()>;

    BridgeIndex(std::shared_ptr<const vector::ChunkCatalog> chunks,
                std::shared_ptr<const graph::GraphStore> graph,
                std::shared_ptr<weights::ChangeLog> changeLog = nullptr, Clock clock = {});
    ~BridgeIndex();

    BridgeIndex(const BridgeIndex&) = delete;
    BridgeIndex& operator=(const BridgeIndex&) = delete;

    // ReferenceError for an unknown chunk. An existing chunk without links yields {}.
    Result<std::vector<BridgeMapping>> getNodesForChunk(const ChunkId& chunkId) const;

    // ReferenceError for an unknown node.
    Result<std::vector<BridgeMapping>>
    getChunksForNode(const NodeId& nodeId,
                     const std::optional<std::string>& relationType = std::nullopt) const;

    std::optional<BridgeMapping> getMapping(const MappingKey& key) const;

    /**
     * Inserts or refreshes a mapping keyed on (chunk, node, relation).
     *
     * A new mapping takes the seed weight; an existing one keeps its learned weight
     * and only refreshes confidence/source. Repeating the same call changes nothing.
     */
    Result<BridgeMapping> upsertMapping(const BridgeMapping& mapping);

    /**
     * Adds delta to the weight of one mapping, clamped to [0,1].
     *
     * delta == 0 (or a delta fully absorbed by the clamp) is a no-op without a
     * version bump. NotFound when the mapping does not exist; nothing is created.
     */
    Result<WeightChange> updateWeight(const MappingKey& key, double delta,
                                      const std::string& feedbackId = {});

    /**
     * Applies delta to every relation linking chunk and node.
     *
     * ReferenceError when the chunk or node is unknown; NotFound when both exist
     * but no mapping links them.
     */
    Result<std::vector<WeightChange>> updateWeight(const ChunkId& chunkId, const NodeId& nodeId,
                                                   double delta,
                                                   const std::string& feedbackId = {});

    // Sets an absolute weight (rollback path); clamped to [0,1].
    Result<WeightChange> setWeight(const MappingKey& key, double weight,
                                   const std::string& feedbackId);

    // Restores a persisted mapping with its version; no validation, no logging.
    void load(const BridgeMapping& mapping, std::uint64_t version);

    std::size_t size() const;
    std::vector<BridgeMapping> allMappings() const;

    void setPersistHook(PersistHook hook);
    void setRetryPolicy(const core::RetryPolicy& policy);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace rlcf::bridge
