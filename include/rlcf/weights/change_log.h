#pragma once

#include <rlcf/core/types.h>
#include <rlcf/weights/weight_schema.h>

#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rlcf::weights {

enum class ParameterKind { Traversal, Alpha, Gating, Rerank, Bridge };

const char* parameterKindName(ParameterKind kind) noexcept;
std::optional<ParameterKind> parseParameterKind(std::string_view name);

/**
 * Identifies one logical parameter key. Only the fields relevant to the kind are set.
 */
struct ParameterRef {
    ParameterKind kind = ParameterKind::Traversal;
    StrategyId strategy = StrategyId::Literal; // Traversal, Alpha
    std::string relation;                      // Traversal, Bridge
    ChunkId chunkId;                           // Bridge
    NodeId nodeId;                             // Bridge

    static ParameterRef traversal(StrategyId s, std::string relation);
    static ParameterRef alpha(StrategyId s);
    static ParameterRef gating();
    static ParameterRef rerank();
    static ParameterRef bridge(ChunkId chunk, NodeId node, std::string relation);

    std::string describe() const;

    bool operator==(const ParameterRef& o) const {
        return kind == o.kind && strategy == o.strategy && relation == o.relation &&
               chunkId == o.chunkId && nodeId == o.nodeId;
    }
};

/**
 * One committed parameter change. Values are serialized text: scalars use
 * round-trippable decimal, blobs use JSON.
 */
struct ChangeLogEntry {
    std::uint64_t sequence = 0;
    TimePoint timestamp{};
    std::string feedbackId; // triggering feedback, "decay", or "rollback@<seq>"
    ParameterRef ref;
    std::string oldValue;
    std::string newValue;
    std::uint64_t version = 0; // key version after the change
};

std::string formatScalar(double v);
std::optional<double> parseScalar(std::string_view s);

/**
 * Append-only audit log of parameter changes. Entries are never removed;
 * rollback appends compensating entries.
 *
 * Only the newest `retained` entries stay in memory. Older history is served by
 * the archive (the persisted log) when one is attached.
 */
class ChangeLog {
public:
    using Listener = std::function<void(const ChangeLogEntry&)>;
    // Entries with sequence > afterSequence in order, at most limit (0 = all).
    using Archive = std::function<Result<std::vector<ChangeLogEntry>>(std::uint64_t afterSequence,
                                                                      std::size_t limit)>;

    static constexpr std::size_t kDefaultRetained = 4096;

    explicit ChangeLog(std::size_t retained = kDefaultRetained);

    // Assigns the next sequence number and notifies the listener.
    std::uint64_t append(ChangeLogEntry entry);

    // Loads the persisted tail without notifying the listener. Sequences continue
    // after lastSequence, or after the newest loaded entry when that is higher.
    void restore(std::vector<ChangeLogEntry> entries, std::uint64_t lastSequence = 0);

    // In-memory entries only.
    std::vector<ChangeLogEntry> entries(std::uint64_t afterSequence = 0,
                                        std::size_t limit = 0) const;
    std::vector<ChangeLogEntry> entriesForFeedback(const std::string& feedbackId) const;

    /**
     * Full history after afterSequence. Falls back to the archive when part of the
     * range is no longer in memory; NotFound when it is gone and no archive is set.
     */
    Result<std::vector<ChangeLogEntry>> history(std::uint64_t afterSequence = 0,
                                                std::size_t limit = 0) const;

    std::uint64_t lastSequence() const;
    // Oldest sequence still held in memory (lastSequence() + 1 when empty).
    std::uint64_t firstRetainedSequence() const;
    std::size_t size() const;
    std::size_t retained() const noexcept { return retained_; }

    void setListener(Listener listener);
    void setArchive(Archive archive);

private:
    std::vector<ChangeLogEntry> collect(std::uint64_t afterSequence, std::size_t limit) const;

    mutable std::mutex mutex_;
    std::deque<ChangeLogEntry> entries_;
    std::size_t retained_;
    std::uint64_t nextSequence_ = 1;
    // Memory holds every entry from here on
    std::uint64_t firstSequence_ = 1;
    Listener listener_;
    Archive archive_;
};

} // namespace rlcf::weights
