#include <rlcf/bridge/bridge_index.h>
#include <rlcf/graph/graph_store.h>
#include <rlcf/vector/vector_searcher.h>
#include <rlcf/weights/change_log.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <unordered_set>

namespace rlcf::bridge {

std::size_t MappingKeyHash::operator()(const MappingKey& k) const noexcept {
    std::hash<std::string> h;
    std::size_t seed = h(k.chunkId);
    seed ^= h(k.nodeId) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
    seed ^= h(k.relationType) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
    return seed;
}

namespace {

MappingKey keyOf(const BridgeMapping& m) {
    return MappingKey{m.chunkId, m.nodeId, m.relationType};
}

bool sameKeyOrder(const BridgeMapping& a, const BridgeMapping& b) {
    if (a.chunkId != b.chunkId)
        return a.chunkId < b.chunkId;
    if (a.nodeId != b.nodeId)
        return a.nodeId < b.nodeId;
    return a.relationType < b.relationType;
}

} // namespace

class BridgeIndex::Impl {
public:
    Impl(std::shared_ptr<const vector::ChunkCatalog> c, std::shared_ptr<const graph::GraphStore> g,
         std::shared_ptr<weights::ChangeLog> log, Clock clk)
        : chunks(std::move(c)), graph(std::move(g)), changeLog(std::move(log)),
          clock(clk ? std::move(clk) : Clock([] { return std::chrono::system_clock::now(); })) {}

    std::vector<BridgeMapping> collect(const std::unordered_set<MappingKey, MappingKeyHash>& keys,
                                       const std::optional<std::string>& relation) const {
        std::vector<BridgeMapping> out;
        out.reserve(keys.size());
        for (const auto& k : keys) {
            if (relation && k.relationType != *relation)
                continue;
            if (auto e = store.get(k))
                out.push_back(e->value);
        }
        std::sort(out.begin(), out.end(), sameKeyOrder);
        return out;
    }

    core::RetryPolicy retryPolicy() const {
        std::shared_lock lock(settingsMutex);
        return retry;
    }

    // Runs under the mapping's shard lock
    void record(const MappingKey& key, const core::Commit<BridgeMapping>& commit, TimePoint now,
                const std::string& feedbackId) {
        if (!changeLog)
            return;
        weights::ChangeLogEntry entry;
        entry.timestamp = now;
        entry.feedbackId = feedbackId;
        entry.ref = weights::ParameterRef::bridge(key.chunkId, key.nodeId, key.relationType);
        entry.oldValue = weights::formatScalar(commit.before.value.weight);
        entry.newValue = weights::formatScalar(commit.after.value.weight);
        entry.version = commit.after.version;
        changeLog->append(std::move(entry));
    }

    void notify(const BridgeMapping& m, std::uint64_t version) {
        PersistHook hook;
        {
            std::shared_lock lock(settingsMutex);
            hook = persistHook;
        }
        if (hook)
            hook(m, version);
    }

    Result<WeightChange> applyWeight(const MappingKey& key, const std::function<double(double)>& fn,
                                     const std::string& feedbackId) {
        const auto now = clock();
        auto res = store.update(
            key,
            [&](const BridgeMapping& cur) -> std::optional<BridgeMapping> {
                double next = clamp01(fn(cur.weight));
                if (next == cur.weight)
                    return std::nullopt;
                BridgeMapping m = cur;
                m.weight = next;
                m.updatedAt = now;
                return m;
            },
            retryPolicy(),
            [&](const core::Commit<BridgeMapping>& c) { record(key, c, now, feedbackId); });
        if (!res) {
            if (res.error().code == ErrorCode::NotFound)
                return Error{ErrorCode::NotFound, "no bridge mapping " + key.chunkId + " -[" +
                                                      key.relationType + "]-> " + key.nodeId};
            spdlog::warn("[BridgeIndex] weight update on {} -> {} failed: {}", key.chunkId,
                         key.nodeId, res.error().message);
            return res.error();
        }

        WeightChange change;
        change.key = key;
        const auto& commit = res.value();
        if (!commit) {
            auto cur = store.get(key);
            change.before = change.after = cur ? cur->value.weight : 0.0;
            change.version = cur ? cur->version : 0;
            return change;
        }
        change.before = commit->before.value.weight;
        change.after = commit->after.value.weight;
        change.version = commit->after.version;
        change.changed = true;
        if (commit->attempts > 1) {
            spdlog::debug("[BridgeIndex] {} -> {} committed after {} attempts", key.chunkId,
                          key.nodeId, commit->attempts);
        }
        notify(commit->after.value, commit->after.version);
        return change;
    }

    std::shared_ptr<const vector::ChunkCatalog> chunks;
    std::shared_ptr<const graph::GraphStore> graph;
    std::shared_ptr<weights::ChangeLog> changeLog;
    Clock clock;
    core::RetryPolicy retry;

    core::VersionedStore<MappingKey, BridgeMapping, MappingKeyHash> store{32};

    // Secondary indexes; structure only changes on upsert
    mutable std::shared_mutex indexMutex;
    std::unordered_map<ChunkId, std::unordered_set<MappingKey, MappingKeyHash>> byChunk;
    std::unordered_map<NodeId, std::unordered_set<MappingKey, MappingKeyHash>> byNode;

    // Guards persistHook and retry
    mutable std::shared_mutex settingsMutex;
    PersistHook persistHook;
};

BridgeIndex::BridgeIndex(std::shared_ptr<const vector::ChunkCatalog> chunks,
                         std::shared_ptr<const graph::GraphStore> graph,
                         std::shared_ptr<weights::ChangeLog> changeLog, Clock clock)
    : pImpl(std::make_unique<Impl>(std::move(chunks), std::move(graph), std::move(changeLog),
                                   std::move(clock))) {}

BridgeIndex::~BridgeIndex() = default;

Result<std::vector<BridgeMapping>> BridgeIndex::getNodesForChunk(const ChunkId& chunkId) const {
    if (!pImpl->chunks || !pImpl->chunks->containsChunk(chunkId))
        return Error{ErrorCode::ReferenceError, "unknown chunk '" + chunkId + "'"};

    std::shared_lock lock(pImpl->indexMutex);
    auto it = pImpl->byChunk.find(chunkId);
    if (it == pImpl->byChunk.end())
        return std::vector<BridgeMapping>{};
    return pImpl->collect(it->second, std::nullopt);
}

Result<std::vector<BridgeMapping>>
BridgeIndex::getChunksForNode(const NodeId& nodeId,
                              const std::optional<std::string>& relationType) const {
    if (!pImpl->graph || !pImpl->graph->hasNode(nodeId))
        return Error{ErrorCode::ReferenceError, "unknown graph node '" + nodeId + "'"};

    std::shared_lock lock(pImpl->indexMutex);
    auto it = pImpl->byNode.find(nodeId);
    if (it == pImpl->byNode.end())
        return std::vector<BridgeMapping>{};
    return pImpl->collect(it->second, relationType);
}

std::optional<BridgeMapping> BridgeIndex::getMapping(const MappingKey& key) const {
    if (auto e = pImpl->store.get(key))
        return e->value;
    return std::nullopt;
}

Result<BridgeMapping> BridgeIndex::upsertMapping(const BridgeMapping& mapping) {
    if (mapping.relationType.empty())
        return Error{ErrorCode::InvalidArgument, "bridge mapping relation must not be empty"};
    if (!std::isfinite(mapping.weight) || !std::isfinite(mapping.confidence) ||
        mapping.confidence < 0.0 || mapping.confidence > 1.0) {
        return Error{ErrorCode::ValidationError, "bridge mapping weight/confidence out of range"};
    }
    if (!pImpl->chunks || !pImpl->chunks->containsChunk(mapping.chunkId))
        return Error{ErrorCode::ReferenceError, "unknown chunk '" + mapping.chunkId + "'"};
    if (!pImpl->graph || !pImpl->graph->hasNode(mapping.nodeId))
        return Error{ErrorCode::ReferenceError, "unknown graph node '" + mapping.nodeId + "'"};

    const auto key = keyOf(mapping);
    const auto now = pImpl->clock();

    BridgeMapping seeded = mapping;
    seeded.weight = clamp01(mapping.weight);
    if (seeded.createdAt == TimePoint{})
        seeded.createdAt = now;
    seeded.updatedAt = now;

    if (pImpl->store.insertIfAbsent(key, seeded)) {
        {
            std::unique_lock lock(pImpl->indexMutex);
            pImpl->byChunk[key.chunkId].insert(key);
            pImpl->byNode[key.nodeId].insert(key);
        }
        pImpl->notify(seeded, 1);
        return seeded;
    }

    auto res = pImpl->store.update(
        key,
        [&](const BridgeMapping& cur) -> std::optional<BridgeMapping> {
            if (cur.confidence == mapping.confidence && cur.source == mapping.source)
                return std::nullopt;
            BridgeMapping m = cur;
            m.confidence = mapping.confidence;
            m.source = mapping.source;
            m.updatedAt = now;
            return m;
        },
        pImpl->retryPolicy());
    if (!res)
        return res.error();
    if (const auto& commit = res.value()) {
        pImpl->notify(commit->after.value, commit->after.version);
        return commit->after.value;
    }
    auto cur = pImpl->store.get(key);
    if (!cur)
        return Error{ErrorCode::InternalError, "bridge mapping vanished during upsert"};
    return cur->value;
}

Result<WeightChange> BridgeIndex::updateWeight(const MappingKey& key, double delta,
                                               const std::string& feedbackId) {
    if (!std::isfinite(delta))
        return Error{ErrorCode::InvalidArgument, "weight delta must be finite"};
    if (delta == 0.0) {
        auto cur = pImpl->store.get(key);
        if (!cur)
            return Error{ErrorCode::NotFound, "no bridge mapping " + key.chunkId + " -[" +
                                                  key.relationType + "]-> " + key.nodeId};
        WeightChange unchanged;
        unchanged.key = key;
        unchanged.before = unchanged.after = cur->value.weight;
        unchanged.version = cur->version;
        return unchanged;
    }
    return pImpl->applyWeight(key, [delta](double w) { return w + delta; }, feedbackId);
}

Result<std::vector<WeightChange>> BridgeIndex::updateWeight(const ChunkId& chunkId,
                                                            const NodeId& nodeId, double delta,
                                                            const std::string& feedbackId) {
    if (!pImpl->chunks || !pImpl->chunks->containsChunk(chunkId))
        return Error{ErrorCode::ReferenceError, "unknown chunk '" + chunkId + "'"};
    if (!pImpl->graph || !pImpl->graph->hasNode(nodeId))
        return Error{ErrorCode::ReferenceError, "unknown graph node '" + nodeId + "'"};

    std::vector<MappingKey> keys;
    {
        std::shared_lock lock(pImpl->indexMutex);
        auto it = pImpl->byChunk.find(chunkId);
        if (it != pImpl->byChunk.end()) {
            for (const auto& k : it->second) {
                if (k.nodeId == nodeId)
                    keys.push_back(k);
            }
        }
    }
    if (keys.empty())
        return Error{ErrorCode::NotFound, "no bridge mapping between '" + chunkId + "' and '" +
                                              nodeId + "'"};
    std::sort(keys.begin(), keys.end(),
              [](const MappingKey& a, const MappingKey& b) { return a.relationType < b.relationType; });

    std::vector<WeightChange> out;
    out.reserve(keys.size());
    for (const auto& k : keys) {
        auto r = updateWeight(k, delta, feedbackId);
        if (!r)
            return r.error();
        out.push_back(r.value());
    }
    return out;
}

Result<WeightChange> BridgeIndex::setWeight(const MappingKey& key, double weight,
                                            const std::string& feedbackId) {
    if (!std::isfinite(weight))
        return Error{ErrorCode::InvalidArgument, "weight must be finite"};
    return pImpl->applyWeight(key, [weight](double) { return weight; }, feedbackId);
}

void BridgeIndex::load(const BridgeMapping& mapping, std::uint64_t version) {
    const auto key = keyOf(mapping);
    pImpl->store.load(key, core::Versioned<BridgeMapping>{mapping, version});
    std::unique_lock lock(pImpl->indexMutex);
    pImpl->byChunk[key.chunkId].insert(key);
    pImpl->byNode[key.nodeId].insert(key);
}

std::size_t BridgeIndex::size() const {
    return pImpl->store.size();
}

std::vector<BridgeMapping> BridgeIndex::allMappings() const {
    std::vector<BridgeMapping> out;
    pImpl->store.forEach([&](const MappingKey&, const core::Versioned<BridgeMapping>& v) {
        out.push_back(v.value);
    });
    std::sort(out.begin(), out.end(), sameKeyOrder);
    return out;
}

void BridgeIndex::setPersistHook(PersistHook hook) {
    std::unique_lock lock(pImpl->settingsMutex);
    pImpl->persistHook = std::move(hook);
}

void BridgeIndex::setRetryPolicy(const core::RetryPolicy& policy) {
    std::unique_lock lock(pImpl->settingsMutex);
    pImpl->retry = policy;
}

} // namespace rlcf::bridge
