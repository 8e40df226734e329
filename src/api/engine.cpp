#include <rlcf/api/engine.h>
#include <rlcf/learning/consensus.h>
#include <rlcf/learning/gating_network.h>
#include <rlcf/storage/parameter_repository.h>

#include <spdlog/spdlog.h>

#include <atomic>
#include <deque>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <unordered_set>

namespace rlcf::api {

using learning::FeedbackLevel;
using learning::kAllLevels;
using learning::kLevelCount;
using learning::levelIndex;

namespace {
constexpr std::size_t kRollbackPageSize = 512;
}

class Engine::Impl {
public:
    config::EngineConfig config;
    std::function<TimePoint()> clock;

    std::shared_ptr<vector::VectorSearcher> vectors;
    std::shared_ptr<graph::GraphStore> graph;
    std::shared_ptr<weights::ChangeLog> changeLog;
    std::shared_ptr<weights::ParameterStore> params;
    std::shared_ptr<bridge::BridgeIndex> bridge;
    std::unique_ptr<search::RetrievalEngine> retrieval;
    std::unique_ptr<learning::AuthorityCalculator> authority;
    std::unique_ptr<learning::PolicyUpdater> updater;
    std::unique_ptr<learning::ConsensusTracker> consensus;
    std::unique_ptr<learning::DecayManager> decay;
    std::unique_ptr<storage::ParameterRepository> repository;
    learning::RewardDecomposer decomposer;

    // Completed traces, oldest evicted first
    mutable std::shared_mutex traceMutex;
    std::unordered_map<std::string, std::shared_ptr<const search::RetrievalTrace>> traces;
    std::deque<std::string> traceOrder;

    std::mutex feedbackMutex;
    std::unordered_set<std::string> processedFeedback;
    std::atomic<std::uint64_t> baselineVersion{0};

    Result<void> openStorage();
    void wirePersistence();

    void rememberTrace(std::shared_ptr<const search::RetrievalTrace> trace) {
        std::unique_lock lock(traceMutex);
        const auto id = trace->traceId;
        if (traces.emplace(id, std::move(trace)).second)
            traceOrder.push_back(id);
        while (traceOrder.size() > config.trace_capacity) {
            traces.erase(traceOrder.front());
            traceOrder.pop_front();
        }
    }

    bool reserveFeedback(const std::string& id) {
        std::lock_guard<std::mutex> lock(feedbackMutex);
        return processedFeedback.insert(id).second;
    }

    void releaseFeedback(const std::string& id) {
        std::lock_guard<std::mutex> lock(feedbackMutex);
        processedFeedback.erase(id);
    }

    void persistBaselines() {
        if (!repository)
            return;
        const auto version = baselineVersion.fetch_add(1) + 1;
        if (auto r = repository->saveBaselines(updater->baselines(), version); !r)
            spdlog::warn("[Engine] Failed to persist reward baselines: {}", r.error().message);
    }
};

Result<void> Engine::Impl::openStorage() {
    auto opened = storage::ParameterRepository::open(config.storage);
    if (!opened)
        return opened.error();
    repository = std::move(opened).value();

    auto lastSequence = repository->lastLogSequence();
    if (!lastSequence)
        return lastSequence.error();
    auto tail = repository->loadChangeLogTail(changeLog->retained());
    if (!tail)
        return tail.error();
    changeLog->restore(std::move(tail).value(), lastSequence.value());

    if (auto r = repository->loadParameters(*params); !r)
        return r;
    if (auto r = repository->loadBridge(*bridge); !r)
        return r;
    if (auto r = repository->loadAuthority(*authority); !r)
        return r;

    auto baselines = repository->loadBaselines();
    if (!baselines)
        return baselines.error();
    if (baselines.value())
        updater->loadBaselines(*baselines.value());

    auto processed = repository->loadProcessedFeedbackIds();
    if (!processed)
        return processed.error();
    for (auto& id : processed.value())
        processedFeedback.insert(std::move(id));
    baselineVersion.store(processedFeedback.size());

    spdlog::info("[Engine] Restored log up to sequence {}, {} bridge mappings, {} processed "
                 "feedback events from {}",
                 changeLog->lastSequence(), bridge->size(), processedFeedback.size(),
                 config.storage.path);
    return {};
}

void Engine::Impl::wirePersistence() {
    auto* repo = repository.get();
    params->setPersistHook([repo](const weights::ParameterRow& row) {
        if (auto r = repo->saveParameter(row); !r)
            spdlog::warn("[Engine] Failed to persist {}: {}", row.ref.describe(),
                         r.error().message);
    });
    bridge->setPersistHook([repo](const bridge::BridgeMapping& m, std::uint64_t version) {
        if (auto r = repo->saveBridgeMapping(m, version); !r)
            spdlog::warn("[Engine] Failed to persist mapping {}->{}: {}", m.chunkId, m.nodeId,
                         r.error().message);
    });
    authority->setPersistHook([repo](const learning::AuthorityRow& row) {
        if (auto r = repo->saveAuthority(row); !r)
            spdlog::warn("[Engine] Failed to persist authority of {}: {}", row.key.userId,
                         r.error().message);
    });
    authority->setBaselinePersistHook([repo](const UserId& user, double baseline) {
        if (auto r = repo->saveCredential(user, baseline); !r)
            spdlog::warn("[Engine] Failed to persist credential of {}: {}", user,
                         r.error().message);
    });
    changeLog->setListener([repo](const weights::ChangeLogEntry& entry) {
        if (auto r = repo->appendLog(entry); !r)
            spdlog::warn("[Engine] Failed to append change log entry {}: {}", entry.sequence,
                         r.error().message);
    });
    changeLog->setArchive([repo](std::uint64_t afterSequence, std::size_t limit) {
        return repo->loadChangeLog(afterSequence, limit);
    });
}

Engine::Engine() : pImpl(std::make_unique<Impl>()) {}

Engine::~Engine() {
    if (pImpl->decay)
        pImpl->decay->stop();
    if (pImpl->authority)
        pImpl->authority->waitIdle();
}

Result<std::unique_ptr<Engine>> Engine::create(config::EngineConfig config,
                                               EngineComponents components) {
    if (auto v = config.validate(); !v)
        return v.error();

    spdlog::set_level(spdlog::level::from_str(config.logging.level));

    std::unique_ptr<Engine> engine(new Engine());
    auto& impl = *engine->pImpl;
    impl.config = std::move(config);
    impl.clock = components.clock ? std::move(components.clock)
                                  : [] { return std::chrono::system_clock::now(); };

    impl.vectors = components.vectors ? std::move(components.vectors)
                                      : vector::makeInMemoryVectorSearcher();
    impl.graph = components.graph ? std::move(components.graph) : graph::makeInMemoryGraphStore();
    impl.changeLog = std::make_shared<weights::ChangeLog>(impl.config.storage.log_memory_entries);
    impl.params = std::make_shared<weights::ParameterStore>(impl.config.parameters,
                                                            impl.changeLog, impl.clock);
    impl.bridge =
        std::make_shared<bridge::BridgeIndex>(impl.vectors, impl.graph, impl.changeLog, impl.clock);
    impl.retrieval = std::make_unique<search::RetrievalEngine>(impl.vectors, impl.graph,
                                                               impl.bridge, impl.config.retrieval);
    impl.authority = std::make_unique<learning::AuthorityCalculator>(impl.config.authority);
    impl.updater =
        std::make_unique<learning::PolicyUpdater>(impl.params, impl.bridge, impl.config.learning);
    impl.consensus = std::make_unique<learning::ConsensusTracker>(impl.config.consensus);

    if (!impl.config.storage.path.empty()) {
        if (auto r = impl.openStorage(); !r)
            return Error{r.error().code, "failed to open storage: " + r.error().message};
        impl.wirePersistence();
    }

    impl.params->bootstrapPriors();

    learning::DecayManager::Dependencies deps;
    deps.store = impl.params;
    deps.executor = std::move(components.executor);
    deps.clock = impl.clock;
    impl.decay = std::make_unique<learning::DecayManager>(impl.config.decay, std::move(deps));

    return engine;
}

Result<void> Engine::addChunk(vector::Chunk chunk) {
    return pImpl->vectors->addChunk(std::move(chunk));
}

Result<void> Engine::addNode(const graph::GraphNode& node) {
    return pImpl->graph->addNode(node);
}

Result<void> Engine::addEdge(const graph::GraphEdge& edge) {
    return pImpl->graph->addEdge(edge);
}

Result<bridge::BridgeMapping> Engine::upsertMapping(const bridge::BridgeMapping& mapping) {
    return pImpl->bridge->upsertMapping(mapping);
}

Result<search::RetrieveResponse> Engine::retrieve(const search::RetrieveRequest& request) {
    auto snapshot = pImpl->params->snapshot();
    if (!snapshot->gating && !request.queryEmbedding.empty()) {
        // The first query fixes the gating input dimension.
        if (pImpl->params->ensureGating(learning::GatingNetwork::initialize(
                request.queryEmbedding.size(), pImpl->config.learning.gating)))
            spdlog::debug("[Engine] Gating initialised for dimension {}",
                          request.queryEmbedding.size());
        snapshot = pImpl->params->snapshot();
    }

    auto response = pImpl->retrieval->retrieve(request, std::move(snapshot));
    if (!response)
        return response;
    pImpl->rememberTrace(response.value().trace);
    return response;
}

std::shared_ptr<const search::RetrievalTrace> Engine::findTrace(const std::string& traceId) const {
    std::shared_lock lock(pImpl->traceMutex);
    auto it = pImpl->traces.find(traceId);
    return it == pImpl->traces.end() ? nullptr : it->second;
}

Result<FeedbackAck> Engine::ingestFeedback(const learning::FeedbackEvent& event) {
    if (auto v = learning::validateFeedback(event); !v) {
        spdlog::warn("[Feedback] Rejected '{}': {}", event.id, v.error().message);
        return v.error();
    }

    FeedbackAck ack;
    ack.feedbackId = event.id;

    if (!pImpl->reserveFeedback(event.id)) {
        spdlog::debug("[Feedback] Duplicate '{}' acknowledged without effect", event.id);
        ack.accepted = true;
        ack.duplicate = true;
        return ack;
    }

    // Iterations oldest first, final trace last
    std::vector<std::shared_ptr<const search::RetrievalTrace>> traces;
    traces.reserve(event.iterationTraceIds.size() + 1);
    for (const auto& id : event.iterationTraceIds) {
        auto t = findTrace(id);
        if (!t) {
            pImpl->releaseFeedback(event.id);
            spdlog::warn("[Feedback] Rejected '{}': unknown iteration trace '{}'", event.id, id);
            return Error{ErrorCode::ValidationError, "unknown trace '" + id + "'"};
        }
        traces.push_back(std::move(t));
    }
    auto finalTrace = findTrace(event.traceId);
    if (!finalTrace) {
        pImpl->releaseFeedback(event.id);
        spdlog::warn("[Feedback] Rejected '{}': unknown trace '{}'", event.id, event.traceId);
        return Error{ErrorCode::ValidationError, "unknown trace '" + event.traceId + "'"};
    }
    traces.push_back(finalTrace);

    ack.rewards = pImpl->decomposer.decompose(event, finalTrace.get());

    std::array<double, kLevelCount> authority{};
    for (auto level : kAllLevels)
        authority[levelIndex(level)] =
            pImpl->authority->getAuthority(event.userId, level, event.domain);

    // apply fails only before committing anything; past that point the id stays
    // consumed so a resend cannot apply the committed deltas twice
    auto report = pImpl->updater->apply(event, ack.rewards, authority, traces);
    if (!report) {
        pImpl->releaseFeedback(event.id);
        spdlog::error("[Feedback] Update for '{}' failed: {}", event.id, report.error().message);
        return report.error();
    }
    ack.update = std::move(report).value();
    if (ack.update.failedUpdates > 0)
        spdlog::warn("[Feedback] '{}' applied partially: {} keys failed (last: {})", event.id,
                     ack.update.failedUpdates, ack.update.lastFailure);
    pImpl->persistBaselines();

    learning::ConsensusVote vote;
    vote.feedbackId = event.id;
    vote.userId = event.userId;
    vote.domain = event.domain;
    vote.rewards = ack.rewards;
    vote.authority = authority;
    for (auto level : kAllLevels)
        vote.judged[levelIndex(level)] = event.judges(level);

    auto consensus = pImpl->consensus->addVote(event.traceId, std::move(vote));
    ack.consensusReached = !consensus.outcomes.empty();
    ack.validationsScheduled = consensus.outcomes.size();
    for (auto& outcome : consensus.outcomes)
        pImpl->authority->scheduleUpdate(std::move(outcome));

    if (pImpl->repository) {
        storage::ProcessedFeedback record;
        record.feedbackId = event.id;
        record.traceId = event.traceId;
        record.receivedAt = pImpl->clock();
        record.rewards = ack.rewards.values;
        if (auto r = pImpl->repository->recordFeedback(record); !r)
            spdlog::warn("[Feedback] Failed to record '{}': {}", event.id, r.error().message);
    }

    ack.accepted = true;
    spdlog::debug("[Feedback] '{}' applied: R=({:.3f}, {:.3f}, {:.3f}), {} traversal, {} bridge, "
                  "{} alpha updates",
                  event.id, ack.rewards.values[0], ack.rewards.values[1], ack.rewards.values[2],
                  ack.update.traversalUpdates, ack.update.bridgeUpdates, ack.update.alphaUpdates);
    return ack;
}

Result<void> Engine::submitValidation(learning::ValidationOutcome outcome) {
    if (outcome.feedbackId.empty() || outcome.userId.empty())
        return Error{ErrorCode::ValidationError, "validation outcome needs feedback and user ids"};
    if (outcome.confirmed.empty())
        return Error{ErrorCode::ValidationError, "validation outcome names no level"};
    pImpl->authority->scheduleUpdate(std::move(outcome));
    return {};
}

void Engine::waitForAuthorityUpdates() {
    pImpl->authority->waitIdle();
}

std::shared_ptr<const weights::ParameterSnapshot> Engine::getParameterSnapshot() const {
    return pImpl->params->snapshot();
}

double Engine::getAuthority(const UserId& user, FeedbackLevel level,
                            const std::string& domain) const {
    return pImpl->authority->getAuthority(user, level, domain);
}

learning::AuthorityBreakdown Engine::authorityBreakdown(const UserId& user, FeedbackLevel level,
                                                        const std::string& domain) const {
    return pImpl->authority->breakdown(user, level, domain);
}

Result<void> Engine::setBaselineCredential(const UserId& user, double credential) {
    return pImpl->authority->setBaselineCredential(user, credential);
}

Result<std::vector<weights::ChangeLogEntry>> Engine::changeLog(std::uint64_t afterSequence,
                                                               std::size_t limit) const {
    return pImpl->changeLog->history(afterSequence, limit);
}

Result<RollbackReport> Engine::rollbackTo(std::uint64_t sequence) {
    const auto last = pImpl->changeLog->lastSequence();
    if (sequence > last)
        return Error{ErrorCode::InvalidArgument, "sequence " + std::to_string(sequence) +
                                                     " is beyond the last change " +
                                                     std::to_string(last)};

    // The first change after the target carries the value each key had at the target.
    // Later history is paged so only one entry per key is held.
    std::vector<weights::ChangeLogEntry> firsts;
    std::unordered_set<std::string> seen;
    for (auto cursor = sequence; cursor < last;) {
        auto page = pImpl->changeLog->history(cursor, kRollbackPageSize);
        if (!page)
            return page.error();
        auto entries = std::move(page).value();
        if (entries.empty())
            break;
        for (auto& e : entries) {
            cursor = e.sequence;
            if (e.sequence > last)
                break;
            if (seen.insert(e.ref.describe()).second)
                firsts.push_back(std::move(e));
        }
    }

    RollbackReport report;
    report.targetSequence = sequence;
    const std::string feedbackId = "rollback@" + std::to_string(sequence);

    for (auto it = firsts.rbegin(); it != firsts.rend(); ++it) {
        const auto& e = *it;
        Result<void> r;
        if (e.ref.kind == weights::ParameterKind::Bridge) {
            auto v = weights::parseScalar(e.oldValue);
            if (!v) {
                r = Error{ErrorCode::ValidationError, "bad bridge value '" + e.oldValue + "'"};
            } else {
                auto set = pImpl->bridge->setWeight(
                    bridge::MappingKey{e.ref.chunkId, e.ref.nodeId, e.ref.relation}, *v,
                    feedbackId);
                if (!set)
                    r = set.error();
            }
        } else {
            r = pImpl->params->restore(e.ref, e.oldValue, feedbackId);
        }

        if (r) {
            ++report.keysReverted;
        } else {
            ++report.keysFailed;
            spdlog::warn("[Engine] Rollback of {} failed: {}", e.ref.describe(),
                         r.error().message);
        }
    }

    spdlog::info("[Engine] Rolled back to sequence {}: {} keys reverted, {} failed", sequence,
                 report.keysReverted, report.keysFailed);
    return report;
}

learning::SweepReport Engine::runDecaySweep(std::optional<TimePoint> at) {
    return at ? pImpl->decay->sweepAt(*at) : pImpl->decay->sweepNow();
}

Result<void> Engine::startDecay() {
    if (!pImpl->config.decay.enabled)
        return Error{ErrorCode::InvalidState, "decay is disabled in configuration"};
    pImpl->decay->start();
    if (!pImpl->decay->isRunning())
        return Error{ErrorCode::InvalidState, "no executor available for scheduled decay"};
    return {};
}

void Engine::stopDecay() {
    pImpl->decay->stop();
}

const bridge::BridgeIndex& Engine::bridgeIndex() const {
    return *pImpl->bridge;
}

const config::EngineConfig& Engine::config() const {
    return pImpl->config;
}

} // namespace rlcf::api
