#include <rlcf/bridge/bridge_index.h>
#include <rlcf/graph/graph_store.h>
#include <rlcf/search/retrieval_engine.h>
#include <rlcf/weights/parameter_store.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <condition_variable>
#include <exception>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <queue>
#include <random>
#include <thread>
#include <unordered_map>

namespace rlcf::search {

using weights::kAllStrategies;
using weights::kStrategyCount;
using weights::StrategyId;
using weights::strategyIndex;
using weights::strategyName;

const char* strategyStatusName(StrategyStatus status) noexcept {
    switch (status) {
        case StrategyStatus::Ok: return "ok";
        case StrategyStatus::TimedOut: return "timed_out";
        case StrategyStatus::Failed: return "failed";
        case StrategyStatus::Skipped: return "skipped";
    }
    return "unknown";
}

namespace {

struct StrategyOutcome {
    Result<std::vector<ScoredCandidate>> ranked{std::vector<ScoredCandidate>{}};
    bool truncated = false;
};

bool combinedBefore(const CombinedCandidate& a, const CombinedCandidate& b) {
    if (a.rerankScore != b.rerankScore)
        return a.rerankScore > b.rerankScore;
    if (a.hybridScore != b.hybridScore)
        return a.hybridScore > b.hybridScore;
    return a.chunkId < b.chunkId;
}

} // namespace

class RetrievalEngine::Impl {
public:
    Impl(std::shared_ptr<vector::VectorSearcher> v, std::shared_ptr<const graph::GraphStore> g,
         std::shared_ptr<const bridge::BridgeIndex> b, RetrievalConfig cfg)
        : vectors(std::move(v)), graph(std::move(g)), bridge(std::move(b)), config(cfg),
          scorer(std::make_shared<GraphTraversalScorer>(graph, cfg.graph)),
          combiner(std::make_shared<HybridCombiner>(cfg.combiner)),
          rng(std::random_device{}()) {
        initThreadPool();
    }

    ~Impl() { pool_.stop(); }

    std::string nextTraceId() {
        std::lock_guard<std::mutex> lk(rngMutex);
        return fmt::format("tr-{:016x}", rng());
    }

    // Minimal fixed-size worker pool; packaged_task carries exceptions into the future
    class ThreadPool {
    public:
        ThreadPool() = default;
        ~ThreadPool() { stop(); }
        void start(size_t threads) {
            stop();
            if (threads == 0)
                return;
            done_ = false;
            for (size_t i = 0; i < threads; ++i) {
                workers_.emplace_back([this]() { run(); });
            }
        }
        void stop() {
            {
                std::lock_guard<std::mutex> lk(m_);
                done_ = true;
            }
            cv_.notify_all();
            for (auto& t : workers_)
                if (t.joinable())
                    t.join();
            workers_.clear();
        }
        template <typename F, typename R = std::invoke_result_t<F&>> std::future<R> submit(F&& f) {
            auto pt = std::make_shared<std::packaged_task<R()>>(std::forward<F>(f));
            auto fut = pt->get_future();
            {
                std::lock_guard<std::mutex> lk(m_);
                q_.emplace([pt]() mutable { (*pt)(); });
            }
            cv_.notify_one();
            return fut;
        }

    private:
        void run() {
            for (;;) {
                std::function<void()> job;
                {
                    std::unique_lock<std::mutex> lk(m_);
                    cv_.wait(lk, [this]() { return done_ || !q_.empty(); });
                    if (done_ && q_.empty())
                        return;
                    job = std::move(q_.front());
                    q_.pop();
                }
                job();
            }
        }
        std::vector<std::thread> workers_;
        std::queue<std::function<void()>> q_;
        std::mutex m_;
        std::condition_variable cv_;
        bool done_{true};
    };

    void initThreadPool() {
        size_t n = config.num_threads;
        if (n == 0) {
            n = kStrategyCount;
        }
        pool_.start(n);
    }

    std::shared_ptr<vector::VectorSearcher> vectors;
    std::shared_ptr<const graph::GraphStore> graph;
    std::shared_ptr<const bridge::BridgeIndex> bridge;
    RetrievalConfig config;
    std::shared_ptr<GraphTraversalScorer> scorer;
    std::shared_ptr<HybridCombiner> combiner;

    std::mutex rngMutex;
    std::mt19937_64 rng;

    ThreadPool pool_;
};

RetrievalEngine::RetrievalEngine(std::shared_ptr<vector::VectorSearcher> vectors,
                                 std::shared_ptr<const graph::GraphStore> graph,
                                 std::shared_ptr<const bridge::BridgeIndex> bridge,
                                 RetrievalConfig config)
    : pImpl(std::make_unique<Impl>(std::move(vectors), std::move(graph), std::move(bridge),
                                   config)) {
    if (!config.isValid()) {
        spdlog::warn("[RetrievalEngine] invalid retrieval config; falling back to defaults");
        pImpl->config = RetrievalConfig{};
    }
}

RetrievalEngine::~RetrievalEngine() = default;

const RetrievalConfig& RetrievalEngine::getConfig() const {
    return pImpl->config;
}

Result<RetrieveResponse>
RetrievalEngine::retrieve(const RetrieveRequest& request,
                          std::shared_ptr<const weights::ParameterSnapshot> snapshot) {
    const auto& cfg = pImpl->config;
    if (request.queryEmbedding.empty())
        return Error{ErrorCode::InvalidArgument, "query embedding must not be empty"};
    if (!snapshot)
        return Error{ErrorCode::InvalidState, "no parameter snapshot"};
    if (!pImpl->vectors || !pImpl->bridge)
        return Error{ErrorCode::InvalidState, "retrieval engine is missing a collaborator"};

    auto cancelled = [&request]() {
        return request.cancel && request.cancel->load(std::memory_order_acquire);
    };
    const std::size_t topK = request.topK > 0 ? request.topK : cfg.top_k;

    // 1) Gating
    learning::GateDistribution gate = learning::uniformDistribution();
    if (snapshot->gating) {
        learning::GatingNetwork net(snapshot->gating);
        auto g = net.forward(request.queryEmbedding, request.queryType);
        if (!g)
            return g.error();
        gate = g.value();
    }
    std::size_t top = 0;
    for (std::size_t k = 1; k < kStrategyCount; ++k) {
        if (gate[k] > gate[top])
            top = k;
    }

    // 2) Shared vector candidate set
    auto vr = pImpl->vectors->search(request.queryEmbedding, topK * cfg.over_retrieve_factor,
                                     &request.filter);
    if (!vr)
        return vr.error();
    auto matches = std::make_shared<const std::vector<vector::VectorMatch>>(std::move(vr).value());

    // 3) Fan out
    struct Pending {
        StrategyResult result;
        std::future<StrategyOutcome> future;
        std::shared_ptr<std::atomic<bool>> stop;
    };
    std::vector<Pending> pending;
    pending.reserve(kStrategyCount);

    for (auto s : kAllStrategies) {
        Pending p;
        p.result.strategy = s;
        p.result.gateWeight = gate[strategyIndex(s)];
        p.result.alpha = snapshot->alpha[strategyIndex(s)];
        const bool active = strategyIndex(s) == top || p.result.gateWeight >= cfg.min_strategy_weight;
        if (!active) {
            p.result.status = StrategyStatus::Skipped;
            pending.push_back(std::move(p));
            continue;
        }
        p.stop = std::make_shared<std::atomic<bool>>(false);

        auto scorer = pImpl->scorer;
        auto combiner = pImpl->combiner;
        auto bridge = pImpl->bridge;
        auto anchors = request.anchorNodes;
        auto stop = p.stop;
        const double alpha = p.result.alpha;
        p.future = pImpl->pool_.submit(
            [scorer, combiner, bridge, snapshot, matches, anchors, stop, alpha, s]() {
                StrategyOutcome out;
                auto weightOf = [&snapshot, s](const std::string& relation) {
                    return snapshot->traversalWeight(s, relation);
                };
                auto scores = scorer->scoreFrom(anchors, weightOf, stop.get());
                if (!scores) {
                    out.ranked = scores.error();
                    return out;
                }
                out.truncated = scores.value().truncated;
                out.ranked = combiner->combine(*matches, scores.value(), *bridge, alpha);
                return out;
            });
        pending.push_back(std::move(p));
    }

    // 4) Join with per-strategy deadline; poll so caller cancellation is observed
    const auto deadline = std::chrono::steady_clock::now() + cfg.strategy_timeout;
    constexpr auto kPollSlice = std::chrono::milliseconds(20);
    bool callerCancelled = false;
    for (auto& p : pending) {
        if (!p.future.valid())
            continue;
        std::future_status st = std::future_status::timeout;
        while (true) {
            if (cancelled()) {
                callerCancelled = true;
                break;
            }
            const auto now = std::chrono::steady_clock::now();
            if (now >= deadline) {
                st = p.future.wait_for(std::chrono::milliseconds(0));
                break;
            }
            st = p.future.wait_for(std::min<std::chrono::steady_clock::duration>(kPollSlice,
                                                                                 deadline - now));
            if (st == std::future_status::ready)
                break;
        }
        if (callerCancelled)
            break;

        if (st != std::future_status::ready) {
            p.stop->store(true, std::memory_order_release);
            p.result.status = StrategyStatus::TimedOut;
            p.result.error = "strategy deadline exceeded";
            spdlog::warn("[RetrievalEngine] strategy '{}' exceeded {} ms; returning partial result",
                         strategyName(p.result.strategy), cfg.strategy_timeout.count());
            continue;
        }
        try {
            auto outcome = p.future.get();
            p.result.graphTruncated = outcome.truncated;
            if (!outcome.ranked) {
                p.result.status = StrategyStatus::Failed;
                p.result.error = outcome.ranked.error().message;
                spdlog::warn("[RetrievalEngine] strategy '{}' failed: {}",
                             strategyName(p.result.strategy), p.result.error);
            } else {
                p.result.status = StrategyStatus::Ok;
                p.result.ranked = std::move(outcome.ranked).value();
            }
        } catch (const std::exception& e) {
            p.result.status = StrategyStatus::Failed;
            p.result.error = e.what();
            spdlog::warn("[RetrievalEngine] strategy '{}' threw: {}",
                         strategyName(p.result.strategy), e.what());
        }
    }
    if (callerCancelled) {
        for (auto& p : pending) {
            if (p.stop)
                p.stop->store(true, std::memory_order_release);
        }
        return Error{ErrorCode::OperationCancelled, "retrieval cancelled by caller"};
    }

    // 5) Total failure is surfaced
    std::size_t ok = 0, timedOut = 0;
    const Error* firstFailure = nullptr;
    Error failure;
    for (const auto& p : pending) {
        if (p.result.status == StrategyStatus::Ok)
            ++ok;
        else if (p.result.status == StrategyStatus::TimedOut)
            ++timedOut;
        else if (p.result.status == StrategyStatus::Failed && !firstFailure) {
            failure = Error{ErrorCode::InternalError, std::string("strategy '") +
                                                          strategyName(p.result.strategy) +
                                                          "' failed: " + p.result.error};
            firstFailure = &failure;
        }
    }
    if (ok == 0) {
        if (firstFailure)
            return *firstFailure;
        if (timedOut > 0)
            return Error{ErrorCode::Timeout, "every active strategy exceeded its deadline"};
        return Error{ErrorCode::InternalError, "no strategy ran"};
    }

    // 6) Combined ranking over strategies that returned
    std::map<ChunkId, CombinedCandidate> byChunk;
    std::map<ChunkId, double> gateMass;
    for (const auto& p : pending) {
        if (p.result.status != StrategyStatus::Ok)
            continue;
        const double g = p.result.gateWeight;
        for (const auto& c : p.result.ranked) {
            auto& cc = byChunk[c.chunkId];
            cc.chunkId = c.chunkId;
            cc.vectorScore = c.vectorScore;
            cc.hybridScore += g * c.finalScore;
            cc.graphScore += g * c.graphScore;
            gateMass[c.chunkId] += g;
        }
    }
    std::vector<CombinedCandidate> combined;
    combined.reserve(byChunk.size());
    const auto& rerank = snapshot->rerank.weights;
    for (auto& [id, cc] : byChunk) {
        const double mass = gateMass[id];
        if (mass > 0.0) {
            cc.hybridScore /= mass;
            cc.graphScore /= mass;
        }
        cc.features = {cc.hybridScore, cc.vectorScore, cc.graphScore};
        cc.rerankScore = 0.0;
        for (std::size_t i = 0; i < weights::kRerankFeatureCount; ++i)
            cc.rerankScore += rerank[i] * cc.features[i];
        combined.push_back(cc);
    }
    std::sort(combined.begin(), combined.end(), combinedBefore);
    if (combined.size() > topK)
        combined.resize(topK);

    for (auto& p : pending) {
        if (p.result.ranked.size() > topK)
            p.result.ranked.resize(topK);
    }

    // 7) Trace
    auto trace = std::make_shared<RetrievalTrace>();
    trace->traceId = pImpl->nextTraceId();
    trace->completedAt = std::chrono::system_clock::now();
    trace->parameterGeneration = snapshot->generation;
    trace->queryEmbedding = request.queryEmbedding;
    trace->queryType = request.queryType;
    trace->domain = request.domain;
    trace->anchorNodes = request.anchorNodes;
    trace->gate = gate;
    trace->selectedStrategy = kAllStrategies[top];
    trace->combined = combined;
    for (auto& p : pending)
        trace->strategies.push_back(std::move(p.result));

    RetrieveResponse response;
    response.perStrategy = trace->strategies;
    response.combined = std::move(combined);
    response.trace = trace;

    spdlog::debug("[RetrievalEngine] trace {}: {} strategies ok, {} timed out, {} results",
                  trace->traceId, ok, timedOut, response.combined.size());
    return response;
}

} // namespace rlcf::search
