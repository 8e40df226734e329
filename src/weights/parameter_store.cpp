#include <rlcf/weights/parameter_store.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <mutex>
#include <shared_mutex>

namespace rlcf::weights {

std::optional<double> ParameterSnapshot::traversalWeight(StrategyId s,
                                                         const std::string& relation) const {
    const auto& def = strategyDefinition(s);
    if (!def.allows(relation))
        return std::nullopt;
    const auto& table = traversal[strategyIndex(s)];
    auto it = table.find(relation);
    return it != table.end() ? it->second : def.prior(relation);
}

namespace {

constexpr int kSingletonKey = 0;

float clampParam(float v, double bound) {
    if (!std::isfinite(v))
        return 0.0f;
    const auto b = static_cast<float>(bound);
    return std::clamp(v, -b, b);
}

void clampGating(GatingParameters& p, double bound) {
    for (auto* vec : {&p.w1, &p.b1, &p.w2, &p.b2, &p.expertBias}) {
        for (auto& v : *vec)
            v = clampParam(v, bound);
    }
}

RerankParameters clampRerank(RerankParameters p) {
    for (auto& w : p.weights)
        w = clamp01(w);
    return p;
}

} // namespace

class ParameterStore::Impl {
public:
    Impl(ParameterStoreConfig cfg, std::shared_ptr<ChangeLog> log, Clock clk)
        : config(cfg), changeLog(std::move(log)),
          clock(clk ? std::move(clk) : Clock([] { return std::chrono::system_clock::now(); })) {
        if (!changeLog)
            changeLog = std::make_shared<ChangeLog>();
    }

    std::uint64_t generation() const {
        return traversal.generation() + alpha.generation() + gating.generation() +
               rerank.generation();
    }

    void record(const ParameterRef& ref, std::string oldValue, std::string newValue,
                std::uint64_t version, TimePoint ts, const std::string& feedbackId) {
        ChangeLogEntry entry;
        entry.timestamp = ts;
        entry.feedbackId = feedbackId;
        entry.ref = ref;
        entry.oldValue = std::move(oldValue);
        entry.newValue = std::move(newValue);
        entry.version = version;
        changeLog->append(std::move(entry));
    }

    core::RetryPolicy retryPolicy() const {
        std::shared_lock lock(settingsMutex);
        return retry;
    }

    void persist(ParameterRow row) {
        PersistHook hook;
        {
            std::shared_lock lock(settingsMutex);
            hook = persistHook;
        }
        if (hook)
            hook(row);
    }

    void persistTraversal(const TraversalKey& key, const core::Versioned<TraversalWeight>& v) {
        ParameterRow row;
        row.ref = ParameterRef::traversal(key.strategy, key.relation);
        row.value = formatScalar(v.value.weight);
        row.version = v.version;
        row.lastReinforced = v.value.lastReinforced;
        row.lastDecayed = v.value.lastDecayed;
        persist(std::move(row));
    }

    Result<ScalarChange>
    commitTraversal(const TraversalKey& key,
                    const std::function<std::optional<TraversalWeight>(const TraversalWeight&)>& fn,
                    const std::string& feedbackId, TimePoint now) {
        const auto ref = ParameterRef::traversal(key.strategy, key.relation);
        auto res = traversal.update(key, fn, retryPolicy(),
                                    [&](const core::Commit<TraversalWeight>& c) {
                                        record(ref, formatScalar(c.before.value.weight),
                                               formatScalar(c.after.value.weight),
                                               c.after.version, now, feedbackId);
                                    });
        if (!res) {
            if (res.error().code == ErrorCode::NotFound)
                return Error{ErrorCode::NotFound, "no traversal weight " + ref.describe()};
            return res.error();
        }
        ScalarChange change;
        change.ref = ref;
        const auto& commit = res.value();
        if (!commit) {
            auto cur = traversal.get(key);
            change.before = change.after = cur ? cur->value.weight : 0.0;
            change.version = cur ? cur->version : 0;
            return change;
        }
        change.before = commit->before.value.weight;
        change.after = commit->after.value.weight;
        change.version = commit->after.version;
        change.changed = true;
        persistTraversal(key, commit->after);
        return change;
    }

    Result<ScalarChange> commitAlpha(StrategyId s, const std::function<double(double)>& fn,
                                     const std::string& feedbackId) {
        const auto now = clock();
        auto res = alpha.update(
            s,
            [&](const double& cur) -> std::optional<double> {
                double next = fn(cur);
                if (!std::isfinite(next))
                    return std::nullopt;
                next = std::clamp(next, config.alpha_min, config.alpha_max);
                if (next == cur)
                    return std::nullopt;
                return next;
            },
            retryPolicy(),
            [&](const core::Commit<double>& c) {
                record(ParameterRef::alpha(s), formatScalar(c.before.value),
                       formatScalar(c.after.value), c.after.version, now, feedbackId);
            });
        if (!res)
            return res.error();
        ScalarChange change;
        change.ref = ParameterRef::alpha(s);
        const auto& commit = res.value();
        if (!commit) {
            auto cur = alpha.get(s);
            change.before = change.after = cur ? cur->value : 0.0;
            change.version = cur ? cur->version : 0;
            return change;
        }
        change.before = commit->before.value;
        change.after = commit->after.value;
        change.version = commit->after.version;
        change.changed = true;
        ParameterRow row;
        row.ref = change.ref;
        row.value = formatScalar(change.after);
        row.version = change.version;
        persist(std::move(row));
        return change;
    }

    Result<bool> commitGating(const GatingUpdate& fn, const std::string& feedbackId) {
        const auto now = clock();
        auto res = gating.update(
            kSingletonKey,
            [&](const std::shared_ptr<const GatingParameters>& cur)
                -> std::optional<std::shared_ptr<const GatingParameters>> {
                if (!cur)
                    return std::nullopt;
                auto next = fn(*cur);
                if (!next)
                    return std::nullopt;
                clampGating(*next, config.gating_param_bound);
                if (!next->valid() || *next == *cur)
                    return std::nullopt;
                return std::make_shared<const GatingParameters>(std::move(*next));
            },
            retryPolicy(),
            [&](const core::Commit<std::shared_ptr<const GatingParameters>>& c) {
                record(ParameterRef::gating(), toJson(*c.before.value), toJson(*c.after.value),
                       c.after.version, now, feedbackId);
            });
        if (!res) {
            if (res.error().code == ErrorCode::NotFound)
                return Error{ErrorCode::NotFound, "gating parameters are not initialised"};
            return res.error();
        }
        const auto& commit = res.value();
        if (!commit)
            return false;
        ParameterRow row;
        row.ref = ParameterRef::gating();
        row.value = toJson(*commit->after.value);
        row.version = commit->after.version;
        persist(std::move(row));
        return true;
    }

    Result<bool> commitRerank(const RerankUpdate& fn, const std::string& feedbackId) {
        const auto now = clock();
        auto res = rerank.update(
            kSingletonKey,
            [&](const RerankParameters& cur) -> std::optional<RerankParameters> {
                auto next = fn(cur);
                if (!next)
                    return std::nullopt;
                for (auto w : next->weights) {
                    if (!std::isfinite(w))
                        return std::nullopt;
                }
                auto clamped = clampRerank(*next);
                if (clamped == cur)
                    return std::nullopt;
                return clamped;
            },
            retryPolicy(),
            [&](const core::Commit<RerankParameters>& c) {
                record(ParameterRef::rerank(), toJson(c.before.value), toJson(c.after.value),
                       c.after.version, now, feedbackId);
            });
        if (!res)
            return res.error();
        const auto& commit = res.value();
        if (!commit)
            return false;
        ParameterRow row;
        row.ref = ParameterRef::rerank();
        row.value = toJson(commit->after.value);
        row.version = commit->after.version;
        persist(std::move(row));
        return true;
    }

    ParameterStoreConfig config;
    std::shared_ptr<ChangeLog> changeLog;
    Clock clock;
    core::RetryPolicy retry;

    core::VersionedStore<TraversalKey, TraversalWeight, TraversalKeyHash> traversal{16};
    core::VersionedStore<StrategyId, double> alpha{4};
    core::VersionedStore<int, std::shared_ptr<const GatingParameters>> gating{1};
    core::VersionedStore<int, RerankParameters> rerank{1};

    mutable std::mutex snapshotMutex;
    mutable std::shared_ptr<const ParameterSnapshot> cached;

    // Guards persistHook and retry
    mutable std::shared_mutex settingsMutex;
    PersistHook persistHook;
};

ParameterStore::ParameterStore(ParameterStoreConfig config, std::shared_ptr<ChangeLog> changeLog,
                               Clock clock)
    : pImpl(std::make_unique<Impl>(config, std::move(changeLog), std::move(clock))) {
    if (!pImpl->config.isValid()) {
        spdlog::warn("[ParameterStore] invalid alpha bounds [{}, {}] (default {}); using defaults",
                     config.alpha_min, config.alpha_max, config.alpha_default);
        pImpl->config = ParameterStoreConfig{};
    }
}

ParameterStore::~ParameterStore() = default;

void ParameterStore::bootstrapPriors() {
    const auto now = pImpl->clock();
    std::size_t seeded = 0;
    for (const auto& def : strategyTable()) {
        for (const auto& [relation, prior] : def.priors) {
            TraversalWeight w;
            w.weight = prior;
            w.prior = prior;
            w.lastReinforced = now;
            w.lastDecayed = now;
            TraversalKey key{def.id, relation};
            if (pImpl->traversal.insertIfAbsent(key, w)) {
                pImpl->persistTraversal(key, core::Versioned<TraversalWeight>{w, 1});
                ++seeded;
            }
        }
        if (pImpl->alpha.insertIfAbsent(def.id, pImpl->config.alpha_default)) {
            ParameterRow row;
            row.ref = ParameterRef::alpha(def.id);
            row.value = formatScalar(pImpl->config.alpha_default);
            row.version = 1;
            pImpl->persist(std::move(row));
        }
    }
    if (pImpl->rerank.insertIfAbsent(kSingletonKey, RerankParameters{})) {
        ParameterRow row;
        row.ref = ParameterRef::rerank();
        row.value = toJson(RerankParameters{});
        row.version = 1;
        pImpl->persist(std::move(row));
    }
    spdlog::debug("[ParameterStore] bootstrap seeded {} traversal priors", seeded);
}

bool ParameterStore::ensureGating(GatingParameters initial) {
    if (!initial.valid())
        return false;
    clampGating(initial, pImpl->config.gating_param_bound);
    auto shared = std::make_shared<const GatingParameters>(std::move(initial));
    if (!pImpl->gating.insertIfAbsent(kSingletonKey, shared))
        return false;
    ParameterRow row;
    row.ref = ParameterRef::gating();
    row.value = toJson(*shared);
    row.version = 1;
    pImpl->persist(std::move(row));
    spdlog::info("[ParameterStore] gating network initialised (input {}, hidden {})",
                 shared->inputDim, shared->hidden);
    return true;
}

std::shared_ptr<const ParameterSnapshot> ParameterStore::snapshot() const {
    std::lock_guard<std::mutex> lock(pImpl->snapshotMutex);
    const auto gen = pImpl->generation();
    if (pImpl->cached && pImpl->cached->generation == gen)
        return pImpl->cached;

    auto snap = std::make_shared<ParameterSnapshot>();
    snap->generation = gen;
    pImpl->traversal.forEach(
        [&](const TraversalKey& k, const core::Versioned<TraversalWeight>& v) {
            snap->traversal[strategyIndex(k.strategy)][k.relation] = v.value.weight;
        });
    for (auto s : kAllStrategies) {
        auto a = pImpl->alpha.get(s);
        snap->alpha[strategyIndex(s)] = a ? a->value : pImpl->config.alpha_default;
    }
    if (auto g = pImpl->gating.get(kSingletonKey))
        snap->gating = g->value;
    if (auto r = pImpl->rerank.get(kSingletonKey))
        snap->rerank = r->value;

    pImpl->cached = std::move(snap);
    return pImpl->cached;
}

std::uint64_t ParameterStore::generation() const {
    return pImpl->generation();
}

std::optional<core::Versioned<TraversalWeight>>
ParameterStore::traversal(StrategyId s, const std::string& relation) const {
    return pImpl->traversal.get(TraversalKey{s, relation});
}

std::vector<TraversalKey> ParameterStore::traversalKeys() const {
    auto keys = pImpl->traversal.keys();
    std::sort(keys.begin(), keys.end(), [](const TraversalKey& a, const TraversalKey& b) {
        if (a.strategy != b.strategy)
            return strategyIndex(a.strategy) < strategyIndex(b.strategy);
        return a.relation < b.relation;
    });
    return keys;
}

std::optional<core::Versioned<double>> ParameterStore::alpha(StrategyId s) const {
    return pImpl->alpha.get(s);
}

Result<ScalarChange> ParameterStore::adjustTraversal(StrategyId s, const std::string& relation,
                                                     double delta,
                                                     const std::string& feedbackId) {
    if (!std::isfinite(delta))
        return Error{ErrorCode::InvalidArgument, "traversal delta must be finite"};
    if (!strategyDefinition(s).allows(relation))
        return Error{ErrorCode::NotFound, std::string("strategy '") + strategyName(s) +
                                              "' does not traverse '" + relation + "'"};
    const auto now = pImpl->clock();
    return pImpl->commitTraversal(
        TraversalKey{s, relation},
        [&](const TraversalWeight& cur) -> std::optional<TraversalWeight> {
            double next = clamp01(cur.weight + delta);
            if (next == cur.weight)
                return std::nullopt;
            TraversalWeight w = cur;
            w.weight = next;
            w.lastReinforced = now;
            return w;
        },
        feedbackId, now);
}

Result<ScalarChange> ParameterStore::adjustAlpha(StrategyId s, double delta,
                                                 const std::string& feedbackId) {
    if (!std::isfinite(delta))
        return Error{ErrorCode::InvalidArgument, "alpha delta must be finite"};
    return pImpl->commitAlpha(s, [delta](double a) { return a + delta; }, feedbackId);
}

Result<bool> ParameterStore::updateGating(const GatingUpdate& fn, const std::string& feedbackId) {
    return pImpl->commitGating(fn, feedbackId);
}

Result<bool> ParameterStore::updateRerank(const RerankUpdate& fn, const std::string& feedbackId) {
    return pImpl->commitRerank(fn, feedbackId);
}

Result<std::optional<ScalarChange>>
ParameterStore::decayTraversal(StrategyId s, const std::string& relation, TimePoint now,
                               double rate, std::chrono::hours grace) {
    if (!(rate > 0.0 && rate <= 1.0))
        return Error{ErrorCode::InvalidArgument, "decay rate must be in (0, 1]"};

    bool skipped = false;
    auto res = pImpl->commitTraversal(
        TraversalKey{s, relation},
        [&](const TraversalWeight& cur) -> std::optional<TraversalWeight> {
            skipped = false;
            if (now - cur.lastReinforced < grace) {
                skipped = true;
                return std::nullopt;
            }
            const auto since = std::max(cur.lastReinforced, cur.lastDecayed);
            const double days =
                std::chrono::duration<double, std::ratio<86400>>(now - since).count();
            if (days <= 0.0) {
                skipped = true;
                return std::nullopt;
            }
            const double factor = std::pow(rate, days);
            const double next = clamp01(factor * cur.weight + (1.0 - factor) * cur.prior);
            if (std::abs(next - cur.weight) < 1e-12) {
                skipped = true;
                return std::nullopt;
            }
            TraversalWeight w = cur;
            w.weight = next;
            w.lastDecayed = now;
            return w;
        },
        "decay", now);
    if (!res)
        return res.error();
    if (skipped || !res.value().changed)
        return std::optional<ScalarChange>{};
    return std::optional<ScalarChange>{res.value()};
}

Result<void> ParameterStore::restore(const ParameterRef& ref, const std::string& value,
                                     const std::string& feedbackId) {
    switch (ref.kind) {
        case ParameterKind::Traversal: {
            auto v = parseScalar(value);
            if (!v)
                return Error{ErrorCode::ValidationError, "bad traversal value '" + value + "'"};
            const auto now = pImpl->clock();
            auto r = pImpl->commitTraversal(
                TraversalKey{ref.strategy, ref.relation},
                [&](const TraversalWeight& cur) -> std::optional<TraversalWeight> {
                    double next = clamp01(*v);
                    if (next == cur.weight)
                        return std::nullopt;
                    TraversalWeight w = cur;
                    w.weight = next;
                    w.lastReinforced = now;
                    return w;
                },
                feedbackId, now);
            if (!r)
                return r.error();
            return {};
        }
        case ParameterKind::Alpha: {
            auto v = parseScalar(value);
            if (!v)
                return Error{ErrorCode::ValidationError, "bad alpha value '" + value + "'"};
            auto r = pImpl->commitAlpha(ref.strategy, [v](double) { return *v; }, feedbackId);
            if (!r)
                return r.error();
            return {};
        }
        case ParameterKind::Gating: {
            auto parsed = gatingFromJson(value);
            if (!parsed)
                return parsed.error();
            auto target = parsed.value();
            auto r = pImpl->commitGating(
                [&](const GatingParameters&) -> std::optional<GatingParameters> { return target; },
                feedbackId);
            if (!r)
                return r.error();
            return {};
        }
        case ParameterKind::Rerank: {
            auto parsed = rerankFromJson(value);
            if (!parsed)
                return parsed.error();
            auto target = parsed.value();
            auto r = pImpl->commitRerank(
                [&](const RerankParameters&) -> std::optional<RerankParameters> { return target; },
                feedbackId);
            if (!r)
                return r.error();
            return {};
        }
        case ParameterKind::Bridge:
            break;
    }
    return Error{ErrorCode::InvalidArgument, "bridge weights are restored by the bridge index"};
}

void ParameterStore::loadTraversal(StrategyId s, const std::string& relation, TraversalWeight w,
                                   std::uint64_t version) {
    w.weight = clamp01(w.weight);
    w.prior = strategyDefinition(s).prior(relation);
    pImpl->traversal.load(TraversalKey{s, relation}, core::Versioned<TraversalWeight>{w, version});
}

void ParameterStore::loadAlpha(StrategyId s, double value, std::uint64_t version) {
    value = std::clamp(value, pImpl->config.alpha_min, pImpl->config.alpha_max);
    pImpl->alpha.load(s, core::Versioned<double>{value, version});
}

void ParameterStore::loadGating(GatingParameters params, std::uint64_t version) {
    if (!params.valid()) {
        spdlog::warn("[ParameterStore] ignoring persisted gating parameters with bad shape");
        return;
    }
    clampGating(params, pImpl->config.gating_param_bound);
    pImpl->gating.load(kSingletonKey,
                       core::Versioned<std::shared_ptr<const GatingParameters>>{
                           std::make_shared<const GatingParameters>(std::move(params)), version});
}

void ParameterStore::loadRerank(RerankParameters params, std::uint64_t version) {
    pImpl->rerank.load(kSingletonKey,
                       core::Versioned<RerankParameters>{clampRerank(params), version});
}

void ParameterStore::setPersistHook(PersistHook hook) {
    std::unique_lock lock(pImpl->settingsMutex);
    pImpl->persistHook = std::move(hook);
}

void ParameterStore::setRetryPolicy(const core::RetryPolicy& policy) {
    std::unique_lock lock(pImpl->settingsMutex);
    pImpl->retry = policy;
}

const ParameterStoreConfig& ParameterStore::config() const {
    return pImpl->config;
}

std::uint64_t ParameterStore::conflictCount() const {
    return pImpl->traversal.conflictCount() + pImpl->alpha.conflictCount() +
           pImpl->gating.conflictCount() + pImpl->rerank.conflictCount();
}

} // namespace rlcf::weights
