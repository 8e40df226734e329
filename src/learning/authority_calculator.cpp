#include <rlcf/learning/authority_calculator.h>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <condition_variable>
#include <mutex>
#include <set>
#include <unordered_map>
#include <utility>

namespace rlcf::learning {

const char* levelName(FeedbackLevel level) noexcept {
    switch (level) {
        case FeedbackLevel::Retrieval:
            return "retrieval";
        case FeedbackLevel::Reasoning:
            return "reasoning";
        case FeedbackLevel::Synthesis:
            return "synthesis";
    }
    return "unknown";
}

std::optional<FeedbackLevel> parseLevel(std::string_view name) {
    for (auto level : kAllLevels) {
        if (name == levelName(level))
            return level;
    }
    return std::nullopt;
}

bool AuthorityConfig::isValid() const {
    const double weights[] = {baseline_weight, track_record_weight, recent_weight};
    double sum = 0.0;
    for (double w : weights) {
        if (!std::isfinite(w) || w < 0.0)
            return false;
        sum += w;
    }
    return std::abs(sum - 1.0) <= 1e-6 && recent_window > 0 && neutral_prior >= 0.0 &&
           neutral_prior <= 1.0;
}

std::size_t AuthorityKeyHash::operator()(const AuthorityKey& k) const noexcept {
    std::size_t h = std::hash<std::string>{}(k.userId);
    h ^= std::hash<std::string>{}(k.domain) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
    return h * 31u + levelIndex(k.level);
}

class AuthorityCalculator::Impl {
public:
    explicit Impl(AuthorityConfig cfg)
        : config(std::move(cfg)), pool(std::max<std::size_t>(1, config.async_threads)) {}

    ~Impl() {
        waitIdle();
        pool.join();
    }

    AuthorityBreakdown compute(const AuthorityKey& key) const {
        AuthorityBreakdown b;
        b.baseline = baselineFor(key.userId);
        b.trackRecord = config.neutral_prior;
        b.recentPerformance = config.neutral_prior;

        if (auto rec = records.get(key)) {
            const auto& r = rec->value;
            b.validated = r.validated;
            if (r.validated > 0)
                b.trackRecord =
                    static_cast<double>(r.confirmed) / static_cast<double>(r.validated);
            if (!r.recent.empty()) {
                const auto hits = std::count(r.recent.begin(), r.recent.end(), true);
                b.recentPerformance =
                    static_cast<double>(hits) / static_cast<double>(r.recent.size());
            }
        }
        b.authority = clamp01(config.baseline_weight * b.baseline +
                              config.track_record_weight * b.trackRecord +
                              config.recent_weight * b.recentPerformance);
        return b;
    }

    double baselineFor(const UserId& user) const {
        std::lock_guard<std::mutex> lock(baselineMutex);
        auto it = baselines.find(user);
        return it != baselines.end() ? it->second : config.neutral_prior;
    }

    // true when this (feedback, level) pair had not been applied yet
    bool markApplied(const std::string& feedbackId, FeedbackLevel level) {
        std::lock_guard<std::mutex> lock(appliedMutex);
        return applied.emplace(feedbackId, level).second;
    }

    void unmarkApplied(const std::string& feedbackId, FeedbackLevel level) {
        std::lock_guard<std::mutex> lock(appliedMutex);
        applied.erase(std::make_pair(feedbackId, level));
    }

    Result<void> apply(const ValidationOutcome& outcome) {
        if (outcome.userId.empty())
            return Error{ErrorCode::ValidationError, "validation outcome without user id"};
        if (outcome.feedbackId.empty())
            return Error{ErrorCode::ValidationError, "validation outcome without feedback id"};

        for (const auto& [level, confirmed] : outcome.confirmed) {
            if (!markApplied(outcome.feedbackId, level)) {
                spdlog::debug("[Authority] Outcome {}/{} already applied", outcome.feedbackId,
                              levelName(level));
                continue;
            }

            AuthorityKey key{outcome.userId, level, outcome.domain};
            records.insertIfAbsent(key, AuthorityRecord{});
            const bool ok = confirmed;
            const std::size_t window = config.recent_window;
            auto commit = records.update(key, [ok, window](const AuthorityRecord& cur) {
                AuthorityRecord next = cur;
                ++next.validated;
                if (ok)
                    ++next.confirmed;
                next.recent.push_back(ok);
                while (next.recent.size() > window)
                    next.recent.pop_front();
                return std::optional<AuthorityRecord>{std::move(next)};
            });
            if (!commit) {
                unmarkApplied(outcome.feedbackId, level);
                return commit.error();
            }

            const auto& after = commit.value()->after;
            spdlog::debug("[Authority] {} {}/{}: {}/{} confirmed (v{})", outcome.userId,
                          levelName(level), outcome.domain, after.value.confirmed,
                          after.value.validated, after.version);

            PersistHook hook;
            {
                std::lock_guard<std::mutex> lock(hookMutex);
                hook = persistHook;
            }
            if (hook)
                hook(AuthorityRow{key, after.value, after.version});
        }
        return Result<void>();
    }

    void waitIdle() {
        std::unique_lock<std::mutex> lock(pendingMutex);
        pendingCv.wait(lock, [this] { return pending == 0; });
    }

    void finishOne() {
        std::lock_guard<std::mutex> lock(pendingMutex);
        --pending;
        if (pending == 0)
            pendingCv.notify_all();
    }

    AuthorityConfig config;
    core::VersionedStore<AuthorityKey, AuthorityRecord, AuthorityKeyHash> records;

    mutable std::mutex baselineMutex;
    std::unordered_map<UserId, double> baselines;

    std::mutex appliedMutex;
    std::set<std::pair<std::string, FeedbackLevel>> applied;

    std::mutex hookMutex;
    PersistHook persistHook;
    BaselinePersistHook baselineHook;

    mutable std::mutex pendingMutex;
    std::condition_variable pendingCv;
    std::size_t pending = 0;

    boost::asio::thread_pool pool;
};

AuthorityCalculator::AuthorityCalculator(AuthorityConfig config)
    : pImpl(std::make_unique<Impl>(std::move(config))) {}

AuthorityCalculator::~AuthorityCalculator() = default;

double AuthorityCalculator::getAuthority(const UserId& user, FeedbackLevel level,
                                         const std::string& domain) const {
    return pImpl->compute(AuthorityKey{user, level, domain}).authority;
}

AuthorityBreakdown AuthorityCalculator::breakdown(const UserId& user, FeedbackLevel level,
                                                  const std::string& domain) const {
    return pImpl->compute(AuthorityKey{user, level, domain});
}

Result<void> AuthorityCalculator::setBaselineCredential(const UserId& user, double credential) {
    if (user.empty())
        return Error{ErrorCode::InvalidArgument, "baseline credential requires a user id"};
    if (!std::isfinite(credential) || credential < 0.0 || credential > 1.0)
        return Error{ErrorCode::ValidationError, "baseline credential must lie in [0,1]"};
    {
        std::lock_guard<std::mutex> lock(pImpl->baselineMutex);
        pImpl->baselines[user] = credential;
    }
    BaselinePersistHook hook;
    {
        std::lock_guard<std::mutex> lock(pImpl->hookMutex);
        hook = pImpl->baselineHook;
    }
    if (hook)
        hook(user, credential);
    return Result<void>();
}

std::optional<double> AuthorityCalculator::baselineCredential(const UserId& user) const {
    std::lock_guard<std::mutex> lock(pImpl->baselineMutex);
    auto it = pImpl->baselines.find(user);
    if (it == pImpl->baselines.end())
        return std::nullopt;
    return it->second;
}

Result<void> AuthorityCalculator::updateFromFeedback(const ValidationOutcome& outcome) {
    return pImpl->apply(outcome);
}

void AuthorityCalculator::scheduleUpdate(ValidationOutcome outcome) {
    {
        std::lock_guard<std::mutex> lock(pImpl->pendingMutex);
        ++pImpl->pending;
    }
    auto* impl = pImpl.get();
    boost::asio::post(impl->pool, [impl, outcome = std::move(outcome)]() {
        try {
            auto r = impl->apply(outcome);
            if (!r)
                spdlog::warn("[Authority] Deferred update for {} failed: {}", outcome.feedbackId,
                             r.error().message);
        } catch (const std::exception& e) {
            spdlog::error("[Authority] Deferred update for {} threw: {}", outcome.feedbackId,
                          e.what());
        }
        impl->finishOne();
    });
}

void AuthorityCalculator::waitIdle() {
    pImpl->waitIdle();
}

std::size_t AuthorityCalculator::pendingUpdates() const {
    std::lock_guard<std::mutex> lock(pImpl->pendingMutex);
    return pImpl->pending;
}

std::optional<AuthorityRecord> AuthorityCalculator::record(const AuthorityKey& key) const {
    auto v = pImpl->records.get(key);
    if (!v)
        return std::nullopt;
    return v->value;
}

std::vector<AuthorityRow> AuthorityCalculator::allRecords() const {
    std::vector<AuthorityRow> out;
    pImpl->records.forEach([&](const AuthorityKey& k, const core::Versioned<AuthorityRecord>& v) {
        out.push_back(AuthorityRow{k, v.value, v.version});
    });
    std::sort(out.begin(), out.end(), [](const AuthorityRow& a, const AuthorityRow& b) {
        if (a.key.userId != b.key.userId)
            return a.key.userId < b.key.userId;
        if (a.key.level != b.key.level)
            return a.key.level < b.key.level;
        return a.key.domain < b.key.domain;
    });
    return out;
}

void AuthorityCalculator::loadRecord(const AuthorityKey& key, AuthorityRecord record,
                                     std::uint64_t version) {
    while (record.recent.size() > pImpl->config.recent_window)
        record.recent.pop_front();
    pImpl->records.load(key, core::Versioned<AuthorityRecord>{std::move(record), version});
}

void AuthorityCalculator::loadBaseline(const UserId& user, double credential) {
    std::lock_guard<std::mutex> lock(pImpl->baselineMutex);
    pImpl->baselines[user] = clamp01(credential);
}

void AuthorityCalculator::setPersistHook(PersistHook hook) {
    std::lock_guard<std::mutex> lock(pImpl->hookMutex);
    pImpl->persistHook = std::move(hook);
}

void AuthorityCalculator::setBaselinePersistHook(BaselinePersistHook hook) {
    std::lock_guard<std::mutex> lock(pImpl->hookMutex);
    pImpl->baselineHook = std::move(hook);
}

const AuthorityConfig& AuthorityCalculator::config() const {
    return pImpl->config;
}

} // namespace rlcf::learning
