#include <rlcf/learning/consensus.h>

#include <spdlog/spdlog.h>

#include <cmath>
#include <map>

namespace rlcf::learning {

ConsensusTracker::ConsensusTracker(ConsensusConfig config) : config_(config) {}

LevelConsensus ConsensusTracker::aggregate(const std::vector<ConsensusVote>& votes,
                                           FeedbackLevel level, const ConsensusConfig& config) {
    const auto li = levelIndex(level);
    LevelConsensus c;
    double wsum = 0.0;
    double num = 0.0;
    double plain = 0.0;
    for (const auto& v : votes) {
        if (!v.judged[li])
            continue;
        ++c.votes;
        const double a = clamp01(v.authority[li]);
        wsum += a;
        num += a * v.rewards.values[li];
        plain += v.rewards.values[li];
    }
    if (c.votes == 0)
        return c;

    const bool weighted = wsum > 0.0;
    c.mean = weighted ? num / wsum : plain / static_cast<double>(c.votes);

    double var = 0.0;
    for (const auto& v : votes) {
        if (!v.judged[li])
            continue;
        const double d = v.rewards.values[li] - c.mean;
        var += (weighted ? clamp01(v.authority[li]) : 1.0) * d * d;
    }
    c.variance = var / (weighted ? wsum : static_cast<double>(c.votes));
    c.agreement = clamp01(1.0 - 4.0 * c.variance);
    c.controversial = c.agreement < config.controversy_threshold;
    c.strong = c.agreement >= config.agreement_threshold;
    return c;
}

ConsensusUpdate ConsensusTracker::addVote(const std::string& traceId, ConsensusVote vote) {
    ConsensusUpdate update;
    update.traceId = traceId;

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = traces_.find(traceId);
    if (it == traces_.end()) {
        while (traces_.size() >= config_.max_tracked_traces && !order_.empty()) {
            traces_.erase(order_.front());
            order_.pop_front();
        }
        it = traces_.emplace(traceId, TraceVotes{}).first;
        order_.push_back(traceId);
    }
    auto& tv = it->second;
    tv.votes.push_back(std::move(vote));
    for (auto& flags : tv.validated)
        flags.push_back(false);

    // outcomes grouped per vote so each contributor gets one ValidationOutcome
    std::map<std::size_t, ValidationOutcome> byVote;
    for (auto level : kAllLevels) {
        const auto li = levelIndex(level);
        auto c = aggregate(tv.votes, level, config_);
        update.levels[li] = c;
        if (c.votes < config_.min_votes)
            continue;
        if (c.controversial) {
            spdlog::debug("[Consensus] {} {} controversial (agreement {:.3f})", traceId,
                          levelName(level), c.agreement);
            continue;
        }
        for (std::size_t i = 0; i < tv.votes.size(); ++i) {
            const auto& v = tv.votes[i];
            if (!v.judged[li] || tv.validated[li][i])
                continue;
            tv.validated[li][i] = true;
            auto& out = byVote[i];
            out.feedbackId = v.feedbackId;
            out.userId = v.userId;
            out.domain = v.domain;
            out.confirmed[level] = std::abs(v.rewards.values[li] - c.mean) <= config_.tolerance;
        }
    }
    for (auto& [idx, outcome] : byVote)
        update.outcomes.push_back(std::move(outcome));

    if (!update.outcomes.empty())
        spdlog::debug("[Consensus] {}: {} validation outcome(s)", traceId, update.outcomes.size());
    return update;
}

std::optional<std::array<LevelConsensus, kLevelCount>>
ConsensusTracker::consensusFor(const std::string& traceId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = traces_.find(traceId);
    if (it == traces_.end())
        return std::nullopt;
    std::array<LevelConsensus, kLevelCount> out;
    for (auto level : kAllLevels)
        out[levelIndex(level)] = aggregate(it->second.votes, level, config_);
    return out;
}

std::size_t ConsensusTracker::trackedTraces() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return traces_.size();
}

} // namespace rlcf::learning
