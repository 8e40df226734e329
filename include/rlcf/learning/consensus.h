#pragma once

#include <rlcf/learning/authority_calculator.h>
#include <rlcf/learning/feedback.h>

#include <array>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace rlcf::learning {

struct ConsensusConfig {
    std::size_t min_votes = 3;           // events per trace before consensus forms
    double tolerance = 0.25;             // |reward - mean| within this => confirmed
    double agreement_threshold = 0.8;    // agreement at or above => strong consensus
    double controversy_threshold = 0.3;  // agreement below => no outcomes issued
    std::size_t max_tracked_traces = 10'000;

    bool isValid() const {
        return min_votes > 0 && tolerance >= 0.0 && controversy_threshold >= 0.0 &&
               controversy_threshold <= agreement_threshold && agreement_threshold <= 1.0 &&
               max_tracked_traces > 0;
    }
};

struct ConsensusVote {
    std::string feedbackId;
    UserId userId;
    std::string domain;
    Rewards rewards;
    std::array<double, kLevelCount> authority{};
    std::array<bool, kLevelCount> judged{};
};

struct LevelConsensus {
    std::size_t votes = 0;
    double mean = 0.5;
    double variance = 0.0;
    double agreement = 1.0; // 1 - 4 * variance, in [0,1]
    bool controversial = false;
    bool strong = false;
};

struct ConsensusUpdate {
    std::string traceId;
    std::array<LevelConsensus, kLevelCount> levels;
    std::vector<ValidationOutcome> outcomes;
};

/**
 * Groups feedback by trace and validates each contributor against the
 * authority-weighted consensus once enough votes exist. The first time a level
 * reaches min_votes, every earlier vote is validated; later votes are validated
 * as they arrive. Each vote is validated at most once per level.
 */
class ConsensusTracker {
public:
    explicit ConsensusTracker(ConsensusConfig config = {});

    // Outcomes are empty until consensus exists for at least one level.
    ConsensusUpdate addVote(const std::string& traceId, ConsensusVote vote);

    std::optional<std::array<LevelConsensus, kLevelCount>>
    consensusFor(const std::string& traceId) const;

    std::size_t trackedTraces() const;

    // Authority-weighted mean and variance of the judged votes at one level.
    static LevelConsensus aggregate(const std::vector<ConsensusVote>& votes, FeedbackLevel level,
                                    const ConsensusConfig& config);

private:
    struct TraceVotes {
        std::vector<ConsensusVote> votes;
        std::array<std::vector<bool>, kLevelCount> validated; // parallel to votes
    };

    ConsensusConfig config_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, TraceVotes> traces_;
    std::deque<std::string> order_; // insertion order for eviction
};

} // namespace rlcf::learning
