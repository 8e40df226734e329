#pragma once

#include <rlcf/core/types.h>
#include <rlcf/learning/authority_calculator.h>
#include <rlcf/weights/weight_schema.h>

#include <array>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rlcf::search {
struct RetrievalTrace;
}

namespace rlcf::learning {

enum class Verdict { Correct, PartiallyCorrect, Incorrect };

const char* verdictName(Verdict v) noexcept;
std::optional<Verdict> parseVerdict(std::string_view name);
double verdictScore(Verdict v) noexcept;

// Missing fields are neutral (0.5), never zero.
struct RetrievalJudgment {
    std::optional<bool> sourcesRelevant;
    std::optional<bool> sourcesComplete;
    std::optional<double> rankingQuality; // [0,1]
};

struct ReasoningJudgment {
    std::map<weights::StrategyId, Verdict> verdicts;
    std::optional<std::vector<weights::StrategyId>> routingCorrections; // should have run
    std::optional<weights::StrategyId> bestStrategy;                   // supervised label
};

// 1..5 Likert ratings
struct SynthesisRatings {
    std::optional<int> accuracy;
    std::optional<int> completeness;
    std::optional<int> clarity;
    std::optional<int> soundness;
};

struct SynthesisJudgment {
    std::optional<bool> answerCorrect;
    SynthesisRatings ratings;
    std::optional<double> rankingCorrect; // [0,1]
};

/**
 * One structured feedback record against a completed retrieval trace.
 *
 * iterationTraceIds lists earlier retrieval iterations of the same query, oldest
 * first; traceId is always the final iteration.
 */
struct FeedbackEvent {
    std::string id;
    std::string traceId;
    std::vector<std::string> iterationTraceIds;
    UserId userId;
    std::string domain;
    TimePoint timestamp{};

    std::optional<RetrievalJudgment> retrieval;
    std::optional<ReasoningJudgment> reasoning;
    std::optional<SynthesisJudgment> synthesis;

    bool judges(FeedbackLevel level) const;
};

// Shape and range checks only; trace existence is checked by the ingestor.
Result<void> validateFeedback(const FeedbackEvent& event);

// Strict JSON boundary: unknown fields and wrong types are ValidationError.
Result<FeedbackEvent> parseFeedbackJson(std::string_view json);

struct RewardWeights {
    double sources_relevant = 0.4;
    double sources_complete = 0.3;
    double ranking_quality = 0.3;
    double strategy_verdict = 0.6;
    double routing_agreement = 0.4;
    double answer = 0.6;
    double ranking_correct = 0.4;
};

struct Rewards {
    std::array<double, kLevelCount> values{0.5, 0.5, 0.5};

    double at(FeedbackLevel level) const { return values[levelIndex(level)]; }
    double& at(FeedbackLevel level) { return values[levelIndex(level)]; }
};

/**
 * Fixed weighted sums of sub-judgments:
 *
 *   R_retrieval = 0.4 relevant + 0.3 complete + 0.3 ranking_quality
 *   R_reasoning = 0.6 gate-weighted verdict + 0.4 routing agreement (Jaccard)
 *   R_synthesis = 0.6 answer + 0.4 ranking_correct
 *
 * The reasoning reward needs the gate distribution and the set of strategies
 * that actually ran, both taken from the final trace.
 */
class RewardDecomposer {
public:
    explicit RewardDecomposer(RewardWeights weights = {}) : weights_(weights) {}

    Rewards decompose(const FeedbackEvent& event, const search::RetrievalTrace* trace) const;

    double retrievalReward(const RetrievalJudgment& j) const;
    double reasoningReward(const ReasoningJudgment& j, const search::RetrievalTrace* trace) const;
    double synthesisReward(const SynthesisJudgment& j) const;

private:
    RewardWeights weights_;
};

} // namespace rlcf::learning
