#pragma once

#include <rlcf/core/types.h>
#include <rlcf/learning/authority_calculator.h>
#include <rlcf/learning/feedback.h>
#include <rlcf/learning/gating_network.h>

#include <array>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rlcf::bridge {
class BridgeIndex;
}

namespace rlcf::search {
struct RetrievalTrace;
}

namespace rlcf::weights {
class ParameterStore;
}

namespace rlcf::learning {

// How reward is split across retrieval iterations of one query.
enum class IterationCredit { Equal, Decayed };

const char* iterationCreditName(IterationCredit c) noexcept;
std::optional<IterationCredit> parseIterationCredit(std::string_view name);

struct LearningConfig {
    double learning_rate = 0.01;
    double baseline_momentum = 0.1; // b <- (1 - m) b + m R
    double clip_gradient = 0.1;     // per-parameter |step| bound
    double min_authority = 0.3;     // below: tracked but parameters untouched
    IterationCredit iteration_credit = IterationCredit::Decayed;
    double iteration_credit_decay = 0.5; // weight ratio between consecutive iterations
    GatingConfig gating;

    bool isValid() const;
};

struct UpdateReport {
    std::array<double, kLevelCount> reward{};
    std::array<double, kLevelCount> baseline{}; // before this event
    std::array<double, kLevelCount> advantage{};
    std::array<double, kLevelCount> authority{};
    std::array<bool, kLevelCount> applied{};
    std::size_t traversalUpdates = 0;
    std::size_t bridgeUpdates = 0;
    std::size_t alphaUpdates = 0;
    bool gatingUpdated = false;
    bool rerankUpdated = false;
    // Keys left unchanged by a hard error (retries exhausted); the rest still applied
    std::size_t failedUpdates = 0;
    std::string lastFailure;
};

/**
 * REINFORCE-style credit assignment from one decomposed feedback event:
 *
 *   delta = lr * authority * (R - baseline) * credit(iteration) * grad log pi
 *
 * with R_retrieval driving traversal, bridge and alpha parameters, R_reasoning
 * the gating network and R_synthesis the rerank weights. Every per-parameter
 * step is clipped to +-clip_gradient; the stores clamp to declared bounds.
 */
class PolicyUpdater {
public:
    PolicyUpdater(std::shared_ptr<weights::ParameterStore> params,
                  std::shared_ptr<bridge::BridgeIndex> bridge, LearningConfig config = {});

    /**
     * traces are in iteration order, the final retrieval last. Levels not judged
     * by the event are left alone (their baseline included).
     *
     * Errors are returned only before anything is committed. A key that fails
     * afterwards is counted in failedUpdates and the remaining keys still apply.
     */
    Result<UpdateReport> apply(const FeedbackEvent& event, const Rewards& rewards,
                               const std::array<double, kLevelCount>& authority,
                               const std::vector<std::shared_ptr<const search::RetrievalTrace>>& traces);

    std::array<double, kLevelCount> baselines() const;
    void loadBaselines(const std::array<double, kLevelCount>& values);

    // Normalized credit per iteration, oldest first; sums to 1.
    static std::vector<double> iterationCredits(std::size_t iterations, IterationCredit policy,
                                                double decay);

    const LearningConfig& config() const { return config_; }

private:
    void updateRetrieval(const FeedbackEvent& event, const search::RetrievalTrace& trace,
                         double scale, UpdateReport& report);
    void updateGating(const FeedbackEvent& event, const search::RetrievalTrace& trace,
                      double advantage, double stepSize, UpdateReport& report);
    void updateRerank(const FeedbackEvent& event, const search::RetrievalTrace& trace,
                      double scale, UpdateReport& report);
    void noteFailure(const FeedbackEvent& event, const std::string& what, const Error& error,
                     UpdateReport& report) const;

    double clip(double v) const;

    std::shared_ptr<weights::ParameterStore> params_;
    std::shared_ptr<bridge::BridgeIndex> bridge_;
    LearningConfig config_;

    mutable std::mutex baselineMutex_;
    std::array<double, kLevelCount> baselines_{0.5, 0.5, 0.5};
};

} // namespace rlcf::learning
