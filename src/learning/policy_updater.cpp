#include <rlcf/bridge/bridge_index.h>
#include <rlcf/learning/policy_updater.h>
#include <rlcf/search/retrieval_engine.h>
#include <rlcf/weights/parameter_store.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <map>
#include <tuple>

namespace rlcf::learning {

using weights::StrategyId;

namespace {

constexpr double kMinWeight = 1e-9;

// NotFound on an individual key means the key is no longer updatable (relation
// not declared, mapping removed); the rest of the update still applies.
bool skippable(const Error& e) {
    return e.code == ErrorCode::NotFound;
}

} // namespace

const char* iterationCreditName(IterationCredit c) noexcept {
    switch (c) {
        case IterationCredit::Equal:
            return "equal";
        case IterationCredit::Decayed:
            return "decayed";
    }
    return "unknown";
}

std::optional<IterationCredit> parseIterationCredit(std::string_view name) {
    if (name == "equal")
        return IterationCredit::Equal;
    if (name == "decayed")
        return IterationCredit::Decayed;
    return std::nullopt;
}

bool LearningConfig::isValid() const {
    return std::isfinite(learning_rate) && learning_rate >= 0.0 && baseline_momentum >= 0.0 &&
           baseline_momentum <= 1.0 && clip_gradient > 0.0 && min_authority >= 0.0 &&
           min_authority <= 1.0 && iteration_credit_decay > 0.0 &&
           iteration_credit_decay <= 1.0 && gating.isValid();
}

PolicyUpdater::PolicyUpdater(std::shared_ptr<weights::ParameterStore> params,
                             std::shared_ptr<bridge::BridgeIndex> bridge, LearningConfig config)
    : params_(std::move(params)), bridge_(std::move(bridge)), config_(config) {}

std::vector<double> PolicyUpdater::iterationCredits(std::size_t iterations,
                                                    IterationCredit policy, double decay) {
    std::vector<double> credits(iterations, 1.0);
    if (iterations == 0)
        return credits;
    if (policy == IterationCredit::Decayed) {
        // final iteration weighs 1, each earlier one decay times the next
        double w = 1.0;
        for (std::size_t i = iterations; i-- > 0;) {
            credits[i] = w;
            w *= decay;
        }
    }
    double sum = 0.0;
    for (double c : credits)
        sum += c;
    for (double& c : credits)
        c /= sum;
    return credits;
}

std::array<double, kLevelCount> PolicyUpdater::baselines() const {
    std::lock_guard<std::mutex> lock(baselineMutex_);
    return baselines_;
}

void PolicyUpdater::loadBaselines(const std::array<double, kLevelCount>& values) {
    std::lock_guard<std::mutex> lock(baselineMutex_);
    for (std::size_t i = 0; i < kLevelCount; ++i)
        baselines_[i] = clamp01(values[i]);
}

double PolicyUpdater::clip(double v) const {
    if (!std::isfinite(v))
        return 0.0;
    return std::clamp(v, -config_.clip_gradient, config_.clip_gradient);
}

Result<UpdateReport>
PolicyUpdater::apply(const FeedbackEvent& event, const Rewards& rewards,
                     const std::array<double, kLevelCount>& authority,
                     const std::vector<std::shared_ptr<const search::RetrievalTrace>>& traces) {
    if (traces.empty())
        return Error{ErrorCode::InvalidArgument, "policy update without a retrieval trace"};
    for (const auto& t : traces) {
        if (!t)
            return Error{ErrorCode::InvalidArgument, "null retrieval trace"};
    }

    UpdateReport report;
    report.reward = rewards.values;
    report.authority = authority;
    {
        std::lock_guard<std::mutex> lock(baselineMutex_);
        report.baseline = baselines_;
        for (auto level : kAllLevels) {
            const auto li = levelIndex(level);
            if (!event.judges(level))
                continue;
            report.advantage[li] = rewards.values[li] - baselines_[li];
            baselines_[li] = (1.0 - config_.baseline_momentum) * baselines_[li] +
                             config_.baseline_momentum * rewards.values[li];
        }
    }

    for (auto level : kAllLevels) {
        const auto li = levelIndex(level);
        report.applied[li] = event.judges(level) && authority[li] >= config_.min_authority;
        if (event.judges(level) && !report.applied[li])
            spdlog::debug("[PolicyUpdater] {} {}: authority {:.3f} below {:.3f}, parameters kept",
                          event.id, levelName(level), authority[li], config_.min_authority);
    }

    const auto credits =
        iterationCredits(traces.size(), config_.iteration_credit, config_.iteration_credit_decay);
    const double lr = config_.learning_rate;

    for (std::size_t i = 0; i < traces.size(); ++i) {
        const auto& trace = *traces[i];
        const double credit = credits[i];

        const auto ret = levelIndex(FeedbackLevel::Retrieval);
        if (report.applied[ret] && report.advantage[ret] != 0.0)
            updateRetrieval(event, trace, lr * authority[ret] * report.advantage[ret] * credit,
                            report);

        const auto rea = levelIndex(FeedbackLevel::Reasoning);
        if (report.applied[rea])
            updateGating(event, trace, report.advantage[rea], lr * authority[rea] * credit,
                         report);

        const auto syn = levelIndex(FeedbackLevel::Synthesis);
        if (report.applied[syn] && report.advantage[syn] != 0.0)
            updateRerank(event, trace, lr * authority[syn] * report.advantage[syn] * credit,
                         report);
    }

    spdlog::debug("[PolicyUpdater] {}: adv=({:.3f},{:.3f},{:.3f}) traversal={} bridge={} "
                  "alpha={} gating={} rerank={}",
                  event.id, report.advantage[0], report.advantage[1], report.advantage[2],
                  report.traversalUpdates, report.bridgeUpdates, report.alphaUpdates,
                  report.gatingUpdated, report.rerankUpdated);
    return report;
}

void PolicyUpdater::noteFailure(const FeedbackEvent& event, const std::string& what,
                                const Error& error, UpdateReport& report) const {
    ++report.failedUpdates;
    report.lastFailure = what + ": " + error.message;
    spdlog::warn("[PolicyUpdater] {}: {} not updated: {}", event.id, what, error.message);
}

void PolicyUpdater::updateRetrieval(const FeedbackEvent& event,
                                    const search::RetrievalTrace& trace, double scale,
                                    UpdateReport& report) {
    std::map<std::pair<StrategyId, std::string>, double> traversalGrad;
    std::map<std::tuple<ChunkId, NodeId, std::string>, double> bridgeGrad;
    std::map<StrategyId, double> alphaGrad;

    for (const auto& sr : trace.strategies) {
        if (sr.status != search::StrategyStatus::Ok || sr.ranked.empty())
            continue;
        const double gate = sr.gateWeight;
        const double n = static_cast<double>(sr.ranked.size());
        double dAlpha = 0.0;

        for (const auto& c : sr.ranked) {
            if (!(c.finalScore > 0.0))
                continue;
            // d log(final) / d alpha
            dAlpha += (c.vectorScore - c.graphScore) / c.finalScore;

            if (!c.link || !c.path || !(c.graphScore > 0.0))
                continue;
            // share of the final score contributed by the graph term
            const double share = (1.0 - sr.alpha) * c.graphScore / c.finalScore;
            if (c.link->weight > kMinWeight)
                bridgeGrad[{c.chunkId, c.link->nodeId, c.link->relationType}] +=
                    gate * share / c.link->weight / n;
            for (const auto& step : c.path->steps) {
                if (step.weight > kMinWeight)
                    traversalGrad[{sr.strategy, step.relation}] += gate * share / step.weight / n;
            }
        }
        alphaGrad[sr.strategy] += gate * dAlpha / n;
    }

    for (const auto& [key, g] : traversalGrad) {
        const double delta = clip(scale * g);
        if (delta == 0.0)
            continue;
        auto r = params_->adjustTraversal(key.first, key.second, delta, event.id);
        if (!r) {
            if (!skippable(r.error()))
                noteFailure(event,
                            weights::ParameterRef::traversal(key.first, key.second).describe(),
                            r.error(), report);
            continue;
        }
        if (r.value().changed)
            ++report.traversalUpdates;
    }

    for (const auto& [key, g] : bridgeGrad) {
        const double delta = clip(scale * g);
        if (delta == 0.0)
            continue;
        bridge::MappingKey mk{std::get<0>(key), std::get<1>(key), std::get<2>(key)};
        auto r = bridge_->updateWeight(mk, delta, event.id);
        if (!r) {
            if (!skippable(r.error()))
                noteFailure(event,
                            weights::ParameterRef::bridge(mk.chunkId, mk.nodeId, mk.relationType)
                                .describe(),
                            r.error(), report);
            continue;
        }
        if (r.value().changed)
            ++report.bridgeUpdates;
    }

    for (const auto& [s, g] : alphaGrad) {
        const double delta = clip(scale * g);
        if (delta == 0.0)
            continue;
        auto r = params_->adjustAlpha(s, delta, event.id);
        if (!r) {
            noteFailure(event, weights::ParameterRef::alpha(s).describe(), r.error(), report);
            continue;
        }
        if (r.value().changed)
            ++report.alphaUpdates;
    }
}

void PolicyUpdater::updateGating(const FeedbackEvent& event,
                                 const search::RetrievalTrace& trace, double advantage,
                                 double stepSize, UpdateReport& report) {
    // objective gradient wrt logits: advantage * (onehot(selected) - p), plus the
    // cross-entropy term toward a supervised best-strategy label when given
    GateDistribution dLogits{};
    const auto policy =
        GatingNetwork::logProbGradient(trace.gate, weights::strategyIndex(trace.selectedStrategy));
    bool any = false;
    for (std::size_t k = 0; k < dLogits.size(); ++k) {
        dLogits[k] = advantage * policy[k];
        any = any || dLogits[k] != 0.0;
    }
    if (event.reasoning && event.reasoning->bestStrategy) {
        const auto target = GatingNetwork::logProbGradient(
            trace.gate, weights::strategyIndex(*event.reasoning->bestStrategy));
        for (std::size_t k = 0; k < dLogits.size(); ++k)
            dLogits[k] += target[k];
        any = true;
    }
    if (!any || stepSize == 0.0)
        return;

    std::optional<Error> stepError;
    auto r = params_->updateGating(
        [&](const weights::GatingParameters& cur) -> std::optional<weights::GatingParameters> {
            GatingNetwork net(std::make_shared<const weights::GatingParameters>(cur));
            auto next = net.step(trace.queryEmbedding, dLogits, stepSize, config_.clip_gradient,
                                 config_.gating.param_bound);
            if (!next) {
                stepError = next.error();
                return std::nullopt;
            }
            stepError.reset();
            return std::move(next).value();
        },
        event.id);
    if (!r) {
        if (skippable(r.error()))
            spdlog::debug("[PolicyUpdater] {}: gating not initialised, skipped", event.id);
        else
            noteFailure(event, "gating", r.error(), report);
        return;
    }
    if (stepError) {
        spdlog::warn("[PolicyUpdater] {}: gating step rejected: {}", event.id,
                     stepError->message);
        return;
    }
    report.gatingUpdated = report.gatingUpdated || r.value();
}

void PolicyUpdater::updateRerank(const FeedbackEvent& event,
                                 const search::RetrievalTrace& trace, double scale,
                                 UpdateReport& report) {
    const auto& list = trace.combined;
    if (list.size() < 2)
        return;

    auto r = params_->updateRerank(
        [&](const weights::RerankParameters& cur) -> std::optional<weights::RerankParameters> {
            // Plackett-Luce: d log P(order) = sum_i (phi_i - E_{j >= i}[phi_j])
            std::vector<double> scores(list.size());
            for (std::size_t i = 0; i < list.size(); ++i) {
                double s = 0.0;
                for (std::size_t f = 0; f < weights::kRerankFeatureCount; ++f)
                    s += cur.weights[f] * list[i].features[f];
                scores[i] = s;
            }
            std::array<double, weights::kRerankFeatureCount> grad{};
            for (std::size_t i = 0; i + 1 < list.size(); ++i) {
                const double maxS = *std::max_element(scores.begin() + static_cast<long>(i),
                                                      scores.end());
                double z = 0.0;
                std::array<double, weights::kRerankFeatureCount> expected{};
                for (std::size_t j = i; j < list.size(); ++j) {
                    const double e = std::exp(scores[j] - maxS);
                    z += e;
                    for (std::size_t f = 0; f < weights::kRerankFeatureCount; ++f)
                        expected[f] += e * list[j].features[f];
                }
                for (std::size_t f = 0; f < weights::kRerankFeatureCount; ++f)
                    grad[f] += list[i].features[f] - expected[f] / z;
            }
            weights::RerankParameters next = cur;
            const double n = static_cast<double>(list.size());
            for (std::size_t f = 0; f < weights::kRerankFeatureCount; ++f)
                next.weights[f] = clamp01(cur.weights[f] + clip(scale * grad[f] / n));
            if (next.weights == cur.weights)
                return std::nullopt;
            return next;
        },
        event.id);
    if (!r) {
        noteFailure(event, "rerank", r.error(), report);
        return;
    }
    report.rerankUpdated = report.rerankUpdated || r.value();
}

} // namespace rlcf::learning
