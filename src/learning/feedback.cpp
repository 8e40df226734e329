#include <rlcf/learning/feedback.h>
#include <rlcf/search/retrieval_engine.h>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cmath>
#include <initializer_list>
#include <set>
#include <stdexcept>

namespace rlcf::learning {

using nlohmann::json;
using weights::StrategyId;

const char* verdictName(Verdict v) noexcept {
    switch (v) {
        case Verdict::Correct:
            return "correct";
        case Verdict::PartiallyCorrect:
            return "partially_correct";
        case Verdict::Incorrect:
            return "incorrect";
    }
    return "unknown";
}

std::optional<Verdict> parseVerdict(std::string_view name) {
    for (auto v : {Verdict::Correct, Verdict::PartiallyCorrect, Verdict::Incorrect}) {
        if (name == verdictName(v))
            return v;
    }
    return std::nullopt;
}

double verdictScore(Verdict v) noexcept {
    switch (v) {
        case Verdict::Correct:
            return 1.0;
        case Verdict::PartiallyCorrect:
            return 0.5;
        case Verdict::Incorrect:
            return 0.0;
    }
    return 0.5;
}

bool FeedbackEvent::judges(FeedbackLevel level) const {
    switch (level) {
        case FeedbackLevel::Retrieval:
            return retrieval.has_value();
        case FeedbackLevel::Reasoning:
            return reasoning.has_value();
        case FeedbackLevel::Synthesis:
            return synthesis.has_value();
    }
    return false;
}

namespace {

bool inUnitRange(double v) {
    return std::isfinite(v) && v >= 0.0 && v <= 1.0;
}

Result<void> checkRating(const std::optional<int>& r, const char* name) {
    if (r && (*r < 1 || *r > 5))
        return Error{ErrorCode::ValidationError,
                     std::string("rating '") + name + "' must be between 1 and 5"};
    return Result<void>();
}

double boolScore(const std::optional<bool>& b) {
    if (!b)
        return 0.5;
    return *b ? 1.0 : 0.0;
}

} // namespace

Result<void> validateFeedback(const FeedbackEvent& event) {
    if (event.id.empty())
        return Error{ErrorCode::ValidationError, "feedback id is empty"};
    if (event.traceId.empty())
        return Error{ErrorCode::ValidationError, "feedback " + event.id + " has no trace id"};
    if (event.userId.empty())
        return Error{ErrorCode::ValidationError, "feedback " + event.id + " has no user id"};
    for (const auto& t : event.iterationTraceIds) {
        if (t.empty())
            return Error{ErrorCode::ValidationError, "empty iteration trace id"};
        if (t == event.traceId)
            return Error{ErrorCode::ValidationError,
                         "iteration trace ids must not repeat the final trace id"};
    }

    if (event.retrieval) {
        const auto& r = *event.retrieval;
        if (r.rankingQuality && !inUnitRange(*r.rankingQuality))
            return Error{ErrorCode::ValidationError, "ranking_quality must lie in [0,1]"};
    }
    if (event.synthesis) {
        const auto& s = *event.synthesis;
        if (s.rankingCorrect && !inUnitRange(*s.rankingCorrect))
            return Error{ErrorCode::ValidationError, "ranking_correct must lie in [0,1]"};
        for (auto [value, name] :
             {std::pair{&s.ratings.accuracy, "accuracy"},
              std::pair{&s.ratings.completeness, "completeness"},
              std::pair{&s.ratings.clarity, "clarity"},
              std::pair{&s.ratings.soundness, "soundness"}}) {
            if (auto ok = checkRating(*value, name); !ok)
                return ok;
        }
    }
    return Result<void>();
}

namespace {

void requireObject(const json& j, const char* where) {
    if (!j.is_object())
        throw std::invalid_argument(std::string(where) + " must be an object");
}

void rejectUnknown(const json& j, std::initializer_list<std::string_view> allowed,
                   const char* where) {
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (std::find(allowed.begin(), allowed.end(), it.key()) == allowed.end())
            throw std::invalid_argument("unknown field '" + it.key() + "' in " + where);
    }
}

StrategyId strategyFrom(const json& j) {
    const auto name = j.get<std::string>();
    auto s = weights::parseStrategy(name);
    if (!s)
        throw std::invalid_argument("unknown strategy '" + name + "'");
    return *s;
}

template <typename T> std::optional<T> optionalField(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null())
        return std::nullopt;
    return it->template get<T>();
}

std::optional<double> optionalNumber(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null())
        return std::nullopt;
    if (!it->is_number())
        throw std::invalid_argument(std::string("field '") + key + "' must be a number");
    return it->get<double>();
}

std::optional<bool> optionalBool(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null())
        return std::nullopt;
    if (!it->is_boolean())
        throw std::invalid_argument(std::string("field '") + key + "' must be a boolean");
    return it->get<bool>();
}

std::optional<int> optionalRating(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null())
        return std::nullopt;
    if (!it->is_number_integer())
        throw std::invalid_argument(std::string("rating '") + key + "' must be an integer");
    return it->get<int>();
}

} // namespace

Result<FeedbackEvent> parseFeedbackJson(std::string_view text) {
    FeedbackEvent ev;
    try {
        auto j = json::parse(text);
        requireObject(j, "feedback");
        rejectUnknown(j,
                      {"id", "trace_id", "iteration_trace_ids", "user_id", "domain",
                       "timestamp_ms", "retrieval", "reasoning", "synthesis"},
                      "feedback");

        ev.id = j.at("id").get<std::string>();
        ev.traceId = j.at("trace_id").get<std::string>();
        ev.userId = j.at("user_id").get<std::string>();
        ev.domain = optionalField<std::string>(j, "domain").value_or("");
        if (auto it = j.find("iteration_trace_ids"); it != j.end())
            ev.iterationTraceIds = it->get<std::vector<std::string>>();
        if (auto ts = optionalField<std::int64_t>(j, "timestamp_ms"))
            ev.timestamp = TimePoint(std::chrono::milliseconds(*ts));

        if (auto it = j.find("retrieval"); it != j.end() && !it->is_null()) {
            requireObject(*it, "retrieval");
            rejectUnknown(*it, {"sources_relevant", "sources_complete", "ranking_quality"},
                          "retrieval");
            RetrievalJudgment r;
            r.sourcesRelevant = optionalBool(*it, "sources_relevant");
            r.sourcesComplete = optionalBool(*it, "sources_complete");
            r.rankingQuality = optionalNumber(*it, "ranking_quality");
            ev.retrieval = r;
        }

        if (auto it = j.find("reasoning"); it != j.end() && !it->is_null()) {
            requireObject(*it, "reasoning");
            rejectUnknown(*it, {"verdicts", "routing_corrections", "best_strategy"}, "reasoning");
            ReasoningJudgment r;
            if (auto v = it->find("verdicts"); v != it->end()) {
                requireObject(*v, "verdicts");
                for (auto e = v->begin(); e != v->end(); ++e) {
                    auto s = weights::parseStrategy(e.key());
                    if (!s)
                        throw std::invalid_argument("unknown strategy '" + e.key() + "'");
                    auto verdict = parseVerdict(e.value().get<std::string>());
                    if (!verdict)
                        throw std::invalid_argument("unknown verdict for '" + e.key() + "'");
                    r.verdicts[*s] = *verdict;
                }
            }
            if (auto rc = it->find("routing_corrections"); rc != it->end() && !rc->is_null()) {
                std::vector<StrategyId> corrections;
                for (const auto& s : *rc)
                    corrections.push_back(strategyFrom(s));
                r.routingCorrections = std::move(corrections);
            }
            if (auto b = it->find("best_strategy"); b != it->end() && !b->is_null())
                r.bestStrategy = strategyFrom(*b);
            ev.reasoning = std::move(r);
        }

        if (auto it = j.find("synthesis"); it != j.end() && !it->is_null()) {
            requireObject(*it, "synthesis");
            rejectUnknown(*it, {"answer_correct", "ratings", "ranking_correct"}, "synthesis");
            SynthesisJudgment s;
            s.answerCorrect = optionalBool(*it, "answer_correct");
            s.rankingCorrect = optionalNumber(*it, "ranking_correct");
            if (auto r = it->find("ratings"); r != it->end() && !r->is_null()) {
                requireObject(*r, "ratings");
                rejectUnknown(*r, {"accuracy", "completeness", "clarity", "soundness"},
                              "ratings");
                s.ratings.accuracy = optionalRating(*r, "accuracy");
                s.ratings.completeness = optionalRating(*r, "completeness");
                s.ratings.clarity = optionalRating(*r, "clarity");
                s.ratings.soundness = optionalRating(*r, "soundness");
            }
            ev.synthesis = s;
        }
    } catch (const json::exception& e) {
        return Error{ErrorCode::ValidationError, std::string("malformed feedback: ") + e.what()};
    } catch (const std::invalid_argument& e) {
        return Error{ErrorCode::ValidationError, std::string("malformed feedback: ") + e.what()};
    }

    if (auto ok = validateFeedback(ev); !ok)
        return ok.error();
    return ev;
}

Rewards RewardDecomposer::decompose(const FeedbackEvent& event,
                                    const search::RetrievalTrace* trace) const {
    Rewards r;
    if (event.retrieval)
        r.at(FeedbackLevel::Retrieval) = retrievalReward(*event.retrieval);
    if (event.reasoning)
        r.at(FeedbackLevel::Reasoning) = reasoningReward(*event.reasoning, trace);
    if (event.synthesis)
        r.at(FeedbackLevel::Synthesis) = synthesisReward(*event.synthesis);
    return r;
}

double RewardDecomposer::retrievalReward(const RetrievalJudgment& j) const {
    const double ranking = j.rankingQuality ? clamp01(*j.rankingQuality) : 0.5;
    return clamp01(weights_.sources_relevant * boolScore(j.sourcesRelevant) +
                   weights_.sources_complete * boolScore(j.sourcesComplete) +
                   weights_.ranking_quality * ranking);
}

double RewardDecomposer::reasoningReward(const ReasoningJudgment& j,
                                         const search::RetrievalTrace* trace) const {
    const auto gate = trace ? trace->gate : uniformDistribution();

    double verdict = 0.5;
    if (!j.verdicts.empty()) {
        double num = 0.0;
        double den = 0.0;
        double plain = 0.0;
        for (const auto& [s, v] : j.verdicts) {
            const double g = gate[weights::strategyIndex(s)];
            num += g * verdictScore(v);
            den += g;
            plain += verdictScore(v);
        }
        verdict = den > 0.0 ? num / den : plain / static_cast<double>(j.verdicts.size());
    }

    double routing = 0.5;
    if (j.routingCorrections) {
        std::set<StrategyId> activated;
        if (trace) {
            for (const auto& sr : trace->strategies) {
                if (sr.status != search::StrategyStatus::Skipped)
                    activated.insert(sr.strategy);
            }
        }
        const std::set<StrategyId> expected(j.routingCorrections->begin(),
                                            j.routingCorrections->end());
        std::size_t both = 0;
        for (auto s : activated)
            both += expected.count(s);
        const std::size_t either = activated.size() + expected.size() - both;
        routing = either == 0 ? 1.0 : static_cast<double>(both) / static_cast<double>(either);
    }

    return clamp01(weights_.strategy_verdict * verdict + weights_.routing_agreement * routing);
}

double RewardDecomposer::synthesisReward(const SynthesisJudgment& j) const {
    double answer = 0.5;
    if (j.answerCorrect) {
        answer = *j.answerCorrect ? 1.0 : 0.0;
    } else {
        double sum = 0.0;
        int n = 0;
        for (const auto* r : {&j.ratings.accuracy, &j.ratings.completeness, &j.ratings.clarity,
                              &j.ratings.soundness}) {
            if (*r) {
                sum += (static_cast<double>(**r) - 1.0) / 4.0;
                ++n;
            }
        }
        if (n > 0)
            answer = sum / n;
    }
    const double ranking = j.rankingCorrect ? clamp01(*j.rankingCorrect) : 0.5;
    return clamp01(weights_.answer * answer + weights_.ranking_correct * ranking);
}

} // namespace rlcf::learning
