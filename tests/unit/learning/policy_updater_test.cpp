#include <gtest/gtest.h>
#include <rlcf/bridge/bridge_index.h>
#include <rlcf/graph/graph_store.h>
#include <rlcf/learning/policy_updater.h>
#include <rlcf/search/retrieval_engine.h>
#include <rlcf/vector/vector_searcher.h>
#include <rlcf/weights/parameter_store.h>

#include <numeric>

using namespace rlcf;
using namespace rlcf::learning;
using weights::StrategyId;

namespace {

constexpr auto kRet = levelIndex(FeedbackLevel::Retrieval);
constexpr auto kRea = levelIndex(FeedbackLevel::Reasoning);
constexpr auto kSyn = levelIndex(FeedbackLevel::Synthesis);

} // namespace

class PolicyUpdaterTest : public ::testing::Test {
protected:
    void SetUp() override {
        chunks_ = vector::makeInMemoryVectorSearcher();
        graph_ = graph::makeInMemoryGraphStore();
        ASSERT_TRUE(chunks_->addChunk({"c1", {1.0f, 0.0f}, "article"}));
        ASSERT_TRUE(chunks_->addChunk({"c2", {0.6f, 0.8f}, "commentary"}));
        ASSERT_TRUE(graph_->addNode({"art-1", "article"}));
        ASSERT_TRUE(graph_->addNode({"art-2", "article"}));
        ASSERT_TRUE(graph_->addEdge({"art-1", "art-2", "amends"}));

        bridge_ = std::make_shared<bridge::BridgeIndex>(chunks_, graph_);
        bridge::BridgeMapping m;
        m.chunkId = "c2";
        m.nodeId = "art-2";
        m.relationType = "mentions";
        m.weight = 0.5;
        ASSERT_TRUE(bridge_->upsertMapping(m));

        params_ = std::make_shared<weights::ParameterStore>(weights::ParameterStoreConfig{},
                                                            nullptr);
        params_->bootstrapPriors();

        config_.learning_rate = 0.1;
    }

    // Literal strategy ranked c2 through art-1 -amends-> art-2 -mentions-> c2.
    std::shared_ptr<const search::RetrievalTrace> literalTrace() const {
        auto trace = std::make_shared<search::RetrievalTrace>();
        trace->traceId = "tr-1";
        trace->queryEmbedding = {0.6f, 0.8f};
        trace->anchorNodes = {"art-1"};
        trace->gate = {1.0, 0.0, 0.0, 0.0};
        trace->selectedStrategy = StrategyId::Literal;

        search::StrategyResult sr;
        sr.strategy = StrategyId::Literal;
        sr.gateWeight = 1.0;
        sr.alpha = 0.7;
        sr.status = search::StrategyStatus::Ok;

        search::ScoredCandidate c;
        c.chunkId = "c2";
        c.vectorScore = 0.8;
        search::GraphPath path;
        path.anchor = "art-1";
        path.target = "art-2";
        path.steps.push_back(search::PathStep{"art-1", "art-2", "amends", 0.85});
        path.product = 0.85;
        c.graphScore = 0.5 * path.score();
        c.finalScore = 0.7 * c.vectorScore + 0.3 * c.graphScore;
        c.linked = true;
        c.link = search::LinkUsed{"art-2", "mentions", 0.5};
        c.path = path;
        sr.ranked.push_back(c);
        trace->strategies.push_back(sr);

        for (auto s : {StrategyId::Systemic, StrategyId::Principles, StrategyId::Precedent}) {
            search::StrategyResult skipped;
            skipped.strategy = s;
            skipped.status = search::StrategyStatus::Skipped;
            trace->strategies.push_back(skipped);
        }

        search::CombinedCandidate first;
        first.chunkId = "c2";
        first.features = {0.9, 0.2, 0.9};
        search::CombinedCandidate second;
        second.chunkId = "c1";
        second.features = {0.5, 0.9, 0.1};
        trace->combined = {first, second};
        return trace;
    }

    static FeedbackEvent retrievalEvent(const std::string& id, bool relevant) {
        FeedbackEvent ev;
        ev.id = id;
        ev.traceId = "tr-1";
        ev.userId = "alice";
        ev.retrieval = RetrievalJudgment{};
        ev.retrieval->sourcesRelevant = relevant;
        ev.retrieval->sourcesComplete = relevant;
        ev.retrieval->rankingQuality = relevant ? 1.0 : 0.0;
        return ev;
    }

    static Rewards rewardsFor(const FeedbackEvent& ev) { return RewardDecomposer{}.decompose(ev, nullptr); }

    double traversal(StrategyId s, const std::string& relation) const {
        return params_->traversal(s, relation)->value.weight;
    }

    double bridgeWeight() const {
        return bridge_->getMapping({"c2", "art-2", "mentions"})->weight;
    }

    std::shared_ptr<vector::VectorSearcher> chunks_;
    std::shared_ptr<graph::GraphStore> graph_;
    std::shared_ptr<bridge::BridgeIndex> bridge_;
    std::shared_ptr<weights::ParameterStore> params_;
    LearningConfig config_;
};

TEST_F(PolicyUpdaterTest, IterationCreditsAreNormalized) {
    auto decayed = PolicyUpdater::iterationCredits(3, IterationCredit::Decayed, 0.5);
    ASSERT_EQ(decayed.size(), 3u);
    EXPECT_NEAR(decayed[0], 0.25 / 1.75, 1e-12);
    EXPECT_NEAR(decayed[2], 1.0 / 1.75, 1e-12);
    EXPECT_NEAR(std::accumulate(decayed.begin(), decayed.end(), 0.0), 1.0, 1e-12);

    auto equal = PolicyUpdater::iterationCredits(4, IterationCredit::Equal, 0.5);
    for (double c : equal)
        EXPECT_DOUBLE_EQ(c, 0.25);

    EXPECT_TRUE(PolicyUpdater::iterationCredits(0, IterationCredit::Equal, 0.5).empty());
    EXPECT_EQ(parseIterationCredit("decayed"), IterationCredit::Decayed);
    EXPECT_FALSE(parseIterationCredit("geometric").has_value());
}

TEST_F(PolicyUpdaterTest, PositiveAdvantageReinforcesPathAndLink) {
    PolicyUpdater updater(params_, bridge_, config_);
    const double traversalBefore = traversal(StrategyId::Literal, "amends");
    const double bridgeBefore = bridgeWeight();
    const double alphaBefore = params_->alpha(StrategyId::Literal)->value;

    auto ev = retrievalEvent("fb-1", true);
    auto r = updater.apply(ev, rewardsFor(ev), {0.8, 0.8, 0.8}, {literalTrace()});
    ASSERT_TRUE(r) << r.error().message;

    const auto& report = r.value();
    EXPECT_DOUBLE_EQ(report.reward[kRet], 1.0);
    EXPECT_DOUBLE_EQ(report.baseline[kRet], 0.5);
    EXPECT_DOUBLE_EQ(report.advantage[kRet], 0.5);
    EXPECT_TRUE(report.applied[kRet]);
    EXPECT_FALSE(report.applied[kRea]);
    EXPECT_EQ(report.traversalUpdates, 1u);
    EXPECT_EQ(report.bridgeUpdates, 1u);
    EXPECT_EQ(report.alphaUpdates, 1u);

    EXPECT_GT(traversal(StrategyId::Literal, "amends"), traversalBefore);
    EXPECT_GT(bridgeWeight(), bridgeBefore);
    // Vector score dominates this candidate, so alpha moves toward vector
    EXPECT_GT(params_->alpha(StrategyId::Literal)->value, alphaBefore);
    // Strategies that were skipped are untouched
    EXPECT_DOUBLE_EQ(traversal(StrategyId::Systemic, "amends"), 0.90);
}

TEST_F(PolicyUpdaterTest, NegativeAdvantageWeakensPathAndLink) {
    PolicyUpdater updater(params_, bridge_, config_);
    const double traversalBefore = traversal(StrategyId::Literal, "amends");
    const double bridgeBefore = bridgeWeight();

    auto ev = retrievalEvent("fb-2", false);
    auto r = updater.apply(ev, rewardsFor(ev), {0.9, 0.9, 0.9}, {literalTrace()});
    ASSERT_TRUE(r);
    EXPECT_DOUBLE_EQ(r.value().advantage[kRet], -0.5);
    EXPECT_LT(traversal(StrategyId::Literal, "amends"), traversalBefore);
    EXPECT_LT(bridgeWeight(), bridgeBefore);
}

TEST_F(PolicyUpdaterTest, StepsAreClipped) {
    config_.learning_rate = 1000.0;
    PolicyUpdater updater(params_, bridge_, config_);
    const double before = traversal(StrategyId::Literal, "amends");
    auto ev = retrievalEvent("fb-3", false);
    ASSERT_TRUE(updater.apply(ev, rewardsFor(ev), {1.0, 1.0, 1.0}, {literalTrace()}));
    EXPECT_NEAR(traversal(StrategyId::Literal, "amends"), before - 0.1, 1e-12);
    EXPECT_NEAR(bridgeWeight(), 0.4, 1e-12);
}

TEST_F(PolicyUpdaterTest, LowAuthorityOnlyMovesBaseline) {
    PolicyUpdater updater(params_, bridge_, config_);
    const auto genBefore = params_->generation();
    const double bridgeBefore = bridgeWeight();

    auto ev = retrievalEvent("fb-4", true);
    auto r = updater.apply(ev, rewardsFor(ev), {0.2, 0.2, 0.2}, {literalTrace()});
    ASSERT_TRUE(r);
    EXPECT_FALSE(r.value().applied[kRet]);
    EXPECT_EQ(params_->generation(), genBefore);
    EXPECT_DOUBLE_EQ(bridgeWeight(), bridgeBefore);
    EXPECT_NEAR(updater.baselines()[kRet], 0.9 * 0.5 + 0.1 * 1.0, 1e-12);
}

TEST_F(PolicyUpdaterTest, UnjudgedLevelsKeepTheirBaseline) {
    PolicyUpdater updater(params_, bridge_, config_);
    auto ev = retrievalEvent("fb-5", true);
    ASSERT_TRUE(updater.apply(ev, rewardsFor(ev), {0.8, 0.8, 0.8}, {literalTrace()}));
    auto b = updater.baselines();
    EXPECT_DOUBLE_EQ(b[kRea], 0.5);
    EXPECT_DOUBLE_EQ(b[kSyn], 0.5);
    EXPECT_NEAR(b[kRet], 0.55, 1e-12);

    updater.loadBaselines({0.7, 1.4, -1.0});
    b = updater.baselines();
    EXPECT_DOUBLE_EQ(b[kRet], 0.7);
    EXPECT_DOUBLE_EQ(b[kRea], 1.0);
    EXPECT_DOUBLE_EQ(b[kSyn], 0.0);
}

TEST_F(PolicyUpdaterTest, ReasoningFeedbackStepsTheGatingNetwork) {
    PolicyUpdater updater(params_, bridge_, config_);
    FeedbackEvent ev;
    ev.id = "fb-6";
    ev.traceId = "tr-1";
    ev.userId = "alice";
    ev.reasoning = ReasoningJudgment{};
    ev.reasoning->verdicts[StrategyId::Literal] = Verdict::Correct;
    ev.reasoning->bestStrategy = StrategyId::Systemic;

    // Without gating parameters the step is skipped, not an error
    auto skipped = updater.apply(ev, rewardsFor(ev), {0.8, 0.8, 0.8}, {literalTrace()});
    ASSERT_TRUE(skipped) << skipped.error().message;
    EXPECT_FALSE(skipped.value().gatingUpdated);

    ASSERT_TRUE(params_->ensureGating(GatingNetwork::initialize(2, GatingConfig{})));
    auto before = params_->snapshot()->gating;
    ev.id = "fb-7";
    auto r = updater.apply(ev, rewardsFor(ev), {0.8, 0.8, 0.8}, {literalTrace()});
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_TRUE(r.value().applied[kRea]);
    EXPECT_TRUE(r.value().gatingUpdated);
    EXPECT_FALSE(*params_->snapshot()->gating == *before);
}

TEST_F(PolicyUpdaterTest, SynthesisFeedbackMovesRerankWeights) {
    PolicyUpdater updater(params_, bridge_, config_);
    FeedbackEvent ev;
    ev.id = "fb-8";
    ev.traceId = "tr-1";
    ev.userId = "alice";
    ev.synthesis = SynthesisJudgment{};
    ev.synthesis->answerCorrect = true;
    ev.synthesis->rankingCorrect = 1.0;

    auto r = updater.apply(ev, rewardsFor(ev), {0.8, 0.8, 0.8}, {literalTrace()});
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_TRUE(r.value().rerankUpdated);
    const auto w = params_->snapshot()->rerank.weights;
    EXPECT_DOUBLE_EQ(w[0], 1.0);
    EXPECT_DOUBLE_EQ(w[1], 0.0);
    EXPECT_GT(w[2], 0.0);
}

TEST_F(PolicyUpdaterTest, EarlierIterationsReceiveLessCredit) {
    config_.iteration_credit = IterationCredit::Decayed;
    PolicyUpdater updater(params_, bridge_, config_);
    auto ev = retrievalEvent("fb-9", true);

    auto single = std::make_shared<weights::ParameterStore>(weights::ParameterStoreConfig{},
                                                            nullptr);
    single->bootstrapPriors();
    PolicyUpdater reference(single, bridge_, config_);

    const double before = traversal(StrategyId::Literal, "amends");
    ASSERT_TRUE(updater.apply(ev, rewardsFor(ev), {0.8, 0.8, 0.8},
                              {literalTrace(), literalTrace()}));
    ASSERT_TRUE(reference.apply(ev, rewardsFor(ev), {0.8, 0.8, 0.8}, {literalTrace()}));

    // Two iterations with credits 1/3 and 2/3 move the weight as far as one full step
    EXPECT_NEAR(traversal(StrategyId::Literal, "amends") - before,
                single->traversal(StrategyId::Literal, "amends")->value.weight - before, 1e-9);
}

TEST_F(PolicyUpdaterTest, RequiresTraces) {
    PolicyUpdater updater(params_, bridge_, config_);
    auto ev = retrievalEvent("fb-10", true);
    auto none = updater.apply(ev, rewardsFor(ev), {0.8, 0.8, 0.8}, {});
    ASSERT_FALSE(none);
    EXPECT_EQ(none.error().code, ErrorCode::InvalidArgument);

    auto null = updater.apply(ev, rewardsFor(ev), {0.8, 0.8, 0.8}, {nullptr});
    ASSERT_FALSE(null);
    EXPECT_EQ(null.error().code, ErrorCode::InvalidArgument);
}

TEST_F(PolicyUpdaterTest, ExhaustedRetriesOnOneKeyReportPartialUpdate) {
    core::RetryPolicy giveUp;
    giveUp.maxAttempts = 0; // every bridge commit reports ConcurrencyConflict at once
    bridge_->setRetryPolicy(giveUp);
    PolicyUpdater updater(params_, bridge_, config_);
    const double traversalBefore = traversal(StrategyId::Literal, "amends");

    auto ev = retrievalEvent("fb-1", true);
    auto r = updater.apply(ev, rewardsFor(ev), {0.8, 0.8, 0.8}, {literalTrace()});
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_EQ(r.value().failedUpdates, 1u);
    EXPECT_NE(r.value().lastFailure.find("bridge/c2"), std::string::npos);
    EXPECT_EQ(r.value().bridgeUpdates, 0u);
    EXPECT_EQ(r.value().traversalUpdates, 1u);
    EXPECT_GT(traversal(StrategyId::Literal, "amends"), traversalBefore);
    EXPECT_DOUBLE_EQ(bridgeWeight(), 0.5);
    EXPECT_EQ(r.value().alphaUpdates, 1u);
}
