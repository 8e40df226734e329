#include <gtest/gtest.h>
#include <rlcf/graph/graph_store.h>
#include <rlcf/search/graph_scorer.h>

#include <atomic>
#include <map>

using namespace rlcf;
using namespace rlcf::search;

namespace {

RelationWeightFn weights(std::map<std::string, double> table) {
    return [table = std::move(table)](const std::string& rel) -> std::optional<double> {
        auto it = table.find(rel);
        if (it == table.end())
            return std::nullopt;
        return it->second;
    };
}

} // namespace

class GraphScorerTest : public ::testing::Test {
protected:
    void SetUp() override {
        graph_ = graph::makeInMemoryGraphStore();
        for (const char* id : {"a", "b", "c", "d", "e", "x", "z"})
            ASSERT_TRUE(graph_->addNode({id, "article"}));
    }

    void edge(const std::string& from, const std::string& to, const std::string& rel) {
        ASSERT_TRUE(graph_->addEdge({from, to, rel}));
    }

    GraphScoringConfig config(std::size_t hops = 3, bool incoming = true) {
        GraphScoringConfig c;
        c.max_hops = hops;
        c.follow_incoming_edges = incoming;
        return c;
    }

    std::shared_ptr<graph::GraphStore> graph_;
};

TEST_F(GraphScorerTest, AnchorScoresOneAtHopZero) {
    GraphTraversalScorer scorer(graph_, config());
    auto r = scorer.scoreFrom({"a"}, weights({}));
    ASSERT_TRUE(r);
    ASSERT_EQ(r.value().best.count("a"), 1u);
    EXPECT_DOUBLE_EQ(r.value().best.at("a").score(), 1.0);
    EXPECT_EQ(r.value().best.at("a").hops(), 0u);
}

TEST_F(GraphScorerTest, ScoreIsProductOverOnePlusHops) {
    edge("a", "b", "amends");
    edge("b", "c", "repeals");
    GraphTraversalScorer scorer(graph_, config());

    auto r = scorer.scoreFrom({"a"}, weights({{"amends", 0.8}, {"repeals", 0.5}}));
    ASSERT_TRUE(r);
    EXPECT_NEAR(r.value().best.at("b").score(), 0.8 / 2.0, 1e-12);
    EXPECT_NEAR(r.value().best.at("c").score(), 0.8 * 0.5 / 3.0, 1e-12);
    ASSERT_EQ(r.value().best.at("c").steps.size(), 2u);
    EXPECT_EQ(r.value().best.at("c").steps[1].relation, "repeals");
}

TEST_F(GraphScorerTest, HopLimitIsRespected) {
    edge("a", "b", "contains");
    edge("b", "c", "contains");
    edge("c", "d", "contains");
    edge("d", "e", "contains");
    GraphTraversalScorer scorer(graph_, config(3));

    auto r = scorer.scoreFrom({"a"}, weights({{"contains", 1.0}}));
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value().best.count("d"), 1u);
    EXPECT_EQ(r.value().best.count("e"), 0u);

    auto score = scorer.scoreNode({"a"}, "e", weights({{"contains", 1.0}}));
    ASSERT_TRUE(score);
    EXPECT_DOUBLE_EQ(score.value(), 0.0);
}

TEST_F(GraphScorerTest, UntraversedRelationsAreSkipped) {
    edge("a", "b", "cites");
    GraphTraversalScorer scorer(graph_, config());
    auto r = scorer.scoreFrom({"a"}, weights({{"amends", 1.0}}));
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value().best.count("b"), 0u);
}

TEST_F(GraphScorerTest, IncomingEdgesFollowConfig) {
    edge("b", "a", "amends");
    auto w = weights({{"amends", 1.0}});

    GraphTraversalScorer both(graph_, config(3, true));
    auto r1 = both.scoreFrom({"a"}, w);
    ASSERT_TRUE(r1);
    EXPECT_EQ(r1.value().best.count("b"), 1u);

    GraphTraversalScorer outOnly(graph_, config(3, false));
    auto r2 = outOnly.scoreFrom({"a"}, w);
    ASSERT_TRUE(r2);
    EXPECT_EQ(r2.value().best.count("b"), 0u);
}

TEST_F(GraphScorerTest, EqualScoresPreferFewerHops) {
    edge("a", "x", "direct");
    edge("a", "b", "first");
    edge("b", "x", "second");
    GraphTraversalScorer scorer(graph_, config());

    // 0.6 / 2 == 0.9 * 1.0 / 3
    auto r = scorer.scoreFrom({"a"}, weights({{"direct", 0.6}, {"first", 0.9}, {"second", 1.0}}));
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value().best.at("x").hops(), 1u);
    EXPECT_EQ(r.value().best.at("x").steps[0].relation, "direct");
}

TEST_F(GraphScorerTest, EqualScoresFromTwoAnchorsPreferSmallerAnchorId) {
    edge("z", "x", "amends");
    edge("a", "x", "amends");
    GraphTraversalScorer scorer(graph_, config());

    auto r = scorer.scoreFrom({"z", "a"}, weights({{"amends", 0.7}}));
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value().best.at("x").anchor, "a");
}

TEST_F(GraphScorerTest, UnknownAnchorsAreIgnored) {
    GraphTraversalScorer scorer(graph_, config());
    auto r = scorer.scoreFrom({"missing"}, weights({}));
    ASSERT_TRUE(r);
    EXPECT_TRUE(r.value().best.empty());
}

TEST_F(GraphScorerTest, CancellationStopsTraversal) {
    edge("a", "b", "amends");
    GraphTraversalScorer scorer(graph_, config());
    std::atomic<bool> cancel{true};
    auto r = scorer.scoreFrom({"a"}, weights({{"amends", 1.0}}), &cancel);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::OperationCancelled);
}
