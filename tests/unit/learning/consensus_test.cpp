#include <gtest/gtest.h>
#include <rlcf/learning/consensus.h>

#include <string>

using namespace rlcf;
using namespace rlcf::learning;

namespace {

constexpr auto kRetrieval = levelIndex(FeedbackLevel::Retrieval);
constexpr auto kReasoning = levelIndex(FeedbackLevel::Reasoning);

ConsensusVote vote(const std::string& id, double reward, double authority = 0.5) {
    ConsensusVote v;
    v.feedbackId = id;
    v.userId = "user-" + id;
    v.domain = "civil";
    v.rewards.values[kRetrieval] = reward;
    v.authority[kRetrieval] = authority;
    v.judged[kRetrieval] = true;
    return v;
}

} // namespace

TEST(ConsensusTrackerTest, NoOutcomesBelowMinimumVotes) {
    ConsensusTracker tracker;
    auto first = tracker.addVote("tr-1", vote("a", 0.8));
    auto second = tracker.addVote("tr-1", vote("b", 0.8));
    EXPECT_TRUE(first.outcomes.empty());
    EXPECT_TRUE(second.outcomes.empty());
    EXPECT_EQ(second.levels[kRetrieval].votes, 2u);
    EXPECT_EQ(second.levels[kReasoning].votes, 0u);
}

TEST(ConsensusTrackerTest, ThirdVoteValidatesEveryContributor) {
    ConsensusTracker tracker;
    tracker.addVote("tr-1", vote("a", 0.8));
    tracker.addVote("tr-1", vote("b", 0.8));
    auto update = tracker.addVote("tr-1", vote("c", 0.2));

    const auto& c = update.levels[kRetrieval];
    EXPECT_NEAR(c.mean, 0.6, 1e-12);
    EXPECT_NEAR(c.variance, 0.08, 1e-12);
    EXPECT_NEAR(c.agreement, 0.68, 1e-12);
    EXPECT_FALSE(c.controversial);
    EXPECT_FALSE(c.strong);

    ASSERT_EQ(update.outcomes.size(), 3u);
    EXPECT_EQ(update.outcomes[0].feedbackId, "a");
    EXPECT_TRUE(update.outcomes[0].confirmed.at(FeedbackLevel::Retrieval));
    EXPECT_TRUE(update.outcomes[1].confirmed.at(FeedbackLevel::Retrieval));
    EXPECT_FALSE(update.outcomes[2].confirmed.at(FeedbackLevel::Retrieval));
    EXPECT_EQ(update.outcomes[2].userId, "user-c");
    EXPECT_EQ(update.outcomes[2].confirmed.count(FeedbackLevel::Reasoning), 0u);

    // Later votes are validated on arrival, earlier ones are not revisited
    auto late = tracker.addVote("tr-1", vote("d", 0.7));
    ASSERT_EQ(late.outcomes.size(), 1u);
    EXPECT_EQ(late.outcomes[0].feedbackId, "d");
    EXPECT_TRUE(late.outcomes[0].confirmed.at(FeedbackLevel::Retrieval));
}

TEST(ConsensusTrackerTest, ControversialTraceIssuesNoOutcomes) {
    ConsensusTracker tracker;
    tracker.addVote("tr-2", vote("a", 1.0));
    tracker.addVote("tr-2", vote("b", 0.0));
    tracker.addVote("tr-2", vote("c", 1.0));
    auto update = tracker.addVote("tr-2", vote("d", 0.0));
    EXPECT_TRUE(update.levels[kRetrieval].controversial);
    EXPECT_DOUBLE_EQ(update.levels[kRetrieval].agreement, 0.0);
    EXPECT_TRUE(update.outcomes.empty());
}

TEST(ConsensusTrackerTest, UnanimousVotesAreStrong) {
    ConsensusTracker tracker;
    tracker.addVote("tr-3", vote("a", 0.9));
    tracker.addVote("tr-3", vote("b", 0.9));
    auto update = tracker.addVote("tr-3", vote("c", 0.9));
    EXPECT_TRUE(update.levels[kRetrieval].strong);
    EXPECT_DOUBLE_EQ(update.levels[kRetrieval].agreement, 1.0);
    ASSERT_EQ(update.outcomes.size(), 3u);
    for (const auto& o : update.outcomes)
        EXPECT_TRUE(o.confirmed.at(FeedbackLevel::Retrieval));
}

TEST(ConsensusTrackerTest, MeanIsAuthorityWeighted) {
    std::vector<ConsensusVote> votes{vote("a", 1.0, 0.9), vote("b", 1.0, 0.9),
                                     vote("c", 0.0, 0.1)};
    auto c = ConsensusTracker::aggregate(votes, FeedbackLevel::Retrieval, ConsensusConfig{});
    EXPECT_EQ(c.votes, 3u);
    EXPECT_NEAR(c.mean, 1.8 / 1.9, 1e-12);

    // No authority at all falls back to the plain mean
    std::vector<ConsensusVote> anonymous{vote("a", 1.0, 0.0), vote("b", 0.5, 0.0)};
    auto plain = ConsensusTracker::aggregate(anonymous, FeedbackLevel::Retrieval,
                                             ConsensusConfig{});
    EXPECT_NEAR(plain.mean, 0.75, 1e-12);

    auto none = ConsensusTracker::aggregate(votes, FeedbackLevel::Synthesis, ConsensusConfig{});
    EXPECT_EQ(none.votes, 0u);
    EXPECT_DOUBLE_EQ(none.mean, 0.5);
}

TEST(ConsensusTrackerTest, OldestTracesAreEvicted) {
    ConsensusConfig cfg;
    cfg.max_tracked_traces = 2;
    ConsensusTracker tracker(cfg);
    tracker.addVote("tr-a", vote("1", 0.5));
    tracker.addVote("tr-b", vote("2", 0.5));
    tracker.addVote("tr-c", vote("3", 0.5));
    EXPECT_EQ(tracker.trackedTraces(), 2u);
    EXPECT_FALSE(tracker.consensusFor("tr-a").has_value());
    auto c = tracker.consensusFor("tr-c");
    ASSERT_TRUE(c.has_value());
    EXPECT_EQ((*c)[kRetrieval].votes, 1u);
}

TEST(ConsensusTrackerTest, ConfigValidation) {
    ConsensusConfig cfg;
    EXPECT_TRUE(cfg.isValid());
    cfg.controversy_threshold = 0.9;
    EXPECT_FALSE(cfg.isValid());
    cfg = ConsensusConfig{};
    cfg.min_votes = 0;
    EXPECT_FALSE(cfg.isValid());
}
