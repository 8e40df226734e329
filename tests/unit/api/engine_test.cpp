#include <gtest/gtest.h>
#include <rlcf/api/engine.h>

#include "common/tmp_dir.h"

#include <boost/asio/io_context.hpp>

using namespace rlcf;
using namespace rlcf::api;
using learning::FeedbackLevel;
using weights::StrategyId;

class EngineTest : public ::testing::Test {
protected:
    void SetUp() override { engine_ = makeEngine(config::EngineConfig{}); }

    std::unique_ptr<Engine> makeEngine(config::EngineConfig cfg,
                                       boost::asio::any_io_executor executor = {}) {
        cfg.logging.level = "warn";
        EngineComponents components;
        components.clock = [this] { return now_; };
        components.executor = std::move(executor);
        auto created = Engine::create(std::move(cfg), std::move(components));
        if (!created) {
            ADD_FAILURE() << created.error().message;
            return nullptr;
        }
        return std::move(created).value();
    }

    void ingestCorpus(Engine& engine) {
        ASSERT_TRUE(engine.addChunk({"c1", {1.0f, 0.0f}, "article"}));
        ASSERT_TRUE(engine.addChunk({"c2", {0.8f, 0.6f}, "commentary"}));
        ASSERT_TRUE(engine.addChunk({"c3", {0.0f, 1.0f}, "ruling"}));
        ASSERT_TRUE(engine.addNode({"art-1", "article"}));
        ASSERT_TRUE(engine.addNode({"art-2", "article"}));
        ASSERT_TRUE(engine.addNode({"ruling-9", "ruling"}));
        ASSERT_TRUE(engine.addEdge({"art-1", "art-2", "amends"}));
        ASSERT_TRUE(engine.addEdge({"art-1", "ruling-9", "cites"}));
        ASSERT_TRUE(engine.upsertMapping(mapping("c1", "art-1", "defines")));
        ASSERT_TRUE(engine.upsertMapping(mapping("c2", "art-2", "mentions")));
        ASSERT_TRUE(engine.upsertMapping(mapping("c3", "ruling-9", "mentions")));
    }

    static bridge::BridgeMapping mapping(const std::string& chunk, const std::string& node,
                                         const std::string& relation) {
        bridge::BridgeMapping m;
        m.chunkId = chunk;
        m.nodeId = node;
        m.relationType = relation;
        m.weight = 0.6;
        m.source = "ingest";
        return m;
    }

    std::string retrieveTrace(Engine& engine) {
        search::RetrieveRequest req;
        req.queryEmbedding = {1.0f, 0.0f};
        req.anchorNodes = {"art-1"};
        req.domain = "civil";
        auto r = engine.retrieve(req);
        EXPECT_TRUE(r) << r.error().message;
        if (!r)
            return {};
        EXPECT_FALSE(r.value().combined.empty());
        return r.value().trace->traceId;
    }

    static learning::FeedbackEvent positiveFeedback(const std::string& id,
                                                    const std::string& traceId,
                                                    const std::string& user = "alice") {
        learning::FeedbackEvent ev;
        ev.id = id;
        ev.traceId = traceId;
        ev.userId = user;
        ev.domain = "civil";
        learning::RetrievalJudgment j;
        j.sourcesRelevant = true;
        j.sourcesComplete = true;
        j.rankingQuality = 1.0;
        ev.retrieval = j;
        return ev;
    }

    double citesWeight(const Engine& engine) const {
        return engine.getParameterSnapshot()->traversalWeight(StrategyId::Precedent, "cites").value();
    }

    TimePoint now_ = TimePoint{} + std::chrono::hours(24 * 500);
    std::unique_ptr<Engine> engine_;
};

TEST_F(EngineTest, FreshEngineStartsFromPriors) {
    ASSERT_NE(engine_, nullptr);
    auto snap = engine_->getParameterSnapshot();
    EXPECT_DOUBLE_EQ(citesWeight(*engine_), 0.85);
    EXPECT_DOUBLE_EQ(snap->alpha[weights::strategyIndex(StrategyId::Principles)], 0.7);
    EXPECT_EQ(snap->gating, nullptr);
    EXPECT_TRUE(engine_->changeLog().value().empty());

    config::EngineConfig bad;
    bad.trace_capacity = 0;
    auto rejected = Engine::create(bad);
    ASSERT_FALSE(rejected);
    EXPECT_EQ(rejected.error().code, ErrorCode::InvalidArgument);
}

TEST_F(EngineTest, PositiveFeedbackReinforcesTheRetrievalPath) {
    ingestCorpus(*engine_);
    const auto traceId = retrieveTrace(*engine_);
    ASSERT_FALSE(traceId.empty());
    ASSERT_NE(engine_->findTrace(traceId), nullptr);
    EXPECT_NE(engine_->getParameterSnapshot()->gating, nullptr);

    auto ack = engine_->ingestFeedback(positiveFeedback("fb-1", traceId));
    ASSERT_TRUE(ack) << ack.error().message;
    EXPECT_TRUE(ack.value().accepted);
    EXPECT_FALSE(ack.value().duplicate);
    EXPECT_NEAR(ack.value().rewards.at(FeedbackLevel::Retrieval), 1.0, 1e-12);

    const auto& update = ack.value().update;
    EXPECT_TRUE(update.applied[learning::levelIndex(FeedbackLevel::Retrieval)]);
    EXPECT_FALSE(update.applied[learning::levelIndex(FeedbackLevel::Synthesis)]);
    EXPECT_GT(update.traversalUpdates, 0u);
    EXPECT_GT(update.bridgeUpdates, 0u);

    EXPECT_GT(citesWeight(*engine_), 0.85);
    auto link = engine_->bridgeIndex().getMapping(bridge::MappingKey{"c3", "ruling-9", "mentions"});
    ASSERT_TRUE(link.has_value());
    EXPECT_GT(link->weight, 0.6);

    auto entries = engine_->changeLog().value();
    ASSERT_FALSE(entries.empty());
    for (const auto& e : entries)
        EXPECT_EQ(e.feedbackId, "fb-1");
}

TEST_F(EngineTest, DuplicateFeedbackIsAcknowledgedWithoutEffect) {
    ingestCorpus(*engine_);
    const auto traceId = retrieveTrace(*engine_);
    ASSERT_TRUE(engine_->ingestFeedback(positiveFeedback("fb-1", traceId)));
    const auto generation = engine_->getParameterSnapshot()->generation;
    const auto logSize = engine_->changeLog().value().size();

    auto again = engine_->ingestFeedback(positiveFeedback("fb-1", traceId));
    ASSERT_TRUE(again);
    EXPECT_TRUE(again.value().accepted);
    EXPECT_TRUE(again.value().duplicate);
    EXPECT_EQ(engine_->getParameterSnapshot()->generation, generation);
    EXPECT_EQ(engine_->changeLog().value().size(), logSize);
}

TEST_F(EngineTest, FeedbackForUnknownTraceIsRejected) {
    ingestCorpus(*engine_);
    auto missing = engine_->ingestFeedback(positiveFeedback("fb-1", "tr-missing"));
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code, ErrorCode::ValidationError);
    EXPECT_TRUE(engine_->changeLog().value().empty());

    // The id was not consumed by the rejected attempt
    const auto traceId = retrieveTrace(*engine_);
    auto ok = engine_->ingestFeedback(positiveFeedback("fb-1", traceId));
    ASSERT_TRUE(ok);
    EXPECT_FALSE(ok.value().duplicate);

    auto badIteration = positiveFeedback("fb-2", traceId);
    badIteration.iterationTraceIds = {"tr-gone"};
    auto rejected = engine_->ingestFeedback(badIteration);
    ASSERT_FALSE(rejected);
    EXPECT_EQ(rejected.error().code, ErrorCode::ValidationError);

    learning::FeedbackEvent anonymous = positiveFeedback("fb-3", traceId, "");
    EXPECT_FALSE(engine_->ingestFeedback(anonymous));
}

TEST_F(EngineTest, OldTracesAreEvicted) {
    config::EngineConfig cfg;
    cfg.trace_capacity = 2;
    auto engine = makeEngine(cfg);
    ASSERT_NE(engine, nullptr);
    ingestCorpus(*engine);
    const auto first = retrieveTrace(*engine);
    const auto second = retrieveTrace(*engine);
    const auto third = retrieveTrace(*engine);
    EXPECT_EQ(engine->findTrace(first), nullptr);
    EXPECT_NE(engine->findTrace(second), nullptr);
    EXPECT_NE(engine->findTrace(third), nullptr);
}

TEST_F(EngineTest, ConsensusRaisesAuthorityOfAgreeingUsers) {
    ingestCorpus(*engine_);
    const auto traceId = retrieveTrace(*engine_);

    ASSERT_TRUE(engine_->ingestFeedback(positiveFeedback("fb-a", traceId, "alice")));
    ASSERT_TRUE(engine_->ingestFeedback(positiveFeedback("fb-b", traceId, "bob")));
    auto third = engine_->ingestFeedback(positiveFeedback("fb-c", traceId, "carol"));
    ASSERT_TRUE(third);
    EXPECT_TRUE(third.value().consensusReached);
    EXPECT_EQ(third.value().validationsScheduled, 3u);

    engine_->waitForAuthorityUpdates();
    for (const char* user : {"alice", "bob", "carol"})
        EXPECT_NEAR(engine_->getAuthority(user, FeedbackLevel::Retrieval, "civil"),
                    0.3 * 0.5 + 0.5 * 1.0 + 0.2 * 1.0, 1e-12)
            << user;
    EXPECT_DOUBLE_EQ(engine_->getAuthority("alice", FeedbackLevel::Synthesis, "civil"), 0.5);
}

TEST_F(EngineTest, ExternalValidationAndCredentials) {
    learning::ValidationOutcome o;
    o.feedbackId = "fb-x";
    o.userId = "dora";
    o.domain = "tax";
    EXPECT_EQ(engine_->submitValidation(o).error().code, ErrorCode::ValidationError);

    o.confirmed[FeedbackLevel::Synthesis] = false;
    ASSERT_TRUE(engine_->submitValidation(o));
    engine_->waitForAuthorityUpdates();
    EXPECT_LT(engine_->getAuthority("dora", FeedbackLevel::Synthesis, "tax"), 0.5);

    ASSERT_TRUE(engine_->setBaselineCredential("dora", 1.0));
    auto b = engine_->authorityBreakdown("dora", FeedbackLevel::Synthesis, "tax");
    EXPECT_DOUBLE_EQ(b.baseline, 1.0);
    EXPECT_DOUBLE_EQ(b.trackRecord, 0.0);
    EXPECT_FALSE(engine_->setBaselineCredential("dora", -0.1));
}

TEST_F(EngineTest, RollbackRestoresEarlierValues) {
    ingestCorpus(*engine_);
    const auto traceId = retrieveTrace(*engine_);
    ASSERT_TRUE(engine_->ingestFeedback(positiveFeedback("fb-1", traceId)));
    const auto alpha = engine_->getParameterSnapshot()->alpha;
    ASSERT_GT(citesWeight(*engine_), 0.85);

    auto beyond = engine_->rollbackTo(engine_->changeLog().value().size() + 10);
    ASSERT_FALSE(beyond);
    EXPECT_EQ(beyond.error().code, ErrorCode::InvalidArgument);

    const auto before = engine_->changeLog().value().size();
    auto report = engine_->rollbackTo(0);
    ASSERT_TRUE(report);
    EXPECT_GT(report.value().keysReverted, 0u);
    EXPECT_EQ(report.value().keysFailed, 0u);

    EXPECT_DOUBLE_EQ(citesWeight(*engine_), 0.85);
    auto link = engine_->bridgeIndex().getMapping(bridge::MappingKey{"c3", "ruling-9", "mentions"});
    ASSERT_TRUE(link.has_value());
    EXPECT_DOUBLE_EQ(link->weight, 0.6);
    for (auto s : weights::kAllStrategies)
        EXPECT_DOUBLE_EQ(engine_->getParameterSnapshot()->alpha[weights::strategyIndex(s)], 0.7)
            << weights::strategyName(s) << " was " << alpha[weights::strategyIndex(s)];

    // Rollback appends compensating entries; history is never rewritten
    auto after = engine_->changeLog(before).value();
    EXPECT_EQ(after.size(), report.value().keysReverted);
    for (const auto& e : after)
        EXPECT_EQ(e.feedbackId, "rollback@0");
}

TEST_F(EngineTest, DecaySweepPullsTowardPriors) {
    ingestCorpus(*engine_);
    const auto traceId = retrieveTrace(*engine_);
    ASSERT_TRUE(engine_->ingestFeedback(positiveFeedback("fb-1", traceId)));
    const double reinforced = citesWeight(*engine_);

    auto early = engine_->runDecaySweep(now_ + std::chrono::hours(1));
    EXPECT_EQ(early.decayed, 0u);

    auto report = engine_->runDecaySweep(now_ + std::chrono::hours(24 * 60));
    EXPECT_GT(report.decayed, 0u);
    EXPECT_LT(citesWeight(*engine_), reinforced);
    EXPECT_GT(citesWeight(*engine_), 0.85);

    auto start = engine_->startDecay();
    ASSERT_FALSE(start);
    EXPECT_EQ(start.error().code, ErrorCode::InvalidState);
}

TEST_F(EngineTest, ScheduledDecayNeedsAnExecutor) {
    boost::asio::io_context io;
    auto engine = makeEngine(config::EngineConfig{}, io.get_executor());
    ASSERT_NE(engine, nullptr);
    ASSERT_TRUE(engine->startDecay());
    engine->stopDecay();

    config::EngineConfig disabled;
    disabled.decay.enabled = false;
    auto off = makeEngine(disabled, io.get_executor());
    ASSERT_NE(off, nullptr);
    EXPECT_EQ(off->startDecay().error().code, ErrorCode::InvalidState);
}

TEST_F(EngineTest, StateSurvivesRestart) {
    test::TempDir dir;
    config::EngineConfig cfg;
    cfg.storage.path = dir.file("engine.db").string();

    double learned = 0.0;
    std::size_t logSize = 0;
    {
        auto engine = makeEngine(cfg);
        ASSERT_NE(engine, nullptr);
        ingestCorpus(*engine);
        const auto traceId = retrieveTrace(*engine);
        ASSERT_TRUE(engine->ingestFeedback(positiveFeedback("fb-1", traceId)));
        ASSERT_TRUE(engine->setBaselineCredential("alice", 0.9));
        learned = citesWeight(*engine);
        logSize = engine->changeLog().value().size();
        ASSERT_GT(learned, 0.85);
    }

    auto engine = makeEngine(cfg);
    ASSERT_NE(engine, nullptr);
    EXPECT_DOUBLE_EQ(citesWeight(*engine), learned);
    EXPECT_EQ(engine->changeLog().value().size(), logSize);
    EXPECT_NE(engine->getParameterSnapshot()->gating, nullptr);
    EXPECT_DOUBLE_EQ(engine->authorityBreakdown("alice", FeedbackLevel::Retrieval, "civil").baseline,
                     0.9);
    auto link = engine->bridgeIndex().getMapping(bridge::MappingKey{"c3", "ruling-9", "mentions"});
    ASSERT_TRUE(link.has_value());
    EXPECT_GT(link->weight, 0.6);

    auto replay = engine->ingestFeedback(positiveFeedback("fb-1", "tr-anything"));
    ASSERT_TRUE(replay);
    EXPECT_TRUE(replay.value().duplicate);
}

TEST_F(EngineTest, HistoryBeyondTheMemoryTailIsReadFromStorage) {
    test::TempDir dir;
    config::EngineConfig cfg;
    cfg.storage.path = dir.file("engine.db").string();
    cfg.storage.log_memory_entries = 2;

    std::size_t logSize = 0;
    {
        auto engine = makeEngine(cfg);
        ASSERT_NE(engine, nullptr);
        ingestCorpus(*engine);
        ASSERT_TRUE(engine->ingestFeedback(positiveFeedback("fb-1", retrieveTrace(*engine))));
        auto history = engine->changeLog();
        ASSERT_TRUE(history) << history.error().message;
        logSize = history.value().size();
        ASSERT_GT(logSize, 2u);
        EXPECT_EQ(history.value().front().sequence, 1u);
    }

    auto engine = makeEngine(cfg);
    ASSERT_NE(engine, nullptr);
    auto history = engine->changeLog();
    ASSERT_TRUE(history) << history.error().message;
    EXPECT_EQ(history.value().size(), logSize);

    auto report = engine->rollbackTo(0);
    ASSERT_TRUE(report) << report.error().message;
    EXPECT_EQ(report.value().keysFailed, 0u);
    EXPECT_DOUBLE_EQ(citesWeight(*engine), 0.85);
    auto link = engine->bridgeIndex().getMapping(bridge::MappingKey{"c3", "ruling-9", "mentions"});
    ASSERT_TRUE(link.has_value());
    EXPECT_DOUBLE_EQ(link->weight, 0.6);
}

TEST_F(EngineTest, InMemoryHistoryIsLimitedToTheTail) {
    config::EngineConfig cfg;
    cfg.storage.log_memory_entries = 2;
    auto engine = makeEngine(cfg);
    ASSERT_NE(engine, nullptr);
    ingestCorpus(*engine);
    ASSERT_TRUE(engine->ingestFeedback(positiveFeedback("fb-1", retrieveTrace(*engine))));

    auto gone = engine->changeLog();
    ASSERT_FALSE(gone);
    EXPECT_EQ(gone.error().code, ErrorCode::NotFound);
    auto rollback = engine->rollbackTo(0);
    ASSERT_FALSE(rollback);
    EXPECT_EQ(rollback.error().code, ErrorCode::NotFound);

    config::EngineConfig bad;
    bad.storage.log_memory_entries = 0;
    EXPECT_FALSE(Engine::create(bad));
}
