#include <gtest/gtest.h>
#include <rlcf/weights/parameter_store.h>

#include <atomic>
#include <cmath>
#include <thread>
#include <vector>

using namespace rlcf;
using namespace rlcf::weights;
using namespace std::chrono_literals;

namespace {

constexpr auto kDay = std::chrono::hours(24);

GatingParameters tinyGating(float fill) {
    GatingParameters p;
    p.inputDim = 2;
    p.hidden = 1;
    p.w1.assign(2, fill);
    p.b1.assign(1, 0.0f);
    p.w2.assign(kStrategyCount, fill);
    p.b2.assign(kStrategyCount, 0.0f);
    p.expertBias.assign(kStrategyCount, 0.0f);
    return p;
}

} // namespace

class ParameterStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        now_ = TimePoint{} + std::chrono::hours(24 * 365);
        log_ = std::make_shared<ChangeLog>();
        store_ = makeStore();
        store_->bootstrapPriors();
    }

    std::unique_ptr<ParameterStore> makeStore() {
        return std::make_unique<ParameterStore>(ParameterStoreConfig{}, log_,
                                                [this] { return now_; });
    }

    double traversalWeight(StrategyId s, const std::string& relation) const {
        auto v = store_->traversal(s, relation);
        return v ? v->value.weight : -1.0;
    }

    TimePoint now_;
    std::shared_ptr<ChangeLog> log_;
    std::unique_ptr<ParameterStore> store_;
};

TEST_F(ParameterStoreTest, BootstrapSeedsPriorsOnce) {
    EXPECT_DOUBLE_EQ(traversalWeight(StrategyId::Literal, "defines"), 0.95);
    EXPECT_DOUBLE_EQ(traversalWeight(StrategyId::Precedent, "cites"), 0.85);
    auto alpha = store_->alpha(StrategyId::Systemic);
    ASSERT_TRUE(alpha.has_value());
    EXPECT_DOUBLE_EQ(alpha->value, 0.7);
    EXPECT_EQ(alpha->version, 1u);

    std::size_t expectedKeys = 0;
    for (const auto& def : strategyTable())
        expectedKeys += def.priors.size();
    EXPECT_EQ(store_->traversalKeys().size(), expectedKeys);

    const auto gen = store_->generation();
    store_->bootstrapPriors();
    EXPECT_EQ(store_->generation(), gen);
    EXPECT_EQ(log_->size(), 0u);
}

TEST_F(ParameterStoreTest, SnapshotExposesOnlyDeclaredRelations) {
    auto snap = store_->snapshot();
    auto defines = snap->traversalWeight(StrategyId::Literal, "defines");
    ASSERT_TRUE(defines.has_value());
    EXPECT_DOUBLE_EQ(*defines, 0.95);
    EXPECT_FALSE(snap->traversalWeight(StrategyId::Literal, "cites").has_value());
    EXPECT_EQ(snap->rerank.weights, (std::array<double, kRerankFeatureCount>{1.0, 0.0, 0.0}));
    EXPECT_EQ(snap->gating, nullptr);
}

TEST_F(ParameterStoreTest, SnapshotIsImmutableAcrossUpdates) {
    auto before = store_->snapshot();
    EXPECT_EQ(store_->snapshot(), before);

    ASSERT_TRUE(store_->adjustTraversal(StrategyId::Literal, "defines", -0.2, "fb-1"));
    auto after = store_->snapshot();
    EXPECT_GT(after->generation, before->generation);
    EXPECT_DOUBLE_EQ(*before->traversalWeight(StrategyId::Literal, "defines"), 0.95);
    EXPECT_NEAR(*after->traversalWeight(StrategyId::Literal, "defines"), 0.75, 1e-12);
}

TEST_F(ParameterStoreTest, UndeclaredRelationIsNotFound) {
    auto r = store_->adjustTraversal(StrategyId::Literal, "cites", 0.1, "fb-1");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::NotFound);

    auto bad = store_->adjustTraversal(StrategyId::Literal, "defines", std::nan(""), "fb-1");
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error().code, ErrorCode::InvalidArgument);
}

TEST_F(ParameterStoreTest, AdjustTraversalLogsAndPersists) {
    std::vector<ParameterRow> rows;
    store_->setPersistHook([&](const ParameterRow& row) { rows.push_back(row); });

    auto r = store_->adjustTraversal(StrategyId::Systemic, "amends", 0.05, "fb-7");
    ASSERT_TRUE(r);
    EXPECT_TRUE(r.value().changed);
    EXPECT_DOUBLE_EQ(r.value().before, 0.90);
    EXPECT_NEAR(r.value().after, 0.95, 1e-12);
    EXPECT_EQ(r.value().version, 2u);

    auto entries = log_->entriesForFeedback("fb-7");
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].ref, ParameterRef::traversal(StrategyId::Systemic, "amends"));
    EXPECT_EQ(entries[0].oldValue, formatScalar(0.90));
    EXPECT_EQ(entries[0].version, 2u);

    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].version, 2u);
    EXPECT_EQ(rows[0].lastReinforced, now_);
}

TEST_F(ParameterStoreTest, AdversarialDeltasStayInBounds) {
    for (int i = 0; i < 20; ++i) {
        ASSERT_TRUE(store_->adjustTraversal(StrategyId::Principles, "balances", 10.0, "up"));
        EXPECT_LE(traversalWeight(StrategyId::Principles, "balances"), 1.0);
    }
    EXPECT_DOUBLE_EQ(traversalWeight(StrategyId::Principles, "balances"), 1.0);

    for (int i = 0; i < 20; ++i) {
        ASSERT_TRUE(store_->adjustTraversal(StrategyId::Principles, "balances", -10.0, "down"));
        EXPECT_GE(traversalWeight(StrategyId::Principles, "balances"), 0.0);
    }
    EXPECT_DOUBLE_EQ(traversalWeight(StrategyId::Principles, "balances"), 0.0);

    // Saturated commits are not logged again
    EXPECT_EQ(log_->entriesForFeedback("up").size(), 1u);
    EXPECT_EQ(log_->entriesForFeedback("down").size(), 1u);
}

TEST_F(ParameterStoreTest, AlphaIsClampedToConfiguredRange) {
    auto up = store_->adjustAlpha(StrategyId::Literal, 5.0, "fb");
    ASSERT_TRUE(up);
    EXPECT_DOUBLE_EQ(up.value().after, 0.9);

    auto down = store_->adjustAlpha(StrategyId::Literal, -5.0, "fb");
    ASSERT_TRUE(down);
    EXPECT_DOUBLE_EQ(down.value().after, 0.3);

    auto atBound = store_->adjustAlpha(StrategyId::Literal, -0.1, "fb");
    ASSERT_TRUE(atBound);
    EXPECT_FALSE(atBound.value().changed);
    EXPECT_DOUBLE_EQ(store_->alpha(StrategyId::Literal)->value, 0.3);
}

TEST_F(ParameterStoreTest, RerankWeightsAreClamped) {
    auto r = store_->updateRerank(
        [](const RerankParameters&) -> std::optional<RerankParameters> {
            RerankParameters p;
            p.weights = {0.8, -0.2, 1.5};
            return p;
        },
        "fb");
    ASSERT_TRUE(r);
    EXPECT_TRUE(r.value());
    EXPECT_EQ(store_->snapshot()->rerank.weights,
              (std::array<double, kRerankFeatureCount>{0.8, 0.0, 1.0}));

    auto declined = store_->updateRerank(
        [](const RerankParameters&) -> std::optional<RerankParameters> { return std::nullopt; },
        "fb");
    ASSERT_TRUE(declined);
    EXPECT_FALSE(declined.value());
}

TEST_F(ParameterStoreTest, GatingMustBeInitialisedAndIsBounded) {
    auto missing = store_->updateGating(
        [](const GatingParameters& p) -> std::optional<GatingParameters> { return p; }, "fb");
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code, ErrorCode::NotFound);

    EXPECT_FALSE(store_->ensureGating(GatingParameters{}));
    EXPECT_TRUE(store_->ensureGating(tinyGating(3.0f)));
    EXPECT_FALSE(store_->ensureGating(tinyGating(0.1f)));

    auto snap = store_->snapshot();
    ASSERT_NE(snap->gating, nullptr);
    for (float w : snap->gating->w1)
        EXPECT_FLOAT_EQ(w, 1.0f);

    auto r = store_->updateGating(
        [](const GatingParameters& p) -> std::optional<GatingParameters> {
            auto next = p;
            next.b2[0] = -7.0f;
            return next;
        },
        "fb-g");
    ASSERT_TRUE(r);
    EXPECT_TRUE(r.value());
    EXPECT_FLOAT_EQ(store_->snapshot()->gating->b2[0], -1.0f);
    EXPECT_EQ(log_->entriesForFeedback("fb-g").size(), 1u);
}

TEST_F(ParameterStoreTest, DecayRespectsGracePeriod) {
    ASSERT_TRUE(store_->adjustTraversal(StrategyId::Literal, "defines", -0.45, "fb"));
    auto r = store_->decayTraversal(StrategyId::Literal, "defines", now_ + 12h, 0.995, 24h);
    ASSERT_TRUE(r);
    EXPECT_FALSE(r.value().has_value());
    EXPECT_NEAR(traversalWeight(StrategyId::Literal, "defines"), 0.5, 1e-12);
}

TEST_F(ParameterStoreTest, DecayPullsTowardPrior) {
    ASSERT_TRUE(store_->adjustTraversal(StrategyId::Literal, "defines", -0.45, "fb"));
    const double deviation = 0.45;

    auto r = store_->decayTraversal(StrategyId::Literal, "defines", now_ + 200 * kDay, 0.995, 24h);
    ASSERT_TRUE(r);
    ASSERT_TRUE(r.value().has_value());
    const double w = traversalWeight(StrategyId::Literal, "defines");
    EXPECT_NEAR(w, 0.95 - deviation * std::pow(0.995, 200.0), 1e-9);
    EXPECT_LE(0.95 - w, 0.368 * deviation);

    auto decayLog = log_->entriesForFeedback("decay");
    ASSERT_EQ(decayLog.size(), 1u);

    ASSERT_TRUE(
        store_->decayTraversal(StrategyId::Literal, "defines", now_ + 1000 * kDay, 0.995, 24h));
    EXPECT_LT(std::abs(traversalWeight(StrategyId::Literal, "defines") - 0.95), 0.01);
}

TEST_F(ParameterStoreTest, DailySweepsMatchOneLongSweep) {
    auto other = makeStore();
    other->bootstrapPriors();
    ASSERT_TRUE(store_->adjustTraversal(StrategyId::Precedent, "overrules", -0.6, "fb"));
    ASSERT_TRUE(other->adjustTraversal(StrategyId::Precedent, "overrules", -0.6, "fb"));

    for (int d = 1; d <= 10; ++d) {
        ASSERT_TRUE(
            store_->decayTraversal(StrategyId::Precedent, "overrules", now_ + d * kDay, 0.995, 24h));
    }
    ASSERT_TRUE(
        other->decayTraversal(StrategyId::Precedent, "overrules", now_ + 10 * kDay, 0.995, 24h));

    auto a = store_->traversal(StrategyId::Precedent, "overrules");
    auto b = other->traversal(StrategyId::Precedent, "overrules");
    ASSERT_TRUE(a && b);
    EXPECT_NEAR(a->value.weight, b->value.weight, 1e-12);
}

TEST_F(ParameterStoreTest, DecayRejectsBadRate) {
    auto r = store_->decayTraversal(StrategyId::Literal, "defines", now_ + 30 * kDay, 1.5, 24h);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);
}

TEST_F(ParameterStoreTest, RestoreCommitsRecordedValues) {
    ASSERT_TRUE(store_->adjustTraversal(StrategyId::Literal, "amends", 0.1, "fb"));
    ASSERT_TRUE(store_->restore(ParameterRef::traversal(StrategyId::Literal, "amends"),
                                formatScalar(0.85), "rollback@0"));
    EXPECT_DOUBLE_EQ(traversalWeight(StrategyId::Literal, "amends"), 0.85);

    ASSERT_TRUE(store_->restore(ParameterRef::alpha(StrategyId::Systemic), "0.4", "rollback@0"));
    EXPECT_DOUBLE_EQ(store_->alpha(StrategyId::Systemic)->value, 0.4);

    RerankParameters rerank;
    rerank.weights = {0.5, 0.25, 0.25};
    ASSERT_TRUE(store_->restore(ParameterRef::rerank(), toJson(rerank), "rollback@0"));
    EXPECT_EQ(store_->snapshot()->rerank, rerank);

    EXPECT_EQ(log_->entriesForFeedback("rollback@0").size(), 3u);

    auto bridge = store_->restore(ParameterRef::bridge("c", "n", "defines"), "0.5", "rollback@0");
    ASSERT_FALSE(bridge);
    EXPECT_EQ(bridge.error().code, ErrorCode::InvalidArgument);

    auto junk = store_->restore(ParameterRef::alpha(StrategyId::Literal), "high", "rollback@0");
    ASSERT_FALSE(junk);
    EXPECT_EQ(junk.error().code, ErrorCode::ValidationError);
}

TEST_F(ParameterStoreTest, LoadOnlyAcceptsNewerVersions) {
    store_->loadAlpha(StrategyId::Precedent, 0.5, 5);
    EXPECT_DOUBLE_EQ(store_->alpha(StrategyId::Precedent)->value, 0.5);
    store_->loadAlpha(StrategyId::Precedent, 0.8, 3);
    EXPECT_DOUBLE_EQ(store_->alpha(StrategyId::Precedent)->value, 0.5);
    EXPECT_EQ(store_->alpha(StrategyId::Precedent)->version, 5u);

    TraversalWeight w;
    w.weight = 1.7;
    store_->loadTraversal(StrategyId::Precedent, "cites", w, 9);
    auto loaded = store_->traversal(StrategyId::Precedent, "cites");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_DOUBLE_EQ(loaded->value.weight, 1.0);
    EXPECT_DOUBLE_EQ(loaded->value.prior, 0.85);
}

TEST_F(ParameterStoreTest, ConcurrentAdjustmentsAreNotLost) {
    constexpr int kThreads = 8;
    constexpr int kRounds = 50;
    std::atomic<int> failures{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t] {
            for (int i = 0; i < kRounds; ++i) {
                auto r = store_->adjustTraversal(StrategyId::Systemic, "amends", -0.001,
                                                 "fb-" + std::to_string(t));
                if (!r)
                    failures.fetch_add(1);
            }
        });
    }
    for (auto& th : threads)
        th.join();

    EXPECT_EQ(failures.load(), 0);
    EXPECT_NEAR(traversalWeight(StrategyId::Systemic, "amends"), 0.5, 1e-9);
    EXPECT_EQ(log_->size(), static_cast<std::size_t>(kThreads * kRounds));
    EXPECT_EQ(store_->traversal(StrategyId::Systemic, "amends")->version,
              static_cast<std::uint64_t>(kThreads * kRounds + 1));
}

TEST_F(ParameterStoreTest, LogEntriesFollowVersionOrderPerKey) {
    core::RetryPolicy policy;
    policy.maxAttempts = 100000;
    policy.initialBackoff = std::chrono::microseconds(1);
    policy.maxBackoff = std::chrono::microseconds(5);
    store_->setRetryPolicy(policy);

    constexpr int kThreads = 8;
    constexpr int kRounds = 300;
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t] {
            const double delta = (t % 2 == 0) ? 0.00001 : -0.00001;
            for (int i = 0; i < kRounds; ++i) {
                EXPECT_TRUE(store_->adjustTraversal(StrategyId::Systemic, "amends", delta,
                                                    "fb-" + std::to_string(t)));
                EXPECT_TRUE(store_->adjustAlpha(StrategyId::Systemic, delta, "fb-a"));
            }
        });
    }
    for (auto& th : threads)
        th.join();

    std::uint64_t lastTraversal = 1;
    std::uint64_t lastAlpha = 1;
    std::string traversalValue = formatScalar(0.9);
    for (const auto& e : log_->entries()) {
        if (e.ref.kind == ParameterKind::Traversal) {
            EXPECT_EQ(e.version, lastTraversal + 1);
            EXPECT_EQ(e.oldValue, traversalValue);
            lastTraversal = e.version;
            traversalValue = e.newValue;
        } else if (e.ref.kind == ParameterKind::Alpha) {
            EXPECT_EQ(e.version, lastAlpha + 1);
            lastAlpha = e.version;
        }
    }
    EXPECT_EQ(lastTraversal, static_cast<std::uint64_t>(kThreads * kRounds + 1));
    EXPECT_EQ(lastAlpha, static_cast<std::uint64_t>(kThreads * kRounds + 1));
}

TEST_F(ParameterStoreTest, RetryPolicyCanChangeWhileUpdatesRun) {
    std::atomic<bool> done{false};
    std::thread tuner([&] {
        core::RetryPolicy fast;
        fast.initialBackoff = std::chrono::microseconds(1);
        core::RetryPolicy slow;
        bool flip = false;
        while (!done.load()) {
            store_->setRetryPolicy(flip ? fast : slow);
            flip = !flip;
        }
    });

    std::vector<std::thread> writers;
    for (int t = 0; t < 4; ++t) {
        writers.emplace_back([&] {
            for (int i = 0; i < 50; ++i)
                EXPECT_TRUE(store_->adjustTraversal(StrategyId::Systemic, "amends", -0.001, "fb"));
        });
    }
    for (auto& w : writers)
        w.join();
    done = true;
    tuner.join();

    EXPECT_NEAR(traversalWeight(StrategyId::Systemic, "amends"), 0.7, 1e-9);
}
