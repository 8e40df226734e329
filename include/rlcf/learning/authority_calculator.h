#pragma once

#include <rlcf/core/types.h>
#include <rlcf/core/versioned_store.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rlcf::learning {

// Feedback layers; each one has its own authority and its own reward.
enum class FeedbackLevel : std::uint8_t { Retrieval = 0, Reasoning = 1, Synthesis = 2 };

inline constexpr std::size_t kLevelCount = 3;
inline constexpr std::array<FeedbackLevel, kLevelCount> kAllLevels{
    FeedbackLevel::Retrieval, FeedbackLevel::Reasoning, FeedbackLevel::Synthesis};

constexpr std::size_t levelIndex(FeedbackLevel level) noexcept {
    return static_cast<std::size_t>(level);
}

const char* levelName(FeedbackLevel level) noexcept;
std::optional<FeedbackLevel> parseLevel(std::string_view name);

struct AuthorityConfig {
    double baseline_weight = 0.3;     // alpha: baseline credential
    double track_record_weight = 0.5; // beta: confirmed / validated
    double recent_weight = 0.2;       // gamma: accuracy over the recent window
    std::size_t recent_window = 20;   // N most recent validated events
    double neutral_prior = 0.5;       // unseen users and empty components
    std::size_t async_threads = 1;    // workers applying delayed validation outcomes

    bool isValid() const;
};

/**
 * Validation history of one user at one (level, domain).
 */
struct AuthorityRecord {
    std::uint64_t confirmed = 0;
    std::uint64_t validated = 0;
    std::deque<bool> recent; // oldest first, at most recent_window entries

    bool operator==(const AuthorityRecord& o) const {
        return confirmed == o.confirmed && validated == o.validated && recent == o.recent;
    }
};

struct AuthorityKey {
    UserId userId;
    FeedbackLevel level = FeedbackLevel::Retrieval;
    std::string domain;

    bool operator==(const AuthorityKey& o) const {
        return level == o.level && userId == o.userId && domain == o.domain;
    }
};

struct AuthorityKeyHash {
    std::size_t operator()(const AuthorityKey& k) const noexcept;
};

struct AuthorityBreakdown {
    double baseline = 0.0;
    double trackRecord = 0.0;
    double recentPerformance = 0.0;
    double authority = 0.0;
    std::uint64_t validated = 0;
};

/**
 * Consensus (or external validator) verdict on one feedback event: for every
 * level judged, whether the user's judgment was confirmed.
 */
struct ValidationOutcome {
    std::string feedbackId;
    UserId userId;
    std::string domain;
    std::map<FeedbackLevel, bool> confirmed;
};

struct AuthorityRow {
    AuthorityKey key;
    AuthorityRecord record;
    std::uint64_t version = 0;
};

/**
 * Per-user trust score by feedback level and domain:
 *
 *   authority = a * baseline + b * track_record + g * recent_performance
 *
 * clamped to [0,1]. Components without history use the neutral prior.
 *
 * Validation outcomes arrive after consensus, possibly much later than the
 * feedback itself; scheduleUpdate() applies them on a worker pool so the
 * ingestion path never waits for them.
 */
class AuthorityCalculator {
public:
    using PersistHook = std::function<void(const AuthorityRow&)>;
    using BaselinePersistHook = std::function<void(const UserId&, double)>;

    explicit AuthorityCalculator(AuthorityConfig config = {});
    ~AuthorityCalculator();

    AuthorityCalculator(const AuthorityCalculator&) = delete;
    AuthorityCalculator& operator=(const AuthorityCalculator&) = delete;

    double getAuthority(const UserId& user, FeedbackLevel level, const std::string& domain) const;
    AuthorityBreakdown breakdown(const UserId& user, FeedbackLevel level,
                                 const std::string& domain) const;

    Result<void> setBaselineCredential(const UserId& user, double credential);
    std::optional<double> baselineCredential(const UserId& user) const;

    /**
     * Applies one outcome synchronously. An outcome already applied for the same
     * (feedback id, level) is ignored, so redelivery never double counts.
     */
    Result<void> updateFromFeedback(const ValidationOutcome& outcome);

    // Queues the outcome; returns immediately.
    void scheduleUpdate(ValidationOutcome outcome);

    // Blocks until every scheduled outcome has been applied.
    void waitIdle();
    std::size_t pendingUpdates() const;

    std::optional<AuthorityRecord> record(const AuthorityKey& key) const;
    std::vector<AuthorityRow> allRecords() const;

    // Persistence loaders
    void loadRecord(const AuthorityKey& key, AuthorityRecord record, std::uint64_t version);
    void loadBaseline(const UserId& user, double credential);

    void setPersistHook(PersistHook hook);
    void setBaselinePersistHook(BaselinePersistHook hook);

    const AuthorityConfig& config() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace rlcf::learning
