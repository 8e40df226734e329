#pragma once

#include <rlcf/core/types.h>
#include <rlcf/learning/authority_calculator.h>
#include <rlcf/storage/database.h>
#include <rlcf/weights/change_log.h>

#include <array>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace rlcf::bridge {
class BridgeIndex;
struct BridgeMapping;
} // namespace rlcf::bridge

namespace rlcf::weights {
class ParameterStore;
struct ParameterRow;
} // namespace rlcf::weights

namespace rlcf::storage {

struct StorageConfig {
    std::string path;                         // empty = in-memory only, nothing persisted
    bool wal = true;                          // PRAGMA journal_mode=WAL
    std::chrono::milliseconds busy_timeout{5000};
    std::size_t log_memory_entries = 4096;    // change-log tail kept in memory
};

struct ProcessedFeedback {
    std::string feedbackId;
    std::string traceId;
    TimePoint receivedAt{};
    std::array<double, learning::kLevelCount> rewards{};
};

/**
 * SQLite persistence for every learned parameter, the bridge index, authority
 * state, the change log and the processed-feedback set.
 *
 * Rows carry the in-memory version; an upsert only overwrites a row holding an
 * older version, so write-through from concurrent committers may arrive in any
 * order without regressing a value.
 */
class ParameterRepository {
public:
    static Result<std::unique_ptr<ParameterRepository>> open(const StorageConfig& config);

    ~ParameterRepository();

    ParameterRepository(const ParameterRepository&) = delete;
    ParameterRepository& operator=(const ParameterRepository&) = delete;

    Result<int> schemaVersion();

    Result<void> saveParameter(const weights::ParameterRow& row);
    Result<void> saveBridgeMapping(const bridge::BridgeMapping& mapping, std::uint64_t version);
    Result<void> saveAuthority(const learning::AuthorityRow& row);
    Result<void> saveCredential(const UserId& user, double baseline);
    Result<void> appendLog(const weights::ChangeLogEntry& entry);
    Result<void> saveBaselines(const std::array<double, learning::kLevelCount>& values,
                               std::uint64_t version);

    // false when the id was already recorded
    Result<bool> recordFeedback(const ProcessedFeedback& feedback);

    Result<void> loadParameters(weights::ParameterStore& store);
    Result<void> loadBridge(bridge::BridgeIndex& index);
    Result<void> loadAuthority(learning::AuthorityCalculator& calculator);
    // Entries after afterSequence in order; limit 0 reads to the end.
    Result<std::vector<weights::ChangeLogEntry>> loadChangeLog(std::uint64_t afterSequence = 0,
                                                               std::size_t limit = 0);
    // The newest count entries, oldest first.
    Result<std::vector<weights::ChangeLogEntry>> loadChangeLogTail(std::size_t count);
    Result<std::uint64_t> lastLogSequence();
    Result<std::vector<std::string>> loadProcessedFeedbackIds();
    Result<std::optional<std::array<double, learning::kLevelCount>>> loadBaselines();

private:
    explicit ParameterRepository(Database db);

    Result<void> upsertBlob(const std::string& name, const std::string& data,
                            std::uint64_t version);

    std::mutex mutex_;
    Database db_;
};

} // namespace rlcf::storage
