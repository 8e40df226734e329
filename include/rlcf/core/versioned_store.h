#pragma once

/**
 * @file versioned_store.h
 * @brief Keyed store with per-key optimistic versioning.
 *
 * Every key carries a monotonically increasing version. Writers read an entry,
 * compute a new value and commit it with compare-and-swap on the version they
 * read. A commit against a stale version fails with ConcurrencyConflict and the
 * writer retries; there is no global write lock. Shards keep the critical
 * sections short and independent keys never contend on the same mutex unless
 * they hash to the same shard.
 */

#include <rlcf/core/types.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

namespace rlcf::core {

/**
 * @brief Retry schedule for compare-and-swap conflicts.
 *
 * Backoff doubles from initialBackoff up to maxBackoff. Exhausting maxAttempts
 * surfaces ConcurrencyConflict to the caller.
 */
struct RetryPolicy {
    int maxAttempts = 64;
    std::chrono::microseconds initialBackoff{1000};
    std::chrono::microseconds maxBackoff{50000};
};

template <typename Value> struct Versioned {
    Value value{};
    std::uint64_t version = 0;
};

/**
 * @brief Result of a successful update: the value before and after commit.
 */
template <typename Value> struct Commit {
    Versioned<Value> before;
    Versioned<Value> after;
    int attempts = 1;
};

struct NoCommitHook {
    template <typename C> void operator()(const C&) const noexcept {}
};

template <typename Key, typename Value, typename Hash = std::hash<Key>> class VersionedStore {
public:
    explicit VersionedStore(std::size_t shardCount = 16)
        : shards_(std::max<std::size_t>(1, shardCount)) {}

    VersionedStore(const VersionedStore&) = delete;
    VersionedStore& operator=(const VersionedStore&) = delete;

    std::optional<Versioned<Value>> get(const Key& key) const {
        const auto& shard = shardFor(key);
        std::shared_lock lock(shard.mutex);
        auto it = shard.entries.find(key);
        if (it == shard.entries.end())
            return std::nullopt;
        return it->second;
    }

    bool contains(const Key& key) const {
        const auto& shard = shardFor(key);
        std::shared_lock lock(shard.mutex);
        return shard.entries.count(key) > 0;
    }

    /**
     * @brief Inserts the key at version 1 if absent.
     * @return true when inserted, false when the key already existed (left untouched).
     */
    bool insertIfAbsent(const Key& key, Value value) {
        auto& shard = shardFor(key);
        std::unique_lock lock(shard.mutex);
        auto [it, inserted] = shard.entries.try_emplace(key, Versioned<Value>{std::move(value), 1});
        if (inserted)
            generation_.fetch_add(1, std::memory_order_acq_rel);
        return inserted;
    }

    /**
     * @brief Loads a persisted entry verbatim (value and version).
     *
     * Only replaces an existing entry when the loaded version is newer.
     */
    void load(const Key& key, Versioned<Value> entry) {
        auto& shard = shardFor(key);
        std::unique_lock lock(shard.mutex);
        auto it = shard.entries.find(key);
        if (it == shard.entries.end()) {
            shard.entries.emplace(key, std::move(entry));
        } else if (entry.version > it->second.version) {
            it->second = std::move(entry);
        } else {
            return;
        }
        generation_.fetch_add(1, std::memory_order_acq_rel);
    }

    /**
     * @brief Commits value if the stored version still equals expectedVersion.
     *
     * @return The new version, NotFound for a missing key, or ConcurrencyConflict
     *         when another writer committed first.
     */
    Result<std::uint64_t> compareAndSwap(const Key& key, std::uint64_t expectedVersion,
                                         Value value) {
        NoCommitHook none;
        auto committed = swap(key, expectedVersion, std::move(value), none);
        if (!committed)
            return committed.error();
        return committed.value().after.version;
    }

    /**
     * @brief Read-modify-write with optimistic retry.
     *
     * @param fn Pure function old value -> new value. It may run more than once.
     *           Returning std::nullopt aborts the update without a commit.
     * @param onCommit Called once with the commit record while the key's shard is
     *           still locked, so per-key side effects (audit entries) are ordered
     *           by version. It must not touch this store.
     * @return Commit record, or std::nullopt inside the Result when fn declined.
     *
     * Thread-safe: Yes. Concurrent updates to the same key serialize; none is lost.
     */
    template <typename Fn, typename OnCommit = NoCommitHook>
    Result<std::optional<Commit<Value>>> update(const Key& key, Fn&& fn,
                                                const RetryPolicy& policy = {},
                                                OnCommit&& onCommit = {}) {
        auto backoff = policy.initialBackoff;
        for (int attempt = 1; attempt <= policy.maxAttempts; ++attempt) {
            auto current = get(key);
            if (!current)
                return Error{ErrorCode::NotFound, "versioned key not found"};

            std::optional<Value> next = fn(static_cast<const Value&>(current->value));
            if (!next)
                return std::optional<Commit<Value>>{};

            auto cas = swap(key, current->version, std::move(*next), onCommit, attempt);
            if (cas)
                return std::optional<Commit<Value>>{std::move(cas).value()};
            if (cas.error().code != ErrorCode::ConcurrencyConflict)
                return cas.error();

            conflicts_.fetch_add(1, std::memory_order_relaxed);
            if (attempt < policy.maxAttempts) {
                std::this_thread::sleep_for(backoff);
                backoff = std::min(backoff * 2, policy.maxBackoff);
            }
        }
        return Error{ErrorCode::ConcurrencyConflict,
                     "update retries exhausted after " + std::to_string(policy.maxAttempts) +
                         " attempts"};
    }

    /**
     * @brief Visits every entry; each shard is read under its own shared lock.
     */
    template <typename Fn> void forEach(Fn&& fn) const {
        for (const auto& shard : shards_) {
            std::shared_lock lock(shard.mutex);
            for (const auto& [k, v] : shard.entries)
                fn(k, v);
        }
    }

    std::vector<Key> keys() const {
        std::vector<Key> out;
        forEach([&](const Key& k, const Versioned<Value>&) { out.push_back(k); });
        return out;
    }

    std::size_t size() const {
        std::size_t n = 0;
        for (const auto& shard : shards_) {
            std::shared_lock lock(shard.mutex);
            n += shard.entries.size();
        }
        return n;
    }

    /// Bumped on every committed change; cheap staleness check for derived caches.
    std::uint64_t generation() const noexcept {
        return generation_.load(std::memory_order_acquire);
    }

    std::uint64_t conflictCount() const noexcept {
        return conflicts_.load(std::memory_order_relaxed);
    }

private:
    struct Shard {
        mutable std::shared_mutex mutex;
        std::unordered_map<Key, Versioned<Value>, Hash> entries;
    };

    template <typename OnCommit>
    Result<Commit<Value>> swap(const Key& key, std::uint64_t expectedVersion, Value value,
                               OnCommit& onCommit, int attempt = 1) {
        auto& shard = shardFor(key);
        std::unique_lock lock(shard.mutex);
        auto it = shard.entries.find(key);
        if (it == shard.entries.end())
            return Error{ErrorCode::NotFound, "versioned key not found"};
        if (it->second.version != expectedVersion)
            return Error{ErrorCode::ConcurrencyConflict, "version moved from " +
                                                             std::to_string(expectedVersion) +
                                                             " to " +
                                                             std::to_string(it->second.version)};
        Commit<Value> commit;
        commit.before = it->second;
        commit.attempts = attempt;
        it->second.value = std::move(value);
        ++it->second.version;
        commit.after = it->second;
        generation_.fetch_add(1, std::memory_order_acq_rel);
        onCommit(static_cast<const Commit<Value>&>(commit));
        return commit;
    }

    Shard& shardFor(const Key& key) { return shards_[Hash{}(key) % shards_.size()]; }
    const Shard& shardFor(const Key& key) const { return shards_[Hash{}(key) % shards_.size()]; }

    std::vector<Shard> shards_;
    std::atomic<std::uint64_t> generation_{0};
    std::atomic<std::uint64_t> conflicts_{0};
};

} // namespace rlcf::core
