#pragma once

#include <rlcf/core/types.h>
#include <rlcf/weights/weight_schema.h>

#include <boost/asio/any_io_executor.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <set>
#include <string>
#include <utility>

namespace rlcf::weights {
class ParameterStore;
}

namespace rlcf::learning {

struct SweepReport {
    std::size_t examined = 0;
    std::size_t decayed = 0;
    std::size_t skipped = 0; // reinforced within grace, excluded, or already at prior
    std::size_t failed = 0;
};

/**
 * Scheduled pull of traversal weights back toward their priors. Only traversal
 * weights decay; alpha, gating and rerank parameters are left alone.
 */
class DecayManager {
public:
    struct Config {
        double rate = 0.995;
        std::chrono::seconds interval{86400};
        std::chrono::hours reinforcement_grace{24};
        bool enabled = true;
        std::set<std::pair<weights::StrategyId, std::string>> excluded;

        bool isValid() const { return rate > 0.0 && rate <= 1.0 && interval.count() > 0; }
    };

    struct Dependencies {
        std::shared_ptr<weights::ParameterStore> store;
        boost::asio::any_io_executor executor;
        std::function<TimePoint()> clock;
    };

    DecayManager(Config config, Dependencies deps);
    ~DecayManager();

    DecayManager(const DecayManager&) = delete;
    DecayManager& operator=(const DecayManager&) = delete;

    // Spawns the periodic sweep on the executor; no-op when disabled or running.
    void start();
    // Cancels the pending wait without blocking; a sweep already in progress runs to completion.
    void stop();

    bool isRunning() const noexcept;

    SweepReport sweepNow();
    SweepReport sweepAt(TimePoint now);

    std::uint64_t sweepCount() const noexcept;

private:
    struct State;
    std::shared_ptr<State> state_;
};

} // namespace rlcf::learning
