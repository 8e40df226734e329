#include <rlcf/learning/decay_manager.h>
#include <rlcf/weights/parameter_store.h>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <spdlog/spdlog.h>

#include <mutex>

namespace rlcf::learning {

struct DecayManager::State {
    Config config;
    Dependencies deps;
    std::atomic<bool> running{false};
    std::atomic<std::uint64_t> sweeps{0};
    std::mutex timerMutex;
    std::shared_ptr<boost::asio::steady_timer> timer;

    TimePoint now() const { return deps.clock ? deps.clock() : std::chrono::system_clock::now(); }

    SweepReport sweep(TimePoint at) {
        SweepReport report;
        if (!deps.store)
            return report;

        for (const auto& key : deps.store->traversalKeys()) {
            ++report.examined;
            if (config.excluded.count({key.strategy, key.relation}) > 0) {
                ++report.skipped;
                continue;
            }
            auto r = deps.store->decayTraversal(key.strategy, key.relation, at, config.rate,
                                                config.reinforcement_grace);
            if (!r) {
                ++report.failed;
                spdlog::warn("[DecayManager] {}/{}: {}", weights::strategyName(key.strategy),
                             key.relation, r.error().message);
                continue;
            }
            if (r.value() && r.value()->changed)
                ++report.decayed;
            else
                ++report.skipped;
        }
        sweeps.fetch_add(1, std::memory_order_relaxed);
        spdlog::info("[DecayManager] Sweep: examined={} decayed={} skipped={} failed={}",
                     report.examined, report.decayed, report.skipped, report.failed);
        return report;
    }
};

DecayManager::DecayManager(Config config, Dependencies deps)
    : state_(std::make_shared<State>()) {
    state_->config = std::move(config);
    state_->deps = std::move(deps);
}

DecayManager::~DecayManager() {
    if (state_->running.load(std::memory_order_acquire)) {
        stop();
    }
}

void DecayManager::start() {
    if (!state_->config.enabled) {
        spdlog::debug("[DecayManager] Disabled, not starting");
        return;
    }
    if (!state_->deps.executor) {
        spdlog::warn("[DecayManager] No executor supplied, scheduled sweeps unavailable");
        return;
    }
    bool expected = false;
    if (!state_->running.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        spdlog::debug("[DecayManager] Already running, skipping start");
        return;
    }

    spdlog::info("[DecayManager] Starting decay task (interval={}s, rate={})",
                 state_->config.interval.count(), state_->config.rate);

    auto timer = std::make_shared<boost::asio::steady_timer>(state_->deps.executor);
    {
        std::lock_guard<std::mutex> lock(state_->timerMutex);
        state_->timer = timer;
    }

    auto state = state_;
    boost::asio::co_spawn(
        state->deps.executor,
        [state, timer]() -> boost::asio::awaitable<void> {
            while (state->running.load(std::memory_order_acquire)) {
                timer->expires_after(state->config.interval);
                try {
                    co_await timer->async_wait(boost::asio::use_awaitable);
                } catch (const boost::system::system_error& e) {
                    if (e.code() == boost::asio::error::operation_aborted) {
                        break;
                    }
                    throw;
                }
                if (!state->running.load(std::memory_order_acquire))
                    break;
                state->sweep(state->now());
            }

            spdlog::debug("[DecayManager] Decay loop stopped");
            co_return;
        },
        boost::asio::detached);
}

void DecayManager::stop() {
    bool expected = true;
    if (!state_->running.compare_exchange_strong(expected, false, std::memory_order_acq_rel)) {
        spdlog::debug("[DecayManager] Not running, skipping stop");
        return;
    }

    spdlog::info("[DecayManager] Stopping decay task");
    std::shared_ptr<boost::asio::steady_timer> timer;
    {
        std::lock_guard<std::mutex> lock(state_->timerMutex);
        timer = std::move(state_->timer);
    }
    if (timer) {
        // timer operations must run on the timer's executor
        boost::asio::post(state_->deps.executor, [timer]() { timer->cancel(); });
    }
}

bool DecayManager::isRunning() const noexcept {
    return state_->running.load(std::memory_order_acquire);
}

SweepReport DecayManager::sweepNow() {
    return state_->sweep(state_->now());
}

SweepReport DecayManager::sweepAt(TimePoint now) {
    return state_->sweep(now);
}

std::uint64_t DecayManager::sweepCount() const noexcept {
    return state_->sweeps.load(std::memory_order_relaxed);
}

} // namespace rlcf::learning
