#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <thread>
#include <vector>

#include "lightbench/metrics/MetricsSink.hpp"
#include "lightbench/protocol/ProtocolAdapter.hpp"

namespace lightbench {

enum class UserState : uint8_t {
    Idle,
    Requesting,
    Waiting,
    Stopped
};

const char* userStateName(UserState s);

struct HarnessOptions {
    int users = 10;
    double spawn_rate = 2.0;                    // users started per second
    std::chrono::milliseconds duration{60000};  // 0 = until stop()
    std::chrono::milliseconds think_min{10};
    std::chrono::milliseconds think_max{50};
    std::string vehicle = "roadrunner";
    uint64_t seed = 0;                          // 0 = non-deterministic
};

// ---------------------------------------------------------------------------
// LoadHarness
//
// Virtual users, one thread each, ramped up at spawn_rate. A user loops
//   Requesting (adapter.fetch) -> record -> Waiting (think-time) -> ...
// until the run duration elapses or stop() is called. stop() wakes users
// out of their think-time immediately; a request in flight is left to
// complete or time out, and its outcome is still recorded.
//
// Users of one run are assigned to adapters by smooth weighted round robin.
// ---------------------------------------------------------------------------
class LoadHarness {
public:
    explicit LoadHarness(MetricsSink& sink);
    ~LoadHarness();

    LoadHarness(const LoadHarness&) = delete;
    LoadHarness& operator=(const LoadHarness&) = delete;

    void start(int users, double spawn_rate,
               std::chrono::milliseconds duration, AdapterPtr adapter);

    // Throws std::invalid_argument on a non-positive user count or spawn
    // rate, or when no adapter has a positive weight. Throws
    // std::logic_error if a run is already in progress.
    void start(const HarnessOptions& opts, std::vector<WeightedAdapter> adapters);

    // Request cancellation. Returns immediately.
    void stop();

    // Blocks until every user has stopped.
    void wait();

    // Blocks up to timeout; true if the run has finished.
    bool waitFor(std::chrono::milliseconds timeout);

    bool running() const { return running_.load(); }
    bool stopRequested() const;

    int activeUsers() const { return active_.load(); }
    size_t spawnedUsers() const;
    UserState userState(size_t index) const;
    uint64_t userCompleted(size_t index) const;

    // Adapter index per user slot for the given weights.
    static std::vector<size_t> assignUsers(const std::vector<WeightedAdapter>& adapters,
                                           int users);

    // Delay of the index-th spawn after the start of a run, capped at
    // MAX_SPAWN_OFFSET_S.
    static std::chrono::steady_clock::duration spawnOffset(size_t index, double spawn_rate);

    static constexpr double MAX_SPAWN_OFFSET_S = 365.0 * 24 * 3600;

private:
    struct User {
        size_t index = 0;
        AdapterPtr adapter;
        std::mt19937_64 rng;
        std::atomic<UserState> state{UserState::Idle};
        std::atomic<uint64_t> completed{0};
        std::thread thread;
    };

    void spawnLoop(std::vector<size_t> plan);
    void runUser(User& u);
    std::chrono::milliseconds drawThink(std::mt19937_64& rng) const;
    void finish();

    MetricsSink& sink_;
    HarnessOptions opts_;
    std::vector<WeightedAdapter> adapters_;

    mutable std::mutex users_mtx_;
    std::vector<std::unique_ptr<User>> users_;

    mutable std::mutex stop_mtx_;
    std::condition_variable stop_cv_;
    bool stop_requested_ = false;

    std::mutex done_mtx_;
    std::condition_variable done_cv_;
    bool done_ = true;

    std::atomic<bool> running_{false};
    std::atomic<int> active_{0};
    std::thread spawner_;
};

} // namespace lightbench
