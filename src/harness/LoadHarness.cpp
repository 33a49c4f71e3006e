#include "lightbench/harness/LoadHarness.hpp"
#include "lightbench/infra/Debug.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace lightbench {

const char* userStateName(UserState s) {
    switch (s) {
    case UserState::Idle:       return "Idle";
    case UserState::Requesting: return "Requesting";
    case UserState::Waiting:    return "Waiting";
    case UserState::Stopped:    return "Stopped";
    }
    return "?";
}

LoadHarness::LoadHarness(MetricsSink& sink) : sink_(sink) {}

LoadHarness::~LoadHarness() {
    stop();
    wait();
}

void LoadHarness::start(int users, double spawn_rate,
                        std::chrono::milliseconds duration, AdapterPtr adapter) {
    HarnessOptions opts;
    opts.users = users;
    opts.spawn_rate = spawn_rate;
    opts.duration = duration;
    start(opts, {WeightedAdapter{std::move(adapter), 1}});
}

std::vector<size_t> LoadHarness::assignUsers(const std::vector<WeightedAdapter>& adapters,
                                             int users) {
    long total = 0;
    for (const auto& a : adapters) {
        if (a.adapter && a.weight > 0) total += a.weight;
    }
    if (total == 0) {
        throw std::invalid_argument("[HARNESS] no adapter with a positive weight");
    }

    std::vector<long> current(adapters.size(), 0);
    std::vector<size_t> plan;
    plan.reserve(users > 0 ? static_cast<size_t>(users) : 0);

    for (int u = 0; u < users; ++u) {
        size_t best = adapters.size();
        for (size_t i = 0; i < adapters.size(); ++i) {
            if (!adapters[i].adapter || adapters[i].weight <= 0) continue;
            current[i] += adapters[i].weight;
            if (best == adapters.size() || current[i] > current[best]) best = i;
        }
        current[best] -= total;
        plan.push_back(best);
    }
    return plan;
}

void LoadHarness::start(const HarnessOptions& opts, std::vector<WeightedAdapter> adapters) {
    if (opts.users <= 0) {
        throw std::invalid_argument("[HARNESS] user count must be positive");
    }
    if (!(opts.spawn_rate > 0.0)) {
        throw std::invalid_argument("[HARNESS] spawn rate must be positive");
    }
    std::vector<size_t> plan = assignUsers(adapters, opts.users);

    if (running_.exchange(true)) {
        throw std::logic_error("[HARNESS] a run is already in progress");
    }
    if (spawner_.joinable()) spawner_.join();

    opts_ = opts;
    if (opts_.think_max < opts_.think_min) std::swap(opts_.think_min, opts_.think_max);
    if (opts_.think_min.count() < 0) opts_.think_min = std::chrono::milliseconds(0);
    adapters_ = std::move(adapters);

    {
        std::lock_guard<std::mutex> lock(users_mtx_);
        users_.clear();
    }
    {
        std::lock_guard<std::mutex> lock(stop_mtx_);
        stop_requested_ = false;
    }
    {
        std::lock_guard<std::mutex> lock(done_mtx_);
        done_ = false;
    }

    std::cout << "[HARNESS] Starting " << opts_.users << " users at "
              << opts_.spawn_rate << "/s, duration "
              << (opts_.duration.count() > 0
                      ? std::to_string(opts_.duration.count()) + "ms"
                      : std::string("unbounded"))
              << ", think " << opts_.think_min.count() << "-"
              << opts_.think_max.count() << "ms\n";

    spawner_ = std::thread([this, plan = std::move(plan)]() mutable {
        spawnLoop(std::move(plan));
    });
}

void LoadHarness::stop() {
    {
        std::lock_guard<std::mutex> lock(stop_mtx_);
        if (stop_requested_) return;
        stop_requested_ = true;
    }
    stop_cv_.notify_all();
}

bool LoadHarness::stopRequested() const {
    std::lock_guard<std::mutex> lock(stop_mtx_);
    return stop_requested_;
}

void LoadHarness::wait() {
    {
        std::unique_lock<std::mutex> lock(done_mtx_);
        done_cv_.wait(lock, [this] { return done_; });
    }
    if (spawner_.joinable()) spawner_.join();
}

bool LoadHarness::waitFor(std::chrono::milliseconds timeout) {
    {
        std::unique_lock<std::mutex> lock(done_mtx_);
        if (!done_cv_.wait_for(lock, timeout, [this] { return done_; })) return false;
    }
    if (spawner_.joinable()) spawner_.join();
    return true;
}

size_t LoadHarness::spawnedUsers() const {
    std::lock_guard<std::mutex> lock(users_mtx_);
    return users_.size();
}

UserState LoadHarness::userState(size_t index) const {
    std::lock_guard<std::mutex> lock(users_mtx_);
    if (index >= users_.size()) return UserState::Idle;
    return users_[index]->state.load();
}

uint64_t LoadHarness::userCompleted(size_t index) const {
    std::lock_guard<std::mutex> lock(users_mtx_);
    if (index >= users_.size()) return 0;
    return users_[index]->completed.load();
}

std::chrono::milliseconds LoadHarness::drawThink(std::mt19937_64& rng) const {
    std::uniform_int_distribution<long long> dist(opts_.think_min.count(),
                                                  opts_.think_max.count());
    return std::chrono::milliseconds(dist(rng));
}

std::chrono::steady_clock::duration LoadHarness::spawnOffset(size_t index, double spawn_rate) {
    // Computed in seconds and capped before the cast, so tiny rates or large
    // user indices cannot overflow the clock's tick count.
    double secs = static_cast<double>(index) / spawn_rate;
    if (!(secs < MAX_SPAWN_OFFSET_S)) secs = MAX_SPAWN_OFFSET_S;
    return std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        std::chrono::duration<double>(secs));
}

void LoadHarness::spawnLoop(std::vector<size_t> plan) {
    const auto t0 = std::chrono::steady_clock::now();
    const auto deadline = t0 + opts_.duration;
    const bool bounded = opts_.duration.count() > 0;

    std::random_device rd;

    for (size_t i = 0; i < plan.size(); ++i) {
        auto next = t0 + spawnOffset(i, opts_.spawn_rate);
        if (bounded && next > deadline) next = deadline;
        {
            std::unique_lock<std::mutex> lock(stop_mtx_);
            if (stop_cv_.wait_until(lock, next, [this] { return stop_requested_; })) break;
        }
        if (bounded && std::chrono::steady_clock::now() >= deadline) break;

        auto user = std::make_unique<User>();
        user->index = i;
        user->adapter = adapters_[plan[i]].adapter;
        user->rng.seed(opts_.seed ? opts_.seed + i
                                  : (static_cast<uint64_t>(rd()) << 32) | rd());

        User& ref = *user;
        {
            std::lock_guard<std::mutex> lock(users_mtx_);
            users_.push_back(std::move(user));
        }
        ++active_;
        ref.thread = std::thread([this, &ref] { runUser(ref); });

        if (infra::debugEnabled()) {
            std::cout << "[HARNESS] Spawned user " << i << " ("
                      << ref.adapter->label() << ")\n";
        }
    }

    std::cout << "[HARNESS] " << spawnedUsers() << " users running\n";

    {
        std::unique_lock<std::mutex> lock(stop_mtx_);
        if (bounded) {
            stop_cv_.wait_until(lock, deadline, [this] { return stop_requested_; });
        } else {
            stop_cv_.wait(lock, [this] { return stop_requested_; });
        }
    }
    stop();
    finish();
}

void LoadHarness::runUser(User& u) {
    const std::string& vehicle = opts_.vehicle;

    while (!stopRequested()) {
        u.state = UserState::Requesting;
        RequestOutcome outcome = u.adapter->fetch(vehicle);
        sink_.record(outcome);
        ++u.completed;

        if (infra::debugEnabled() && !outcome.success) {
            std::cerr << "[HARNESS] user " << u.index << " " << outcome.protocol
                      << " " << errorClassName(outcome.failureClass())
                      << ": " << outcome.detail << "\n";
        }

        u.state = UserState::Waiting;
        const auto think = drawThink(u.rng);
        std::unique_lock<std::mutex> lock(stop_mtx_);
        if (stop_cv_.wait_for(lock, think, [this] { return stop_requested_; })) break;
    }

    u.state = UserState::Stopped;
    --active_;
}

void LoadHarness::finish() {
    std::vector<User*> users;
    {
        std::lock_guard<std::mutex> lock(users_mtx_);
        for (auto& u : users_) users.push_back(u.get());
    }
    for (User* u : users) {
        if (u->thread.joinable()) u->thread.join();
    }

    uint64_t total = 0;
    for (User* u : users) total += u->completed.load();
    std::cout << "[HARNESS] Stopped " << users.size() << " users after "
              << total << " requests\n";

    running_ = false;
    {
        std::lock_guard<std::mutex> lock(done_mtx_);
        done_ = true;
    }
    done_cv_.notify_all();
}

} // namespace lightbench
