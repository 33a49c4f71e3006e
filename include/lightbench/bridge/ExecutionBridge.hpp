#pragma once

#include <atomic>
#include <chrono>
#include <exception>
#include <functional>
#include <future>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>

#include "lightbench/core/Errors.hpp"
#include "lightbench/infra/Clock.hpp"

namespace lightbench {

// ---------------------------------------------------------------------------
// Per-submission completion handle. The first call wins; later calls
// (a response racing a timeout) are ignored, so the blocked caller sees
// exactly one result.
// ---------------------------------------------------------------------------
template <typename Result>
class Completion {
public:
    Completion() : state_(std::make_shared<State>()) {}

    bool operator()(Result r) const {
        if (state_->done.exchange(true)) return false;
        state_->promise.set_value(std::move(r));
        return true;
    }

    bool fail(std::exception_ptr e) const {
        if (state_->done.exchange(true)) return false;
        state_->promise.set_exception(std::move(e));
        return true;
    }

    bool done() const { return state_->done.load(); }

    std::future<Result> future() const { return state_->promise.get_future(); }

private:
    struct State {
        std::promise<Result> promise;
        std::atomic<bool> done{false};
    };
    std::shared_ptr<State> state_;
};

// ---------------------------------------------------------------------------
// ExecutionBridge
//
// Owns one background thread running one single-threaded io_context and
// one Session bound to it. Worker threads never touch the io_context or
// the session: they hand a closure to submit() and block on its
// completion handle. Closures run on the bridge thread in arrival order
// but may complete in any order.
//
// The Session is created on the bridge thread. If that does not happen
// within the startup grace period the constructor throws
// BridgeStartupError.
//
// submit() must not be called from the bridge thread itself.
// ---------------------------------------------------------------------------
template <typename Session>
class ExecutionBridge {
public:
    using SessionFactory =
        std::function<std::unique_ptr<Session>(boost::asio::io_context&)>;

    ExecutionBridge(std::string name,
                    SessionFactory factory,
                    std::chrono::milliseconds startup_grace)
        : name_(std::move(name)), rt_(std::make_shared<Runtime>()) {

        auto ready = std::make_shared<std::promise<void>>();
        std::future<void> ready_f = ready->get_future();

        thread_ = std::thread([rt = rt_, factory = std::move(factory),
                               ready, tag = name_]() {
            try {
                rt->session = factory(rt->ioc);
            } catch (...) {
                ready->set_exception(std::current_exception());
                return;
            }
            auto guard = boost::asio::make_work_guard(rt->ioc);
            ready->set_value();

            while (!rt->ioc.stopped()) {
                try {
                    rt->ioc.run();
                } catch (const std::exception& e) {
                    std::cerr << "[BRIDGE] " << tag
                              << " handler escaped: " << e.what() << "\n";
                }
            }
            rt->session.reset();
        });

        if (ready_f.wait_for(startup_grace) != std::future_status::ready) {
            // The factory may still be blocked; the thread keeps its own
            // reference to the runtime and exits once the factory returns.
            rt_->ioc.stop();
            thread_.detach();
            throw BridgeStartupError(
                name_ + ": background loop failed to start within " +
                std::to_string(startup_grace.count()) + "ms");
        }

        try {
            ready_f.get();
        } catch (const std::exception& e) {
            thread_.join();
            throw BridgeStartupError(name_ + ": " + e.what());
        }

        std::cout << "[BRIDGE] " << name_ << " loop started\n";
    }

    ~ExecutionBridge() {
        rt_->ioc.stop();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    ExecutionBridge(const ExecutionBridge&) = delete;
    ExecutionBridge& operator=(const ExecutionBridge&) = delete;

    const std::string& name() const { return name_; }

    // Runs work(session, completion) on the bridge thread and waits up to
    // timeout for the completion. Returns nullopt on timeout. An exception
    // thrown by work, or passed to completion.fail(), is rethrown here.
    template <typename Result, typename Work>
    std::optional<Result> submit(Work work, infra::MonoDur timeout) {
        Completion<Result> done;
        std::future<Result> fut = done.future();

        boost::asio::post(rt_->ioc,
            [rt = rt_, work = std::move(work), done]() mutable {
                try {
                    work(*rt->session, done);
                } catch (...) {
                    done.fail(std::current_exception());
                }
            });

        if (fut.wait_for(timeout) != std::future_status::ready) {
            return std::nullopt;
        }
        return fut.get();
    }

private:
    struct Runtime {
        boost::asio::io_context ioc{1};
        std::unique_ptr<Session> session;
    };

    std::string name_;
    std::shared_ptr<Runtime> rt_;
    std::thread thread_;
};

// ---------------------------------------------------------------------------
// One lazily created bridge shared by every caller of get(). The first call
// builds it under the lock, so concurrent first calls still start exactly
// one loop. If the start fails the slot stays empty and a later call
// retries. The factory and grace of the first successful call win.
// ---------------------------------------------------------------------------
template <typename Session>
class SharedBridge {
public:
    using Bridge = ExecutionBridge<Session>;

    explicit SharedBridge(std::string name) : name_(std::move(name)) {}

    SharedBridge(const SharedBridge&) = delete;
    SharedBridge& operator=(const SharedBridge&) = delete;

    // Throws BridgeStartupError.
    Bridge& get(typename Bridge::SessionFactory factory,
                std::chrono::milliseconds startup_grace) {
        std::lock_guard<std::mutex> lock(mtx_);
        if (!bridge_) {
            bridge_ = std::make_unique<Bridge>(name_, std::move(factory), startup_grace);
        }
        return *bridge_;
    }

    bool started() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return bridge_ != nullptr;
    }

private:
    std::string name_;
    mutable std::mutex mtx_;
    std::unique_ptr<Bridge> bridge_;
};

} // namespace lightbench
