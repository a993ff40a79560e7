#pragma once

#include "core/error.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/use_future.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <format>
#include <future>
#include <mutex>
#include <thread>
#include <type_traits>

namespace dbaccess {

namespace asio = boost::asio;

/**
 * @brief Runs asynchronous adapter operations on behalf of blocking callers
 *
 * Owns one long-lived io_context, driven by a single thread, that every
 * adapter shares. Adapter operations are coroutines suspended only while
 * they await driver I/O, so unrelated operations interleave freely on it.
 * Drivers with no asynchronous API push their blocking calls onto a
 * separate thread_pool through offload().
 *
 * Dispatch threads call run_to_completion() and block until the coroutine
 * finishes or the deadline passes. On timeout the coroutine keeps running;
 * its result lands in a promise nobody reads and is freed with it.
 *
 * Holds no per-connection state.
 */
class ExecutionBridge {
public:
    struct Config {
        size_t blocking_threads = 4;
        std::chrono::milliseconds default_timeout{30000};
    };

    ExecutionBridge();
    explicit ExecutionBridge(const Config& config);
    ~ExecutionBridge();

    ExecutionBridge(const ExecutionBridge&) = delete;
    ExecutionBridge& operator=(const ExecutionBridge&) = delete;

    /**
     * @brief Submit a coroutine and block until it completes
     * @return The coroutine's value; its exception is rethrown unchanged
     * @throws TimeoutError when the deadline passes first
     * @throws ConnectionError after stop()
     * @throws std::logic_error when called from the execution context itself
     */
    template <typename T>
    T run_to_completion(asio::awaitable<T> operation, std::chrono::milliseconds timeout);

    template <typename T>
    T run_to_completion(asio::awaitable<T> operation) {
        return run_to_completion(std::move(operation), config_.default_timeout);
    }

    /**
     * @brief Run a blocking callable on the offload pool and await its result
     *
     * Must be awaited from a coroutine running on this bridge.
     */
    template <typename F>
    asio::awaitable<std::invoke_result_t<F&>> offload(F fn);

    [[nodiscard]] asio::io_context::executor_type executor() noexcept {
        return io_.get_executor();
    }

    /// True on the thread that drives the execution context
    [[nodiscard]] bool running_in_context() const noexcept;

    /**
     * @brief Stop the execution context and join its threads (idempotent)
     *
     * Coroutines still suspended are destroyed without resuming.
     */
    void stop();

    [[nodiscard]] bool is_stopped() const noexcept {
        return stopped_.load(std::memory_order_acquire);
    }

    /// Number of operations whose caller gave up waiting
    [[nodiscard]] uint64_t abandoned_count() const noexcept {
        return abandoned_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] const Config& config() const noexcept { return config_; }

private:
    void check_callable() const;
    void note_abandoned(std::chrono::milliseconds timeout);

    Config config_;
    asio::io_context io_;
    asio::executor_work_guard<asio::io_context::executor_type> work_guard_;
    asio::thread_pool blocking_pool_;
    std::thread io_thread_;
    std::thread::id io_thread_id_;

    std::atomic<bool> stopped_{false};
    std::atomic<uint64_t> abandoned_{0};
    std::mutex stop_mutex_;
};

// ============================================================================
// Template implementation
// ============================================================================

template <typename T>
T ExecutionBridge::run_to_completion(asio::awaitable<T> operation,
                                     std::chrono::milliseconds timeout) {
    check_callable();

    std::future<T> future = asio::co_spawn(io_, std::move(operation), asio::use_future);

    if (future.wait_for(timeout) == std::future_status::timeout) {
        note_abandoned(timeout);
        throw TimeoutError(std::format(
            "Operation did not complete within {} ms", timeout.count()));
    }
    return future.get();
}

template <typename F>
asio::awaitable<std::invoke_result_t<F&>> ExecutionBridge::offload(F fn) {
    using R = std::invoke_result_t<F&>;
    static_assert(!std::is_void_v<R>, "offloaded callables must return a value");

    co_return co_await asio::co_spawn(
        blocking_pool_.get_executor(),
        [fn = std::move(fn)]() mutable -> asio::awaitable<R> {
            co_return fn();
        },
        asio::use_awaitable);
}

} // namespace dbaccess
