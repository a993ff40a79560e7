#pragma once

#include <utility> // std::exchange, used by boost/asio/awaitable.hpp (Boost 1.74)
#include <boost/asio/awaitable.hpp>

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace dbaccess {

/**
 * @brief Single in-flight-operation guard for one engine instance
 *
 * Native connections are not safe for concurrent use, so at most one
 * operation holds the gate at a time. Once close() starts, new entries are
 * rejected with ConnectionError and close() waits for the holder to leave.
 */
class OperationGate : public std::enable_shared_from_this<OperationGate> {
public:
    /**
     * @brief Move-only proof of entry; leaving happens on destruction
     */
    class Ticket {
    public:
        Ticket() = default;
        ~Ticket() { release(); }

        Ticket(Ticket&& other) noexcept : gate_(std::move(other.gate_)) {}
        Ticket& operator=(Ticket&& other) noexcept {
            if (this != &other) {
                release();
                gate_ = std::move(other.gate_);
            }
            return *this;
        }

        Ticket(const Ticket&) = delete;
        Ticket& operator=(const Ticket&) = delete;

        [[nodiscard]] bool valid() const noexcept { return gate_ != nullptr; }

        void release() noexcept;

    private:
        friend class OperationGate;
        explicit Ticket(std::shared_ptr<OperationGate> gate) : gate_(std::move(gate)) {}

        std::shared_ptr<OperationGate> gate_;
    };

    /**
     * @brief Wait for the gate to be free and take it
     * @throws ConnectionError if the gate is closing or closed
     * @throws TimeoutError if the gate is still held at the deadline
     */
    [[nodiscard]] Ticket enter(std::chrono::steady_clock::time_point deadline);

    /**
     * @brief Reject new entries and wait for the current holder to leave
     * @return true for the call that actually closed the gate
     */
    bool close();

    [[nodiscard]] bool is_closing() const;
    [[nodiscard]] bool is_busy() const;

private:
    void leave() noexcept;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool busy_ = false;
    bool closing_ = false;
};

/**
 * @brief Keep an engine and its gate ticket alive for the whole operation
 *
 * Owner is held so the coroutine's `this` stays valid even when the caller
 * stopped waiting and the connection was removed from its manager.
 */
template <typename T, typename Owner>
boost::asio::awaitable<T> guarded(std::shared_ptr<Owner> owner,
                                  OperationGate::Ticket ticket,
                                  boost::asio::awaitable<T> operation) {
    // Locals are destroyed before parameters: the gate opens while the owner still lives
    auto held = std::move(ticket);
    (void)owner;
    co_return co_await std::move(operation);
}

} // namespace dbaccess
