#include "db/operation_gate.hpp"
#include "core/error.hpp"

namespace dbaccess {

void OperationGate::Ticket::release() noexcept {
    if (gate_) {
        gate_->leave();
        gate_.reset();
    }
}

OperationGate::Ticket OperationGate::enter(std::chrono::steady_clock::time_point deadline) {
    std::unique_lock lock(mutex_);

    const bool available = cv_.wait_until(lock, deadline, [this] {
        return closing_ || !busy_;
    });

    if (closing_) {
        throw ConnectionError("Connection is closing");
    }
    if (!available) {
        throw TimeoutError("Timed out waiting for the connection's in-flight operation");
    }

    busy_ = true;
    return Ticket(shared_from_this());
}

bool OperationGate::close() {
    std::unique_lock lock(mutex_);
    const bool first = !closing_;
    closing_ = true;
    // Wake waiters so they observe closing_ and bail out
    cv_.notify_all();
    cv_.wait(lock, [this] { return !busy_; });
    return first;
}

bool OperationGate::is_closing() const {
    std::lock_guard lock(mutex_);
    return closing_;
}

bool OperationGate::is_busy() const {
    std::lock_guard lock(mutex_);
    return busy_;
}

void OperationGate::leave() noexcept {
    {
        std::lock_guard lock(mutex_);
        busy_ = false;
    }
    cv_.notify_all();
}

} // namespace dbaccess
