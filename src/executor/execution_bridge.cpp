#include "executor/execution_bridge.hpp"
#include "core/utils.hpp"

#include <format>
#include <stdexcept>

namespace dbaccess {

ExecutionBridge::ExecutionBridge() : ExecutionBridge(Config{}) {}

ExecutionBridge::ExecutionBridge(const Config& config)
    : config_(config),
      io_(1),
      work_guard_(asio::make_work_guard(io_)),
      blocking_pool_(config.blocking_threads == 0 ? 1 : config.blocking_threads) {

    io_thread_ = std::thread([this] {
        // A throwing handler must not take the shared context down with it
        for (;;) {
            try {
                io_.run();
                break;
            } catch (const std::exception& e) {
                utils::log::error(std::format("Execution context handler failed: {}", e.what()));
            }
        }
    });
    io_thread_id_ = io_thread_.get_id();

    utils::log::info(std::format("Execution bridge started ({} offload threads)",
        config_.blocking_threads == 0 ? 1 : config_.blocking_threads));
}

ExecutionBridge::~ExecutionBridge() {
    stop();
}

bool ExecutionBridge::running_in_context() const noexcept {
    return std::this_thread::get_id() == io_thread_id_;
}

void ExecutionBridge::stop() {
    std::lock_guard<std::mutex> lock(stop_mutex_);
    if (stopped_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    work_guard_.reset();
    io_.stop();
    if (io_thread_.joinable()) {
        io_thread_.join();
    }
    blocking_pool_.stop();
    blocking_pool_.join();

    utils::log::info(std::format("Execution bridge stopped ({} abandoned operations)",
        abandoned_.load(std::memory_order_relaxed)));
}

void ExecutionBridge::check_callable() const {
    if (stopped_.load(std::memory_order_acquire)) {
        throw ConnectionError("Execution context has been stopped");
    }
    // Blocking the only context thread on its own work would never return
    if (running_in_context()) {
        throw std::logic_error("run_to_completion called from inside the execution context");
    }
}

void ExecutionBridge::note_abandoned(std::chrono::milliseconds timeout) {
    abandoned_.fetch_add(1, std::memory_order_relaxed);
    utils::log::warn(std::format(
        "Operation abandoned after {} ms; it will finish in the background", timeout.count()));
}

} // namespace dbaccess
