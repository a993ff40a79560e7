#include <catch2/catch_test_macros.hpp>
#include "db/operation_gate.hpp"
#include "core/error.hpp"

#include <atomic>
#include <future>
#include <thread>

using namespace dbaccess;
using namespace std::chrono_literals;

namespace {

std::chrono::steady_clock::time_point in(std::chrono::milliseconds d) {
    return std::chrono::steady_clock::now() + d;
}

} // namespace

TEST_CASE("OperationGate admits one holder at a time", "[gate]") {
    auto gate = std::make_shared<OperationGate>();

    auto ticket = gate->enter(in(100ms));
    CHECK(ticket.valid());
    CHECK(gate->is_busy());

    CHECK_THROWS_AS(gate->enter(in(50ms)), TimeoutError);

    ticket.release();
    CHECK_FALSE(ticket.valid());
    CHECK_FALSE(gate->is_busy());

    auto again = gate->enter(in(50ms));
    CHECK(again.valid());
}

TEST_CASE("OperationGate ticket leaves on destruction and survives moves", "[gate]") {
    auto gate = std::make_shared<OperationGate>();
    {
        auto first = gate->enter(in(100ms));
        OperationGate::Ticket moved = std::move(first);
        CHECK_FALSE(first.valid());
        CHECK(moved.valid());
        CHECK(gate->is_busy());
    }
    CHECK_FALSE(gate->is_busy());
}

TEST_CASE("OperationGate waiter gets in once the holder leaves", "[gate]") {
    auto gate = std::make_shared<OperationGate>();
    auto ticket = gate->enter(in(100ms));

    auto waiter = std::async(std::launch::async, [gate] {
        auto t = gate->enter(in(2000ms));
        return t.valid();
    });

    std::this_thread::sleep_for(50ms);
    ticket.release();
    CHECK(waiter.get());
}

TEST_CASE("OperationGate close rejects new entries", "[gate]") {
    auto gate = std::make_shared<OperationGate>();

    CHECK(gate->close());
    CHECK(gate->is_closing());
    CHECK_FALSE(gate->close());  // second call is a no-op

    CHECK_THROWS_AS(gate->enter(in(50ms)), ConnectionError);
}

TEST_CASE("OperationGate close waits for the in-flight holder", "[gate]") {
    auto gate = std::make_shared<OperationGate>();
    auto ticket = gate->enter(in(100ms));

    std::atomic<bool> closed{false};
    std::thread closer([&] {
        gate->close();
        closed = true;
    });

    std::this_thread::sleep_for(100ms);
    CHECK_FALSE(closed.load());

    ticket.release();
    closer.join();
    CHECK(closed.load());
}

TEST_CASE("OperationGate waiters are turned away once close starts", "[gate]") {
    auto gate = std::make_shared<OperationGate>();
    auto ticket = gate->enter(in(100ms));

    auto waiter = std::async(std::launch::async, [gate] {
        try {
            auto t = gate->enter(in(5000ms));
            return ErrorCode::NONE;
        } catch (const DbError& e) {
            return e.code();
        }
    });
    std::this_thread::sleep_for(50ms);

    std::thread closer([gate] { gate->close(); });

    CHECK(waiter.get() == ErrorCode::CONNECTION_ERROR);
    ticket.release();
    closer.join();
}
