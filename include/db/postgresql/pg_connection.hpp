#pragma once

#include "core/error.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>

#include <libpq-fe.h>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dbaccess {

// RAII wrappers for libpq resources
struct PGConnDeleter {
    void operator()(PGconn* conn) const noexcept {
        if (conn) {
            PQfinish(conn);
        }
    }
};
using PGConnPtr = std::unique_ptr<PGconn, PGConnDeleter>;

struct PGResultDeleter {
    void operator()(PGresult* res) const noexcept {
        if (res) {
            PQclear(res);
        }
    }
};
using PGResultPtr = std::unique_ptr<PGresult, PGResultDeleter>;

/**
 * @brief Error kind for a SQLSTATE code
 *
 * Class 08 and 57P01..57P03 are connection failures, class 42 is a
 * syntax or access-rule error, 57014 is a cancelled statement.
 */
[[nodiscard]] ErrorCode classify_sqlstate(std::string_view sqlstate);

/**
 * @brief Throw the typed error for a SQLSTATE and backend message
 */
[[noreturn]] void throw_sql_error(std::string_view sqlstate, const std::string& message);

/**
 * @brief One non-blocking libpq connection driven by the shared io_context
 *
 * Every wait on the server socket suspends the calling coroutine instead of
 * a thread. Not safe for concurrent use; one operation at a time.
 */
class PgConnection {
public:
    using Clock = std::chrono::steady_clock;

    PgConnection() = default;
    ~PgConnection() = default;

    PgConnection(const PgConnection&) = delete;
    PgConnection& operator=(const PgConnection&) = delete;

    /**
     * @brief Check that libpq accepts the connection string
     * @throws InvalidArgumentError with libpq's parse message
     */
    static void validate_conninfo(const std::string& conninfo);

    /**
     * @brief Open the connection with PQconnectStart/PQconnectPoll
     * @throws ConnectionError on failure, TimeoutError past the deadline
     */
    boost::asio::awaitable<void> connect(std::string conninfo, Clock::duration timeout);

    /**
     * @brief Send query text (possibly several statements) and collect every result
     *
     * COPY streams are refused: COPY IN is aborted and COPY OUT drained, then
     * DriverError is raised with the connection still usable.
     */
    boost::asio::awaitable<std::vector<PGResultPtr>> exec(std::string sql);

    /**
     * @brief Send one statement with text parameters through the extended protocol
     */
    boost::asio::awaitable<PGResultPtr> exec_params(std::string sql,
                                                    std::vector<std::string> params);

    /**
     * @brief Throw the typed error for a failed result; no-op for success
     */
    void check_result(const PGresult* res) const;

    [[nodiscard]] bool is_connected() const;

    /**
     * @brief Bound every socket wait of later queries
     *
     * A query that exceeds it raises TimeoutError and closes the connection.
     */
    void set_io_timeout(std::optional<Clock::duration> timeout) { io_timeout_ = timeout; }

    /// Finish the native connection (idempotent)
    void close();

    [[nodiscard]] std::string error_message() const;

private:
    using wait_type = boost::asio::posix::stream_descriptor::wait_type;
    using Deadline = std::optional<Clock::time_point>;

    boost::asio::awaitable<void> wait_socket(wait_type type, Deadline deadline);
    [[nodiscard]] Deadline io_deadline() const;
    boost::asio::awaitable<void> flush(Deadline deadline);
    boost::asio::awaitable<std::vector<PGResultPtr>> collect_results(Deadline deadline);
    boost::asio::awaitable<void> refuse_copy_in(Deadline deadline);
    boost::asio::awaitable<void> drain_copy_out(Deadline deadline);

    /// ConnectionError when the link is gone, else DriverError
    [[noreturn]] void throw_send_failure() const;

    PGConnPtr conn_;
    std::optional<Clock::duration> io_timeout_;
};

} // namespace dbaccess
