#include "db/postgresql/pg_connection.hpp"
#include "core/utils.hpp"

#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <format>

namespace dbaccess {

namespace asio = boost::asio;

// ============================================================================
// SQLSTATE translation
// ============================================================================

ErrorCode classify_sqlstate(std::string_view sqlstate) {
    if (sqlstate.size() != 5) {
        return ErrorCode::DRIVER_ERROR;
    }
    if (sqlstate.starts_with("08")) {
        return ErrorCode::CONNECTION_ERROR;
    }
    if (sqlstate.starts_with("42")) {
        return ErrorCode::QUERY_SYNTAX_ERROR;
    }
    if (sqlstate == "57014") {
        return ErrorCode::TIMEOUT;
    }
    if (sqlstate == "57P01" || sqlstate == "57P02" || sqlstate == "57P03") {
        return ErrorCode::CONNECTION_ERROR;
    }
    return ErrorCode::DRIVER_ERROR;
}

void throw_sql_error(std::string_view sqlstate, const std::string& message) {
    utils::log::debug(std::format("PostgreSQL error [{}]: {}", sqlstate, message));

    switch (classify_sqlstate(sqlstate)) {
        case ErrorCode::CONNECTION_ERROR: throw ConnectionError(message);
        case ErrorCode::QUERY_SYNTAX_ERROR: throw QuerySyntaxError(message);
        case ErrorCode::TIMEOUT: throw TimeoutError(message);
        default: throw DriverError(message);
    }
}

namespace {

/// Releases (never closes) a descriptor borrowed from libpq
struct BorrowedSocket {
    std::shared_ptr<asio::posix::stream_descriptor> descriptor;

    ~BorrowedSocket() {
        if (descriptor) {
            boost::system::error_code ignored;
            descriptor->cancel(ignored);
            descriptor->release();
        }
    }
};

} // namespace

// ============================================================================
// PgConnection
// ============================================================================

void PgConnection::validate_conninfo(const std::string& conninfo) {
    char* err = nullptr;
    PQconninfoOption* options = PQconninfoParse(conninfo.c_str(), &err);
    if (!options) {
        std::string message = err ? utils::trim(err) : "invalid connection string";
        if (err) {
            PQfreemem(err);
        }
        throw InvalidArgumentError(std::format("Invalid PostgreSQL connection string: {}", message));
    }
    PQconninfoFree(options);
}

asio::awaitable<void> PgConnection::connect(std::string conninfo, Clock::duration timeout) {
    validate_conninfo(conninfo);
    close();

    const auto deadline = Clock::now() + timeout;

    conn_.reset(PQconnectStart(conninfo.c_str()));
    if (!conn_) {
        throw ConnectionError("Failed to allocate PGconn");
    }
    if (PQstatus(conn_.get()) == CONNECTION_BAD) {
        std::string message = error_message();
        close();
        throw ConnectionError(message);
    }

    // Polling starts as if the socket had reported write-ready
    PostgresPollingStatusType poll = PGRES_POLLING_WRITING;
    while (poll != PGRES_POLLING_OK) {
        if (poll == PGRES_POLLING_FAILED) {
            std::string message = error_message();
            close();
            throw ConnectionError(message);
        }
        try {
            co_await wait_socket(poll == PGRES_POLLING_READING
                ? wait_type::wait_read : wait_type::wait_write, deadline);
        } catch (const DbError&) {
            close();
            throw;
        }
        poll = PQconnectPoll(conn_.get());
    }

    if (PQsetnonblocking(conn_.get(), 1) != 0) {
        std::string message = error_message();
        close();
        throw ConnectionError(message);
    }
}

asio::awaitable<std::vector<PGResultPtr>> PgConnection::exec(std::string sql) {
    if (!is_connected()) {
        throw ConnectionError("PostgreSQL connection is not open");
    }
    if (!PQsendQuery(conn_.get(), sql.c_str())) {
        throw_send_failure();
    }

    const auto deadline = io_deadline();
    try {
        co_await flush(deadline);
        co_return co_await collect_results(deadline);
    } catch (const TimeoutError&) {
        // Results are still pending on the wire; the link cannot be reused
        close();
        throw;
    }
}

asio::awaitable<PGResultPtr> PgConnection::exec_params(std::string sql,
                                                       std::vector<std::string> params) {
    if (!is_connected()) {
        throw ConnectionError("PostgreSQL connection is not open");
    }

    std::vector<const char*> values;
    values.reserve(params.size());
    for (const auto& p : params) {
        values.push_back(p.c_str());
    }

    if (!PQsendQueryParams(conn_.get(), sql.c_str(), static_cast<int>(values.size()),
                           nullptr, values.data(), nullptr, nullptr, 0)) {
        throw_send_failure();
    }

    const auto deadline = io_deadline();
    std::vector<PGResultPtr> results;
    try {
        co_await flush(deadline);
        results = co_await collect_results(deadline);
    } catch (const TimeoutError&) {
        close();
        throw;
    }
    if (results.empty()) {
        throw DriverError("PostgreSQL returned no result");
    }
    // Extended protocol allows a single statement
    co_return std::move(results.back());
}

void PgConnection::check_result(const PGresult* res) const {
    if (!res) {
        throw ConnectionError(error_message());
    }

    switch (PQresultStatus(res)) {
        case PGRES_TUPLES_OK:
        case PGRES_COMMAND_OK:
        case PGRES_EMPTY_QUERY:
        case PGRES_SINGLE_TUPLE:
            return;
        default:
            break;
    }

    const char* sqlstate = PQresultErrorField(res, PG_DIAG_SQLSTATE);
    const char* primary = PQresultErrorField(res, PG_DIAG_MESSAGE_PRIMARY);
    std::string message = primary ? primary : utils::trim(PQresultErrorMessage(res));

    if (!sqlstate && !is_connected()) {
        throw ConnectionError(message.empty() ? error_message() : message);
    }
    throw_sql_error(sqlstate ? sqlstate : "", message);
}

bool PgConnection::is_connected() const {
    return conn_ != nullptr && PQstatus(conn_.get()) == CONNECTION_OK;
}

void PgConnection::close() {
    conn_.reset();
}

std::string PgConnection::error_message() const {
    if (!conn_) {
        return "PostgreSQL connection is not open";
    }
    return utils::trim(PQerrorMessage(conn_.get()));
}

asio::awaitable<void> PgConnection::wait_socket(wait_type type, Deadline deadline) {
    const int fd = PQsocket(conn_.get());
    if (fd < 0) {
        throw ConnectionError("PostgreSQL connection has no socket");
    }

    auto executor = co_await asio::this_coro::executor;

    // The socket can change between connect attempts, so it is wrapped per wait
    BorrowedSocket socket{std::make_shared<asio::posix::stream_descriptor>(executor, fd)};

    std::optional<asio::steady_timer> timer;
    if (deadline) {
        timer.emplace(executor, *deadline);
        std::weak_ptr<asio::posix::stream_descriptor> weak = socket.descriptor;
        timer->async_wait([weak](const boost::system::error_code& ec) {
            if (ec) {
                return;
            }
            if (auto descriptor = weak.lock()) {
                boost::system::error_code ignored;
                descriptor->cancel(ignored);
            }
        });
    }

    boost::system::error_code ec;
    co_await socket.descriptor->async_wait(type, asio::redirect_error(asio::use_awaitable, ec));

    if (timer) {
        timer->cancel();
    }
    if (ec == asio::error::operation_aborted) {
        throw TimeoutError("Timed out waiting for the PostgreSQL server");
    }
    if (ec) {
        throw ConnectionError(std::format("PostgreSQL socket error: {}", ec.message()));
    }
}

PgConnection::Deadline PgConnection::io_deadline() const {
    if (!io_timeout_) {
        return std::nullopt;
    }
    return Clock::now() + *io_timeout_;
}

asio::awaitable<void> PgConnection::flush(Deadline deadline) {
    for (;;) {
        const int rc = PQflush(conn_.get());
        if (rc == 0) {
            co_return;
        }
        if (rc < 0) {
            throw ConnectionError(error_message());
        }
        co_await wait_socket(wait_type::wait_write, deadline);
        // Keep reading so the server never blocks on a full send buffer
        if (!PQconsumeInput(conn_.get())) {
            throw ConnectionError(error_message());
        }
    }
}

asio::awaitable<std::vector<PGResultPtr>> PgConnection::collect_results(Deadline deadline) {
    std::vector<PGResultPtr> results;
    std::optional<std::string> refused;

    for (;;) {
        while (PQisBusy(conn_.get())) {
            co_await wait_socket(wait_type::wait_read, deadline);
            if (!PQconsumeInput(conn_.get())) {
                throw ConnectionError(error_message());
            }
        }

        PGResultPtr res(PQgetResult(conn_.get()));
        if (!res) {
            break;
        }

        const ExecStatusType status = PQresultStatus(res.get());
        if (status == PGRES_COPY_IN) {
            refused = "COPY FROM STDIN is not supported";
            co_await refuse_copy_in(deadline);
            continue;
        }
        if (status == PGRES_COPY_OUT || status == PGRES_COPY_BOTH) {
            refused = "COPY TO STDOUT is not supported";
            co_await drain_copy_out(deadline);
            continue;
        }
        results.push_back(std::move(res));
    }

    if (refused) {
        throw DriverError(*refused);
    }
    co_return results;
}

asio::awaitable<void> PgConnection::refuse_copy_in(Deadline deadline) {
    for (;;) {
        const int rc = PQputCopyEnd(conn_.get(), "COPY FROM STDIN is not supported");
        if (rc == 1) {
            break;
        }
        if (rc < 0) {
            throw ConnectionError(error_message());
        }
        co_await wait_socket(wait_type::wait_write, deadline);
    }
    co_await flush(deadline);
}

asio::awaitable<void> PgConnection::drain_copy_out(Deadline deadline) {
    for (;;) {
        char* buffer = nullptr;
        const int rc = PQgetCopyData(conn_.get(), &buffer, /*async=*/1);
        if (buffer) {
            PQfreemem(buffer);
        }
        if (rc > 0) {
            continue;
        }
        if (rc == -1) {
            co_return;
        }
        if (rc == -2) {
            throw ConnectionError(error_message());
        }
        co_await wait_socket(wait_type::wait_read, deadline);
        if (!PQconsumeInput(conn_.get())) {
            throw ConnectionError(error_message());
        }
    }
}

void PgConnection::throw_send_failure() const {
    if (!is_connected()) {
        throw ConnectionError(error_message());
    }
    throw DriverError(error_message());
}

} // namespace dbaccess
