#pragma once

#include <exception>
#include <string>
#include <string_view>
#include <vector>

namespace rdbcpp {
namespace core {

enum class ErrorKind {
    InvalidSpecification,
    ExecutionFailed,
    MappingFailed,
    TransactionAlreadyActive,
    TransactionInactive,
    SynchronizationNotEnabled,
    AlreadyConsumed,
    IncorrectResultSize,
    UnexpectedRollback,
    Driver
};

std::string_view toString(ErrorKind kind) noexcept;

/**
 * Base of every error raised by the client.
 *
 * Carries a kind, an SQLSTATE ("HY000" unless a driver reported one), the
 * chain of messages reported by the driver, an optional cause and errors that
 * were suppressed while handling this one (e.g. the original failure of a unit
 * of work whose rollback failed as well).
 */
class DatabaseException : public std::exception {
public:
    DatabaseException(ErrorKind kind, std::string message);

    const char* what() const noexcept override { return message_.c_str(); }

    ErrorKind getKind() const noexcept { return kind_; }
    int getErrorCode() const noexcept { return error_code_; }
    const std::string& getSQLState() const noexcept { return sql_state_; }
    const std::vector<std::string>& getErrorMessages() const noexcept { return error_messages_; }

    std::exception_ptr getCause() const noexcept { return cause_; }
    const std::vector<std::exception_ptr>& getSuppressed() const noexcept { return suppressed_; }
    void addSuppressed(std::exception_ptr error);

protected:
    void setCause(std::exception_ptr cause);

    std::string message_;
    ErrorKind   kind_;
    int         error_code_ {0};
    std::string sql_state_ {"HY000"};
    std::vector<std::string> error_messages_;
    std::exception_ptr cause_;
    std::vector<std::exception_ptr> suppressed_;
};

// Malformed statement construction; raised while building, never reaches a driver
class InvalidSpecification : public DatabaseException {
public:
    explicit InvalidSpecification(std::string message);
};

// Driver or database reported an error while running a statement
class ExecutionFailed : public DatabaseException {
public:
    explicit ExecutionFailed(std::string message, std::exception_ptr cause = nullptr);

    // Wraps whatever is in flight; DatabaseException details are carried over
    static ExecutionFailed wrap(std::exception_ptr cause, std::string_view context);
};

class MappingFailed : public DatabaseException {
public:
    MappingFailed(std::string message, size_t rowIndex);

    size_t getRowIndex() const noexcept { return row_index_; }

private:
    size_t row_index_;
};

class TransactionAlreadyActive : public DatabaseException {
public:
    explicit TransactionAlreadyActive(std::string message);
};

class TransactionInactive : public DatabaseException {
public:
    explicit TransactionInactive(std::string message);
};

class SynchronizationNotEnabled : public DatabaseException {
public:
    explicit SynchronizationNotEnabled(std::string message);
};

// A one-shot result was subscribed or consumed a second time
class AlreadyConsumed : public DatabaseException {
public:
    explicit AlreadyConsumed(std::string message);
};

class IncorrectResultSize : public DatabaseException {
public:
    IncorrectResultSize(size_t expected, size_t actual);

    size_t getExpected() const noexcept { return expected_; }
    size_t getActual() const noexcept { return actual_; }

private:
    size_t expected_;
    size_t actual_;
};

// Commit was requested on a context that had been marked rollback-only
class UnexpectedRollback : public DatabaseException {
public:
    explicit UnexpectedRollback(std::string message);
};

/**
 * @brief Rethrow the exception being handled as ExecutionFailed
 *
 * Must be called inside a catch block. Driver and foreign exceptions are
 * wrapped; client errors (InvalidSpecification, TransactionInactive, ...)
 * propagate unchanged.
 */
[[noreturn]] void rethrowAsExecutionFailed(std::string_view context);

/**
 * @brief Rethrow primary with secondary attached as suppressed
 *
 * Only a DatabaseException can carry suppressed errors; any other primary is
 * rethrown as is.
 */
[[noreturn]] void rethrowWithSuppressed(std::exception_ptr primary, std::exception_ptr secondary);

} // namespace core
} // namespace rdbcpp
