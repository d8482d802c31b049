#include "rdbcpp/core/exception.hpp"
#include <sstream>

namespace rdbcpp {
namespace core {

std::string_view toString(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::InvalidSpecification:      return "InvalidSpecification";
        case ErrorKind::ExecutionFailed:           return "ExecutionFailed";
        case ErrorKind::MappingFailed:             return "MappingFailed";
        case ErrorKind::TransactionAlreadyActive:  return "TransactionAlreadyActive";
        case ErrorKind::TransactionInactive:       return "TransactionInactive";
        case ErrorKind::SynchronizationNotEnabled: return "SynchronizationNotEnabled";
        case ErrorKind::AlreadyConsumed:           return "AlreadyConsumed";
        case ErrorKind::IncorrectResultSize:       return "IncorrectResultSize";
        case ErrorKind::UnexpectedRollback:        return "UnexpectedRollback";
        case ErrorKind::Driver:                    return "Driver";
    }
    return "Unknown";
}

DatabaseException::DatabaseException(ErrorKind kind, std::string message)
    : message_(std::move(message))
    , kind_(kind) {
}

void DatabaseException::addSuppressed(std::exception_ptr error) {
    if (error) {
        suppressed_.push_back(std::move(error));
    }
}

void DatabaseException::setCause(std::exception_ptr cause) {
    cause_ = std::move(cause);
}

InvalidSpecification::InvalidSpecification(std::string message)
    : DatabaseException(ErrorKind::InvalidSpecification, std::move(message)) {
}

ExecutionFailed::ExecutionFailed(std::string message, std::exception_ptr cause)
    : DatabaseException(ErrorKind::ExecutionFailed, std::move(message)) {
    setCause(std::move(cause));
}

ExecutionFailed ExecutionFailed::wrap(std::exception_ptr cause, std::string_view context) {
    std::ostringstream oss;
    oss << context;

    int errorCode = 0;
    std::string sqlState;
    std::vector<std::string> chain;

    try {
        if (cause) {
            std::rethrow_exception(cause);
        }
    }
    catch (const DatabaseException& e) {
        oss << ": " << e.what();
        errorCode = e.getErrorCode();
        sqlState = e.getSQLState();
        chain = e.getErrorMessages();
    }
    catch (const std::exception& e) {
        oss << ": " << e.what();
    }
    catch (...) {
        oss << ": unknown error";
    }

    ExecutionFailed failed(oss.str(), std::move(cause));
    failed.error_code_ = errorCode;
    if (!sqlState.empty()) {
        failed.sql_state_ = sqlState;
    }
    failed.error_messages_ = std::move(chain);
    return failed;
}

MappingFailed::MappingFailed(std::string message, size_t rowIndex)
    : DatabaseException(ErrorKind::MappingFailed, std::move(message))
    , row_index_(rowIndex) {
}

TransactionAlreadyActive::TransactionAlreadyActive(std::string message)
    : DatabaseException(ErrorKind::TransactionAlreadyActive, std::move(message)) {
    sql_state_ = "25001";
}

TransactionInactive::TransactionInactive(std::string message)
    : DatabaseException(ErrorKind::TransactionInactive, std::move(message)) {
    sql_state_ = "25000";
}

SynchronizationNotEnabled::SynchronizationNotEnabled(std::string message)
    : DatabaseException(ErrorKind::SynchronizationNotEnabled, std::move(message)) {
}

AlreadyConsumed::AlreadyConsumed(std::string message)
    : DatabaseException(ErrorKind::AlreadyConsumed, std::move(message)) {
    sql_state_ = "24000";
}

IncorrectResultSize::IncorrectResultSize(size_t expected, size_t actual)
    : DatabaseException(ErrorKind::IncorrectResultSize,
                        "Incorrect result size: expected at most " + std::to_string(expected) +
                        " row(s), got " + std::to_string(actual))
    , expected_(expected)
    , actual_(actual) {
    sql_state_ = "21000";
}

UnexpectedRollback::UnexpectedRollback(std::string message)
    : DatabaseException(ErrorKind::UnexpectedRollback, std::move(message)) {
    sql_state_ = "40000";
}

void rethrowAsExecutionFailed(std::string_view context) {
    auto current = std::current_exception();
    try {
        std::rethrow_exception(current);
    }
    catch (const DatabaseException& e) {
        if (e.getKind() != ErrorKind::Driver) {
            throw;
        }
    }
    catch (...) {
        // wrapped below
    }
    throw ExecutionFailed::wrap(current, context);
}

void rethrowWithSuppressed(std::exception_ptr primary, std::exception_ptr secondary) {
    try {
        std::rethrow_exception(primary);
    }
    catch (DatabaseException& e) {
        e.addSuppressed(secondary);
        throw;
    }
}

} // namespace core
} // namespace rdbcpp
