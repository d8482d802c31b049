#include "rdbcpp/core/result_consumer.hpp"
#include "rdbcpp_util/logging.h"

namespace rdbcpp {
namespace core {

namespace detail {

void logCursorClosed(const std::string& description, size_t rows) noexcept {
    auto logger = util::Logging::get();
    if (logger) {
        logger->debug("Cursor of {} exhausted after {} row(s)", description, rows);
    }
}

void closeQuietly(Cursor& cursor, const std::string& description) noexcept {
    try {
        cursor.close();
    }
    catch (const std::exception& e) {
        auto logger = util::Logging::get();
        if (logger) {
            logger->warn("Closing cursor of {} failed: {}", description, e.what());
        }
    }
}

} // namespace detail

ResultConsumer::ResultConsumer(CursorLauncher launcher, std::string description)
    : state_(std::make_shared<State>(std::move(launcher), std::move(description))) {
}

void ResultConsumer::claim(std::string_view mode) const {
    if (state_->claimed.exchange(true)) {
        throw AlreadyConsumed("Result of " + state_->description + " already consumed; cannot read " +
                              std::string(mode));
    }
}

std::unique_ptr<Cursor> ResultConsumer::launch(const State& state) {
    auto logger = util::Logging::get();
    if (logger) {
        logger->debug("Issuing {}", state.description);
    }
    try {
        auto cursor = state.launcher();
        if (!cursor) {
            throw ExecutionFailed("Driver returned no cursor for " + state.description);
        }
        return cursor;
    }
    catch (...) {
        rethrowAsExecutionFailed("Executing " + state.description + " failed");
    }
}

Single<std::uint64_t> ResultConsumer::rowsUpdated() const {
    claim("update count");
    auto state = state_;
    return Single<std::uint64_t>([state]() -> std::uint64_t {
        auto cursor = launch(*state);
        std::uint64_t count = 0;
        try {
            // Drain anything the statement returned before asking for the count
            while (cursor->next()) {
            }
            count = cursor->affectedRows();
            cursor->close();
        }
        catch (...) {
            detail::closeQuietly(*cursor, state->description);
            rethrowAsExecutionFailed("Executing " + state->description + " failed");
        }

        auto logger = util::Logging::get();
        if (logger) {
            logger->debug("{} updated {} row(s)", state->description, count);
        }
        return count;
    });
}

ResultStream<Row> ResultConsumer::rows() const {
    return stream<Row>([](RawRow&& raw, const ColumnSet& columns, size_t index) {
        return Row(columns, std::move(raw), index);
    });
}

} // namespace core
} // namespace rdbcpp
