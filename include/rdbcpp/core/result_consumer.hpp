#pragma once

#include "rdbcpp/core/driver.hpp"
#include "rdbcpp/core/entity_mapper.hpp"
#include "rdbcpp/core/exception.hpp"
#include "rdbcpp/core/result_stream.hpp"
#include "rdbcpp/core/row.hpp"
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>

namespace rdbcpp {
namespace core {

// Opens the cursor of one statement; runs at subscription
using CursorLauncher = std::function<std::unique_ptr<Cursor>()>;

namespace detail {

void logCursorClosed(const std::string& description, size_t rows) noexcept;
void closeQuietly(Cursor& cursor, const std::string& description) noexcept;

/**
 * Pulls rows from a freshly launched cursor and converts each with Convert,
 * called as convert(RawRow&&, const ColumnSet&, size_t rowIndex). The cursor
 * is closed on exhaustion, failure, cancellation or destruction.
 */
template<typename T, typename Convert>
class CursorSource : public Source<T> {
public:
    CursorSource(std::unique_ptr<Cursor> cursor, Convert convert, std::string description)
        : cursor_(std::move(cursor))
        , convert_(std::move(convert))
        , description_(std::move(description)) {}

    ~CursorSource() override { cancel(); }

    std::optional<T> next() override {
        if (!cursor_) {
            return std::nullopt;
        }

        std::optional<RawRow> raw;
        try {
            raw = cursor_->next();
            if (raw && !columns_) {
                columns_ = std::make_shared<const std::vector<ColumnMetadata>>(cursor_->columns());
            }
        }
        catch (...) {
            cancel();
            rethrowAsExecutionFailed("Fetching from " + description_ + " failed");
        }

        if (!raw) {
            finish();
            return std::nullopt;
        }

        try {
            return std::optional<T>(convert_(std::move(*raw), columns_, rowIndex_++));
        }
        catch (...) {
            cancel();
            throw;
        }
    }

    void cancel() noexcept override {
        if (cursor_) {
            closeQuietly(*cursor_, description_);
            cursor_.reset();
        }
    }

private:
    void finish() {
        auto cursor = std::move(cursor_);
        try {
            cursor->close();
        }
        catch (...) {
            rethrowAsExecutionFailed("Closing cursor of " + description_ + " failed");
        }
        logCursorClosed(description_, rowIndex_);
    }

    std::unique_ptr<Cursor> cursor_;
    Convert convert_;
    std::string description_;
    ColumnSet columns_;
    size_t rowIndex_ = 0;
};

} // namespace detail

/**
 * @brief Consumption modes for the result of one executed statement
 *
 * Exactly one mode may be selected per consumer; the returned sequence is
 * cold and sends the statement when subscribed. Driver failures surface as
 * ExecutionFailed from the pull that hit them.
 */
class ResultConsumer {
public:
    ResultConsumer(CursorLauncher launcher, std::string description);

    /** @brief Affected row count reported by the driver */
    Single<std::uint64_t> rowsUpdated() const;

    /** @brief Generic rows in driver column order */
    ResultStream<Row> rows() const;

    template<typename T>
    ResultStream<T> as(std::shared_ptr<const EntityMapper<T>> mapper) const {
        if (!mapper) {
            throw InvalidSpecification("Entity mapper must not be null");
        }
        return stream<T>([mapper](RawRow&& raw, const ColumnSet& columns, size_t index) {
            return mapper->rowToEntity(Row(columns, std::move(raw), index));
        });
    }

    template<typename T>
        requires DescribedEntity<T>
    ResultStream<T> as() const {
        return as<T>(defaultMapper<T>());
    }

    /**
     * @brief Caller-supplied extraction
     * @param extractor called as extractor(const RawRow&, const std::vector<ColumnMetadata>&)
     */
    template<typename F>
    auto map(F extractor) const {
        using R = std::invoke_result_t<F&, const RawRow&, const std::vector<ColumnMetadata>&>;
        return stream<R>([extractor](RawRow&& raw, const ColumnSet& columns, size_t) mutable {
            return extractor(static_cast<const RawRow&>(raw), *columns);
        });
    }

    bool isConsumed() const noexcept { return state_->claimed.load(); }

private:
    struct State {
        State(CursorLauncher l, std::string d) : launcher(std::move(l)), description(std::move(d)) {}
        CursorLauncher launcher;
        std::string description;
        std::atomic<bool> claimed{false};
    };

    void claim(std::string_view mode) const;

    // Launches the cursor, wrapping launch failures into ExecutionFailed
    static std::unique_ptr<Cursor> launch(const State& state);

    template<typename T, typename Convert>
    ResultStream<T> stream(Convert convert) const {
        claim("rows");
        auto state = state_;
        return ResultStream<T>([state, convert]() -> std::unique_ptr<Source<T>> {
            return std::make_unique<detail::CursorSource<T, Convert>>(launch(*state), convert,
                                                                      state->description);
        });
    }

    std::shared_ptr<State> state_;
};

} // namespace core
} // namespace rdbcpp
