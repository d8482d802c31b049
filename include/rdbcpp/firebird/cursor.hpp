#pragma once

#include "rdbcpp/firebird/connection.hpp"
#include "rdbcpp/firebird/message_metadata.hpp"
#include <memory>
#include <optional>
#include <vector>

namespace rdbcpp {
namespace firebird {

/**
 * Rows of one executed statement.
 *
 * Queries stream through an IResultSet. DML has already run when the cursor
 * is created; it yields the RETURNING row, if any, and reports the affected
 * record count. An implicit transaction owned by the cursor is committed on
 * exhaustion or close and rolled back after a fetch error.
 */
class FirebirdCursor : public core::Cursor {
public:
    struct Parts {
        std::shared_ptr<FirebirdConnection> connection;
        Firebird::IStatement* statement = nullptr;
        Firebird::IResultSet* resultSet = nullptr;
        Firebird::ITransaction* transaction = nullptr;
        bool ownsTransaction = false;
        MessageMetadata output;
        std::vector<unsigned char> buffer;
        std::optional<core::RawRow> singleton;   // RETURNING row of a DML statement
        std::uint64_t affectedRows = 0;
    };

    explicit FirebirdCursor(Parts parts);
    ~FirebirdCursor() override;

    FirebirdCursor(const FirebirdCursor&) = delete;
    FirebirdCursor& operator=(const FirebirdCursor&) = delete;

    std::optional<core::RawRow> next() override;
    const std::vector<core::ColumnMetadata>& columns() const override { return columns_; }
    std::uint64_t affectedRows() const override { return parts_.affectedRows; }
    void close() override;

    // Decodes the current output buffer into a row
    static core::RawRow decodeRow(const MessageMetadata& output,
                                  const std::vector<unsigned char>& buffer,
                                  Firebird::IAttachment* attachment,
                                  Firebird::ITransaction* transaction);

    static std::vector<core::ColumnMetadata> describeColumns(const MessageMetadata& output);

private:
    Firebird::ThrowStatusWrapper& status() const {
        statusWrapper_.init();
        return statusWrapper_;
    }

    void finish(bool commit);

    Parts parts_;
    std::vector<core::ColumnMetadata> columns_;
    bool closed_ = false;
    Firebird::IStatus* status_;
    mutable Firebird::ThrowStatusWrapper statusWrapper_{nullptr};
};

} // namespace firebird
} // namespace rdbcpp
