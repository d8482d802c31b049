#include "rdbcpp/firebird/cursor.hpp"
#include "rdbcpp/firebird/firebird_exception.hpp"
#include "rdbcpp/firebird/value_codec.hpp"
#include "rdbcpp_util/logging.h"

namespace rdbcpp {
namespace firebird {

FirebirdCursor::FirebirdCursor(Parts parts)
    : parts_(std::move(parts))
    , status_(Environment::getInstance().getMaster()->getStatus())
    , statusWrapper_(status_) {
    try {
        columns_ = describeColumns(parts_.output);
    }
    catch (const core::DatabaseException&) {
        try {
            finish(false);
        }
        catch (const core::DatabaseException& e) {
            auto logger = util::Logging::get();
            if (logger) logger->warn("Error while closing cursor (ignored): {}", e.what());
        }
        statusWrapper_.dispose();
        throw;
    }
}

FirebirdCursor::~FirebirdCursor() {
    if (!closed_) {
        try {
            close();
        }
        catch (const core::DatabaseException& e) {
            auto logger = util::Logging::get();
            if (logger) logger->warn("Error while closing cursor (ignored): {}", e.what());
        }
    }
    statusWrapper_.dispose();
}

std::vector<core::ColumnMetadata> FirebirdCursor::describeColumns(const MessageMetadata& output) {
    std::vector<core::ColumnMetadata> columns;
    columns.reserve(output.getCount());
    for (unsigned i = 0; i < output.getCount(); ++i) {
        const auto& field = output.getField(i);
        core::ColumnMetadata column;
        column.name = field.alias.empty() ? field.name : field.alias;
        column.index = i;
        column.type = value_codec::columnType(field);
        column.nullable = field.nullable;
        columns.push_back(std::move(column));
    }
    return columns;
}

core::RawRow FirebirdCursor::decodeRow(const MessageMetadata& output,
                                       const std::vector<unsigned char>& buffer,
                                       Firebird::IAttachment* attachment,
                                       Firebird::ITransaction* transaction) {
    auto blobReader = [attachment, transaction](const ISC_QUAD& blobId) {
        return value_codec::loadBlob(attachment, transaction, blobId);
    };

    core::RawRow row;
    row.reserve(output.getCount());
    for (const auto& field : output.getFields()) {
        row.push_back(value_codec::readField(field, buffer.data(), blobReader));
    }
    return row;
}

std::optional<core::RawRow> FirebirdCursor::next() {
    if (closed_) {
        return std::nullopt;
    }

    if (!parts_.resultSet) {
        std::optional<core::RawRow> row = std::move(parts_.singleton);
        parts_.singleton.reset();
        if (!row) {
            finish(true);
        }
        return row;
    }

    int result = 0;
    try {
        auto& st = status();
        result = parts_.resultSet->fetchNext(&st, parts_.buffer.data());
    }
    catch (const Firebird::FbException& e) {
        FirebirdException error(e);
        finish(false);
        throw error;
    }

    if (result == Firebird::IStatus::RESULT_NO_DATA) {
        finish(true);
        return std::nullopt;
    }

    try {
        return decodeRow(parts_.output, parts_.buffer,
                         parts_.connection->getAttachment(), parts_.transaction);
    }
    catch (const core::DatabaseException&) {
        finish(false);
        throw;
    }
}

void FirebirdCursor::close() {
    if (!closed_) {
        finish(true);
    }
}

void FirebirdCursor::finish(bool commit) {
    if (closed_) {
        return;
    }
    closed_ = true;

    auto logger = util::Logging::get();
    std::exception_ptr failure;

    try {
        auto& st = status();
        if (parts_.resultSet) {
            parts_.resultSet->close(&st);
            parts_.resultSet = nullptr;
        }
        if (parts_.statement) {
            parts_.statement->free(&st);
            parts_.statement = nullptr;
        }
    }
    catch (const Firebird::FbException& e) {
        failure = std::make_exception_ptr(FirebirdException(e));
        commit = false;
        if (parts_.resultSet) {
            parts_.resultSet->release();
            parts_.resultSet = nullptr;
        }
        if (parts_.statement) {
            parts_.statement->release();
            parts_.statement = nullptr;
        }
    }

    if (parts_.ownsTransaction && parts_.transaction) {
        Firebird::ITransaction* tra = parts_.transaction;
        parts_.transaction = nullptr;
        try {
            auto& st = status();
            if (commit) {
                tra->commit(&st);
                if (logger) logger->debug("Auto-committed query transaction");
            } else {
                tra->rollback(&st);
                if (logger) logger->debug("Rolled back query transaction");
            }
        }
        catch (const Firebird::FbException& e) {
            tra->release();
            if (!failure) {
                failure = std::make_exception_ptr(FirebirdException(e));
            } else if (logger) {
                logger->warn("Ending implicit transaction failed (ignored): {}", FirebirdException(e).what());
            }
        }
    }
    parts_.transaction = nullptr;

    if (failure) {
        std::rethrow_exception(failure);
    }
}

} // namespace firebird
} // namespace rdbcpp
