#include "rdbcpp/firebird/connection.hpp"
#include "rdbcpp/firebird/cursor.hpp"
#include "rdbcpp/firebird/transaction_handle.hpp"
#include "rdbcpp/firebird/firebird_exception.hpp"
#include "rdbcpp/firebird/message_metadata.hpp"
#include "rdbcpp/firebird/value_codec.hpp"
#include "rdbcpp/core/named_param_parser.hpp"
#include "rdbcpp_util/config.h"
#include "rdbcpp_util/logging.h"

namespace rdbcpp {
namespace firebird {

namespace {

Firebird::IXpbBuilder* buildDpb(Firebird::ThrowStatusWrapper& st, const ConnectionParams& params) {
    auto& env = Environment::getInstance();
    Firebird::IXpbBuilder* dpb = env.getUtil()->getXpbBuilder(&st, Firebird::IXpbBuilder::DPB, nullptr, 0);

    try {
        if (!params.user.empty()) {
            dpb->insertString(&st, isc_dpb_user_name, params.user.c_str());
        }
        if (!params.password.empty()) {
            dpb->insertString(&st, isc_dpb_password, params.password.c_str());
        }
        if (!params.charset.empty()) {
            dpb->insertString(&st, isc_dpb_lc_ctype, params.charset.c_str());
        }
        if (!params.role.empty()) {
            dpb->insertString(&st, isc_dpb_sql_role_name, params.role.c_str());
        }
        if (params.sql_dialect > 0) {
            dpb->insertInt(&st, isc_dpb_sql_dialect, params.sql_dialect);
        }
    }
    catch (...) {
        dpb->dispose();
        throw;
    }
    return dpb;
}

void releaseQuietly(Firebird::IStatement* stmt, Firebird::ITransaction* implicitTransaction) noexcept {
    if (stmt) {
        stmt->release();
    }
    if (implicitTransaction) {
        auto& env = Environment::getInstance();
        Firebird::ThrowStatusWrapper st(env.getMaster()->getStatus());
        try {
            implicitTransaction->rollback(&st);
        }
        catch (const Firebird::FbException&) {
            implicitTransaction->release();
            auto logger = util::Logging::get();
            if (logger) logger->warn("Rollback of implicit transaction failed (ignored)");
        }
        st.dispose();
    }
}

} // namespace

ConnectionParams ConnectionParams::fromConfig() {
    const auto& db = util::Config::db();
    ConnectionParams params;
    params.database = db.server.empty() ? db.path : db.server + ":" + db.path;
    params.user = db.user;
    params.password = db.password;
    params.charset = db.charset;
    params.role = db.role;
    params.sql_dialect = db.sqlDialect;
    return params;
}

FirebirdConnection::FirebirdConnection(const ConnectionParams& params)
    : params_(params)
    , env_(Environment::getInstance())
    , status_(env_.getMaster()->getStatus())
    , statusWrapper_(status_) {
    try {
        connect();
    }
    catch (...) {
        statusWrapper_.dispose();
        throw;
    }
}

FirebirdConnection::~FirebirdConnection() {
    disconnect();
    statusWrapper_.dispose();
}

void FirebirdConnection::connect() {
    auto logger = util::Logging::get();
    if (logger) logger->info("Connecting to {}", params_.database);

    try {
        auto& st = status();
        Firebird::IXpbBuilder* dpb = buildDpb(st, params_);

        try {
            attachment_ = env_.getProvider()->attachDatabase(
                &st,
                params_.database.c_str(),
                dpb->getBufferLength(&st),
                dpb->getBuffer(&st));
        }
        catch (...) {
            dpb->dispose();
            throw;
        }
        dpb->dispose();

        if (!attachment_) {
            if (logger) logger->error("Failed to attach to {}", params_.database);
            throw FirebirdException("Failed to attach to database: " + params_.database);
        }

        if (logger) logger->info("Connected to {}", params_.database);
    }
    catch (const Firebird::FbException& e) {
        if (logger) logger->error("Connection to {} failed", params_.database);
        throw FirebirdException(e);
    }
}

void FirebirdConnection::disconnect() noexcept {
    if (!attachment_) {
        return;
    }
    auto logger = util::Logging::get();
    try {
        auto& st = status();
        attachment_->detach(&st);
        if (logger) logger->info("Disconnected from {}", params_.database);
    }
    catch (const Firebird::FbException& e) {
        attachment_->release();
        if (logger) logger->warn("Error while disconnecting (ignored): {}", FirebirdException(e).what());
    }
    attachment_ = nullptr;
}

bool FirebirdConnection::isConnected() const {
    if (!attachment_) {
        return false;
    }
    try {
        auto& st = status();
        attachment_->ping(&st);
        return true;
    }
    catch (const Firebird::FbException&) {
        return false;
    }
}

Firebird::ITransaction* FirebirdConnection::startTransaction(core::IsolationLevel isolation, bool readOnly) {
    if (!attachment_) {
        throw FirebirdException("Not connected to database");
    }

    try {
        auto& st = status();
        Firebird::IXpbBuilder* tpb = env_.getUtil()->getXpbBuilder(&st, Firebird::IXpbBuilder::TPB, nullptr, 0);
        Firebird::ITransaction* tra = nullptr;

        try {
            switch (isolation) {
                case core::IsolationLevel::ReadUncommitted:
                case core::IsolationLevel::ReadCommitted:
                    tpb->insertTag(&st, isc_tpb_read_committed);
                    tpb->insertTag(&st, isc_tpb_rec_version);
                    break;
                case core::IsolationLevel::Default:
                case core::IsolationLevel::RepeatableRead:
                    tpb->insertTag(&st, isc_tpb_concurrency);
                    break;
                case core::IsolationLevel::Serializable:
                    tpb->insertTag(&st, isc_tpb_consistency);
                    break;
            }
            tpb->insertTag(&st, readOnly ? isc_tpb_read : isc_tpb_write);
            tpb->insertTag(&st, isc_tpb_wait);

            tra = attachment_->startTransaction(&st, tpb->getBufferLength(&st), tpb->getBuffer(&st));
        }
        catch (...) {
            tpb->dispose();
            throw;
        }
        tpb->dispose();

        if (!tra) {
            throw FirebirdException("Failed to start transaction");
        }
        return tra;
    }
    catch (const Firebird::FbException& e) {
        throw FirebirdException(e);
    }
}

std::unique_ptr<core::TransactionHandle> FirebirdConnection::beginTransaction(core::IsolationLevel isolation,
                                                                              bool readOnly) {
    if (activeTransaction_) {
        throw FirebirdException("A transaction is already open on this connection");
    }

    Firebird::ITransaction* tra = startTransaction(isolation, readOnly);
    activeTransaction_ = tra;

    auto logger = util::Logging::get();
    if (logger) {
        logger->debug("Started {} transaction ({})", readOnly ? "read-only" : "read-write",
                      core::toString(isolation));
    }
    return std::make_unique<FirebirdTransactionHandle>(shared_from_this(), tra);
}

void FirebirdConnection::transactionFinished(Firebird::ITransaction* transaction) noexcept {
    if (activeTransaction_ == transaction) {
        activeTransaction_ = nullptr;
    }
}

std::unique_ptr<core::Cursor> FirebirdConnection::executeStatement(const std::string& sql,
                                                                   const core::Bindings& bindings) {
    if (!attachment_) {
        throw FirebirdException("Not connected to database");
    }

    auto logger = util::Logging::get();

    auto parsed = core::NamedParamParser::parse(sql);
    std::vector<core::Parameter> parameters = core::NamedParamParser::arrange(parsed, bindings);

    Firebird::ITransaction* tra = activeTransaction_;
    Firebird::ITransaction* implicitTransaction = nullptr;
    if (!tra) {
        tra = startTransaction(core::IsolationLevel::ReadCommitted, false);
        implicitTransaction = tra;
    }

    if (logger) {
        logger->debug("Executing {} ({} parameters, {})", parsed.convertedSql, parameters.size(),
                      implicitTransaction ? "auto-commit" : "in transaction");
    }

    Firebird::IStatement* stmt = nullptr;
    try {
        auto& st = status();

        stmt = attachment_->prepare(&st, tra, 0, parsed.convertedSql.c_str(),
                                    static_cast<unsigned>(params_.sql_dialect),
                                    Firebird::IStatement::PREPARE_PREFETCH_METADATA);
        if (!stmt) {
            throw FirebirdException("Failed to prepare SQL statement");
        }

        MessageMetadata input;
        std::vector<unsigned char> inBuffer;
        if (!parameters.empty()) {
            input = MessageMetadata(value_codec::buildInputMetadata(st, parameters));
            inBuffer.assign(input.getMessageLength(), 0);

            auto blobWriter = [this, tra](const core::Bytes& data) {
                return value_codec::createBlob(attachment_, tra, data);
            };
            for (unsigned i = 0; i < parameters.size(); ++i) {
                value_codec::writeParameter(input.getField(i), parameters[i], inBuffer.data(), blobWriter);
            }
        }
        Firebird::IMessageMetadata* inMeta = input.isValid() ? input.getRawMetadata() : nullptr;
        void* inData = inBuffer.empty() ? nullptr : inBuffer.data();

        MessageMetadata output(stmt->getOutputMetadata(&st));
        std::vector<unsigned char> outBuffer(output.getMessageLength(), 0);

        FirebirdCursor::Parts parts;
        parts.connection = shared_from_this();
        parts.transaction = tra;

        if (stmt->getFlags(&st) & Firebird::IStatement::FLAG_HAS_CURSOR) {
            parts.resultSet = stmt->openCursor(&st, tra, inMeta, inData, output.getRawMetadata(), 0);
            if (!parts.resultSet) {
                throw FirebirdException("Failed to open cursor");
            }
            parts.statement = stmt;
            parts.ownsTransaction = implicitTransaction != nullptr;
        } else {
            bool hasOutput = output.getCount() > 0;
            stmt->execute(&st, tra, inMeta, inData,
                          hasOutput ? output.getRawMetadata() : nullptr,
                          hasOutput ? outBuffer.data() : nullptr);
            parts.affectedRows = stmt->getAffectedRecords(&st);
            if (hasOutput) {
                parts.singleton = FirebirdCursor::decodeRow(output, outBuffer, attachment_, tra);
            }

            stmt->free(&st);
            stmt = nullptr;

            if (implicitTransaction) {
                implicitTransaction->commit(&st);
                implicitTransaction = nullptr;
                parts.transaction = nullptr;
                if (logger) logger->debug("Auto-committed {} affected rows", parts.affectedRows);
            }
        }

        parts.output = std::move(output);
        parts.buffer = std::move(outBuffer);
        return std::make_unique<FirebirdCursor>(std::move(parts));
    }
    catch (const Firebird::FbException& e) {
        FirebirdException error(e);
        if (logger) logger->error("Statement failed: {}", error.what());
        releaseQuietly(stmt, implicitTransaction);
        throw error;
    }
    catch (...) {
        releaseQuietly(stmt, implicitTransaction);
        throw;
    }
}

void FirebirdConnection::executeDDL(const std::string& ddl) {
    Firebird::ITransaction* tra = startTransaction(core::IsolationLevel::Default, false);
    try {
        auto& st = status();
        attachment_->execute(&st, tra, 0, ddl.c_str(), static_cast<unsigned>(params_.sql_dialect),
                             nullptr, nullptr, nullptr, nullptr);
        tra->commit(&st);
    }
    catch (const Firebird::FbException& e) {
        FirebirdException error(e);
        releaseQuietly(nullptr, tra);
        throw error;
    }
}

void FirebirdConnection::createDatabase(const ConnectionParams& params) {
    auto& env = Environment::getInstance();
    Firebird::ThrowStatusWrapper st(env.getMaster()->getStatus());

    try {
        Firebird::IXpbBuilder* dpb = buildDpb(st, params);
        Firebird::IAttachment* att = nullptr;
        try {
            if (!params.charset.empty()) {
                dpb->insertString(&st, isc_dpb_set_db_charset, params.charset.c_str());
            }
            att = env.getProvider()->createDatabase(
                &st,
                params.database.c_str(),
                dpb->getBufferLength(&st),
                dpb->getBuffer(&st));
        }
        catch (...) {
            dpb->dispose();
            throw;
        }
        dpb->dispose();

        if (att) {
            att->detach(&st);
        }
    }
    catch (const Firebird::FbException& e) {
        FirebirdException error(e);
        st.dispose();
        throw error;
    }
    st.dispose();
}

bool FirebirdConnection::databaseExists(const ConnectionParams& params) {
    auto& env = Environment::getInstance();
    Firebird::ThrowStatusWrapper st(env.getMaster()->getStatus());

    try {
        Firebird::IXpbBuilder* dpb = buildDpb(st, params);
        Firebird::IAttachment* att = nullptr;
        try {
            att = env.getProvider()->attachDatabase(
                &st,
                params.database.c_str(),
                dpb->getBufferLength(&st),
                dpb->getBuffer(&st));
        }
        catch (...) {
            dpb->dispose();
            throw;
        }
        dpb->dispose();

        bool exists = att != nullptr;
        if (att) {
            att->detach(&st);
        }
        st.dispose();
        return exists;
    }
    catch (const Firebird::FbException&) {
        st.dispose();
        return false;
    }
}

} // namespace firebird
} // namespace rdbcpp
