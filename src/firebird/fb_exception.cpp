#include "rdbcpp/firebird/firebird_exception.hpp"
#include "rdbcpp/firebird/environment.hpp"
#include <sstream>
#include <unordered_map>

namespace rdbcpp {
namespace firebird {

namespace {
    const std::unordered_map<int, std::string> ERROR_TO_SQLSTATE = {
        {335544321, "22012"},  // isc_arith_except
        {335544347, "23000"},  // isc_integ_constraint
        {335544665, "23000"},  // isc_unique_key_violation
        {335544558, "23000"},  // isc_check_constraint
        {335544466, "23000"},  // isc_foreign_key
        {335544838, "23000"},  // isc_foreign_key_target_doesnt_exist
        {335544839, "23000"},  // isc_foreign_key_references_present
        {335544336, "40001"},  // isc_deadlock
        {335544345, "40001"},  // isc_lock_conflict
        {335544510, "40001"},  // isc_lock_timeout
        {335544856, "40001"},  // isc_update_conflict
        {335544332, "24000"},  // isc_stream_eof
        {335544343, "42000"},  // isc_dsql_token_unk_err
        {335544569, "42000"},  // isc_dsql_command_err
        {335544580, "42S02"},  // isc_dsql_relation_err
        {335544578, "42S22"},  // isc_dsql_field_err
        {335544352, "28000"},  // isc_login
        {335544353, "28000"},  // isc_no_priv
        {335544324, "08001"},  // isc_unavailable
        {335544375, "08001"},  // isc_io_error
        {335544344, "08003"},  // isc_bad_db_handle
        {335544327, "08004"},  // isc_shutinprog
        {335544337, "25000"}   // isc_tra_state
    };

    std::string mapErrorCodeToSQLState(int error_code) {
        auto it = ERROR_TO_SQLSTATE.find(error_code);
        if (it != ERROR_TO_SQLSTATE.end()) {
            return it->second;
        }
        return "HY000";
    }
}

FirebirdException::FirebirdException(std::string message)
    : core::DatabaseException(core::ErrorKind::Driver, std::move(message)) {
    error_messages_.push_back(message_);
}

FirebirdException::FirebirdException(const Firebird::FbException& fb_ex)
    : core::DatabaseException(core::ErrorKind::Driver, std::string()) {

    Firebird::IStatus* status = fb_ex.getStatus();
    sql_state_.clear();
    extractErrorDetails(status);

    auto& env = Environment::getInstance();
    char buffer[4096] = {0};
    env.getUtil()->formatStatus(buffer, sizeof(buffer), status);
    message_ = buffer;

    if (error_messages_.size() > 1) {
        std::ostringstream ss;
        ss << message_ << "\nError chain:";
        for (size_t i = 0; i < error_messages_.size(); ++i) {
            ss << "\n  [" << i << "] " << error_messages_[i];
        }
        message_ = ss.str();
    }
    if (sql_state_.empty()) sql_state_ = "HY000";
}

void FirebirdException::extractErrorDetails(Firebird::IStatus* status) {
    if (!status) return;
    const intptr_t* errors = status->getErrors();
    if (!errors) return;

    size_t i = 0;
    while (errors[i] != isc_arg_end) {
        const intptr_t tag = errors[i++];
        switch (tag) {
            case isc_arg_gds: {
                const intptr_t code = errors[i++];
                if (error_code_ == 0) {
                    error_code_ = static_cast<int>(code);
                }

                auto& env = Environment::getInstance();
                char msg[1024] = {0};

                Firebird::IStatus* tmp = env.getMaster()->getStatus();
                const intptr_t temp_vec[] = { isc_arg_gds, code, isc_arg_end };
                tmp->setErrors(temp_vec);
                env.getUtil()->formatStatus(msg, sizeof(msg), tmp);
                error_messages_.emplace_back(msg);
                tmp->dispose();
                break;
            }
            case isc_arg_string:
            case isc_arg_cstring: {
                std::string text;
                if (tag == isc_arg_cstring) {
                    const auto len = static_cast<size_t>(errors[i++]);
                    const char* s = reinterpret_cast<const char*>(errors[i++]);
                    if (s) text.assign(s, len);
                } else {
                    const char* s = reinterpret_cast<const char*>(errors[i++]);
                    if (s) text = s;
                }
                if (!text.empty()) {
                    if (!error_messages_.empty()) {
                        error_messages_.back() += " - ";
                        error_messages_.back() += text;
                    } else {
                        error_messages_.push_back(std::move(text));
                    }
                }
                break;
            }
            case isc_arg_number: {
                const intptr_t n = errors[i++];
                if (!error_messages_.empty()) {
                    error_messages_.back() += " ";
                    error_messages_.back() += std::to_string(n);
                }
                break;
            }
            case isc_arg_sql_state: {
                const char* st = reinterpret_cast<const char*>(errors[i++]);
                if (st && sql_state_.empty()) sql_state_ = st;
                break;
            }
            case isc_arg_interpreted: {
                const char* s = reinterpret_cast<const char*>(errors[i++]);
                if (s) error_messages_.emplace_back(s);
                break;
            }
            default:
                ++i;
                break;
        }
    }

    if (sql_state_.empty() && error_code_ != 0) {
        sql_state_ = mapErrorCodeToSQLState(error_code_);
    }
}

} // namespace firebird
} // namespace rdbcpp
