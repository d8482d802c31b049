#pragma once

#include "rdbcpp/firebird/firebird_compat.hpp"
#include "rdbcpp/core/exception.hpp"
#include <string>

namespace rdbcpp {
namespace firebird {

/**
 * Error reported by the Firebird client library.
 *
 * The first GDS code becomes the error code; the SQLSTATE is taken from the
 * status vector, or mapped from the GDS code when the server sent none.
 */
class FirebirdException : public core::DatabaseException {
public:
    explicit FirebirdException(std::string message);
    explicit FirebirdException(const Firebird::FbException& fb_ex);

private:
    void extractErrorDetails(Firebird::IStatus* status);
};

} // namespace firebird
} // namespace rdbcpp
