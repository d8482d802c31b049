#pragma once

#include "rdbcpp/firebird/message_metadata.hpp"
#include "rdbcpp/core/parameter.hpp"
#include "rdbcpp/core/types.hpp"
#include <functional>
#include <vector>

namespace rdbcpp {
namespace firebird {
namespace value_codec {

// Character set id of OCTETS, used for binary VARCHAR parameters and columns
constexpr unsigned CS_BINARY = 1;

// Longest string sent inline as VARCHAR; longer values travel as BLOB
constexpr unsigned MAX_VARCHAR_LENGTH = 32765;

using BlobReader = std::function<core::Bytes(const ISC_QUAD&)>;
using BlobWriter = std::function<ISC_QUAD(const core::Bytes&)>;

/**
 * @brief Client type a column decodes to
 *
 * Scaled SMALLINT/INTEGER/BIGINT (NUMERIC, DECIMAL) decode to Double.
 * @throws FirebirdException for server types the client does not map
 */
core::SqlType columnType(const FieldInfo& field);

/**
 * @brief Input message layout for the given parameters
 *
 * Every parameter declares its own type, so a null still transmits one.
 * The caller owns the returned interface.
 */
Firebird::IMessageMetadata* buildInputMetadata(Firebird::ThrowStatusWrapper& status,
                                               const std::vector<core::Parameter>& parameters);

void writeParameter(const FieldInfo& field,
                    const core::Parameter& parameter,
                    unsigned char* buffer,
                    const BlobWriter& blobWriter);

core::Field readField(const FieldInfo& field,
                      const unsigned char* buffer,
                      const BlobReader& blobReader);

// Reads a whole BLOB in 32KB segments; an all-zero id reads as empty
core::Bytes loadBlob(Firebird::IAttachment* attachment,
                     Firebird::ITransaction* transaction,
                     const ISC_QUAD& blobId);

ISC_QUAD createBlob(Firebird::IAttachment* attachment,
                    Firebird::ITransaction* transaction,
                    const core::Bytes& data);

} // namespace value_codec
} // namespace firebird
} // namespace rdbcpp
