#pragma once

#include "rdbcpp/firebird/environment.hpp"
#include <string>
#include <vector>

namespace rdbcpp {
namespace firebird {

/**
 * @brief Field information in a message
 */
struct FieldInfo {
    std::string name;        // Field name
    std::string relation;    // Table name
    std::string alias;       // Field alias
    unsigned type = 0;       // SQL type code, nullable bit stripped
    bool nullable = true;
    unsigned subType = 0;    // BLOB subtype
    unsigned length = 0;     // Length in bytes
    int scale = 0;           // Negative for NUMERIC/DECIMAL decimal places
    unsigned charSet = 0;
    unsigned offset = 0;     // Offset in message buffer
    unsigned nullOffset = 0; // Null indicator offset
};

/**
 * @brief Owning wrapper for Firebird IMessageMetadata
 *
 * Field descriptions are read once on construction.
 */
class MessageMetadata {
public:
    MessageMetadata();
    explicit MessageMetadata(Firebird::IMessageMetadata* metadata);

    MessageMetadata(MessageMetadata&& other) noexcept;
    MessageMetadata& operator=(MessageMetadata&& other) noexcept;

    MessageMetadata(const MessageMetadata&) = delete;
    MessageMetadata& operator=(const MessageMetadata&) = delete;

    ~MessageMetadata();

    unsigned getCount() const noexcept { return static_cast<unsigned>(fields_.size()); }
    const FieldInfo& getField(unsigned index) const;
    const std::vector<FieldInfo>& getFields() const noexcept { return fields_; }

    /** @brief Size of the message buffer in bytes */
    unsigned getMessageLength() const noexcept { return messageLength_; }

    bool isValid() const noexcept { return metadata_ != nullptr; }
    Firebird::IMessageMetadata* getRawMetadata() const noexcept { return metadata_; }

private:
    Firebird::ThrowStatusWrapper& status() const {
        statusWrapper_.init();
        return statusWrapper_;
    }

    void loadFields();
    void cleanup() noexcept;

    Environment& env_;
    Firebird::IMessageMetadata* metadata_ = nullptr;
    Firebird::IStatus* status_;
    mutable Firebird::ThrowStatusWrapper statusWrapper_{nullptr};

    std::vector<FieldInfo> fields_;
    unsigned messageLength_ = 0;
};

} // namespace firebird
} // namespace rdbcpp
