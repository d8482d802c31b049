#include "rdbcpp/firebird/message_metadata.hpp"
#include "rdbcpp/firebird/firebird_exception.hpp"

namespace rdbcpp {
namespace firebird {

MessageMetadata::MessageMetadata()
    : env_(Environment::getInstance()),
      status_(env_.getMaster()->getStatus()),
      statusWrapper_(status_) {
}

MessageMetadata::MessageMetadata(Firebird::IMessageMetadata* metadata)
    : env_(Environment::getInstance()),
      metadata_(metadata),
      status_(env_.getMaster()->getStatus()),
      statusWrapper_(status_) {
    if (!metadata_) {
        statusWrapper_.dispose();
        throw FirebirdException("Invalid metadata pointer");
    }
    try {
        loadFields();
    }
    catch (const Firebird::FbException& e) {
        cleanup();
        statusWrapper_.dispose();
        throw FirebirdException(e);
    }
}

MessageMetadata::MessageMetadata(MessageMetadata&& other) noexcept
    : env_(Environment::getInstance()),
      metadata_(other.metadata_),
      status_(env_.getMaster()->getStatus()),
      statusWrapper_(status_),
      fields_(std::move(other.fields_)),
      messageLength_(other.messageLength_) {
    other.metadata_ = nullptr;
    other.messageLength_ = 0;
}

MessageMetadata& MessageMetadata::operator=(MessageMetadata&& other) noexcept {
    if (this != &other) {
        cleanup();
        metadata_ = other.metadata_;
        fields_ = std::move(other.fields_);
        messageLength_ = other.messageLength_;
        other.metadata_ = nullptr;
        other.messageLength_ = 0;
    }
    return *this;
}

MessageMetadata::~MessageMetadata() {
    cleanup();
    statusWrapper_.dispose();
}

void MessageMetadata::cleanup() noexcept {
    if (metadata_) {
        metadata_->release();
        metadata_ = nullptr;
    }
}

void MessageMetadata::loadFields() {
    auto& st = status();

    unsigned count = metadata_->getCount(&st);
    fields_.clear();
    fields_.reserve(count);

    for (unsigned i = 0; i < count; ++i) {
        FieldInfo field;

        const char* name = metadata_->getField(&st, i);
        field.name = name ? name : "";

        const char* relation = metadata_->getRelation(&st, i);
        field.relation = relation ? relation : "";

        const char* alias = metadata_->getAlias(&st, i);
        field.alias = alias ? alias : "";

        field.type = metadata_->getType(&st, i) & ~1u;
        field.nullable = metadata_->isNullable(&st, i);
        field.subType = static_cast<unsigned>(metadata_->getSubType(&st, i));
        field.length = metadata_->getLength(&st, i);
        field.scale = metadata_->getScale(&st, i);
        field.charSet = metadata_->getCharSet(&st, i);
        field.offset = metadata_->getOffset(&st, i);
        field.nullOffset = metadata_->getNullOffset(&st, i);

        fields_.push_back(std::move(field));
    }

    messageLength_ = metadata_->getMessageLength(&st);
}

const FieldInfo& MessageMetadata::getField(unsigned index) const {
    if (index >= fields_.size()) {
        throw FirebirdException("Field index out of range");
    }
    return fields_[index];
}

} // namespace firebird
} // namespace rdbcpp
