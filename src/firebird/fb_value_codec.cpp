#include "rdbcpp/firebird/value_codec.hpp"
#include "rdbcpp/firebird/firebird_exception.hpp"
#include <algorithm>
#include <cstring>

namespace rdbcpp {
namespace firebird {
namespace value_codec {

namespace {

struct InputLayout {
    unsigned type;
    unsigned length;
    int subType = 0;
    unsigned charSet = 0;
    bool setCharSet = false;
};

int64_t pow10_int(int scale) {
    int64_t result = 1;
    for (int i = 0; i < scale; ++i) {
        result *= 10;
    }
    return result;
}

size_t payloadSize(const core::Parameter& parameter) {
    if (parameter.isNull()) {
        return 0;
    }
    const auto& value = *parameter.getValue();
    if (auto* s = std::get_if<std::string>(&value)) return s->size();
    if (auto* b = std::get_if<core::Bytes>(&value)) return b->size();
    return 0;
}

InputLayout layoutFor(const core::Parameter& parameter) {
    switch (parameter.getType()) {
        case core::SqlType::Boolean:   return {SQL_BOOLEAN, 1};
        case core::SqlType::SmallInt:  return {SQL_SHORT, sizeof(int16_t)};
        case core::SqlType::Integer:   return {SQL_LONG, sizeof(int32_t)};
        case core::SqlType::BigInt:    return {SQL_INT64, sizeof(int64_t)};
        case core::SqlType::Float:     return {SQL_FLOAT, sizeof(float)};
        case core::SqlType::Double:    return {SQL_DOUBLE, sizeof(double)};
        case core::SqlType::Date:      return {SQL_TYPE_DATE, sizeof(ISC_DATE)};
        case core::SqlType::Time:      return {SQL_TYPE_TIME, sizeof(ISC_TIME)};
        case core::SqlType::Timestamp: return {SQL_TIMESTAMP, sizeof(ISC_TIMESTAMP)};
        case core::SqlType::Text: {
            size_t size = payloadSize(parameter);
            if (size > MAX_VARCHAR_LENGTH) {
                return {SQL_BLOB, sizeof(ISC_QUAD), 1};
            }
            return {SQL_VARYING, static_cast<unsigned>(size > 0 ? size : 1)};
        }
        case core::SqlType::Binary: {
            size_t size = payloadSize(parameter);
            if (size > MAX_VARCHAR_LENGTH) {
                return {SQL_BLOB, sizeof(ISC_QUAD), 0};
            }
            return {SQL_VARYING, static_cast<unsigned>(size > 0 ? size : 1), 0, CS_BINARY, true};
        }
    }
    throw FirebirdException("Unsupported parameter type");
}

ISC_DATE encodeDate(Firebird::IUtil* util, const core::Date& date) {
    if (!date.ok()) {
        throw FirebirdException("Invalid date value");
    }
    return util->encodeDate(static_cast<unsigned>(static_cast<int>(date.year())),
                            static_cast<unsigned>(date.month()),
                            static_cast<unsigned>(date.day()));
}

ISC_TIME encodeTime(Firebird::IUtil* util, core::Time time) {
    using namespace std::chrono;
    auto h = duration_cast<hours>(time);
    auto m = duration_cast<minutes>(time - h);
    auto s = duration_cast<seconds>(time - h - m);
    auto us = time - h - m - s;
    return util->encodeTime(static_cast<unsigned>(h.count() % 24),
                            static_cast<unsigned>(m.count()),
                            static_cast<unsigned>(s.count()),
                            static_cast<unsigned>(us.count() / 100));  // 1/10000 s
}

core::Date decodeDate(Firebird::IUtil* util, ISC_DATE date) {
    unsigned year, month, day;
    util->decodeDate(date, &year, &month, &day);
    return core::Date{std::chrono::year{static_cast<int>(year)},
                      std::chrono::month{month},
                      std::chrono::day{day}};
}

core::Time decodeTime(Firebird::IUtil* util, ISC_TIME time) {
    unsigned hours, minutes, seconds, fractions;
    util->decodeTime(time, &hours, &minutes, &seconds, &fractions);
    return std::chrono::hours(hours) + std::chrono::minutes(minutes) +
           std::chrono::seconds(seconds) + std::chrono::microseconds(static_cast<int64_t>(fractions) * 100);
}

template<typename T>
T require(const core::Parameter& parameter) {
    core::Value value = *parameter.getValue();
    T out{};
    if (!core::convertValue(value, out)) {
        throw FirebirdException(std::string("Parameter value does not fit declared type ") +
                                std::string(core::toString(parameter.getType())));
    }
    return out;
}

const unsigned char* bytesOf(const core::Value& value, size_t& size) {
    if (auto* s = std::get_if<std::string>(&value)) {
        size = s->size();
        return reinterpret_cast<const unsigned char*>(s->data());
    }
    if (auto* b = std::get_if<core::Bytes>(&value)) {
        size = b->size();
        return b->data();
    }
    throw FirebirdException("Parameter value is neither text nor binary");
}

} // namespace

core::SqlType columnType(const FieldInfo& field) {
    switch (field.type) {
        case SQL_TEXT:
        case SQL_VARYING:
            return field.charSet == CS_BINARY ? core::SqlType::Binary : core::SqlType::Text;
        case SQL_SHORT:
            return field.scale < 0 ? core::SqlType::Double : core::SqlType::SmallInt;
        case SQL_LONG:
            return field.scale < 0 ? core::SqlType::Double : core::SqlType::Integer;
        case SQL_INT64:
            return field.scale < 0 ? core::SqlType::Double : core::SqlType::BigInt;
        case SQL_FLOAT:
            return core::SqlType::Float;
        case SQL_DOUBLE:
        case SQL_D_FLOAT:
            return core::SqlType::Double;
        case SQL_BOOLEAN:
            return core::SqlType::Boolean;
        case SQL_TYPE_DATE:
            return core::SqlType::Date;
        case SQL_TYPE_TIME:
            return core::SqlType::Time;
        case SQL_TIMESTAMP:
            return core::SqlType::Timestamp;
        case SQL_BLOB:
            return field.subType == 1 ? core::SqlType::Text : core::SqlType::Binary;
        default:
            throw FirebirdException("Unsupported column type " + std::to_string(field.type) +
                                    " for column " + field.name);
    }
}

Firebird::IMessageMetadata* buildInputMetadata(Firebird::ThrowStatusWrapper& status,
                                               const std::vector<core::Parameter>& parameters) {
    auto& env = Environment::getInstance();
    Firebird::IMetadataBuilder* builder =
        env.getMaster()->getMetadataBuilder(&status, static_cast<unsigned>(parameters.size()));

    try {
        for (unsigned i = 0; i < parameters.size(); ++i) {
            InputLayout layout = layoutFor(parameters[i]);
            builder->setType(&status, i, layout.type + 1);  // +1: nullable
            builder->setLength(&status, i, layout.length);
            builder->setSubType(&status, i, layout.subType);
            builder->setScale(&status, i, 0);
            if (layout.setCharSet) {
                builder->setCharSet(&status, i, layout.charSet);
            }
        }
        Firebird::IMessageMetadata* metadata = builder->getMetadata(&status);
        builder->release();
        return metadata;
    }
    catch (...) {
        builder->release();
        throw;
    }
}

void writeParameter(const FieldInfo& field,
                    const core::Parameter& parameter,
                    unsigned char* buffer,
                    const BlobWriter& blobWriter) {
    auto* nullIndicator = reinterpret_cast<int16_t*>(buffer + field.nullOffset);
    unsigned char* data = buffer + field.offset;

    if (parameter.isNull()) {
        *nullIndicator = -1;
        return;
    }
    *nullIndicator = 0;

    auto* util = Environment::getInstance().getUtil();

    switch (field.type) {
        case SQL_BOOLEAN: {
            FB_BOOLEAN b = require<bool>(parameter) ? FB_TRUE : FB_FALSE;
            std::memcpy(data, &b, sizeof(b));
            break;
        }
        case SQL_SHORT: {
            auto v = require<int16_t>(parameter);
            std::memcpy(data, &v, sizeof(v));
            break;
        }
        case SQL_LONG: {
            auto v = require<int32_t>(parameter);
            std::memcpy(data, &v, sizeof(v));
            break;
        }
        case SQL_INT64: {
            auto v = require<int64_t>(parameter);
            std::memcpy(data, &v, sizeof(v));
            break;
        }
        case SQL_FLOAT: {
            auto v = require<float>(parameter);
            std::memcpy(data, &v, sizeof(v));
            break;
        }
        case SQL_DOUBLE: {
            auto v = require<double>(parameter);
            std::memcpy(data, &v, sizeof(v));
            break;
        }
        case SQL_TYPE_DATE: {
            ISC_DATE d = encodeDate(util, require<core::Date>(parameter));
            std::memcpy(data, &d, sizeof(d));
            break;
        }
        case SQL_TYPE_TIME: {
            ISC_TIME t = encodeTime(util, require<core::Time>(parameter));
            std::memcpy(data, &t, sizeof(t));
            break;
        }
        case SQL_TIMESTAMP: {
            auto tp = require<core::Timestamp>(parameter);
            auto day = std::chrono::floor<std::chrono::days>(tp);
            ISC_TIMESTAMP ts;
            ts.timestamp_date = encodeDate(util, core::Date{day});
            ts.timestamp_time = encodeTime(util, tp - day);
            std::memcpy(data, &ts, sizeof(ts));
            break;
        }
        case SQL_VARYING: {
            size_t size = 0;
            const unsigned char* bytes = bytesOf(*parameter.getValue(), size);
            if (size > field.length) {
                throw FirebirdException("Parameter value exceeds declared length");
            }
            auto len = static_cast<uint16_t>(size);
            std::memcpy(data, &len, sizeof(len));
            if (size > 0) {
                std::memcpy(data + sizeof(len), bytes, size);
            }
            break;
        }
        case SQL_BLOB: {
            size_t size = 0;
            const unsigned char* bytes = bytesOf(*parameter.getValue(), size);
            ISC_QUAD blobId = blobWriter(core::Bytes(bytes, bytes + size));
            std::memcpy(data, &blobId, sizeof(blobId));
            break;
        }
        default:
            throw FirebirdException("Unsupported input field type " + std::to_string(field.type));
    }
}

core::Field readField(const FieldInfo& field,
                      const unsigned char* buffer,
                      const BlobReader& blobReader) {
    int16_t nullIndicator = 0;
    std::memcpy(&nullIndicator, buffer + field.nullOffset, sizeof(nullIndicator));
    if (nullIndicator == -1) {
        return std::nullopt;
    }

    const unsigned char* data = buffer + field.offset;
    auto* util = Environment::getInstance().getUtil();

    switch (field.type) {
        case SQL_TEXT: {
            if (field.charSet == CS_BINARY) {
                return core::Value{core::Bytes(data, data + field.length)};
            }
            std::string value(reinterpret_cast<const char*>(data), field.length);
            value.erase(value.find_last_not_of(' ') + 1);
            return core::Value{std::move(value)};
        }
        case SQL_VARYING: {
            uint16_t len{};
            std::memcpy(&len, data, sizeof(len));
            const unsigned char* chars = data + sizeof(len);
            if (field.charSet == CS_BINARY) {
                return core::Value{core::Bytes(chars, chars + len)};
            }
            return core::Value{std::string(reinterpret_cast<const char*>(chars), len)};
        }
        case SQL_SHORT: {
            int16_t v{};
            std::memcpy(&v, data, sizeof(v));
            if (field.scale < 0) {
                return core::Value{static_cast<double>(v) / static_cast<double>(pow10_int(-field.scale))};
            }
            return core::Value{v};
        }
        case SQL_LONG: {
            int32_t v{};
            std::memcpy(&v, data, sizeof(v));
            if (field.scale < 0) {
                return core::Value{static_cast<double>(v) / static_cast<double>(pow10_int(-field.scale))};
            }
            return core::Value{v};
        }
        case SQL_INT64: {
            int64_t v{};
            std::memcpy(&v, data, sizeof(v));
            if (field.scale < 0) {
                return core::Value{static_cast<double>(v) / static_cast<double>(pow10_int(-field.scale))};
            }
            return core::Value{v};
        }
        case SQL_FLOAT: {
            float v{};
            std::memcpy(&v, data, sizeof(v));
            return core::Value{v};
        }
        case SQL_DOUBLE:
        case SQL_D_FLOAT: {
            double v{};
            std::memcpy(&v, data, sizeof(v));
            return core::Value{v};
        }
        case SQL_BOOLEAN: {
            FB_BOOLEAN v{};
            std::memcpy(&v, data, sizeof(v));
            return core::Value{v != FB_FALSE};
        }
        case SQL_TYPE_DATE: {
            ISC_DATE d{};
            std::memcpy(&d, data, sizeof(d));
            return core::Value{decodeDate(util, d)};
        }
        case SQL_TYPE_TIME: {
            ISC_TIME t{};
            std::memcpy(&t, data, sizeof(t));
            return core::Value{decodeTime(util, t)};
        }
        case SQL_TIMESTAMP: {
            ISC_TIMESTAMP ts{};
            std::memcpy(&ts, data, sizeof(ts));
            core::Timestamp tp = std::chrono::sys_days{decodeDate(util, ts.timestamp_date)} +
                                 decodeTime(util, ts.timestamp_time);
            return core::Value{tp};
        }
        case SQL_BLOB: {
            ISC_QUAD blobId{};
            std::memcpy(&blobId, data, sizeof(blobId));
            core::Bytes bytes = blobReader(blobId);
            if (field.subType == 1) {
                return core::Value{std::string(bytes.begin(), bytes.end())};
            }
            return core::Value{std::move(bytes)};
        }
        default:
            throw FirebirdException("Unsupported column type " + std::to_string(field.type) +
                                    " for column " + field.name);
    }
}

core::Bytes loadBlob(Firebird::IAttachment* attachment,
                     Firebird::ITransaction* transaction,
                     const ISC_QUAD& blobId) {
    if (blobId.gds_quad_high == 0 && blobId.gds_quad_low == 0) {
        return core::Bytes();
    }

    auto& env = Environment::getInstance();
    Firebird::ThrowStatusWrapper st(env.getMaster()->getStatus());

    Firebird::IBlob* blob = nullptr;
    try {
        ISC_QUAD id = blobId;
        blob = attachment->openBlob(&st, transaction, &id, 0, nullptr);

        core::Bytes data;
        const unsigned segmentSize = 32768;
        std::vector<unsigned char> segment(segmentSize);

        while (true) {
            unsigned actualLength = 0;
            int result = blob->getSegment(&st, segmentSize, segment.data(), &actualLength);
            if (result == Firebird::IStatus::RESULT_OK ||
                result == Firebird::IStatus::RESULT_SEGMENT) {
                data.insert(data.end(), segment.begin(), segment.begin() + actualLength);
            } else {
                break;  // RESULT_NO_DATA
            }
        }

        blob->close(&st);
        blob = nullptr;
        st.dispose();
        return data;
    }
    catch (const Firebird::FbException& e) {
        FirebirdException error(e);
        if (blob) {
            blob->release();
        }
        st.dispose();
        throw error;
    }
}

ISC_QUAD createBlob(Firebird::IAttachment* attachment,
                    Firebird::ITransaction* transaction,
                    const core::Bytes& data) {
    auto& env = Environment::getInstance();
    Firebird::ThrowStatusWrapper st(env.getMaster()->getStatus());

    ISC_QUAD blobId;
    std::memset(&blobId, 0, sizeof(ISC_QUAD));

    Firebird::IBlob* blob = nullptr;
    try {
        blob = attachment->createBlob(&st, transaction, &blobId, 0, nullptr);

        const size_t segmentSize = 32768;
        size_t offset = 0;
        while (offset < data.size()) {
            size_t chunkSize = std::min(segmentSize, data.size() - offset);
            blob->putSegment(&st, static_cast<unsigned>(chunkSize), data.data() + offset);
            offset += chunkSize;
        }

        blob->close(&st);
        blob = nullptr;
        st.dispose();
        return blobId;
    }
    catch (const Firebird::FbException& e) {
        FirebirdException error(e);
        if (blob) {
            blob->release();
        }
        st.dispose();
        throw error;
    }
}

} // namespace value_codec
} // namespace firebird
} // namespace rdbcpp
