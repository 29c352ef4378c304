/**
 * @file FrameMetadataCodec.cpp
 * @brief Implementation of GpsTime and FrameMetadata encoding
 */

#include "digistream/wire/serialization/FrameMetadataCodec.hpp"

#include <cstring>
#include <string>

namespace DIGISTREAM::Wire {

namespace {

SerializedGpsTime toSerialized(const Core::GpsTime& time) {
    SerializedGpsTime packed;
    packed.year = time.year;
    packed.day = time.day;
    packed.hour = time.hour;
    packed.minute = time.minute;
    packed.second = time.second;
    packed.millisecond = time.millisecond;
    packed.microsecond = time.microsecond;
    packed.nanosecond = time.nanosecond;
    return packed;
}

Core::GpsTime fromSerialized(const SerializedGpsTime& packed) {
    return Core::GpsTime(packed.year, packed.day, packed.hour, packed.minute, packed.second,
                         packed.millisecond, packed.microsecond, packed.nanosecond);
}

SerializedFrameMetadata toSerialized(const Core::FrameMetadata& metadata) {
    SerializedFrameMetadata packed;
    packed.has_timestamp = FIELD_PRESENT;
    packed.timestamp = toSerialized(metadata.timestamp);
    packed.period_number = metadata.period_number;
    packed.protons_per_pulse = metadata.protons_per_pulse;
    packed.running = metadata.running ? 1 : 0;
    packed.frame_number = metadata.frame_number;
    packed.veto_flags = metadata.veto_flags;
    return packed;
}

void checkRange(std::vector<Error>& violations, const char* context, const char* field,
                unsigned value, unsigned min, unsigned max) {
    if (value < min || value > max) {
        violations.emplace_back(Error::FIELD_OUT_OF_RANGE,
                                std::string(context) + "." + field + " = " + std::to_string(value) +
                                " is outside [" + std::to_string(min) + ", " +
                                std::to_string(max) + "]");
    }
}

} // namespace

std::vector<uint8_t> encodeGpsTime(const Core::GpsTime& time) {
    SerializedGpsTime packed = toSerialized(time);
    std::vector<uint8_t> buffer(sizeof(packed));
    std::memcpy(buffer.data(), &packed, sizeof(packed));
    return buffer;
}

Result<Core::GpsTime> decodeGpsTime(const uint8_t* data, size_t size) {
    if (!data || size < GPS_TIME_SIZE) {
        return Error{Error::TRUNCATED_BUFFER,
                     "GpsTime needs " + std::to_string(GPS_TIME_SIZE) + " bytes, got " +
                     std::to_string(data ? size : 0)};
    }
    SerializedGpsTime packed;
    std::memcpy(&packed, data, sizeof(packed));
    return fromSerialized(packed);
}

std::vector<uint8_t> encodeFrameMetadata(const Core::FrameMetadata& metadata) {
    std::vector<uint8_t> buffer;
    buffer.reserve(FRAME_METADATA_SIZE);
    ByteWriter writer(buffer);
    writeFrameMetadata(writer, metadata);
    return buffer;
}

Result<Core::FrameMetadata> decodeFrameMetadata(const uint8_t* data, size_t size) {
    if (!data) {
        return Error{Error::TRUNCATED_BUFFER, "FrameMetadata buffer is null"};
    }
    ByteReader reader(data, size);
    return readFrameMetadata(reader);
}

void writeFrameMetadata(ByteWriter& writer, const Core::FrameMetadata& metadata) {
    SerializedFrameMetadata packed = toSerialized(metadata);
    writer.writeBytes(&packed, sizeof(packed));
}

Result<Core::FrameMetadata> readFrameMetadata(ByteReader& reader) {
    // The presence flag comes first so a missing timestamp is reported even
    // when the rest of the block is cut short
    auto has_timestamp = reader.read<uint8_t>("FrameMetadata.has_timestamp");
    if (!isOk(has_timestamp)) {
        return getError(has_timestamp);
    }
    if (getValue(has_timestamp) != FIELD_PRESENT) {
        return Error{Error::MISSING_REQUIRED_FIELD, "FrameMetadata.timestamp is absent"};
    }

    auto packed_time = reader.read<SerializedGpsTime>("FrameMetadata.timestamp");
    if (!isOk(packed_time)) {
        return getError(packed_time);
    }

    struct __attribute__((packed)) Scalars {
        uint64_t period_number;
        uint8_t protons_per_pulse;
        uint8_t running;
        uint32_t frame_number;
        uint16_t veto_flags;
    };
    static_assert(sizeof(Scalars) + 1 + GPS_TIME_SIZE == FRAME_METADATA_SIZE,
                  "FrameMetadata scalars out of sync with SerializedFrameMetadata");

    auto scalars = reader.read<Scalars>("FrameMetadata");
    if (!isOk(scalars)) {
        return getError(scalars);
    }
    const Scalars& fields = getValue(scalars);

    Core::FrameMetadata metadata;
    metadata.timestamp = fromSerialized(getValue(packed_time));
    metadata.period_number = fields.period_number;
    metadata.protons_per_pulse = fields.protons_per_pulse;
    metadata.running = fields.running != 0;
    metadata.frame_number = fields.frame_number;
    metadata.veto_flags = fields.veto_flags;
    return metadata;
}

std::vector<Error> validateGpsTime(const Core::GpsTime& time, const char* context) {
    std::vector<Error> violations;
    unsigned year = 2000u + time.year;
    bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;

    checkRange(violations, context, "day", time.day, 1, leap ? 366 : 365);
    checkRange(violations, context, "hour", time.hour, 0, 23);
    checkRange(violations, context, "minute", time.minute, 0, 59);
    checkRange(violations, context, "second", time.second, 0, 59);
    checkRange(violations, context, "millisecond", time.millisecond, 0, 999);
    checkRange(violations, context, "microsecond", time.microsecond, 0, 999);
    checkRange(violations, context, "nanosecond", time.nanosecond, 0, 999);
    return violations;
}

} // namespace DIGISTREAM::Wire
