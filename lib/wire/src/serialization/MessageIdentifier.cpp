#include "digistream/wire/serialization/MessageIdentifier.hpp"

#include <cstdio>
#include <cstring>

#include "digistream/wire/serialization/ProtocolConstants.hpp"

namespace DIGISTREAM::Wire {

bool bufferHasIdentifier(const uint8_t* data, size_t size, const char* identifier)
{
    if (!data || !identifier || size < IDENTIFIER_SIZE) {
        return false;
    }
    return std::memcmp(data, identifier, IDENTIFIER_SIZE) == 0;
}

MessageKind identify(const uint8_t* data, size_t size)
{
    if (bufferHasIdentifier(data, size, EVENT_LIST_IDENTIFIER)) {
        return MessageKind::EventList;
    }
    if (bufferHasIdentifier(data, size, ANALOG_TRACE_IDENTIFIER)) {
        return MessageKind::AnalogTrace;
    }
    return MessageKind::Unknown;
}

const char* identifierFor(MessageKind kind)
{
    switch (kind) {
        case MessageKind::EventList:
            return EVENT_LIST_IDENTIFIER;
        case MessageKind::AnalogTrace:
            return ANALOG_TRACE_IDENTIFIER;
        case MessageKind::Unknown:
            return nullptr;
    }
    return nullptr;
}

std::string messageKindToString(MessageKind kind)
{
    switch (kind) {
        case MessageKind::EventList:
            return "EventList";
        case MessageKind::AnalogTrace:
            return "AnalogTrace";
        case MessageKind::Unknown:
            return "Unknown";
    }
    return "Unknown";
}

std::string describeIdentifier(const uint8_t* data, size_t size)
{
    if (!data) {
        return "<null>";
    }
    std::string text;
    size_t count = size < IDENTIFIER_SIZE ? size : IDENTIFIER_SIZE;
    for (size_t i = 0; i < count; ++i) {
        unsigned char c = data[i];
        if (c >= 0x20 && c < 0x7f) {
            text += static_cast<char>(c);
        } else {
            char escaped[5];
            std::snprintf(escaped, sizeof(escaped), "\\x%02x", c);
            text += escaped;
        }
    }
    if (count < IDENTIFIER_SIZE) {
        text += "..";
    }
    return text;
}

} // namespace DIGISTREAM::Wire
