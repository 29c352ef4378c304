#include "digistream/wire/serialization/BufferIO.hpp"

namespace DIGISTREAM::Wire {

Status ByteReader::seek(size_t offset) {
    if (offset > size_) {
        return Error{Error::TRUNCATED_BUFFER,
                     "Offset " + std::to_string(offset) + " is beyond the end of a " +
                     std::to_string(size_) + "-byte buffer"};
    }
    offset_ = offset;
    return std::monostate{};
}

Error ByteReader::truncated(const char* field, size_t needed) const {
    return Error{Error::TRUNCATED_BUFFER,
                 std::string("Buffer too small for ") + field + ": need " + std::to_string(needed) +
                 " bytes at offset " + std::to_string(offset_) + ", " +
                 std::to_string(remaining()) + " remaining"};
}

} // namespace DIGISTREAM::Wire
