/**
 * @file BufferIO.hpp
 * @brief Little-endian byte writer, bounds-checked reader and zero-copy array views
 *
 * The wire format is packed, so arrays inside a buffer are generally not
 * aligned for their element type. ArrayView therefore copies each element
 * out with memcpy instead of handing out typed pointers.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <iterator>
#include <string>
#include <type_traits>
#include <vector>

#include "digistream/wire/utils/Error.hpp"

namespace DIGISTREAM::Wire {

/**
 * @brief Read-only view over a packed little-endian array in a borrowed buffer
 *
 * Valid only as long as the underlying buffer is.
 */
template<typename T>
class ArrayView {
    static_assert(std::is_trivially_copyable<T>::value, "ArrayView requires trivially copyable elements");

public:
    class const_iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = T;
        using difference_type = std::ptrdiff_t;
        using pointer = const T*;
        using reference = T;

        const_iterator() : ptr_(nullptr) {}
        explicit const_iterator(const uint8_t* ptr) : ptr_(ptr) {}

        T operator*() const {
            T value;
            std::memcpy(&value, ptr_, sizeof(T));
            return value;
        }
        const_iterator& operator++() {
            ptr_ += sizeof(T);
            return *this;
        }
        const_iterator operator++(int) {
            const_iterator previous = *this;
            ptr_ += sizeof(T);
            return previous;
        }
        bool operator==(const const_iterator& other) const { return ptr_ == other.ptr_; }
        bool operator!=(const const_iterator& other) const { return ptr_ != other.ptr_; }

    private:
        const uint8_t* ptr_;
    };

    ArrayView() : data_(nullptr), size_(0) {}
    ArrayView(const uint8_t* data, size_t count) : data_(data), size_(count) {}

    size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }

    /// Element i, no bounds check
    T operator[](size_t i) const {
        T value;
        std::memcpy(&value, data_ + i * sizeof(T), sizeof(T));
        return value;
    }

    const_iterator begin() const { return const_iterator(data_); }
    const_iterator end() const { return const_iterator(data_ + size_ * sizeof(T)); }

    /// Raw bytes of the array inside the borrowed buffer
    const uint8_t* bytes() const { return data_; }
    size_t byteSize() const { return size_ * sizeof(T); }

    /// Owned copy of the elements
    std::vector<T> toVector() const {
        std::vector<T> out(size_);
        if (size_ > 0) {
            std::memcpy(out.data(), data_, byteSize());
        }
        return out;
    }

    bool operator==(const std::vector<T>& other) const {
        if (other.size() != size_) {
            return false;
        }
        return size_ == 0 || std::memcmp(other.data(), data_, byteSize()) == 0;
    }
    bool operator!=(const std::vector<T>& other) const { return !(*this == other); }

private:
    const uint8_t* data_;
    size_t size_;
};

/**
 * @brief Appends little-endian scalars and arrays to a byte vector
 */
class ByteWriter {
public:
    explicit ByteWriter(std::vector<uint8_t>& buffer) : buffer_(buffer) {}

    template<typename T>
    void write(T value) {
        static_assert(std::is_trivially_copyable<T>::value, "write requires a trivially copyable type");
        writeBytes(&value, sizeof(T));
    }

    template<typename T>
    void writeArray(const T* data, size_t count) {
        static_assert(std::is_trivially_copyable<T>::value, "writeArray requires trivially copyable elements");
        if (count > 0) {
            writeBytes(data, count * sizeof(T));
        }
    }

    /// Write a u32 element count followed by the elements
    template<typename T>
    void writeSequence(const std::vector<T>& values) {
        write<uint32_t>(static_cast<uint32_t>(values.size()));
        writeArray(values.data(), values.size());
    }

    void writeBytes(const void* data, size_t size) {
        size_t offset = buffer_.size();
        buffer_.resize(offset + size);
        std::memcpy(buffer_.data() + offset, data, size);
    }

    /// Overwrite a previously written value
    template<typename T>
    void patch(size_t offset, T value) {
        static_assert(std::is_trivially_copyable<T>::value, "patch requires a trivially copyable type");
        std::memcpy(buffer_.data() + offset, &value, sizeof(T));
    }

    size_t position() const { return buffer_.size(); }

private:
    std::vector<uint8_t>& buffer_;
};

/**
 * @brief Bounds-checked little-endian reader over a borrowed buffer
 *
 * Every read past the end yields TRUNCATED_BUFFER naming the field.
 */
class ByteReader {
public:
    ByteReader(const uint8_t* data, size_t size, size_t offset = 0)
        : data_(data), size_(size), offset_(offset) {}

    size_t position() const { return offset_; }
    size_t size() const { return size_; }
    size_t remaining() const { return offset_ <= size_ ? size_ - offset_ : 0; }
    bool atEnd() const { return offset_ >= size_; }

    /// Move to an absolute offset (may equal size())
    Status seek(size_t offset);

    template<typename T>
    Result<T> read(const char* field) {
        static_assert(std::is_trivially_copyable<T>::value, "read requires a trivially copyable type");
        if (remaining() < sizeof(T)) {
            return truncated(field, sizeof(T));
        }
        T value;
        std::memcpy(&value, data_ + offset_, sizeof(T));
        offset_ += sizeof(T);
        return value;
    }

    template<typename T>
    Result<ArrayView<T>> readArray(size_t count, const char* field) {
        // Compare in element units so a huge count cannot overflow the byte size
        if (count > remaining() / sizeof(T)) {
            return truncated(field, count * sizeof(T));
        }
        ArrayView<T> view(data_ + offset_, count);
        offset_ += count * sizeof(T);
        return view;
    }

    /// Read a u32 element count followed by the elements
    template<typename T>
    Result<ArrayView<T>> readSequence(const char* field) {
        auto count = read<uint32_t>(field);
        if (!isOk(count)) {
            return getError(count);
        }
        return readArray<T>(getValue(count), field);
    }

private:
    Error truncated(const char* field, size_t needed) const;

    const uint8_t* data_;
    size_t size_;
    size_t offset_;
};

} // namespace DIGISTREAM::Wire
