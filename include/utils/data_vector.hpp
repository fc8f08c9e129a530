#pragma once
#include <cstdint>
#include <cstring>
#include <algorithm>
#include <memory>
#include <span>
#include <string_view>
//---------------------------------------------------------------------------
// BlobStream - Streaming I/O for Cloud Object Storage
// Dominik Durner, 2022
// The BlobStream Authors, 2024
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace blobstream::utils {
//---------------------------------------------------------------------------
/// Minimal version of a vector that only allows to store raw data
/// Growing keeps the content, shrinking from the front moves the tail
template <typename T>
class DataVector {
    private:
    /// Current capacity
    uint64_t _capacity;
    /// Current size
    uint64_t _size;
    /// The data
    std::unique_ptr<T[]> _data;

    public:
    /// Constructor
    DataVector() : _capacity(0), _size(0) {}

    /// Constructor with size
    explicit DataVector(uint64_t cap) : _capacity(0), _size(0) {
        resize(cap);
    }

    /// Constructor from other pointers
    DataVector(const T* start, const T* end) : _capacity(0), _size(0) {
        append(start, static_cast<uint64_t>(end - start));
    }

    /// Copy constructor
    DataVector(const DataVector& rhs) : _capacity(0), _size(0) {
        append(rhs.cdata(), rhs.size());
    }

    /// Move constructor
    DataVector(DataVector&& rhs) noexcept : _capacity(rhs._capacity), _size(rhs._size), _data(std::move(rhs._data)) {
        rhs._capacity = 0;
        rhs._size = 0;
    }

    /// Copy assignment
    DataVector& operator=(const DataVector& rhs) {
        if (this != &rhs) {
            clear();
            append(rhs.cdata(), rhs.size());
        }
        return *this;
    }

    /// Move assignment
    DataVector& operator=(DataVector&& rhs) noexcept {
        _capacity = rhs._capacity;
        _size = rhs._size;
        _data = std::move(rhs._data);
        rhs._capacity = 0;
        rhs._size = 0;
        return *this;
    }

    /// Get the data
    [[nodiscard]] T* data() {
        return _data.get();
    }

    /// Get the data
    [[nodiscard]] const T* cdata() const {
        return _data.get();
    }

    /// Get the size
    [[nodiscard]] uint64_t size() const {
        return _size;
    }

    /// Is the vector empty
    [[nodiscard]] bool empty() const {
        return !_size;
    }

    /// Get the capacity
    [[nodiscard]] uint64_t capacity() const {
        return _capacity;
    }

    /// Clear the size
    void clear() {
        _size = 0;
    }

    /// Increase the capacity
    void reserve(uint64_t cap) {
        if (_capacity < cap) {
            auto swap = std::unique_ptr<T[]>(new T[cap]());
            if (_data && _size)
                std::memcpy(swap.get(), _data.get(), _size * sizeof(T));
            _data.swap(swap);
            _capacity = cap;
        }
    }

    /// Change the number of elements
    void resize(uint64_t size) {
        if (size > _capacity) {
            reserve(size);
        }
        _size = size;
    }

    /// Append elements, grows geometrically
    void append(const T* start, uint64_t count) {
        if (!count)
            return;
        if (_size + count > _capacity)
            reserve(std::max(_size + count, _capacity << 1));
        std::memcpy(_data.get() + _size, start, count * sizeof(T));
        _size += count;
    }

    /// Remove the first count elements
    void erasePrefix(uint64_t count) {
        if (count >= _size) {
            _size = 0;
            return;
        }
        std::memmove(_data.get(), _data.get() + count, (_size - count) * sizeof(T));
        _size -= count;
    }

    /// Get a view of the content
    [[nodiscard]] std::span<const T> span() const {
        return {_data.get(), _size};
    }
};
//---------------------------------------------------------------------------
/// The byte vector used for payloads
using Bytes = DataVector<uint8_t>;
//---------------------------------------------------------------------------
/// View bytes as characters
inline std::string_view asString(std::span<const uint8_t> bytes) {
    return {reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}
//---------------------------------------------------------------------------
/// View characters as bytes
inline std::span<const uint8_t> asBytes(std::string_view str) {
    return {reinterpret_cast<const uint8_t*>(str.data()), str.size()};
}
//---------------------------------------------------------------------------
} // namespace blobstream::utils
