#pragma once
#include "utils/data_vector.hpp"
#include <cstdint>
#include <string>
#include <string_view>
//---------------------------------------------------------------------------
// BlobStream - Streaming I/O for Cloud Object Storage
// The BlobStream Authors, 2024
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace blobstream::io {
//---------------------------------------------------------------------------
/// A growable window of bytes, filled at the back and consumed from the front
class ByteBuffer {
    /// The bytes, consumed up to _offset
    utils::Bytes _data;
    /// The read offset
    uint64_t _offset;
    /// The number of bytes requested by a fill
    uint64_t _chunkSize;

    /// Drop the consumed prefix
    void compact();

    public:
    /// The constructor
    explicit ByteBuffer(uint64_t chunkSize);

    /// The number of unread bytes
    [[nodiscard]] uint64_t length() const { return _data.size() - _offset; }
    /// The chunk size
    [[nodiscard]] uint64_t chunkSize() const { return _chunkSize; }
    /// A view of the unread bytes
    [[nodiscard]] std::string_view view() const { return {reinterpret_cast<const char*>(_data.cdata()) + _offset, length()}; }

    /// Append bytes
    void append(std::string_view bytes);
    /// Read up to chunkSize bytes from the source, returns the number of appended bytes
    template <typename Source>
    uint64_t fill(Source& source) {
        auto chunk = source.read(static_cast<int64_t>(_chunkSize));
        append(chunk);
        return chunk.size();
    }

    /// Read and consume up to size bytes
    [[nodiscard]] std::string read(uint64_t size);
    /// Read up to size bytes without consuming them
    [[nodiscard]] std::string peek(uint64_t size) const;
    /// Read and consume up to and including the terminator, or everything if there is none
    [[nodiscard]] std::string readline(std::string_view terminator);
    /// Discard everything
    void empty();
};
//---------------------------------------------------------------------------
} // namespace blobstream::io
