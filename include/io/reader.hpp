#pragma once
#include "io/byte_buffer.hpp"
#include "io/config.hpp"
#include "io/range_reader.hpp"
#include <cstdint>
#include <memory>
#include <span>
#include <string>
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
/// A buffered, seekable reader of one object
/// Not thread safe, every call that needs data blocks on the store
class Reader {
    /// The range reader
    RangeReader _raw;
    /// The lookahead buffer
    ByteBuffer _buffer;
    /// The config
    ReaderConfig _config;
    /// The logical position
    uint64_t _position;
    /// The range reader is exhausted
    bool _eof;
    /// Closed
    bool _closed;

    /// Consume up to size bytes from the buffer, everything with a negative size
    std::string readFromBuffer(int64_t size = -1);
    /// Fill the buffer until it holds max(size, bufferSize) bytes or the object ends
    void fillBuffer(int64_t size = -1);
    /// Fail if closed
    void checkOpen() const;

    public:
    /// The constructor, seeks to the start unless deferSeek is set
    Reader(std::shared_ptr<cloud::Store> store, const std::string& bucket, const std::string& key, ReaderConfig config = ReaderConfig());

    /// Read up to size bytes, everything remaining with a negative size
    [[nodiscard]] std::string read(int64_t size = -1);
    /// Same as read
    [[nodiscard]] std::string read1(int64_t size = -1) { return read(size); }
    /// Read into the target, returns the number of bytes
    uint64_t readinto(std::span<uint8_t> target);
    /// Read a line including its terminator, only limit -1 is supported
    [[nodiscard]] std::string readline(int64_t limit = -1);
    /// Seek, returns the new position
    uint64_t seek(int64_t offset, Whence whence = Whence::Start);
    /// The position
    [[nodiscard]] uint64_t tell() const { return _position; }
    /// Release the resources
    void close();
    /// Nothing to cancel for a reader
    void terminate() {}

    /// Seeking is supported
    [[nodiscard]] bool seekable() const { return true; }
    /// Reading is supported
    [[nodiscard]] bool readable() const { return true; }
    /// Is the reader closed
    [[nodiscard]] bool closed() const { return _closed; }
    /// Unsupported
    [[noreturn]] void truncate(std::optional<uint64_t> size = std::nullopt);
    /// Unsupported
    [[noreturn]] void detach();

    /// The name, the key of the object
    [[nodiscard]] const std::string& name() const { return _raw.handle().key; }
    /// The object
    [[nodiscard]] const cloud::ObjectHandle& handle() const { return _raw.handle(); }
    /// The content length once known
    [[nodiscard]] std::optional<uint64_t> contentLength() const { return _raw.contentLength(); }
};
//---------------------------------------------------------------------------
} // namespace blobstream::io
