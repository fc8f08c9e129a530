#pragma once
#include "cloud/store.hpp"
#include "io/config.hpp"
#include <cstdint>
#include <memory>
#include <optional>
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
/// Reads an object through range requests
/// Keeps one streaming body open and reopens it after a seek or a dropped connection
class RangeReader {
    /// The store
    std::shared_ptr<cloud::Store> _store;
    /// The object
    cloud::ObjectHandle _handle;
    /// The current position
    uint64_t _position;
    /// The content length, once known it never changes
    std::optional<uint64_t> _contentLength;
    /// The open body, none means the next read opens a new range
    std::unique_ptr<cloud::ObjectBody> _body;

    /// Open a range request, without arguments at the current position
    void openBody(std::optional<uint64_t> start = std::nullopt, std::optional<uint64_t> suffix = std::nullopt);
    /// Resolve the object size after an unsatisfiable range
    void resolveSize(const cloud::StoreError& error);
    /// Read from the open body, all remaining bytes with a negative size
    std::string readFromBody(int64_t size);
    /// Build the error raised for a failed store call
    [[nodiscard]] Error accessError(const std::string& what) const;

    public:
    /// The constructor, performs no network call
    RangeReader(std::shared_ptr<cloud::Store> store, cloud::ObjectHandle handle);

    /// Seek to a position, returns the new position
    uint64_t seek(int64_t offset, Whence whence = Whence::Start);
    /// Read up to size bytes, everything remaining with a negative size
    [[nodiscard]] std::string read(int64_t size = -1);
    /// Release the open body
    void close();

    /// The position
    [[nodiscard]] uint64_t position() const { return _position; }
    /// The content length if known
    [[nodiscard]] std::optional<uint64_t> contentLength() const { return _contentLength; }
    /// The object
    [[nodiscard]] const cloud::ObjectHandle& handle() const { return _handle; }
};
//---------------------------------------------------------------------------
} // namespace blobstream::io
