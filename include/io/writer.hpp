#pragma once
#include "utils/error.hpp"
#include <cstdint>
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
/// The interface of the object writers
/// Not thread safe, close and terminate finalize the writer exactly once
class Writer {
    public:
    /// The destructor
    virtual ~Writer() = default;

    /// Append bytes, returns the number of accepted bytes
    virtual uint64_t write(std::span<const uint8_t> data) = 0;
    /// Commit the written bytes
    virtual void close() = 0;
    /// Discard the written bytes
    virtual void terminate() = 0;
    /// The number of written bytes
    [[nodiscard]] virtual uint64_t tell() const = 0;
    /// Is the writer finalized
    [[nodiscard]] virtual bool closed() const = 0;
    /// The name, the key of the object
    [[nodiscard]] virtual const std::string& name() const = 0;

    /// Writing is supported
    [[nodiscard]] bool writable() const { return true; }
    /// Bytes are staged until a part is full, nothing to flush
    void flush() {}
    /// Unsupported
    [[noreturn]] void detach() { throw Error(Error::Kind::Unsupported, "detach() not supported"); }
};
//---------------------------------------------------------------------------
} // namespace blobstream::io
