#pragma once
#include "cloud/store.hpp"
#include "io/writer.hpp"
#include "utils/data_vector.hpp"
#include <cstdint>
#include <memory>
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
/// Writes an object with a single put
/// The whole payload is buffered until close
class SinglepartWriter : public Writer {
    /// The store
    std::shared_ptr<cloud::Store> _store;
    /// The object
    cloud::ObjectHandle _handle;
    /// The payload
    utils::Bytes _buffer;
    /// The number of written bytes
    uint64_t _totalBytes;
    /// Finalized
    bool _closed;

    public:
    /// The constructor, checks that the bucket is accessible
    SinglepartWriter(std::shared_ptr<cloud::Store> store, const std::string& bucket, const std::string& key);

    /// Buffer bytes
    uint64_t write(std::span<const uint8_t> data) override;
    /// Put the object
    void close() override;
    /// Drop the buffer, nothing was sent
    void terminate() override;
    /// The number of written bytes
    [[nodiscard]] uint64_t tell() const override { return _totalBytes; }
    /// Is the writer finalized
    [[nodiscard]] bool closed() const override { return _closed; }
    /// The key
    [[nodiscard]] const std::string& name() const override { return _handle.key; }
};
//---------------------------------------------------------------------------
} // namespace blobstream::io
