#pragma once
#include "cloud/store.hpp"
#include "io/config.hpp"
#include "io/writer.hpp"
#include "utils/data_vector.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
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
/// Writes an object as a multipart upload
/// Bytes are staged until a part of at least minPartSize is complete
class MultipartWriter : public Writer {
    public:
    /// The state of the upload
    enum class State : uint8_t {
        Open,
        Uploading,
        Completed,
        Aborted
    };
    /// The upload bookkeeping
    struct Session {
        /// The upload id
        std::string uploadId;
        /// The state
        State state = State::Open;
        /// The uploaded parts in order
        std::vector<cloud::CompletedPart> parts;
        /// The number of written bytes
        uint64_t totalBytes = 0;
        /// The number of uploaded parts
        uint32_t totalParts = 0;
    };

    private:
    /// The store
    std::shared_ptr<cloud::Store> _store;
    /// The object
    cloud::ObjectHandle _handle;
    /// The config
    MultipartConfig _config;
    /// The staged bytes
    utils::Bytes _staging;
    /// The session
    Session _session;

    /// Upload the staged bytes as the next part
    void uploadNextPart();
    /// Is the session finalized
    [[nodiscard]] bool finalized() const { return _session.state == State::Completed || _session.state == State::Aborted; }

    public:
    /// The constructor, initiates the upload
    MultipartWriter(std::shared_ptr<cloud::Store> store, const std::string& bucket, const std::string& key, MultipartConfig config = MultipartConfig());
    /// The destructor, aborts an unfinished upload
    ~MultipartWriter() noexcept override;

    /// Stage bytes, uploads a part once minPartSize bytes are staged
    uint64_t write(std::span<const uint8_t> data) override;
    /// Upload the remaining bytes and complete the upload
    void close() override;
    /// Abort the upload
    void terminate() override;
    /// The number of written bytes
    [[nodiscard]] uint64_t tell() const override { return _session.totalBytes; }
    /// Is the upload finalized
    [[nodiscard]] bool closed() const override { return finalized(); }
    /// The key
    [[nodiscard]] const std::string& name() const override { return _handle.key; }

    /// The session
    [[nodiscard]] const Session& session() const { return _session; }
};
//---------------------------------------------------------------------------
} // namespace blobstream::io
