#pragma once
#include "io/writer.hpp"
#include "utils/log.hpp"
#include <exception>
#include <memory>
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
/// Owns a writer and finalizes it exactly once
/// Leaving the scope without finish() cancels the upload
template <typename W = Writer>
class WriteGuard {
    /// The writer
    std::unique_ptr<W> _writer;
    /// Finalized
    bool _done;

    public:
    /// The constructor
    explicit WriteGuard(std::unique_ptr<W> writer) : _writer(std::move(writer)), _done(false) {
        if (!_writer)
            throw Error(Error::Kind::Configuration, "WriteGuard requires a writer");
    }
    /// The destructor
    ~WriteGuard() noexcept {
        if (_done)
            return;
        try {
            cancel();
        } catch (const std::exception& e) {
            utils::logger().error("{}: cancel failed: {}", _writer->name(), e.what());
        }
    }

    WriteGuard(const WriteGuard&) = delete;
    WriteGuard& operator=(const WriteGuard&) = delete;

    /// Access the writer
    W* operator->() { return _writer.get(); }
    /// Access the writer
    W& operator*() { return *_writer; }
    /// Access the writer
    [[nodiscard]] W& get() { return *_writer; }

    /// Commit, calls close
    void finish() {
        if (_done)
            return;
        _done = true;
        _writer->close();
    }
    /// Discard, calls terminate
    void cancel() {
        if (_done)
            return;
        _done = true;
        _writer->terminate();
    }
    /// Was the writer finalized
    [[nodiscard]] bool done() const { return _done; }
};
//---------------------------------------------------------------------------
} // namespace blobstream::io
