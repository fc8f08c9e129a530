#pragma once
#include "io/retry.hpp"
#include <cstdint>
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
/// The reference point of a seek
enum class Whence : uint8_t {
    Start = 0,
    Current = 1,
    End = 2
};
//---------------------------------------------------------------------------
/// Config of a reader
struct ReaderConfig {
    /// Default size of the lookahead buffer
    static constexpr uint64_t defaultBufferSize = 128u << 10;

    /// The size of the lookahead buffer
    uint64_t bufferSize = defaultBufferSize;
    /// The line terminator of readline
    std::string lineTerminator = "\n";
    /// Skip the initial seek, the construction does not touch the store
    bool deferSeek = false;
    /// Read a specific version
    std::optional<std::string> versionId;
};
//---------------------------------------------------------------------------
/// Config of a multipart writer
struct MultipartConfig {
    /// Default size of a part
    static constexpr uint64_t defaultMinPartSize = 50ull << 20;
    /// The smallest part size the store accepts for all but the last part
    static constexpr uint64_t minMinPartSize = 5ull << 20;

    /// Upload a part once this many bytes are staged
    uint64_t minPartSize = defaultMinPartSize;
    /// The retry policy for initiate, part upload and completion
    RetryPolicy retry;
};
//---------------------------------------------------------------------------
} // namespace blobstream::io
