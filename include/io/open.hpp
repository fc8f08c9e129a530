#pragma once
#include "cloud/provider.hpp"
#include "cloud/store.hpp"
#include "io/config.hpp"
#include "io/reader.hpp"
#include "io/writer.hpp"
#include <memory>
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
/// The mode of readers
inline constexpr std::string_view readBinary = "rb";
/// The mode of writers
inline constexpr std::string_view writeBinary = "wb";
//---------------------------------------------------------------------------
/// The options of open
struct OpenOptions {
    /// The reader config, including the version
    ReaderConfig reader;
    /// The multipart writer config
    MultipartConfig multipart;
    /// Use a multipart upload, otherwise a single put
    bool multipartUpload = true;
    /// The options to build a store for uri based opens
    cloud::Provider::StoreOptions store;
};
//---------------------------------------------------------------------------
/// Merge the credentials and the host of the uri into the options, returns the uri without credentials
cloud::Uri consolidate(cloud::Uri uri, OpenOptions& options);
//---------------------------------------------------------------------------
/// Open an object for reading, the mode must be "rb"
[[nodiscard]] std::unique_ptr<Reader> openReader(const std::string& bucket, const std::string& key, std::string_view mode, const OpenOptions& options, std::shared_ptr<cloud::Store> store);
/// Open an object for writing, the mode must be "wb"
[[nodiscard]] std::unique_ptr<Writer> openWriter(const std::string& bucket, const std::string& key, std::string_view mode, const OpenOptions& options, std::shared_ptr<cloud::Store> store);
/// Open an s3 uri for reading
[[nodiscard]] std::unique_ptr<Reader> openReader(std::string_view uri, std::string_view mode, OpenOptions options = OpenOptions());
/// Open an s3 uri for writing
[[nodiscard]] std::unique_ptr<Writer> openWriter(std::string_view uri, std::string_view mode, OpenOptions options = OpenOptions());
//---------------------------------------------------------------------------
} // namespace blobstream::io
