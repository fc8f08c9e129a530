#include "io/open.hpp"
#include "io/multipart_writer.hpp"
#include "io/singlepart_writer.hpp"
#include "utils/log.hpp"
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
using namespace std;
//---------------------------------------------------------------------------
namespace {
//---------------------------------------------------------------------------
void checkMode(string_view mode, string_view expected)
// Only the binary modes are supported
{
    if (mode != expected)
        throw Error(Error::Kind::Unsupported, "bad mode: '" + string(mode) + "' expected '" + string(expected) + "'");
}
//---------------------------------------------------------------------------
} // namespace
//---------------------------------------------------------------------------
cloud::Uri consolidate(cloud::Uri uri, OpenOptions& options)
// Merge the uri into the options
{
    if (options.store.credentials && (uri.accessId || uri.accessSecret)) {
        utils::logger().warn("ignoring credentials parsed from URL because they conflict with the credentials of the options");
    } else if (uri.accessId && uri.accessSecret) {
        options.store.credentials = cloud::AWS::Secret{*uri.accessId, *uri.accessSecret, ""};
    }
    uri.accessId.reset();
    uri.accessSecret.reset();

    if (uri.host != cloud::Provider::defaultHost) {
        if (options.store.endpoint)
            utils::logger().warn("ignoring endpoint parsed from URL because it conflicts with the endpoint of the options");
        else
            options.store.endpoint = "https://" + uri.host + ":" + to_string(uri.port);
    }
    return uri;
}
//---------------------------------------------------------------------------
unique_ptr<Reader> openReader(const string& bucket, const string& key, string_view mode, const OpenOptions& options, shared_ptr<cloud::Store> store)
// Open for reading
{
    checkMode(mode, readBinary);
    return make_unique<Reader>(move(store), bucket, key, options.reader);
}
//---------------------------------------------------------------------------
unique_ptr<Writer> openWriter(const string& bucket, const string& key, string_view mode, const OpenOptions& options, shared_ptr<cloud::Store> store)
// Open for writing
{
    checkMode(mode, writeBinary);
    if (options.reader.versionId)
        throw Error(Error::Kind::Configuration, "version_id must be None when writing");
    if (options.multipartUpload)
        return make_unique<MultipartWriter>(move(store), bucket, key, options.multipart);
    return make_unique<SinglepartWriter>(move(store), bucket, key);
}
//---------------------------------------------------------------------------
unique_ptr<Reader> openReader(string_view uri, string_view mode, OpenOptions options)
// Open an uri for reading
{
    checkMode(mode, readBinary);
    auto parsed = consolidate(cloud::Provider::parseUri(uri), options);
    return openReader(parsed.bucketId, parsed.keyId, mode, options, cloud::Provider::makeStore(options.store));
}
//---------------------------------------------------------------------------
unique_ptr<Writer> openWriter(string_view uri, string_view mode, OpenOptions options)
// Open an uri for writing
{
    checkMode(mode, writeBinary);
    if (options.reader.versionId)
        throw Error(Error::Kind::Configuration, "version_id must be None when writing");
    auto parsed = consolidate(cloud::Provider::parseUri(uri), options);
    return openWriter(parsed.bucketId, parsed.keyId, mode, options, cloud::Provider::makeStore(options.store));
}
//---------------------------------------------------------------------------
} // namespace blobstream::io
