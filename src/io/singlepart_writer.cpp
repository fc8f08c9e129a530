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
Error bucketError(const string& bucket, const Error& error)
// Client errors mean the bucket is missing or forbidden
{
    if (error.is(Error::Kind::Client) || error.is(Error::Kind::StoreRejection))
        return Error(Error::Kind::Configuration, "the bucket '" + bucket + "' does not exist, or is forbidden for access (" + error.what() + ")", current_exception());
    return Error(Error::Kind::IOFailure, "the bucket '" + bucket + "' is not reachable (" + error.what() + ")", current_exception());
}
//---------------------------------------------------------------------------
} // namespace
//---------------------------------------------------------------------------
SinglepartWriter::SinglepartWriter(shared_ptr<cloud::Store> store, const string& bucket, const string& key)
    : _store(move(store)), _handle{bucket, key, nullopt}, _buffer(), _totalBytes(0), _closed(false)
// The constructor
{
    if (!_store)
        throw Error(Error::Kind::Configuration, "SinglepartWriter requires a store");
    try {
        _store->headContainer(bucket);
    } catch (const Error& error) {
        throw bucketError(bucket, error);
    }
}
//---------------------------------------------------------------------------
uint64_t SinglepartWriter::write(span<const uint8_t> data)
// Buffer bytes
{
    if (_closed)
        throw Error(Error::Kind::IOFailure, "I/O operation on closed file");
    _buffer.append(data.data(), data.size());
    _totalBytes += data.size();
    return data.size();
}
//---------------------------------------------------------------------------
void SinglepartWriter::close()
// Put the object
{
    if (_closed)
        return;
    try {
        _store->putObject(_handle, _buffer.span());
    } catch (const Error& error) {
        throw bucketError(_handle.bucket, error);
    }
    utils::logger().debug("{}: direct upload finished", _handle.name());
    _buffer = utils::Bytes();
    _closed = true;
}
//---------------------------------------------------------------------------
void SinglepartWriter::terminate()
// Nothing to cancel for a single put
{
    _buffer = utils::Bytes();
    _closed = true;
}
//---------------------------------------------------------------------------
} // namespace blobstream::io
