#include "io/multipart_writer.hpp"
#include "io/retry.hpp"
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
MultipartWriter::MultipartWriter(shared_ptr<cloud::Store> store, const string& bucket, const string& key, MultipartConfig config)
    : _store(move(store)), _handle{bucket, key, nullopt}, _config(move(config)), _staging(), _session()
// The constructor
{
    if (!_store)
        throw Error(Error::Kind::Configuration, "MultipartWriter requires a store");
    if (_config.minPartSize < MultipartConfig::minMinPartSize)
        utils::logger().warn("S3 requires minimum part size >= 5MB; multipart upload may fail");

    try {
        _session.uploadId = Retry::run([&] { return _store->initiateMultipartUpload(_handle); }, _config.retry);
    } catch (const Error& error) {
        if (error.is(Error::Kind::IOFailure))
            throw;
        throw Error(Error::Kind::Configuration, "the bucket '" + bucket + "' does not exist, or is forbidden for access (" + error.what() + ")", current_exception());
    }
    _session.state = State::Uploading;
    _staging.reserve(_config.minPartSize);
    utils::logger().debug("{}: created multipart upload {}", _handle.name(), _session.uploadId);
}
//---------------------------------------------------------------------------
MultipartWriter::~MultipartWriter() noexcept
// The destructor
{
    if (finalized())
        return;
    try {
        utils::logger().warn("{}: upload {} was neither closed nor terminated, aborting", _handle.name(), _session.uploadId);
        terminate();
    } catch (const exception& e) {
        utils::logger().error("{}: abort of upload {} failed: {}", _handle.name(), _session.uploadId, e.what());
    }
}
//---------------------------------------------------------------------------
uint64_t MultipartWriter::write(span<const uint8_t> data)
// Stage bytes
{
    if (finalized())
        throw Error(Error::Kind::IOFailure, "I/O operation on closed file");
    _staging.append(data.data(), data.size());
    _session.totalBytes += data.size();
    if (_staging.size() >= _config.minPartSize)
        uploadNextPart();
    return data.size();
}
//---------------------------------------------------------------------------
void MultipartWriter::uploadNextPart()
// Upload the staged bytes
{
    auto partNumber = _session.totalParts + 1;
    utils::logger().info("{}: uploading part_num: {}, {} bytes (total {:.3f}GB)", _handle.name(), partNumber, _staging.size(), static_cast<double>(_session.totalBytes) / (1024.0 * 1024.0 * 1024.0));
    _session.state = State::Uploading;

    string etag;
    try {
        etag = Retry::run([&] { return _store->uploadPart(_handle, _session.uploadId, partNumber, _staging.span()); }, _config.retry);
    } catch (const Error& error) {
        if (error.is(Error::Kind::IOFailure))
            throw;
        throw Error(Error::Kind::IOFailure, _handle.name() + ": upload of part " + to_string(partNumber) + " failed: " + error.what(), current_exception());
    }
    _session.parts.push_back({partNumber, move(etag)});
    utils::logger().debug("{}: upload of part_num #{} finished", _handle.name(), partNumber);
    _session.totalParts++;
    _staging.clear();
}
//---------------------------------------------------------------------------
void MultipartWriter::close()
// Complete the upload
{
    if (finalized())
        return;
    if (!_staging.empty())
        uploadNextPart();

    if (_session.totalBytes) {
        try {
            Retry::run([&] { _store->completeMultipartUpload(_handle, _session.uploadId, _session.parts); }, _config.retry);
        } catch (const Error& error) {
            if (error.is(Error::Kind::IOFailure))
                throw;
            throw Error(Error::Kind::IOFailure, _handle.name() + ": completion of upload " + _session.uploadId + " failed: " + error.what(), current_exception());
        }
        utils::logger().debug("{}: completed multipart upload", _handle.name());
    } else {
        // An empty completion is rejected by the store, write an empty object instead
        try {
            _store->abortMultipartUpload(_handle, _session.uploadId);
            _store->putObject(_handle, {});
        } catch (const Error& error) {
            throw Error(Error::Kind::IOFailure, _handle.name() + ": writing the empty object failed: " + error.what(), current_exception());
        }
        utils::logger().info("{}: wrote 0 bytes to imitate multipart upload", _handle.name());
    }
    _session.state = State::Completed;
}
//---------------------------------------------------------------------------
void MultipartWriter::terminate()
// Abort the upload
{
    if (finalized())
        return;
    _session.state = State::Aborted;
    _staging.clear();
    try {
        _store->abortMultipartUpload(_handle, _session.uploadId);
    } catch (const Error& error) {
        throw Error(Error::Kind::IOFailure, _handle.name() + ": abort of upload " + _session.uploadId + " failed: " + error.what(), current_exception());
    }
    utils::logger().debug("{}: aborted multipart upload {}", _handle.name(), _session.uploadId);
}
//---------------------------------------------------------------------------
} // namespace blobstream::io
