#include "io/range_reader.hpp"
#include "network/http_helper.hpp"
#include "utils/log.hpp"
#include <algorithm>
#include <exception>
#include <limits>
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
RangeReader::RangeReader(shared_ptr<cloud::Store> store, cloud::ObjectHandle handle) : _store(move(store)), _handle(move(handle)), _position(0), _contentLength(), _body()
// The constructor
{
    if (!_store)
        throw Error(Error::Kind::Configuration, "RangeReader requires a store");
}
//---------------------------------------------------------------------------
Error RangeReader::accessError(const string& what) const
// The error for a failed store call, keeps the current exception as cause
{
    string message = "unable to access bucket: '" + _handle.bucket + "' key: '" + _handle.key + "' version: " + _handle.versionId.value_or("None") + " error: " + what;
    return Error(Error::Kind::IOFailure, message, current_exception());
}
//---------------------------------------------------------------------------
uint64_t RangeReader::seek(int64_t offset, Whence whence)
// Seek to a position
{
    optional<uint64_t> start;
    optional<uint64_t> suffix;
    switch (whence) {
        case Whence::Start: start = static_cast<uint64_t>(max<int64_t>(0, offset)); break;
        case Whence::Current: start = static_cast<uint64_t>(max<int64_t>(0, static_cast<int64_t>(_position) + offset)); break;
        case Whence::End: suffix = static_cast<uint64_t>(max<int64_t>(0, -offset)); break;
        default: throw Error(Error::Kind::Configuration, "invalid whence, expected one of Start, Current, End");
    }
    close();

    // Past the end, no request needed
    auto reachedEof = _contentLength && ((start && *start >= *_contentLength) || (suffix && !*suffix));
    if (reachedEof) {
        _body = make_unique<cloud::BufferBody>(string());
        _position = *_contentLength;
    } else {
        openBody(start, suffix);
    }
    return _position;
}
//---------------------------------------------------------------------------
void RangeReader::openBody(optional<uint64_t> start, optional<uint64_t> suffix)
// Open a range request
{
    if (!start && !suffix)
        start = _position;
    auto range = start ? cloud::ByteRange::from(*start) : cloud::ByteRange::suffix(*suffix);
    utils::logger().debug("content_length: {} range: {}", _contentLength ? to_string(*_contentLength) : "None", range.toString());

    cloud::GetResult result;
    try {
        result = _store->getObject(_handle, range);
    } catch (const cloud::StoreError& error) {
        if (!error.is(Error::Kind::RangeNotSatisfiable))
            throw accessError(error.what());
        resolveSize(error);
        return;
    } catch (const Error& error) {
        throw accessError(error.what());
    }

    if (!result.contentRange)
        throw Error(Error::Kind::Protocol, "Malformed Content-Range: missing for " + _handle.name());
    auto contentRange = network::HttpHelper::parseContentRange(*result.contentRange);
    _contentLength = contentRange.total;
    _position = contentRange.start;
    _body = move(result.body);
}
//---------------------------------------------------------------------------
void RangeReader::resolveSize(const cloud::StoreError& error)
// The range starts beyond the object, move to its end
{
    uint64_t size;
    if (error.actualObjectSize()) {
        size = *error.actualObjectSize();
    } else {
        try {
            size = _store->headObject(_handle).contentLength;
        } catch (const Error& headError) {
            throw accessError(headError.what());
        }
    }
    utils::logger().debug("range not satisfiable, object size is {}", size);
    _contentLength = size;
    _position = size;
    _body = make_unique<cloud::BufferBody>(string());
}
//---------------------------------------------------------------------------
string RangeReader::readFromBody(int64_t size)
// Read from the open body
{
    static constexpr uint64_t chunkSize = 64u << 10;
    string result;
    auto remaining = size < 0 ? numeric_limits<uint64_t>::max() : static_cast<uint64_t>(size);
    while (remaining) {
        auto offset = result.size();
        auto want = min(remaining, chunkSize);
        result.resize(offset + want);
        auto got = _body->read(reinterpret_cast<uint8_t*>(result.data()) + offset, want);
        result.resize(offset + got);
        if (!got)
            break;
        remaining -= got;
    }
    return result;
}
//---------------------------------------------------------------------------
string RangeReader::read(int64_t size)
// Read from the stream
{
    if (!_body)
        openBody();
    if (_contentLength && _position >= *_contentLength)
        return {};

    string binary;
    try {
        binary = readFromBody(size);
    } catch (const Error& error) {
        if (!error.is(Error::Kind::IncompleteRead))
            throw accessError(error.what());
        // The connection was dropped, reopen at the current position and try once more
        utils::logger().debug("connection dropped at position {}, reopening", _position);
        close();
        openBody();
        try {
            binary = readFromBody(size);
        } catch (const Error& retryError) {
            throw accessError(retryError.what());
        }
    }
    _position += binary.size();
    return binary;
}
//---------------------------------------------------------------------------
void RangeReader::close()
// Release the body
{
    _body.reset();
}
//---------------------------------------------------------------------------
} // namespace blobstream::io
