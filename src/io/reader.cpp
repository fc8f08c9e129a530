#include "io/reader.hpp"
#include "utils/log.hpp"
#include <algorithm>
#include <cstring>
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
using namespace std;
//---------------------------------------------------------------------------
Reader::Reader(shared_ptr<cloud::Store> store, const string& bucket, const string& key, ReaderConfig config)
    : _raw(move(store), cloud::ObjectHandle{bucket, key, config.versionId}), _buffer(config.bufferSize), _config(move(config)), _position(0), _eof(false), _closed(false)
// The constructor
{
    if (!_config.deferSeek)
        seek(0);
}
//---------------------------------------------------------------------------
void Reader::checkOpen() const
// Fail on closed readers
{
    if (_closed)
        throw Error(Error::Kind::IOFailure, "I/O operation on closed file");
}
//---------------------------------------------------------------------------
string Reader::read(int64_t size)
// Read up to size bytes
{
    checkOpen();
    if (size == 0)
        return {};
    if (size < 0) {
        // Read from the raw reader first, it knows the content length afterwards
        auto out = readFromBuffer();
        out += _raw.read();
        _position = _raw.contentLength().value_or(_position + out.size());
        _eof = true;
        return out;
    }
    auto wanted = static_cast<uint64_t>(size);
    if (_buffer.length() >= wanted)
        return readFromBuffer(size);
    if (_eof)
        return readFromBuffer();
    fillBuffer(size);
    return readFromBuffer(size);
}
//---------------------------------------------------------------------------
uint64_t Reader::readinto(span<uint8_t> target)
// Read into a caller buffer
{
    auto data = read(static_cast<int64_t>(target.size()));
    if (!data.empty())
        memcpy(target.data(), data.data(), data.size());
    return data.size();
}
//---------------------------------------------------------------------------
string Reader::readline(int64_t limit)
// Read a line
{
    checkOpen();
    if (limit != -1)
        throw Error(Error::Kind::Unsupported, "limits other than -1 not implemented yet");

    string_view terminator = _config.lineTerminator;
    uint64_t scanned = 0;
    while (!_eof && _buffer.view().find(terminator, scanned) == string_view::npos) {
        // A terminator may straddle the end of the buffered bytes
        auto length = _buffer.length();
        scanned = length >= terminator.size() ? length - terminator.size() + 1 : 0;
        fillBuffer(static_cast<int64_t>(length + 1));
    }
    auto line = _buffer.readline(terminator);
    _position += line.size();
    return line;
}
//---------------------------------------------------------------------------
uint64_t Reader::seek(int64_t offset, Whence whence)
// Seek to a position
{
    checkOpen();
    utils::logger().debug("seeking to offset: {} whence: {}", offset, static_cast<int>(whence));
    if (whence == Whence::Current) {
        whence = Whence::Start;
        offset += static_cast<int64_t>(_position);
    }
    _position = _raw.seek(offset, whence);
    _buffer.empty();
    _eof = _position == _raw.contentLength();
    utils::logger().debug("current position: {}", _position);
    return _position;
}
//---------------------------------------------------------------------------
void Reader::close()
// Release the resources
{
    utils::logger().debug("close: called");
    _buffer.empty();
    _raw.close();
    _closed = true;
}
//---------------------------------------------------------------------------
void Reader::truncate(optional<uint64_t> /*size*/)
// Not supported
{
    throw Error(Error::Kind::Unsupported, "truncation not supported");
}
//---------------------------------------------------------------------------
void Reader::detach()
// Not supported
{
    throw Error(Error::Kind::Unsupported, "detach() not supported");
}
//---------------------------------------------------------------------------
string Reader::readFromBuffer(int64_t size)
// Consume from the buffer
{
    auto count = size >= 0 ? static_cast<uint64_t>(size) : _buffer.length();
    auto part = _buffer.read(count);
    _position += part.size();
    return part;
}
//---------------------------------------------------------------------------
void Reader::fillBuffer(int64_t size)
// Fill the buffer from the range reader
{
    auto target = max<uint64_t>(size > 0 ? static_cast<uint64_t>(size) : 0, _buffer.chunkSize());
    while (_buffer.length() < target && !_eof) {
        if (!_buffer.fill(_raw))
            _eof = true;
    }
}
//---------------------------------------------------------------------------
} // namespace blobstream::io
