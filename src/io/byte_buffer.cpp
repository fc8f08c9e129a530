#include "io/byte_buffer.hpp"
#include <algorithm>
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
ByteBuffer::ByteBuffer(uint64_t chunkSize) : _data(), _offset(0), _chunkSize(chunkSize ? chunkSize : 1)
// The constructor
{
}
//---------------------------------------------------------------------------
void ByteBuffer::compact()
// Move the unread bytes to the front
{
    if (!_offset)
        return;
    _data.erasePrefix(_offset);
    _offset = 0;
}
//---------------------------------------------------------------------------
void ByteBuffer::append(string_view bytes)
// Append bytes
{
    if (bytes.empty())
        return;
    if (_offset >= _data.size() / 2)
        compact();
    _data.append(reinterpret_cast<const uint8_t*>(bytes.data()), bytes.size());
}
//---------------------------------------------------------------------------
string ByteBuffer::read(uint64_t size)
// Read and consume
{
    auto result = peek(size);
    _offset += result.size();
    if (_offset == _data.size())
        empty();
    return result;
}
//---------------------------------------------------------------------------
string ByteBuffer::peek(uint64_t size) const
// Read without consuming
{
    return string(view().substr(0, min(size, length())));
}
//---------------------------------------------------------------------------
string ByteBuffer::readline(string_view terminator)
// Read a line
{
    auto unread = view();
    auto pos = terminator.empty() ? string_view::npos : unread.find(terminator);
    if (pos == string_view::npos)
        return read(unread.size());
    return read(pos + terminator.size());
}
//---------------------------------------------------------------------------
void ByteBuffer::empty()
// Discard everything
{
    _data.clear();
    _offset = 0;
}
//---------------------------------------------------------------------------
} // namespace blobstream::io
