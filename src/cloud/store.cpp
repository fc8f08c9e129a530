#include "cloud/store.hpp"
#include <algorithm>
#include <cstring>
//---------------------------------------------------------------------------
// BlobStream - Streaming I/O for Cloud Object Storage
// The BlobStream Authors, 2024
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace blobstream::cloud {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
string ObjectHandle::name() const
// The s3 style name
{
    auto result = "s3://" + bucket + "/" + key;
    if (versionId)
        result += "?versionId=" + *versionId;
    return result;
}
//---------------------------------------------------------------------------
string ObjectBody::readAll()
// Read until the end of the body
{
    static constexpr uint64_t chunkSize = 64u << 10;
    string result;
    auto buffer = make_unique<uint8_t[]>(chunkSize);
    while (auto count = read(buffer.get(), chunkSize))
        result.append(reinterpret_cast<const char*>(buffer.get()), count);
    return result;
}
//---------------------------------------------------------------------------
uint64_t BufferBody::read(uint8_t* data, uint64_t length)
// Read from memory
{
    auto count = min<uint64_t>(length, _content.size() - _offset);
    memcpy(data, _content.data() + _offset, count);
    _offset += count;
    return count;
}
//---------------------------------------------------------------------------
} // namespace blobstream::cloud
