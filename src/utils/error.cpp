#include "utils/error.hpp"
//---------------------------------------------------------------------------
// BlobStream - Streaming I/O for Cloud Object Storage
// The BlobStream Authors, 2024
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace blobstream {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
optional<Error::Kind> Error::causeKind() const
// Get the kind of the cause
{
    auto cause = causeAs<Error>();
    if (!cause)
        return nullopt;
    return cause->kind();
}
//---------------------------------------------------------------------------
} // namespace blobstream
