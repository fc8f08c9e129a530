#include "utils/error.hpp"
#include <catch2/catch.hpp>
//---------------------------------------------------------------------------
// BlobStream - Streaming I/O for Cloud Object Storage
// The BlobStream Authors, 2024
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace blobstream::test {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
TEST_CASE("error_cause") {
    exception_ptr cause;
    try {
        throw Error(Error::Kind::Transport, "connection refused");
    } catch (const Error&) {
        cause = current_exception();
    }
    Error error(Error::Kind::IOFailure, "giving up", cause);
    REQUIRE(error.is(Error::Kind::IOFailure));
    REQUIRE(string(error.what()) == "giving up");
    REQUIRE(error.causeKind() == Error::Kind::Transport);
    REQUIRE(string(error.causeAs<Error>()->what()) == "connection refused");
    REQUIRE(!error.causeAs<invalid_argument>());

    Error plain(Error::Kind::Protocol, "bad header");
    REQUIRE(!plain.cause());
    REQUIRE(!plain.causeKind());
    REQUIRE(Error::kindName(plain.kind()) == "Protocol");
}
//---------------------------------------------------------------------------
} // namespace blobstream::test
