#include "io/retry.hpp"
#include <catch2/catch.hpp>
#include <chrono>
#include <string>
#include <vector>
//---------------------------------------------------------------------------
// BlobStream - Streaming I/O for Cloud Object Storage
// The BlobStream Authors, 2024
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace blobstream::io::test {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
TEST_CASE("retry") {
    vector<chrono::milliseconds> sleeps;
    RetryPolicy policy;
    policy.attempts = 4;
    policy.backoff = chrono::milliseconds(250);
    policy.sleep = [&](chrono::milliseconds duration) { sleeps.push_back(duration); };
    unsigned calls = 0;

    SECTION("success after transient failures") {
        auto result = Retry::run([&] {
            if (++calls < 3)
                throw Error(Error::Kind::Transport, "connection refused");
            return string("ok");
        },
                                 policy);
        REQUIRE(result == "ok");
        REQUIRE(calls == 3);
        REQUIRE(sleeps == vector<chrono::milliseconds>(2, chrono::milliseconds(250)));
    }
    SECTION("exhausted") {
        try {
            Retry::run([&] {
                ++calls;
                throw Error(Error::Kind::Transport, "connection refused");
            },
                       policy);
            FAIL("the failures were hidden");
        } catch (const Error& e) {
            REQUIRE(e.is(Error::Kind::IOFailure));
            REQUIRE(string(e.what()) == "Unable to connect to the endpoint after 4 attempts");
            REQUIRE(e.causeKind() == Error::Kind::Transport);
        }
        REQUIRE(calls == 4);
        REQUIRE(sleeps.size() == 3);
    }
    SECTION("not retryable") {
        try {
            Retry::run([&] {
                ++calls;
                throw Error(Error::Kind::Client, "forbidden");
            },
                       policy);
            FAIL("the failure was hidden");
        } catch (const Error& e) {
            REQUIRE(e.is(Error::Kind::Client));
        }
        REQUIRE(calls == 1);
        REQUIRE(sleeps.empty());
    }
    SECTION("custom kinds") {
        policy.retryable = {Error::Kind::Client};
        Retry::run([&] {
            if (++calls < 2)
                throw Error(Error::Kind::Client, "throttled");
        },
                   policy);
        REQUIRE(calls == 2);
    }
    SECTION("at least one attempt") {
        policy.attempts = 0;
        REQUIRE(Retry::run([&] { return ++calls; }, policy) == 1);
    }
}
//---------------------------------------------------------------------------
} // namespace blobstream::io::test
