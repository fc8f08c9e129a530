#include "utils/blocking_queue.hpp"
#include <catch2/catch.hpp>
#include <thread>
#include <vector>
//---------------------------------------------------------------------------
// BlobStream - Streaming I/O for Cloud Object Storage
// The BlobStream Authors, 2024
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace blobstream::utils::test {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
TEST_CASE("blocking_queue") {
    BlockingQueue<int> queue(2);
    REQUIRE(queue.push(1));
    REQUIRE(queue.push(2));
    REQUIRE(queue.size() == 2);
    REQUIRE(queue.pop() == 1);

    SECTION("close keeps the remaining elements") {
        queue.close();
        REQUIRE(!queue.push(3));
        REQUIRE(queue.pop() == 2);
        REQUIRE(!queue.pop());
    }
    SECTION("cancel drops the remaining elements") {
        queue.cancel();
        REQUIRE(queue.closed());
        REQUIRE(!queue.pop());
    }
}
//---------------------------------------------------------------------------
TEST_CASE("blocking_queue_threads") {
    BlockingQueue<int> queue(4);
    static constexpr int count = 1000;
    bool accepted = true;
    thread producer([&] {
        for (int i = 0; i < count; i++)
            accepted = queue.push(i) && accepted;
        queue.close();
    });
    int expected = 0;
    while (auto value = queue.pop())
        REQUIRE(*value == expected++);
    producer.join();
    REQUIRE(accepted);
    REQUIRE(expected == count);
}
//---------------------------------------------------------------------------
TEST_CASE("blocking_queue_cancel_wakes_producer") {
    BlockingQueue<int> queue(1);
    REQUIRE(queue.push(1));
    bool pushed = true;
    thread producer([&] { pushed = queue.push(2); });
    queue.cancel();
    producer.join();
    REQUIRE(!pushed);
}
//---------------------------------------------------------------------------
} // namespace blobstream::utils::test
