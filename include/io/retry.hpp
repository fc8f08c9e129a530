#pragma once
#include "utils/error.hpp"
#include "utils/log.hpp"
#include <algorithm>
#include <chrono>
#include <exception>
#include <functional>
#include <string>
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
namespace blobstream::io {
//---------------------------------------------------------------------------
/// How often and on which errors an operation is repeated
struct RetryPolicy {
    /// The default number of attempts
    static constexpr unsigned defaultAttempts = 6;
    /// The default pause between attempts
    static constexpr std::chrono::milliseconds defaultBackoff = std::chrono::seconds(10);

    /// The number of attempts, at least one
    unsigned attempts = defaultAttempts;
    /// The pause between attempts
    std::chrono::milliseconds backoff = defaultBackoff;
    /// The error kinds that are repeated
    std::vector<Error::Kind> retryable = {Error::Kind::Transport};
    /// The sleep function, empty uses std::this_thread::sleep_for
    std::function<void(std::chrono::milliseconds)> sleep;

    /// Is the kind repeated
    [[nodiscard]] bool retries(Error::Kind kind) const {
        return std::find(retryable.begin(), retryable.end(), kind) != retryable.end();
    }
};
//---------------------------------------------------------------------------
/// Runs an operation until it succeeds, fails with a non-retryable error, or the attempts are exhausted
class Retry {
    public:
    /// Run the operation
    template <typename F>
    static auto run(F&& operation, const RetryPolicy& policy = RetryPolicy()) -> decltype(operation()) {
        auto attempts = std::max(policy.attempts, 1u);
        std::exception_ptr last;
        for (auto attempt = 1u; attempt <= attempts; attempt++) {
            try {
                return operation();
            } catch (const Error& error) {
                if (!policy.retries(error.kind()))
                    throw;
                last = std::current_exception();
                utils::logger().critical("Unable to connect to the endpoint ({}). Check your network connection. Sleeping and retrying {} more times before giving up.", error.what(), attempts - attempt);
            }
            if (attempt < attempts) {
                if (policy.sleep)
                    policy.sleep(policy.backoff);
                else
                    std::this_thread::sleep_for(policy.backoff);
            }
        }
        utils::logger().critical("Unable to connect to the endpoint. Giving up.");
        throw Error(Error::Kind::IOFailure, "Unable to connect to the endpoint after " + std::to_string(attempts) + " attempts", last);
    }
};
//---------------------------------------------------------------------------
} // namespace blobstream::io
