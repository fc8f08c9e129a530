#include "utils/log.hpp"
#include <cstdlib>
#include <memory>
#include <spdlog/sinks/stdout_color_sinks.h>
//---------------------------------------------------------------------------
// BlobStream - Streaming I/O for Cloud Object Storage
// The BlobStream Authors, 2024
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace blobstream::utils {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
spdlog::logger& logger()
// Get the library logger
{
    static shared_ptr<spdlog::logger> instance = []() {
        auto log = spdlog::get(loggerName);
        if (log)
            return log;
        log = spdlog::stderr_color_mt(loggerName);
        if (auto level = getenv(logLevelVariable))
            log->set_level(spdlog::level::from_str(level));
        else
            log->set_level(spdlog::level::warn);
        return log;
    }();
    return *instance;
}
//---------------------------------------------------------------------------
} // namespace blobstream::utils
