#pragma once
#include <spdlog/spdlog.h>
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
/// The name of the library logger in the spdlog registry
inline constexpr const char* loggerName = "blobstream";
/// The environment variable that overrides the log level
inline constexpr const char* logLevelVariable = "BLOBSTREAM_LOG_LEVEL";
//---------------------------------------------------------------------------
/// Get the library logger, created on first use unless the application registered one under loggerName
spdlog::logger& logger();
//---------------------------------------------------------------------------
} // namespace blobstream::utils
