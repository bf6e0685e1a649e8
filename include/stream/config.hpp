#pragma once
#include "utils/digest.hpp"
#include <cmath>
#include <cstdint>
#include <stdexcept>
//---------------------------------------------------------------------------
// UploadStream - Throttled Chunked Upload Source Library
// UploadStream Authors, 2024
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace uploadstream::stream {
//---------------------------------------------------------------------------
/// Config for chunking, bandwidth and payload digest of an upload stream
struct Config {
    /// Default chunk size in bytes
    static constexpr uint64_t defaultChunkSize = 4096;

    /// Maximum bytes produced per read
    uint64_t chunkSize = defaultChunkSize;
    /// The bandwidth ceiling in bytes/s, 0 is unlimited
    double maxSpeed = 0;
    /// The payload digest
    utils::Digest::Algorithm digest = utils::Digest::Algorithm::None;

    /// Check the settings
    void validate() const {
        if (!chunkSize)
            throw std::runtime_error("Invalid Config: chunk size must be positive!");
        if (!std::isfinite(maxSpeed) || maxSpeed < 0)
            throw std::runtime_error("Invalid Config: max speed must be a non-negative number!");
    }
};
//---------------------------------------------------------------------------
} // namespace uploadstream::stream
