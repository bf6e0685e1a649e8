#pragma once
#include <cstdint>
#include <string>
#include <string_view>
//---------------------------------------------------------------------------
// UploadStream - Throttled Chunked Upload Source Library
// Dominik Durner, 2022
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace uploadstream::utils {
//---------------------------------------------------------------------------
/// Encode everything from binary representation to hex
std::string hexEncode(const uint8_t* input, uint64_t length, bool upper = false);
/// Encode a raw digest string to hex
inline std::string hexEncode(std::string_view raw, bool upper = false) {
    return hexEncode(reinterpret_cast<const uint8_t*>(raw.data()), raw.size(), upper);
}
/// Encode everything from binary representation to base64
std::string base64Encode(const uint8_t* input, uint64_t length);
/// Encode a raw digest string to base64
inline std::string base64Encode(std::string_view raw) {
    return base64Encode(reinterpret_cast<const uint8_t*>(raw.data()), raw.size());
}
/// Human readable byte size, e.g. 1.50 MiB
std::string formatBytes(uint64_t bytes);
//---------------------------------------------------------------------------
} // namespace uploadstream::utils
