#pragma once
#include <cstdint>
#include <optional>
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
/// This is the interface for pull-based byte producers of unknown length,
/// e.g., an open file or a pipe.
//---------------------------------------------------------------------------
class Handle {
    public:
    /// The destructor
    virtual ~Handle() noexcept = default;
    /// Read up to length bytes into data; 0 marks the end of the handle, a closed handle returns 0
    virtual uint64_t read(uint8_t* data, uint64_t length) = 0;
    /// Detach the underlying resource, may be called from another thread than read
    virtual void close() = 0;
    /// Is the handle closed
    [[nodiscard]] virtual bool closed() const = 0;
    /// Seek back to the first byte; false if the handle cannot seek
    virtual bool rewind() { return false; }
    /// The total size if the handle knows it
    [[nodiscard]] virtual std::optional<uint64_t> size() const { return std::nullopt; }
};
//---------------------------------------------------------------------------
} // namespace uploadstream::stream
