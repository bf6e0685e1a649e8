#pragma once
#include "stream/handle.hpp"
#include "utils/byte_buffer.hpp"
#include <atomic>
#include <string_view>
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
/// An in-memory stream over a private copy of the data
class MemoryHandle : public Handle {
    private:
    /// The data
    utils::ByteBuffer _data;
    /// The read position
    uint64_t _position;
    /// Closed flag
    std::atomic<bool> _closed;

    public:
    /// Constructor from raw data
    MemoryHandle(const uint8_t* data, uint64_t size) : _data(data, size), _position(0), _closed(false) {}
    /// Constructor from text
    explicit MemoryHandle(std::string_view text) : _data(text), _position(0), _closed(false) {}

    /// Read the next bytes
    uint64_t read(uint8_t* data, uint64_t length) override;
    /// Close the stream
    void close() override { _closed.store(true, std::memory_order_release); }
    /// Is the stream closed
    [[nodiscard]] bool closed() const override { return _closed.load(std::memory_order_acquire); }
    /// Rewind to the start
    bool rewind() override;
    /// The size
    [[nodiscard]] std::optional<uint64_t> size() const override { return _data.size(); }
    /// The read position
    [[nodiscard]] uint64_t position() const { return _position; }
};
//---------------------------------------------------------------------------
} // namespace uploadstream::stream
