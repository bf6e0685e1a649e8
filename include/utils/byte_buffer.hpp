#pragma once
#include <algorithm>
#include <cstdint>
#include <cstring>
#include <memory>
#include <string_view>
//---------------------------------------------------------------------------
// UploadStream - Throttled Chunked Upload Source Library
// UploadStream Authors, 2024
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace uploadstream::utils {
//---------------------------------------------------------------------------
/// Read-only byte storage that either owns a private copy or maps memory owned by the caller
class ByteBuffer {
    private:
    /// The data owned
    std::unique_ptr<uint8_t[]> _dataOwned;
    /// The data, owned or mapped
    const uint8_t* _data;
    /// Current size
    uint64_t _size;

    /// Constructor unowned, map to other pointer
    constexpr ByteBuffer(const uint8_t* ptr, uint64_t size, bool /*mapped*/) : _data(ptr), _size(size) {}

    public:
    /// Constructor
    constexpr ByteBuffer() : _data(nullptr), _size(0) {}

    /// Constructor that copies the data
    ByteBuffer(const uint8_t* data, uint64_t size) : _data(nullptr), _size(0) {
        if (!size)
            return;
        _dataOwned = std::make_unique<uint8_t[]>(size);
        std::memcpy(_dataOwned.get(), data, size);
        _data = _dataOwned.get();
        _size = size;
    }

    /// Constructor that copies the bytes of a string
    explicit ByteBuffer(std::string_view text) : ByteBuffer(reinterpret_cast<const uint8_t*>(text.data()), text.size()) {}

    /// Map memory that has to outlive the buffer
    [[nodiscard]] static ByteBuffer map(const uint8_t* data, uint64_t size) {
        return ByteBuffer(data, size, true);
    }

    /// Copy constructor
    ByteBuffer(const ByteBuffer&) = delete;
    /// Move constructor
    ByteBuffer(ByteBuffer&& rhs) noexcept : _dataOwned(std::move(rhs._dataOwned)), _data(rhs._data), _size(rhs._size) {
        rhs._data = nullptr;
        rhs._size = 0;
    }
    /// Copy assignment
    ByteBuffer& operator=(const ByteBuffer&) = delete;
    /// Move assignment
    ByteBuffer& operator=(ByteBuffer&& rhs) noexcept {
        if (this != &rhs) {
            _dataOwned = std::move(rhs._dataOwned);
            _data = rhs._data;
            _size = rhs._size;
            rhs._data = nullptr;
            rhs._size = 0;
        }
        return *this;
    }

    /// Get the data
    [[nodiscard]] constexpr const uint8_t* cdata() const {
        return _data;
    }

    /// Get the size
    [[nodiscard]] constexpr uint64_t size() const {
        return _size;
    }

    /// Is the data owned
    [[nodiscard]] bool owned() const {
        return _dataOwned || !_size;
    }

    /// Copy up to length bytes starting at offset, returns the copied bytes
    uint64_t copy(uint64_t offset, uint8_t* dest, uint64_t length) const {
        if (offset >= _size)
            return 0;
        auto count = std::min(length, _size - offset);
        std::memcpy(dest, _data + offset, count);
        return count;
    }
};
//---------------------------------------------------------------------------
} // namespace uploadstream::utils
