#pragma once
#include "stream/handle.hpp"
#include "utils/byte_buffer.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>
#include <variant>
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
/// The origin of an upload body, classified once at construction.
/// Either empty, a fully materialized buffer, or a streaming handle.
class Source {
    public:
    /// The source kind
    enum class Kind : uint8_t {
        Empty = 0,
        Buffer = 1,
        Stream = 2
    };

    private:
    /// The data
    std::variant<std::monostate, utils::ByteBuffer, std::unique_ptr<Handle>> _data;

    public:
    /// The default constructor, an empty source
    Source() = default;
    /// Constructor from a buffer
    explicit Source(utils::ByteBuffer buffer) : _data(std::move(buffer)) {}
    /// Constructor from a streaming handle, a null handle is an empty source
    explicit Source(std::unique_ptr<Handle> handle);

    /// An empty source
    [[nodiscard]] static Source empty() { return Source(); }
    /// A buffer source with a private copy of the data
    [[nodiscard]] static Source copy(const uint8_t* data, uint64_t size) { return Source(utils::ByteBuffer(data, size)); }
    /// A buffer source mapping caller memory that has to outlive the source
    [[nodiscard]] static Source view(const uint8_t* data, uint64_t size) { return Source(utils::ByteBuffer::map(data, size)); }
    /// A buffer source with the bytes of the text
    [[nodiscard]] static Source text(std::string_view text) { return Source(utils::ByteBuffer(text)); }
    /// A streaming source
    [[nodiscard]] static Source stream(std::unique_ptr<Handle> handle) { return Source(std::move(handle)); }

    /// Get the kind
    [[nodiscard]] Kind kind() const { return static_cast<Kind>(_data.index()); }
    /// Get the buffer, nullptr if no buffer source
    [[nodiscard]] const utils::ByteBuffer* buffer() const { return std::get_if<utils::ByteBuffer>(&_data); }
    /// Get the handle, nullptr if no stream source
    [[nodiscard]] Handle* handle() const;
    /// The total length if known
    [[nodiscard]] std::optional<uint64_t> size() const;
};
//---------------------------------------------------------------------------
} // namespace uploadstream::stream
