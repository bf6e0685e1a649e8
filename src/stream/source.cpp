#include "stream/source.hpp"
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
using namespace std;
//---------------------------------------------------------------------------
Source::Source(unique_ptr<Handle> handle)
// Constructor from a streaming handle
{
    if (handle)
        _data = move(handle);
}
//---------------------------------------------------------------------------
Handle* Source::handle() const
// Get the handle
{
    if (auto handle = get_if<unique_ptr<Handle>>(&_data))
        return handle->get();
    return nullptr;
}
//---------------------------------------------------------------------------
optional<uint64_t> Source::size() const
// The total length if known
{
    switch (kind()) {
        case Kind::Empty: return 0;
        case Kind::Buffer: return buffer()->size();
        case Kind::Stream: return handle()->size();
    }
    return nullopt;
}
//---------------------------------------------------------------------------
} // namespace uploadstream::stream
