#include "stream/memory_handle.hpp"
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
uint64_t MemoryHandle::read(uint8_t* data, uint64_t length)
// Copies the next bytes
{
    if (closed())
        return 0;
    auto count = _data.copy(_position, data, length);
    _position += count;
    return count;
}
//---------------------------------------------------------------------------
bool MemoryHandle::rewind()
// Rewinds to the start
{
    if (closed())
        return false;
    _position = 0;
    return true;
}
//---------------------------------------------------------------------------
} // namespace uploadstream::stream
