#pragma once
#ifndef UPLOADSTREAM_HAS_IO_URING
#error "You must not include io_uring_file_handle.hpp when building without uring support"
#endif
#include "stream/handle.hpp"
#include <atomic>
#include <string>
#include <liburing.h>
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
/// Reads a file with the io_uring interface; every read is an explicit
/// positioned submission, so rewinding only resets the offset.
/// Like FileHandle, close keeps the descriptor number until destruction.
class IOUringFileHandle : public Handle {
    private:
    /// The uring buffer
    struct io_uring _uring;
    /// The file descriptor
    int _fd;
    /// Closed flag
    std::atomic<bool> _closed;
    /// The next read offset
    uint64_t _offset;

    public:
    /// Open the file at path with a uring of the given number of entries
    explicit IOUringFileHandle(const std::string& path, uint32_t entries = 8);
    /// Copy constructor
    IOUringFileHandle(const IOUringFileHandle&) = delete;
    /// Copy assignment
    IOUringFileHandle& operator=(const IOUringFileHandle&) = delete;
    /// The destructor
    ~IOUringFileHandle() noexcept override;

    /// Submit a read and wait for its completion (cqe)
    uint64_t read(uint8_t* data, uint64_t length) override;
    /// Detach the file, later reads return 0
    void close() override;
    /// Is the handle closed
    [[nodiscard]] bool closed() const override { return _closed.load(std::memory_order_acquire); }
    /// Reset the read offset
    bool rewind() override;
    /// The file size
    [[nodiscard]] std::optional<uint64_t> size() const override;
};
//---------------------------------------------------------------------------
} // namespace uploadstream::stream
