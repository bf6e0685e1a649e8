#pragma once
#include "stream/handle.hpp"
#include <atomic>
#include <string>
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
/// Reads from a POSIX file descriptor with blocking read calls.
/// Works for regular files as well as pipes and sockets.
/// Closing redirects the descriptor to /dev/null; its number is only
/// released by the destructor so that a read racing with close can never
/// hit a descriptor that was reused for another file.
class FileHandle : public Handle {
    private:
    /// The file descriptor
    int _fd;
    /// Closed flag
    std::atomic<bool> _closed;

    public:
    /// Open the file at path for reading
    explicit FileHandle(const std::string& path);
    /// Adopt an open file descriptor, the handle closes it
    explicit FileHandle(int fd);
    /// Copy constructor
    FileHandle(const FileHandle&) = delete;
    /// Copy assignment
    FileHandle& operator=(const FileHandle&) = delete;
    /// The destructor
    ~FileHandle() noexcept override;

    /// Read up to length bytes
    uint64_t read(uint8_t* data, uint64_t length) override;
    /// Detach the file, later reads return 0
    void close() override;
    /// Is the handle closed
    [[nodiscard]] bool closed() const override { return _closed.load(std::memory_order_acquire); }
    /// Seek to the start, false for pipes and sockets
    bool rewind() override;
    /// The size of a regular file
    [[nodiscard]] std::optional<uint64_t> size() const override;
    /// The file descriptor
    [[nodiscard]] int fd() const { return _fd; }

    /// Point fd at /dev/null, the descriptor number stays allocated
    static void detach(int fd);
};
//---------------------------------------------------------------------------
} // namespace uploadstream::stream
