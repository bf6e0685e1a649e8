#include "stream/file_handle.hpp"
#include <cerrno>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
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
FileHandle::FileHandle(const string& path) : _fd(-1), _closed(false)
// Opens the file
{
    _fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (_fd < 0)
        throw runtime_error("File open error! " + path + ": " + string(strerror(errno)));
}
//---------------------------------------------------------------------------
FileHandle::FileHandle(int fd) : _fd(fd), _closed(false)
// Adopts the descriptor
{
    if (fd < 0)
        throw runtime_error("Invalid file descriptor!");
}
//---------------------------------------------------------------------------
uint64_t FileHandle::read(uint8_t* data, uint64_t length)
// Reads up to length bytes
{
    while (true) {
        if (closed())
            return 0;
        // After a concurrent close the descriptor refers to /dev/null and reads 0
        auto res = ::read(_fd, data, length);
        if (res >= 0)
            return static_cast<uint64_t>(res);
        if (errno == EINTR)
            continue;
        throw runtime_error("File read error! " + string(strerror(errno)));
    }
}
//---------------------------------------------------------------------------
void FileHandle::detach(int fd)
// Replaces the open file behind fd with /dev/null
{
    auto devNull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
    if (devNull < 0)
        throw runtime_error("File close error! " + string(strerror(errno)));
    if (::dup3(devNull, fd, O_CLOEXEC) < 0) {
        auto error = errno;
        ::close(devNull);
        throw runtime_error("File close error! " + string(strerror(error)));
    }
    if (::close(devNull) < 0)
        throw runtime_error("File close error! " + string(strerror(errno)));
}
//---------------------------------------------------------------------------
void FileHandle::close()
// Detaches the file
{
    if (_closed.exchange(true, memory_order_acq_rel))
        return;
    detach(_fd);
}
//---------------------------------------------------------------------------
bool FileHandle::rewind()
// Seeks to the start
{
    if (closed())
        return false;
    if (::lseek(_fd, 0, SEEK_SET) < 0) {
        if (errno == ESPIPE)
            return false;
        throw runtime_error("File seek error! " + string(strerror(errno)));
    }
    return true;
}
//---------------------------------------------------------------------------
optional<uint64_t> FileHandle::size() const
// The size of a regular file
{
    if (closed())
        return nullopt;
    struct stat st;
    if (::fstat(_fd, &st) < 0 || !S_ISREG(st.st_mode))
        return nullopt;
    return static_cast<uint64_t>(st.st_size);
}
//---------------------------------------------------------------------------
FileHandle::~FileHandle() noexcept
// The destructor
{
    if (::close(_fd) < 0)
        cerr << "File close error! " << strerror(errno) << endl;
}
//---------------------------------------------------------------------------
} // namespace uploadstream::stream
