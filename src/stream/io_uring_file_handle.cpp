#ifdef UPLOADSTREAM_HAS_IO_URING
#include "stream/io_uring_file_handle.hpp"
#include "stream/file_handle.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <limits>
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
IOUringFileHandle::IOUringFileHandle(const string& path, uint32_t entries) : _fd(-1), _closed(false), _offset(0)
// Constructor that opens the file and inits the uring queue
{
    struct io_uring_params params;
    memset(&params, 0, sizeof(params));

    if (io_uring_queue_init_params(entries, &_uring, &params) < 0) {
        throw runtime_error("Uring init error!");
    }

    _fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (_fd < 0) {
        auto error = errno;
        io_uring_queue_exit(&_uring);
        throw runtime_error("File open error! " + path + ": " + string(strerror(error)));
    }
}
//---------------------------------------------------------------------------
uint64_t IOUringFileHandle::read(uint8_t* data, uint64_t length)
// Submits a positioned read and waits for the completion (cqe)
{
    auto request = static_cast<unsigned>(min<uint64_t>(length, numeric_limits<unsigned>::max()));
    while (true) {
        if (closed())
            return 0;

        auto sqe = io_uring_get_sqe(&_uring);
        if (!sqe)
            throw runtime_error("Uring submission queue full!");
        io_uring_prep_read(sqe, _fd, data, request, _offset);
        sqe->user_data = reinterpret_cast<uintptr_t>(this);

        if (io_uring_submit(&_uring) < 0)
            throw runtime_error("Uring submit error!");

        io_uring_cqe* cqe;
        if (io_uring_wait_cqe(&_uring, &cqe) < 0)
            throw runtime_error("io_uring_wait_cqe error!");
        auto res = cqe->res;
        io_uring_cqe_seen(&_uring, cqe);

        if (res >= 0) {
            _offset += static_cast<uint64_t>(res);
            return static_cast<uint64_t>(res);
        }
        if (res == -EINTR || res == -EAGAIN)
            continue;
        throw runtime_error("Uring read error! " + string(strerror(-res)));
    }
}
//---------------------------------------------------------------------------
void IOUringFileHandle::close()
// Detaches the file
{
    if (_closed.exchange(true, memory_order_acq_rel))
        return;
    FileHandle::detach(_fd);
}
//---------------------------------------------------------------------------
bool IOUringFileHandle::rewind()
// Resets the offset
{
    if (closed())
        return false;
    _offset = 0;
    return true;
}
//---------------------------------------------------------------------------
optional<uint64_t> IOUringFileHandle::size() const
// The file size
{
    if (closed())
        return nullopt;
    struct stat st;
    if (::fstat(_fd, &st) < 0 || !S_ISREG(st.st_mode))
        return nullopt;
    return static_cast<uint64_t>(st.st_size);
}
//---------------------------------------------------------------------------
IOUringFileHandle::~IOUringFileHandle() noexcept
// The destructor
{
    if (::close(_fd) < 0)
        cerr << "File close error! " << strerror(errno) << endl;
    io_uring_queue_exit(&_uring);
}
//---------------------------------------------------------------------------
} // namespace uploadstream::stream
#endif
