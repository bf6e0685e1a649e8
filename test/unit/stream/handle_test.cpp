#include "stream/file_handle.hpp"
#include "stream/memory_handle.hpp"
#include "stream/source.hpp"
#include <catch2/catch.hpp>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <string>
#include <unistd.h>
#ifdef UPLOADSTREAM_HAS_IO_URING
#include "stream/io_uring_file_handle.hpp"
#endif
//---------------------------------------------------------------------------
// UploadStream - Throttled Chunked Upload Source Library
// UploadStream Authors, 2024
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace uploadstream::stream::test {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
/// A temporary file removed at the end of the scope
class TemporaryFile {
    /// The path
    string _path;

    public:
    /// Create the file with the content
    explicit TemporaryFile(const string& content) {
        char name[] = "/tmp/uploadstream_XXXXXX";
        auto fd = mkstemp(name);
        REQUIRE(fd >= 0);
        REQUIRE(::write(fd, content.data(), content.size()) == static_cast<ssize_t>(content.size()));
        ::close(fd);
        _path = name;
    }
    /// Remove the file
    ~TemporaryFile() { ::unlink(_path.c_str()); }
    /// The path
    const string& path() const { return _path; }
};
//---------------------------------------------------------------------------
TEST_CASE("memory_handle") {
    MemoryHandle handle("This is a streamed test.");
    REQUIRE(handle.size() == 24u);

    uint8_t buffer[16];
    REQUIRE(handle.read(buffer, 16) == 16);
    REQUIRE(!memcmp(buffer, "This is a stream", 16));
    REQUIRE(handle.read(buffer, 16) == 8);
    REQUIRE(!memcmp(buffer, "ed test.", 8));
    REQUIRE(handle.read(buffer, 16) == 0);

    REQUIRE(handle.rewind());
    REQUIRE(handle.position() == 0);
    REQUIRE(handle.read(buffer, 4) == 4);
    REQUIRE(!memcmp(buffer, "This", 4));

    handle.close();
    REQUIRE(handle.closed());
    REQUIRE(!handle.rewind());
    // A closed handle is at its end
    REQUIRE(handle.read(buffer, 4) == 0);
}
//---------------------------------------------------------------------------
TEST_CASE("file_handle") {
    string content(10000, 'x');
    content[9999] = 'y';
    TemporaryFile file(content);

    FileHandle handle(file.path());
    REQUIRE(!handle.closed());
    REQUIRE(handle.size() == 10000u);

    auto buffer = make_unique<uint8_t[]>(4096);
    uint64_t total = 0;
    uint64_t length;
    uint8_t last = 0;
    while ((length = handle.read(buffer.get(), 4096)) > 0) {
        total += length;
        last = buffer[length - 1];
    }
    REQUIRE(total == 10000);
    REQUIRE(last == 'y');

    REQUIRE(handle.rewind());
    REQUIRE(handle.read(buffer.get(), 4096) == 4096);

    handle.close();
    REQUIRE(handle.closed());
    REQUIRE(!handle.size().has_value());
    REQUIRE(!handle.rewind());
    REQUIRE(handle.read(buffer.get(), 4096) == 0);
    // Closing twice is a no-op
    handle.close();
}
//---------------------------------------------------------------------------
TEST_CASE("file_handle_close_keeps_descriptor") {
    TemporaryFile first(string(64, 'a'));
    TemporaryFile second(string(64, 'b'));

    FileHandle handle(first.path());
    auto fd = handle.fd();
    handle.close();

    // The number is not free for reuse while the handle lives
    FileHandle other(second.path());
    REQUIRE(other.fd() != fd);

    // A read that already loaded the number sees the end of the stream
    uint8_t buffer[64];
    REQUIRE(::read(fd, buffer, sizeof(buffer)) == 0);
    REQUIRE(handle.read(buffer, sizeof(buffer)) == 0);
    REQUIRE(other.read(buffer, sizeof(buffer)) == 64);
    REQUIRE(buffer[0] == 'b');
}
//---------------------------------------------------------------------------
TEST_CASE("file_handle_pipe") {
    int fds[2];
    REQUIRE(::pipe(fds) == 0);
    REQUIRE(::write(fds[1], "pipe", 4) == 4);
    ::close(fds[1]);

    FileHandle handle(fds[0]);
    REQUIRE(!handle.size().has_value());
    REQUIRE(!handle.rewind());
    uint8_t buffer[8];
    REQUIRE(handle.read(buffer, 8) == 4);
    REQUIRE(handle.read(buffer, 8) == 0);
}
//---------------------------------------------------------------------------
TEST_CASE("file_handle_errors") {
    REQUIRE_THROWS_AS(FileHandle("/nonexistent/uploadstream/file"), runtime_error);
    REQUIRE_THROWS_AS(FileHandle(-1), runtime_error);
}
//---------------------------------------------------------------------------
#ifdef UPLOADSTREAM_HAS_IO_URING
TEST_CASE("io_uring_file_handle") {
    string content(5000, 'u');
    TemporaryFile file(content);

    IOUringFileHandle handle(file.path());
    REQUIRE(handle.size() == 5000u);
    uint8_t buffer[4096];
    REQUIRE(handle.read(buffer, 4096) == 4096);
    REQUIRE(handle.read(buffer, 4096) == 904);
    REQUIRE(handle.read(buffer, 4096) == 0);
    REQUIRE(handle.rewind());
    REQUIRE(handle.read(buffer, 4096) == 4096);
    handle.close();
    REQUIRE(handle.closed());
    REQUIRE(handle.read(buffer, 4096) == 0);
}
#endif
//---------------------------------------------------------------------------
TEST_CASE("source") {
    auto empty = Source::empty();
    REQUIRE(empty.kind() == Source::Kind::Empty);
    REQUIRE(empty.size() == 0u);
    REQUIRE(!empty.handle());
    REQUIRE(!empty.buffer());

    auto text = Source::text("Hello");
    REQUIRE(text.kind() == Source::Kind::Buffer);
    REQUIRE(text.size() == 5u);
    REQUIRE(text.buffer()->owned());

    uint8_t raw[8] = {};
    auto view = Source::view(raw, sizeof(raw));
    REQUIRE(view.kind() == Source::Kind::Buffer);
    REQUIRE(view.buffer()->cdata() == raw);

    auto stream = Source::stream(make_unique<MemoryHandle>("stream"));
    REQUIRE(stream.kind() == Source::Kind::Stream);
    REQUIRE(stream.handle());
    REQUIRE(stream.size() == 6u);

    auto missing = Source::stream(nullptr);
    REQUIRE(missing.kind() == Source::Kind::Empty);
}
//---------------------------------------------------------------------------
} // namespace uploadstream::stream::test
