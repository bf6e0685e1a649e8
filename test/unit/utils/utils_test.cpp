#include "utils/digest.hpp"
#include "utils/utils.hpp"
#include <catch2/catch.hpp>
#include <stdexcept>
#include <string>
//---------------------------------------------------------------------------
// UploadStream - Throttled Chunked Upload Source Library
// UploadStream Authors, 2024
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace uploadstream::utils::test {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
TEST_CASE("utils_encode") {
    string plain = "abc";
    auto data = reinterpret_cast<const uint8_t*>(plain.data());
    REQUIRE(hexEncode(data, plain.size()) == "616263");
    REQUIRE(hexEncode(data, plain.size(), true) == "616263");
    uint8_t bytes[] = {0xde, 0xad, 0xbe, 0xef};
    REQUIRE(hexEncode(bytes, 4) == "deadbeef");
    REQUIRE(hexEncode(bytes, 4, true) == "DEADBEEF");
    REQUIRE(base64Encode(data, plain.size()) == "YWJj");
    REQUIRE(base64Encode(bytes, 4) == "3q2+7w==");

    REQUIRE(formatBytes(512) == "512 B");
    REQUIRE(formatBytes(1536) == "1.50 KiB");
    REQUIRE(formatBytes(3u * 1024 * 1024) == "3.00 MiB");
}
//---------------------------------------------------------------------------
TEST_CASE("digest") {
    string plain = "abc";
    auto data = reinterpret_cast<const uint8_t*>(plain.data());

    REQUIRE(hexEncode(Digest::compute(Digest::Algorithm::MD5, data, plain.size())) == "900150983cd24fb0d6963f7d28e17f72");
    REQUIRE(hexEncode(Digest::compute(Digest::Algorithm::SHA256, data, plain.size())) == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    REQUIRE(Digest::compute(Digest::Algorithm::None, data, plain.size()).empty());

    // Incremental updates match the one-shot digest
    Digest digest(Digest::Algorithm::SHA256);
    REQUIRE(digest.enabled());
    digest.update(data, 1);
    auto partial = digest.finish();
    REQUIRE(partial == Digest::compute(Digest::Algorithm::SHA256, data, 1));
    digest.update(data + 1, 2);
    REQUIRE(digest.finish() == Digest::compute(Digest::Algorithm::SHA256, data, 3));
    REQUIRE(digest.finish().size() == 32);

    digest.reset();
    REQUIRE(digest.finish() == Digest::compute(Digest::Algorithm::SHA256, nullptr, 0));

    Digest none;
    REQUIRE(!none.enabled());
    none.update(data, 3);
    REQUIRE(none.finish().empty());
}
//---------------------------------------------------------------------------
TEST_CASE("digest_parse") {
    REQUIRE(Digest::parse("md5") == Digest::Algorithm::MD5);
    REQUIRE(Digest::parse("sha256") == Digest::Algorithm::SHA256);
    REQUIRE(Digest::parse("none") == Digest::Algorithm::None);
    REQUIRE(Digest::name(Digest::Algorithm::MD5) == "md5");
    REQUIRE_THROWS_AS(Digest::parse("crc32"), runtime_error);
}
//---------------------------------------------------------------------------
} // namespace uploadstream::utils::test
