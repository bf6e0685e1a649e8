#include "utils/digest.hpp"
#include <stdexcept>
#include <utility>
#include <openssl/evp.h>
//---------------------------------------------------------------------------
// UploadStream - Throttled Chunked Upload Source Library
// UploadStream Authors, 2024
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
namespace uploadstream {
namespace utils {
//---------------------------------------------------------------------------
static const EVP_MD* evpDigest(Digest::Algorithm algorithm)
// Maps the algorithm to the OpenSSL digest
{
    switch (algorithm) {
        case Digest::Algorithm::MD5: return EVP_md5();
        case Digest::Algorithm::SHA256: return EVP_sha256();
        default: return nullptr;
    }
}
//---------------------------------------------------------------------------
void Digest::ContextDeleter::operator()(EVP_MD_CTX* ctx) const
// Frees the context
{
    EVP_MD_CTX_free(ctx);
}
//---------------------------------------------------------------------------
Digest::Digest(Algorithm algorithm) : _algorithm(algorithm)
// The constructor
{
    reset();
}
//---------------------------------------------------------------------------
void Digest::reset()
// Restarts the digest
{
    auto md = evpDigest(_algorithm);
    if (!md) {
        _ctx.reset();
        return;
    }
    if (!_ctx) {
        _ctx.reset(EVP_MD_CTX_new());
        if (!_ctx)
            throw runtime_error("OpenSSL Error!");
    }
    if (EVP_DigestInit_ex(_ctx.get(), md, nullptr) <= 0)
        throw runtime_error("OpenSSL Error - Digest Init!");
}
//---------------------------------------------------------------------------
void Digest::update(const uint8_t* data, uint64_t length)
// Adds data to the digest
{
    if (!_ctx || !length)
        return;
    if (EVP_DigestUpdate(_ctx.get(), data, length) <= 0)
        throw runtime_error("OpenSSL Error - Digest Update!");
}
//---------------------------------------------------------------------------
string Digest::finish() const
// Finalizes a copy of the context such that updates can continue
{
    if (!_ctx)
        return "";

    unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> copy(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!copy.get())
        throw runtime_error("OpenSSL Error!");
    if (EVP_MD_CTX_copy_ex(copy.get(), _ctx.get()) <= 0)
        throw runtime_error("OpenSSL Error - Digest Copy!");

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned digestLength = 0;
    if (EVP_DigestFinal_ex(copy.get(), hash, &digestLength) <= 0)
        throw runtime_error("OpenSSL Error - Digest Final!");
    return string(reinterpret_cast<char*>(hash), digestLength);
}
//---------------------------------------------------------------------------
string Digest::compute(Algorithm algorithm, const uint8_t* data, uint64_t length)
// Digest of a single buffer
{
    Digest digest(algorithm);
    digest.update(data, length);
    return digest.finish();
}
//---------------------------------------------------------------------------
Digest::Algorithm Digest::parse(string_view name)
// Parses the algorithm name
{
    if (name == "none" || name.empty())
        return Algorithm::None;
    if (name == "md5")
        return Algorithm::MD5;
    if (name == "sha256")
        return Algorithm::SHA256;
    throw runtime_error("Unsupported digest algorithm: " + string(name));
}
//---------------------------------------------------------------------------
string_view Digest::name(Algorithm algorithm)
// The algorithm name
{
    switch (algorithm) {
        case Algorithm::MD5: return "md5";
        case Algorithm::SHA256: return "sha256";
        default: return "none";
    }
}
//---------------------------------------------------------------------------
}; // namespace utils
}; // namespace uploadstream
