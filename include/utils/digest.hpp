#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <openssl/types.h>
//---------------------------------------------------------------------------
// UploadStream - Throttled Chunked Upload Source Library
// UploadStream Authors, 2024
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace uploadstream::utils {
//---------------------------------------------------------------------------
/// Incremental message digest of a payload, built on the OpenSSL EVP interface.
/// Used to derive Content-MD5 or x-amz-content-sha256 values while the body is produced.
class Digest {
    public:
    /// The supported algorithms
    enum class Algorithm : uint8_t {
        None,
        MD5,
        SHA256
    };

    private:
    /// The context deleter
    struct ContextDeleter {
        void operator()(EVP_MD_CTX* ctx) const;
    };
    /// The digest context, empty for Algorithm::None
    std::unique_ptr<EVP_MD_CTX, ContextDeleter> _ctx;
    /// The algorithm
    Algorithm _algorithm;

    public:
    /// The constructor
    explicit Digest(Algorithm algorithm = Algorithm::None);

    /// Add data to the digest
    void update(const uint8_t* data, uint64_t length);
    /// The raw digest of all data since construction or the last reset; the digest stays open for updates
    [[nodiscard]] std::string finish() const;
    /// Restart the digest
    void reset();

    /// Get the algorithm
    [[nodiscard]] constexpr Algorithm algorithm() const { return _algorithm; }
    /// Is a digest computed
    [[nodiscard]] constexpr bool enabled() const { return _algorithm != Algorithm::None; }

    /// The raw digest of a single buffer
    [[nodiscard]] static std::string compute(Algorithm algorithm, const uint8_t* data, uint64_t length);
    /// Parse the algorithm name [none, md5, sha256]
    [[nodiscard]] static Algorithm parse(std::string_view name);
    /// The name of the algorithm
    [[nodiscard]] static std::string_view name(Algorithm algorithm);
};
//---------------------------------------------------------------------------
} // namespace uploadstream::utils
