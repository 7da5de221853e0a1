/**
 * Ferry - Crypto helpers: libsodium for randomness, OpenSSL for the digests object stores speak.
 */
#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <string_view>

struct evp_md_ctx_st;

namespace ferry::crypto
{

    void ensure_sodium_init();

    // Random identifier made of ASCII letters, drawn from the libsodium CSPRNG.
    std::string random_id(std::size_t length);

    std::string to_hex(std::span<const unsigned char> data);

    std::string sha256_hex(std::string_view data);

    std::string hmac_sha256_raw(std::string_view key, std::string_view data);

    std::string hmac_sha256_hex(std::string_view key, std::string_view data);

    // Incremental MD5, the digest S3-compatible stores return as ETag for single-part uploads.
    class Md5
    {
    public:
        Md5();
        ~Md5();

        Md5(const Md5 &) = delete;
        Md5 &operator=(const Md5 &) = delete;

        void update(std::span<const std::byte> data);

        std::string hex_digest();

    private:
        evp_md_ctx_st *ctx_;
        bool finished_{false};
    };

    std::string md5_hex(std::span<const std::byte> data);

} // namespace ferry::crypto
