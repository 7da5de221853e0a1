#include "ferry/crypto.hpp"

#include <mutex>
#include <stdexcept>

#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/sha.h>
#include <sodium.h>

namespace ferry::crypto
{

    namespace
    {

        constexpr std::string_view kIdAlphabet = "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ";

        void throw_if_sodium_init_failed(int status)
        {
            if (status < 0)
            {
                throw std::runtime_error("libsodium initialization failed");
            }
        }

        std::once_flag &sodium_once_flag()
        {
            static std::once_flag flag;
            return flag;
        }

        void ensure_initialized_once()
        {
            std::call_once(sodium_once_flag(), []()
                           { throw_if_sodium_init_failed(sodium_init()); });
        }

    } // namespace

    void ensure_sodium_init()
    {
        ensure_initialized_once();
    }

    std::string random_id(std::size_t length)
    {
        ensure_initialized_once();
        std::string id;
        id.reserve(length);
        for (std::size_t i = 0; i < length; ++i)
        {
            const auto index = randombytes_uniform(static_cast<std::uint32_t>(kIdAlphabet.size()));
            id.push_back(kIdAlphabet[index]);
        }
        return id;
    }

    std::string to_hex(std::span<const unsigned char> data)
    {
        static constexpr char kHexDigits[] = "0123456789abcdef";
        std::string result;
        result.resize(data.size() * 2);
        for (std::size_t i = 0; i < data.size(); ++i)
        {
            const auto byte = data[i];
            result[2 * i] = kHexDigits[(byte >> 4) & 0x0F];
            result[2 * i + 1] = kHexDigits[byte & 0x0F];
        }
        return result;
    }

    std::string sha256_hex(std::string_view data)
    {
        unsigned char hash[SHA256_DIGEST_LENGTH];
        SHA256(reinterpret_cast<const unsigned char *>(data.data()), data.size(), hash);
        return to_hex(hash);
    }

    std::string hmac_sha256_raw(std::string_view key, std::string_view data)
    {
        unsigned char digest[SHA256_DIGEST_LENGTH];
        unsigned int length = 0;
        if (HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
                 reinterpret_cast<const unsigned char *>(data.data()), data.size(), digest, &length) == nullptr)
        {
            throw std::runtime_error("HMAC-SHA256 failed");
        }
        return {reinterpret_cast<const char *>(digest), length};
    }

    std::string hmac_sha256_hex(std::string_view key, std::string_view data)
    {
        const auto raw = hmac_sha256_raw(key, data);
        return to_hex(std::span(reinterpret_cast<const unsigned char *>(raw.data()), raw.size()));
    }

    Md5::Md5() : ctx_(EVP_MD_CTX_new())
    {
        if (ctx_ == nullptr || EVP_DigestInit_ex(ctx_, EVP_md5(), nullptr) != 1)
        {
            EVP_MD_CTX_free(ctx_);
            throw std::runtime_error("EVP md5 initialization failed");
        }
    }

    Md5::~Md5()
    {
        EVP_MD_CTX_free(ctx_);
    }

    void Md5::update(std::span<const std::byte> data)
    {
        if (finished_)
        {
            throw std::logic_error("md5 digest already finalized");
        }
        if (EVP_DigestUpdate(ctx_, data.data(), data.size()) != 1)
        {
            throw std::runtime_error("EVP md5 update failed");
        }
    }

    std::string Md5::hex_digest()
    {
        if (finished_)
        {
            throw std::logic_error("md5 digest already finalized");
        }
        unsigned char digest[EVP_MAX_MD_SIZE];
        unsigned int length = 0;
        if (EVP_DigestFinal_ex(ctx_, digest, &length) != 1)
        {
            throw std::runtime_error("EVP md5 finalization failed");
        }
        finished_ = true;
        return to_hex(std::span<const unsigned char>(digest, length));
    }

    std::string md5_hex(std::span<const std::byte> data)
    {
        Md5 md5;
        md5.update(data);
        return md5.hex_digest();
    }

} // namespace ferry::crypto
