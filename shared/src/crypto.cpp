#include "clipferry/crypto.hpp"

#include <mutex>
#include <stdexcept>
#include <vector>

#include <sodium.h>

namespace clipferry::crypto
{

    namespace
    {

        constexpr std::size_t kIdentityDigestBytes = 16;

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

    std::string identity_token(std::string_view identity)
    {
        ensure_initialized_once();
        std::vector<unsigned char> digest(kIdentityDigestBytes);
        if (crypto_generichash(digest.data(), digest.size(),
                               reinterpret_cast<const unsigned char *>(identity.data()), identity.size(), nullptr,
                               0) != 0)
        {
            throw std::runtime_error("crypto_generichash failed");
        }
        return to_hex(digest);
    }

    std::string random_token(std::size_t bytes)
    {
        ensure_initialized_once();
        std::vector<unsigned char> buffer(bytes);
        randombytes_buf(buffer.data(), buffer.size());
        return to_hex(buffer);
    }

} // namespace clipferry::crypto
