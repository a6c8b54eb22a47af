/**
 * ClipFerry - Naming helpers for scratch storage built on libsodium.
 */
#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <string_view>

namespace clipferry::crypto
{

    void ensure_sodium_init();

    // Hex BLAKE2b digest of an opaque identity, used as a path-safe directory name.
    std::string identity_token(std::string_view identity);

    std::string random_token(std::size_t bytes = 8);

    std::string to_hex(std::span<const unsigned char> data);

} // namespace clipferry::crypto
