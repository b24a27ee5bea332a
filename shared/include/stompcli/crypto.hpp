/**
 * stompcli - Crypto helpers built on libsodium.
 */
#pragma once

#include <cstddef>
#include <span>
#include <string>

namespace stompcli::crypto
{

    // Hex encoded, 2 * byte_count characters long.
    std::string random_token(std::size_t byte_count);

    std::string hash_bytes(std::span<const std::byte> data);

} // namespace stompcli::crypto
