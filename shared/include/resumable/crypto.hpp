/**
 * Resumable - Digest and random identifier helpers built on libsodium.
 */
#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <string_view>

namespace resumable::crypto
{

    std::string hash_bytes(std::span<const std::byte> data);

    std::string hash_text(std::string_view text);

    // Hex string of `byte_count` random bytes.
    std::string random_hex(std::size_t byte_count);

} // namespace resumable::crypto
