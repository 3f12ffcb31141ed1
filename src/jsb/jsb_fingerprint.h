/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace fm::jsb {

std::array<std::uint8_t, 32> blake3_hash32(std::span<const std::uint8_t> payload);

// Lowercase hex BLAKE3-256 of the whole container.
std::string fingerprint(std::span<const std::uint8_t> payload);

// Case-insensitive comparison against a stored hex digest.
bool matches_digest(std::span<const std::uint8_t> payload, std::string_view digest);

}  // namespace fm::jsb
