/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "jsb/jsb_fingerprint.h"

#include <blake3.h>

namespace fm::jsb {

std::array<std::uint8_t, 32> blake3_hash32(std::span<const std::uint8_t> payload) {
    std::array<std::uint8_t, 32> out{};
    blake3_hasher h{};
    blake3_hasher_init(&h);
    if (!payload.empty()) {
        blake3_hasher_update(&h, payload.data(), payload.size());
    }
    blake3_hasher_finalize(&h, out.data(), out.size());
    return out;
}

std::string fingerprint(std::span<const std::uint8_t> payload) {
    static const char hexdig[] = "0123456789abcdef";
    const auto hash = blake3_hash32(payload);
    std::string out;
    out.reserve(hash.size() * 2);
    for (const auto b : hash) {
        out.push_back(hexdig[(b >> 4) & 0xFu]);
        out.push_back(hexdig[b & 0xFu]);
    }
    return out;
}

bool matches_digest(std::span<const std::uint8_t> payload, std::string_view digest) {
    const std::string actual = fingerprint(payload);
    if (digest.size() != actual.size()) {
        return false;
    }
    for (std::size_t i = 0; i < digest.size(); i++) {
        char c = digest[i];
        if (c >= 'A' && c <= 'F') {
            c = static_cast<char>(c + 32);
        }
        if (c != actual[i]) {
            return false;
        }
    }
    return true;
}

}  // namespace fm::jsb
