/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "jsb/jsb_resync.h"

namespace fm::jsb {

std::optional<ResyncPoint> detect_trailing_control(const Token& token) {
    if (token.kind != TokenKind::String || token.str_value.empty() || token.cursor == 0) {
        return std::nullopt;
    }
    const auto last = static_cast<unsigned char>(token.str_value.back());
    if (last >= 32) {
        return std::nullopt;
    }
    ResyncPoint out{};
    out.trimmed = token.str_value.substr(0, token.str_value.size() - 1);
    out.restart_at = token.cursor - 1;
    return out;
}

}  // namespace fm::jsb
