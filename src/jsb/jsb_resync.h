/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "jsb/jsb_token_stream.h"

#include <optional>
#include <string>

namespace fm::jsb {

struct ResyncPoint {
    std::string trimmed;
    std::size_t restart_at = 0;
};

// A short-string marker that claims one byte too many swallows the next key's
// length byte; the decoded string then ends in a control character. Returns the
// trimmed string and the offset a fresh TokenStream should start from.
std::optional<ResyncPoint> detect_trailing_control(const Token& token);

}  // namespace fm::jsb
