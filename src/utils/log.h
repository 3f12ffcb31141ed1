/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <cstdarg>

namespace fm::log {
void set_debug(bool enabled);
bool debug_enabled();

void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);
void debug(const char* fmt, ...);
}  // namespace fm::log

#define FM_LOG_INFO(fmt, ...) ::fm::log::info(fmt, ##__VA_ARGS__)
#define FM_LOG_WARN(fmt, ...) ::fm::log::warn(fmt, ##__VA_ARGS__)
#define FM_LOG_ERROR(fmt, ...) ::fm::log::error(fmt, ##__VA_ARGS__)
#define FM_LOG_DEBUG(fmt, ...)                  \
    do {                                        \
        if (::fm::log::debug_enabled()) {       \
            ::fm::log::debug(fmt, ##__VA_ARGS__); \
        }                                       \
    } while (0)
