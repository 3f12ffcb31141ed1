/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "fs_utils.h"

#include "log.h"

#include <array>
#include <fstream>
#include <stdexcept>
#include <string>

#if defined(_WIN32)
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace fs = std::filesystem;

namespace fm::fs_utils {
fs::path executable_dir() {
#if defined(_WIN32)
    std::wstring buf(32768, L'\0');
    const DWORD n = ::GetModuleFileNameW(nullptr, buf.data(), static_cast<DWORD>(buf.size()));
    if (n == 0 || n >= buf.size()) {
        return {};
    }
    buf.resize(n);
    return fs::path(buf).parent_path();
#else
    std::array<char, 4096> buf{};
    const ssize_t n = ::readlink("/proc/self/exe", buf.data(), buf.size() - 1);
    if (n <= 0) {
        return {};
    }
    buf[static_cast<std::size_t>(n)] = '\0';
    return fs::path(buf.data()).parent_path();
#endif
}

std::vector<std::uint8_t> read_file(const fs::path& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f) {
        throw std::runtime_error(std::string("Failed to open file for reading: ") + path.string());
    }
    f.seekg(0, std::ios::end);
    const auto len = f.tellg();
    f.seekg(0, std::ios::beg);
    if (len < 0) {
        throw std::runtime_error(std::string("Failed to get file size: ") + path.string());
    }
    std::vector<std::uint8_t> buf(static_cast<std::size_t>(len));
    if (!buf.empty()) {
        f.read(reinterpret_cast<char*>(buf.data()), static_cast<std::streamsize>(buf.size()));
        if (!f) {
            throw std::runtime_error(std::string("Failed to read file: ") + path.string());
        }
    }
    return buf;
}

nlohmann::ordered_json read_json_file(const fs::path& path) {
    const auto bytes = read_file(path);
    if (bytes.empty()) {
        throw std::runtime_error("JSON file is empty: " + path.string());
    }
    const auto text = std::string(bytes.begin(), bytes.end());
    try {
        return nlohmann::ordered_json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Malformed JSON in " + path.string() + ": " + e.what());
    }
}

void write_text_file(const fs::path& path, const std::string& text) {
    ensure_dir(path.parent_path());
    std::ofstream f(path, std::ios::binary);
    if (!f) {
        throw std::runtime_error(std::string("Failed to open file for writing: ") + path.string());
    }
    f.write(text.data(), static_cast<std::streamsize>(text.size()));
}

void write_file(const fs::path& path, std::span<const std::uint8_t> bytes) {
    ensure_dir(path.parent_path());
    std::ofstream f(path, std::ios::binary);
    if (!f) {
        throw std::runtime_error(std::string("Failed to open file for writing: ") + path.string());
    }
    if (!bytes.empty()) {
        f.write(
            reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size())
        );
    }
    if (!f) {
        throw std::runtime_error(std::string("Failed to write file: ") + path.string());
    }
}

void ensure_dir(const fs::path& dir) {
    if (dir.empty()) {
        return;
    }
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        FM_LOG_ERROR(
            "Failed to create directory: %s (%s)", dir.string().c_str(), ec.message().c_str()
        );
    }
}
}  // namespace fm::fs_utils
