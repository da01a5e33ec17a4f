#pragma once

#include <cstdint>
#include <string>
#include <string_view>

// Big-endian helpers for the on-disk hdlist layout.

inline void put_be32(std::string& out, std::uint32_t value) {
    out.push_back(static_cast<char>((value >> 24) & 0xff));
    out.push_back(static_cast<char>((value >> 16) & 0xff));
    out.push_back(static_cast<char>((value >> 8) & 0xff));
    out.push_back(static_cast<char>(value & 0xff));
}

inline std::uint32_t get_be32(std::string_view data, size_t pos) {
    const auto* p = reinterpret_cast<const unsigned char*>(data.data() + pos);
    return (static_cast<std::uint32_t>(p[0]) << 24) |
           (static_cast<std::uint32_t>(p[1]) << 16) |
           (static_cast<std::uint32_t>(p[2]) << 8) |
           static_cast<std::uint32_t>(p[3]);
}
