#pragma once

#include <cstdint>
#include <initializer_list>
#include <string>

namespace sonar {
namespace net {

// Raw byte string from octet values
inline std::string bytes(std::initializer_list<int> values) {
    std::string out;
    out.reserve(values.size());
    for (int v : values) {
        out.push_back(static_cast<char>(v & 0xFF));
    }
    return out;
}

inline uint8_t byte_at(const std::string &data, size_t index) { return static_cast<uint8_t>(data[index]); }

inline uint16_t read_be16(const std::string &data, size_t offset) {
    return static_cast<uint16_t>((byte_at(data, offset) << 8) | byte_at(data, offset + 1));
}

inline void append_be16(std::string &out, uint16_t value) {
    out.push_back(static_cast<char>((value >> 8) & 0xFF));
    out.push_back(static_cast<char>(value & 0xFF));
}

}  // namespace net
}  // namespace sonar
