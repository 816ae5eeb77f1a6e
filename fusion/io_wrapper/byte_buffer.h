#pragma once

#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

namespace scene_fusion {

typedef std::vector<std::uint8_t> ByteBuffer;

// little-endian appends, independent of the host byte order.

inline void appendU8(ByteBuffer& buf, std::uint8_t v) {
    buf.push_back(v);
}

inline void appendU16(ByteBuffer& buf, std::uint16_t v) {
    buf.push_back(static_cast<std::uint8_t>(v & 0xff));
    buf.push_back(static_cast<std::uint8_t>((v >> 8) & 0xff));
}

inline void appendU32(ByteBuffer& buf, std::uint32_t v) {
    for (int i = 0; i < 4; ++i)
        buf.push_back(static_cast<std::uint8_t>((v >> (8 * i)) & 0xff));
}

inline void appendF32(ByteBuffer& buf, float v) {
    std::uint32_t bits;
    std::memcpy(&bits, &v, sizeof(bits));
    appendU32(buf, bits);
}

inline void appendBytes(ByteBuffer& buf, const void* data, std::size_t size) {
    const std::uint8_t* p = static_cast<const std::uint8_t*>(data);
    buf.insert(buf.end(), p, p + size);
}

inline void appendString(ByteBuffer& buf, const std::string& s) {
    buf.insert(buf.end(), s.begin(), s.end());
}

inline std::uint16_t readU16(const std::uint8_t* p) {
    return static_cast<std::uint16_t>(p[0] | (p[1] << 8));
}

inline std::uint32_t readU32(const std::uint8_t* p) {
    return static_cast<std::uint32_t>(p[0]) | (static_cast<std::uint32_t>(p[1]) << 8) |
           (static_cast<std::uint32_t>(p[2]) << 16) | (static_cast<std::uint32_t>(p[3]) << 24);
}

inline float readF32(const std::uint8_t* p) {
    const std::uint32_t bits = readU32(p);
    float v;
    std::memcpy(&v, &bits, sizeof(v));
    return v;
}

}
