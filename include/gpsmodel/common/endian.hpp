#pragma once
#include <cstdint>
#include <bit>
#include <cstring>

namespace gpsmodel {

// UBX puts every multi-byte field on the wire little-endian.
constexpr uint16_t to_little_endian_16(uint16_t val) {
    if constexpr (std::endian::native == std::endian::little) {
        return val;
    } else {
        return std::byteswap(val);
    }
}

constexpr uint16_t from_little_endian_16(uint16_t val) {
    return to_little_endian_16(val);
}

inline void write_le16(uint8_t* buf, uint16_t val) {
    uint16_t le_val = to_little_endian_16(val);
    std::memcpy(buf, &le_val, sizeof(le_val));
}

inline uint16_t read_le16(const uint8_t* buf) {
    uint16_t temp;
    std::memcpy(&temp, buf, sizeof(temp));
    return from_little_endian_16(temp);
}

} // namespace gpsmodel
