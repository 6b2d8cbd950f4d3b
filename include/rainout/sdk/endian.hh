#ifndef RAINOUT_SDK_ENDIAN_HH
#define RAINOUT_SDK_ENDIAN_HH

#include <rainout/sdk/types.hh>
#include <rainout/sdk/rainout_sdk_config.h>
#include <cstring>

namespace rainout {

#if RAINOUT_BIG_ENDIAN
    constexpr bool is_big_endian = true;
    constexpr bool is_little_endian = false;
#else
    constexpr bool is_big_endian = false;
    constexpr bool is_little_endian = true;
#endif

inline uint16_t swap16(uint16_t x) noexcept {
    return static_cast<uint16_t>((x << 8) | (x >> 8));
}

inline uint32_t swap32(uint32_t x) noexcept {
    return ((x << 24) | ((x << 8) & 0x00FF0000) |
            ((x >> 8) & 0x0000FF00) | (x >> 24));
}

inline uint16_t swap16le(uint16_t x) noexcept {
    return is_little_endian ? x : swap16(x);
}

inline uint16_t swap16be(uint16_t x) noexcept {
    return is_big_endian ? x : swap16(x);
}

inline uint32_t swap32le(uint32_t x) noexcept {
    return is_little_endian ? x : swap32(x);
}

inline uint32_t swap32be(uint32_t x) noexcept {
    return is_big_endian ? x : swap32(x);
}

// Native buffers handed over by adapters carry no alignment guarantee,
// so samples are always moved through memcpy.
template<typename T>
inline T load_sample(const uint8_t* src) noexcept {
    T v;
    std::memcpy(&v, src, sizeof(T));
    return v;
}

template<typename T>
inline void store_sample(uint8_t* dst, T v) noexcept {
    std::memcpy(dst, &v, sizeof(T));
}

} // namespace rainout

#endif // RAINOUT_SDK_ENDIAN_HH
