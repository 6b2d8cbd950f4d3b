/**
 * @file audio_format.hh
 * @brief Native sample format definitions
 * @ingroup sdk_audio_format
 */

#ifndef RAINOUT_SDK_AUDIO_FORMAT_HH
#define RAINOUT_SDK_AUDIO_FORMAT_HH

#include <rainout/sdk/types.hh>
#include <rainout/sdk/rainout_sdk_config.h>
#include <rainout/export_rainout.h>
#include <iosfwd>

namespace rainout {

/**
 * @defgroup sdk_audio_format Native Formats
 * @ingroup sdk
 * @brief Sample formats an adapter may hand to the stream engine
 *
 * The user-facing buffers are always 32-bit float. Adapters describe
 * the native layout of the hardware buffer with an audio_format and the
 * engine converts on both edges of every cycle.
 * @{
 */

/**
 * @enum audio_format
 * @brief Native sample format
 *
 * The value encodes the sample properties:
 *
 * - Bits 0-7: Bit size (8, 16, 32)
 * - Bit 8: Float flag
 * - Bit 12: Big endian flag
 * - Bit 15: Signed flag
 */
enum class audio_format : uint16_t {
    unknown = 0,
    u8 = 0x0008,
    s8 = 0x8008,
    s16le = 0x8010,
    s16be = 0x9010,
    s32le = 0x8020,
    s32be = 0x9020,
    f32le = 0x8120,
    f32be = 0x9120
};

inline constexpr uint8_t audio_format_bit_size(audio_format fmt) {
    return static_cast<uint8_t>(static_cast<uint16_t>(fmt) & 0xFF);
}

inline constexpr uint8_t audio_format_byte_size(audio_format fmt) {
    return audio_format_bit_size(fmt) / 8;
}

inline constexpr bool audio_format_is_signed(audio_format fmt) {
    return (static_cast<uint16_t>(fmt) & 0x8000) != 0;
}

inline constexpr bool audio_format_is_big_endian(audio_format fmt) {
    return (static_cast<uint16_t>(fmt) & 0x1000) != 0;
}

inline constexpr bool audio_format_is_float(audio_format fmt) {
    return (static_cast<uint16_t>(fmt) & 0x0100) != 0;
}

#if RAINOUT_BIG_ENDIAN
inline constexpr audio_format audio_s16sys = audio_format::s16be;
inline constexpr audio_format audio_s32sys = audio_format::s32be;
inline constexpr audio_format audio_f32sys = audio_format::f32be;
#else
inline constexpr audio_format audio_s16sys = audio_format::s16le;
inline constexpr audio_format audio_s32sys = audio_format::s32le;
inline constexpr audio_format audio_f32sys = audio_format::f32le;
#endif

/**
 * @brief Prints the format name ("s16le", "f32le", ...)
 */
RAINOUT_EXPORT std::ostream& operator<<(std::ostream& os, audio_format fmt);

/** @} */

} // namespace rainout

#endif // RAINOUT_SDK_AUDIO_FORMAT_HH
