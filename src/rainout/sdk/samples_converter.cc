//
// Native <-> float sample conversion with arbitrary strides.
//

#include <rainout/sdk/samples_converter.hh>
#include <rainout/sdk/endian.hh>
#include <limits>
#include <type_traits>
#include <algorithm>

namespace rainout {
    namespace {
        template<typename T>
        float as_float(T src) noexcept {
            static_assert(std::is_integral_v<T>, "T must be an integral type");
            if constexpr (std::is_signed_v<T>) {
                // Divide by max + 1 to keep the asymmetric range (-128..127) inside [-1, 1)
                constexpr double max_val = static_cast<double>(std::numeric_limits<T>::max()) + 1.0;
                return static_cast<float>(static_cast<double>(src) / max_val);
            } else {
                constexpr double max_v = std::numeric_limits<T>::max();
                constexpr double min_v = std::numeric_limits<T>::min();
                constexpr double delta = max_v - min_v;
                constexpr auto scale = static_cast<float>(2.0 / delta);
                return static_cast<float>(static_cast<double>(src) - min_v) * scale - 1.0f;
            }
        }

        inline float clamp_unit(float f) noexcept {
            return (f >= 1.f) ? 1.f : (f < -1.f ? -1.f : f);
        }

        template<typename T>
        T from_float(float f) noexcept {
            const float clamped = clamp_unit(f);
            if constexpr (std::is_signed_v<T>) {
                return static_cast<T>(static_cast<double>(clamped) * static_cast<double>(std::numeric_limits<T>::max()));
            } else {
                constexpr double max_v = std::numeric_limits<T>::max();
                return static_cast<T>((static_cast<double>(clamped) * 0.5 + 0.5) * max_v + 0.5);
            }
        }

        template<bool BigEndian>
        inline uint8_t to_host(uint8_t x) noexcept { return x; }

        template<bool BigEndian>
        inline uint16_t to_host(uint16_t x) noexcept {
            if constexpr (BigEndian) {
                return swap16be(x);
            } else {
                return swap16le(x);
            }
        }

        template<bool BigEndian>
        inline uint32_t to_host(uint32_t x) noexcept {
            if constexpr (BigEndian) {
                return swap32be(x);
            } else {
                return swap32le(x);
            }
        }

        // byte swapping is symmetric
        template<bool BigEndian, typename U>
        inline U from_host(U x) noexcept {
            return to_host<BigEndian>(x);
        }

        template<typename S, bool BigEndian>
        void int_to_float(float* dst, const uint8* src, frames_t frames, std::size_t stride) noexcept {
            using raw_t = std::make_unsigned_t<S>;
            for (frames_t i = 0; i < frames; i++) {
                const auto raw = to_host<BigEndian>(load_sample<raw_t>(src));
                dst[i] = as_float(static_cast<S>(raw));
                src += stride;
            }
        }

        template<bool BigEndian>
        void f32_to_float(float* dst, const uint8* src, frames_t frames, std::size_t stride) noexcept {
            for (frames_t i = 0; i < frames; i++) {
                const auto raw = to_host<BigEndian>(load_sample<uint32_t>(src));
                float v;
                std::memcpy(&v, &raw, sizeof(v));
                dst[i] = v;
                src += stride;
            }
        }

        template<typename S, bool BigEndian>
        void float_to_int(uint8* dst, const float* src, frames_t frames, std::size_t stride) noexcept {
            using raw_t = std::make_unsigned_t<S>;
            for (frames_t i = 0; i < frames; i++) {
                const auto v = static_cast<raw_t>(from_float<S>(src[i]));
                store_sample<raw_t>(dst, from_host<BigEndian>(v));
                dst += stride;
            }
        }

        template<bool BigEndian>
        void float_to_f32(uint8* dst, const float* src, frames_t frames, std::size_t stride) noexcept {
            for (frames_t i = 0; i < frames; i++) {
                uint32_t raw;
                std::memcpy(&raw, &src[i], sizeof(raw));
                store_sample<uint32_t>(dst, from_host<BigEndian>(raw));
                dst += stride;
            }
        }

        template<std::size_t Bytes>
        void write_zero(uint8* dst, frames_t frames, std::size_t stride) noexcept {
            for (frames_t i = 0; i < frames; i++) {
                std::memset(dst, 0, Bytes);
                dst += stride;
            }
        }

        void write_u8_silence(uint8* dst, frames_t frames, std::size_t stride) noexcept {
            for (frames_t i = 0; i < frames; i++) {
                *dst = 0x80;
                dst += stride;
            }
        }
    }

    to_float_converter_func_t get_to_float_converter(audio_format format) {
        switch (format) {
            case audio_format::u8:    return int_to_float<uint8_t, false>;
            case audio_format::s8:    return int_to_float<int8_t, false>;
            case audio_format::s16le: return int_to_float<int16_t, false>;
            case audio_format::s16be: return int_to_float<int16_t, true>;
            case audio_format::s32le: return int_to_float<int32_t, false>;
            case audio_format::s32be: return int_to_float<int32_t, true>;
            case audio_format::f32le: return f32_to_float<false>;
            case audio_format::f32be: return f32_to_float<true>;
            default:
                return nullptr;
        }
    }

    from_float_converter_func_t get_from_float_converter(audio_format format) {
        switch (format) {
            case audio_format::u8:    return float_to_int<uint8_t, false>;
            case audio_format::s8:    return float_to_int<int8_t, false>;
            case audio_format::s16le: return float_to_int<int16_t, false>;
            case audio_format::s16be: return float_to_int<int16_t, true>;
            case audio_format::s32le: return float_to_int<int32_t, false>;
            case audio_format::s32be: return float_to_int<int32_t, true>;
            case audio_format::f32le: return float_to_f32<false>;
            case audio_format::f32be: return float_to_f32<true>;
            default:
                return nullptr;
        }
    }

    silence_func_t get_silence_writer(audio_format format) {
        switch (format) {
            case audio_format::u8:
                return write_u8_silence;
            case audio_format::s8:
                return write_zero<1>;
            case audio_format::s16le:
            case audio_format::s16be:
                return write_zero<2>;
            case audio_format::s32le:
            case audio_format::s32be:
            case audio_format::f32le:
            case audio_format::f32be:
                return write_zero<4>;
            default:
                return nullptr;
        }
    }

    int bytes_per_sample(audio_format format) {
        return audio_format_byte_size(format);
    }
}
