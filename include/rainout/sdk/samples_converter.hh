//
// Strided conversion between native sample formats and float.
//

#ifndef RAINOUT_SDK_SAMPLES_CONVERTER_HH
#define RAINOUT_SDK_SAMPLES_CONVERTER_HH

#include <rainout/sdk/audio_format.hh>
#include <rainout/sdk/types.hh>
#include <rainout/export_rainout.h>

namespace rainout {
    /**
     * Reads @p frames samples starting at @p src, advancing @p stride bytes per
     * sample, and writes them as contiguous floats to @p dst.
     *
     * An interleaved stream uses a stride of channels * bytes_per_sample, a
     * planar one a stride of bytes_per_sample.
     */
    using to_float_converter_func_t = void (*)(float* dst, const uint8* src, frames_t frames, std::size_t stride) noexcept;

    /**
     * Writes @p frames contiguous floats from @p src into the native buffer at
     * @p dst, advancing @p stride bytes per sample. Values are clamped to [-1, 1].
     */
    using from_float_converter_func_t = void (*)(uint8* dst, const float* src, frames_t frames, std::size_t stride) noexcept;

    /**
     * Writes @p frames silent samples, advancing @p stride bytes per sample.
     */
    using silence_func_t = void (*)(uint8* dst, frames_t frames, std::size_t stride) noexcept;

    RAINOUT_EXPORT to_float_converter_func_t get_to_float_converter(audio_format format);
    RAINOUT_EXPORT from_float_converter_func_t get_from_float_converter(audio_format format);
    RAINOUT_EXPORT silence_func_t get_silence_writer(audio_format format);

    RAINOUT_EXPORT int bytes_per_sample(audio_format format);
}

#endif
