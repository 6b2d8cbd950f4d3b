#include <rainout/sdk/audio_format.hh>
#include <ostream>

namespace rainout {

std::ostream& operator<<(std::ostream& os, audio_format fmt) {
    switch (fmt) {
        case audio_format::unknown: return os << "unknown";
        case audio_format::u8: return os << "u8";
        case audio_format::s8: return os << "s8";
        case audio_format::s16le: return os << "s16le";
        case audio_format::s16be: return os << "s16be";
        case audio_format::s32le: return os << "s32le";
        case audio_format::s32be: return os << "s32be";
        case audio_format::f32le: return os << "f32le";
        case audio_format::f32be: return os << "f32be";
    }
    return os << "audio_format(" << static_cast<int>(fmt) << ")";
}

} // namespace rainout
