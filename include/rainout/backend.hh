/**
 * @file backend.hh
 * @brief Closed set of backend identifiers
 * @ingroup backends
 */

#ifndef RAINOUT_BACKEND_HH
#define RAINOUT_BACKEND_HH

#include <rainout/export_rainout.h>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace rainout {

/**
 * @enum backend
 * @brief Every audio/MIDI backend rainout knows about
 *
 * The set is closed; an adapter registers under one of these identifiers.
 */
enum class backend {
    jack,
    pipewire,
    alsa,
    core_audio,
    wasapi,
    asio,
    sdl3,
    dummy
};

/**
 * @brief How the backend delivers processing cycles
 */
enum class backend_kind {
    duplex_server,  ///< a server drives one callback with inputs and outputs together
    split_stream    ///< separate native input/output streams joined by a synchronisation thread
};

RAINOUT_EXPORT backend_kind backend_kind_of(backend b);

/**
 * @brief Display name ("Jack", "Pipewire", "Alsa", "CoreAudio", "WASAPI", "ASIO", "SDL3", "Dummy")
 */
RAINOUT_EXPORT const char* to_string(backend b);

/**
 * @brief Inverse of to_string(), case insensitive
 */
RAINOUT_EXPORT std::optional<backend> backend_from_string(const std::string& name);

RAINOUT_EXPORT std::ostream& operator<<(std::ostream& os, backend b);

/**
 * @brief Fixed preference order of the platform this library was built for
 *
 * The first entry is tried first during automatic backend selection.
 */
RAINOUT_EXPORT const std::vector<backend>& platform_backend_preference();

} // namespace rainout

#endif // RAINOUT_BACKEND_HH
