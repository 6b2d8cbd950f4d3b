/**
 * @file sdl3_backend.hh
 * @brief SDL3 audio backend factory
 * @ingroup backends
 */

#ifndef RAINOUT_BACKENDS_SDL3_BACKEND_HH
#define RAINOUT_BACKENDS_SDL3_BACKEND_HH

#include <memory>

// Include generated export header
#include "export_rainout_backend_sdl3.h"

namespace rainout {

/**
 * @defgroup sdl3_backend SDL3 Audio Backend
 * @ingroup backends
 * @brief Portable adapter on top of SDL3's audio streams
 *
 * SDL3 exposes playback and recording devices separately, so the adapter
 * reports device_options_kind::linked_in_out. SDL resamples and converts
 * channel counts itself, which is why every device accepts the common
 * sample rates. The callback length is chosen by SDL, so sessions are
 * always resolved with an unfixed block size.
 *
 * ## Device changes
 *
 * Removal and arrival are picked up with an SDL event watch. SDL only
 * dispatches events while the application pumps them (SDL_PumpEvents or
 * an event loop); without that the stream still runs but disconnects are
 * not reported.
 *
 * ## Configuration
 *
 * SDL3 backend respects environment variables:
 * - `SDL_AUDIO_DRIVER`: Force specific driver
 * - `SDL_AUDIO_DEVICE_SAMPLE_FRAMES`: Preferred callback size
 *
 * SDL3 has no MIDI support; combine it with a MIDI capable backend.
 *
 * @{
 */

class audio_backend;

/**
 * @brief Create an SDL3 audio backend instance
 *
 * The backend registry initialises it on first use.
 *
 * @code
 * #include <rainout_backends/sdl3/sdl3_backend.hh>
 * #include <rainout/backend_registry.hh>
 *
 * rainout::backend_registry::global().register_backend(rainout::create_sdl3_backend());
 * @endcode
 */
RAINOUT_BACKEND_SDL3_EXPORT std::shared_ptr<audio_backend> create_sdl3_backend();

/** @} */ // end of sdl3_backend group

} // namespace rainout

#endif // RAINOUT_BACKENDS_SDL3_BACKEND_HH
