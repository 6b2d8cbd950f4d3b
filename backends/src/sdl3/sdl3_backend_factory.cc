/**
 * @file sdl3_backend_factory.cc
 * @brief SDL3 backend factory implementation
 * @ingroup sdl3_backend
 */

#include <rainout_backends/sdl3/sdl3_backend.hh>
#include "sdl3_backend_impl.hh"

namespace rainout {

std::shared_ptr<audio_backend> create_sdl3_backend() {
    return std::make_shared<sdl3_backend>();
}

} // namespace rainout
