/**
 * @file example_common.hh
 * @brief Common utilities for rainout examples
 *
 * Registers the hardware backends this build carries with the global
 * registry. The null backend is always present at the lowest priority.
 */

#ifndef RAINOUT_EXAMPLE_COMMON_HH
#define RAINOUT_EXAMPLE_COMMON_HH

#include <rainout/backend_registry.hh>
#include <rainout/message_channel.hh>
#include <iostream>

#ifdef RAINOUT_HAS_SDL3_BACKEND
#include <rainout_backends/sdl3/sdl3_backend.hh>
#endif

namespace rainout {
    namespace examples {
        /**
         * @brief Adds the compiled in backends to backend_registry::global()
         */
        inline void register_backends() {
#ifdef RAINOUT_HAS_SDL3_BACKEND
            backend_registry::global().register_backend(create_sdl3_backend());
#endif
        }

        /**
         * @brief Prints pending stream messages
         * @return false once the stream has reported its last message
         */
        inline bool print_messages(message_channel& channel) {
            bool alive = true;
            channel.pop_each([&alive](const stream_msg& msg) {
                std::cout << "  [stream] " << msg << '\n';
                if (is_terminal(msg.type)) {
                    alive = false;
                }
            });
            return alive;
        }
    } // namespace examples
} // namespace rainout

#endif // RAINOUT_EXAMPLE_COMMON_HH
