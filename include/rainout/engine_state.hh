#ifndef RAINOUT_ENGINE_STATE_HH
#define RAINOUT_ENGINE_STATE_HH

#include <rainout/export_rainout.h>
#include <iosfwd>

namespace rainout {

/**
 * @brief Lifecycle of a stream
 *
 * created -> initializing -> running -> stopping -> stopped, with the side
 * path running -> faulted -> stopped once the faulted handle is closed.
 */
enum class engine_state : int {
    created,
    initializing,
    running,
    stopping,
    stopped,
    faulted
};

RAINOUT_EXPORT const char* to_string(engine_state s);
RAINOUT_EXPORT std::ostream& operator<<(std::ostream& os, engine_state s);

} // namespace rainout

#endif // RAINOUT_ENGINE_STATE_HH
