/**
 * @file types.hh
 * @brief Platform-independent type definitions
 * @ingroup sdk_types
 */

#ifndef RAINOUT_SDK_TYPES_HH
#define RAINOUT_SDK_TYPES_HH

#include <cstdint>
#include <cstddef>

namespace rainout {

/**
 * @defgroup sdk_types Type Definitions
 * @ingroup sdk
 * @brief Core type aliases shared by the core and the backend adapters
 * @{
 */

/**
 * @typedef sample_rate_t
 * @brief Number of sample frames per second (Hz)
 */
using sample_rate_t = uint32_t;

/**
 * @typedef frames_t
 * @brief Count of sample frames in a processing cycle or block
 *
 * One frame holds one sample for every channel of a stream.
 */
using frames_t = uint32_t;

/**
 * @typedef channels_t
 * @brief Number of native channels exposed by a device
 */
using channels_t = uint32_t;

using uint8 = uint8_t;
using int8 = int8_t;
using uint16 = uint16_t;
using int16 = int16_t;
using uint32 = uint32_t;
using int32 = int32_t;

/** @} */

} // namespace rainout

#endif // RAINOUT_SDK_TYPES_HH
