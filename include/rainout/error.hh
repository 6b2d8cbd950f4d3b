// This is copyrighted software. More information is at the end of this file.
#pragma once

#include <rainout/export_rainout.h>
#include <iosfwd>
#include <stdexcept>
#include <string>

namespace rainout {

/**
 * @brief Base exception class for all rainout errors
 */
class rainout_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Reasons a configuration could not be turned into a running stream
 */
enum class run_config_errc {
    backend_unavailable,   ///< backend not registered, not installed or not running
    device_not_found,      ///< explicit device is not reported by the backend
    port_not_found,        ///< explicit audio or MIDI port missing and degrading is disabled
    invalid_sample_rate,   ///< rate is not in the supported set of every resolved device
    invalid_block_size,    ///< outside the device range or not a power of two where required
    no_suitable_device,    ///< no device satisfies the stereo output requirement
    timeout,               ///< the adapter did not finish opening in time
    device_open_failed     ///< the adapter reported a failure while opening
};

RAINOUT_EXPORT const char* to_string(run_config_errc code);
RAINOUT_EXPORT std::ostream& operator<<(std::ostream& os, run_config_errc code);

/**
 * @brief Configuration resolution or stream open failure
 *
 * Thrown by run(), config_resolver and the hot reconfiguration calls of
 * stream_handle. Whenever this is thrown nothing was opened and nothing was
 * changed.
 */
class RAINOUT_EXPORT run_config_error : public rainout_error {
public:
    run_config_error(run_config_errc code, const std::string& detail);

    [[nodiscard]] run_config_errc code() const noexcept { return m_code; }

private:
    run_config_errc m_code;
};

/**
 * @brief Reasons a live reconfiguration request was refused
 */
enum class change_config_errc {
    not_supported,   ///< the backend cannot apply this kind of change while running
    busy             ///< too many changes are still waiting for a cycle boundary
};

RAINOUT_EXPORT const char* to_string(change_config_errc code);

class RAINOUT_EXPORT change_config_error : public rainout_error {
public:
    change_config_error(change_config_errc code, const std::string& detail);

    [[nodiscard]] change_config_errc code() const noexcept { return m_code; }

private:
    change_config_errc m_code;
};

/**
 * @brief Audio device related errors
 *
 * Thrown by backend adapters when a native call fails.
 */
class device_error : public rainout_error {
public:
    using rainout_error::rainout_error;
};

/**
 * @brief Native sample format cannot be converted
 */
class format_error : public rainout_error {
public:
    using rainout_error::rainout_error;
};

/**
 * @brief State related errors
 *
 * Thrown when a stream_handle is used after the stream faulted or was
 * closed.
 */
class state_error : public rainout_error {
public:
    using rainout_error::rainout_error;
};

} // namespace rainout

/*
 * Copyright (C) 2025
 *
 * This file is part of rainout.
 *
 * rainout is free software: you can redistribute it and/or modify it under the
 * terms of the GNU Lesser General Public License as published by the Free
 * Software Foundation, either version 3 of the License, or (at your option) any
 * later version.
 *
 * rainout is distributed in the hope that it will be useful, but WITHOUT ANY
 * WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR
 * A PARTICULAR PURPOSE.  See the GNU Lesser General Public License for more
 * details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with rainout.  If not, see <http://www.gnu.org/licenses/>.
 */
