/**
 * @file stream_message.hh
 * @brief Asynchronous notifications emitted by a running stream
 * @ingroup core
 */

#ifndef RAINOUT_STREAM_MESSAGE_HH
#define RAINOUT_STREAM_MESSAGE_HH

#include <rainout/device_id.hh>
#include <rainout/export_rainout.h>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <type_traits>

namespace rainout {

enum class stream_msg_type : uint8_t {
    audio_device_disconnected,
    audio_device_reconnected,
    midi_device_disconnected,
    midi_device_reconnected,
    nonfatal_error,
    /// terminal: the stream faulted and no longer processes
    fatal_error,
    /// terminal: the stream was closed
    closed
};

/**
 * @brief Runtime conditions reported through the message channel
 */
enum class stream_error_code : uint8_t {
    none,
    // nonfatal
    midi_buffer_overflow,   ///< MIDI input events dropped; count holds how many
    midi_event_too_long,    ///< an incoming message exceeded max_midi_message_size
    xrun,                   ///< the adapter reported an over- or underrun
    buffer_size_mismatch,   ///< a cycle was longer than the session block size
    // fatal
    process_fault,          ///< an exception escaped process_handler::process
    backend_failure         ///< the adapter lost the device or the server
};

RAINOUT_EXPORT bool is_fatal(stream_error_code code) noexcept;
RAINOUT_EXPORT bool is_terminal(stream_msg_type type) noexcept;
RAINOUT_EXPORT const char* to_string(stream_msg_type type);
RAINOUT_EXPORT const char* to_string(stream_error_code code);

/**
 * @struct stream_msg
 * @brief One notification as seen by the owner of the stream_handle
 */
struct stream_msg {
    stream_msg_type type = stream_msg_type::nonfatal_error;
    /// set for the four device messages
    std::optional<device_id> device;
    stream_error_code error = stream_error_code::none;
    /// event count for midi_buffer_overflow, frame count for buffer_size_mismatch
    uint64_t count = 0;
    /// human readable detail of fatal errors
    std::string detail;
};

RAINOUT_EXPORT std::ostream& operator<<(std::ostream& os, const stream_msg& msg);

/**
 * @struct rt_message
 * @brief Realtime safe record travelling through the notification ring
 */
struct rt_message {
    stream_msg_type type = stream_msg_type::nonfatal_error;
    stream_error_code error = stream_error_code::none;
    uint64_t count = 0;
};

static_assert(std::is_trivially_copyable_v<rt_message>, "rt_message must be trivially copyable");

} // namespace rainout

#endif // RAINOUT_STREAM_MESSAGE_HH
