/**
 * @file midi_buffer.hh
 * @brief Per-cycle ordered MIDI event storage
 * @ingroup midi
 */

#ifndef RAINOUT_MIDI_BUFFER_HH
#define RAINOUT_MIDI_BUFFER_HH

#include <rainout/sdk/buffer.hh>
#include <rainout/sdk/types.hh>
#include <rainout/export_rainout.h>
#include <cstddef>
#include <cstdint>

namespace rainout {

/**
 * @brief Largest raw MIDI message a buffer stores; SysEx longer than this is rejected
 */
inline constexpr std::size_t max_midi_message_size = 8;

/**
 * @struct midi_message
 * @brief A raw MIDI message timestamped relative to the start of the cycle
 */
struct midi_message {
    frames_t delta_frames = 0;
    uint8_t data[max_midi_message_size] = {};
    uint8_t length = 0;

    [[nodiscard]] const uint8_t* begin() const noexcept { return data; }
    [[nodiscard]] const uint8_t* end() const noexcept { return data + length; }

    /**
     * @brief Builds a message from raw bytes; returns false if @p size is too large
     */
    RAINOUT_EXPORT static bool make(frames_t delta, const uint8_t* bytes, std::size_t size, midi_message& out) noexcept;
};

enum class midi_push_result {
    ok,
    buffer_full,
    event_too_long
};

/**
 * @class midi_buffer
 * @brief Fixed capacity list of MIDI events for one port and one cycle
 * @ingroup midi
 *
 * The engine clears every input buffer before filling it and every output
 * buffer before calling process(). Events stay in push order; producers are
 * expected to push them in ascending delta_frames.
 */
class RAINOUT_EXPORT midi_buffer {
public:
    midi_buffer() = default;
    explicit midi_buffer(std::size_t capacity);

    /**
     * @return false if the buffer is full
     */
    bool push(const midi_message& msg) noexcept;

    midi_push_result push_raw(frames_t delta_frames, const uint8_t* bytes, std::size_t size) noexcept;

    /**
     * @brief Appends as many events of @p other as fit
     * @return number of events that did not fit
     */
    std::size_t extend(const midi_buffer& other) noexcept;

    /**
     * @brief Replaces the content with the events of @p other
     * @return number of events that did not fit
     */
    std::size_t clear_and_copy_from(const midi_buffer& other) noexcept;

    void clear() noexcept { m_size = 0; }

    [[nodiscard]] std::size_t size() const noexcept { return m_size; }
    [[nodiscard]] bool empty() const noexcept { return m_size == 0; }
    [[nodiscard]] std::size_t capacity() const noexcept { return m_events.size(); }

    const midi_message& operator[](std::size_t i) const noexcept { return m_events[i]; }

    const midi_message* begin() const noexcept { return m_events.data(); }
    const midi_message* end() const noexcept { return m_events.data() + m_size; }

private:
    buffer<midi_message> m_events;
    std::size_t m_size = 0;
};

} // namespace rainout

#endif // RAINOUT_MIDI_BUFFER_HH
