#include <rainout/midi_buffer.hh>
#include <algorithm>
#include <cstring>

namespace rainout {

    bool midi_message::make(frames_t delta, const uint8_t* bytes, std::size_t size, midi_message& out) noexcept {
        if (size > max_midi_message_size) {
            return false;
        }
        out.delta_frames = delta;
        out.length = static_cast<uint8_t>(size);
        if (size > 0) {
            std::memcpy(out.data, bytes, size);
        }
        return true;
    }

    midi_buffer::midi_buffer(std::size_t capacity)
        : m_events(capacity) {
    }

    bool midi_buffer::push(const midi_message& msg) noexcept {
        if (m_size >= m_events.size()) {
            return false;
        }
        m_events[m_size++] = msg;
        return true;
    }

    midi_push_result midi_buffer::push_raw(frames_t delta_frames, const uint8_t* bytes, std::size_t size) noexcept {
        midi_message msg;
        if (!midi_message::make(delta_frames, bytes, size, msg)) {
            return midi_push_result::event_too_long;
        }
        return push(msg) ? midi_push_result::ok : midi_push_result::buffer_full;
    }

    std::size_t midi_buffer::extend(const midi_buffer& other) noexcept {
        const auto room = m_events.size() - m_size;
        const auto n = std::min(room, other.m_size);
        std::copy_n(other.m_events.data(), n, m_events.data() + m_size);
        m_size += n;
        return other.m_size - n;
    }

    std::size_t midi_buffer::clear_and_copy_from(const midi_buffer& other) noexcept {
        clear();
        return extend(other);
    }

} // namespace rainout
