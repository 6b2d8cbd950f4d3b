#include <rainout/stream_message.hh>
#include <ostream>

namespace rainout {

    bool is_fatal(stream_error_code code) noexcept {
        return code == stream_error_code::process_fault || code == stream_error_code::backend_failure;
    }

    bool is_terminal(stream_msg_type type) noexcept {
        return type == stream_msg_type::fatal_error || type == stream_msg_type::closed;
    }

    const char* to_string(stream_msg_type type) {
        switch (type) {
            case stream_msg_type::audio_device_disconnected: return "audio device disconnected";
            case stream_msg_type::audio_device_reconnected: return "audio device reconnected";
            case stream_msg_type::midi_device_disconnected: return "MIDI device disconnected";
            case stream_msg_type::midi_device_reconnected: return "MIDI device reconnected";
            case stream_msg_type::nonfatal_error: return "nonfatal error";
            case stream_msg_type::fatal_error: return "fatal error";
            case stream_msg_type::closed: return "closed";
        }
        return "unknown";
    }

    const char* to_string(stream_error_code code) {
        switch (code) {
            case stream_error_code::none: return "none";
            case stream_error_code::midi_buffer_overflow: return "MIDI buffer overflow";
            case stream_error_code::midi_event_too_long: return "MIDI event too long";
            case stream_error_code::xrun: return "xrun";
            case stream_error_code::buffer_size_mismatch: return "buffer size mismatch";
            case stream_error_code::process_fault: return "process fault";
            case stream_error_code::backend_failure: return "backend failure";
        }
        return "unknown";
    }

    std::ostream& operator<<(std::ostream& os, const stream_msg& msg) {
        os << to_string(msg.type);
        if (msg.device) {
            os << " " << *msg.device;
        }
        if (msg.error != stream_error_code::none) {
            os << " [" << to_string(msg.error);
            if (msg.count > 0) {
                os << " x" << msg.count;
            }
            os << "]";
        }
        if (!msg.detail.empty()) {
            os << ": " << msg.detail;
        }
        return os;
    }

} // namespace rainout
