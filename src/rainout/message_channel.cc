#include <rainout/message_channel.hh>
#include <rainout/device_monitor.hh>
#include <algorithm>
#include <cstring>

namespace rainout {

    message_channel::message_channel(std::size_t capacity, device_monitor& devices)
        : m_ring(std::max<std::size_t>(capacity, 1)),
          m_devices(devices) {
    }

    bool message_channel::post(const rt_message& msg) noexcept {
        if (m_ring.try_push(msg)) {
            return true;
        }
        m_dropped.fetch_add(1, std::memory_order_relaxed);
        return false;
    }

    bool message_channel::post_terminal(stream_msg_type type, stream_error_code code, const char* detail) noexcept {
        int expected = terminal_empty;
        if (!m_terminal_state.compare_exchange_strong(expected, terminal_writing,
                                                      std::memory_order_acq_rel)) {
            return false;
        }
        m_terminal_type = type;
        m_terminal_code = code;
        if (detail) {
            std::strncpy(m_terminal_detail, detail, max_detail - 1);
            m_terminal_detail[max_detail - 1] = '\0';
        }
        m_terminal_state.store(terminal_ready, std::memory_order_release);
        return true;
    }

    std::optional<stream_msg> message_channel::pop() {
        if (m_terminal_state.load(std::memory_order_acquire) == terminal_consumed) {
            m_devices.clear_transitions();
            return std::nullopt;
        }

        stream_msg msg;
        if (m_devices.take_transition(msg)) {
            return msg;
        }

        rt_message rec;
        if (m_ring.try_pop(rec)) {
            msg.type = rec.type;
            msg.error = rec.error;
            msg.count = rec.count;
            return msg;
        }

        int expected = terminal_ready;
        if (m_terminal_state.compare_exchange_strong(expected, terminal_consumed,
                                                     std::memory_order_acq_rel)) {
            stream_msg msg;
            msg.type = m_terminal_type;
            msg.error = m_terminal_code;
            msg.detail = m_terminal_detail;
            return msg;
        }
        return std::nullopt;
    }

    bool message_channel::terminal_pending() const noexcept {
        return m_terminal_state.load(std::memory_order_acquire) == terminal_ready;
    }

    bool message_channel::terminated() const noexcept {
        return m_terminal_state.load(std::memory_order_acquire) != terminal_empty;
    }

    bool message_channel::is_empty() const {
        if (m_terminal_state.load(std::memory_order_acquire) == terminal_consumed) {
            return true;
        }
        return m_ring.empty() && !terminal_pending() && !m_devices.has_transitions();
    }

} // namespace rainout
