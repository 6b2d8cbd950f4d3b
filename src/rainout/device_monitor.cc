#include <rainout/device_monitor.hh>
#include <failsafe/failsafe.hh>
#include <algorithm>

namespace rainout {

    namespace {
        stream_msg_type transition_type(device_kind kind, bool present) noexcept {
            if (kind == device_kind::audio) {
                return present ? stream_msg_type::audio_device_reconnected
                               : stream_msg_type::audio_device_disconnected;
            }
            return present ? stream_msg_type::midi_device_reconnected
                           : stream_msg_type::midi_device_disconnected;
        }
    }

    device_monitor::slot* device_monitor::track(const device_id& id, device_kind kind) {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto& s : m_slots) {
            if (s.kind == kind && s.id.matches(id)) {
                return &s;
            }
        }
        const auto index = static_cast<uint32_t>(m_slots.size());
        m_slots.emplace_back(id, kind, index);
        return &m_slots.back();
    }

    bool device_monitor::set_present(const device_id& id, device_kind kind, bool present) {
        std::lock_guard<std::mutex> lock(m_mutex);
        bool found = false;
        for (auto& s : m_slots) {
            if (s.kind == kind && s.id.matches(id)) {
                found = true;
                if (s.present.exchange(present, std::memory_order_acq_rel) != present) {
                    LOG_INFO("device_monitor", present ? "Device back" : "Device lost", s.id.name);
                    queue_transition(s.index, present);
                }
            }
        }
        if (!found) {
            LOG_DEBUG("device_monitor", "Ignoring presence change of unused device", id.name);
        }
        return found;
    }

    void device_monitor::queue_transition(uint32_t index, bool present) {
        auto same_slot = [index](const transition& t) { return t.index == index; };
        if (std::count_if(m_pending.begin(), m_pending.end(), same_slot) < 2) {
            m_pending.push_back({index, present});
            return;
        }
        // the new state equals the one before the last queued transition
        auto last = std::find_if(m_pending.rbegin(), m_pending.rend(), same_slot);
        m_pending.erase(std::next(last).base());
    }

    bool device_monitor::take_transition(stream_msg& msg) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_pending.empty()) {
            return false;
        }
        const auto t = m_pending.front();
        m_pending.pop_front();
        const auto& s = m_slots[t.index];
        msg = stream_msg{};
        msg.type = transition_type(s.kind, t.present);
        msg.device = s.id;
        return true;
    }

    bool device_monitor::has_transitions() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return !m_pending.empty();
    }

    void device_monitor::clear_transitions() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_pending.clear();
    }

    std::size_t device_monitor::size() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_slots.size();
    }

} // namespace rainout
