/**
 * @file device_monitor.hh
 * @brief Presence tracking of the devices backing a stream
 * @ingroup devices
 */

#ifndef RAINOUT_DEVICE_MONITOR_HH
#define RAINOUT_DEVICE_MONITOR_HH

#include <rainout/device_id.hh>
#include <rainout/stream_message.hh>
#include <rainout/export_rainout.h>
#include <atomic>
#include <cstdint>
#include <deque>
#include <iterator>
#include <mutex>
#include <utility>

namespace rainout {

enum class device_kind : uint8_t {
    audio,
    midi
};

/**
 * @class device_monitor
 * @brief Two state (present / lost) machine per device of a stream
 * @ingroup devices
 *
 * Slots are created on the owner thread whenever a session starts using a
 * device and live as long as the monitor, so slot pointers stay valid while
 * the realtime thread holds them.
 *
 * Adapters call set_present() from their notification thread. The realtime
 * thread only reads the present flag to substitute silence. Every actual
 * change of state is queued here and handed to the owner by
 * take_transition(), so a device lost and regained while no cycle runs is
 * still reported as one disconnected and one reconnected message.
 * Repeating the same state is a no-op.
 *
 * At most two transitions are queued per device. A third one cancels the
 * last queued transition instead: lost, back, lost again leaves a single
 * pending disconnected message, matching the state the owner ends up in.
 */
class RAINOUT_EXPORT device_monitor {
public:
    struct slot {
        slot(device_id id_, device_kind kind_, uint32_t index_)
            : id(std::move(id_)), kind(kind_), index(index_) {
        }

        const device_id id;
        const device_kind kind;
        const uint32_t index;
        std::atomic<bool> present{true};
    };

    device_monitor() = default;
    device_monitor(const device_monitor&) = delete;
    device_monitor& operator=(const device_monitor&) = delete;

    /**
     * @brief Returns the slot for @p id, creating it on first use
     */
    slot* track(const device_id& id, device_kind kind);

    /**
     * @brief Records a presence change reported by the adapter
     * @return false if the device is not used by this stream
     */
    bool set_present(const device_id& id, device_kind kind, bool present);

    [[nodiscard]] std::size_t size() const;

    /**
     * @brief Owner side: takes the oldest queued transition
     * @return false when no transition is pending
     */
    bool take_transition(stream_msg& msg);

    [[nodiscard]] bool has_transitions() const;

    /**
     * @brief Drops every queued transition
     */
    void clear_transitions();

private:
    struct transition {
        uint32_t index;
        bool present;
    };

    void queue_transition(uint32_t index, bool present);

    mutable std::mutex m_mutex;
    std::deque<slot> m_slots;
    std::deque<transition> m_pending;
};

} // namespace rainout

#endif // RAINOUT_DEVICE_MONITOR_HH
