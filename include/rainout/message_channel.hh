/**
 * @file message_channel.hh
 * @brief Bounded realtime-to-owner notification path
 * @ingroup core
 */

#ifndef RAINOUT_MESSAGE_CHANNEL_HH
#define RAINOUT_MESSAGE_CHANNEL_HH

#include <rainout/stream_message.hh>
#include <rainout/sdk/spsc_queue.hh>
#include <rainout/export_rainout.h>
#include <atomic>
#include <cstddef>
#include <optional>

namespace rainout {

class device_monitor;

/**
 * @class message_channel
 * @brief Lock-free ring of status messages plus one slot for the terminal message
 * @ingroup core
 *
 * The realtime thread is the only producer of the ring. When the ring is
 * full a status message is dropped and counted; the producer never waits.
 *
 * Terminal messages (fatal_error, closed) never go through the ring. The
 * first one posted, from any thread, wins the terminal slot. The consumer
 * receives the terminal message after every message already in the ring,
 * so a stream cannot end without its owner being told.
 *
 * Device transitions are queued by the device_monitor on the owner side and
 * are delivered ahead of ring records. Nothing is delivered after the
 * terminal message.
 */
class RAINOUT_EXPORT message_channel {
public:
    message_channel(std::size_t capacity, device_monitor& devices);

    message_channel(const message_channel&) = delete;
    message_channel& operator=(const message_channel&) = delete;

    // ---- producer side ----

    /**
     * @brief Realtime thread only
     * @return false if the message was dropped
     */
    bool post(const rt_message& msg) noexcept;

    /**
     * @brief Claims the terminal slot; any thread
     * @return false if a terminal message was already posted
     */
    bool post_terminal(stream_msg_type type, stream_error_code code, const char* detail) noexcept;

    // ---- consumer side ----

    /**
     * @brief Next message, or nullopt when nothing is pending
     */
    std::optional<stream_msg> pop();

    /**
     * @brief Calls @p f for every pending message, at most @p max of them
     * @return number of messages delivered
     */
    template<typename F>
    std::size_t pop_each(F&& f, std::size_t max = static_cast<std::size_t>(-1)) {
        std::size_t n = 0;
        while (n < max) {
            auto msg = pop();
            if (!msg) {
                break;
            }
            f(*msg);
            ++n;
        }
        return n;
    }

    /**
     * @brief A terminal message was posted and not yet popped
     */
    [[nodiscard]] bool terminal_pending() const noexcept;

    /**
     * @brief A terminal message was posted (popped or not)
     */
    [[nodiscard]] bool terminated() const noexcept;

    [[nodiscard]] bool is_empty() const;

    [[nodiscard]] std::size_t capacity() const noexcept { return m_ring.capacity(); }

    /**
     * @brief Status messages lost to overflow since creation
     */
    [[nodiscard]] uint64_t dropped_count() const noexcept {
        return m_dropped.load(std::memory_order_relaxed);
    }

private:
    enum terminal_state : int {
        terminal_empty,
        terminal_writing,
        terminal_ready,
        terminal_consumed
    };

    static constexpr std::size_t max_detail = 256;

    spsc_queue<rt_message> m_ring;
    device_monitor& m_devices;
    std::atomic<uint64_t> m_dropped{0};

    std::atomic<int> m_terminal_state{terminal_empty};
    stream_msg_type m_terminal_type = stream_msg_type::closed;
    stream_error_code m_terminal_code = stream_error_code::none;
    char m_terminal_detail[max_detail] = {};
};

} // namespace rainout

#endif // RAINOUT_MESSAGE_CHANNEL_HH
