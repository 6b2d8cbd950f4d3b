#pragma once

#include <rainout/midi_buffer.hh>
#include <rainout/sdk/spsc_queue.hh>
#include <atomic>
#include <cstdint>
#include <memory>
#include <vector>

namespace rainout {

    /**
     * Fixed table of MIDI event queues addressed by endpoint number.
     *
     * Queues are created on the owner thread and published with a release
     * store; once published a queue lives as long as the table. Lookups are
     * wait-free and may happen on any thread.
     */
    class midi_endpoints {
    public:
        using queue_t = spsc_queue<midi_message>;

        midi_endpoints(std::size_t max_endpoints, std::size_t queue_capacity)
            : m_slots(std::make_unique<std::atomic<queue_t*>[]>(max_endpoints)),
              m_max(max_endpoints),
              m_queue_capacity(queue_capacity) {
            for (std::size_t i = 0; i < m_max; i++) {
                m_slots[i].store(nullptr, std::memory_order_relaxed);
            }
        }

        /**
         * Owner thread. Returns nullptr when @p endpoint is beyond the table.
         */
        queue_t* ensure(uint32_t endpoint) {
            if (endpoint >= m_max) {
                return nullptr;
            }
            auto* q = m_slots[endpoint].load(std::memory_order_acquire);
            if (!q) {
                m_owned.push_back(std::make_unique<queue_t>(m_queue_capacity));
                q = m_owned.back().get();
                m_slots[endpoint].store(q, std::memory_order_release);
            }
            return q;
        }

        queue_t* get(uint32_t endpoint) const noexcept {
            if (endpoint >= m_max) {
                return nullptr;
            }
            return m_slots[endpoint].load(std::memory_order_acquire);
        }

        [[nodiscard]] std::size_t max_endpoints() const noexcept { return m_max; }

    private:
        std::unique_ptr<std::atomic<queue_t*>[]> m_slots;
        std::vector<std::unique_ptr<queue_t>> m_owned;
        std::size_t m_max;
        std::size_t m_queue_capacity;
    };

} // namespace rainout
