/**
 * @file spsc_queue.hh
 * @brief Bounded wait-free single producer / single consumer ring
 * @ingroup sdk
 */

#ifndef RAINOUT_SDK_SPSC_QUEUE_HH
#define RAINOUT_SDK_SPSC_QUEUE_HH

#include <rainout/sdk/buffer.hh>
#include <atomic>
#include <cstddef>

namespace rainout {

    /**
     * @class spsc_queue
     * @brief Fixed capacity ring connecting exactly one producer thread to one consumer thread
     * @ingroup sdk
     *
     * Storage is allocated once by the constructor. try_push() and try_pop()
     * never block, never allocate and never take a lock, so either end may
     * live on the realtime thread. A full queue rejects the element; the
     * caller decides whether that is a drop or an error.
     */
    template<typename T>
    class spsc_queue {
    public:
        explicit spsc_queue(std::size_t capacity)
            : m_slots(capacity + 1) {
        }

        spsc_queue(const spsc_queue&) = delete;
        spsc_queue& operator=(const spsc_queue&) = delete;

        /**
         * @brief Producer side
         * @return false if the queue is full
         */
        bool try_push(const T& value) noexcept {
            const auto head = m_head.load(std::memory_order_relaxed);
            const auto next = advance(head);
            if (next == m_tail.load(std::memory_order_acquire)) {
                return false;
            }
            m_slots[head] = value;
            m_head.store(next, std::memory_order_release);
            return true;
        }

        /**
         * @brief Consumer side
         * @return false if the queue is empty
         */
        bool try_pop(T& out) noexcept {
            const auto tail = m_tail.load(std::memory_order_relaxed);
            if (tail == m_head.load(std::memory_order_acquire)) {
                return false;
            }
            out = m_slots[tail];
            m_tail.store(advance(tail), std::memory_order_release);
            return true;
        }

        /**
         * @brief Consumer side: drops everything currently queued
         * @return number of discarded elements
         */
        std::size_t discard_all() noexcept {
            std::size_t n = 0;
            T tmp;
            while (try_pop(tmp)) {
                ++n;
            }
            return n;
        }

        [[nodiscard]] bool empty() const noexcept {
            return m_tail.load(std::memory_order_acquire) == m_head.load(std::memory_order_acquire);
        }

        /**
         * @brief Approximate element count; exact only when both ends are idle
         */
        [[nodiscard]] std::size_t size() const noexcept {
            const auto head = m_head.load(std::memory_order_acquire);
            const auto tail = m_tail.load(std::memory_order_acquire);
            return head >= tail ? head - tail : head + m_slots.size() - tail;
        }

        [[nodiscard]] std::size_t capacity() const noexcept {
            return m_slots.size() - 1;
        }

    private:
        std::size_t advance(std::size_t index) const noexcept {
            return (index + 1) == m_slots.size() ? 0 : index + 1;
        }

        buffer<T> m_slots;
        alignas(64) std::atomic<std::size_t> m_head{0};
        alignas(64) std::atomic<std::size_t> m_tail{0};
    };

} // namespace rainout

#endif // RAINOUT_SDK_SPSC_QUEUE_HH
