/**
 * @file buffer.hh
 * @brief Fixed size container used for realtime audio and MIDI storage
 * @ingroup sdk
 */

#pragma once

#include <algorithm>
#include <cstring>
#include <memory>
#include <type_traits>
#include <stdexcept>

namespace rainout {
    /**
     * @class buffer
     * @brief Heap block of trivially copyable elements that never grows on its own
     * @tparam T Element type
     * @ingroup sdk
     *
     * Every buffer handed to a process_handler is a buffer<float> whose size()
     * is the capacity reserved when the stream layout was built. The number of
     * valid frames in a cycle is process_info::frames, which never exceeds
     * size().
     *
     * Only the constructor and reset() allocate; everything else is safe to
     * call from the realtime thread.
     *
     * @code
     * void process(rainout::process_info& info) override {
     *     auto& left = info.audio_outputs[0];
     *     for (rainout::frames_t i = 0; i < info.frames; ++i) {
     *         left[i] = next_sample();
     *     }
     * }
     * @endcode
     */
    template<typename T>
    class buffer final {
        static_assert(std::is_trivially_copyable_v<T>, "buffer<T> requires trivially copyable T");
    public:
        buffer()
            : m_size(0) {
        }

        /**
         * @brief Allocates @p size zero-initialised elements
         */
        explicit buffer(std::size_t size)
            : m_data(std::make_unique<T[]>(size)), m_size(size) {
            std::fill_n(m_data.get(), m_size, T{});
        }

        buffer(buffer&&) noexcept = default;
        buffer& operator=(buffer&&) noexcept = default;

        [[nodiscard]] std::size_t size() const noexcept {
            return m_size;
        }

        [[nodiscard]] bool empty() const noexcept {
            return m_size == 0;
        }

        T* data() noexcept { return m_data.get(); }
        const T* data() const noexcept { return m_data.get(); }

        /**
         * @throws std::out_of_range if pos >= size()
         */
        T& at(std::size_t pos) {
            if (pos >= m_size) throw std::out_of_range("buffer index out of range");
            return m_data[pos];
        }

        const T& at(std::size_t pos) const {
            if (pos >= m_size) throw std::out_of_range("buffer index out of range");
            return m_data[pos];
        }

        /**
         * @brief Discards the content and allocates @p new_size zeroed elements
         */
        void reset(std::size_t new_size) {
            m_data = std::make_unique<T[]>(new_size);
            m_size = new_size;
            std::fill_n(m_data.get(), m_size, T{});
        }

        /**
         * @brief Sets the first @p count elements (clamped to size()) to T{}
         */
        void clear(std::size_t count) noexcept {
            std::fill_n(m_data.get(), std::min(count, m_size), T{});
        }

        void clear() noexcept {
            clear(m_size);
        }

        /**
         * @brief Copies min(count, size(), other.size()) elements from @p other
         */
        void copy_from(const buffer& other, std::size_t count) noexcept {
            const auto n = std::min({count, m_size, other.m_size});
            if (n > 0) {
                std::memcpy(m_data.get(), other.m_data.get(), sizeof(T) * n);
            }
        }

        void swap(buffer& other) noexcept {
            m_data.swap(other.m_data);
            std::swap(m_size, other.m_size);
        }

        T& operator[](std::size_t pos) noexcept { return m_data[pos]; }
        const T& operator[](std::size_t pos) const noexcept { return m_data[pos]; }

        T* begin() noexcept { return data(); }
        T* end() noexcept { return data() + size(); }
        const T* begin() const noexcept { return data(); }
        const T* end() const noexcept { return data() + size(); }

    private:
        std::unique_ptr<T[]> m_data;
        std::size_t m_size;
    };
}
