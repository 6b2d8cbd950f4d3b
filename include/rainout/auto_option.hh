#ifndef RAINOUT_AUTO_OPTION_HH
#define RAINOUT_AUTO_OPTION_HH

#include <optional>
#include <utility>

namespace rainout {

    /**
     * @class auto_option
     * @brief A configuration value that is either given explicitly or left to the resolver
     *
     * Default constructed options are automatic. auto_option never reaches
     * the realtime path: the resolver replaces every one of them with a
     * concrete value in stream_info.
     *
     * @code
     * rainout::rainout_config cfg;
     * cfg.sample_rate = rainout::auto_option<rainout::sample_rate_t>::use(48000);
     * cfg.block_size = rainout::automatic;
     * @endcode
     */
    template<typename T>
    class auto_option {
    public:
        auto_option() = default;

        static auto_option use(T value) {
            auto_option o;
            o.m_value = std::move(value);
            return o;
        }

        static auto_option automatic() {
            return auto_option{};
        }

        [[nodiscard]] bool is_auto() const noexcept { return !m_value.has_value(); }
        [[nodiscard]] bool is_explicit() const noexcept { return m_value.has_value(); }

        /**
         * @throws std::bad_optional_access on an automatic option
         */
        const T& value() const { return m_value.value(); }
        T& value() { return m_value.value(); }

        [[nodiscard]] const std::optional<T>& as_optional() const noexcept { return m_value; }

        bool operator==(const auto_option& other) const { return m_value == other.m_value; }
        bool operator!=(const auto_option& other) const { return !(*this == other); }

    private:
        std::optional<T> m_value;
    };

    /**
     * @brief Tag convertible to any automatic auto_option
     */
    struct automatic_t {
        template<typename T>
        operator auto_option<T>() const { return auto_option<T>::automatic(); }
    };

    inline constexpr automatic_t automatic{};

} // namespace rainout

#endif // RAINOUT_AUTO_OPTION_HH
