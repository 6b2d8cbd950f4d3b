/**
 * @file backend_registry.hh
 * @brief Registry of backend adapters in preference order
 * @ingroup backends
 */

#pragma once

#include <rainout/backend.hh>
#include <rainout/enumeration.hh>
#include <rainout/export_rainout.h>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace rainout {

    class audio_backend;

    /**
     * @class backend_registry
     * @brief Adapters sorted by priority, higher first
     * @ingroup backends
     *
     * The registry owns no enumeration results: every enumerate_* call asks
     * the adapter to rescan. Adapters are initialised lazily on first use;
     * one that fails to initialise reports backend_status::not_installed.
     *
     * @code
     * rainout::backend_registry::global().register_backend(rainout::create_sdl3_backend());
     * for (auto b : rainout::available_audio_backends()) {
     *     std::cout << b << "\n";
     * }
     * @endcode
     */
    class RAINOUT_EXPORT backend_registry {
    public:
        /**
         * @brief Registers @p adapter with its platform preference rank as priority
         *
         * An adapter already registered under the same id is replaced.
         */
        void register_backend(std::shared_ptr<audio_backend> adapter);

        void register_backend(std::shared_ptr<audio_backend> adapter, int priority);

        bool unregister_backend(backend id);

        /**
         * @brief Registered audio backends, most preferred first; performs no I/O
         */
        [[nodiscard]] std::vector<backend> available_audio_backends() const;

        /**
         * @brief Registered backends that provide MIDI, most preferred first
         */
        [[nodiscard]] std::vector<backend> available_midi_backends() const;

        [[nodiscard]] std::optional<audio_backend_options> enumerate_audio_backend(backend id) const;

        [[nodiscard]] std::optional<midi_backend_options> enumerate_midi_backend(backend id) const;

        /**
         * @brief First running backend with devices, else the first running one without devices
         */
        [[nodiscard]] std::optional<audio_backend_options> find_preferred_audio_backend() const;

        /**
         * @brief Initialised adapter for @p id, or nullptr
         */
        [[nodiscard]] std::shared_ptr<audio_backend> find(backend id) const;

        [[nodiscard]] std::size_t size() const;

        void clear();

        /**
         * @brief Priority derived from platform_backend_preference()
         */
        static int default_priority(backend id);

        /**
         * @brief Process wide registry, holding the null backend at the lowest priority
         */
        static backend_registry& global();

    private:
        struct backend_entry {
            std::shared_ptr<audio_backend> adapter;
            int priority;
        };

        std::vector<backend_entry> snapshot() const;
        static bool ensure_initialized(audio_backend& adapter);

        mutable std::mutex m_mutex;
        std::vector<backend_entry> m_backends;
    };

} // namespace rainout
