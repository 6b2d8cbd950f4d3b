/**
 * @file audio_backend.hh
 * @brief Platform backend adapter interface
 * @ingroup backends
 */

#ifndef RAINOUT_SDK_AUDIO_BACKEND_HH
#define RAINOUT_SDK_AUDIO_BACKEND_HH

#include <rainout/backend.hh>
#include <rainout/enumeration.hh>
#include <rainout/stream_info.hh>
#include <rainout/sdk/backend_stream.hh>
#include <rainout/export_rainout.h>
#include <memory>
#include <optional>
#include <string>

namespace rainout {

/**
 * @class audio_backend
 * @brief Abstract interface every platform adapter implements
 * @ingroup backends
 *
 * An adapter translates one native API (a duplex audio server or a pair of
 * split input/output streams) into the uniform model of rainout:
 *
 * - live enumeration of its devices and MIDI ports;
 * - opening a backend_stream for a resolved session;
 * - delivering cycles to the stream_host and forwarding device presence
 *   changes and failures.
 *
 * @code
 * class my_backend : public rainout::audio_backend {
 * public:
 *     rainout::backend id() const override { return rainout::backend::alsa; }
 *     rainout::audio_backend_options enumerate_audio() override {
 *         // query the platform every time
 *     }
 *     std::unique_ptr<rainout::backend_stream> open_stream(
 *         const rainout::stream_info& session, rainout::stream_host& host,
 *         const rainout::stream_open_options& opts) override {
 *         // open the devices; do not start delivering cycles yet
 *     }
 *     // ...
 * };
 * @endcode
 *
 * ## Thread Safety
 *
 * - init()/shutdown() are called from the owner thread
 * - enumeration may be called from any non-realtime thread
 */
class RAINOUT_EXPORT audio_backend {
public:
    virtual ~audio_backend() = default;

    /**
     * @throws device_error if the native library cannot be initialised
     */
    virtual void init() = 0;

    virtual void shutdown() = 0;

    [[nodiscard]] virtual bool is_initialized() const = 0;

    [[nodiscard]] virtual backend id() const = 0;

    [[nodiscard]] virtual std::string get_name() const { return to_string(id()); }

    [[nodiscard]] virtual std::optional<std::string> version() const { return std::nullopt; }

    /**
     * @brief Scans the platform; never cached
     */
    virtual audio_backend_options enumerate_audio() = 0;

    [[nodiscard]] virtual bool supports_midi() const { return false; }

    /**
     * @brief Scans MIDI ports; adapters without MIDI report not_installed
     */
    virtual midi_backend_options enumerate_midi();

    /**
     * @brief Opens the audio side (and the MIDI side when the session uses this backend for MIDI)
     * @throws device_error
     */
    virtual std::unique_ptr<backend_stream> open_stream(const stream_info& session,
                                                        stream_host& host,
                                                        const stream_open_options& options) = 0;

    /**
     * @brief Opens only the MIDI side, for sessions whose MIDI backend differs from the audio backend
     * @throws device_error
     */
    virtual std::unique_ptr<backend_stream> open_midi_stream(const stream_info& session,
                                                             stream_host& host,
                                                             const stream_open_options& options);
};

} // namespace rainout

#endif // RAINOUT_SDK_AUDIO_BACKEND_HH
