/**
 * @file null_backend.hh
 * @brief Simulated backend driven by its own clock thread
 * @ingroup backends
 */

#ifndef RAINOUT_BACKENDS_NULL_NULL_BACKEND_HH
#define RAINOUT_BACKENDS_NULL_NULL_BACKEND_HH

#include <rainout/enumeration.hh>
#include <rainout/midi_buffer.hh>
#include <rainout/sdk/audio_backend.hh>
#include <rainout/sdk/audio_format.hh>
#include <rainout/export_rainout.h>
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace rainout {

/**
 * @struct null_backend_config
 * @brief What the null backend pretends to have
 */
struct null_backend_config {
    backend id = backend::dummy;
    std::string version = "1.0";
    backend_status status = backend_status::running;
    device_options_kind device_options = device_options_kind::single_device;

    std::vector<audio_device_info> devices;
    std::optional<std::size_t> default_device;
    std::vector<audio_device_info> in_devices;
    std::vector<audio_device_info> out_devices;
    std::optional<std::size_t> default_in_device;
    std::optional<std::size_t> default_out_device;

    std::vector<midi_port_info> midi_in_ports;
    std::vector<midi_port_info> midi_out_ports;

    /// sample format of the simulated hardware buffers
    audio_format native_format = audio_f32sys;
    /// constant value fed into every input channel
    float input_level = 0.0f;
    /// sleep between cycles to follow the sample clock; otherwise cycles run back to back
    bool realtime_pacing = true;

    bool can_change_audio_ports = true;
    bool can_change_block_size = true;
    bool can_change_midi_ports = true;
};

/**
 * @brief One stereo duplex device at 44.1/48/96 kHz plus one MIDI port each way
 */
RAINOUT_EXPORT null_backend_config default_null_backend_config();

/**
 * @class null_backend
 * @brief Adapter without hardware, for headless runs and tests
 * @ingroup backends
 *
 * Each opened stream runs a thread that plays the role of the device
 * clock: it calls stream_host::run_cycle with interleaved buffers in
 * null_backend_config::native_format, sized by current_block_frames().
 *
 * The simulation controls below are safe to call from any thread except
 * the realtime one.
 */
class RAINOUT_EXPORT null_backend : public audio_backend {
public:
    explicit null_backend(null_backend_config config);
    ~null_backend() override;

    void init() override;
    void shutdown() override;
    [[nodiscard]] bool is_initialized() const override;
    [[nodiscard]] backend id() const override;
    [[nodiscard]] std::optional<std::string> version() const override;
    audio_backend_options enumerate_audio() override;
    [[nodiscard]] bool supports_midi() const override;
    midi_backend_options enumerate_midi() override;

    std::unique_ptr<backend_stream> open_stream(const stream_info& session,
                                                stream_host& host,
                                                const stream_open_options& options) override;

    std::unique_ptr<backend_stream> open_midi_stream(const stream_info& session,
                                                     stream_host& host,
                                                     const stream_open_options& options) override;

    // ---- simulation controls ----

    void set_status(backend_status status);

    /**
     * @brief Removes a device from enumeration, or brings it back, and tells open streams
     */
    void set_device_present(const device_id& id, bool present);

    void set_midi_device_present(const device_id& id, bool present);

    /**
     * @brief Delivers @p msg to every open stream that uses the given input port
     * @return number of streams that accepted it
     */
    std::size_t send_midi(const device_id& device, uint32_t port_index, const midi_message& msg);

    /**
     * @brief Reports an xrun to every open stream
     */
    void simulate_xrun();

    /**
     * @brief Makes every open stream fail as if the device vanished for good
     */
    void fail_streams(const char* reason);

    [[nodiscard]] std::size_t open_stream_count() const;

    /// cycles delivered by all streams since creation
    [[nodiscard]] uint64_t delivered_cycles() const noexcept;

    /// outgoing MIDI messages taken from the engine
    [[nodiscard]] uint64_t midi_messages_sent() const noexcept;

    /// largest absolute sample written to the first output channel by the last cycle
    [[nodiscard]] float last_output_peak() const noexcept;

    /// option value last passed to open_stream
    [[nodiscard]] std::optional<std::string> last_application_name() const;

    struct stats {
        std::atomic<uint64_t> cycles{0};
        std::atomic<uint64_t> midi_sent{0};
        std::atomic<float> output_peak{0.0f};
    };

    class stream;

private:
    void register_stream(stream* s);
    void unregister_stream(stream* s);
    std::vector<audio_device_info> present(const std::vector<audio_device_info>& list) const;

    null_backend_config m_config;
    bool m_initialized = false;
    stats m_stats;

    mutable std::mutex m_mutex;
    std::vector<device_id> m_absent;
    std::vector<device_id> m_absent_midi;
    std::vector<stream*> m_streams;
    std::optional<std::string> m_application_name;
};

RAINOUT_EXPORT std::shared_ptr<audio_backend> create_null_backend();

RAINOUT_EXPORT std::shared_ptr<null_backend> create_null_backend(null_backend_config config);

} // namespace rainout

#endif // RAINOUT_BACKENDS_NULL_NULL_BACKEND_HH
