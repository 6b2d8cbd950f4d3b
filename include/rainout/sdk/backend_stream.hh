/**
 * @file backend_stream.hh
 * @brief Contract between an open adapter stream and the stream engine
 * @ingroup backends
 */

#ifndef RAINOUT_SDK_BACKEND_STREAM_HH
#define RAINOUT_SDK_BACKEND_STREAM_HH

#include <rainout/device_id.hh>
#include <rainout/device_monitor.hh>
#include <rainout/midi_buffer.hh>
#include <rainout/stream_info.hh>
#include <rainout/sdk/audio_format.hh>
#include <rainout/sdk/types.hh>
#include <cstdint>
#include <optional>

namespace rainout {

/**
 * @struct native_audio_block
 * @brief Hardware side audio of one cycle in the device's own format
 *
 * Either @c data points to interleaved frames of @c channels samples, or
 * @c planes points to @c channels pointers to one plane each. A block with
 * zero channels is ignored.
 */
struct native_audio_block {
    audio_format format = audio_f32sys;
    channels_t channels = 0;
    bool interleaved = true;
    uint8* data = nullptr;
    uint8* const* planes = nullptr;
};

/**
 * @struct native_cycle
 * @brief One hardware period handed to stream_host::run_cycle
 *
 * The engine reads @c input and overwrites every channel of @c output.
 */
struct native_cycle {
    frames_t frames = 0;
    native_audio_block input;
    native_audio_block output;
};

enum class cycle_result {
    keep_running,
    /// the engine stopped or faulted; the adapter should stop calling run_cycle
    stop
};

/**
 * @class stream_host
 * @brief Engine services available to an adapter stream
 * @ingroup backends
 */
class stream_host {
public:
    virtual ~stream_host() = default;

    /**
     * @brief Processes one cycle; realtime thread of the adapter
     *
     * Never blocks, allocates or throws.
     */
    virtual cycle_result run_cycle(native_cycle& cycle) noexcept = 0;

    /**
     * @brief Frames the adapter should deliver per cycle from now on
     *
     * Changes only when a block size reconfiguration has been applied, so
     * split-stream adapters read it before sizing each cycle.
     */
    [[nodiscard]] virtual frames_t current_block_frames() const noexcept = 0;

    /**
     * @brief Queues an incoming MIDI message for the input port using @p endpoint
     *
     * One producer thread per endpoint. Events are delivered in the next
     * cycle with delta_frames clamped to that cycle.
     * @return false if the message was dropped
     */
    virtual bool push_midi_input(uint32_t endpoint, const midi_message& msg) noexcept = 0;

    /**
     * @brief Raw variant; oversized messages are dropped and reported
     */
    virtual bool push_midi_input(uint32_t endpoint, frames_t delta, const uint8* bytes, std::size_t size) noexcept = 0;

    /**
     * @brief Takes the next outgoing MIDI message of the output port using @p endpoint
     *
     * Messages become available when the cycle that produced them returns.
     */
    virtual bool pop_midi_output(uint32_t endpoint, midi_message& msg) noexcept = 0;

    /**
     * @brief Device added or removed; any non-realtime thread
     */
    virtual void device_presence_changed(const device_id& id, device_kind kind, bool present) = 0;

    /**
     * @brief Over- or underrun detected; any thread
     */
    virtual void report_xrun() noexcept = 0;

    /**
     * @brief Unrecoverable adapter failure; any thread. Faults the stream.
     */
    virtual void backend_failed(const char* reason) noexcept = 0;
};

/**
 * @struct stream_open_options
 */
struct stream_open_options {
    std::optional<std::string> application_name;
};

/**
 * @class backend_stream
 * @brief An opened device (or server connection) delivering cycles to a stream_host
 * @ingroup backends
 *
 * Lifecycle: created opened but idle by audio_backend::open_stream(), then
 * start(), stop(), close(). stop() and close() are idempotent and are
 * always called by the owner before destruction.
 */
class backend_stream {
public:
    virtual ~backend_stream() = default;

    /**
     * @brief Begin delivering cycles
     * @throws device_error
     */
    virtual void start() = 0;

    /**
     * @brief Stop delivering cycles; returns once no cycle is in flight
     */
    virtual void stop() = 0;

    /**
     * @brief Release the device
     */
    virtual void close() = 0;

    /**
     * @brief Prepare the native side for @p next before the engine swaps to it
     *
     * Called on the owner thread. Afterwards the adapter must deliver cycles
     * valid for both the current and the next session until the engine
     * reports the new block size through current_block_frames().
     * @throws device_error when the change cannot be applied; nothing changes then
     */
    virtual void prepare_change(const stream_info& next) = 0;

    [[nodiscard]] virtual bool can_change_audio_port_config() const = 0;
    [[nodiscard]] virtual bool can_change_block_size() const = 0;
    [[nodiscard]] virtual bool can_change_midi_ports() const = 0;

    /**
     * @brief Round trip latency in frames, when the native API reports it
     */
    [[nodiscard]] virtual std::optional<frames_t> latency() const { return std::nullopt; }
};

} // namespace rainout

#endif // RAINOUT_SDK_BACKEND_STREAM_HH
