/**
 * @file stream_handle.hh
 * @brief Owner side of a running stream and the run() entry point
 * @ingroup core
 */

#ifndef RAINOUT_STREAM_HANDLE_HH
#define RAINOUT_STREAM_HANDLE_HH

#include <rainout/configuration.hh>
#include <rainout/engine_state.hh>
#include <rainout/message_channel.hh>
#include <rainout/process_handler.hh>
#include <rainout/stream_change.hh>
#include <rainout/stream_info.hh>
#include <rainout/export_rainout.h>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace rainout {

class backend_registry;

/**
 * @class stream_handle
 * @brief Keeps a stream alive; closing or destroying it stops the stream
 * @ingroup core
 *
 * The handle is owned by one thread. It is move-only; a moved-from handle
 * is empty and every call except is_open() throws state_error.
 *
 * Once the stream faulted (a fatal_error message is pending or was
 * delivered), configuration changes throw state_error and the handle should
 * be discarded. The stream is never restarted automatically.
 *
 * @code
 * auto handle = rainout::run(rainout::rainout_config{}, rainout::run_options{},
 *                            std::make_unique<my_synth>());
 * while (auto msg = handle.messages().pop()) {
 *     std::cout << *msg << "\n";
 * }
 * handle.close();
 * @endcode
 */
class RAINOUT_EXPORT stream_handle {
public:
    stream_handle(stream_handle&& other) noexcept;
    stream_handle& operator=(stream_handle&& other) noexcept;
    ~stream_handle();

    stream_handle(const stream_handle&) = delete;
    stream_handle& operator=(const stream_handle&) = delete;

    /**
     * @brief Session currently in effect, including accepted changes
     */
    [[nodiscard]] const stream_info& info() const;

    [[nodiscard]] engine_state state() const;

    /**
     * @brief Notifications of the stream
     *
     * Stays readable after close() so the terminal message can be taken.
     */
    message_channel& messages();

    [[nodiscard]] bool can_change_audio_port_config() const;
    [[nodiscard]] bool can_change_block_size() const;
    [[nodiscard]] bool can_change_midi_ports() const;

    /**
     * @brief Applies every field of @p change at one cycle boundary
     *
     * On return the change is accepted and process_handler::stream_changed
     * will be called exactly once, before the first cycle that uses it. On
     * any exception nothing changed.
     *
     * @throws state_error when the stream faulted or was closed
     * @throws change_config_error not_supported or busy
     * @throws run_config_error when a requested value does not resolve
     */
    void apply_changes(const stream_change& change);

    void change_audio_ports(const std::optional<auto_option<std::vector<audio_port_ref>>>& in_ports,
                            const std::optional<auto_option<std::vector<audio_port_ref>>>& out_ports);

    void change_block_size(const auto_option<frames_t>& block_size);

    void change_midi_ports(const std::optional<auto_option<std::vector<midi_port_config>>>& in_ports,
                           const std::optional<auto_option<std::vector<midi_port_config>>>& out_ports);

    /**
     * @brief Number of process() calls made so far
     */
    [[nodiscard]] uint64_t processed_cycles() const;

    /**
     * @brief Number of accepted changes the realtime thread has installed
     */
    [[nodiscard]] uint64_t applied_changes() const;

    /**
     * @brief Stops the stream and releases the device; idempotent
     *
     * Posts the terminal closed message unless a fatal error was posted
     * before.
     */
    void close();

    [[nodiscard]] bool is_open() const noexcept;

private:
    friend RAINOUT_EXPORT stream_handle run(const rainout_config&, const run_options&,
                                            std::unique_ptr<process_handler>, const backend_registry&);

    struct impl;
    explicit stream_handle(std::unique_ptr<impl> pimpl);

    impl& checked() const;

    std::unique_ptr<impl> m_pimpl;
};

/**
 * @brief Resolves @p config, opens the device and starts processing
 *
 * process_handler::init is called on the calling thread before the first
 * cycle. Nothing stays open when this throws.
 *
 * @throws run_config_error on resolution failures, timeout or device_open_failed
 */
RAINOUT_EXPORT stream_handle run(const rainout_config& config,
                                 const run_options& options,
                                 std::unique_ptr<process_handler> handler,
                                 const backend_registry& registry);

/**
 * @brief run() against backend_registry::global()
 */
RAINOUT_EXPORT stream_handle run(const rainout_config& config,
                                 const run_options& options,
                                 std::unique_ptr<process_handler> handler);

} // namespace rainout

#endif // RAINOUT_STREAM_HANDLE_HH
