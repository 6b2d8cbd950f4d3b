/**
 * @file config_resolver.hh
 * @brief Turns a rainout_config into a concrete stream_info
 * @ingroup config
 */

#ifndef RAINOUT_CONFIG_RESOLVER_HH
#define RAINOUT_CONFIG_RESOLVER_HH

#include <rainout/configuration.hh>
#include <rainout/stream_info.hh>
#include <rainout/export_rainout.h>
#include <optional>
#include <string>
#include <vector>

namespace rainout {

class backend_registry;

/**
 * @class config_resolver
 * @brief Resolves automatic choices and validates explicit ones against a live enumeration
 * @ingroup config
 *
 * Resolution is a pure function of the configuration, the options and what
 * the backends report at the time of the call. It opens nothing. Resolving
 * the result of stream_info::as_config() yields the same stream_info.
 *
 * Failures are reported by throwing run_config_error.
 */
class RAINOUT_EXPORT config_resolver {
public:
    /**
     * @brief The devices a session runs on, as currently enumerated
     */
    struct session_devices {
        audio_backend_options backend_options;
        std::optional<audio_device_info> input;
        std::optional<audio_device_info> output;
        bool linked = false;

        /// device whose rates and block sizes lead: the output, else the input
        [[nodiscard]] const audio_device_info* primary() const {
            if (output) {
                return &*output;
            }
            return input ? &*input : nullptr;
        }
    };

    explicit config_resolver(const backend_registry& registry);

    /**
     * @throws run_config_error
     */
    [[nodiscard]] stream_info resolve(const rainout_config& config, const run_options& options) const;

    /**
     * @brief Enumerates the session's backend again and finds its devices
     * @throws run_config_error backend_unavailable or device_not_found
     */
    [[nodiscard]] session_devices find_session_devices(const stream_info& session) const;

    /**
     * @brief Resolves a block size request against the devices of a session
     * @throws run_config_error invalid_block_size
     */
    [[nodiscard]] static stream_block_size resolve_block_size(const auto_option<frames_t>& requested,
                                                              const session_devices& devices,
                                                              const run_options& options);

    /**
     * @brief Resolves a port request against the ports of @p device (may be null)
     *
     * @param include_auto whether an automatic request selects the device defaults at all
     * @param prefer_stereo widen automatic selections to two ports
     * @throws run_config_error port_not_found
     */
    [[nodiscard]] static std::vector<stream_audio_port_info> resolve_audio_ports(
        const auto_option<std::vector<audio_port_ref>>& requested,
        const audio_device_info* device,
        bool is_input,
        bool include_auto,
        bool prefer_stereo,
        const run_options& options);

    /**
     * @brief Resolves the MIDI part of a configuration
     * @return nullopt when the configuration has no MIDI part or no MIDI backend runs
     * @throws run_config_error backend_unavailable or port_not_found
     */
    [[nodiscard]] std::optional<midi_stream_info> resolve_midi(const std::optional<midi_config>& config,
                                                               backend audio_backend,
                                                               const run_options& options) const;

    /**
     * @brief Latency estimate in frames derived from the block size
     */
    [[nodiscard]] static frames_t estimate_latency(const stream_block_size& block_size, bool has_input);

private:
    audio_backend_options select_backend(const auto_option<backend>& requested) const;

    const backend_registry& m_registry;
};

/**
 * @struct sample_rate_and_latency
 */
struct sample_rate_and_latency {
    sample_rate_t sample_rate = 0;
    std::optional<frames_t> latency;
};

/**
 * @brief Resolves @p config against the global registry without opening anything
 * @throws run_config_error
 */
RAINOUT_EXPORT sample_rate_and_latency estimated_sample_rate_and_latency(const rainout_config& config,
                                                                         const run_options& options = {});

} // namespace rainout

#endif // RAINOUT_CONFIG_RESOLVER_HH
