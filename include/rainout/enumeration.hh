/**
 * @file enumeration.hh
 * @brief Snapshots describing backends, devices and MIDI ports
 * @ingroup devices
 */

#ifndef RAINOUT_ENUMERATION_HH
#define RAINOUT_ENUMERATION_HH

#include <rainout/backend.hh>
#include <rainout/device_id.hh>
#include <rainout/sdk/types.hh>
#include <rainout/export_rainout.h>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace rainout {

/**
 * @defgroup devices Device Enumeration
 * @brief Live queries of what the platform offers
 *
 * Every value in this header is an immutable snapshot: each enumeration call
 * rescans the backend and builds fresh objects, nothing is cached between
 * calls.
 * @{
 */

enum class backend_status {
    running,        ///< usable, at least one device present
    no_devices,     ///< usable, but no device is present
    not_installed,  ///< library or driver missing
    not_running     ///< installed but the server is not running
};

RAINOUT_EXPORT const char* to_string(backend_status s);

/**
 * @brief Speaker arrangement a device reports for its ports
 */
enum class channel_layout {
    unspecified,
    mono,
    multi_mono,
    stereo,
    multi_stereo,
    stereo_x2_speaker_headphone,
    other
};

RAINOUT_EXPORT const char* to_string(channel_layout l);

/**
 * @struct block_size_range
 * @brief Fixed block sizes a device accepts
 */
struct block_size_range {
    frames_t min_size = 0;
    frames_t max_size = 0;
    frames_t default_size = 0;
    bool power_of_two_only = false;

    [[nodiscard]] bool contains(frames_t size) const noexcept {
        if (size < min_size || size > max_size) {
            return false;
        }
        return !power_of_two_only || (size != 0 && (size & (size - 1)) == 0);
    }

    bool operator==(const block_size_range& o) const {
        return min_size == o.min_size && max_size == o.max_size &&
               default_size == o.default_size && power_of_two_only == o.power_of_two_only;
    }
};

/**
 * @struct audio_device_info
 * @brief Capabilities of one audio device
 *
 * For backends with separate input and output devices the unused side is
 * left empty.
 */
struct audio_device_info {
    device_id id;
    std::vector<std::string> in_ports;
    std::vector<std::string> out_ports;
    std::vector<sample_rate_t> sample_rates;
    /// 0 when the device does not report one; the first supported rate is used then
    sample_rate_t default_sample_rate = 0;
    /// absent when the device only supports variable ("unfixed") cycle lengths
    std::optional<block_size_range> block_sizes;
    std::vector<std::size_t> default_in_ports;
    std::vector<std::size_t> default_out_ports;
    channel_layout in_layout = channel_layout::unspecified;
    channel_layout out_layout = channel_layout::unspecified;
    bool can_take_exclusive_access = false;

    [[nodiscard]] RAINOUT_EXPORT bool supports_sample_rate(sample_rate_t rate) const;
    [[nodiscard]] RAINOUT_EXPORT bool has_stereo_output() const;
};

/**
 * @brief How a backend groups inputs and outputs into devices
 */
enum class device_options_kind {
    single_device,   ///< each device is full duplex
    linked_in_out,   ///< inputs and outputs are separate devices that may be paired
    system_wide      ///< one system device exposing every port (server backends)
};

/**
 * @struct audio_backend_options
 * @brief Result of enumerating one audio backend
 */
struct audio_backend_options {
    backend id = backend::dummy;
    std::optional<std::string> version;
    backend_status status = backend_status::not_installed;
    device_options_kind device_options = device_options_kind::single_device;

    /// single_device and system_wide backends
    std::vector<audio_device_info> devices;
    std::optional<std::size_t> default_device;

    /// linked_in_out backends
    std::vector<audio_device_info> in_devices;
    std::vector<audio_device_info> out_devices;
    std::optional<std::size_t> default_in_device;
    std::optional<std::size_t> default_out_device;

    [[nodiscard]] bool has_devices() const {
        return !devices.empty() || !in_devices.empty() || !out_devices.empty();
    }
};

enum class midi_control_scheme {
    midi1,
    midi2
};

/**
 * @struct midi_port_info
 * @brief One MIDI port of a MIDI device
 */
struct midi_port_info {
    device_id id;
    uint32_t port_index = 0;
    midi_control_scheme control_scheme = midi_control_scheme::midi1;
};

/**
 * @struct midi_backend_options
 * @brief Result of enumerating one MIDI backend
 */
struct midi_backend_options {
    backend id = backend::dummy;
    std::optional<std::string> version;
    backend_status status = backend_status::not_installed;
    std::vector<midi_port_info> in_ports;
    std::vector<midi_port_info> out_ports;
    std::optional<std::size_t> default_in_port;
    std::optional<std::size_t> default_out_port;
};

RAINOUT_EXPORT std::ostream& operator<<(std::ostream& os, const audio_device_info& info);

/**
 * @brief Audio backends of the global registry, most preferred first
 */
RAINOUT_EXPORT std::vector<backend> available_audio_backends();

/**
 * @brief MIDI capable backends of the global registry, most preferred first
 */
RAINOUT_EXPORT std::vector<backend> available_midi_backends();

/**
 * @brief Live scan of one audio backend; nullopt if it is not registered
 */
RAINOUT_EXPORT std::optional<audio_backend_options> enumerate_audio_backend(backend b);

/**
 * @brief Live scan of one MIDI backend; nullopt if it is not registered
 */
RAINOUT_EXPORT std::optional<midi_backend_options> enumerate_midi_backend(backend b);

/**
 * @brief First running backend with devices, else the first one without devices
 */
RAINOUT_EXPORT std::optional<audio_backend_options> find_preferred_audio_backend();

/** @} */

} // namespace rainout

#endif // RAINOUT_ENUMERATION_HH
