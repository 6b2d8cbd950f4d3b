#include "reconfig_controller.hh"
#include <rainout/backend_registry.hh>
#include <rainout/error.hh>
#include <rainout/sdk/backend_stream.hh>

namespace rainout {

    reconfig_controller::reconfig_controller(const backend_registry& registry, const run_options& options)
        : m_resolver(registry),
          m_options(options) {
    }

    stream_info reconfig_controller::plan(const stream_info& current,
                                          const stream_change& change,
                                          const backend_stream& audio_caps,
                                          const backend_stream& midi_caps) const {
        if (change.changes_audio_ports() && !audio_caps.can_change_audio_port_config()) {
            throw change_config_error(change_config_errc::not_supported,
                                      "audio ports cannot be changed while the stream runs");
        }
        if (change.changes_block_size() && !audio_caps.can_change_block_size()) {
            throw change_config_error(change_config_errc::not_supported,
                                      "block size cannot be changed while the stream runs");
        }
        if (change.changes_midi_ports()) {
            if (!current.midi) {
                throw change_config_error(change_config_errc::not_supported,
                                          "the stream was started without MIDI");
            }
            if (!midi_caps.can_change_midi_ports()) {
                throw change_config_error(change_config_errc::not_supported,
                                          "MIDI ports cannot be changed while the stream runs");
            }
        }

        stream_info next = current;
        if (change.empty()) {
            return next;
        }

        const auto devices = m_resolver.find_session_devices(current);

        if (change.audio_in_ports) {
            next.audio_in_ports = config_resolver::resolve_audio_ports(
                *change.audio_in_ports, devices.input ? &*devices.input : nullptr,
                true, m_options.auto_audio_inputs, false, m_options);
        }
        if (change.audio_out_ports) {
            next.audio_out_ports = config_resolver::resolve_audio_ports(
                *change.audio_out_ports, devices.output ? &*devices.output : nullptr,
                false, true, m_options.must_have_stereo_output, m_options);
        }
        if (change.block_size) {
            next.block_size = config_resolver::resolve_block_size(*change.block_size, devices, m_options);
        }
        if (change.changes_block_size() || change.changes_audio_ports()) {
            next.latency = config_resolver::estimate_latency(next.block_size, !next.audio_in_ports.empty());
        }

        if (change.changes_midi_ports()) {
            auto midi = current.as_config().midi;
            if (change.midi_in_ports) {
                midi->in_ports = *change.midi_in_ports;
            }
            if (change.midi_out_ports) {
                midi->out_ports = *change.midi_out_ports;
            }
            auto resolved = m_resolver.resolve_midi(midi, current.audio_backend, m_options);
            if (!resolved) {
                throw run_config_error(run_config_errc::backend_unavailable,
                                       "the stream's MIDI backend is no longer available");
            }
            next.midi = std::move(resolved);
        }
        return next;
    }

} // namespace rainout
