#include <rainout/config_resolver.hh>
#include <rainout/backend_registry.hh>
#include <rainout/error.hh>
#include <failsafe/failsafe.hh>
#include <algorithm>
#include <sstream>

namespace rainout {

namespace {
    template<typename T>
    std::string str(const T& v) {
        std::ostringstream os;
        os << v;
        return os.str();
    }

    const audio_device_info* find_device(const std::vector<audio_device_info>& list, const device_id& id) {
        for (const auto& d : list) {
            if (d.id.matches(id)) {
                return &d;
            }
        }
        return nullptr;
    }

    const audio_device_info* default_of(const std::vector<audio_device_info>& list,
                                        const std::optional<std::size_t>& index) {
        if (list.empty()) {
            return nullptr;
        }
        if (index && *index < list.size()) {
            return &list[*index];
        }
        return &list.front();
    }

    // Keeps @p candidate when it has a stereo output, otherwise returns the
    // first device of @p list that has one.
    const audio_device_info* ensure_stereo(const audio_device_info* candidate,
                                           const std::vector<audio_device_info>& list) {
        if (candidate && candidate->has_stereo_output()) {
            return candidate;
        }
        for (const auto& d : list) {
            if (d.has_stereo_output()) {
                if (candidate) {
                    LOG_WARN("config_resolver", "Device", candidate->id.name,
                             "has no stereo output, using", d.id.name, "instead");
                }
                return &d;
            }
        }
        throw run_config_error(run_config_errc::no_suitable_device,
                               "no device with at least two output ports is available");
    }

    bool wants_inputs(const rainout_config& config, const run_options& options) {
        if (config.audio_in_ports.is_auto()) {
            return options.auto_audio_inputs;
        }
        return !config.audio_in_ports.value().empty();
    }

    config_resolver::session_devices select_devices(audio_backend_options opts,
                                                     const rainout_config& config,
                                                     const run_options& options) {
        config_resolver::session_devices result;
        const auto& requested = config.audio_device;

        if (opts.device_options != device_options_kind::linked_in_out) {
            const audio_device_info* device = nullptr;
            if (requested.is_auto()) {
                device = default_of(opts.devices, opts.default_device);
                if (!device) {
                    throw run_config_error(run_config_errc::device_not_found,
                                           str(opts.id) + " reports no devices");
                }
            } else {
                const auto& sel = requested.value();
                std::optional<device_id> wanted;
                if (sel.type == audio_device_selection::kind::single) {
                    wanted = sel.device;
                } else if (sel.input && sel.output && !sel.input->matches(*sel.output)) {
                    throw run_config_error(run_config_errc::device_not_found,
                                           str(opts.id) + " does not support linked input/output devices");
                } else {
                    wanted = sel.output ? sel.output : sel.input;
                }
                if (!wanted) {
                    throw run_config_error(run_config_errc::device_not_found, "no device was selected");
                }
                device = find_device(opts.devices, *wanted);
                if (!device) {
                    throw run_config_error(run_config_errc::device_not_found, str(*wanted));
                }
            }
            if (options.must_have_stereo_output) {
                device = ensure_stereo(device, opts.devices);
            }
            result.input = *device;
            result.output = *device;
            result.linked = false;
        } else {
            const audio_device_info* in = nullptr;
            const audio_device_info* out = nullptr;
            if (requested.is_auto()) {
                out = default_of(opts.out_devices, opts.default_out_device);
                if (wants_inputs(config, options)) {
                    in = default_of(opts.in_devices, opts.default_in_device);
                }
            } else {
                const auto& sel = requested.value();
                if (sel.type == audio_device_selection::kind::single) {
                    // one device for both directions, wherever it has them
                    out = find_device(opts.out_devices, sel.device);
                    if (wants_inputs(config, options) || !out) {
                        in = find_device(opts.in_devices, sel.device);
                    }
                    if (!in && !out) {
                        throw run_config_error(run_config_errc::device_not_found, str(sel.device));
                    }
                    if (!in && config.audio_in_ports.is_explicit() && !config.audio_in_ports.value().empty()) {
                        throw run_config_error(run_config_errc::device_not_found,
                                               str(sel.device) + " has no inputs on " + str(opts.id));
                    }
                } else {
                    if (sel.output) {
                        out = find_device(opts.out_devices, *sel.output);
                        if (!out) {
                            throw run_config_error(run_config_errc::device_not_found, str(*sel.output));
                        }
                    }
                    if (sel.input) {
                        in = find_device(opts.in_devices, *sel.input);
                        if (!in) {
                            throw run_config_error(run_config_errc::device_not_found, str(*sel.input));
                        }
                    }
                }
            }
            if (options.must_have_stereo_output) {
                out = ensure_stereo(out, opts.out_devices);
            }
            if (!in && !out) {
                throw run_config_error(run_config_errc::device_not_found,
                                       str(opts.id) + " reports no usable devices");
            }
            if (in) {
                result.input = *in;
            }
            if (out) {
                result.output = *out;
            }
            result.linked = true;
        }
        result.backend_options = std::move(opts);
        return result;
    }

    std::vector<const audio_device_info*> unique_devices(const config_resolver::session_devices& devs) {
        std::vector<const audio_device_info*> list;
        if (devs.output) {
            list.push_back(&*devs.output);
        }
        if (devs.input && !(devs.output && devs.output->id.matches(devs.input->id))) {
            list.push_back(&*devs.input);
        }
        return list;
    }

    sample_rate_t resolve_sample_rate(const auto_option<sample_rate_t>& requested,
                                      const config_resolver::session_devices& devs) {
        const auto devices = unique_devices(devs);
        auto supported_by_all = [&devices](sample_rate_t rate) {
            return std::all_of(devices.begin(), devices.end(),
                               [rate](const audio_device_info* d) { return d->supports_sample_rate(rate); });
        };

        if (requested.is_explicit()) {
            const auto rate = requested.value();
            if (!supported_by_all(rate)) {
                throw run_config_error(run_config_errc::invalid_sample_rate,
                                       std::to_string(rate) + " Hz is not supported by the selected device");
            }
            return rate;
        }

        const auto* primary = devs.primary();
        if (primary->default_sample_rate != 0 && supported_by_all(primary->default_sample_rate)) {
            return primary->default_sample_rate;
        }
        for (auto rate : primary->sample_rates) {
            if (supported_by_all(rate)) {
                return rate;
            }
        }
        throw run_config_error(run_config_errc::invalid_sample_rate,
                               "the selected devices share no sample rate");
    }

    audio_port_ref as_ref(const stream_audio_port_info& port) {
        return port.success ? audio_port_ref::by_index(port.channel) : audio_port_ref::by_name(port.name);
    }
}

config_resolver::config_resolver(const backend_registry& registry)
    : m_registry(registry) {
}

audio_backend_options config_resolver::select_backend(const auto_option<backend>& requested) const {
    if (requested.is_explicit()) {
        const auto id = requested.value();
        auto opts = m_registry.enumerate_audio_backend(id);
        if (!opts) {
            throw run_config_error(run_config_errc::backend_unavailable,
                                   str(id) + " is not available on this system");
        }
        if (opts->status != backend_status::running) {
            throw run_config_error(run_config_errc::backend_unavailable,
                                   str(id) + " is " + to_string(opts->status));
        }
        return std::move(*opts);
    }
    auto opts = m_registry.find_preferred_audio_backend();
    if (!opts) {
        throw run_config_error(run_config_errc::backend_unavailable, "no audio backend is running");
    }
    return std::move(*opts);
}

stream_block_size config_resolver::resolve_block_size(const auto_option<frames_t>& requested,
                                                      const session_devices& devices,
                                                      const run_options& options) {
    const auto list = unique_devices(devices);
    const auto* primary = devices.primary();
    if (!primary) {
        throw run_config_error(run_config_errc::device_not_found, "session has no device");
    }

    auto accepted_by_all = [&list](frames_t size) {
        return std::all_of(list.begin(), list.end(), [size](const audio_device_info* d) {
            return !d->block_sizes || d->block_sizes->contains(size);
        });
    };

    if (!primary->block_sizes) {
        if (requested.is_explicit()) {
            if (requested.value() == 0) {
                throw run_config_error(run_config_errc::invalid_block_size, "block size must not be zero");
            }
            return stream_block_size::unfixed_with_max(requested.value());
        }
        return stream_block_size::unfixed_with_max(options.fallback_max_block_size);
    }

    const auto& range = *primary->block_sizes;
    if (requested.is_explicit()) {
        const auto size = requested.value();
        if (!accepted_by_all(size)) {
            std::string why = std::to_string(size) + " frames is outside " +
                              std::to_string(range.min_size) + ".." + std::to_string(range.max_size);
            if (range.power_of_two_only) {
                why += " or not a power of two";
            }
            throw run_config_error(run_config_errc::invalid_block_size, why);
        }
        return stream_block_size::fixed_size(size);
    }

    if (accepted_by_all(range.default_size)) {
        return stream_block_size::fixed_size(range.default_size);
    }
    for (const auto* d : list) {
        if (d->block_sizes && accepted_by_all(d->block_sizes->default_size)) {
            return stream_block_size::fixed_size(d->block_sizes->default_size);
        }
    }
    throw run_config_error(run_config_errc::invalid_block_size,
                           "the selected devices share no default block size");
}

std::vector<stream_audio_port_info> config_resolver::resolve_audio_ports(
    const auto_option<std::vector<audio_port_ref>>& requested,
    const audio_device_info* device,
    bool is_input,
    bool include_auto,
    bool prefer_stereo,
    const run_options& options) {

    std::vector<stream_audio_port_info> result;
    static const std::vector<std::string> no_ports;
    const auto& ports = device ? (is_input ? device->in_ports : device->out_ports) : no_ports;

    if (requested.is_auto()) {
        if (!include_auto || !device || ports.empty()) {
            return result;
        }
        std::vector<std::size_t> picked;
        for (auto idx : (is_input ? device->default_in_ports : device->default_out_ports)) {
            if (idx < ports.size()) {
                picked.push_back(idx);
            }
        }
        const std::size_t wanted = (!is_input || prefer_stereo) ? 2 : 1;
        if (picked.empty() || (prefer_stereo && picked.size() < 2)) {
            picked.clear();
            for (std::size_t i = 0; i < std::min(wanted, ports.size()); i++) {
                picked.push_back(i);
            }
        }
        for (auto idx : picked) {
            result.push_back({ports[idx], idx, true});
        }
        return result;
    }

    for (const auto& ref : requested.value()) {
        std::optional<std::size_t> found;
        if (ref.index) {
            if (*ref.index < ports.size()) {
                found = *ref.index;
            }
        } else {
            const auto it = std::find(ports.begin(), ports.end(), ref.name);
            if (it != ports.end()) {
                found = static_cast<std::size_t>(it - ports.begin());
            }
        }
        if (found) {
            result.push_back({ports[*found], *found, true});
            continue;
        }

        const auto label = ref.index ? "port " + std::to_string(*ref.index) : ref.name;
        if (!options.empty_buffers_for_failed_ports) {
            throw run_config_error(run_config_errc::port_not_found,
                                   std::string(is_input ? "input " : "output ") + label);
        }
        LOG_WARN("config_resolver", is_input ? "Input" : "Output", "port", label,
                 "not found, using a silent buffer");
        result.push_back({label, 0, false});
    }
    return result;
}

std::optional<midi_stream_info> config_resolver::resolve_midi(const std::optional<midi_config>& config,
                                                              backend audio_backend,
                                                              const run_options& options) const {
    if (!config) {
        return std::nullopt;
    }

    std::optional<midi_backend_options> opts;
    if (config->midi_backend.is_explicit()) {
        const auto id = config->midi_backend.value();
        opts = m_registry.enumerate_midi_backend(id);
        if (!opts || opts->status != backend_status::running) {
            throw run_config_error(run_config_errc::backend_unavailable,
                                   str(id) + " MIDI is not running");
        }
    } else {
        auto candidates = m_registry.available_midi_backends();
        // MIDI of the audio backend wins when it runs
        std::stable_partition(candidates.begin(), candidates.end(),
                              [audio_backend](backend b) { return b == audio_backend; });
        for (auto id : candidates) {
            auto o = m_registry.enumerate_midi_backend(id);
            if (o && o->status == backend_status::running) {
                opts = std::move(o);
                break;
            }
        }
        if (!opts) {
            LOG_WARN("config_resolver", "No MIDI backend is running, continuing without MIDI");
            return std::nullopt;
        }
    }

    midi_stream_info info;
    info.midi_backend = opts->id;
    info.midi_buffer_size = options.midi_buffer_size;

    auto resolve_ports = [&options](const auto_option<std::vector<midi_port_config>>& requested,
                                    const std::vector<midi_port_info>& available,
                                    const std::optional<std::size_t>& default_port,
                                    bool is_input) {
        std::vector<stream_midi_port_info> result;
        if (requested.is_auto()) {
            if (default_port && *default_port < available.size()) {
                const auto& p = available[*default_port];
                result.push_back({p.id, p.port_index, p.control_scheme, true, 0});
            }
        } else {
            for (const auto& want : requested.value()) {
                const auto it = std::find_if(available.begin(), available.end(),
                                             [&want](const midi_port_info& p) {
                                                 return p.id.matches(want.device) && p.port_index == want.port_index;
                                             });
                if (it != available.end()) {
                    result.push_back({it->id, it->port_index, want.control_scheme, true, 0});
                    continue;
                }
                if (!options.empty_buffers_for_failed_ports) {
                    throw run_config_error(run_config_errc::port_not_found,
                                           std::string(is_input ? "MIDI input " : "MIDI output ") +
                                           want.device.name + ":" + std::to_string(want.port_index));
                }
                LOG_WARN("config_resolver", "MIDI device", want.device.name, "port", want.port_index,
                         "not found, using an empty buffer");
                result.push_back({want.device, want.port_index, want.control_scheme, false, 0});
            }
        }
        for (std::size_t i = 0; i < result.size(); i++) {
            result[i].endpoint = static_cast<uint32_t>(i);
        }
        return result;
    };

    info.in_ports = resolve_ports(config->in_ports, opts->in_ports, opts->default_in_port, true);
    info.out_ports = resolve_ports(config->out_ports, opts->out_ports, opts->default_out_port, false);
    return info;
}

frames_t config_resolver::estimate_latency(const stream_block_size& block_size, bool has_input) {
    return block_size.size * (has_input ? 2u : 1u);
}

stream_info config_resolver::resolve(const rainout_config& config, const run_options& options) const {
    auto devices = select_devices(select_backend(config.audio_backend), config, options);
    const auto& backend_opts = devices.backend_options;

    stream_info info;
    info.audio_backend = backend_opts.id;
    info.backend_version = backend_opts.version;
    info.linked_devices = devices.linked;
    if (devices.input) {
        info.input_device = devices.input->id;
    }
    if (devices.output) {
        info.output_device = devices.output->id;
    }

    info.sample_rate = resolve_sample_rate(config.sample_rate, devices);
    info.block_size = resolve_block_size(config.block_size, devices, options);

    info.audio_in_ports = resolve_audio_ports(config.audio_in_ports,
                                              devices.input ? &*devices.input : nullptr,
                                              true, options.auto_audio_inputs, false, options);
    info.audio_out_ports = resolve_audio_ports(config.audio_out_ports,
                                               devices.output ? &*devices.output : nullptr,
                                               false, true, options.must_have_stereo_output, options);

    const auto* primary = devices.primary();
    if (config.take_exclusive_access) {
        if (primary->can_take_exclusive_access) {
            info.exclusive_access = true;
        } else {
            LOG_WARN("config_resolver", "Device", primary->id.name, "cannot be used exclusively");
        }
    }
    info.checking_for_silent_inputs = options.check_for_silent_inputs;
    info.latency = estimate_latency(info.block_size, !info.audio_in_ports.empty());
    info.midi = resolve_midi(config.midi, info.audio_backend, options);

    LOG_INFO("config_resolver", "Resolved", info.audio_backend, "device",
             info.output_device ? info.output_device->name : info.input_device->name,
             "at", info.sample_rate, "Hz,", info.block_size.fixed ? "block" : "max block",
             info.block_size.size, "frames,", info.audio_in_ports.size(), "inputs,",
             info.audio_out_ports.size(), "outputs");
    return info;
}

config_resolver::session_devices config_resolver::find_session_devices(const stream_info& session) const {
    auto opts = m_registry.enumerate_audio_backend(session.audio_backend);
    if (!opts || opts->status != backend_status::running) {
        throw run_config_error(run_config_errc::backend_unavailable,
                               str(session.audio_backend) + " is no longer running");
    }
    session_devices devices;
    devices.linked = session.linked_devices;
    auto lookup = [&](const device_id& id, bool is_input) -> audio_device_info {
        const auto& list = opts->device_options == device_options_kind::linked_in_out
                               ? (is_input ? opts->in_devices : opts->out_devices)
                               : opts->devices;
        const auto* d = find_device(list, id);
        if (!d) {
            throw run_config_error(run_config_errc::device_not_found, str(id));
        }
        return *d;
    };
    if (session.input_device) {
        devices.input = lookup(*session.input_device, true);
    }
    if (session.output_device) {
        devices.output = lookup(*session.output_device, false);
    }
    devices.backend_options = std::move(*opts);
    return devices;
}

rainout_config stream_info::as_config() const {
    rainout_config cfg;
    cfg.audio_backend = auto_option<backend>::use(audio_backend);
    if (linked_devices) {
        cfg.audio_device = auto_option<audio_device_selection>::use(
            audio_device_selection::linked(input_device, output_device));
    } else {
        cfg.audio_device = auto_option<audio_device_selection>::use(
            audio_device_selection::single(output_device ? *output_device : *input_device));
    }
    cfg.sample_rate = auto_option<sample_rate_t>::use(sample_rate);
    cfg.block_size = auto_option<frames_t>::use(block_size.size);

    std::vector<audio_port_ref> ins;
    for (const auto& p : audio_in_ports) {
        ins.push_back(as_ref(p));
    }
    std::vector<audio_port_ref> outs;
    for (const auto& p : audio_out_ports) {
        outs.push_back(as_ref(p));
    }
    cfg.audio_in_ports = auto_option<std::vector<audio_port_ref>>::use(std::move(ins));
    cfg.audio_out_ports = auto_option<std::vector<audio_port_ref>>::use(std::move(outs));
    cfg.take_exclusive_access = exclusive_access;

    if (midi) {
        midi_config m;
        m.midi_backend = auto_option<backend>::use(midi->midi_backend);
        auto to_config = [](const std::vector<stream_midi_port_info>& ports) {
            std::vector<midi_port_config> list;
            for (const auto& p : ports) {
                list.push_back({p.device, p.port_index, p.control_scheme});
            }
            return auto_option<std::vector<midi_port_config>>::use(std::move(list));
        };
        m.in_ports = to_config(midi->in_ports);
        m.out_ports = to_config(midi->out_ports);
        cfg.midi = std::move(m);
    }
    return cfg;
}

bool rainout_config::is_fully_explicit() const {
    const bool audio = audio_backend.is_explicit() && audio_device.is_explicit() &&
                       sample_rate.is_explicit() && block_size.is_explicit() &&
                       audio_in_ports.is_explicit() && audio_out_ports.is_explicit();
    if (!audio) {
        return false;
    }
    if (midi) {
        return midi->midi_backend.is_explicit() && midi->in_ports.is_explicit() && midi->out_ports.is_explicit();
    }
    return true;
}

std::ostream& operator<<(std::ostream& os, const stream_info& info) {
    os << "stream_info{backend=" << info.audio_backend;
    if (info.output_device) {
        os << ", output=" << *info.output_device;
    }
    if (info.input_device) {
        os << ", input=" << *info.input_device;
    }
    os << ", rate=" << info.sample_rate
       << ", block=" << (info.block_size.fixed ? "" : "<=") << info.block_size.size
       << ", ins=" << info.audio_in_ports.size()
       << ", outs=" << info.audio_out_ports.size();
    if (info.midi) {
        os << ", midi=" << info.midi->midi_backend
           << " (" << info.midi->in_ports.size() << " in, " << info.midi->out_ports.size() << " out)";
    }
    return os << "}";
}

sample_rate_and_latency estimated_sample_rate_and_latency(const rainout_config& config,
                                                          const run_options& options) {
    const auto info = config_resolver(backend_registry::global()).resolve(config, options);
    return {info.sample_rate, info.latency};
}

} // namespace rainout
