#include <rainout/backends/null/null_backend.hh>
#include <rainout/error.hh>
#include <failsafe/failsafe.hh>
#include "null_stream.hh"
#include <algorithm>

namespace rainout {

    null_backend_config default_null_backend_config() {
        null_backend_config cfg;

        audio_device_info dev;
        dev.id = device_id{"Null Device", std::string("null:0")};
        dev.in_ports = {"in_1", "in_2"};
        dev.out_ports = {"out_1", "out_2"};
        dev.sample_rates = {44100, 48000, 96000};
        dev.default_sample_rate = 48000;
        dev.block_sizes = block_size_range{16, 4096, 512, false};
        dev.default_in_ports = {0, 1};
        dev.default_out_ports = {0, 1};
        dev.in_layout = channel_layout::stereo;
        dev.out_layout = channel_layout::stereo;
        dev.can_take_exclusive_access = true;
        cfg.devices.push_back(dev);
        cfg.default_device = 0;

        const device_id midi{"Null MIDI", std::string("null-midi:0")};
        cfg.midi_in_ports.push_back({midi, 0, midi_control_scheme::midi1});
        cfg.midi_out_ports.push_back({midi, 0, midi_control_scheme::midi1});
        return cfg;
    }

    null_backend::null_backend(null_backend_config config)
        : m_config(std::move(config)) {
    }

    null_backend::~null_backend() = default;

    void null_backend::init() {
        if (m_initialized) {
            THROW_RUNTIME("null backend already initialised");
        }
        m_initialized = true;
        LOG_DEBUG("null_backend", "Initialised as", m_config.id);
    }

    void null_backend::shutdown() {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_streams.empty()) {
            LOG_WARN("null_backend", "Shutting down with", m_streams.size(), "open streams");
        }
        m_initialized = false;
    }

    bool null_backend::is_initialized() const {
        return m_initialized;
    }

    backend null_backend::id() const {
        return m_config.id;
    }

    std::optional<std::string> null_backend::version() const {
        return m_config.version;
    }

    std::vector<audio_device_info> null_backend::present(const std::vector<audio_device_info>& list) const {
        std::vector<audio_device_info> result;
        for (const auto& d : list) {
            const bool absent = std::any_of(m_absent.begin(), m_absent.end(),
                                            [&d](const device_id& a) { return a.matches(d.id); });
            if (!absent) {
                result.push_back(d);
            }
        }
        return result;
    }

    audio_backend_options null_backend::enumerate_audio() {
        std::lock_guard<std::mutex> lock(m_mutex);
        audio_backend_options opts;
        opts.id = m_config.id;
        opts.version = m_config.version;
        opts.status = m_config.status;
        opts.device_options = m_config.device_options;
        if (m_config.status != backend_status::running) {
            return opts;
        }

        // defaults are kept only while the default device is present
        auto keep_default = [this](const std::vector<audio_device_info>& all,
                                   const std::vector<audio_device_info>& now,
                                   const std::optional<std::size_t>& def) -> std::optional<std::size_t> {
            if (!def || *def >= all.size()) {
                return std::nullopt;
            }
            for (std::size_t i = 0; i < now.size(); i++) {
                if (now[i].id == all[*def].id) {
                    return i;
                }
            }
            return std::nullopt;
        };
        opts.devices = present(m_config.devices);
        opts.default_device = keep_default(m_config.devices, opts.devices, m_config.default_device);
        opts.in_devices = present(m_config.in_devices);
        opts.default_in_device = keep_default(m_config.in_devices, opts.in_devices, m_config.default_in_device);
        opts.out_devices = present(m_config.out_devices);
        opts.default_out_device = keep_default(m_config.out_devices, opts.out_devices, m_config.default_out_device);
        if (!opts.has_devices()) {
            opts.status = backend_status::no_devices;
        }
        return opts;
    }

    bool null_backend::supports_midi() const {
        return !m_config.midi_in_ports.empty() || !m_config.midi_out_ports.empty();
    }

    midi_backend_options null_backend::enumerate_midi() {
        std::lock_guard<std::mutex> lock(m_mutex);
        midi_backend_options opts;
        opts.id = m_config.id;
        opts.version = m_config.version;
        opts.status = m_config.status;
        if (m_config.status != backend_status::running) {
            return opts;
        }
        auto filter = [this](const std::vector<midi_port_info>& ports) {
            std::vector<midi_port_info> result;
            for (const auto& p : ports) {
                const bool absent = std::any_of(m_absent_midi.begin(), m_absent_midi.end(),
                                                [&p](const device_id& a) { return a.matches(p.id); });
                if (!absent) {
                    result.push_back(p);
                }
            }
            return result;
        };
        opts.in_ports = filter(m_config.midi_in_ports);
        opts.out_ports = filter(m_config.midi_out_ports);
        if (!opts.in_ports.empty()) {
            opts.default_in_port = 0;
        }
        if (!opts.out_ports.empty()) {
            opts.default_out_port = 0;
        }
        return opts;
    }

    std::unique_ptr<backend_stream> null_backend::open_stream(const stream_info& session,
                                                              stream_host& host,
                                                              const stream_open_options& options) {
        if (!m_initialized) {
            throw device_error("null backend is not initialised");
        }
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_config.status != backend_status::running) {
                throw device_error(std::string("null backend is ") + to_string(m_config.status));
            }
            m_application_name = options.application_name;
        }
        auto s = std::make_unique<stream>(*this, session, host, true);
        LOG_INFO("null_backend", "Opened stream at", session.sample_rate, "Hz with", session.max_block_frames(),
                 "frames per cycle");
        return s;
    }

    std::unique_ptr<backend_stream> null_backend::open_midi_stream(const stream_info& session,
                                                                   stream_host& host,
                                                                   const stream_open_options& options) {
        if (!supports_midi()) {
            return audio_backend::open_midi_stream(session, host, options);
        }
        if (!m_initialized) {
            throw device_error("null backend is not initialised");
        }
        return std::make_unique<stream>(*this, session, host, false);
    }

    void null_backend::set_status(backend_status status) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_config.status = status;
    }

    void null_backend::set_device_present(const device_id& id, bool present) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_absent.erase(std::remove_if(m_absent.begin(), m_absent.end(),
                                      [&id](const device_id& a) { return a.matches(id); }),
                       m_absent.end());
        if (!present) {
            m_absent.push_back(id);
        }
        for (auto* s : m_streams) {
            s->device_presence_changed(id, device_kind::audio, present);
        }
    }

    void null_backend::set_midi_device_present(const device_id& id, bool present) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_absent_midi.erase(std::remove_if(m_absent_midi.begin(), m_absent_midi.end(),
                                           [&id](const device_id& a) { return a.matches(id); }),
                            m_absent_midi.end());
        if (!present) {
            m_absent_midi.push_back(id);
        }
        for (auto* s : m_streams) {
            s->device_presence_changed(id, device_kind::midi, present);
        }
    }

    std::size_t null_backend::send_midi(const device_id& device, uint32_t port_index, const midi_message& msg) {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::size_t accepted = 0;
        for (auto* s : m_streams) {
            if (s->send_midi(device, port_index, msg)) {
                ++accepted;
            }
        }
        return accepted;
    }

    void null_backend::simulate_xrun() {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto* s : m_streams) {
            s->report_xrun();
        }
    }

    void null_backend::fail_streams(const char* reason) {
        std::lock_guard<std::mutex> lock(m_mutex);
        LOG_WARN("null_backend", "Failing", m_streams.size(), "streams:", reason);
        for (auto* s : m_streams) {
            s->fail(reason);
        }
    }

    std::size_t null_backend::open_stream_count() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_streams.size();
    }

    uint64_t null_backend::delivered_cycles() const noexcept {
        return m_stats.cycles.load(std::memory_order_relaxed);
    }

    uint64_t null_backend::midi_messages_sent() const noexcept {
        return m_stats.midi_sent.load(std::memory_order_relaxed);
    }

    float null_backend::last_output_peak() const noexcept {
        return m_stats.output_peak.load(std::memory_order_relaxed);
    }

    std::optional<std::string> null_backend::last_application_name() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_application_name;
    }

    void null_backend::register_stream(stream* s) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_streams.push_back(s);
    }

    void null_backend::unregister_stream(stream* s) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_streams.erase(std::remove(m_streams.begin(), m_streams.end(), s), m_streams.end());
    }

    std::shared_ptr<audio_backend> create_null_backend() {
        return std::make_shared<null_backend>(default_null_backend_config());
    }

    std::shared_ptr<null_backend> create_null_backend(null_backend_config config) {
        return std::make_shared<null_backend>(std::move(config));
    }

} // namespace rainout
