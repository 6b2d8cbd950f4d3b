#include <rainout/backend_registry.hh>
#include <rainout/backends/null/null_backend.hh>
#include <rainout/sdk/audio_backend.hh>
#include <failsafe/failsafe.hh>
#include <algorithm>

namespace rainout {

void backend_registry::register_backend(std::shared_ptr<audio_backend> adapter) {
    if (!adapter) {
        THROW_RUNTIME("Cannot register a null backend adapter");
    }
    const auto priority = default_priority(adapter->id());
    register_backend(std::move(adapter), priority);
}

void backend_registry::register_backend(std::shared_ptr<audio_backend> adapter, int priority) {
    if (!adapter) {
        THROW_RUNTIME("Cannot register a null backend adapter");
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto id = adapter->id();
    m_backends.erase(std::remove_if(m_backends.begin(), m_backends.end(),
                                    [id](const backend_entry& e) { return e.adapter->id() == id; }),
                     m_backends.end());
    m_backends.push_back({std::move(adapter), priority});

    // Sort by priority (higher first)
    std::stable_sort(m_backends.begin(), m_backends.end(),
                     [](const backend_entry& a, const backend_entry& b) {
                         return a.priority > b.priority;
                     });
}

bool backend_registry::unregister_backend(backend id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto before = m_backends.size();
    m_backends.erase(std::remove_if(m_backends.begin(), m_backends.end(),
                                    [id](const backend_entry& e) { return e.adapter->id() == id; }),
                     m_backends.end());
    return m_backends.size() != before;
}

std::vector<backend_registry::backend_entry> backend_registry::snapshot() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_backends;
}

bool backend_registry::ensure_initialized(audio_backend& adapter) {
    if (adapter.is_initialized()) {
        return true;
    }
    try {
        adapter.init();
        return true;
    } catch (const std::exception& e) {
        LOG_WARN("backend_registry", "Backend", adapter.get_name(), "failed to initialize:", e.what());
        return false;
    }
}

std::vector<backend> backend_registry::available_audio_backends() const {
    std::vector<backend> result;
    for (const auto& entry : snapshot()) {
        result.push_back(entry.adapter->id());
    }
    return result;
}

std::vector<backend> backend_registry::available_midi_backends() const {
    std::vector<backend> result;
    for (const auto& entry : snapshot()) {
        if (entry.adapter->supports_midi()) {
            result.push_back(entry.adapter->id());
        }
    }
    return result;
}

std::optional<audio_backend_options> backend_registry::enumerate_audio_backend(backend id) const {
    for (const auto& entry : snapshot()) {
        if (entry.adapter->id() != id) {
            continue;
        }
        if (!ensure_initialized(*entry.adapter)) {
            audio_backend_options opts;
            opts.id = id;
            opts.status = backend_status::not_installed;
            return opts;
        }
        auto opts = entry.adapter->enumerate_audio();
        opts.id = id;
        if (opts.status != backend_status::running) {
            opts.devices.clear();
            opts.in_devices.clear();
            opts.out_devices.clear();
            opts.default_device.reset();
            opts.default_in_device.reset();
            opts.default_out_device.reset();
        }
        return opts;
    }
    return std::nullopt;
}

std::optional<midi_backend_options> backend_registry::enumerate_midi_backend(backend id) const {
    for (const auto& entry : snapshot()) {
        if (entry.adapter->id() != id || !entry.adapter->supports_midi()) {
            continue;
        }
        if (!ensure_initialized(*entry.adapter)) {
            midi_backend_options opts;
            opts.id = id;
            opts.status = backend_status::not_installed;
            return opts;
        }
        auto opts = entry.adapter->enumerate_midi();
        opts.id = id;
        if (opts.status != backend_status::running) {
            opts.in_ports.clear();
            opts.out_ports.clear();
            opts.default_in_port.reset();
            opts.default_out_port.reset();
        }
        return opts;
    }
    return std::nullopt;
}

std::optional<audio_backend_options> backend_registry::find_preferred_audio_backend() const {
    std::optional<audio_backend_options> without_devices;
    for (auto id : available_audio_backends()) {
        auto opts = enumerate_audio_backend(id);
        if (!opts) {
            continue;
        }
        if (opts->status == backend_status::running && opts->has_devices()) {
            return opts;
        }
        if (!without_devices && (opts->status == backend_status::no_devices ||
                                 opts->status == backend_status::running)) {
            without_devices = std::move(opts);
        }
    }
    return without_devices;
}

std::shared_ptr<audio_backend> backend_registry::find(backend id) const {
    for (const auto& entry : snapshot()) {
        if (entry.adapter->id() == id) {
            if (!ensure_initialized(*entry.adapter)) {
                return nullptr;
            }
            return entry.adapter;
        }
    }
    return nullptr;
}

std::size_t backend_registry::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_backends.size();
}

void backend_registry::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_backends.clear();
}

int backend_registry::default_priority(backend id) {
    const auto& order = platform_backend_preference();
    const auto it = std::find(order.begin(), order.end(), id);
    if (it == order.end()) {
        return 0;
    }
    return static_cast<int>(order.size() - static_cast<std::size_t>(it - order.begin())) * 10;
}

backend_registry& backend_registry::global() {
    static backend_registry instance;
    static const bool seeded = [] {
        instance.register_backend(create_null_backend(), -1000);
        return true;
    }();
    (void)seeded;
    return instance;
}

} // namespace rainout
