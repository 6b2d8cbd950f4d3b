/**
 * @example 02_enumerate_backends.cc
 * @brief Lists every registered backend with its devices and MIDI ports
 *
 * Enumeration performs no stream I/O, so this is safe to run while other
 * programs use the devices.
 */

#include "example_common.hh"
#include <rainout/config_resolver.hh>
#include <rainout/enumeration.hh>
#include <rainout/error.hh>
#include <iostream>

namespace {
    void print_devices(const char* title, const std::vector<rainout::audio_device_info>& devices,
                       const std::optional<std::size_t>& default_index) {
        if (devices.empty()) {
            return;
        }
        std::cout << "  " << title << ":\n";
        for (std::size_t i = 0; i < devices.size(); i++) {
            std::cout << "    " << i << ": " << devices[i];
            if (default_index && *default_index == i) {
                std::cout << " (default)";
            }
            std::cout << '\n';
        }
    }

    void print_midi_ports(const char* title, const std::vector<rainout::midi_port_info>& ports) {
        for (const auto& p : ports) {
            std::cout << "    " << title << ' ' << p.id.name << " #" << p.port_index
                      << (p.control_scheme == rainout::midi_control_scheme::midi2 ? " (MIDI 2.0)" : "") << '\n';
        }
    }
}

int main() {
    try {
        rainout::examples::register_backends();

        std::cout << "=== Audio backends ===\n";
        for (auto id : rainout::available_audio_backends()) {
            const auto opts = rainout::enumerate_audio_backend(id);
            if (!opts) {
                continue;
            }
            std::cout << id << " " << opts->version.value_or("?")
                      << " [" << rainout::to_string(opts->status) << "]\n";
            print_devices("devices", opts->devices, opts->default_device);
            print_devices("input devices", opts->in_devices, opts->default_in_device);
            print_devices("output devices", opts->out_devices, opts->default_out_device);
        }

        std::cout << "\n=== MIDI backends ===\n";
        for (auto id : rainout::available_midi_backends()) {
            const auto opts = rainout::enumerate_midi_backend(id);
            if (!opts) {
                continue;
            }
            std::cout << id << " [" << rainout::to_string(opts->status) << "]\n";
            print_midi_ports("in ", opts->in_ports);
            print_midi_ports("out", opts->out_ports);
        }

        const auto preferred = rainout::find_preferred_audio_backend();
        if (!preferred) {
            std::cerr << "\nNo usable audio backend\n";
            return 1;
        }
        const auto estimate = rainout::estimated_sample_rate_and_latency(rainout::rainout_config{});
        std::cout << "\nPreferred: " << preferred->id << ", a default stream would run at "
                  << estimate.sample_rate << " Hz";
        if (estimate.latency) {
            std::cout << " with " << *estimate.latency << " frames of latency";
        }
        std::cout << '\n';

    } catch (const rainout::run_config_error& e) {
        std::cerr << "Cannot resolve a default stream: " << e.what() << '\n';
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }

    return 0;
}
