/**
 * @example 03_midi_thru.cc
 * @brief MIDI thru with transposition on the null backend
 *
 * Runs without hardware: a private registry holds a null backend whose
 * simulated keyboard plays a scale. The handler shifts every note an
 * octave up and forwards it to the MIDI output.
 */

#include "example_common.hh"
#include <rainout/backend_registry.hh>
#include <rainout/backends/null/null_backend.hh>
#include <rainout/error.hh>
#include <rainout/process_handler.hh>
#include <rainout/stream_handle.hh>
#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <thread>

namespace {
    class transpose_handler : public rainout::process_handler {
        public:
            explicit transpose_handler(int semitones)
                : m_semitones(semitones) {
            }

            void init(const rainout::stream_info& info) override {
                std::cout << "MIDI thru on " << info << '\n';
            }

            void stream_changed(const rainout::stream_info&) override {
            }

            void process(rainout::process_info& info) override {
                for (const auto& in : info.midi_inputs) {
                    for (auto msg : in) {
                        const auto status = msg.data[0] & 0xF0;
                        if ((status == 0x80 || status == 0x90) && msg.length == 3) {
                            const int note = msg.data[1] + m_semitones;
                            if (note < 0 || note > 127) {
                                continue;
                            }
                            msg.data[1] = static_cast<rainout::uint8>(note);
                        }
                        for (auto& out : info.midi_outputs) {
                            if (!out.push(msg)) {
                                m_dropped.fetch_add(1, std::memory_order_relaxed);
                            }
                        }
                    }
                }
            }

            [[nodiscard]] int dropped() const noexcept {
                return m_dropped.load();
            }

        private:
            int m_semitones;
            std::atomic<int> m_dropped{0};
    };
}

int main() {
    try {
        auto config = rainout::default_null_backend_config();
        auto adapter = rainout::create_null_backend(config);
        rainout::backend_registry registry;
        registry.register_backend(adapter, 0);

        rainout::rainout_config stream_config;
        stream_config.midi = rainout::midi_config{};
        rainout::run_options options;
        options.application_name = "rainout midi thru";

        auto handler = std::make_unique<transpose_handler>(12);
        auto* thru = handler.get();
        auto handle = rainout::run(stream_config, options, std::move(handler), registry);

        const auto& keyboard = config.midi_in_ports.front().id;
        const rainout::uint8 scale[] = {60, 62, 64, 65, 67, 69, 71, 72};
        for (auto note : scale) {
            rainout::midi_message on;
            rainout::midi_message off;
            const rainout::uint8 on_bytes[] = {0x90, note, 100};
            const rainout::uint8 off_bytes[] = {0x80, note, 0};
            if (!rainout::midi_message::make(0, on_bytes, sizeof(on_bytes), on) ||
                !rainout::midi_message::make(64, off_bytes, sizeof(off_bytes), off)) {
                std::cerr << "Malformed MIDI message\n";
                return 1;
            }
            if (adapter->send_midi(keyboard, 0, on) == 0 || adapter->send_midi(keyboard, 0, off) == 0) {
                std::cerr << "Keyboard input queue full, note " << static_cast<int>(note) << " lost\n";
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            rainout::examples::print_messages(handle.messages());
        }

        handle.close();
        rainout::examples::print_messages(handle.messages());
        std::cout << "Forwarded " << adapter->midi_messages_sent() << " messages, dropped "
                  << thru->dropped() << '\n';

    } catch (const rainout::run_config_error& e) {
        std::cerr << "Cannot open a stream: " << e.what() << '\n';
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }

    return 0;
}
