/**
 * @example 01_simple_stereo_out.cc
 * @brief Plays a sine tone on the preferred backend
 *
 * Opens a stream with every setting left automatic, writes a 440 Hz tone
 * to the first two outputs and prints stream messages while it runs.
 * Halfway through the block size is changed live when the device allows it.
 */

#include "example_common.hh"
#include <rainout/error.hh>
#include <rainout/process_handler.hh>
#include <rainout/stream_handle.hh>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <thread>

namespace {
    constexpr float two_pi = 6.28318530718f;

    class sine_handler : public rainout::process_handler {
        public:
            explicit sine_handler(float frequency)
                : m_frequency(frequency) {
            }

            void init(const rainout::stream_info& info) override {
                m_step = two_pi * m_frequency / static_cast<float>(info.sample_rate);
                m_phase = 0.0f;
            }

            void stream_changed(const rainout::stream_info& info) override {
                // keep the phase so the tone does not click
                m_step = two_pi * m_frequency / static_cast<float>(info.sample_rate);
            }

            void process(rainout::process_info& info) override {
                for (rainout::frames_t i = 0; i < info.frames; i++) {
                    const float v = 0.2f * std::sin(m_phase);
                    m_phase += m_step;
                    if (m_phase > two_pi) {
                        m_phase -= two_pi;
                    }
                    for (std::size_t c = 0; c < info.audio_outputs.size() && c < 2; c++) {
                        info.audio_outputs[c][i] = v;
                    }
                }
            }

        private:
            float m_frequency;
            float m_step = 0.0f;
            float m_phase = 0.0f;
    };
}

int main(int argc, char* argv[]) {
    const int seconds = argc > 1 ? std::atoi(argv[1]) : 3;
    if (seconds <= 0) {
        std::cerr << "Usage: " << argv[0] << " [seconds]\n";
        return 1;
    }

    try {
        rainout::examples::register_backends();

        rainout::rainout_config config;
        rainout::run_options options;
        options.application_name = "rainout stereo out";
        options.must_have_stereo_output = true;

        auto handle = rainout::run(config, options, std::make_unique<sine_handler>(440.0f));
        std::cout << "Opened " << handle.info() << '\n';

        const auto started = std::chrono::steady_clock::now();
        const auto duration = std::chrono::seconds(seconds);
        bool changed = false;
        while (std::chrono::steady_clock::now() - started < duration) {
            if (!rainout::examples::print_messages(handle.messages())) {
                std::cerr << "Stream stopped unexpectedly\n";
                return 1;
            }
            if (!changed && std::chrono::steady_clock::now() - started > duration / 2) {
                changed = true;
                if (handle.can_change_block_size()) {
                    try {
                        handle.change_block_size(rainout::auto_option<rainout::frames_t>::use(256));
                        std::cout << "Block size changed: " << handle.info() << '\n';
                    } catch (const rainout::run_config_error& e) {
                        std::cout << "Device kept its block size: " << e.what() << '\n';
                    }
                }
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }

        std::cout << "Processed " << handle.processed_cycles() << " cycles\n";
        handle.close();
        rainout::examples::print_messages(handle.messages());

    } catch (const rainout::run_config_error& e) {
        std::cerr << "Cannot open a stream: " << e.what() << '\n';
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }

    return 0;
}
