#ifndef RAINOUT_TEST_HELPERS_HH
#define RAINOUT_TEST_HELPERS_HH

#include <rainout/backend_registry.hh>
#include <rainout/message_channel.hh>
#include <rainout/process_handler.hh>
#include <rainout/stream_info.hh>
#include "mock_backends.hh"
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

namespace rainout::test {

    // What a recording_handler saw; shared with the test because the
    // engine owns the handler itself
    struct handler_log {
        std::atomic<int> init_calls{0};
        std::atomic<int> changed_calls{0};
        std::atomic<uint64_t> process_calls{0};
        std::atomic<frames_t> last_frames{0};
        std::atomic<std::size_t> last_in_count{0};
        std::atomic<std::size_t> last_out_count{0};
        std::atomic<float> last_input_sample{0.0f};
        std::atomic<bool> last_input_silent{false};
        // when set, the start of every process call is timestamped
        std::atomic<bool> record_cycle_times{false};

        mutable std::mutex mutex;
        std::vector<stream_info> sessions;           // init first, then every stream_changed
        std::vector<midi_message> midi_received;
        std::vector<uint64_t> midi_received_in;      // process call that saw each event
        // buffers of the last process call, as handed to the handler
        std::vector<std::vector<float>> inputs_seen;
        std::vector<std::vector<float>> outputs_seen;
        std::vector<std::chrono::steady_clock::time_point> cycle_started;

        stream_info last_session() const {
            std::lock_guard<std::mutex> lock(mutex);
            return sessions.back();
        }

        std::vector<midi_message> midi() const {
            std::lock_guard<std::mutex> lock(mutex);
            return midi_received;
        }

        std::vector<std::chrono::steady_clock::time_point> cycle_times() const {
            std::lock_guard<std::mutex> lock(mutex);
            return cycle_started;
        }

        std::vector<uint64_t> midi_calls() const {
            std::lock_guard<std::mutex> lock(mutex);
            return midi_received_in;
        }
    };

    // Handler that writes a constant to every output and records every call
    class recording_handler : public process_handler {
        public:
            explicit recording_handler(std::shared_ptr<handler_log> log)
                : m_log(std::move(log)) {
            }

            // Configurable behaviors
            float output_value = 0.25f;
            bool throw_in_init = false;
            bool throw_in_process = false;
            bool throw_in_changed = false;
            // copies every MIDI input event to each MIDI output
            bool echo_midi = false;
            // keeps a copy of every audio buffer as process() receives it
            bool capture_buffers = false;

            void init(const stream_info& info) override {
                m_log->init_calls++;
                if (throw_in_init) {
                    throw std::runtime_error("init refused");
                }
                std::lock_guard<std::mutex> lock(m_log->mutex);
                m_log->sessions.push_back(info);
            }

            void stream_changed(const stream_info& info) override {
                m_log->changed_calls++;
                if (throw_in_changed) {
                    throw std::runtime_error("stream_changed refused");
                }
                std::lock_guard<std::mutex> lock(m_log->mutex);
                m_log->sessions.push_back(info);
            }

            void process(process_info& info) override {
                if (m_log->record_cycle_times.load()) {
                    const auto now = std::chrono::steady_clock::now();
                    std::lock_guard<std::mutex> lock(m_log->mutex);
                    m_log->cycle_started.push_back(now);
                }
                if (throw_in_process) {
                    throw std::runtime_error("process exploded");
                }
                const auto call = ++m_log->process_calls;
                m_log->last_frames = info.frames;
                if (capture_buffers) {
                    std::lock_guard<std::mutex> lock(m_log->mutex);
                    m_log->inputs_seen.clear();
                    for (const auto& in : info.audio_inputs) {
                        m_log->inputs_seen.emplace_back(in.data(), in.data() + in.size());
                    }
                    m_log->outputs_seen.clear();
                    for (const auto& out : info.audio_outputs) {
                        m_log->outputs_seen.emplace_back(out.data(), out.data() + out.size());
                    }
                }
                m_log->last_in_count = info.audio_inputs.size();
                m_log->last_out_count = info.audio_outputs.size();
                if (!info.audio_inputs.empty()) {
                    m_log->last_input_sample = info.audio_inputs[0][0];
                    m_log->last_input_silent = static_cast<bool>(info.silent_audio_inputs[0]);
                }
                for (auto& out : info.audio_outputs) {
                    for (frames_t i = 0; i < info.frames; i++) {
                        out[i] = output_value;
                    }
                }
                bool any_midi = false;
                for (const auto& in : info.midi_inputs) {
                    any_midi = any_midi || !in.empty();
                }
                if (any_midi) {
                    std::lock_guard<std::mutex> lock(m_log->mutex);
                    for (const auto& in : info.midi_inputs) {
                        for (const auto& ev : in) {
                            m_log->midi_received.push_back(ev);
                            m_log->midi_received_in.push_back(call);
                            if (echo_midi) {
                                for (auto& out : info.midi_outputs) {
                                    out.push(ev);
                                }
                            }
                        }
                    }
                }
            }

        private:
            std::shared_ptr<handler_log> m_log;
    };

    inline std::unique_ptr<recording_handler> make_handler(const std::shared_ptr<handler_log>& log) {
        return std::make_unique<recording_handler>(log);
    }

    inline std::vector<stream_msg> drain(message_channel& channel) {
        std::vector<stream_msg> result;
        channel.pop_each([&result](const stream_msg& m) { result.push_back(m); });
        return result;
    }

    // Polls @p done for up to @p timeout
    template<typename F>
    bool wait_until(F&& done, std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (!done()) {
            if (std::chrono::steady_clock::now() >= deadline) {
                return false;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        return true;
    }

    // Options that keep tests fast when no adapter thread honours a stop request
    inline run_options quick_options() {
        run_options o;
        o.close_timeout = std::chrono::milliseconds(20);
        o.open_timeout = std::chrono::milliseconds(2000);
        return o;
    }

} // namespace rainout::test

#endif // RAINOUT_TEST_HELPERS_HH
