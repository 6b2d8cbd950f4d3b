#ifndef RAINOUT_BACKEND_TEST_HELPERS_HH
#define RAINOUT_BACKEND_TEST_HELPERS_HH

#include <rainout/sdk/audio_backend.hh>
#include <rainout/sdk/backend_stream.hh>
#include <atomic>
#include <memory>
#include <mutex>
#include <vector>

namespace rainout::test {

// Conformance checks that every adapter has to pass.
// They are shared between the null backend and the SDL3 backend tests.

// Stand-in for the engine: counts cycles and records what the adapter reports
class counting_host : public stream_host {
public:
    explicit counting_host(frames_t block_frames = 256)
        : m_block_frames(block_frames) {
    }

    cycle_result run_cycle(native_cycle& cycle) noexcept override;
    [[nodiscard]] frames_t current_block_frames() const noexcept override { return m_block_frames.load(); }
    bool push_midi_input(uint32_t endpoint, const midi_message& msg) noexcept override;
    bool push_midi_input(uint32_t endpoint, frames_t delta, const uint8* bytes, std::size_t size) noexcept override;
    bool pop_midi_output(uint32_t endpoint, midi_message& msg) noexcept override;
    void device_presence_changed(const device_id& id, device_kind kind, bool present) override;
    void report_xrun() noexcept override { xruns++; }
    void backend_failed(const char*) noexcept override { failures++; }

    void set_block_frames(frames_t n) noexcept { m_block_frames = n; }
    void stop_after(uint64_t cycles) noexcept { m_stop_after = cycles; }

    std::atomic<uint64_t> cycles{0};
    std::atomic<uint64_t> last_frames{0};
    std::atomic<uint64_t> midi_in{0};
    std::atomic<uint64_t> xruns{0};
    std::atomic<uint64_t> failures{0};

    struct presence_event {
        device_id id;
        device_kind kind;
        bool present;
    };
    std::vector<presence_event> presence_events();

private:
    std::atomic<frames_t> m_block_frames;
    std::atomic<uint64_t> m_stop_after{0};
    std::mutex m_mutex;
    std::vector<presence_event> m_presence;
};

// Not initialised at first, double init throws, double shutdown is harmless
void test_backend_initialization(std::shared_ptr<audio_backend> backend);

// Enumeration results are self-consistent: indices in range, ids match
void test_enumeration_invariants(std::shared_ptr<audio_backend> backend);

// Backends without MIDI report not_installed and refuse MIDI streams
void test_midi_capabilities(std::shared_ptr<audio_backend> backend);

// Opens the default device, runs it until @p min_cycles arrived, stops and closes twice
void test_stream_lifecycle(std::shared_ptr<audio_backend> backend, uint64_t min_cycles);

// Builds a session for the backend's default device, without MIDI; false when it has none
bool default_session(audio_backend& backend, stream_info& session);

} // namespace rainout::test

#endif // RAINOUT_BACKEND_TEST_HELPERS_HH
