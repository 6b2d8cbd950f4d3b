/**
 * @file stream_engine.hh
 * @brief Realtime side of a running stream
 * @ingroup internal
 */

#pragma once

#include <rainout/configuration.hh>
#include <rainout/device_monitor.hh>
#include <rainout/engine_state.hh>
#include <rainout/message_channel.hh>
#include <rainout/process_handler.hh>
#include <rainout/sdk/backend_stream.hh>
#include <rainout/sdk/spsc_queue.hh>
#include <rainout/export_rainout.h>
#include "midi_endpoints.hh"
#include "stream_layout.hh"
#include <atomic>
#include <cstdint>
#include <memory>

namespace rainout {

    /**
     * @class stream_engine
     * @brief Drives the process_handler from the adapter's realtime thread
     * @ingroup internal
     *
     * The engine owns the active stream_layout. The owner thread prepares a
     * replacement layout and submits it; the realtime thread installs it at
     * the start of the next cycle, calls process_handler::stream_changed and
     * hands the previous layout back through the retired queue, where the
     * owner frees it. Nothing on the realtime path allocates, locks or
     * throws.
     *
     * ## Cycle
     *
     * 1. install pending layouts, honour a stop request
     * 2. take queued MIDI input of the cycle
     * 3. for each chunk of at most capacity frames: hand the chunk the MIDI
     *    events falling into it, convert inputs, zero outputs, call
     *    process(), convert outputs, queue MIDI output
     * 4. flush xrun and overflow counters as nonfatal messages
     *
     * Device presence is only read here to substitute silence; transitions
     * reach the owner through the device_monitor.
     *
     * @warning This is an internal class not intended for direct use
     */
    class RAINOUT_EXPORT stream_engine final : public stream_host {
    public:
        stream_engine(std::unique_ptr<process_handler> handler,
                      const run_options& options,
                      device_monitor& monitor,
                      message_channel& channel);
        ~stream_engine() override;

        stream_engine(const stream_engine&) = delete;
        stream_engine& operator=(const stream_engine&) = delete;

        // ---- owner thread ----

        /**
         * @brief Builds the layout of @p session, honouring @p min_capacity
         */
        std::unique_ptr<stream_layout> build_layout(const stream_info& session, frames_t min_capacity = 0);

        /**
         * @brief Installs the first layout and calls process_handler::init
         *
         * Must be called before the adapter starts. Exceptions of init
         * propagate.
         */
        void initialize(std::unique_ptr<stream_layout> layout);

        /**
         * @brief Lets cycles reach the handler
         */
        void mark_running() noexcept;

        /**
         * Endpoint counters after a change, applied by commit_endpoints()
         * once the change is accepted
         */
        struct endpoint_reservation {
            uint32_t next_in = 0;
            uint32_t next_out = 0;
        };

        /**
         * @brief Gives endpoint numbers to the MIDI ports of @p next
         *
         * Ports also present in @p current keep their endpoint, new ones get
         * numbers never used before by this stream. Nothing is consumed until
         * the reservation is committed.
         * @throws change_config_error when the endpoint table is exhausted
         */
        [[nodiscard]] endpoint_reservation assign_endpoints(const stream_info& current, stream_info& next) const;

        void commit_endpoints(const endpoint_reservation& r) noexcept;

        /**
         * @brief Creates the MIDI endpoint queues of @p session ahead of its layout
         *
         * Queues of a refused change stay empty and serve the next
         * reservation of the same numbers.
         * @throws rainout_error when an endpoint is beyond the configured maximum
         */
        void create_endpoint_queues(const stream_info& session);

        /**
         * @brief Whether submit() has room for another layout
         */
        [[nodiscard]] bool can_submit() noexcept;

        /**
         * @brief Queues @p next for installation at the next cycle boundary
         * @return false if the command queue is full; @p next is left untouched then
         */
        bool submit(std::unique_ptr<stream_layout>& next);

        /**
         * @brief Frees layouts the realtime thread has replaced
         */
        void collect_retired();

        /**
         * @brief Asks the realtime thread to stop at the next cycle boundary
         */
        void request_stop() noexcept;

        /**
         * @brief Final transition once the adapter no longer runs cycles
         */
        void finish() noexcept;

        [[nodiscard]] engine_state state() const noexcept {
            return m_state.load(std::memory_order_acquire);
        }

        /**
         * @brief Number of completed process() calls
         */
        [[nodiscard]] uint64_t processed_cycles() const noexcept {
            return m_cycles.load(std::memory_order_relaxed);
        }

        /**
         * @brief Number of layouts installed by the realtime thread
         */
        [[nodiscard]] uint64_t applied_changes() const noexcept {
            return m_applied.load(std::memory_order_acquire);
        }

        /**
         * @brief Capacity of the layout most recently installed or submitted
         */
        [[nodiscard]] frames_t latest_capacity() const noexcept { return m_latest_capacity; }

        /**
         * @brief Moves the stream to faulted and posts the fatal message; any thread
         */
        void fault(stream_error_code code, const char* reason) noexcept;

        // ---- stream_host ----

        cycle_result run_cycle(native_cycle& cycle) noexcept override;
        [[nodiscard]] frames_t current_block_frames() const noexcept override;
        bool push_midi_input(uint32_t endpoint, const midi_message& msg) noexcept override;
        bool push_midi_input(uint32_t endpoint, frames_t delta, const uint8* bytes, std::size_t size) noexcept override;
        bool pop_midi_output(uint32_t endpoint, midi_message& msg) noexcept override;
        void device_presence_changed(const device_id& id, device_kind kind, bool present) override;
        void report_xrun() noexcept override;
        void backend_failed(const char* reason) noexcept override;

    private:
        static constexpr std::size_t command_capacity = 16;

        bool install_pending() noexcept;
        void gather_midi_input(stream_layout& layout, frames_t frames) noexcept;
        static void split_midi_input(stream_layout& layout, frames_t offset, frames_t frames) noexcept;
        bool process_chunk(stream_layout& layout, native_cycle& cycle, frames_t offset, frames_t frames) noexcept;
        void queue_midi_output(stream_layout& layout, frames_t offset) noexcept;
        void flush_counters() noexcept;
        static void write_silence(native_audio_block& block, frames_t offset, frames_t frames) noexcept;

        std::unique_ptr<process_handler> m_handler;
        device_monitor& m_monitor;
        message_channel& m_channel;

        midi_endpoints m_midi_in;
        midi_endpoints m_midi_out;
        uint32_t m_next_in_endpoint = 0;
        uint32_t m_next_out_endpoint = 0;

        std::unique_ptr<stream_layout> m_active;
        spsc_queue<stream_layout*> m_commands;
        spsc_queue<stream_layout*> m_retired;
        frames_t m_latest_capacity = 0;

        std::atomic<engine_state> m_state{engine_state::created};
        std::atomic<frames_t> m_block_frames{0};
        std::atomic<uint64_t> m_cycles{0};
        std::atomic<uint64_t> m_applied{0};

        // realtime thread only
        uint64_t m_midi_overflow = 0;
        uint64_t m_mismatch_frames = 0;

        // any thread
        std::atomic<uint64_t> m_xruns{0};
        std::atomic<uint64_t> m_midi_push_overflow{0};
        std::atomic<uint64_t> m_midi_too_long{0};
    };

} // namespace rainout
