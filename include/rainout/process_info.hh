/**
 * @file process_info.hh
 * @brief Buffers handed to the user callback each cycle
 * @ingroup core
 */

#ifndef RAINOUT_PROCESS_INFO_HH
#define RAINOUT_PROCESS_INFO_HH

#include <rainout/midi_buffer.hh>
#include <rainout/sdk/buffer.hh>
#include <rainout/sdk/types.hh>
#include <vector>

namespace rainout {

/**
 * @struct process_info
 * @brief View of one processing cycle
 *
 * Lists are ordered like the ports of the session. Every audio buffer holds
 * at least @c frames samples; only the first @c frames are meaningful.
 * Output audio buffers arrive zeroed and output MIDI buffers arrive empty.
 * A port whose device is missing or disconnected still has its buffer:
 * silent for audio, empty for MIDI.
 */
struct process_info {
    const std::vector<buffer<float>>& audio_inputs;
    std::vector<buffer<float>>& audio_outputs;
    frames_t frames;
    /// one flag per input; always false unless the session checks for silent inputs
    const std::vector<bool>& silent_audio_inputs;
    const std::vector<midi_buffer>& midi_inputs;
    std::vector<midi_buffer>& midi_outputs;
};

} // namespace rainout

#endif // RAINOUT_PROCESS_INFO_HH
