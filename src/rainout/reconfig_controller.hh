/**
 * @file reconfig_controller.hh
 * @brief Validation of live configuration changes
 * @ingroup internal
 */

#pragma once

#include <rainout/config_resolver.hh>
#include <rainout/stream_change.hh>
#include <rainout/stream_info.hh>
#include <rainout/export_rainout.h>

namespace rainout {

    class backend_registry;
    class backend_stream;

    /**
     * @class reconfig_controller
     * @brief Turns a stream_change into the next session of a running stream
     * @ingroup internal
     *
     * plan() only reads: it checks the adapter capabilities, re-enumerates
     * the session's devices and applies the resolver rules to the changed
     * fields. Fields the change leaves unset are carried over unchanged.
     */
    class RAINOUT_EXPORT reconfig_controller {
    public:
        reconfig_controller(const backend_registry& registry, const run_options& options);

        /**
         * @p midi_caps is the stream that carries MIDI; the audio stream when
         * one adapter serves both.
         *
         * @throws change_config_error not_supported when the adapter cannot apply a requested kind of change
         * @throws run_config_error when the requested values do not resolve
         */
        [[nodiscard]] stream_info plan(const stream_info& current,
                                       const stream_change& change,
                                       const backend_stream& audio_caps,
                                       const backend_stream& midi_caps) const;

    private:
        config_resolver m_resolver;
        const run_options& m_options;
    };

} // namespace rainout
