/**
 * @file process_handler.hh
 * @brief User callback contract
 * @ingroup core
 */

#ifndef RAINOUT_PROCESS_HANDLER_HH
#define RAINOUT_PROCESS_HANDLER_HH

#include <rainout/process_info.hh>
#include <rainout/stream_info.hh>

namespace rainout {

/**
 * @class process_handler
 * @brief Application code driven by the stream engine
 * @ingroup core
 *
 * The engine owns the handler for the whole lifetime of the stream and
 * never calls two of its methods concurrently:
 *
 * - init() exactly once, on the thread calling run(), before the adapter
 *   starts and therefore before the first process() call;
 * - stream_changed() exactly once for every accepted reconfiguration,
 *   on the realtime thread, before the first process() call that sees the
 *   new buffers;
 * - process() once per hardware cycle on the realtime thread.
 *
 * process() and stream_changed() must not block, allocate or perform I/O.
 * An exception escaping process() faults the stream.
 */
class process_handler {
public:
    virtual ~process_handler() = default;

    virtual void init(const stream_info& info) = 0;

    virtual void stream_changed(const stream_info& info) = 0;

    virtual void process(process_info& info) = 0;
};

} // namespace rainout

#endif // RAINOUT_PROCESS_HANDLER_HH
