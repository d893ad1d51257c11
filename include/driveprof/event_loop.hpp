#ifndef DRIVEPROF_EVENT_LOOP_HEADER
#define DRIVEPROF_EVENT_LOOP_HEADER

#include <exception>
#include <functional>

#include <asio/io_context.hpp>

namespace driveprof {

/**
 * Runs `ios` until it runs out of work or is stopped. A handler that throws does not
 * end the loop: `on_exception` is invoked with what it threw and the loop resumes
 * with the remaining handlers, so the caller can still tear down in an orderly way.
 * Anything not derived from `std::exception` is propagated.
 */
void run_event_loop(asio::io_context& ios,
    const std::function<void(const std::exception&)>& on_exception);

} // namespace driveprof

#endif // DRIVEPROF_EVENT_LOOP_HEADER
