#include "event_loop.hpp"

namespace driveprof {

void run_event_loop(asio::io_context& ios,
    const std::function<void(const std::exception&)>& on_exception)
{
    for(;;)
    {
        try
        {
            ios.run();
            return;
        }
        catch(const std::exception& e)
        {
            // run() may be resumed without a restart after a handler threw.
            on_exception(e);
        }
    }
}

} // namespace driveprof
