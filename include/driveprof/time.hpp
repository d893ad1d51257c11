#ifndef DRIVEPROF_TIME_HEADER
#define DRIVEPROF_TIME_HEADER

#include <chrono>

#include <asio/basic_waitable_timer.hpp>

namespace driveprof {

// Every elapsed time the profiler reports is measured against this clock, so it must
// be monotonic.
using clock = std::chrono::steady_clock;

using time_point = clock::time_point;
using duration = clock::duration;

using std::chrono::hours;
using std::chrono::microseconds;
using std::chrono::milliseconds;
using std::chrono::minutes;
using std::chrono::seconds;

using std::chrono::duration_cast;
using std::chrono::time_point_cast;

using deadline_timer = asio::basic_waitable_timer<clock>;

template <typename Unit>
int64_t to_int(const duration& d)
{
    return duration_cast<Unit>(d).count();
}

/** Returns `d` as fractional seconds, keeping sub-millisecond resolution. */
inline double to_seconds(const duration& d) noexcept
{
    return std::chrono::duration<double>(d).count();
}

inline duration elapsed_since(const time_point& t)
{
    return clock::now() - t;
}

template <typename Duration, typename Handler>
void start_timer(deadline_timer& timer, const Duration& expires_in, Handler handler)
{
    // Setting the expiry cancels pending async waits (which is what we want).
    timer.expires_after(expires_in);
    timer.async_wait(std::move(handler));
}

} // namespace driveprof

#endif // DRIVEPROF_TIME_HEADER
