#ifndef DRIVEPROF_COUNTER_CACHE_HEADER
#define DRIVEPROF_COUNTER_CACHE_HEADER

#include "time.hpp"

#include <optional>
#include <utility>

namespace driveprof {

/**
 * Holds the last value read from a counter source and returns it until it is older
 * than the expiry, at which point the source is read again. This keeps successive
 * reads within one report consistent and bounds the cost of reading expensive
 * sources (such as querying the kernel for every socket).
 */
template <typename Counters>
class counter_cache
{
    duration expiry_;
    time_point last_refresh_;
    std::optional<Counters> cached_;

public:
    explicit counter_cache(duration expiry) : expiry_(expiry) {}

    template <typename Source>
    const Counters& get(Source&& source, const time_point now = clock::now())
    {
        if(!cached_ || (now - last_refresh_ >= expiry_))
        {
            cached_ = std::forward<Source>(source)();
            last_refresh_ = now;
        }
        return *cached_;
    }

    /** Forces the next `get` to read the source. */
    void invalidate() noexcept { cached_.reset(); }
};

} // namespace driveprof

#endif // DRIVEPROF_COUNTER_CACHE_HEADER
