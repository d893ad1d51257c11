#include "milestone_tracker.hpp"

namespace driveprof {

void milestone_tracker::mark_start(const time_point now)
{
    if(!start_time_) { start_time_ = now; }
}

void milestone_tracker::mark_metadata_found(const time_point now)
{
    if(!metadata_found_at_) { metadata_found_at_ = elapsed_since_start(now); }
}

void milestone_tracker::mark_fully_downloaded(const time_point now)
{
    if(!fully_downloaded_at_) { fully_downloaded_at_ = elapsed_since_start(now); }
}

double milestone_tracker::elapsed_since_start(const time_point now) const
{
    if(!start_time_) { return 0.0; }
    return to_seconds(now - *start_time_);
}

} // namespace driveprof
