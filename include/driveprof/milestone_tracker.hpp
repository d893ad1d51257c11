#ifndef DRIVEPROF_MILESTONE_TRACKER_HEADER
#define DRIVEPROF_MILESTONE_TRACKER_HEADER

#include "time.hpp"

#include <optional>

namespace driveprof {

/**
 * Records the points in a session's lifetime that the report shows. Each milestone is
 * set at most once: the first call wins and later calls are no-ops, so a late or
 * repeated event can never move a milestone.
 *
 * The clock reading is a parameter so that tests can drive time explicitly.
 */
class milestone_tracker
{
    std::optional<time_point> start_time_;

    // Seconds elapsed since start when the milestone was reached.
    std::optional<double> metadata_found_at_;
    std::optional<double> fully_downloaded_at_;

public:

    void mark_start(const time_point now = clock::now());
    void mark_metadata_found(const time_point now = clock::now());
    void mark_fully_downloaded(const time_point now = clock::now());

    /**
     * Seconds elapsed since `mark_start`, with sub-millisecond resolution. 0 if the
     * session has not started.
     */
    double elapsed_since_start(const time_point now = clock::now()) const;

    bool has_started() const noexcept { return start_time_.has_value(); }
    const std::optional<time_point>& start_time() const noexcept { return start_time_; }

    const std::optional<double>& metadata_found_at() const noexcept
    {
        return metadata_found_at_;
    }

    const std::optional<double>& fully_downloaded_at() const noexcept
    {
        return fully_downloaded_at_;
    }
};

} // namespace driveprof

#endif // DRIVEPROF_MILESTONE_TRACKER_HEADER
