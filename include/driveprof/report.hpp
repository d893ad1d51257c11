#ifndef DRIVEPROF_REPORT_HEADER
#define DRIVEPROF_REPORT_HEADER

#include "remote_peer_tracker.hpp"
#include "milestone_tracker.hpp"
#include "metrics_snapshot.hpp"
#include "replicated_tree.hpp"
#include "rate.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace driveprof {

struct stream_progress
{
    int64_t contiguous_length = 0;
    int64_t length = 0;
};

/** The best replica of a stream among the connected peers. */
struct stream_availability
{
    int64_t max_remote_length = 0;
    int64_t max_remote_contiguous_length = 0;
    int num_peers = 0;
};

/** Folds the peers' lengths with `running_max`. */
stream_availability compute_availability(const std::vector<remote_peer_info>& peers);

/** Everything a report shows, read between two suspension points of the session. */
struct report_input
{
    double elapsed_seconds = 0.0;
    std::optional<double> metadata_found_at;
    std::optional<double> fully_downloaded_at;

    stream_progress metadata;
    // Empty while the blob stream does not exist yet.
    std::optional<stream_progress> blobs;

    metrics_snapshot snapshot;
    metrics_rates rates;

    stream_availability metadata_availability;
    std::optional<stream_availability> blob_availability;

    // Empty if remote peer tracking is disabled.
    std::optional<remote_peer_report> remote_peers;
};

struct report_options
{
    // Print our address instead of "xxx.xxx.xxx.xxx".
    bool show_address = false;
    // Print the per-message-type replication counters.
    bool show_detail = false;
};

/**
 * Assembles the input of a report from the live state of `tree` and the counters in
 * `snapshot`. Elapsed time is measured to the instant the snapshot was captured.
 * `tree` may be null if the session ends before the drive was opened.
 */
report_input collect_report_input(const replicated_tree* tree,
    const metrics_snapshot& snapshot, const milestone_tracker& milestones,
    const remote_peer_tracker& remote_peers);

/**
 * Renders the report as text. Pure: identical inputs produce identical output, and
 * nothing in it depends on the current time.
 */
std::string render_report(const report_input& input,
    const report_options& options = report_options());

} // namespace driveprof

#endif // DRIVEPROF_REPORT_HEADER
