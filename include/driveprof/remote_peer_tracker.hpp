#ifndef DRIVEPROF_REMOTE_PEER_TRACKER_HEADER
#define DRIVEPROF_REMOTE_PEER_TRACKER_HEADER

#include "replicated_tree.hpp"
#include "types.hpp"
#include "path.hpp"

#include <cstdint>
#include <istream>
#include <string>
#include <vector>

namespace driveprof {

enum class replication_status
{
    downloading,
    done
};

inline const char* to_string(const replication_status s) noexcept
{
    return s == replication_status::done ? "done" : "downloading";
}

/** A peer is done with a stream once it holds every block of it, without gaps. */
inline bool is_done(const remote_peer_info& peer) noexcept
{
    return peer.remote_length > 0
        && peer.remote_contiguous_length == peer.remote_length;
}

struct peer_classification
{
    std::string id;
    stream_id stream;
    replication_status status;
    int64_t contiguous_length;
    int64_t length;
};

/**
 * Classifies the live peers of a stream that are expected. The result follows the
 * order of `expected`; an expected peer that is not in `peers` is omitted (it is
 * merely not visible right now), as is every peer that is not expected. If a peer is
 * connected more than once, its first entry is used.
 */
std::vector<peer_classification> classify(const std::vector<remote_peer_info>& peers,
    const std::vector<std::string>& expected, const stream_id stream);

struct remote_peer_report
{
    // Metadata stream entries first, then blob stream entries.
    std::vector<peer_classification> peers;
    int num_expected = 0;
    int num_done = 0;
    bool all_done = false;
};

/**
 * Cross-references a fixed list of expected peers with the live peer lists of the
 * two streams of a drive on every report tick. With no expected peers it is disabled
 * and the report has no section for it.
 */
class remote_peer_tracker
{
    std::vector<std::string> expected_;

public:

    remote_peer_tracker() = default;
    explicit remote_peer_tracker(std::vector<std::string> expected);

    bool is_enabled() const noexcept { return !expected_.empty(); }
    const std::vector<std::string>& expected() const noexcept { return expected_; }

    /**
     * `blob_peers` may be null if the blob stream does not exist yet, in which case
     * no peer can be done with it.
     */
    remote_peer_report evaluate(const std::vector<remote_peer_info>& metadata_peers,
        const std::vector<remote_peer_info>* blob_peers) const;
};

/**
 * Parses a newline separated list of peer public keys. Blank lines and lines whose
 * first non-blank character is '#' are skipped, each entry is normalized and
 * duplicates are dropped (the first occurrence keeps its position).
 *
 * Throws `std::invalid_argument` naming the line number of the first malformed entry.
 */
std::vector<std::string> parse_expected_peers(std::istream& in);

/** Same as above but reads `file`, also throwing if it cannot be opened. */
std::vector<std::string> load_expected_peers(const path& file);

} // namespace driveprof

#endif // DRIVEPROF_REMOTE_PEER_TRACKER_HEADER
