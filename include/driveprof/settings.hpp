#ifndef DRIVEPROF_SETTINGS_HEADER
#define DRIVEPROF_SETTINGS_HEADER

#include "log.hpp"
#include "path.hpp"
#include "time.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace driveprof {
namespace values {

constexpr int unlimited = -1;
constexpr int none = -2;

} // values

/** Settings of a single profiling session. */
struct session_settings
{
    // The drive to download, as 64 hex digits or 52 z-base32 characters. Required
    // unless the local test network is used, in which case it is filled in with
    // the key of the seeded drive.
    std::string drive_key;

    // The report is printed every this many seconds once the metadata has been
    // found, and once more when the session ends.
    milliseconds report_interval{seconds(10)};

    // Print the externally observed address instead of a redacted placeholder.
    // Off by default so as not to leak one's network identity in shared logs.
    bool show_address = false;

    // Include the per-message-type replication counters in the report.
    bool show_detail = false;

    // The session downloads into a fresh directory created under this root. If
    // empty, the system's temporary directory is used.
    path workspace_root;

    // The name of the session's workspace directory. If empty, a random one of the
    // form "driveprof-tmp-<hex>" is chosen.
    std::string workspace_name;

    // An optional newline separated list of peer public keys whose replication
    // progress is tracked. Blank lines and lines starting with '#' are skipped.
    path remote_peers_file;

    // The normalized identities loaded from `remote_peers_file`. Filled in by
    // `fill_in_defaults`, but may also be set directly.
    std::vector<std::string> expected_peers;
};

/** Settings of the TCP swarm. */
struct swarm_settings
{
    // The endpoints, as "host:port", a client swarm connects to.
    std::vector<std::string> bootstrap;

    // The address and port on which a server swarm accepts connections. A port of 0
    // lets the OS pick one.
    std::string listen_address = "0.0.0.0";
    uint16_t listen_port = 0;

    // How long to wait before redialing a bootstrap endpoint whose connection failed
    // or was closed. Successive failures back off exponentially, up to
    // `max_reconnect_interval`.
    seconds reconnect_interval{1};
    seconds max_reconnect_interval{16};

    // This is the number of seconds we wait for establishing a connection (including
    // the handshake) with a peer.
    seconds connect_timeout{10};

    // The number of times a bootstrap endpoint is dialed before it is given up on.
    int max_connection_attempts = values::unlimited;

    // Counters are cached for this long, so that a report reads one consistent set.
    milliseconds counter_cache_expiry{1000};
};

/** Settings of the replication protocol. */
struct replication_settings
{
    // A request that has not been answered in this long is re-issued to another peer
    // that has the block, if there is one (which counts as a hotswap).
    seconds request_timeout{5};

    // The number of outstanding block requests we allow ourselves to have with a
    // single peer.
    int max_outstanding_requests = 16;

    // Frames larger than this are a protocol violation. Must fit a full blob block
    // plus the data message header.
    int max_message_size = 0x100000;

    // Files are split into blocks of this size in the blob core.
    int blob_block_size = 0x10000;

    // A peer announcing a core longer than this many blocks (or blocks past it) is
    // disconnected. This bounds what a peer can make us track and request.
    int64_t max_core_length = int64_t(1) << 24;

    // Replication counters are cached for this long.
    milliseconds counter_cache_expiry{1000};
};

/** Settings of the in-process test network started with `--local`. */
struct testnet_settings
{
    bool enabled = false;

    // The seeded drive has this many files, each of this many bytes.
    int num_files = 2000;
    int file_size = 51200;
};

struct log_settings
{
    // Messages below this priority are discarded.
    log::priority min_priority = log::priority::normal;

    // If set, log lines are appended to this file as well.
    path log_file;

    // Whether log lines are also written to stdout (where the reports go).
    bool log_to_stdout = true;
};

struct profiler_settings
{
    session_settings session;
    swarm_settings swarm;
    replication_settings replication;
    testnet_settings testnet;
    log_settings log;
};

/**
 * Each throws `std::invalid_argument` naming the offending field if the settings are
 * not usable.
 */
void verify(const session_settings& s);
void verify(const swarm_settings& s);
void verify(const replication_settings& s);
void verify(const testnet_settings& s);
void verify(const profiler_settings& s);

/**
 * Resolves the derived fields: the workspace root and name, and the expected peers
 * from `remote_peers_file`. Throws `std::invalid_argument` if the peer list cannot
 * be loaded.
 */
void fill_in_defaults(session_settings& s);
void fill_in_defaults(profiler_settings& s);

} // driveprof

#endif // DRIVEPROF_SETTINGS_HEADER
