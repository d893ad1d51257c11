#ifndef DRIVEPROF_METRICS_SNAPSHOT_HEADER
#define DRIVEPROF_METRICS_SNAPSHOT_HEADER

#include "time.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <string>

namespace driveprof {

class swarm;
class store;

/**
 * Raw counters of the transport layer. These are monotonically non-decreasing over
 * the lifetime of a swarm. Packet counts are not available on every platform, in
 * which case they are left empty rather than reported as zero.
 */
struct transport_counters
{
    int64_t bytes_received = 0;
    int64_t bytes_transmitted = 0;
    std::optional<int64_t> packets_received;
    std::optional<int64_t> packets_transmitted;
    std::optional<int64_t> packets_dropped;
};

/** Outbound connection counts and congestion events of the swarm's connections. */
struct connection_counters
{
    int64_t attempted = 0;
    int64_t opened = 0;
    int64_t closed = 0;
    std::optional<int64_t> retransmission_timeouts;
    std::optional<int64_t> fast_recoveries;
    std::optional<int64_t> retransmits;
};

struct peer_address_info
{
    // Our address as observed by the other end of a connection, which is unknown
    // until we have a connection.
    std::optional<std::string> address;

    // Whether we are unreachable by inbound connections.
    bool is_firewalled = true;
};

/** The message types of the replication protocol, in wire order. */
enum class message_type : uint8_t
{
    sync,
    request,
    cancel,
    data,
    want,
    bitfield,
    range,
    extension
};

constexpr int num_message_types = 8;

const char* to_string(const message_type t) noexcept;

struct message_counter
{
    int64_t received = 0;
    int64_t transmitted = 0;
};

/**
 * Counters of a peer discovery layer (hole punching and DHT traffic). A swarm
 * without one leaves them empty.
 */
struct discovery_counters
{
    // Hole punches, by the NAT type of the remote.
    std::optional<int64_t> consistent_punches;
    std::optional<int64_t> random_punches;
    std::optional<int64_t> open_punches;

    std::optional<int64_t> total_queries;

    std::optional<message_counter> ping;
    std::optional<message_counter> ping_nat;
    std::optional<message_counter> down_hint;
    std::optional<message_counter> find_node;
};

struct replication_counters
{
    std::array<message_counter, num_message_types> messages{};

    // The number of times a block request was moved to another peer because the
    // original one did not answer in time.
    int64_t hotswaps = 0;

    message_counter& operator[](const message_type t) noexcept
    {
        return messages[static_cast<int>(t)];
    }

    const message_counter& operator[](const message_type t) const noexcept
    {
        return messages[static_cast<int>(t)];
    }
};

/** Everything a swarm reports about itself. */
struct swarm_counters
{
    transport_counters transport;
    connection_counters connections;
    peer_address_info address;
    discovery_counters discovery;
};

/**
 * An immutable read of every counter at one instant. A report tick captures one
 * snapshot and renders from it, so all sections agree with each other.
 */
struct metrics_snapshot
{
    time_point captured_at;
    transport_counters transport;
    connection_counters connections;
    peer_address_info address;
    discovery_counters discovery;
    replication_counters replication;
};

/** Reads the counters of `swarm` and `store`. */
metrics_snapshot capture_snapshot(
    swarm& swarm, store& store, const time_point now = clock::now());

} // namespace driveprof

#endif // DRIVEPROF_METRICS_SNAPSHOT_HEADER
