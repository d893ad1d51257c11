#include "metrics_snapshot.hpp"
#include "swarm.hpp"
#include "store.hpp"

namespace driveprof {

const char* to_string(const message_type t) noexcept
{
    switch(t)
    {
    case message_type::sync: return "Sync";
    case message_type::request: return "Request";
    case message_type::cancel: return "Cancel";
    case message_type::data: return "Data";
    case message_type::want: return "Want";
    case message_type::bitfield: return "Bitfield";
    case message_type::range: return "Range";
    case message_type::extension: return "Extension";
    default: return "Unknown";
    }
}

metrics_snapshot capture_snapshot(swarm& swarm, store& store, const time_point now)
{
    const swarm_counters s = swarm.counters();
    metrics_snapshot snapshot;
    snapshot.captured_at = now;
    snapshot.transport = s.transport;
    snapshot.connections = s.connections;
    snapshot.address = s.address;
    snapshot.discovery = s.discovery;
    snapshot.replication = store.counters();
    return snapshot;
}

} // namespace driveprof
