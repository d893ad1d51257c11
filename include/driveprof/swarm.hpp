#ifndef DRIVEPROF_SWARM_HEADER
#define DRIVEPROF_SWARM_HEADER

#include "metrics_snapshot.hpp"
#include "error_code.hpp"
#include "connection.hpp"
#include "types.hpp"

#include <functional>
#include <memory>

namespace driveprof {

struct join_options
{
    // Accept inbound connections for the topic.
    bool server = false;
    // Dial out to find peers of the topic.
    bool client = true;
};

/** Peer-to-peer network membership. */
class swarm
{
public:

    using connection_handler = std::function<void(std::shared_ptr<connection>)>;
    using completion_handler = std::function<void(const error_code&)>;

    virtual ~swarm() = default;

    virtual void join(const key_type& topic, const join_options options) = 0;

    /** Every connection that completes its handshake is passed to `handler`. */
    virtual void on_connection(connection_handler handler) = 0;

    /** Closes every connection and stops looking for peers. */
    virtual void destroy(completion_handler handler) = 0;

    /** The counters may be cached for a short while (about a second). */
    virtual swarm_counters counters() = 0;
};

} // namespace driveprof

#endif // DRIVEPROF_SWARM_HEADER
