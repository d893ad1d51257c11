#ifndef DRIVEPROF_STORE_HEADER
#define DRIVEPROF_STORE_HEADER

#include "metrics_snapshot.hpp"
#include "replicated_tree.hpp"
#include "error_code.hpp"
#include "connection.hpp"
#include "types.hpp"
#include "path.hpp"

#include <functional>
#include <memory>

namespace driveprof {

/** Local storage of replicated streams, and the replication protocol on top of it. */
class store
{
public:

    using completion_handler = std::function<void(const error_code&)>;

    virtual ~store() = default;

    /** Opens (creating if needed) the storage in `directory`. */
    virtual void open(const path& directory, completion_handler handler) = 0;

    /** Must be called after `open` completed. */
    virtual std::shared_ptr<replicated_tree> open_drive(const key_type& key) = 0;

    /** Replicates every open stream over `connection`. */
    virtual void replicate(std::shared_ptr<connection> connection) = 0;

    /** The counters may be cached for a short while (about a second). */
    virtual replication_counters counters() = 0;

    /** Stops replicating and releases the storage. */
    virtual void close(completion_handler handler) = 0;
};

} // namespace driveprof

#endif // DRIVEPROF_STORE_HEADER
