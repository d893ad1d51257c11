#ifndef DRIVEPROF_CONNECTION_HEADER
#define DRIVEPROF_CONNECTION_HEADER

#include "error_code.hpp"
#include "types.hpp"
#include "view.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace driveprof {

/**
 * A handshaked, bidirectional byte stream to a peer handed out by a swarm. The
 * replication protocol runs on top of it.
 */
class connection
{
public:

    using read_handler = std::function<void(const error_code&, size_t)>;
    using write_handler = std::function<void(const error_code&)>;
    using error_handler = std::function<void(const error_code&)>;

    virtual ~connection() = default;

    virtual const public_key_type& remote_public_key() const = 0;

    /** The topic (discovery key) both ends joined. */
    virtual const key_type& topic() const = 0;

    /** "address:port" of the remote end. */
    virtual std::string remote_address() const = 0;

    virtual bool is_open() const = 0;

    /**
     * Registers a handler invoked when the connection fails. A connection closed
     * without error (by either end) does not invoke it.
     */
    virtual void on_error(error_handler handler) = 0;

    /**
     * Registers a handler invoked exactly once when the connection closes, for any
     * reason.
     */
    virtual void on_close(error_handler handler) = 0;

    /** Reads at most `buffer.size()` bytes. The buffer must outlive the operation. */
    virtual void async_read_some(view<uint8_t> buffer, read_handler handler) = 0;

    /**
     * Queues `data` to be sent. Writes are sent in the order they were queued and
     * `handler` (which may be empty) is invoked once `data` is sent.
     */
    virtual void async_write(std::vector<uint8_t> data, write_handler handler) = 0;

    /**
     * Closes the connection, reporting `error` to the error handlers if it is set.
     * Closing an already closed connection is a no-op.
     */
    virtual void close(const error_code& error = error_code()) = 0;
};

} // namespace driveprof

#endif // DRIVEPROF_CONNECTION_HEADER
