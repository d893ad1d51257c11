#ifndef DRIVEPROF_TCP_CONNECTION_HEADER
#define DRIVEPROF_TCP_CONNECTION_HEADER

#include "connection.hpp"
#include "tcp_info.hpp"
#include "log.hpp"
#include "time.hpp"

#include <array>
#include <deque>
#include <memory>
#include <optional>
#include <utility>

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>

namespace driveprof {

/**
 * The swarm handshake, sent by both ends before anything else:
 *
 *  [8 bytes magic "DRVPROF1"][32 bytes topic][32 bytes public key]
 *  [18 bytes the remote's endpoint as seen by the sender]
 *
 * The last field tells each end the address it is reachable at from the outside.
 */
constexpr int endpoint_size = 16 + 2;
constexpr int swarm_handshake_size = 8 + 32 + 32 + endpoint_size;

/**
 * Writes `endpoint` to `it` as a 16 byte IPv6 address, IPv4 addresses being mapped,
 * followed by the port, both in network byte order.
 */
void write_endpoint(uint8_t* it, const asio::ip::tcp::endpoint& endpoint) noexcept;

/** The inverse of `write_endpoint`. A mapped IPv4 address is returned as IPv4. */
asio::ip::tcp::endpoint read_endpoint(const uint8_t* it);

/** A `connection` over a TCP socket. */
class tcp_connection final
    : public connection
    , public std::enable_shared_from_this<tcp_connection>
{
public:

    using tcp = asio::ip::tcp;
    using handshake_handler = std::function<void(const error_code&)>;
    using topic_filter = std::function<bool(const key_type&)>;

    /** Shared by every connection of a swarm. */
    struct byte_counters
    {
        int64_t received = 0;
        int64_t transmitted = 0;
    };

private:

    tcp::socket socket_;

    std::shared_ptr<byte_counters> byte_counters_;

    public_key_type local_key_;
    public_key_type remote_key_{};
    key_type topic_{};

    // Cached because the socket can't be asked once it's closed.
    tcp::endpoint remote_endpoint_;
    std::string remote_address_;

    // Our address as the remote saw it, learned from its handshake.
    std::string observed_address_;

    std::array<uint8_t, swarm_handshake_size> handshake_buffer_;
    handshake_handler handshake_handler_;
    deadline_timer handshake_timer_;

    // Writes are serialized: only the front of the queue is being sent at any time.
    std::deque<std::pair<std::vector<uint8_t>, write_handler>> send_queue_;
    bool is_writing_ = false;

    bool is_outbound_ = false;
    bool is_open_ = true;

    std::vector<error_handler> error_handlers_;
    std::vector<error_handler> close_handlers_;

    // The kernel's counters as last read before the socket was closed.
    std::optional<tcp_info_sample> final_tcp_info_;

public:

    tcp_connection(tcp::socket socket, std::shared_ptr<byte_counters> counters,
        const public_key_type& local_key);

    /**
     * Sends our handshake for `topic`, then waits for the remote's, which must be for
     * the same topic. `handler` is invoked exactly once.
     */
    void start_outbound_handshake(const key_type& topic, const duration timeout,
        handshake_handler handler);

    /**
     * Waits for the remote's handshake, then replies with ours if `accept` accepts
     * the topic the remote asked for.
     */
    void start_inbound_handshake(topic_filter accept, const duration timeout,
        handshake_handler handler);

    const public_key_type& remote_public_key() const override { return remote_key_; }
    const key_type& topic() const override { return topic_; }
    std::string remote_address() const override { return remote_address_; }
    bool is_open() const override { return is_open_; }

    /**
     * Our address as observed by the remote, or empty until the handshake completes.
     * Behind a NAT this is the public address, unlike the socket's local endpoint.
     */
    const std::string& observed_address() const noexcept { return observed_address_; }

    void on_error(error_handler handler) override;
    void on_close(error_handler handler) override;

    void async_read_some(view<uint8_t> buffer, read_handler handler) override;
    void async_write(std::vector<uint8_t> data, write_handler handler) override;

    void close(const error_code& error = error_code()) override;

    /**
     * The kernel's counters of the socket, read live while it is open, and as they
     * were at the time of closing afterwards.
     */
    std::optional<tcp_info_sample> tcp_info();

private:

    std::vector<uint8_t> make_handshake() const;
    void write_handshake();
    void read_handshake(topic_filter accept);
    error_code verify_handshake(const topic_filter& accept);
    void complete_handshake(const error_code& error);
    void send_next();

    template<typename... Args>
    void log(const log::priority priority, const char* format, Args&&... args) const;
};

} // namespace driveprof

#endif // DRIVEPROF_TCP_CONNECTION_HEADER
