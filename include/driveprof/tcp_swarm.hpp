#ifndef DRIVEPROF_TCP_SWARM_HEADER
#define DRIVEPROF_TCP_SWARM_HEADER

#include "exponential_backoff.hpp"
#include "counter_cache.hpp"
#include "tcp_connection.hpp"
#include "settings.hpp"
#include "swarm.hpp"
#include "time.hpp"
#include "log.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>

namespace driveprof {

/**
 * A swarm over plain TCP. There is no peer discovery: a client dials the configured
 * bootstrap endpoints for every topic it joins, and a server accepts connections for
 * any topic it joined as a server.
 */
class tcp_swarm final : public swarm, public std::enable_shared_from_this<tcp_swarm>
{
public:

    using tcp = asio::ip::tcp;

private:

    /** Keeps dialing a bootstrap endpoint for a topic until the swarm is destroyed. */
    struct dialer
    {
        std::string host;
        std::string port;
        key_type topic;
        exponential_backoff backoff;
        deadline_timer retry_timer;
        deadline_timer connect_timer;
        std::shared_ptr<tcp::socket> socket;
        std::shared_ptr<tcp_connection> connection;
        int num_attempts = 0;

        dialer(asio::io_context& ios, std::string h, std::string p, const key_type& t,
            const swarm_settings& settings)
            : host(std::move(h))
            , port(std::move(p))
            , topic(t)
            , backoff(settings.reconnect_interval, settings.max_reconnect_interval)
            , retry_timer(ios)
            , connect_timer(ios)
        {}
    };

    asio::io_context& ios_;
    swarm_settings settings_;

    public_key_type public_key_;

    // Every topic joined so far, along with how it was joined.
    std::map<key_type, join_options> topics_;

    std::unique_ptr<tcp::acceptor> acceptor_;
    tcp::resolver resolver_;

    std::vector<std::unique_ptr<dialer>> dialers_;

    // Every connection that has completed its handshake and is still open, outbound
    // and inbound.
    std::vector<std::shared_ptr<tcp_connection>> connections_;

    connection_handler connection_handler_;

    std::shared_ptr<tcp_connection::byte_counters> byte_counters_;

    // Kernel counters of the connections that have been closed.
    tcp_info_sample closed_tcp_info_;

    int64_t num_attempted_ = 0;
    int64_t num_opened_ = 0;
    int64_t num_closed_ = 0;

    // Where the most recently connected remote saw us.
    std::optional<std::string> observed_address_;

    counter_cache<swarm_counters> counter_cache_;

    bool is_destroyed_ = false;

public:

    tcp_swarm(asio::io_context& ios, swarm_settings settings);

    void join(const key_type& topic, const join_options options) override;
    void on_connection(connection_handler handler) override;
    void destroy(completion_handler handler) override;
    swarm_counters counters() override;

    const public_key_type& public_key() const noexcept { return public_key_; }

    /**
     * The endpoint on which inbound connections are accepted. Throws
     * `std::system_error` if the swarm hasn't joined any topic as a server.
     */
    tcp::endpoint listen_endpoint() const;

    int num_connections() const noexcept { return int(connections_.size()); }

private:

    void listen();
    void accept();
    void on_accepted(const error_code& error, tcp::socket socket);

    void dial(dialer& d);
    void on_resolved(dialer& d, const error_code& error,
        const tcp::resolver::results_type& results);
    void on_dialed(dialer& d, const error_code& error);
    void redial(dialer& d);

    void on_handshake(std::shared_ptr<tcp_connection> connection,
        const error_code& error, dialer* d);
    void on_connection_closed(tcp_connection* connection, dialer* d,
        const error_code& error);

    swarm_counters collect_counters();

    template<typename... Args>
    void log(const log::priority priority, const char* format, Args&&... args) const;
};

} // namespace driveprof

#endif // DRIVEPROF_TCP_SWARM_HEADER
