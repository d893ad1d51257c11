#include "tcp_swarm.hpp"
#include "profiler_error.hpp"
#include "string_utils.hpp"
#include "random.hpp"

#include <algorithm>

#include <asio/connect.hpp>
#include <asio/error.hpp>
#include <asio/post.hpp>

namespace driveprof {

#define SHARED_THIS this, self(shared_from_this())

tcp_swarm::tcp_swarm(asio::io_context& ios, swarm_settings settings)
    : ios_(ios)
    , settings_(std::move(settings))
    , public_key_(util::random_key())
    , resolver_(ios)
    , byte_counters_(std::make_shared<tcp_connection::byte_counters>())
    , counter_cache_(settings_.counter_cache_expiry)
{}

void tcp_swarm::join(const key_type& topic, const join_options options)
{
    if(is_destroyed_)
    {
        throw system_error(make_error_code(profiler_errc::swarm_destroyed));
    }

    auto& joined = topics_[topic];
    joined.server = joined.server || options.server;
    joined.client = joined.client || options.client;

    if(options.server && !acceptor_) { listen(); }

    if(options.client)
    {
        for(const auto& endpoint : settings_.bootstrap)
        {
            const auto colon = endpoint.rfind(':');
            auto host = endpoint.substr(0, colon);
            auto port = endpoint.substr(colon + 1);
            const bool is_dialed = std::any_of(dialers_.begin(), dialers_.end(),
                [&](const auto& d)
                { return d->host == host && d->port == port && d->topic == topic; });
            if(is_dialed) { continue; }
            dialers_.emplace_back(std::make_unique<dialer>(
                ios_, std::move(host), std::move(port), topic, settings_));
            dial(*dialers_.back());
        }
    }
    counter_cache_.invalidate();
}

void tcp_swarm::on_connection(connection_handler handler)
{
    connection_handler_ = std::move(handler);
}

void tcp_swarm::listen()
{
    const tcp::endpoint endpoint(
        asio::ip::make_address(settings_.listen_address), settings_.listen_port);
    acceptor_ = std::make_unique<tcp::acceptor>(ios_, endpoint);
    log(log::priority::normal, "listening on %s:%i",
        acceptor_->local_endpoint().address().to_string().c_str(),
        int(acceptor_->local_endpoint().port()));
    accept();
}

tcp_swarm::tcp::endpoint tcp_swarm::listen_endpoint() const
{
    if(!acceptor_) { throw system_error(make_error_code(std::errc::not_connected)); }
    return acceptor_->local_endpoint();
}

void tcp_swarm::accept()
{
    acceptor_->async_accept(
        [SHARED_THIS](const error_code& error, tcp::socket socket)
        { on_accepted(error, std::move(socket)); });
}

void tcp_swarm::on_accepted(const error_code& error, tcp::socket socket)
{
    if(is_destroyed_ || error == asio::error::operation_aborted) { return; }
    if(error)
    {
        log(log::priority::high, "accept error: %s", error.message().c_str());
        accept();
        return;
    }

    auto connection = std::make_shared<tcp_connection>(
        std::move(socket), byte_counters_, public_key_);
    connection->start_inbound_handshake(
        [this](const key_type& topic)
        {
            auto it = topics_.find(topic);
            return it != topics_.end() && it->second.server;
        },
        settings_.connect_timeout,
        [SHARED_THIS, connection](const error_code& error)
        { on_handshake(connection, error, nullptr); });
    accept();
}

void tcp_swarm::dial(dialer& d)
{
    if(is_destroyed_) { return; }
    if((settings_.max_connection_attempts != values::unlimited)
       && (d.num_attempts >= settings_.max_connection_attempts))
    {
        log(log::priority::high, "giving up on %s:%s after %i attempts",
            d.host.c_str(), d.port.c_str(), d.num_attempts);
        return;
    }

    ++d.num_attempts;
    ++num_attempted_;
    counter_cache_.invalidate();
    log(log::priority::low, "dialing %s:%s (attempt %i)", d.host.c_str(),
        d.port.c_str(), d.num_attempts);

    resolver_.async_resolve(d.host, d.port,
        [SHARED_THIS, &d](const error_code& error,
            const tcp::resolver::results_type& results)
        { on_resolved(d, error, results); });
}

void tcp_swarm::on_resolved(dialer& d, const error_code& error,
    const tcp::resolver::results_type& results)
{
    if(is_destroyed_) { return; }
    if(error)
    {
        log(log::priority::normal, "could not resolve %s: %s", d.host.c_str(),
            error.message().c_str());
        redial(d);
        return;
    }

    d.socket = std::make_shared<tcp::socket>(ios_);
    asio::async_connect(*d.socket, results,
        [SHARED_THIS, &d](const error_code& error, const tcp::endpoint&)
        { on_dialed(d, error); });
    start_timer(d.connect_timer, settings_.connect_timeout,
        [SHARED_THIS, &d](const error_code& error)
        {
            if(error == asio::error::operation_aborted || !d.socket) { return; }
            error_code ec;
            d.socket->close(ec);
        });
}

void tcp_swarm::on_dialed(dialer& d, const error_code& error)
{
    error_code ec;
    d.connect_timer.cancel(ec);
    if(is_destroyed_) { return; }
    if(error || !d.socket || !d.socket->is_open())
    {
        log(log::priority::normal, "could not connect to %s:%s: %s", d.host.c_str(),
            d.port.c_str(), error ? error.message().c_str() : "timed out");
        d.socket.reset();
        redial(d);
        return;
    }

    auto connection = std::make_shared<tcp_connection>(
        std::move(*d.socket), byte_counters_, public_key_);
    d.socket.reset();
    d.connection = connection;
    ++num_opened_;
    counter_cache_.invalidate();
    connection->start_outbound_handshake(d.topic, settings_.connect_timeout,
        [SHARED_THIS, connection, &d](const error_code& error)
        { on_handshake(connection, error, &d); });
}

void tcp_swarm::redial(dialer& d)
{
    if(is_destroyed_) { return; }
    start_timer(d.retry_timer, d.backoff(),
        [SHARED_THIS, &d](const error_code& error)
        {
            if(error == asio::error::operation_aborted) { return; }
            dial(d);
        });
}

void tcp_swarm::on_handshake(std::shared_ptr<tcp_connection> connection,
    const error_code& error, dialer* d)
{
    if(error)
    {
        log(log::priority::normal, "handshake with %s failed: %s",
            connection->remote_address().c_str(), error.message().c_str());
        if(d)
        {
            ++num_closed_;
            d->connection.reset();
            redial(*d);
        }
        return;
    }
    if(is_destroyed_)
    {
        connection->close();
        return;
    }

    if(!connection->observed_address().empty())
    {
        observed_address_ = connection->observed_address();
    }
    if(d) { d->backoff.reset(); }

    log(log::priority::normal, "%s connection with %s", d ? "outbound" : "inbound",
        connection->remote_address().c_str());
    connections_.emplace_back(connection);
    counter_cache_.invalidate();

    auto self = shared_from_this();
    connection->on_close([this, self, c = connection.get(), d](const error_code& error)
        { on_connection_closed(c, d, error); });

    if(connection_handler_)
    {
        connection_handler_(std::move(connection));
    }
    else
    {
        connection->close();
    }
}

void tcp_swarm::on_connection_closed(tcp_connection* connection, dialer* d,
    const error_code& error)
{
    auto it = std::find_if(connections_.begin(), connections_.end(),
        [connection](const auto& c) { return c.get() == connection; });
    if(it == connections_.end()) { return; }

    if(auto info = connection->tcp_info()) { closed_tcp_info_ += *info; }
    connections_.erase(it);
    counter_cache_.invalidate();

    if(d)
    {
        ++num_closed_;
        d->connection.reset();
        log(log::priority::normal, "connection to %s:%s closed%s%s", d->host.c_str(),
            d->port.c_str(), error ? ": " : "", error ? error.message().c_str() : "");
        redial(*d);
    }
}

void tcp_swarm::destroy(completion_handler handler)
{
    if(!is_destroyed_)
    {
        is_destroyed_ = true;
        log(log::priority::normal, "destroying swarm with %i connections",
            num_connections());

        error_code ec;
        resolver_.cancel();
        if(acceptor_) { acceptor_->close(ec); }
        for(auto& d : dialers_)
        {
            d->retry_timer.cancel(ec);
            d->connect_timer.cancel(ec);
            if(d->socket) { d->socket->close(ec); }
        }
        // Closing removes the connection from the list, so iterate a copy.
        auto connections = connections_;
        for(auto& c : connections) { c->close(); }
        for(auto& d : dialers_)
        {
            if(d->connection) { d->connection->close(); }
        }
    }
    asio::post(ios_, [handler = std::move(handler)] { handler(error_code()); });
}

swarm_counters tcp_swarm::counters()
{
    return counter_cache_.get([this] { return collect_counters(); });
}

swarm_counters tcp_swarm::collect_counters()
{
    swarm_counters counters;
    counters.transport.bytes_received = byte_counters_->received;
    counters.transport.bytes_transmitted = byte_counters_->transmitted;

    if(is_tcp_info_supported())
    {
        tcp_info_sample total = closed_tcp_info_;
        for(const auto& c : connections_)
        {
            if(auto info = c->tcp_info()) { total += *info; }
        }
        counters.transport.packets_received = total.segments_received;
        counters.transport.packets_transmitted = total.segments_transmitted;
        counters.connections.retransmits = total.retransmits;
    }

    counters.connections.attempted = num_attempted_;
    counters.connections.opened = num_opened_;
    counters.connections.closed = num_closed_;

    counters.address.address = observed_address_;
    counters.address.is_firewalled = std::none_of(topics_.begin(), topics_.end(),
        [](const auto& t) { return t.second.server; });
    return counters;
}

template<typename... Args>
void tcp_swarm::log(const log::priority priority, const char* format,
    Args&&... args) const
{
    log::log_swarm("TCP", util::format(format, std::forward<Args>(args)...), priority);
}

} // namespace driveprof
