#include "tcp_connection.hpp"
#include "replication_error.hpp"
#include "endian.hpp"
#include "string_utils.hpp"

#include <algorithm>
#include <cstring>
#include <iterator>

#include <asio/buffer.hpp>
#include <asio/error.hpp>
#include <asio/post.hpp>
#include <asio/read.hpp>
#include <asio/write.hpp>

namespace driveprof {

#define SHARED_THIS this, self(shared_from_this())

static constexpr char handshake_magic[8] = {'D', 'R', 'V', 'P', 'R', 'O', 'F', '1'};

tcp_connection::tcp_connection(tcp::socket socket,
    std::shared_ptr<byte_counters> counters, const public_key_type& local_key)
    : socket_(std::move(socket))
    , byte_counters_(std::move(counters))
    , local_key_(local_key)
    , handshake_timer_(socket_.get_executor())
{
    error_code ec;
    remote_endpoint_ = socket_.remote_endpoint(ec);
    if(!ec)
    {
        remote_address_ = remote_endpoint_.address().to_string() + ':'
            + std::to_string(remote_endpoint_.port());
    }
}

void write_endpoint(uint8_t* it, const asio::ip::tcp::endpoint& endpoint) noexcept
{
    const auto& address = endpoint.address();
    const auto v6 = address.is_v4()
        ? asio::ip::make_address_v6(asio::ip::v4_mapped, address.to_v4())
        : address.to_v6();
    const auto bytes = v6.to_bytes();
    std::copy(bytes.begin(), bytes.end(), it);
    endian::write_network<uint16_t>(it + bytes.size(), endpoint.port());
}

asio::ip::tcp::endpoint read_endpoint(const uint8_t* it)
{
    asio::ip::address_v6::bytes_type bytes;
    std::copy(it, it + bytes.size(), bytes.begin());
    const asio::ip::address_v6 v6(bytes);
    const auto port = endian::read_network<uint16_t>(it + bytes.size());
    if(v6.is_v4_mapped())
    {
        return {asio::ip::make_address_v4(asio::ip::v4_mapped, v6), port};
    }
    return {v6, port};
}

void tcp_connection::start_outbound_handshake(const key_type& topic,
    const duration timeout, handshake_handler handler)
{
    topic_ = topic;
    is_outbound_ = true;
    handshake_handler_ = std::move(handler);
    start_timer(handshake_timer_, timeout,
        [SHARED_THIS](const error_code& error)
        {
            if(error == asio::error::operation_aborted) { return; }
            close(make_error_code(asio::error::timed_out));
        });
    write_handshake();
    read_handshake([this](const key_type& topic) { return topic == topic_; });
}

void tcp_connection::start_inbound_handshake(topic_filter accept,
    const duration timeout, handshake_handler handler)
{
    handshake_handler_ = std::move(handler);
    start_timer(handshake_timer_, timeout,
        [SHARED_THIS](const error_code& error)
        {
            if(error == asio::error::operation_aborted) { return; }
            close(make_error_code(asio::error::timed_out));
        });
    read_handshake(std::move(accept));
}

std::vector<uint8_t> tcp_connection::make_handshake() const
{
    std::vector<uint8_t> handshake;
    handshake.reserve(swarm_handshake_size);
    handshake.insert(handshake.end(), std::begin(handshake_magic),
        std::end(handshake_magic));
    handshake.insert(handshake.end(), topic_.begin(), topic_.end());
    handshake.insert(handshake.end(), local_key_.begin(), local_key_.end());
    handshake.resize(swarm_handshake_size);
    write_endpoint(handshake.data() + swarm_handshake_size - endpoint_size,
        remote_endpoint_);
    return handshake;
}

void tcp_connection::write_handshake()
{
    async_write(make_handshake(), nullptr);
}

void tcp_connection::read_handshake(topic_filter accept)
{
    asio::async_read(socket_, asio::buffer(handshake_buffer_),
        [SHARED_THIS, accept = std::move(accept)](const error_code& error,
            size_t num_bytes_read)
        {
            byte_counters_->received += num_bytes_read;
            if(error)
            {
                if(error == asio::error::operation_aborted) { return; }
                close(error);
                return;
            }
            const auto ec = verify_handshake(accept);
            if(ec)
            {
                close(ec);
                return;
            }
            // The inbound side only learns the topic from the remote, so it replies
            // once it's verified.
            if(!is_outbound_) { write_handshake(); }
            complete_handshake(error_code());
        });
}

error_code tcp_connection::verify_handshake(const topic_filter& accept)
{
    const uint8_t* pos = handshake_buffer_.data();
    if(std::memcmp(pos, handshake_magic, sizeof handshake_magic) != 0)
    {
        return replication_errc::invalid_handshake;
    }
    pos += sizeof handshake_magic;

    key_type topic;
    std::copy(pos, pos + topic.size(), topic.begin());
    pos += topic.size();
    if(!accept(topic)) { return replication_errc::topic_mismatch; }

    std::copy(pos, pos + remote_key_.size(), remote_key_.begin());
    pos += remote_key_.size();
    if(remote_key_ == local_key_) { return replication_errc::self_connection; }

    const auto observed = read_endpoint(pos);
    if(!observed.address().is_unspecified())
    {
        observed_address_ = observed.address().to_string();
    }
    topic_ = topic;
    return error_code();
}

void tcp_connection::complete_handshake(const error_code& error)
{
    error_code ec;
    handshake_timer_.cancel(ec);
    if(handshake_handler_)
    {
        auto handler = std::move(handshake_handler_);
        handshake_handler_ = nullptr;
        handler(error);
    }
}

void tcp_connection::on_error(error_handler handler)
{
    error_handlers_.emplace_back(std::move(handler));
}

void tcp_connection::on_close(error_handler handler)
{
    close_handlers_.emplace_back(std::move(handler));
}

void tcp_connection::async_read_some(view<uint8_t> buffer, read_handler handler)
{
    if(!is_open_)
    {
        asio::post(socket_.get_executor(), [handler = std::move(handler)]
            { handler(asio::error::not_connected, 0); });
        return;
    }
    socket_.async_read_some(asio::buffer(buffer.data(), buffer.size()),
        [SHARED_THIS, handler = std::move(handler)](const error_code& error,
            size_t num_bytes_read)
        {
            byte_counters_->received += num_bytes_read;
            if(error == asio::error::eof)
            {
                // An orderly shutdown by the remote is not a failure.
                close();
            }
            else if(error && error != asio::error::operation_aborted)
            {
                close(error);
            }
            handler(error, num_bytes_read);
        });
}

void tcp_connection::async_write(std::vector<uint8_t> data, write_handler handler)
{
    if(!is_open_)
    {
        if(handler)
        {
            asio::post(socket_.get_executor(), [handler = std::move(handler)]
                { handler(asio::error::not_connected); });
        }
        return;
    }
    send_queue_.emplace_back(std::move(data), std::move(handler));
    if(!is_writing_) { send_next(); }
}

void tcp_connection::send_next()
{
    if(send_queue_.empty() || !is_open_) { return; }
    is_writing_ = true;
    const auto& front = send_queue_.front().first;
    asio::async_write(socket_, asio::buffer(front.data(), front.size()),
        [SHARED_THIS](const error_code& error, size_t num_bytes_written)
        {
            is_writing_ = false;
            byte_counters_->transmitted += num_bytes_written;
            if(send_queue_.empty()) { return; }
            auto handler = std::move(send_queue_.front().second);
            send_queue_.pop_front();
            if(error && error != asio::error::operation_aborted) { close(error); }
            if(handler) { handler(error); }
            if(!error) { send_next(); }
        });
}

std::optional<tcp_info_sample> tcp_connection::tcp_info()
{
    if(is_open_) { return read_tcp_info(socket_.native_handle()); }
    return final_tcp_info_;
}

void tcp_connection::close(const error_code& error)
{
    if(!is_open_) { return; }
    is_open_ = false;

    if(error)
    {
        log(log::priority::normal, "closing: %s", error.message().c_str());
    }
    else
    {
        log(log::priority::low, "closing");
    }

    final_tcp_info_ = read_tcp_info(socket_.native_handle());

    error_code ec;
    handshake_timer_.cancel(ec);
    socket_.shutdown(tcp::socket::shutdown_both, ec);
    socket_.close(ec);

    // Writes that never made it out are failed so their owners are not left hanging.
    // The front one is completed by its own handler with operation_aborted.
    for(auto it = is_writing_ ? std::next(send_queue_.begin()) : send_queue_.begin();
        it != send_queue_.end(); ++it)
    {
        if(it->second)
        {
            asio::post(socket_.get_executor(), [handler = std::move(it->second)]
                { handler(asio::error::operation_aborted); });
        }
    }
    if(is_writing_)
    {
        send_queue_.erase(std::next(send_queue_.begin()), send_queue_.end());
    }
    else
    {
        send_queue_.clear();
    }

    // Handlers run from a fresh stack, as close may be called from within a handler
    // of the very objects that are notified.
    auto self = shared_from_this();
    asio::post(socket_.get_executor(), [this, self, error]
        {
            complete_handshake(error ? error
                : make_error_code(asio::error::operation_aborted));
            if(error)
            {
                for(auto& handler : error_handlers_) { handler(error); }
            }
            for(auto& handler : close_handlers_) { handler(error); }
            error_handlers_.clear();
            close_handlers_.clear();
        });
}

template<typename... Args>
void tcp_connection::log(const log::priority priority, const char* format,
    Args&&... args) const
{
    log::log_peer(remote_address_, "CONNECTION",
        util::format(format, std::forward<Args>(args)...), priority);
}

} // namespace driveprof
