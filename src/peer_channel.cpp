#include "peer_channel.hpp"
#include "replication_error.hpp"
#include "string_utils.hpp"
#include "id_encoding.hpp"
#include "bitfield.hpp"
#include "payload_reader.hpp"
#include "core.hpp"

#include <algorithm>
#include <cstring>
#include <limits>
#include <stdexcept>

#include <asio/error.hpp>

namespace driveprof {

#define SHARED_THIS this, self(shared_from_this())

// The number of bytes we try to receive at once.
static constexpr int receive_chunk_size = 0x4000;

static const std::string agent_extension_payload = "driveprof";

peer_channel::peer_channel(std::shared_ptr<connection> connection,
    const replication_settings& settings, std::shared_ptr<replication_counters> counters,
    core_lookup lookup)
    : connection_(std::move(connection))
    , remote_id_(id_encoding::normalize(connection_->remote_public_key()))
    , remote_address_(connection_->remote_address())
    , settings_(settings)
    , counters_(std::move(counters))
    , lookup_(std::move(lookup))
{}

void peer_channel::start(const std::vector<std::shared_ptr<core>>& cores,
    close_handler handler)
{
    close_handler_ = std::move(handler);
    connection_->on_close([SHARED_THIS](const error_code&) { on_disconnected(); });
    log(log::priority::normal, "replicating %i cores with %s", int(cores.size()),
        remote_id_.c_str());
    send_extension();
    for(const auto& c : cores) { open_core(c); }
    receive();
}

void peer_channel::open_core(std::shared_ptr<core> c)
{
    if(is_closed_ || local_channel(*c)) { return; }
    if(local_channels_.size() >= no_channel)
    {
        log(log::priority::high, "too many cores, not announcing %s",
            util::to_hex(c->key()).c_str());
        return;
    }
    local_channels_.emplace_back(c);
    send_sync(*c);

    auto pending = pending_syncs_.find(c->key());
    if(pending != pending_syncs_.end())
    {
        const auto sync = pending->second;
        pending_syncs_.erase(pending);
        attach(sync.channel, std::move(c), sync.length, sync.contiguous_length);
    }
}

void peer_channel::close(const error_code& error)
{
    if(is_closed_) { return; }
    is_closed_ = true;
    connection_->close(error);
}

void peer_channel::on_disconnected()
{
    is_closed_ = true;
    log(log::priority::normal, "disconnected");
    for(auto& entry : remote_channels_) { entry.second->remove_peer(this); }
    remote_channels_.clear();
    local_channels_.clear();
    pending_syncs_.clear();
    if(close_handler_)
    {
        auto handler = std::move(close_handler_);
        close_handler_ = nullptr;
        handler(*this);
    }
}

void peer_channel::receive()
{
    if(is_closed_) { return; }
    view<uint8_t> buffer = message_parser_.get_receive_buffer(receive_chunk_size);
    connection_->async_read_some(buffer,
        [SHARED_THIS](const error_code& error, size_t num_bytes_received)
        { on_received(error, num_bytes_received); });
}

void peer_channel::on_received(const error_code& error, const size_t num_bytes_received)
{
    // The connection closes itself on a failed read, we just stop reading.
    if(error || is_closed_) { return; }
    message_parser_.record_received_bytes(int(num_bytes_received));

    while(!is_closed_)
    {
        const int length = message_parser_.current_message_length();
        if(length < 0) { break; }
        if(length > settings_.max_message_size)
        {
            close(make_error_code(replication_errc::message_too_big));
            return;
        }
        if(length < 2)
        {
            close(make_error_code(replication_errc::unknown_message));
            return;
        }
        if(!message_parser_.has_message()) { break; }
        handle_message(message_parser_.extract_message());
    }
    if(is_closed_) { return; }

    message_parser_.optimize_receive_space();
    receive();
}

void peer_channel::handle_message(const message& msg)
{
    if(msg.type >= num_message_types)
    {
        close(make_error_code(replication_errc::unknown_message));
        return;
    }
    const auto type = static_cast<message_type>(msg.type);
    ++(*counters_)[type].received;

    if(type == message_type::sync)
    {
        handle_sync(msg);
        return;
    }
    if(type == message_type::extension)
    {
        handle_extension(msg);
        return;
    }

    auto it = remote_channels_.find(msg.channel);
    if(it == remote_channels_.end())
    {
        close(make_error_code(replication_errc::unknown_channel));
        return;
    }
    // Keep the core alive even if handling the message detaches it.
    auto c = it->second;
    switch(type)
    {
    case message_type::request: handle_request(*c, msg); break;
    case message_type::cancel: handle_cancel(*c, msg); break;
    case message_type::data: handle_data(*c, msg); break;
    case message_type::want: handle_want(*c, msg); break;
    case message_type::bitfield: handle_bitfield(*c, msg); break;
    case message_type::range: handle_range(*c, msg); break;
    default: close(make_error_code(replication_errc::unknown_message));
    }
}

void peer_channel::handle_sync(const message& msg)
{
    payload_reader reader(msg.data);
    const auto key_bytes = reader.read_bytes(std::tuple_size<key_type>::value);
    const auto length = reader.read_int64();
    const auto contiguous_length = reader.read_int64();
    if(!reader.is_valid() || !reader.is_exhausted() || msg.channel == no_channel)
    {
        close(make_error_code(replication_errc::invalid_sync_message));
        return;
    }
    if(!is_in_bounds(0, length))
    {
        log(log::priority::high, "SYNC length %lli out of bounds",
            static_cast<long long>(length));
        close(make_error_code(replication_errc::out_of_bounds));
        return;
    }

    key_type key;
    std::copy(key_bytes.begin(), key_bytes.end(), key.begin());
    log(log::priority::low, "SYNC %s (channel %i): %lli / %lli",
        util::to_hex(key).substr(0, 8).c_str(), int(msg.channel),
        static_cast<long long>(contiguous_length), static_cast<long long>(length));

    auto c = lookup_(key);
    if(!c)
    {
        pending_syncs_[key] = pending_sync{msg.channel, length, contiguous_length};
        return;
    }
    if(!local_channel(*c)) { open_core(c); }
    attach(msg.channel, std::move(c), length, contiguous_length);
}

void peer_channel::attach(const uint8_t channel, std::shared_ptr<core> c,
    const int64_t length, const int64_t contiguous_length)
{
    auto& entry = remote_channels_[channel];
    if(entry && entry != c)
    {
        // The remote rebound its channel number to another core.
        entry->remove_peer(this);
    }
    if(entry != c)
    {
        entry = c;
        c->add_peer(shared_from_this(), remote_id_);
    }
    c->on_remote_sync(this, length, contiguous_length);
}

void peer_channel::handle_request(core& c, const message& msg)
{
    payload_reader reader(msg.data);
    const auto index = reader.read_int64();
    if(!reader.is_valid() || !reader.is_exhausted())
    {
        close(make_error_code(replication_errc::invalid_request_message));
        return;
    }
    const auto channel = local_channel(c);
    if(!channel) { return; }
    if(!c.has(index))
    {
        log(log::priority::low, "REQUEST %lli: don't have it",
            static_cast<long long>(index));
        return;
    }

    error_code error;
    auto block = c.read(index, error);
    if(error)
    {
        log(log::priority::high, "could not read block %lli: %s",
            static_cast<long long>(index), error.message().c_str());
        return;
    }
    payload data(8 + int(block.size()));
    data.u64(index).buffer(block);
    send(message_type::data, *channel, data);
}

void peer_channel::handle_cancel(core&, const message& msg)
{
    payload_reader reader(msg.data);
    const auto index = reader.read_int64();
    if(!reader.is_valid() || !reader.is_exhausted())
    {
        close(make_error_code(replication_errc::invalid_cancel_message));
        return;
    }
    // Requests are answered as soon as they arrive, so by now there is nothing left
    // to cancel.
    log(log::priority::low, "CANCEL %lli", static_cast<long long>(index));
}

void peer_channel::handle_data(core& c, const message& msg)
{
    payload_reader reader(msg.data);
    const auto index = reader.read_int64();
    if(!reader.is_valid())
    {
        close(make_error_code(replication_errc::invalid_data_message));
        return;
    }
    const auto error = c.on_block(this, index, reader.rest());
    if(error)
    {
        log(log::priority::high, "rejected block %lli: %s",
            static_cast<long long>(index), error.message().c_str());
        close(error);
    }
}

void peer_channel::handle_want(core& c, const message& msg)
{
    payload_reader reader(msg.data);
    const auto begin = reader.read_int64();
    const auto length = reader.read_int64();
    if(!reader.is_valid() || !reader.is_exhausted() || length <= 0
       || begin > std::numeric_limits<int64_t>::max() - length)
    {
        close(make_error_code(replication_errc::invalid_want_message));
        return;
    }
    if(!is_in_bounds(begin, length))
    {
        close(make_error_code(replication_errc::out_of_bounds));
        return;
    }
    const auto channel = local_channel(c);
    if(!channel) { return; }

    if(c.has_range(begin, begin + length))
    {
        payload range(16);
        range.u64(begin).u64(length);
        send(message_type::range, *channel, range);
        return;
    }
    const auto available = c.availability(begin, length);
    payload bits(16 + int(available.data().size()));
    bits.u64(begin).u64(available.size()).buffer(available.data());
    send(message_type::bitfield, *channel, bits);
}

void peer_channel::handle_bitfield(core& c, const message& msg)
{
    payload_reader reader(msg.data);
    const auto begin = reader.read_int64();
    const auto num_bits = reader.read_int64();
    if(!reader.is_valid())
    {
        close(make_error_code(replication_errc::invalid_bitfield_message));
        return;
    }
    if(!is_in_bounds(begin, num_bits))
    {
        close(make_error_code(replication_errc::out_of_bounds));
        return;
    }
    try
    {
        c.on_remote_bitfield(this, begin, bitfield::from_bytes(reader.rest(), num_bits));
    }
    catch(const std::invalid_argument&)
    {
        close(make_error_code(replication_errc::invalid_bitfield_message));
    }
}

void peer_channel::handle_range(core& c, const message& msg)
{
    payload_reader reader(msg.data);
    const auto begin = reader.read_int64();
    const auto length = reader.read_int64();
    if(!reader.is_valid() || !reader.is_exhausted()
       || begin > std::numeric_limits<int64_t>::max() - length)
    {
        close(make_error_code(replication_errc::invalid_range_message));
        return;
    }
    if(!is_in_bounds(begin, length))
    {
        log(log::priority::high, "RANGE [%lli, +%lli) out of bounds",
            static_cast<long long>(begin), static_cast<long long>(length));
        close(make_error_code(replication_errc::out_of_bounds));
        return;
    }
    c.on_remote_range(this, begin, length);
}

void peer_channel::handle_extension(const message& msg)
{
    payload_reader reader(msg.data);
    const auto name_length = reader.read<uint16_t>();
    const auto name = reader.read_bytes(name_length);
    if(!reader.is_valid())
    {
        close(make_error_code(replication_errc::invalid_extension_message));
        return;
    }
    const auto content = reader.rest();
    log(log::priority::low, "EXTENSION %s: %s",
        std::string(name.begin(), name.end()).c_str(),
        std::string(content.begin(), content.end()).c_str());
}

std::optional<uint8_t> peer_channel::local_channel(const core& c) const noexcept
{
    for(size_t i = 0; i < local_channels_.size(); ++i)
    {
        if(local_channels_[i].get() == &c) { return uint8_t(i); }
    }
    return std::nullopt;
}

bool peer_channel::is_in_bounds(const int64_t begin, const int64_t length) const noexcept
{
    const auto max = settings_.max_core_length;
    return begin >= 0 && length >= 0 && length <= max && begin <= max - length;
}

void peer_channel::send_sync(const core& c)
{
    const auto channel = local_channel(c);
    if(is_closed_ || !channel) { return; }
    payload sync(48);
    sync.buffer(c.key()).u64(c.length()).u64(c.contiguous_length());
    send(message_type::sync, *channel, sync);
}

void peer_channel::send_request(const core& c, const block_index_t index)
{
    const auto channel = local_channel(c);
    if(is_closed_ || !channel) { return; }
    payload request(8);
    request.u64(index);
    send(message_type::request, *channel, request);
}

void peer_channel::send_cancel(const core& c, const block_index_t index)
{
    const auto channel = local_channel(c);
    if(is_closed_ || !channel) { return; }
    payload cancel(8);
    cancel.u64(index);
    send(message_type::cancel, *channel, cancel);
}

void peer_channel::send_want(const core& c, const int64_t begin, const int64_t length)
{
    const auto channel = local_channel(c);
    if(is_closed_ || !channel) { return; }
    payload want(16);
    want.u64(begin).u64(length);
    send(message_type::want, *channel, want);
}

void peer_channel::send_extension()
{
    const std::string name = agent_extension_name;
    payload extension(2 + int(name.size() + agent_extension_payload.size()));
    extension.u16(uint16_t(name.size())).buffer(name).buffer(agent_extension_payload);
    send(message_type::extension, no_channel, extension);
}

void peer_channel::send(const message_type type, const uint8_t channel,
    const payload& body)
{
    payload frame(message_header_size + int(body.data.size()));
    frame.u32(uint32_t(2 + body.data.size()))
        .u8(static_cast<uint8_t>(type))
        .u8(channel)
        .buffer(body.data);
    ++(*counters_)[type].transmitted;
    connection_->async_write(std::move(frame.data), nullptr);
}

template<typename... Args>
void peer_channel::log(const log::priority priority, const char* format,
    Args&&... args) const
{
    log::log_peer(remote_address_, "CHANNEL",
        util::format(format, std::forward<Args>(args)...), priority);
}

} // namespace driveprof
