#include "core.hpp"
#include "replication_error.hpp"
#include "string_utils.hpp"
#include "peer_channel.hpp"

#include <algorithm>

#include <asio/error.hpp>
#include <asio/post.hpp>

namespace driveprof {

#define SHARED_THIS this, self(shared_from_this())

// How often outstanding requests are checked for timeouts.
static constexpr auto request_timer_interval = seconds(1);

core::core(asio::io_context& ios, const key_type& key, const bool is_writable,
    const replication_settings& settings, std::shared_ptr<replication_counters> counters,
    path directory)
    : ios_(ios)
    , key_(key)
    , is_writable_(is_writable)
    , settings_(settings)
    , counters_(std::move(counters))
    , storage_(std::move(directory))
    , request_timer_(ios)
{}

void core::open(error_code& error)
{
    storage_.open(error);
    if(!error) { log(log::priority::low, "opened in %s", storage_.directory().c_str()); }
}

void core::close()
{
    if(is_closed_) { return; }
    is_closed_ = true;
    log(log::priority::low, "closing with %i peers and %i downloads",
        int(peers_.size()), int(downloads_.size()));

    error_code ec;
    request_timer_.cancel(ec);
    for(auto& d : downloads_)
    {
        asio::post(ios_, [handler = std::move(d.handler)]
            { handler(make_error_code(asio::error::operation_aborted)); });
    }
    downloads_.clear();
    append_handlers_.clear();
    requests_.clear();
    peers_.clear();
    storage_.close();
}

std::vector<remote_peer_info> core::peers() const
{
    std::vector<remote_peer_info> peers;
    peers.reserve(peers_.size());
    for(const auto& p : peers_)
    {
        remote_peer_info info;
        info.remote_length = p.remote_length;
        info.remote_contiguous_length = p.remote_contiguous_length;
        info.remote_public_key = p.public_key;
        peers.emplace_back(std::move(info));
    }
    return peers;
}

void core::on_append(std::function<void()> handler)
{
    append_handlers_.emplace_back(std::move(handler));
}

bitfield core::availability(const int64_t begin, const int64_t num_bits) const
{
    const int64_t n = std::max<int64_t>(0, std::min(num_bits, length_ - begin));
    bitfield available(n);
    for(int64_t i = 0; i < n; ++i)
    {
        if(have_.test(begin + i)) { available.set(i); }
    }
    return available;
}

void core::append(const_view<uint8_t> block, error_code& error)
{
    error.clear();
    if(!is_writable_)
    {
        error = std::make_error_code(std::errc::operation_not_permitted);
        return;
    }
    const block_index_t index = length_;
    storage_.write(index, block, error);
    if(error) { return; }
    have_.set(index);
    update_contiguous_length();
    update_length(index + 1);
    schedule_sync();
}

std::vector<uint8_t> core::read(const block_index_t index, error_code& error) const
{
    return storage_.read(index, error);
}

void core::download(const int64_t begin, const int64_t end, completion_handler handler)
{
    if(is_closed_)
    {
        asio::post(ios_, [handler = std::move(handler)]
            { handler(make_error_code(asio::error::operation_aborted)); });
        return;
    }
    log(log::priority::low, "downloading [%lli, %lli)", static_cast<long long>(begin),
        static_cast<long long>(end));
    downloads_.push_back(range_download{begin, end, std::move(handler)});
    complete_downloads();
    request_blocks();
}

void core::add_peer(std::shared_ptr<peer_channel> channel, std::string public_key)
{
    if(is_closed_ || find_peer(channel.get())) { return; }
    core_peer peer;
    peer.channel = std::move(channel);
    peer.public_key = std::move(public_key);
    log(log::priority::normal, "peer %s attached", peer.public_key.c_str());
    peers_.emplace_back(std::move(peer));
}

void core::remove_peer(const peer_channel* channel)
{
    auto it = std::find_if(peers_.begin(), peers_.end(),
        [channel](const core_peer& p) { return p.channel.get() == channel; });
    if(it == peers_.end()) { return; }
    log(log::priority::normal, "peer %s detached", it->public_key.c_str());
    peers_.erase(it);

    // Whatever the peer owed us is requested again from the others.
    for(auto r = requests_.begin(); r != requests_.end();)
    {
        if(r->second.channel.get() == channel) { r = requests_.erase(r); }
        else { ++r; }
    }
    request_blocks();
}

void core::on_remote_sync(const peer_channel* channel, const int64_t length,
    const int64_t contiguous_length)
{
    auto peer = find_peer(channel);
    if(!peer) { return; }
    peer->remote_length = std::max(peer->remote_length, length);
    peer->remote_contiguous_length = std::max(peer->remote_contiguous_length,
        std::min(contiguous_length, length));
    update_length(length);
    if(peer->remote_length > peer->remote_contiguous_length
       && peer->remote_contiguous_length < length_)
    {
        // We only know the prefix the remote has, so ask about the rest.
        peer->channel->send_want(*this, peer->remote_contiguous_length,
            peer->remote_length - peer->remote_contiguous_length);
    }
    request_blocks();
}

void core::on_remote_range(const peer_channel* channel, const int64_t begin,
    const int64_t length)
{
    auto peer = find_peer(channel);
    if(!peer) { return; }
    peer->remote_length = std::max(peer->remote_length, begin + length);
    if(begin <= peer->remote_contiguous_length)
    {
        peer->remote_contiguous_length = std::max(
            peer->remote_contiguous_length, begin + length);
    }
    else
    {
        peer->available.set_range(begin, begin + length);
    }
    update_length(begin + length);
    request_blocks();
}

void core::on_remote_bitfield(const peer_channel* channel, const int64_t begin,
    const bitfield& available)
{
    auto peer = find_peer(channel);
    if(!peer) { return; }
    for(bitfield::size_type i = 0; i < available.size(); ++i)
    {
        if(available.test(i)) { peer->available.set(begin + i); }
    }
    request_blocks();
}

error_code core::on_block(const peer_channel* channel, const block_index_t index,
    const_view<uint8_t> block)
{
    if(is_closed_) { return make_error_code(replication_errc::store_closed); }
    if(index < 0 || index >= length_)
    {
        return make_error_code(replication_errc::unwanted_block);
    }

    auto request = requests_.find(index);
    if(request != requests_.end())
    {
        if(auto peer = find_peer(request->second.channel.get()))
        {
            --peer->num_outstanding;
        }
        requests_.erase(request);
    }
    if(auto peer = find_peer(channel))
    {
        // Sending it means the peer has it.
        peer->available.set(index);
    }

    // A late answer to a request that was moved to another peer.
    if(have_.test(index)) { return error_code(); }

    error_code error;
    storage_.write(index, block, error);
    if(error) { return error; }
    have_.set(index);

    update_contiguous_length();
    complete_downloads();
    request_blocks();
    schedule_sync();
    return error_code();
}

core::core_peer* core::find_peer(const peer_channel* channel) noexcept
{
    auto it = std::find_if(peers_.begin(), peers_.end(),
        [channel](const core_peer& p) { return p.channel.get() == channel; });
    return it == peers_.end() ? nullptr : &*it;
}

void core::update_length(const int64_t length)
{
    if(length <= length_) { return; }
    length_ = length;
    // Handlers are one-shot: anyone interested in the next append registers again.
    auto handlers = std::move(append_handlers_);
    append_handlers_.clear();
    for(auto& handler : handlers) { asio::post(ios_, std::move(handler)); }
}

void core::update_contiguous_length()
{
    contiguous_length_ = have_.first_unset(contiguous_length_);
}

void core::schedule_sync()
{
    if(is_sync_scheduled_ || is_closed_) { return; }
    is_sync_scheduled_ = true;
    asio::post(ios_, [SHARED_THIS]
        {
            is_sync_scheduled_ = false;
            if(is_closed_) { return; }
            for(auto& peer : peers_) { peer.channel->send_sync(*this); }
        });
}

void core::request_blocks()
{
    if(is_closed_ || peers_.empty()) { return; }
    for(const auto& d : downloads_)
    {
        const auto end = std::min(d.end, length_);
        for(auto index = d.begin; index < end; ++index)
        {
            if(have_.test(index) || requests_.count(index)) { continue; }
            // Every peer is busy, the next answer will get us here again.
            if(!has_free_request_slot()) { return; }
            request_block(index);
        }
    }
}

bool core::has_free_request_slot() const noexcept
{
    return std::any_of(peers_.begin(), peers_.end(), [this](const core_peer& p)
        { return p.num_outstanding < settings_.max_outstanding_requests; });
}

void core::request_block(const block_index_t index)
{
    core_peer* best = nullptr;
    for(auto& peer : peers_)
    {
        if(!peer.has(index)
           || peer.num_outstanding >= settings_.max_outstanding_requests)
        {
            continue;
        }
        if(!best || peer.num_outstanding < best->num_outstanding) { best = &peer; }
    }
    if(!best) { return; }

    best->channel->send_request(*this, index);
    ++best->num_outstanding;
    requests_[index] = pending_request{best->channel,
        clock::now() + settings_.request_timeout};
    start_request_timer();
}

void core::start_request_timer()
{
    if(is_request_timer_running_) { return; }
    is_request_timer_running_ = true;
    start_timer(request_timer_, request_timer_interval,
        [SHARED_THIS](const error_code& error) { on_request_timeout(error); });
}

void core::on_request_timeout(const error_code& error)
{
    is_request_timer_running_ = false;
    if(error == asio::error::operation_aborted || is_closed_) { return; }

    const auto now = clock::now();
    for(auto& entry : requests_)
    {
        const auto index = entry.first;
        auto& request = entry.second;
        if(request.deadline > now) { continue; }

        core_peer* current = find_peer(request.channel.get());
        core_peer* other = nullptr;
        for(auto& peer : peers_)
        {
            if(&peer == current || !peer.has(index)
               || peer.num_outstanding >= settings_.max_outstanding_requests)
            {
                continue;
            }
            if(!other || peer.num_outstanding < other->num_outstanding) { other = &peer; }
        }

        request.deadline = now + settings_.request_timeout;
        // Without anyone else to ask we keep waiting on the same peer.
        if(!other) { continue; }

        if(current)
        {
            --current->num_outstanding;
            current->channel->send_cancel(*this, index);
        }
        other->channel->send_request(*this, index);
        ++other->num_outstanding;
        request.channel = other->channel;
        ++counters_->hotswaps;
        log(log::priority::normal, "block %lli hotswapped to %s",
            static_cast<long long>(index), other->public_key.c_str());
    }

    if(!requests_.empty()) { start_request_timer(); }
}

void core::complete_downloads()
{
    for(auto it = downloads_.begin(); it != downloads_.end();)
    {
        if(have_.all_set(it->begin, it->end))
        {
            asio::post(ios_, [handler = std::move(it->handler)] { handler(error_code()); });
            it = downloads_.erase(it);
        }
        else
        {
            ++it;
        }
    }
}

template<typename... Args>
void core::log(const log::priority priority, const char* format, Args&&... args) const
{
    const auto key = util::to_hex(key_).substr(0, 8);
    log::log_store("CORE " + key, util::format(format, std::forward<Args>(args)...),
        priority);
}

} // namespace driveprof
