#include "local_store.hpp"
#include "profiler_error.hpp"
#include "string_utils.hpp"
#include "peer_channel.hpp"
#include "random.hpp"
#include "drive.hpp"
#include "core.hpp"

#include <algorithm>
#include <filesystem>

#include <asio/post.hpp>

namespace driveprof {

local_store::local_store(asio::io_context& ios, replication_settings settings)
    : ios_(ios)
    , settings_(std::move(settings))
    , counters_(std::make_shared<replication_counters>())
    , counter_cache_(settings_.counter_cache_expiry)
{}

local_store::~local_store()
{
    for(auto& entry : cores_) { entry.second->close(); }
}

void local_store::open(const path& directory, completion_handler handler)
{
    error_code error;
    std::filesystem::create_directories(directory, error);
    if(!error)
    {
        directory_ = directory;
        is_open_ = true;
        log(log::priority::normal, "opened in %s", directory_.c_str());
    }
    asio::post(ios_, [handler = std::move(handler), error] { handler(error); });
}

std::shared_ptr<replicated_tree> local_store::open_drive(const key_type& key)
{
    auto metadata = open_core(key, false);
    auto d = std::make_shared<drive>(ios_, std::move(metadata), make_core_opener(),
        settings_.blob_block_size);
    drives_.emplace_back(d);
    return d;
}

std::shared_ptr<drive> local_store::create_drive()
{
    auto metadata = open_core(util::random_key(), true);
    auto blobs = open_core(util::random_key(), true);
    auto d = std::make_shared<drive>(ios_, std::move(metadata), make_core_opener(),
        settings_.blob_block_size);
    error_code error;
    d->initialize(std::move(blobs), error);
    if(error) { throw system_error(error); }
    drives_.emplace_back(d);
    return d;
}

std::function<std::shared_ptr<core>(const key_type&, const bool)>
local_store::make_core_opener()
{
    std::weak_ptr<local_store> weak_self = shared_from_this();
    return [weak_self](const key_type& key, const bool is_writable)
    {
        auto self = weak_self.lock();
        if(!self) { throw system_error(make_error_code(profiler_errc::store_not_open)); }
        return self->open_core(key, is_writable);
    };
}

std::shared_ptr<core> local_store::open_core(const key_type& key, const bool is_writable)
{
    if(!is_open_) { throw system_error(make_error_code(profiler_errc::store_not_open)); }
    if(auto c = find_core(key)) { return c; }

    auto c = std::make_shared<core>(ios_, key, is_writable, settings_, counters_,
        directory_ / util::to_hex(key));
    error_code error;
    c->open(error);
    if(error) { throw system_error(error); }
    cores_.emplace(key, c);
    log(log::priority::normal, "opened %s core %s", is_writable ? "writable" : "remote",
        util::to_hex(key).substr(0, 8).c_str());

    for(auto& channel : channels_) { channel->open_core(c); }
    return c;
}

std::shared_ptr<core> local_store::find_core(const key_type& key) const
{
    auto it = cores_.find(key);
    return it == cores_.end() ? nullptr : it->second;
}

void local_store::replicate(std::shared_ptr<connection> connection)
{
    if(!is_open_)
    {
        connection->close(make_error_code(profiler_errc::store_not_open));
        return;
    }

    std::weak_ptr<local_store> weak_self = shared_from_this();
    auto channel = std::make_shared<peer_channel>(std::move(connection), settings_,
        counters_, [weak_self](const key_type& key) -> std::shared_ptr<core>
        {
            auto self = weak_self.lock();
            return self ? self->find_core(key) : nullptr;
        });
    channels_.emplace_back(channel);

    std::vector<std::shared_ptr<core>> cores;
    cores.reserve(cores_.size());
    for(const auto& entry : cores_) { cores.emplace_back(entry.second); }
    channel->start(cores, [weak_self](peer_channel& channel)
        {
            if(auto self = weak_self.lock()) { self->on_channel_closed(channel); }
        });
}

void local_store::on_channel_closed(peer_channel& channel)
{
    channels_.erase(std::remove_if(channels_.begin(), channels_.end(),
        [&channel](const auto& c) { return c.get() == &channel; }), channels_.end());
}

replication_counters local_store::counters()
{
    return counter_cache_.get([this] { return *counters_; });
}

void local_store::close(completion_handler handler)
{
    if(is_open_)
    {
        log(log::priority::normal, "closing %i cores and %i channels",
            int(cores_.size()), int(channels_.size()));
        is_open_ = false;
        for(auto& channel : channels_) { channel->close(); }
        for(auto& entry : cores_) { entry.second->close(); }
    }
    asio::post(ios_, [handler = std::move(handler)] { handler(error_code()); });
}

template<typename... Args>
void local_store::log(const log::priority priority, const char* format,
    Args&&... args) const
{
    log::log_store("STORE", util::format(format, std::forward<Args>(args)...), priority);
}

} // namespace driveprof
