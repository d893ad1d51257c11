#ifndef DRIVEPROF_LOCAL_STORE_HEADER
#define DRIVEPROF_LOCAL_STORE_HEADER

#include "counter_cache.hpp"
#include "settings.hpp"
#include "store.hpp"
#include "log.hpp"

#include <map>
#include <memory>
#include <vector>

#include <asio/io_context.hpp>

namespace driveprof {

class core;
class drive;
class peer_channel;

/**
 * A store that keeps every core in its own directory under the store's directory,
 * named after the hex encoded core key, and replicates all open cores over every
 * connection it is given.
 */
class local_store final : public store, public std::enable_shared_from_this<local_store>
{
    asio::io_context& ios_;
    replication_settings settings_;

    path directory_;
    bool is_open_ = false;

    std::map<key_type, std::shared_ptr<core>> cores_;
    std::vector<std::shared_ptr<drive>> drives_;
    std::vector<std::shared_ptr<peer_channel>> channels_;

    // Message counts of every channel and the hotswaps of every core, over the
    // lifetime of the store.
    std::shared_ptr<replication_counters> counters_;
    counter_cache<replication_counters> counter_cache_;

public:

    local_store(asio::io_context& ios, replication_settings settings);
    ~local_store();

    void open(const path& directory, completion_handler handler) override;

    /** Throws `std::system_error` if the store isn't open or the core can't be. */
    std::shared_ptr<replicated_tree> open_drive(const key_type& key) override;

    /**
     * Creates a new, writable drive with random keys. Throws `std::system_error` if
     * the store isn't open or the cores can't be created.
     */
    std::shared_ptr<drive> create_drive();

    void replicate(std::shared_ptr<connection> connection) override;
    replication_counters counters() override;
    void close(completion_handler handler) override;

    bool is_open() const noexcept { return is_open_; }
    int num_channels() const noexcept { return int(channels_.size()); }

    /**
     * Returns the core with the given key, opening it (and announcing it on every
     * channel) if it isn't open yet. Throws `std::system_error` on failure.
     */
    std::shared_ptr<core> open_core(const key_type& key, const bool is_writable);

    /** Returns the core if it's open, null otherwise. */
    std::shared_ptr<core> find_core(const key_type& key) const;

private:

    std::function<std::shared_ptr<core>(const key_type&, const bool)> make_core_opener();
    void on_channel_closed(peer_channel& channel);

    template<typename... Args>
    void log(const log::priority priority, const char* format, Args&&... args) const;
};

} // namespace driveprof

#endif // DRIVEPROF_LOCAL_STORE_HEADER
