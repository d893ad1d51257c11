#ifndef DRIVEPROF_PEER_CHANNEL_HEADER
#define DRIVEPROF_PEER_CHANNEL_HEADER

#include "metrics_snapshot.hpp"
#include "message_parser.hpp"
#include "connection.hpp"
#include "settings.hpp"
#include "payload.hpp"
#include "types.hpp"
#include "log.hpp"

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace driveprof {

class core;

/** The name of the extension every channel announces itself with. */
constexpr char agent_extension_name[] = "driveprof/agent";

/**
 * Runs the replication protocol for every open core over a single connection.
 *
 * Each side numbers the cores it announces with a sync message; that number is the
 * channel field of every message it sends about that core. Thus the channel field
 * of an incoming message is interpreted in the remote's numbering, which it binds
 * to a core key with its sync message.
 *
 *  sync      [32 key][u64 length][u64 contiguous length]
 *  request   [u64 index]
 *  cancel    [u64 index]
 *  data      [u64 index][block]
 *  want      [u64 begin][u64 length]
 *  bitfield  [u64 begin][u64 number of bits][bits, most significant first]
 *  range     [u64 begin][u64 length]
 *  extension [u16 name length][name][payload]
 */
class peer_channel : public std::enable_shared_from_this<peer_channel>
{
public:

    using core_lookup = std::function<std::shared_ptr<core>(const key_type&)>;
    using close_handler = std::function<void(peer_channel&)>;

    // The channel field of messages that aren't about any core.
    static constexpr uint8_t no_channel = 0xff;

private:

    struct pending_sync
    {
        uint8_t channel;
        int64_t length;
        int64_t contiguous_length;
    };

    std::shared_ptr<connection> connection_;
    std::string remote_id_;
    std::string remote_address_;

    replication_settings settings_;

    // Shared by every channel of the store.
    std::shared_ptr<replication_counters> counters_;

    core_lookup lookup_;
    close_handler close_handler_;

    message_parser message_parser_;

    // Our channel numbers: the index of a core is its channel.
    std::vector<std::shared_ptr<core>> local_channels_;

    // The remote's channel numbers of the cores we replicate with it.
    std::map<uint8_t, std::shared_ptr<core>> remote_channels_;

    // Syncs for cores we haven't opened (yet). Once a core is opened, the remote's
    // last sync for it is applied.
    std::map<key_type, pending_sync> pending_syncs_;

    bool is_closed_ = false;

public:

    peer_channel(std::shared_ptr<connection> connection,
        const replication_settings& settings,
        std::shared_ptr<replication_counters> counters, core_lookup lookup);

    /**
     * Announces `cores` and ourselves to the remote and starts receiving.
     * `handler` is invoked once the connection is closed.
     */
    void start(const std::vector<std::shared_ptr<core>>& cores, close_handler handler);

    /** Announces a core opened after `start`. */
    void open_core(std::shared_ptr<core> c);

    /** Closes the connection, which detaches the channel from every core. */
    void close(const error_code& error = error_code());

    bool is_closed() const noexcept { return is_closed_; }
    const std::string& remote_id() const noexcept { return remote_id_; }

    void send_sync(const core& c);
    void send_request(const core& c, const block_index_t index);
    void send_cancel(const core& c, const block_index_t index);
    void send_want(const core& c, const int64_t begin, const int64_t length);

private:

    void receive();
    void on_received(const error_code& error, const size_t num_bytes_received);
    void on_disconnected();

    void handle_message(const message& msg);
    void handle_sync(const message& msg);
    void handle_request(core& c, const message& msg);
    void handle_cancel(core& c, const message& msg);
    void handle_data(core& c, const message& msg);
    void handle_want(core& c, const message& msg);
    void handle_bitfield(core& c, const message& msg);
    void handle_range(core& c, const message& msg);
    void handle_extension(const message& msg);

    void attach(const uint8_t channel, std::shared_ptr<core> c,
        const int64_t length, const int64_t contiguous_length);

    std::optional<uint8_t> local_channel(const core& c) const noexcept;

    /** Whether blocks [begin, begin + length) lie within the maximum core length. */
    bool is_in_bounds(const int64_t begin, const int64_t length) const noexcept;

    void send(const message_type type, const uint8_t channel, const payload& body);
    void send_extension();

    template<typename... Args>
    void log(const log::priority priority, const char* format, Args&&... args) const;
};

} // namespace driveprof

#endif // DRIVEPROF_PEER_CHANNEL_HEADER
