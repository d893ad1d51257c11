#ifndef DRIVEPROF_CORE_HEADER
#define DRIVEPROF_CORE_HEADER

#include "metrics_snapshot.hpp"
#include "replicated_tree.hpp"
#include "core_storage.hpp"
#include "settings.hpp"
#include "bitfield.hpp"
#include "types.hpp"
#include "time.hpp"
#include "log.hpp"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <asio/io_context.hpp>

namespace driveprof {

class peer_channel;

/**
 * A single replicated append-only log of blocks (a "core"). A writable core is
 * appended to locally, a read-only core learns about its blocks from peers and
 * downloads the ranges it is asked to.
 *
 * The length of a core is the largest length any attached peer announced, or the
 * number of locally appended blocks, whichever is greater. It never decreases.
 */
class core final : public replicated_stream, public std::enable_shared_from_this<core>
{
public:

    using completion_handler = std::function<void(const error_code&)>;

private:

    /** What we know about a peer replicating this core with us. */
    struct core_peer
    {
        std::shared_ptr<peer_channel> channel;
        std::string public_key;

        int64_t remote_length = 0;
        int64_t remote_contiguous_length = 0;

        // Blocks past the remote's contiguous length that it told us it has.
        bitfield available;

        // The number of our requests the peer has yet to answer.
        int num_outstanding = 0;

        bool has(const block_index_t index) const noexcept
        {
            return index < remote_contiguous_length || available.test(index);
        }
    };

    struct pending_request
    {
        std::shared_ptr<peer_channel> channel;
        time_point deadline;
    };

    struct range_download
    {
        int64_t begin;
        int64_t end;
        completion_handler handler;
    };

    asio::io_context& ios_;
    key_type key_;
    bool is_writable_;
    replication_settings settings_;

    // Shared by every core of the store, only hotswaps are counted here.
    std::shared_ptr<replication_counters> counters_;

    core_storage storage_;

    bitfield have_;
    int64_t length_ = 0;
    int64_t contiguous_length_ = 0;

    std::vector<core_peer> peers_;

    std::vector<std::function<void()>> append_handlers_;

    // Block index to the request in flight for it. At most one request is in flight
    // for a block.
    std::map<block_index_t, pending_request> requests_;

    std::vector<range_download> downloads_;

    deadline_timer request_timer_;
    bool is_request_timer_running_ = false;

    // Progress is announced to peers at most once per round of the event loop.
    bool is_sync_scheduled_ = false;

    bool is_closed_ = false;

public:

    core(asio::io_context& ios, const key_type& key, const bool is_writable,
        const replication_settings& settings,
        std::shared_ptr<replication_counters> counters, path directory);

    /** Opens the core's storage. */
    void open(error_code& error);

    /** Fails pending downloads with operation_aborted and releases the storage. */
    void close();

    const key_type& key() const noexcept { return key_; }
    bool is_writable() const noexcept { return is_writable_; }

    int64_t length() const override { return length_; }
    int64_t contiguous_length() const override { return contiguous_length_; }
    std::vector<remote_peer_info> peers() const override;
    void on_append(std::function<void()> handler) override;

    bool has(const block_index_t index) const noexcept { return have_.test(index); }
    bool has_range(const int64_t begin, const int64_t end) const noexcept
    {
        return have_.all_set(begin, end);
    }

    /**
     * Our availability of the blocks [begin, begin + num_bits), with bits past our
     * length cleared.
     */
    bitfield availability(const int64_t begin, const int64_t num_bits) const;

    /** Appends a block to a writable core. */
    void append(const_view<uint8_t> block, error_code& error);

    std::vector<uint8_t> read(const block_index_t index, error_code& error) const;

    /**
     * Downloads blocks [begin, end) from peers, waiting for peers that have them for
     * as long as it takes. `handler` is invoked once all are held locally.
     */
    void download(const int64_t begin, const int64_t end, completion_handler handler);

    // The following are invoked by the channels replicating this core.

    void add_peer(std::shared_ptr<peer_channel> channel, std::string public_key);
    void remove_peer(const peer_channel* channel);

    void on_remote_sync(const peer_channel* channel, const int64_t length,
        const int64_t contiguous_length);
    void on_remote_range(const peer_channel* channel, const int64_t begin,
        const int64_t length);
    void on_remote_bitfield(const peer_channel* channel, const int64_t begin,
        const bitfield& available);

    /**
     * Stores a block sent by a peer. A block past our length was never announced,
     * so it is rejected with `replication_errc::unwanted_block`.
     */
    error_code on_block(const peer_channel* channel, const block_index_t index,
        const_view<uint8_t> block);

private:

    core_peer* find_peer(const peer_channel* channel) noexcept;

    void update_length(const int64_t length);
    void update_contiguous_length();
    void schedule_sync();

    void request_blocks();
    bool has_free_request_slot() const noexcept;
    void request_block(const block_index_t index);
    void start_request_timer();
    void on_request_timeout(const error_code& error);

    void complete_downloads();

    template<typename... Args>
    void log(const log::priority priority, const char* format, Args&&... args) const;
};

} // namespace driveprof

#endif // DRIVEPROF_CORE_HEADER
