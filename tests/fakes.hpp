#ifndef DRIVEPROF_TESTS_FAKES_HEADER
#define DRIVEPROF_TESTS_FAKES_HEADER

#include "driveprof/replicated_tree.hpp"
#include "driveprof/connection.hpp"
#include "driveprof/workspace.hpp"
#include "driveprof/swarm.hpp"
#include "driveprof/store.hpp"

#include <algorithm>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <asio/error.hpp>
#include <asio/io_context.hpp>
#include <asio/post.hpp>

namespace driveprof {
namespace test {

struct fake_stream : public replicated_stream
{
    int64_t length_ = 0;
    int64_t contiguous_length_ = 0;
    std::vector<remote_peer_info> peers_;
    std::vector<std::function<void()>> append_handlers_;

    int64_t length() const override { return length_; }
    int64_t contiguous_length() const override { return contiguous_length_; }
    std::vector<remote_peer_info> peers() const override { return peers_; }

    void on_append(std::function<void()> handler) override
    {
        append_handlers_.push_back(std::move(handler));
    }

    /** Grows the stream and fires the pending append handlers once. */
    void append(const int64_t n)
    {
        length_ += n;
        auto handlers = std::move(append_handlers_);
        append_handlers_.clear();
        for(auto& h : handlers) { h(); }
    }
};

struct fake_tree : public replicated_tree
{
    asio::io_context& ios;
    key_type key_{};
    key_type discovery_key_{};
    fake_stream metadata_;
    std::unique_ptr<fake_stream> blobs_;
    error_code ready_error;

    int num_downloads = 0;
    completion_handler download_handler;

    explicit fake_tree(asio::io_context& ios) : ios(ios)
    {
        discovery_key_.fill(7);
    }

    void ready(completion_handler handler) override
    {
        asio::post(ios, [this, handler = std::move(handler)] { handler(ready_error); });
    }

    const key_type& key() const override { return key_; }
    const key_type& discovery_key() const override { return discovery_key_; }
    int64_t version() const override { return metadata_.length_; }
    replicated_stream& metadata() override { return metadata_; }
    const replicated_stream& metadata() const override { return metadata_; }
    replicated_stream* blobs() override { return blobs_.get(); }
    const replicated_stream* blobs() const override { return blobs_.get(); }

    void download(const std::string&, completion_handler handler) override
    {
        ++num_downloads;
        download_handler = std::move(handler);
    }
};

struct fake_store : public store
{
    asio::io_context& ios;
    std::shared_ptr<fake_tree> tree;
    error_code open_error;
    replication_counters counters_;

    int num_opens = 0;
    int num_closes = 0;
    int num_replicated = 0;

    fake_store(asio::io_context& ios, std::shared_ptr<fake_tree> tree)
        : ios(ios), tree(std::move(tree))
    {}

    void open(const path&, completion_handler handler) override
    {
        ++num_opens;
        asio::post(ios, [this, handler = std::move(handler)] { handler(open_error); });
    }

    std::shared_ptr<replicated_tree> open_drive(const key_type& key) override
    {
        tree->key_ = key;
        return tree;
    }

    void replicate(std::shared_ptr<connection>) override { ++num_replicated; }
    replication_counters counters() override { return counters_; }

    void close(completion_handler handler) override
    {
        ++num_closes;
        asio::post(ios, [handler = std::move(handler)] { handler(error_code()); });
    }
};

struct fake_swarm : public swarm
{
    asio::io_context& ios;
    swarm_counters counters_;
    connection_handler connection_handler_;

    int num_joins = 0;
    int num_destroys = 0;
    key_type joined_topic{};
    join_options joined_options;

    explicit fake_swarm(asio::io_context& ios) : ios(ios) {}

    void join(const key_type& topic, const join_options options) override
    {
        ++num_joins;
        joined_topic = topic;
        joined_options = options;
    }

    void on_connection(connection_handler handler) override
    {
        connection_handler_ = std::move(handler);
    }

    void destroy(completion_handler handler) override
    {
        ++num_destroys;
        asio::post(ios, [handler = std::move(handler)] { handler(error_code()); });
    }

    swarm_counters counters() override { return counters_; }
};

/**
 * An in-memory connection. Bytes handed to `deliver` complete the pending read and
 * everything written is kept in `written`.
 */
struct fake_connection : public connection
{
    asio::io_context& ios;
    public_key_type remote_key{};
    key_type topic_{};
    bool is_open_ = true;
    error_code close_error;
    std::vector<std::vector<uint8_t>> written;

    std::vector<error_handler> error_handlers;
    std::vector<error_handler> close_handlers;
    view<uint8_t> read_buffer;
    read_handler pending_read;

    fake_connection(asio::io_context& ios, const uint8_t id) : ios(ios)
    {
        remote_key.fill(id);
    }

    const public_key_type& remote_public_key() const override { return remote_key; }
    const key_type& topic() const override { return topic_; }
    std::string remote_address() const override { return "10.0.0.1:4000"; }
    bool is_open() const override { return is_open_; }

    void on_error(error_handler handler) override
    {
        error_handlers.push_back(std::move(handler));
    }

    void on_close(error_handler handler) override
    {
        close_handlers.push_back(std::move(handler));
    }

    void async_read_some(view<uint8_t> buffer, read_handler handler) override
    {
        read_buffer = buffer;
        pending_read = std::move(handler);
    }

    void async_write(std::vector<uint8_t> data, write_handler handler) override
    {
        written.push_back(std::move(data));
        if(handler) { asio::post(ios, [handler] { handler(error_code()); }); }
    }

    void close(const error_code& error = error_code()) override
    {
        if(!is_open_) { return; }
        is_open_ = false;
        close_error = error;
        if(pending_read)
        {
            asio::post(ios, [h = std::move(pending_read)]
                { h(make_error_code(asio::error::operation_aborted), 0); });
            pending_read = nullptr;
        }
        // Like a real connection, the handlers run from a fresh stack.
        asio::post(ios, [error, on_error = std::move(error_handlers),
            on_close = std::move(close_handlers)]
            {
                if(error)
                {
                    for(auto& h : on_error) { h(error); }
                }
                for(auto& h : on_close) { h(error); }
            });
        error_handlers.clear();
        close_handlers.clear();
    }

    /** Completes the pending read with `bytes`, which must fit its buffer. */
    void deliver(const std::vector<uint8_t>& bytes)
    {
        if(!pending_read) { return; }
        std::copy(bytes.begin(), bytes.end(), read_buffer.begin());
        asio::post(ios, [h = std::move(pending_read), n = bytes.size()]
            { h(error_code(), n); });
        pending_read = nullptr;
    }
};

/** Counts the calls instead of touching the file system. */
struct fake_workspace : public workspace
{
    int* num_creates;
    int* num_removes;

    fake_workspace(int* num_creates, int* num_removes)
        : workspace("/nonexistent/driveprof-test")
        , num_creates(num_creates)
        , num_removes(num_removes)
    {}

    void create() override { ++*num_creates; }

    error_code remove() noexcept override
    {
        ++*num_removes;
        return error_code();
    }
};

} // namespace test
} // namespace driveprof

#endif // DRIVEPROF_TESTS_FAKES_HEADER
