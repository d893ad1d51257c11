#ifndef DRIVEPROF_SEEDER_HEADER
#define DRIVEPROF_SEEDER_HEADER

#include "error_code.hpp"
#include "workspace.hpp"
#include "settings.hpp"
#include "types.hpp"
#include "log.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <asio/io_context.hpp>

namespace driveprof {

class local_store;
class tcp_swarm;
class drive;

/**
 * Creates a drive of generated files and serves it on the loopback interface, so
 * that the profiler has something to download without a real network.
 */
class seeder : public std::enable_shared_from_this<seeder>
{
public:

    using completion_handler = std::function<void(const error_code&)>;

private:

    asio::io_context& ios_;
    testnet_settings settings_;

    std::shared_ptr<local_store> store_;
    std::shared_ptr<tcp_swarm> swarm_;
    std::unique_ptr<workspace> workspace_;
    std::shared_ptr<drive> drive_;

    bool is_stopped_ = false;

public:

    /**
     * The drive is created in `directory`, which is removed on `stop`. The swarm
     * settings' listen address and port are used as they are, so set the port to 0
     * to let the OS pick one.
     */
    seeder(asio::io_context& ios, testnet_settings settings,
        swarm_settings swarm_settings, replication_settings replication_settings,
        path directory);

    /**
     * Creates the workspace (which may throw), then generates the drive and starts
     * serving it. `handler` is invoked once the drive can be downloaded.
     */
    void start(completion_handler handler);

    /** Stops serving and removes the workspace. */
    void stop(completion_handler handler);

    /** Only valid after `start` completed. */
    const key_type& drive_key() const;

    /** "127.0.0.1:<port>", or whatever the swarm listens on. */
    std::string bootstrap_endpoint() const;

private:

    void on_store_opened(const error_code& error, completion_handler handler);

    template<typename... Args>
    void log(const log::priority priority, const char* format, Args&&... args) const;
};

/** The contents of the i-th generated file. */
std::vector<uint8_t> make_test_file(const int index, const int size);

} // namespace driveprof

#endif // DRIVEPROF_SEEDER_HEADER
