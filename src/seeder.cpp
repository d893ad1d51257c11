#include "seeder.hpp"
#include "profiler_error.hpp"
#include "string_utils.hpp"
#include "id_encoding.hpp"
#include "local_store.hpp"
#include "tcp_swarm.hpp"
#include "drive.hpp"

#include <asio/post.hpp>

namespace driveprof {

#define SHARED_THIS this, self(shared_from_this())

std::vector<uint8_t> make_test_file(const int index, const int size)
{
    std::vector<uint8_t> content(size);
    for(int i = 0; i < size; ++i) { content[i] = uint8_t((index * 31 + i) & 0xff); }
    return content;
}

seeder::seeder(asio::io_context& ios, testnet_settings settings,
    swarm_settings swarm_settings, replication_settings replication_settings,
    path directory)
    : ios_(ios)
    , settings_(std::move(settings))
    , store_(std::make_shared<local_store>(ios, std::move(replication_settings)))
    , swarm_(std::make_shared<tcp_swarm>(ios, std::move(swarm_settings)))
    , workspace_(std::make_unique<workspace>(std::move(directory)))
{}

void seeder::start(completion_handler handler)
{
    workspace_->create();
    log(log::priority::normal, "creating %i files of %i bytes in %s",
        settings_.num_files, settings_.file_size,
        workspace_->directory().string().c_str());
    store_->open(workspace_->directory(),
        [SHARED_THIS, handler = std::move(handler)](const error_code& error)
        { on_store_opened(error, std::move(handler)); });
}

void seeder::on_store_opened(const error_code& error, completion_handler handler)
{
    if(error || is_stopped_)
    {
        handler(error ? error : make_error_code(profiler_errc::cancelled));
        return;
    }

    try
    {
        drive_ = store_->create_drive();
        for(int i = 0; i < settings_.num_files; ++i)
        {
            error_code ec;
            const auto content = make_test_file(i, settings_.file_size);
            drive_->put("/" + std::to_string(i), content, ec);
            if(ec)
            {
                handler(ec);
                return;
            }
        }

        std::weak_ptr<local_store> weak_store = store_;
        swarm_->on_connection([weak_store](std::shared_ptr<connection> connection)
            {
                if(auto store = weak_store.lock())
                {
                    store->replicate(std::move(connection));
                }
                else
                {
                    connection->close();
                }
            });
        swarm_->join(drive_->discovery_key(), join_options{true, false});
    }
    catch(const system_error& e)
    {
        handler(e.code());
        return;
    }

    log(log::priority::normal, "serving drive %s (version %lli) on %s",
        id_encoding::normalize(drive_->key()).c_str(),
        static_cast<long long>(drive_->version()), bootstrap_endpoint().c_str());
    handler(error_code());
}

void seeder::stop(completion_handler handler)
{
    if(is_stopped_)
    {
        asio::post(ios_, [handler = std::move(handler)] { handler(error_code()); });
        return;
    }
    is_stopped_ = true;
    swarm_->destroy([SHARED_THIS, handler = std::move(handler)](const error_code& error)
        {
            if(error)
            {
                log(log::priority::high, "could not destroy swarm: %s",
                    error.message().c_str());
            }
            store_->close([SHARED_THIS, handler = std::move(handler)](const error_code& error)
                {
                    if(error)
                    {
                        log(log::priority::high, "could not close store: %s",
                            error.message().c_str());
                    }
                    const auto ec = workspace_->remove();
                    if(ec)
                    {
                        log(log::priority::high, "could not remove %s: %s",
                            workspace_->directory().string().c_str(),
                            ec.message().c_str());
                    }
                    handler(ec);
                });
        });
}

const key_type& seeder::drive_key() const
{
    if(!drive_) { throw system_error(make_error_code(profiler_errc::store_not_open)); }
    return drive_->key();
}

std::string seeder::bootstrap_endpoint() const
{
    const auto endpoint = swarm_->listen_endpoint();
    return endpoint.address().to_string() + ':' + std::to_string(endpoint.port());
}

template<typename... Args>
void seeder::log(const log::priority priority, const char* format, Args&&... args) const
{
    log::log_session("SEEDER", util::format(format, std::forward<Args>(args)...),
        priority);
}

} // namespace driveprof
