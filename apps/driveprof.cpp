#include "driveprof/download_session.hpp"
#include "driveprof/command_line.hpp"
#include "driveprof/event_loop.hpp"
#include "driveprof/id_encoding.hpp"
#include "driveprof/local_store.hpp"
#include "driveprof/tcp_swarm.hpp"
#include "driveprof/workspace.hpp"
#include "driveprof/settings.hpp"
#include "driveprof/seeder.hpp"
#include "driveprof/log.hpp"

#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <string>

#include <asio/io_context.hpp>
#include <asio/signal_set.hpp>

using namespace driveprof;

namespace {

/** Owns everything a profiler run needs and wires the pieces together. */
class profiler
{
    asio::io_context& ios_;
    profiler_settings settings_;
    asio::signal_set signals_;
    std::shared_ptr<seeder> seeder_;
    std::shared_ptr<download_session> session_;
    int exit_code_ = 0;
    bool has_thrown_ = false;

public:
    profiler(asio::io_context& ios, profiler_settings settings)
        : ios_(ios)
        , settings_(std::move(settings))
        , signals_(ios, SIGINT, SIGTERM)
    {}

    int exit_code() const noexcept { return exit_code_; }

    void run()
    {
        signals_.async_wait([this](const error_code& error, int)
            {
                if(error) { return; }
                on_interrupt();
            });
        if(settings_.testnet.enabled)
        {
            start_seeder();
        }
        else
        {
            start_session();
        }
    }

    /**
     * A handler threw. The session is cancelled so the workspace is still removed,
     * unless it's already being torn down, in which case we just stop.
     */
    void on_exception(const std::exception& e)
    {
        log::log_session("MAIN", std::string("unhandled exception: ") + e.what(),
            log::priority::high);
        std::cout << "Error: " << e.what() << '\n';
        exit_code_ = 1;
        if(session_ && !session_->is_finished() && !has_thrown_)
        {
            has_thrown_ = true;
            session_->cancel();
            return;
        }
        ios_.stop();
    }

private:
    void start_seeder()
    {
        // The seeder only serves the profiler, so it listens on loopback only.
        auto seed_swarm = settings_.swarm;
        seed_swarm.listen_address = "127.0.0.1";
        seed_swarm.listen_port = 0;
        seed_swarm.bootstrap.clear();

        const auto& session = settings_.session;
        seeder_ = std::make_shared<seeder>(ios_, settings_.testnet, seed_swarm,
            settings_.replication,
            session.workspace_root / (session.workspace_name + "-seed"));
        std::cout << "Seeding " << settings_.testnet.num_files << " files of "
                  << settings_.testnet.file_size << " bytes locally\n";
        try
        {
            seeder_->start([this](const error_code& error)
                {
                    if(error)
                    {
                        fail_setup("could not seed the local drive: "
                            + error.message());
                        return;
                    }
                    settings_.session.drive_key = id_encoding::normalize(
                        seeder_->drive_key());
                    settings_.swarm.bootstrap.push_back(seeder_->bootstrap_endpoint());
                    start_session();
                });
        }
        catch(const std::exception& e)
        {
            fail_setup(e.what());
        }
    }

    void start_session()
    {
        auto store = std::make_shared<local_store>(ios_, settings_.replication);
        auto swarm = std::make_shared<tcp_swarm>(ios_, settings_.swarm);
        auto ws = std::make_unique<workspace>(
            settings_.session.workspace_root / settings_.session.workspace_name);
        try
        {
            session_ = std::make_shared<download_session>(ios_, std::move(store),
                std::move(swarm), std::move(ws), settings_.session);
            session_->start([this](const error_code& error)
                {
                    if(error) { exit_code_ = 1; }
                    shut_down();
                });
        }
        catch(const std::exception& e)
        {
            session_.reset();
            fail_setup(e.what());
        }
    }

    void on_interrupt()
    {
        log::log_session("MAIN", "interrupted");
        if(session_)
        {
            session_->cancel();
        }
        else
        {
            // Still seeding, there is no session to report on yet.
            shut_down();
        }
    }

    /** Setup failed: print the error and stop with exit code 1. */
    void fail_setup(const std::string& message)
    {
        std::cout << "Error: " << message << '\n';
        exit_code_ = 1;
        shut_down();
    }

    void shut_down()
    {
        error_code ec;
        signals_.cancel(ec);
        if(!seeder_)
        {
            ios_.stop();
            return;
        }
        seeder_->stop([this](const error_code& error)
            {
                if(error)
                {
                    log::log_session("MAIN", "could not stop seeder: " + error.message(),
                        log::priority::high);
                }
                ios_.stop();
            });
    }
};

} // namespace

int main(int argc, char** argv)
{
    command_line cmd;
    try
    {
        cmd = parse_command_line(argc, argv);
        if(cmd.show_help)
        {
            std::cout << usage(argv[0]);
            return 0;
        }
        fill_in_defaults(cmd.settings);
        verify(cmd.settings);
        log::configure(cmd.settings.log);
    }
    catch(const std::exception& e)
    {
        std::cerr << "Error: " << e.what() << "\n\n" << usage(argv[0]);
        return 1;
    }

    asio::io_context ios;
    profiler p(ios, std::move(cmd.settings));
    p.run();
    run_event_loop(ios, [&p](const std::exception& e) { p.on_exception(e); });
    log::flush();
    return p.exit_code();
}
