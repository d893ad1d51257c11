#include "driveprof/command_line.hpp"
#include "driveprof/event_loop.hpp"
#include "driveprof/id_encoding.hpp"
#include "driveprof/settings.hpp"
#include "driveprof/seeder.hpp"
#include "driveprof/log.hpp"

#include <csignal>
#include <exception>
#include <iostream>
#include <memory>

#include <asio/io_context.hpp>
#include <asio/signal_set.hpp>

using namespace driveprof;

int main(int argc, char** argv)
{
    command_line cmd;
    try
    {
        cmd = parse_seed_command_line(argc, argv);
        if(cmd.show_help)
        {
            std::cout << seed_usage(argv[0]);
            return 0;
        }
        fill_in_defaults(cmd.settings);
        verify(cmd.settings.swarm);
        verify(cmd.settings.replication);
        verify(cmd.settings.testnet);
        log::configure(cmd.settings.log);
    }
    catch(const std::exception& e)
    {
        std::cerr << "Error: " << e.what() << "\n\n" << seed_usage(argv[0]);
        return 1;
    }

    const auto& settings = cmd.settings;
    asio::io_context ios;
    int exit_code = 0;
    auto s = std::make_shared<seeder>(ios, settings.testnet, settings.swarm,
        settings.replication,
        settings.session.workspace_root / settings.session.workspace_name);
    asio::signal_set signals(ios, SIGINT, SIGTERM);

    auto stop = [&]
    {
        error_code ec;
        signals.cancel(ec);
        s->stop([&](const error_code& error)
            {
                if(error)
                {
                    std::cout << "Error: " << error.message() << '\n';
                    exit_code = 1;
                }
                ios.stop();
            });
    };

    signals.async_wait([&](const error_code& error, int)
        {
            if(error) { return; }
            std::cout << "Stopping...\n";
            stop();
        });

    try
    {
        s->start([&](const error_code& error)
            {
                if(error)
                {
                    std::cout << "Error: " << error.message() << '\n';
                    exit_code = 1;
                    stop();
                    return;
                }
                std::cout << "Seeding drive " << id_encoding::normalize(s->drive_key())
                          << '\n'
                          << "Profile it with: driveprof " << id_encoding::normalize(
                                 s->drive_key())
                          << " --bootstrap " << s->bootstrap_endpoint() << '\n';
            });
    }
    catch(const std::exception& e)
    {
        std::cout << "Error: " << e.what() << '\n';
        return 1;
    }

    run_event_loop(ios, [&](const std::exception& e)
        {
            std::cout << "Error: " << e.what() << '\n';
            exit_code = 1;
            ios.stop();
        });
    log::flush();
    return exit_code;
}
