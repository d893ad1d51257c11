#include "command_line.hpp"
#include "string_utils.hpp"

#include <limits>
#include <stdexcept>

namespace driveprof {

namespace {

/** Walks argv, handing out flag values. */
class arg_cursor
{
    int argc_;
    const char* const* argv_;
    int pos_ = 1;

public:
    arg_cursor(int argc, const char* const* argv) : argc_(argc), argv_(argv) {}

    bool done() const noexcept { return pos_ >= argc_; }
    std::string next() { return argv_[pos_++]; }

    std::string value_of(const std::string& flag)
    {
        if(done()) { throw std::invalid_argument(flag + " requires a value"); }
        return next();
    }

    int int_value_of(const std::string& flag, const int min, const int max)
    {
        const auto s = value_of(flag);
        if(s.empty() || s.find_first_not_of("0123456789") != std::string::npos
           || s.length() > 9)
        {
            throw std::invalid_argument(flag + " expects a number, got: " + s);
        }
        const int value = std::stoi(s);
        if(value < min || value > max)
        {
            throw std::invalid_argument(util::format("%s must be between %i and %i",
                flag.c_str(), min, max));
        }
        return value;
    }
};

constexpr int max_int = std::numeric_limits<int>::max();

// A lone "-" is not a flag.
bool is_flag(const std::string& arg)
{
    return arg.length() > 1 && util::starts_with(arg, std::string("-"));
}

/** Handles the flags shared by both tools. Returns false if `arg` isn't one. */
bool parse_common_flag(const std::string& arg, arg_cursor& args, command_line& cmd)
{
    auto& s = cmd.settings;
    if(arg == "--help" || arg == "-h")
    {
        cmd.show_help = true;
    }
    else if(arg == "--log-file")
    {
        s.log.log_file = args.value_of(arg);
    }
    else if(arg == "--log-level")
    {
        s.log.min_priority = log::priority_from_string(args.value_of(arg));
    }
    else if(arg == "--files")
    {
        s.testnet.num_files = args.int_value_of(arg, 1, max_int);
    }
    else if(arg == "--file-size")
    {
        s.testnet.file_size = args.int_value_of(arg, 0, max_int);
    }
    else
    {
        return false;
    }
    return true;
}

} // namespace

command_line parse_command_line(int argc, const char* const* argv)
{
    command_line cmd;
    auto& s = cmd.settings;
    arg_cursor args(argc, argv);
    while(!args.done())
    {
        const auto arg = args.next();
        if(parse_common_flag(arg, args, cmd)) { continue; }

        if(arg == "--interval" || arg == "-i")
        {
            s.session.report_interval = seconds(args.int_value_of(arg, 1, max_int));
        }
        else if(arg == "--ip")
        {
            s.session.show_address = true;
        }
        else if(arg == "--detail")
        {
            s.session.show_detail = true;
        }
        else if(arg == "--remote-peers")
        {
            s.session.remote_peers_file = args.value_of(arg);
        }
        else if(arg == "--bootstrap")
        {
            s.swarm.bootstrap.emplace_back(args.value_of(arg));
        }
        else if(arg == "--local")
        {
            s.testnet.enabled = true;
        }
        else if(is_flag(arg))
        {
            throw std::invalid_argument("unknown flag: " + arg);
        }
        else if(s.session.drive_key.empty())
        {
            s.session.drive_key = arg;
        }
        else
        {
            throw std::invalid_argument("unexpected argument: " + arg);
        }
    }
    return cmd;
}

command_line parse_seed_command_line(int argc, const char* const* argv)
{
    command_line cmd;
    auto& s = cmd.settings;
    s.testnet.enabled = true;
    arg_cursor args(argc, argv);
    while(!args.done())
    {
        const auto arg = args.next();
        if(parse_common_flag(arg, args, cmd)) { continue; }

        if(arg == "--listen")
        {
            s.swarm.listen_address = args.value_of(arg);
        }
        else if(arg == "--port")
        {
            s.swarm.listen_port = uint16_t(args.int_value_of(arg, 0, 65535));
        }
        else if(is_flag(arg))
        {
            throw std::invalid_argument("unknown flag: " + arg);
        }
        else
        {
            throw std::invalid_argument("unexpected argument: " + arg);
        }
    }
    return cmd;
}

std::string usage(const std::string& program)
{
    return "Usage: " + program + " <key> [options]\n"
        "       " + program + " --local [options]\n"
        "\n"
        "Downloads a drive and prints performance stats while it does.\n"
        "\n"
        "Options:\n"
        "  --interval, -i <seconds>  Interval at which to print the performance stats"
        " (default 10)\n"
        "  --ip                      Print our IP address (redacted by default)\n"
        "  --detail                  Include detailed replication stats\n"
        "  --remote-peers <file>     Track the progress of the peers listed in file,"
        " one key per line\n"
        "  --bootstrap <host:port>   Peer to connect to (may be repeated)\n"
        "  --local                   Seed a generated drive locally and download that\n"
        "  --files <n>               Number of files of the local drive (default 2000)\n"
        "  --file-size <bytes>       Size of each file of the local drive"
        " (default 51200)\n"
        "  --log-file <path>         Also append diagnostics to this file\n"
        "  --log-level <priority>    One of low, normal, high (default normal)\n"
        "  --help, -h                Print this message\n";
}

std::string seed_usage(const std::string& program)
{
    return "Usage: " + program + " [options]\n"
        "\n"
        "Seeds a generated drive until interrupted.\n"
        "\n"
        "Options:\n"
        "  --files <n>               Number of files (default 2000)\n"
        "  --file-size <bytes>       Size of each file (default 51200)\n"
        "  --listen <address>        Address to accept connections on"
        " (default 0.0.0.0)\n"
        "  --port <port>             Port to accept connections on (default: any)\n"
        "  --log-file <path>         Also append diagnostics to this file\n"
        "  --log-level <priority>    One of low, normal, high (default normal)\n"
        "  --help, -h                Print this message\n";
}

} // namespace driveprof
