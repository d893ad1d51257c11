#ifndef DRIVEPROF_COMMAND_LINE_HEADER
#define DRIVEPROF_COMMAND_LINE_HEADER

#include "settings.hpp"

#include <string>

namespace driveprof {

struct command_line
{
    profiler_settings settings;
    bool show_help = false;
};

/**
 * Parses the arguments of `driveprof`:
 *
 *  driveprof <key> [--interval|-i <seconds>] [--ip] [--detail]
 *            [--remote-peers <file>] [--bootstrap <host:port>]...
 *            [--log-file <path>] [--log-level low|normal|high]
 *  driveprof --local [--files <n>] [--file-size <bytes>] [...]
 *
 * Throws `std::invalid_argument` on an unknown flag, a missing or malformed value,
 * or a second positional argument. The settings are not verified.
 */
command_line parse_command_line(int argc, const char* const* argv);

/**
 * Parses the arguments of `driveprof-seed`:
 *
 *  driveprof-seed [--files <n>] [--file-size <bytes>] [--listen <address>]
 *                 [--port <port>] [--log-file <path>] [--log-level <priority>]
 */
command_line parse_seed_command_line(int argc, const char* const* argv);

std::string usage(const std::string& program);
std::string seed_usage(const std::string& program);

} // namespace driveprof

#endif // DRIVEPROF_COMMAND_LINE_HEADER
