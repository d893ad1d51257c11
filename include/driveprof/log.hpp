#ifndef DRIVEPROF_LOG_HEADER
#define DRIVEPROF_LOG_HEADER

#include <ostream>
#include <string>

namespace driveprof {

struct log_settings;

namespace log {

enum class priority
{
    low,
    normal,
    high
};

/**
 * Installs the sinks and the priority threshold. Until this is called, everything at
 * `priority::normal` or above is written to stdout.
 */
void configure(const log_settings& settings);

/**
 * Redirects the console sink, mostly so that tests can capture diagnostics. Passing
 * nullptr silences the console sink (the log file, if any, is still written).
 */
void set_stream(std::ostream* stream);

void log_session(const std::string& header, const std::string& log,
        const priority priority = priority::normal);
void log_swarm(const std::string& header, const std::string& log,
        const priority priority = priority::normal);
void log_store(const std::string& header, const std::string& log,
        const priority priority = priority::normal);
void log_peer(const std::string& remote, const std::string& header,
        const std::string& log, const priority priority = priority::normal);

/** Writes out everything buffered in the sinks. Call before the process exits. */
void flush();

const char* to_string(const priority p) noexcept;

/** Throws `std::invalid_argument` if `s` is not one of "low", "normal" or "high". */
priority priority_from_string(const std::string& s);

} // log
} // driveprof

#endif // DRIVEPROF_LOG_HEADER
