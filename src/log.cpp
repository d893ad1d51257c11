#include "log.hpp"
#include "settings.hpp"

#include <fstream>
#include <iostream>
#include <stdexcept>

namespace driveprof {
namespace log {
namespace detail {

#define DRIVEPROF_FLUSH(f)                                                               \
    do                                                                                   \
        if(f.is_open())                                                                  \
            f.flush();                                                                   \
    while(0)

#define DRIVEPROF_PRIORITY_CHAR(p)                                                       \
    char(p == priority::low ? 'l' : p == priority::normal ? 'n' : 'h')

#define DRIVEPROF_LOG(priority, stream, header, log)                                     \
    stream << '[' << DRIVEPROF_PRIORITY_CHAR(priority) << '|' << header << "] " << log   \
           << '\n';

/**
 * Every component runs on the network thread, so unlike disk bound loggers this one
 * needs no locking.
 */
class logger
{
    std::ofstream file_;
    std::ostream* stream_ = &std::cout;
    priority min_priority_ = priority::normal;

public:
    void configure(const log_settings& settings);
    void set_stream(std::ostream* stream) noexcept { stream_ = stream; }
    void log(const std::string& header, const std::string& log, const priority priority);

    void flush()
    {
        DRIVEPROF_FLUSH(file_);
        if(stream_) { stream_->flush(); }
    }
};

logger logger;

constexpr auto g_open_mode = std::ios::app | std::ios::out;

void logger::configure(const log_settings& settings)
{
    min_priority_ = settings.min_priority;
    stream_ = settings.log_to_stdout ? &std::cout : nullptr;
    if(file_.is_open()) { file_.close(); }
    if(!settings.log_file.empty())
    {
        file_.open(settings.log_file.c_str(), g_open_mode);
        if(!file_.is_open())
        {
            throw std::invalid_argument(
                "could not open log file " + settings.log_file.string());
        }
    }
}

void logger::log(const std::string& header, const std::string& log,
    const priority priority)
{
    if(priority < min_priority_) { return; }
    if(file_.is_open()) { DRIVEPROF_LOG(priority, file_, header, log); }
    if(stream_) { DRIVEPROF_LOG(priority, *stream_, header, log); }
}

} // detail

void configure(const log_settings& settings)
{
    detail::logger.configure(settings);
}

void set_stream(std::ostream* stream)
{
    detail::logger.set_stream(stream);
}

void log_session(const std::string& header, const std::string& log,
    const priority priority)
{
    detail::logger.log("session|" + header, log, priority);
}

void log_swarm(const std::string& header, const std::string& log,
    const priority priority)
{
    detail::logger.log("swarm|" + header, log, priority);
}

void log_store(const std::string& header, const std::string& log,
    const priority priority)
{
    detail::logger.log("store|" + header, log, priority);
}

void log_peer(const std::string& remote, const std::string& header,
    const std::string& log, const priority priority)
{
    detail::logger.log(remote + '|' + header, log, priority);
}

void flush()
{
    detail::logger.flush();
}

const char* to_string(const priority p) noexcept
{
    switch(p)
    {
    case priority::low: return "low";
    case priority::normal: return "normal";
    case priority::high: return "high";
    default: return "unknown";
    }
}

priority priority_from_string(const std::string& s)
{
    if(s == "low") { return priority::low; }
    if(s == "normal") { return priority::normal; }
    if(s == "high") { return priority::high; }
    throw std::invalid_argument("invalid log priority: " + s);
}

} // log
} // driveprof
