#include "profiler_error.hpp"
#include "workspace.hpp"

#include <filesystem>

namespace driveprof {

namespace fs = std::filesystem;

workspace::workspace(path directory) : directory_(std::move(directory)) {}

void workspace::create()
{
    error_code ec;
    if(fs::exists(directory_, ec))
    {
        fs::remove_all(directory_, ec);
        if(ec)
        {
            throw system_error(make_error_code(profiler_errc::workspace_unavailable),
                directory_.string() + ": " + ec.message());
        }
    }
    fs::create_directories(directory_, ec);
    if(ec) { throw system_error(ec, "could not create " + directory_.string()); }
}

error_code workspace::remove() noexcept
{
    error_code ec;
    fs::remove_all(directory_, ec);
    return ec;
}

} // namespace driveprof
