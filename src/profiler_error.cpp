#include "profiler_error.hpp"

namespace driveprof {

std::string profiler_error_category::message(int env) const
{
    switch(static_cast<profiler_errc>(env))
    {
    case profiler_errc::unknown:
        return "Unknown error";
    case profiler_errc::invalid_drive_key:
        return "Invalid drive key";
    case profiler_errc::workspace_unavailable:
        return "Stale workspace directory could not be removed";
    case profiler_errc::store_not_open:
        return "Store is not open";
    case profiler_errc::swarm_destroyed:
        return "Swarm has been destroyed";
    case profiler_errc::already_started:
        return "Session already started";
    case profiler_errc::cancelled:
        return "Cancelled before the download completed";
    default:
        return "not profiler related error";
    }
}

error_condition profiler_error_category::default_error_condition(int ev) const noexcept
{
    switch(static_cast<profiler_errc>(ev))
    {
    case profiler_errc::invalid_drive_key:
        return std::errc::invalid_argument;
    case profiler_errc::workspace_unavailable:
        return std::errc::directory_not_empty;
    case profiler_errc::cancelled:
        return std::errc::operation_canceled;
    default:
        return error_condition(ev, *this);
    }
}

const profiler_error_category& profiler_category()
{
    static profiler_error_category instance;
    return instance;
}

error_code make_error_code(profiler_errc e)
{
    return error_code(static_cast<int>(e), profiler_category());
}

error_condition make_error_condition(profiler_errc e)
{
    return error_condition(static_cast<int>(e), profiler_category());
}

} // namespace driveprof
