#ifndef DRIVEPROF_PROFILER_ERROR_HEADER
#define DRIVEPROF_PROFILER_ERROR_HEADER

#include "error_code.hpp"

#include <type_traits> // true_type
#include <string>

namespace driveprof {

/** Errors that abort a profiling session before its first report or end it early. */
enum class profiler_errc
{
    unknown = 1,

    // The drive key given on the command line is neither 64 hex digits nor 52
    // z-base32 characters.
    invalid_drive_key,

    // A stale workspace directory was found and could not be removed.
    workspace_unavailable,

    // The store was used before `open` completed or after `close`.
    store_not_open,

    // The swarm was used after `destroy`.
    swarm_destroyed,

    // The session was asked to start twice.
    already_started,

    // The user interrupted the session before the download completed.
    cancelled
};

struct profiler_error_category : public error_category
{
    const char* name() const noexcept override { return "profiler"; }
    std::string message(int env) const override;
    error_condition default_error_condition(int ev) const noexcept override;
};

const profiler_error_category& profiler_category();
error_code make_error_code(profiler_errc e);
error_condition make_error_condition(profiler_errc e);

} // namespace driveprof

namespace DRIVEPROF_ERROR_CODE_NS {
template <>
struct is_error_code_enum<driveprof::profiler_errc> : public true_type
{};
} // namespace DRIVEPROF_ERROR_CODE_NS

#endif // DRIVEPROF_PROFILER_ERROR_HEADER
