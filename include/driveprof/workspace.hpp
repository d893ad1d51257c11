#ifndef DRIVEPROF_WORKSPACE_HEADER
#define DRIVEPROF_WORKSPACE_HEADER

#include "error_code.hpp"
#include "path.hpp"

namespace driveprof {

/**
 * The temporary directory a session downloads into. The session owns it exclusively
 * and removes it however it ends.
 */
class workspace
{
    path directory_;

public:

    explicit workspace(path directory);
    virtual ~workspace() = default;

    const path& directory() const noexcept { return directory_; }

    /**
     * Creates the directory, empty. A stale directory left behind by an earlier run
     * is removed first; if that fails a `std::system_error` is thrown (with
     * `profiler_errc::workspace_unavailable`), as it is if the directory cannot be
     * created.
     */
    virtual void create();

    /** Removes the directory recursively. Never throws. */
    virtual error_code remove() noexcept;
};

} // namespace driveprof

#endif // DRIVEPROF_WORKSPACE_HEADER
