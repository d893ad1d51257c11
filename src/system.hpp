#ifndef DRIVEPROF_SYSTEM_HEADER
#define DRIVEPROF_SYSTEM_HEADER

#include "error_code.hpp"

namespace driveprof {
namespace system {

/** Returns the error of the last failed system call on this thread (errno). */
error_code last_error() noexcept;

} // namespace system
} // namespace driveprof

#endif // DRIVEPROF_SYSTEM_HEADER
