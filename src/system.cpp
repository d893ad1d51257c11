#include "system.hpp"

#include <cerrno>

namespace driveprof {
namespace system {

error_code last_error() noexcept
{
    return error_code(errno, std::system_category());
}

} // namespace system
} // namespace driveprof
