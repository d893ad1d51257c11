#ifndef DRIVEPROF_PATH_HEADER
#define DRIVEPROF_PATH_HEADER

#include <filesystem>

namespace driveprof {

using std::filesystem::path;

} // namespace driveprof

#endif // DRIVEPROF_PATH_HEADER
