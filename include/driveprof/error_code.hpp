#ifndef DRIVEPROF_ERROR_CODE_HEADER
#define DRIVEPROF_ERROR_CODE_HEADER

#include <system_error>

namespace driveprof {

// Standalone asio reports through std::error_code, so we alias the std facilities
// rather than spelling out the namespace everywhere.
using std::errc;
using std::error_category;
using std::error_code;
using std::error_condition;
using std::generic_category;
using std::is_error_code_enum;
using std::make_error_code;
using std::system_category;
using std::system_error;

#define DRIVEPROF_ERROR_CODE_NS std

} // namespace driveprof

#endif // DRIVEPROF_ERROR_CODE_HEADER
