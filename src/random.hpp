#ifndef DRIVEPROF_RANDOM_HEADER
#define DRIVEPROF_RANDOM_HEADER

#include "types.hpp"

#include <random>

namespace driveprof {
namespace util {

std::mt19937& random_engine();

/** Returns a random integer in the range [0, max] or [min, max]. */
int random_int(const int max);
int random_int(const int min, const int max);

/** Returns 32 random bytes, used as the key of new cores and swarm identities. */
key_type random_key();

} // namespace util
} // namespace driveprof

#endif // DRIVEPROF_RANDOM_HEADER
