#ifndef DRIVEPROF_TYPES_HEADER
#define DRIVEPROF_TYPES_HEADER

#include <array>
#include <cstdint>

namespace driveprof {

// Every identity in the system (drive keys, core keys, discovery keys and peer
// public keys) is 32 bytes long.
using key_type = std::array<uint8_t, 32>;
using public_key_type = key_type;
using sha256_hash = key_type;

// Block indices within a core. A core's length is the number of blocks in it.
using block_index_t = int64_t;

/** The two replicated streams that make up a drive. */
enum class stream_id : uint8_t
{
    metadata,
    blobs
};

constexpr int num_streams = 2;

inline const char* to_string(const stream_id s) noexcept
{
    return s == stream_id::metadata ? "metadata" : "blobs";
}

} // namespace driveprof

#endif // DRIVEPROF_TYPES_HEADER
