#ifndef DRIVEPROF_TCP_INFO_HEADER
#define DRIVEPROF_TCP_INFO_HEADER

#include <cstdint>
#include <optional>

namespace driveprof {

/** Kernel side counters of a single TCP socket. */
struct tcp_info_sample
{
    int64_t segments_received = 0;
    int64_t segments_transmitted = 0;
    int64_t retransmits = 0;

    tcp_info_sample& operator+=(const tcp_info_sample& other) noexcept
    {
        segments_received += other.segments_received;
        segments_transmitted += other.segments_transmitted;
        retransmits += other.retransmits;
        return *this;
    }
};

/** Whether `read_tcp_info` can ever succeed on this platform. */
bool is_tcp_info_supported() noexcept;

/**
 * Queries the kernel for the counters of the socket `fd`. Returns nothing if the
 * platform does not expose them or the socket is no longer valid.
 */
std::optional<tcp_info_sample> read_tcp_info(const int fd) noexcept;

} // namespace driveprof

#endif // DRIVEPROF_TCP_INFO_HEADER
