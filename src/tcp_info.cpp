#include "tcp_info.hpp"

// This translation unit deliberately doesn't include asio: the segment counters are
// only declared in the kernel's own header, which clashes with <netinet/tcp.h>.
#ifdef __linux__
# include <netinet/in.h>
# include <sys/socket.h>
# include <linux/tcp.h>
#endif

namespace driveprof {

bool is_tcp_info_supported() noexcept
{
#ifdef __linux__
    return true;
#else
    return false;
#endif
}

std::optional<tcp_info_sample> read_tcp_info(const int fd) noexcept
{
#ifdef __linux__
    if(fd < 0) { return std::nullopt; }
    struct tcp_info info{};
    socklen_t length = sizeof(info);
    if(::getsockopt(fd, IPPROTO_TCP, TCP_INFO, &info, &length) != 0) { return std::nullopt; }
    tcp_info_sample sample;
    sample.segments_received = info.tcpi_segs_in;
    sample.segments_transmitted = info.tcpi_segs_out;
    sample.retransmits = info.tcpi_total_retrans;
    return sample;
#else
    (void)fd;
    return std::nullopt;
#endif
}

} // namespace driveprof
