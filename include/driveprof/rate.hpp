#ifndef DRIVEPROF_RATE_HEADER
#define DRIVEPROF_RATE_HEADER

#include "metrics_snapshot.hpp"

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>

namespace driveprof {

/**
 * Returns `count / elapsed_seconds`, or an empty optional (rendered as "unavailable")
 * if no time has elapsed yet or the count itself is not available.
 */
std::optional<double> rate(
    const std::optional<int64_t>& count, const double elapsed_seconds) noexcept;

/**
 * Scales `n` to the largest 1000-based unit (B, kB, MB, GB, TB, PB, EB) that keeps the
 * number at or above 1, with two decimals, e.g. "1.60 GB".
 *
 * NOTE: when displaying a byte rate, compute the rate from the raw count first and
 * scale the result, as the rate may fall into a different unit than the total.
 */
std::string human_bytes(const double n);

template <typename T>
constexpr T running_max(const T& current, const T& candidate) noexcept
{
    return std::max(current, candidate);
}

/** Per-second rates of the transport counters of one snapshot. */
struct metrics_rates
{
    std::optional<double> bytes_received;
    std::optional<double> bytes_transmitted;
    std::optional<double> packets_received;
    std::optional<double> packets_transmitted;
    std::optional<double> packets_dropped;
};

metrics_rates compute_rates(
    const metrics_snapshot& snapshot, const double elapsed_seconds) noexcept;

} // namespace driveprof

#endif // DRIVEPROF_RATE_HEADER
