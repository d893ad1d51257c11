#include "string_utils.hpp"
#include "rate.hpp"

#include <cmath>

namespace driveprof {

std::optional<double> rate(
    const std::optional<int64_t>& count, const double elapsed_seconds) noexcept
{
    if(!count || !(elapsed_seconds > 0.0)) { return std::nullopt; }
    return static_cast<double>(*count) / elapsed_seconds;
}

std::string human_bytes(const double n)
{
    static constexpr const char* units[] = {"B", "kB", "MB", "GB", "TB", "PB", "EB"};
    static constexpr int num_units = sizeof(units) / sizeof(units[0]);

    double scaled = std::isfinite(n) ? n : 0.0;
    int unit = 0;
    while(std::abs(scaled) >= 1000.0 && unit < num_units - 1)
    {
        scaled /= 1000.0;
        ++unit;
    }
    // Rounding to two decimals may carry over into the next unit (999.999 kB).
    if(std::abs(scaled) >= 999.995 && unit < num_units - 1)
    {
        scaled /= 1000.0;
        ++unit;
    }
    return util::format("%.2f %s", scaled, units[unit]);
}

metrics_rates compute_rates(
    const metrics_snapshot& snapshot, const double elapsed_seconds) noexcept
{
    const auto& t = snapshot.transport;
    metrics_rates r;
    r.bytes_received = rate(t.bytes_received, elapsed_seconds);
    r.bytes_transmitted = rate(t.bytes_transmitted, elapsed_seconds);
    r.packets_received = rate(t.packets_received, elapsed_seconds);
    r.packets_transmitted = rate(t.packets_transmitted, elapsed_seconds);
    r.packets_dropped = rate(t.packets_dropped, elapsed_seconds);
    return r;
}

} // namespace driveprof
