#ifndef DRIVEPROF_EXPONENTIAL_BACKOFF_HEADER
#define DRIVEPROF_EXPONENTIAL_BACKOFF_HEADER

#include "time.hpp"

namespace driveprof {

/** A simple binary exponential backoff generator of delays, capped at `max`. */
class exponential_backoff
{
    duration initial_;
    duration max_;
    duration value_;

public:
    exponential_backoff(duration initial, duration max)
        : initial_(initial), max_(max), value_(initial)
    {}

    void reset() noexcept { value_ = initial_; }

    duration operator()() noexcept
    {
        const auto tmp = value_;
        value_ = value_ == duration::zero() ? initial_ : value_ * 2;
        if(value_ > max_) {
            value_ = max_;
        }
        return tmp;
    }
};

} // namespace driveprof

#endif // DRIVEPROF_EXPONENTIAL_BACKOFF_HEADER
