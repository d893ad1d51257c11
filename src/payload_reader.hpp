#ifndef DRIVEPROF_PAYLOAD_READER_HEADER
#define DRIVEPROF_PAYLOAD_READER_HEADER

#include "endian.hpp"
#include "view.hpp"

#include <cstdint>
#include <limits>

namespace driveprof {

/**
 * Reads big-endian integers from a message payload, remembering whether any read
 * ran past its end (in which case the message is malformed).
 */
class payload_reader
{
    const_view<uint8_t> data_;
    bool is_valid_ = true;

public:
    explicit payload_reader(const_view<uint8_t> data) : data_(data) {}

    bool is_valid() const noexcept { return is_valid_; }
    bool is_exhausted() const noexcept { return data_.empty(); }
    const_view<uint8_t> rest() const noexcept { return data_; }

    template <typename Int>
    Int read()
    {
        if(!is_valid_ || data_.size() < sizeof(Int))
        {
            is_valid_ = false;
            return 0;
        }
        const auto value = endian::read_network<Int>(data_.data());
        data_.trim_front(sizeof(Int));
        return value;
    }

    /** Reads an unsigned 64-bit field that must fit a signed 64-bit integer. */
    int64_t read_int64()
    {
        const auto value = read<uint64_t>();
        if(value > uint64_t(std::numeric_limits<int64_t>::max())) { is_valid_ = false; }
        return is_valid_ ? int64_t(value) : 0;
    }

    const_view<uint8_t> read_bytes(const size_t n)
    {
        if(!is_valid_ || data_.size() < n)
        {
            is_valid_ = false;
            return {};
        }
        auto bytes = data_.subview(0, n);
        data_.trim_front(n);
        return bytes;
    }
};

} // namespace driveprof

#endif // DRIVEPROF_PAYLOAD_READER_HEADER
