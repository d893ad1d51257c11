#ifndef DRIVEPROF_PAYLOAD_HEADER
#define DRIVEPROF_PAYLOAD_HEADER

#include "endian.hpp"

#include <cstdint>
#include <iterator>
#include <vector>

namespace driveprof {

/**
 * Builds the body of an outgoing frame. Integers are appended big endian:
 *
 *  payload p;
 *  p.u8(type).u8(channel).u64(index);
 */
struct payload
{
    std::vector<uint8_t> data;

    payload() = default;

    payload(const int size)
    {
        data.reserve(size);
    }

    payload& u8(const uint8_t h)
    {
        data.emplace_back(h);
        return *this;
    }

    payload& u16(const uint16_t h)
    {
        add_integer<uint16_t>(h);
        return *this;
    }

    payload& u32(const uint32_t h)
    {
        add_integer<uint32_t>(h);
        return *this;
    }

    payload& u64(const uint64_t h)
    {
        add_integer<uint64_t>(h);
        return *this;
    }

    template<typename InputIt>
    payload& range(InputIt begin, InputIt end)
    {
        data.insert(data.cend(), begin, end);
        return *this;
    }

    template<typename Buffer>
    payload& buffer(const Buffer& buffer)
    {
        return range(std::begin(buffer), std::end(buffer));
    }

private:

    template<typename Int>
    void add_integer(Int x)
    {
        const auto pos = data.size();
        data.resize(data.size() + sizeof(Int));
        endian::write_network<Int>(&data[pos], x);
    }
};

} // namespace driveprof

#endif // DRIVEPROF_PAYLOAD_HEADER
