#ifndef DRIVEPROF_ENDIAN_HEADER
#define DRIVEPROF_ENDIAN_HEADER

#include <cstdint>

#include <boost/endian/conversion.hpp>

namespace driveprof {
namespace endian {

/**
 * Parses a byte sequence and reconstructs into an integer of type T, converting
 * from Network Byte Order to Host Byte Order. The byte sequence must have at
 * least sizeof(T) bytes.
 */
template <typename T>
T read_network(const uint8_t* it) noexcept
{
    return boost::endian::endian_load<T, sizeof(T), boost::endian::order::big>(it);
}

/**
 * Writes an integer of type T to the byte sequence pointed to by it, converting
 * it from Host Byte Order to Network Byte Order. The byte sequence must have
 * space for sizeof(T) bytes.
 */
template <typename T>
void write_network(uint8_t* it, const T& h) noexcept
{
    boost::endian::endian_store<T, sizeof(T), boost::endian::order::big>(it, h);
}

} // endian
} // driveprof

#endif // DRIVEPROF_ENDIAN_HEADER
