#include "string_utils.hpp"
#include "id_encoding.hpp"

#include <algorithm>
#include <stdexcept>

namespace driveprof {
namespace id_encoding {

// z-base32 favours characters that are easy to read and type.
static constexpr char z32_alphabet[] = "ybndrfg8ejkmcpqxot1uwisza345h769";

// 256 bits in 5 bit groups, the last group padded with 4 zero bits.
static constexpr int z32_key_length = 52;
static constexpr int hex_key_length = 64;

static int z32_value(const char c) noexcept
{
    const char* const end = z32_alphabet + 32;
    const char* const it = std::find(z32_alphabet, end, c);
    return it == end ? -1 : static_cast<int>(it - z32_alphabet);
}

std::string encode(const key_type& key)
{
    std::string s;
    s.reserve(z32_key_length);
    uint32_t buffer = 0;
    int num_bits = 0;
    for(const uint8_t byte : key)
    {
        buffer = (buffer << 8) | byte;
        num_bits += 8;
        while(num_bits >= 5)
        {
            s += z32_alphabet[(buffer >> (num_bits - 5)) & 0x1f];
            num_bits -= 5;
        }
    }
    if(num_bits > 0) { s += z32_alphabet[(buffer << (5 - num_bits)) & 0x1f]; }
    return s;
}

static key_type decode_z32(const std::string& s)
{
    key_type key;
    uint32_t buffer = 0;
    int num_bits = 0;
    size_t pos = 0;
    for(const char c : s)
    {
        const int value = z32_value(c);
        if(value < 0)
        {
            throw std::invalid_argument(
                std::string("invalid z-base32 character '") + c + "' in key");
        }
        buffer = (buffer << 5) | value;
        num_bits += 5;
        if(num_bits >= 8)
        {
            key[pos++] = (buffer >> (num_bits - 8)) & 0xff;
            num_bits -= 8;
        }
    }
    // The 4 bits of padding must be zero, otherwise there would be several encodings
    // of the same key.
    if((buffer & ((1u << num_bits) - 1)) != 0)
    {
        throw std::invalid_argument("non-canonical z-base32 key");
    }
    return key;
}

key_type decode(const std::string& input)
{
    std::string s = input;
    util::trim(s);
    util::to_lower(s);
    if(s.length() == hex_key_length && util::is_hex(s))
    {
        const auto bytes = util::from_hex(s);
        key_type key;
        std::copy(bytes.begin(), bytes.end(), key.begin());
        return key;
    }
    else if(s.length() == z32_key_length)
    {
        return decode_z32(s);
    }
    throw std::invalid_argument("key must be 64 hex digits or 52 z-base32 characters,"
        " got '" + input + "'");
}

bool is_valid(const std::string& s) noexcept
{
    try
    {
        decode(s);
        return true;
    }
    catch(const std::invalid_argument&)
    {
        return false;
    }
}

std::string normalize(const std::string& s)
{
    return encode(decode(s));
}

} // namespace id_encoding
} // namespace driveprof
