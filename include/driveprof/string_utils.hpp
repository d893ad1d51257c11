#ifndef DRIVEPROF_STRING_UTILS_HEADER
#define DRIVEPROF_STRING_UTILS_HEADER

#include <algorithm>
#include <cctype> // std::isspace, std::tolower
#include <cstdint>
#include <cstdio> // std::snprintf
#include <iterator> // std::begin, std::end
#include <memory> // std::unique_ptr
#include <stdexcept>
#include <string>
#include <vector>

namespace driveprof {
namespace util {

template <typename String>
inline void ltrim(String& s)
{
    s.erase(std::begin(s), std::find_if(std::begin(s), std::end(s), [](const auto& c) {
        return !std::isspace(static_cast<unsigned char>(c));
    }));
}

template <typename String>
inline void rtrim(String& s)
{
    s.erase(std::find_if(std::rbegin(s), std::rend(s),
                    [](const auto& c) {
                        return !std::isspace(static_cast<unsigned char>(c));
                    })
                    .base(),
            std::end(s));
}

template <typename String>
inline void trim(String& s)
{
    ltrim(s);
    rtrim(s);
}

template <typename String>
inline void to_lower(String& s)
{
    std::transform(std::begin(s), std::end(s), std::begin(s), [](const auto& c) {
        return std::tolower(static_cast<unsigned char>(c));
    });
}

template <typename String1, typename String2>
bool starts_with(const String1& s, const String2& prefix) noexcept
{
    return s.size() >= prefix.size()
            && std::equal(prefix.begin(), prefix.end(), s.begin());
}

template <typename Bytes>
std::string to_hex(const Bytes& data)
{
    static constexpr char hex_chars[] = "0123456789abcdef";
    std::string hex_str;
    const size_t size = std::end(data) - std::begin(data);
    hex_str.reserve(size * 2);
    for(size_t i = 0; i < size; ++i) {
        const uint8_t byte = data[i];
        hex_str += hex_chars[byte >> 4];
        hex_str += hex_chars[byte & 0xf];
    }
    return hex_str;
}

/** Determines whether `s` is a hexadecimal number. */
template <typename InputIt>
bool is_hex(InputIt begin, InputIt end)
{
    static const char hex_digits[] = "0123456789abcdefABCDEF";
    while(begin != end) {
        const auto c = *begin++;
        if(std::end(hex_digits) - 1
                == std::find(std::begin(hex_digits), std::end(hex_digits) - 1, c)) {
            return false;
        }
    }
    return true;
}

template <typename Iterable>
bool is_hex(const Iterable& s)
{
    return is_hex(std::begin(s), std::end(s));
}

inline int hex_digit_value(const char c)
{
    if(c >= '0' && c <= '9') {
        return c - '0';
    } else if(c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    } else if(c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    throw std::invalid_argument(std::string("not a hex digit: ") + c);
}

/**
 * Decodes a hex string into its bytes. If the string has an odd length or contains
 * a non-hex character, an invalid_argument exception is thrown.
 */
inline std::vector<uint8_t> from_hex(const std::string& s)
{
    if(s.length() % 2 != 0) {
        throw std::invalid_argument("hex string must have an even length");
    }
    std::vector<uint8_t> bytes;
    bytes.reserve(s.length() / 2);
    for(size_t i = 0; i < s.length(); i += 2) {
        bytes.push_back(hex_digit_value(s[i]) << 4 | hex_digit_value(s[i + 1]));
    }
    return bytes;
}

template <typename... Args>
std::string format(const char* format_str, Args&&... args)
{
    const size_t length = std::snprintf(nullptr, 0, format_str, args...) + 1;
    std::unique_ptr<char[]> buffer(new char[length]);
    std::snprintf(buffer.get(), length, format_str, args...);
    // -1 to exclude the '\0' at the end
    return std::string(buffer.get(), buffer.get() + length - 1);
}

} // namespace util
} // namespace driveprof

#endif // DRIVEPROF_STRING_UTILS_HEADER
