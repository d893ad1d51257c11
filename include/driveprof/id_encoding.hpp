#ifndef DRIVEPROF_ID_ENCODING_HEADER
#define DRIVEPROF_ID_ENCODING_HEADER

#include "types.hpp"

#include <string>

namespace driveprof {

/**
 * Textual forms of 32 byte keys. A key may be given either as 64 hex digits or as
 * 52 z-base32 characters (case insensitive); keys are always displayed in lowercase
 * z-base32, which is what `normalize` returns.
 */
namespace id_encoding {

/** Encodes `key` in z-base32. */
std::string encode(const key_type& key);

/**
 * Decodes either textual form, ignoring surrounding whitespace. Throws
 * `std::invalid_argument` if `s` is neither.
 */
key_type decode(const std::string& s);

/** Returns whether `decode` would succeed. */
bool is_valid(const std::string& s) noexcept;

/** Returns the canonical z-base32 form of any accepted textual form. */
std::string normalize(const std::string& s);

inline std::string normalize(const key_type& key)
{
    return encode(key);
}

} // namespace id_encoding
} // namespace driveprof

#endif // DRIVEPROF_ID_ENCODING_HEADER
