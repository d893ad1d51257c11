#ifndef DRIVEPROF_SHA256_HASHER_HEADER
#define DRIVEPROF_SHA256_HASHER_HEADER

#include "types.hpp"
#include "view.hpp"

#include <array>
#include <string>
#include <utility> // declval

#include <openssl/sha.h>

namespace driveprof {

/**
 * Incremental SHA-256. Feed it with update() and retrieve the digest with finish().
 * It is used to derive the discovery key (the topic joined in the swarm) from a
 * drive's key, so that the key itself is never announced.
 */
class sha256_hasher
{
    SHA256_CTX context_;

public:

    sha256_hasher();

    void reset();

    sha256_hasher& update(const_view<uint8_t> buffer);
    template<
        typename Container,
        typename = decltype(std::declval<Container>().data())
    > sha256_hasher& update(const Container& buffer);

    sha256_hash finish();
};

template<typename Container, typename>
sha256_hasher& sha256_hasher::update(const Container& buffer)
{
    return update(const_view<uint8_t>(
        reinterpret_cast<const uint8_t*>(buffer.data()), buffer.size()));
}

/** Returns SHA-256("driveprof:discovery" || key). */
sha256_hash make_discovery_key(const key_type& key);

} // namespace driveprof

#endif // DRIVEPROF_SHA256_HASHER_HEADER
