#include "sha256_hasher.hpp"

namespace driveprof {

sha256_hasher::sha256_hasher()
{
    reset();
}

void sha256_hasher::reset()
{
    SHA256_Init(&context_);
}

sha256_hasher& sha256_hasher::update(const_view<uint8_t> buffer)
{
    SHA256_Update(&context_, buffer.data(), buffer.size());
    return *this;
}

sha256_hash sha256_hasher::finish()
{
    sha256_hash digest;
    SHA256_Final(digest.data(), &context_);
    return digest;
}

sha256_hash make_discovery_key(const key_type& key)
{
    static const std::string namespace_tag = "driveprof:discovery";
    sha256_hasher hasher;
    hasher.update(namespace_tag);
    hasher.update(key);
    return hasher.finish();
}

} // namespace driveprof
