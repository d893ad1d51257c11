#ifndef DRIVEPROF_REPLICATED_TREE_HEADER
#define DRIVEPROF_REPLICATED_TREE_HEADER

#include "error_code.hpp"
#include "types.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace driveprof {

/** What a connected peer has told us about its replica of a stream. */
struct remote_peer_info
{
    int64_t remote_length = 0;
    int64_t remote_contiguous_length = 0;
    // The peer's public key in normalized (z-base32) form.
    std::string remote_public_key;
};

/** An append-only log of blocks, replicated between peers. */
class replicated_stream
{
public:

    virtual ~replicated_stream() = default;

    /** The number of blocks in the stream, as far as we know. */
    virtual int64_t length() const = 0;

    /** The number of blocks we hold from the start of the stream without gaps. */
    virtual int64_t contiguous_length() const = 0;

    /** The peers we are currently replicating this stream with. */
    virtual std::vector<remote_peer_info> peers() const = 0;

    /** Invokes `handler` once, the next time the stream's length grows. */
    virtual void on_append(std::function<void()> handler) = 0;
};

/**
 * A drive: a metadata stream holding the file entries, and a blob stream holding the
 * file contents. The blob stream is only known once the drive's header has been
 * replicated, so `blobs` may return null early on.
 */
class replicated_tree
{
public:

    using completion_handler = std::function<void(const error_code&)>;

    virtual ~replicated_tree() = default;

    /** Invokes `handler` once the drive's local state has been loaded. */
    virtual void ready(completion_handler handler) = 0;

    virtual const key_type& key() const = 0;

    /** The topic under which peers of this drive meet in the swarm. */
    virtual const key_type& discovery_key() const = 0;

    virtual int64_t version() const = 0;

    virtual replicated_stream& metadata() = 0;
    virtual const replicated_stream& metadata() const = 0;
    virtual replicated_stream* blobs() = 0;
    virtual const replicated_stream* blobs() const = 0;

    /**
     * Downloads every entry under `path` along with its contents, waiting for peers
     * that have the data for as long as it takes. `handler` is invoked once
     * everything is held locally, or with an error if the download cannot complete.
     */
    virtual void download(const std::string& path, completion_handler handler) = 0;
};

} // namespace driveprof

#endif // DRIVEPROF_REPLICATED_TREE_HEADER
