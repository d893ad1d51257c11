#ifndef DRIVEPROF_REPLICATION_ERROR_HEADER
#define DRIVEPROF_REPLICATION_ERROR_HEADER

#include "error_code.hpp"

#include <type_traits> // true_type
#include <string>

namespace driveprof {

/**
 * These are the errors that may occur while replicating with a peer. Protocol
 * violations result in the peer being disconnected.
 */
enum class replication_errc
{
    unknown = 1,

    // The swarm handshake was malformed.
    invalid_handshake,

    // The peer is interested in a different topic (discovery key) than us.
    topic_mismatch,

    // We connected to ourselves.
    self_connection,

    // The message length exceeded the maximum allowed frame size.
    message_too_big,

    // Generic invalid messages.
    invalid_sync_message,
    invalid_request_message,
    invalid_cancel_message,
    invalid_data_message,
    invalid_want_message,
    invalid_bitfield_message,
    invalid_range_message,
    invalid_extension_message,

    // We could not identify the message so to be safe the connection was closed.
    unknown_message,

    // The message referred to a channel the peer never opened with a sync message.
    unknown_channel,

    // The peer sent a block we did not request.
    unwanted_block,

    // The peer announced a core length or block range past the maximum core length.
    out_of_bounds,

    // The drive's header block (the first block of the metadata core) is malformed.
    invalid_drive_header,

    // A drive entry in the metadata core is malformed.
    invalid_drive_entry,

    // A block was read from local storage but it was missing or truncated.
    block_not_found,

    // The store was closed while the operation was pending.
    store_closed
};

struct replication_error_category : public error_category
{
    const char* name() const noexcept override { return "replication"; }
    std::string message(int env) const override;
    error_condition default_error_condition(int ev) const noexcept override;
};

const replication_error_category& replication_category();
error_code make_error_code(replication_errc e);
error_condition make_error_condition(replication_errc e);

} // namespace driveprof

namespace DRIVEPROF_ERROR_CODE_NS {
template <>
struct is_error_code_enum<driveprof::replication_errc> : public true_type
{};
} // namespace DRIVEPROF_ERROR_CODE_NS

#endif // DRIVEPROF_REPLICATION_ERROR_HEADER
