#include "replication_error.hpp"

namespace driveprof {

std::string replication_error_category::message(int env) const
{
    switch(static_cast<replication_errc>(env))
    {
    case replication_errc::unknown:
        return "Unknown error";
    case replication_errc::invalid_handshake:
        return "Invalid handshake";
    case replication_errc::topic_mismatch:
        return "Peer joined a different topic";
    case replication_errc::self_connection:
        return "Connected to ourselves";
    case replication_errc::message_too_big:
        return "Peer's message exceeded max message length";
    case replication_errc::invalid_sync_message:
        return "Invalid 'sync' message";
    case replication_errc::invalid_request_message:
        return "Invalid 'request' message";
    case replication_errc::invalid_cancel_message:
        return "Invalid 'cancel' message";
    case replication_errc::invalid_data_message:
        return "Invalid 'data' message";
    case replication_errc::invalid_want_message:
        return "Invalid 'want' message";
    case replication_errc::invalid_bitfield_message:
        return "Invalid 'bitfield' message";
    case replication_errc::invalid_range_message:
        return "Invalid 'range' message";
    case replication_errc::invalid_extension_message:
        return "Invalid 'extension' message";
    case replication_errc::unknown_message:
        return "Could not identify message";
    case replication_errc::unknown_channel:
        return "Message on a channel that was never opened";
    case replication_errc::unwanted_block:
        return "Peer sent a block we did not request";
    case replication_errc::out_of_bounds:
        return "Peer announced blocks past the maximum core length";
    case replication_errc::invalid_drive_header:
        return "Invalid drive header";
    case replication_errc::invalid_drive_entry:
        return "Invalid drive entry";
    case replication_errc::block_not_found:
        return "Block not found in storage";
    case replication_errc::store_closed:
        return "Store closed";
    default:
        return "not replication related error";
    }
}

error_condition replication_error_category::default_error_condition(
    int ev) const noexcept
{
    switch(static_cast<replication_errc>(ev))
    {
    case replication_errc::message_too_big:
        return std::errc::message_size;
    case replication_errc::store_closed:
        return std::errc::operation_canceled;
    default:
        return error_condition(ev, *this);
    }
}

const replication_error_category& replication_category()
{
    static replication_error_category instance;
    return instance;
}

error_code make_error_code(replication_errc e)
{
    return error_code(static_cast<int>(e), replication_category());
}

error_condition make_error_condition(replication_errc e)
{
    return error_condition(static_cast<int>(e), replication_category());
}

} // namespace driveprof
