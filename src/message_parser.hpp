#ifndef DRIVEPROF_MESSAGE_PARSER_HEADER
#define DRIVEPROF_MESSAGE_PARSER_HEADER

#include "view.hpp"

#include <cstdint>
#include <vector>

namespace driveprof {

/**
 * A replication frame on the wire:
 *
 *  [u32 length][u8 type][u8 channel][payload]
 *
 * where length counts the type and channel bytes and the payload, but not itself.
 */
struct message
{
    uint8_t type;
    uint8_t channel;
    // The payload, excluding the length, type and channel fields.
    const_view<uint8_t> data;
};

/** The number of bytes preceding the payload. */
constexpr int message_header_size = 4 + 1 + 1;

/**
 * Accumulates the bytes read from a peer channel's socket and splits them into
 * frames on demand. Extracted messages point into the parser's own storage, so a
 * message must be handled before the next get_receive_buffer or
 * optimize_receive_space call.
 */
class message_parser
{
    std::vector<uint8_t> buffer_;

    // Offset of the length field of the next frame to extract.
    int message_begin_ = 0;

    // One past the last received byte. Bytes from here to the end of buffer_ hold
    // nothing.
    int unused_begin_ = 0;

public:
    bool is_empty() const noexcept { return size() == 0; }

    /** Received bytes, whether or not they were extracted. */
    int size() const noexcept { return unused_begin_; }

    int buffer_size() const noexcept { return int(buffer_.size()); }

    int free_space_size() const noexcept { return buffer_size() - size(); }

    /** Grows the buffer if fewer than n bytes are free. */
    void reserve(const int n);

    /** Space for the next read of up to n bytes, reserving it first if needed. */
    view<uint8_t> get_receive_buffer(const int n);

    /** Marks n bytes of the last receive buffer as filled by the socket. */
    void record_received_bytes(const int n) noexcept;

    /** Whether a complete frame is available. */
    bool has_message() const noexcept;

    /**
     * Consumes and returns the next frame. Throws logic_error when no complete frame
     * is buffered and invalid_argument when the length field can't even cover the
     * type and channel bytes.
     */
    message extract_message();

    /**
     * The value of the current message's length field, or -1 if fewer than four bytes
     * of it have arrived. Used to reject oversized frames before buffering them.
     */
    int current_message_length() const noexcept;

    /**
     * How many more bytes the next frame needs: 0 once it is complete, -1 while its
     * length field is still partial.
     */
    int num_bytes_left_till_completion() const noexcept;

    /**
     * Drops the extracted frames and moves a trailing partial frame to the start of
     * the buffer. Call after every complete frame was handled.
     */
    void optimize_receive_space();

private:
    bool has(const int n) const noexcept;
};

} // namespace driveprof

#endif // DRIVEPROF_MESSAGE_PARSER_HEADER
