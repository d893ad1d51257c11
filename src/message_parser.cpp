#include "message_parser.hpp"
#include "endian.hpp"

#include <algorithm>
#include <cassert>
#include <stdexcept>

namespace driveprof {

void message_parser::reserve(const int n)
{
    if(n <= buffer_size()) { return; }
    buffer_.resize(n);
}

view<uint8_t> message_parser::get_receive_buffer(const int n)
{
    if(n > free_space_size())
    {
        buffer_.resize(buffer_size() + n - free_space_size());
    }
    return view<uint8_t>(&buffer_[unused_begin_], n);
}

void message_parser::record_received_bytes(const int n) noexcept
{
    assert(n >= 0);
    assert(size() + n <= buffer_size());
    unused_begin_ += n;
}

bool message_parser::has_message() const noexcept
{
    const int length = current_message_length();
    if(length < 0) { return false; }
    return has(4 + length);
}

message message_parser::extract_message()
{
    const int length = current_message_length();
    if(length < 0 || !has(4 + length))
    {
        throw std::logic_error("message_parser has no messages");
    }
    if(length < 2)
    {
        throw std::invalid_argument("message frame too short");
    }

    const uint8_t* pos = &buffer_[message_begin_ + 4];
    message msg;
    msg.type = pos[0];
    msg.channel = pos[1];
    msg.data = const_view<uint8_t>(pos + 2, size_t(length - 2));
    message_begin_ += 4 + length;
    return msg;
}

int message_parser::current_message_length() const noexcept
{
    if(!has(4)) { return -1; }
    const auto length = endian::read_network<uint32_t>(&buffer_[message_begin_]);
    // Anything that doesn't fit in an int is certainly too large for us.
    if(length > uint32_t(0x7fffffff - 4)) { return 0x7fffffff - 4; }
    return int(length);
}

int message_parser::num_bytes_left_till_completion() const noexcept
{
    const int length = current_message_length();
    if(length < 0) { return -1; }
    const int num_available = unused_begin_ - message_begin_;
    return std::max(4 + length - num_available, 0);
}

void message_parser::optimize_receive_space()
{
    if(message_begin_ >= unused_begin_)
    {
        // Everything was consumed, reset to the beginning of the buffer.
        message_begin_ = 0;
        unused_begin_ = 0;
        return;
    }
    if(message_begin_ == 0) { return; }

    const auto begin = buffer_.begin();
    std::copy(begin + message_begin_, begin + unused_begin_, begin);
    unused_begin_ -= message_begin_;
    message_begin_ = 0;
}

inline bool message_parser::has(const int n) const noexcept
{
    return unused_begin_ - message_begin_ >= n;
}

} // namespace driveprof
