#ifndef DRIVEPROF_BITFIELD_HEADER
#define DRIVEPROF_BITFIELD_HEADER

#include <algorithm>
#include <cassert>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace driveprof {

/**
 * Block availability of a core. Bit 0 is the most significant bit of the first byte,
 * so that the raw bytes read left to right in block order when sent over the wire.
 *
 * Unlike a torrent's piece count, a core's length is not known up front, so the
 * bitfield grows as blocks are appended or announced. Excess bits are always zero.
 */
class bitfield
{
public:
    using size_type = uint64_t;
    using block_type = uint8_t;

private:
    std::vector<block_type> blocks_;
    size_type num_bits_ = 0;

public:
    bitfield() = default;

    explicit bitfield(size_type num_bits)
        : blocks_(num_blocks_for(num_bits), 0), num_bits_(num_bits)
    {}

    /**
     * Creates a bitfield from the raw bytes sent by a peer. The byte count must match
     * num_bits and the excess bits must be zero, otherwise an invalid_argument
     * exception is thrown.
     */
    template <typename Bytes>
    static bitfield from_bytes(const Bytes& bytes, size_type num_bits)
    {
        if(!is_raw_bitfield_valid(bytes, num_bits)) {
            throw std::invalid_argument(
                "byte sequence does not match the number of bits in bitfield");
        }
        bitfield b;
        b.blocks_.assign(bytes.begin(), bytes.end());
        b.num_bits_ = num_bits;
        return b;
    }

    template <typename Bytes>
    static bool is_raw_bitfield_valid(const Bytes& bytes, size_type num_bits) noexcept
    {
        if(num_blocks_for(num_bits) != size_type(bytes.size())) {
            return false;
        }
        if(bytes.size() == 0) {
            return true;
        }
        const block_type last = *(bytes.begin() + (bytes.size() - 1));
        const block_type mask = block_type(~block_type(0) << num_excess_bits(num_bits));
        return (last & mask) == last;
    }

    const std::vector<block_type>& data() const noexcept { return blocks_; }

    size_type size() const noexcept { return num_bits_; }

    /** Grows (or shrinks) to num_bits. New bits are zero. */
    void resize(const size_type num_bits)
    {
        blocks_.resize(num_blocks_for(num_bits), 0);
        num_bits_ = num_bits;
        clear_unused_bits();
    }

    bitfield& set(const size_type bit)
    {
        if(bit >= num_bits_) {
            resize(bit + 1);
        }
        blocks_[block_index(bit)] |= make_bit_mask(bit);
        return *this;
    }

    bitfield& set_range(const size_type begin, const size_type end)
    {
        for(auto i = begin; i < end; ++i) {
            set(i);
        }
        return *this;
    }

    bitfield& reset(const size_type bit) noexcept
    {
        if(bit < num_bits_) {
            blocks_[block_index(bit)] &= ~make_bit_mask(bit);
        }
        return *this;
    }

    /** Bits past the end are reported as unset. */
    bool test(const size_type bit) const noexcept
    {
        if(bit >= num_bits_) {
            return false;
        }
        return (blocks_[block_index(bit)] & make_bit_mask(bit)) != 0;
    }

    bool operator[](const size_type bit) const noexcept { return test(bit); }

    /** Whether every bit in [begin, end) is set. An empty range is trivially set. */
    bool all_set(const size_type begin, const size_type end) const noexcept
    {
        for(auto i = begin; i < end; ++i) {
            if(!test(i)) {
                return false;
            }
        }
        return true;
    }

    /** Returns the index of the first unset bit at or after `from`. */
    size_type first_unset(size_type from = 0) const noexcept
    {
        while(test(from)) {
            ++from;
        }
        return from;
    }

    size_type count() const noexcept
    {
        size_type n = 0;
        for(size_type i = 0; i < num_bits_; ++i) {
            if(test(i)) {
                ++n;
            }
        }
        return n;
    }

    std::string to_string() const
    {
        std::string s(num_bits_, '0');
        for(size_type i = 0; i < num_bits_; ++i) {
            if(test(i)) {
                s[i] = '1';
            }
        }
        return s;
    }

    friend bool operator==(const bitfield& a, const bitfield& b) noexcept
    {
        return (a.num_bits_ == b.num_bits_) && (a.blocks_ == b.blocks_);
    }

    friend bool operator!=(const bitfield& a, const bitfield& b) noexcept
    {
        return !(a == b);
    }

private:
    static constexpr size_type bits_per_block() noexcept { return 8; }

    static constexpr size_type num_blocks_for(const size_type num_bits) noexcept
    {
        return (num_bits + bits_per_block() - 1) / bits_per_block();
    }

    static constexpr size_type block_index(const size_type bit) noexcept
    {
        return bit / bits_per_block();
    }

    static constexpr block_type make_bit_mask(const size_type bit) noexcept
    {
        return block_type(1 << (bits_per_block() - bit % bits_per_block() - 1));
    }

    static constexpr int num_excess_bits(const size_type num_bits) noexcept
    {
        const auto rem = num_bits % bits_per_block();
        return rem == 0 ? 0 : int(bits_per_block() - rem);
    }

    void clear_unused_bits() noexcept
    {
        if(blocks_.empty()) {
            return;
        }
        blocks_.back() &= block_type(~block_type(0) << num_excess_bits(num_bits_));
    }
};

} // namespace driveprof

#endif // DRIVEPROF_BITFIELD_HEADER
