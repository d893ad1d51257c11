#ifndef DRIVEPROF_VIEW_HEADER
#define DRIVEPROF_VIEW_HEADER

#include <array>
#include <cstddef>
#include <iterator>
#include <stdexcept>
#include <type_traits>

namespace driveprof {

/**
 * A memory view that takes a pointer and a length and provides basic container like
 * operations, but does not take ownership of the resource.
 */
template <typename T>
struct view
{
    using value_type = T;
    using difference_type = std::ptrdiff_t;
    using size_type = size_t;
    using reference = value_type&;
    using const_reference = const value_type&;
    using pointer = value_type*;
    using const_pointer = const value_type*;
    using iterator = pointer;
    using const_iterator = const_pointer;

private:
    pointer data_ = nullptr;
    size_type length_ = 0;

public:
    view() = default;

    constexpr view(pointer data, size_type length) : data_(data), length_(length) {}

    constexpr view(pointer begin, pointer end) : data_(begin), length_(end - begin) {}

    template <typename U>
    constexpr view(const view<U>& other) : data_(other.data()), length_(other.length())
    {}

    template <typename U, size_type N>
    constexpr view(std::array<U, N>& arr) : data_(arr.data()), length_(arr.size())
    {}

    template <typename U, size_type N>
    constexpr view(const std::array<U, N>& arr) : data_(arr.data()), length_(arr.size())
    {}

    template <typename Container, typename = decltype(std::declval<Container>().data())>
    view(Container& c) : data_(c.data()), length_(c.size())
    {}

    constexpr size_type size() const noexcept { return length(); }
    constexpr size_type length() const noexcept { return length_; }
    constexpr bool empty() const noexcept { return length() == 0; }

    constexpr pointer data() const noexcept { return data_; }

    constexpr iterator begin() const noexcept { return data(); }
    constexpr iterator end() const noexcept { return begin() + size(); }

    constexpr reference operator[](const size_type i) const noexcept { return data_[i]; }

    constexpr view subview(const size_type offset) const
    {
        if(offset > size()) {
            throw std::out_of_range("tried to create a subview that is larger than view");
        }
        return {data() + offset, size() - offset};
    }

    constexpr view subview(const size_type offset, const size_type count) const
    {
        if((offset > size()) || (offset + count > size())) {
            throw std::out_of_range("tried to create a subview that is larger than view");
        }
        return {data() + offset, count};
    }

    constexpr void trim_front(const size_type n)
    {
        if(n > size()) {
            throw std::out_of_range(
                    "tried to trim more from front of view than its size");
        }
        data_ += n;
        length_ -= n;
    }
};

template <typename T>
using const_view = view<const T>;

} // namespace driveprof

#endif // DRIVEPROF_VIEW_HEADER
