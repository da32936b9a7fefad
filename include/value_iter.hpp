#ifndef SDS_VALUE_ITER_HPP
#define SDS_VALUE_ITER_HPP

#include "common.hpp"

namespace sds {

/// \brief A random access iterator over a container whose elements can only be read by value, such as packed integers.
/// Dereferencing calls `getUnchecked(i)` on the container.
template<typename Container, typename Value = U64>
class [[nodiscard]] ValueIter {
    const Container* cPtr = nullptr;
    Index i = 0;

public:
    using iterator_category = std::random_access_iterator_tag;
    using value_type = Value;
    using difference_type = Index;
    using pointer = void;
    using reference = value_type;

    constexpr ValueIter() noexcept = default;
    explicit constexpr ValueIter(const Container& c, Index pos = 0) noexcept : cPtr(&c), i(pos) {}

    [[nodiscard]] constexpr Index index() const noexcept { return i; }

    constexpr ValueIter& operator++() noexcept { return *this += 1; }
    constexpr ValueIter operator++(int) noexcept {
        ValueIter copy(*this);
        ++*this;
        return copy;
    }
    constexpr ValueIter& operator--() noexcept { return *this -= 1; }
    constexpr ValueIter operator--(int) noexcept {
        ValueIter copy(*this);
        --*this;
        return copy;
    }
    constexpr ValueIter& operator+=(Index n) noexcept {
        i += n;
        return *this;
    }
    constexpr ValueIter& operator-=(Index n) noexcept {
        i -= n;
        return *this;
    }

    [[nodiscard]] friend constexpr ValueIter operator+(ValueIter iter, Index n) noexcept { return iter += n; }
    [[nodiscard]] friend constexpr ValueIter operator+(Index n, ValueIter iter) noexcept { return iter += n; }
    [[nodiscard]] friend constexpr ValueIter operator-(ValueIter iter, Index n) noexcept { return iter -= n; }
    [[nodiscard]] friend constexpr Index operator-(ValueIter a, ValueIter b) noexcept { return a.i - b.i; }

    [[nodiscard]] constexpr reference operator*() const { return operator[](0); }

    [[nodiscard]] constexpr reference operator[](Index n) const { return cPtr->getUnchecked(i + n); }

    [[nodiscard]] friend constexpr bool operator==(ValueIter lhs, ValueIter rhs) noexcept { return lhs.i == rhs.i; }
    [[nodiscard]] friend constexpr bool operator!=(ValueIter lhs, ValueIter rhs) noexcept { return lhs.i != rhs.i; }
    [[nodiscard]] friend constexpr bool operator<(ValueIter lhs, ValueIter rhs) noexcept { return lhs.i < rhs.i; }
    [[nodiscard]] friend constexpr bool operator>(ValueIter lhs, ValueIter rhs) noexcept { return rhs < lhs; }
    [[nodiscard]] friend constexpr bool operator<=(ValueIter lhs, ValueIter rhs) noexcept { return !(rhs < lhs); }
    [[nodiscard]] friend constexpr bool operator>=(ValueIter lhs, ValueIter rhs) noexcept { return !(lhs < rhs); }
};

} // namespace sds

#endif // SDS_VALUE_ITER_HPP
