#ifndef SDS_COMMON_HPP
#define SDS_COMMON_HPP

#include <algorithm>
#include <cassert>
#include <cstdint>
#include <cstring>
#include <iterator>
#include <memory>
#include <ostream>
#include <random>
#include <type_traits>

static_assert(__cplusplus >= 201703L, "sds requires at least C++17 (concepts and <bit> need C++20)");
static_assert(sizeof(void*) >= 8, "sds requires a 64 bit system");

#ifdef _MSC_VER
#define SDS_HAS_MSVC_INTRINSICS
#include <intrin.h>
#elif defined __clang__ || defined __GNUC__
#ifdef __clang__
// function calls in SDS_ASSUME are fine, they turn into asserts in debug builds
#pragma clang diagnostic ignored "-Wassume"
#endif
#define SDS_HAS_DEFAULT_GCC_INTRINSICS
#endif // _MSC_VER

#if __cplusplus >= 202002L
#include <bit>
#include <concepts>
#define SDS_HAS_CPP20
#define SDS_CONSTEVAL consteval
#define SDS_CPP20_CONSTEXPR constexpr
#else
#define SDS_CONSTEVAL constexpr
#define SDS_CPP20_CONSTEXPR inline
#endif

#if __has_cpp_attribute(assume)
#define SDS_ASSUME_IMPL(x) [[assume(x)]]
#elif defined __clang__
#define SDS_ASSUME_IMPL(x) __builtin_assume(x)
#elif defined(__GNUC__) && !defined(__ICC)
// side effects of x are not ignored
#define SDS_ASSUME_IMPL(x)                                                                                             \
    if (x) {                                                                                                           \
    } else {                                                                                                           \
        __builtin_unreachable();                                                                                       \
    }
#elif defined _MSC_VER || defined __ICC
#define SDS_ASSUME_IMPL(x) __assume(x)
#endif

/// Precondition of an unchecked operation. Checked with assert in debug builds, an optimizer hint otherwise.
#ifdef NDEBUG
#define SDS_ASSUME(x) SDS_ASSUME_IMPL(x)
#else
#define SDS_ASSUME(x) assert(x)
#endif

namespace sds {

using Byte = unsigned char;
using Index = std::ptrdiff_t;
using U64 = std::uint64_t;
using U16 = std::uint16_t;
using Limb = U64;

static constexpr Index CACHELINE_SIZE_BYTES = 64;
static constexpr Index LIMB_BITS = 64;

[[nodiscard]] constexpr Index roundUpDiv(Index dividend, Index divisor) noexcept {
    SDS_ASSUME(dividend >= 0 && divisor > 0);
    return (dividend + divisor - 1) / divisor;
}

[[nodiscard]] constexpr Index roundUpTo(Index value, Index divisor) noexcept {
    SDS_ASSUME(value >= 0 && divisor > 0);
    return roundUpDiv(value, divisor) * divisor;
}

/// \brief The number of 64 bit words needed to store `numBits` bits.
[[nodiscard]] constexpr Index numLimbsForBits(Index numBits) noexcept { return roundUpDiv(numBits, LIMB_BITS); }

/// A randomly seeded engine for tests and benchmarks.
[[nodiscard]] inline std::mt19937_64 createRandomEngine() noexcept {
    std::random_device rd;
    std::seed_seq seq{rd(), rd(), rd(), rd()};
    return std::mt19937_64(seq);
}


/// Non-owning view of contiguous elements, the subset of std::span that the structures need.
template<typename T>
class [[nodiscard]] Span {
    T* first_ = nullptr;
    Index size_ = 0;

public:
    using value_type = T;

    constexpr Span() noexcept = default;
    constexpr Span(T* ptr, Index size) noexcept : first_(ptr), size_(size) { assert(size >= 0); }
    constexpr Span(T* first, T* last) noexcept : first_(first), size_(last - first) { assert(size_ >= 0); }

    template<typename Container, typename = std::enable_if_t<std::is_same_v<typename Container::value_type, std::remove_cv_t<T>>>>
    /*implicit*/ SDS_CPP20_CONSTEXPR Span(Container& c) : Span(c.data(), Index(c.size())) {}

    [[nodiscard]] constexpr Index size() const noexcept { return size_; }
    [[nodiscard]] constexpr bool empty() const noexcept { return size_ == 0; }

    [[nodiscard]] constexpr T& operator[](Index i) const noexcept {
        assert(i >= 0 && i < size_);
        return first_[i];
    }

    [[nodiscard]] constexpr T* data() const noexcept { return first_; }
    [[nodiscard]] constexpr T* begin() const noexcept { return first_; }
    [[nodiscard]] constexpr T* end() const noexcept { return first_ + size_; }

    [[nodiscard]] constexpr Span subspan(Index offset, Index count) const noexcept {
        assert(offset >= 0 && count >= 0 && offset + count <= size_);
        return Span(first_ + offset, count);
    }
};

template<typename Container>
Span(Container&) -> Span<std::remove_reference_t<decltype(*std::declval<Container&>().data())>>;

/// An iterator pair, used to expose value iterators as a range.
template<typename Iter, typename Sentinel = Iter>
struct [[nodiscard]] Subrange {
    Iter first;
    Sentinel last;

    using value_type = typename std::iterator_traits<Iter>::value_type;

    [[nodiscard]] constexpr Iter begin() const noexcept { return first; }
    [[nodiscard]] constexpr Sentinel end() const noexcept { return last; }
    [[nodiscard]] constexpr Index size() const noexcept { return last - first; }
    [[nodiscard]] constexpr auto operator[](Index i) const noexcept -> decltype(begin()[i]) { return begin()[i]; }
};

} // namespace sds

#endif // SDS_COMMON_HPP
