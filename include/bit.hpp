#ifndef SDS_BIT_HPP
#define SDS_BIT_HPP

#include "common.hpp"
#include <array>


namespace sds {

template<typename Integer> // no concepts in C++17 :(
[[nodiscard]] SDS_CPP20_CONSTEXPR Index intLog2(Integer n) noexcept {
    if constexpr (std::is_signed_v<Integer>) {
        return intLog2(static_cast<std::make_unsigned_t<Integer>>(n));
    } else {
        static_assert(std::is_unsigned_v<Integer>);
        SDS_ASSUME(n > 0); // __builtin_clz produces UB in that case
#ifdef SDS_HAS_CPP20
        return Index(8 * sizeof(Integer)) - std::countl_zero(n) - 1;
#elif defined SDS_HAS_DEFAULT_GCC_INTRINSICS
        return 8 * sizeof(unsigned long long) - __builtin_clzll(n) - 1;
#elif defined SDS_HAS_MSVC_INTRINSICS
        unsigned long pos;
        _BitScanReverse64(&pos, std::uint64_t(n));
        return Index(pos);
#else
        Index res = 0;
        while (n >>= 1) {
            ++res;
        }
        return res;
#endif
    }
}

template<typename Integer>
[[nodiscard]] SDS_CPP20_CONSTEXPR Index roundUpLog2(Integer n) noexcept {
    if constexpr (std::is_signed_v<Integer>) {
        return roundUpLog2(static_cast<std::make_unsigned_t<Integer>>(n));
    } else {
        static_assert(std::is_unsigned_v<Integer>);
        assert(n > 0);
        if (n <= 1) {
            return 0;
        }
        return intLog2(Integer(n - 1)) + 1;
    }
}

/// \brief A mask of the lowest `width` bits, valid for all widths in [0, 64].
[[nodiscard]] constexpr U64 lowMask(Index width) noexcept {
    SDS_ASSUME(width >= 0 && width <= 64);
    return width == 64 ? ~U64(0) : (U64(1) << width) - 1;
}

template<typename T>
[[nodiscard]] constexpr Index popcountFallback(T n) noexcept {
    static_assert(std::is_unsigned_v<T>);
    // see https://graphics.stanford.edu/~seander/bithacks.html#CountBitsSetParallel
    n = n - ((n >> 1) & (T) ~(T)0 / 3);
    n = (n & (T) ~(T)0 / 15 * 3) + ((n >> 2) & (T) ~(T)0 / 15 * 3);
    n = (n + (n >> 4)) & (T) ~(T)0 / 255 * 15;
    return (T)(n * ((T) ~(T)0 / 255)) >> (sizeof(T) - 1) * 8;
}

template<typename UnsignedInteger>
[[nodiscard]] SDS_CPP20_CONSTEXPR Index popcount(UnsignedInteger n) noexcept {
    static_assert(std::is_unsigned_v<UnsignedInteger>);
#ifdef SDS_HAS_CPP20
    return std::popcount(n);
#elif defined SDS_HAS_DEFAULT_GCC_INTRINSICS
    return __builtin_popcountll(std::uint64_t(n));
#elif defined SDS_HAS_MSVC_INTRINSICS
    return __popcnt64(std::uint64_t(n));
#else
    return popcountFallback(n);
#endif
}

/// \brief Returns the number of ones in `val` strictly below bit `pos`.
template<typename UnsignedInteger>
[[nodiscard]] SDS_CPP20_CONSTEXPR Index popcountBefore(UnsignedInteger val, Index pos) noexcept {
    SDS_ASSUME(pos >= 0);
    SDS_ASSUME(pos < Index(sizeof(UnsignedInteger) * 8));
    const Index shiftAmount = sizeof(UnsignedInteger) * 8 - pos - 1;
    return popcount(UnsignedInteger((val << shiftAmount) << 1)); // two shifts to ignore bit pos without invoking UB
}

[[nodiscard]] SDS_CPP20_CONSTEXPR Index countTrailingZeros(U64 n) noexcept {
    SDS_ASSUME(n > 0); // undefined otherwise
#ifdef SDS_HAS_CPP20
    return static_cast<Index>(std::countr_zero(n));
#elif defined SDS_HAS_DEFAULT_GCC_INTRINSICS
    return static_cast<Index>(__builtin_ctzll(n));
#elif defined SDS_HAS_MSVC_INTRINSICS
    unsigned long pos;
    _BitScanForward64(&pos, n);
    return static_cast<Index>(pos);
#else
    Index res = 0;
    for (; (n & 1) == 0; n >>= 1) {
        ++res;
    }
    return res;
#endif
}

/// \brief Reference implementation of in-word select that clears the lowest set bit `bitRank` times.
/// Only used for testing and for building the lookup table at compile time.
[[nodiscard]] constexpr Index u64SelectNaive(U64 value, Index bitRank) noexcept {
    if (bitRank >= popcountFallback(value)) {
        return -1;
    }
    for (Index i = 0; i < bitRank; ++i) {
        value &= value - 1;
    }
    Index pos = 0;
    for (value &= ~(value - 1); value > 1; value >>= 1) {
        ++pos;
    }
    return pos;
}

template<Index BitSize = 8>
using BitSelectTable = std::array<std::array<Byte, BitSize>, (1ull << BitSize)>;

template<Index BitSize = 8>
[[nodiscard]] SDS_CONSTEVAL BitSelectTable<BitSize> precomputeBitSelectTable() noexcept {
    BitSelectTable<BitSize> table{}; // {} needed for constant evaluation
    for (Index bitString = 0; bitString < Index(table.size()); ++bitString) {
        for (Index bitRank = 0; bitRank < BitSize; ++bitRank) {
            table[bitString][bitRank] = static_cast<Byte>(u64SelectNaive(U64(bitString), bitRank));
        }
    }
    return table;
}

constexpr static inline BitSelectTable<> byteSelectTable = precomputeBitSelectTable();

[[nodiscard]] constexpr Index byteSelectWithTable(Byte byte, Index bitRank) noexcept {
    return byteSelectTable[byte][bitRank];
}

namespace detail {

constexpr U64 onesStep8 = 0x0101'0101'0101'0101ull;
constexpr U64 msbsStep8 = 0x8080'8080'8080'8080ull;

/// \brief Bytewise inclusive prefix popcounts of `value`: byte j holds the number of ones in bytes 0 to j.
[[nodiscard]] constexpr U64 bytePrefixCounts(U64 value) noexcept {
    U64 counts = value - ((value >> 1) & 0x5555'5555'5555'5555ull);
    counts = (counts & 0x3333'3333'3333'3333ull) + ((counts >> 2) & 0x3333'3333'3333'3333ull);
    counts = (counts + (counts >> 4)) & 0x0f0f'0f0f'0f0f'0f0full;
    return counts * onesStep8;
}

/// \brief Index of the first bit of the byte that contains the one with rank `bitRank`, given the prefix counts.
[[nodiscard]] SDS_CPP20_CONSTEXPR Index selectByteOffset(U64 prefixCounts, Index bitRank) noexcept {
    // The maximum (rank + 1) is 64, so setting the 7th bit of each byte prevents borrows between bytes. The rightmost
    // byte where the 7th bit remained set is the first byte whose prefix count exceeds bitRank.
    U64 x = (prefixCounts | msbsStep8) - (U64(bitRank + 1) * onesStep8);
    return countTrailingZeros((x & msbsStep8) >> 7);
}

} // namespace detail

/// \brief Broadword select with a byte lookup table, based on
/// https://github.com/s-yata/marisa-trie/blob/master/lib/marisa/grimoire/vector/bit-vector.cc
/// \param value The word to search in.
/// \param bitRank The rank of the wanted one, must be less than `popcount(value)`.
/// \return The position of the bitRank-th one, counting from the least significant bit.
[[nodiscard]] SDS_CPP20_CONSTEXPR Index u64SelectWithTable(U64 value, Index bitRank) noexcept {
    SDS_ASSUME(bitRank >= 0 && bitRank < 64);
    const U64 counts = detail::bytePrefixCounts(value);
    const Index numBitsBeforeByte = detail::selectByteOffset(counts, bitRank);
    SDS_ASSUME(numBitsBeforeByte >= 0);
    SDS_ASSUME(numBitsBeforeByte <= 64 - 8);
    bitRank -= Index(((counts << 8) >> numBitsBeforeByte) & 0xff);
    SDS_ASSUME(bitRank >= 0);
    SDS_ASSUME(bitRank < 8);
    return numBitsBeforeByte + byteSelectWithTable(static_cast<Byte>(value >> numBitsBeforeByte), bitRank);
}

/// \brief Same byte search as u64SelectWithTable(), but finishes inside the byte by clearing at most 7 lower ones
/// instead of a table lookup.
[[nodiscard]] SDS_CPP20_CONSTEXPR Index u64SelectBroadword(U64 value, Index bitRank) noexcept {
    SDS_ASSUME(bitRank >= 0 && bitRank < 64);
    const U64 counts = detail::bytePrefixCounts(value);
    const Index numBitsBeforeByte = detail::selectByteOffset(counts, bitRank);
    bitRank -= Index(((counts << 8) >> numBitsBeforeByte) & 0xff);
    U64 byte = (value >> numBitsBeforeByte) & 0xff;
    for (Index i = 0; i < bitRank; ++i) {
        byte &= byte - 1;
    }
    return numBitsBeforeByte + countTrailingZeros(byte);
}

[[nodiscard]] SDS_CPP20_CONSTEXPR Index u64Select(U64 value, Index bitRank) noexcept {
    return u64SelectWithTable(value, bitRank);
}

/// \brief Select among the zeros of `value`.
[[nodiscard]] SDS_CPP20_CONSTEXPR Index u64SelectZero(U64 value, Index bitRank) noexcept {
    return u64Select(~value, bitRank);
}

} // namespace sds

#endif // SDS_BIT_HPP
