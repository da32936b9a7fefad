#include "gtest/gtest.h"

#include "../include/bit.hpp"

using namespace sds;


TEST(Bit, IntLog2) {
    ASSERT_EQ(intLog2(1u), 0);
    ASSERT_EQ(intLog2(std::uint64_t(2)), 1);
    ASSERT_EQ(intLog2(std::uint32_t(3)), 1);
    ASSERT_EQ(intLog2(std::uint8_t(4)), 2);
    ASSERT_EQ(intLog2(std::uint8_t(5)), 2);
    ASSERT_EQ(intLog2(std::uint16_t(123)), 6);
    ASSERT_EQ(intLog2(std::uint8_t(255)), 7);
    ASSERT_EQ(intLog2(0x19ull), 4);
    ASSERT_EQ(intLog2(~U64(0)), 63);
}

TEST(Bit, RoundUpLog2) {
    ASSERT_EQ(roundUpLog2(1ull), 0);
    ASSERT_EQ(roundUpLog2(2ul), 1);
    ASSERT_EQ(roundUpLog2(3u), 2);
    ASSERT_EQ(roundUpLog2(4u), 2);
    ASSERT_EQ(roundUpLog2(5u), 3);
    ASSERT_EQ(roundUpLog2(std::uint8_t(123)), 7);
    ASSERT_EQ(roundUpLog2(std::uint8_t(255)), 8);
}

TEST(Bit, LowMask) {
    ASSERT_EQ(lowMask(0), 0);
    ASSERT_EQ(lowMask(1), 1);
    ASSERT_EQ(lowMask(7), 127);
    ASSERT_EQ(lowMask(63), ~U64(0) >> 1);
    ASSERT_EQ(lowMask(64), ~U64(0));
}

TEST(Bit, Popcount) {
    ASSERT_EQ(popcount(0u), 0);
    ASSERT_EQ(popcount(std::uint16_t(1)), 1);
    ASSERT_EQ(popcount(std::uint8_t(2)), 1);
    ASSERT_EQ(popcount(3ul), 2);
    ASSERT_EQ(popcount(std::uint8_t(255)), 8);
    ASSERT_EQ(popcount(std::uint16_t(256)), 1);
    ASSERT_EQ(popcount((1ull << 16) - 12), 13);
    ASSERT_EQ(popcount(U64(-1)), 64);
    ASSERT_EQ(popcount(U64(-2)), 63);
}

TEST(Bit, PopcountFallback) {
    ASSERT_EQ(popcountFallback(0u), 0);
    ASSERT_EQ(popcountFallback(std::uint16_t(1)), 1);
    ASSERT_EQ(popcountFallback(std::uint8_t(2)), 1);
    ASSERT_EQ(popcountFallback(3ul), 2);
    ASSERT_EQ(popcountFallback(std::uint8_t(255)), 8);
    ASSERT_EQ(popcountFallback(std::uint16_t(256)), 1);
    ASSERT_EQ(popcountFallback((1ull << 16) - 12), 13);
    ASSERT_EQ(popcountFallback(U64(-1)), 64);
    ASSERT_EQ(popcountFallback(U64(-2)), 63);
}

TEST(Bit, PopcountBefore) {
    ASSERT_EQ(popcountBefore(U64(-1), 0), 0);
    ASSERT_EQ(popcountBefore(U64(-1), 1), 1);
    ASSERT_EQ(popcountBefore(U64(-1), 63), 63);
    ASSERT_EQ(popcountBefore(U64(0b1011), 3), 2);
    ASSERT_EQ(popcountBefore(U64(0b1011), 4), 3);
    ASSERT_EQ(popcountBefore(U64(1) << 63, 63), 0);
}

TEST(Bit, CountTrailingZeros) {
    ASSERT_EQ(countTrailingZeros(1), 0);
    ASSERT_EQ(countTrailingZeros(2), 1);
    ASSERT_EQ(countTrailingZeros(3), 0);
    ASSERT_EQ(countTrailingZeros(U64(1) << 32), 32);
    ASSERT_EQ(countTrailingZeros(U64(-2)), 1);
    ASSERT_EQ(countTrailingZeros(U64(-1)), 0);
    ASSERT_EQ(countTrailingZeros(U64(1) << 63), 63);
}

TEST(Bit, SelectNaive) {
    ASSERT_EQ(u64SelectNaive(1, 0), 0);
    ASSERT_EQ(u64SelectNaive(2, 0), 1);
    ASSERT_EQ(u64SelectNaive(3, 1), 1);
    ASSERT_EQ(u64SelectNaive(0b1010'0000, 1), 7);
    ASSERT_EQ(u64SelectNaive(0b1010'0000, 2), -1);
    ASSERT_EQ(u64SelectNaive(0, 0), -1);
    ASSERT_EQ(u64SelectNaive(U64(-1), 63), 63);
}

TEST(Bit, Select) {
    ASSERT_EQ(u64Select(1, 0), 0);
    ASSERT_EQ(u64Select(2, 0), 1);
    ASSERT_EQ(u64Select(3, 0), 0);
    ASSERT_EQ(u64Select(3, 1), 1);
    ASSERT_EQ(u64Select((U64(1) << 15) + 3, 2), 15);
    ASSERT_EQ(u64Select(U64(1) << 63, 0), 63);
    ASSERT_EQ(u64Select(U64(-1), 0), 0);
    ASSERT_EQ(u64Select(U64(-1), 40), 40);
    ASSERT_EQ(u64Select(U64(-1), 63), 63);
    ASSERT_EQ(u64Select(0x8000'0000'0000'0001ull, 1), 63);
    ASSERT_EQ(u64Select(0xff00'0000'0000'0000ull, 7), 63);
    ASSERT_EQ(u64SelectZero(U64(-2), 0), 0);
    ASSERT_EQ(u64SelectZero(0b1011, 0), 2);
    ASSERT_EQ(u64SelectZero(0b1011, 1), 4);
    ASSERT_EQ(u64SelectZero(0, 63), 63);
}

TEST(Bit, SelectVariantsAgree) {
    auto engine = createRandomEngine();
    std::uniform_int_distribution<U64> dist;
    for (int i = 0; i < 10'000; ++i) {
        U64 value = dist(engine);
        // also test sparse and dense words
        if (i % 3 == 1) {
            value &= dist(engine) & dist(engine);
        } else if (i % 3 == 2) {
            value |= dist(engine) | dist(engine);
        }
        const Index numOnes = popcount(value);
        for (Index rank = 0; rank < numOnes; ++rank) {
            const Index expected = u64SelectNaive(value, rank);
            ASSERT_EQ(u64SelectWithTable(value, rank), expected) << value << " " << rank;
            ASSERT_EQ(u64SelectBroadword(value, rank), expected) << value << " " << rank;
            ASSERT_EQ(popcountBefore(value, expected), rank);
        }
    }
}

TEST(Bit, ByteSelectTable) {
    for (Index byte = 0; byte < 256; ++byte) {
        for (Index rank = 0; rank < popcount(U64(byte)); ++rank) {
            ASSERT_EQ(byteSelectWithTable(Byte(byte), rank), u64SelectNaive(U64(byte), rank));
        }
    }
}

#ifdef SDS_HAS_CPP20

TEST(Bit, Constexpr) {
    static_assert(intLog2(1024u) == 10);
    static_assert(popcount(U64(0xff)) == 8);
    static_assert(u64Select(0b1001'0000, 1) == 7);
    static_assert(u64SelectBroadword(0b1001'0000, 0) == 4);
    static_assert(lowMask(3) == 7);
}

#endif
