#include "../include/mapped_file.hpp"
#include "../include/serialization.hpp"
#include "gtest/gtest.h"
#include <algorithm>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <random>
#include <sstream>
#include <system_error>

using namespace sds;

namespace {

template<typename EF>
std::string serializeToString(const EF& ef) {
    std::ostringstream os(std::ios::binary);
    serialize(ef, os);
    return os.str();
}

/// Serialized data has to be 8 byte aligned, which a std::string doesn't guarantee.
class AlignedBytes {
    OwnedArray<U64> words;
    Index offset;
    Index numBytes;

public:
    explicit AlignedBytes(const std::string& str, Index offset = 0)
        : words(roundUpDiv(Index(str.size()) + offset, 8) + 1), offset(offset), numBytes(Index(str.size())) {
        std::memcpy(reinterpret_cast<Byte*>(words.data()) + offset, str.data(), str.size());
    }

    [[nodiscard]] Span<const Byte> bytes() const noexcept {
        return {reinterpret_cast<const Byte*>(words.data()) + offset, numBytes};
    }

    [[nodiscard]] U64* wordData() noexcept { return words.data(); }
};

EliasFano<> randomSequence(Index size, U64 universe) {
    auto engine = createRandomEngine();
    std::uniform_int_distribution<U64> dist(0, universe - 1);
    std::vector<U64> values(size);
    for (auto& value : values) {
        value = dist(engine);
    }
    std::sort(values.begin(), values.end());
    return EliasFano<>(values, universe);
}

template<typename EF1, typename EF2>
void expectSameSequence(const EF1& expected, const EF2& actual) {
    ASSERT_EQ(expected.size(), actual.size());
    ASSERT_EQ(expected.universe(), actual.universe());
    ASSERT_EQ(expected.numLowBits(), actual.numLowBits());
    ASSERT_EQ(expected.decodeAll(), actual.decodeAll());
    auto engine = createRandomEngine();
    std::uniform_int_distribution<U64> dist(0, expected.universe());
    for (int i = 0; i < 1000; ++i) {
        const U64 x = dist(engine);
        ASSERT_EQ(expected.rank(x), actual.rank(x)) << x;
    }
}

CompactArray<> randomCompactArray(Index bitWidth, Index size) {
    auto engine = createRandomEngine();
    std::uniform_int_distribution<U64> dist(0, lowMask(bitWidth));
    CompactArray<> arr(bitWidth, size);
    for (Index i = 0; i < size; ++i) {
        arr.set(i, dist(engine));
    }
    return arr;
}

template<typename A1, typename A2>
void expectSameArray(const A1& expected, const A2& actual) {
    ASSERT_EQ(expected.size(), actual.size());
    ASSERT_EQ(expected.bitWidth(), actual.bitWidth());
    for (Index i = 0; i < expected.size(); ++i) {
        ASSERT_EQ(expected.get(i), actual.get(i)) << i;
    }
}

} // namespace

TEST(Serialization, StreamRoundTrip) {
    for (U64 universe : {U64(10), U64(1) << 20, U64(1) << 62}) {
        const auto ef = randomSequence(20'000, universe);
        const std::string str = serializeToString(ef);
        ASSERT_EQ(Index(str.size()), serializedSizeInBytes(ef));
        std::istringstream is(str, std::ios::binary);
        const auto copy = deserialize(is);
        expectSameSequence(ef, copy);
    }
}

TEST(Serialization, ExampleLayout) {
    EliasFano<> ef{0, 2, 5, 7, 10};
    const std::string str = serializeToString(ef);
    AlignedBytes data(str);
    const U64* words = data.wordData();
    ASSERT_EQ(std::memcmp(str.data(), "SDSEF\0\0\1", 8), 0);
    ASSERT_EQ(words[0], SERIALIZATION_MAGIC);
    ASSERT_EQ(words[1], RankSelectLayout<>::signature);
    ASSERT_EQ(words[2], 5);
    ASSERT_EQ(words[3], 11);
    ASSERT_EQ(words[4], 1);
    // low parts: one limb with the bits 0, 0, 1, 1, 0
    ASSERT_EQ(words[5], 1);
    ASSERT_EQ(words[6], 0b01100);
    // high parts: 11 bits in one limb
    ASSERT_EQ(words[7], 11);
    ASSERT_EQ(words[8], 1);
    ASSERT_EQ(words[9], 0b01001010101);
}

TEST(Serialization, EmptySequence) {
    EliasFano<> ef(std::vector<U64>{}, 100);
    const std::string str = serializeToString(ef);
    std::istringstream is(str, std::ios::binary);
    const auto copy = deserialize(is);
    ASSERT_EQ(copy.size(), 0);
    ASSERT_EQ(copy.universe(), 100);
    ASSERT_EQ(copy.rank(50), 0);
    AlignedBytes data(str);
    ASSERT_EQ(viewSerialized(data.bytes()).universe(), 100);
}

TEST(Serialization, DefaultConstructedRoundTrip) {
    const EliasFano<> ef;
    const std::string str = serializeToString(ef);
    ASSERT_EQ(Index(str.size()), serializedSizeInBytes(ef));
    ASSERT_EQ(str, serializeToString(EliasFano<>(std::vector<U64>{}, 0)));
    std::istringstream is(str, std::ios::binary);
    const auto copy = deserialize(is);
    ASSERT_EQ(copy.size(), 0);
    ASSERT_EQ(copy.universe(), 0);
    ASSERT_EQ(copy.numHighBits(), 1);
    AlignedBytes data(str);
    const auto view = viewSerialized(data.bytes());
    ASSERT_TRUE(view.empty());
    ASSERT_EQ(serializeToString(EliasFano<Borrowed>()), str);
}

TEST(Serialization, ViewInPlace) {
    const auto ef = randomSequence(10'000, U64(1) << 40);
    AlignedBytes data(serializeToString(ef));
    const auto view = viewSerialized(data.bytes());
    expectSameSequence(ef, view);
    // the low limbs start after the five header words and the limb count
    ASSERT_EQ(reinterpret_cast<const Byte*>(view.low().limbs().data()), data.bytes().data() + 6 * 8);
    const auto owned = view.toOwned();
    expectSameSequence(ef, owned);
}

TEST(Serialization, SeveralSequencesInOneStream) {
    const auto first = randomSequence(100, 1000);
    const auto second = randomSequence(5000, U64(1) << 33);
    std::stringstream stream(std::ios::in | std::ios::out | std::ios::binary);
    serialize(first, stream);
    serialize(second, stream);
    const auto firstCopy = deserialize(stream);
    const auto secondCopy = deserialize(stream);
    expectSameSequence(first, firstCopy);
    expectSameSequence(second, secondCopy);
}

TEST(Serialization, WrongMagicOrLayout) {
    EliasFano<> ef{1, 2, 3, 100};
    std::string str = serializeToString(ef);
    {
        using SmallBlocks = RankSelectLayout<1, 4, 8>;
        AlignedBytes data(str);
        ASSERT_THROW((void)viewSerialized<SmallBlocks>(data.bytes()), FormatError);
        std::istringstream is(str, std::ios::binary);
        ASSERT_THROW((void)deserialize<SmallBlocks>(is), FormatError);
    }
    str[0] = 'X';
    AlignedBytes data(str);
    ASSERT_THROW((void)viewSerialized(data.bytes()), FormatError);
    std::istringstream is(str, std::ios::binary);
    ASSERT_THROW((void)deserialize(is), FormatError);
}

TEST(Serialization, Truncated) {
    const auto ef = randomSequence(300, 5000);
    const std::string str = serializeToString(ef);
    for (Index len = 0; len < Index(str.size()); ++len) {
        const std::string prefix = str.substr(0, len);
        AlignedBytes data(prefix);
        ASSERT_THROW((void)viewSerialized(data.bytes()), FormatError) << len;
        std::istringstream is(prefix, std::ios::binary);
        ASSERT_THROW((void)deserialize(is), FormatError) << len;
    }
}

TEST(Serialization, TrailingBytes) {
    const auto ef = randomSequence(300, 5000);
    const std::string str = serializeToString(ef) + std::string(8, '\0');
    AlignedBytes data(str);
    ASSERT_THROW((void)viewSerialized(data.bytes()), FormatError);
    // a stream may contain more data after the sequence
    std::istringstream is(str, std::ios::binary);
    expectSameSequence(ef, deserialize(is));
    ASSERT_EQ(is.rdbuf()->in_avail(), 8);
}

TEST(Serialization, Misaligned) {
    EliasFano<> ef{1, 2, 3, 100};
    AlignedBytes data(serializeToString(ef), 4);
    ASSERT_THROW((void)viewSerialized(data.bytes()), FormatError);
}

TEST(Serialization, InconsistentHeader) {
    EliasFano<> ef{0, 2, 5, 7, 10};
    const std::string str = serializeToString(ef);
    auto expectFormatError = [&](Index wordIdx, U64 value) {
        AlignedBytes data(str);
        data.wordData()[wordIdx] = value;
        ASSERT_THROW((void)viewSerialized(data.bytes()), FormatError) << wordIdx;
        std::string corrupted = str;
        std::memcpy(corrupted.data() + wordIdx * 8, &value, 8);
        std::istringstream is(corrupted, std::ios::binary);
        ASSERT_THROW((void)deserialize(is), FormatError) << wordIdx;
    };
    expectFormatError(2, U64(1) << 60); // number of values
    expectFormatError(2, 6);
    expectFormatError(3, 1000); // universe, which changes the number of low bits
    expectFormatError(4, 2); // number of low bits
    expectFormatError(5, 2); // number of low limbs
    expectFormatError(7, 12); // number of high bits
}

TEST(Serialization, NonzeroPadding) {
    EliasFano<> ef{0, 2, 5, 7, 10};
    ASSERT_EQ(ef.high().blockRanks().size(), 1);
    const std::string str = serializeToString(ef);
    AlignedBytes data(str);
    // magic, signature, n, universe, low bits, low section, high bits, high section, superblock ranks
    const Index blockRanksIdx = 5 + 2 + 1 + 2 + 1 + ef.high().superblockRanks().size();
    ASSERT_EQ(data.wordData()[blockRanksIdx], 1);
    data.wordData()[blockRanksIdx + 1] |= U64(1) << 48;
    ASSERT_THROW((void)viewSerialized(data.bytes()), FormatError);
    std::string corrupted = str;
    corrupted[(blockRanksIdx + 1) * 8 + 6] = 1;
    std::istringstream is(corrupted, std::ios::binary);
    ASSERT_THROW((void)deserialize(is), FormatError);
    // the block counters of the stream path live in their own buffer
    std::istringstream valid(str, std::ios::binary);
    const auto copy = deserialize(valid);
    ASSERT_EQ(copy.high().blockRanks().size(), 1);
    ASSERT_EQ(copy.high().blockRanks()[0], 0);
    ASSERT_EQ(copy.decodeAll(), ef.decodeAll());
}

TEST(Serialization, SelectSampleOutOfRange) {
    EliasFano<> ef{0, 2, 5, 7, 10};
    ASSERT_EQ(ef.high().oneSamples().size(), 1);
    ASSERT_EQ(ef.high().zeroSamples().size(), 1);
    const std::string str = serializeToString(ef);
    // header, low section, high section, two superblock ranks and one word of block ranks come first
    const Index oneSampleIdx = 5 + 2 + 3 + 3 + 2 + 1;
    const Index zeroSampleIdx = oneSampleIdx + 2;
    {
        AlignedBytes data(str);
        ASSERT_EQ(data.wordData()[oneSampleIdx], 0);
        ASSERT_EQ(data.wordData()[zeroSampleIdx], 1);
    }
    for (auto [idx, value] : {std::pair{oneSampleIdx, U64(1) << 40}, std::pair{zeroSampleIdx, U64(11)}}) {
        AlignedBytes data(str);
        data.wordData()[idx] = value;
        ASSERT_THROW((void)viewSerialized(data.bytes()), FormatError) << idx;
        std::string corrupted = str;
        std::memcpy(corrupted.data() + idx * 8, &value, 8);
        std::istringstream is(corrupted, std::ios::binary);
        ASSERT_THROW((void)deserialize(is), FormatError) << idx;
    }
}

TEST(Serialization, WriteFailure) {
    EliasFano<> ef{1, 2, 3};
    std::ostringstream os;
    os.setstate(std::ios::badbit);
    ASSERT_THROW(serialize(ef, os), std::ios_base::failure);
}

TEST(CompactArraySerialization, RoundTrip) {
    for (Index width : {0, 1, 7, 33, 64}) {
        const auto arr = randomCompactArray(width, 1000);
        const std::string str = serializeToString(arr);
        ASSERT_EQ(Index(str.size()), serializedSizeInBytes(arr));
        std::istringstream is(str, std::ios::binary);
        expectSameArray(arr, deserializeCompactArray(is));
        AlignedBytes data(str);
        const auto view = viewSerializedCompactArray(data.bytes());
        expectSameArray(arr, view);
        ASSERT_EQ(reinterpret_cast<const Byte*>(view.limbs().data()), data.bytes().data() + 4 * 8) << width;
    }
}

TEST(CompactArraySerialization, Layout) {
    CompactArray<> arr(5, 3);
    arr.set(0, 1);
    arr.set(1, 2);
    arr.set(2, 31);
    AlignedBytes data(serializeToString(arr));
    ASSERT_EQ(data.bytes().size(), 5 * 8);
    const U64* words = data.wordData();
    ASSERT_EQ(words[0], COMPACT_ARRAY_MAGIC);
    ASSERT_EQ(words[1], 5);
    ASSERT_EQ(words[2], 3);
    ASSERT_EQ(words[3], 1);
    ASSERT_EQ(words[4], 1 | 2 << 5 | 31 << 10);
}

TEST(CompactArraySerialization, Errors) {
    const auto arr = randomCompactArray(11, 100);
    const std::string str = serializeToString(arr);
    // an Elias-Fano sequence is not a compact array and vice versa
    {
        AlignedBytes data(serializeToString(EliasFano<>{1, 2, 3}));
        ASSERT_THROW((void)viewSerializedCompactArray(data.bytes()), FormatError);
        AlignedBytes arrayData(str);
        ASSERT_THROW((void)viewSerialized(arrayData.bytes()), FormatError);
    }
    for (Index len = 0; len < Index(str.size()); len += 3) {
        const std::string prefix = str.substr(0, len);
        AlignedBytes data(prefix);
        ASSERT_THROW((void)viewSerializedCompactArray(data.bytes()), FormatError) << len;
        std::istringstream is(prefix, std::ios::binary);
        ASSERT_THROW((void)deserializeCompactArray(is), FormatError) << len;
    }
    auto expectFormatError = [&](Index wordIdx, U64 value) {
        AlignedBytes data(str);
        data.wordData()[wordIdx] = value;
        ASSERT_THROW((void)viewSerializedCompactArray(data.bytes()), FormatError) << wordIdx;
    };
    expectFormatError(1, 65); // bit width
    expectFormatError(1, 12);
    expectFormatError(2, U64(1) << 62); // number of entries
    expectFormatError(2, 200);
    expectFormatError(3, 17); // number of limbs
    AlignedBytes trailing(str + std::string(8, '\0'));
    ASSERT_THROW((void)viewSerializedCompactArray(trailing.bytes()), FormatError);
}

TEST(CompactArraySerialization, ViewMappedArray) {
    const auto arr = randomCompactArray(23, 100'000);
    const std::string path = testing::TempDir() + "sds_mapped_compact_array.bin";
    {
        std::ofstream os(path, std::ios::binary | std::ios::trunc);
        serialize(arr, os);
    }
    {
        MappedFile file(path);
        const auto view = viewSerializedCompactArray(file.bytes());
        expectSameArray(arr, view);
        expectSameArray(arr, view.toOwned());
    }
    std::remove(path.c_str());
}

TEST(MappedFile, ViewMappedSequence) {
    const auto ef = randomSequence(50'000, U64(1) << 45);
    const std::string path = testing::TempDir() + "sds_mapped_file_test.ef";
    {
        std::ofstream os(path, std::ios::binary | std::ios::trunc);
        serialize(ef, os);
    }
    {
        MappedFile file(path);
        ASSERT_EQ(file.size(), serializedSizeInBytes(ef));
        const auto view = viewSerialized(file.bytes());
        expectSameSequence(ef, view);
        MappedFile moved(std::move(file));
        ASSERT_EQ(file.size(), 0);
        ASSERT_EQ(view.get(100), ef.get(100));
    }
    std::remove(path.c_str());
}

TEST(MappedFile, EmptyFile) {
    const std::string path = testing::TempDir() + "sds_mapped_file_empty";
    std::ofstream(path, std::ios::binary | std::ios::trunc).close();
    MappedFile file(path);
    ASSERT_EQ(file.size(), 0);
    ASSERT_TRUE(file.bytes().empty());
    ASSERT_THROW((void)viewSerialized(file.bytes()), FormatError);
    std::remove(path.c_str());
}

TEST(MappedFile, MissingFile) {
    ASSERT_THROW(MappedFile("/nonexistent/sds/missing.ef"), std::system_error);
}
