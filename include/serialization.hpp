#ifndef SDS_SERIALIZATION_HPP
#define SDS_SERIALIZATION_HPP

#include "elias_fano.hpp"
#include <istream>
#include <ostream>
#include <vector>

#if defined(__BYTE_ORDER__) && __BYTE_ORDER__ != __ORDER_LITTLE_ENDIAN__
#error "The serialization format stores little-endian words and can only be read in place on little-endian hosts"
#endif

namespace sds {

/// The serialized form of an EliasFano sequence is a sequence of little-endian 64 bit words:
///   magic, layout signature, n, universe, number of low bits,
///   low: number of limbs, limbs,
///   high: number of bits, number of limbs, limbs,
///   superblock ranks: count, ranks,
///   block ranks: count, ceil(count / 4) words holding the 16 bit ranks (zero padded),
///   one samples: count, samples,
///   zero samples: count, samples.
/// Because every section is word aligned, viewSerialized() can answer queries directly on a memory mapped file.
constexpr static U64 SERIALIZATION_MAGIC = U64('S') | U64('D') << 8 | U64('S') << 16 | U64('E') << 24
                                           | U64('F') << 32 | U64(1) << 56;

/// A standalone CompactArray is serialized as magic, bit width, number of entries, number of limbs, limbs.
constexpr static U64 COMPACT_ARRAY_MAGIC = U64('S') | U64('D') << 8 | U64('S') << 16 | U64('C') << 24
                                           | U64('A') << 32 | U64(1) << 56;

namespace detail {

inline void writeWords(std::ostream& os, Span<const U64> words) {
    os.write(reinterpret_cast<const char*>(words.data()), std::streamsize(words.size() * 8));
}

inline void writeWord(std::ostream& os, U64 word) { writeWords(os, Span<const U64>(&word, 1)); }

inline void writeSection(std::ostream& os, Span<const U64> words) {
    writeWord(os, U64(words.size()));
    writeWords(os, words);
}

inline void writeSection(std::ostream& os, Span<const U16> halfWords) {
    writeWord(os, U64(halfWords.size()));
    os.write(reinterpret_cast<const char*>(halfWords.data()), std::streamsize(halfWords.size() * 2));
    const Index padding = roundUpTo(halfWords.size(), 4) - halfWords.size();
    const U64 zero = 0;
    os.write(reinterpret_cast<const char*>(&zero), std::streamsize(padding * 2));
}

/// \brief Reads words from memory that stays valid, without copying.
class SpanReader {
    Span<const U64> words;
    Index pos = 0;

public:
    explicit SpanReader(Span<const Byte> bytes) {
        if (reinterpret_cast<std::uintptr_t>(bytes.data()) % alignof(U64) != 0) [[unlikely]] {
            throw FormatError("serialized data must be aligned to 8 bytes");
        }
        if (bytes.size() % 8 != 0) [[unlikely]] {
            throw FormatError("the size of serialized data must be a multiple of 8 bytes, not "
                              + std::to_string(bytes.size()));
        }
        words = Span<const U64>(reinterpret_cast<const U64*>(bytes.data()), bytes.size() / 8);
    }

    [[nodiscard]] Index remainingWords() const noexcept { return words.size() - pos; }

    [[nodiscard]] Span<const U64> read(U64 count, const char* what) {
        if (count > U64(remainingWords())) [[unlikely]] {
            throw FormatError(std::string("truncated data while reading ") + what);
        }
        Span<const U64> res = words.subspan(pos, Index(count));
        pos += Index(count);
        return res;
    }

    /// \brief The 16 bit values stored in the next `numWords` words, including padding.
    [[nodiscard]] Span<const U16> readHalfWords(U64 numWords, const char* what) {
        const Span<const U64> res = read(numWords, what);
        return {reinterpret_cast<const U16*>(res.data()), res.size() * 4};
    }
};

/// \brief Reads words from a stream into buffers that live as long as the reader.
class StreamReader {
    std::istream& is;
    std::vector<OwnedArray<U64>> words;
    std::vector<OwnedArray<U16>> halfWords;

    // guards against allocating huge buffers for corrupted counts before noticing that the stream is too short
    constexpr static Index chunkSizeInBytes = Index(1) << 19;

    template<typename T>
    [[nodiscard]] Span<const T> readInto(std::vector<OwnedArray<T>>& buffers, U64 count, const char* what) {
        constexpr Index chunkSize = chunkSizeInBytes / Index(sizeof(T));
        OwnedArray<T> buffer;
        for (U64 done = 0; done < count;) {
            const Index toRead = Index(std::min(U64(chunkSize), count - done));
            buffer.resize(Index(done) + toRead);
            const auto numBytes = std::streamsize(toRead * Index(sizeof(T)));
            is.read(reinterpret_cast<char*>(buffer.data() + done), numBytes);
            if (is.gcount() != numBytes) [[unlikely]] {
                throw FormatError(std::string("truncated stream while reading ") + what);
            }
            done += U64(toRead);
        }
        buffers.push_back(std::move(buffer));
        return buffers.back().span();
    }

public:
    explicit StreamReader(std::istream& is) : is(is) {}

    [[nodiscard]] Span<const U64> read(U64 count, const char* what) { return readInto(words, count, what); }

    /// \brief Reads the next `numWords` words as 16 bit values into a U16 buffer, including padding.
    [[nodiscard]] Span<const U16> readHalfWords(U64 numWords, const char* what) {
        return readInto(halfWords, numWords * 4, what);
    }
};

template<typename Reader>
[[nodiscard]] U64 readWord(Reader& reader, const char* what) {
    return reader.read(1, what)[0];
}

template<typename Reader>
[[nodiscard]] Span<const U64> readSection(Reader& reader, const char* what) {
    return reader.read(readWord(reader, what), what);
}

template<typename Reader>
[[nodiscard]] Span<const U16> readHalfWordSection(Reader& reader, const char* what) {
    const U64 count = readWord(reader, what);
    if (count > (U64(1) << 60)) [[unlikely]] {
        throw FormatError(std::string("invalid size of ") + what);
    }
    const Span<const U16> padded = reader.readHalfWords(U64(roundUpDiv(Index(count), 4)), what);
    for (Index i = Index(count); i < padded.size(); ++i) {
        if (padded[i] != 0) [[unlikely]] {
            throw FormatError(std::string("nonzero padding in ") + what);
        }
    }
    return padded.subspan(0, Index(count));
}

/// \brief Parses all sections and checks that they fit together. Counter and sample values are trusted.
template<typename Ownership, typename Layout, typename Reader>
[[nodiscard]] EliasFano<Ownership, Layout> readEliasFano(Reader& reader) {
    if (readWord(reader, "magic number") != SERIALIZATION_MAGIC) [[unlikely]] {
        throw FormatError("not a serialized Elias-Fano sequence (wrong magic number)");
    }
    const U64 signature = readWord(reader, "layout signature");
    if (signature != Layout::signature) [[unlikely]] {
        throw FormatError("serialized with a different layout: signature " + std::to_string(signature)
                          + " instead of " + std::to_string(Layout::signature));
    }
    const U64 numValues = readWord(reader, "number of values");
    const U64 universe = readWord(reader, "universe");
    const U64 lowBits = readWord(reader, "number of low bits");
    // every value needs at least one high bit, this also keeps the size computations below from overflowing
    if (numValues > (U64(1) << 56)) [[unlikely]] {
        throw FormatError("invalid number of values: " + std::to_string(numValues));
    }
    if (lowBits != U64(eliasFanoLowBits(Index(numValues), universe))) [[unlikely]] {
        throw FormatError("inconsistent number of low bits: " + std::to_string(lowBits));
    }
    const Span<const U64> lowLimbs = readSection(reader, "low parts");
    auto low = CompactArray<Ownership>::fromRawParts(lowLimbs, Index(lowBits), Index(numValues));

    const U64 numHighBits = readWord(reader, "number of high bits");
    if (numHighBits != U64(eliasFanoHighBits(Index(numValues), universe, Index(lowBits)))) [[unlikely]] {
        throw FormatError("inconsistent number of high bits: " + std::to_string(numHighBits));
    }
    const Span<const U64> highLimbs = readSection(reader, "high parts");
    auto highBits = BitStorage<Ownership>::fromRawParts(highLimbs, Index(numHighBits));

    const Span<const U64> superblockRanks = readSection(reader, "superblock ranks");
    const Span<const U16> blockRanks = readHalfWordSection(reader, "block ranks");
    const Span<const U64> oneSamples = readSection(reader, "one samples");
    const Span<const U64> zeroSamples = readSection(reader, "zero samples");
    auto high = RankSelectBitvec<Ownership, Layout>::fromRawParts(
            std::move(highBits), superblockRanks, blockRanks, oneSamples, zeroSamples);
    return EliasFano<Ownership, Layout>::fromRawParts(Index(numValues), universe, std::move(low), std::move(high));
}

template<typename Ownership, typename Reader>
[[nodiscard]] CompactArray<Ownership> readCompactArray(Reader& reader) {
    if (readWord(reader, "magic number") != COMPACT_ARRAY_MAGIC) [[unlikely]] {
        throw FormatError("not a serialized compact array (wrong magic number)");
    }
    const U64 bitWidth = readWord(reader, "bit width");
    const U64 size = readWord(reader, "number of entries");
    // the limit keeps bitWidth * size from overflowing
    if (bitWidth > 64 || size > (U64(1) << 56)) [[unlikely]] {
        throw FormatError("invalid compact array of " + std::to_string(size) + " entries with " + std::to_string(bitWidth)
                          + " bits each");
    }
    const Span<const U64> limbs = readSection(reader, "compact array entries");
    return CompactArray<Ownership>::fromRawParts(limbs, Index(bitWidth), Index(size));
}

inline void checkNoTrailingData(const SpanReader& reader) {
    if (reader.remainingWords() != 0) [[unlikely]] {
        throw FormatError(std::to_string(reader.remainingWords() * 8) + " trailing bytes after serialized data");
    }
}

} // namespace detail


/// \brief The exact number of bytes serialize() writes.
template<typename Ownership, typename Layout>
[[nodiscard]] Index serializedSizeInBytes(const EliasFano<Ownership, Layout>& ef) noexcept {
    const auto& high = ef.high();
    const Index numWords = 5 + (1 + ef.low().limbs().size()) + (2 + high.bits().numLimbs())
                           + (1 + high.superblockRanks().size()) + (1 + roundUpDiv(high.blockRanks().size(), 4))
                           + (1 + high.oneSamples().size()) + (1 + high.zeroSamples().size());
    return numWords * 8;
}

/// \throw std::ios_base::failure if writing fails
template<typename Ownership, typename Layout>
void serialize(const EliasFano<Ownership, Layout>& ef, std::ostream& os) {
    const auto& high = ef.high();
    detail::writeWord(os, SERIALIZATION_MAGIC);
    detail::writeWord(os, Layout::signature);
    detail::writeWord(os, U64(ef.size()));
    detail::writeWord(os, ef.universe());
    detail::writeWord(os, U64(ef.numLowBits()));
    detail::writeSection(os, ef.low().limbs());
    detail::writeWord(os, U64(high.size()));
    detail::writeSection(os, high.bits().limbs());
    detail::writeSection(os, high.superblockRanks());
    detail::writeSection(os, high.blockRanks());
    detail::writeSection(os, high.oneSamples());
    detail::writeSection(os, high.zeroSamples());
    if (!os) [[unlikely]] {
        throw std::ios_base::failure("failed to write a serialized Elias-Fano sequence");
    }
}

/// \brief Interprets serialized bytes in place, in constant time. The bytes must be 8 byte aligned (memory returned by
/// MappedFile is) and must outlive the returned sequence.
/// All section sizes, the header, the total number of ones and the range of the select samples are validated. The
/// individual rank counters and select samples are not, since that would take time linear in their number: the
/// caller must only pass data written by serialize(), or queries may have undefined behavior.
/// \throw FormatError if the data is truncated, misaligned, or inconsistent
template<typename Layout = RankSelectLayout<>>
[[nodiscard]] EliasFano<Borrowed, Layout> viewSerialized(Span<const Byte> bytes) {
    detail::SpanReader reader(bytes);
    auto res = detail::readEliasFano<Borrowed, Layout>(reader);
    detail::checkNoTrailingData(reader);
    return res;
}

/// \brief Reads one serialized sequence from the stream into heap memory.
/// \throw FormatError if the data is truncated or inconsistent
template<typename Layout = RankSelectLayout<>>
[[nodiscard]] EliasFano<Owned, Layout> deserialize(std::istream& is) {
    detail::StreamReader reader(is);
    return detail::readEliasFano<Owned, Layout>(reader);
}


template<typename Ownership>
[[nodiscard]] Index serializedSizeInBytes(const CompactArray<Ownership>& arr) noexcept {
    return (4 + arr.limbs().size()) * 8;
}

/// \throw std::ios_base::failure if writing fails
template<typename Ownership>
void serialize(const CompactArray<Ownership>& arr, std::ostream& os) {
    detail::writeWord(os, COMPACT_ARRAY_MAGIC);
    detail::writeWord(os, U64(arr.bitWidth()));
    detail::writeWord(os, U64(arr.size()));
    detail::writeSection(os, arr.limbs());
    if (!os) [[unlikely]] {
        throw std::ios_base::failure("failed to write a serialized compact array");
    }
}

/// \brief Like viewSerialized(), for data written by serialize(const CompactArray&). Every field is validated.
/// \throw FormatError if the data is truncated, misaligned, or inconsistent
[[nodiscard]] inline CompactArray<Borrowed> viewSerializedCompactArray(Span<const Byte> bytes) {
    detail::SpanReader reader(bytes);
    auto res = detail::readCompactArray<Borrowed>(reader);
    detail::checkNoTrailingData(reader);
    return res;
}

/// \throw FormatError if the data is truncated or inconsistent
[[nodiscard]] inline CompactArray<Owned> deserializeCompactArray(std::istream& is) {
    detail::StreamReader reader(is);
    return detail::readCompactArray<Owned>(reader);
}

} // namespace sds

#endif // SDS_SERIALIZATION_HPP
