#ifndef SDS_ELIAS_FANO_HPP
#define SDS_ELIAS_FANO_HPP

#include "compact_array.hpp"
#include "rank_select.hpp"
#include <exception>
#include <initializer_list>
#include <optional>
#include <utility>
#include <vector>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace sds {

/// \brief The number of low bits per value, `floor(log2(u / n))` or 0 if `u < n`. An empty sequence is treated like
/// a sequence of one value, which keeps the high bits short.
[[nodiscard]] SDS_CPP20_CONSTEXPR Index eliasFanoLowBits(Index numValues, U64 universe) noexcept {
    const U64 ratio = universe / U64(std::max(numValues, Index(1)));
    return ratio == 0 ? 0 : intLog2(ratio);
}

/// \brief The length of the high bit vector: one bit per value plus one bit per possible high part, plus one.
[[nodiscard]] constexpr Index eliasFanoHighBits(Index numValues, U64 universe, Index lowBits) noexcept {
    return numValues + Index(universe >> lowBits) + 1;
}

enum class BuildStrategy {
    Sequential,
    Parallel,
};

/// \brief Runtime options for EliasFano::build().
struct BuildOptions {
    BuildStrategy strategy = BuildStrategy::Sequential;
    /// Number of OpenMP threads for BuildStrategy::Parallel, 0 means the OpenMP default.
    int numThreads = 0;
    /// Lower bound on the number of values handled by a single task. Rounded up to a multiple of 64.
    Index minValuesPerTask = Index(1) << 16;
};

template<typename Layout>
class EliasFanoBuilder;

template<typename Ownership, typename Layout>
class EliasFano;

namespace detail {

template<typename Layout>
EliasFano<Owned, Layout> buildEliasFanoParallel(Span<const U64> values, U64 universe, const BuildOptions& options);

} // namespace detail


/// \brief Elias-Fano representation of a non-decreasing sequence of `size()` integers in [0, universe()).
/// The lowest numLowBits() bits of each value are stored in a CompactArray, the remaining high part `h` of the i-th
/// value is stored by setting bit `h + i` of a bitvector. The high part of the i-th value can then be recovered as
/// `selectOne(i) - i`, and the values with high part `h` are exactly those between the h-1-th and the h-th zero.
/// Instances are immutable, so any number of threads can query them concurrently.
/// \tparam Ownership Owned if built in memory, Borrowed if viewing serialized data (see serialization.hpp).
/// \tparam Layout Tuning of the high bitvector, see RankSelectLayout.
template<typename Ownership = Owned, typename Layout = RankSelectLayout<>>
class [[nodiscard]] EliasFano {
    static_assert(Layout::Selects == SupportedSelects::BOTH, "rank queries need selectZero on the high bits");

    template<typename, typename>
    friend class EliasFano;

    constexpr static bool IsOwned = isOwned<Ownership>;
    constexpr static Index linearFallbackSize = 8;

    Index numValues = 0;
    U64 universe_ = 0;
    CompactArray<Ownership> low_;
    RankSelectBitvec<Ownership, Layout> high_;

    EliasFano(Index numValues, U64 universe, CompactArray<Ownership> low, RankSelectBitvec<Ownership, Layout> high) noexcept
        : numValues(numValues), universe_(universe), low_(std::move(low)), high_(std::move(high)) {}

    /// \brief The first index in [first, last) whose low part is at least `lowPart`, or `last`.
    [[nodiscard]] Index lowerBoundInBucket(Index first, Index last, U64 lowPart) const noexcept {
        if (numLowBits() == 0) {
            return first;
        }
        while (last - first > linearFallbackSize) {
            const Index mid = first + (last - first) / 2;
            if (low_.getUnchecked(mid) < lowPart) {
                first = mid + 1;
            } else {
                last = mid;
            }
        }
        for (; first < last && low_.getUnchecked(first) < lowPart; ++first) {
        }
        return first;
    }

    template<typename Range>
    [[nodiscard]] static U64 universeOf(const Range& values) {
        U64 res = 0;
        for (const auto& value : values) {
            if constexpr (std::is_signed_v<std::decay_t<decltype(value)>>) {
                if (value < 0) [[unlikely]] {
                    throw RangeError("negative value " + std::to_string(value) + " in an Elias-Fano sequence");
                }
            }
            if (U64(value) == ~U64(0)) [[unlikely]] {
                throw RangeError("the value 2^64-1 can't be stored because the universe is exclusive");
            }
            res = std::max(res, U64(value) + 1);
        }
        return res;
    }

    template<typename Range>
    [[nodiscard]] static EliasFano buildFromRange(const Range& values, U64 universe) {
        static_assert(IsOwned, "a borrowed Elias-Fano sequence can't be built");
        EliasFanoBuilder<Layout> builder(Index(std::distance(std::begin(values), std::end(values))), universe);
        builder.extend(values);
        return std::move(builder).build();
    }

public:
    using value_type = U64;
    using Iter = ValueIter<EliasFano>;
    using HighBits = RankSelectBitvec<Ownership, Layout>;

private:
    /// \brief A single zero bit. Borrowed sequences refer to one shared instance.
    [[nodiscard]] static HighBits emptyHighBits() {
        if constexpr (IsOwned) {
            return HighBits(BitStorage<Owned>(1));
        } else {
            static const RankSelectBitvec<Owned, Layout> singleZero{BitStorage<Owned>(1)};
            return HighBits::fromRawParts(BitStorage<Borrowed>::fromRawParts(singleZero.bits().limbs(), 1),
                    singleZero.superblockRanks(), singleZero.blockRanks(), singleZero.oneSamples(),
                    singleZero.zeroSamples());
        }
    }

public:

    /// \brief An empty sequence with universe 0. Like every built sequence it has `size() + (universe() >> l) + 1`
    /// high bits, so it can be serialized and read back.
    EliasFano() : high_(emptyHighBits()) {}

    /// \brief Builds the sequence from a sorted range, the universe is the largest value plus one.
    template<typename Range, typename = std::void_t<decltype(std::begin(std::declval<const Range&>()))>>
    explicit EliasFano(const Range& values) : EliasFano(buildFromRange(values, universeOf(values))) {}

    template<typename Range, typename = std::void_t<decltype(std::begin(std::declval<const Range&>()))>>
    EliasFano(const Range& values, U64 universe) : EliasFano(buildFromRange(values, universe)) {}

    EliasFano(std::initializer_list<U64> list) : EliasFano(buildFromRange(list, universeOf(list))) {}

    /// \brief Builds the sequence from sorted values in [0, universe) with the chosen strategy. Both strategies
    /// produce bit-identical structures and report the same error for invalid input.
    [[nodiscard]] static EliasFano build(Span<const U64> values, U64 universe, const BuildOptions& options = {}) {
        static_assert(IsOwned, "a borrowed Elias-Fano sequence can't be built");
        if (options.strategy == BuildStrategy::Parallel) {
            return detail::buildEliasFanoParallel<Layout>(values, universe, options);
        }
        return buildFromRange(values, universe);
    }

    /// \brief Assembles a sequence from its parts, for example the parts of a deserialized sequence. An owning high
    /// bitvector can be created from plain bits, which recomputes its rank and select metadata.
    /// \throw FormatError if the parts don't fit together
    [[nodiscard]] static EliasFano fromRawParts(
            Index numValues, U64 universe, CompactArray<Ownership> low, RankSelectBitvec<Ownership, Layout> high) {
        if (numValues < 0 || low.size() != numValues) [[unlikely]] {
            throw FormatError("expected " + std::to_string(numValues) + " low parts, got " + std::to_string(low.size()));
        }
        const Index lowBits = eliasFanoLowBits(numValues, universe);
        if (low.bitWidth() != lowBits) [[unlikely]] {
            throw FormatError("expected " + std::to_string(lowBits) + " low bits for " + std::to_string(numValues)
                              + " values in a universe of " + std::to_string(universe) + ", got "
                              + std::to_string(low.bitWidth()));
        }
        if (high.size() != eliasFanoHighBits(numValues, universe, lowBits) || high.numOnes() != numValues) [[unlikely]] {
            throw FormatError("the high bits don't match " + std::to_string(numValues) + " values in a universe of "
                              + std::to_string(universe));
        }
        return EliasFano(numValues, universe, std::move(low), std::move(high));
    }

    /// \brief Deep copy into heap memory, which can outlive the memory a borrowed sequence refers to.
    [[nodiscard]] EliasFano<Owned, Layout> toOwned() const {
        return EliasFano<Owned, Layout>(numValues, universe_, low_.toOwned(), high_.toOwned());
    }

    /// \brief The number of stored values.
    [[nodiscard]] constexpr Index size() const noexcept { return numValues; }
    [[nodiscard]] constexpr bool empty() const noexcept { return numValues == 0; }

    /// \brief The exclusive upper bound of the stored values.
    [[nodiscard]] constexpr U64 universe() const noexcept { return universe_; }

    [[nodiscard]] constexpr Index numLowBits() const noexcept { return low_.bitWidth(); }
    [[nodiscard]] constexpr Index numHighBits() const noexcept { return high_.size(); }

    [[nodiscard]] constexpr const CompactArray<Ownership>& low() const noexcept { return low_; }
    [[nodiscard]] constexpr const HighBits& high() const noexcept { return high_; }

    /// \brief The total amount of bits allocated by this class for the low parts, the high parts and the rank and
    /// select metadata. Data members within this class itself don't count.
    [[nodiscard]] constexpr Index numAllocatedBits() const noexcept {
        return low_.numAllocatedBits() + high_.numAllocatedBits();
    }

    [[nodiscard]] U64 getUnchecked(Index i) const noexcept {
        SDS_ASSUME(i >= 0 && i < size());
        const U64 highPart = U64(high_.selectOneUnchecked(i) - i);
        return (highPart << numLowBits()) | low_.getUnchecked(i);
    }

    [[nodiscard]] U64 get(Index i) const {
        if (i < 0 || i >= size()) [[unlikely]] {
            detail::throwIndexError("EliasFano::get", i, size());
        }
        return getUnchecked(i);
    }

    [[nodiscard]] U64 operator[](Index i) const { return get(i); }

    /// \brief The number of stored values less than `x`.
    [[nodiscard]] Index rank(U64 x) const noexcept {
        if (x >= universe_) {
            return numValues;
        }
        const Index highPart = Index(x >> numLowBits());
        // the bucket starts after the highPart-th zero, which has highPart zeros before it
        const Index bucketStart = highPart == 0 ? 0 : high_.selectZeroUnchecked(highPart - 1) + 1;
        const Index bucketEnd = high_.selectZeroHintedUnchecked(highPart, bucketStart, highPart);
        return lowerBoundInBucket(bucketStart - highPart, bucketEnd - highPart, x & low_.mask());
    }

    /// \brief The first value greater than or equal to `x`, and its index.
    /// \throw NotFoundError if all values are smaller than `x`
    [[nodiscard]] std::pair<Index, U64> successor(U64 x) const {
        const Index i = rank(x);
        if (i == numValues) [[unlikely]] {
            throw NotFoundError("no successor found for " + std::to_string(x));
        }
        return {i, getUnchecked(i)};
    }

    /// \brief The first value greater than `x`, and its index.
    [[nodiscard]] std::pair<Index, U64> successorStrict(U64 x) const {
        const Index i = x == ~U64(0) ? numValues : rank(x + 1);
        if (i == numValues) [[unlikely]] {
            throw NotFoundError("no strict successor found for " + std::to_string(x));
        }
        return {i, getUnchecked(i)};
    }

    /// \brief The last value less than or equal to `x`, and its index.
    /// \throw NotFoundError if all values are greater than `x`
    [[nodiscard]] std::pair<Index, U64> predecessor(U64 x) const {
        const Index i = x == ~U64(0) ? numValues : rank(x + 1);
        if (i == 0) [[unlikely]] {
            throw NotFoundError("no predecessor found for " + std::to_string(x));
        }
        return {i - 1, getUnchecked(i - 1)};
    }

    /// \brief The last value less than `x`, and its index.
    [[nodiscard]] std::pair<Index, U64> predecessorStrict(U64 x) const {
        const Index i = rank(x);
        if (i == 0) [[unlikely]] {
            throw NotFoundError("no strict predecessor found for " + std::to_string(x));
        }
        return {i - 1, getUnchecked(i - 1)};
    }

    /// \brief The index of the first occurrence of `value`, if it is stored.
    [[nodiscard]] std::optional<Index> indexOf(U64 value) const noexcept {
        const Index i = rank(value);
        if (i < numValues && getUnchecked(i) == value) {
            return i;
        }
        return std::nullopt;
    }

    [[nodiscard]] bool contains(U64 value) const noexcept { return indexOf(value).has_value(); }

    /// \brief Decodes all values with a single scan over the high bits, which is faster than calling get() n times.
    [[nodiscard]] std::vector<U64> decodeAll() const {
        std::vector<U64> res;
        res.reserve(numValues);
        const BitStorage<Ownership>& bits = high_.bits();
        for (Index limbIdx = 0; limbIdx < bits.numLimbs(); ++limbIdx) {
            for (Limb limb = bits.getLimb(limbIdx); limb != 0; limb &= limb - 1) {
                const Index i = Index(res.size());
                const Index pos = limbIdx * 64 + countTrailingZeros(limb);
                res.push_back((U64(pos - i) << numLowBits()) | low_.getUnchecked(i));
            }
        }
        return res;
    }

    [[nodiscard]] Iter begin() const noexcept { return Iter(*this, 0); }
    [[nodiscard]] Iter end() const noexcept { return Iter(*this, size()); }
    [[nodiscard]] Subrange<Iter> values() const noexcept { return {begin(), end()}; }
};


/// \brief Builds an EliasFano sequence from values that arrive one at a time in non-decreasing order. The number of
/// values and the universe have to be known in advance. Once an append has failed, the builder can't be used anymore,
/// so a partially built sequence is never returned.
template<typename Layout = RankSelectLayout<>>
class EliasFanoBuilder {
    Index numValues;
    U64 universe_;
    Index lowBits;
    Index count = 0;
    U64 last = 0;
    bool unusable = false;
    CompactArray<Owned> low_;
    BitStorage<Owned> high_;

    [[nodiscard]] static Index checkedNumValues(Index numValues) {
        if (numValues < 0) [[unlikely]] {
            throw RangeError("negative number of values: " + std::to_string(numValues));
        }
        return numValues;
    }

    void checkUsable() const {
        if (unusable) [[unlikely]] {
            throw std::logic_error("an Elias-Fano builder can't be used after an error or after build()");
        }
    }

    template<typename Err>
    [[noreturn]] void fail(const std::string& message) {
        unusable = true;
        throw Err(message);
    }

public:
    EliasFanoBuilder(Index numValues, U64 universe)
        : numValues(checkedNumValues(numValues)),
          universe_(universe),
          lowBits(eliasFanoLowBits(numValues, universe)),
          low_(lowBits, numValues),
          high_(eliasFanoHighBits(numValues, universe, lowBits)) {}

    [[nodiscard]] constexpr Index size() const noexcept { return count; }
    [[nodiscard]] constexpr Index expectedSize() const noexcept { return numValues; }
    [[nodiscard]] constexpr U64 universe() const noexcept { return universe_; }
    [[nodiscard]] constexpr Index numLowBits() const noexcept { return lowBits; }

    /// \throw RangeError if the value isn't less than the universe or if there already are expectedSize() values
    /// \throw MonotonicityError if the value is less than the previous value
    void push(U64 value) {
        checkUsable();
        if (count >= numValues) [[unlikely]] {
            fail<RangeError>("can't append more than the declared " + std::to_string(numValues) + " values");
        }
        if (value >= universe_) [[unlikely]] {
            fail<RangeError>("value " + std::to_string(value) + " at index " + std::to_string(count)
                             + " isn't less than the universe " + std::to_string(universe_));
        }
        if (value < last) [[unlikely]] {
            fail<MonotonicityError>("value " + std::to_string(value) + " at index " + std::to_string(count)
                                    + " is less than the previous value " + std::to_string(last));
        }
        low_.setUnchecked(count, value & low_.mask());
        high_.setBitUnchecked(Index(value >> lowBits) + count);
        last = value;
        ++count;
    }

    /// \brief Appends all values of a range. Negative values of signed element types are rejected with a RangeError.
    template<typename Range>
    void extend(const Range& values) {
        for (const auto& value : values) {
            if constexpr (std::is_signed_v<std::decay_t<decltype(value)>>) {
                if (value < 0) [[unlikely]] {
                    checkUsable();
                    fail<RangeError>("negative value " + std::to_string(value) + " at index " + std::to_string(count));
                }
            }
            push(U64(value));
        }
    }

    /// \brief Computes the rank and select metadata in one pass over the high bits.
    /// \throw RangeError if fewer values than declared have been appended
    [[nodiscard]] EliasFano<Owned, Layout> build() && {
        checkUsable();
        if (count != numValues) [[unlikely]] {
            fail<RangeError>("expected " + std::to_string(numValues) + " values, got " + std::to_string(count));
        }
        unusable = true;
        return EliasFano<Owned, Layout>::fromRawParts(
                numValues, universe_, std::move(low_), RankSelectBitvec<Owned, Layout>(std::move(high_)));
    }
};


namespace detail {

/// \brief Every task validates and encodes a contiguous chunk of the input into its own low array and its own
/// segment of the high bits; the segments are then merged in chunk order. Chunks contain a multiple of 64 values,
/// so the low parts of every chunk start at a limb boundary.
template<typename Layout>
EliasFano<Owned, Layout> buildEliasFanoParallel(Span<const U64> values, U64 universe, const BuildOptions& options) {
    struct Chunk {
        CompactArray<Owned> low;
        BitStorage<Owned> high;
        Index firstHighBit = 0;
        std::exception_ptr error;
    };

    const Index numValues = values.size();
    const Index lowBits = eliasFanoLowBits(numValues, universe);
    const U64 lowMaskValue = lowMask(lowBits);
#ifdef _OPENMP
    const int numThreads = options.numThreads > 0 ? options.numThreads : omp_get_max_threads();
#else
    const int numThreads = 1;
#endif
    const Index chunkSize
            = roundUpTo(std::max({Index(1), options.minValuesPerTask, roundUpDiv(numValues, numThreads)}), 64);
    const Index numChunks = roundUpDiv(numValues, chunkSize);
    std::vector<Chunk> chunks(numChunks);

#pragma omp parallel for schedule(static) num_threads(numThreads)
    for (Index c = 0; c < numChunks; ++c) {
        Chunk& chunk = chunks[c];
        const Index first = c * chunkSize;
        const Index last = std::min(numValues, first + chunkSize);
        // exceptions must not leave the parallel region, they are rethrown in chunk order below
        try {
            for (Index i = first; i < last; ++i) {
                if (values[i] >= universe) [[unlikely]] {
                    throw RangeError("value " + std::to_string(values[i]) + " at index " + std::to_string(i)
                                     + " isn't less than the universe " + std::to_string(universe));
                }
                if (i > 0 && values[i] < values[i - 1]) [[unlikely]] {
                    throw MonotonicityError("value " + std::to_string(values[i]) + " at index " + std::to_string(i)
                                            + " is less than the previous value " + std::to_string(values[i - 1]));
                }
            }
            chunk.firstHighBit = Index(values[first] >> lowBits) + first;
            const Index lastHighBit = Index(values[last - 1] >> lowBits) + last - 1;
            chunk.low = CompactArray<Owned>(lowBits, last - first);
            chunk.high = BitStorage<Owned>(lastHighBit - chunk.firstHighBit + 1);
            for (Index i = first; i < last; ++i) {
                chunk.low.setUnchecked(i - first, values[i] & lowMaskValue);
                chunk.high.setBitUnchecked(Index(values[i] >> lowBits) + i - chunk.firstHighBit);
            }
        } catch (...) {
            chunk.error = std::current_exception();
        }
    }

    for (const Chunk& chunk : chunks) {
        if (chunk.error) {
            std::rethrow_exception(chunk.error);
        }
    }
    CompactArray<Owned> low(lowBits, numValues);
    BitStorage<Owned> high(eliasFanoHighBits(numValues, universe, lowBits));
    for (Index c = 0; c < numChunks; ++c) {
        low.copyLimbsAt(c * chunkSize * lowBits / 64, chunks[c].low.limbs());
        high.orBitsAt(chunks[c].firstHighBit, chunks[c].high);
    }
    return EliasFano<Owned, Layout>::fromRawParts(
            numValues, universe, std::move(low), RankSelectBitvec<Owned, Layout>(std::move(high)));
}

} // namespace detail

} // namespace sds

#endif // SDS_ELIAS_FANO_HPP
