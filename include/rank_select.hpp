#ifndef SDS_RANK_SELECT_HPP
#define SDS_RANK_SELECT_HPP

#include "bit_storage.hpp"

namespace sds {

enum class SupportedSelects {
    ONE_ONLY,
    BOTH,
};

/// \brief Compile time tuning of a RankSelectBitvec.
/// \tparam BlockSizeInLimbs Every block stores a 16 bit count of the ones between the start of its superblock and
/// its own start. Smaller blocks mean fewer popcounts per rank query and more space.
/// \tparam SuperblockSizeInLimbs Every superblock stores the 64 bit number of ones before it. Must be a multiple of the
/// block size and at most 1024 limbs, so that block counts fit into 16 bits.
/// \tparam SelectSampleRate The position of every SelectSampleRate-th one (and zero, for SupportedSelects::BOTH) is
/// stored. 0 disables sampling, select queries then binary search over the rank counters.
/// \tparam Selects Whether zeros are sampled as well. selectZero() works either way, but is slower without samples.
template<Index BlockSizeInLimbs_ = 8, Index SuperblockSizeInLimbs_ = 1024, Index SelectSampleRate_ = 1024,
        SupportedSelects Selects_ = SupportedSelects::BOTH>
struct RankSelectLayout {
    constexpr static Index BlockSizeInLimbs = BlockSizeInLimbs_;
    constexpr static Index SuperblockSizeInLimbs = SuperblockSizeInLimbs_;
    constexpr static Index SelectSampleRate = SelectSampleRate_;
    constexpr static SupportedSelects Selects = Selects_;

    static_assert(BlockSizeInLimbs > 0);
    static_assert(SuperblockSizeInLimbs % BlockSizeInLimbs == 0);
    static_assert(SuperblockSizeInLimbs * 64 <= (Index(1) << 16), "block counts must fit into 16 bits");
    static_assert(SelectSampleRate >= 0 && SelectSampleRate < (Index(1) << 30));

    /// \brief Identifies the layout in serialized data.
    constexpr static U64 signature = U64(BlockSizeInLimbs) | (U64(SuperblockSizeInLimbs) << 16)
                                     | (U64(SelectSampleRate) << 32) | (U64(Selects) << 62);
};


/// \brief A bitvector with rank and select support. The ones before every superblock and, relative to the superblock,
/// before every block are counted in one pass over the bits. Select queries start at a sampled position (or a binary
/// search over superblocks), binary search over the block counts, scan at most one block with popcount and finish
/// with a broadword in-word select.
/// \tparam Ownership Owned if built from bits, Borrowed if all metadata is read from memory owned elsewhere.
/// \tparam Layout A RankSelectLayout.
template<typename Ownership = Owned, typename Layout = RankSelectLayout<>>
class [[nodiscard]] RankSelectBitvec {
    template<typename, typename>
    friend class RankSelectBitvec;

    constexpr static Index blockSize = Layout::BlockSizeInLimbs;
    constexpr static Index superblockSize = Layout::SuperblockSizeInLimbs;
    constexpr static Index blocksPerSuperblock = superblockSize / blockSize;
    constexpr static Index sampleRate = Layout::SelectSampleRate;
    constexpr static Index linearFallbackSize = 8;

    template<bool IsOne>
    constexpr static bool hasSamples = sampleRate > 0 && (IsOne || Layout::Selects == SupportedSelects::BOTH);

    BitStorage<Ownership> bits_;
    ArrayFor<U64, Ownership> superblockRanks_;
    ArrayFor<U16, Ownership> blockRanks_;
    ArrayFor<U64, Ownership> oneSamples_;
    ArrayFor<U64, Ownership> zeroSamples_;

    void buildMetadata() {
        static_assert(isOwned<Ownership>);
        const Index numLimbs = bits_.numLimbs();
        const Index numSuperblocks = numSuperblocksFor(numLimbs);
        superblockRanks_ = OwnedArray<U64>(numSuperblocks + 1);
        blockRanks_ = OwnedArray<U16>(numBlocksFor(numLimbs));
        oneSamples_ = OwnedArray<U64>();
        zeroSamples_ = OwnedArray<U64>();
        Index numOnesBefore = 0;
        Index nextOneRank = 0;
        Index nextZeroRank = 0;
        for (Index superblockIdx = 0; superblockIdx < numSuperblocks; ++superblockIdx) {
            superblockRanks_[superblockIdx] = U64(numOnesBefore);
            const Index firstLimb = superblockIdx * superblockSize;
            const Index endLimb = std::min(numLimbs, firstLimb + superblockSize);
            Index inSuperblock = 0;
            for (Index limbIdx = firstLimb; limbIdx < endLimb; ++limbIdx) {
                if (limbIdx % blockSize == 0) {
                    blockRanks_[limbIdx / blockSize] = U16(inSuperblock);
                }
                const Limb limb = bits_.getLimb(limbIdx);
                const Index ones = popcount(limb);
                if constexpr (hasSamples<true>) {
                    const Index onesBefore = numOnesBefore + inSuperblock;
                    for (; nextOneRank < onesBefore + ones; nextOneRank += sampleRate) {
                        oneSamples_.pushBack(U64(limbIdx * 64 + u64Select(limb, nextOneRank - onesBefore)));
                    }
                }
                if constexpr (hasSamples<false>) {
                    const Index zerosBefore = limbIdx * 64 - (numOnesBefore + inSuperblock);
                    const Limb zeros = ~limb & lowMask(std::min(Index(64), size() - limbIdx * 64));
                    for (; nextZeroRank < zerosBefore + popcount(zeros); nextZeroRank += sampleRate) {
                        zeroSamples_.pushBack(U64(limbIdx * 64 + u64Select(zeros, nextZeroRank - zerosBefore)));
                    }
                }
                inSuperblock += ones;
            }
            numOnesBefore += inSuperblock;
        }
        superblockRanks_[numSuperblocks] = U64(numOnesBefore);
    }

    template<bool IsOne>
    [[nodiscard]] constexpr Index superblockRank(Index superblockIdx) const noexcept {
        const Index ones = Index(superblockRanks_[superblockIdx]);
        if constexpr (IsOne) {
            return ones;
        } else {
            return superblockIdx * superblockSize * 64 - ones;
        }
    }

    template<bool IsOne>
    [[nodiscard]] constexpr Index blockRank(Index blockIdx) const noexcept {
        const Index ones = Index(superblockRanks_[blockIdx / blocksPerSuperblock]) + Index(blockRanks_[blockIdx]);
        if constexpr (IsOne) {
            return ones;
        } else {
            return blockIdx * blockSize * 64 - ones;
        }
    }

    /// \brief Finds the last index in [lo, hi] whose rank is at most `rank`, given that `rankOf(lo) <= rank`.
    template<typename RankOf>
    [[nodiscard]] static Index lastWithRankAtMost(Index lo, Index hi, Index rank, RankOf rankOf) noexcept {
        SDS_ASSUME(lo <= hi);
        SDS_ASSUME(rankOf(lo) <= rank);
        while (hi - lo > linearFallbackSize) {
            const Index mid = lo + (hi - lo + 1) / 2;
            if (rankOf(mid) <= rank) {
                lo = mid;
            } else {
                hi = mid - 1;
            }
        }
        while (lo < hi && rankOf(lo + 1) <= rank) {
            ++lo;
        }
        return lo;
    }

    template<bool IsOne>
    [[nodiscard]] Index selectUnchecked(Index rank) const noexcept {
        Index firstBlock = 0;
        Index lastBlock = 0;
        if constexpr (hasSamples<IsOne>) {
            const auto& samples = IsOne ? oneSamples_ : zeroSamples_;
            const Index sampleIdx = rank / sampleRate;
            SDS_ASSUME(sampleIdx < samples.size());
            firstBlock = Index(samples[sampleIdx]) / 64 / blockSize;
            lastBlock = sampleIdx + 1 < samples.size() ? Index(samples[sampleIdx + 1]) / 64 / blockSize : numBlocks() - 1;
        } else {
            const Index superblockIdx = lastWithRankAtMost(0, numSuperblocks() - 1, rank,
                    [this](Index i) { return superblockRank<IsOne>(i); });
            firstBlock = superblockIdx * blocksPerSuperblock;
            lastBlock = std::min(numBlocks(), firstBlock + blocksPerSuperblock) - 1;
        }
        const Index blockIdx = lastWithRankAtMost(
                firstBlock, lastBlock, rank, [this](Index i) { return blockRank<IsOne>(i); });
        const Index firstLimb = blockIdx * blockSize;
        return scanLimbs<IsOne>(firstLimb, limbFor<IsOne>(firstLimb), rank - blockRank<IsOne>(blockIdx));
    }

    template<bool IsOne>
    [[nodiscard]] Limb limbFor(Index limbIdx) const noexcept {
        return IsOne ? bits_.getLimb(limbIdx) : ~bits_.getLimb(limbIdx);
    }

    /// \brief The position of the `remaining`-th searched bit, counting from the bits of `limb`, which is limb
    /// `limbIdx` with some low bits possibly cleared.
    template<bool IsOne>
    [[nodiscard]] Index scanLimbs(Index limbIdx, Limb limb, Index remaining) const noexcept {
        for (;;) {
            const Index count = popcount(limb);
            if (remaining < count) {
                return limbIdx * 64 + u64Select(limb, remaining);
            }
            remaining -= count;
            ++limbIdx;
            SDS_ASSUME(limbIdx < bits_.numLimbs());
            limb = limbFor<IsOne>(limbIdx);
        }
    }

    /// Gallops over the block counters starting at the block of `pos`, so the cost grows with the logarithm of the
    /// distance between the hint and the result instead of the size of the bitvector.
    template<bool IsOne>
    [[nodiscard]] Index selectHintedUnchecked(Index rank, Index pos, Index rankAtPos) const noexcept {
        SDS_ASSUME(pos >= 0 && pos < size());
        SDS_ASSUME(rankAtPos <= rank);
        const Index hintBlock = pos / 64 / blockSize;
        Index lo = hintBlock;
        Index step = 1;
        while (lo + step < numBlocks() && blockRank<IsOne>(lo + step) <= rank) {
            lo += step;
            step *= 2;
        }
        const Index blockIdx = lastWithRankAtMost(lo, std::min(numBlocks() - 1, lo + step), rank,
                [this](Index i) { return blockRank<IsOne>(i); });
        if (blockIdx == hintBlock) {
            const Index limbIdx = pos / 64;
            return scanLimbs<IsOne>(limbIdx, limbFor<IsOne>(limbIdx) & ~lowMask(pos % 64), rank - rankAtPos);
        }
        const Index firstLimb = blockIdx * blockSize;
        return scanLimbs<IsOne>(firstLimb, limbFor<IsOne>(firstLimb), rank - blockRank<IsOne>(blockIdx));
    }

    template<bool IsOne>
    void checkHint(Index rank, Index pos, Index rankAtPos, Index count) const {
        const char* kind = IsOne ? "one" : "zero";
        if (rank < 0 || rank >= count) [[unlikely]] {
            throw IndexError("invalid rank for hinted select " + std::string(kind) + " query: " + std::to_string(rank)
                             + " (there are " + std::to_string(count) + " " + kind + "s)");
        }
        if (pos < 0 || pos > size()) [[unlikely]] {
            detail::throwIndexError("RankSelectBitvec::select hint", pos, size() + 1);
        }
        const Index actual = IsOne ? rankOneUnchecked(pos) : rankZeroUnchecked(pos);
        if (rankAtPos != actual || rankAtPos > rank) [[unlikely]] {
            throw RangeError("invalid select hint: there are " + std::to_string(actual) + " " + kind + "s before "
                             + std::to_string(pos) + ", the hint claims " + std::to_string(rankAtPos)
                             + " and the query asks for rank " + std::to_string(rank));
        }
    }

    /// Samples are increasing bit positions, so checking the first and the last one takes constant time.
    static void checkSampleRange(Span<const U64> samples, Index numBits, const char* kind) {
        if (samples.empty()) {
            return;
        }
        const U64 first = samples[0];
        const U64 last = samples[samples.size() - 1];
        if (first > last || last >= U64(numBits)) [[unlikely]] {
            throw FormatError(std::string(kind) + " select samples must be increasing positions below "
                              + std::to_string(numBits) + ", got " + std::to_string(first) + " to "
                              + std::to_string(last));
        }
    }

public:
    using LayoutType = Layout;

    RankSelectBitvec() noexcept = default;

    /// \brief Takes ownership of the bits and computes rank and select metadata in one pass.
    explicit RankSelectBitvec(BitStorage<Owned> bits) : bits_(std::move(bits)) { buildMetadata(); }

    explicit RankSelectBitvec(std::string_view str) : RankSelectBitvec(BitStorage<Owned>(str)) {}

    /// \brief Reassembles a bitvector from the parts returned by bits(), superblockRanks(), blockRanks(), oneSamples()
    /// and zeroSamples() without recomputing anything, in constant time. The sizes of all parts, the total number of
    /// ones and the range of the select samples are checked. The remaining counter and sample values are trusted:
    /// if they don't match the bits, queries return wrong results or have undefined behavior.
    [[nodiscard]] static RankSelectBitvec fromRawParts(BitStorage<Ownership> bits, Span<const U64> superblockRanks,
            Span<const U16> blockRanks, Span<const U64> oneSamples, Span<const U64> zeroSamples) {
        const Index numLimbs = bits.numLimbs();
        if (superblockRanks.size() != numSuperblocksFor(numLimbs) + 1 || blockRanks.size() != numBlocksFor(numLimbs))
                [[unlikely]] {
            throw FormatError("rank counters don't match a bitvector of " + std::to_string(bits.size()) + " bits");
        }
        const Index ones = Index(superblockRanks[superblockRanks.size() - 1]);
        if (superblockRanks[0] != 0 || ones < 0 || ones > bits.size()) [[unlikely]] {
            throw FormatError("invalid total number of ones: " + std::to_string(ones));
        }
        if (oneSamples.size() != numSamplesFor<true>(ones) || zeroSamples.size() != numSamplesFor<false>(bits.size() - ones))
                [[unlikely]] {
            throw FormatError("the number of select samples doesn't match the number of ones and zeros");
        }
        checkSampleRange(oneSamples, bits.size(), "one");
        checkSampleRange(zeroSamples, bits.size(), "zero");
        RankSelectBitvec res;
        res.bits_ = std::move(bits);
        res.superblockRanks_ = makeArray<Ownership>(superblockRanks);
        res.blockRanks_ = makeArray<Ownership>(blockRanks);
        res.oneSamples_ = makeArray<Ownership>(oneSamples);
        res.zeroSamples_ = makeArray<Ownership>(zeroSamples);
        return res;
    }

    [[nodiscard]] RankSelectBitvec<Owned, Layout> toOwned() const {
        return RankSelectBitvec<Owned, Layout>::fromRawParts(
                bits_.toOwned(), superblockRanks(), blockRanks(), oneSamples(), zeroSamples());
    }

    [[nodiscard]] constexpr static Index numSuperblocksFor(Index numLimbs) noexcept {
        return roundUpDiv(numLimbs, superblockSize);
    }
    [[nodiscard]] constexpr static Index numBlocksFor(Index numLimbs) noexcept { return roundUpDiv(numLimbs, blockSize); }

    template<bool IsOne>
    [[nodiscard]] constexpr static Index numSamplesFor(Index count) noexcept {
        if constexpr (hasSamples<IsOne>) {
            return roundUpDiv(count, sampleRate);
        } else {
            return 0;
        }
    }

    [[nodiscard]] constexpr Index size() const noexcept { return bits_.size(); }
    [[nodiscard]] constexpr bool empty() const noexcept { return bits_.empty(); }
    [[nodiscard]] constexpr Index numSuperblocks() const noexcept { return numSuperblocksFor(bits_.numLimbs()); }
    [[nodiscard]] constexpr Index numBlocks() const noexcept { return numBlocksFor(bits_.numLimbs()); }

    [[nodiscard]] constexpr Index numOnes() const noexcept {
        return superblockRanks_.size() == 0 ? 0 : Index(superblockRanks_[superblockRanks_.size() - 1]);
    }
    [[nodiscard]] constexpr Index numZeros() const noexcept { return size() - numOnes(); }

    [[nodiscard]] constexpr const BitStorage<Ownership>& bits() const noexcept { return bits_; }
    [[nodiscard]] constexpr Span<const U64> superblockRanks() const noexcept { return superblockRanks_.span(); }
    [[nodiscard]] constexpr Span<const U16> blockRanks() const noexcept { return blockRanks_.span(); }
    [[nodiscard]] constexpr Span<const U64> oneSamples() const noexcept { return oneSamples_.span(); }
    [[nodiscard]] constexpr Span<const U64> zeroSamples() const noexcept { return zeroSamples_.span(); }

    /// \brief The total amount of bits allocated for bits and metadata.
    [[nodiscard]] constexpr Index numAllocatedBits() const noexcept {
        return bits_.numAllocatedBits()
               + 8 * (superblockRanks_.sizeInBytes() + blockRanks_.sizeInBytes() + oneSamples_.sizeInBytes() + zeroSamples_.sizeInBytes());
    }

    [[nodiscard]] bool getBit(Index i) const { return bits_.getBit(i); }
    [[nodiscard]] bool getBitUnchecked(Index i) const noexcept { return bits_.getBitUnchecked(i); }

    /// \brief The number of ones in [0, pos). pos == size() is allowed.
    [[nodiscard]] Index rankOneUnchecked(Index pos) const noexcept {
        SDS_ASSUME(pos >= 0 && pos <= size());
        if (pos == size()) {
            return numOnes();
        }
        const Index limbIdx = pos / 64;
        const Index blockIdx = limbIdx / blockSize;
        Index res = blockRank<true>(blockIdx);
        for (Index i = blockIdx * blockSize; i < limbIdx; ++i) {
            res += popcount(bits_.getLimb(i));
        }
        return res + popcountBefore(bits_.getLimb(limbIdx), pos % 64);
    }

    [[nodiscard]] Index rankZeroUnchecked(Index pos) const noexcept { return pos - rankOneUnchecked(pos); }

    [[nodiscard]] Index rankOne(Index pos) const {
        if (pos < 0 || pos > size()) [[unlikely]] {
            throw IndexError("invalid position for a rank query: " + std::to_string(pos) + " (size is "
                             + std::to_string(size()) + ")");
        }
        return rankOneUnchecked(pos);
    }

    [[nodiscard]] Index rankZero(Index pos) const { return pos - rankOne(pos); }

    [[nodiscard]] Index selectOneUnchecked(Index rank) const noexcept {
        SDS_ASSUME(rank >= 0 && rank < numOnes());
        return selectUnchecked<true>(rank);
    }

    [[nodiscard]] Index selectZeroUnchecked(Index rank) const noexcept {
        SDS_ASSUME(rank >= 0 && rank < numZeros());
        return selectUnchecked<false>(rank);
    }

    /// \brief The position of the one with the given rank, ie. the rank+1-th one.
    [[nodiscard]] Index selectOne(Index rank) const {
        if (rank < 0 || rank >= numOnes()) [[unlikely]] {
            throw IndexError("invalid rank for select one query: " + std::to_string(rank) + " (there are "
                             + std::to_string(numOnes()) + " ones)");
        }
        return selectUnchecked<true>(rank);
    }

    [[nodiscard]] Index selectZero(Index rank) const {
        if (rank < 0 || rank >= numZeros()) [[unlikely]] {
            throw IndexError("invalid rank for select zero query: " + std::to_string(rank) + " (there are "
                             + std::to_string(numZeros()) + " zeros)");
        }
        return selectUnchecked<false>(rank);
    }

    /// \brief selectOne(rank), starting the search at a known position `pos` with `rankAtPos` ones before it. Faster
    /// than selectOne() if the result is close to the hint.
    [[nodiscard]] Index selectOneHintedUnchecked(Index rank, Index pos, Index rankAtPos) const noexcept {
        SDS_ASSUME(rank >= 0 && rank < numOnes());
        return selectHintedUnchecked<true>(rank, pos, rankAtPos);
    }

    [[nodiscard]] Index selectZeroHintedUnchecked(Index rank, Index pos, Index rankAtPos) const noexcept {
        SDS_ASSUME(rank >= 0 && rank < numZeros());
        return selectHintedUnchecked<false>(rank, pos, rankAtPos);
    }

    /// \throw IndexError if `rank` or `pos` is out of range
    /// \throw RangeError if `rankAtPos` isn't the number of ones before `pos`, or is larger than `rank`
    [[nodiscard]] Index selectOneHinted(Index rank, Index pos, Index rankAtPos) const {
        checkHint<true>(rank, pos, rankAtPos, numOnes());
        return selectHintedUnchecked<true>(rank, pos, rankAtPos);
    }

    [[nodiscard]] Index selectZeroHinted(Index rank, Index pos, Index rankAtPos) const {
        checkHint<false>(rank, pos, rankAtPos, numZeros());
        return selectHintedUnchecked<false>(rank, pos, rankAtPos);
    }
};

} // namespace sds

#endif // SDS_RANK_SELECT_HPP
