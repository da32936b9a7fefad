#ifndef SDS_COMPACT_ARRAY_HPP
#define SDS_COMPACT_ARRAY_HPP

#include "bit.hpp"
#include "errors.hpp"
#include "storage.hpp"
#include "value_iter.hpp"

namespace sds {

/// \brief Packs `size()` unsigned integers of `bitWidth()` bits each into 64 bit limbs, without any padding between
/// entries. An entry may straddle two limbs. The bit width can be anything in [0, 64]; an array of width 0 doesn't
/// allocate anything and all its entries are zero.
/// \tparam Ownership Owned if entries can be set, Borrowed for a read-only view of limbs that live elsewhere.
template<typename Ownership = Owned>
class [[nodiscard]] CompactArray {
    template<typename>
    friend class CompactArray;

    ArrayFor<Limb, Ownership> limbs_;
    Index numEntries = 0;
    Index width = 0;
    Limb mask_ = 0;

    constexpr static bool IsOwned = isOwned<Ownership>;

    static void checkLayout(Index bitWidth, Index size) {
        if (bitWidth < 0 || bitWidth > 64) [[unlikely]] {
            throw RangeError("invalid bit width for a compact array: " + std::to_string(bitWidth));
        }
        if (size < 0) [[unlikely]] {
            throw RangeError("negative compact array size: " + std::to_string(size));
        }
    }

public:
    using value_type = U64;
    using Iter = ValueIter<CompactArray>;

    CompactArray() noexcept = default;

    /// \brief Creates a zero-initialized array.
    CompactArray(Index bitWidth, Index size) {
        static_assert(IsOwned, "only an owning CompactArray can be created with a size");
        checkLayout(bitWidth, size);
        limbs_ = OwnedArray<Limb>(numLimbsFor(bitWidth, size));
        numEntries = size;
        width = bitWidth;
        mask_ = lowMask(bitWidth);
    }

    /// \brief Copies (Owned) or refers to (Borrowed) limbs previously obtained from limbs().
    [[nodiscard]] static CompactArray fromRawParts(Span<const Limb> limbs, Index bitWidth, Index size) {
        checkLayout(bitWidth, size);
        if (limbs.size() != numLimbsFor(bitWidth, size)) [[unlikely]] {
            throw FormatError("a compact array of " + std::to_string(size) + " entries with " + std::to_string(bitWidth)
                              + " bits each can't consist of " + std::to_string(limbs.size()) + " limbs");
        }
        CompactArray res;
        res.limbs_ = makeArray<Ownership>(limbs);
        res.numEntries = size;
        res.width = bitWidth;
        res.mask_ = lowMask(bitWidth);
        return res;
    }

    [[nodiscard]] CompactArray<Owned> toOwned() const {
        return CompactArray<Owned>::fromRawParts(limbs(), width, numEntries);
    }

    [[nodiscard]] constexpr static Index numLimbsFor(Index bitWidth, Index size) noexcept {
        return numLimbsForBits(bitWidth * size);
    }

    [[nodiscard]] constexpr Index size() const noexcept { return numEntries; }
    [[nodiscard]] constexpr bool empty() const noexcept { return numEntries == 0; }
    [[nodiscard]] constexpr Index bitWidth() const noexcept { return width; }
    [[nodiscard]] constexpr Limb mask() const noexcept { return mask_; }
    [[nodiscard]] constexpr Span<const Limb> limbs() const noexcept { return limbs_.span(); }
    [[nodiscard]] constexpr Index numAllocatedBits() const noexcept { return limbs_.sizeInBytes() * 8; }

    [[nodiscard]] constexpr U64 getUnchecked(Index i) const noexcept {
        SDS_ASSUME(i >= 0 && i < size());
        if (width == 0) {
            return 0;
        }
        const Index bitPos = i * width;
        const Index limbIdx = bitPos / 64;
        const Index bitIdx = bitPos % 64;
        const Limb low = limbs_[limbIdx] >> bitIdx;
        if (bitIdx + width <= 64) {
            return low & mask_;
        }
        return (low | (limbs_[limbIdx + 1] << (64 - bitIdx))) & mask_;
    }

    [[nodiscard]] U64 get(Index i) const {
        if (i < 0 || i >= size()) [[unlikely]] {
            detail::throwIndexError("CompactArray::get", i, size());
        }
        return getUnchecked(i);
    }

    [[nodiscard]] U64 operator[](Index i) const { return get(i); }

    /// \brief Overwrites entry i, touching only the one or two limbs that contain it.
    void setUnchecked(Index i, U64 value) noexcept {
        static_assert(IsOwned, "a borrowed CompactArray is read-only");
        SDS_ASSUME(i >= 0 && i < size());
        SDS_ASSUME((value & ~mask_) == 0);
        if (width == 0) {
            return;
        }
        const Index bitPos = i * width;
        const Index limbIdx = bitPos / 64;
        const Index bitIdx = bitPos % 64;
        Limb& first = limbs_[limbIdx];
        first = (first & ~(mask_ << bitIdx)) | (value << bitIdx);
        if (bitIdx + width > 64) {
            Limb& second = limbs_[limbIdx + 1];
            second = (second & ~(mask_ >> (64 - bitIdx))) | (value >> (64 - bitIdx));
        }
    }

    void set(Index i, U64 value) {
        if (i < 0 || i >= size()) [[unlikely]] {
            detail::throwIndexError("CompactArray::set", i, size());
        }
        if ((value & ~mask_) != 0) [[unlikely]] {
            throw RangeError("value " + std::to_string(value) + " doesn't fit into " + std::to_string(width) + " bits");
        }
        setUnchecked(i, value);
    }

    /// \brief Overwrites whole limbs starting at limb `firstLimb`. Used to concatenate arrays whose entries start
    /// at a limb boundary.
    void copyLimbsAt(Index firstLimb, Span<const Limb> src) {
        static_assert(IsOwned, "a borrowed CompactArray is read-only");
        if (firstLimb < 0 || firstLimb + src.size() > limbs_.size()) [[unlikely]] {
            throw IndexError("can't copy " + std::to_string(src.size()) + " limbs to limb " + std::to_string(firstLimb)
                             + " of a compact array with " + std::to_string(limbs_.size()) + " limbs");
        }
        std::copy(src.begin(), src.end(), limbs_.data() + firstLimb);
    }

    [[nodiscard]] Iter begin() const noexcept { return Iter(*this, 0); }
    [[nodiscard]] Iter end() const noexcept { return Iter(*this, size()); }

    [[nodiscard]] Subrange<Iter> values() const noexcept { return {begin(), end()}; }
};

} // namespace sds

#endif // SDS_COMPACT_ARRAY_HPP
