#ifndef SDS_ATOMIC_COMPACT_ARRAY_HPP
#define SDS_ATOMIC_COMPACT_ARRAY_HPP

#include "compact_array.hpp"
#include <atomic>

namespace sds {

/// \brief A CompactArray whose entries can be read and written by several threads at once. Every limb is a std::atomic
/// and a write replaces only the bits of its entry with compare-and-swap loops, so threads writing different entries
/// never lose each other's updates, even if the entries share a limb.
/// An entry that straddles two limbs is written with two atomic operations. A reader racing with a writer of that
/// same entry may see some old and some new bits. Once all writers are done, toCompactArray() returns the contents
/// as an ordinary CompactArray.
class [[nodiscard]] AtomicCompactArray {
    std::unique_ptr<std::atomic<Limb>[]> limbs_;
    Index numLimbs = 0;
    Index numEntries = 0;
    Index width = 0;
    Limb mask_ = 0;

    /// Replaces the bits of limb `limbIdx` selected by `mask` with `bits`.
    void updateLimb(Index limbIdx, Limb mask, Limb bits, std::memory_order order) noexcept {
        std::atomic<Limb>& limb = limbs_[limbIdx];
        Limb current = limb.load(std::memory_order_relaxed);
        while (!limb.compare_exchange_weak(current, (current & ~mask) | bits, order, std::memory_order_relaxed)) {
        }
    }

public:
    using value_type = U64;

    AtomicCompactArray() noexcept = default;

    /// \brief Creates a zero-initialized array.
    /// \throw RangeError if the width isn't in [0, 64] or the size is negative
    AtomicCompactArray(Index bitWidth, Index size) : AtomicCompactArray(CompactArray<Owned>(bitWidth, size)) {}

    /// \brief Copies the entries of `values`.
    template<typename Ownership>
    explicit AtomicCompactArray(const CompactArray<Ownership>& values)
        : limbs_(std::make_unique<std::atomic<Limb>[]>(values.limbs().size())), numLimbs(values.limbs().size()),
          numEntries(values.size()), width(values.bitWidth()), mask_(values.mask()) {
        for (Index i = 0; i < numLimbs; ++i) {
            limbs_[i].store(values.limbs()[i], std::memory_order_relaxed);
        }
    }

    [[nodiscard]] constexpr Index size() const noexcept { return numEntries; }
    [[nodiscard]] constexpr bool empty() const noexcept { return numEntries == 0; }
    [[nodiscard]] constexpr Index bitWidth() const noexcept { return width; }
    [[nodiscard]] constexpr Limb mask() const noexcept { return mask_; }
    [[nodiscard]] constexpr Index numAllocatedBits() const noexcept { return numLimbs * 64; }

    [[nodiscard]] U64 getAtomicUnchecked(Index i, std::memory_order order) const noexcept {
        SDS_ASSUME(i >= 0 && i < size());
        if (width == 0) {
            return 0;
        }
        const Index bitPos = i * width;
        const Index limbIdx = bitPos / 64;
        const Index bitIdx = bitPos % 64;
        const Limb low = limbs_[limbIdx].load(order) >> bitIdx;
        if (bitIdx + width <= 64) {
            return low & mask_;
        }
        return (low | (limbs_[limbIdx + 1].load(order) << (64 - bitIdx))) & mask_;
    }

    /// \throw IndexError if `i` is out of range
    [[nodiscard]] U64 getAtomic(Index i, std::memory_order order = std::memory_order_seq_cst) const {
        if (i < 0 || i >= size()) [[unlikely]] {
            detail::throwIndexError("AtomicCompactArray::getAtomic", i, size());
        }
        return getAtomicUnchecked(i, order);
    }

    void setAtomicUnchecked(Index i, U64 value, std::memory_order order) noexcept {
        SDS_ASSUME(i >= 0 && i < size());
        SDS_ASSUME((value & ~mask_) == 0);
        if (width == 0) {
            return;
        }
        const Index bitPos = i * width;
        const Index limbIdx = bitPos / 64;
        const Index bitIdx = bitPos % 64;
        updateLimb(limbIdx, mask_ << bitIdx, value << bitIdx, order);
        if (bitIdx + width > 64) {
            updateLimb(limbIdx + 1, mask_ >> (64 - bitIdx), value >> (64 - bitIdx), order);
        }
    }

    /// \throw IndexError if `i` is out of range
    /// \throw RangeError if `value` doesn't fit into bitWidth() bits
    void setAtomic(Index i, U64 value, std::memory_order order = std::memory_order_seq_cst) {
        if (i < 0 || i >= size()) [[unlikely]] {
            detail::throwIndexError("AtomicCompactArray::setAtomic", i, size());
        }
        if ((value & ~mask_) != 0) [[unlikely]] {
            throw RangeError("value " + std::to_string(value) + " doesn't fit into " + std::to_string(width) + " bits");
        }
        setAtomicUnchecked(i, value, order);
    }

    /// \brief Copies the current entries into a CompactArray. Writes that happen concurrently may or may not be seen.
    [[nodiscard]] CompactArray<Owned> toCompactArray() const {
        OwnedArray<Limb> words(numLimbs);
        for (Index i = 0; i < numLimbs; ++i) {
            words[i] = limbs_[i].load(std::memory_order_acquire);
        }
        return CompactArray<Owned>::fromRawParts(words.span(), width, numEntries);
    }
};

} // namespace sds

#endif // SDS_ATOMIC_COMPACT_ARRAY_HPP
