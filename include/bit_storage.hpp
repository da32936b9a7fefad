#ifndef SDS_BIT_STORAGE_HPP
#define SDS_BIT_STORAGE_HPP

#include "bit.hpp"
#include "errors.hpp"
#include "storage.hpp"
#include <string_view>

namespace sds {

/// \brief A sequence of bits packed into 64 bit limbs. Bit i is bit `i % 64` of limb `i / 64`, counting from the least
/// significant bit. Bits past the end in the last limb are always zero.
/// \tparam Ownership Owned for a heap buffer that can be modified and grown while a structure is built,
/// Borrowed for a read-only view.
template<typename Ownership = Owned>
class [[nodiscard]] BitStorage {
    template<typename>
    friend class BitStorage;

    ArrayFor<Limb, Ownership> limbs_;
    Index numBits = 0;

    constexpr static bool IsOwned = isOwned<Ownership>;

    [[nodiscard]] static Index checkedSize(Index numBits) {
        if (numBits < 0) [[unlikely]] {
            throw RangeError("negative bit storage size: " + std::to_string(numBits));
        }
        return numBits;
    }

public:
    BitStorage() noexcept = default;

    explicit BitStorage(Index numBits) : limbs_(numLimbsForBits(checkedSize(numBits))), numBits(numBits) {
        static_assert(IsOwned, "only an owning BitStorage can be created with a size");
    }

    /// \brief Parses a string of '0' and '1' characters, the i-th character becomes bit i.
    explicit BitStorage(std::string_view str) : BitStorage(Index(str.size())) {
        for (Index i = 0; i < Index(str.size()); ++i) {
            if (str[i] == '1') {
                setBitUnchecked(i);
            } else if (str[i] != '0') [[unlikely]] {
                throw std::invalid_argument("invalid character '" + std::string(1, str[i]) + "' in bit string");
            }
        }
    }

    /// \brief Copies (Owned) or refers to (Borrowed) the given limbs.
    [[nodiscard]] static BitStorage fromRawParts(Span<const Limb> limbs, Index numBits) {
        if (numBits < 0 || limbs.size() != numLimbsForBits(numBits)) [[unlikely]] {
            throw FormatError("bit storage of " + std::to_string(numBits) + " bits can't consist of "
                              + std::to_string(limbs.size()) + " limbs");
        }
        if (numBits % 64 != 0 && (limbs[limbs.size() - 1] & ~lowMask(numBits % 64)) != 0) [[unlikely]] {
            throw FormatError("nonzero padding bits in the last limb of a bit storage");
        }
        BitStorage res;
        res.limbs_ = makeArray<Ownership>(limbs);
        res.numBits = numBits;
        return res;
    }

    [[nodiscard]] BitStorage<Owned> toOwned() const { return BitStorage<Owned>::fromRawParts(limbs(), numBits); }

    [[nodiscard]] constexpr Index size() const noexcept { return numBits; }
    [[nodiscard]] constexpr bool empty() const noexcept { return numBits == 0; }
    [[nodiscard]] constexpr Index numLimbs() const noexcept { return limbs_.size(); }
    [[nodiscard]] constexpr Index numAllocatedBits() const noexcept { return limbs_.sizeInBytes() * 8; }

    [[nodiscard]] constexpr Span<const Limb> limbs() const noexcept { return limbs_.span(); }

    [[nodiscard]] constexpr Limb getLimb(Index limbIdx) const noexcept {
        SDS_ASSUME(limbIdx >= 0 && limbIdx < numLimbs());
        return limbs_[limbIdx];
    }

    [[nodiscard]] constexpr bool getBitUnchecked(Index i) const noexcept {
        SDS_ASSUME(i >= 0 && i < size());
        return (limbs_[i / 64] >> (i % 64)) & 1;
    }

    [[nodiscard]] bool getBit(Index i) const {
        if (i < 0 || i >= size()) [[unlikely]] {
            detail::throwIndexError("BitStorage::getBit", i, size());
        }
        return getBitUnchecked(i);
    }

    [[nodiscard]] bool operator[](Index i) const { return getBit(i); }

    void setBitUnchecked(Index i, bool value = true) noexcept {
        static_assert(IsOwned, "a borrowed BitStorage is read-only");
        SDS_ASSUME(i >= 0 && i < size());
        Limb& limb = limbs_[i / 64];
        const Limb mask = Limb(1) << (i % 64);
        limb = value ? (limb | mask) : (limb & ~mask);
    }

    void setBit(Index i, bool value = true) {
        if (i < 0 || i >= size()) [[unlikely]] {
            detail::throwIndexError("BitStorage::setBit", i, size());
        }
        setBitUnchecked(i, value);
    }

    /// \brief Appends a bit, growing the underlying buffer if necessary. Only used during construction.
    void pushBack(bool value) {
        static_assert(IsOwned, "a borrowed BitStorage is read-only");
        if (numBits % 64 == 0) {
            limbs_.resize(numLimbs() + 1);
        }
        ++numBits;
        setBitUnchecked(numBits - 1, value);
    }

    /// \brief ORs all bits of `other` into this storage, with bit 0 of `other` ending up at bit `offset`.
    /// Works on whole limbs, so its running time doesn't depend on the offset.
    void orBitsAt(Index offset, const BitStorage<Owned>& other) {
        static_assert(IsOwned, "a borrowed BitStorage is read-only");
        if (offset < 0 || offset + other.size() > size()) [[unlikely]] {
            throw IndexError("can't place " + std::to_string(other.size()) + " bits at offset "
                             + std::to_string(offset) + " into a bit storage of size " + std::to_string(size()));
        }
        const Index firstLimb = offset / 64;
        const Index shift = offset % 64;
        for (Index i = 0; i < other.numLimbs(); ++i) {
            const Limb limb = other.getLimb(i);
            limbs_[firstLimb + i] |= limb << shift;
            if (shift != 0 && firstLimb + i + 1 < numLimbs()) {
                limbs_[firstLimb + i + 1] |= limb >> (64 - shift);
            }
        }
    }

    [[nodiscard]] Index numOnes() const noexcept {
        Index res = 0;
        for (Limb limb : limbs_) {
            res += popcount(limb);
        }
        return res;
    }

    [[nodiscard]] friend bool operator==(const BitStorage& lhs, const BitStorage& rhs) noexcept {
        return lhs.size() == rhs.size() && std::equal(lhs.limbs_.begin(), lhs.limbs_.end(), rhs.limbs_.begin());
    }
    [[nodiscard]] friend bool operator!=(const BitStorage& lhs, const BitStorage& rhs) noexcept {
        return !(lhs == rhs);
    }

    friend std::ostream& operator<<(std::ostream& os, const BitStorage& bits) {
        for (Index i = 0; i < bits.size(); ++i) {
            os << (bits.getBitUnchecked(i) ? '1' : '0');
        }
        return os;
    }
};

} // namespace sds

#endif // SDS_BIT_STORAGE_HPP
