#ifndef SDS_STORAGE_HPP
#define SDS_STORAGE_HPP

#include "common.hpp"
#include <new>
#include <type_traits>
#include <utility>

namespace sds {

/// \brief Allocate `numBytes` bytes of memory, aligned to (at least) a cache line.
template<typename T, Index Alignment = CACHELINE_SIZE_BYTES>
[[nodiscard, gnu::returns_nonnull]] T* allocateBytes(Index numBytes) {
    constexpr std::size_t alignment = std::max({std::size_t(CACHELINE_SIZE_BYTES), std::size_t(Alignment), alignof(T)});
    SDS_ASSUME(numBytes % sizeof(T) == 0);
    // for large sizes, the malloc implementation should even give page-aligned pointers.
    // don't use std::aligned_alloc as that requires size to be a multiple of alignment, which may not be true
    return static_cast<T*>(::operator new(std::size_t(numBytes), std::align_val_t(alignment)));
}

/// \brief Deallocate memory previously allocated by allocateBytes()
template<typename T, Index Alignment = CACHELINE_SIZE_BYTES>
void deallocateBytes(T* ptr) noexcept {
    constexpr std::size_t alignment = std::max({std::size_t(CACHELINE_SIZE_BYTES), std::size_t(Alignment), alignof(T)});
    if (ptr) {
        ::operator delete(ptr, std::align_val_t(alignment));
    }
}

/// \brief Owns a pointer to zero-initialized heap memory with the given alignment.
/// \tparam T An integer type; the memory is never read before it has been value-initialized.
template<typename T, Index Alignment = CACHELINE_SIZE_BYTES>
class Allocation {
    static_assert(std::is_trivially_copyable_v<T>);
    T* mem = nullptr;
    Index numTs = 0;

public:
    Allocation() noexcept = default;

    explicit Allocation(Index numTs) : numTs(numTs) {
        SDS_ASSUME(numTs >= 0);
        if (numTs > 0) {
            mem = allocateBytes<T, Alignment>(numTs * Index(sizeof(T)));
            // compiles to a memset for integer types but formally starts the lifetime of the elements
            std::uninitialized_value_construct_n(mem, numTs);
        }
    }

    Allocation(Allocation&& other) noexcept
        : mem(std::exchange(other.mem, nullptr)), numTs(std::exchange(other.numTs, 0)) {}

    Allocation& operator=(Allocation&& other) noexcept {
        using std::swap;
        swap(mem, other.mem);
        swap(numTs, other.numTs);
        return *this;
    }

    ~Allocation() noexcept { deallocateBytes<T, Alignment>(mem); }

    [[nodiscard]] constexpr Index sizeInTs() const noexcept { return numTs; }
    [[nodiscard]] constexpr Index sizeInBytes() const noexcept { return numTs * Index(sizeof(T)); }

    [[nodiscard]] constexpr T* memory() const noexcept { return mem; }
};


/// \brief Ownership tag: the structure owns its words on the heap and can be modified during construction.
struct Owned {};

/// \brief Ownership tag: the structure refers to read-only words owned by someone else, such as a memory mapped
/// file. It must not outlive that memory.
struct Borrowed {};

template<typename Ownership>
constexpr static bool isOwned = std::is_same_v<Ownership, Owned>;


/// \brief A heap array of trivially copyable values that can grow while a structure is being built.
template<typename T>
class [[nodiscard]] OwnedArray {
    Allocation<T> allocation;
    Index numT = 0;

public:
    using value_type = T;

    OwnedArray() noexcept = default;

    explicit OwnedArray(Index size) : allocation(size), numT(size) {}

    [[nodiscard]] static OwnedArray copyOf(Span<const T> values) {
        OwnedArray res(values.size());
        std::copy(values.begin(), values.end(), res.data());
        return res;
    }

    /// \brief Changes the size, new elements are zero. Grows the capacity geometrically.
    void resize(Index newSize) {
        SDS_ASSUME(newSize >= 0);
        if (newSize > allocation.sizeInTs()) {
            Allocation<T> newAllocation(std::max(newSize, 2 * allocation.sizeInTs()));
            std::copy(data(), data() + numT, newAllocation.memory());
            allocation = std::move(newAllocation);
        } else if (newSize < numT) {
            std::fill(data() + newSize, data() + numT, T());
        }
        numT = newSize;
    }

    void pushBack(T value) {
        resize(numT + 1);
        data()[numT - 1] = value;
    }

    [[nodiscard]] constexpr Index size() const noexcept { return numT; }
    [[nodiscard]] constexpr Index capacity() const noexcept { return allocation.sizeInTs(); }
    [[nodiscard]] constexpr Index sizeInBytes() const noexcept { return numT * Index(sizeof(T)); }

    [[nodiscard]] constexpr T* data() noexcept { return allocation.memory(); }
    [[nodiscard]] constexpr const T* data() const noexcept { return allocation.memory(); }

    [[nodiscard]] constexpr T& operator[](Index i) noexcept {
        SDS_ASSUME(i >= 0 && i < numT);
        return data()[i];
    }
    [[nodiscard]] constexpr const T& operator[](Index i) const noexcept {
        SDS_ASSUME(i >= 0 && i < numT);
        return data()[i];
    }

    [[nodiscard]] constexpr T* begin() noexcept { return data(); }
    [[nodiscard]] constexpr T* end() noexcept { return data() + numT; }
    [[nodiscard]] constexpr const T* begin() const noexcept { return data(); }
    [[nodiscard]] constexpr const T* end() const noexcept { return data() + numT; }

    [[nodiscard]] constexpr Span<const T> span() const noexcept { return {data(), numT}; }
};


/// \brief A read-only view of values that live somewhere else, usually inside a mapped file.
template<typename T>
class [[nodiscard]] BorrowedArray {
    const T* ptr = nullptr;
    Index numT = 0;

public:
    using value_type = T;

    constexpr BorrowedArray() noexcept = default;

    constexpr explicit BorrowedArray(Span<const T> values) noexcept : ptr(values.data()), numT(values.size()) {}

    [[nodiscard]] constexpr Index size() const noexcept { return numT; }
    [[nodiscard]] constexpr Index sizeInBytes() const noexcept { return numT * Index(sizeof(T)); }

    [[nodiscard]] constexpr const T* data() const noexcept { return ptr; }

    [[nodiscard]] constexpr const T& operator[](Index i) const noexcept {
        SDS_ASSUME(i >= 0 && i < numT);
        return ptr[i];
    }

    [[nodiscard]] constexpr const T* begin() const noexcept { return ptr; }
    [[nodiscard]] constexpr const T* end() const noexcept { return ptr + numT; }

    [[nodiscard]] constexpr Span<const T> span() const noexcept { return {ptr, numT}; }
};

namespace detail {

template<typename T, typename Ownership>
struct ArrayForImpl;

template<typename T>
struct ArrayForImpl<T, Owned> {
    using Type = OwnedArray<T>;
};

template<typename T>
struct ArrayForImpl<T, Borrowed> {
    using Type = BorrowedArray<T>;
};

} // namespace detail

template<typename T, typename Ownership>
using ArrayFor = typename detail::ArrayForImpl<T, Ownership>::Type;

/// \brief Creates an owning copy or a borrowing view of `values`, depending on Ownership.
template<typename Ownership, typename T>
[[nodiscard]] ArrayFor<T, Ownership> makeArray(Span<const T> values) {
    if constexpr (isOwned<Ownership>) {
        return OwnedArray<T>::copyOf(values);
    } else {
        return BorrowedArray<T>(values);
    }
}

} // namespace sds

#endif // SDS_STORAGE_HPP
