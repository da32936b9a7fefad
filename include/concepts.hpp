#ifndef SDS_CONCEPTS_HPP
#define SDS_CONCEPTS_HPP

#include "common.hpp"
#include <optional>
#include <utility>

namespace sds {

/// Note that the following concepts also apply in C++17 mode, they are just not checked by the implementation.
#ifdef SDS_HAS_CPP20

/// Read access to a sequence of fixed-width unsigned integers, such as a CompactArray. Values are returned by value,
/// there are no references to individual entries.
template<typename T>
concept ValueAccess = requires(const T& ct) {
    { ct.size() } -> std::convertible_to<Index>;
    { ct.bitWidth() } -> std::convertible_to<Index>;
    { ct.get(Index()) } -> std::convertible_to<U64>;
    { ct.getUnchecked(Index()) } -> std::convertible_to<U64>;
};

/// A bitvector that answers rank queries for positions in [0, size()] and select queries for ranks in
/// [0, numOnes()) and [0, numZeros()).
template<typename T>
concept RankSelect = requires(const T& ct) {
    { ct.size() } -> std::convertible_to<Index>;
    { ct.numOnes() } -> std::convertible_to<Index>;
    { ct.numZeros() } -> std::convertible_to<Index>;
    { ct.getBit(Index()) } -> std::convertible_to<bool>;
    { ct.rankOne(Index()) } -> std::convertible_to<Index>;
    { ct.rankZero(Index()) } -> std::convertible_to<Index>;
    { ct.selectOne(Index()) } -> std::convertible_to<Index>;
    { ct.selectZero(Index()) } -> std::convertible_to<Index>;
};

/// An immutable sequence of integers that can be accessed by index and searched by value. For sequences with
/// duplicates, indexOf returns the index of the first occurrence.
template<typename T>
concept IndexedDict = requires(const T& ct) {
    { ct.size() } -> std::convertible_to<Index>;
    { ct.get(Index()) } -> std::convertible_to<U64>;
    { ct.indexOf(U64()) } -> std::same_as<std::optional<Index>>;
    { ct.contains(U64()) } -> std::convertible_to<bool>;
};

/// A sorted IndexedDict that also answers successor and predecessor queries, returning the index and the value.
template<typename T>
concept SuccessorDict = IndexedDict<T> && requires(const T& ct) {
    { ct.rank(U64()) } -> std::convertible_to<Index>;
    { ct.successor(U64()) } -> std::same_as<std::pair<Index, U64>>;
    { ct.predecessor(U64()) } -> std::same_as<std::pair<Index, U64>>;
};

#define SDS_INDEXED_DICT_CONCEPT IndexedDict
#define SDS_SUCCESSOR_DICT_CONCEPT SuccessorDict

#else // SDS_HAS_CPP20

#define SDS_INDEXED_DICT_CONCEPT class
#define SDS_SUCCESSOR_DICT_CONCEPT class

#endif // SDS_HAS_CPP20

} // namespace sds

#endif // SDS_CONCEPTS_HPP
