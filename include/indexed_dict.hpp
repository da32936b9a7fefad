#ifndef SDS_INDEXED_DICT_HPP
#define SDS_INDEXED_DICT_HPP

#include "concepts.hpp"
#include "errors.hpp"
#include <algorithm>
#include <memory>
#include <string>

namespace sds {

/// \brief Runtime interface for immutable indexed dictionaries, for code that doesn't want to be a template over the
/// concrete structure. All functions are const and can be called concurrently.
class AnyIndexedDict {
public:
    virtual ~AnyIndexedDict() = default;

    [[nodiscard]] virtual Index size() const noexcept = 0;
    [[nodiscard]] virtual U64 get(Index i) const = 0;
    [[nodiscard]] virtual std::optional<Index> indexOf(U64 value) const = 0;
    [[nodiscard]] virtual bool contains(U64 value) const = 0;

    [[nodiscard]] bool empty() const noexcept { return size() == 0; }
};

/// \brief Runtime interface for sorted dictionaries. successor and predecessor throw NotFoundError if there is no
/// such element.
class AnySuccessorDict : public AnyIndexedDict {
public:
    [[nodiscard]] virtual Index rank(U64 value) const = 0;
    [[nodiscard]] virtual std::pair<Index, U64> successor(U64 value) const = 0;
    [[nodiscard]] virtual std::pair<Index, U64> predecessor(U64 value) const = 0;
};


namespace detail {

template<typename Dict, typename Base>
class DictAdapterBase : public Base {
protected:
    std::shared_ptr<const Dict> dict;

public:
    explicit DictAdapterBase(std::shared_ptr<const Dict> d) : dict(std::move(d)) {
        if (!dict) [[unlikely]] {
            throw std::invalid_argument("can't adapt a null dictionary");
        }
    }

    [[nodiscard]] Index size() const noexcept override { return dict->size(); }
    [[nodiscard]] U64 get(Index i) const override { return dict->get(i); }
    [[nodiscard]] std::optional<Index> indexOf(U64 value) const override { return dict->indexOf(value); }
    [[nodiscard]] bool contains(U64 value) const override { return dict->contains(value); }

    [[nodiscard]] const Dict& underlying() const noexcept { return *dict; }
    [[nodiscard]] const std::shared_ptr<const Dict>& shared() const noexcept { return dict; }
};

} // namespace detail

/// \brief Exposes any IndexedDict through AnyIndexedDict. Holds a shared pointer so that an immutable structure can
/// be used by several adapters and threads at once.
template<SDS_INDEXED_DICT_CONCEPT Dict>
class IndexedDictAdapter final : public detail::DictAdapterBase<Dict, AnyIndexedDict> {
public:
    using detail::DictAdapterBase<Dict, AnyIndexedDict>::DictAdapterBase;
};

template<SDS_SUCCESSOR_DICT_CONCEPT Dict>
class SuccessorDictAdapter final : public detail::DictAdapterBase<Dict, AnySuccessorDict> {
public:
    using detail::DictAdapterBase<Dict, AnySuccessorDict>::DictAdapterBase;

    [[nodiscard]] Index rank(U64 value) const override { return this->dict->rank(value); }
    [[nodiscard]] std::pair<Index, U64> successor(U64 value) const override { return this->dict->successor(value); }
    [[nodiscard]] std::pair<Index, U64> predecessor(U64 value) const override {
        return this->dict->predecessor(value);
    }
};

template<SDS_INDEXED_DICT_CONCEPT Dict>
[[nodiscard]] std::shared_ptr<const AnyIndexedDict> makeIndexedDict(std::shared_ptr<const Dict> dict) {
    return std::make_shared<IndexedDictAdapter<Dict>>(std::move(dict));
}

template<SDS_SUCCESSOR_DICT_CONCEPT Dict>
[[nodiscard]] std::shared_ptr<const AnySuccessorDict> makeSuccessorDict(std::shared_ptr<const Dict> dict) {
    return std::make_shared<SuccessorDictAdapter<Dict>>(std::move(dict));
}


/// \brief The trivial sorted dictionary: a borrowed, non-decreasing array of plain 64 bit values searched with
/// std::lower_bound. The array must outlive the dictionary.
class [[nodiscard]] SortedArrayDict {
    Span<const U64> values_;

public:
    using value_type = U64;

    SortedArrayDict() noexcept = default;

    /// \throw MonotonicityError if the values aren't sorted
    explicit SortedArrayDict(Span<const U64> values) : values_(values) {
        const auto* it = std::is_sorted_until(values.begin(), values.end());
        if (it != values.end()) [[unlikely]] {
            throw MonotonicityError("value " + std::to_string(*it) + " at index "
                                    + std::to_string(it - values.begin()) + " is less than the previous value");
        }
    }

    [[nodiscard]] constexpr Index size() const noexcept { return values_.size(); }
    [[nodiscard]] constexpr bool empty() const noexcept { return values_.empty(); }
    [[nodiscard]] constexpr Span<const U64> values() const noexcept { return values_; }

    [[nodiscard]] U64 getUnchecked(Index i) const noexcept { return values_[i]; }

    [[nodiscard]] U64 get(Index i) const {
        if (i < 0 || i >= size()) [[unlikely]] {
            detail::throwIndexError("SortedArrayDict::get", i, size());
        }
        return values_[i];
    }

    [[nodiscard]] Index rank(U64 value) const noexcept {
        return std::lower_bound(values_.begin(), values_.end(), value) - values_.begin();
    }

    [[nodiscard]] std::optional<Index> indexOf(U64 value) const noexcept {
        const Index i = rank(value);
        if (i < size() && values_[i] == value) {
            return i;
        }
        return std::nullopt;
    }

    [[nodiscard]] bool contains(U64 value) const noexcept { return indexOf(value).has_value(); }

    [[nodiscard]] std::pair<Index, U64> successor(U64 value) const {
        const Index i = rank(value);
        if (i == size()) [[unlikely]] {
            throw NotFoundError("no successor found for " + std::to_string(value));
        }
        return {i, values_[i]};
    }

    [[nodiscard]] std::pair<Index, U64> predecessor(U64 value) const {
        const Index i = std::upper_bound(values_.begin(), values_.end(), value) - values_.begin();
        if (i == 0) [[unlikely]] {
            throw NotFoundError("no predecessor found for " + std::to_string(value));
        }
        return {i - 1, values_[i - 1]};
    }
};

} // namespace sds

#endif // SDS_INDEXED_DICT_HPP
