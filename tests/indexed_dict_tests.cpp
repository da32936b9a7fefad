#include "../include/elias_fano.hpp"
#include "../include/indexed_dict.hpp"
#include "gtest/gtest.h"
#include <random>
#include <thread>

using namespace sds;

#ifdef SDS_HAS_CPP20
static_assert(SuccessorDict<SortedArrayDict>);
static_assert(IndexedDict<EliasFano<Owned, RankSelectLayout<1, 4, 8>>>);
static_assert(!IndexedDict<CompactArray<>>);
static_assert(!SuccessorDict<RankSelectBitvec<>>);
#endif

namespace {

std::vector<U64> randomSortedValues(Index size, U64 universe) {
    auto engine = createRandomEngine();
    std::uniform_int_distribution<U64> dist(0, universe - 1);
    std::vector<U64> values(size);
    for (auto& value : values) {
        value = dist(engine);
    }
    std::sort(values.begin(), values.end());
    return values;
}

void testSameAnswers(const AnySuccessorDict& expected, const AnySuccessorDict& actual, U64 universe) {
    ASSERT_EQ(expected.size(), actual.size());
    ASSERT_EQ(expected.empty(), actual.empty());
    for (Index i = 0; i < expected.size(); ++i) {
        ASSERT_EQ(expected.get(i), actual.get(i)) << i;
    }
    ASSERT_THROW((void)actual.get(actual.size()), IndexError);
    auto engine = createRandomEngine();
    std::uniform_int_distribution<U64> dist(0, universe);
    for (int i = 0; i < 2000; ++i) {
        const U64 x = i < expected.size() ? expected.get(i) : dist(engine);
        ASSERT_EQ(expected.rank(x), actual.rank(x)) << x;
        ASSERT_EQ(expected.indexOf(x), actual.indexOf(x)) << x;
        ASSERT_EQ(expected.contains(x), actual.contains(x)) << x;
        if (expected.rank(x) < expected.size()) {
            ASSERT_EQ(expected.successor(x), actual.successor(x)) << x;
        } else {
            ASSERT_THROW((void)actual.successor(x), NotFoundError) << x;
        }
        if (x >= expected.get(0)) {
            ASSERT_EQ(expected.predecessor(x), actual.predecessor(x)) << x;
        } else {
            ASSERT_THROW((void)actual.predecessor(x), NotFoundError) << x;
        }
    }
}

} // namespace

TEST(SortedArrayDict, Queries) {
    const std::vector<U64> values{2, 3, 3, 8, 100};
    SortedArrayDict dict(values);
    ASSERT_EQ(dict.size(), 5);
    ASSERT_EQ(dict.get(3), 8);
    ASSERT_EQ(dict.rank(3), 1);
    ASSERT_EQ(dict.rank(101), 5);
    ASSERT_EQ(dict.indexOf(3), std::optional<Index>(1));
    ASSERT_FALSE(dict.indexOf(4).has_value());
    ASSERT_EQ(dict.successor(4), std::make_pair(Index(3), U64(8)));
    ASSERT_EQ(dict.predecessor(3), std::make_pair(Index(2), U64(3)));
    ASSERT_THROW((void)dict.successor(101), NotFoundError);
    ASSERT_THROW((void)dict.predecessor(1), NotFoundError);
    ASSERT_THROW((void)dict.get(5), IndexError);
}

TEST(SortedArrayDict, RejectsUnsortedValues) {
    const std::vector<U64> values{2, 3, 1};
    ASSERT_THROW((void)SortedArrayDict{Span<const U64>(values)}, MonotonicityError);
    ASSERT_TRUE(SortedArrayDict().empty());
}

TEST(AnyIndexedDict, EliasFanoMatchesSortedArray) {
    for (U64 universe : {U64(50), U64(1) << 24, U64(1) << 60}) {
        const auto values = randomSortedValues(5000, universe);
        auto reference = makeSuccessorDict(std::make_shared<const SortedArrayDict>(Span<const U64>(values)));
        auto ef = makeSuccessorDict(std::make_shared<const EliasFano<>>(EliasFano<>(values, universe)));
        testSameAnswers(*reference, *ef, universe);
    }
}

TEST(AnyIndexedDict, HeterogeneousCollection) {
    const auto values = randomSortedValues(1000, 1 << 20);
    std::vector<std::shared_ptr<const AnyIndexedDict>> dicts;
    dicts.push_back(makeIndexedDict(std::make_shared<const SortedArrayDict>(Span<const U64>(values))));
    dicts.push_back(makeIndexedDict(std::make_shared<const EliasFano<>>(EliasFano<>(values, 1 << 20))));
    using SmallBlocks = EliasFano<Owned, RankSelectLayout<1, 4, 8>>;
    dicts.push_back(makeIndexedDict(std::make_shared<const SmallBlocks>(SmallBlocks(values, 1 << 20))));
    for (const auto& dict : dicts) {
        ASSERT_EQ(dict->size(), 1000);
        for (Index i = 0; i < dict->size(); ++i) {
            ASSERT_EQ(dict->get(i), values[i]);
            ASSERT_TRUE(dict->contains(values[i]));
            ASSERT_EQ(dict->get(*dict->indexOf(values[i])), values[i]);
        }
    }
}

TEST(AnyIndexedDict, AdapterSharesOwnership) {
    auto ef = std::make_shared<const EliasFano<>>(EliasFano<>{1, 5, 9});
    auto dict = makeSuccessorDict(ef);
    const auto* adapter = dynamic_cast<const SuccessorDictAdapter<EliasFano<>>*>(dict.get());
    ASSERT_NE(adapter, nullptr);
    ASSERT_EQ(&adapter->underlying(), ef.get());
    ASSERT_EQ(ef.use_count(), 2);
    ef.reset();
    ASSERT_EQ(dict->size(), 3);
    ASSERT_EQ(dict->successor(6), std::make_pair(Index(2), U64(9)));
    ASSERT_THROW((void)makeIndexedDict(std::shared_ptr<const EliasFano<>>()), std::invalid_argument);
}

TEST(AnyIndexedDict, ConcurrentQueriesThroughInterface) {
    const auto values = randomSortedValues(100'000, U64(1) << 40);
    const std::shared_ptr<const AnySuccessorDict> dict
            = makeSuccessorDict(std::make_shared<const EliasFano<>>(EliasFano<>(values, U64(1) << 40)));
    std::vector<int> failures(4, 0);
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&, t] {
            for (Index i = t; i < Index(values.size()); i += 4) {
                if (dict->predecessor(values[i]).second != values[i]) {
                    ++failures[t];
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    ASSERT_EQ(std::count(failures.begin(), failures.end(), 0), 4);
}
