#include "../include/elias_fano.hpp"
#include "../include/serialization.hpp"
#include "benchmarks_common.hpp"

#include <numeric>
#include <sstream>
#include <unordered_map>

using namespace sds;

constexpr U64 maxValue = U64(1) << 62;

static std::vector<U64> createSortedRandomVector(Index size) {
    std::vector<U64> vec = randomArray<U64>(size, maxValue - 1);
    std::sort(vec.begin(), vec.end());
    return vec;
}

static std::unordered_map<Index, std::vector<U64>> efVecs;

static const std::vector<U64>& getEFNumbers(Index size) {
    auto it = efVecs.find(size);
    if (it == efVecs.end()) {
        it = efVecs.try_emplace(size, createSortedRandomVector(size)).first;
    }
    return it->second;
}

static EliasFano<> getEF(Index size) {
    return EliasFano<>(getEFNumbers(size), maxValue);
}


static void BM_EliasFanoCreation(bm::State& state) {
    const std::vector<U64>& numbers = getEFNumbers(state.range());
    for (auto _ : state) {
        auto ef = EliasFano<>::build(numbers, maxValue);
        bm::DoNotOptimize(ef);
        bm::ClobberMemory();
    }
    setNumBits(state, getEF(state.range()).numAllocatedBits());
    state.SetComplexityN(state.range());
    divideByNInPlot(state);
    setGroup(state, 10);
}

static void BM_EliasFanoParallelCreation(bm::State& state) {
    const std::vector<U64>& numbers = getEFNumbers(state.range());
    const BuildOptions options{BuildStrategy::Parallel, 0, Index(1) << 14};
    for (auto _ : state) {
        auto ef = EliasFano<>::build(numbers, maxValue, options);
        bm::DoNotOptimize(ef);
        bm::ClobberMemory();
    }
    setNumBits(state, getEF(state.range()).numAllocatedBits());
    state.SetComplexityN(state.range());
    divideByNInPlot(state);
    setGroup(state, 10);
}

static void BM_EliasFanoGetRandom(bm::State& state) {
    Span<const U64> randomQueries = getRandomQueries(state);
    EliasFano<> ef = getEF(state.range());
    Index i = 0;
    for (auto _ : state) {
        U64 res = ef.getUnchecked(Index(randomQueries[i++] % U64(ef.size())));
        bm::DoNotOptimize(res);
    }
    setNumBits(state, ef.numAllocatedBits());
    state.SetComplexityN(state.range());
    setGroup(state, 11);
}

static void BM_EliasFanoDecodeAll(bm::State& state) {
    EliasFano<> ef = getEF(state.range());
    for (auto _ : state) {
        auto values = ef.decodeAll();
        bm::DoNotOptimize(values);
        bm::ClobberMemory();
    }
    setNumBits(state, ef.numAllocatedBits());
    state.SetComplexityN(state.range());
    divideByNInPlot(state);
    setGroup(state, 11);
}

static void BM_EliasFanoSuccessorInArray(bm::State& state) {
    std::vector<U64> vec = getEFNumbers(state.range());
    EliasFano<> ef(vec, maxValue);
    std::mt19937_64 engine(std::random_device{}());
    std::shuffle(vec.begin(), vec.end(), engine);

    Index i = 0;
    for (auto _ : state) {
        auto res = ef.successor(vec[i++ % vec.size()]);
        bm::DoNotOptimize(res);
    }
    setNumBits(state, ef.numAllocatedBits());
    state.SetComplexityN(state.range());
    setGroup(state, 12);
}

static void BM_EliasFanoRankRandom(bm::State& state) {
    Span<const U64> randomQueries = getRandomQueries(state);
    EliasFano<> ef = getEF(state.range());

    Index i = 0;
    for (auto _ : state) {
        Index res = ef.rank(randomQueries[i++] % maxValue);
        bm::DoNotOptimize(res);
    }
    setNumBits(state, ef.numAllocatedBits());
    state.SetComplexityN(state.range());
    setGroup(state, 12);
}

static void BM_EliasFanoPredecessorAscending(bm::State& state) {
    const Index size = Index(state.max_iterations);
    std::vector<U64> arr(state.range());
    std::iota(arr.begin(), arr.end(), 42);
    std::vector<U64> predecessorQueries = randomArray<U64>(size, state.range() + 42, 42);
    EliasFano<> ef(arr);

    Index i = 0;
    for (auto _ : state) {
        auto res = ef.predecessor(predecessorQueries[i++]);
        bm::DoNotOptimize(res);
    }
    setNumBits(state, ef.numAllocatedBits());
    state.SetComplexityN(state.range());
    setGroup(state, 12);
}

// A dense cluster followed by one huge value, so that most buckets of the high bits are empty.
static void BM_EliasFanoSuccessorClusterThenLarge(bm::State& state) {
    Span<const U64> randomQueries = getRandomQueries(state);
    std::vector<U64> arr(state.range());
    std::iota(arr.begin(), arr.end(), 0);
    arr.push_back(maxValue - 1);
    EliasFano<> ef(arr, maxValue);

    Index i = 0;
    for (auto _ : state) {
        auto res = ef.successor(randomQueries[i++] % maxValue);
        bm::DoNotOptimize(res);
    }
    setNumBits(state, ef.numAllocatedBits());
    state.SetComplexityN(state.range());
    setGroup(state, 12);
}

static void BM_EliasFanoViewSerialized(bm::State& state) {
    std::ostringstream os(std::ios::binary);
    serialize(getEF(state.range()), os);
    const std::string str = os.str();
    OwnedArray<U64> words(Index(str.size()) / 8);
    std::copy(str.begin(), str.end(), reinterpret_cast<char*>(words.data()));
    const Span<const Byte> bytes(reinterpret_cast<const Byte*>(words.data()), Index(str.size()));
    for (auto _ : state) {
        auto view = viewSerialized(bytes);
        bm::DoNotOptimize(view);
    }
    state.SetComplexityN(state.range());
    setGroup(state, 13);
}


BENCHMARK(BM_EliasFanoCreation)->RangeMultiplier(5)->Range(5, maxNumValues)->Complexity(bm::oN);
BENCHMARK(BM_EliasFanoParallelCreation)->RangeMultiplier(5)->Range(5, maxNumValues)->Complexity(bm::oN);
BENCHMARK(BM_EliasFanoGetRandom)->RangeMultiplier(5)->Range(5, maxNumValues)->Complexity(bm::o1);
BENCHMARK(BM_EliasFanoDecodeAll)->RangeMultiplier(5)->Range(5, maxNumValues)->Complexity(bm::oN);
BENCHMARK(BM_EliasFanoSuccessorInArray)->RangeMultiplier(5)->Range(5, maxNumValues)->Complexity(bm::oLogN);
BENCHMARK(BM_EliasFanoRankRandom)->RangeMultiplier(5)->Range(5, maxNumValues)->Complexity(bm::oLogN);
BENCHMARK(BM_EliasFanoPredecessorAscending)->RangeMultiplier(5)->Range(5, maxNumValues)->Complexity(bm::o1);
BENCHMARK(BM_EliasFanoSuccessorClusterThenLarge)->RangeMultiplier(5)->Range(5, maxNumValues)->Complexity(bm::oLogN);
BENCHMARK(BM_EliasFanoViewSerialized)->RangeMultiplier(5)->Range(5, maxNumValues)->Complexity(bm::o1);
