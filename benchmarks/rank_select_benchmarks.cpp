#include "../include/rank_select.hpp"
#include "benchmarks_common.hpp"


using namespace sds;

using Bitvector = RankSelectBitvec<>;
using DenseSamplesBitvector = RankSelectBitvec<Owned, RankSelectLayout<4, 1024, 256>>;
using UnsampledBitvector = RankSelectBitvec<Owned, RankSelectLayout<8, 1024, 0>>;

constexpr Index maxNumBits = maxNumValues * 64;

// Only used internally, so a macro is fine here.
// Also, the fact that random numbers aren't perfectly uniformly distributed doesn't matter
#define SDS_GET_RANDVAL(maxVal) Index(randomQueries[i++] % U64(maxVal))


template<typename Bv = Bitvector>
[[nodiscard]] static Bv randomBitvector(Index numBits) {
    return Bv(BitStorage<Owned>::fromRawParts(getRandomNumbers(numBits / 64), numBits));
}

template<typename Bv = Bitvector>
[[nodiscard]] static Bv alternatingBitvector(Index numBits) {
    BitStorage<Owned> bits(numBits);
    for (Index i = 1; i < numBits; i += 2) {
        bits.setBitUnchecked(i);
    }
    return Bv(std::move(bits));
}

static void BM_RankSelectConstruction(bm::State& state) {
    Span<const U64> limbs = getRandomNumbers(state.range() / 64);
    for (auto _ : state) {
        Bitvector bv(BitStorage<Owned>::fromRawParts(limbs, state.range()));
        bm::DoNotOptimize(bv);
        bm::ClobberMemory();
    }
    setNumBits(state, randomBitvector(state.range()).numAllocatedBits());
    state.SetComplexityN(state.range());
    divideByNInPlot(state);
    subtractNFromBitCount(state);
    setGroup(state, 1);
}

static void BM_RankSelectAlternatingRankRandom(bm::State& state) {
    Span<const U64> randomQueries = getRandomQueries(state);
    Bitvector bv = alternatingBitvector(state.range());
    Index i = 0;
    for (auto _ : state) {
        Index val = bv.rankZeroUnchecked(SDS_GET_RANDVAL(state.range()));
        bm::DoNotOptimize(val);
    }
    setNumBits(state, bv.numAllocatedBits());
    state.SetComplexityN(state.range());
    subtractNFromBitCount(state);
    setGroup(state, 2.1);
}

static void BM_RankSelectRandomRank(bm::State& state) {
    Span<const U64> randomQueries = getRandomQueries(state);
    Bitvector bv = randomBitvector(state.range());
    Index i = 0;
    for (auto _ : state) {
        Index val = bv.rankOneUnchecked(SDS_GET_RANDVAL(state.range()));
        bm::DoNotOptimize(val);
    }
    setNumBits(state, bv.numAllocatedBits());
    state.SetComplexityN(state.range());
    subtractNFromBitCount(state);
    setGroup(state, 2.1);
}


// ** Select **

template<typename Bv>
static void selectOneRandom(bm::State& state) {
    Span<const U64> randomQueries = getRandomQueries(state);
    Bv bv = randomBitvector<Bv>(state.range());
    const Index maxRank = bv.numOnes();
    Index i = 0;
    for (auto _ : state) {
        Index val = bv.selectOneUnchecked(SDS_GET_RANDVAL(maxRank));
        bm::DoNotOptimize(val);
    }
    setNumBits(state, bv.numAllocatedBits());
    state.SetComplexityN(state.range());
    subtractNFromBitCount(state);
    setGroup(state, 2.2);
}

static void BM_RankSelectRandomSelectOne(bm::State& state) {
    selectOneRandom<Bitvector>(state);
}

static void BM_RankSelectRandomSelectOneDenseSamples(bm::State& state) {
    selectOneRandom<DenseSamplesBitvector>(state);
}

static void BM_RankSelectRandomSelectOneUnsampled(bm::State& state) {
    selectOneRandom<UnsampledBitvector>(state);
}

static void BM_RankSelectAlternatingSelectZeroRandom(bm::State& state) {
    Span<const U64> randomQueries = getRandomQueries(state);
    Bitvector bv = alternatingBitvector(state.range());
    const Index maxRank = bv.numZeros();
    Index i = 0;
    for (auto _ : state) {
        Index val = bv.selectZeroUnchecked(SDS_GET_RANDVAL(maxRank));
        bm::DoNotOptimize(val);
    }
    setNumBits(state, bv.numAllocatedBits());
    state.SetComplexityN(state.range());
    subtractNFromBitCount(state);
    setGroup(state, 2.2);
}

static void BM_RankSelectOnesThenZerosSelectFirstZero(bm::State& state) {
    BitStorage<Owned> bits(state.range());
    for (Index i = 0; i < state.range() / 2; ++i) {
        bits.setBitUnchecked(i);
    }
    Bitvector bv(std::move(bits));
    for (auto _ : state) {
        Index i = bv.selectZeroUnchecked(0);
        bm::DoNotOptimize(i);
    }
    setNumBits(state, bv.numAllocatedBits());
    state.SetComplexityN(state.range());
    subtractNFromBitCount(state);
    setGroup(state, 2.2);
}


BENCHMARK(BM_RankSelectConstruction)->RangeMultiplier(8)->Range(64, maxNumBits)->Complexity(bm::oN);
BENCHMARK(BM_RankSelectAlternatingRankRandom)->RangeMultiplier(8)->Range(64, maxNumBits)->Complexity(bm::o1);
BENCHMARK(BM_RankSelectRandomRank)->RangeMultiplier(8)->Range(64, maxNumBits)->Complexity(bm::o1);
BENCHMARK(BM_RankSelectRandomSelectOne)->RangeMultiplier(8)->Range(64, maxNumBits)->Complexity(bm::oLogN);
BENCHMARK(BM_RankSelectRandomSelectOneDenseSamples)->RangeMultiplier(8)->Range(64, maxNumBits)->Complexity(bm::oLogN);
BENCHMARK(BM_RankSelectRandomSelectOneUnsampled)->RangeMultiplier(8)->Range(64, maxNumBits)->Complexity(bm::oLogN);
BENCHMARK(BM_RankSelectAlternatingSelectZeroRandom)->RangeMultiplier(8)->Range(64, maxNumBits)->Complexity(bm::oLogN);
BENCHMARK(BM_RankSelectOnesThenZerosSelectFirstZero)->RangeMultiplier(8)->Range(64, maxNumBits)->Complexity(bm::oLogN);
