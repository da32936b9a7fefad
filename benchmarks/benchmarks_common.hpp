#ifndef SDS_BENCHMARKS_COMMON_HPP
#define SDS_BENCHMARKS_COMMON_HPP

#include "../include/common.hpp"
#include "benchmark/benchmark.h"
#include <algorithm>
#include <limits>
#include <random>
#include <unordered_map>
#include <vector>

namespace bm = benchmark;

namespace sds {


constexpr Index maxNumValues = Index(1) << 25;

template<typename T = U64>
static std::vector<T> randomArray(Index size, T maxVal = std::numeric_limits<T>::max(), T minVal = 0) {
    std::vector<T> vec(size);
    std::uniform_int_distribution<T> dist(minVal, maxVal);
    std::random_device rd;
    std::mt19937_64 engine(rd());
    for (auto& v : vec) {
        v = dist(engine);
    }
    return vec;
}

static std::unordered_map<Index, std::vector<U64>> vecs;

// Computing fresh random numbers for each benchmark invocation can take a long time, so only do the work once (per
// file). Usually, only benchmarks from one file are run, so the fact everything is `static` shouldn't matter.
static Span<const U64> getRandomNumbers(Index size) {
    auto it = vecs.find(size);
    if (it == vecs.end()) {
        it = vecs.try_emplace(size, randomArray(size)).first;
    }
    return it->second;
}

/// Random queries for a benchmark, one per iteration.
[[nodiscard]] static Span<const U64> getRandomQueries(const bm::State& state) {
    return getRandomNumbers(Index(state.max_iterations));
}

static void divideByNInPlot(bm::State& state) {
    state.counters["perN"] += 1;
}

static void subtractNFromBitCount(bm::State& state) {
    state.counters["perN"] += 2;
}

static void setNumBits(bm::State& state, Index numBits) {
    state.counters["bits"] = double(numBits);
}

static void setGroup(bm::State& state, double groupIdx) {
    state.counters["group"] = groupIdx;
}


} // namespace sds

#endif // SDS_BENCHMARKS_COMMON_HPP
