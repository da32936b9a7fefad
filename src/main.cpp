#include "../include/elias_fano.hpp"
#include "../include/mapped_file.hpp"
#include "../include/serialization.hpp"
#include <chrono>
#include <fstream>
#include <iostream>
#include <optional>

using namespace sds;

struct PredecessorInput {
    std::vector<U64> sequence;
    std::vector<U64> queries;
};

[[nodiscard]] static std::ifstream openInput(const std::string& filename) {
    std::ifstream file(filename);
    if (!file) {
        throw std::runtime_error("can't open input file '" + filename + "'");
    }
    return file;
}

[[nodiscard]] static std::vector<U64> readQueries(std::istream& is) {
    std::vector<U64> queries;
    U64 query;
    while (is >> query) {
        queries.push_back(query);
    }
    return queries;
}

/// \brief Reads `n`, followed by `n` sorted values, followed by an arbitrary number of queries.
[[nodiscard]] static PredecessorInput readPredecessorInput(const std::string& filename) {
    PredecessorInput result;
    std::ifstream file = openInput(filename);
    Index n = -1;
    if (!(file >> n) || n < 0) {
        throw std::runtime_error("'" + filename + "' doesn't start with the number of values");
    }
    result.sequence.resize(n);
    for (Index i = 0; i < n; ++i) {
        if (!(file >> result.sequence[i])) {
            throw std::runtime_error("'" + filename + "' contains fewer than " + std::to_string(n) + " values");
        }
    }
    result.queries = readQueries(file);
    return result;
}

static void writeAnswers(const std::string& filename, Span<const std::optional<U64>> answers) {
    std::ofstream file(filename);
    for (const auto& answer : answers) {
        if (answer) {
            file << *answer << '\n';
        } else {
            file << "-\n";
        }
    }
    if (!file) {
        throw std::runtime_error("failed to write output file '" + filename + "'");
    }
}

/// \brief Answers the queries with a range-based search that doesn't throw for missing elements.
template<typename Dict, typename Search>
[[nodiscard]] static std::vector<std::optional<U64>> answerQueries(
        const Dict& dict, Span<const U64> queries, Search search) {
    std::vector<std::optional<U64>> answers(queries.size());
    for (Index i = 0; i < queries.size(); ++i) {
        answers[i] = search(dict, queries[i]);
    }
    return answers;
}

template<typename Dict>
[[nodiscard]] static std::optional<U64> predecessorOrNone(const Dict& dict, U64 query) {
    const Index i = query == ~U64(0) ? dict.size() : dict.rank(query + 1);
    if (i == 0) {
        return std::nullopt;
    }
    return dict.getUnchecked(i - 1);
}

template<typename Dict>
[[nodiscard]] static std::optional<U64> successorOrNone(const Dict& dict, U64 query) {
    const Index i = dict.rank(query);
    if (i == dict.size()) {
        return std::nullopt;
    }
    return dict.getUnchecked(i);
}

struct Measurement {
    Index timeInMs = 0;
    Index spaceInBits = 0;
};

/// \brief Builds the Elias-Fano sequence from `input.sequence` and uses it to answer predecessor queries.
/// The time includes construction, the space is the heap memory of the sequence.
static Measurement predecessorMode(const std::string& inputFile, const std::string& outputFile) {
    const PredecessorInput input = readPredecessorInput(inputFile);
    const auto before = std::chrono::steady_clock::now();
    const EliasFano<> ef(input.sequence);
    auto answers = answerQueries(ef, input.queries, predecessorOrNone<EliasFano<>>);
    const auto after = std::chrono::steady_clock::now();
    writeAnswers(outputFile, answers);
    std::cout << "n=" << ef.size() << " universe=" << ef.universe() << " low bits=" << ef.numLowBits()
              << " high bits=" << ef.numHighBits() << std::endl;
    return {std::chrono::duration_cast<std::chrono::milliseconds>(after - before).count(), ef.numAllocatedBits()};
}

/// \brief Builds the sequence in parallel and writes its serialized form.
static Measurement buildMode(const std::string& inputFile, const std::string& efFile, int numThreads) {
    std::ifstream file = openInput(inputFile);
    const std::vector<U64> values = readQueries(file);
    const U64 universe = values.empty() ? 0 : values.back() + 1;
    if (!values.empty() && universe == 0) {
        throw RangeError("the value 2^64-1 can't be stored because the universe is exclusive");
    }
    const auto before = std::chrono::steady_clock::now();
    const auto ef = EliasFano<>::build(values, universe, {BuildStrategy::Parallel, numThreads});
    const auto after = std::chrono::steady_clock::now();
    std::ofstream out(efFile, std::ios::binary);
    if (!out) {
        throw std::runtime_error("can't open output file '" + efFile + "'");
    }
    serialize(ef, out);
    std::cout << "wrote " << serializedSizeInBytes(ef) << " bytes for " << ef.size() << " values" << std::endl;
    return {std::chrono::duration_cast<std::chrono::milliseconds>(after - before).count(), ef.numAllocatedBits()};
}

/// \brief Maps a serialized sequence and answers successor queries on the mapped memory.
static Measurement queryMode(const std::string& efFile, const std::string& queryFile, const std::string& outputFile) {
    const MappedFile mapping(efFile);
    const auto ef = viewSerialized(mapping.bytes());
    std::ifstream file = openInput(queryFile);
    const std::vector<U64> queries = readQueries(file);
    const auto before = std::chrono::steady_clock::now();
    auto answers = answerQueries(ef, queries, successorOrNone<EliasFano<Borrowed>>);
    const auto after = std::chrono::steady_clock::now();
    writeAnswers(outputFile, answers);
    return {std::chrono::duration_cast<std::chrono::milliseconds>(after - before).count(), ef.numAllocatedBits()};
}


static void printUsage() {
    std::cerr << "Usage: `<program> pd <input_file> <output_file>`\n"
                 "       `<program> build <input_file> <ef_file> [num_threads]`\n"
                 "       `<program> query <ef_file> <query_file> <output_file>`"
              << std::endl;
}

int main(int argc, char** argv) {
    if (argc < 2) {
        printUsage();
        return 1;
    }
    const std::string mode = argv[1];
    try {
        Measurement result;
        if (mode == "pd" && argc == 4) {
            result = predecessorMode(argv[2], argv[3]);
        } else if (mode == "build" && (argc == 4 || argc == 5)) {
            result = buildMode(argv[2], argv[3], argc == 5 ? std::stoi(argv[4]) : 0);
        } else if (mode == "query" && argc == 5) {
            result = queryMode(argv[2], argv[3], argv[4]);
        } else {
            printUsage();
            return 2;
        }
        std::cout << "RESULT algo=" << mode << " name=sds time=" << result.timeInMs << " space=" << result.spaceInBits
                  << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << std::endl;
        return 3;
    }
    return 0;
}
