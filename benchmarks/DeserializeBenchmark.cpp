#include "BenchmarkConfig.hpp"

#include <seqmap/OrderedMap.hpp>
#include <seqmap/serialization/MapSerializer.hpp>
#include <seqmap/strategies/IntegerKeyStrategy.hpp>
#include <seqmap/wire/BinaryMapFormat.hpp>
#include <seqmap/wire/PairSequence.hpp>

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>

/**
 * @brief Бенчмарк десериализации
 *
 * Измеряем:
 * - Чтение бинарного формата в OrderedMap и в std::unordered_map
 * - Цену стратегии ключей (строка -> число)
 * - Поиск по маленьким мапам: линейный проход против хэша
 */

// ==================== Утилиты ====================

template<typename Func>
double measureMs(Func&& func) {
    auto start = std::chrono::high_resolution_clock::now();
    func();
    auto end = std::chrono::high_resolution_clock::now();

    std::chrono::duration<double, std::milli> duration = end - start;
    return duration.count();
}

void printResult(const std::string& name, double timeMs, size_t operations) {
    double opsPerSec = (operations / timeMs) * 1000.0;
    std::cout << std::left << std::setw(45) << name
              << std::right << std::setw(10) << std::fixed << std::setprecision(2)
              << timeMs << " ms"
              << std::setw(15) << std::fixed << std::setprecision(0)
              << opsPerSec << " entries/sec\n";
}

std::string makeKey(size_t i, size_t length) {
    std::string key = "key_" + std::to_string(i);
    if (key.size() < length) {
        key.append(length - key.size(), '_');
    }
    return key;
}

std::vector<uint8_t> makeBinaryInput(const BenchmarkConfig& config) {
    OrderedMap<std::string, int64_t> map = OrderedMap<std::string, int64_t>::withCapacity(config.map_size);
    for (size_t i = 0; i < config.map_size; ++i) {
        map.insert(makeKey(i, config.key_length), static_cast<int64_t>(i));
    }

    std::vector<uint8_t> data;
    BinaryMapWriter<std::string, int64_t> writer(data);
    serializeMap(map, writer);
    return data;
}

// ==================== Бенчмарки ====================

void benchmarkBinaryIntoOrderedMap(const BenchmarkConfig& config) {
    auto data = makeBinaryInput(config);
    size_t checksum = 0;

    double timeMs = measureMs([&]() {
        for (size_t r = 0; r < config.repetitions; ++r) {
            BinaryMapReader<std::string, int64_t> reader(data);
            auto map = deserializeMap(reader);
            checksum += map.size();
        }
    });

    printResult("Binary -> OrderedMap (n=" + std::to_string(config.map_size) + ")",
                timeMs, config.totalEntries());
    if (checksum != config.totalEntries()) {
        std::cerr << "checksum mismatch\n";
    }
}

void benchmarkBinaryIntoUnorderedMap(const BenchmarkConfig& config) {
    auto data = makeBinaryInput(config);
    size_t checksum = 0;

    double timeMs = measureMs([&]() {
        for (size_t r = 0; r < config.repetitions; ++r) {
            BinaryMapReader<std::string, int64_t> reader(data);
            std::unordered_map<std::string, int64_t> map;
            map.reserve(reader.beginMap().value_or(0));

            std::string key;
            int64_t value = 0;
            while (reader.nextEntry(key, value)) {
                map.insert_or_assign(std::move(key), value);
            }
            checksum += map.size();
        }
    });

    printResult("Binary -> unordered_map (n=" + std::to_string(config.map_size) + ")",
                timeMs, config.totalEntries());
    if (checksum != config.totalEntries()) {
        std::cerr << "checksum mismatch\n";
    }
}

void benchmarkIntegerKeyStrategy(const BenchmarkConfig& config) {
    std::vector<std::pair<std::string, int64_t>> tokens;
    tokens.reserve(config.map_size);
    for (size_t i = 0; i < config.map_size; ++i) {
        tokens.emplace_back(std::to_string(i * 7919), static_cast<int64_t>(i));
    }

    IntegerKeyStrategy<int64_t> strategy;
    MapSerializer<int64_t, int64_t, std::string> serializer;
    size_t checksum = 0;

    double timeMs = measureMs([&]() {
        for (size_t r = 0; r < config.repetitions; ++r) {
            PairSequenceReader<std::string, int64_t> reader(tokens);
            auto map = serializer.deserialize(reader, strategy);
            checksum += map.size();
        }
    });

    printResult("Tokens + IntegerKeyStrategy (n=" + std::to_string(config.map_size) + ")",
                timeMs, config.totalEntries());
    if (checksum != config.totalEntries()) {
        std::cerr << "checksum mismatch\n";
    }
}

void benchmarkSmallLookup(const BenchmarkConfig& config) {
    std::mt19937 rng(config.random_seed);
    std::uniform_int_distribution<size_t> dist(0, config.map_size - 1);

    OrderedMap<std::string, int> ordered;
    std::unordered_map<std::string, int> hash;
    std::vector<std::string> keys;
    for (size_t i = 0; i < config.map_size; ++i) {
        keys.push_back(makeKey(i, config.key_length));
        ordered.insert(keys.back(), static_cast<int>(i));
        hash.emplace(keys.back(), static_cast<int>(i));
    }

    std::vector<size_t> probes(config.repetitions);
    std::generate(probes.begin(), probes.end(), [&]() { return dist(rng); });

    long long sum = 0;
    double orderedMs = measureMs([&]() {
        for (size_t probe : probes) {
            sum += *ordered.find(keys[probe]);
        }
    });
    double hashMs = measureMs([&]() {
        for (size_t probe : probes) {
            sum += hash.find(keys[probe])->second;
        }
    });

    printResult("Lookup OrderedMap (n=" + std::to_string(config.map_size) + ")",
                orderedMs, probes.size());
    printResult("Lookup unordered_map (n=" + std::to_string(config.map_size) + ")",
                hashMs, probes.size());
    if (sum < 0) {
        std::cerr << "unexpected sum\n";
    }
}

int main() {
    BenchmarkConfig standard;
    standard.setStandard();

    BenchmarkConfig small;
    small.setSmallObjects();

    std::cout << "=== Deserialize Benchmark ===\n\n";

    std::cout << "--- Large maps ---\n";
    benchmarkBinaryIntoOrderedMap(standard);
    benchmarkBinaryIntoUnorderedMap(standard);
    benchmarkIntegerKeyStrategy(standard);

    std::cout << "\n--- Small objects ---\n";
    benchmarkBinaryIntoOrderedMap(small);
    benchmarkBinaryIntoUnorderedMap(small);
    benchmarkSmallLookup(small);

    std::cout << "\n=== Benchmark complete ===\n";

    return 0;
}
