/*
 * Copyright (c) 2025-2026 Tobias Weber <weber.tobias.md@gmail.com>
 *
 * This file is part of the CSVIO library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

/**
 * @file bench_reader_writer.cpp
 * @brief Throughput benchmarks for csvio::Reader and csvio::Writer.
 *
 * The data set is generated in memory: a header row plus N rows of an
 * HTTP access log (timestamp, host, method, path, quoted user agent,
 * status class, bytes). The read benchmarks count records whose sixth
 * field equals "3" and validate the count against the generator.
 */

#include <benchmark/benchmark.h>
#include <csvio/csvio.h>

#include <array>
#include <cstdint>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// ============================================================================
// Setup helpers
// ============================================================================

namespace {

struct Dataset {
    std::string     csv;
    size_t          rows = 0;
    size_t          matches = 0;    // rows whose sixth field is "3"
};

// Deterministic pseudo-random sequence
class XorShift32 {
    uint32_t state_;
public:
    explicit XorShift32(uint32_t seed) : state_(seed) {}
    uint32_t next() {
        state_ ^= state_ << 13;
        state_ ^= state_ >> 17;
        state_ ^= state_ << 5;
        return state_;
    }
};

std::vector<std::vector<std::string>> makeRows(size_t rows, Dataset* ds = nullptr) {
    static constexpr std::array<std::string_view, 4> methods{"GET", "POST", "PUT", "DELETE"};
    static constexpr std::array<std::string_view, 3> agents{
        "Mozilla/5.0 (X11; Linux x86_64)",
        "curl/8.5.0",
        "bot, \"crawler\" v2",
    };

    XorShift32 rng(0xC0FFEEu);
    std::vector<std::vector<std::string>> out;
    out.reserve(rows);
    for (size_t i = 0; i < rows; ++i) {
        const uint32_t r = rng.next();
        std::string status = std::to_string(1 + r % 5);
        if (ds && status == "3") {
            ds->matches++;
        }
        out.push_back({
            std::to_string(1700000000ull + i),
            "10.0." + std::to_string((r >> 8) & 0xFF) + "." + std::to_string((r >> 16) & 0xFF),
            std::string(methods[r % methods.size()]),
            "/api/v1/items/" + std::to_string(r % 10000),
            std::string(agents[(r >> 4) % agents.size()]),
            std::move(status),
            std::to_string(r % 65536),
        });
    }
    return out;
}

const Dataset& dataset(size_t rows) {
    static std::vector<std::pair<size_t, Dataset>> cache;
    for (const auto& [n, ds] : cache) {
        if (n == rows) return ds;
    }

    Dataset ds;
    const auto table = makeRows(rows, &ds);
    csvio::Writer writer{csvio::StringSink{ds.csv}};
    writer.writeRecord({"ts", "host", "method", "path", "agent", "status", "bytes"});
    for (const auto& row : table) {
        writer.writeRecord(row);
    }
    ds.rows = rows;
    cache.emplace_back(rows, std::move(ds));
    return cache.back().second;
}

} // namespace

// ============================================================================
// Reader benchmarks
// ============================================================================

static void BM_Reader_CountMatches(benchmark::State& state) {
    const Dataset& ds = dataset(static_cast<size_t>(state.range(0)));

    for (auto _ : state) {
        csvio::Reader reader{csvio::MemorySource{ds.csv}};
        csvio::Record record;
        reader.readNext(record);   // header

        size_t total = 0;
        size_t matches = 0;
        while (reader.readNext(record)) {
            total++;
            if (record.fieldOrNone(5).value_or("") == "3") {
                matches++;
            }
        }
        if (total != ds.rows || matches != ds.matches) {
            state.SkipWithError("unexpected record count");
            break;
        }
        benchmark::DoNotOptimize(matches);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(ds.csv.size()));
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(ds.rows));
}
BENCHMARK(BM_Reader_CountMatches)->Arg(1000)->Arg(100000);

static void BM_Reader_IStream(benchmark::State& state) {
    const Dataset& ds = dataset(static_cast<size_t>(state.range(0)));

    for (auto _ : state) {
        std::istringstream in(ds.csv);
        csvio::Reader reader{csvio::IStreamSource{in}};
        csvio::Record record;
        size_t total = 0;
        while (reader.readNext(record)) {
            total++;
        }
        benchmark::DoNotOptimize(total);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(ds.csv.size()));
}
BENCHMARK(BM_Reader_IStream)->Arg(100000);

// ============================================================================
// Writer benchmarks
// ============================================================================

static void BM_Writer_Records(benchmark::State& state) {
    const auto table = makeRows(static_cast<size_t>(state.range(0)));
    std::string out;
    size_t bytes = 0;

    for (auto _ : state) {
        out.clear();
        csvio::Writer writer{csvio::StringSink{out}};
        for (const auto& row : table) {
            writer.writeRecord(row);
        }
        bytes = out.size();
        benchmark::DoNotOptimize(out.data());
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(bytes));
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(table.size()));
}
BENCHMARK(BM_Writer_Records)->Arg(1000)->Arg(100000);

// Decode and re-encode with a different dialect
static void BM_Recode_CsvToTsv(benchmark::State& state) {
    const Dataset& ds = dataset(static_cast<size_t>(state.range(0)));
    const csvio::Dialect tsv{.delimiter = '\t', .terminator = csvio::Terminator::octet('\n')};
    std::string out;

    for (auto _ : state) {
        out.clear();
        csvio::Reader reader{csvio::MemorySource{ds.csv}};
        csvio::Writer writer{csvio::StringSink{out}, tsv};
        csvio::Record record;
        while (reader.readNext(record)) {
            writer.writeRecord(record.fields());
        }
        benchmark::DoNotOptimize(out.data());
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(ds.csv.size()));
}
BENCHMARK(BM_Recode_CsvToTsv)->Arg(100000);
