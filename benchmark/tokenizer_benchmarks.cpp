#include <benchmark/benchmark.h>
#include "bench_data.h"
#include "chunk_splitter.h"
#include "dsvkit/piece_scan.h"
#include "tokenizer.h"

#include <sstream>
#include <string>

// ============================================================================
// BENCHMARK: terminator scan
// ============================================================================

static void BM_FindTerminator(benchmark::State& state) {
  std::string data(static_cast<size_t>(state.range(0)), 'x');
  data.back() = '\n';

  for (auto _ : state) {
    size_t pos = dsvkit::find_terminator(data.data(), data.size(), ',');
    benchmark::DoNotOptimize(pos);
  }
  state.SetBytesProcessed(static_cast<int64_t>(data.size() * state.iterations()));
}
BENCHMARK(BM_FindTerminator)->RangeMultiplier(8)->Range(64, 1 << 20);

static void BM_FindTerminator_Scalar(benchmark::State& state) {
  std::string data(static_cast<size_t>(state.range(0)), 'x');
  data.back() = '\n';

  for (auto _ : state) {
    size_t pos = dsvkit::detail::find_terminator_scalar(data.data(), data.size(), ',');
    benchmark::DoNotOptimize(pos);
  }
  state.SetBytesProcessed(static_cast<int64_t>(data.size() * state.iterations()));
}
BENCHMARK(BM_FindTerminator_Scalar)->RangeMultiplier(8)->Range(64, 1 << 20);

// ============================================================================
// BENCHMARK: splitter and tokenizer throughput
// ============================================================================

static void BM_SplitPieces(benchmark::State& state) {
  std::string csv_data = generate_dsv_data(static_cast<size_t>(state.range(0)), 10);

  for (auto _ : state) {
    std::istringstream input(csv_data);
    dsvkit::ChunkSplitter splitter(input, ',');
    std::string_view piece;
    size_t pieces = 0;
    while (splitter.next(piece)) {
      ++pieces;
    }
    benchmark::DoNotOptimize(pieces);
  }
  state.SetBytesProcessed(static_cast<int64_t>(csv_data.size() * state.iterations()));
}
BENCHMARK(BM_SplitPieces)->Arg(1000)->Arg(100000)->Unit(benchmark::kMillisecond);

static void BM_Tokenize(benchmark::State& state) {
  size_t rows = static_cast<size_t>(state.range(0));
  size_t quote_every = static_cast<size_t>(state.range(1));
  std::string csv_data = generate_dsv_data(rows, 10, ',', quote_every);

  for (auto _ : state) {
    std::istringstream input(csv_data);
    dsvkit::Tokenizer tokenizer(input, dsvkit::DialectParameters::csv());
    size_t fields = 0;
    while (tokenizer.next()) {
      ++fields;
    }
    benchmark::DoNotOptimize(fields);
  }
  state.SetBytesProcessed(static_cast<int64_t>(csv_data.size() * state.iterations()));
  state.counters["Rows"] = static_cast<double>(rows);
}
BENCHMARK(BM_Tokenize)
    ->Args({100000, 0})
    ->Args({100000, 10})
    ->Args({100000, 1})
    ->Unit(benchmark::kMillisecond);

static void BM_Tokenize_StrictQuotes(benchmark::State& state) {
  std::string csv_data = generate_dsv_data(static_cast<size_t>(state.range(0)), 10, ',', 3);
  dsvkit::DialectParameters dialect;
  dialect.quote_mode = dsvkit::QuoteMode::STRICT;

  for (auto _ : state) {
    std::istringstream input(csv_data);
    dsvkit::Tokenizer tokenizer(input, dialect);
    size_t fields = 0;
    while (tokenizer.next()) {
      ++fields;
    }
    benchmark::DoNotOptimize(fields);
  }
  state.SetBytesProcessed(static_cast<int64_t>(csv_data.size() * state.iterations()));
}
BENCHMARK(BM_Tokenize_StrictQuotes)->Arg(100000)->Unit(benchmark::kMillisecond);
