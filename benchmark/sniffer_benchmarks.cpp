#include <benchmark/benchmark.h>
#include "bench_data.h"
#include "sniffer.h"
#include "writer.h"

#include <sstream>
#include <string>

// ============================================================================
// BENCHMARK: dialect guessing on a sample
// ============================================================================

static void BM_GuessParameters(benchmark::State& state) {
  char sep = static_cast<char>(state.range(0));
  std::string sample = generate_dsv_data(500, 8, sep, 5).substr(0, DSVKIT_SAMPLE_SIZE);
  auto data = reinterpret_cast<const uint8_t*>(sample.data());

  for (auto _ : state) {
    dsvkit::Sniffer sniffer(data, sample.size());
    dsvkit::GuessResult result = sniffer.guess_parameters();
    benchmark::DoNotOptimize(result);
  }
  state.SetBytesProcessed(static_cast<int64_t>(sample.size() * state.iterations()));
}
BENCHMARK(BM_GuessParameters)->Arg(',')->Arg(';')->Arg('\t')->Arg('|');

static void BM_SepQuoteScores(benchmark::State& state) {
  std::string sample = generate_dsv_data(500, 8, ';', 5).substr(0, DSVKIT_SAMPLE_SIZE);
  auto data = reinterpret_cast<const uint8_t*>(sample.data());

  for (auto _ : state) {
    dsvkit::Sniffer sniffer(data, sample.size());
    auto scores = sniffer.sep_quote_scores();
    benchmark::DoNotOptimize(scores);
  }
  state.SetBytesProcessed(static_cast<int64_t>(sample.size() * state.iterations()));
}
BENCHMARK(BM_SepQuoteScores);

// ============================================================================
// BENCHMARK: writer
// ============================================================================

static void BM_WriteFields(benchmark::State& state) {
  size_t rows = static_cast<size_t>(state.range(0));
  const std::string plain = "value_12345";
  const std::string special = "needs \"quotes\", really";
  size_t bytes = 0;

  for (auto _ : state) {
    std::ostringstream out;
    dsvkit::Writer writer(out);
    for (size_t r = 0; r < rows; ++r) {
      for (size_t c = 0; c < 10; ++c) {
        writer.write_field(c % 4 == 0 ? special : plain);
      }
      writer.new_row();
    }
    writer.flush();
    bytes = out.str().size();
    benchmark::DoNotOptimize(bytes);
  }
  state.SetBytesProcessed(static_cast<int64_t>(bytes * state.iterations()));
}
BENCHMARK(BM_WriteFields)->Arg(100000)->Unit(benchmark::kMillisecond);
