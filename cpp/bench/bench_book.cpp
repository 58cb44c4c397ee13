#include <benchmark/benchmark.h>

#include "synthex/book.hpp"
#include "synthex/engine.hpp"

#include <cstdint>
#include <random>
#include <vector>

using synthex::i64;
using synthex::Ns;
using synthex::OrderRequest;
using synthex::OrderType;
using synthex::Side;
using synthex::u64;

// -------------------------
// Book fixtures
// -------------------------
static void seed_ladder(synthex::OrderBook& book, int levels, int per_level) {
    u64 ts = 0;
    for (int l = 0; l < levels; ++l) {
        for (int k = 0; k < per_level; ++k) {
            (void)book.submit(OrderRequest{Side::Buy, OrderType::Limit, 10, 1'000'000 - 100 * (l + 1), 1}, Ns{ts++});
            (void)book.submit(OrderRequest{Side::Sell, OrderType::Limit, 10, 1'000'000 + 100 * (l + 1), 2}, Ns{ts++});
        }
    }
}

// -------------------------
// Benchmarks
// -------------------------

// Passive add + cancel on a populated book (level lookup + FIFO link/unlink).
static void BM_Book_RestCancel(benchmark::State& state) {
    synthex::OrderBook book(0);
    seed_ladder(book, static_cast<int>(state.range(0)), 4);

    std::mt19937_64 rng(7);
    std::uniform_int_distribution<int> lvl(1, static_cast<int>(state.range(0)));
    u64 ts = 1'000'000;

    for (auto _ : state) {
        const i64 px = 1'000'000 - 100 * lvl(rng);
        const auto r = book.submit(OrderRequest{Side::Buy, OrderType::Limit, 10, px, 3}, Ns{ts++});
        benchmark::DoNotOptimize(book.cancel(r.order_id));
    }
    state.SetItemsProcessed(state.iterations());
}

// Market order sweeping `range(0)` levels, then the liquidity is put back.
static void BM_Book_MarketSweep(benchmark::State& state) {
    const int levels = static_cast<int>(state.range(0));
    synthex::OrderBook book(0);
    seed_ladder(book, levels, 1);
    u64 ts = 1'000'000;

    i64 filled = 0;
    for (auto _ : state) {
        const auto r = book.submit(OrderRequest{Side::Buy, OrderType::Market, 10 * levels, 0, 3}, Ns{ts++});
        filled += r.filled_qty;
        benchmark::DoNotOptimize(r.fills.data());

        state.PauseTiming();
        for (int l = 0; l < levels; ++l)
            (void)book.submit(OrderRequest{Side::Sell, OrderType::Limit, 10, 1'000'000 + 100 * (l + 1), 2}, Ns{ts++});
        state.ResumeTiming();
    }
    state.SetItemsProcessed(filled);
    state.counters["levels"] = benchmark::Counter(static_cast<double>(levels), benchmark::Counter::kAvgThreads);
}

// Full engine tick across `range(0)` symbols with the default agent mix.
static void BM_Engine_Tick(benchmark::State& state) {
    synthex::EngineConfig cfg = synthex::default_config();
    cfg.symbols.resize(static_cast<std::size_t>(state.range(0)));
    cfg.workers = static_cast<std::size_t>(state.range(1));
    cfg.log_level = synthex::log::Level::Warn;

    synthex::Engine engine(cfg);
    if (engine.start() != synthex::EngineError::None) {
        state.SkipWithError("engine failed to start");
        return;
    }

    for (auto _ : state) {
        benchmark::DoNotOptimize(engine.advance_tick());
    }

    const auto st = engine.stats();
    state.SetItemsProcessed(state.iterations() * state.range(0));
    state.counters["fills_per_tick"] = benchmark::Counter(
        static_cast<double>(st.fills) / static_cast<double>(st.ticks ? st.ticks : 1), benchmark::Counter::kAvgThreads);
    engine.stop();
}

BENCHMARK(BM_Book_RestCancel)->Arg(1)->Arg(10)->Arg(100)->Arg(1000);
BENCHMARK(BM_Book_MarketSweep)->Arg(1)->Arg(5)->Arg(20);
BENCHMARK(BM_Engine_Tick)->Args({1, 1})->Args({5, 1})->Args({5, 4});

BENCHMARK_MAIN();
