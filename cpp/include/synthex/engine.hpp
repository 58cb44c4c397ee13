#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>
#include <vector>

#include "synthex/agents.hpp"
#include "synthex/analytics.hpp"
#include "synthex/book.hpp"
#include "synthex/config.hpp"
#include "synthex/execution.hpp"
#include "synthex/liquidity.hpp"
#include "synthex/persist.hpp"
#include "synthex/price.hpp"
#include "synthex/types.hpp"
#include "synthex/worker_pool.hpp"

namespace synthex
{

  enum class EngineState : std::uint8_t
  {
    Initialized = 0,
    Running = 1,
    Paused = 2,
    Stopped = 3 // terminal
  };

  enum class EngineError : std::uint8_t
  {
    None = 0,
    NotRunning = 1,        // engine is stopped
    InvalidTransition = 2, // request not valid in the current state
    WrongClockMode = 3     // advance_tick() while the wall clock drives ticks
  };

  std::string_view to_string(EngineState s) noexcept;
  std::string_view to_string(EngineError e) noexcept;

  /// Per-symbol snapshot, rebuilt once per tick.
  struct MarketState
  {
    u32 symbol{0};
    u64 tick{0};
    Ns ts{0};

    double last_price{0.0};
    double reference_price{0.0};
    i64 volume{0}; // cumulative traded quantity
    double liquidity{0.0};
    double realized_vol{0.0};
    double momentum{0.0}; // momentum term of the last price step
    std::optional<double> spread;
  };

  /// Result of an external submit_order().
  struct SubmitResult
  {
    u64 order_id{0};
    SubmitStatus status{SubmitStatus::Rejected};
    i64 filled_quantity{0};
    double avg_fill_price{0.0};
    RejectReason reject_reason{RejectReason::None};
  };

  struct EngineStats
  {
    u64 ticks{0};
    u64 orders_accepted{0}; // agent intents accepted + external orders that reached the book
    u64 orders_rejected{0};
    u64 external_orders{0};
    u64 fills{0};
    i64 volume{0};
    PersistStats persist{};
  };

  /// Everything owned by one symbol. No state is shared with other symbols; the
  /// engine serialises access through mutex().
  class SymbolContext final
  {
  public:
    SymbolContext(u32 index, const SymbolSpec& spec, const EngineConfig& cfg, AsyncPersister* persister);

    SymbolContext(const SymbolContext&) = delete;
    SymbolContext& operator=(const SymbolContext&) = delete;

    std::mutex& mutex() noexcept { return mu_; }

    u32 index() const noexcept { return index_; }
    const SymbolSpec& spec() const noexcept { return spec_; }

    // One full tick over [start, end): recovery, price step, agents, latency
    // release, fills to liquidity and agents, analytics, persistence.
    void tick(u64 tick_no, Ns start, Ns end);

    // Matches immediately as owner 0. The order is stamped no earlier than the
    // end of the last processed tick, so it queues behind everything released by it.
    SubmitResult submit_external(const OrderRequest& req, Ns now);

    bool cancel(u64 order_id) { return book_.cancel(order_id); }

    const OrderBook& book() const noexcept { return book_; }
    const LiquidityModel& liquidity() const noexcept { return liquidity_; }
    const PriceProcess& price() const noexcept { return price_; }
    const AgentPopulation& agents() const noexcept { return agents_; }
    const ExecutionEngine& execution() const noexcept { return exec_; }
    const MarketState& market_state() const noexcept { return state_; }
    const Metrics& metrics() const noexcept { return metrics_; }

    // Fills processed by the last tick (including external fills since the tick before).
    const std::vector<Fill>& last_fills() const noexcept { return tick_fills_; }

    u64 orders_accepted() const noexcept { return orders_accepted_; }
    u64 orders_rejected() const noexcept { return orders_rejected_; }
    u64 external_orders() const noexcept { return external_orders_; }
    u64 fill_count() const noexcept { return fill_count_; }
    i64 volume() const noexcept { return volume_; }

  private:
    void record_fill_(const Fill& f, std::vector<Fill>& into);
    void persist_tick_(u64 tick_no, Ns end);
    void persist_book_(u64 ts);

    std::mutex mu_;

    u32 index_{0};
    SymbolSpec spec_;
    double dt_seconds_{0.0};
    u32 signal_lookback_{5};
    u64 epoch_ns_{0};
    u32 book_every_ticks_{0};
    std::size_t book_levels_{0};
    AsyncPersister* persister_{nullptr};

    Rng rng_;
    OrderBook book_;
    LiquidityModel liquidity_;
    PriceProcess price_;
    ExecutionEngine exec_;
    AgentPopulation agents_;
    Analytics analytics_;

    MarketState state_{};
    Metrics metrics_{};
    double last_price_{0.0};
    i64 volume_{0};
    Ns last_end_{0};

    std::vector<Fill> tick_fills_;
    std::vector<Fill> external_fills_; // folded into the next tick
    std::vector<MatchResult> results_;

    u64 orders_accepted_{0};
    u64 orders_rejected_{0};
    u64 external_orders_{0};
    u64 fill_count_{0};
  };

  /// Simulation orchestrator.
  ///
  /// Lifecycle: Initialized -> Running <-> Paused -> Stopped (terminal).
  /// Transitions wait for an in-flight tick, so a tick always completes before a
  /// pause or stop takes effect. Simulated time of tick k is
  /// [k * tick_interval, (k + 1) * tick_interval).
  class Engine final
  {
  public:
    // `sink` overrides cfg.persist.sink when given.
    explicit Engine(EngineConfig cfg, std::unique_ptr<PersistSink> sink = nullptr);
    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    const EngineConfig& config() const noexcept { return cfg_; }

    EngineState state() const;

    EngineError start();
    EngineError pause();
    EngineError resume();
    EngineError stop();

    // Manual clock only. Processes exactly one tick for every symbol.
    EngineError advance_tick();

    SubmitResult submit_order(
        std::string_view symbol,
        Side side,
        OrderType type,
        i64 qty,
        std::optional<double> limit_price = std::nullopt);

    bool cancel_order(u64 order_id);

    std::optional<BookSnapshot> get_order_book(std::string_view symbol, std::size_t depth) const;
    std::optional<MarketState> get_market_state(std::string_view symbol) const;
    std::vector<std::string> list_symbols() const;

    std::optional<u32> symbol_index(std::string_view symbol) const;

    // Runs `f` with the symbol's lock held.
    void inspect(u32 symbol, const std::function<void(const SymbolContext&)>& f) const;

    u64 tick_count() const noexcept { return tick_count_.load(std::memory_order_acquire); }

    // Current simulated time (start of the next tick).
    Ns now() const noexcept { return Ns{tick_count() * cfg_.tick_interval.value}; }

    EngineStats stats() const;

  private:
    EngineError transition_(EngineState from_a, EngineState from_b, EngineState to);
    void run_tick_();
    void driver_loop_();

    EngineConfig cfg_;
    std::unique_ptr<AsyncPersister> persister_;
    std::vector<std::unique_ptr<SymbolContext>> symbols_;
    std::unordered_map<std::string, u32> by_name_;
    std::unique_ptr<WorkerPool> pool_;

    // Held for a whole tick; lifecycle transitions take it too.
    std::mutex tick_mu_;

    mutable std::mutex state_mu_;
    std::condition_variable state_cv_;
    EngineState state_{EngineState::Initialized};

    std::atomic<u64> tick_count_{0};
    std::thread driver_;
  };

} // namespace synthex
