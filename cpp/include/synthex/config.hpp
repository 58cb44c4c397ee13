#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "synthex/agents.hpp"
#include "synthex/analytics.hpp"
#include "synthex/book.hpp"
#include "synthex/execution.hpp"
#include "synthex/liquidity.hpp"
#include "synthex/log.hpp"
#include "synthex/price.hpp"
#include "synthex/types.hpp"

namespace synthex
{

  /// Immutable per-symbol parameters. Created at startup, never mutated.
  struct SymbolSpec
  {
    std::string name;
    double initial_price{0.0};
    double base_liquidity{10'000.0};
    PriceDynamics dynamics{};
  };

  enum class ClockMode : std::uint8_t
  {
    Manual = 0,   // one tick per advance_tick()
    WallClock = 1 // driver thread ticks every tick_interval
  };

  enum class SinkKind : std::uint8_t
  {
    None = 0, // no persister at all
    Null = 1, // persister thread with a discarding sink
    GzCsv = 2
  };

  struct PersistParams
  {
    SinkKind sink{SinkKind::None};
    std::string root{"synthex_data"};
    std::size_t queue_capacity{65'536};

    // Top-of-book snapshot every N ticks (0 disables), `book_levels` per side.
    u32 book_every_ticks{10};
    std::size_t book_levels{10};
  };

  struct EngineConfig
  {
    std::vector<SymbolSpec> symbols;

    BookParams book{};
    LiquidityParams liquidity{};
    PriceParams price{};
    ExecParams exec{};
    AgentMix agents{};
    AnalyticsParams analytics{};
    PersistParams persist{};

    ClockMode clock{ClockMode::Manual};
    Ns tick_interval{Ns::from_ms(100)};

    // Symbol i draws from Rng(seed + i).
    u64 seed{42};

    // > 1 runs symbol ticks on a worker pool.
    std::size_t workers{1};

    // Unix epoch ns of simulated time 0; used to stamp persisted records.
    u64 epoch_ns{0};

    log::Level log_level{log::Level::Info};
  };

  // AAPL 150, MSFT 300, GOOGL 140, BTCUSDT 60000, ETHUSDT 3000.
  std::vector<SymbolSpec> default_symbols();

  // Defaults with default_symbols().
  EngineConfig default_config();

  // Parses `key = value` lines and `[symbol NAME]` sections into `cfg`.
  // `#` and `;` start comments. The first symbol section replaces the symbol
  // list in `cfg`; later ones append. Throws std::runtime_error("<origin>:<line>: ...").
  void parse_config(std::string_view text, std::string_view origin, EngineConfig& cfg);

  // default_config() overlaid with the file at `path`, then validated.
  EngineConfig load_config(const std::string& path);

  // Throws std::runtime_error naming the first out-of-range value.
  void validate(const EngineConfig& cfg);

} // namespace synthex
