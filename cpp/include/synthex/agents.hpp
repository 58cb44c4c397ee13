#pragma once

#include <cstddef>
#include <deque>
#include <optional>
#include <string_view>
#include <variant>
#include <vector>

#include "synthex/book.hpp"
#include "synthex/execution.hpp"
#include "synthex/types.hpp"

namespace synthex
{

  // ---------------- parameters ----------------

  struct MarketMakerParams
  {
    double spread{0.001}; // full quoted spread as a fraction of reference, at baseline depth
    i64 quote_size{100};

    // Quotes shift by reference * inventory_skew per quote_size of inventory.
    double inventory_skew{0.0002};

    // Beyond this absolute inventory only the reducing side is quoted.
    i64 max_inventory{2'000};
  };

  struct NoiseParams
  {
    double probability{0.05};
    i64 min_size{10};
    i64 max_size{50};
    double market_share{0.7}; // P(market | trade)
    double limit_band{0.01};  // limit price within reference * (1 +- band)

    // Limit orders still resting after this many ticks are cancelled. 0 keeps them.
    u32 order_lifetime_ticks{50};
  };

  struct InformedParams
  {
    double probability{0.1};
    double threshold{0.002}; // |mean return| needed to act
    u32 lookback{5};
    i64 base_size{75};
    double max_conviction{3.0}; // size = base_size * min(|signal| / threshold, max_conviction)
  };

  struct MomentumParams
  {
    double probability{0.08};
    double threshold{0.001};
    u32 lookback{20};       // ticks of own reference memory
    u32 cooldown_ticks{10}; // minimum ticks between two trades
    i64 size{60};
    double offset{0.0005}; // limit price = reference * (1 +- offset), through the market
  };

  /// Population composition per symbol plus archetype parameters.
  struct AgentMix
  {
    u32 market_makers{5};
    u32 noise{20};
    u32 informed{10};
    u32 momentum{5};

    MarketMakerParams mm{};
    NoiseParams noise_params{};
    InformedParams informed_params{};
    MomentumParams momentum_params{};

    u32 total() const noexcept { return market_makers + noise + informed + momentum; }
  };

  // ---------------- state ----------------

  struct MarketMaker
  {
    MarketMakerParams p{};
    std::vector<u64> live_quotes; // ids of quotes sent last tick
  };

  struct NoiseTrader
  {
    NoiseParams p{};

    struct Sent
    {
      u64 id;
      u64 tick;
    };
    std::deque<Sent> open_limits{}; // oldest first
  };

  struct InformedTrader
  {
    InformedParams p{};
  };

  struct MomentumTrader
  {
    MomentumParams p{};
    std::deque<double> memory; // reference prices, oldest first
    std::optional<u64> last_trade_tick;
  };

  using AgentBehavior = std::variant<MarketMaker, NoiseTrader, InformedTrader, MomentumTrader>;

  enum class Archetype : std::uint8_t
  {
    MarketMaker = 0,
    Noise = 1,
    Informed = 2,
    Momentum = 3
  };

  std::string_view to_string(Archetype a) noexcept;

  struct Agent
  {
    u32 id{0};
    AgentBehavior behavior;

    // Updated from the agent's own fills only.
    i64 position{0};
    double cash{0.0};
    u64 orders_sent{0};
    u64 fills{0};

    Archetype archetype() const noexcept { return static_cast<Archetype>(behavior.index()); }

    // Owner tag carried by the agent's orders (0 is reserved for external flow).
    u64 owner() const noexcept { return static_cast<u64>(id) + 1; }
  };

  /// Read-only market view handed to every agent of one symbol for one tick.
  struct AgentView
  {
    u32 symbol{0};
    u64 tick{0};
    Ns now{0};

    double reference_price{0.0};
    double last_price{0.0};
    std::optional<i64> best_bid;
    std::optional<i64> best_ask;

    // baseline / current liquidity (>= 1)
    double thinness{1.0};

    // Mean simple return of the reference price over InformedParams::lookback.
    double recent_momentum{0.0};
  };

  // Single behaviour entry point. Appends zero or more intents for `agent`.
  void act(Agent& agent, const AgentView& view, Rng& rng, std::vector<OrderIntent>& out);

  // Applies the agent's side of a fill to its position and cash.
  void apply_fill(Agent& agent, const Fill& f);

  /// Fixed agent set of one symbol. Agents act in id order.
  class AgentPopulation final
  {
  public:
    explicit AgentPopulation(const AgentMix& mix);

    std::size_t size() const noexcept { return agents_.size(); }
    const std::vector<Agent>& agents() const noexcept { return agents_; }
    const Agent& agent(u32 id) const { return agents_.at(id); }

    // Lets every agent act and submits the intents through `exec`.
    // Returns the number of intents accepted.
    std::size_t step(const AgentView& view, Rng& rng, ExecutionEngine& exec);

    // Routes a fill to the taker and maker agents, if they belong to this population.
    void on_fill(const Fill& f);

    // Sum of agent positions. Zero whenever every fill was agent-vs-agent.
    i64 net_position() const noexcept;

  private:
    Agent* by_owner_(u64 owner) noexcept;

    std::vector<Agent> agents_;
    std::vector<OrderIntent> scratch_;
  };

} // namespace synthex
