#pragma once

#include <cstddef>
#include <deque>

#include "synthex/types.hpp"

namespace synthex
{

  /// Per-symbol coefficients of the reference price process.
  struct PriceDynamics
  {
    // Relative volatility per sqrt(second).
    double volatility{0.002};

    // momentum_term = momentum_factor * (current - price `momentum_lookback` ticks ago)
    double momentum_factor{0.05};
    u32 momentum_lookback{5};

    // mean_reversion_term = mean_reversion_speed * (current - anchor)
    double mean_reversion_speed{0.01};
  };

  struct PriceParams
  {
    // Next price >= floor_ratio * current and >= min_price.
    double floor_ratio{0.5};
    double min_price{1.0 / static_cast<double>(kPriceScale)};

    std::size_t history_capacity{100};
  };

  struct PriceState
  {
    double current{0.0};
    double anchor{0.0}; // fair price the process mean-reverts to (initial price)

    // Most recent price last. Bounded by PriceParams::history_capacity.
    std::deque<double> history;

    // Price `k` steps before the current one (oldest kept price if history is shorter).
    double price_ago(std::size_t k) const noexcept;
  };

  /// Decomposed outcome of one step.
  struct PriceStep
  {
    double price{0.0};
    double impacted{0.0}; // current after the accumulated impact nudge
    double brownian{0.0};
    double momentum{0.0};
    double mean_reversion{0.0};
  };

  /// One step of the reference price process:
  ///
  ///   p'   = current * (1 + impact)
  ///   next = p' + brownian + momentum - mean_reversion
  ///
  /// brownian ~ N(0, volatility * p' * sqrt(dt) * sqrt(thinness)); thinness is
  /// baseline / current liquidity (>= 1). All randomness comes from `rng`.
  PriceStep next_price(
      const PriceState& st,
      const PriceDynamics& dyn,
      const PriceParams& params,
      double impact,
      double thinness,
      double dt_seconds,
      Rng& rng);

  /// Stateful wrapper: keeps the price history and applies next_price() once per tick.
  class PriceProcess final
  {
  public:
    PriceProcess(double initial_price, const PriceDynamics& dyn, const PriceParams& params = {});

    const PriceState& state() const noexcept { return state_; }
    const PriceDynamics& dynamics() const noexcept { return dyn_; }

    double current() const noexcept { return state_.current; }

    // Result of the last step (zeroes before the first step).
    const PriceStep& last_step() const noexcept { return last_; }

    const PriceStep& step(double impact, double thinness, double dt_seconds, Rng& rng);

    // Mean simple return over the last `n` steps; 0 with fewer than two prices.
    double mean_return(std::size_t n) const noexcept;

  private:
    PriceDynamics dyn_{};
    PriceParams params_{};
    PriceState state_{};
    PriceStep last_{};
  };

} // namespace synthex
