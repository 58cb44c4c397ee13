#pragma once

#include "synthex/types.hpp"

namespace synthex
{

  struct LiquidityParams
  {
    // impact = impact_coefficient * sqrt(qty / current)
    double impact_coefficient{0.1};

    // current -= qty * depletion_factor per fill
    double depletion_factor{1.0};

    // Fraction of the gap to baseline closed per elapsed tick, clamped at 1.
    double recovery_rate{0.05};

    // floor = floor_fraction * baseline; keeps the impact law finite.
    double floor_fraction{0.05};
  };

  struct LiquidityState
  {
    double current{0.0};
    double baseline{0.0};
    double floor{0.0};
    u64 last_update_tick{0};

    // Relative price nudge accumulated since the last price step.
    double pending_impact{0.0};
  };

  /// Per-symbol depth tracker and square-root impact law.
  /// Invariant: floor <= current <= baseline after every call.
  class LiquidityModel final
  {
  public:
    explicit LiquidityModel(double baseline, const LiquidityParams& params = {});

    const LiquidityState& state() const noexcept { return state_; }
    const LiquidityParams& params() const noexcept { return params_; }

    double current() const noexcept { return state_.current; }

    // baseline / current, >= 1. Used to widen price noise and quoted spreads.
    double thinness() const noexcept { return state_.baseline / state_.current; }

    // Signed impact a taker of `qty` would cause at the current depth.
    double impact_of(Side taker, i64 qty) const noexcept;

    // Accumulates the fill's impact, then depletes depth. Returns the impact.
    double on_fill(Side taker, i64 qty) noexcept;

    // Closes part of the gap to baseline for every tick elapsed since the last
    // update. Ticks earlier than the last update are ignored.
    void recover(u64 tick) noexcept;

    // Returns and clears the accumulated impact.
    double take_impact() noexcept;

  private:
    LiquidityParams params_{};
    LiquidityState state_{};
  };

} // namespace synthex
