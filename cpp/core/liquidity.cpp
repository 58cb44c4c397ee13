#include "synthex/liquidity.hpp"

#include <algorithm>
#include <cmath>

#include "synthex/log.hpp"

namespace synthex
{

  LiquidityModel::LiquidityModel(double baseline, const LiquidityParams& params) : params_(params)
  {
    SYNTHEX_ASSERT(baseline > 0.0);
    SYNTHEX_ASSERT(params.floor_fraction > 0.0 && params.floor_fraction <= 1.0);

    state_.baseline = baseline;
    state_.current = baseline;
    state_.floor = baseline * params.floor_fraction;
  }

  double LiquidityModel::impact_of(Side taker, i64 qty) const noexcept
  {
    if ( qty <= 0 )
      return 0.0;
    const double mag = params_.impact_coefficient * std::sqrt(static_cast<double>(qty) / state_.current);
    return taker == Side::Buy ? mag : -mag;
  }

  double LiquidityModel::on_fill(Side taker, i64 qty) noexcept
  {
    const double impact = impact_of(taker, qty);
    state_.pending_impact += impact;

    const double depleted = state_.current - static_cast<double>(qty) * params_.depletion_factor;
    state_.current = std::max(state_.floor, depleted);
    return impact;
  }

  void LiquidityModel::recover(u64 tick) noexcept
  {
    if ( tick <= state_.last_update_tick ) {
      return;
    }

    const double elapsed = static_cast<double>(tick - state_.last_update_tick);
    state_.last_update_tick = tick;

    const double step = std::min(1.0, params_.recovery_rate * elapsed);
    state_.current += (state_.baseline - state_.current) * step;
    state_.current = std::clamp(state_.current, state_.floor, state_.baseline);
  }

  double LiquidityModel::take_impact() noexcept
  {
    const double impact = state_.pending_impact;
    state_.pending_impact = 0.0;
    return impact;
  }

} // namespace synthex
