#include "synthex/price.hpp"

#include <algorithm>
#include <cmath>

#include "synthex/log.hpp"

namespace synthex
{

  double PriceState::price_ago(std::size_t k) const noexcept
  {
    if ( history.empty() )
      return current;
    if ( k >= history.size() )
      return history.front();
    return history[history.size() - 1 - k];
  }

  PriceStep next_price(
      const PriceState& st,
      const PriceDynamics& dyn,
      const PriceParams& params,
      double impact,
      double thinness,
      double dt_seconds,
      Rng& rng)
  {
    PriceStep out{};

    // Impact is a relative nudge; never let it flip the sign of the price.
    const double p = st.current * std::max(1.0 + impact, params.floor_ratio);
    out.impacted = p;

    const double sigma = dyn.volatility * p * std::sqrt(std::max(dt_seconds, 0.0)) *
                         std::sqrt(std::max(thinness, 1.0));
    if ( sigma > 0.0 ) {
      std::normal_distribution<double> noise(0.0, sigma);
      out.brownian = noise(rng);
    }

    out.momentum = dyn.momentum_factor * (p - st.price_ago(dyn.momentum_lookback));
    out.mean_reversion = dyn.mean_reversion_speed * (p - st.anchor);

    const double next = p + out.brownian + out.momentum - out.mean_reversion;
    out.price = std::max({next, params.floor_ratio * st.current, params.min_price});
    return out;
  }

  PriceProcess::PriceProcess(double initial_price, const PriceDynamics& dyn, const PriceParams& params)
      : dyn_(dyn), params_(params)
  {
    SYNTHEX_ASSERT(initial_price > 0.0);
    SYNTHEX_ASSERT(params.history_capacity >= 2);

    state_.current = initial_price;
    state_.anchor = initial_price;
    state_.history.push_back(initial_price);
  }

  const PriceStep& PriceProcess::step(double impact, double thinness, double dt_seconds, Rng& rng)
  {
    last_ = next_price(state_, dyn_, params_, impact, thinness, dt_seconds, rng);

    state_.current = last_.price;
    state_.history.push_back(last_.price);
    while ( state_.history.size() > params_.history_capacity )
      state_.history.pop_front();

    return last_;
  }

  double PriceProcess::mean_return(std::size_t n) const noexcept
  {
    const std::deque<double>& h = state_.history;
    if ( h.size() < 2 || n == 0 )
      return 0.0;

    const std::size_t count = std::min(n, h.size() - 1);
    double sum = 0.0;
    for ( std::size_t i = h.size() - count; i < h.size(); ++i )
      sum += h[i] / h[i - 1] - 1.0;
    return sum / static_cast<double>(count);
  }

} // namespace synthex
