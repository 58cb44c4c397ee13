#include "synthex/analytics.hpp"

#include <cmath>

#include "synthex/log.hpp"

namespace synthex
{

  RollingWindow::RollingWindow(std::size_t capacity) : capacity_(capacity) { SYNTHEX_ASSERT(capacity > 0); }

  void RollingWindow::push(double v)
  {
    values_.push_back(v);
    if ( values_.size() > capacity_ )
      values_.pop_front();
  }

  std::optional<double> realized_volatility(const std::deque<double>& prices)
  {
    if ( prices.size() < 3 )
      return std::nullopt;

    std::vector<double> rets;
    rets.reserve(prices.size() - 1);
    for ( std::size_t i = 1; i < prices.size(); ++i ) {
      if ( prices[i - 1] <= 0.0 || prices[i] <= 0.0 )
        return std::nullopt;
      rets.push_back(std::log(prices[i] / prices[i - 1]));
    }

    double mean = 0.0;
    for ( const double r : rets )
      mean += r;
    mean /= static_cast<double>(rets.size());

    double var = 0.0;
    for ( const double r : rets )
      var += (r - mean) * (r - mean);
    var /= static_cast<double>(rets.size());

    return std::sqrt(var);
  }

  std::optional<double> effective_spread(const std::vector<Fill>& fills)
  {
    double sum = 0.0;
    std::size_t n = 0;
    for ( const Fill& f : fills ) {
      if ( f.mid_at_submit <= 0.0 )
        continue;
      sum += 2.0 * std::fabs(f.price() - f.mid_at_submit);
      ++n;
    }
    if ( n == 0 )
      return std::nullopt;
    return sum / static_cast<double>(n);
  }

  std::optional<double> vwap(const std::vector<Fill>& fills)
  {
    double notional = 0.0;
    i64 qty = 0;
    for ( const Fill& f : fills ) {
      notional += f.price() * static_cast<double>(f.qty);
      qty += f.qty;
    }
    if ( qty == 0 )
      return std::nullopt;
    return notional / static_cast<double>(qty);
  }

  Metrics compute_metrics(
      const OrderBook& book,
      const std::vector<Fill>& fills,
      const RollingWindow& history,
      std::optional<double> mid_before,
      const AnalyticsParams& params)
  {
    Metrics m{};

    const std::optional<i64> bb = book.best_bid();
    const std::optional<i64> ba = book.best_ask();
    if ( bb && ba ) {
      m.bid_ask_spread = to_price(*ba - *bb);
      m.mid_price = book.mid();
    }

    m.bid_depth = book.depth_qty(Side::Buy, params.imbalance_levels);
    m.ask_depth = book.depth_qty(Side::Sell, params.imbalance_levels);
    const i64 total = m.bid_depth + m.ask_depth;
    if ( total > 0 )
      m.imbalance = static_cast<double>(m.bid_depth - m.ask_depth) / static_cast<double>(total);

    m.fill_count = fills.size();
    for ( const Fill& f : fills )
      m.volume += f.qty;

    m.effective_spread = effective_spread(fills);
    m.vwap = vwap(fills);

    // Relative mid shift across a tick that traded.
    if ( !fills.empty() && mid_before && m.mid_price && *mid_before > 0.0 )
      m.price_impact = (*m.mid_price - *mid_before) / *mid_before;

    m.realized_volatility = realized_volatility(history.values());
    return m;
  }

  Analytics::Analytics(const AnalyticsParams& params) : params_(params), history_(params.vol_window + 1) {}

  Metrics Analytics::update(
      const OrderBook& book,
      const std::vector<Fill>& fills,
      double reference_price,
      std::optional<double> mid_before)
  {
    history_.push(reference_price);
    return compute_metrics(book, fills, history_, mid_before, params_);
  }

} // namespace synthex
