#pragma once

#include <cstddef>
#include <deque>
#include <optional>
#include <vector>

#include "synthex/book.hpp"
#include "synthex/types.hpp"

namespace synthex
{

  struct AnalyticsParams
  {
    std::size_t imbalance_levels{5}; // depth/imbalance over the top N levels per side
    std::size_t vol_window{20};      // log returns used for realized volatility
  };

  /// One analytics row per symbol per tick. Empty optionals mean "not computable"
  /// (one-sided book, no fills, not enough history).
  struct Metrics
  {
    std::optional<double> bid_ask_spread;
    std::optional<double> mid_price;
    std::optional<double> imbalance;
    i64 bid_depth{0};
    i64 ask_depth{0};

    std::optional<double> effective_spread;
    std::optional<double> price_impact;
    std::optional<double> realized_volatility;
    std::optional<double> vwap;

    i64 volume{0};
    std::size_t fill_count{0};
  };

  /// Fixed-capacity price history, oldest first.
  class RollingWindow final
  {
  public:
    explicit RollingWindow(std::size_t capacity);

    void push(double v);

    std::size_t size() const noexcept { return values_.size(); }
    std::size_t capacity() const noexcept { return capacity_; }
    const std::deque<double>& values() const noexcept { return values_; }

  private:
    std::size_t capacity_{0};
    std::deque<double> values_;
  };

  // Population stdev of log returns of `prices`. Empty with fewer than two returns
  // or a non-positive price.
  std::optional<double> realized_volatility(const std::deque<double>& prices);

  // mean(2 * |price - mid_at_submit|) over fills that carry a mid.
  std::optional<double> effective_spread(const std::vector<Fill>& fills);

  std::optional<double> vwap(const std::vector<Fill>& fills);

  /// Pure metrics computation: post-match book, the tick's fills, price history and
  /// the mid observed before the tick. Does not touch the book.
  Metrics compute_metrics(
      const OrderBook& book,
      const std::vector<Fill>& fills,
      const RollingWindow& history,
      std::optional<double> mid_before,
      const AnalyticsParams& params);

  /// Owns the rolling history of one symbol.
  class Analytics final
  {
  public:
    explicit Analytics(const AnalyticsParams& params = {});

    const AnalyticsParams& params() const noexcept { return params_; }
    const RollingWindow& history() const noexcept { return history_; }

    // Records the tick's reference price, then computes the row.
    Metrics update(
        const OrderBook& book,
        const std::vector<Fill>& fills,
        double reference_price,
        std::optional<double> mid_before);

  private:
    AnalyticsParams params_{};
    RollingWindow history_;
  };

} // namespace synthex
