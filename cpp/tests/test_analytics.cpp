#include <cassert>
#include <cmath>
#include <deque>
#include <vector>

#include "synthex/analytics.hpp"

namespace
{
  synthex::Fill make_fill(synthex::Side side, double px, synthex::i64 qty, double mid)
  {
    synthex::Fill f{};
    f.side = side;
    f.price_q = synthex::to_price_q(px);
    f.qty = qty;
    f.mid_at_submit = mid;
    return f;
  }

  bool near(double a, double b) { return std::fabs(a - b) < 1e-9; }

} // namespace

int main()
{
  using synthex::Ns;
  using synthex::OrderRequest;
  using synthex::OrderType;
  using synthex::Side;

  // ----------------------------
  // 1) Realized volatility
  // ----------------------------
  {
    assert(!synthex::realized_volatility({}).has_value());
    assert(!synthex::realized_volatility({100.0, 101.0}).has_value());
    assert(synthex::realized_volatility({100.0, 100.0, 100.0}).value() == 0.0);

    // +ln(1.1), -ln(1.1): mean 0, population stdev ln(1.1)
    const auto rv = synthex::realized_volatility({100.0, 110.0, 100.0});
    assert(rv && near(*rv, std::log(1.1)));

    assert(!synthex::realized_volatility({100.0, 0.0, 100.0}).has_value());

    synthex::RollingWindow w(3);
    for ( int i = 1; i <= 5; ++i )
      w.push(static_cast<double>(i));
    assert(w.size() == 3);
    assert(w.values().front() == 3.0 && w.values().back() == 5.0);
  }

  // ----------------------------
  // 2) Fill-based measures
  // ----------------------------
  {
    std::vector<synthex::Fill> fills;
    assert(!synthex::effective_spread(fills).has_value());
    assert(!synthex::vwap(fills).has_value());

    fills.push_back(make_fill(Side::Buy, 100.1, 10, 100.0));
    fills.push_back(make_fill(Side::Sell, 99.8, 30, 100.0));
    fills.push_back(make_fill(Side::Buy, 100.5, 10, 0.0)); // no mid at submit

    // mean(0.2, 0.4); the fill without a mid is skipped
    assert(near(synthex::effective_spread(fills).value(), 0.3));
    assert(near(synthex::vwap(fills).value(), (1001.0 + 2994.0 + 1005.0) / 50.0));
  }

  // ----------------------------
  // 3) Book measures and impact over a tick
  // ----------------------------
  {
    synthex::OrderBook book(0);
    (void)book.submit(OrderRequest{Side::Buy, OrderType::Limit, 30, 990'000, 1}, Ns{1});
    (void)book.submit(OrderRequest{Side::Sell, OrderType::Limit, 10, 1'010'000, 2}, Ns{2});
    (void)book.submit(OrderRequest{Side::Sell, OrderType::Limit, 40, 1'020'000, 3}, Ns{3});

    synthex::AnalyticsParams p{};
    p.imbalance_levels = 1;
    synthex::RollingWindow hist(21);

    const auto quiet = synthex::compute_metrics(book, {}, hist, book.mid(), p);
    assert(near(quiet.bid_ask_spread.value(), 2.0));
    assert(near(quiet.mid_price.value(), 100.0));
    assert(near(quiet.imbalance.value(), 0.5)); // (30 - 10) / 40 over the top level
    assert(quiet.bid_depth == 30 && quiet.ask_depth == 10);
    assert(!quiet.price_impact.has_value());
    assert(quiet.volume == 0 && quiet.fill_count == 0);
    assert(!quiet.realized_volatility.has_value());

    const auto mid_before = book.mid();
    const auto r = book.submit(OrderRequest{Side::Buy, OrderType::Market, 10, 0, 4}, Ns{4});
    const auto traded = synthex::compute_metrics(book, r.fills, hist, mid_before, p);
    assert(near(traded.mid_price.value(), 100.5));
    assert(near(traded.price_impact.value(), 0.005));
    assert(near(traded.effective_spread.value(), 2.0));
    assert(traded.volume == 10 && traded.fill_count == 1);

    // One-sided book: no spread or mid, imbalance still defined
    synthex::OrderBook bids_only(1);
    (void)bids_only.submit(OrderRequest{Side::Buy, OrderType::Limit, 5, 990'000, 1}, Ns{1});
    const auto one = synthex::compute_metrics(bids_only, {}, hist, std::nullopt, p);
    assert(!one.bid_ask_spread.has_value());
    assert(!one.mid_price.has_value());
    assert(one.imbalance.value() == 1.0);

    synthex::OrderBook empty(2);
    assert(!synthex::compute_metrics(empty, {}, hist, std::nullopt, p).imbalance.has_value());
  }

  // ----------------------------
  // 4) Rolling history drives realized volatility
  // ----------------------------
  {
    synthex::AnalyticsParams p{};
    p.vol_window = 4;
    synthex::Analytics a(p);
    synthex::OrderBook book(0);

    assert(!a.update(book, {}, 100.0, std::nullopt).realized_volatility.has_value());
    assert(!a.update(book, {}, 101.0, std::nullopt).realized_volatility.has_value());
    assert(a.update(book, {}, 100.0, std::nullopt).realized_volatility.has_value());
    for ( int i = 0; i < 10; ++i )
      (void)a.update(book, {}, 100.0, std::nullopt);
    assert(a.history().size() == 5);
    assert(a.update(book, {}, 100.0, std::nullopt).realized_volatility.value() == 0.0);
  }

  return 0;
}
