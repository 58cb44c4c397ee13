#include <atomic>
#include <cassert>
#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "synthex/engine.hpp"

namespace
{
  using synthex::EngineError;

  struct Counts
  {
    std::atomic<synthex::u64> fills{0};
    std::atomic<synthex::u64> states{0};
    std::atomic<synthex::u64> analytics{0};
    std::atomic<synthex::u64> levels{0};
  };

  class CountingSink final : public synthex::PersistSink
  {
  public:
    explicit CountingSink(std::shared_ptr<Counts> c) : c_(std::move(c)) {}

    void write_fill(const synthex::FillRecord&) override { c_->fills.fetch_add(1); }
    void write_market_state(const synthex::MarketStateRecord&) override { c_->states.fetch_add(1); }
    void write_analytics(const synthex::AnalyticsRecord&) override { c_->analytics.fetch_add(1); }
    void write_orderbook_level(const synthex::OrderBookLevelRecord&) override { c_->levels.fetch_add(1); }

  private:
    std::shared_ptr<Counts> c_;
  };

  struct BookRows
  {
    std::mutex mu;
    std::vector<synthex::OrderBookLevelRecord> rows;
  };

  class BookCaptureSink final : public synthex::PersistSink
  {
  public:
    explicit BookCaptureSink(std::shared_ptr<BookRows> b) : b_(std::move(b)) {}

    void write_fill(const synthex::FillRecord&) override {}
    void write_market_state(const synthex::MarketStateRecord&) override {}
    void write_analytics(const synthex::AnalyticsRecord&) override {}
    void write_orderbook_level(const synthex::OrderBookLevelRecord& r) override
    {
      std::lock_guard<std::mutex> lk(b_->mu);
      b_->rows.push_back(r);
    }

  private:
    std::shared_ptr<BookRows> b_;
  };

  // Every fill of the last tick across all symbols, flattened.
  void append_fills(synthex::Engine& e, std::vector<synthex::u64>& out)
  {
    for ( synthex::u32 i = 0; i < e.list_symbols().size(); ++i ) {
      e.inspect(i, [&](const synthex::SymbolContext& s) {
        for ( const synthex::Fill& f : s.last_fills() ) {
          out.push_back(f.fill_id);
          out.push_back(f.order_id);
          out.push_back(f.maker_order_id);
          out.push_back(static_cast<synthex::u64>(f.price_q));
          out.push_back(static_cast<synthex::u64>(f.qty));
          out.push_back(f.ts.value);
        }
      });
    }
  }

  synthex::EngineConfig small_config()
  {
    synthex::EngineConfig cfg = synthex::default_config();
    cfg.symbols.resize(3);
    cfg.log_level = synthex::log::Level::Warn;
    return cfg;
  }

  synthex::EngineConfig quiet_config()
  {
    synthex::EngineConfig cfg = small_config();
    cfg.symbols.resize(1);
    cfg.agents.market_makers = 0;
    cfg.agents.noise = 0;
    cfg.agents.informed = 0;
    cfg.agents.momentum = 0;
    return cfg;
  }

  // Everything observable about one run, flattened.
  std::vector<double> fingerprint(synthex::Engine& e)
  {
    std::vector<double> out;
    for ( const std::string& name : e.list_symbols() ) {
      const auto st = e.get_market_state(name).value();
      out.push_back(st.last_price);
      out.push_back(st.reference_price);
      out.push_back(static_cast<double>(st.volume));
      out.push_back(st.liquidity);
      out.push_back(st.realized_vol);
      out.push_back(st.spread.value_or(-1.0));

      const auto book = e.get_order_book(name, 0).value();
      for ( const auto& l : book.bids ) {
        out.push_back(static_cast<double>(l.price_q));
        out.push_back(static_cast<double>(l.qty));
      }
      for ( const auto& l : book.asks ) {
        out.push_back(static_cast<double>(l.price_q));
        out.push_back(static_cast<double>(l.qty));
      }
    }
    const auto s = e.stats();
    out.push_back(static_cast<double>(s.fills));
    out.push_back(static_cast<double>(s.orders_accepted));
    return out;
  }

} // namespace

int main()
{
  using synthex::EngineState;
  using synthex::OrderType;
  using synthex::RejectReason;
  using synthex::Side;
  using synthex::SubmitStatus;

  // ----------------------------
  // 1) Lifecycle
  // ----------------------------
  {
    synthex::Engine e(small_config());
    assert(e.state() == EngineState::Initialized);
    assert(e.advance_tick() == EngineError::InvalidTransition);
    assert(e.pause() == EngineError::InvalidTransition);
    assert(e.resume() == EngineError::InvalidTransition);

    assert(e.start() == EngineError::None);
    assert(e.start() == EngineError::InvalidTransition);
    for ( int i = 0; i < 3; ++i )
      assert(e.advance_tick() == EngineError::None);
    assert(e.tick_count() == 3);
    assert(e.now() == synthex::Ns::from_ms(300));

    const auto st = e.get_market_state("AAPL").value();
    assert(st.tick == 2);
    assert(st.ts == synthex::Ns::from_ms(300));

    assert(e.pause() == EngineError::None);
    assert(e.state() == EngineState::Paused);
    assert(e.advance_tick() == EngineError::InvalidTransition);
    assert(e.tick_count() == 3);
    assert(e.resume() == EngineError::None);
    assert(e.advance_tick() == EngineError::None);

    assert(e.stop() == EngineError::None);
    assert(e.state() == EngineState::Stopped);
    assert(e.stop() == EngineError::NotRunning);
    assert(e.start() == EngineError::NotRunning);
    assert(e.advance_tick() == EngineError::NotRunning);

    const auto r = e.submit_order("AAPL", Side::Buy, OrderType::Market, 10);
    assert(r.status == SubmitStatus::Rejected);
    assert(r.reject_reason == RejectReason::NotRunning);

    // Queries keep working on a stopped engine
    assert(e.get_order_book("AAPL", 5).has_value());
  }

  // ----------------------------
  // 2) Symbols
  // ----------------------------
  {
    synthex::Engine e(small_config());
    const auto names = e.list_symbols();
    assert(names.size() == 3);
    assert(names[0] == "AAPL" && names[1] == "MSFT" && names[2] == "GOOGL");
    assert(e.symbol_index("GOOGL").value() == 2);
    assert(!e.symbol_index("TSLA").has_value());
    assert(!e.get_order_book("TSLA", 5).has_value());
    assert(!e.get_market_state("TSLA").has_value());

    const auto r = e.submit_order("TSLA", Side::Buy, OrderType::Market, 1);
    assert(r.reject_reason == RejectReason::UnknownSymbol);

    const auto st = e.get_market_state("MSFT").value();
    assert(st.symbol == 1);
    assert(st.last_price == 300.0);
    assert(st.volume == 0);
  }

  // ----------------------------
  // 3) External orders match immediately
  // ----------------------------
  {
    synthex::Engine e(quiet_config());
    assert(e.start() == EngineError::None);

    const auto ask = e.submit_order("AAPL", Side::Sell, OrderType::Limit, 100, 150.0);
    assert(ask.status == SubmitStatus::Resting);
    assert(synthex::id_symbol(ask.order_id) == 0);

    const auto hit = e.submit_order("AAPL", Side::Buy, OrderType::Limit, 40, 151.0);
    assert(hit.status == SubmitStatus::Filled);
    assert(hit.filled_quantity == 40);
    assert(hit.avg_fill_price == 150.0);

    const auto book = e.get_order_book("AAPL", 5).value();
    assert(book.bids.empty());
    assert(book.asks.size() == 1 && book.asks[0].qty == 60);

    const auto bad = e.submit_order("AAPL", Side::Buy, OrderType::Limit, 10);
    assert(bad.reject_reason == RejectReason::InvalidParams);
    const auto neg = e.submit_order("AAPL", Side::Buy, OrderType::Limit, 10, -1.0);
    assert(neg.reject_reason == RejectReason::InvalidParams);
    const auto empty_side = e.submit_order("AAPL", Side::Sell, OrderType::Market, 10);
    assert(empty_side.reject_reason == RejectReason::NoLiquidity);

    assert(e.cancel_order(ask.order_id));
    assert(!e.cancel_order(ask.order_id));
    assert(!e.cancel_order(0));
    assert(!e.cancel_order(synthex::make_id(1, 9)));

    assert(e.advance_tick() == EngineError::None);
    const auto st = e.get_market_state("AAPL").value();
    assert(st.volume == 40);
    assert(st.last_price == 150.0);

    bool saw_fill = false;
    e.inspect(0, [&](const synthex::SymbolContext& s) {
      saw_fill = s.last_fills().size() == 1;
      assert(s.metrics().volume == 40);
    });
    assert(saw_fill);

    const auto stats = e.stats();
    assert(stats.external_orders == 3); // InvalidParams is not counted
    assert(stats.fills == 1);
    assert(stats.volume == 40);
    e.stop();
  }

  // ----------------------------
  // 4) Same seed, same market and fill sequence; worker pool matches serial
  // ----------------------------
  {
    struct Run
    {
      std::vector<double> state;
      std::vector<synthex::u64> fills;
    };

    auto run = [](std::size_t workers) {
      synthex::EngineConfig cfg = small_config();
      cfg.workers = workers;
      synthex::Engine e(cfg);
      (void)e.start();
      Run out{};
      for ( int i = 0; i < 60; ++i ) {
        assert(e.advance_tick() == EngineError::None);
        append_fills(e, out.fills);
      }
      out.state = fingerprint(e);
      e.stop();
      return out;
    };

    const Run a = run(1);
    const Run b = run(1);
    const Run c = run(3);
    assert(!a.fills.empty());
    assert(a.fills == b.fills);
    assert(a.fills == c.fills);
    assert(a.state == b.state);
    assert(a.state == c.state);
  }

  // ----------------------------
  // 5) Every tick persists one state and one analytics row per symbol
  // ----------------------------
  {
    auto counts = std::make_shared<Counts>();
    synthex::Engine e(small_config(), std::make_unique<CountingSink>(counts));
    (void)e.start();
    for ( int i = 0; i < 20; ++i )
      (void)e.advance_tick();
    e.stop();

    const auto st = e.stats();
    assert(counts->states.load() == 60);
    assert(counts->analytics.load() == 60);
    assert(counts->fills.load() == st.fills);
    // Book snapshots on ticks 9 and 19, at most 10 levels per side
    assert(counts->levels.load() > 0);
    assert(counts->levels.load() <= 2 * 3 * 2 * 10);
    assert(st.persist.dropped == 0);
    assert(st.persist.written == st.persist.enqueued);
  }

  // ----------------------------
  // 6) Wall clock drives ticks until paused
  // ----------------------------
  {
    synthex::EngineConfig cfg = small_config();
    cfg.clock = synthex::ClockMode::WallClock;
    cfg.tick_interval = synthex::Ns::from_ms(2);
    synthex::Engine e(cfg);

    assert(e.start() == EngineError::None);
    assert(e.advance_tick() == EngineError::WrongClockMode);

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while ( e.tick_count() < 5 && std::chrono::steady_clock::now() < deadline )
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    assert(e.tick_count() >= 5);

    assert(e.pause() == EngineError::None);
    const auto frozen = e.tick_count();
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    assert(e.tick_count() == frozen);

    assert(e.stop() == EngineError::None);
  }

  // ----------------------------
  // 7) Invalid configuration is refused up front
  // ----------------------------
  {
    synthex::EngineConfig cfg = small_config();
    cfg.symbols[1].name = cfg.symbols[0].name;
    bool threw = false;
    try {
      synthex::Engine e(cfg);
    }
    catch ( const std::runtime_error& ) {
      threw = true;
    }
    assert(threw);

    cfg = small_config();
    cfg.symbols.clear();
    threw = false;
    try {
      synthex::Engine e(cfg);
    }
    catch ( const std::runtime_error& ) {
      threw = true;
    }
    assert(threw);
  }

  // ----------------------------
  // 8) Periodic book snapshots, best level first on each side
  // ----------------------------
  {
    auto rows = std::make_shared<BookRows>();
    synthex::EngineConfig cfg = quiet_config();
    cfg.persist.book_every_ticks = 2;
    synthex::Engine e(cfg, std::make_unique<BookCaptureSink>(rows));
    (void)e.start();

    (void)e.submit_order("AAPL", Side::Sell, OrderType::Limit, 100, 150.0);
    (void)e.submit_order("AAPL", Side::Sell, OrderType::Limit, 50, 151.0);
    (void)e.submit_order("AAPL", Side::Sell, OrderType::Limit, 25, 150.0);
    (void)e.submit_order("AAPL", Side::Buy, OrderType::Limit, 30, 149.0);

    assert(e.advance_tick() == EngineError::None); // tick 0: no snapshot
    assert(e.advance_tick() == EngineError::None); // tick 1: snapshot
    e.stop();

    std::lock_guard<std::mutex> lk(rows->mu);
    assert(rows->rows.size() == 3);
    for ( const auto& r : rows->rows ) {
      assert(r.symbol == "AAPL");
      assert(r.ts_ns == 200'000'000ULL);
    }
    const auto& bid = rows->rows[0];
    assert(bid.side == Side::Buy && bid.level == 0);
    assert(bid.price == 149.0 && bid.quantity == 30 && bid.num_orders == 1);
    const auto& ask0 = rows->rows[1];
    assert(ask0.side == Side::Sell && ask0.level == 0);
    assert(ask0.price == 150.0 && ask0.quantity == 125 && ask0.num_orders == 2);
    const auto& ask1 = rows->rows[2];
    assert(ask1.level == 1 && ask1.price == 151.0 && ask1.quantity == 50);
  }

  // ----------------------------
  // 9) A late external order queues behind quotes released in the last tick
  // ----------------------------
  {
    synthex::EngineConfig cfg = quiet_config();
    cfg.agents.market_makers = 1;
    synthex::SymbolContext s(0, cfg.symbols[0], cfg, nullptr);
    s.tick(0, synthex::Ns{0}, cfg.tick_interval);

    // Market maker quotes arrived 10ms into the tick
    const auto bid = s.book().best_bid();
    assert(bid.has_value());

    // Clock still reads the start of tick 0, as it does while other symbols finish
    const auto joined =
        s.submit_external(synthex::OrderRequest{Side::Buy, OrderType::Limit, 5, *bid, 0}, synthex::Ns{0});
    assert(joined.status == SubmitStatus::Resting);

    const synthex::Order* mine = s.book().find(joined.order_id);
    assert(mine != nullptr);
    assert(mine->submit_ts == cfg.tick_interval);

    const auto sweep =
        s.submit_external(synthex::OrderRequest{Side::Sell, OrderType::Market, 10, 0, 0}, synthex::Ns{0});
    assert(sweep.filled_quantity == 10);

    // The maker quote was first in line; the late order is untouched
    mine = s.book().find(joined.order_id);
    assert(mine != nullptr);
    assert(mine->remaining() == 5);
    assert(s.book().depth_qty(Side::Buy, 1) == 5 + cfg.agents.mm.quote_size - 10);
  }

  return 0;
}
