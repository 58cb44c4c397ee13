#include <zlib.h>

#include <atomic>
#include <cassert>
#include <condition_variable>
#include <filesystem>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "synthex/persist.hpp"

namespace fs = std::filesystem;

namespace
{
  // Blocks inside write_fill until released, so the queue can be filled up.
  struct GateState
  {
    std::mutex mu;
    std::condition_variable cv;
    bool entered{false};
    bool open{false};
  };

  class GatedSink final : public synthex::PersistSink
  {
  public:
    explicit GatedSink(std::shared_ptr<GateState> g) : g_(std::move(g)) {}

    void write_fill(const synthex::FillRecord&) override
    {
      std::unique_lock<std::mutex> lk(g_->mu);
      g_->entered = true;
      g_->cv.notify_all();
      g_->cv.wait(lk, [&]() { return g_->open; });
    }
    void write_market_state(const synthex::MarketStateRecord&) override {}
    void write_analytics(const synthex::AnalyticsRecord&) override {}
    void write_orderbook_level(const synthex::OrderBookLevelRecord&) override {}

  private:
    std::shared_ptr<GateState> g_;
  };

  class FailingSink final : public synthex::PersistSink
  {
  public:
    void write_fill(const synthex::FillRecord&) override { throw std::runtime_error("disk full"); }
    void write_market_state(const synthex::MarketStateRecord&) override {}
    void write_analytics(const synthex::AnalyticsRecord&) override {}
    void write_orderbook_level(const synthex::OrderBookLevelRecord&) override {}
  };

  // Throws something that is not a std::exception, from writes and from flush.
  class OddThrowSink final : public synthex::PersistSink
  {
  public:
    void write_fill(const synthex::FillRecord&) override { throw 42; }
    void write_market_state(const synthex::MarketStateRecord&) override {}
    void write_analytics(const synthex::AnalyticsRecord&) override {}
    void write_orderbook_level(const synthex::OrderBookLevelRecord&) override {}
    void flush() override { throw "flush"; }
  };

  synthex::FillRecord fill(synthex::u64 ts_ns, synthex::u64 id)
  {
    synthex::FillRecord r{};
    r.ts_ns = ts_ns;
    r.fill_id = id;
    r.order_id = id;
    r.symbol = "AAPL";
    r.side = synthex::Side::Buy;
    r.price = 150.25;
    r.quantity = 10;
    return r;
  }

  std::vector<std::string> read_gz_lines(const fs::path& p)
  {
    std::vector<std::string> lines;
    gzFile f = gzopen(p.string().c_str(), "rb");
    assert(f != nullptr);
    char buf[1024];
    while ( gzgets(f, buf, sizeof(buf)) != nullptr ) {
      std::string s(buf);
      if ( !s.empty() && s.back() == '\n' )
        s.pop_back();
      lines.push_back(s);
    }
    gzclose(f);
    return lines;
  }

} // namespace

int main()
{
  // ----------------------------
  // 1) UTC day partitions
  // ----------------------------
  {
    assert(synthex::GzCsvSink::day_of(0) == "1970-01-01");
    assert(synthex::GzCsvSink::day_of(86'400'000'000'000ULL - 1) == "1970-01-01");
    assert(synthex::GzCsvSink::day_of(86'400'000'000'000ULL) == "1970-01-02");
    assert(synthex::GzCsvSink::day_of(1'700'000'000'000'000'000ULL) == "2023-11-14");
  }

  // ----------------------------
  // 2) Full queue drops instead of blocking the producer
  // ----------------------------
  {
    auto gate = std::make_shared<GateState>();
    synthex::AsyncPersister p(std::make_unique<GatedSink>(gate), 2);

    assert(p.try_push(fill(0, 1)));
    {
      // Writer holds record 1 and is stuck in the sink
      std::unique_lock<std::mutex> lk(gate->mu);
      gate->cv.wait(lk, [&]() { return gate->entered; });
    }

    assert(p.try_push(fill(0, 2)));
    assert(p.try_push(fill(0, 3)));
    assert(!p.try_push(fill(0, 4)));
    assert(p.stats().dropped == 1);

    {
      std::lock_guard<std::mutex> lk(gate->mu);
      gate->open = true;
    }
    gate->cv.notify_all();

    p.drain();
    const auto st = p.stats();
    assert(st.enqueued == 3);
    assert(st.written == 3);
    assert(st.dropped == 1);
    assert(st.failed == 0);

    p.stop();
    assert(!p.try_push(fill(0, 5)));
    assert(p.stats().dropped == 2);
  }

  // ----------------------------
  // 3) Sink failures are counted, never propagated
  // ----------------------------
  {
    synthex::AsyncPersister p(std::make_unique<FailingSink>(), 64);
    for ( synthex::u64 i = 0; i < 5; ++i )
      assert(p.try_push(fill(0, i)));
    assert(p.try_push(synthex::MarketStateRecord{}));
    p.drain();

    const auto st = p.stats();
    assert(st.failed == 5);
    assert(st.written == 1);

    // Non-standard exceptions are counted too and the writer keeps going
    synthex::AsyncPersister q(std::make_unique<OddThrowSink>(), 64);
    assert(q.try_push(fill(0, 1)));
    assert(q.try_push(synthex::AnalyticsRecord{}));
    q.drain();
    assert(q.stats().written == 1);
    assert(q.stats().failed == 2); // the fill and the flush

    assert(q.try_push(synthex::MarketStateRecord{}));
    q.drain();
    assert(q.stats().written == 2);
    assert(q.stats().failed == 3);
  }

  // ----------------------------
  // 4) Gzip CSV layout, header once per file, append across sinks
  // ----------------------------
  {
    const fs::path root = fs::temp_directory_path() / "synthex_test_persist";
    fs::remove_all(root);

    {
      synthex::GzCsvSink sink(root);
      assert(fs::is_directory(root / "fills"));
      assert(fs::is_directory(root / "market_state"));
      assert(fs::is_directory(root / "analytics"));
      assert(fs::is_directory(root / "orderbook"));

      sink.write_fill(fill(5, 65'536));

      synthex::AnalyticsRecord a{};
      a.ts_ns = 5;
      a.symbol = "AAPL";
      a.bid_depth = 7;
      a.imbalance = 0.5;
      sink.write_analytics(a);

      synthex::MarketStateRecord m{};
      m.ts_ns = 86'400'000'000'000ULL; // next day
      m.symbol = "AAPL";
      m.last_price = 150.0;
      m.volume = 10;
      sink.write_market_state(m);

      synthex::OrderBookLevelRecord lv{};
      lv.ts_ns = 5;
      lv.symbol = "AAPL";
      lv.side = synthex::Side::Sell;
      lv.level = 1;
      lv.price = 150.5;
      lv.quantity = 200;
      lv.num_orders = 2;
      sink.write_orderbook_level(lv);
      sink.flush();
    }

    {
      synthex::GzCsvSink sink(root);
      sink.write_fill(fill(6, 131'072));
    }

    const auto fills = read_gz_lines(root / "fills" / "1970-01-01.csv.gz");
    assert(fills.size() == 3);
    assert(fills[0] == synthex::GzCsvSink::kFillsHeader);
    assert(fills[1] == "5,65536,65536,AAPL,buy,150.25,10");
    assert(fills[2] == "6,131072,131072,AAPL,buy,150.25,10");

    const auto analytics = read_gz_lines(root / "analytics" / "1970-01-01.csv.gz");
    assert(analytics.size() == 2);
    assert(analytics[0] == synthex::GzCsvSink::kAnalyticsHeader);
    assert(analytics[1] == "5,AAPL,,,0.5,7,0,,,");

    const auto states = read_gz_lines(root / "market_state" / "1970-01-02.csv.gz");
    assert(states.size() == 2);
    assert(states[1] == "86400000000000,AAPL,150,10,0,0,0,");
    assert(!fs::exists(root / "market_state" / "1970-01-01.csv.gz"));

    const auto levels = read_gz_lines(root / "orderbook" / "1970-01-01.csv.gz");
    assert(levels.size() == 2);
    assert(levels[0] == synthex::GzCsvSink::kOrderBookHeader);
    assert(levels[1] == "5,AAPL,sell,1,150.5,200,2");

    fs::remove_all(root);
  }

  return 0;
}
