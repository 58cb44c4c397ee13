#include "synthex/persist.hpp"

#include <zlib.h>

#include <chrono>
#include <cstdio>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace synthex
{

  namespace
  {

    constexpr std::string_view kTableNames[4] = {"fills", "market_state", "analytics", "orderbook"};

    void append_u64(std::string& s, u64 v) { s += std::to_string(v); }

    void append_i64(std::string& s, i64 v) { s += std::to_string(v); }

    void append_double(std::string& s, double v)
    {
      char buf[64];
      const int n = std::snprintf(buf, sizeof(buf), "%.10g", v);
      if ( n > 0 )
        s.append(buf, static_cast<std::size_t>(n));
    }

    void append_opt(std::string& s, const std::optional<double>& v)
    {
      if ( v )
        append_double(s, *v);
    }

  } // namespace

  /* RAII wrapper for a gzFile opened for append. */
  struct GzCsvSink::GzWriter
  {
    gzFile f{nullptr};
    std::string path;

    explicit GzWriter(const fs::path& p) : path(p.string())
    {
      f = gzopen(path.c_str(), "ab");
      if ( !f )
        throw std::runtime_error("gzopen failed for: " + path);
    }

    ~GzWriter()
    {
      if ( f )
        gzclose(f);
    }

    GzWriter(const GzWriter&) = delete;
    GzWriter& operator=(const GzWriter&) = delete;

    void write(std::string_view data)
    {
      if ( data.empty() )
        return;
      const int n = gzwrite(f, data.data(), static_cast<unsigned>(data.size()));
      if ( n <= 0 || static_cast<std::size_t>(n) != data.size() ) {
        int errnum = 0;
        const char* msg = gzerror(f, &errnum);
        throw std::runtime_error("gzwrite failed for: " + path + " : " + (msg ? msg : "unknown"));
      }
    }

    void flush()
    {
      if ( gzflush(f, Z_SYNC_FLUSH) != Z_OK )
        throw std::runtime_error("gzflush failed for: " + path);
    }
  };

  GzCsvSink::GzCsvSink(fs::path root) : root_(std::move(root))
  {
    for ( const std::string_view t : kTableNames ) {
      std::error_code ec;
      fs::create_directories(root_ / std::string(t), ec);
      if ( ec )
        throw std::runtime_error("Failed to create output directory: " + (root_ / std::string(t)).string());
    }
  }

  GzCsvSink::~GzCsvSink() = default;

  std::string GzCsvSink::day_of(u64 ts_ns)
  {
    using namespace std::chrono;
    const auto days_since_epoch = static_cast<int>(ts_ns / 86'400'000'000'000ULL);
    const year_month_day ymd{sys_days{days{days_since_epoch}}};

    char buf[16];
    std::snprintf(
        buf,
        sizeof(buf),
        "%04d-%02u-%02u",
        static_cast<int>(ymd.year()),
        static_cast<unsigned>(ymd.month()),
        static_cast<unsigned>(ymd.day()));
    return std::string(buf);
  }

  fs::path GzCsvSink::partition_path(std::string_view table, u64 ts_ns) const
  {
    return root_ / std::string(table) / (day_of(ts_ns) + ".csv.gz");
  }

  GzCsvSink::GzWriter& GzCsvSink::open_(Table t, u64 ts_ns)
  {
    const auto ti = static_cast<std::size_t>(t);
    Partition& p = parts_[ti];

    std::string day = day_of(ts_ns);
    if ( p.out && p.day == day )
      return *p.out;

    // Day rolled over (or first record): close the old file before opening the next.
    p.out.reset();

    const fs::path path = partition_path(kTableNames[ti], ts_ns);
    const bool fresh = !fs::exists(path);

    auto w = std::make_unique<GzWriter>(path);
    if ( fresh ) {
      static constexpr std::string_view kHeaders[4] = {
          kFillsHeader, kMarketStateHeader, kAnalyticsHeader, kOrderBookHeader};
      w->write(kHeaders[ti]);
      w->write("\n");
    }

    p.day = std::move(day);
    p.out = std::move(w);
    return *p.out;
  }

  void GzCsvSink::emit_(Table t, u64 ts_ns)
  {
    line_ += '\n';
    open_(t, ts_ns).write(line_);
  }

  void GzCsvSink::write_fill(const FillRecord& r)
  {
    line_.clear();
    append_u64(line_, r.ts_ns);
    line_ += ',';
    append_u64(line_, r.fill_id);
    line_ += ',';
    append_u64(line_, r.order_id);
    line_ += ',';
    line_ += r.symbol;
    line_ += ',';
    line_ += to_string(r.side);
    line_ += ',';
    append_double(line_, r.price);
    line_ += ',';
    append_i64(line_, r.quantity);
    emit_(Table::Fills, r.ts_ns);
  }

  void GzCsvSink::write_market_state(const MarketStateRecord& r)
  {
    line_.clear();
    append_u64(line_, r.ts_ns);
    line_ += ',';
    line_ += r.symbol;
    line_ += ',';
    append_double(line_, r.last_price);
    line_ += ',';
    append_i64(line_, r.volume);
    line_ += ',';
    append_double(line_, r.liquidity);
    line_ += ',';
    append_double(line_, r.volatility);
    line_ += ',';
    append_double(line_, r.momentum);
    line_ += ',';
    append_opt(line_, r.spread);
    emit_(Table::MarketState, r.ts_ns);
  }

  void GzCsvSink::write_analytics(const AnalyticsRecord& r)
  {
    line_.clear();
    append_u64(line_, r.ts_ns);
    line_ += ',';
    line_ += r.symbol;
    line_ += ',';
    append_opt(line_, r.bid_ask_spread);
    line_ += ',';
    append_opt(line_, r.mid_price);
    line_ += ',';
    append_opt(line_, r.imbalance);
    line_ += ',';
    append_i64(line_, r.bid_depth);
    line_ += ',';
    append_i64(line_, r.ask_depth);
    line_ += ',';
    append_opt(line_, r.effective_spread);
    line_ += ',';
    append_opt(line_, r.price_impact);
    line_ += ',';
    append_opt(line_, r.realized_volatility);
    emit_(Table::Analytics, r.ts_ns);
  }

  void GzCsvSink::write_orderbook_level(const OrderBookLevelRecord& r)
  {
    line_.clear();
    append_u64(line_, r.ts_ns);
    line_ += ',';
    line_ += r.symbol;
    line_ += ',';
    line_ += to_string(r.side);
    line_ += ',';
    append_u64(line_, r.level);
    line_ += ',';
    append_double(line_, r.price);
    line_ += ',';
    append_i64(line_, r.quantity);
    line_ += ',';
    append_u64(line_, r.num_orders);
    emit_(Table::OrderBook, r.ts_ns);
  }

  void GzCsvSink::flush()
  {
    for ( Partition& p : parts_ ) {
      if ( p.out )
        p.out->flush();
    }
  }

} // namespace synthex
