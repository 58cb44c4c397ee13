#pragma once

#include <array>
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <variant>

#include "synthex/types.hpp"

namespace synthex
{

  // ---------------- record shapes ----------------
  // Timestamps are Unix epoch nanoseconds.

  struct FillRecord
  {
    u64 ts_ns{0};
    u64 fill_id{0};
    u64 order_id{0};
    std::string symbol;
    Side side{Side::Buy};
    double price{0.0};
    i64 quantity{0};
  };

  struct MarketStateRecord
  {
    u64 ts_ns{0};
    std::string symbol;
    double last_price{0.0};
    i64 volume{0};
    double liquidity{0.0};
    double volatility{0.0};
    double momentum{0.0};
    std::optional<double> spread;
  };

  struct AnalyticsRecord
  {
    u64 ts_ns{0};
    std::string symbol;
    std::optional<double> bid_ask_spread;
    std::optional<double> mid_price;
    std::optional<double> imbalance;
    i64 bid_depth{0};
    i64 ask_depth{0};
    std::optional<double> effective_spread;
    std::optional<double> price_impact;
    std::optional<double> realized_volatility;
  };

  // One price level of a periodic book snapshot. `level` 0 is the best price.
  struct OrderBookLevelRecord
  {
    u64 ts_ns{0};
    std::string symbol;
    Side side{Side::Buy};
    u32 level{0};
    double price{0.0};
    i64 quantity{0};
    u32 num_orders{0};
  };

  using PersistRecord = std::variant<FillRecord, MarketStateRecord, AnalyticsRecord, OrderBookLevelRecord>;

  /// Consumer side of persistence. Called from the writer thread only; may throw.
  class PersistSink
  {
  public:
    virtual ~PersistSink() = default;

    virtual void write_fill(const FillRecord& r) = 0;
    virtual void write_market_state(const MarketStateRecord& r) = 0;
    virtual void write_analytics(const AnalyticsRecord& r) = 0;
    virtual void write_orderbook_level(const OrderBookLevelRecord& r) = 0;

    virtual void flush() {}
  };

  class NullSink final : public PersistSink
  {
  public:
    void write_fill(const FillRecord&) override {}
    void write_market_state(const MarketStateRecord&) override {}
    void write_analytics(const AnalyticsRecord&) override {}
    void write_orderbook_level(const OrderBookLevelRecord&) override {}
  };

  /// Gzip CSV files partitioned by UTC day:
  ///   <root>/fills/<YYYY-MM-DD>.csv.gz
  ///   <root>/market_state/<YYYY-MM-DD>.csv.gz
  ///   <root>/analytics/<YYYY-MM-DD>.csv.gz
  ///   <root>/orderbook/<YYYY-MM-DD>.csv.gz
  /// Existing files are appended to (a new gzip member); the header row is only
  /// written when the file is created. Empty optionals are empty fields.
  class GzCsvSink final : public PersistSink
  {
  public:
    explicit GzCsvSink(std::filesystem::path root);
    ~GzCsvSink() override;

    GzCsvSink(const GzCsvSink&) = delete;
    GzCsvSink& operator=(const GzCsvSink&) = delete;

    void write_fill(const FillRecord& r) override;
    void write_market_state(const MarketStateRecord& r) override;
    void write_analytics(const AnalyticsRecord& r) override;
    void write_orderbook_level(const OrderBookLevelRecord& r) override;
    void flush() override;

    static constexpr std::string_view kFillsHeader = "timestamp,fill_id,order_id,symbol,side,price,quantity";
    static constexpr std::string_view kMarketStateHeader =
        "timestamp,symbol,last_price,volume,liquidity,volatility,momentum,spread";
    static constexpr std::string_view kAnalyticsHeader =
        "timestamp,symbol,bid_ask_spread,mid_price,imbalance,bid_depth,ask_depth,effective_spread,"
        "price_impact,realized_volatility";
    static constexpr std::string_view kOrderBookHeader = "timestamp,symbol,side,level,price,quantity,num_orders";

    // "YYYY-MM-DD" (UTC) of a Unix-epoch nanosecond timestamp.
    static std::string day_of(u64 ts_ns);

    // Path a record of `table` at `ts_ns` goes to.
    std::filesystem::path partition_path(std::string_view table, u64 ts_ns) const;

  private:
    struct GzWriter;

    enum class Table : std::size_t
    {
      Fills = 0,
      MarketState = 1,
      Analytics = 2,
      OrderBook = 3
    };

    struct Partition
    {
      std::string day;
      std::unique_ptr<GzWriter> out;
    };

    GzWriter& open_(Table t, u64 ts_ns);
    void emit_(Table t, u64 ts_ns);

    std::filesystem::path root_;
    std::array<Partition, 4> parts_;
    std::string line_;
  };

  struct PersistStats
  {
    u64 enqueued{0};
    u64 written{0};
    u64 dropped{0}; // queue full at enqueue time
    u64 failed{0};  // sink threw
  };

  /// Bounded multi-producer queue drained by one writer thread.
  ///
  /// try_push() never waits on the sink: a full queue drops the record and bumps
  /// `dropped`. Sink exceptions are counted in `failed` and logged at a limited
  /// rate; they never reach the producer.
  class AsyncPersister final
  {
  public:
    AsyncPersister(std::unique_ptr<PersistSink> sink, std::size_t capacity);
    ~AsyncPersister();

    AsyncPersister(const AsyncPersister&) = delete;
    AsyncPersister& operator=(const AsyncPersister&) = delete;

    bool try_push(PersistRecord rec);

    // Blocks until everything enqueued so far has been handed to the sink, then
    // flushes the sink.
    void drain();

    // Drains, flushes and joins the writer. Later pushes are dropped.
    void stop();

    PersistStats stats() const noexcept;
    std::size_t capacity() const noexcept { return capacity_; }

  private:
    void run_();
    void write_one_(const PersistRecord& rec);
    void flush_sink_();

    std::unique_ptr<PersistSink> sink_;
    std::size_t capacity_{0};

    std::mutex mu_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    std::deque<PersistRecord> q_;
    bool stop_{false};
    bool busy_{false};
    bool flush_requested_{false};

    std::atomic<u64> enqueued_{0};
    std::atomic<u64> written_{0};
    std::atomic<u64> dropped_{0};
    std::atomic<u64> failed_{0};

    std::thread worker_;
  };

} // namespace synthex
