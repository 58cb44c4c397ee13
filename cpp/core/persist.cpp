#include "synthex/persist.hpp"

#include <exception>
#include <string>

#include "synthex/log.hpp"

namespace synthex
{

  namespace
  {

    constexpr u64 kWarnEvery = 1'000;

    struct SinkWriter
    {
      PersistSink& sink;

      void operator()(const FillRecord& r) const { sink.write_fill(r); }
      void operator()(const MarketStateRecord& r) const { sink.write_market_state(r); }
      void operator()(const AnalyticsRecord& r) const { sink.write_analytics(r); }
      void operator()(const OrderBookLevelRecord& r) const { sink.write_orderbook_level(r); }
    };

    void warn_failure(u64 n, const char* what)
    {
      if ( n != 1 && n % kWarnEvery != 0 )
        return;
      log::warn("persist: sink failure #" + std::to_string(n) + ": " + what);
    }

  } // namespace

  AsyncPersister::AsyncPersister(std::unique_ptr<PersistSink> sink, std::size_t capacity)
      : sink_(std::move(sink)), capacity_(capacity)
  {
    SYNTHEX_ASSERT(sink_ != nullptr);
    SYNTHEX_ASSERT(capacity_ > 0);
    worker_ = std::thread([this]() { run_(); });
  }

  AsyncPersister::~AsyncPersister() { stop(); }

  bool AsyncPersister::try_push(PersistRecord rec)
  {
    {
      std::lock_guard<std::mutex> lk(mu_);
      if ( stop_ || q_.size() >= capacity_ ) {
        dropped_.fetch_add(1, std::memory_order_relaxed);
        return false;
      }
      q_.push_back(std::move(rec));
      enqueued_.fetch_add(1, std::memory_order_relaxed);
    }
    cv_.notify_one();
    return true;
  }

  void AsyncPersister::drain()
  {
    std::unique_lock<std::mutex> lk(mu_);
    if ( stop_ )
      return;
    flush_requested_ = true;
    cv_.notify_one();
    idle_cv_.wait(lk, [&]() { return q_.empty() && !busy_ && !flush_requested_; });
  }

  void AsyncPersister::stop()
  {
    {
      std::lock_guard<std::mutex> lk(mu_);
      stop_ = true;
    }
    cv_.notify_all();
    if ( worker_.joinable() )
      worker_.join();
  }

  PersistStats AsyncPersister::stats() const noexcept
  {
    PersistStats s{};
    s.enqueued = enqueued_.load(std::memory_order_relaxed);
    s.written = written_.load(std::memory_order_relaxed);
    s.dropped = dropped_.load(std::memory_order_relaxed);
    s.failed = failed_.load(std::memory_order_relaxed);
    return s;
  }

  void AsyncPersister::run_()
  {
    std::deque<PersistRecord> batch;

    for ( ;; ) {
      bool do_flush = false;
      {
        std::unique_lock<std::mutex> lk(mu_);
        cv_.wait(lk, [&]() { return stop_ || flush_requested_ || !q_.empty(); });
        if ( stop_ && q_.empty() && !flush_requested_ )
          break;

        batch.swap(q_);
        do_flush = flush_requested_;
        flush_requested_ = false;
        busy_ = true;
      }

      for ( const PersistRecord& rec : batch )
        write_one_(rec);
      batch.clear();

      if ( do_flush )
        flush_sink_();

      {
        std::lock_guard<std::mutex> lk(mu_);
        busy_ = false;
      }
      idle_cv_.notify_all();
    }

    flush_sink_();
  }

  void AsyncPersister::write_one_(const PersistRecord& rec)
  {
    try {
      std::visit(SinkWriter{*sink_}, rec);
      written_.fetch_add(1, std::memory_order_relaxed);
    }
    catch ( const std::exception& e ) {
      warn_failure(failed_.fetch_add(1, std::memory_order_relaxed) + 1, e.what());
    }
    catch ( ... ) {
      warn_failure(failed_.fetch_add(1, std::memory_order_relaxed) + 1, "unknown error");
    }
  }

  void AsyncPersister::flush_sink_()
  {
    try {
      sink_->flush();
    }
    catch ( const std::exception& e ) {
      warn_failure(failed_.fetch_add(1, std::memory_order_relaxed) + 1, e.what());
    }
    catch ( ... ) {
      warn_failure(failed_.fetch_add(1, std::memory_order_relaxed) + 1, "unknown error");
    }
  }

} // namespace synthex
