#pragma once

#include <cstddef>
#include <queue>
#include <vector>

#include "synthex/book.hpp"
#include "synthex/types.hpp"

namespace synthex
{

  enum class IntentKind : std::uint8_t
  {
    New = 0,
    Cancel = 1
  };

  /// Something a participant wants the exchange to do after the modelled latency.
  struct OrderIntent
  {
    IntentKind kind{IntentKind::New};
    OrderRequest order{}; // New
    u64 cancel_id{0};     // Cancel

    static OrderIntent limit(Side side, i64 qty, i64 price_q, u64 owner)
    {
      return OrderIntent{IntentKind::New, OrderRequest{side, OrderType::Limit, qty, price_q, owner}, 0};
    }

    static OrderIntent market(Side side, i64 qty, u64 owner)
    {
      return OrderIntent{IntentKind::New, OrderRequest{side, OrderType::Market, qty, 0, owner}, 0};
    }

    static OrderIntent cancel(u64 order_id, u64 owner)
    {
      OrderIntent it{IntentKind::Cancel, OrderRequest{}, order_id};
      it.order.owner = owner;
      return it;
    }
  };

  struct ExecParams
  {
    // Constant accept -> book latency.
    Ns latency{Ns::from_ms(10)};

    // Hard cap on queued intents. 0 => unlimited.
    std::size_t max_pending{0};
  };

  /// Outcome of accept(). On success `order_id` is the id the order will carry
  /// in the book (or the cancel target) and `release_ts` when it gets there.
  struct Pending
  {
    bool accepted{false};
    u64 order_id{0};
    Ns release_ts{0};
    RejectReason reject_reason{RejectReason::None};
  };

  /// Latency gate in front of one order book.
  ///
  /// Intents are released in (release_ts, accept sequence) order; with a
  /// constant latency that is exactly accept order, so same-timestamp
  /// submissions never reorder. Orders reach the book stamped with their
  /// release time.
  class ExecutionEngine final
  {
  public:
    explicit ExecutionEngine(OrderBook& book, const ExecParams& params = {});

    const ExecParams& params() const noexcept { return params_; }

    // Validates and enqueues. Order ids are reserved from the book here.
    Pending accept(const OrderIntent& intent, Ns now);

    // Forwards every intent with release_ts <= now to the book.
    std::vector<MatchResult> advance(Ns now);

    // Same as advance(now) but appends to `out`.
    std::size_t advance(Ns now, std::vector<MatchResult>& out);

    std::size_t pending_count() const noexcept { return queue_.size(); }

    // Earliest queued release time; Ns{0} when empty.
    Ns next_release() const noexcept;

  private:
    struct QueuedIntent
    {
      Ns release_ts;
      u64 seq;
      u64 order_id;
      OrderIntent intent;
    };
    struct QueuedCmp
    {
      bool operator()(const QueuedIntent& a, const QueuedIntent& b) const
      {
        if ( a.release_ts.value != b.release_ts.value )
          return a.release_ts.value > b.release_ts.value;
        return a.seq > b.seq;
      }
    };

    MatchResult release_(const QueuedIntent& q);

    OrderBook* book_{nullptr};
    ExecParams params_{};

    std::priority_queue<QueuedIntent, std::vector<QueuedIntent>, QueuedCmp> queue_;
    u64 next_seq_{1};
  };

} // namespace synthex
