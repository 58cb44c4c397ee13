#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <unordered_map>
#include <vector>

#include "synthex/types.hpp"

namespace synthex
{

  struct BookParams
  {
    // Basic self-trade prevention: reject an incoming order that would trade
    // against a resting order of the same (non-zero) owner.
    StpPolicy stp{StpPolicy::RejectIncoming};

    // Hard cap on resting orders per book. 0 => unlimited.
    std::size_t max_resting_orders{0};
  };

  /// Order parameters as they reach the book.
  struct OrderRequest
  {
    Side side{Side::Buy};
    OrderType type{OrderType::Limit};
    i64 qty{0};
    i64 price_q{0}; // required for Limit, ignored for Market

    // 0 = external participant. Agents use their agent id + 1.
    u64 owner{0};
  };

  /// Order as stored in the book arena. Only resting orders occupy a slot.
  struct Order
  {
    u64 id{0};
    u64 owner{0};
    u32 symbol{0};
    OrderType type{OrderType::Limit};
    Side side{Side::Buy};

    i64 price_q{0};
    i64 qty{0};
    i64 filled_qty{0};

    Ns submit_ts{0};

    OrderState state{OrderState::Pending};
    RejectReason reject_reason{RejectReason::None};

    // Intrusive per-price FIFO list pointers (indices into the arena).
    u64 bucket_prev{kInvalidIndex};
    u64 bucket_next{kInvalidIndex};

    i64 remaining() const noexcept { return qty - filled_qty; }
  };

  /// One execution against one resting order. Immutable once emitted.
  struct Fill
  {
    u64 fill_id{0};
    u64 order_id{0};       // incoming (taker) order
    u64 maker_order_id{0}; // consumed resting order
    u32 symbol{0};
    Side side{Side::Buy}; // taker side
    i64 price_q{0};
    i64 qty{0};
    Ns ts{0};

    u64 taker_owner{0};
    u64 maker_owner{0};

    // Book mid when the taker order arrived; 0 if either side was empty.
    double mid_at_submit{0.0};

    double price() const noexcept { return to_price(price_q); }
  };

  struct MatchResult
  {
    u64 order_id{0};
    Side side{Side::Buy};
    OrderType type{OrderType::Limit};

    // Final state of the incoming order after this call.
    OrderState state{OrderState::Rejected};
    RejectReason reject_reason{RejectReason::None};

    // True when the result acknowledges a cancel instead of a new order.
    bool cancel{false};

    i64 requested_qty{0};
    i64 filled_qty{0};
    double filled_notional{0.0};

    std::vector<Fill> fills;

    SubmitStatus status() const noexcept;

    // 0.0 when nothing filled.
    double avg_fill_price() const noexcept
    {
      return filled_qty > 0 ? filled_notional / static_cast<double>(filled_qty) : 0.0;
    }
  };

  struct LevelView
  {
    i64 price_q{0};
    i64 qty{0};
    u32 order_count{0};
  };

  /// Aggregated levels, best price first on both sides.
  struct BookSnapshot
  {
    std::vector<LevelView> bids;
    std::vector<LevelView> asks;
  };

  /// Per-symbol limit order book with price-time priority.
  ///
  /// Layout:
  /// - Resting orders live in an arena (orders_) and are recycled through a free list.
  /// - Each side is a flat ladder: prices sorted ascending with a parallel vector of
  ///   buckets. Best bid is the back of the bid ladder, best ask the front of the ask
  ///   ladder.
  /// - A bucket is an intrusive doubly-linked FIFO through Order::bucket_prev/next,
  ///   ordered by (submit_ts, id).
  ///
  /// Threading: none. The owning symbol context serialises access.
  class OrderBook final
  {
  public:
    explicit OrderBook(u32 symbol, const BookParams& params = {});

    u32 symbol() const noexcept { return symbol_; }
    const BookParams& params() const noexcept { return params_; }

    // Reserves the next order id without submitting (used by the execution
    // engine to hand out ids at accept time).
    [[nodiscard]] u64 reserve_id() noexcept;

    // Submits with a freshly allocated id.
    MatchResult submit(const OrderRequest& req, Ns ts);

    // Submits under an id previously obtained from reserve_id().
    MatchResult submit(u64 order_id, const OrderRequest& req, Ns ts);

    // Removes a resting order. False if unknown, filled or already cancelled.
    bool cancel(u64 order_id);

    BookSnapshot snapshot(std::size_t depth) const;

    std::optional<i64> best_bid() const noexcept;
    std::optional<i64> best_ask() const noexcept;
    std::optional<double> mid() const noexcept;

    // Total resting quantity over the best `levels` levels of one side.
    i64 depth_qty(Side side, std::size_t levels) const noexcept;

    std::size_t level_count(Side side) const noexcept;
    std::size_t resting_count() const noexcept { return id_to_index_.size(); }

    // Resting order by id, nullptr if not resting.
    const Order* find(u64 order_id) const;

    static RejectReason validate(const OrderRequest& req) noexcept;

    // Full structural audit (level totals, ordering, no cross). Aborts on failure.
    void audit() const;

  private:
    struct Bucket
    {
      u64 head{kInvalidIndex};
      u64 tail{kInvalidIndex};
      u32 size{0};
      i64 total_qty{0};
    };

    struct Ladder
    {
      std::vector<i64> prices; // sorted ascending
      std::vector<Bucket> buckets;

      bool empty() const noexcept { return prices.empty(); }
    };

    struct CrossingScan
    {
      i64 available_qty{0};
      bool self_trade{false};
    };

    Ladder& ladder_(Side side) noexcept { return side == Side::Buy ? bids_ : asks_; }
    const Ladder& ladder_(Side side) const noexcept { return side == Side::Buy ? bids_ : asks_; }

    // Index of the best level on a side (kInvalidIndex if empty).
    static u64 best_idx_(const Ladder& l, Side side) noexcept;

    static bool crosses_(Side incoming, const OrderRequest& req, i64 level_price_q) noexcept;

    CrossingScan scan_crossing_(const OrderRequest& req) const;

    void match_(const OrderRequest& req, u64 order_id, Ns ts, MatchResult& out);
    void rest_(const OrderRequest& req, u64 order_id, Ns ts, i64 filled_qty);

    // Price-bucket helpers (log P lookup, contiguous iteration)
    u64 find_bucket_idx_(const Ladder& l, i64 price_q) const;
    u64 get_or_insert_bucket_idx_(Ladder& l, i64 price_q);
    void erase_bucket_(Ladder& l, u64 idx);

    void bucket_insert_(Bucket& b, u64 order_idx);
    void bucket_unlink_(Bucket& b, u64 order_idx);

    u64 alloc_slot_();
    void release_slot_(u64 order_idx);

    u32 symbol_{0};
    BookParams params_{};

    u64 next_order_seq_{1};
    u64 next_fill_seq_{1};

    std::vector<Order> orders_;
    std::vector<u64> free_slots_;

    // Resting order id -> arena index.
    std::unordered_map<u64, u64> id_to_index_;

    Ladder bids_;
    Ladder asks_;
  };

} // namespace synthex
