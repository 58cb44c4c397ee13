#include <algorithm>

#include "synthex/book.hpp"
#include "synthex/log.hpp"

namespace synthex
{

  bool OrderBook::crosses_(Side incoming, const OrderRequest& req, i64 level_price_q) noexcept
  {
    if ( req.type == OrderType::Market )
      return true;
    return incoming == Side::Buy ? level_price_q <= req.price_q : level_price_q >= req.price_q;
  }

  // Dry run of the match walk: how much crossing quantity is reachable for this
  // order, and whether the walk would touch one of the owner's own resting orders.
  OrderBook::CrossingScan OrderBook::scan_crossing_(const OrderRequest& req) const
  {
    CrossingScan s{};
    const Side opp = opposite(req.side);
    const Ladder& l = ladder_(opp);
    const std::size_t n = l.prices.size();

    for ( std::size_t k = 0; k < n && s.available_qty < req.qty; ++k ) {
      const std::size_t i = (opp == Side::Buy) ? n - 1 - k : k;
      if ( !crosses_(req.side, req, l.prices[i]) )
        break;

      for ( u64 cur = l.buckets[i].head; cur != kInvalidIndex && s.available_qty < req.qty;
            cur = orders_[cur].bucket_next ) {
        const Order& r = orders_[cur];
        if ( req.owner != 0 && r.owner == req.owner ) {
          s.self_trade = true;
          return s;
        }
        s.available_qty += r.remaining();
      }
    }
    return s;
  }

  // Walks the opposite side best price outward, FIFO within a level, emitting one
  // fill per consumed resting order. Levels are erased once their bucket empties.
  void OrderBook::match_(const OrderRequest& req, u64 order_id, Ns ts, MatchResult& out)
  {
    const Side opp = opposite(req.side);
    Ladder& l = ladder_(opp);
    const double mid_before = mid().value_or(0.0);

    i64 rem = req.qty;
    while ( rem > 0 && !l.empty() ) {
      const u64 li = best_idx_(l, opp);
      const i64 px = l.prices[li];
      if ( !crosses_(req.side, req, px) )
        break;

      Bucket& b = l.buckets[li];
      u64 cur = b.head;
      while ( rem > 0 && cur != kInvalidIndex ) {
        Order& r = orders_[cur];
        const u64 next = r.bucket_next;

        const i64 dq = std::min(rem, r.remaining());
        SYNTHEX_ASSERT(dq > 0);

        r.filled_qty += dq;
        b.total_qty -= dq;
        rem -= dq;
        SYNTHEX_ASSERT(r.remaining() >= 0);
        SYNTHEX_ASSERT(b.total_qty >= 0);

        out.fills.push_back(Fill{
            .fill_id = make_id(next_fill_seq_++, symbol_),
            .order_id = order_id,
            .maker_order_id = r.id,
            .symbol = symbol_,
            .side = req.side,
            .price_q = px,
            .qty = dq,
            .ts = ts,
            .taker_owner = req.owner,
            .maker_owner = r.owner,
            .mid_at_submit = mid_before});
        out.filled_qty += dq;
        out.filled_notional += to_price(px) * static_cast<double>(dq);

        if ( r.remaining() == 0 ) {
          r.state = OrderState::Filled;
          bucket_unlink_(b, cur);
          release_slot_(cur);
        }
        else {
          r.state = OrderState::Partial;
        }

        cur = next;
      }

      if ( b.size == 0 )
        erase_bucket_(l, li);
    }
  }

  void OrderBook::rest_(const OrderRequest& req, u64 order_id, Ns ts, i64 filled_qty)
  {
    const u64 idx = alloc_slot_();
    Order& o = orders_[idx];
    o.id = order_id;
    o.owner = req.owner;
    o.symbol = symbol_;
    o.type = OrderType::Limit;
    o.side = req.side;
    o.price_q = req.price_q;
    o.qty = req.qty;
    o.filled_qty = filled_qty;
    o.submit_ts = ts;
    o.state = filled_qty > 0 ? OrderState::Partial : OrderState::Resting;
    o.reject_reason = RejectReason::None;

    const bool inserted = id_to_index_.emplace(order_id, idx).second;
    SYNTHEX_ASSERT(inserted);

    Ladder& l = ladder_(req.side);
    const u64 bi = get_or_insert_bucket_idx_(l, req.price_q);
    bucket_insert_(l.buckets[bi], idx);
  }

} // namespace synthex
