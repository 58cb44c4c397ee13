#include "synthex/book.hpp"
#include "synthex/log.hpp"

namespace synthex
{

  SubmitStatus MatchResult::status() const noexcept
  {
    switch ( state ) {
      case OrderState::Filled:
        return SubmitStatus::Filled;
      case OrderState::Partial:
        return SubmitStatus::PartiallyFilled;
      case OrderState::Resting:
        return SubmitStatus::Resting;
      case OrderState::Cancelled:
        // market remainder discarded after a partial fill
        return filled_qty > 0 ? SubmitStatus::PartiallyFilled : SubmitStatus::Rejected;
      case OrderState::Pending:
      case OrderState::Rejected:
        break;
    }
    return SubmitStatus::Rejected;
  }

  OrderBook::OrderBook(u32 symbol, const BookParams& params) : symbol_(symbol), params_(params)
  {
    SYNTHEX_ASSERT(symbol <= kSymbolMask);
  }

  u64 OrderBook::reserve_id() noexcept { return make_id(next_order_seq_++, symbol_); }

  RejectReason OrderBook::validate(const OrderRequest& req) noexcept
  {
    if ( req.qty <= 0 )
      return RejectReason::InvalidParams;
    if ( req.type == OrderType::Limit && req.price_q <= 0 )
      return RejectReason::InvalidParams;
    return RejectReason::None;
  }

  MatchResult OrderBook::submit(const OrderRequest& req, Ns ts)
  {
    // Validate before reserving so a rejected order leaves the id sequence alone.
    const RejectReason vr = validate(req);
    if ( vr != RejectReason::None ) {
      MatchResult out{};
      out.side = req.side;
      out.type = req.type;
      out.requested_qty = req.qty;
      out.state = OrderState::Rejected;
      out.reject_reason = vr;
      return out;
    }
    return submit(reserve_id(), req, ts);
  }

  MatchResult OrderBook::submit(u64 order_id, const OrderRequest& req, Ns ts)
  {
    MatchResult out{};
    out.order_id = order_id;
    out.side = req.side;
    out.type = req.type;
    out.requested_qty = req.qty;

    auto reject = [&](RejectReason r) {
      out.state = OrderState::Rejected;
      out.reject_reason = r;
      return out;
    };

    const RejectReason vr = validate(req);
    if ( vr != RejectReason::None )
      return reject(vr);

    SYNTHEX_ASSERT(id_symbol(order_id) == symbol_);

    const bool check_stp = params_.stp == StpPolicy::RejectIncoming && req.owner != 0;
    const bool check_cap = params_.max_resting_orders > 0 && req.type == OrderType::Limit;
    if ( check_stp || check_cap ) {
      const CrossingScan s = scan_crossing_(req);
      if ( check_stp && s.self_trade )
        return reject(RejectReason::SelfTradePrevention);
      if ( check_cap && s.available_qty < req.qty && resting_count() >= params_.max_resting_orders )
        return reject(RejectReason::InsufficientResources);
    }

    match_(req, order_id, ts, out);

    const i64 rem = req.qty - out.filled_qty;
    SYNTHEX_ASSERT(rem >= 0);

    if ( req.type == OrderType::Market ) {
      if ( out.filled_qty == 0 ) {
        out.state = OrderState::Rejected;
        out.reject_reason = RejectReason::NoLiquidity;
      }
      else {
        out.state = rem == 0 ? OrderState::Filled : OrderState::Cancelled;
      }
    }
    else if ( rem == 0 ) {
      out.state = OrderState::Filled;
    }
    else {
      rest_(req, order_id, ts, out.filled_qty);
      out.state = out.filled_qty > 0 ? OrderState::Partial : OrderState::Resting;
    }

    if ( !bids_.empty() && !asks_.empty() )
      SYNTHEX_ASSERT(bids_.prices.back() < asks_.prices.front());

    return out;
  }

  bool OrderBook::cancel(u64 order_id)
  {
    auto it = id_to_index_.find(order_id);
    if ( it == id_to_index_.end() )
      return false;

    const u64 idx = it->second;
    Order& o = orders_[idx];
    SYNTHEX_ASSERT(is_resting(o.state));

    Ladder& l = ladder_(o.side);
    const u64 bi = find_bucket_idx_(l, o.price_q);
    SYNTHEX_ASSERT(bi != kInvalidIndex);

    Bucket& b = l.buckets[bi];
    bucket_unlink_(b, idx);
    o.state = OrderState::Cancelled;
    if ( b.size == 0 )
      erase_bucket_(l, bi);

    release_slot_(idx);
    return true;
  }

  BookSnapshot OrderBook::snapshot(std::size_t depth) const
  {
    BookSnapshot snap;

    auto collect = [depth](const Ladder& l, Side side, std::vector<LevelView>& out) {
      const std::size_t n = l.prices.size();
      const std::size_t take = (depth == 0 || depth > n) ? n : depth;
      out.reserve(take);
      for ( std::size_t k = 0; k < take; ++k ) {
        const std::size_t i = side == Side::Buy ? n - 1 - k : k;
        out.push_back(LevelView{l.prices[i], l.buckets[i].total_qty, l.buckets[i].size});
      }
    };

    collect(bids_, Side::Buy, snap.bids);
    collect(asks_, Side::Sell, snap.asks);
    return snap;
  }

  std::optional<i64> OrderBook::best_bid() const noexcept
  {
    if ( bids_.empty() )
      return std::nullopt;
    return bids_.prices.back();
  }

  std::optional<i64> OrderBook::best_ask() const noexcept
  {
    if ( asks_.empty() )
      return std::nullopt;
    return asks_.prices.front();
  }

  std::optional<double> OrderBook::mid() const noexcept
  {
    if ( bids_.empty() || asks_.empty() )
      return std::nullopt;
    return 0.5 * (to_price(bids_.prices.back()) + to_price(asks_.prices.front()));
  }

  i64 OrderBook::depth_qty(Side side, std::size_t levels) const noexcept
  {
    const Ladder& l = ladder_(side);
    const std::size_t n = l.prices.size();
    const std::size_t take = (levels == 0 || levels > n) ? n : levels;

    i64 total = 0;
    for ( std::size_t k = 0; k < take; ++k ) {
      const std::size_t i = side == Side::Buy ? n - 1 - k : k;
      total += l.buckets[i].total_qty;
    }
    return total;
  }

  std::size_t OrderBook::level_count(Side side) const noexcept { return ladder_(side).prices.size(); }

  const Order* OrderBook::find(u64 order_id) const
  {
    auto it = id_to_index_.find(order_id);
    if ( it == id_to_index_.end() )
      return nullptr;
    return &orders_[it->second];
  }

} // namespace synthex
