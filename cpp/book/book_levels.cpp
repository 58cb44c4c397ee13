#include <algorithm>

#include "synthex/book.hpp"
#include "synthex/log.hpp"

namespace synthex
{

  // ---------------- ladder index ----------------

  u64 OrderBook::best_idx_(const Ladder& l, Side side) noexcept
  {
    if ( l.prices.empty() )
      return kInvalidIndex;
    return side == Side::Buy ? static_cast<u64>(l.prices.size() - 1) : 0;
  }

  u64 OrderBook::find_bucket_idx_(const Ladder& l, i64 price_q) const
  {
    auto it = std::lower_bound(l.prices.begin(), l.prices.end(), price_q);
    if ( it == l.prices.end() || *it != price_q )
      return kInvalidIndex;
    return static_cast<u64>(it - l.prices.begin());
  }

  u64 OrderBook::get_or_insert_bucket_idx_(Ladder& l, i64 price_q)
  {
    auto it = std::lower_bound(l.prices.begin(), l.prices.end(), price_q);
    const u64 idx = static_cast<u64>(it - l.prices.begin());
    if ( it != l.prices.end() && *it == price_q )
      return idx;

    l.prices.insert(it, price_q);
    l.buckets.insert(l.buckets.begin() + static_cast<std::ptrdiff_t>(idx), Bucket{});
    return idx;
  }

  void OrderBook::erase_bucket_(Ladder& l, u64 idx)
  {
    // precondition: bucket is empty
    SYNTHEX_ASSERT(l.buckets[idx].size == 0);
    SYNTHEX_ASSERT(l.buckets[idx].total_qty == 0);
    l.prices.erase(l.prices.begin() + static_cast<std::ptrdiff_t>(idx));
    l.buckets.erase(l.buckets.begin() + static_cast<std::ptrdiff_t>(idx));
  }

  // ---------------- per-price FIFO ----------------

  // Inserts keeping (submit_ts, id) order. Sequential submission always lands at
  // the tail; only an order stamped earlier than the tail walks backwards.
  void OrderBook::bucket_insert_(Bucket& b, u64 order_idx)
  {
    Order& o = orders_[order_idx];

    u64 after = b.tail;
    while ( after != kInvalidIndex ) {
      const Order& p = orders_[after];
      if ( p.submit_ts < o.submit_ts || (p.submit_ts == o.submit_ts && p.id < o.id) )
        break;
      after = p.bucket_prev;
    }

    o.bucket_prev = after;
    o.bucket_next = (after != kInvalidIndex) ? orders_[after].bucket_next : b.head;

    if ( after != kInvalidIndex )
      orders_[after].bucket_next = order_idx;
    else
      b.head = order_idx;

    if ( o.bucket_next != kInvalidIndex )
      orders_[o.bucket_next].bucket_prev = order_idx;
    else
      b.tail = order_idx;

    ++b.size;
    b.total_qty += o.remaining();
  }

  void OrderBook::bucket_unlink_(Bucket& b, u64 order_idx)
  {
    Order& o = orders_[order_idx];
    const u64 prev = o.bucket_prev;
    const u64 next = o.bucket_next;
    if ( prev != kInvalidIndex )
      orders_[prev].bucket_next = next;
    else
      b.head = next;
    if ( next != kInvalidIndex )
      orders_[next].bucket_prev = prev;
    else
      b.tail = prev;
    o.bucket_prev = o.bucket_next = kInvalidIndex;

    SYNTHEX_ASSERT(b.size > 0);
    --b.size;
    b.total_qty -= o.remaining();
    SYNTHEX_ASSERT(b.total_qty >= 0);
  }

  // ---------------- arena ----------------

  u64 OrderBook::alloc_slot_()
  {
    if ( !free_slots_.empty() ) {
      const u64 idx = free_slots_.back();
      free_slots_.pop_back();
      return idx;
    }
    orders_.emplace_back();
    return static_cast<u64>(orders_.size() - 1);
  }

  void OrderBook::release_slot_(u64 order_idx)
  {
    id_to_index_.erase(orders_[order_idx].id);
    orders_[order_idx] = Order{};
    free_slots_.push_back(order_idx);
  }

  // ---------------- audit ----------------

  void OrderBook::audit() const
  {
    std::size_t resting = 0;

    for ( const Ladder* l : {&bids_, &asks_} ) {
      SYNTHEX_ASSERT(l->prices.size() == l->buckets.size());
      for ( std::size_t i = 0; i < l->prices.size(); ++i ) {
        if ( i > 0 )
          SYNTHEX_ASSERT(l->prices[i - 1] < l->prices[i]);

        const Bucket& b = l->buckets[i];
        SYNTHEX_ASSERT(b.size > 0);

        i64 sum = 0;
        u32 count = 0;
        u64 prev = kInvalidIndex;
        for ( u64 cur = b.head; cur != kInvalidIndex; cur = orders_[cur].bucket_next ) {
          const Order& o = orders_[cur];
          SYNTHEX_ASSERT(o.bucket_prev == prev);
          SYNTHEX_ASSERT(o.price_q == l->prices[i]);
          SYNTHEX_ASSERT(is_resting(o.state));
          SYNTHEX_ASSERT(o.remaining() > 0);
          if ( prev != kInvalidIndex ) {
            const Order& p = orders_[prev];
            SYNTHEX_ASSERT(p.submit_ts < o.submit_ts || (p.submit_ts == o.submit_ts && p.id < o.id));
          }
          sum += o.remaining();
          ++count;
          prev = cur;
        }
        SYNTHEX_ASSERT(b.tail == prev);
        SYNTHEX_ASSERT(count == b.size);
        SYNTHEX_ASSERT(sum == b.total_qty);
        resting += count;
      }
    }

    SYNTHEX_ASSERT(resting == id_to_index_.size());

    if ( !bids_.empty() && !asks_.empty() )
      SYNTHEX_ASSERT(bids_.prices.back() < asks_.prices.front());
  }

} // namespace synthex
