#include <cassert>
#include <cstddef>
#include <vector>

#include "synthex/execution.hpp"

int main()
{
  using synthex::Ns;
  using synthex::OrderIntent;
  using synthex::RejectReason;
  using synthex::Side;
  using synthex::SubmitStatus;

  synthex::ExecParams base{};
  base.latency = Ns{10};

  // ----------------------------
  // 1) Latency gating, book sees the release time
  // ----------------------------
  {
    synthex::OrderBook book(0);
    synthex::ExecutionEngine ex(book, base);

    const auto p = ex.accept(OrderIntent::limit(Side::Sell, 10, 10'000, 1), Ns{0});
    assert(p.accepted);
    assert(p.order_id != 0);
    assert(p.release_ts == Ns{10});
    assert(ex.pending_count() == 1);
    assert(ex.next_release() == Ns{10});

    assert(ex.advance(Ns{9}).empty());
    assert(book.resting_count() == 0);

    const auto rs = ex.advance(Ns{10});
    assert(rs.size() == 1);
    assert(rs[0].order_id == p.order_id);
    assert(rs[0].status() == SubmitStatus::Resting);
    assert(ex.pending_count() == 0);
    assert(ex.next_release() == Ns{0});

    const synthex::Order* o = book.find(p.order_id);
    assert(o != nullptr);
    assert(o->submit_ts == Ns{10});
  }

  // ----------------------------
  // 2) Same-timestamp submissions keep accept order
  // ----------------------------
  {
    synthex::OrderBook book(0);
    synthex::ExecutionEngine ex(book, base);

    const auto a = ex.accept(OrderIntent::limit(Side::Sell, 10, 10'000, 1), Ns{5});
    const auto b = ex.accept(OrderIntent::limit(Side::Sell, 10, 10'000, 2), Ns{5});
    const auto c = ex.accept(OrderIntent::market(Side::Buy, 15, 3), Ns{5});
    assert(a.order_id < b.order_id && b.order_id < c.order_id);

    std::vector<synthex::MatchResult> out;
    assert(ex.advance(Ns{100}, out) == 3);
    assert(out[2].order_id == c.order_id);
    assert(out[2].fills.size() == 2);
    assert(out[2].fills[0].maker_order_id == a.order_id);
    assert(out[2].fills[1].maker_order_id == b.order_id);
    assert(out[2].fills[0].ts == Ns{15});
  }

  // ----------------------------
  // 3) Cancels travel through the same queue
  // ----------------------------
  {
    synthex::OrderBook book(0);
    synthex::ExecutionEngine ex(book, base);

    const auto p = ex.accept(OrderIntent::limit(Side::Buy, 10, 9'900, 1), Ns{0});
    const auto c = ex.accept(OrderIntent::cancel(p.order_id, 1), Ns{0});
    assert(c.accepted);
    assert(c.order_id == p.order_id);

    const auto rs = ex.advance(Ns{10});
    assert(rs.size() == 2);
    assert(!rs[0].cancel);
    assert(rs[1].cancel);
    assert(rs[1].state == synthex::OrderState::Cancelled);
    assert(rs[1].requested_qty == 10);
    assert(book.resting_count() == 0);

    // Second cancel of the same id: unknown by then
    (void)ex.accept(OrderIntent::cancel(p.order_id, 1), Ns{10});
    const auto again = ex.advance(Ns{20});
    assert(again.size() == 1);
    assert(again[0].reject_reason == RejectReason::UnknownOrderId);

    // Only the owner may cancel
    const auto q = ex.accept(OrderIntent::limit(Side::Buy, 10, 9'900, 1), Ns{20});
    (void)ex.accept(OrderIntent::cancel(q.order_id, 2), Ns{20});
    const auto foreign = ex.advance(Ns{30});
    assert(foreign[1].reject_reason == RejectReason::UnknownOrderId);
    assert(book.find(q.order_id) != nullptr);

    // Rejected at accept time
    assert(ex.accept(OrderIntent::cancel(0, 1), Ns{30}).reject_reason == RejectReason::UnknownOrderId);
    const auto other_symbol = synthex::make_id(1, 5);
    assert(!ex.accept(OrderIntent::cancel(other_symbol, 1), Ns{30}).accepted);
  }

  // ----------------------------
  // 4) Validation and queue capacity
  // ----------------------------
  {
    synthex::OrderBook book(0);
    synthex::ExecParams p = base;
    p.max_pending = 2;
    synthex::ExecutionEngine ex(book, p);

    const auto bad = ex.accept(OrderIntent::limit(Side::Buy, 0, 10'000, 1), Ns{0});
    assert(!bad.accepted);
    assert(bad.reject_reason == RejectReason::InvalidParams);
    assert(ex.pending_count() == 0);

    const auto first = ex.accept(OrderIntent::limit(Side::Buy, 1, 9'000, 1), Ns{0});
    assert(first.accepted);
    assert(synthex::id_sequence(first.order_id) == 1); // rejects never consume ids
    assert(ex.accept(OrderIntent::limit(Side::Buy, 1, 9'001, 1), Ns{0}).accepted);
    const auto full = ex.accept(OrderIntent::limit(Side::Buy, 1, 9'002, 1), Ns{0});
    assert(full.reject_reason == RejectReason::InsufficientResources);

    (void)ex.advance(Ns{10});
    assert(ex.accept(OrderIntent::limit(Side::Buy, 1, 9'002, 1), Ns{10}).accepted);
    assert(book.level_count(Side::Buy) == 2);
  }

  return 0;
}
