#include "synthex/execution.hpp"

namespace synthex
{

  ExecutionEngine::ExecutionEngine(OrderBook& book, const ExecParams& params) : book_(&book), params_(params) {}

  Pending ExecutionEngine::accept(const OrderIntent& intent, Ns now)
  {
    Pending p{};

    RejectReason rr = RejectReason::None;
    if ( intent.kind == IntentKind::New )
      rr = OrderBook::validate(intent.order);
    else if ( intent.cancel_id == 0 || id_symbol(intent.cancel_id) != book_->symbol() )
      rr = RejectReason::UnknownOrderId;

    if ( rr == RejectReason::None && params_.max_pending > 0 && queue_.size() >= params_.max_pending )
      rr = RejectReason::InsufficientResources;

    if ( rr != RejectReason::None ) {
      p.reject_reason = rr;
      return p;
    }

    const u64 id = intent.kind == IntentKind::New ? book_->reserve_id() : intent.cancel_id;
    const Ns release = now + params_.latency;

    queue_.push(QueuedIntent{release, next_seq_++, id, intent});

    p.accepted = true;
    p.order_id = id;
    p.release_ts = release;
    return p;
  }

  std::vector<MatchResult> ExecutionEngine::advance(Ns now)
  {
    std::vector<MatchResult> out;
    advance(now, out);
    return out;
  }

  std::size_t ExecutionEngine::advance(Ns now, std::vector<MatchResult>& out)
  {
    std::size_t n = 0;
    while ( !queue_.empty() && queue_.top().release_ts <= now ) {
      const QueuedIntent q = queue_.top();
      queue_.pop();
      out.push_back(release_(q));
      ++n;
    }
    return n;
  }

  Ns ExecutionEngine::next_release() const noexcept
  {
    if ( queue_.empty() )
      return Ns{0};
    return queue_.top().release_ts;
  }

  MatchResult ExecutionEngine::release_(const QueuedIntent& q)
  {
    if ( q.intent.kind == IntentKind::New )
      return book_->submit(q.order_id, q.intent.order, q.release_ts);

    MatchResult r{};
    r.cancel = true;
    r.order_id = q.order_id;

    // Only the owner may pull its own order. Owner 0 (external) may cancel anything.
    const Order* o = book_->find(q.order_id);
    if ( o == nullptr ) {
      r.state = OrderState::Rejected;
      r.reject_reason = RejectReason::UnknownOrderId;
      return r;
    }
    if ( q.intent.order.owner != 0 && o->owner != q.intent.order.owner ) {
      r.state = OrderState::Rejected;
      r.reject_reason = RejectReason::UnknownOrderId;
      return r;
    }

    r.side = o->side;
    r.type = o->type;
    r.requested_qty = o->remaining();

    const bool ok = book_->cancel(q.order_id);
    r.state = ok ? OrderState::Cancelled : OrderState::Rejected;
    r.reject_reason = ok ? RejectReason::None : RejectReason::UnknownOrderId;
    return r;
  }

} // namespace synthex
