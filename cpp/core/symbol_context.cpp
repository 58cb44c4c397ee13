#include "synthex/engine.hpp"

namespace synthex
{

  SymbolContext::SymbolContext(u32 index, const SymbolSpec& spec, const EngineConfig& cfg, AsyncPersister* persister)
      : index_(index),
        spec_(spec),
        dt_seconds_(cfg.tick_interval.seconds()),
        signal_lookback_(cfg.agents.informed_params.lookback),
        epoch_ns_(cfg.epoch_ns),
        book_every_ticks_(cfg.persist.book_every_ticks),
        book_levels_(cfg.persist.book_levels),
        persister_(persister),
        rng_(cfg.seed + index),
        book_(index, cfg.book),
        liquidity_(spec.base_liquidity, cfg.liquidity),
        price_(spec.initial_price, spec.dynamics, cfg.price),
        exec_(book_, cfg.exec),
        agents_(cfg.agents),
        analytics_(cfg.analytics),
        last_price_(spec.initial_price)
  {
    state_.symbol = index_;
    state_.last_price = spec.initial_price;
    state_.reference_price = spec.initial_price;
    state_.liquidity = liquidity_.current();
  }

  void SymbolContext::record_fill_(const Fill& f, std::vector<Fill>& into)
  {
    liquidity_.on_fill(f.side, f.qty);
    agents_.on_fill(f);

    last_price_ = f.price();
    volume_ += f.qty;
    ++fill_count_;
    into.push_back(f);
  }

  void SymbolContext::tick(u64 tick_no, Ns start, Ns end)
  {
    // External fills since the last tick belong to this tick's analytics.
    tick_fills_.swap(external_fills_);
    external_fills_.clear();

    const std::optional<double> mid_before = book_.mid();

    // 1) liquidity recovers, 2) reference price consumes the accumulated impact
    liquidity_.recover(tick_no);
    const PriceStep& step = price_.step(liquidity_.take_impact(), liquidity_.thinness(), dt_seconds_, rng_);

    // 3) agents act on the view, intents go through the latency gate
    AgentView view{};
    view.symbol = index_;
    view.tick = tick_no;
    view.now = start;
    view.reference_price = step.price;
    view.last_price = last_price_;
    view.best_bid = book_.best_bid();
    view.best_ask = book_.best_ask();
    view.thinness = liquidity_.thinness();
    view.recent_momentum = price_.mean_return(signal_lookback_);
    orders_accepted_ += agents_.step(view, rng_, exec_);

    // 4) release everything due by the end of the tick
    results_.clear();
    exec_.advance(end, results_);
    for ( const MatchResult& r : results_ ) {
      if ( r.cancel )
        continue;
      if ( r.status() == SubmitStatus::Rejected )
        ++orders_rejected_;
      for ( const Fill& f : r.fills )
        record_fill_(f, tick_fills_);
    }

    // 5) analytics and the rebuilt market state
    metrics_ = analytics_.update(book_, tick_fills_, step.price, mid_before);

    state_.tick = tick_no;
    state_.ts = end;
    state_.last_price = last_price_;
    state_.reference_price = step.price;
    state_.volume = volume_;
    state_.liquidity = liquidity_.current();
    state_.realized_vol = metrics_.realized_volatility.value_or(0.0);
    state_.momentum = step.momentum;
    state_.spread = metrics_.bid_ask_spread;

    last_end_ = end;
    persist_tick_(tick_no, end);
  }

  SubmitResult SymbolContext::submit_external(const OrderRequest& req, Ns now)
  {
    const MatchResult r = book_.submit(req, now.value < last_end_.value ? last_end_ : now);

    SubmitResult out{};
    out.order_id = r.order_id;
    out.status = r.status();
    out.filled_quantity = r.filled_qty;
    out.avg_fill_price = r.avg_fill_price();
    out.reject_reason = r.reject_reason;

    if ( r.reject_reason == RejectReason::InvalidParams )
      return out;

    ++external_orders_;
    if ( out.status == SubmitStatus::Rejected )
      ++orders_rejected_;
    else
      ++orders_accepted_;

    for ( const Fill& f : r.fills )
      record_fill_(f, external_fills_);
    return out;
  }

  void SymbolContext::persist_tick_(u64 tick_no, Ns end)
  {
    if ( persister_ == nullptr )
      return;

    for ( const Fill& f : tick_fills_ ) {
      FillRecord fr{};
      fr.ts_ns = epoch_ns_ + f.ts.value;
      fr.fill_id = f.fill_id;
      fr.order_id = f.order_id;
      fr.symbol = spec_.name;
      fr.side = f.side;
      fr.price = f.price();
      fr.quantity = f.qty;
      persister_->try_push(std::move(fr));
    }

    const u64 ts = epoch_ns_ + end.value;

    MarketStateRecord ms{};
    ms.ts_ns = ts;
    ms.symbol = spec_.name;
    ms.last_price = state_.last_price;
    ms.volume = state_.volume;
    ms.liquidity = state_.liquidity;
    ms.volatility = state_.realized_vol;
    ms.momentum = state_.momentum;
    ms.spread = state_.spread;
    persister_->try_push(std::move(ms));

    AnalyticsRecord ar{};
    ar.ts_ns = ts;
    ar.symbol = spec_.name;
    ar.bid_ask_spread = metrics_.bid_ask_spread;
    ar.mid_price = metrics_.mid_price;
    ar.imbalance = metrics_.imbalance;
    ar.bid_depth = metrics_.bid_depth;
    ar.ask_depth = metrics_.ask_depth;
    ar.effective_spread = metrics_.effective_spread;
    ar.price_impact = metrics_.price_impact;
    ar.realized_volatility = metrics_.realized_volatility;
    persister_->try_push(std::move(ar));

    if ( book_every_ticks_ != 0 && (tick_no + 1) % book_every_ticks_ == 0 )
      persist_book_(ts);
  }

  void SymbolContext::persist_book_(u64 ts)
  {
    const BookSnapshot snap = book_.snapshot(book_levels_);

    auto emit = [&](Side side, const std::vector<LevelView>& levels) {
      for ( std::size_t i = 0; i < levels.size(); ++i ) {
        OrderBookLevelRecord r{};
        r.ts_ns = ts;
        r.symbol = spec_.name;
        r.side = side;
        r.level = static_cast<u32>(i);
        r.price = to_price(levels[i].price_q);
        r.quantity = levels[i].qty;
        r.num_orders = levels[i].order_count;
        persister_->try_push(std::move(r));
      }
    };
    emit(Side::Buy, snap.bids);
    emit(Side::Sell, snap.asks);
  }

} // namespace synthex
