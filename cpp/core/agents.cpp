#include "synthex/agents.hpp"

#include <algorithm>
#include <cmath>

namespace synthex
{

  namespace
  {

    inline i64 floor_q(double px) { return static_cast<i64>(std::floor(px * static_cast<double>(kPriceScale))); }

    inline i64 ceil_q(double px) { return static_cast<i64>(std::ceil(px * static_cast<double>(kPriceScale))); }

    inline bool chance(Rng& rng, double p)
    {
      std::bernoulli_distribution d(std::clamp(p, 0.0, 1.0));
      return d(rng);
    }

    inline Side draw_side(Rng& rng)
    {
      std::bernoulli_distribution d(0.5);
      return d(rng) ? Side::Buy : Side::Sell;
    }

    // Dispatches one agent's behaviour. Each overload only touches its own state.
    struct Actor
    {
      Agent& agent;
      const AgentView& view;
      Rng& rng;
      std::vector<OrderIntent>& out;

      void operator()(MarketMaker& mm) const
      {
        // Pull last tick's quotes first; cancels are queued ahead of the new quotes.
        for ( const u64 id : mm.live_quotes )
          out.push_back(OrderIntent::cancel(id, agent.owner()));
        mm.live_quotes.clear();

        const double ref = view.reference_price;
        if ( ref <= 0.0 )
          return;

        const double half = ref * mm.p.spread * 0.5 * view.thinness;
        const double inventory = static_cast<double>(agent.position) / static_cast<double>(mm.p.quote_size);
        const double skew = ref * mm.p.inventory_skew * inventory;

        const i64 bid_q = floor_q(ref - half - skew);
        i64 ask_q = ceil_q(ref + half - skew);
        if ( ask_q <= bid_q )
          ask_q = bid_q + 1;

        if ( agent.position < mm.p.max_inventory && bid_q > 0 )
          out.push_back(OrderIntent::limit(Side::Buy, mm.p.quote_size, bid_q, agent.owner()));
        if ( agent.position > -mm.p.max_inventory )
          out.push_back(OrderIntent::limit(Side::Sell, mm.p.quote_size, ask_q, agent.owner()));
      }

      void operator()(NoiseTrader& nt) const
      {
        // Expire old limits. Ones that already filled make the cancel a no-op.
        if ( nt.p.order_lifetime_ticks != 0 ) {
          while ( !nt.open_limits.empty() && view.tick - nt.open_limits.front().tick >= nt.p.order_lifetime_ticks ) {
            out.push_back(OrderIntent::cancel(nt.open_limits.front().id, agent.owner()));
            nt.open_limits.pop_front();
          }
        }

        if ( !chance(rng, nt.p.probability) )
          return;

        const Side side = draw_side(rng);
        std::uniform_int_distribution<i64> size_dist(nt.p.min_size, nt.p.max_size);
        const i64 qty = size_dist(rng);

        if ( chance(rng, nt.p.market_share) ) {
          out.push_back(OrderIntent::market(side, qty, agent.owner()));
          return;
        }

        std::uniform_real_distribution<double> band(-nt.p.limit_band, nt.p.limit_band);
        const i64 price_q = std::max<i64>(1, to_price_q(view.reference_price * (1.0 + band(rng))));
        out.push_back(OrderIntent::limit(side, qty, price_q, agent.owner()));
      }

      void operator()(InformedTrader& it) const
      {
        if ( !chance(rng, it.p.probability) )
          return;

        const double signal = view.recent_momentum;
        if ( std::fabs(signal) < it.p.threshold )
          return;

        const double conviction = std::min(std::fabs(signal) / it.p.threshold, it.p.max_conviction);
        const i64 qty = std::max<i64>(1, std::llround(static_cast<double>(it.p.base_size) * conviction));
        out.push_back(OrderIntent::market(signal > 0.0 ? Side::Buy : Side::Sell, qty, agent.owner()));
      }

      void operator()(MomentumTrader& mt) const
      {
        mt.memory.push_back(view.reference_price);
        while ( mt.memory.size() > static_cast<std::size_t>(mt.p.lookback) + 1 )
          mt.memory.pop_front();

        if ( mt.last_trade_tick && view.tick - *mt.last_trade_tick < mt.p.cooldown_ticks )
          return;
        if ( !chance(rng, mt.p.probability) )
          return;
        if ( mt.memory.size() < 2 || mt.memory.front() <= 0.0 )
          return;

        const double signal = mt.memory.back() / mt.memory.front() - 1.0;
        if ( std::fabs(signal) < mt.p.threshold )
          return;

        const Side side = signal > 0.0 ? Side::Buy : Side::Sell;
        const double offset = side == Side::Buy ? mt.p.offset : -mt.p.offset;
        const i64 price_q = std::max<i64>(1, to_price_q(view.reference_price * (1.0 + offset)));

        out.push_back(OrderIntent::limit(side, mt.p.size, price_q, agent.owner()));
        mt.last_trade_tick = view.tick;
      }
    };

  } // namespace

  std::string_view to_string(Archetype a) noexcept
  {
    switch ( a ) {
      case Archetype::MarketMaker:
        return "market_maker";
      case Archetype::Noise:
        return "noise";
      case Archetype::Informed:
        return "informed";
      case Archetype::Momentum:
        return "momentum";
    }
    return "unknown";
  }

  void act(Agent& agent, const AgentView& view, Rng& rng, std::vector<OrderIntent>& out)
  {
    std::visit(Actor{agent, view, rng, out}, agent.behavior);
  }

  void apply_fill(Agent& agent, const Fill& f)
  {
    const double notional = f.price() * static_cast<double>(f.qty);

    auto book = [&](Side s) {
      if ( s == Side::Buy ) {
        agent.position += f.qty;
        agent.cash -= notional;
      }
      else {
        agent.position -= f.qty;
        agent.cash += notional;
      }
      ++agent.fills;
    };

    if ( f.taker_owner == agent.owner() )
      book(f.side);
    if ( f.maker_owner == agent.owner() )
      book(opposite(f.side));
  }

  AgentPopulation::AgentPopulation(const AgentMix& mix)
  {
    agents_.reserve(mix.total());

    auto add = [this](AgentBehavior b) {
      Agent a{};
      a.id = static_cast<u32>(agents_.size());
      a.behavior = std::move(b);
      agents_.push_back(std::move(a));
    };

    for ( u32 i = 0; i < mix.market_makers; ++i )
      add(MarketMaker{mix.mm, {}});
    for ( u32 i = 0; i < mix.noise; ++i )
      add(NoiseTrader{mix.noise_params});
    for ( u32 i = 0; i < mix.informed; ++i )
      add(InformedTrader{mix.informed_params});
    for ( u32 i = 0; i < mix.momentum; ++i )
      add(MomentumTrader{mix.momentum_params, {}, std::nullopt});
  }

  std::size_t AgentPopulation::step(const AgentView& view, Rng& rng, ExecutionEngine& exec)
  {
    std::size_t accepted = 0;

    for ( Agent& a : agents_ ) {
      scratch_.clear();
      act(a, view, rng, scratch_);

      for ( const OrderIntent& it : scratch_ ) {
        const Pending p = exec.accept(it, view.now);
        if ( !p.accepted )
          continue;
        ++accepted;

        if ( it.kind != IntentKind::New )
          continue;
        ++a.orders_sent;
        if ( auto* mm = std::get_if<MarketMaker>(&a.behavior) )
          mm->live_quotes.push_back(p.order_id);
        else if ( auto* nt = std::get_if<NoiseTrader>(&a.behavior) ) {
          if ( nt->p.order_lifetime_ticks != 0 && it.order.type == OrderType::Limit )
            nt->open_limits.push_back(NoiseTrader::Sent{p.order_id, view.tick});
        }
      }
    }
    return accepted;
  }

  Agent* AgentPopulation::by_owner_(u64 owner) noexcept
  {
    if ( owner == 0 || owner > agents_.size() )
      return nullptr;
    return &agents_[owner - 1];
  }

  void AgentPopulation::on_fill(const Fill& f)
  {
    Agent* taker = by_owner_(f.taker_owner);
    Agent* maker = by_owner_(f.maker_owner);
    if ( taker != nullptr )
      apply_fill(*taker, f);
    if ( maker != nullptr && maker != taker )
      apply_fill(*maker, f);
  }

  i64 AgentPopulation::net_position() const noexcept
  {
    i64 net = 0;
    for ( const Agent& a : agents_ )
      net += a.position;
    return net;
  }

} // namespace synthex
