#include "synthex/engine.hpp"

#include <algorithm>
#include <chrono>
#include <stdexcept>

#include "synthex/log.hpp"

namespace synthex
{

  std::string_view to_string(EngineState s) noexcept
  {
    switch ( s ) {
      case EngineState::Initialized:
        return "initialized";
      case EngineState::Running:
        return "running";
      case EngineState::Paused:
        return "paused";
      case EngineState::Stopped:
        return "stopped";
    }
    return "unknown";
  }

  std::string_view to_string(EngineError e) noexcept
  {
    switch ( e ) {
      case EngineError::None:
        return "none";
      case EngineError::NotRunning:
        return "not_running";
      case EngineError::InvalidTransition:
        return "invalid_transition";
      case EngineError::WrongClockMode:
        return "wrong_clock_mode";
    }
    return "unknown";
  }

  Engine::Engine(EngineConfig cfg, std::unique_ptr<PersistSink> sink) : cfg_(std::move(cfg))
  {
    validate(cfg_);
    log::set_level(cfg_.log_level);

    if ( !sink ) {
      switch ( cfg_.persist.sink ) {
        case SinkKind::None:
          break;
        case SinkKind::Null:
          sink = std::make_unique<NullSink>();
          break;
        case SinkKind::GzCsv:
          sink = std::make_unique<GzCsvSink>(cfg_.persist.root);
          break;
      }
    }
    if ( sink )
      persister_ = std::make_unique<AsyncPersister>(std::move(sink), cfg_.persist.queue_capacity);

    symbols_.reserve(cfg_.symbols.size());
    for ( std::size_t i = 0; i < cfg_.symbols.size(); ++i ) {
      const SymbolSpec& spec = cfg_.symbols[i];
      const u32 idx = static_cast<u32>(i);
      if ( !by_name_.emplace(spec.name, idx).second )
        throw std::runtime_error("duplicate symbol: " + spec.name);
      symbols_.push_back(std::make_unique<SymbolContext>(idx, spec, cfg_, persister_.get()));
    }

    const std::size_t workers = std::min(cfg_.workers, symbols_.size());
    if ( workers > 1 )
      pool_ = std::make_unique<WorkerPool>(workers);

    log::info(
        "engine: " + std::to_string(symbols_.size()) + " symbols, " + std::to_string(cfg_.agents.total()) +
        " agents/symbol, tick " + std::to_string(cfg_.tick_interval.value / 1'000'000) + "ms, seed " +
        std::to_string(cfg_.seed));
  }

  Engine::~Engine() { stop(); }

  EngineState Engine::state() const
  {
    std::lock_guard<std::mutex> lk(state_mu_);
    return state_;
  }

  EngineError Engine::transition_(EngineState from_a, EngineState from_b, EngineState to)
  {
    // Taking tick_mu_ first makes the transition wait for an in-flight tick.
    std::lock_guard<std::mutex> tl(tick_mu_);
    std::lock_guard<std::mutex> lk(state_mu_);
    if ( state_ == EngineState::Stopped )
      return EngineError::NotRunning;
    if ( state_ != from_a && state_ != from_b )
      return EngineError::InvalidTransition;

    log::debug("engine: " + std::string(to_string(state_)) + " -> " + std::string(to_string(to)));
    state_ = to;
    state_cv_.notify_all();
    return EngineError::None;
  }

  EngineError Engine::start()
  {
    const EngineError e = transition_(EngineState::Initialized, EngineState::Initialized, EngineState::Running);
    if ( e == EngineError::None && cfg_.clock == ClockMode::WallClock )
      driver_ = std::thread([this]() { driver_loop_(); });
    return e;
  }

  EngineError Engine::pause() { return transition_(EngineState::Running, EngineState::Running, EngineState::Paused); }

  EngineError Engine::resume() { return transition_(EngineState::Paused, EngineState::Paused, EngineState::Running); }

  EngineError Engine::stop()
  {
    {
      std::lock_guard<std::mutex> tl(tick_mu_);
      std::lock_guard<std::mutex> lk(state_mu_);
      if ( state_ == EngineState::Stopped )
        return EngineError::NotRunning;
      state_ = EngineState::Stopped;
    }
    state_cv_.notify_all();

    if ( driver_.joinable() )
      driver_.join();
    if ( persister_ )
      persister_->stop();

    log::info("engine: stopped after " + std::to_string(tick_count()) + " ticks");
    return EngineError::None;
  }

  EngineError Engine::advance_tick()
  {
    std::lock_guard<std::mutex> tl(tick_mu_);
    {
      std::lock_guard<std::mutex> lk(state_mu_);
      if ( state_ == EngineState::Stopped )
        return EngineError::NotRunning;
      if ( state_ != EngineState::Running )
        return EngineError::InvalidTransition;
    }
    if ( cfg_.clock != ClockMode::Manual )
      return EngineError::WrongClockMode;

    run_tick_();
    return EngineError::None;
  }

  // Caller holds tick_mu_.
  void Engine::run_tick_()
  {
    const u64 k = tick_count_.load(std::memory_order_relaxed);
    const u64 interval = cfg_.tick_interval.value;
    const Ns start{k * interval};
    const Ns end{(k + 1) * interval};

    auto work = [&](SymbolContext& s) {
      std::lock_guard<std::mutex> lk(s.mutex());
      s.tick(k, start, end);
    };

    if ( pool_ ) {
      const std::size_t n = symbols_.size();
      const std::size_t w = pool_->size();
      pool_->run_all([&](std::size_t wid) {
        for ( std::size_t i = wid; i < n; i += w )
          work(*symbols_[i]);
      });
    }
    else {
      for ( auto& s : symbols_ )
        work(*s);
    }

    tick_count_.store(k + 1, std::memory_order_release);
  }

  void Engine::driver_loop_()
  {
    using clock = std::chrono::steady_clock;
    const auto interval = std::chrono::nanoseconds(cfg_.tick_interval.value);
    auto next = clock::now();

    for ( ;; ) {
      {
        std::unique_lock<std::mutex> lk(state_mu_);
        next += interval;
        // Fell behind by more than a tick: do not burst to catch up.
        const auto now = clock::now();
        if ( next + interval < now )
          next = now;
        state_cv_.wait_until(lk, next, [&]() { return state_ == EngineState::Stopped; });
        if ( state_ == EngineState::Stopped )
          return;
      }

      std::lock_guard<std::mutex> tl(tick_mu_);
      // Re-checked under tick_mu_: a pause that returned must not see another tick.
      if ( state() == EngineState::Running )
        run_tick_();
    }
  }

  SubmitResult Engine::submit_order(
      std::string_view symbol,
      Side side,
      OrderType type,
      i64 qty,
      std::optional<double> limit_price)
  {
    SubmitResult out{};

    if ( state() == EngineState::Stopped ) {
      out.reject_reason = RejectReason::NotRunning;
      return out;
    }

    const std::optional<u32> idx = symbol_index(symbol);
    if ( !idx ) {
      out.reject_reason = RejectReason::UnknownSymbol;
      return out;
    }

    OrderRequest req{};
    req.side = side;
    req.type = type;
    req.qty = qty;
    req.owner = 0;
    if ( type == OrderType::Limit ) {
      if ( !limit_price || !(*limit_price > 0.0) ) {
        out.reject_reason = RejectReason::InvalidParams;
        return out;
      }
      req.price_q = to_price_q(*limit_price);
    }

    SymbolContext& s = *symbols_[*idx];
    std::lock_guard<std::mutex> lk(s.mutex());
    return s.submit_external(req, now());
  }

  bool Engine::cancel_order(u64 order_id)
  {
    if ( state() == EngineState::Stopped )
      return false;

    const u32 idx = id_symbol(order_id);
    if ( order_id == 0 || idx >= symbols_.size() )
      return false;

    SymbolContext& s = *symbols_[idx];
    std::lock_guard<std::mutex> lk(s.mutex());
    return s.cancel(order_id);
  }

  std::optional<BookSnapshot> Engine::get_order_book(std::string_view symbol, std::size_t depth) const
  {
    const std::optional<u32> idx = symbol_index(symbol);
    if ( !idx )
      return std::nullopt;

    SymbolContext& s = *symbols_[*idx];
    std::lock_guard<std::mutex> lk(s.mutex());
    return s.book().snapshot(depth);
  }

  std::optional<MarketState> Engine::get_market_state(std::string_view symbol) const
  {
    const std::optional<u32> idx = symbol_index(symbol);
    if ( !idx )
      return std::nullopt;

    SymbolContext& s = *symbols_[*idx];
    std::lock_guard<std::mutex> lk(s.mutex());
    return s.market_state();
  }

  std::vector<std::string> Engine::list_symbols() const
  {
    std::vector<std::string> out;
    out.reserve(symbols_.size());
    for ( const auto& s : symbols_ )
      out.push_back(s->spec().name);
    return out;
  }

  std::optional<u32> Engine::symbol_index(std::string_view symbol) const
  {
    auto it = by_name_.find(std::string(symbol));
    if ( it == by_name_.end() )
      return std::nullopt;
    return it->second;
  }

  void Engine::inspect(u32 symbol, const std::function<void(const SymbolContext&)>& f) const
  {
    SymbolContext& s = *symbols_.at(symbol);
    std::lock_guard<std::mutex> lk(s.mutex());
    f(s);
  }

  EngineStats Engine::stats() const
  {
    EngineStats st{};
    st.ticks = tick_count();
    for ( const auto& p : symbols_ ) {
      SymbolContext& s = *p;
      std::lock_guard<std::mutex> lk(s.mutex());
      st.orders_accepted += s.orders_accepted();
      st.orders_rejected += s.orders_rejected();
      st.external_orders += s.external_orders();
      st.fills += s.fill_count();
      st.volume += s.volume();
    }
    if ( persister_ )
      st.persist = persister_->stats();
    return st;
  }

} // namespace synthex
