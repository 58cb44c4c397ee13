/*
Headless runner for the synthetic exchange.

Loads a config (or the built-in defaults), runs a fixed number of ticks and
prints a per-symbol summary. With `clock = wallclock` the driver thread paces
the ticks; otherwise they are advanced back to back.

Usage:
  synthex_run <config.cfg | -> <ticks> [report_every]
*/

#include <charconv>
#include <chrono>
#include <cstdio>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>

#include "synthex/config.hpp"
#include "synthex/engine.hpp"

namespace
{

  synthex::u64 parse_count(std::string_view sv, const char* what)
  {
    synthex::u64 v = 0;
    auto r = std::from_chars(sv.data(), sv.data() + sv.size(), v, 10);
    if ( sv.empty() || r.ec != std::errc{} || r.ptr != sv.data() + sv.size() )
      throw std::runtime_error(std::string("invalid ") + what + ": '" + std::string(sv) + "'");
    return v;
  }

  std::string fmt(double v)
  {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.4f", v);
    return buf;
  }

  void report(const synthex::Engine& e)
  {
    for ( const std::string& name : e.list_symbols() ) {
      const auto st = e.get_market_state(name);
      if ( !st )
        continue;
      std::cerr << "[INFO] " << name << " tick=" << st->tick << " ref=" << fmt(st->reference_price)
                << " last=" << fmt(st->last_price) << " vol=" << st->volume << " liq=" << fmt(st->liquidity)
                << " spread=" << (st->spread ? fmt(*st->spread) : std::string("-")) << "\n";
    }
  }

  void run(const std::string& config_path, synthex::u64 ticks, synthex::u64 report_every)
  {
    synthex::EngineConfig cfg = config_path == "-" ? synthex::default_config() : synthex::load_config(config_path);

    synthex::Engine engine(cfg);
    const auto t0 = std::chrono::steady_clock::now();

    if ( engine.start() != synthex::EngineError::None )
      throw std::runtime_error("engine failed to start");

    if ( cfg.clock == synthex::ClockMode::WallClock ) {
      synthex::u64 next_report = report_every;
      while ( engine.tick_count() < ticks ) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        if ( report_every && engine.tick_count() >= next_report ) {
          report(engine);
          next_report += report_every;
        }
      }
    }
    else {
      for ( synthex::u64 i = 1; i <= ticks; ++i ) {
        const synthex::EngineError err = engine.advance_tick();
        if ( err != synthex::EngineError::None )
          throw std::runtime_error("advance_tick failed: " + std::string(synthex::to_string(err)));
        if ( report_every && i % report_every == 0 )
          report(engine);
      }
    }

    engine.stop();
    const double secs = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();

    report(engine);
    const synthex::EngineStats st = engine.stats();
    std::cerr << "[INFO] orders_accepted=" << st.orders_accepted << " orders_rejected=" << st.orders_rejected
              << " fills=" << st.fills << " volume=" << st.volume << "\n";
    std::cerr << "[INFO] persist enqueued=" << st.persist.enqueued << " written=" << st.persist.written
              << " dropped=" << st.persist.dropped << " failed=" << st.persist.failed << "\n";
    std::cerr << "[OK] Ran " << st.ticks << " ticks over " << engine.list_symbols().size() << " symbols in "
              << fmt(secs) << "s\n";
  }

} // namespace

int main(int argc, char** argv)
{
  try {
    if ( argc < 3 || argc > 4 ) {
      std::cerr << "Usage: synthex_run <config.cfg | -> <ticks> [report_every]\n";
      return 2;
    }
    const synthex::u64 ticks = parse_count(argv[2], "tick count");
    const synthex::u64 every = argc == 4 ? parse_count(argv[3], "report interval") : 0;
    run(argv[1], ticks, every);
    return 0;
  }
  catch ( const std::exception& e ) {
    std::cerr << "[FAIL] " << e.what() << "\n";
    return 1;
  }
}
