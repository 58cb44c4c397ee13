#include "synthex/config.hpp"

#include <fast_float/fast_float.h>

#include <charconv>
#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <variant>

namespace synthex
{

  namespace
  {

    struct Ctx
    {
      std::string_view origin;
      std::size_t line{0};

      [[noreturn]] void fail(const std::string& msg) const
      {
        throw std::runtime_error(std::string(origin) + ":" + std::to_string(line) + ": " + msg);
      }
    };

    std::string_view trim(std::string_view s)
    {
      const char* ws = " \t\r\n";
      const auto b = s.find_first_not_of(ws);
      if ( b == std::string_view::npos )
        return {};
      const auto e = s.find_last_not_of(ws);
      return s.substr(b, e - b + 1);
    }

    double parse_double(std::string_view sv, const Ctx& ctx)
    {
      double v = 0.0;
      const char* b = sv.data();
      const char* e = b + sv.size();
      auto r = fast_float::from_chars(b, e, v);
      if ( sv.empty() || r.ec != std::errc{} || r.ptr != e || !std::isfinite(v) )
        ctx.fail("invalid number '" + std::string(sv) + "'");
      return v;
    }

    template <class Int>
    Int parse_int(std::string_view sv, const Ctx& ctx)
    {
      Int v{};
      const char* b = sv.data();
      const char* e = b + sv.size();
      auto r = std::from_chars(b, e, v, 10);
      if ( sv.empty() || r.ec != std::errc{} || r.ptr != e )
        ctx.fail("invalid integer '" + std::string(sv) + "'");
      return v;
    }

    // Numeric fields addressable by key.
    using Target = std::variant<double*, i64*, u32*, std::size_t*>;

    struct Field
    {
      std::string_view key;
      Target target;
    };

    std::vector<Field> global_fields(EngineConfig& c)
    {
      return {
          {"max_resting_orders", &c.book.max_resting_orders},
          {"impact_coefficient", &c.liquidity.impact_coefficient},
          {"depletion_factor", &c.liquidity.depletion_factor},
          {"recovery_rate", &c.liquidity.recovery_rate},
          {"floor_fraction", &c.liquidity.floor_fraction},
          {"price_floor_ratio", &c.price.floor_ratio},
          {"price_history", &c.price.history_capacity},
          {"max_pending", &c.exec.max_pending},
          {"workers", &c.workers},

          {"agents.market_makers", &c.agents.market_makers},
          {"agents.noise", &c.agents.noise},
          {"agents.informed", &c.agents.informed},
          {"agents.momentum", &c.agents.momentum},

          {"mm.spread", &c.agents.mm.spread},
          {"mm.quote_size", &c.agents.mm.quote_size},
          {"mm.inventory_skew", &c.agents.mm.inventory_skew},
          {"mm.max_inventory", &c.agents.mm.max_inventory},

          {"noise.probability", &c.agents.noise_params.probability},
          {"noise.min_size", &c.agents.noise_params.min_size},
          {"noise.max_size", &c.agents.noise_params.max_size},
          {"noise.market_share", &c.agents.noise_params.market_share},
          {"noise.limit_band", &c.agents.noise_params.limit_band},
          {"noise.order_lifetime_ticks", &c.agents.noise_params.order_lifetime_ticks},

          {"informed.probability", &c.agents.informed_params.probability},
          {"informed.threshold", &c.agents.informed_params.threshold},
          {"informed.lookback", &c.agents.informed_params.lookback},
          {"informed.base_size", &c.agents.informed_params.base_size},
          {"informed.max_conviction", &c.agents.informed_params.max_conviction},

          {"momentum.probability", &c.agents.momentum_params.probability},
          {"momentum.threshold", &c.agents.momentum_params.threshold},
          {"momentum.lookback", &c.agents.momentum_params.lookback},
          {"momentum.cooldown_ticks", &c.agents.momentum_params.cooldown_ticks},
          {"momentum.size", &c.agents.momentum_params.size},
          {"momentum.offset", &c.agents.momentum_params.offset},

          {"analytics.imbalance_levels", &c.analytics.imbalance_levels},
          {"analytics.vol_window", &c.analytics.vol_window},

          {"persist.queue_capacity", &c.persist.queue_capacity},
          {"persist.book_every_ticks", &c.persist.book_every_ticks},
          {"persist.book_levels", &c.persist.book_levels},
      };
    }

    std::vector<Field> symbol_fields(SymbolSpec& s)
    {
      return {
          {"initial_price", &s.initial_price},
          {"base_liquidity", &s.base_liquidity},
          {"volatility", &s.dynamics.volatility},
          {"momentum_factor", &s.dynamics.momentum_factor},
          {"momentum_lookback", &s.dynamics.momentum_lookback},
          {"mean_reversion_speed", &s.dynamics.mean_reversion_speed},
      };
    }

    struct Assign
    {
      std::string_view value;
      const Ctx& ctx;

      void operator()(double* p) const { *p = parse_double(value, ctx); }
      void operator()(i64* p) const { *p = parse_int<i64>(value, ctx); }
      void operator()(u32* p) const { *p = parse_int<u32>(value, ctx); }
      void operator()(std::size_t* p) const { *p = parse_int<std::size_t>(value, ctx); }
    };

    bool assign_field(std::vector<Field>& fields, std::string_view key, std::string_view value, const Ctx& ctx)
    {
      for ( Field& f : fields ) {
        if ( f.key == key ) {
          std::visit(Assign{value, ctx}, f.target);
          return true;
        }
      }
      return false;
    }

    // Keys that are not plain numbers.
    bool assign_special(EngineConfig& c, std::string_view key, std::string_view value, const Ctx& ctx)
    {
      if ( key == "seed" ) {
        c.seed = parse_int<u64>(value, ctx);
      }
      else if ( key == "tick_interval_ms" ) {
        c.tick_interval = Ns::from_ms(parse_int<u64>(value, ctx));
      }
      else if ( key == "latency_ms" ) {
        c.exec.latency = Ns::from_ms(parse_int<u64>(value, ctx));
      }
      else if ( key == "epoch_ms" ) {
        c.epoch_ns = parse_int<u64>(value, ctx) * 1'000'000ULL;
      }
      else if ( key == "clock" ) {
        if ( value == "manual" )
          c.clock = ClockMode::Manual;
        else if ( value == "wallclock" )
          c.clock = ClockMode::WallClock;
        else
          ctx.fail("clock must be 'manual' or 'wallclock'");
      }
      else if ( key == "stp" ) {
        if ( value == "none" )
          c.book.stp = StpPolicy::None;
        else if ( value == "reject_incoming" )
          c.book.stp = StpPolicy::RejectIncoming;
        else
          ctx.fail("stp must be 'none' or 'reject_incoming'");
      }
      else if ( key == "log_level" ) {
        if ( !log::parse_level(value, c.log_level) )
          ctx.fail("unknown log_level '" + std::string(value) + "'");
      }
      else if ( key == "persist.sink" ) {
        if ( value == "none" )
          c.persist.sink = SinkKind::None;
        else if ( value == "null" )
          c.persist.sink = SinkKind::Null;
        else if ( value == "gzcsv" )
          c.persist.sink = SinkKind::GzCsv;
        else
          ctx.fail("persist.sink must be 'none', 'null' or 'gzcsv'");
      }
      else if ( key == "persist.root" ) {
        c.persist.root = std::string(value);
      }
      else {
        return false;
      }
      return true;
    }

  } // namespace

  std::vector<SymbolSpec> default_symbols()
  {
    auto make = [](std::string name, double px, double vol) {
      SymbolSpec s{};
      s.name = std::move(name);
      s.initial_price = px;
      s.dynamics.volatility = vol;
      return s;
    };

    return {
        make("AAPL", 150.0, 0.002),
        make("MSFT", 300.0, 0.002),
        make("GOOGL", 140.0, 0.002),
        make("BTCUSDT", 60'000.0, 0.004),
        make("ETHUSDT", 3'000.0, 0.005),
    };
  }

  EngineConfig default_config()
  {
    EngineConfig c{};
    c.symbols = default_symbols();
    return c;
  }

  void parse_config(std::string_view text, std::string_view origin, EngineConfig& cfg)
  {
    Ctx ctx{origin, 0};
    bool replaced_symbols = false;
    SymbolSpec* section = nullptr;

    std::size_t pos = 0;
    while ( pos <= text.size() ) {
      const std::size_t nl = text.find('\n', pos);
      std::string_view raw = text.substr(pos, nl == std::string_view::npos ? std::string_view::npos : nl - pos);
      pos = (nl == std::string_view::npos) ? text.size() + 1 : nl + 1;
      ++ctx.line;

      const std::size_t hash = raw.find_first_of("#;");
      const std::string_view line = trim(hash == std::string_view::npos ? raw : raw.substr(0, hash));
      if ( line.empty() )
        continue;

      if ( line.front() == '[' ) {
        if ( line.back() != ']' )
          ctx.fail("unterminated section header");
        const std::string_view inner = trim(line.substr(1, line.size() - 2));
        constexpr std::string_view kPrefix = "symbol";
        if ( inner == kPrefix )
          ctx.fail("symbol section needs a name");
        if ( inner.substr(0, kPrefix.size()) != kPrefix || (inner[kPrefix.size()] != ' ' && inner[kPrefix.size()] != '\t') )
          ctx.fail("unknown section '" + std::string(inner) + "'");
        const std::string_view name = trim(inner.substr(kPrefix.size()));

        if ( !replaced_symbols ) {
          cfg.symbols.clear();
          replaced_symbols = true;
        }
        for ( const SymbolSpec& s : cfg.symbols ) {
          if ( s.name == name )
            ctx.fail("duplicate symbol '" + std::string(name) + "'");
        }
        cfg.symbols.push_back(SymbolSpec{});
        cfg.symbols.back().name = std::string(name);
        section = &cfg.symbols.back();
        continue;
      }

      const std::size_t eq = line.find('=');
      if ( eq == std::string_view::npos )
        ctx.fail("expected 'key = value'");
      const std::string_view key = trim(line.substr(0, eq));
      const std::string_view value = trim(line.substr(eq + 1));
      if ( key.empty() )
        ctx.fail("empty key");
      if ( value.empty() )
        ctx.fail("empty value for '" + std::string(key) + "'");

      if ( section != nullptr ) {
        std::vector<Field> fields = symbol_fields(*section);
        if ( !assign_field(fields, key, value, ctx) )
          ctx.fail("unknown symbol key '" + std::string(key) + "'");
        continue;
      }

      std::vector<Field> fields = global_fields(cfg);
      if ( !assign_field(fields, key, value, ctx) && !assign_special(cfg, key, value, ctx) )
        ctx.fail("unknown key '" + std::string(key) + "'");
    }
  }

  EngineConfig load_config(const std::string& path)
  {
    std::ifstream in(path);
    if ( !in.is_open() )
      throw std::runtime_error("Could not open config: " + path);

    std::ostringstream ss;
    ss << in.rdbuf();
    if ( in.bad() )
      throw std::runtime_error("Failed to read config: " + path);

    EngineConfig cfg = default_config();
    parse_config(ss.str(), path, cfg);
    validate(cfg);
    return cfg;
  }

  void validate(const EngineConfig& c)
  {
    auto require = [](bool ok, const std::string& what) {
      if ( !ok )
        throw std::runtime_error("invalid config: " + what);
    };

    require(!c.symbols.empty(), "no symbols");
    require(c.symbols.size() <= kMaxSymbols, "too many symbols");
    for ( const SymbolSpec& s : c.symbols ) {
      require(!s.name.empty(), "symbol with empty name");
      require(s.initial_price > 0.0, s.name + ".initial_price must be > 0");
      require(s.base_liquidity > 0.0, s.name + ".base_liquidity must be > 0");
      require(s.dynamics.volatility >= 0.0, s.name + ".volatility must be >= 0");
      require(s.dynamics.momentum_lookback >= 1, s.name + ".momentum_lookback must be >= 1");
      require(
          s.dynamics.mean_reversion_speed >= 0.0 && s.dynamics.mean_reversion_speed < 1.0,
          s.name + ".mean_reversion_speed must be in [0, 1)");
    }

    require(c.liquidity.impact_coefficient >= 0.0, "impact_coefficient must be >= 0");
    require(c.liquidity.depletion_factor >= 0.0, "depletion_factor must be >= 0");
    require(c.liquidity.recovery_rate >= 0.0, "recovery_rate must be >= 0");
    require(c.liquidity.floor_fraction > 0.0 && c.liquidity.floor_fraction <= 1.0, "floor_fraction must be in (0, 1]");

    require(c.price.floor_ratio > 0.0 && c.price.floor_ratio < 1.0, "price_floor_ratio must be in (0, 1)");
    require(c.price.history_capacity >= 2, "price_history must be >= 2");

    require(c.tick_interval.value > 0, "tick_interval_ms must be > 0");
    require(c.workers >= 1, "workers must be >= 1");

    const AgentMix& a = c.agents;
    require(a.mm.spread > 0.0, "mm.spread must be > 0");
    require(a.mm.quote_size > 0, "mm.quote_size must be > 0");
    require(a.mm.max_inventory > 0, "mm.max_inventory must be > 0");
    require(a.noise_params.min_size > 0, "noise.min_size must be > 0");
    require(a.noise_params.max_size >= a.noise_params.min_size, "noise.max_size must be >= noise.min_size");
    require(a.noise_params.limit_band >= 0.0 && a.noise_params.limit_band < 1.0, "noise.limit_band must be in [0, 1)");
    require(a.informed_params.threshold > 0.0, "informed.threshold must be > 0");
    require(a.informed_params.base_size > 0, "informed.base_size must be > 0");
    require(a.informed_params.lookback >= 1, "informed.lookback must be >= 1");
    require(a.momentum_params.threshold > 0.0, "momentum.threshold must be > 0");
    require(a.momentum_params.size > 0, "momentum.size must be > 0");
    require(a.momentum_params.lookback >= 1, "momentum.lookback must be >= 1");

    for ( const double p : {a.noise_params.probability,
                            a.noise_params.market_share,
                            a.informed_params.probability,
                            a.momentum_params.probability} )
      require(p >= 0.0 && p <= 1.0, "probabilities must be in [0, 1]");

    require(c.analytics.vol_window >= 2, "analytics.vol_window must be >= 2");
    require(c.persist.queue_capacity > 0, "persist.queue_capacity must be > 0");
    require(c.persist.book_levels > 0, "persist.book_levels must be > 0");
    require(c.persist.sink != SinkKind::GzCsv || !c.persist.root.empty(), "persist.root must be set for gzcsv");
  }

} // namespace synthex
