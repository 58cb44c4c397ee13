#include <cstdint>
#include <memory>
#include <nanobind/nanobind.h>
#include <nanobind/stl/optional.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/vector.h>
#include <optional>
#include <string>
#include <vector>

#include "synthex/config.hpp"
#include "synthex/engine.hpp"

namespace nb = nanobind;

namespace
{

  // Python-side state uses plain floats for prices; the book keeps fixed point.
  struct Level
  {
    double price{0.0};
    std::int64_t quantity{0};
    std::uint32_t order_count{0};
  };

  struct Book
  {
    std::vector<Level> bids;
    std::vector<Level> asks;
  };

  Book to_py(const synthex::BookSnapshot& s)
  {
    Book b;
    b.bids.reserve(s.bids.size());
    b.asks.reserve(s.asks.size());
    for ( const auto& l : s.bids )
      b.bids.push_back(Level{synthex::to_price(l.price_q), l.qty, l.order_count});
    for ( const auto& l : s.asks )
      b.asks.push_back(Level{synthex::to_price(l.price_q), l.qty, l.order_count});
    return b;
  }

  void check(synthex::EngineError e)
  {
    if ( e != synthex::EngineError::None )
      throw std::runtime_error(std::string("engine: ") + std::string(synthex::to_string(e)));
  }

} // namespace

NB_MODULE(_synthex, m)
{
  m.doc() = "synthex synthetic exchange bindings";

  // ---------------------------
  // Enums
  // ---------------------------
  nb::enum_<synthex::Side>(m, "Side").value("Buy", synthex::Side::Buy).value("Sell", synthex::Side::Sell);

  nb::enum_<synthex::OrderType>(m, "OrderType")
      .value("Limit", synthex::OrderType::Limit)
      .value("Market", synthex::OrderType::Market);

  nb::enum_<synthex::SubmitStatus>(m, "SubmitStatus")
      .value("Filled", synthex::SubmitStatus::Filled)
      .value("PartiallyFilled", synthex::SubmitStatus::PartiallyFilled)
      .value("Resting", synthex::SubmitStatus::Resting)
      .value("Rejected", synthex::SubmitStatus::Rejected);

  nb::enum_<synthex::RejectReason>(m, "RejectReason")
      .value("None", synthex::RejectReason::None)
      .value("InvalidParams", synthex::RejectReason::InvalidParams)
      .value("UnknownSymbol", synthex::RejectReason::UnknownSymbol)
      .value("UnknownOrderId", synthex::RejectReason::UnknownOrderId)
      .value("AlreadyTerminal", synthex::RejectReason::AlreadyTerminal)
      .value("NoLiquidity", synthex::RejectReason::NoLiquidity)
      .value("SelfTradePrevention", synthex::RejectReason::SelfTradePrevention)
      .value("InsufficientResources", synthex::RejectReason::InsufficientResources)
      .value("NotRunning", synthex::RejectReason::NotRunning);

  nb::enum_<synthex::EngineState>(m, "EngineState")
      .value("Initialized", synthex::EngineState::Initialized)
      .value("Running", synthex::EngineState::Running)
      .value("Paused", synthex::EngineState::Paused)
      .value("Stopped", synthex::EngineState::Stopped);

  nb::enum_<synthex::ClockMode>(m, "ClockMode")
      .value("Manual", synthex::ClockMode::Manual)
      .value("WallClock", synthex::ClockMode::WallClock);

  nb::enum_<synthex::SinkKind>(m, "SinkKind")
      .value("None", synthex::SinkKind::None)
      .value("Null", synthex::SinkKind::Null)
      .value("GzCsv", synthex::SinkKind::GzCsv);

  // ---------------------------
  // Configuration
  // ---------------------------
  nb::class_<synthex::SymbolSpec>(m, "SymbolSpec")
      .def(nb::init<>())
      .def_rw("name", &synthex::SymbolSpec::name)
      .def_rw("initial_price", &synthex::SymbolSpec::initial_price)
      .def_rw("base_liquidity", &synthex::SymbolSpec::base_liquidity)
      .def_prop_rw(
          "volatility",
          [](const synthex::SymbolSpec& s) { return s.dynamics.volatility; },
          [](synthex::SymbolSpec& s, double v) { s.dynamics.volatility = v; })
      .def_prop_rw(
          "momentum_factor",
          [](const synthex::SymbolSpec& s) { return s.dynamics.momentum_factor; },
          [](synthex::SymbolSpec& s, double v) { s.dynamics.momentum_factor = v; })
      .def_prop_rw(
          "mean_reversion_speed",
          [](const synthex::SymbolSpec& s) { return s.dynamics.mean_reversion_speed; },
          [](synthex::SymbolSpec& s, double v) { s.dynamics.mean_reversion_speed = v; });

  nb::class_<synthex::EngineConfig>(m, "EngineConfig")
      .def(nb::init<>())
      .def_rw("symbols", &synthex::EngineConfig::symbols)
      .def_rw("clock", &synthex::EngineConfig::clock)
      .def_rw("seed", &synthex::EngineConfig::seed)
      .def_rw("workers", &synthex::EngineConfig::workers)
      .def_rw("epoch_ns", &synthex::EngineConfig::epoch_ns)
      .def_prop_rw(
          "tick_interval_ns",
          [](const synthex::EngineConfig& c) { return c.tick_interval.value; },
          [](synthex::EngineConfig& c, std::uint64_t v) { c.tick_interval = synthex::Ns{v}; })
      .def_prop_rw(
          "latency_ns",
          [](const synthex::EngineConfig& c) { return c.exec.latency.value; },
          [](synthex::EngineConfig& c, std::uint64_t v) { c.exec.latency = synthex::Ns{v}; })
      // Convenience: flat persistence knobs
      .def_prop_rw(
          "persist_sink",
          [](const synthex::EngineConfig& c) { return c.persist.sink; },
          [](synthex::EngineConfig& c, synthex::SinkKind v) { c.persist.sink = v; })
      .def_prop_rw(
          "persist_root",
          [](const synthex::EngineConfig& c) { return c.persist.root; },
          [](synthex::EngineConfig& c, const std::string& v) { c.persist.root = v; })
      // Convenience: agent counts per symbol
      .def_prop_rw(
          "market_makers",
          [](const synthex::EngineConfig& c) { return c.agents.market_makers; },
          [](synthex::EngineConfig& c, std::uint32_t v) { c.agents.market_makers = v; })
      .def_prop_rw(
          "noise_traders",
          [](const synthex::EngineConfig& c) { return c.agents.noise; },
          [](synthex::EngineConfig& c, std::uint32_t v) { c.agents.noise = v; })
      .def_prop_rw(
          "informed_traders",
          [](const synthex::EngineConfig& c) { return c.agents.informed; },
          [](synthex::EngineConfig& c, std::uint32_t v) { c.agents.informed = v; })
      .def_prop_rw(
          "momentum_traders",
          [](const synthex::EngineConfig& c) { return c.agents.momentum; },
          [](synthex::EngineConfig& c, std::uint32_t v) { c.agents.momentum = v; });

  m.def("default_config", &synthex::default_config);
  m.def("load_config", &synthex::load_config, nb::arg("path"));

  // ---------------------------
  // Results and snapshots (copies, no reference lifetimes)
  // ---------------------------
  nb::class_<synthex::SubmitResult>(m, "SubmitResult")
      .def_ro("order_id", &synthex::SubmitResult::order_id)
      .def_ro("status", &synthex::SubmitResult::status)
      .def_ro("filled_quantity", &synthex::SubmitResult::filled_quantity)
      .def_ro("avg_fill_price", &synthex::SubmitResult::avg_fill_price)
      .def_ro("reject_reason", &synthex::SubmitResult::reject_reason);

  nb::class_<Level>(m, "Level")
      .def_ro("price", &Level::price)
      .def_ro("quantity", &Level::quantity)
      .def_ro("order_count", &Level::order_count);

  nb::class_<Book>(m, "OrderBook").def_ro("bids", &Book::bids).def_ro("asks", &Book::asks);

  nb::class_<synthex::MarketState>(m, "MarketState")
      .def_ro("symbol", &synthex::MarketState::symbol)
      .def_ro("tick", &synthex::MarketState::tick)
      .def_prop_ro("ts_ns", [](const synthex::MarketState& s) { return s.ts.value; })
      .def_ro("last_price", &synthex::MarketState::last_price)
      .def_ro("reference_price", &synthex::MarketState::reference_price)
      .def_ro("volume", &synthex::MarketState::volume)
      .def_ro("liquidity", &synthex::MarketState::liquidity)
      .def_ro("realized_vol", &synthex::MarketState::realized_vol)
      .def_ro("momentum", &synthex::MarketState::momentum)
      .def_ro("spread", &synthex::MarketState::spread);

  nb::class_<synthex::PersistStats>(m, "PersistStats")
      .def_ro("enqueued", &synthex::PersistStats::enqueued)
      .def_ro("written", &synthex::PersistStats::written)
      .def_ro("dropped", &synthex::PersistStats::dropped)
      .def_ro("failed", &synthex::PersistStats::failed);

  nb::class_<synthex::EngineStats>(m, "EngineStats")
      .def_ro("ticks", &synthex::EngineStats::ticks)
      .def_ro("orders_accepted", &synthex::EngineStats::orders_accepted)
      .def_ro("orders_rejected", &synthex::EngineStats::orders_rejected)
      .def_ro("external_orders", &synthex::EngineStats::external_orders)
      .def_ro("fills", &synthex::EngineStats::fills)
      .def_ro("volume", &synthex::EngineStats::volume)
      .def_ro("persist", &synthex::EngineStats::persist);

  // ---------------------------
  // Engine
  // ---------------------------
  nb::class_<synthex::Engine>(m, "Engine")
      .def(
          "__init__",
          [](synthex::Engine* self, const synthex::EngineConfig& cfg) { new (self) synthex::Engine(cfg); },
          nb::arg("config"))
      .def_prop_ro("state", &synthex::Engine::state)
      .def_prop_ro("tick_count", &synthex::Engine::tick_count)
      .def_prop_ro("now_ns", [](const synthex::Engine& e) { return e.now().value; })

      // Lifecycle errors surface as RuntimeError on the Python side
      .def("start", [](synthex::Engine& e) { check(e.start()); })
      .def("pause", [](synthex::Engine& e) { check(e.pause()); }, nb::call_guard<nb::gil_scoped_release>())
      .def("resume", [](synthex::Engine& e) { check(e.resume()); })
      .def("stop", [](synthex::Engine& e) { (void)e.stop(); }, nb::call_guard<nb::gil_scoped_release>())
      .def(
          "advance_tick",
          [](synthex::Engine& e, std::uint64_t n) {
            for ( std::uint64_t i = 0; i < n; ++i )
              check(e.advance_tick());
          },
          nb::arg("n") = 1,
          nb::call_guard<nb::gil_scoped_release>(),
          "Advance `n` ticks (manual clock only).")

      .def(
          "submit_order",
          [](synthex::Engine& e,
             const std::string& symbol,
             synthex::Side side,
             synthex::OrderType type,
             std::int64_t quantity,
             std::optional<double> price) { return e.submit_order(symbol, side, type, quantity, price); },
          nb::arg("symbol"),
          nb::arg("side"),
          nb::arg("type"),
          nb::arg("quantity"),
          nb::arg("price") = nb::none())
      .def("cancel_order", &synthex::Engine::cancel_order, nb::arg("order_id"))
      .def(
          "get_order_book",
          [](const synthex::Engine& e, const std::string& symbol, std::size_t depth) -> std::optional<Book> {
            const auto snap = e.get_order_book(symbol, depth);
            if ( !snap )
              return std::nullopt;
            return to_py(*snap);
          },
          nb::arg("symbol"),
          nb::arg("depth") = 10)
      .def(
          "get_market_state",
          [](const synthex::Engine& e, const std::string& symbol) { return e.get_market_state(symbol); },
          nb::arg("symbol"))
      .def("list_symbols", &synthex::Engine::list_symbols)
      .def("stats", &synthex::Engine::stats);
}
