#pragma once

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <random>
#include <string_view>

namespace synthex
{

  using i64 = std::int64_t;
  using u64 = std::uint64_t;
  using u32 = std::uint32_t;

  /// Explicit, seedable randomness. One instance per symbol context.
  using Rng = std::mt19937_64;

  inline constexpr u64 kInvalidIndex = std::numeric_limits<u64>::max();

  /// Book prices are fixed-point: price_q = round(price * kPriceScale).
  inline constexpr i64 kPriceScale = 10'000;

  /// Order and fill ids carry the owning symbol index in their low bits.
  inline constexpr u32 kSymbolBits = 16;
  inline constexpr u64 kSymbolMask = (u64{1} << kSymbolBits) - 1;
  inline constexpr std::size_t kMaxSymbols = std::size_t{1} << kSymbolBits;

  inline constexpr u64 make_id(u64 local_seq, u32 symbol) noexcept
  {
    return (local_seq << kSymbolBits) | (static_cast<u64>(symbol) & kSymbolMask);
  }

  inline constexpr u32 id_symbol(u64 id) noexcept { return static_cast<u32>(id & kSymbolMask); }

  inline constexpr u64 id_sequence(u64 id) noexcept { return id >> kSymbolBits; }

  inline i64 to_price_q(double price) noexcept
  {
    return static_cast<i64>(std::llround(price * static_cast<double>(kPriceScale)));
  }

  inline constexpr double to_price(i64 price_q) noexcept
  {
    return static_cast<double>(price_q) / static_cast<double>(kPriceScale);
  }

  /// Strongly-typed nanoseconds of simulated time.
  struct Ns
  {
    u64 value{0};
    constexpr Ns() = default;
    constexpr explicit Ns(u64 v) : value(v) {}

    static constexpr Ns from_ms(u64 ms) { return Ns{ms * 1'000'000}; }
    constexpr double seconds() const { return static_cast<double>(value) * 1e-9; }

    friend constexpr Ns operator+(Ns a, Ns b) { return Ns{a.value + b.value}; }

    friend constexpr bool operator==(Ns a, Ns b) { return a.value == b.value; }
    friend constexpr bool operator!=(Ns a, Ns b) { return a.value != b.value; }
    friend constexpr bool operator<(Ns a, Ns b) { return a.value < b.value; }
    friend constexpr bool operator<=(Ns a, Ns b) { return a.value <= b.value; }
    friend constexpr bool operator>(Ns a, Ns b) { return a.value > b.value; }
    friend constexpr bool operator>=(Ns a, Ns b) { return a.value >= b.value; }
  };

  enum class Side : std::uint8_t
  {
    Buy = 0,
    Sell = 1
  };

  inline constexpr Side opposite(Side s) noexcept { return s == Side::Buy ? Side::Sell : Side::Buy; }

  enum class OrderType : std::uint8_t
  {
    Limit = 0,
    Market = 1
  };

  enum class OrderState : std::uint8_t
  {
    Pending = 0, // accepted by the execution engine, not yet at the book
    Resting = 1,
    Partial = 2, // partially filled and still resting
    Filled = 3,
    Cancelled = 4,
    Rejected = 5
  };

  /// Public submission status reported to callers.
  enum class SubmitStatus : std::uint8_t
  {
    Filled = 0,
    PartiallyFilled = 1,
    Resting = 2,
    Rejected = 3
  };

  enum class RejectReason : std::uint8_t
  {
    None = 0,
    InvalidParams = 1,
    UnknownSymbol = 2,
    UnknownOrderId = 3,
    AlreadyTerminal = 4,
    NoLiquidity = 5,
    SelfTradePrevention = 6,
    InsufficientResources = 7, // resting capacity exceeded
    NotRunning = 8
  };

  enum class StpPolicy : std::uint8_t
  {
    None = 0,
    RejectIncoming = 1
  };

  inline bool is_terminal(OrderState st) noexcept
  {
    return st == OrderState::Filled || st == OrderState::Cancelled || st == OrderState::Rejected;
  }

  inline bool is_resting(OrderState st) noexcept
  {
    return st == OrderState::Resting || st == OrderState::Partial;
  }

  std::string_view to_string(Side s) noexcept;
  std::string_view to_string(OrderType t) noexcept;
  std::string_view to_string(SubmitStatus s) noexcept;
  std::string_view to_string(RejectReason r) noexcept;

} // namespace synthex
