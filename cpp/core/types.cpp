#include "synthex/types.hpp"

namespace synthex
{

  std::string_view to_string(Side s) noexcept { return s == Side::Buy ? "buy" : "sell"; }

  std::string_view to_string(OrderType t) noexcept { return t == OrderType::Market ? "market" : "limit"; }

  std::string_view to_string(SubmitStatus s) noexcept
  {
    switch ( s ) {
      case SubmitStatus::Filled:
        return "filled";
      case SubmitStatus::PartiallyFilled:
        return "partially_filled";
      case SubmitStatus::Resting:
        return "resting";
      case SubmitStatus::Rejected:
        return "rejected";
    }
    return "unknown";
  }

  std::string_view to_string(RejectReason r) noexcept
  {
    switch ( r ) {
      case RejectReason::None:
        return "none";
      case RejectReason::InvalidParams:
        return "invalid_params";
      case RejectReason::UnknownSymbol:
        return "unknown_symbol";
      case RejectReason::UnknownOrderId:
        return "unknown_order_id";
      case RejectReason::AlreadyTerminal:
        return "already_terminal";
      case RejectReason::NoLiquidity:
        return "no_liquidity";
      case RejectReason::SelfTradePrevention:
        return "self_trade_prevention";
      case RejectReason::InsufficientResources:
        return "insufficient_resources";
      case RejectReason::NotRunning:
        return "not_running";
    }
    return "unknown";
  }

} // namespace synthex
