#include "arb/domain/trade_record.hpp"

#include <stdexcept>

namespace arb {
namespace domain {

const char* toString(TradeStatus status) {
  switch (status) {
    case TradeStatus::Pending: return "pending";
    case TradeStatus::Success: return "success";
    case TradeStatus::Failed:  return "failed";
  }
  return "unknown";
}

TradeStatus tradeStatusFromString(const std::string& name) {
  if (name == "pending") return TradeStatus::Pending;
  if (name == "success") return TradeStatus::Success;
  if (name == "failed") return TradeStatus::Failed;
  throw std::invalid_argument("unknown trade status: " + name);
}

}  // namespace domain
}  // namespace arb
