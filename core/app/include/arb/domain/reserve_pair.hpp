#pragma once

#include "arb/domain/amount.hpp"

#include <cstdint>

namespace arb {
namespace domain {

// -----------------------------------------------------------------------------
// ReservePair: one pool, oriented in the direction of a swap
// -----------------------------------------------------------------------------
//
// @brief  Snapshot of a two-token constant-product pool at one instant,
//         oriented so that reserve_in is the side being sold into.
//
// @details
// Produced by an IReserveReader for a single evaluation and discarded
// afterwards. fee_bps is the venue's swap fee taken from the input amount
// (30 = 0.30%).
//
// Ownership: value type, owned by the orchestrator for one evaluation.
// -----------------------------------------------------------------------------
struct ReservePair {
  Amount reserve_in{0};
  Amount reserve_out{0};
  std::uint32_t fee_bps{30};
};

}  // namespace domain
}  // namespace arb
