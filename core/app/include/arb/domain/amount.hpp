#pragma once

#include <string>

namespace arb {
namespace domain {

// -----------------------------------------------------------------------------
// Amount / SignedAmount
// -----------------------------------------------------------------------------
// Native token quantities (wei-like smallest units). A 1000 USD trade in an
// 18-decimal token is already 5e20 units, past the uint64 range, so all
// on-chain amounts are 128-bit. Constant-product pools store reserves as
// uint112, which leaves headroom for the fee-scaled products computed by
// the AMM math.
// -----------------------------------------------------------------------------
using Amount = unsigned __int128;
using SignedAmount = __int128;

/// Largest reserve or swap amount accepted by the AMM math (2^112 - 1).
constexpr Amount kMaxReserve = (static_cast<Amount>(1) << 112) - 1;

/// Decimal rendering; JSON and iostreams have no 128-bit support.
std::string toString(Amount value);
std::string toString(SignedAmount value);

/// Parses a non-negative decimal string. Throws std::invalid_argument on
/// non-digit input and std::out_of_range when the value exceeds 128 bits.
Amount parseAmount(const std::string& text);

/// 10^decimals as an Amount. Throws std::out_of_range above 10^38.
Amount pow10(unsigned decimals);

}  // namespace domain
}  // namespace arb
