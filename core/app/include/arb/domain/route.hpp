#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace arb {
namespace domain {

// -----------------------------------------------------------------------------
// Route: closed multi-hop swap loop
// -----------------------------------------------------------------------------
//
// @brief  Ordered loop of token symbols plus the venue used for each leg.
//
// @details
// Leg i swaps tokens[i] -> tokens[(i + 1) % n] on venues[i]; the final leg
// returns to tokens[0], which is the token the notional is denominated in.
// Routes are generated once at startup and never mutated.
//
// A valid route has at least two tokens and exactly one venue per leg;
// validateRoute() enforces this.
// -----------------------------------------------------------------------------
struct Route {
  std::string id;
  std::vector<std::string> tokens;
  std::vector<std::string> venues;

  std::size_t legCount() const { return tokens.size(); }

  const std::string& legTokenIn(std::size_t leg) const { return tokens[leg]; }

  const std::string& legTokenOut(std::size_t leg) const {
    return tokens[(leg + 1) % tokens.size()];
  }
};

/// Throws InvalidConfiguration for an empty/degenerate route or a
/// venue list that does not match the leg count.
void validateRoute(const Route& route);

/// "USDC-WETH-WMATIC" style identifier.
std::string makeRouteId(const std::vector<std::string>& tokens);

}  // namespace domain
}  // namespace arb
