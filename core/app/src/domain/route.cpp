#include "arb/domain/route.hpp"
#include "arb/errors.hpp"

namespace arb {
namespace domain {

void validateRoute(const Route& route) {
  if (route.tokens.size() < 2) {
    throw InvalidConfiguration("route '" + route.id + "' has " +
                               std::to_string(route.tokens.size()) +
                               " token(s); at least 2 required");
  }
  if (route.venues.size() != route.tokens.size()) {
    throw InvalidConfiguration("route '" + route.id + "' has " +
                               std::to_string(route.venues.size()) +
                               " venue(s) for " +
                               std::to_string(route.tokens.size()) + " legs");
  }
  for (std::size_t leg = 0; leg < route.legCount(); ++leg) {
    if (route.legTokenIn(leg) == route.legTokenOut(leg)) {
      throw InvalidConfiguration("route '" + route.id + "' leg " +
                                 std::to_string(leg) +
                                 " swaps a token into itself");
    }
  }
}

std::string makeRouteId(const std::vector<std::string>& tokens) {
  std::string id;
  for (const auto& symbol : tokens) {
    if (!id.empty()) {
      id += '-';
    }
    id += symbol;
  }
  return id;
}

}  // namespace domain
}  // namespace arb
