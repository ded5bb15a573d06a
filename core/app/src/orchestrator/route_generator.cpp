#include "arb/orchestrator/route_generator.hpp"

#include <cstddef>

namespace arb {

std::vector<domain::Route> generateRoutes(const std::vector<std::string>& tokens,
                                          const std::string& dex_a,
                                          const std::string& dex_b) {
  std::vector<domain::Route> routes;
  const std::size_t n = tokens.size();
  if (n < 3) {
    return routes;
  }
  routes.reserve(n * (n - 1) * (n - 2));

  for (std::size_t i = 0; i < n; ++i) {
    for (std::size_t j = 0; j < n; ++j) {
      for (std::size_t k = 0; k < n; ++k) {
        if (i == j || j == k || i == k) {
          continue;
        }
        domain::Route route;
        route.tokens = {tokens[i], tokens[j], tokens[k]};
        route.venues = {dex_a, dex_b, dex_a};
        route.id = domain::makeRouteId(route.tokens);
        routes.push_back(std::move(route));
      }
    }
  }
  return routes;
}

}  // namespace arb
