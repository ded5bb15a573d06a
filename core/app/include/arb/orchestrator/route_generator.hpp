#pragma once

#include "arb/domain/route.hpp"

#include <string>
#include <vector>

namespace arb {

/// Every ordered 3-permutation of distinct tokens, with venues
/// {dex_a, dex_b, dex_a}: n * (n - 1) * (n - 2) routes, in lexicographic
/// order of token indices. Fewer than three tokens yields no routes.
std::vector<domain::Route> generateRoutes(const std::vector<std::string>& tokens,
                                          const std::string& dex_a,
                                          const std::string& dex_b);

}  // namespace arb
