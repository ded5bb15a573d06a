#pragma once

#include <cstdint>
#include <optional>

namespace arb {

// -----------------------------------------------------------------------------
// FeeData: network fee levels reported by a node
// -----------------------------------------------------------------------------
//
// Each field is optional because nodes differ in what they report (legacy
// gas price only, or EIP-1559 fields only). Values are in wei per gas.
// -----------------------------------------------------------------------------
struct FeeData {
  std::optional<std::uint64_t> max_fee_per_gas;
  std::optional<std::uint64_t> max_priority_fee_per_gas;
  std::optional<std::uint64_t> gas_price;
};

// -----------------------------------------------------------------------------
// IFeeOracle: current network fee level
// -----------------------------------------------------------------------------
//
// @brief  External collaborator queried by GasEstimator once per market
//         update.
//
// @details
// Returns std::nullopt when the fee level is unavailable (timeout, RPC
// error). Implementations own the bound on their own latency; the
// estimator never waits on anything else. An implementation that throws
// is treated the same as std::nullopt.
//
// Thread model: called from the scan loop thread only.
// -----------------------------------------------------------------------------
class IFeeOracle {
 public:
  virtual ~IFeeOracle() = default;

  virtual std::optional<FeeData> feeData() = 0;
};

// -----------------------------------------------------------------------------
// StaticFeeOracle: fixed fee level
// -----------------------------------------------------------------------------
// Used in paper mode when no node is configured, and by tests. A
// default-constructed oracle reports empty FeeData (estimator defaults
// apply); setUnavailable() makes it report std::nullopt.
// -----------------------------------------------------------------------------
class StaticFeeOracle : public IFeeOracle {
 public:
  StaticFeeOracle() = default;
  explicit StaticFeeOracle(FeeData data) : data_(data) {}

  std::optional<FeeData> feeData() override { return data_; }

  void setFeeData(FeeData data) { data_ = data; }
  void setUnavailable() { data_.reset(); }

 private:
  std::optional<FeeData> data_{FeeData{}};
};

}  // namespace arb
