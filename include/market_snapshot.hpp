#pragma once
#include <chrono>
#include <optional>

// One sample of an option chain around the ATM strike. Numeric fields are
// optional so a missing upstream value disables only the signals reading it.
struct MarketSnapshot {
  std::chrono::system_clock::time_point timestamp;
  std::optional<double> atm_iv;
  std::optional<double> atm_oi;
  std::optional<double> gamma_concentration; // 0..1
  std::optional<double> net_gex;
  std::optional<double> spot_price;
  std::optional<double> atm_strike;
  std::optional<double> ce_oi_total;
  std::optional<double> pe_oi_total;
  std::optional<double> ce_iv_avg;
  std::optional<double> pe_iv_avg;
};

using SnapshotField = std::optional<double> MarketSnapshot::*;
