#include "snapshot_codec.hpp"
#include <cmath>
#include <cstdint>
#include <utility>

using json = nlohmann::json;

namespace {

constexpr std::pair<const char *, SnapshotField> kSnapshotFields[] = {
    {"atm_iv", &MarketSnapshot::atm_iv},
    {"atm_oi", &MarketSnapshot::atm_oi},
    {"gamma_concentration", &MarketSnapshot::gamma_concentration},
    {"net_gex", &MarketSnapshot::net_gex},
    {"spot_price", &MarketSnapshot::spot_price},
    {"atm_strike", &MarketSnapshot::atm_strike},
    {"ce_oi_total", &MarketSnapshot::ce_oi_total},
    {"pe_oi_total", &MarketSnapshot::pe_oi_total},
    {"ce_iv_avg", &MarketSnapshot::ce_iv_avg},
    {"pe_iv_avg", &MarketSnapshot::pe_iv_avg},
};

std::optional<double> numberAt(const json &j, const char *key) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_number())
    return std::nullopt;

  return finiteValue(it->get<double>());
}

int64_t toEpochSeconds(std::chrono::system_clock::time_point tp) {
  return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch())
      .count();
}

void putOptional(json &j, const char *key, const std::optional<double> &value) {
  j[key] = value ? json(*value) : json(nullptr);
}

} // namespace

std::optional<double> finiteValue(double value) {
  if (!std::isfinite(value))
    return std::nullopt;
  return value;
}

std::optional<MarketSnapshot> snapshotFromJson(const json &j) {
  if (!j.is_object())
    return std::nullopt;

  MarketSnapshot snapshot;
  if (auto ts = j.find("timestamp"); ts != j.end() && ts->is_number()) {
    snapshot.timestamp = std::chrono::system_clock::time_point(
        std::chrono::seconds(ts->get<int64_t>()));
  }

  for (const auto &[key, field] : kSnapshotFields) {
    snapshot.*field = numberAt(j, key);
  }
  return snapshot;
}

json snapshotToJson(const MarketSnapshot &snapshot) {
  json j;
  j["timestamp"] = toEpochSeconds(snapshot.timestamp);
  for (const auto &[key, field] : kSnapshotFields) {
    putOptional(j, key, snapshot.*field);
  }
  return j;
}

json signalToJson(const GammaBlastSignal &signal, const std::string &symbol,
                  const std::string &expiry,
                  std::chrono::system_clock::time_point timestamp) {
  const auto &m = signal.metrics;

  json metrics;
  putOptional(metrics, "iv_zscore", m.iv_zscore);
  putOptional(metrics, "oi_accel_zscore", m.oi_accel_zscore);
  putOptional(metrics, "gamma_zscore", m.gamma_zscore);
  putOptional(metrics, "gex_percentile", m.gex_percentile);
  putOptional(metrics, "pin_distance_pct", m.pin_distance_pct);
  putOptional(metrics, "pcr", m.pcr);
  metrics["direction_score"] =
      m.direction_score ? json(*m.direction_score) : json(nullptr);
  putOptional(metrics, "iv_velocity", m.iv_velocity);
  putOptional(metrics, "oi_velocity", m.oi_velocity);
  putOptional(metrics, "gamma_velocity", m.gamma_velocity);

  return json{
      {"symbol", symbol},
      {"expiry", expiry},
      {"timestamp", toEpochSeconds(timestamp)},
      {"probability", signal.probability},
      {"direction", std::string(toString(signal.direction))},
      {"confidence", std::string(toString(signal.confidence))},
      {"time_to_blast_min", signal.time_to_blast_min},
      {"triggers", signal.triggers},
      {"risk_level", std::string(toString(signal.risk_level))},
      {"mode", std::string(toString(signal.mode))},
      {"metrics", std::move(metrics)},
  };
}
