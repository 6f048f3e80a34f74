#include "gamma_blast_detector.hpp"
#include "snapshot_codec.hpp"
#include "snapshot_store.hpp"
#include <pybind11/chrono.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <ctime>
#include <span>

namespace py = pybind11;
using namespace pybind11::literals;

namespace {

std::optional<double> numberFrom(const py::dict &d, const char *key) {
  if (!d.contains(key))
    return std::nullopt;
  py::object value = d[key];
  if (value.is_none())
    return std::nullopt;
  // bool is an int subclass in Python
  if (py::isinstance<py::bool_>(value))
    return std::nullopt;
  if (!py::isinstance<py::int_>(value) && !py::isinstance<py::float_>(value))
    return std::nullopt;
  return finiteValue(value.cast<double>());
}

// Missing or None keys leave the field empty
MarketSnapshot snapshotFromDict(const py::dict &d) {
  MarketSnapshot snapshot;
  if (auto ts = numberFrom(d, "timestamp")) {
    snapshot.timestamp = std::chrono::system_clock::from_time_t(
        static_cast<std::time_t>(*ts));
  }
  snapshot.atm_iv = numberFrom(d, "atm_iv");
  snapshot.atm_oi = numberFrom(d, "atm_oi");
  snapshot.gamma_concentration = numberFrom(d, "gamma_concentration");
  snapshot.net_gex = numberFrom(d, "net_gex");
  snapshot.spot_price = numberFrom(d, "spot_price");
  snapshot.atm_strike = numberFrom(d, "atm_strike");
  snapshot.ce_oi_total = numberFrom(d, "ce_oi_total");
  snapshot.pe_oi_total = numberFrom(d, "pe_oi_total");
  snapshot.ce_iv_avg = numberFrom(d, "ce_iv_avg");
  snapshot.pe_iv_avg = numberFrom(d, "pe_iv_avg");
  return snapshot;
}

py::object optionalToPy(const std::optional<double> &value) {
  return value ? py::cast(*value) : py::none();
}

py::dict signalToDict(const GammaBlastSignal &signal) {
  const auto &m = signal.metrics;
  return py::dict(
      "probability"_a = signal.probability,
      "direction"_a = std::string(toString(signal.direction)),
      "confidence"_a = std::string(toString(signal.confidence)),
      "time_to_blast_min"_a = signal.time_to_blast_min,
      "triggers"_a = signal.triggers,
      "risk_level"_a = std::string(toString(signal.risk_level)),
      "mode"_a = std::string(toString(signal.mode)),
      "metrics"_a = py::dict(
          "iv_zscore"_a = optionalToPy(m.iv_zscore),
          "oi_accel_zscore"_a = optionalToPy(m.oi_accel_zscore),
          "gamma_zscore"_a = optionalToPy(m.gamma_zscore),
          "gex_percentile"_a = optionalToPy(m.gex_percentile),
          "pin_distance_pct"_a = optionalToPy(m.pin_distance_pct),
          "pcr"_a = optionalToPy(m.pcr),
          "direction_score"_a = m.direction_score
                                    ? py::cast(*m.direction_score)
                                    : py::none(),
          "iv_velocity"_a = optionalToPy(m.iv_velocity),
          "oi_velocity"_a = optionalToPy(m.oi_velocity),
          "gamma_velocity"_a = optionalToPy(m.gamma_velocity)));
}

py::dict detect(const py::dict &current, const py::list &history) {
  std::vector<MarketSnapshot> window;
  window.reserve(history.size());
  for (py::handle item : history) {
    window.push_back(snapshotFromDict(item.cast<py::dict>()));
  }

  const auto now = snapshotFromDict(current);
  GammaBlastDetector detector;
  GammaBlastSignal signal;
  {
    py::gil_scoped_release release;
    signal = detector.detect(now, window);
  }
  return signalToDict(signal);
}

py::dict check_gamma_blast_sync(const std::string &symbol,
                                const std::string &expiry,
                                const std::string &redis_url) {
  try {
    SnapshotStore store(redis_url, 1);
    auto snapshots = store.getRecentSnapshots(
        symbol, expiry, DetectionConfig::max_history + 1);

    if (snapshots.empty()) {
      return py::dict("error"_a = "No snapshot data found");
    }

    GammaBlastDetector detector;
    const std::span<const MarketSnapshot> history{snapshots.begin() + 1,
                                                  snapshots.end()};
    auto result = signalToDict(detector.detect(snapshots.front(), history));
    result["timestamp"] = py::cast(snapshots.front().timestamp);
    return result;
  } catch (const std::exception &e) {
    return py::dict("error"_a = e.what());
  }
}

} // namespace

PYBIND11_MODULE(gamma_blast_detector, m) {
  m.doc() = "Gamma Blast Detector Module";

  m.def("detect", &detect,
        "Score the current snapshot against a newest-first history",
        py::arg("current"), py::arg("history"));

  m.def("check_gamma_blast_sync", &check_gamma_blast_sync,
        "Synchronously score the latest stored snapshot of a symbol/expiry",
        py::arg("symbol"), py::arg("expiry"),
        py::arg("redis_url") = "redis://127.0.0.1:6379");

  py::class_<DetectionConfig>(m, "DetectionConfig")
      .def(py::init<>())
      .def_readonly_static("min_adaptive_history",
                           &DetectionConfig::min_adaptive_history)
      .def_readonly_static("max_history", &DetectionConfig::max_history)
      .def_readonly_static("max_probability", &DetectionConfig::max_probability)
      .def_readonly_static("iv_spike_high_z", &DetectionConfig::iv_spike_high_z)
      .def_readonly_static("iv_spike_low_z", &DetectionConfig::iv_spike_low_z)
      .def_readonly_static("oi_unwind_z", &DetectionConfig::oi_unwind_z)
      .def_readonly_static("oi_buildup_z", &DetectionConfig::oi_buildup_z)
      .def_readonly_static("gamma_cluster_z", &DetectionConfig::gamma_cluster_z)
      .def_readonly_static("pin_distance_pct",
                           &DetectionConfig::pin_distance_pct)
      .def_readonly_static("gex_extreme_high_pct",
                           &DetectionConfig::gex_extreme_high_pct)
      .def_readonly_static("gex_extreme_low_pct",
                           &DetectionConfig::gex_extreme_low_pct)
      .def_readonly_static("fallback_base_probability",
                           &DetectionConfig::fallback_base_probability);
}
