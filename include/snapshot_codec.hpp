#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "gamma_blast_signal.hpp"
#include "market_snapshot.hpp"

// Empty for NaN and infinities
std::optional<double> finiteValue(double value);

// Decodes a stored snapshot. Missing, null or non-numeric fields stay empty.
// Returns nullopt only when `j` is not an object.
std::optional<MarketSnapshot> snapshotFromJson(const nlohmann::json &j);

nlohmann::json snapshotToJson(const MarketSnapshot &snapshot);

// Field names match what the dashboard and alerting read.
nlohmann::json signalToJson(const GammaBlastSignal &signal,
                            const std::string &symbol,
                            const std::string &expiry,
                            std::chrono::system_clock::time_point timestamp);
