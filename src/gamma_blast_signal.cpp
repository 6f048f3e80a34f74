#include "gamma_blast_signal.hpp"

std::string_view toString(Direction direction) {
  switch (direction) {
  case Direction::UPSIDE:
    return "UPSIDE";
  case Direction::DOWNSIDE:
    return "DOWNSIDE";
  case Direction::NEUTRAL:
    break;
  }
  return "NEUTRAL";
}

std::string_view toString(Confidence confidence) {
  switch (confidence) {
  case Confidence::CRITICAL:
    return "CRITICAL";
  case Confidence::VERY_HIGH:
    return "VERY_HIGH";
  case Confidence::HIGH:
    return "HIGH";
  case Confidence::MEDIUM:
    return "MEDIUM";
  case Confidence::LOW:
    break;
  }
  return "LOW";
}

std::string_view toString(DetectionMode mode) {
  return mode == DetectionMode::ADAPTIVE ? "ADAPTIVE" : "FALLBACK";
}
