#include "confidence_classifier.hpp"
#include "detection_config.hpp"

Classification classify(double probability, std::size_t trigger_count) {
  using C = DetectionConfig;

  if (probability > C::critical_probability &&
      trigger_count >= C::critical_triggers)
    return {Confidence::CRITICAL, C::critical_minutes};
  if (probability > C::very_high_probability &&
      trigger_count >= C::very_high_triggers)
    return {Confidence::VERY_HIGH, C::very_high_minutes};
  if (probability > C::high_probability)
    return {Confidence::HIGH, C::high_minutes};
  if (probability > C::medium_probability)
    return {Confidence::MEDIUM, C::medium_minutes};
  return {Confidence::LOW, C::low_minutes};
}
