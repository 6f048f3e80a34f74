#pragma once
#include <cstddef>
#include "gamma_blast_signal.hpp"

struct Classification {
  Confidence confidence;
  int time_to_blast_min;
};

Classification classify(double probability, std::size_t trigger_count);
