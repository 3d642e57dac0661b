#ifndef PLX_ENGINE_CONFIG_H
#define PLX_ENGINE_CONFIG_H

#include "../utils/plx_string.h"
#include <cstddef>

namespace plx::processors {

// Tunable tolerances in normalized page units. The defaults were fitted to
// box score layouts and are not physical constants.
struct plx_engine_config {
  double row_tolerance = 0.015;        // row clustering and same-row tests
  double column_tolerance = 0.03;      // header markers closer than this merge
  double proximity_threshold = 0.1;    // multi-word anchor chaining
  double value_max_distance = 0.5;     // reach of anchor.NAME.value
  size_t fingerprint_blocks = 50;      // layout hash prefix
  bool verbose = false;

  // PLX_ROW_TOLERANCE, PLX_COLUMN_TOLERANCE, PLX_PROXIMITY_THRESHOLD,
  // PLX_VALUE_MAX_DISTANCE, PLX_FINGERPRINT_BLOCKS, PLX_VERBOSE
  static plx_engine_config from_env();
};

} // namespace plx::processors

#endif // PLX_ENGINE_CONFIG_H
