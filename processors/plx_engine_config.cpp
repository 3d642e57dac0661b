#include "plx_engine_config.h"
#include "../utils/plx_env.h"
#include <iostream>

namespace plx::processors {

namespace {

  double positive_or(double value, double fallback, const char* key)
  {
    if (value <= 0.0) {
      std::cerr << "Warning: " << key << " must be positive, using " << fallback << std::endl;
      return fallback;
    }
    return value;
  }

} // namespace

plx_engine_config plx_engine_config::from_env()
{
  plx_engine_config config;
  config.row_tolerance = positive_or(env_double("PLX_ROW_TOLERANCE", config.row_tolerance),
                                     config.row_tolerance, "PLX_ROW_TOLERANCE");
  config.column_tolerance = positive_or(env_double("PLX_COLUMN_TOLERANCE", config.column_tolerance),
                                        config.column_tolerance, "PLX_COLUMN_TOLERANCE");
  config.proximity_threshold = positive_or(env_double("PLX_PROXIMITY_THRESHOLD", config.proximity_threshold),
                                           config.proximity_threshold, "PLX_PROXIMITY_THRESHOLD");
  config.value_max_distance = positive_or(env_double("PLX_VALUE_MAX_DISTANCE", config.value_max_distance),
                                          config.value_max_distance, "PLX_VALUE_MAX_DISTANCE");

  long long blocks = env_int("PLX_FINGERPRINT_BLOCKS", static_cast<long long>(config.fingerprint_blocks));
  if (blocks > 0) {
    config.fingerprint_blocks = static_cast<size_t>(blocks);
  } else {
    std::cerr << "Warning: PLX_FINGERPRINT_BLOCKS must be positive, using "
              << config.fingerprint_blocks << std::endl;
  }

  config.verbose = env_bool("PLX_VERBOSE", config.verbose);
  return config;
}

} // namespace plx::processors
