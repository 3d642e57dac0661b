#include "plx_execution_log.h"
#include <iostream>

namespace plx::processors {

plx_execution_log::plx_execution_log(bool verbose) : verbose_(verbose) {}

void plx_execution_log::warn(const plx_string& message) {
  std::cerr << "Warning: " << message << std::endl;
  warnings_.push_back(message);
}

void plx_execution_log::info(const plx_string& message) const {
  if (verbose_) {
    std::cout << message << std::endl;
  }
}

const std::vector<plx_string>& plx_execution_log::get_warnings() const {
  return warnings_;
}

bool plx_execution_log::is_verbose() const {
  return verbose_;
}

} // namespace plx::processors
