#ifndef PLX_EXECUTION_LOG_H
#define PLX_EXECUTION_LOG_H

#include "../utils/plx_string.h"
#include <vector>

namespace plx::processors {

// Collects the degraded-step messages of one execution. Warnings go to
// std::cerr as they happen, info lines to std::cout when verbose.
class plx_execution_log {
public:
  explicit plx_execution_log(bool verbose = false);

  void warn(const plx_string& message);
  void info(const plx_string& message) const;

  const std::vector<plx_string>& get_warnings() const;
  bool is_verbose() const;

private:
  bool verbose_;
  std::vector<plx_string> warnings_;
};

} // namespace plx::processors

#endif // PLX_EXECUTION_LOG_H
