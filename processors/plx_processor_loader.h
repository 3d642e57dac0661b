#ifndef PLX_PROCESSOR_LOADER_H
#define PLX_PROCESSOR_LOADER_H

#include "plx_processor.h"
#include <vector>

namespace plx::processors {

// Reads, writes and checks processors in their JSON interchange form
class plx_processor_loader {
public:
  // Parses and checks; throws plx_processor_error when the text is not a
  // JSON object or a region references an undeclared anchor
  static void load_json(const plx_string& json_text, plx_processor& processor);

  // Same for a file on disk
  static void load_file(const plx_string& path, plx_processor& processor);

  static plx_string to_json(const plx_processor& processor, int indent = 2);

  /**
   * @brief Referential integrity check.
   * @throws plx_processor_error listing every dangling anchor reference.
   * @return Non-fatal findings: unknown enum values, bad sources, formulas
   *         and predicates that do not parse.
   */
  static std::vector<plx_string> check(const plx_processor& processor);
};

} // namespace plx::processors

#endif // PLX_PROCESSOR_LOADER_H
