#pragma once

#include <string>

namespace report {

/**
 * @struct Violation
 * Structure representing one reported rule violation.
 */
struct Violation {
    std::string file;
    int line = 0;
    int column = 0;
    std::string severity; /**< Analyzer severity, always "style". */
    std::string message; /**< Rule text or the generic message. */
    std::string addon; /**< Rule category tag, "misra". */
    std::string error_id; /**< e.g. "c2012-15.1". */
    std::string misra_severity; /**< Required, Mandatory, Advisory or Undefined. */
};

/**
 * @class ViolationWriter
 * @brief Output side of the reporting sink, owned by the embedding
 * application.
 */
class ViolationWriter {
public:
  virtual ~ViolationWriter() = default;

  virtual void Write(const Violation &violation) = 0;
};

} // namespace report
