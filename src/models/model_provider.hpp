#pragma once

#include "program.hpp"

#include <memory>
#include <string>

namespace models {

/**
 * @class ModelProvider
 * @brief Acquisition boundary to the external analyzer.
 *
 * Implementations deserialize the analyzer output for one unit. A failure
 * is reported with std::runtime_error and fails only that unit.
 */
class ModelProvider {
public:
  virtual ~ModelProvider() = default;

  /**
   * @brief Loads the program model of a translation unit.
   * @param unit The unit name handed to the checker.
   * @return The decorated unit with every configuration.
   */
  virtual std::unique_ptr<TranslationUnit> Acquire(const std::string &unit) = 0;
};

} // namespace models
