#pragma once

namespace utils::verbose {
/**
 * @class Flags
 * @brief Process-wide switch for log output.
 *
 * Quiet and verbose runs are chosen per checker through its settings.
 * Clean() silences every message of the process until Reset().
 */
class Flags {
private:
  /**
   * @brief Default constructor.
   */
  Flags() = default;

public:
  Flags(const Flags &other) = delete;
  Flags &operator=(const Flags &other) = delete;

  /**
   * @brief Check if log messages may be printed.
   * @return False after Clean().
   */
  bool NeedToPrint() const;

  /**
   * @brief Silence all output.
   */
  void Clean();

  /**
   * @brief Undo Clean().
   */
  void Reset();

  static Flags &getInstance() {
    static Flags instance;
    return instance;
  }

private:
    bool clean_ = false;
};

} // namespace utils::verbose
