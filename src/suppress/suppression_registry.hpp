#pragma once

#include "../models/program.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace suppress {

/**
 * @struct LineSymbol
 * Location part of a suppression. At least one field is set.
 */
struct LineSymbol {
    std::optional<int> line;
    std::optional<std::string> symbol; /**< Stored, not matched. */

    bool operator==(const LineSymbol &other) const {
      return line == other.line && symbol == other.symbol;
    }
};

/**
 * @struct Entry
 * One suppression with the hit count of its rule, for the end-of-run
 * listing.
 */
struct Entry {
    int rule_number = 0; /**< major * 100 + minor. */
    std::optional<std::string> file; /**< Unset for a global suppression. */
    std::optional<LineSymbol> where; /**< Unset for a whole-file suppression. */
    int hits = 0;
};

/**
 * @class SuppressionRegistry
 * @brief Rule number to file to location suppression lookup.
 *
 * A rule maps either to the global sentinel (no file) or to files; a file
 * maps to a list of line/symbol pairs where an empty item suppresses the
 * whole file. The registry is filled before rules run and only the hit
 * counters change afterwards.
 */
class SuppressionRegistry {
public:
  /**
   * @brief Adds a suppression. Re-adding an existing one is a no-op.
   * @param rule_number major * 100 + minor.
   * @param file File name, lexically normalized; unset suppresses the
   * rule everywhere.
   * @param line Line number.
   * @param symbol Symbol name.
   */
  void Add(int rule_number, std::optional<std::string> file = std::nullopt,
           std::optional<int> line = std::nullopt,
           std::optional<std::string> symbol = std::nullopt);

  /**
   * @brief Adds the suppressions whose error id names a rule, e.g.
   * "misra-c2012-15.1" is ignored while "misra_15_1" and "MISRA.15.1" are
   * taken.
   * @param directives Suppressions extracted by the analyzer.
   */
  void AddFromDirectives(const std::vector<models::SuppressionDirective> &directives);

  /**
   * @brief Adds global suppressions from a comma separated rule list such
   * as "15.1,11.3". Items that are not rule ids are ignored.
   * @param list The rule list.
   */
  void AddRuleList(std::string_view list);

  /**
   * @brief Sets the prefix stripped from queried paths. Without a prefix
   * the base name of the path is used.
   */
  void SetFilePrefix(std::string prefix) { file_prefix_ = std::move(prefix); }

  /**
   * @brief Looks up a suppression: global, whole file, then line.
   * @param file_path Path of the violation.
   * @param line Line of the violation.
   * @param rule_number major * 100 + minor.
   * @return True when the violation is suppressed.
   */
  bool IsSuppressed(const std::string &file_path, int line, int rule_number) const;

  /**
   * @brief Checks for the global sentinel of a rule.
   */
  bool IsGloballySuppressed(int rule_number) const;

  /**
   * @brief Counts one suppressed violation of a rule.
   */
  void CountHit(int rule_number) { hits_[rule_number]++; }

  int Hits(int rule_number) const;

  /**
   * @brief Number of stored items of a rule over all files.
   */
  std::size_t ItemCount(int rule_number) const;

  bool Empty() const { return rules_.empty(); }

  /**
   * @brief Lists every suppression with the hit count of its rule.
   */
  std::vector<Entry> Entries() const;

  /**
   * @brief Formats the suppression listing, one line per entry, in
   * descending order.
   */
  std::vector<std::string> ReportLines() const;

private:
  using ItemList = std::vector<std::optional<LineSymbol>>;
  using FileMap = std::map<std::optional<std::string>, ItemList>;

  std::string QueryName(const std::string &file_path) const;

  std::map<int, FileMap> rules_;
  std::map<int, int> hits_;
  std::optional<std::string> file_prefix_;
};

/**
 * @brief Removes a leading path prefix and the separators left behind.
 * @param file_path The path, e.g. "/remove/this/path/file.c".
 * @param prefix The prefix, e.g. "/remove/this/path".
 * @return "file.c" for the example; file_path when it does not start with
 * prefix.
 */
std::string RemoveFilePrefix(const std::string &file_path, const std::string &prefix);

/**
 * @brief Normalizes a suppression file name: expands a leading "~" and
 * removes "." and ".." components.
 */
std::string NormalizeFileName(const std::string &file_name);

} // namespace suppress
