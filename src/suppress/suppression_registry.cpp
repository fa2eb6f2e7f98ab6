#include "suppression_registry.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fmt/core.h>
#include <limits>
#include <regex>
#include <stdexcept>

namespace suppress {

namespace {

/* major * 100 + minor, std::nullopt when the number does not fit an int */
std::optional<int> RuleNumber(const std::string &major, const std::string &minor) {
  constexpr long long kMax = std::numeric_limits<int>::max();
  long long major_value = 0;
  long long minor_value = 0;
  try {
    major_value = std::stoll(major);
    minor_value = std::stoll(minor);
  } catch (const std::out_of_range &) {
    return std::nullopt;
  }
  if (major_value > kMax || minor_value > kMax ||
      major_value * 100 + minor_value > kMax) {
    return std::nullopt;
  }
  return static_cast<int>(major_value * 100 + minor_value);
}

} // namespace

std::string RemoveFilePrefix(const std::string &file_path,
                             const std::string &prefix) {
  if (file_path.compare(0, prefix.size(), prefix) != 0) {
    return file_path;
  }
  auto rest = file_path.substr(prefix.size());
  auto first = rest.find_first_not_of("\\/");
  return first == std::string::npos ? std::string() : rest.substr(first);
}

std::string NormalizeFileName(const std::string &file_name) {
  std::string expanded = file_name;
  if (!expanded.empty() && expanded[0] == '~') {
    if (const char *home = std::getenv("HOME")) {
      expanded = home + expanded.substr(1);
    }
  }
  auto normal = std::filesystem::path(expanded).lexically_normal().string();
  if (normal.size() > 1 && normal.back() == '/') {
    normal.pop_back();
  }
  return normal;
}

void SuppressionRegistry::Add(int rule_number, std::optional<std::string> file,
                              std::optional<int> line,
                              std::optional<std::string> symbol) {
  if (file.has_value()) {
    file = NormalizeFileName(*file);
  }
  std::optional<LineSymbol> item;
  if (line.has_value() || symbol.has_value()) {
    item = LineSymbol{line, std::move(symbol)};
  }

  auto &items = rules_[rule_number][file];
  if (std::find(items.begin(), items.end(), item) == items.end()) {
    items.push_back(std::move(item));
  }
}

void SuppressionRegistry::AddFromDirectives(
    const std::vector<models::SuppressionDirective> &directives) {
  static const std::regex kRulePattern(R"(^(misra|MISRA)[_.]([0-9]+)[_.]([0-9]+))");

  for (const auto &directive : directives) {
    std::smatch match;
    if (!std::regex_search(directive.error_id, match, kRulePattern)) {
      continue;
    }
    if (auto rule_number = RuleNumber(match[2].str(), match[3].str())) {
      Add(*rule_number, directive.file_name, directive.line_number,
          directive.symbol_name);
    }
  }
}

void SuppressionRegistry::AddRuleList(std::string_view list) {
  static const std::regex kRulePattern(R"(^([0-9]+).([0-9]+))");

  std::string::size_type start = 0;
  const std::string text(list);
  while (start <= text.size()) {
    auto comma = text.find(',', start);
    if (comma == std::string::npos) {
      comma = text.size();
    }
    const auto item = text.substr(start, comma - start);
    std::smatch match;
    if (std::regex_search(item, match, kRulePattern)) {
      if (auto rule_number = RuleNumber(match[1].str(), match[2].str())) {
        Add(*rule_number);
      }
    }
    start = comma + 1;
  }
}

std::string SuppressionRegistry::QueryName(const std::string &file_path) const {
  if (file_prefix_.has_value()) {
    return RemoveFilePrefix(file_path, *file_prefix_);
  }
  return std::filesystem::path(file_path).filename().string();
}

bool SuppressionRegistry::IsSuppressed(const std::string &file_path, int line,
                                       int rule_number) const {
  auto rule = rules_.find(rule_number);
  if (rule == rules_.end()) {
    return false;
  }
  const auto &files = rule->second;
  if (files.count(std::nullopt) != 0) {
    return true;
  }
  auto file = files.find(QueryName(file_path));
  if (file == files.end()) {
    return false;
  }
  for (const auto &item : file->second) {
    if (!item.has_value() || item->line == line) {
      return true;
    }
  }
  return false;
}

bool SuppressionRegistry::IsGloballySuppressed(int rule_number) const {
  auto rule = rules_.find(rule_number);
  return rule != rules_.end() && rule->second.count(std::nullopt) != 0;
}

int SuppressionRegistry::Hits(int rule_number) const {
  auto it = hits_.find(rule_number);
  return it == hits_.end() ? 0 : it->second;
}

std::size_t SuppressionRegistry::ItemCount(int rule_number) const {
  auto rule = rules_.find(rule_number);
  if (rule == rules_.end()) {
    return 0;
  }
  std::size_t count = 0;
  for (const auto &[file, items] : rule->second) {
    count += items.size();
  }
  return count;
}

std::vector<Entry> SuppressionRegistry::Entries() const {
  std::vector<Entry> entries;
  for (const auto &[rule_number, files] : rules_) {
    for (const auto &[file, items] : files) {
      for (const auto &item : items) {
        entries.push_back(Entry{rule_number, file, item, Hits(rule_number)});
      }
    }
  }
  return entries;
}

std::vector<std::string> SuppressionRegistry::ReportLines() const {
  std::vector<std::string> lines;
  for (const auto &entry : Entries()) {
    std::string where = "None";
    if (entry.where.has_value() && entry.where->line.has_value()) {
      where = std::to_string(*entry.where->line);
    }
    lines.push_back(fmt::format("{}.{}: {}: {} ({} locations suppressed)",
                                entry.rule_number / 100, entry.rule_number % 100,
                                entry.file.value_or("None"), where, entry.hits));
  }
  std::sort(lines.rbegin(), lines.rend());
  return lines;
}

} // namespace suppress
