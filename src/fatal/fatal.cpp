#include "fatal.hpp"
#include "../utils/verbose/verbose.hpp"
#include <fmt/core.h>
#include <iostream>

namespace loger {
static constexpr std::string_view kPrefix = "misracheck: ";

static std::size_t nr_errs = 0;

void non_fatal(const std::string_view &s1,
               const std::optional<std::string> &s2) {
  std::string detail = s2 ? fmt::format(" ({})", *s2) : "";
  std::cout << fmt::format("{}Error: {}{}", kPrefix, s1, detail);
  std::cout << std::endl;
  nr_errs++;
}

void status(const std::string_view &message) {
  auto &verbose_flags = utils::verbose::Flags::getInstance();
  if (!verbose_flags.NeedToPrint()) {
    return;
  }
  std::cout << message << std::endl;
}

void verbose(const std::string_view &message) {
  auto &verbose_flags = utils::verbose::Flags::getInstance();
  if (!verbose_flags.NeedToPrint()) {
    return;
  }
  std::cout << fmt::format("{}{}", kPrefix, message) << std::endl;
}

std::size_t errorCount() { return nr_errs; }

void resetErrorCount() { nr_errs = 0; }

} // namespace loger
