#pragma once

#include <optional>
#include <string>

namespace engine {

struct CheckSettings {
  bool verify = false;       // compare against rule tags in comments
  bool quiet = false;        // no progress messages
  bool verbose = false;      // log skipped rules
  bool show_summary = true;  // build the summary after the run
  std::optional<std::string> file_prefix; // stripped before suppression lookup
  std::string suppress_rules; // e.g. "15.1,11.3"
};

} // namespace engine
