#include "verbose.hpp"

namespace utils::verbose {

bool Flags::NeedToPrint() const { return !clean_; }

void Flags::Clean() { clean_ = true; }

void Flags::Reset() { clean_ = false; }

} // namespace utils::verbose
