#pragma once

#include <string>
#include <string_view>

namespace rules {

/**
 * @struct RuleId
 * Rule identifier "major.minor".
 */
struct RuleId {
    int major = 0;
    int minor = 0;

    /**
     * @brief Rule number in hundreds format: major * 100 + minor.
     */
    int Number() const { return major * 100 + minor; }

    /**
     * @brief Formats the id as "major.minor".
     */
    std::string ToString() const;

    /**
     * @brief Parses "major.minor".
     * @param text The rule id, e.g. "15.1".
     * @return The parsed id.
     * @throws std::invalid_argument when text is not two dot separated
     * numbers.
     */
    static RuleId Parse(std::string_view text);

    /**
     * @brief Builds an id from the hundreds format.
     */
    static RuleId FromNumber(int number) { return RuleId{number / 100, number % 100}; }

    bool operator==(const RuleId &other) const { return Number() == other.Number(); }
    bool operator!=(const RuleId &other) const { return !(*this == other); }
    bool operator<(const RuleId &other) const { return Number() < other.Number(); }
};

} // namespace rules
