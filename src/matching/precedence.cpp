#include "precedence.hpp"

#include <string_view>
#include <unordered_map>

namespace matching {

const std::unordered_map<std::string_view, int> kBinaryPrecedence{
    {"*", 12},  {"/", 12},  {"%", 12},  {"+", 11},  {"-", 11},
    {"<<", 10}, {">>", 10}, {"<", 9},   {">", 9},   {"<=", 9},
    {">=", 9},  {"==", 8},  {"!=", 8},  {"&", 7},   {"^", 6},
    {"|", 5},   {"&&", 4},  {"||", 3},  {"?", 2},   {":", 2},
    {",", 0},
};

int Precedence(models::TokenRef expr) {
  if (!expr || !expr.Operand1() || !expr.Operand2()) {
    return kAtomPrecedence;
  }
  auto it = kBinaryPrecedence.find(expr.Str());
  if (it != kBinaryPrecedence.end()) {
    return it->second;
  }
  if (expr->is_assignment_op) {
    return 1;
  }
  return -1;
}

} // namespace matching
