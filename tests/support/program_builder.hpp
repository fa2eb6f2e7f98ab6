#pragma once

#include "../../src/models/program.hpp"
#include "../../src/models/refs.hpp"
#include "../../src/report/verify_sink.hpp"
#include "../../src/rules/rule.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace support {

/**
 * @class ProgramBuilder
 * @brief Builds small models for tests.
 *
 * Source lines are split on spaces; a word starting with "//" takes the
 * rest of the line and "/*" runs up to the closing "*\/". Brackets are
 * linked and kind flags are set from the token text. AST edges, types,
 * scopes and symbols are wired by hand.
 */
class ProgramBuilder {
public:
  explicit ProgramBuilder(std::string file = "test.c") : file_(std::move(file)) {}

  /**
   * @brief Appends the tokens of one source line.
   * @return Index of the first appended token.
   */
  int Line(int line, std::string_view text);

  /**
   * @brief Index of the n-th token with the given text.
   */
  int Find(std::string_view text, int occurrence = 0) const;

  models::TokenRef Tok(int index) const { return {&model_, index}; }
  models::TokenRef Tok(std::string_view text, int occurrence = 0) const {
    return Tok(Find(text, occurrence));
  }

  /**
   * @brief Sets the AST operands of a node and their parent links.
   */
  void Ast(int node, int operand1, int operand2 = models::kNoIndex);

  void Type(int token, models::TypeKind kind,
            std::optional<models::Sign> sign = std::nullopt, int pointer = 0);

  /**
   * @brief Adds a scope; body_start and body_end are brace token indices.
   * Tokens strictly inside the braces get the scope.
   * @return The scope index.
   */
  int AddScope(models::ScopeType type, int body_start, int body_end,
               int nested_in = models::kNoIndex, std::string class_name = "");

  /**
   * @brief Adds a variable and binds every token with its name that lies
   * inside the declaring scope (or everywhere for a global).
   * @return The variable index.
   */
  int AddVariable(int name_token, int type_start, int type_end,
                  int scope = models::kNoIndex);

  /**
   * @brief Adds a function and binds every token with its name.
   * @return The function index.
   */
  int AddFunction(std::string name, int token_def);

  void AddDirective(int line, std::string text);

  models::Model &Model() { return model_; }
  const models::Model &Model() const { return model_; }

private:
  void Append(int line, int column, std::string text);

  std::string file_;
  models::Model model_;
  std::vector<int> open_brackets_;
};

/**
 * @brief Wraps a model into a unit with one configuration and the same
 * tokens as the raw stream.
 */
models::TranslationUnit MakeUnit(const models::Model &model,
                                 const std::string &standard = "c11");

/**
 * @brief Runs one check function and returns "line:major.minor" for
 * every report.
 */
std::vector<std::string> Run(rules::FunctionRule::CheckFunction check, rules::RuleId id,
                             const models::TranslationUnit &unit);

/**
 * @brief Runs a rule object and returns "line:major.minor" for every
 * report.
 */
std::vector<std::string> Run(const rules::Rule &rule,
                             const models::TranslationUnit &unit);

} // namespace support
