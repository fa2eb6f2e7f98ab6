#pragma once

namespace models {

/* index of an entity inside its arena, kNoIndex when absent */
constexpr int kNoIndex = -1;

struct Value;
struct ValueType;
struct Token;
struct Scope;
struct Variable;
struct Function;
struct Directive;
struct Model;
struct Platform;
struct Standards;
struct Configuration;
struct SuppressionDirective;
struct TranslationUnit;
struct Location;

class TokenRef;
class ScopeRef;
class VariableRef;
class FunctionRef;

} // namespace models
