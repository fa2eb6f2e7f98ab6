#pragma once

#include "rule.hpp"

/**
 * Check functions of the rule catalog, grouped by the file that
 * implements them. rule_table.cpp binds each one to its rule id.
 */
namespace rules::checks {

// identifiers.cpp
void UnusedParameter(const CheckContext &ctx);            // 2.7
void ExternalIdentifierClash(const CheckContext &ctx);    // 5.1
void ScopeIdentifierClash(const CheckContext &ctx);       // 5.2
void IdentifierHiding(const CheckContext &ctx);           // 5.3
void MacroNameClash(const CheckContext &ctx);             // 5.4
void IdentifierMacroClash(const CheckContext &ctx);       // 5.5
void ReservedIdentifier(const CheckContext &ctx);         // 21.1

// lexical.cpp, raw tokens
void NestedCommentMarker(const CheckContext &ctx);        // 3.1
void LineSplicingComment(const CheckContext &ctx);        // 3.2
void UnterminatedEscape(const CheckContext &ctx);         // 4.1
void Trigraph(const CheckContext &ctx);                   // 4.2
void OctalConstant(const CheckContext &ctx);              // 7.1
void LowercaseLongSuffix(const CheckContext &ctx);        // 7.3
void RestrictQualifier(const CheckContext &ctx);          // 8.14
void DesignatedArraySize(const CheckContext &ctx);        // 9.5
void SizeofArithmetic(const CheckContext &ctx);           // 12.1
void CompoundBody(const CheckContext &ctx);               // 15.6
void StaticArrayParameter(const CheckContext &ctx);       // 17.6
void IncludeSyntax(const CheckContext &ctx);              // 20.3

// declarations.cpp
void ExternArraySize(const CheckContext &ctx);            // 8.11
void DuplicateEnumValue(const CheckContext &ctx);         // 8.12
void PointerNesting(const CheckContext &ctx);             // 18.5
void FlexibleArrayMember(const CheckContext &ctx);        // 18.7
void VariableLengthArray(const CheckContext &ctx);        // 18.8
void UnionKeyword(const CheckContext &ctx);               // 19.2

// essential_types.cpp
void ShiftOperandCategory(const CheckContext &ctx);       // 10.1
void NarrowingAssignment(const CheckContext &ctx);        // 10.3
void MixedCategories(const CheckContext &ctx);            // 10.4
void CompositeWidening(const CheckContext &ctx);          // 10.6
void CompositeCast(const CheckContext &ctx);              // 10.8

// pointers.cpp
void IncompatibleObjectPointerCast(const CheckContext &ctx); // 11.3
void PointerIntegerCast(const CheckContext &ctx);         // 11.4
void VoidPointerConversion(const CheckContext &ctx);      // 11.5
void VoidPointerArithmeticCast(const CheckContext &ctx);  // 11.6
void PointerNonIntegerCast(const CheckContext &ctx);      // 11.7
void CastAwayConst(const CheckContext &ctx);              // 11.8
void IntegerNullPointer(const CheckContext &ctx);         // 11.9
void PointerArithmetic(const CheckContext &ctx);          // 18.4

// operators.cpp
void ImplicitPrecedence(const CheckContext &ctx);         // 12.1
void ShiftWidth(const CheckContext &ctx);                 // 12.2
void CommaOperator(const CheckContext &ctx);              // 12.3
void UnsignedWrap(const CheckContext &ctx);               // 12.4
void InitializerSideEffect(const CheckContext &ctx);      // 13.1
void IncrementWithSideEffects(const CheckContext &ctx);   // 13.3
void AssignmentResultUsed(const CheckContext &ctx);       // 13.4
void LogicalOperandSideEffect(const CheckContext &ctx);   // 13.5
void SizeofSideEffect(const CheckContext &ctx);           // 13.6

// control_flow.cpp
void FloatLoopCounter(const CheckContext &ctx);           // 14.1
void MalformedForLoop(const CheckContext &ctx);           // 14.2
void NonBooleanCondition(const CheckContext &ctx);        // 14.4
void Goto(const CheckContext &ctx);                       // 15.1
void BackwardGoto(const CheckContext &ctx);               // 15.2
void GotoIntoBlock(const CheckContext &ctx);              // 15.3
void MultipleExits(const CheckContext &ctx);              // 15.5
void UnterminatedElseIf(const CheckContext &ctx);         // 15.7
void MisplacedCase(const CheckContext &ctx);              // 16.2
void MissingDefault(const CheckContext &ctx);             // 16.4
void MisplacedDefault(const CheckContext &ctx);           // 16.5
void SingleClauseSwitch(const CheckContext &ctx);         // 16.6
void BooleanSwitch(const CheckContext &ctx);              // 16.7

// functions.cpp
void VariadicArguments(const CheckContext &ctx);          // 17.1
void Recursion(const CheckContext &ctx);                  // 17.2
void UnusedReturnValue(const CheckContext &ctx);          // 17.7
void ParameterModified(const CheckContext &ctx);          // 17.8

// preprocessor.cpp
void LateInclude(const CheckContext &ctx);                // 20.1
void IncludeHeaderName(const CheckContext &ctx);          // 20.2
void KeywordMacro(const CheckContext &ctx);               // 20.4
void Undef(const CheckContext &ctx);                      // 20.5
void UnparenthesizedMacroParameter(const CheckContext &ctx); // 20.7
void StringifyOperator(const CheckContext &ctx);          // 20.10
void UnknownDirective(const CheckContext &ctx);           // 20.13
void ConditionalAcrossFiles(const CheckContext &ctx);     // 20.14

// standard_library.cpp
void DynamicMemory(const CheckContext &ctx);              // 21.3
void Setjmp(const CheckContext &ctx);                     // 21.4
void Signal(const CheckContext &ctx);                     // 21.5
void StandardIo(const CheckContext &ctx);                 // 21.6
void StringConversion(const CheckContext &ctx);           // 21.7
void ProcessControl(const CheckContext &ctx);             // 21.8
void SearchAndSort(const CheckContext &ctx);              // 21.9
void TimeFunctions(const CheckContext &ctx);              // 21.10
void TypeGenericMath(const CheckContext &ctx);            // 21.11
void FloatingExceptions(const CheckContext &ctx);         // 21.12

} // namespace rules::checks
