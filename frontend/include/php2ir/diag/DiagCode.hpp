// frontend/include/php2ir/diag/DiagCode.hpp
#pragma once
#include <cstdint>


namespace php2ir::diag {

    enum class Severity : uint8_t {
        kError,
        kWarning,
        kFatal,
    };

    enum class Language : uint8_t {
        kEn,
        kKo,
    };

    /// @brief 진단 코드가 속하는 오류 분류(사용자에게 보고되는 taxonomy).
    enum class ErrorKind : uint8_t {
        kUnresolvedSymbol,
        kTypeMismatch,
        kVisibilityViolation,
        kUseBeforeDef,
        kUnsupportedConstruct,
        kInternal,
        kNote,          // warnings / bookkeeping
    };

    enum class Code : uint16_t {
        kTooManyErrors,

        // ---- unresolved ----
        kUnresolvedFunction,        // {0}=name
        kUnresolvedClass,           // {0}=name
        kUnresolvedMethod,          // {0}=class, {1}=method
        kUnresolvedProperty,        // {0}=class, {1}=property
        kUnresolvedConstant,        // {0}=name
        kNoParentClass,             // {0}=class
        kThisOutsideClass,
        kDuplicateFunction,         // {0}=name
        kDuplicateClass,            // {0}=name
        kDuplicateMember,           // {0}=class, {1}=member
        kUnknownDependency,         // {0}=unit
        kDependencyCycle,           // {0}=unit

        // ---- type mismatch ----
        kArgTypeMismatch,           // {0}=callee, {1}=index, {2}=expected, {3}=got
        kArgCountMismatch,          // {0}=callee, {1}=expected, {2}=got
        kReturnTypeMismatch,        // {0}=function, {1}=expected, {2}=got
        kMissingReturnValue,        // {0}=function
        kVoidReturnValue,           // {0}=function
        kPropertyTypeMismatch,      // {0}=property, {1}=expected, {2}=got
        kOperandTypeMismatch,       // {0}=operator, {1}=lhs, {2}=rhs
        kConditionTypeMismatch,     // {0}=got
        kOverrideSignatureMismatch, // {0}=class, {1}=method, {2}=parent
        kMissingInterfaceMethod,    // {0}=class, {1}=interface, {2}=method
        kNotAnInterface,            // {0}=name
        kNotAClass,                 // {0}=name
        kInheritanceCycle,          // {0}=class
        kCannotInstantiate,         // {0}=name
        kNotThrowable,              // {0}=type
        kStaticCallToInstance,      // {0}=class, {1}=method
        kFfiSignatureMismatch,      // {0}=function, {1}=detail
        kFfiBodyNotEmpty,           // {0}=function

        // ---- visibility ----
        kOverrideNarrowsVisibility, // {0}=class, {1}=method, {2}=parent visibility
        kMemberNotAccessible,       // {0}=visibility, {1}=class, {2}=member
        kOverrideFinal,             // {0}=name

        // ---- ssa ----
        kUseBeforeDef,              // {0}=variable

        // ---- unsupported ----
        kUnsupportedConstruct,      // {0}=construct
        kInvalidBreakLevel,         // {0}=keyword, {1}=level

        // ---- warnings ----
        kUnknownAttribute,          // {0}=attribute
        kUnreachableCode,

        // ---- pipeline ----
        kCancelled,                 // {0}=stage
        kInternalFailure,           // {0}=stage, {1}=detail
    };

    /// @brief 코드가 속한 ErrorKind를 반환한다.
    ErrorKind kind_of(Code c);

} // namespace php2ir::diag
