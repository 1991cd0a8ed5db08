// frontend/src/diag/render.cpp
#include <php2ir/diag/Render.hpp>

#include <sstream>
#include <string>


namespace php2ir::diag {

    static std::string replace_all(std::string s, std::string_view from, std::string_view to) {
        if (from.empty()) return s;
        size_t pos = 0;
        while ((pos = s.find(from, pos)) != std::string::npos) {
            s.replace(pos, from.size(), to);
            pos += to.size();
        }
        return s;
    }

    static std::string format_template(std::string templ, const std::vector<std::string>& args) {
        for (size_t i = 0; i < args.size(); ++i) {
            std::string key = "{" + std::to_string(i) + "}";
            templ = replace_all(std::move(templ), key, args[i]);
        }
        return templ;
    }

    ErrorKind kind_of(Code c) {
        switch (c) {
            case Code::kUnresolvedFunction:
            case Code::kUnresolvedClass:
            case Code::kUnresolvedMethod:
            case Code::kUnresolvedProperty:
            case Code::kUnresolvedConstant:
            case Code::kNoParentClass:
            case Code::kThisOutsideClass:
            case Code::kDuplicateFunction:
            case Code::kDuplicateClass:
            case Code::kDuplicateMember:
            case Code::kUnknownDependency:
            case Code::kDependencyCycle:
                return ErrorKind::kUnresolvedSymbol;

            case Code::kArgTypeMismatch:
            case Code::kArgCountMismatch:
            case Code::kReturnTypeMismatch:
            case Code::kMissingReturnValue:
            case Code::kVoidReturnValue:
            case Code::kPropertyTypeMismatch:
            case Code::kOperandTypeMismatch:
            case Code::kConditionTypeMismatch:
            case Code::kOverrideSignatureMismatch:
            case Code::kMissingInterfaceMethod:
            case Code::kNotAnInterface:
            case Code::kNotAClass:
            case Code::kInheritanceCycle:
            case Code::kCannotInstantiate:
            case Code::kNotThrowable:
            case Code::kStaticCallToInstance:
            case Code::kFfiSignatureMismatch:
            case Code::kFfiBodyNotEmpty:
                return ErrorKind::kTypeMismatch;

            case Code::kOverrideNarrowsVisibility:
            case Code::kMemberNotAccessible:
            case Code::kOverrideFinal:
                return ErrorKind::kVisibilityViolation;

            case Code::kUseBeforeDef:
                return ErrorKind::kUseBeforeDef;

            case Code::kUnsupportedConstruct:
            case Code::kInvalidBreakLevel:
                return ErrorKind::kUnsupportedConstruct;

            case Code::kCancelled:
            case Code::kInternalFailure:
                return ErrorKind::kInternal;

            case Code::kTooManyErrors:
            case Code::kUnknownAttribute:
            case Code::kUnreachableCode:
                return ErrorKind::kNote;
        }
        return ErrorKind::kInternal;
    }

    std::string_view kind_name(ErrorKind k) {
        switch (k) {
            case ErrorKind::kUnresolvedSymbol:     return "UnresolvedSymbolError";
            case ErrorKind::kTypeMismatch:         return "TypeMismatchError";
            case ErrorKind::kVisibilityViolation:  return "VisibilityViolationError";
            case ErrorKind::kUseBeforeDef:         return "UseBeforeDefError";
            case ErrorKind::kUnsupportedConstruct: return "UnsupportedConstructError";
            case ErrorKind::kInternal:             return "InternalError";
            case ErrorKind::kNote:                 return "Note";
        }
        return "InternalError";
    }

    std::string_view code_name(Code c) {
        switch (c) {
            case Code::kTooManyErrors: return "TooManyErrors";
            case Code::kUnresolvedFunction: return "UnresolvedFunction";
            case Code::kUnresolvedClass: return "UnresolvedClass";
            case Code::kUnresolvedMethod: return "UnresolvedMethod";
            case Code::kUnresolvedProperty: return "UnresolvedProperty";
            case Code::kUnresolvedConstant: return "UnresolvedConstant";
            case Code::kNoParentClass: return "NoParentClass";
            case Code::kThisOutsideClass: return "ThisOutsideClass";
            case Code::kDuplicateFunction: return "DuplicateFunction";
            case Code::kDuplicateClass: return "DuplicateClass";
            case Code::kDuplicateMember: return "DuplicateMember";
            case Code::kUnknownDependency: return "UnknownDependency";
            case Code::kDependencyCycle: return "DependencyCycle";
            case Code::kArgTypeMismatch: return "ArgTypeMismatch";
            case Code::kArgCountMismatch: return "ArgCountMismatch";
            case Code::kReturnTypeMismatch: return "ReturnTypeMismatch";
            case Code::kMissingReturnValue: return "MissingReturnValue";
            case Code::kVoidReturnValue: return "VoidReturnValue";
            case Code::kPropertyTypeMismatch: return "PropertyTypeMismatch";
            case Code::kOperandTypeMismatch: return "OperandTypeMismatch";
            case Code::kConditionTypeMismatch: return "ConditionTypeMismatch";
            case Code::kOverrideSignatureMismatch: return "OverrideSignatureMismatch";
            case Code::kMissingInterfaceMethod: return "MissingInterfaceMethod";
            case Code::kNotAnInterface: return "NotAnInterface";
            case Code::kNotAClass: return "NotAClass";
            case Code::kInheritanceCycle: return "InheritanceCycle";
            case Code::kCannotInstantiate: return "CannotInstantiate";
            case Code::kNotThrowable: return "NotThrowable";
            case Code::kStaticCallToInstance: return "StaticCallToInstance";
            case Code::kFfiSignatureMismatch: return "FfiSignatureMismatch";
            case Code::kFfiBodyNotEmpty: return "FfiBodyNotEmpty";
            case Code::kOverrideNarrowsVisibility: return "OverrideNarrowsVisibility";
            case Code::kMemberNotAccessible: return "MemberNotAccessible";
            case Code::kOverrideFinal: return "OverrideFinal";
            case Code::kUseBeforeDef: return "UseBeforeDef";
            case Code::kUnsupportedConstruct: return "UnsupportedConstruct";
            case Code::kInvalidBreakLevel: return "InvalidBreakLevel";
            case Code::kUnknownAttribute: return "UnknownAttribute";
            case Code::kUnreachableCode: return "UnreachableCode";
            case Code::kCancelled: return "Cancelled";
            case Code::kInternalFailure: return "InternalFailure";
        }
        return "Unknown";
    }

    static std::string template_en(Code c) {
        switch (c) {
            case Code::kTooManyErrors: return "too many errors; further errors are suppressed";
            case Code::kUnresolvedFunction: return "call to undefined function '{0}'";
            case Code::kUnresolvedClass: return "class '{0}' not found";
            case Code::kUnresolvedMethod: return "call to undefined method {0}::{1}()";
            case Code::kUnresolvedProperty: return "undefined property {0}::${1}";
            case Code::kUnresolvedConstant: return "undefined constant '{0}'";
            case Code::kNoParentClass: return "cannot use 'parent' in class '{0}' which has no parent";
            case Code::kThisOutsideClass: return "cannot use '$this' outside of an instance method";
            case Code::kDuplicateFunction: return "cannot redeclare function '{0}'";
            case Code::kDuplicateClass: return "cannot redeclare class '{0}'";
            case Code::kDuplicateMember: return "cannot redeclare {0}::{1}";
            case Code::kUnknownDependency: return "unknown dependency unit '{0}'";
            case Code::kDependencyCycle: return "unit '{0}' is part of a dependency cycle";
            case Code::kArgTypeMismatch: return "argument #{1} of {0}() must be of type {2}, {3} given";
            case Code::kArgCountMismatch: return "{0}() expects {1} argument(s), {2} given";
            case Code::kReturnTypeMismatch: return "{0}(): return value must be of type {1}, {2} returned";
            case Code::kMissingReturnValue: return "{0}(): a non-void function must return a value";
            case Code::kVoidReturnValue: return "{0}(): a void function must not return a value";
            case Code::kPropertyTypeMismatch: return "cannot assign {2} to property ${0} of type {1}";
            case Code::kOperandTypeMismatch: return "unsupported operand types: {1} {0} {2}";
            case Code::kConditionTypeMismatch: return "condition of type {0} cannot be tested";
            case Code::kOverrideSignatureMismatch: return "declaration of {0}::{1}() must be compatible with {2}::{1}()";
            case Code::kMissingInterfaceMethod: return "class {0} does not implement {1}::{2}()";
            case Code::kNotAnInterface: return "'{0}' is not an interface";
            case Code::kNotAClass: return "'{0}' cannot be extended; it is not a class";
            case Code::kInheritanceCycle: return "class '{0}' inherits from itself";
            case Code::kCannotInstantiate: return "cannot instantiate '{0}'";
            case Code::kNotThrowable: return "type {0} cannot be thrown or caught";
            case Code::kStaticCallToInstance: return "non-static method {0}::{1}() cannot be called statically";
            case Code::kFfiSignatureMismatch: return "foreign declaration {0}(): {1}";
            case Code::kFfiBodyNotEmpty: return "foreign declaration {0}() must have an empty body";
            case Code::kOverrideNarrowsVisibility: return "access level to {0}::{1}() must be {2} or weaker";
            case Code::kMemberNotAccessible: return "cannot access {0} member {1}::{2}";
            case Code::kOverrideFinal: return "cannot override final '{0}'";
            case Code::kUseBeforeDef: return "variable ${0} may be read before it is assigned";
            case Code::kUnsupportedConstruct: return "{0} is not supported by the compiled subset";
            case Code::kInvalidBreakLevel: return "'{0} {1}' does not target an enclosing loop or switch";
            case Code::kUnknownAttribute: return "unknown attribute '{0}' ignored";
            case Code::kUnreachableCode: return "unreachable code";
            case Code::kCancelled: return "compilation cancelled before {0}";
            case Code::kInternalFailure: return "internal consistency failure in {0}: {1}";
        }
        return "unknown diagnostic";
    }

    static std::string template_ko(Code c) {
        switch (c) {
            case Code::kTooManyErrors: return "오류가 너무 많아 이후 오류는 생략합니다";
            case Code::kUnresolvedFunction: return "정의되지 않은 함수 '{0}' 호출";
            case Code::kUnresolvedClass: return "클래스 '{0}'를 찾을 수 없습니다";
            case Code::kUnresolvedMethod: return "정의되지 않은 메서드 {0}::{1}() 호출";
            case Code::kUnresolvedProperty: return "정의되지 않은 프로퍼티 {0}::${1}";
            case Code::kUnresolvedConstant: return "정의되지 않은 상수 '{0}'";
            case Code::kNoParentClass: return "부모가 없는 클래스 '{0}'에서 'parent'를 사용할 수 없습니다";
            case Code::kThisOutsideClass: return "인스턴스 메서드 밖에서는 '$this'를 사용할 수 없습니다";
            case Code::kDuplicateFunction: return "함수 '{0}'를 다시 선언할 수 없습니다";
            case Code::kDuplicateClass: return "클래스 '{0}'를 다시 선언할 수 없습니다";
            case Code::kDuplicateMember: return "{0}::{1}를 다시 선언할 수 없습니다";
            case Code::kUnknownDependency: return "알 수 없는 의존 단위 '{0}'";
            case Code::kDependencyCycle: return "단위 '{0}'가 의존 순환에 포함되어 있습니다";
            case Code::kArgTypeMismatch: return "{0}()의 {1}번째 인자는 {2} 타입이어야 하는데 {3}가 전달되었습니다";
            case Code::kArgCountMismatch: return "{0}()는 인자 {1}개를 기대하지만 {2}개가 전달되었습니다";
            case Code::kReturnTypeMismatch: return "{0}(): 반환값은 {1} 타입이어야 하는데 {2}를 반환합니다";
            case Code::kMissingReturnValue: return "{0}(): void가 아닌 함수는 값을 반환해야 합니다";
            case Code::kVoidReturnValue: return "{0}(): void 함수는 값을 반환할 수 없습니다";
            case Code::kPropertyTypeMismatch: return "{1} 타입 프로퍼티 ${0}에 {2}를 대입할 수 없습니다";
            case Code::kOperandTypeMismatch: return "지원되지 않는 피연산자 타입: {1} {0} {2}";
            case Code::kConditionTypeMismatch: return "{0} 타입은 조건식으로 쓸 수 없습니다";
            case Code::kOverrideSignatureMismatch: return "{0}::{1}() 선언은 {2}::{1}()와 호환되어야 합니다";
            case Code::kMissingInterfaceMethod: return "클래스 {0}가 {1}::{2}()를 구현하지 않습니다";
            case Code::kNotAnInterface: return "'{0}'는 인터페이스가 아닙니다";
            case Code::kNotAClass: return "'{0}'는 클래스가 아니므로 상속할 수 없습니다";
            case Code::kInheritanceCycle: return "클래스 '{0}'가 자기 자신을 상속합니다";
            case Code::kCannotInstantiate: return "'{0}'는 인스턴스화할 수 없습니다";
            case Code::kNotThrowable: return "{0} 타입은 throw/catch 할 수 없습니다";
            case Code::kStaticCallToInstance: return "비정적 메서드 {0}::{1}()를 정적으로 호출할 수 없습니다";
            case Code::kFfiSignatureMismatch: return "외부 함수 선언 {0}(): {1}";
            case Code::kFfiBodyNotEmpty: return "외부 함수 선언 {0}()의 본문은 비어 있어야 합니다";
            case Code::kOverrideNarrowsVisibility: return "{0}::{1}()의 접근 수준은 {2} 이상이어야 합니다";
            case Code::kMemberNotAccessible: return "{0} 멤버 {1}::{2}에 접근할 수 없습니다";
            case Code::kOverrideFinal: return "final '{0}'는 재정의할 수 없습니다";
            case Code::kUseBeforeDef: return "변수 ${0}가 대입 전에 읽힐 수 있습니다";
            case Code::kUnsupportedConstruct: return "{0}는 컴파일 가능한 부분집합에서 지원되지 않습니다";
            case Code::kInvalidBreakLevel: return "'{0} {1}'가 감싸는 루프/switch를 가리키지 않습니다";
            case Code::kUnknownAttribute: return "알 수 없는 속성 '{0}'를 무시합니다";
            case Code::kUnreachableCode: return "도달할 수 없는 코드";
            case Code::kCancelled: return "{0} 이전에 컴파일이 취소되었습니다";
            case Code::kInternalFailure: return "{0} 내부 일관성 오류: {1}";
        }
        return "알 수 없는 진단";
    }

    std::string render_message(const Diagnostic& d, Language lang) {
        std::string msg = (lang == Language::kKo) ? template_ko(d.code()) : template_en(d.code());
        return format_template(std::move(msg), d.args());
    }

    static const char* severity_name_(Severity sev) {
        return (sev == Severity::kWarning) ? "warning" :
               (sev == Severity::kFatal)   ? "fatal"   : "error";
    }

    std::string render_one(const Diagnostic& d, Language lang, const SourceManager& sm) {
        const std::string msg = render_message(d, lang);

        const auto sp = d.span();
        const auto lc = sm.line_col(sp.file_id, sp.lo);
        const auto sn = sm.snippet_for_span(sp);

        std::ostringstream oss;
        oss << severity_name_(d.severity()) << "[" << code_name(d.code()) << "]: " << msg << "\n";
        oss << " --> " << sm.name(sp.file_id) << ":" << lc.line << ":" << lc.col << "\n";
        oss << "  |\n";
        oss << sn.line_no << " | " << sn.line_text << "\n";
        oss << "  | ";
        for (uint32_t i = 0; i < sn.caret_cols_before; ++i) oss << ' ';
        for (uint32_t i = 0; i < sn.caret_cols_len; ++i) oss << '^';
        return oss.str();
    }

    std::string render_brief(const Diagnostic& d, const SourceManager& sm) {
        const auto sp = d.span();
        const auto lc = sm.line_col(sp.file_id, sp.lo);

        std::ostringstream oss;
        oss << kind_name(d.kind()) << " " << sm.name(sp.file_id) << ":" << lc.line << ":" << lc.col
            << ": " << render_message(d, Language::kEn);
        return oss.str();
    }

} // namespace php2ir::diag
