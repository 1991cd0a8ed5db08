// frontend/include/php2ir/resolve/Resolve.hpp
#pragma once
#include <php2ir/ast/Nodes.hpp>
#include <php2ir/diag/Diagnostic.hpp>
#include <php2ir/sema/ExportTable.hpp>
#include <php2ir/sema/SymbolTable.hpp>
#include <php2ir/ty/TypePool.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>


namespace php2ir::resolve {

    using sema::SymbolId;
    using sema::kInvalidSymbol;
    using sema::kNoSlot;

    enum class BuiltinFn : uint8_t {
        kNone,
        kCount,
        kStrlen,
        kImplode,
        kAbs,
        kSqrt,
        kSin,
        kCos,
        kFloor,
        kIntdiv,
        kStrRepeat,
        kStrtoupper,
        kIsNull,
    };

    /// @brief 호출 지점 하나의 바인딩 방식.
    enum class CallKind : uint8_t {
        kNone,
        kFunction,      // user function, direct
        kForeign,       // #[ffi] extern
        kBuiltin,
        kStaticMethod,  // method bound at compile time, receiver passed
        kVirtual,       // vtable slot load + indirect call
        kDynamic,       // by-name lookup on a boxed receiver
        kStaticNoRecv,  // static method (no receiver)
    };

    struct CallInfo {
        CallKind kind = CallKind::kNone;
        SymbolId callee = kInvalidSymbol;   // function / method symbol (kInvalidSymbol: no constructor)
        SymbolId cls = kInvalidSymbol;      // kNew: instantiated class
        BuiltinFn builtin = BuiltinFn::kNone;
        uint32_t vslot = kNoSlot;
        bool implicit_this = false;         // parent::m(), self::m() on an instance method
    };

    struct PropInfo {
        SymbolId prop = kInvalidSymbol;
        uint32_t slot = kNoSlot;
        ty::TypeId type = ty::kInvalidType;
        bool dynamic = false;               // mixed / interface receiver: by-name access
    };

    struct LocalVar {
        std::string name{};
        ty::TypeId type = ty::kInvalidType;
        bool is_param = false;
    };

    /// @brief 해석이 끝난 함수 본문 하나. __main은 최상위 문장 목록을 들고 있다.
    struct FunctionInfo {
        std::string name{};                 // "__main", "foo", "Person::greet"
        SymbolId sym = kInvalidSymbol;      // kInvalidSymbol for __main
        SymbolId cls = kInvalidSymbol;
        bool is_main = false;
        bool has_this = false;

        ast::StmtId body = ast::k_invalid_stmt;
        std::vector<ast::StmtId> top{};

        // parameters first (declaration order), then other locals in first-seen order
        std::vector<LocalVar> locals{};
        uint32_t param_count = 0;

        ty::TypeId ret = ty::kInvalidType;
        bool ret_hinted = false;
        Span span{};
    };

    struct UnitInput {
        std::vector<sema::ExportTablePtr> deps{};
    };

    struct ResolveOptions {
        // true: scalar <-> string / bool coercions at typed sinks are type errors
        bool strict_scalars = false;
    };

    struct ResolvedUnit {
        std::string unit_name{};
        bool ok = false;

        ty::TypePool types{};
        sema::SymbolTable table{};

        std::vector<ty::TypeId> expr_types{};                       // by ExprId
        std::unordered_map<ast::ExprId, CallInfo> calls{};          // kCall/kMethodCall/kStaticCall/kNew
        std::unordered_map<ast::ExprId, PropInfo> props{};          // kPropFetch
        std::unordered_map<ast::ExprId, sema::DefaultValue> consts{}; // kConstFetch
        std::unordered_map<ast::ExprId, SymbolId> class_refs{};     // kInstanceOf
        std::unordered_map<uint32_t, std::vector<SymbolId>> catch_types{}; // catch clause id

        std::vector<FunctionInfo> functions{};
        std::vector<SymbolId> local_classes{};                      // declaration order

        sema::ExportTablePtr exports{};
    };

    /// @brief 번역 단위 하나를 해석한다. 오류는 bag에 모으고 ok=false로 돌려준다.
    ResolvedUnit resolve_unit(const ast::Unit& unit, const UnitInput& in, diag::Bag& bag,
                              const ResolveOptions& opt = {});

    /// @brief 단위의 export table 텍스트 덤프(같은 입력이면 바이트 단위로 같다).
    std::string dump_exports(const ResolvedUnit& ru);

    // ---- queries shared with later stages ----

    /// @brief cls가 Throwable을 구현하는지(throw / catch 가능한 클래스).
    bool is_throwable_class(const sema::SymbolTable& table, SymbolId cls);

    /// @brief 함수 local 이름 -> 인덱스. 없으면 UINT32_MAX.
    uint32_t local_index(const FunctionInfo& fn, std::string_view name);

} // namespace php2ir::resolve
