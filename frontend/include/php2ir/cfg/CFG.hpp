// frontend/include/php2ir/cfg/CFG.hpp
#pragma once
#include <php2ir/resolve/Resolve.hpp>
#include <php2ir/text/Span.hpp>
#include <php2ir/ty/TypePool.hpp>

#include <cstdint>
#include <string>
#include <vector>


namespace php2ir::cfg {

    using VarId = uint32_t;
    using BlockId = uint32_t;

    inline constexpr VarId kInvalidVar = 0xFFFF'FFFFu;
    inline constexpr BlockId kInvalidBlock = 0xFFFF'FFFFu;

    /// @brief 값이 기계 수준에서 어떻게 표현되는지. 정적 타입에서 바로 정해진다.
    enum class Repr : uint8_t {
        kVoid,
        kBool,
        kInt,
        kFloat,
        kStr,   // RC handle
        kArr,   // RC handle, copy-on-write
        kObj,   // RC handle, never null
        kBox,   // RC handle to a tagged value; null / ?T / mixed
    };

    /// @brief null, ?T, mixed, never -> kBox. object는 non-null일 때만 kObj.
    Repr repr_of(const ty::TypePool& types, ty::TypeId t);
    std::string_view repr_name(Repr r);

    /// @brief 참조 카운트 대상인지(str/arr/obj/box).
    inline bool is_rc(Repr r) {
        return r == Repr::kStr || r == Repr::kArr || r == Repr::kObj || r == Repr::kBox;
    }

    struct Var {
        std::string name{};             // "$x" for locals, "%t3" for temporaries
        ty::TypeId type = ty::kInvalidType;
        Repr repr = Repr::kBox;
        bool is_temp = false;
        bool is_param = false;
    };

    enum class OpKind : uint8_t {
        kParam,         // dst = param #imm
        kConst,         // dst = lit
        kCopy,          // dst = a
        kCast,          // dst = (repr dst) a
        kBinary,        // dst = a <bin> b
        kUnary,         // dst = <un> a
        kConcat,        // dst = a . b (str)
        kEcho,          // echo a (str)

        kArrayNew,      // dst = []
        kArrayGet,      // dst(box) = a[b]; absent key -> null
        kArraySet,      // dst(arr) = a with [b] = c(box)
        kArrayPush,     // dst(arr) = a with [] = c(box)
        kArrayCount,    // dst(int) = count(a)
        kArrayKeyAt,    // dst(box) = key at position b
        kArrayValueAt,  // dst(box) = value at position b
        kStrAt,         // dst(str) = a[b]

        kNew,           // dst(obj) = allocate sym, property defaults applied
        kGetProp,       // dst = a->slot[imm]
        kSetProp,       // a->slot[imm] = b
        kGetPropDyn,    // dst(box) = a(box)->name
        kSetPropDyn,    // a(box)->name = c(box)

        kCall,          // dst = sym(args...)              direct (function / bound method)
        kCallVirtual,   // dst = args[0]->vtable[imm](args...)
        kCallForeign,   // dst = sym(args...)              C calling convention
        kCallBuiltin,   // dst = builtin(args...)
        kCallDyn,       // dst(box) = a(box)->name(args(box)...)

        kInstanceOf,    // dst(bool) = a instanceof sym
        kIsNull,        // dst(bool) = a(box) === null
        kLandingPad,    // dst(obj) = take in-flight exception
    };

    enum class BinKind : uint8_t {
        kAdd, kSub, kMul, kDiv, kRem, kPow,
        kBitAnd, kBitOr, kBitXor, kShl, kShr,
        kEq, kNe, kLt, kLe, kGt, kGe,           // loose
        kIdentical, kNotIdentical,              // strict
        kSpaceship,
    };

    enum class UnKind : uint8_t {
        kNeg,
        kNot,
        kBitNot,
    };

    std::string_view op_name(OpKind k);
    std::string_view bin_name(BinKind k);
    std::string_view un_name(UnKind k);
    bool is_compare(BinKind k);

    struct Literal {
        enum class Kind : uint8_t { kNull, kBool, kInt, kFloat, kStr };
        Kind kind = Kind::kNull;
        int64_t i = 0;
        double f = 0.0;
        bool b = false;
        std::string s{};
    };

    struct Op {
        OpKind kind = OpKind::kConst;
        VarId dst = kInvalidVar;
        VarId a = kInvalidVar;
        VarId b = kInvalidVar;
        VarId c = kInvalidVar;
        std::vector<VarId> args{};

        BinKind bin = BinKind::kAdd;
        UnKind un = UnKind::kNeg;
        Literal lit{};

        uint32_t imm = 0;                                 // param index / slot / vtable slot
        resolve::SymbolId sym = resolve::kInvalidSymbol;  // callee, class or property
        resolve::BuiltinFn builtin = resolve::BuiltinFn::kNone;
        std::string name{};                               // dynamic member name
        Span span{};
    };

    enum class TermKind : uint8_t {
        kNone,
        kJump,          // -> target
        kBranch,        // value ? target : alt
        kReturn,        // return value (kInvalidVar: void)
        kRaise,         // raise value, exception edge -> target
        kExcCheck,      // pending exception ? alt : target
        kUnwindExit,    // leave the function with the exception still pending
    };

    struct Term {
        TermKind kind = TermKind::kNone;
        VarId value = kInvalidVar;
        BlockId target = kInvalidBlock;
        BlockId alt = kInvalidBlock;
        Span span{};
    };

    /// @brief 후속 블록 목록. kBranch는 (target, alt), kExcCheck는 (normal, unwind) 순서.
    std::vector<BlockId> successors(const Term& t);
    /// @brief i번째 후속 간선이 예외 간선인지.
    bool is_exception_edge(const Term& t, uint32_t succ_index);

    struct Block {
        std::vector<Op> ops{};
        Term term{};
        std::vector<BlockId> preds{};   // one entry per incoming edge
    };

    struct Function {
        std::string name{};
        resolve::SymbolId sym = resolve::kInvalidSymbol;
        resolve::SymbolId cls = resolve::kInvalidSymbol;
        bool is_main = false;

        std::vector<Var> vars{};
        uint32_t param_count = 0;           // vars [0, param_count) are parameters
        uint32_t local_count = 0;           // vars [0, local_count) are source locals

        ty::TypeId ret = ty::kInvalidType;
        Repr ret_repr = Repr::kVoid;

        std::vector<Block> blocks{};
        BlockId entry = 0;
        BlockId unwind_exit = kInvalidBlock;
        Span span{};
    };

    struct NormalizeStats {
        uint32_t functions = 0;
        uint32_t blocks = 0;
        uint32_t pruned_blocks = 0;
        uint32_t split_edges = 0;
        uint32_t exc_checks = 0;
        uint32_t runtime_checks = 0;
        uint32_t finally_copies = 0;
    };

    struct Unit {
        std::string name{};
        std::vector<Function> functions{};
        NormalizeStats stats{};
    };

    struct VerifyError {
        std::string msg;
    };

    /// @brief op가 예외를 던질 수 있는지. 던질 수 있으면 블록은 kExcCheck로 끝난다.
    bool may_throw(const Function& f, const Op& op);

    /// @brief op가 읽는 변수들(dst 제외) 순서대로.
    std::vector<VarId> op_uses(const Op& op);

    /// @brief 해석된 단위 하나를 정규 CFG로 바꾼다. 함수마다 cfg::Function 하나.
    Unit normalize_unit(const ast::AstArena& ast, const resolve::ResolvedUnit& ru,
                        const ty::TypePool& types, diag::Bag& bag);

    /// @brief 도달 불가 블록 제거 후 preds 재계산. 제거한 블록 수를 돌려준다.
    uint32_t prune_unreachable(Function& f);
    /// @brief critical edge를 빈 블록으로 쪼갠다. 쪼갠 간선 수를 돌려준다.
    uint32_t split_critical_edges(Function& f);
    void compute_preds(Function& f);

    std::vector<VerifyError> verify(const Function& f);

    std::string dump(const Function& f, const ty::TypePool& types);
    std::string dump(const Unit& u, const ty::TypePool& types);

} // namespace php2ir::cfg
