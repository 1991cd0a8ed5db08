// frontend/include/php2ir/ast/Nodes.hpp
#pragma once
#include <php2ir/text/Span.hpp>
#include <php2ir/ty/TypePool.hpp>

#include <cstdint>
#include <string>
#include <vector>


namespace php2ir::ast {

    using ExprId = uint32_t;
    using StmtId = uint32_t;
    using FnId = uint32_t;
    using ClassId = uint32_t;

    inline constexpr ExprId k_invalid_expr = 0xFFFF'FFFFu;
    inline constexpr StmtId k_invalid_stmt = 0xFFFF'FFFFu;
    inline constexpr uint32_t k_invalid_decl = 0xFFFF'FFFFu;

    enum class BinOp : uint8_t {
        kAdd, kSub, kMul, kDiv, kMod, kPow,
        kConcat,
        kEq, kNe, kIdentical, kNotIdentical,
        kLt, kLe, kGt, kGe, kSpaceship,
        kAnd, kOr, kXor,            // logical (&&, ||, xor)
        kBitAnd, kBitOr, kBitXor, kShl, kShr,
        kNone,                      // plain '=' in kAssign
    };

    enum class UnaryOp : uint8_t {
        kNeg,
        kPlus,
        kNot,
        kBitNot,
    };

    enum class IncDec : uint8_t {
        kPreInc,
        kPreDec,
        kPostInc,
        kPostDec,
    };

    enum class Visibility : uint8_t {
        kPublic,
        kProtected,
        kPrivate,
    };

    enum class ExprKind : uint8_t {
        kIntLit,
        kFloatLit,
        kStringLit,
        kBoolLit,
        kNullLit,
        kInterp,        // "a $b c": parts in list slice
        kArrayLit,      // values in list slice, keys in key slice (k_invalid_expr = no key)
        kVar,           // $text
        kThis,
        kConstFetch,    // PHP_EOL, M_PI ...
        kBinary,        // a <op> b
        kUnary,         // <uop> a
        kAssign,        // a = b, a <op>= b
        kIncDec,        // ++a, a--
        kTernary,       // a ? b : c  (b invalid for a ?: c)
        kCoalesce,      // a ?? b
        kCall,          // text(args)
        kMethodCall,    // a->text(args)
        kStaticCall,    // class_name::text(args)
        kNew,           // new class_name(args)
        kPropFetch,     // a->text
        kIndex,         // a[b] (b invalid for push target a[])
        kInstanceOf,    // a instanceof class_name
        kCast,          // (cast_type) a
        kMatch,         // match (a) { arms }

        // outside the compiled subset (kept so the resolver can report them)
        kEval,          // eval(a)
        kVarVar,        // $$a
        kStaticPropFetch, // class_name::$text
    };

    enum class StmtKind : uint8_t {
        kNop,
        kExpr,          // a;
        kEcho,          // echo list
        kBlock,         // { children }
        kIf,            // if (a) body else else_body
        kWhile,
        kDoWhile,
        kFor,           // for (init; cond; step) body
        kForeach,       // foreach (a as [key =>] value) body
        kSwitch,
        kBreak,         // break level
        kContinue,
        kReturn,        // return [a]
        kTry,
        kThrow,
        kFnDecl,
        kClassDecl,

        kGlobal,        // global $x (unsupported)
        kStaticVar,     // static $x (unsupported)
    };

    struct MatchArm {
        // conditions slice into AstArena::expr_list; empty slice == default arm
        uint32_t cond_begin = 0;
        uint32_t cond_count = 0;
        bool is_default = false;
        ExprId body = k_invalid_expr;
        Span span{};
    };

    struct Expr {
        ExprKind kind = ExprKind::kNullLit;
        Span span{};

        BinOp op = BinOp::kNone;
        UnaryOp uop = UnaryOp::kNeg;
        IncDec incdec = IncDec::kPostInc;

        ExprId a = k_invalid_expr;
        ExprId b = k_invalid_expr;
        ExprId c = k_invalid_expr;

        // literal payloads
        int64_t int_value = 0;
        double float_value = 0.0;
        bool bool_value = false;

        // variable / function / method / property / constant name, or string literal bytes
        std::string text{};
        // kStaticCall / kNew / kInstanceOf target: "parent", "self", "static" or a class name
        std::string class_name{};

        // kCast
        ty::TypeId cast_type = ty::kInvalidType;

        // args / parts / array values (expr_list slice)
        uint32_t list_begin = 0;
        uint32_t list_count = 0;
        // array keys (expr_list slice, parallel to values)
        uint32_t key_begin = 0;
        uint32_t key_count = 0;
        // match arms
        uint32_t arm_begin = 0;
        uint32_t arm_count = 0;
    };

    struct SwitchCase {
        ExprId match = k_invalid_expr;  // k_invalid_expr == default
        uint32_t stmt_begin = 0;        // stmt_list slice
        uint32_t stmt_count = 0;
        Span span{};
    };

    struct CatchClause {
        std::vector<std::string> types;
        std::string var{};              // empty: catch without variable
        StmtId body = k_invalid_stmt;
        Span span{};
    };

    struct Stmt {
        StmtKind kind = StmtKind::kNop;
        Span span{};

        ExprId a = k_invalid_expr;
        StmtId body = k_invalid_stmt;
        StmtId else_body = k_invalid_stmt;

        // kBlock children / kEcho exprs / kFor init,cond,step
        uint32_t list_begin = 0;
        uint32_t list_count = 0;
        uint32_t cond_begin = 0;
        uint32_t cond_count = 0;
        uint32_t step_begin = 0;
        uint32_t step_count = 0;

        // kForeach
        std::string key_var{};
        std::string value_var{};
        bool by_ref = false;

        // kSwitch
        uint32_t case_begin = 0;
        uint32_t case_count = 0;

        // kTry
        uint32_t catch_begin = 0;
        uint32_t catch_count = 0;
        StmtId finally_body = k_invalid_stmt;

        // kBreak / kContinue
        uint32_t level = 1;

        // kFnDecl / kClassDecl
        uint32_t decl = k_invalid_decl;

        // kGlobal / kStaticVar
        std::string text{};
    };

    struct Attribute {
        std::string name{};
        std::vector<ExprId> args{};
        Span span{};
    };

    struct Param {
        std::string name{};
        ty::TypeId type = ty::kInvalidType;     // kInvalidType: no hint
        ExprId default_value = k_invalid_expr;
        bool by_ref = false;
        bool variadic = false;
        Span span{};
    };

    struct FnDecl {
        std::string name{};
        std::vector<Param> params{};
        ty::TypeId ret = ty::kInvalidType;      // kInvalidType: no hint
        StmtId body = k_invalid_stmt;           // block; invalid for interface methods
        std::vector<Attribute> attrs{};

        bool is_method = false;
        Visibility vis = Visibility::kPublic;
        bool is_static = false;
        bool is_final = false;
        bool is_abstract = false;
        Span span{};
    };

    struct PropDecl {
        std::string name{};
        ty::TypeId type = ty::kInvalidType;
        ExprId default_value = k_invalid_expr;
        Visibility vis = Visibility::kPublic;
        bool is_static = false;
        Span span{};
    };

    struct ClassDecl {
        std::string name{};
        std::string parent{};                   // empty: no parent
        std::vector<std::string> interfaces{};
        bool is_interface = false;
        bool is_final = false;
        bool is_abstract = false;

        std::vector<PropDecl> props{};
        std::vector<FnId> methods{};
        std::vector<Attribute> attrs{};
        Span span{};
    };

    /// @brief 한 번역 단위의 AST 저장소. 노드는 정수 id로 참조하고 만든 뒤에는 바꾸지 않는다.
    class AstArena {
    public:
        ExprId add_expr(const Expr& e) { exprs_.push_back(e); return static_cast<ExprId>(exprs_.size() - 1); }
        StmtId add_stmt(const Stmt& s) { stmts_.push_back(s); return static_cast<StmtId>(stmts_.size() - 1); }

        uint32_t add_expr_list(const std::vector<ExprId>& xs) {
            const uint32_t begin = static_cast<uint32_t>(expr_list_.size());
            expr_list_.insert(expr_list_.end(), xs.begin(), xs.end());
            return begin;
        }
        uint32_t add_stmt_list(const std::vector<StmtId>& xs) {
            const uint32_t begin = static_cast<uint32_t>(stmt_list_.size());
            stmt_list_.insert(stmt_list_.end(), xs.begin(), xs.end());
            return begin;
        }

        uint32_t add_arm(const MatchArm& a) { arms_.push_back(a); return static_cast<uint32_t>(arms_.size() - 1); }
        uint32_t add_case(const SwitchCase& c) { cases_.push_back(c); return static_cast<uint32_t>(cases_.size() - 1); }
        uint32_t add_catch(const CatchClause& c) { catches_.push_back(c); return static_cast<uint32_t>(catches_.size() - 1); }
        FnId add_fn(const FnDecl& f) { fns_.push_back(f); return static_cast<FnId>(fns_.size() - 1); }
        ClassId add_class(const ClassDecl& c) { classes_.push_back(c); return static_cast<ClassId>(classes_.size() - 1); }

        // accessors
        const Expr& expr(ExprId id) const { return exprs_[id]; }
        const Stmt& stmt(StmtId id) const { return stmts_[id]; }
        const std::vector<Expr>& exprs() const { return exprs_; }
        const std::vector<Stmt>& stmts() const { return stmts_; }

        ExprId expr_at(uint32_t list_index) const { return expr_list_[list_index]; }
        StmtId stmt_at(uint32_t list_index) const { return stmt_list_[list_index]; }

        const MatchArm& arm(uint32_t id) const { return arms_[id]; }
        const SwitchCase& switch_case(uint32_t id) const { return cases_[id]; }
        const CatchClause& catch_clause(uint32_t id) const { return catches_[id]; }

        const FnDecl& fn(FnId id) const { return fns_[id]; }
        const ClassDecl& cls(ClassId id) const { return classes_[id]; }
        const std::vector<FnDecl>& fns() const { return fns_; }
        const std::vector<ClassDecl>& classes() const { return classes_; }

    private:
        std::vector<Expr> exprs_;
        std::vector<Stmt> stmts_;
        std::vector<ExprId> expr_list_;
        std::vector<StmtId> stmt_list_;
        std::vector<MatchArm> arms_;
        std::vector<SwitchCase> cases_;
        std::vector<CatchClause> catches_;
        std::vector<FnDecl> fns_;
        std::vector<ClassDecl> classes_;
    };

    /// @brief 파서가 넘겨주는 번역 단위 하나: 아레나 + 최상위 문장 목록.
    struct Unit {
        std::string name{};
        uint32_t file_id = 0;
        AstArena ast{};
        ty::TypePool types{};           // type hints are interned here by the parser
        std::vector<StmtId> top{};
    };

} // namespace php2ir::ast
