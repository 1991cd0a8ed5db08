// frontend/src/cfg/normalizer.hpp
#pragma once
#include <php2ir/cfg/CFG.hpp>
#include <php2ir/diag/Diagnostic.hpp>

#include <string>
#include <string_view>
#include <vector>


namespace php2ir::cfg::detail {

    /// @brief 함수 하나를 블록 단위로 펼치는 작업 상태.
    ///        현재 블록(cur_)에 op를 붙이고, 예외 가능 op 뒤에서는 블록을 끊는다.
    class Normalizer {
    public:
        Normalizer(const ast::AstArena& ast, const resolve::ResolvedUnit& ru,
                   const ty::TypePool& types, diag::Bag& bag, NormalizeStats& stats);

        Function run(const resolve::FunctionInfo& fi);

    private:
        struct Breakable {
            BlockId brk = kInvalidBlock;
            BlockId cont = kInvalidBlock;
            bool is_loop = true;
            uint32_t try_depth = 0;
        };

        struct TryCtx {
            ast::StmtId finally_body = ast::k_invalid_stmt;
            BlockId outer_handler = kInvalidBlock;
        };

        // ---- block plumbing ----
        BlockId new_block_();
        void set_block_(BlockId b) { cur_ = b; }
        void emit_(Op op);
        void terminate_(Term t);
        void jump_(BlockId target);
        void branch_(VarId cond, BlockId t, BlockId f);
        void raise_(VarId exc, Span sp);
        VarId temp_(Repr r, ty::TypeId t = ty::kInvalidType);

        // ---- small op helpers ----
        VarId const_(const Literal& lit, Repr r, Span sp);
        VarId const_int_(int64_t v, Span sp);
        VarId const_float_(double v, Span sp);
        VarId const_bool_(bool v, Span sp);
        VarId const_str_(std::string_view v, Span sp);
        VarId const_null_(Span sp);
        VarId default_value_(const sema::DefaultValue& d, ty::TypeId to, Span sp);
        VarId cast_(VarId v, Repr to, ty::TypeId to_type, Span sp);
        VarId coerce_(VarId v, ty::TypeId to, Span sp);
        VarId to_repr_(VarId v, Repr to, Span sp);
        void assign_var_(VarId dst, VarId src, Span sp);
        VarId binary_op_(BinKind k, VarId a, VarId b, Repr out, Span sp);
        void raise_error_(std::string_view cls_name, const std::string& msg, VarId detail, Span sp);

        // ---- statements (normalize_stmt.cpp) ----
        void stmts_(uint32_t begin, uint32_t count);
        void stmt_(ast::StmtId s);
        void if_(const ast::Stmt& s);
        void while_(const ast::Stmt& s);
        void do_while_(const ast::Stmt& s);
        void for_(const ast::Stmt& s);
        void foreach_(const ast::Stmt& s);
        void switch_(const ast::Stmt& s);
        void break_(const ast::Stmt& s);
        void return_(const ast::Stmt& s);
        void try_(const ast::Stmt& s);
        void throw_(const ast::Stmt& s);
        void emit_finally_(uint32_t try_index);
        void leave_tries_(uint32_t depth);
        void fall_off_end_();

        // ---- expressions (normalize_expr.cpp) ----
        ty::TypeId type_of_(ast::ExprId e) const;
        VarId value_(ast::ExprId e);
        VarId expr_(ast::ExprId e);
        VarId cond_(ast::ExprId e);
        VarId binary_(ast::ExprId id, const ast::Expr& e);
        VarId apply_binop_(ast::BinOp op, VarId l, VarId r, ast::ExprId rhs, ty::TypeId result, Span sp);
        VarId arith_(BinKind k, VarId l, VarId r, ast::ExprId divisor, ty::TypeId result, Span sp);
        VarId compare_(BinKind k, VarId l, VarId r, Span sp);
        VarId strict_eq_(VarId l, VarId r, Span sp);
        VarId logical_(const ast::Expr& e);
        VarId unary_(ast::ExprId id, const ast::Expr& e);
        VarId assign_(ast::ExprId id, const ast::Expr& e);
        VarId incdec_(ast::ExprId id, const ast::Expr& e);
        VarId store_(ast::ExprId target, VarId value, Span sp);
        VarId ternary_(ast::ExprId id, const ast::Expr& e);
        VarId coalesce_(ast::ExprId id, const ast::Expr& e);
        VarId interp_(const ast::Expr& e);
        VarId array_lit_(ast::ExprId id, const ast::Expr& e);
        VarId index_read_(const ast::Expr& e, bool raw);
        VarId array_key_(ast::ExprId key);
        VarId as_array_(VarId v, Span sp);
        VarId prop_read_(ast::ExprId id, const ast::Expr& e);
        VarId call_(ast::ExprId id, const ast::Expr& e);
        VarId builtin_(ast::ExprId id, const ast::Expr& e, const resolve::CallInfo& ci);
        VarId method_call_(ast::ExprId id, const ast::Expr& e);
        VarId static_call_(ast::ExprId id, const ast::Expr& e);
        VarId new_(ast::ExprId id, const ast::Expr& e);
        VarId dynamic_call_(VarId recv, const ast::Expr& e, ty::TypeId result);
        VarId instanceof_(ast::ExprId id, const ast::Expr& e);
        VarId match_(ast::ExprId id, const ast::Expr& e);
        std::vector<VarId> call_args_(const sema::Symbol& callee, const ast::Expr& e);
        VarId emit_call_(Op op, const sema::Symbol& callee, Span sp);
        void check_divisor_(VarId divisor, ast::ExprId divisor_expr, bool modulo, Span sp);

        bool is_nonzero_literal_(ast::ExprId e) const;
        const sema::Symbol& sym_(resolve::SymbolId id) const { return ru_.table.symbol(id); }

        const ast::AstArena& ast_;
        const resolve::ResolvedUnit& ru_;
        const ty::TypePool& types_;
        diag::Bag& bag_;
        NormalizeStats& stats_;

        // per-function state
        const resolve::FunctionInfo* fi_ = nullptr;
        Function* fn_ = nullptr;
        BlockId cur_ = kInvalidBlock;
        BlockId handler_ = kInvalidBlock;
        std::vector<Breakable> breakables_;
        std::vector<TryCtx> tries_;
    };

} // namespace php2ir::cfg::detail
