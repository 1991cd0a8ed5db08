// frontend/src/resolve/resolver.hpp
#pragma once
#include <php2ir/resolve/Builtins.hpp>
#include <php2ir/resolve/Resolve.hpp>

#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>


namespace php2ir::resolve::detail {

    std::string_view visibility_name(ast::Visibility v);
    bool has_value_return(const ast::AstArena& ast, ast::StmtId s);

    /// @brief resolve_unit의 작업 상태. 선언 수집 -> 클래스 확정 -> 본문 해석 순서로 돈다.
    class Resolver {
    public:
        Resolver(const ast::Unit& unit, const UnitInput& in, diag::Bag& bag,
                 const ResolveOptions& opt, ResolvedUnit& out);

        void run();

    private:
        // ---- diagnostics ----
        void report_(diag::Severity sev, diag::Code code, Span sp, std::initializer_list<std::string_view> args);
        void error_(diag::Code code, Span sp, std::initializer_list<std::string_view> args = {});
        // body diagnostics are only reported in the final (recording) pass
        void body_error_(diag::Code code, Span sp, std::initializer_list<std::string_view> args = {});

        // ---- declarations (resolve_decls.cpp) ----
        void import_deps_();
        void collect_decls_();
        void declare_function_(ast::FnId fid);
        void declare_class_(ast::ClassId cid);
        void declare_method_(SymbolId cls, ast::FnId fid, bool in_interface);
        bool read_params_(const ast::FnDecl& f, std::vector<sema::ParamSig>& out);
        void read_attrs_(const std::vector<ast::Attribute>& attrs, sema::Symbol& sym, const ast::FnDecl* fn);
        void check_ffi_(sema::Symbol& sym, const ast::FnDecl& f, const ast::Attribute& a);
        bool const_value_(ast::ExprId e, sema::DefaultValue& out) const;
        ty::TypeId const_type_(const sema::DefaultValue& v);

        void link_classes_();
        void finalize_class_(SymbolId cls);
        void check_override_(SymbolId cls, SymbolId m, SymbolId parent_m);
        void check_interfaces_(SymbolId cls);
        bool sig_compatible_(const sema::Symbol& child, const sema::Symbol& parent);
        std::optional<SymbolId> find_in_chain_(SymbolId cls, std::string_view method) const;

        void build_functions_();
        void build_exports_();

        // ---- bodies (resolve_body.cpp) ----
        void resolve_function_(FunctionInfo& fi);
        void collect_locals_stmt_(ast::StmtId s);
        void collect_locals_expr_(ast::ExprId e);
        uint32_t add_local_(std::string_view name, ty::TypeId t, bool is_param);
        void set_local_(std::string_view name, ty::TypeId t);

        void stmts_(uint32_t begin, uint32_t count);
        void stmt_(ast::StmtId s);
        void foreach_(const ast::Stmt& s);
        void try_(const ast::Stmt& s);
        void return_(const ast::Stmt& s);

        ty::TypeId expr_(ast::ExprId e);
        ty::TypeId expr_inner_(ast::ExprId e);
        ty::TypeId binary_(const ast::Expr& e, ast::BinOp op, ty::TypeId l, ty::TypeId r);
        ty::TypeId assign_(const ast::Expr& e);
        ty::TypeId store_(ast::ExprId target, ty::TypeId value, Span sp);
        ty::TypeId incdec_(const ast::Expr& e);
        ty::TypeId call_(ast::ExprId id, const ast::Expr& e);
        ty::TypeId builtin_call_(ast::ExprId id, const ast::Expr& e, const BuiltinInfo& b);
        ty::TypeId method_call_(ast::ExprId id, const ast::Expr& e);
        ty::TypeId static_call_(ast::ExprId id, const ast::Expr& e);
        ty::TypeId new_(ast::ExprId id, const ast::Expr& e);
        ty::TypeId prop_fetch_(ast::ExprId id, const ast::Expr& e);
        ty::TypeId index_(const ast::Expr& e);
        ty::TypeId match_(const ast::Expr& e);

        std::vector<ty::TypeId> args_(const ast::Expr& e);
        void check_args_(const sema::Symbol& callee, std::string_view display,
                         const std::vector<ty::TypeId>& args, const ast::Expr& e);
        void record_call_(ast::ExprId id, const CallInfo& ci);

        SymbolId class_ref_(std::string_view name, Span sp);
        bool accessible_(const sema::Symbol& member) const;
        void check_access_(const sema::Symbol& member, Span sp);
        std::string member_display_(const sema::Symbol& member) const;

        // ---- type helpers ----
        bool assignable_(ty::TypeId from, ty::TypeId to) const;
        bool subtype_(ty::TypeId a, ty::TypeId b) const;
        bool class_subtype_(std::string_view a, std::string_view b) const;
        bool stringable_(ty::TypeId t) const;
        bool is_never_(ty::TypeId t) const { return types_.is_builtin(t, ty::Builtin::kNever); }
        ty::TypeId value_type_(ty::TypeId t) const;
        ty::TypeId elem_type_(ty::TypeId t) const;
        ty::TypeId class_type_(SymbolId cls, bool exact);
        std::string tname_(ty::TypeId t) const { return types_.to_string(t); }

        const ast::Unit& unit_;
        const ast::AstArena& ast_;
        const UnitInput& in_;
        diag::Bag& bag_;
        const ResolveOptions& opt_;
        ResolvedUnit& out_;
        ty::TypePool& types_;
        sema::SymbolTable& table_;

        std::vector<SymbolId> exported_;
        std::vector<std::pair<SymbolId, ast::FnId>> local_fns_;
        std::vector<std::pair<SymbolId, ast::ClassId>> local_classes_;
        std::unordered_map<SymbolId, uint8_t> finalize_state_;   // 1 = visiting, 2 = done
        uint32_t issues_at_start_ = 0;

        // per-function state
        FunctionInfo* fn_ = nullptr;
        std::unordered_map<std::string, uint32_t> local_ix_;
        bool recording_ = false;
        bool changed_ = false;
        std::vector<bool> breakables_;   // true: loop, false: switch
    };

} // namespace php2ir::resolve::detail
