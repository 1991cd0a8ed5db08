// frontend/include/php2ir/ast/Builder.hpp
#pragma once
#include <php2ir/ast/Nodes.hpp>

#include <string>
#include <string_view>
#include <vector>


namespace php2ir::ast {

    struct ArmSpec {
        std::vector<ExprId> conds{};    // empty + is_default: default arm
        ExprId body = k_invalid_expr;
        bool is_default = false;
    };

    struct CaseSpec {
        ExprId match = k_invalid_expr;  // k_invalid_expr: default
        std::vector<StmtId> body{};
    };

    struct CatchSpec {
        std::vector<std::string> types{};
        std::string var{};
        std::vector<StmtId> body{};
    };

    /// @brief 외부 파서 대신 코드로 AST를 조립하는 도우미.
    ///        prelude 단위와 테스트가 사용한다. 각 노드는 단조 증가하는 합성 span을 받는다.
    class Builder {
    public:
        explicit Builder(Unit& unit) : u_(unit) {}

        Span next_span();
        ty::TypeId type(std::string_view spelling);   // "" -> kInvalidType (no hint)

        // ---- expressions ----
        ExprId int_(int64_t v);
        ExprId float_(double v);
        ExprId str(std::string_view v);
        ExprId bool_(bool v);
        ExprId null_();
        ExprId var(std::string_view name);
        ExprId this_();
        ExprId konst(std::string_view name);
        ExprId bin(BinOp op, ExprId a, ExprId b);
        ExprId unary(UnaryOp op, ExprId a);
        ExprId assign(ExprId target, ExprId value);
        ExprId assign_op(BinOp op, ExprId target, ExprId value);
        ExprId incdec(IncDec k, ExprId target);
        ExprId ternary(ExprId cond, ExprId then_e, ExprId else_e);
        ExprId coalesce(ExprId a, ExprId b);
        ExprId call(std::string_view name, const std::vector<ExprId>& args);
        ExprId mcall(ExprId recv, std::string_view name, const std::vector<ExprId>& args);
        ExprId scall(std::string_view cls, std::string_view name, const std::vector<ExprId>& args);
        ExprId new_(std::string_view cls, const std::vector<ExprId>& args);
        ExprId prop(ExprId obj, std::string_view name);
        ExprId index(ExprId base, ExprId idx);
        ExprId push_target(ExprId base);
        ExprId instance_of(ExprId a, std::string_view cls);
        ExprId cast(std::string_view to, ExprId a);
        ExprId interp(const std::vector<ExprId>& parts);
        ExprId list(const std::vector<ExprId>& values);
        ExprId map(const std::vector<ExprId>& keys, const std::vector<ExprId>& values);
        ExprId match(ExprId subject, const std::vector<ArmSpec>& arms);
        ExprId eval(ExprId code);
        ExprId var_var(ExprId name_expr);
        ExprId static_prop(std::string_view cls, std::string_view name);

        // ---- statements ----
        StmtId expr(ExprId e);
        StmtId echo(const std::vector<ExprId>& xs);
        StmtId block(const std::vector<StmtId>& xs);
        StmtId if_(ExprId cond, const std::vector<StmtId>& then_s, StmtId else_s = k_invalid_stmt);
        StmtId while_(ExprId cond, const std::vector<StmtId>& body);
        StmtId do_while(const std::vector<StmtId>& body, ExprId cond);
        StmtId for_(const std::vector<ExprId>& init, const std::vector<ExprId>& cond,
                    const std::vector<ExprId>& step, const std::vector<StmtId>& body);
        StmtId foreach(ExprId subject, std::string_view key_var, std::string_view value_var,
                       const std::vector<StmtId>& body, bool by_ref = false);
        StmtId switch_(ExprId subject, const std::vector<CaseSpec>& cases);
        StmtId break_(uint32_t level = 1);
        StmtId continue_(uint32_t level = 1);
        StmtId ret(ExprId e = k_invalid_expr);
        StmtId try_(const std::vector<StmtId>& body, const std::vector<CatchSpec>& catches);
        StmtId try_finally(const std::vector<StmtId>& body, const std::vector<CatchSpec>& catches,
                           const std::vector<StmtId>& finally_body);
        StmtId throw_(ExprId e);
        StmtId global(std::string_view name);

        // ---- declarations ----
        Param param(std::string_view name, std::string_view type = "", ExprId def = k_invalid_expr);
        Attribute attr(std::string_view name, const std::vector<ExprId>& args = {});
        FnDecl function(std::string_view name, const std::vector<Param>& params, std::string_view ret,
                        const std::vector<StmtId>& body);
        FnDecl method(Visibility vis, std::string_view name, const std::vector<Param>& params,
                      std::string_view ret, const std::vector<StmtId>& body, bool is_static = false);
        FnDecl abstract_method(std::string_view name, const std::vector<Param>& params, std::string_view ret);
        PropDecl property(Visibility vis, std::string_view name, std::string_view type,
                          ExprId def = k_invalid_expr);
        ClassDecl class_(std::string_view name, std::string_view parent,
                         const std::vector<PropDecl>& props, const std::vector<FnDecl>& methods);
        ClassDecl interface_(std::string_view name, const std::vector<FnDecl>& methods);

        StmtId fn_stmt(const FnDecl& f);
        StmtId class_stmt(const ClassDecl& c);

        /// @brief 최상위 문장 목록 끝에 추가한다.
        void emit(StmtId s) { u_.top.push_back(s); }

    private:
        ExprId leaf_(ExprKind k);

        Unit& u_;
        uint32_t pos_ = 0;
    };

} // namespace php2ir::ast
