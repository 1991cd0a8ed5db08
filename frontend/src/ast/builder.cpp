// frontend/src/ast/builder.cpp
#include <php2ir/ast/Builder.hpp>


namespace php2ir::ast {

    Span Builder::next_span() {
        Span s{};
        s.file_id = u_.file_id;
        s.lo = pos_;
        s.hi = pos_ + 1;
        ++pos_;
        return s;
    }

    ty::TypeId Builder::type(std::string_view spelling) {
        if (spelling.empty()) return ty::kInvalidType;
        return u_.types.parse(spelling);
    }

    ExprId Builder::leaf_(ExprKind k) {
        Expr e{};
        e.kind = k;
        e.span = next_span();
        return u_.ast.add_expr(e);
    }

    // ---- expressions ----

    ExprId Builder::int_(int64_t v) {
        Expr e{};
        e.kind = ExprKind::kIntLit;
        e.span = next_span();
        e.int_value = v;
        return u_.ast.add_expr(e);
    }

    ExprId Builder::float_(double v) {
        Expr e{};
        e.kind = ExprKind::kFloatLit;
        e.span = next_span();
        e.float_value = v;
        return u_.ast.add_expr(e);
    }

    ExprId Builder::str(std::string_view v) {
        Expr e{};
        e.kind = ExprKind::kStringLit;
        e.span = next_span();
        e.text = std::string(v);
        return u_.ast.add_expr(e);
    }

    ExprId Builder::bool_(bool v) {
        Expr e{};
        e.kind = ExprKind::kBoolLit;
        e.span = next_span();
        e.bool_value = v;
        return u_.ast.add_expr(e);
    }

    ExprId Builder::null_() { return leaf_(ExprKind::kNullLit); }
    ExprId Builder::this_() { return leaf_(ExprKind::kThis); }

    ExprId Builder::var(std::string_view name) {
        Expr e{};
        e.kind = ExprKind::kVar;
        e.span = next_span();
        e.text = std::string(name);
        return u_.ast.add_expr(e);
    }

    ExprId Builder::konst(std::string_view name) {
        Expr e{};
        e.kind = ExprKind::kConstFetch;
        e.span = next_span();
        e.text = std::string(name);
        return u_.ast.add_expr(e);
    }

    ExprId Builder::bin(BinOp op, ExprId a, ExprId b) {
        Expr e{};
        e.kind = ExprKind::kBinary;
        e.span = next_span();
        e.op = op;
        e.a = a;
        e.b = b;
        return u_.ast.add_expr(e);
    }

    ExprId Builder::unary(UnaryOp op, ExprId a) {
        Expr e{};
        e.kind = ExprKind::kUnary;
        e.span = next_span();
        e.uop = op;
        e.a = a;
        return u_.ast.add_expr(e);
    }

    ExprId Builder::assign(ExprId target, ExprId value) {
        return assign_op(BinOp::kNone, target, value);
    }

    ExprId Builder::assign_op(BinOp op, ExprId target, ExprId value) {
        Expr e{};
        e.kind = ExprKind::kAssign;
        e.span = next_span();
        e.op = op;
        e.a = target;
        e.b = value;
        return u_.ast.add_expr(e);
    }

    ExprId Builder::incdec(IncDec k, ExprId target) {
        Expr e{};
        e.kind = ExprKind::kIncDec;
        e.span = next_span();
        e.incdec = k;
        e.a = target;
        return u_.ast.add_expr(e);
    }

    ExprId Builder::ternary(ExprId cond, ExprId then_e, ExprId else_e) {
        Expr e{};
        e.kind = ExprKind::kTernary;
        e.span = next_span();
        e.a = cond;
        e.b = then_e;
        e.c = else_e;
        return u_.ast.add_expr(e);
    }

    ExprId Builder::coalesce(ExprId a, ExprId b) {
        Expr e{};
        e.kind = ExprKind::kCoalesce;
        e.span = next_span();
        e.a = a;
        e.b = b;
        return u_.ast.add_expr(e);
    }

    ExprId Builder::call(std::string_view name, const std::vector<ExprId>& args) {
        Expr e{};
        e.kind = ExprKind::kCall;
        e.span = next_span();
        e.text = std::string(name);
        e.list_begin = u_.ast.add_expr_list(args);
        e.list_count = static_cast<uint32_t>(args.size());
        return u_.ast.add_expr(e);
    }

    ExprId Builder::mcall(ExprId recv, std::string_view name, const std::vector<ExprId>& args) {
        Expr e{};
        e.kind = ExprKind::kMethodCall;
        e.span = next_span();
        e.a = recv;
        e.text = std::string(name);
        e.list_begin = u_.ast.add_expr_list(args);
        e.list_count = static_cast<uint32_t>(args.size());
        return u_.ast.add_expr(e);
    }

    ExprId Builder::scall(std::string_view cls, std::string_view name, const std::vector<ExprId>& args) {
        Expr e{};
        e.kind = ExprKind::kStaticCall;
        e.span = next_span();
        e.class_name = std::string(cls);
        e.text = std::string(name);
        e.list_begin = u_.ast.add_expr_list(args);
        e.list_count = static_cast<uint32_t>(args.size());
        return u_.ast.add_expr(e);
    }

    ExprId Builder::new_(std::string_view cls, const std::vector<ExprId>& args) {
        Expr e{};
        e.kind = ExprKind::kNew;
        e.span = next_span();
        e.class_name = std::string(cls);
        e.list_begin = u_.ast.add_expr_list(args);
        e.list_count = static_cast<uint32_t>(args.size());
        return u_.ast.add_expr(e);
    }

    ExprId Builder::prop(ExprId obj, std::string_view name) {
        Expr e{};
        e.kind = ExprKind::kPropFetch;
        e.span = next_span();
        e.a = obj;
        e.text = std::string(name);
        return u_.ast.add_expr(e);
    }

    ExprId Builder::index(ExprId base, ExprId idx) {
        Expr e{};
        e.kind = ExprKind::kIndex;
        e.span = next_span();
        e.a = base;
        e.b = idx;
        return u_.ast.add_expr(e);
    }

    ExprId Builder::push_target(ExprId base) {
        return index(base, k_invalid_expr);
    }

    ExprId Builder::instance_of(ExprId a, std::string_view cls) {
        Expr e{};
        e.kind = ExprKind::kInstanceOf;
        e.span = next_span();
        e.a = a;
        e.class_name = std::string(cls);
        return u_.ast.add_expr(e);
    }

    ExprId Builder::cast(std::string_view to, ExprId a) {
        Expr e{};
        e.kind = ExprKind::kCast;
        e.span = next_span();
        e.a = a;
        e.cast_type = type(to);
        return u_.ast.add_expr(e);
    }

    ExprId Builder::interp(const std::vector<ExprId>& parts) {
        Expr e{};
        e.kind = ExprKind::kInterp;
        e.span = next_span();
        e.list_begin = u_.ast.add_expr_list(parts);
        e.list_count = static_cast<uint32_t>(parts.size());
        return u_.ast.add_expr(e);
    }

    ExprId Builder::list(const std::vector<ExprId>& values) {
        Expr e{};
        e.kind = ExprKind::kArrayLit;
        e.span = next_span();
        e.list_begin = u_.ast.add_expr_list(values);
        e.list_count = static_cast<uint32_t>(values.size());
        const std::vector<ExprId> keys(values.size(), k_invalid_expr);
        e.key_begin = u_.ast.add_expr_list(keys);
        e.key_count = static_cast<uint32_t>(keys.size());
        return u_.ast.add_expr(e);
    }

    ExprId Builder::map(const std::vector<ExprId>& keys, const std::vector<ExprId>& values) {
        Expr e{};
        e.kind = ExprKind::kArrayLit;
        e.span = next_span();
        e.list_begin = u_.ast.add_expr_list(values);
        e.list_count = static_cast<uint32_t>(values.size());
        e.key_begin = u_.ast.add_expr_list(keys);
        e.key_count = static_cast<uint32_t>(keys.size());
        return u_.ast.add_expr(e);
    }

    ExprId Builder::match(ExprId subject, const std::vector<ArmSpec>& arms) {
        Expr e{};
        e.kind = ExprKind::kMatch;
        e.span = next_span();
        e.a = subject;
        e.arm_count = static_cast<uint32_t>(arms.size());
        bool first = true;
        for (const auto& spec : arms) {
            MatchArm arm{};
            arm.cond_begin = u_.ast.add_expr_list(spec.conds);
            arm.cond_count = static_cast<uint32_t>(spec.conds.size());
            arm.is_default = spec.is_default;
            arm.body = spec.body;
            arm.span = next_span();
            const uint32_t id = u_.ast.add_arm(arm);
            if (first) {
                e.arm_begin = id;
                first = false;
            }
        }
        return u_.ast.add_expr(e);
    }

    ExprId Builder::eval(ExprId code) {
        Expr e{};
        e.kind = ExprKind::kEval;
        e.span = next_span();
        e.a = code;
        return u_.ast.add_expr(e);
    }

    ExprId Builder::var_var(ExprId name_expr) {
        Expr e{};
        e.kind = ExprKind::kVarVar;
        e.span = next_span();
        e.a = name_expr;
        return u_.ast.add_expr(e);
    }

    ExprId Builder::static_prop(std::string_view cls, std::string_view name) {
        Expr e{};
        e.kind = ExprKind::kStaticPropFetch;
        e.span = next_span();
        e.class_name = std::string(cls);
        e.text = std::string(name);
        return u_.ast.add_expr(e);
    }

    // ---- statements ----

    StmtId Builder::expr(ExprId e) {
        Stmt s{};
        s.kind = StmtKind::kExpr;
        s.span = next_span();
        s.a = e;
        return u_.ast.add_stmt(s);
    }

    StmtId Builder::echo(const std::vector<ExprId>& xs) {
        Stmt s{};
        s.kind = StmtKind::kEcho;
        s.span = next_span();
        s.list_begin = u_.ast.add_expr_list(xs);
        s.list_count = static_cast<uint32_t>(xs.size());
        return u_.ast.add_stmt(s);
    }

    StmtId Builder::block(const std::vector<StmtId>& xs) {
        Stmt s{};
        s.kind = StmtKind::kBlock;
        s.span = next_span();
        s.list_begin = u_.ast.add_stmt_list(xs);
        s.list_count = static_cast<uint32_t>(xs.size());
        return u_.ast.add_stmt(s);
    }

    StmtId Builder::if_(ExprId cond, const std::vector<StmtId>& then_s, StmtId else_s) {
        Stmt s{};
        s.kind = StmtKind::kIf;
        s.span = next_span();
        s.a = cond;
        s.body = block(then_s);
        s.else_body = else_s;
        return u_.ast.add_stmt(s);
    }

    StmtId Builder::while_(ExprId cond, const std::vector<StmtId>& body) {
        Stmt s{};
        s.kind = StmtKind::kWhile;
        s.span = next_span();
        s.a = cond;
        s.body = block(body);
        return u_.ast.add_stmt(s);
    }

    StmtId Builder::do_while(const std::vector<StmtId>& body, ExprId cond) {
        Stmt s{};
        s.kind = StmtKind::kDoWhile;
        s.span = next_span();
        s.a = cond;
        s.body = block(body);
        return u_.ast.add_stmt(s);
    }

    StmtId Builder::for_(const std::vector<ExprId>& init, const std::vector<ExprId>& cond,
                         const std::vector<ExprId>& step, const std::vector<StmtId>& body) {
        Stmt s{};
        s.kind = StmtKind::kFor;
        s.span = next_span();
        s.list_begin = u_.ast.add_expr_list(init);
        s.list_count = static_cast<uint32_t>(init.size());
        s.cond_begin = u_.ast.add_expr_list(cond);
        s.cond_count = static_cast<uint32_t>(cond.size());
        s.step_begin = u_.ast.add_expr_list(step);
        s.step_count = static_cast<uint32_t>(step.size());
        s.body = block(body);
        return u_.ast.add_stmt(s);
    }

    StmtId Builder::foreach(ExprId subject, std::string_view key_var, std::string_view value_var,
                            const std::vector<StmtId>& body, bool by_ref) {
        Stmt s{};
        s.kind = StmtKind::kForeach;
        s.span = next_span();
        s.a = subject;
        s.key_var = std::string(key_var);
        s.value_var = std::string(value_var);
        s.by_ref = by_ref;
        s.body = block(body);
        return u_.ast.add_stmt(s);
    }

    StmtId Builder::switch_(ExprId subject, const std::vector<CaseSpec>& cases) {
        Stmt s{};
        s.kind = StmtKind::kSwitch;
        s.span = next_span();
        s.a = subject;
        s.case_count = static_cast<uint32_t>(cases.size());
        bool first = true;
        for (const auto& spec : cases) {
            SwitchCase c{};
            c.match = spec.match;
            c.stmt_begin = u_.ast.add_stmt_list(spec.body);
            c.stmt_count = static_cast<uint32_t>(spec.body.size());
            c.span = next_span();
            const uint32_t id = u_.ast.add_case(c);
            if (first) {
                s.case_begin = id;
                first = false;
            }
        }
        return u_.ast.add_stmt(s);
    }

    StmtId Builder::break_(uint32_t level) {
        Stmt s{};
        s.kind = StmtKind::kBreak;
        s.span = next_span();
        s.level = level;
        return u_.ast.add_stmt(s);
    }

    StmtId Builder::continue_(uint32_t level) {
        Stmt s{};
        s.kind = StmtKind::kContinue;
        s.span = next_span();
        s.level = level;
        return u_.ast.add_stmt(s);
    }

    StmtId Builder::ret(ExprId e) {
        Stmt s{};
        s.kind = StmtKind::kReturn;
        s.span = next_span();
        s.a = e;
        return u_.ast.add_stmt(s);
    }

    StmtId Builder::try_(const std::vector<StmtId>& body, const std::vector<CatchSpec>& catches) {
        Stmt s{};
        s.kind = StmtKind::kTry;
        s.span = next_span();
        s.body = block(body);
        s.catch_count = static_cast<uint32_t>(catches.size());
        bool first = true;
        for (const auto& spec : catches) {
            CatchClause c{};
            c.types = spec.types;
            c.var = spec.var;
            c.body = block(spec.body);
            c.span = next_span();
            const uint32_t id = u_.ast.add_catch(c);
            if (first) {
                s.catch_begin = id;
                first = false;
            }
        }
        return u_.ast.add_stmt(s);
    }

    StmtId Builder::try_finally(const std::vector<StmtId>& body, const std::vector<CatchSpec>& catches,
                                const std::vector<StmtId>& finally_body) {
        const StmtId fin = block(finally_body);
        Stmt s{};
        s.kind = StmtKind::kTry;
        s.span = next_span();
        s.body = block(body);
        s.catch_count = static_cast<uint32_t>(catches.size());
        bool first = true;
        for (const auto& spec : catches) {
            CatchClause c{};
            c.types = spec.types;
            c.var = spec.var;
            c.body = block(spec.body);
            c.span = next_span();
            const uint32_t id = u_.ast.add_catch(c);
            if (first) {
                s.catch_begin = id;
                first = false;
            }
        }
        s.finally_body = fin;
        return u_.ast.add_stmt(s);
    }

    StmtId Builder::throw_(ExprId e) {
        Stmt s{};
        s.kind = StmtKind::kThrow;
        s.span = next_span();
        s.a = e;
        return u_.ast.add_stmt(s);
    }

    StmtId Builder::global(std::string_view name) {
        Stmt s{};
        s.kind = StmtKind::kGlobal;
        s.span = next_span();
        s.text = std::string(name);
        return u_.ast.add_stmt(s);
    }

    // ---- declarations ----

    Param Builder::param(std::string_view name, std::string_view type_spelling, ExprId def) {
        Param p{};
        p.name = std::string(name);
        p.type = type(type_spelling);
        p.default_value = def;
        p.span = next_span();
        return p;
    }

    Attribute Builder::attr(std::string_view name, const std::vector<ExprId>& args) {
        Attribute a{};
        a.name = std::string(name);
        a.args = args;
        a.span = next_span();
        return a;
    }

    FnDecl Builder::function(std::string_view name, const std::vector<Param>& params, std::string_view ret_type,
                             const std::vector<StmtId>& body) {
        FnDecl f{};
        f.name = std::string(name);
        f.params = params;
        f.ret = type(ret_type);
        f.body = block(body);
        f.span = next_span();
        return f;
    }

    FnDecl Builder::method(Visibility vis, std::string_view name, const std::vector<Param>& params,
                           std::string_view ret_type, const std::vector<StmtId>& body, bool is_static) {
        FnDecl f = function(name, params, ret_type, body);
        f.is_method = true;
        f.vis = vis;
        f.is_static = is_static;
        return f;
    }

    FnDecl Builder::abstract_method(std::string_view name, const std::vector<Param>& params,
                                    std::string_view ret_type) {
        FnDecl f{};
        f.name = std::string(name);
        f.params = params;
        f.ret = type(ret_type);
        f.is_method = true;
        f.is_abstract = true;
        f.span = next_span();
        return f;
    }

    PropDecl Builder::property(Visibility vis, std::string_view name, std::string_view type_spelling, ExprId def) {
        PropDecl p{};
        p.name = std::string(name);
        p.type = type(type_spelling);
        p.default_value = def;
        p.vis = vis;
        p.span = next_span();
        return p;
    }

    ClassDecl Builder::class_(std::string_view name, std::string_view parent,
                              const std::vector<PropDecl>& props, const std::vector<FnDecl>& methods) {
        ClassDecl c{};
        c.name = std::string(name);
        c.parent = std::string(parent);
        c.props = props;
        for (const auto& m : methods) {
            FnDecl f = m;
            f.is_method = true;
            c.methods.push_back(u_.ast.add_fn(f));
        }
        c.span = next_span();
        return c;
    }

    ClassDecl Builder::interface_(std::string_view name, const std::vector<FnDecl>& methods) {
        ClassDecl c = class_(name, "", {}, methods);
        c.is_interface = true;
        return c;
    }

    StmtId Builder::fn_stmt(const FnDecl& f) {
        Stmt s{};
        s.kind = StmtKind::kFnDecl;
        s.span = f.span;
        s.decl = u_.ast.add_fn(f);
        return u_.ast.add_stmt(s);
    }

    StmtId Builder::class_stmt(const ClassDecl& c) {
        Stmt s{};
        s.kind = StmtKind::kClassDecl;
        s.span = c.span;
        s.decl = u_.ast.add_class(c);
        return u_.ast.add_stmt(s);
    }

} // namespace php2ir::ast
