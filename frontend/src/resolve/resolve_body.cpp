// frontend/src/resolve/resolve_body.cpp
#include "resolver.hpp"

#include <php2ir/resolve/Prelude.hpp>


namespace php2ir::resolve::detail {

    using sema::Symbol;
    using sema::SymbolKind;

    namespace {

        constexpr int kMaxInferRounds = 16;

        bool is_int_like_(const ty::TypePool& tp, ty::TypeId t) {
            return tp.is_builtin(t, ty::Builtin::kInt) ||
                   tp.is_builtin(t, ty::Builtin::kBool) ||
                   tp.is_builtin(t, ty::Builtin::kNull);
        }

        bool is_mixed_like_(const ty::TypePool& tp, ty::TypeId t) {
            return tp.is_mixed(t) || tp.is_nullable(t);
        }

        std::string_view binop_spelling_(ast::BinOp op) {
            switch (op) {
                case ast::BinOp::kAdd: return "+";
                case ast::BinOp::kSub: return "-";
                case ast::BinOp::kMul: return "*";
                case ast::BinOp::kDiv: return "/";
                case ast::BinOp::kMod: return "%";
                case ast::BinOp::kPow: return "**";
                case ast::BinOp::kConcat: return ".";
                case ast::BinOp::kEq: return "==";
                case ast::BinOp::kNe: return "!=";
                case ast::BinOp::kIdentical: return "===";
                case ast::BinOp::kNotIdentical: return "!==";
                case ast::BinOp::kLt: return "<";
                case ast::BinOp::kLe: return "<=";
                case ast::BinOp::kGt: return ">";
                case ast::BinOp::kGe: return ">=";
                case ast::BinOp::kSpaceship: return "<=>";
                case ast::BinOp::kAnd: return "&&";
                case ast::BinOp::kOr: return "||";
                case ast::BinOp::kXor: return "xor";
                case ast::BinOp::kBitAnd: return "&";
                case ast::BinOp::kBitOr: return "|";
                case ast::BinOp::kBitXor: return "^";
                case ast::BinOp::kShl: return "<<";
                case ast::BinOp::kShr: return ">>";
                case ast::BinOp::kNone: return "=";
            }
            return "?";
        }

    } // namespace

    // ---- function driver ----

    void Resolver::resolve_function_(FunctionInfo& fi) {
        fn_ = &fi;
        local_ix_.clear();
        breakables_.clear();
        for (uint32_t i = 0; i < fi.locals.size(); ++i) local_ix_.emplace(fi.locals[i].name, i);

        if (fi.is_main) {
            for (ast::StmtId s : fi.top) collect_locals_stmt_(s);
        } else {
            collect_locals_stmt_(fi.body);
        }

        auto walk = [&]() {
            breakables_.clear();
            if (fi.is_main) {
                for (ast::StmtId s : fi.top) stmt_(s);
            } else {
                stmt_(fi.body);
            }
        };

        // forward propagation to a fixed point over the local lattice (never -> T -> mixed)
        recording_ = false;
        bool converged = false;
        for (int round = 0; round < kMaxInferRounds; ++round) {
            changed_ = false;
            walk();
            if (!changed_) {
                converged = true;
                break;
            }
        }
        for (auto& l : fi.locals) {
            if (l.is_param) continue;
            if (!converged || is_never_(l.type) || l.type == ty::kInvalidType) l.type = types_.mixed();
        }

        recording_ = true;
        walk();
        recording_ = false;
        fn_ = nullptr;
    }

    uint32_t Resolver::add_local_(std::string_view name, ty::TypeId t, bool is_param) {
        auto it = local_ix_.find(std::string(name));
        if (it != local_ix_.end()) return it->second;
        const uint32_t ix = static_cast<uint32_t>(fn_->locals.size());
        fn_->locals.push_back({std::string(name), t, is_param});
        local_ix_.emplace(std::string(name), ix);
        return ix;
    }

    void Resolver::set_local_(std::string_view name, ty::TypeId t) {
        if (recording_) return;
        const uint32_t ix = add_local_(name, types_.never(), false);
        LocalVar& l = fn_->locals[ix];
        if (l.is_param) return;
        const ty::TypeId nt = types_.join(l.type, value_type_(t));
        if (nt != l.type) {
            l.type = nt;
            changed_ = true;
        }
    }

    void Resolver::collect_locals_stmt_(ast::StmtId sid) {
        if (sid == ast::k_invalid_stmt) return;
        const ast::Stmt& s = ast_.stmt(sid);

        auto exprs = [&](uint32_t begin, uint32_t count) {
            for (uint32_t i = 0; i < count; ++i) collect_locals_expr_(ast_.expr_at(begin + i));
        };
        auto stmts = [&](uint32_t begin, uint32_t count) {
            for (uint32_t i = 0; i < count; ++i) collect_locals_stmt_(ast_.stmt_at(begin + i));
        };

        switch (s.kind) {
            case ast::StmtKind::kExpr:
            case ast::StmtKind::kReturn:
            case ast::StmtKind::kThrow:
                collect_locals_expr_(s.a);
                break;
            case ast::StmtKind::kEcho:
                exprs(s.list_begin, s.list_count);
                break;
            case ast::StmtKind::kBlock:
                stmts(s.list_begin, s.list_count);
                break;
            case ast::StmtKind::kIf:
                collect_locals_expr_(s.a);
                collect_locals_stmt_(s.body);
                collect_locals_stmt_(s.else_body);
                break;
            case ast::StmtKind::kWhile:
            case ast::StmtKind::kDoWhile:
                collect_locals_expr_(s.a);
                collect_locals_stmt_(s.body);
                break;
            case ast::StmtKind::kFor:
                exprs(s.list_begin, s.list_count);
                exprs(s.cond_begin, s.cond_count);
                exprs(s.step_begin, s.step_count);
                collect_locals_stmt_(s.body);
                break;
            case ast::StmtKind::kForeach:
                collect_locals_expr_(s.a);
                if (!s.key_var.empty()) add_local_(s.key_var, types_.never(), false);
                if (!s.value_var.empty()) add_local_(s.value_var, types_.never(), false);
                collect_locals_stmt_(s.body);
                break;
            case ast::StmtKind::kSwitch:
                collect_locals_expr_(s.a);
                for (uint32_t i = 0; i < s.case_count; ++i) {
                    const ast::SwitchCase& c = ast_.switch_case(s.case_begin + i);
                    collect_locals_expr_(c.match);
                    stmts(c.stmt_begin, c.stmt_count);
                }
                break;
            case ast::StmtKind::kTry:
                collect_locals_stmt_(s.body);
                for (uint32_t i = 0; i < s.catch_count; ++i) {
                    const ast::CatchClause& c = ast_.catch_clause(s.catch_begin + i);
                    if (!c.var.empty()) add_local_(c.var, types_.never(), false);
                    collect_locals_stmt_(c.body);
                }
                collect_locals_stmt_(s.finally_body);
                break;
            default:
                break;
        }
    }

    void Resolver::collect_locals_expr_(ast::ExprId id) {
        if (id == ast::k_invalid_expr) return;
        const ast::Expr& e = ast_.expr(id);
        if (e.kind == ast::ExprKind::kVar) {
            add_local_(e.text, types_.never(), false);
            return;
        }
        collect_locals_expr_(e.a);
        collect_locals_expr_(e.b);
        collect_locals_expr_(e.c);
        for (uint32_t i = 0; i < e.list_count; ++i) collect_locals_expr_(ast_.expr_at(e.list_begin + i));
        for (uint32_t i = 0; i < e.key_count; ++i) collect_locals_expr_(ast_.expr_at(e.key_begin + i));
        for (uint32_t i = 0; i < e.arm_count; ++i) {
            const ast::MatchArm& arm = ast_.arm(e.arm_begin + i);
            for (uint32_t k = 0; k < arm.cond_count; ++k) collect_locals_expr_(ast_.expr_at(arm.cond_begin + k));
            collect_locals_expr_(arm.body);
        }
    }

    // ---- statements ----

    void Resolver::stmts_(uint32_t begin, uint32_t count) {
        for (uint32_t i = 0; i < count; ++i) stmt_(ast_.stmt_at(begin + i));
    }

    void Resolver::stmt_(ast::StmtId sid) {
        if (sid == ast::k_invalid_stmt) return;
        const ast::Stmt& s = ast_.stmt(sid);

        switch (s.kind) {
            case ast::StmtKind::kNop:
                break;

            case ast::StmtKind::kExpr:
                expr_(s.a);
                break;

            case ast::StmtKind::kEcho:
                for (uint32_t i = 0; i < s.list_count; ++i) {
                    const ast::ExprId x = ast_.expr_at(s.list_begin + i);
                    const ty::TypeId t = value_type_(expr_(x));
                    if (!stringable_(t)) {
                        body_error_(diag::Code::kOperandTypeMismatch, ast_.expr(x).span, {"echo", tname_(t), "string"});
                    }
                }
                break;

            case ast::StmtKind::kBlock:
                stmts_(s.list_begin, s.list_count);
                break;

            case ast::StmtKind::kIf: {
                const ty::TypeId c = expr_(s.a);
                if (types_.is_builtin(c, ty::Builtin::kVoid)) {
                    body_error_(diag::Code::kConditionTypeMismatch, s.span, {tname_(c)});
                }
                stmt_(s.body);
                stmt_(s.else_body);
                break;
            }

            case ast::StmtKind::kWhile:
            case ast::StmtKind::kDoWhile:
                expr_(s.a);
                breakables_.push_back(true);
                stmt_(s.body);
                breakables_.pop_back();
                break;

            case ast::StmtKind::kFor:
                for (uint32_t i = 0; i < s.list_count; ++i) expr_(ast_.expr_at(s.list_begin + i));
                for (uint32_t i = 0; i < s.cond_count; ++i) expr_(ast_.expr_at(s.cond_begin + i));
                for (uint32_t i = 0; i < s.step_count; ++i) expr_(ast_.expr_at(s.step_begin + i));
                breakables_.push_back(true);
                stmt_(s.body);
                breakables_.pop_back();
                break;

            case ast::StmtKind::kForeach:
                foreach_(s);
                break;

            case ast::StmtKind::kSwitch:
                expr_(s.a);
                for (uint32_t i = 0; i < s.case_count; ++i) {
                    const ast::SwitchCase& c = ast_.switch_case(s.case_begin + i);
                    if (c.match != ast::k_invalid_expr) expr_(c.match);
                }
                breakables_.push_back(false);
                for (uint32_t i = 0; i < s.case_count; ++i) {
                    const ast::SwitchCase& c = ast_.switch_case(s.case_begin + i);
                    stmts_(c.stmt_begin, c.stmt_count);
                }
                breakables_.pop_back();
                break;

            case ast::StmtKind::kBreak:
            case ast::StmtKind::kContinue: {
                const bool is_break = (s.kind == ast::StmtKind::kBreak);
                // continue skips switch levels; break counts every breakable construct
                uint32_t avail = 0;
                for (bool is_loop : breakables_) {
                    if (is_break || is_loop) ++avail;
                }
                if (s.level == 0 || s.level > avail) {
                    body_error_(diag::Code::kInvalidBreakLevel, s.span,
                                {is_break ? "break" : "continue", std::to_string(s.level)});
                }
                break;
            }

            case ast::StmtKind::kReturn:
                return_(s);
                break;

            case ast::StmtKind::kTry:
                try_(s);
                break;

            case ast::StmtKind::kThrow: {
                const ty::TypeId t = value_type_(expr_(s.a));
                if (types_.is_mixed(t) || is_never_(t)) break;
                bool ok = false;
                if (types_.get(t).kind == ty::Kind::kObject) {
                    const auto cls = table_.lookup_class(types_.class_of(t));
                    ok = cls && is_throwable_class(table_, *cls);
                }
                if (!ok) body_error_(diag::Code::kNotThrowable, s.span, {tname_(t)});
                break;
            }

            case ast::StmtKind::kFnDecl:
            case ast::StmtKind::kClassDecl:
                body_error_(diag::Code::kUnsupportedConstruct, s.span, {"conditional or nested declaration"});
                break;

            case ast::StmtKind::kGlobal:
                body_error_(diag::Code::kUnsupportedConstruct, s.span, {"global"});
                break;

            case ast::StmtKind::kStaticVar:
                body_error_(diag::Code::kUnsupportedConstruct, s.span, {"static variable"});
                break;
        }
    }

    void Resolver::foreach_(const ast::Stmt& s) {
        const ty::TypeId t = value_type_(expr_(s.a));
        if (s.by_ref) body_error_(diag::Code::kUnsupportedConstruct, s.span, {"by-reference foreach"});

        ty::TypeId vt = types_.mixed();
        ty::TypeId kt = types_.mixed();
        if (is_never_(t)) {
            vt = t;
            kt = t;
        } else if (types_.is_array(t)) {
            vt = elem_type_(t);
            if (types_.get(t).shape == ty::ArrayShape::kList) kt = types_.int_();
        } else if (!types_.is_mixed(t)) {
            body_error_(diag::Code::kOperandTypeMismatch, s.span, {"foreach", tname_(t), "array"});
        }
        if (!s.key_var.empty()) set_local_(s.key_var, kt);
        if (!s.value_var.empty()) set_local_(s.value_var, vt);

        breakables_.push_back(true);
        stmt_(s.body);
        breakables_.pop_back();
    }

    void Resolver::try_(const ast::Stmt& s) {
        stmt_(s.body);

        for (uint32_t i = 0; i < s.catch_count; ++i) {
            const uint32_t cid = s.catch_begin + i;
            const ast::CatchClause& c = ast_.catch_clause(cid);

            std::vector<SymbolId> classes;
            for (const auto& tn : c.types) {
                const SymbolId cls = class_ref_(tn, c.span);
                if (cls == kInvalidSymbol) continue;
                if (!is_throwable_class(table_, cls)) {
                    body_error_(diag::Code::kNotThrowable, c.span, {tn});
                    continue;
                }
                classes.push_back(cls);
            }

            if (!c.var.empty()) {
                ty::TypeId vt = types_.mixed();
                if (classes.size() == 1) vt = class_type_(classes[0], false);
                set_local_(c.var, vt);
            }
            if (recording_) out_.catch_types[cid] = classes;
            stmt_(c.body);
        }

        stmt_(s.finally_body);
    }

    void Resolver::return_(const ast::Stmt& s) {
        if (fn_->is_main) {
            if (s.a != ast::k_invalid_expr) expr_(s.a);
            return;
        }
        const ty::TypeId ret = fn_->ret;
        const bool ret_void = types_.is_builtin(ret, ty::Builtin::kVoid);

        if (s.a == ast::k_invalid_expr) {
            if (fn_->ret_hinted && !ret_void) {
                body_error_(diag::Code::kMissingReturnValue, s.span, {fn_->name});
            }
            return;
        }

        const ty::TypeId t = value_type_(expr_(s.a));
        if (ret_void) {
            body_error_(diag::Code::kVoidReturnValue, s.span, {fn_->name});
        } else if (!assignable_(t, ret)) {
            body_error_(diag::Code::kReturnTypeMismatch, s.span, {fn_->name, tname_(ret), tname_(t)});
        }
    }

    // ---- expressions ----

    ty::TypeId Resolver::expr_(ast::ExprId id) {
        if (id == ast::k_invalid_expr) return types_.null();
        const ty::TypeId t = expr_inner_(id);
        if (recording_) out_.expr_types[id] = t;
        return t;
    }

    ty::TypeId Resolver::expr_inner_(ast::ExprId id) {
        const ast::Expr& e = ast_.expr(id);
        switch (e.kind) {
            case ast::ExprKind::kIntLit:    return types_.int_();
            case ast::ExprKind::kFloatLit:  return types_.float_();
            case ast::ExprKind::kStringLit: return types_.string();
            case ast::ExprKind::kBoolLit:   return types_.bool_();
            case ast::ExprKind::kNullLit:   return types_.null();

            case ast::ExprKind::kInterp:
                for (uint32_t i = 0; i < e.list_count; ++i) {
                    const ast::ExprId p = ast_.expr_at(e.list_begin + i);
                    const ty::TypeId t = value_type_(expr_(p));
                    if (!stringable_(t)) {
                        body_error_(diag::Code::kOperandTypeMismatch, ast_.expr(p).span,
                                    {"interpolation", tname_(t), "string"});
                    }
                }
                return types_.string();

            case ast::ExprKind::kArrayLit: {
                ty::TypeId elem = types_.never();
                bool keyed = false;
                for (uint32_t i = 0; i < e.list_count; ++i) {
                    elem = types_.join(elem, value_type_(expr_(ast_.expr_at(e.list_begin + i))));
                }
                for (uint32_t i = 0; i < e.key_count; ++i) {
                    const ast::ExprId k = ast_.expr_at(e.key_begin + i);
                    if (k == ast::k_invalid_expr) continue;
                    keyed = true;
                    const ty::TypeId kt = value_type_(expr_(k));
                    if (!is_int_like_(types_, kt) && !types_.is_builtin(kt, ty::Builtin::kString) &&
                        !types_.is_mixed(kt) && !is_never_(kt)) {
                        body_error_(diag::Code::kOperandTypeMismatch, ast_.expr(k).span, {"array key", tname_(kt), ""});
                    }
                }
                return types_.array(elem, keyed ? ty::ArrayShape::kMap : ty::ArrayShape::kList);
            }

            case ast::ExprKind::kVar: {
                auto it = local_ix_.find(e.text);
                if (it == local_ix_.end()) return types_.mixed();
                return fn_->locals[it->second].type;
            }

            case ast::ExprKind::kThis:
                if (!fn_->has_this) {
                    body_error_(diag::Code::kThisOutsideClass, e.span);
                    return types_.mixed();
                }
                return fn_->locals[0].type;

            case ast::ExprKind::kConstFetch: {
                sema::DefaultValue v{};
                if (!find_constant(e.text, v)) {
                    body_error_(diag::Code::kUnresolvedConstant, e.span, {e.text});
                    return types_.mixed();
                }
                if (recording_) out_.consts[id] = v;
                return const_type_(v);
            }

            case ast::ExprKind::kBinary: {
                if (e.op == ast::BinOp::kAnd || e.op == ast::BinOp::kOr) {
                    expr_(e.a);
                    expr_(e.b);
                    return types_.bool_();
                }
                const ty::TypeId l = expr_(e.a);
                const ty::TypeId r = expr_(e.b);
                return binary_(e, e.op, l, r);
            }

            case ast::ExprKind::kUnary: {
                const ty::TypeId t = value_type_(expr_(e.a));
                if (e.uop == ast::UnaryOp::kNot) return types_.bool_();
                if (is_never_(t)) return t;
                if (e.uop == ast::UnaryOp::kBitNot) {
                    if (!is_int_like_(types_, t) && !types_.is_numeric(t) && !is_mixed_like_(types_, t)) {
                        body_error_(diag::Code::kOperandTypeMismatch, e.span, {"~", tname_(t), ""});
                    }
                    return types_.int_();
                }
                if (is_int_like_(types_, t)) return types_.int_();
                if (types_.is_builtin(t, ty::Builtin::kFloat)) return t;
                if (is_mixed_like_(types_, t)) return types_.mixed();
                body_error_(diag::Code::kOperandTypeMismatch, e.span,
                            {e.uop == ast::UnaryOp::kNeg ? "-" : "+", tname_(t), ""});
                return types_.mixed();
            }

            case ast::ExprKind::kAssign:
                return assign_(e);

            case ast::ExprKind::kIncDec:
                return incdec_(e);

            case ast::ExprKind::kTernary: {
                const ty::TypeId c = value_type_(expr_(e.a));
                const ty::TypeId t1 = (e.b != ast::k_invalid_expr) ? value_type_(expr_(e.b)) : types_.non_null(c);
                const ty::TypeId t2 = value_type_(expr_(e.c));
                return types_.join(t1, t2);
            }

            case ast::ExprKind::kCoalesce: {
                const ty::TypeId t1 = value_type_(expr_(e.a));
                const ty::TypeId t2 = value_type_(expr_(e.b));
                if (types_.is_builtin(t1, ty::Builtin::kNull)) return t2;
                return types_.join(types_.non_null(t1), t2);
            }

            case ast::ExprKind::kCall:        return call_(id, e);
            case ast::ExprKind::kMethodCall:  return method_call_(id, e);
            case ast::ExprKind::kStaticCall:  return static_call_(id, e);
            case ast::ExprKind::kNew:         return new_(id, e);
            case ast::ExprKind::kPropFetch:   return prop_fetch_(id, e);
            case ast::ExprKind::kIndex:       return index_(e);

            case ast::ExprKind::kInstanceOf: {
                expr_(e.a);
                const SymbolId cls = class_ref_(e.class_name, e.span);
                if (recording_ && cls != kInvalidSymbol) out_.class_refs[id] = cls;
                return types_.bool_();
            }

            case ast::ExprKind::kCast: {
                const ty::TypeId src = value_type_(expr_(e.a));
                const ty::TypeId to = e.cast_type;
                const bool scalar_to = types_.is_scalar(to) || types_.is_builtin(to, ty::Builtin::kString);
                const bool array_to = types_.is_array(to) &&
                                      (types_.is_array(src) || types_.is_mixed(src) || is_never_(src));
                if (types_.is_error(to) || (!scalar_to && !array_to)) {
                    body_error_(diag::Code::kUnsupportedConstruct, e.span, {"cast to " + tname_(to)});
                    return types_.mixed();
                }
                if (scalar_to && (types_.is_array(src) || types_.is_object(src))) {
                    body_error_(diag::Code::kOperandTypeMismatch, e.span, {"cast", tname_(src), tname_(to)});
                }
                return to;
            }

            case ast::ExprKind::kMatch:
                return match_(e);

            case ast::ExprKind::kEval:
                body_error_(diag::Code::kUnsupportedConstruct, e.span, {"eval"});
                return types_.mixed();
            case ast::ExprKind::kVarVar:
                body_error_(diag::Code::kUnsupportedConstruct, e.span, {"variable variable"});
                return types_.mixed();
            case ast::ExprKind::kStaticPropFetch:
                body_error_(diag::Code::kUnsupportedConstruct, e.span, {"static property"});
                return types_.mixed();
        }
        return types_.mixed();
    }

    ty::TypeId Resolver::binary_(const ast::Expr& e, ast::BinOp op, ty::TypeId l, ty::TypeId r) {
        l = value_type_(l);
        r = value_type_(r);
        if (is_never_(l) || is_never_(r)) {
            switch (op) {
                case ast::BinOp::kConcat: return types_.string();
                case ast::BinOp::kEq: case ast::BinOp::kNe:
                case ast::BinOp::kIdentical: case ast::BinOp::kNotIdentical:
                case ast::BinOp::kLt: case ast::BinOp::kLe:
                case ast::BinOp::kGt: case ast::BinOp::kGe:
                case ast::BinOp::kXor:
                    return types_.bool_();
                default:
                    return types_.never();
            }
        }

        auto mismatch = [&]() {
            body_error_(diag::Code::kOperandTypeMismatch, e.span, {binop_spelling_(op), tname_(l), tname_(r)});
        };
        const bool l_int = is_int_like_(types_, l);
        const bool r_int = is_int_like_(types_, r);
        const bool l_num = l_int || types_.is_builtin(l, ty::Builtin::kFloat);
        const bool r_num = r_int || types_.is_builtin(r, ty::Builtin::kFloat);
        const bool l_dyn = is_mixed_like_(types_, l);
        const bool r_dyn = is_mixed_like_(types_, r);

        switch (op) {
            case ast::BinOp::kConcat:
                if (!stringable_(l) || !stringable_(r)) mismatch();
                return types_.string();

            case ast::BinOp::kEq: case ast::BinOp::kNe:
            case ast::BinOp::kIdentical: case ast::BinOp::kNotIdentical:
            case ast::BinOp::kLt: case ast::BinOp::kLe:
            case ast::BinOp::kGt: case ast::BinOp::kGe:
            case ast::BinOp::kXor:
                return types_.bool_();

            case ast::BinOp::kSpaceship:
                return types_.int_();

            case ast::BinOp::kAdd: case ast::BinOp::kSub: case ast::BinOp::kMul:
            case ast::BinOp::kDiv: case ast::BinOp::kMod: case ast::BinOp::kPow: {
                const bool ok_l = l_num || l_dyn;
                const bool ok_r = r_num || r_dyn;
                if (!ok_l || !ok_r) {
                    mismatch();
                    return (op == ast::BinOp::kMod) ? types_.int_() : types_.mixed();
                }
                if (op == ast::BinOp::kMod) return types_.int_();
                if (l_dyn || r_dyn) return types_.mixed();
                if (op == ast::BinOp::kDiv) return types_.float_();
                return (l_int && r_int) ? types_.int_() : types_.float_();
            }

            case ast::BinOp::kBitAnd: case ast::BinOp::kBitOr: case ast::BinOp::kBitXor:
            case ast::BinOp::kShl: case ast::BinOp::kShr:
                if (!(l_num || l_dyn) || !(r_num || r_dyn)) mismatch();
                return types_.int_();

            case ast::BinOp::kAnd: case ast::BinOp::kOr:
                return types_.bool_();

            case ast::BinOp::kNone:
                return r;
        }
        return types_.mixed();
    }

    ty::TypeId Resolver::assign_(const ast::Expr& e) {
        if (e.op == ast::BinOp::kNone) {
            const ty::TypeId vt = value_type_(expr_(e.b));
            return store_(e.a, vt, e.span);
        }
        const ty::TypeId cur = expr_(e.a);
        const ty::TypeId rhs = expr_(e.b);
        const ty::TypeId nt = binary_(e, e.op, cur, rhs);
        return store_(e.a, nt, e.span);
    }

    ty::TypeId Resolver::store_(ast::ExprId target, ty::TypeId vt, Span sp) {
        const ast::Expr& t = ast_.expr(target);
        vt = value_type_(vt);

        switch (t.kind) {
            case ast::ExprKind::kVar: {
                set_local_(t.text, vt);
                const ty::TypeId lt = fn_->locals[local_ix_.at(t.text)].type;
                if (fn_->locals[local_ix_.at(t.text)].is_param && !assignable_(vt, lt)) {
                    body_error_(diag::Code::kArgTypeMismatch, sp, {fn_->name, "$" + t.text, tname_(lt), tname_(vt)});
                }
                if (recording_) out_.expr_types[target] = lt;
                return lt;
            }

            case ast::ExprKind::kIndex: {
                const ty::TypeId bt = value_type_(expr_(t.a));
                if (t.b != ast::k_invalid_expr) {
                    const ty::TypeId kt = value_type_(expr_(t.b));
                    if (!is_int_like_(types_, kt) && !types_.is_builtin(kt, ty::Builtin::kString) &&
                        !types_.is_mixed(kt) && !is_never_(kt)) {
                        body_error_(diag::Code::kOperandTypeMismatch, t.span, {"array key", tname_(kt), ""});
                    }
                }
                const ty::ArrayShape shape = (t.b == ast::k_invalid_expr) ? ty::ArrayShape::kList : ty::ArrayShape::kMap;
                const ty::TypeId written = types_.array(vt, shape);

                ty::TypeId nt = written;
                if (types_.is_array(bt)) {
                    nt = types_.join(bt, written);
                } else if (types_.is_mixed(bt)) {
                    nt = bt;
                } else if (!is_never_(bt)) {
                    body_error_(diag::Code::kOperandTypeMismatch, t.span, {"[]=", tname_(bt), tname_(vt)});
                    nt = types_.mixed();
                }
                store_(t.a, nt, sp);
                if (recording_) out_.expr_types[target] = vt;
                return vt;
            }

            case ast::ExprKind::kPropFetch: {
                const ty::TypeId pt = prop_fetch_(target, t);
                if (recording_) out_.expr_types[target] = pt;
                auto it = out_.props.find(target);
                const bool dynamic = (it != out_.props.end() && it->second.dynamic);
                if (!dynamic && !is_never_(pt) && !assignable_(vt, pt)) {
                    body_error_(diag::Code::kPropertyTypeMismatch, sp, {"$" + t.text, tname_(pt), tname_(vt)});
                }
                return dynamic ? vt : pt;
            }

            case ast::ExprKind::kStaticPropFetch:
                body_error_(diag::Code::kUnsupportedConstruct, t.span, {"static property"});
                return types_.mixed();

            default:
                body_error_(diag::Code::kUnsupportedConstruct, t.span, {"assignment target"});
                return types_.mixed();
        }
    }

    ty::TypeId Resolver::incdec_(const ast::Expr& e) {
        const ty::TypeId t = value_type_(expr_(e.a));
        ty::TypeId nt = t;
        if (is_never_(t)) {
            nt = t;
        } else if (is_int_like_(types_, t)) {
            nt = types_.int_();
        } else if (types_.is_builtin(t, ty::Builtin::kFloat)) {
            nt = t;
        } else if (is_mixed_like_(types_, t)) {
            nt = types_.mixed();
        } else {
            body_error_(diag::Code::kOperandTypeMismatch, e.span, {"++/--", tname_(t), ""});
            nt = types_.mixed();
        }
        return store_(e.a, nt, e.span);
    }

    std::vector<ty::TypeId> Resolver::args_(const ast::Expr& e) {
        std::vector<ty::TypeId> out;
        out.reserve(e.list_count);
        for (uint32_t i = 0; i < e.list_count; ++i) out.push_back(value_type_(expr_(ast_.expr_at(e.list_begin + i))));
        return out;
    }

    void Resolver::check_args_(const Symbol& callee, std::string_view display,
                               const std::vector<ty::TypeId>& args, const ast::Expr& e) {
        uint32_t required = 0;
        for (uint32_t i = 0; i < callee.params.size(); ++i) {
            if (callee.params[i].def.kind == sema::DefaultValue::Kind::kNone) required = i + 1;
        }
        if (args.size() < required || args.size() > callee.params.size()) {
            const size_t expected = (args.size() < required) ? required : callee.params.size();
            body_error_(diag::Code::kArgCountMismatch, e.span,
                        {display, std::to_string(expected), std::to_string(args.size())});
            return;
        }
        for (size_t i = 0; i < args.size(); ++i) {
            if (!assignable_(args[i], callee.params[i].type)) {
                const ast::ExprId a = ast_.expr_at(e.list_begin + static_cast<uint32_t>(i));
                body_error_(diag::Code::kArgTypeMismatch, ast_.expr(a).span,
                            {display, std::to_string(i + 1), tname_(callee.params[i].type), tname_(args[i])});
            }
        }
    }

    void Resolver::record_call_(ast::ExprId id, const CallInfo& ci) {
        if (recording_) out_.calls[id] = ci;
    }

    ty::TypeId Resolver::call_(ast::ExprId id, const ast::Expr& e) {
        if (const BuiltinInfo* b = find_builtin(e.text)) return builtin_call_(id, e, *b);

        const std::vector<ty::TypeId> args = args_(e);
        const auto f = table_.lookup_function(e.text);
        if (!f) {
            body_error_(diag::Code::kUnresolvedFunction, e.span, {e.text});
            return types_.mixed();
        }
        const Symbol& fs = table_.symbol(*f);
        check_args_(fs, fs.name, args, e);

        CallInfo ci{};
        ci.kind = (fs.kind == SymbolKind::kForeign) ? CallKind::kForeign : CallKind::kFunction;
        ci.callee = *f;
        record_call_(id, ci);
        return fs.type;
    }

    ty::TypeId Resolver::builtin_call_(ast::ExprId id, const ast::Expr& e, const BuiltinInfo& b) {
        const std::vector<ty::TypeId> args = args_(e);
        const std::string name(b.name);
        if (args.size() < b.min_args || args.size() > b.max_args) {
            body_error_(diag::Code::kArgCountMismatch, e.span,
                        {name, std::to_string(b.min_args), std::to_string(args.size())});
            return types_.mixed();
        }

        CallInfo ci{};
        ci.kind = CallKind::kBuiltin;
        ci.builtin = b.id;
        record_call_(id, ci);

        auto need = [&](size_t i, ty::TypeId want) {
            if (!assignable_(args[i], want)) {
                const ast::ExprId a = ast_.expr_at(e.list_begin + static_cast<uint32_t>(i));
                body_error_(diag::Code::kArgTypeMismatch, ast_.expr(a).span,
                            {name, std::to_string(i + 1), tname_(want), tname_(args[i])});
            }
        };
        const ty::TypeId any_array = types_.array(types_.mixed(), ty::ArrayShape::kAny);

        switch (b.id) {
            case BuiltinFn::kCount:
                need(0, any_array);
                return types_.int_();
            case BuiltinFn::kStrlen:
                need(0, types_.string());
                return types_.int_();
            case BuiltinFn::kImplode:
                need(0, types_.string());
                need(1, any_array);
                return types_.string();
            case BuiltinFn::kAbs:
                if (is_int_like_(types_, args[0])) return types_.int_();
                need(0, types_.float_());
                return types_.float_();
            case BuiltinFn::kSqrt:
            case BuiltinFn::kSin:
            case BuiltinFn::kCos:
            case BuiltinFn::kFloor:
                need(0, types_.float_());
                return types_.float_();
            case BuiltinFn::kIntdiv:
                need(0, types_.int_());
                need(1, types_.int_());
                return types_.int_();
            case BuiltinFn::kStrRepeat:
                need(0, types_.string());
                need(1, types_.int_());
                return types_.string();
            case BuiltinFn::kStrtoupper:
                need(0, types_.string());
                return types_.string();
            case BuiltinFn::kIsNull:
                return types_.bool_();
            case BuiltinFn::kNone:
                break;
        }
        return types_.mixed();
    }

    ty::TypeId Resolver::method_call_(ast::ExprId id, const ast::Expr& e) {
        const ty::TypeId rt = value_type_(expr_(e.a));
        const std::vector<ty::TypeId> args = args_(e);
        if (is_never_(rt)) return rt;

        CallInfo ci{};
        if (is_mixed_like_(types_, rt)) {
            ci.kind = CallKind::kDynamic;
            record_call_(id, ci);
            return types_.mixed();
        }
        if (types_.get(rt).kind != ty::Kind::kObject) {
            body_error_(diag::Code::kUnresolvedMethod, e.span, {tname_(rt), e.text});
            return types_.mixed();
        }

        const auto cls = table_.lookup_class(types_.class_of(rt));
        if (!cls) {
            body_error_(diag::Code::kUnresolvedClass, e.span, {std::string(types_.class_of(rt))});
            return types_.mixed();
        }
        const Symbol& cs = table_.symbol(*cls);
        const auto m = table_.lookup_member(*cls, SymbolKind::kMethod, e.text);
        if (!m) {
            body_error_(diag::Code::kUnresolvedMethod, e.span, {cs.name, e.text});
            return types_.mixed();
        }
        const Symbol& ms = table_.symbol(*m);
        check_access_(ms, e.span);
        check_args_(ms, member_display_(ms), args, e);
        if (ms.is_static) {
            body_error_(diag::Code::kUnsupportedConstruct, e.span, {"static method called on an instance"});
            return ms.type;
        }

        ci.callee = *m;
        if (cs.kind == SymbolKind::kInterface) {
            ci.kind = CallKind::kDynamic;
        } else if (ms.vis == ast::Visibility::kPrivate || ms.is_final || cs.is_final ||
                   types_.get(rt).exact || ms.vtable_slot == kNoSlot) {
            ci.kind = CallKind::kStaticMethod;
        } else {
            ci.kind = CallKind::kVirtual;
            ci.vslot = ms.vtable_slot;
        }
        record_call_(id, ci);
        return ms.type;
    }

    ty::TypeId Resolver::static_call_(ast::ExprId id, const ast::Expr& e) {
        const std::vector<ty::TypeId> args = args_(e);
        const std::string folded = sema::fold_name(e.class_name);
        const SymbolId cur = fn_->cls;

        SymbolId target = kInvalidSymbol;
        if (folded == "static") {
            body_error_(diag::Code::kUnsupportedConstruct, e.span, {"static::"});
            return types_.mixed();
        } else if (folded == "parent") {
            if (cur == kInvalidSymbol || table_.symbol(cur).parent == kInvalidSymbol) {
                body_error_(diag::Code::kNoParentClass, e.span,
                            {cur == kInvalidSymbol ? std::string("<global>") : table_.symbol(cur).name});
                return types_.mixed();
            }
            target = table_.symbol(cur).parent;
        } else {
            target = class_ref_(e.class_name, e.span);
            if (target == kInvalidSymbol) return types_.mixed();
        }

        const auto m = find_in_chain_(target, e.text);
        if (!m || table_.symbol(*m).is_abstract) {
            body_error_(diag::Code::kUnresolvedMethod, e.span, {table_.symbol(target).name, e.text});
            return types_.mixed();
        }
        const Symbol& ms = table_.symbol(*m);
        check_access_(ms, e.span);
        check_args_(ms, member_display_(ms), args, e);

        CallInfo ci{};
        ci.callee = *m;
        if (ms.is_static) {
            ci.kind = CallKind::kStaticNoRecv;
        } else if (fn_->has_this && cur != kInvalidSymbol && table_.is_subclass_of(cur, target)) {
            ci.kind = CallKind::kStaticMethod;
            ci.implicit_this = true;
        } else {
            body_error_(diag::Code::kStaticCallToInstance, e.span, {table_.symbol(target).name, ms.name});
            return ms.type;
        }
        record_call_(id, ci);
        return ms.type;
    }

    ty::TypeId Resolver::new_(ast::ExprId id, const ast::Expr& e) {
        const std::vector<ty::TypeId> args = args_(e);
        const SymbolId cls = class_ref_(e.class_name, e.span);
        if (cls == kInvalidSymbol) return types_.mixed();

        const Symbol& cs = table_.symbol(cls);
        if (cs.kind == SymbolKind::kInterface || cs.is_abstract) {
            body_error_(diag::Code::kCannotInstantiate, e.span, {cs.name});
        }

        CallInfo ci{};
        ci.kind = CallKind::kStaticMethod;
        ci.cls = cls;
        const sema::ClassLayout* lay = table_.layout(cls);
        if (lay != nullptr && lay->ctor != kInvalidSymbol) {
            const Symbol& ctor = table_.symbol(lay->ctor);
            check_access_(ctor, e.span);
            check_args_(ctor, member_display_(ctor), args, e);
            ci.callee = lay->ctor;
        } else if (!args.empty()) {
            body_error_(diag::Code::kArgCountMismatch, e.span,
                        {cs.name + "::__construct", "0", std::to_string(args.size())});
        }
        record_call_(id, ci);
        return class_type_(cls, true);
    }

    ty::TypeId Resolver::prop_fetch_(ast::ExprId id, const ast::Expr& e) {
        const ty::TypeId rt = value_type_(expr_(e.a));
        if (is_never_(rt)) return rt;

        PropInfo pi{};
        bool dynamic = is_mixed_like_(types_, rt);
        SymbolId cls = kInvalidSymbol;
        if (!dynamic) {
            if (types_.get(rt).kind != ty::Kind::kObject) {
                body_error_(diag::Code::kUnresolvedProperty, e.span, {tname_(rt), e.text});
                return types_.mixed();
            }
            const auto c = table_.lookup_class(types_.class_of(rt));
            if (!c) {
                body_error_(diag::Code::kUnresolvedClass, e.span, {std::string(types_.class_of(rt))});
                return types_.mixed();
            }
            cls = *c;
            dynamic = (table_.symbol(cls).kind == SymbolKind::kInterface);
        }
        if (dynamic) {
            pi.dynamic = true;
            pi.type = types_.mixed();
            if (recording_) out_.props[id] = pi;
            return pi.type;
        }

        const auto p = table_.lookup_member(cls, SymbolKind::kProperty, e.text);
        if (!p) {
            body_error_(diag::Code::kUnresolvedProperty, e.span, {table_.symbol(cls).name, e.text});
            return types_.mixed();
        }
        const Symbol& ps = table_.symbol(*p);
        check_access_(ps, e.span);
        pi.prop = *p;
        pi.slot = ps.prop_slot;
        pi.type = ps.type;
        if (recording_) out_.props[id] = pi;
        return ps.type;
    }

    ty::TypeId Resolver::index_(const ast::Expr& e) {
        const ty::TypeId bt = value_type_(expr_(e.a));
        if (e.b == ast::k_invalid_expr) {
            body_error_(diag::Code::kUnsupportedConstruct, e.span, {"[] in read context"});
            return types_.mixed();
        }
        const ty::TypeId kt = value_type_(expr_(e.b));
        if (is_never_(bt)) return bt;

        const bool key_ok = is_int_like_(types_, kt) || types_.is_builtin(kt, ty::Builtin::kString) ||
                            types_.is_mixed(kt) || types_.is_builtin(kt, ty::Builtin::kFloat) || is_never_(kt);
        if (types_.is_array(bt)) {
            if (!key_ok) body_error_(diag::Code::kOperandTypeMismatch, e.span, {"array key", tname_(kt), ""});
            // a missing key reads as null
            const ty::TypeId et = elem_type_(bt);
            return is_never_(et) ? et : types_.nullable(et);
        }
        if (types_.is_builtin(bt, ty::Builtin::kString)) {
            if (!is_int_like_(types_, kt) && !types_.is_mixed(kt) && !is_never_(kt)) {
                body_error_(diag::Code::kOperandTypeMismatch, e.span, {"string offset", tname_(kt), ""});
            }
            return types_.string();
        }
        if (is_mixed_like_(types_, bt)) return types_.mixed();
        body_error_(diag::Code::kOperandTypeMismatch, e.span, {"[]", tname_(bt), tname_(kt)});
        return types_.mixed();
    }

    ty::TypeId Resolver::match_(const ast::Expr& e) {
        expr_(e.a);
        ty::TypeId result = types_.never();
        for (uint32_t i = 0; i < e.arm_count; ++i) {
            const ast::MatchArm& arm = ast_.arm(e.arm_begin + i);
            for (uint32_t k = 0; k < arm.cond_count; ++k) expr_(ast_.expr_at(arm.cond_begin + k));
            result = types_.join(result, value_type_(expr_(arm.body)));
        }
        if (e.arm_count == 0 && recording_) return types_.mixed();
        return result;
    }

    // ---- name and access helpers ----

    SymbolId Resolver::class_ref_(std::string_view name, Span sp) {
        const std::string folded = sema::fold_name(name);
        const SymbolId cur = fn_ ? fn_->cls : kInvalidSymbol;
        if (folded == "self") {
            if (cur == kInvalidSymbol) {
                body_error_(diag::Code::kUnresolvedClass, sp, {"self"});
                return kInvalidSymbol;
            }
            return cur;
        }
        if (folded == "parent") {
            if (cur == kInvalidSymbol || table_.symbol(cur).parent == kInvalidSymbol) {
                body_error_(diag::Code::kNoParentClass, sp,
                            {cur == kInvalidSymbol ? std::string("<global>") : table_.symbol(cur).name});
                return kInvalidSymbol;
            }
            return table_.symbol(cur).parent;
        }
        if (folded == "static") {
            body_error_(diag::Code::kUnsupportedConstruct, sp, {"static::"});
            return kInvalidSymbol;
        }
        const auto c = table_.lookup_class(name);
        if (!c) {
            body_error_(diag::Code::kUnresolvedClass, sp, {name});
            return kInvalidSymbol;
        }
        return *c;
    }

    bool Resolver::accessible_(const Symbol& m) const {
        const SymbolId cur = fn_ ? fn_->cls : kInvalidSymbol;
        switch (m.vis) {
            case ast::Visibility::kPublic:
                return true;
            case ast::Visibility::kPrivate:
                return cur == m.owner;
            case ast::Visibility::kProtected:
                return cur != kInvalidSymbol &&
                       (table_.is_subclass_of(cur, m.owner) || table_.is_subclass_of(m.owner, cur));
        }
        return false;
    }

    void Resolver::check_access_(const Symbol& m, Span sp) {
        if (accessible_(m)) return;
        const std::string member = (m.kind == SymbolKind::kProperty) ? ("$" + m.name) : m.name;
        body_error_(diag::Code::kMemberNotAccessible, sp,
                    {visibility_name(m.vis), table_.symbol(m.owner).name, member});
    }

    std::string Resolver::member_display_(const Symbol& m) const {
        if (m.owner == kInvalidSymbol) return m.name;
        return table_.symbol(m.owner).name + "::" + m.name;
    }

    // ---- type helpers ----

    bool Resolver::assignable_(ty::TypeId from, ty::TypeId to) const {
        if (to == ty::kInvalidType || types_.is_error(from) || types_.is_error(to)) return true;
        if (from == to || is_never_(from)) return true;
        if (types_.is_mixed(to)) return true;
        if (types_.is_builtin(from, ty::Builtin::kVoid)) return false;
        if (types_.is_mixed(from)) return true;

        if (types_.is_nullable(to)) {
            if (types_.is_builtin(from, ty::Builtin::kNull)) return true;
            return assignable_(types_.non_null(from), types_.non_null(to));
        }
        if (types_.is_builtin(from, ty::Builtin::kNull)) return false;
        // ?T into T is checked at runtime when the box is unwrapped
        if (types_.is_nullable(from)) return assignable_(types_.non_null(from), to);

        if (types_.is_numeric(from) && types_.is_numeric(to)) return true;
        const bool from_scalar = types_.is_scalar(from) || types_.is_builtin(from, ty::Builtin::kString);
        const bool to_scalar = types_.is_scalar(to) || types_.is_builtin(to, ty::Builtin::kString);
        if (from_scalar && to_scalar) return !opt_.strict_scalars;

        if (types_.get(from).kind == ty::Kind::kObject && types_.get(to).kind == ty::Kind::kObject) {
            return class_subtype_(types_.class_of(from), types_.class_of(to));
        }
        if (types_.is_array(from) && types_.is_array(to)) return true;
        return false;
    }

    bool Resolver::subtype_(ty::TypeId a, ty::TypeId b) const {
        if (a == b || types_.is_error(a) || types_.is_error(b)) return true;
        if (types_.is_mixed(b) || is_never_(a)) return true;
        if (types_.is_builtin(a, ty::Builtin::kNull)) return types_.can_be_null(b);
        if (types_.is_nullable(b)) {
            return subtype_(types_.non_null(a), types_.non_null(b));
        }
        if (types_.is_nullable(a)) return false;

        const ty::Type& ta = types_.get(a);
        const ty::Type& tb = types_.get(b);
        if (ta.kind == ty::Kind::kObject && tb.kind == ty::Kind::kObject) {
            return class_subtype_(ta.class_name, tb.class_name);
        }
        if (ta.kind == ty::Kind::kArray && tb.kind == ty::Kind::kArray) {
            if (tb.shape != ty::ArrayShape::kAny && ta.shape != tb.shape) return false;
            return subtype_(ta.elem, tb.elem);
        }
        return false;
    }

    bool Resolver::class_subtype_(std::string_view a, std::string_view b) const {
        const auto ca = table_.lookup_class(a);
        const auto cb = table_.lookup_class(b);
        if (!ca || !cb) return sema::fold_name(a) == sema::fold_name(b);
        return table_.is_subclass_of(*ca, *cb);
    }

    bool Resolver::stringable_(ty::TypeId t) const {
        if (types_.is_nullable(t)) t = types_.non_null(t);
        return types_.is_scalar(t) ||
               types_.is_builtin(t, ty::Builtin::kString) ||
               types_.is_builtin(t, ty::Builtin::kNull) ||
               types_.is_mixed(t) ||
               is_never_(t);
    }

    ty::TypeId Resolver::value_type_(ty::TypeId t) const {
        if (t == ty::kInvalidType) return types_.mixed();
        if (types_.is_builtin(t, ty::Builtin::kVoid)) return types_.null();
        return t;
    }

    ty::TypeId Resolver::elem_type_(ty::TypeId t) const {
        const ty::TypeId e = types_.elem_of(t);
        if (recording_ && is_never_(e)) return types_.mixed();
        return e;
    }

    ty::TypeId Resolver::class_type_(SymbolId cls, bool exact) {
        return types_.object(table_.symbol(cls).name, exact);
    }

} // namespace php2ir::resolve::detail


namespace php2ir::resolve {

    ResolvedUnit resolve_unit(const ast::Unit& unit, const UnitInput& in, diag::Bag& bag,
                              const ResolveOptions& opt) {
        ResolvedUnit out{};
        detail::Resolver r(unit, in, bag, opt, out);
        r.run();
        return out;
    }

    std::string dump_exports(const ResolvedUnit& ru) {
        if (!ru.exports) return {};
        return sema::dump_export_table(*ru.exports);
    }

    bool is_throwable_class(const sema::SymbolTable& table, SymbolId cls) {
        const auto t = table.lookup_class("Throwable");
        return t && table.is_subclass_of(cls, *t);
    }

    uint32_t local_index(const FunctionInfo& fn, std::string_view name) {
        for (uint32_t i = 0; i < fn.locals.size(); ++i) {
            if (fn.locals[i].name == name) return i;
        }
        return UINT32_MAX;
    }

} // namespace php2ir::resolve
