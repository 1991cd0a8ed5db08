// frontend/src/cfg/normalize_expr.cpp
#include "normalizer.hpp"

#include <php2ir/resolve/Builtins.hpp>


namespace php2ir::cfg::detail {

    namespace {

        BinKind bin_kind_(ast::BinOp op) {
            switch (op) {
                case ast::BinOp::kAdd: return BinKind::kAdd;
                case ast::BinOp::kSub: return BinKind::kSub;
                case ast::BinOp::kMul: return BinKind::kMul;
                case ast::BinOp::kDiv: return BinKind::kDiv;
                case ast::BinOp::kMod: return BinKind::kRem;
                case ast::BinOp::kPow: return BinKind::kPow;
                case ast::BinOp::kEq: return BinKind::kEq;
                case ast::BinOp::kNe: return BinKind::kNe;
                case ast::BinOp::kIdentical: return BinKind::kIdentical;
                case ast::BinOp::kNotIdentical: return BinKind::kNotIdentical;
                case ast::BinOp::kLt: return BinKind::kLt;
                case ast::BinOp::kLe: return BinKind::kLe;
                case ast::BinOp::kGt: return BinKind::kGt;
                case ast::BinOp::kGe: return BinKind::kGe;
                case ast::BinOp::kSpaceship: return BinKind::kSpaceship;
                case ast::BinOp::kBitAnd: return BinKind::kBitAnd;
                case ast::BinOp::kBitOr: return BinKind::kBitOr;
                case ast::BinOp::kBitXor: return BinKind::kBitXor;
                case ast::BinOp::kShl: return BinKind::kShl;
                case ast::BinOp::kShr: return BinKind::kShr;
                default: return BinKind::kAdd;
            }
        }

        bool is_arith_(ast::BinOp op) {
            switch (op) {
                case ast::BinOp::kAdd: case ast::BinOp::kSub: case ast::BinOp::kMul:
                case ast::BinOp::kDiv: case ast::BinOp::kMod: case ast::BinOp::kPow:
                    return true;
                default:
                    return false;
            }
        }

        bool is_scalar_repr_(Repr r) {
            return r == Repr::kBool || r == Repr::kInt || r == Repr::kFloat;
        }

    } // namespace

    ty::TypeId Normalizer::type_of_(ast::ExprId e) const {
        if (e == ast::k_invalid_expr || e >= ru_.expr_types.size()) return types_.mixed();
        const ty::TypeId t = ru_.expr_types[e];
        return (t == ty::kInvalidType) ? types_.mixed() : t;
    }

    bool Normalizer::is_nonzero_literal_(ast::ExprId e) const {
        if (e == ast::k_invalid_expr) return false;
        const ast::Expr& x = ast_.expr(e);
        if (x.kind == ast::ExprKind::kIntLit) return x.int_value != 0;
        if (x.kind == ast::ExprKind::kFloatLit) return x.float_value != 0.0;
        return false;
    }

    /// @brief 식의 값을 정적 타입의 repr로 맞춰서 돌려준다. void 호출은 null box.
    VarId Normalizer::value_(ast::ExprId e) {
        const VarId v = expr_(e);
        const ty::TypeId t = type_of_(e);
        const Span sp = ast_.expr(e).span;
        if (repr_of(types_, t) == Repr::kVoid) return (v == kInvalidVar) ? const_null_(sp) : v;
        return coerce_(v, t, sp);
    }

    VarId Normalizer::cond_(ast::ExprId e) {
        return to_repr_(value_(e), Repr::kBool, ast_.expr(e).span);
    }

    VarId Normalizer::expr_(ast::ExprId id) {
        const ast::Expr& e = ast_.expr(id);
        const Span sp = e.span;

        switch (e.kind) {
            case ast::ExprKind::kIntLit:    return const_int_(e.int_value, sp);
            case ast::ExprKind::kFloatLit:  return const_float_(e.float_value, sp);
            case ast::ExprKind::kStringLit: return const_str_(e.text, sp);
            case ast::ExprKind::kBoolLit:   return const_bool_(e.bool_value, sp);
            case ast::ExprKind::kNullLit:   return const_null_(sp);
            case ast::ExprKind::kInterp:    return interp_(e);
            case ast::ExprKind::kArrayLit:  return array_lit_(id, e);

            case ast::ExprKind::kVar: {
                const uint32_t ix = resolve::local_index(*fi_, e.text);
                return (ix == UINT32_MAX) ? const_null_(sp) : ix;
            }
            case ast::ExprKind::kThis:
                return fi_->has_this ? 0 : const_null_(sp);

            case ast::ExprKind::kConstFetch: {
                auto it = ru_.consts.find(id);
                if (it == ru_.consts.end()) return const_null_(sp);
                return default_value_(it->second, type_of_(id), sp);
            }

            case ast::ExprKind::kBinary:
                if (e.op == ast::BinOp::kAnd || e.op == ast::BinOp::kOr) return logical_(e);
                return binary_(id, e);
            case ast::ExprKind::kUnary:      return unary_(id, e);
            case ast::ExprKind::kAssign:     return assign_(id, e);
            case ast::ExprKind::kIncDec:     return incdec_(id, e);
            case ast::ExprKind::kTernary:    return ternary_(id, e);
            case ast::ExprKind::kCoalesce:   return coalesce_(id, e);
            case ast::ExprKind::kCall:       return call_(id, e);
            case ast::ExprKind::kMethodCall: return method_call_(id, e);
            case ast::ExprKind::kStaticCall: return static_call_(id, e);
            case ast::ExprKind::kNew:        return new_(id, e);
            case ast::ExprKind::kPropFetch:  return prop_read_(id, e);
            case ast::ExprKind::kIndex:      return index_read_(e, false);
            case ast::ExprKind::kInstanceOf: return instanceof_(id, e);
            case ast::ExprKind::kCast:       return coerce_(value_(e.a), e.cast_type, sp);
            case ast::ExprKind::kMatch:      return match_(id, e);

            // rejected by the resolver
            case ast::ExprKind::kEval:
            case ast::ExprKind::kVarVar:
            case ast::ExprKind::kStaticPropFetch:
                return const_null_(sp);
        }
        return const_null_(sp);
    }

    // ---- operators ----

    VarId Normalizer::binary_(ast::ExprId id, const ast::Expr& e) {
        const VarId l = value_(e.a);
        const VarId r = value_(e.b);
        return apply_binop_(e.op, l, r, e.b, type_of_(id), e.span);
    }

    VarId Normalizer::apply_binop_(ast::BinOp op, VarId l, VarId r, ast::ExprId rhs,
                                   ty::TypeId result, Span sp) {
        if (is_arith_(op)) return arith_(bin_kind_(op), l, r, rhs, result, sp);

        switch (op) {
            case ast::BinOp::kConcat: {
                Op cat{};
                cat.kind = OpKind::kConcat;
                cat.a = to_repr_(l, Repr::kStr, sp);
                cat.b = to_repr_(r, Repr::kStr, sp);
                cat.dst = temp_(Repr::kStr, types_.string());
                cat.span = sp;
                const VarId dst = cat.dst;
                emit_(std::move(cat));
                return dst;
            }
            case ast::BinOp::kBitAnd:
            case ast::BinOp::kBitOr:
            case ast::BinOp::kBitXor:
            case ast::BinOp::kShl:
            case ast::BinOp::kShr:
                return binary_op_(bin_kind_(op), to_repr_(l, Repr::kInt, sp), to_repr_(r, Repr::kInt, sp),
                                  Repr::kInt, sp);
            case ast::BinOp::kXor:
                return binary_op_(BinKind::kNe, to_repr_(l, Repr::kBool, sp), to_repr_(r, Repr::kBool, sp),
                                  Repr::kBool, sp);
            case ast::BinOp::kIdentical:
                return strict_eq_(l, r, sp);
            case ast::BinOp::kNotIdentical: {
                Op n{};
                n.kind = OpKind::kUnary;
                n.un = UnKind::kNot;
                n.a = strict_eq_(l, r, sp);
                n.dst = temp_(Repr::kBool, types_.bool_());
                n.span = sp;
                const VarId dst = n.dst;
                emit_(std::move(n));
                return dst;
            }
            case ast::BinOp::kEq: case ast::BinOp::kNe:
            case ast::BinOp::kLt: case ast::BinOp::kLe:
            case ast::BinOp::kGt: case ast::BinOp::kGe:
            case ast::BinOp::kSpaceship:
                return compare_(bin_kind_(op), l, r, sp);
            default:
                return const_null_(sp);
        }
    }

    void Normalizer::check_divisor_(VarId divisor, ast::ExprId divisor_expr, bool modulo, Span sp) {
        if (is_nonzero_literal_(divisor_expr)) return;

        const Repr r = fn_->vars[divisor].repr;
        const VarId zero = (r == Repr::kFloat) ? const_float_(0.0, sp) : const_int_(0, sp);
        const VarId is_zero = binary_op_(BinKind::kEq, divisor, zero, Repr::kBool, sp);

        const BlockId bad = new_block_();
        const BlockId ok = new_block_();
        branch_(is_zero, bad, ok);
        set_block_(bad);
        raise_error_("DivisionByZeroError", modulo ? "Modulo by zero" : "Division by zero", kInvalidVar, sp);
        set_block_(ok);
    }

    VarId Normalizer::arith_(BinKind k, VarId l, VarId r, ast::ExprId divisor,
                             ty::TypeId result, Span sp) {
        Repr out = repr_of(types_, result);
        if (k == BinKind::kRem) out = Repr::kInt;
        if (out != Repr::kInt && out != Repr::kFloat) out = Repr::kBox;

        if (out == Repr::kBox) {
            // box arithmetic never sees a zero divisor: the test runs on the float view first
            if (k == BinKind::kDiv) check_divisor_(to_repr_(r, Repr::kFloat, sp), divisor, false, sp);
            return binary_op_(k, to_repr_(l, Repr::kBox, sp), to_repr_(r, Repr::kBox, sp), Repr::kBox, sp);
        }

        const VarId a = to_repr_(l, out, sp);
        const VarId b = to_repr_(r, out, sp);
        if (k == BinKind::kDiv || k == BinKind::kRem) check_divisor_(b, divisor, k == BinKind::kRem, sp);
        return binary_op_(k, a, b, out, sp);
    }

    VarId Normalizer::compare_(BinKind k, VarId l, VarId r, Span sp) {
        const Repr lr = fn_->vars[l].repr;
        const Repr rr = fn_->vars[r].repr;

        Repr opnd = Repr::kBox;
        if (lr == rr && (is_scalar_repr_(lr) || lr == Repr::kStr)) {
            opnd = lr;
        } else if (is_scalar_repr_(lr) && is_scalar_repr_(rr)) {
            opnd = (lr == Repr::kFloat || rr == Repr::kFloat) ? Repr::kFloat : Repr::kInt;
        }
        // ordering on bool goes through int
        if (opnd == Repr::kBool && k != BinKind::kEq && k != BinKind::kNe) opnd = Repr::kInt;

        const Repr out = (k == BinKind::kSpaceship) ? Repr::kInt : Repr::kBool;
        return binary_op_(k, to_repr_(l, opnd, sp), to_repr_(r, opnd, sp), out, sp);
    }

    VarId Normalizer::strict_eq_(VarId l, VarId r, Span sp) {
        const Repr lr = fn_->vars[l].repr;
        const Repr rr = fn_->vars[r].repr;
        if (lr == rr) return binary_op_(BinKind::kIdentical, l, r, Repr::kBool, sp);
        if (lr == Repr::kBox || rr == Repr::kBox) {
            return binary_op_(BinKind::kIdentical, to_repr_(l, Repr::kBox, sp), to_repr_(r, Repr::kBox, sp),
                              Repr::kBool, sp);
        }
        // int === float and friends: different tags never compare identical
        return const_bool_(false, sp);
    }

    VarId Normalizer::logical_(const ast::Expr& e) {
        const Span sp = e.span;
        const bool is_and = (e.op == ast::BinOp::kAnd);
        const VarId res = temp_(Repr::kBool, types_.bool_());

        const VarId l = cond_(e.a);
        const BlockId rhs = new_block_();
        const BlockId shortcut = new_block_();
        const BlockId join = new_block_();
        if (is_and) branch_(l, rhs, shortcut);
        else branch_(l, shortcut, rhs);

        set_block_(rhs);
        assign_var_(res, cond_(e.b), sp);
        jump_(join);

        set_block_(shortcut);
        assign_var_(res, const_bool_(!is_and, sp), sp);
        jump_(join);

        set_block_(join);
        return res;
    }

    VarId Normalizer::unary_(ast::ExprId id, const ast::Expr& e) {
        const Span sp = e.span;
        Op op{};
        op.kind = OpKind::kUnary;
        op.span = sp;

        switch (e.uop) {
            case ast::UnaryOp::kNot:
                op.un = UnKind::kNot;
                op.a = cond_(e.a);
                op.dst = temp_(Repr::kBool, types_.bool_());
                break;
            case ast::UnaryOp::kBitNot:
                op.un = UnKind::kBitNot;
                op.a = to_repr_(value_(e.a), Repr::kInt, sp);
                op.dst = temp_(Repr::kInt, types_.int_());
                break;
            case ast::UnaryOp::kPlus:
                return coerce_(value_(e.a), type_of_(id), sp);
            case ast::UnaryOp::kNeg: {
                Repr out = repr_of(types_, type_of_(id));
                if (out != Repr::kInt && out != Repr::kFloat) out = Repr::kBox;
                op.un = UnKind::kNeg;
                op.a = to_repr_(value_(e.a), out, sp);
                op.dst = temp_(out, type_of_(id));
                break;
            }
        }
        const VarId dst = op.dst;
        emit_(std::move(op));
        return dst;
    }

    // ---- assignment ----

    VarId Normalizer::assign_(ast::ExprId id, const ast::Expr& e) {
        if (e.op == ast::BinOp::kNone) {
            const VarId v = value_(e.b);
            return store_(e.a, v, e.span);
        }
        const VarId cur = value_(e.a);
        const VarId rhs = value_(e.b);
        ty::TypeId result = type_of_(id);
        if (e.op == ast::BinOp::kConcat) result = types_.string();
        const VarId nv = apply_binop_(e.op, cur, rhs, e.b, result, e.span);
        return store_(e.a, nv, e.span);
    }

    VarId Normalizer::incdec_(ast::ExprId id, const ast::Expr& e) {
        const Span sp = e.span;
        const ty::TypeId t = type_of_(id);
        const bool inc = (e.incdec == ast::IncDec::kPreInc || e.incdec == ast::IncDec::kPostInc);
        const bool post = (e.incdec == ast::IncDec::kPostInc || e.incdec == ast::IncDec::kPostDec);

        // old value is pinned in a temp before the store redefines the variable
        const VarId cur = value_(e.a);
        const VarId old = temp_(fn_->vars[cur].repr, fn_->vars[cur].type);
        assign_var_(old, cur, sp);

        const VarId nv = arith_(inc ? BinKind::kAdd : BinKind::kSub, old, const_int_(1, sp),
                                ast::k_invalid_expr, t, sp);
        const VarId stored = store_(e.a, nv, sp);
        return post ? old : stored;
    }

    VarId Normalizer::store_(ast::ExprId target, VarId value, Span sp) {
        const ast::Expr& t = ast_.expr(target);

        switch (t.kind) {
            case ast::ExprKind::kVar: {
                const uint32_t ix = resolve::local_index(*fi_, t.text);
                if (ix == UINT32_MAX) return value;
                assign_var_(ix, coerce_(value, fn_->vars[ix].type, sp), sp);
                return ix;
            }

            case ast::ExprKind::kIndex: {
                // a[k] = v rebuilds the array value and stores it back into a
                const VarId arr = as_array_(value_(t.a), sp);
                const VarId boxed = to_repr_(value, Repr::kBox, sp);
                Op op{};
                op.dst = temp_(Repr::kArr, type_of_(t.a));
                op.a = arr;
                op.c = boxed;
                op.span = sp;
                if (t.b == ast::k_invalid_expr) {
                    op.kind = OpKind::kArrayPush;
                } else {
                    op.kind = OpKind::kArraySet;
                    op.b = array_key_(t.b);
                }
                const VarId next = op.dst;
                emit_(std::move(op));
                (void)store_(t.a, next, sp);
                return value;
            }

            case ast::ExprKind::kPropFetch: {
                auto it = ru_.props.find(target);
                if (it == ru_.props.end()) return value;
                const resolve::PropInfo& pi = it->second;
                Op op{};
                op.span = sp;
                if (pi.dynamic) {
                    op.kind = OpKind::kSetPropDyn;
                    op.a = to_repr_(value_(t.a), Repr::kBox, sp);
                    op.c = to_repr_(value, Repr::kBox, sp);
                    op.name = t.text;
                    emit_(std::move(op));
                    return value;
                }
                op.kind = OpKind::kSetProp;
                op.a = to_repr_(value_(t.a), Repr::kObj, sp);
                op.b = coerce_(value, pi.type, sp);
                op.imm = pi.slot;
                op.sym = pi.prop;
                const VarId stored = op.b;
                emit_(std::move(op));
                return stored;
            }

            default:
                return value;
        }
    }

    // ---- conditional values ----

    VarId Normalizer::ternary_(ast::ExprId id, const ast::Expr& e) {
        const Span sp = e.span;
        const ty::TypeId t = type_of_(id);
        const VarId res = temp_(repr_of(types_, t), t);

        const BlockId tb = new_block_();
        const BlockId fb = new_block_();
        const BlockId join = new_block_();

        if (e.b != ast::k_invalid_expr) {
            branch_(cond_(e.a), tb, fb);
            set_block_(tb);
            assign_var_(res, coerce_(value_(e.b), t, sp), sp);
            jump_(join);
        } else {
            // a ?: c evaluates a once
            const VarId v = value_(e.a);
            branch_(to_repr_(v, Repr::kBool, sp), tb, fb);
            set_block_(tb);
            assign_var_(res, coerce_(v, t, sp), sp);
            jump_(join);
        }

        set_block_(fb);
        assign_var_(res, coerce_(value_(e.c), t, sp), sp);
        jump_(join);

        set_block_(join);
        return res;
    }

    VarId Normalizer::coalesce_(ast::ExprId id, const ast::Expr& e) {
        const Span sp = e.span;
        const ty::TypeId t = type_of_(id);

        const ast::Expr& lhs = ast_.expr(e.a);
        const VarId raw = (lhs.kind == ast::ExprKind::kIndex && lhs.b != ast::k_invalid_expr)
                              ? index_read_(lhs, true)
                              : value_(e.a);
        if (fn_->vars[raw].repr != Repr::kBox) return coerce_(raw, t, sp);

        const VarId res = temp_(repr_of(types_, t), t);
        Op isn{};
        isn.kind = OpKind::kIsNull;
        isn.a = raw;
        isn.dst = temp_(Repr::kBool, types_.bool_());
        isn.span = sp;
        const VarId is_null = isn.dst;
        emit_(std::move(isn));

        const BlockId have = new_block_();
        const BlockId fallback = new_block_();
        const BlockId join = new_block_();
        branch_(is_null, fallback, have);

        set_block_(have);
        assign_var_(res, coerce_(raw, t, sp), sp);
        jump_(join);

        set_block_(fallback);
        assign_var_(res, coerce_(value_(e.b), t, sp), sp);
        jump_(join);

        set_block_(join);
        return res;
    }

    VarId Normalizer::interp_(const ast::Expr& e) {
        const Span sp = e.span;
        VarId acc = kInvalidVar;
        for (uint32_t i = 0; i < e.list_count; ++i) {
            const VarId part = to_repr_(value_(ast_.expr_at(e.list_begin + i)), Repr::kStr, sp);
            if (acc == kInvalidVar) {
                acc = part;
                continue;
            }
            Op cat{};
            cat.kind = OpKind::kConcat;
            cat.a = acc;
            cat.b = part;
            cat.dst = temp_(Repr::kStr, types_.string());
            cat.span = sp;
            acc = cat.dst;
            emit_(std::move(cat));
        }
        return (acc == kInvalidVar) ? const_str_("", sp) : acc;
    }

    // ---- arrays ----

    VarId Normalizer::array_lit_(ast::ExprId id, const ast::Expr& e) {
        const Span sp = e.span;
        const ty::TypeId t = type_of_(id);

        Op nw{};
        nw.kind = OpKind::kArrayNew;
        nw.dst = temp_(Repr::kArr, t);
        nw.span = sp;
        VarId arr = nw.dst;
        emit_(std::move(nw));

        for (uint32_t i = 0; i < e.list_count; ++i) {
            const ast::ExprId key = (i < e.key_count) ? ast_.expr_at(e.key_begin + i) : ast::k_invalid_expr;
            Op op{};
            op.span = sp;
            op.a = arr;
            if (key != ast::k_invalid_expr) {
                op.kind = OpKind::kArraySet;
                op.b = array_key_(key);
            } else {
                op.kind = OpKind::kArrayPush;
            }
            op.c = to_repr_(value_(ast_.expr_at(e.list_begin + i)), Repr::kBox, sp);
            op.dst = temp_(Repr::kArr, t);
            arr = op.dst;
            emit_(std::move(op));
        }
        return arr;
    }

    /// @brief 키 정규화: bool / float -> int. int, string, box(null 포함)는 그대로.
    VarId Normalizer::array_key_(ast::ExprId key) {
        const VarId v = value_(key);
        const Repr r = fn_->vars[v].repr;
        if (r == Repr::kBool || r == Repr::kFloat) return to_repr_(v, Repr::kInt, ast_.expr(key).span);
        if (r == Repr::kArr || r == Repr::kObj) return to_repr_(v, Repr::kBox, ast_.expr(key).span);
        return v;
    }

    VarId Normalizer::as_array_(VarId v, Span sp) {
        if (fn_->vars[v].repr == Repr::kArr) return v;
        return to_repr_(to_repr_(v, Repr::kBox, sp), Repr::kArr, sp);
    }

    VarId Normalizer::index_read_(const ast::Expr& e, bool raw) {
        const Span sp = e.span;
        const VarId base = value_(e.a);

        if (fn_->vars[base].repr == Repr::kStr) {
            Op at{};
            at.kind = OpKind::kStrAt;
            at.a = base;
            at.b = to_repr_(value_(e.b), Repr::kInt, sp);
            at.dst = temp_(Repr::kStr, types_.string());
            at.span = sp;
            const VarId dst = at.dst;
            emit_(std::move(at));
            return raw ? to_repr_(dst, Repr::kBox, sp) : dst;
        }

        const VarId arr = as_array_(base, sp);
        Op get{};
        get.kind = OpKind::kArrayGet;
        get.a = arr;
        get.b = (e.b == ast::k_invalid_expr) ? const_null_(sp) : array_key_(e.b);
        get.dst = temp_(Repr::kBox, types_.mixed());
        get.span = sp;
        const VarId dst = get.dst;
        emit_(std::move(get));
        return dst;
    }

    VarId Normalizer::prop_read_(ast::ExprId id, const ast::Expr& e) {
        const Span sp = e.span;
        auto it = ru_.props.find(id);
        if (it == ru_.props.end()) return const_null_(sp);
        const resolve::PropInfo& pi = it->second;

        Op op{};
        op.span = sp;
        if (pi.dynamic) {
            op.kind = OpKind::kGetPropDyn;
            op.a = to_repr_(value_(e.a), Repr::kBox, sp);
            op.name = e.text;
            op.dst = temp_(Repr::kBox, types_.mixed());
        } else {
            op.kind = OpKind::kGetProp;
            op.a = to_repr_(value_(e.a), Repr::kObj, sp);
            op.imm = pi.slot;
            op.sym = pi.prop;
            op.dst = temp_(repr_of(types_, pi.type), pi.type);
        }
        const VarId dst = op.dst;
        emit_(std::move(op));
        return dst;
    }

    // ---- calls ----

    std::vector<VarId> Normalizer::call_args_(const sema::Symbol& callee, const ast::Expr& e) {
        std::vector<VarId> out;
        out.reserve(callee.params.size());
        for (size_t i = 0; i < callee.params.size(); ++i) {
            const sema::ParamSig& p = callee.params[i];
            if (i < e.list_count) {
                const ast::ExprId a = ast_.expr_at(e.list_begin + static_cast<uint32_t>(i));
                out.push_back(coerce_(value_(a), p.type, ast_.expr(a).span));
            } else {
                out.push_back(default_value_(p.def, p.type, e.span));
            }
        }
        return out;
    }

    VarId Normalizer::emit_call_(Op op, const sema::Symbol& callee, Span sp) {
        op.span = sp;
        const Repr r = repr_of(types_, callee.type);
        if (r != Repr::kVoid) op.dst = temp_(r, callee.type);
        const VarId dst = op.dst;
        emit_(std::move(op));
        return dst;
    }

    VarId Normalizer::call_(ast::ExprId id, const ast::Expr& e) {
        auto it = ru_.calls.find(id);
        if (it == ru_.calls.end()) return const_null_(e.span);
        const resolve::CallInfo& ci = it->second;
        if (ci.kind == resolve::CallKind::kBuiltin) return builtin_(id, e, ci);
        if (ci.callee == resolve::kInvalidSymbol) return const_null_(e.span);

        const sema::Symbol& callee = sym_(ci.callee);
        Op op{};
        op.kind = (ci.kind == resolve::CallKind::kForeign) ? OpKind::kCallForeign : OpKind::kCall;
        op.sym = ci.callee;
        op.args = call_args_(callee, e);
        return emit_call_(std::move(op), callee, e.span);
    }

    VarId Normalizer::builtin_(ast::ExprId id, const ast::Expr& e, const resolve::CallInfo& ci) {
        const Span sp = e.span;
        const ty::TypeId t = type_of_(id);
        auto arg = [&](uint32_t i) { return ast_.expr_at(e.list_begin + i); };
        auto call = [&](std::vector<VarId> args, Repr out, ty::TypeId out_t) {
            Op op{};
            op.kind = OpKind::kCallBuiltin;
            op.builtin = ci.builtin;
            op.args = std::move(args);
            op.dst = temp_(out, out_t);
            op.span = sp;
            const VarId dst = op.dst;
            emit_(std::move(op));
            return dst;
        };

        switch (ci.builtin) {
            case resolve::BuiltinFn::kCount: {
                Op op{};
                op.kind = OpKind::kArrayCount;
                op.a = as_array_(value_(arg(0)), sp);
                op.dst = temp_(Repr::kInt, types_.int_());
                op.span = sp;
                const VarId dst = op.dst;
                emit_(std::move(op));
                return dst;
            }
            case resolve::BuiltinFn::kStrlen:
                return call({to_repr_(value_(arg(0)), Repr::kStr, sp)}, Repr::kInt, types_.int_());
            case resolve::BuiltinFn::kImplode: {
                const VarId sep = to_repr_(value_(arg(0)), Repr::kStr, sp);
                const VarId arr = as_array_(value_(arg(1)), sp);
                return call({sep, arr}, Repr::kStr, types_.string());
            }
            case resolve::BuiltinFn::kAbs: {
                const Repr r = (repr_of(types_, t) == Repr::kInt) ? Repr::kInt : Repr::kFloat;
                return call({to_repr_(value_(arg(0)), r, sp)}, r, t);
            }
            case resolve::BuiltinFn::kSqrt:
            case resolve::BuiltinFn::kSin:
            case resolve::BuiltinFn::kCos:
            case resolve::BuiltinFn::kFloor:
                return call({to_repr_(value_(arg(0)), Repr::kFloat, sp)}, Repr::kFloat, types_.float_());
            case resolve::BuiltinFn::kIntdiv: {
                const VarId a = to_repr_(value_(arg(0)), Repr::kInt, sp);
                const VarId b = to_repr_(value_(arg(1)), Repr::kInt, sp);
                check_divisor_(b, arg(1), false, sp);
                return binary_op_(BinKind::kDiv, a, b, Repr::kInt, sp);
            }
            case resolve::BuiltinFn::kStrRepeat: {
                const VarId s = to_repr_(value_(arg(0)), Repr::kStr, sp);
                const VarId n = to_repr_(value_(arg(1)), Repr::kInt, sp);
                return call({s, n}, Repr::kStr, types_.string());
            }
            case resolve::BuiltinFn::kStrtoupper:
                return call({to_repr_(value_(arg(0)), Repr::kStr, sp)}, Repr::kStr, types_.string());
            case resolve::BuiltinFn::kIsNull: {
                const VarId v = value_(arg(0));
                if (fn_->vars[v].repr != Repr::kBox) return const_bool_(false, sp);
                Op op{};
                op.kind = OpKind::kIsNull;
                op.a = v;
                op.dst = temp_(Repr::kBool, types_.bool_());
                op.span = sp;
                const VarId dst = op.dst;
                emit_(std::move(op));
                return dst;
            }
            case resolve::BuiltinFn::kNone:
                break;
        }
        return const_null_(sp);
    }

    VarId Normalizer::method_call_(ast::ExprId id, const ast::Expr& e) {
        const Span sp = e.span;
        auto it = ru_.calls.find(id);
        if (it == ru_.calls.end()) return const_null_(sp);
        const resolve::CallInfo& ci = it->second;

        if (ci.kind == resolve::CallKind::kDynamic || ci.callee == resolve::kInvalidSymbol) {
            const VarId recv = to_repr_(value_(e.a), Repr::kBox, sp);
            return dynamic_call_(recv, e, type_of_(id));
        }

        const sema::Symbol& callee = sym_(ci.callee);
        Op op{};
        op.sym = ci.callee;
        op.args.push_back(to_repr_(value_(e.a), Repr::kObj, sp));
        for (VarId a : call_args_(callee, e)) op.args.push_back(a);
        if (ci.kind == resolve::CallKind::kVirtual) {
            op.kind = OpKind::kCallVirtual;
            op.imm = ci.vslot;
        } else {
            op.kind = OpKind::kCall;
        }
        return emit_call_(std::move(op), callee, sp);
    }

    VarId Normalizer::dynamic_call_(VarId recv, const ast::Expr& e, ty::TypeId result) {
        const Span sp = e.span;
        Op op{};
        op.kind = OpKind::kCallDyn;
        op.a = recv;
        op.name = e.text;
        for (uint32_t i = 0; i < e.list_count; ++i) {
            op.args.push_back(to_repr_(value_(ast_.expr_at(e.list_begin + i)), Repr::kBox, sp));
        }
        op.dst = temp_(Repr::kBox, types_.mixed());
        op.span = sp;
        const VarId dst = op.dst;
        emit_(std::move(op));
        return coerce_(dst, result, sp);
    }

    VarId Normalizer::static_call_(ast::ExprId id, const ast::Expr& e) {
        const Span sp = e.span;
        auto it = ru_.calls.find(id);
        if (it == ru_.calls.end() || it->second.callee == resolve::kInvalidSymbol) return const_null_(sp);
        const resolve::CallInfo& ci = it->second;
        const sema::Symbol& callee = sym_(ci.callee);

        Op op{};
        op.kind = OpKind::kCall;
        op.sym = ci.callee;
        if (ci.implicit_this) op.args.push_back(0);
        for (VarId a : call_args_(callee, e)) op.args.push_back(a);
        return emit_call_(std::move(op), callee, sp);
    }

    VarId Normalizer::new_(ast::ExprId id, const ast::Expr& e) {
        const Span sp = e.span;
        auto it = ru_.calls.find(id);
        if (it == ru_.calls.end() || it->second.cls == resolve::kInvalidSymbol) return const_null_(sp);
        const resolve::CallInfo& ci = it->second;

        Op nw{};
        nw.kind = OpKind::kNew;
        nw.sym = ci.cls;
        nw.dst = temp_(Repr::kObj, type_of_(id));
        nw.span = sp;
        const VarId obj = nw.dst;
        emit_(std::move(nw));

        if (ci.callee != resolve::kInvalidSymbol) {
            const sema::Symbol& ctor = sym_(ci.callee);
            Op call{};
            call.kind = OpKind::kCall;
            call.sym = ci.callee;
            call.args.push_back(obj);
            for (VarId a : call_args_(ctor, e)) call.args.push_back(a);
            (void)emit_call_(std::move(call), ctor, sp);
        }
        return obj;
    }

    VarId Normalizer::instanceof_(ast::ExprId id, const ast::Expr& e) {
        const Span sp = e.span;
        const VarId v = value_(e.a);
        auto it = ru_.class_refs.find(id);
        const Repr r = fn_->vars[v].repr;
        if (it == ru_.class_refs.end() || (r != Repr::kObj && r != Repr::kBox)) return const_bool_(false, sp);

        Op op{};
        op.kind = OpKind::kInstanceOf;
        op.a = v;
        op.sym = it->second;
        op.dst = temp_(Repr::kBool, types_.bool_());
        op.span = sp;
        const VarId dst = op.dst;
        emit_(std::move(op));
        return dst;
    }

    // ---- match ----

    VarId Normalizer::match_(ast::ExprId id, const ast::Expr& e) {
        const Span sp = e.span;
        const ty::TypeId t = type_of_(id);

        const VarId v = value_(e.a);
        const VarId subject = temp_(fn_->vars[v].repr, fn_->vars[v].type);
        assign_var_(subject, v, sp);
        const VarId res = temp_(repr_of(types_, t), t);

        // a bool subject whose arms name both true and false needs no fallback
        uint32_t default_arm = UINT32_MAX;
        bool saw_true = false;
        bool saw_false = false;
        uint32_t last_cond_arm = UINT32_MAX;
        for (uint32_t i = 0; i < e.arm_count; ++i) {
            const ast::MatchArm& arm = ast_.arm(e.arm_begin + i);
            if (arm.is_default || arm.cond_count == 0) {
                default_arm = i;
                continue;
            }
            last_cond_arm = i;
            for (uint32_t k = 0; k < arm.cond_count; ++k) {
                const ast::Expr& c = ast_.expr(ast_.expr_at(arm.cond_begin + k));
                if (c.kind != ast::ExprKind::kBoolLit) continue;
                if (c.bool_value) saw_true = true;
                else saw_false = true;
            }
        }
        const bool exhaustive = default_arm == UINT32_MAX && fn_->vars[subject].repr == Repr::kBool &&
                                saw_true && saw_false;

        const BlockId join = new_block_();
        std::vector<BlockId> bodies(e.arm_count, kInvalidBlock);
        for (uint32_t i = 0; i < e.arm_count; ++i) bodies[i] = new_block_();

        // conditions are evaluated lazily, in arm order, with ===
        for (uint32_t i = 0; i < e.arm_count; ++i) {
            if (i == default_arm) continue;
            const ast::MatchArm& arm = ast_.arm(e.arm_begin + i);
            for (uint32_t k = 0; k < arm.cond_count; ++k) {
                if (exhaustive && i == last_cond_arm && k + 1 == arm.cond_count) {
                    jump_(bodies[i]);
                    break;
                }
                const VarId cv = value_(ast_.expr_at(arm.cond_begin + k));
                const VarId hit = strict_eq_(subject, cv, arm.span);
                const BlockId next = new_block_();
                branch_(hit, bodies[i], next);
                set_block_(next);
            }
        }

        if (cur_ != kInvalidBlock) {
            if (default_arm != UINT32_MAX) {
                jump_(bodies[default_arm]);
            } else {
                const Repr r = fn_->vars[subject].repr;
                VarId detail = kInvalidVar;
                std::string msg = "Unhandled match case ";
                if (r == Repr::kStr) {
                    Op q1{};
                    q1.kind = OpKind::kConcat;
                    q1.a = const_str_("'", sp);
                    q1.b = subject;
                    q1.dst = temp_(Repr::kStr, types_.string());
                    q1.span = sp;
                    const VarId quoted = q1.dst;
                    emit_(std::move(q1));
                    Op q2{};
                    q2.kind = OpKind::kConcat;
                    q2.a = quoted;
                    q2.b = const_str_("'", sp);
                    q2.dst = temp_(Repr::kStr, types_.string());
                    q2.span = sp;
                    detail = q2.dst;
                    emit_(std::move(q2));
                } else if (r == Repr::kArr) {
                    msg += "of type array";
                } else if (r == Repr::kObj) {
                    msg += "of type " + types_.to_string(fn_->vars[subject].type);
                } else {
                    detail = subject;
                }
                raise_error_("UnhandledMatchError", msg, detail, sp);
            }
        }

        for (uint32_t i = 0; i < e.arm_count; ++i) {
            const ast::MatchArm& arm = ast_.arm(e.arm_begin + i);
            set_block_(bodies[i]);
            assign_var_(res, coerce_(value_(arm.body), t, arm.span), arm.span);
            jump_(join);
        }

        set_block_(join);
        return res;
    }

} // namespace php2ir::cfg::detail
