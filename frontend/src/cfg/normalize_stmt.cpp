// frontend/src/cfg/normalize_stmt.cpp
#include "normalizer.hpp"

#include <algorithm>


namespace php2ir::cfg::detail {

    Normalizer::Normalizer(const ast::AstArena& ast, const resolve::ResolvedUnit& ru,
                           const ty::TypePool& types, diag::Bag& bag, NormalizeStats& stats)
        : ast_(ast), ru_(ru), types_(types), bag_(bag), stats_(stats) {}

    Function Normalizer::run(const resolve::FunctionInfo& fi) {
        Function f{};
        f.name = fi.name;
        f.sym = fi.sym;
        f.cls = fi.cls;
        f.is_main = fi.is_main;
        f.ret = fi.ret;
        f.ret_repr = repr_of(types_, fi.ret);
        f.span = fi.span;

        for (const auto& l : fi.locals) {
            Var v{};
            v.name = "$" + l.name;
            v.type = l.type;
            v.repr = repr_of(types_, l.type);
            v.is_param = l.is_param;
            f.vars.push_back(std::move(v));
        }
        f.param_count = fi.param_count;
        f.local_count = static_cast<uint32_t>(fi.locals.size());

        fi_ = &fi;
        fn_ = &f;
        breakables_.clear();
        tries_.clear();

        f.entry = new_block_();
        f.unwind_exit = new_block_();
        f.blocks[f.unwind_exit].term.kind = TermKind::kUnwindExit;
        f.blocks[f.unwind_exit].term.span = fi.span;
        handler_ = f.unwind_exit;
        cur_ = f.entry;

        for (uint32_t i = 0; i < f.param_count; ++i) {
            Op op{};
            op.kind = OpKind::kParam;
            op.dst = i;
            op.imm = i;
            op.span = fi.span;
            emit_(std::move(op));
        }

        if (fi.is_main) {
            for (ast::StmtId s : fi.top) stmt_(s);
        } else {
            stmt_(fi.body);
        }
        if (cur_ != kInvalidBlock) fall_off_end_();

        stats_.pruned_blocks += prune_unreachable(f);
        stats_.split_edges += split_critical_edges(f);
        stats_.blocks += static_cast<uint32_t>(f.blocks.size());
        stats_.functions += 1;

        fi_ = nullptr;
        fn_ = nullptr;
        return f;
    }

    // ---- block plumbing ----

    BlockId Normalizer::new_block_() {
        fn_->blocks.emplace_back();
        return static_cast<BlockId>(fn_->blocks.size() - 1);
    }

    void Normalizer::emit_(Op op) {
        // statements after return / break / throw land in a fresh block that pruning removes
        if (cur_ == kInvalidBlock) cur_ = new_block_();
        const bool throws = may_throw(*fn_, op);
        const Span sp = op.span;
        fn_->blocks[cur_].ops.push_back(std::move(op));
        if (!throws) return;

        const BlockId next = new_block_();
        Term t{};
        t.kind = TermKind::kExcCheck;
        t.target = next;
        t.alt = handler_;
        t.span = sp;
        fn_->blocks[cur_].term = t;
        stats_.exc_checks += 1;
        cur_ = next;
    }

    void Normalizer::terminate_(Term t) {
        if (cur_ == kInvalidBlock) cur_ = new_block_();
        fn_->blocks[cur_].term = t;
        cur_ = kInvalidBlock;
    }

    void Normalizer::jump_(BlockId target) {
        Term t{};
        t.kind = TermKind::kJump;
        t.target = target;
        terminate_(t);
    }

    void Normalizer::branch_(VarId cond, BlockId then_b, BlockId else_b) {
        Term t{};
        t.kind = TermKind::kBranch;
        t.value = cond;
        t.target = then_b;
        t.alt = else_b;
        terminate_(t);
    }

    void Normalizer::raise_(VarId exc, Span sp) {
        Term t{};
        t.kind = TermKind::kRaise;
        t.value = exc;
        t.target = handler_;
        t.span = sp;
        terminate_(t);
    }

    VarId Normalizer::temp_(Repr r, ty::TypeId t) {
        Var v{};
        v.name = "%t" + std::to_string(fn_->vars.size() - fn_->local_count);
        v.type = t;
        v.repr = r;
        v.is_temp = true;
        fn_->vars.push_back(std::move(v));
        return static_cast<VarId>(fn_->vars.size() - 1);
    }

    // ---- small op helpers ----

    VarId Normalizer::const_(const Literal& lit, Repr r, Span sp) {
        Op op{};
        op.kind = OpKind::kConst;
        op.dst = temp_(r);
        op.lit = lit;
        op.span = sp;
        const VarId dst = op.dst;
        emit_(std::move(op));
        return dst;
    }

    VarId Normalizer::const_int_(int64_t v, Span sp) {
        Literal l{};
        l.kind = Literal::Kind::kInt;
        l.i = v;
        return const_(l, Repr::kInt, sp);
    }

    VarId Normalizer::const_float_(double v, Span sp) {
        Literal l{};
        l.kind = Literal::Kind::kFloat;
        l.f = v;
        return const_(l, Repr::kFloat, sp);
    }

    VarId Normalizer::const_bool_(bool v, Span sp) {
        Literal l{};
        l.kind = Literal::Kind::kBool;
        l.b = v;
        return const_(l, Repr::kBool, sp);
    }

    VarId Normalizer::const_str_(std::string_view v, Span sp) {
        Literal l{};
        l.kind = Literal::Kind::kStr;
        l.s = std::string(v);
        return const_(l, Repr::kStr, sp);
    }

    VarId Normalizer::const_null_(Span sp) {
        return const_(Literal{}, Repr::kBox, sp);
    }

    VarId Normalizer::default_value_(const sema::DefaultValue& d, ty::TypeId to, Span sp) {
        using K = sema::DefaultValue::Kind;
        VarId v = kInvalidVar;
        switch (d.kind) {
            case K::kNone:
            case K::kNull:   v = const_null_(sp); break;
            case K::kInt:    v = const_int_(d.i, sp); break;
            case K::kFloat:  v = const_float_(d.f, sp); break;
            case K::kBool:   v = const_bool_(d.b, sp); break;
            case K::kString: v = const_str_(d.s, sp); break;
            case K::kEmptyArray: {
                Op op{};
                op.kind = OpKind::kArrayNew;
                op.dst = temp_(Repr::kArr);
                op.span = sp;
                v = op.dst;
                emit_(std::move(op));
                break;
            }
        }
        return coerce_(v, to, sp);
    }

    VarId Normalizer::cast_(VarId v, Repr to, ty::TypeId to_type, Span sp) {
        Op op{};
        op.kind = OpKind::kCast;
        op.dst = temp_(to, to_type);
        op.a = v;
        op.span = sp;
        const VarId dst = op.dst;
        emit_(std::move(op));
        return dst;
    }

    VarId Normalizer::to_repr_(VarId v, Repr to, Span sp) {
        if (v == kInvalidVar) v = const_null_(sp);
        if (fn_->vars[v].repr == to || to == Repr::kVoid) return v;
        return cast_(v, to, ty::kInvalidType, sp);
    }

    VarId Normalizer::coerce_(VarId v, ty::TypeId to, Span sp) {
        const Repr r = repr_of(types_, to);
        if (v == kInvalidVar) v = const_null_(sp);
        if (r == Repr::kVoid || fn_->vars[v].repr == r) return v;
        return cast_(v, r, to, sp);
    }

    void Normalizer::assign_var_(VarId dst, VarId src, Span sp) {
        if (src == kInvalidVar) src = const_null_(sp);
        if (src == dst) return;
        if (fn_->vars[src].repr != fn_->vars[dst].repr) {
            // a throwing cast defines a temp; the variable is written on the normal edge only
            Op conv{};
            conv.kind = OpKind::kCast;
            conv.dst = dst;
            conv.a = src;
            if (may_throw(*fn_, conv)) src = cast_(src, fn_->vars[dst].repr, fn_->vars[dst].type, sp);
        }
        Op op{};
        op.kind = (fn_->vars[src].repr == fn_->vars[dst].repr) ? OpKind::kCopy : OpKind::kCast;
        op.dst = dst;
        op.a = src;
        op.span = sp;
        emit_(std::move(op));
    }

    VarId Normalizer::binary_op_(BinKind k, VarId a, VarId b, Repr out, Span sp) {
        Op op{};
        op.kind = OpKind::kBinary;
        op.bin = k;
        op.dst = temp_(out);
        op.a = a;
        op.b = b;
        op.span = sp;
        const VarId dst = op.dst;
        emit_(std::move(op));
        return dst;
    }

    void Normalizer::raise_error_(std::string_view cls_name, const std::string& msg, VarId detail, Span sp) {
        const auto cls = ru_.table.lookup_class(cls_name);
        if (!cls) {
            diag::Diagnostic d(diag::Severity::kFatal, diag::Code::kInternalFailure, sp);
            d.add_arg("normalize");
            d.add_arg(std::string(cls_name) + " is not visible in unit " + ru_.unit_name);
            bag_.add(std::move(d));
            jump_(fn_->unwind_exit);
            return;
        }

        Op nw{};
        nw.kind = OpKind::kNew;
        nw.dst = temp_(Repr::kObj);
        nw.sym = *cls;
        nw.span = sp;
        const VarId obj = nw.dst;
        emit_(std::move(nw));

        VarId text = const_str_(msg, sp);
        if (detail != kInvalidVar) {
            Op cat{};
            cat.kind = OpKind::kConcat;
            cat.dst = temp_(Repr::kStr);
            cat.a = text;
            cat.b = to_repr_(detail, Repr::kStr, sp);
            cat.span = sp;
            text = cat.dst;
            emit_(std::move(cat));
        }

        const sema::ClassLayout* lay = ru_.table.layout(*cls);
        if (lay != nullptr && lay->ctor != resolve::kInvalidSymbol) {
            const sema::Symbol& ctor = sym_(lay->ctor);
            Op call{};
            call.kind = OpKind::kCall;
            call.sym = lay->ctor;
            call.span = sp;
            call.args.push_back(obj);
            for (size_t i = 0; i < ctor.params.size(); ++i) {
                if (i == 0) call.args.push_back(coerce_(text, ctor.params[i].type, sp));
                else call.args.push_back(default_value_(ctor.params[i].def, ctor.params[i].type, sp));
            }
            emit_(std::move(call));
        }
        stats_.runtime_checks += 1;
        raise_(obj, sp);
    }

    // ---- statements ----

    void Normalizer::stmts_(uint32_t begin, uint32_t count) {
        for (uint32_t i = 0; i < count; ++i) stmt_(ast_.stmt_at(begin + i));
    }

    void Normalizer::stmt_(ast::StmtId sid) {
        if (sid == ast::k_invalid_stmt) return;
        const ast::Stmt& s = ast_.stmt(sid);

        switch (s.kind) {
            case ast::StmtKind::kExpr:
                (void)expr_(s.a);
                break;
            case ast::StmtKind::kEcho:
                for (uint32_t i = 0; i < s.list_count; ++i) {
                    const ast::ExprId x = ast_.expr_at(s.list_begin + i);
                    Op op{};
                    op.kind = OpKind::kEcho;
                    op.a = to_repr_(value_(x), Repr::kStr, ast_.expr(x).span);
                    op.span = s.span;
                    emit_(std::move(op));
                }
                break;
            case ast::StmtKind::kBlock:
                stmts_(s.list_begin, s.list_count);
                break;
            case ast::StmtKind::kIf:       if_(s); break;
            case ast::StmtKind::kWhile:    while_(s); break;
            case ast::StmtKind::kDoWhile:  do_while_(s); break;
            case ast::StmtKind::kFor:      for_(s); break;
            case ast::StmtKind::kForeach:  foreach_(s); break;
            case ast::StmtKind::kSwitch:   switch_(s); break;
            case ast::StmtKind::kBreak:
            case ast::StmtKind::kContinue: break_(s); break;
            case ast::StmtKind::kReturn:   return_(s); break;
            case ast::StmtKind::kTry:      try_(s); break;
            case ast::StmtKind::kThrow:    throw_(s); break;

            // hoisted / rejected by the resolver
            case ast::StmtKind::kNop:
            case ast::StmtKind::kFnDecl:
            case ast::StmtKind::kClassDecl:
            case ast::StmtKind::kGlobal:
            case ast::StmtKind::kStaticVar:
                break;
        }
    }

    void Normalizer::if_(const ast::Stmt& s) {
        const VarId c = cond_(s.a);
        const BlockId then_b = new_block_();
        const BlockId join = new_block_();
        const BlockId else_b = (s.else_body != ast::k_invalid_stmt) ? new_block_() : join;
        branch_(c, then_b, else_b);

        set_block_(then_b);
        stmt_(s.body);
        if (cur_ != kInvalidBlock) jump_(join);

        if (s.else_body != ast::k_invalid_stmt) {
            set_block_(else_b);
            stmt_(s.else_body);
            if (cur_ != kInvalidBlock) jump_(join);
        }
        set_block_(join);
    }

    void Normalizer::while_(const ast::Stmt& s) {
        const BlockId header = new_block_();
        const BlockId body = new_block_();
        const BlockId exit = new_block_();

        jump_(header);
        set_block_(header);
        branch_(cond_(s.a), body, exit);

        breakables_.push_back({exit, header, true, static_cast<uint32_t>(tries_.size())});
        set_block_(body);
        stmt_(s.body);
        if (cur_ != kInvalidBlock) jump_(header);
        breakables_.pop_back();

        set_block_(exit);
    }

    void Normalizer::do_while_(const ast::Stmt& s) {
        const BlockId body = new_block_();
        const BlockId test = new_block_();
        const BlockId exit = new_block_();

        jump_(body);
        breakables_.push_back({exit, test, true, static_cast<uint32_t>(tries_.size())});
        set_block_(body);
        stmt_(s.body);
        if (cur_ != kInvalidBlock) jump_(test);
        breakables_.pop_back();

        set_block_(test);
        branch_(cond_(s.a), body, exit);
        set_block_(exit);
    }

    void Normalizer::for_(const ast::Stmt& s) {
        for (uint32_t i = 0; i < s.list_count; ++i) (void)expr_(ast_.expr_at(s.list_begin + i));

        const BlockId header = new_block_();
        const BlockId body = new_block_();
        const BlockId step = new_block_();
        const BlockId exit = new_block_();

        jump_(header);
        set_block_(header);
        if (s.cond_count == 0) {
            jump_(body);
        } else {
            // every condition runs, the last one decides
            for (uint32_t i = 0; i + 1 < s.cond_count; ++i) (void)expr_(ast_.expr_at(s.cond_begin + i));
            branch_(cond_(ast_.expr_at(s.cond_begin + s.cond_count - 1)), body, exit);
        }

        breakables_.push_back({exit, step, true, static_cast<uint32_t>(tries_.size())});
        set_block_(body);
        stmt_(s.body);
        if (cur_ != kInvalidBlock) jump_(step);
        breakables_.pop_back();

        set_block_(step);
        for (uint32_t i = 0; i < s.step_count; ++i) (void)expr_(ast_.expr_at(s.step_begin + i));
        jump_(header);

        set_block_(exit);
    }

    void Normalizer::foreach_(const ast::Stmt& s) {
        const Span sp = s.span;
        const VarId src = as_array_(value_(s.a), sp);

        // the loop walks a snapshot; writes to the source separate storage (copy-on-write)
        const VarId snap = temp_(Repr::kArr, type_of_(s.a));
        assign_var_(snap, src, sp);

        Op cnt{};
        cnt.kind = OpKind::kArrayCount;
        cnt.dst = temp_(Repr::kInt, types_.int_());
        cnt.a = snap;
        cnt.span = sp;
        const VarId n = cnt.dst;
        emit_(std::move(cnt));

        const VarId cursor = temp_(Repr::kInt, types_.int_());
        assign_var_(cursor, const_int_(0, sp), sp);

        const BlockId header = new_block_();
        const BlockId body = new_block_();
        const BlockId step = new_block_();
        const BlockId exit = new_block_();

        jump_(header);
        set_block_(header);
        branch_(binary_op_(BinKind::kLt, cursor, n, Repr::kBool, sp), body, exit);

        set_block_(body);
        auto fetch = [&](OpKind k, const std::string& name) {
            const uint32_t ix = resolve::local_index(*fi_, name);
            if (ix == UINT32_MAX) return;
            Op op{};
            op.kind = k;
            op.dst = temp_(Repr::kBox, types_.mixed());
            op.a = snap;
            op.b = cursor;
            op.span = sp;
            const VarId raw = op.dst;
            emit_(std::move(op));
            assign_var_(ix, coerce_(raw, fn_->vars[ix].type, sp), sp);
        };
        if (!s.key_var.empty()) fetch(OpKind::kArrayKeyAt, s.key_var);
        if (!s.value_var.empty()) fetch(OpKind::kArrayValueAt, s.value_var);

        breakables_.push_back({exit, step, true, static_cast<uint32_t>(tries_.size())});
        stmt_(s.body);
        if (cur_ != kInvalidBlock) jump_(step);
        breakables_.pop_back();

        set_block_(step);
        Op inc{};
        inc.kind = OpKind::kBinary;
        inc.bin = BinKind::kAdd;
        inc.dst = cursor;
        inc.a = cursor;
        inc.b = const_int_(1, sp);
        inc.span = sp;
        emit_(std::move(inc));
        jump_(header);

        set_block_(exit);
    }

    void Normalizer::switch_(const ast::Stmt& s) {
        const Span sp = s.span;
        const VarId v = value_(s.a);
        const VarId subject = temp_(fn_->vars[v].repr, fn_->vars[v].type);
        assign_var_(subject, v, sp);

        const BlockId exit = new_block_();
        std::vector<BlockId> bodies;
        bodies.reserve(s.case_count);
        for (uint32_t i = 0; i < s.case_count; ++i) bodies.push_back(new_block_());

        // cases are tested in source order with loose equality
        BlockId default_b = exit;
        for (uint32_t i = 0; i < s.case_count; ++i) {
            const ast::SwitchCase& c = ast_.switch_case(s.case_begin + i);
            if (c.match == ast::k_invalid_expr) {
                default_b = bodies[i];
                continue;
            }
            const VarId eq = compare_(BinKind::kEq, subject, value_(c.match), c.span);
            const BlockId next = new_block_();
            branch_(eq, bodies[i], next);
            set_block_(next);
        }
        jump_(default_b);

        breakables_.push_back({exit, kInvalidBlock, false, static_cast<uint32_t>(tries_.size())});
        for (uint32_t i = 0; i < s.case_count; ++i) {
            const ast::SwitchCase& c = ast_.switch_case(s.case_begin + i);
            set_block_(bodies[i]);
            stmts_(c.stmt_begin, c.stmt_count);
            if (cur_ != kInvalidBlock) jump_((i + 1 < s.case_count) ? bodies[i + 1] : exit);
        }
        breakables_.pop_back();

        set_block_(exit);
    }

    void Normalizer::break_(const ast::Stmt& s) {
        const bool is_break = (s.kind == ast::StmtKind::kBreak);
        uint32_t seen = 0;
        for (size_t i = breakables_.size(); i-- > 0;) {
            const Breakable& b = breakables_[i];
            if (!is_break && !b.is_loop) continue;
            if (++seen != s.level) continue;

            leave_tries_(b.try_depth);
            jump_(is_break ? b.brk : b.cont);
            return;
        }
    }

    void Normalizer::return_(const ast::Stmt& s) {
        VarId v = kInvalidVar;
        if (fn_->ret_repr == Repr::kVoid) {
            if (s.a != ast::k_invalid_expr) (void)expr_(s.a);
        } else if (s.a != ast::k_invalid_expr) {
            v = coerce_(value_(s.a), fn_->ret, s.span);
        } else {
            v = coerce_(const_null_(s.span), fn_->ret, s.span);
        }

        // the value is fixed before any finally body runs; finally may reassign the local
        if (!tries_.empty() && v != kInvalidVar && !fn_->vars[v].is_temp) {
            const VarId pinned = temp_(fn_->vars[v].repr, fn_->vars[v].type);
            assign_var_(pinned, v, s.span);
            v = pinned;
        }

        leave_tries_(0);
        Term t{};
        t.kind = TermKind::kReturn;
        t.value = v;
        t.span = s.span;
        terminate_(t);
    }

    void Normalizer::fall_off_end_() {
        const Span sp = fn_->span;
        if (fn_->ret_repr == Repr::kVoid) {
            Term t{};
            t.kind = TermKind::kReturn;
            t.span = sp;
            terminate_(t);
            return;
        }
        if (!fi_->ret_hinted) {
            Term t{};
            t.kind = TermKind::kReturn;
            t.value = coerce_(const_null_(sp), fn_->ret, sp);
            t.span = sp;
            terminate_(t);
            return;
        }
        raise_error_("TypeError",
                     fn_->name + "(): Return value must be of type " + types_.to_string(fn_->ret) + ", none returned",
                     kInvalidVar, sp);
    }

    void Normalizer::emit_finally_(uint32_t try_index) {
        const TryCtx ctx = tries_[try_index];
        if (ctx.finally_body == ast::k_invalid_stmt) return;

        // the copy runs outside its own try: its exceptions go to the enclosing handler
        const std::vector<TryCtx> saved_tries = tries_;
        const BlockId saved_handler = handler_;
        tries_.resize(try_index);
        handler_ = ctx.outer_handler;

        stats_.finally_copies += 1;
        stmt_(ctx.finally_body);

        tries_ = saved_tries;
        handler_ = saved_handler;
    }

    void Normalizer::leave_tries_(uint32_t depth) {
        for (size_t i = tries_.size(); i > depth; --i) {
            if (cur_ == kInvalidBlock) return;
            emit_finally_(static_cast<uint32_t>(i - 1));
        }
    }

    void Normalizer::try_(const ast::Stmt& s) {
        const Span sp = s.span;
        const BlockId outer = handler_;
        const bool has_finally = (s.finally_body != ast::k_invalid_stmt);
        const uint32_t ti = static_cast<uint32_t>(tries_.size());

        const BlockId dispatch = new_block_();
        const BlockId after = new_block_();
        const BlockId fin_exc = has_finally ? new_block_() : outer;

        tries_.push_back({s.finally_body, outer});

        // ---- try body ----
        handler_ = dispatch;
        stmt_(s.body);
        if (cur_ != kInvalidBlock) {
            emit_finally_(ti);
            if (cur_ != kInvalidBlock) jump_(after);
        }

        // ---- dispatch: subclass catches are tested before their ancestors ----
        struct CatchTest {
            uint32_t clause = 0;
            resolve::SymbolId cls = resolve::kInvalidSymbol;
        };
        std::vector<CatchTest> tests;
        for (uint32_t i = 0; i < s.catch_count; ++i) {
            auto it = ru_.catch_types.find(s.catch_begin + i);
            if (it == ru_.catch_types.end()) continue;
            for (resolve::SymbolId cls : it->second) {
                auto pos = std::find_if(tests.begin(), tests.end(), [&](const CatchTest& t) {
                    return t.cls != cls && ru_.table.is_subclass_of(cls, t.cls);
                });
                tests.insert(pos, CatchTest{i, cls});
            }
        }

        handler_ = fin_exc;
        set_block_(dispatch);
        Op pad{};
        pad.kind = OpKind::kLandingPad;
        pad.dst = temp_(Repr::kObj);
        pad.span = sp;
        const VarId exc = pad.dst;
        emit_(std::move(pad));

        std::vector<BlockId> catch_blocks;
        for (uint32_t i = 0; i < s.catch_count; ++i) catch_blocks.push_back(new_block_());

        for (const auto& t : tests) {
            Op io{};
            io.kind = OpKind::kInstanceOf;
            io.dst = temp_(Repr::kBool, types_.bool_());
            io.a = exc;
            io.sym = t.cls;
            io.span = sp;
            const VarId hit = io.dst;
            emit_(std::move(io));
            const BlockId next = new_block_();
            branch_(hit, catch_blocks[t.clause], next);
            set_block_(next);
        }

        // nothing matched: run finally, then propagate the same object outward
        emit_finally_(ti);
        handler_ = outer;
        if (cur_ != kInvalidBlock) raise_(exc, sp);
        handler_ = fin_exc;

        // ---- catch bodies ----
        for (uint32_t i = 0; i < s.catch_count; ++i) {
            const ast::CatchClause& c = ast_.catch_clause(s.catch_begin + i);
            set_block_(catch_blocks[i]);
            if (!c.var.empty()) {
                const uint32_t ix = resolve::local_index(*fi_, c.var);
                if (ix != UINT32_MAX) assign_var_(ix, coerce_(exc, fn_->vars[ix].type, c.span), c.span);
            }
            stmt_(c.body);
            if (cur_ != kInvalidBlock) {
                emit_finally_(ti);
                if (cur_ != kInvalidBlock) jump_(after);
            }
        }

        // ---- exception escaping a catch body: finally, then re-raise ----
        if (has_finally) {
            handler_ = outer;
            set_block_(fin_exc);
            Op pad2{};
            pad2.kind = OpKind::kLandingPad;
            pad2.dst = temp_(Repr::kObj);
            pad2.span = sp;
            const VarId exc2 = pad2.dst;
            emit_(std::move(pad2));
            emit_finally_(ti);
            if (cur_ != kInvalidBlock) raise_(exc2, sp);
        }

        tries_.pop_back();
        handler_ = outer;
        set_block_(after);
    }

    void Normalizer::throw_(const ast::Stmt& s) {
        const VarId v = to_repr_(value_(s.a), Repr::kObj, s.span);
        raise_(v, s.span);
    }

} // namespace php2ir::cfg::detail


namespace php2ir::cfg {

    Unit normalize_unit(const ast::AstArena& ast, const resolve::ResolvedUnit& ru,
                        const ty::TypePool& types, diag::Bag& bag) {
        Unit u{};
        u.name = ru.unit_name;
        detail::Normalizer n(ast, ru, types, bag, u.stats);
        u.functions.reserve(ru.functions.size());
        for (const auto& fi : ru.functions) u.functions.push_back(n.run(fi));
        return u;
    }

} // namespace php2ir::cfg
