// frontend/src/resolve/resolve_decls.cpp
#include "resolver.hpp"

#include <algorithm>
#include <memory>


namespace php2ir::resolve::detail {

    using sema::Symbol;
    using sema::SymbolKind;
    using sema::DefaultValue;

    std::string_view visibility_name(ast::Visibility v) {
        switch (v) {
            case ast::Visibility::kPublic:    return "public";
            case ast::Visibility::kProtected: return "protected";
            case ast::Visibility::kPrivate:   return "private";
        }
        return "public";
    }

    bool has_value_return(const ast::AstArena& ast, ast::StmtId sid) {
        if (sid == ast::k_invalid_stmt) return false;
        const ast::Stmt& s = ast.stmt(sid);
        switch (s.kind) {
            case ast::StmtKind::kReturn:
                return s.a != ast::k_invalid_expr;
            case ast::StmtKind::kBlock:
                for (uint32_t i = 0; i < s.list_count; ++i) {
                    if (has_value_return(ast, ast.stmt_at(s.list_begin + i))) return true;
                }
                return false;
            case ast::StmtKind::kIf:
                return has_value_return(ast, s.body) || has_value_return(ast, s.else_body);
            case ast::StmtKind::kWhile:
            case ast::StmtKind::kDoWhile:
            case ast::StmtKind::kFor:
            case ast::StmtKind::kForeach:
                return has_value_return(ast, s.body);
            case ast::StmtKind::kSwitch:
                for (uint32_t i = 0; i < s.case_count; ++i) {
                    const ast::SwitchCase& c = ast.switch_case(s.case_begin + i);
                    for (uint32_t k = 0; k < c.stmt_count; ++k) {
                        if (has_value_return(ast, ast.stmt_at(c.stmt_begin + k))) return true;
                    }
                }
                return false;
            case ast::StmtKind::kTry:
                if (has_value_return(ast, s.body) || has_value_return(ast, s.finally_body)) return true;
                for (uint32_t i = 0; i < s.catch_count; ++i) {
                    if (has_value_return(ast, ast.catch_clause(s.catch_begin + i).body)) return true;
                }
                return false;
            default:
                return false;
        }
    }

    namespace {

        uint32_t vis_rank_(ast::Visibility v) {
            switch (v) {
                case ast::Visibility::kPublic:    return 0;
                case ast::Visibility::kProtected: return 1;
                case ast::Visibility::kPrivate:   return 2;
            }
            return 0;
        }

        bool is_ctor_name_(std::string_view n) {
            return sema::fold_name(n) == "__construct";
        }

    } // namespace

    Resolver::Resolver(const ast::Unit& unit, const UnitInput& in, diag::Bag& bag,
                       const ResolveOptions& opt, ResolvedUnit& out)
        : unit_(unit), ast_(unit.ast), in_(in), bag_(bag), opt_(opt), out_(out),
          types_(out.types), table_(out.table) {
        out_.unit_name = unit.name;
        out_.types = unit.types;
        out_.expr_types.assign(ast_.exprs().size(), ty::kInvalidType);
    }

    void Resolver::run() {
        issues_at_start_ = bag_.issue_count();

        import_deps_();
        collect_decls_();
        link_classes_();
        for (const auto& [cls, cid] : local_classes_) {
            (void)cid;
            finalize_class_(cls);
        }
        for (const auto& [cls, cid] : local_classes_) {
            (void)cid;
            check_interfaces_(cls);
        }

        build_functions_();
        for (auto& fi : out_.functions) resolve_function_(fi);

        for (const auto& [cls, cid] : local_classes_) {
            (void)cid;
            out_.local_classes.push_back(cls);
        }
        build_exports_();
        out_.ok = (bag_.issue_count() == issues_at_start_);
    }

    // ---- diagnostics ----

    void Resolver::report_(diag::Severity sev, diag::Code code, Span sp,
                           std::initializer_list<std::string_view> args) {
        diag::Diagnostic d(sev, code, sp);
        for (auto a : args) d.add_arg(a);
        bag_.add(std::move(d));
    }

    void Resolver::error_(diag::Code code, Span sp, std::initializer_list<std::string_view> args) {
        report_(diag::Severity::kError, code, sp, args);
    }

    void Resolver::body_error_(diag::Code code, Span sp, std::initializer_list<std::string_view> args) {
        if (!recording_) return;
        report_(diag::Severity::kError, code, sp, args);
    }

    // ---- declarations ----

    void Resolver::import_deps_() {
        Span sp{};
        sp.file_id = unit_.file_id;
        for (const auto& dep : in_.deps) {
            if (!dep) continue;
            std::vector<std::string> conflicts;
            if (sema::import_symbols(*dep, table_, types_, &conflicts)) continue;
            for (const auto& name : conflicts) {
                const auto id = table_.lookup_global(name);
                const bool is_class = id && (table_.symbol(*id).kind == SymbolKind::kClass ||
                                             table_.symbol(*id).kind == SymbolKind::kInterface);
                error_(is_class ? diag::Code::kDuplicateClass : diag::Code::kDuplicateFunction, sp, {name});
            }
        }
    }

    void Resolver::collect_decls_() {
        for (ast::StmtId sid : unit_.top) {
            const ast::Stmt& s = ast_.stmt(sid);
            if (s.kind == ast::StmtKind::kFnDecl) declare_function_(s.decl);
            else if (s.kind == ast::StmtKind::kClassDecl) declare_class_(s.decl);
        }
    }

    void Resolver::declare_function_(ast::FnId fid) {
        const ast::FnDecl& f = ast_.fn(fid);

        Symbol sym{};
        sym.kind = SymbolKind::kFunction;
        sym.name = f.name;
        sym.decl = fid;
        sym.decl_span = f.span;
        sym.origin_unit = unit_.name;

        read_params_(f, sym.params);
        if (f.ret != ty::kInvalidType) {
            sym.type = f.ret;
            sym.has_hint = true;
        } else {
            sym.type = has_value_return(ast_, f.body) ? types_.mixed() : types_.void_();
        }
        read_attrs_(f.attrs, sym, &f);

        if (find_builtin(f.name) != nullptr) {
            error_(diag::Code::kDuplicateFunction, f.span, {f.name});
            return;
        }
        const auto r = table_.insert_global(sym);
        if (!r.ok) {
            error_(r.is_duplicate ? diag::Code::kDuplicateFunction : diag::Code::kInternalFailure, f.span, {f.name});
            return;
        }
        local_fns_.push_back({r.symbol_id, fid});
        exported_.push_back(r.symbol_id);
    }

    bool Resolver::read_params_(const ast::FnDecl& f, std::vector<sema::ParamSig>& out) {
        bool ok = true;
        for (const auto& p : f.params) {
            sema::ParamSig ps{};
            ps.name = p.name;
            ps.has_hint = (p.type != ty::kInvalidType);
            ps.type = ps.has_hint ? p.type : types_.mixed();

            if (p.by_ref) {
                error_(diag::Code::kUnsupportedConstruct, p.span, {"by-reference parameter"});
                ok = false;
            }
            if (p.variadic) {
                error_(diag::Code::kUnsupportedConstruct, p.span, {"variadic parameter"});
                ok = false;
            }

            if (p.default_value != ast::k_invalid_expr) {
                if (!const_value_(p.default_value, ps.def)) {
                    error_(diag::Code::kUnsupportedConstruct, p.span, {"non-constant default value"});
                    ok = false;
                } else if (ps.has_hint && ps.def.kind == DefaultValue::Kind::kNull) {
                    // `int $x = null` declares ?int
                    ps.type = types_.nullable(ps.type);
                } else if (ps.has_hint && !assignable_(const_type_(ps.def), ps.type)) {
                    const std::string idx = std::to_string(out.size() + 1);
                    error_(diag::Code::kArgTypeMismatch, p.span,
                           {f.name, idx, tname_(ps.type), tname_(const_type_(ps.def))});
                    ok = false;
                }
            }
            out.push_back(std::move(ps));
        }
        return ok;
    }

    void Resolver::read_attrs_(const std::vector<ast::Attribute>& attrs, Symbol& sym, const ast::FnDecl* fn) {
        for (const auto& a : attrs) {
            if (fn != nullptr && !fn->is_method && sema::fold_name(a.name) == "ffi") {
                check_ffi_(sym, *fn, a);
                continue;
            }
            report_(diag::Severity::kWarning, diag::Code::kUnknownAttribute, a.span, {a.name});
        }
    }

    void Resolver::check_ffi_(Symbol& sym, const ast::FnDecl& f, const ast::Attribute& a) {
        auto fail = [&](std::string_view detail) {
            error_(diag::Code::kFfiSignatureMismatch, a.span, {f.name, detail});
        };

        if (a.args.size() != 2 ||
            ast_.expr(a.args[0]).kind != ast::ExprKind::kStringLit ||
            ast_.expr(a.args[1]).kind != ast::ExprKind::kStringLit) {
            fail("expected #[ffi(\"library\", \"prototype\")]");
            return;
        }
        const std::string& lib = ast_.expr(a.args[0]).text;
        const std::string& proto_text = ast_.expr(a.args[1]).text;

        if (f.body != ast::k_invalid_stmt && ast_.stmt(f.body).list_count != 0) {
            error_(diag::Code::kFfiBodyNotEmpty, f.span, {f.name});
        }

        const CPrototype proto = parse_c_prototype(proto_text);
        if (!proto.ok) {
            fail(proto.error);
            return;
        }
        if (proto.params.size() != sym.params.size()) {
            fail("parameter count differs from the C prototype");
            return;
        }

        auto matches = [&](CType c, ty::TypeId t) {
            switch (c) {
                case CType::kDouble: return types_.is_builtin(t, ty::Builtin::kFloat);
                case CType::kInt64:
                case CType::kInt32:  return types_.is_builtin(t, ty::Builtin::kInt);
                case CType::kBool:   return types_.is_builtin(t, ty::Builtin::kBool);
                case CType::kVoid:   return types_.is_builtin(t, ty::Builtin::kVoid);
            }
            return false;
        };

        for (size_t i = 0; i < proto.params.size(); ++i) {
            const auto& p = sym.params[i];
            if (!p.has_hint) {
                fail("parameter $" + p.name + " needs a type hint");
                return;
            }
            if (!matches(proto.params[i], p.type)) {
                fail("parameter $" + p.name + " is " + tname_(p.type) + " but C expects " +
                     std::string(ctype_name(proto.params[i])));
                return;
            }
        }
        if (!matches(proto.ret, sym.type)) {
            fail("return type is " + tname_(sym.type) + " but C returns " + std::string(ctype_name(proto.ret)));
            return;
        }

        sym.kind = SymbolKind::kForeign;
        sym.foreign_lib = lib;
        sym.foreign_symbol = proto.name;
        sym.foreign_proto = proto_text;
    }

    bool Resolver::const_value_(ast::ExprId id, DefaultValue& out) const {
        using K = DefaultValue::Kind;
        const ast::Expr& e = ast_.expr(id);
        out = DefaultValue{};
        switch (e.kind) {
            case ast::ExprKind::kIntLit:    out.kind = K::kInt; out.i = e.int_value; return true;
            case ast::ExprKind::kFloatLit:  out.kind = K::kFloat; out.f = e.float_value; return true;
            case ast::ExprKind::kStringLit: out.kind = K::kString; out.s = e.text; return true;
            case ast::ExprKind::kBoolLit:   out.kind = K::kBool; out.b = e.bool_value; return true;
            case ast::ExprKind::kNullLit:   out.kind = K::kNull; return true;
            case ast::ExprKind::kArrayLit:
                if (e.list_count != 0) return false;
                out.kind = K::kEmptyArray;
                return true;
            case ast::ExprKind::kConstFetch:
                return find_constant(e.text, out);
            case ast::ExprKind::kUnary: {
                if (e.uop != ast::UnaryOp::kNeg && e.uop != ast::UnaryOp::kPlus) return false;
                if (!const_value_(e.a, out)) return false;
                const bool neg = (e.uop == ast::UnaryOp::kNeg);
                if (out.kind == K::kInt) { if (neg) out.i = -out.i; return true; }
                if (out.kind == K::kFloat) { if (neg) out.f = -out.f; return true; }
                return false;
            }
            default:
                return false;
        }
    }

    ty::TypeId Resolver::const_type_(const DefaultValue& v) {
        using K = DefaultValue::Kind;
        switch (v.kind) {
            case K::kNone:       return types_.mixed();
            case K::kNull:       return types_.null();
            case K::kInt:        return types_.int_();
            case K::kFloat:      return types_.float_();
            case K::kBool:       return types_.bool_();
            case K::kString:     return types_.string();
            case K::kEmptyArray: return types_.array(types_.never(), ty::ArrayShape::kList);
        }
        return types_.mixed();
    }

    void Resolver::declare_class_(ast::ClassId cid) {
        const ast::ClassDecl& c = ast_.cls(cid);

        Symbol sym{};
        sym.kind = c.is_interface ? SymbolKind::kInterface : SymbolKind::kClass;
        sym.name = c.name;
        sym.type = types_.object(c.name, false);
        sym.is_final = c.is_final;
        sym.is_abstract = c.is_abstract || c.is_interface;
        sym.decl = cid;
        sym.decl_span = c.span;
        sym.origin_unit = unit_.name;
        read_attrs_(c.attrs, sym, nullptr);

        const auto r = table_.insert_global(sym);
        if (!r.ok) {
            error_(diag::Code::kDuplicateClass, c.span, {c.name});
            return;
        }
        const SymbolId cls = r.symbol_id;
        local_classes_.push_back({cls, cid});
        exported_.push_back(cls);

        for (const auto& p : c.props) {
            if (c.is_interface) {
                error_(diag::Code::kUnsupportedConstruct, p.span, {"interface property"});
                continue;
            }
            if (p.is_static) {
                error_(diag::Code::kUnsupportedConstruct, p.span, {"static property"});
                continue;
            }

            Symbol ps{};
            ps.kind = SymbolKind::kProperty;
            ps.name = p.name;
            ps.has_hint = (p.type != ty::kInvalidType);
            ps.type = ps.has_hint ? p.type : types_.mixed();
            ps.vis = p.vis;
            ps.decl_span = p.span;
            ps.origin_unit = unit_.name;

            if (p.default_value != ast::k_invalid_expr) {
                if (!const_value_(p.default_value, ps.init)) {
                    error_(diag::Code::kUnsupportedConstruct, p.span, {"non-constant property initializer"});
                } else if (!assignable_(const_type_(ps.init), ps.type)) {
                    error_(diag::Code::kPropertyTypeMismatch, p.span,
                           {c.name + "::$" + p.name, tname_(ps.type), tname_(const_type_(ps.init))});
                }
            } else if (!ps.has_hint) {
                ps.init.kind = DefaultValue::Kind::kNull;
            }

            const auto pr = table_.insert_member(cls, ps);
            if (!pr.ok) error_(diag::Code::kDuplicateMember, p.span, {c.name, "$" + p.name});
        }

        for (ast::FnId fid : c.methods) declare_method_(cls, fid, c.is_interface);
    }

    void Resolver::declare_method_(SymbolId cls, ast::FnId fid, bool in_interface) {
        const ast::FnDecl& f = ast_.fn(fid);
        const std::string cls_name = table_.symbol(cls).name;

        Symbol m{};
        m.kind = SymbolKind::kMethod;
        m.name = f.name;
        m.vis = f.vis;
        m.is_static = f.is_static;
        m.is_final = f.is_final;
        m.is_abstract = f.is_abstract || in_interface || f.body == ast::k_invalid_stmt;
        m.decl = fid;
        m.decl_span = f.span;
        m.origin_unit = unit_.name;

        read_params_(f, m.params);
        if (f.ret != ty::kInvalidType) {
            m.type = f.ret;
            m.has_hint = true;
        } else if (m.is_abstract) {
            m.type = types_.mixed();
        } else {
            m.type = has_value_return(ast_, f.body) ? types_.mixed() : types_.void_();
        }
        if (is_ctor_name_(f.name)) {
            m.type = types_.void_();
            m.has_hint = false;
            if (f.is_static) error_(diag::Code::kUnsupportedConstruct, f.span, {"static constructor"});
        }
        if (in_interface && f.vis != ast::Visibility::kPublic) {
            error_(diag::Code::kOverrideNarrowsVisibility, f.span, {cls_name, f.name, "public"});
        }
        read_attrs_(f.attrs, m, &f);

        const auto r = table_.insert_member(cls, m);
        if (!r.ok) error_(diag::Code::kDuplicateMember, f.span, {cls_name, f.name});
    }

    // ---- class hierarchy ----

    void Resolver::link_classes_() {
        for (const auto& [cls, cid] : local_classes_) {
            const ast::ClassDecl& c = ast_.cls(cid);

            if (!c.parent.empty()) {
                const auto p = table_.lookup_class(c.parent);
                if (!p) {
                    error_(diag::Code::kUnresolvedClass, c.span, {c.parent});
                } else if (table_.symbol(*p).kind == SymbolKind::kInterface || c.is_interface) {
                    error_(diag::Code::kNotAClass, c.span, {c.parent});
                } else if (*p == cls) {
                    error_(diag::Code::kInheritanceCycle, c.span, {c.name});
                } else if (table_.symbol(*p).is_final) {
                    error_(diag::Code::kOverrideFinal, c.span, {table_.symbol(*p).name});
                } else {
                    table_.symbol_mut(cls).parent = *p;
                }
            }

            for (const auto& iname : c.interfaces) {
                const auto i = table_.lookup_class(iname);
                if (!i) {
                    error_(diag::Code::kUnresolvedClass, c.span, {iname});
                } else if (table_.symbol(*i).kind != SymbolKind::kInterface) {
                    error_(diag::Code::kNotAnInterface, c.span, {iname});
                } else if (*i == cls) {
                    error_(diag::Code::kInheritanceCycle, c.span, {c.name});
                } else {
                    table_.symbol_mut(cls).interfaces.push_back(*i);
                }
            }
        }
    }

    void Resolver::finalize_class_(SymbolId cls) {
        const uint8_t st = finalize_state_[cls];
        if (st != 0) return;

        sema::ClassLayout* lay = table_.layout_mut(cls);
        if (lay == nullptr) return;
        if (lay->finalized) {
            finalize_state_[cls] = 2;
            return;
        }
        finalize_state_[cls] = 1;

        const Span span = table_.symbol(cls).decl_span;
        const std::string name = table_.symbol(cls).name;

        // parents first
        SymbolId parent = table_.symbol(cls).parent;
        if (parent != kInvalidSymbol) {
            if (finalize_state_[parent] == 1) {
                error_(diag::Code::kInheritanceCycle, span, {name});
                table_.symbol_mut(cls).parent = kInvalidSymbol;
                parent = kInvalidSymbol;
            } else {
                finalize_class_(parent);
            }
        }
        std::vector<SymbolId> direct_ifaces;
        for (SymbolId i : table_.symbol(cls).interfaces) {
            if (finalize_state_[i] == 1) {
                error_(diag::Code::kInheritanceCycle, span, {name});
                continue;
            }
            finalize_class_(i);
            direct_ifaces.push_back(i);
        }
        table_.symbol_mut(cls).interfaces = direct_ifaces;

        lay = table_.layout_mut(cls);
        lay->parent = parent;
        if (parent != kInvalidSymbol) {
            const sema::ClassLayout* pl = table_.layout(parent);
            lay->ancestors.push_back(parent);
            lay->ancestors.insert(lay->ancestors.end(), pl->ancestors.begin(), pl->ancestors.end());
            lay->slots = pl->slots;
            lay->vtable = pl->vtable;
            lay->ctor = pl->ctor;
            lay->interfaces = pl->interfaces;
        }
        for (SymbolId i : direct_ifaces) {
            lay->interfaces.push_back(i);
            const sema::ClassLayout* il = table_.layout(i);
            lay->interfaces.insert(lay->interfaces.end(), il->interfaces.begin(), il->interfaces.end());
        }
        std::sort(lay->interfaces.begin(), lay->interfaces.end());
        lay->interfaces.erase(std::unique(lay->interfaces.begin(), lay->interfaces.end()), lay->interfaces.end());

        const bool is_interface = table_.symbol(cls).kind == SymbolKind::kInterface;
        const bool cls_final = table_.symbol(cls).is_final;

        // property slots in declaration order, after the parent's
        for (SymbolId m : table_.members_in_order(cls)) {
            if (table_.symbol(m).kind != SymbolKind::kProperty) continue;
            table_.symbol_mut(m).prop_slot = static_cast<uint32_t>(lay->slots.size());
            lay->slots.push_back(m);
        }

        // vtable: overrides reuse the parent's slot, new overridable methods append
        for (SymbolId m : table_.members_in_order(cls)) {
            if (table_.symbol(m).kind != SymbolKind::kMethod) continue;
            const std::string mname = table_.symbol(m).name;

            if (is_ctor_name_(mname)) {
                lay->ctor = m;
                continue;
            }
            if (is_interface) continue;

            std::optional<SymbolId> pm;
            if (parent != kInvalidSymbol) pm = find_in_chain_(parent, mname);
            if (pm && table_.symbol(*pm).vis == ast::Visibility::kPrivate) pm.reset();

            if (pm) {
                check_override_(cls, m, *pm);
                table_.symbol_mut(m).override_target = *pm;
                const uint32_t slot = table_.symbol(*pm).vtable_slot;
                if (slot != kNoSlot) {
                    table_.symbol_mut(m).vtable_slot = slot;
                    lay->vtable[slot] = m;
                    continue;
                }
            }

            const Symbol& ms = table_.symbol(m);
            if (ms.is_static || ms.vis == ast::Visibility::kPrivate || ms.is_final || cls_final) continue;
            table_.symbol_mut(m).vtable_slot = static_cast<uint32_t>(lay->vtable.size());
            lay->vtable.push_back(m);
        }

        lay->finalized = true;
        finalize_state_[cls] = 2;

        // a concrete class cannot keep abstract slots
        if (!is_interface && !table_.symbol(cls).is_abstract) {
            for (SymbolId e : lay->vtable) {
                const Symbol& es = table_.symbol(e);
                if (!es.is_abstract) continue;
                error_(diag::Code::kMissingInterfaceMethod, span, {name, table_.symbol(es.owner).name, es.name});
            }
        }
    }

    std::optional<SymbolId> Resolver::find_in_chain_(SymbolId cls, std::string_view method) const {
        SymbolId cur = cls;
        uint32_t guard = 0;
        while (cur != kInvalidSymbol && guard++ < 1024) {
            if (auto m = table_.lookup_own_member(cur, SymbolKind::kMethod, method)) return m;
            cur = table_.symbol(cur).parent;
        }
        return std::nullopt;
    }

    void Resolver::check_override_(SymbolId cls, SymbolId m, SymbolId parent_m) {
        const Symbol& ms = table_.symbol(m);
        const Symbol& ps = table_.symbol(parent_m);
        const std::string& cname = table_.symbol(cls).name;
        const std::string& pname = table_.symbol(ps.owner).name;

        if (ps.is_final) {
            error_(diag::Code::kOverrideFinal, ms.decl_span, {pname + "::" + ps.name});
        }
        if (vis_rank_(ms.vis) > vis_rank_(ps.vis)) {
            error_(diag::Code::kOverrideNarrowsVisibility, ms.decl_span,
                   {cname, ms.name, visibility_name(ps.vis)});
        }
        if (ms.is_static != ps.is_static || !sig_compatible_(ms, ps)) {
            error_(diag::Code::kOverrideSignatureMismatch, ms.decl_span, {cname, ms.name, pname});
        }
    }

    void Resolver::check_interfaces_(SymbolId cls) {
        const Symbol& cs = table_.symbol(cls);
        if (cs.kind != SymbolKind::kClass || cs.is_abstract) return;
        const sema::ClassLayout* lay = table_.layout(cls);
        if (lay == nullptr) return;

        for (SymbolId iface : lay->interfaces) {
            for (SymbolId im : table_.members_in_order(iface)) {
                const Symbol& ims = table_.symbol(im);
                if (ims.kind != SymbolKind::kMethod) continue;

                const auto impl = find_in_chain_(cls, ims.name);
                if (!impl || table_.symbol(*impl).is_abstract) {
                    error_(diag::Code::kMissingInterfaceMethod, cs.decl_span,
                           {cs.name, table_.symbol(iface).name, ims.name});
                    continue;
                }
                const Symbol& is = table_.symbol(*impl);
                if (is.vis != ast::Visibility::kPublic) {
                    error_(diag::Code::kOverrideNarrowsVisibility, is.decl_span, {cs.name, is.name, "public"});
                } else if (is.is_static != ims.is_static || !sig_compatible_(is, ims)) {
                    error_(diag::Code::kOverrideSignatureMismatch, is.decl_span,
                           {cs.name, is.name, table_.symbol(iface).name});
                }
            }
        }
    }

    bool Resolver::sig_compatible_(const Symbol& child, const Symbol& parent) {
        if (child.params.size() < parent.params.size()) return false;

        // parameters are contravariant
        for (size_t i = 0; i < parent.params.size(); ++i) {
            const auto& cp = child.params[i];
            const auto& pp = parent.params[i];
            if (!cp.has_hint) continue;
            if (!pp.has_hint) {
                if (!types_.is_mixed(cp.type)) return false;
                continue;
            }
            if (!subtype_(pp.type, cp.type)) return false;
        }
        for (size_t i = parent.params.size(); i < child.params.size(); ++i) {
            if (child.params[i].def.kind == DefaultValue::Kind::kNone) return false;
        }

        // return is covariant
        if (!parent.has_hint) return true;
        if (!child.has_hint) return false;
        if (types_.is_builtin(parent.type, ty::Builtin::kVoid)) {
            return types_.is_builtin(child.type, ty::Builtin::kVoid);
        }
        return subtype_(child.type, parent.type);
    }

    // ---- outputs ----

    void Resolver::build_functions_() {
        for (const auto& [sym, fid] : local_fns_) {
            const Symbol& s = table_.symbol(sym);
            if (s.kind != SymbolKind::kFunction) continue;

            FunctionInfo fi{};
            fi.name = s.name;
            fi.sym = sym;
            fi.body = ast_.fn(fid).body;
            fi.ret = s.type;
            fi.ret_hinted = s.has_hint;
            fi.span = s.decl_span;
            for (const auto& p : s.params) fi.locals.push_back({p.name, p.type, true});
            fi.param_count = static_cast<uint32_t>(fi.locals.size());
            out_.functions.push_back(std::move(fi));
        }

        for (const auto& [cls, cid] : local_classes_) {
            (void)cid;
            if (table_.symbol(cls).kind != SymbolKind::kClass) continue;
            const std::string cname = table_.symbol(cls).name;

            for (SymbolId m : table_.members_in_order(cls)) {
                const Symbol& ms = table_.symbol(m);
                if (ms.kind != SymbolKind::kMethod || ms.is_abstract || ms.decl == ast::k_invalid_decl) continue;

                FunctionInfo fi{};
                fi.name = cname + "::" + ms.name;
                fi.sym = m;
                fi.cls = cls;
                fi.has_this = !ms.is_static;
                fi.body = ast_.fn(ms.decl).body;
                fi.ret = ms.type;
                fi.ret_hinted = ms.has_hint;
                fi.span = ms.decl_span;
                if (fi.has_this) fi.locals.push_back({"this", class_type_(cls, false), true});
                for (const auto& p : ms.params) fi.locals.push_back({p.name, p.type, true});
                fi.param_count = static_cast<uint32_t>(fi.locals.size());
                out_.functions.push_back(std::move(fi));
            }
        }

        FunctionInfo main{};
        main.name = "__main";
        main.is_main = true;
        main.ret = types_.void_();
        for (ast::StmtId sid : unit_.top) {
            const ast::StmtKind k = ast_.stmt(sid).kind;
            if (k == ast::StmtKind::kFnDecl || k == ast::StmtKind::kClassDecl) continue;
            if (main.top.empty()) main.span = ast_.stmt(sid).span;
            main.top.push_back(sid);
        }
        out_.functions.push_back(std::move(main));
    }

    void Resolver::build_exports_() {
        auto ex = std::make_shared<sema::ExportTable>();
        ex->unit_name = unit_.name;
        ex->types = types_;
        ex->table = table_;
        ex->exported = exported_;
        out_.exports = std::move(ex);
    }

} // namespace php2ir::resolve::detail
