#include <php2ir/ast/Builder.hpp>
#include <php2ir/resolve/Prelude.hpp>
#include <php2ir/resolve/Resolve.hpp>

#include <iostream>
#include <string>
#include <vector>

namespace {

    using namespace php2ir;
    using ast::BinOp;
    using ast::Visibility;

    static bool require_(bool cond, const char* msg) {
        if (cond) return true;
        std::cerr << "  - " << msg << "\n";
        return false;
    }

    static resolve::ResolvedUnit resolve_(const ast::Unit& u, diag::Bag& bag,
                                          std::vector<sema::ExportTablePtr> extra = {}) {
        resolve::UnitInput in{};
        in.deps.push_back(resolve::prelude_exports());
        for (auto& d : extra) in.deps.push_back(d);
        return resolve::resolve_unit(u, in, bag);
    }

    static ast::FnDecl add_fn_(ast::Builder& b) {
        return b.function("add", {b.param("a", "int"), b.param("b", "int")}, "int",
                          {b.ret(b.bin(BinOp::kAdd, b.var("a"), b.var("b")))});
    }

    /// @brief 사용자 함수 호출이 직접 호출로 묶이는지 검사한다.
    static bool test_function_call_binds_direct() {
        ast::Unit u{};
        u.name = "app";
        ast::Builder b(u);
        b.emit(b.fn_stmt(add_fn_(b)));
        const ast::ExprId call = b.call("add", {b.int_(1), b.int_(2)});
        b.emit(b.expr(b.assign(b.var("r"), call)));

        diag::Bag bag;
        const auto ru = resolve_(u, bag);

        bool ok = true;
        ok &= require_(ru.ok && !bag.has_error(), "well-formed unit must resolve");
        auto it = ru.calls.find(call);
        ok &= require_(it != ru.calls.end(), "call site must be recorded");
        if (it != ru.calls.end()) {
            ok &= require_(it->second.kind == resolve::CallKind::kFunction, "user function call must be direct");
            ok &= require_(ru.table.symbol(it->second.callee).name == "add", "callee must be add");
        }
        ok &= require_(ru.functions.size() == 2, "__main plus add");
        return ok;
    }

    static bool test_unresolved_function_reported() {
        ast::Unit u{};
        u.name = "app";
        ast::Builder b(u);
        b.emit(b.expr(b.call("nope", {})));

        diag::Bag bag;
        const auto ru = resolve_(u, bag);

        bool ok = true;
        ok &= require_(!ru.ok, "unit must fail");
        ok &= require_(bag.has_code(diag::Code::kUnresolvedFunction), "expected UnresolvedFunction");
        ok &= require_(bag.count_kind(diag::ErrorKind::kUnresolvedSymbol) == 1, "exactly one unresolved symbol");
        return ok;
    }

    static bool test_arg_count_mismatch() {
        ast::Unit u{};
        u.name = "app";
        ast::Builder b(u);
        b.emit(b.fn_stmt(add_fn_(b)));
        b.emit(b.expr(b.call("add", {b.int_(1)})));

        diag::Bag bag;
        const auto ru = resolve_(u, bag);
        return require_(!ru.ok && bag.has_code(diag::Code::kArgCountMismatch), "add(1) must be an arity error");
    }

    static bool test_arg_type_mismatch() {
        ast::Unit u{};
        u.name = "app";
        ast::Builder b(u);
        b.emit(b.fn_stmt(add_fn_(b)));
        b.emit(b.expr(b.call("add", {b.int_(1), b.list({})})));

        diag::Bag bag;
        const auto ru = resolve_(u, bag);
        return require_(!ru.ok && bag.has_code(diag::Code::kArgTypeMismatch), "array into int must be rejected");
    }

    /// @brief parent::m()은 깊이에 상관없이 바로 위 부모의 구현으로 정적으로 묶여야 한다.
    static bool test_parent_call_binds_immediate_parent() {
        ast::Unit u{};
        u.name = "app";
        ast::Builder b(u);

        b.emit(b.class_stmt(b.class_("A", "", {}, {
            b.method(Visibility::kPublic, "name", {}, "string", {b.ret(b.str("A"))}),
        })));
        b.emit(b.class_stmt(b.class_("B", "A", {}, {
            b.method(Visibility::kPublic, "name", {}, "string", {b.ret(b.str("B"))}),
        })));
        b.emit(b.class_stmt(b.class_("C", "B", {}, {})));
        const ast::ExprId parent_call = b.scall("parent", "name", {});
        b.emit(b.class_stmt(b.class_("D", "C", {}, {
            b.method(Visibility::kPublic, "name", {}, "string",
                     {b.ret(b.bin(BinOp::kConcat, b.str("D>"), parent_call))}),
        })));

        diag::Bag bag;
        const auto ru = resolve_(u, bag);

        bool ok = true;
        ok &= require_(ru.ok, "class chain must resolve");
        auto it = ru.calls.find(parent_call);
        ok &= require_(it != ru.calls.end(), "parent:: call must be recorded");
        if (it == ru.calls.end()) return false;

        const auto& ci = it->second;
        ok &= require_(ci.kind == resolve::CallKind::kStaticMethod, "parent:: must be a static binding");
        ok &= require_(ci.implicit_this, "parent:: passes $this");
        const auto& callee = ru.table.symbol(ci.callee);
        ok &= require_(callee.owner != sema::kInvalidSymbol &&
                       ru.table.symbol(callee.owner).name == "B",
                       "C inherits name() from B, so parent::name() in D is B::name");
        return ok;
    }

    static bool test_virtual_call_uses_vtable_slot() {
        ast::Unit u{};
        u.name = "app";
        ast::Builder b(u);

        b.emit(b.class_stmt(b.class_("Animal", "", {}, {
            b.method(Visibility::kPublic, "speak", {}, "string", {b.ret(b.str("..."))}),
        })));
        b.emit(b.class_stmt(b.class_("Dog", "Animal", {}, {
            b.method(Visibility::kPublic, "speak", {}, "string", {b.ret(b.str("woof"))}),
        })));
        const ast::ExprId vcall = b.mcall(b.var("a"), "speak", {});
        b.emit(b.fn_stmt(b.function("talk", {b.param("a", "Animal")}, "string", {b.ret(vcall)})));
        const ast::ExprId exact = b.mcall(b.new_("Dog", {}), "speak", {});
        b.emit(b.echo({exact}));

        diag::Bag bag;
        const auto ru = resolve_(u, bag);

        bool ok = true;
        ok &= require_(ru.ok, "unit must resolve");
        auto v = ru.calls.find(vcall);
        ok &= require_(v != ru.calls.end() && v->second.kind == resolve::CallKind::kVirtual,
                       "call through a declared base type is virtual");
        if (v != ru.calls.end()) {
            ok &= require_(v->second.vslot != resolve::kNoSlot, "virtual call carries a vtable slot");
        }
        auto e = ru.calls.find(exact);
        ok &= require_(e != ru.calls.end() && e->second.kind == resolve::CallKind::kStaticMethod,
                       "receiver of exactly known class is bound statically");
        return ok;
    }

    static bool test_override_narrows_visibility() {
        ast::Unit u{};
        u.name = "app";
        ast::Builder b(u);

        b.emit(b.class_stmt(b.class_("A", "", {}, {
            b.method(Visibility::kPublic, "greet", {}, "string", {b.ret(b.str("A"))}),
            b.method(Visibility::kProtected, "helper", {}, "int", {b.ret(b.int_(1))}),
        })));
        b.emit(b.class_stmt(b.class_("B", "A", {}, {
            b.method(Visibility::kProtected, "greet", {}, "string", {b.ret(b.str("B"))}),
            // protected -> public widens, which is allowed
            b.method(Visibility::kPublic, "helper", {}, "int", {b.ret(b.int_(2))}),
        })));

        diag::Bag bag;
        const auto ru = resolve_(u, bag);

        bool ok = true;
        ok &= require_(!ru.ok, "narrowed override must fail");
        ok &= require_(bag.has_code(diag::Code::kOverrideNarrowsVisibility), "expected OverrideNarrowsVisibility");
        uint32_t narrowed = 0;
        for (const auto& d : bag.diags()) {
            if (d.code() != diag::Code::kOverrideNarrowsVisibility) continue;
            ++narrowed;
            ok &= require_(d.args().size() == 3 && d.args()[0] == "B" && d.args()[1] == "greet" &&
                           d.args()[2] == "public", "diagnostic names class, method and required visibility");
        }
        ok &= require_(narrowed == 1, "only greet is reported");
        ok &= require_(!bag.has_code(diag::Code::kOverrideSignatureMismatch), "signatures are compatible");
        return ok;
    }

    static bool test_override_signature_mismatch() {
        ast::Unit u{};
        u.name = "app";
        ast::Builder b(u);

        b.emit(b.class_stmt(b.class_("Base", "", {}, {
            b.method(Visibility::kPublic, "take", {b.param("n", "int")}, "int", {b.ret(b.var("n"))}),
            b.method(Visibility::kPublic, "pair", {b.param("a", "int"), b.param("b", "int")}, "int",
                     {b.ret(b.var("a"))}),
            b.method(Visibility::kPublic, "label", {}, "string", {b.ret(b.str("base"))}),
        })));
        b.emit(b.class_stmt(b.class_("Child", "Base", {}, {
            // int is not accepted by a string parameter
            b.method(Visibility::kPublic, "take", {b.param("n", "string")}, "int", {b.ret(b.int_(0))}),
            // fewer parameters than the parent
            b.method(Visibility::kPublic, "pair", {b.param("a", "int")}, "int", {b.ret(b.var("a"))}),
            // return type is not a subtype
            b.method(Visibility::kPublic, "label", {}, "int", {b.ret(b.int_(1))}),
        })));

        diag::Bag bag;
        const auto ru = resolve_(u, bag);

        bool ok = true;
        ok &= require_(!ru.ok, "incompatible overrides must fail");
        uint32_t mismatched = 0;
        for (const auto& d : bag.diags()) {
            if (d.code() != diag::Code::kOverrideSignatureMismatch) continue;
            ++mismatched;
            ok &= require_(d.args().size() == 3 && d.args()[0] == "Child" && d.args()[2] == "Base",
                           "diagnostic names both classes");
        }
        ok &= require_(mismatched == 3, "each incompatible override is reported once");
        ok &= require_(!bag.has_code(diag::Code::kOverrideNarrowsVisibility), "visibility is unchanged");
        return ok;
    }

    static bool test_private_property_not_accessible() {
        ast::Unit u{};
        u.name = "app";
        ast::Builder b(u);

        b.emit(b.class_stmt(b.class_("P", "", {b.property(Visibility::kPrivate, "x", "int", b.int_(1))}, {})));
        b.emit(b.expr(b.assign(b.var("p"), b.new_("P", {}))));
        b.emit(b.echo({b.prop(b.var("p"), "x")}));

        diag::Bag bag;
        const auto ru = resolve_(u, bag);
        bool ok = true;
        ok &= require_(!ru.ok, "private access must fail");
        ok &= require_(bag.has_code(diag::Code::kMemberNotAccessible), "expected MemberNotAccessible");
        ok &= require_(bag.count_kind(diag::ErrorKind::kVisibilityViolation) >= 1, "taxonomy is visibility");
        return ok;
    }

    static bool test_missing_interface_method() {
        ast::Unit u{};
        u.name = "app";
        ast::Builder b(u);

        b.emit(b.class_stmt(b.interface_("Shape", {b.abstract_method("area", {}, "float")})));
        ast::ClassDecl sq = b.class_("Square", "", {}, {});
        sq.interfaces.push_back("Shape");
        b.emit(b.class_stmt(sq));

        diag::Bag bag;
        const auto ru = resolve_(u, bag);
        return require_(!ru.ok && bag.has_code(diag::Code::kMissingInterfaceMethod),
                        "Square must implement Shape::area");
    }

    static bool test_unsupported_constructs() {
        ast::Unit u{};
        u.name = "app";
        ast::Builder b(u);
        b.emit(b.expr(b.eval(b.str("echo 1;"))));
        b.emit(b.global("g"));

        diag::Bag bag;
        const auto ru = resolve_(u, bag);
        bool ok = true;
        ok &= require_(!ru.ok, "eval / global must fail");
        ok &= require_(bag.count_kind(diag::ErrorKind::kUnsupportedConstruct) == 2, "two unsupported constructs");
        return ok;
    }

    static bool test_unknown_attribute_is_warning() {
        ast::Unit u{};
        u.name = "app";
        ast::Builder b(u);
        ast::FnDecl f = b.function("f", {}, "int", {b.ret(b.int_(1))});
        f.attrs.push_back(b.attr("Pure"));
        b.emit(b.fn_stmt(f));

        diag::Bag bag;
        const auto ru = resolve_(u, bag);
        bool ok = true;
        ok &= require_(ru.ok, "a warning does not fail the unit");
        ok &= require_(bag.has_code(diag::Code::kUnknownAttribute), "expected UnknownAttribute warning");
        ok &= require_(!bag.has_error(), "warnings are not errors");
        return ok;
    }

    static bool test_ffi_prototype_checked() {
        ast::Unit u{};
        u.name = "app";
        ast::Builder b(u);

        ast::FnDecl good = b.function("c_sqrt", {b.param("x", "float")}, "float", {});
        good.attrs.push_back(b.attr("ffi", {b.str("m"), b.str("double sqrt(double)")}));
        b.emit(b.fn_stmt(good));

        ast::FnDecl bad = b.function("c_floor", {b.param("x", "int")}, "float", {});
        bad.attrs.push_back(b.attr("ffi", {b.str("m"), b.str("double floor(double)")}));
        b.emit(b.fn_stmt(bad));

        diag::Bag bag;
        const auto ru = resolve_(u, bag);

        bool ok = true;
        ok &= require_(bag.has_code(diag::Code::kFfiSignatureMismatch), "int parameter vs double must mismatch");
        ok &= require_(bag.error_count() == 1, "only c_floor is wrong");
        auto sym = ru.table.lookup_function("c_sqrt");
        ok &= require_(sym.has_value(), "c_sqrt must be declared");
        if (sym) {
            const auto& s = ru.table.symbol(*sym);
            ok &= require_(s.kind == sema::SymbolKind::kForeign, "c_sqrt is foreign");
            ok &= require_(s.foreign_symbol == "sqrt" && s.foreign_lib == "m", "C name and library recorded");
        }
        return ok;
    }

    static bool test_export_dump_idempotent() {
        ast::Unit u{};
        u.name = "lib";
        ast::Builder b(u);
        b.emit(b.fn_stmt(add_fn_(b)));
        b.emit(b.class_stmt(b.class_("Point", "", {
            b.property(Visibility::kPublic, "x", "int", b.int_(0)),
            b.property(Visibility::kPublic, "y", "int", b.int_(0)),
        }, {
            b.method(Visibility::kPublic, "sum", {}, "int",
                     {b.ret(b.bin(BinOp::kAdd, b.prop(b.this_(), "x"), b.prop(b.this_(), "y")))}),
        })));

        diag::Bag bag1, bag2;
        const auto r1 = resolve_(u, bag1);
        const auto r2 = resolve_(u, bag2);

        bool ok = true;
        ok &= require_(r1.ok && r2.ok, "lib must resolve");
        const std::string d1 = resolve::dump_exports(r1);
        const std::string d2 = resolve::dump_exports(r2);
        ok &= require_(d1 == d2, "export dumps must be byte-identical");
        ok &= require_(d1.find("add") != std::string::npos, "dump lists add");
        ok &= require_(d1.find("Point") != std::string::npos, "dump lists Point");
        return ok;
    }

    /// @brief 다른 단위의 export table을 의존으로 넘기면 그 함수를 부를 수 있다.
    static bool test_cross_unit_import() {
        ast::Unit lib{};
        lib.name = "lib";
        {
            ast::Builder b(lib);
            b.emit(b.fn_stmt(b.function("greet", {b.param("who", "string")}, "string",
                                        {b.ret(b.bin(BinOp::kConcat, b.str("hi "), b.var("who")))})));
        }
        diag::Bag lib_bag;
        const auto lib_ru = resolve_(lib, lib_bag);

        ast::Unit app{};
        app.name = "app";
        ast::Builder b(app);
        const ast::ExprId call = b.call("greet", {b.str("bob")});
        b.emit(b.echo({call}));

        bool ok = true;
        ok &= require_(lib_ru.ok && lib_ru.exports != nullptr, "lib must resolve and export");

        diag::Bag without;
        const auto alone = resolve_(app, without);
        ok &= require_(!alone.ok && without.has_code(diag::Code::kUnresolvedFunction),
                       "greet is unknown without the lib dependency");

        diag::Bag with;
        const auto linked = resolve_(app, with, {lib_ru.exports});
        ok &= require_(linked.ok, "greet resolves through the lib exports");
        auto it = linked.calls.find(call);
        ok &= require_(it != linked.calls.end() && it->second.kind == resolve::CallKind::kFunction,
                       "imported function is still a direct call");
        if (it != linked.calls.end()) {
            ok &= require_(linked.table.symbol(it->second.callee).imported, "callee symbol is marked imported");
        }
        return ok;
    }

    static bool test_error_bound_truncates() {
        ast::Unit u{};
        u.name = "app";
        ast::Builder b(u);
        for (int i = 0; i < 5; ++i) b.emit(b.expr(b.call("missing_" + std::to_string(i), {})));

        diag::Bag bag(2);
        const auto ru = resolve_(u, bag);

        bool ok = true;
        ok &= require_(!ru.ok, "unit must fail");
        ok &= require_(bag.truncated(), "bag must be truncated");
        ok &= require_(bag.has_code(diag::Code::kTooManyErrors), "TooManyErrors recorded once");
        ok &= require_(bag.error_count() == 2, "only max_errors errors are kept");
        ok &= require_(bag.dropped_count() == 3, "the rest are dropped");
        return ok;
    }

    static bool test_use_of_this_outside_class() {
        ast::Unit u{};
        u.name = "app";
        ast::Builder b(u);
        b.emit(b.echo({b.prop(b.this_(), "x")}));

        diag::Bag bag;
        const auto ru = resolve_(u, bag);
        return require_(!ru.ok && bag.has_code(diag::Code::kThisOutsideClass), "$this at top level");
    }

} // namespace

int main() {
    struct Case {
        const char* name;
        bool (*fn)();
    };

    const Case cases[] = {
        {"function_call_binds_direct", test_function_call_binds_direct},
        {"unresolved_function_reported", test_unresolved_function_reported},
        {"arg_count_mismatch", test_arg_count_mismatch},
        {"arg_type_mismatch", test_arg_type_mismatch},
        {"parent_call_binds_immediate_parent", test_parent_call_binds_immediate_parent},
        {"virtual_call_uses_vtable_slot", test_virtual_call_uses_vtable_slot},
        {"override_narrows_visibility", test_override_narrows_visibility},
        {"override_signature_mismatch", test_override_signature_mismatch},
        {"private_property_not_accessible", test_private_property_not_accessible},
        {"missing_interface_method", test_missing_interface_method},
        {"unsupported_constructs", test_unsupported_constructs},
        {"unknown_attribute_is_warning", test_unknown_attribute_is_warning},
        {"ffi_prototype_checked", test_ffi_prototype_checked},
        {"export_dump_idempotent", test_export_dump_idempotent},
        {"cross_unit_import", test_cross_unit_import},
        {"error_bound_truncates", test_error_bound_truncates},
        {"use_of_this_outside_class", test_use_of_this_outside_class},
    };

    int failed = 0;
    for (const auto& tc : cases) {
        std::cout << "[TEST] " << tc.name << "\n";
        const bool ok = tc.fn();
        if (!ok) {
            ++failed;
            std::cout << "  -> FAIL\n";
        } else {
            std::cout << "  -> PASS\n";
        }
    }

    if (failed != 0) {
        std::cout << "FAILED: " << failed << " test(s)\n";
        return 1;
    }
    std::cout << "ALL RESOLVE TESTS PASSED\n";
    return 0;
}
