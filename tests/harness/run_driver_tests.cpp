#include <php2ir/ast/Builder.hpp>
#include <php2ir/diag/Render.hpp>
#include <php2ir/driver/Pipeline.hpp>
#include <php2ir/lir/Interp.hpp>
#include <php2ir/resolve/Prelude.hpp>

#include <atomic>
#include <iostream>
#include <string>
#include <string_view>
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

    static bool has_code_(const driver::UnitResult* r, diag::Code c) {
        if (r == nullptr) return false;
        for (const auto& d : r->bag.diags()) {
            if (d.code() == c) return true;
        }
        return false;
    }

    static void dump_diags_(const driver::PipelineResult& pr) {
        for (const auto& r : pr.units) {
            for (const auto& d : r.bag.diags()) {
                std::cerr << "    " << r.name << ": " << diag::render_message(d, diag::Language::kEn) << "\n";
            }
        }
        for (const auto& e : pr.internal_errors) std::cerr << "    internal: " << e << "\n";
    }

    /// @brief lib: greet() 함수와 Counter 클래스를 내보낸다.
    static void build_lib_(ast::Unit& u) {
        u.name = "lib";
        ast::Builder b(u);
        b.emit(b.fn_stmt(b.function("greet", {b.param("who", "string")}, "string",
                                    {b.ret(b.bin(BinOp::kConcat, b.str("hello "), b.var("who")))})));
        b.emit(b.class_stmt(b.class_("Counter", "", {b.property(Visibility::kPrivate, "n", "int", b.int_(0))}, {
            b.method(Visibility::kPublic, "bump", {}, "int", {
                b.expr(b.assign_op(BinOp::kAdd, b.prop(b.this_(), "n"), b.int_(1))),
                b.ret(b.prop(b.this_(), "n")),
            }),
        })));
    }

    static void build_app_(ast::Unit& u) {
        u.name = "app";
        ast::Builder b(u);
        b.emit(b.echo({b.call("greet", {b.str("php2ir")}), b.str("\n")}));
        b.emit(b.expr(b.assign(b.var("c"), b.new_("Counter", {}))));
        b.emit(b.expr(b.mcall(b.var("c"), "bump", {})));
        b.emit(b.echo({b.mcall(b.var("c"), "bump", {})}));
    }

    static void build_empty_(ast::Unit& u, std::string_view name) {
        u.name = std::string(name);
        ast::Builder b(u);
        b.emit(b.echo({b.str(name)}));
    }

    static bool test_prelude_compiles_alone() {
        const ast::Unit prelude = resolve::build_prelude_unit();
        const auto r = driver::compile_unit(prelude, {}, false);

        bool ok = true;
        ok &= require_(r.ok, "prelude must compile");
        ok &= require_(r.internal_errors.empty(), "no internal errors");
        ok &= require_(r.exports != nullptr, "prelude publishes an export table");
        ok &= require_(!r.module.classes.empty(), "prelude defines the throwable classes");
        return ok;
    }

    static bool test_multi_unit_program() {
        ast::Unit lib{}, app{};
        build_lib_(lib);
        build_app_(app);

        driver::UnitSource app_src{&app, {"lib"}, true};
        driver::UnitSource lib_src{&lib, {}, false};
        const auto pr = driver::compile_program({app_src, lib_src});
        if (!pr.ok) dump_diags_(pr);

        bool ok = true;
        ok &= require_(pr.ok, "program must compile");
        ok &= require_(pr.units.size() == 3, "prelude plus two units");
        if (pr.units.size() == 3) {
            ok &= require_(pr.units[0].name == resolve::k_prelude_unit_name, "prelude comes first");
            ok &= require_(pr.units[1].name == "app" && pr.units[2].name == "lib", "then input order");
        }
        ok &= require_(pr.main_symbol == "php_main_app", "entry unit provides main");
        const driver::UnitResult* a = pr.find("app");
        ok &= require_(a != nullptr && a->entry && a->module.emit_entry, "entry unit emits the C main wrapper");
        if (!pr.ok) return false;

        const lir::InterpResult r = lir::run_program(pr.modules(), pr.main_symbol);
        if (!r.error.empty()) std::cerr << "    interp: " << r.error << "\n";
        ok &= require_(r.ok && r.error.empty(), "program must run");
        ok &= require_(r.output == "hello php2ir\n2", "cross-unit call and class work");
        ok &= require_(r.leaked == 0, "no leaks");
        return ok;
    }

    static bool test_unknown_dependency() {
        ast::Unit app{};
        build_empty_(app, "app");
        const auto pr = driver::compile_program({driver::UnitSource{&app, {"nowhere"}, true}});

        const driver::UnitResult* a = pr.find("app");
        bool ok = true;
        ok &= require_(!pr.ok, "program must fail");
        ok &= require_(a != nullptr && !a->ok, "unit is not compiled");
        ok &= require_(has_code_(a, diag::Code::kUnknownDependency), "unknown dependency is reported");
        ok &= require_(pr.main_symbol.empty(), "no main without a compiled entry unit");
        return ok;
    }

    static bool test_dependency_cycle() {
        ast::Unit a{}, b{}, c{}, d{};
        build_empty_(a, "a");
        build_empty_(b, "b");
        build_empty_(c, "c");
        build_empty_(d, "d");

        const auto pr = driver::compile_program({
            driver::UnitSource{&a, {"b"}, false},
            driver::UnitSource{&b, {"a"}, false},
            driver::UnitSource{&c, {"a"}, false},
            driver::UnitSource{&d, {}, true},
        });

        bool ok = true;
        ok &= require_(!pr.ok, "program must fail");
        ok &= require_(has_code_(pr.find("a"), diag::Code::kDependencyCycle), "a is on the cycle");
        ok &= require_(has_code_(pr.find("b"), diag::Code::kDependencyCycle), "b is on the cycle");
        ok &= require_(has_code_(pr.find("c"), diag::Code::kDependencyCycle), "c depends on the cycle");
        const driver::UnitResult* dr = pr.find("d");
        ok &= require_(dr != nullptr && dr->ok, "independent unit still compiles");
        ok &= require_(pr.main_symbol == "php_main_d", "independent entry unit provides main");
        return ok;
    }

    static bool test_cancel_before_start() {
        ast::Unit app{};
        build_empty_(app, "app");
        std::atomic<bool> cancel{true};
        driver::PipelineOptions opt{};
        opt.cancel = &cancel;

        const auto pr = driver::compile_program({driver::UnitSource{&app, {}, true}}, opt);
        const driver::UnitResult* a = pr.find("app");

        bool ok = true;
        ok &= require_(!pr.ok, "cancelled program is not ok");
        ok &= require_(has_code_(a, diag::Code::kCancelled), "unit reports cancellation");
        if (a != nullptr && !a->bag.diags().empty()) {
            const auto& d = a->bag.diags().front();
            ok &= require_(!d.args().empty() && d.args()[0] == "resolve", "cancelled before resolve");
        }
        return ok;
    }

    static std::vector<std::string> printed_(const driver::PipelineResult& pr) {
        std::vector<std::string> out;
        for (const auto& u : pr.units) out.push_back(u.name + "\n" + lir::print(u.module));
        return out;
    }

    static bool test_worker_count_does_not_change_output() {
        ast::Unit lib{}, app{}, extra{};
        build_lib_(lib);
        build_app_(app);
        build_empty_(extra, "extra");

        const std::vector<driver::UnitSource> srcs = {
            driver::UnitSource{&lib, {}, false},
            driver::UnitSource{&extra, {"lib"}, false},
            driver::UnitSource{&app, {"lib", "extra"}, true},
        };

        driver::PipelineOptions one{};
        one.workers = 1;
        driver::PipelineOptions four{};
        four.workers = 4;

        const auto p1 = driver::compile_program(srcs, one);
        const auto p4 = driver::compile_program(srcs, four);

        bool ok = true;
        ok &= require_(p1.ok && p4.ok, "both runs compile");
        ok &= require_(printed_(p1) == printed_(p4), "modules are identical regardless of worker count");
        ok &= require_(p1.main_symbol == p4.main_symbol, "same main");
        return ok;
    }

} // namespace

int main() {
    struct Case {
        const char* name;
        bool (*fn)();
    };

    const Case cases[] = {
        {"prelude_compiles_alone", test_prelude_compiles_alone},
        {"multi_unit_program", test_multi_unit_program},
        {"unknown_dependency", test_unknown_dependency},
        {"dependency_cycle", test_dependency_cycle},
        {"cancel_before_start", test_cancel_before_start},
        {"worker_count_does_not_change_output", test_worker_count_does_not_change_output},
    };

    int failed = 0;
    for (const auto& tc : cases) {
        std::cout << "[TEST] " << tc.name << "\n";
        const bool ok = tc.fn();
        std::cout << (ok ? "  -> PASS\n" : "  -> FAIL\n");
        if (!ok) ++failed;
    }

    if (failed != 0) {
        std::cout << "FAILED: " << failed << " test(s)\n";
        return 1;
    }
    std::cout << "ALL DRIVER TESTS PASSED\n";
    return 0;
}
