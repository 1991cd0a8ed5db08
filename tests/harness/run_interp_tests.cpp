#include <php2ir/ast/Builder.hpp>
#include <php2ir/diag/Render.hpp>
#include <php2ir/driver/Pipeline.hpp>
#include <php2ir/lir/Interp.hpp>

#include <iostream>
#include <string>
#include <vector>

namespace {

    using namespace php2ir;
    using ast::BinOp;
    using ast::CatchSpec;
    using ast::IncDec;
    using ast::Visibility;

    static bool require_(bool cond, const char* msg) {
        if (cond) return true;
        std::cerr << "  - " << msg << "\n";
        return false;
    }

    /// @brief 단위 하나를 entry로 컴파일하고 끝까지 실행한다. 컴파일 실패는 error에 담긴다.
    static lir::InterpResult run_(const ast::Unit& u) {
        driver::UnitSource src{};
        src.unit = &u;
        src.entry = true;
        const driver::PipelineResult pr = driver::compile_program({src});

        if (!pr.ok) {
            for (const auto& r : pr.units) {
                for (const auto& d : r.bag.diags()) {
                    std::cerr << "    " << r.name << ": " << diag::render_message(d, diag::Language::kEn) << "\n";
                }
            }
            for (const auto& e : pr.internal_errors) std::cerr << "    internal: " << e << "\n";
            lir::InterpResult bad{};
            bad.error = "compile failed";
            return bad;
        }
        lir::InterpResult r = lir::run_program(pr.modules(), pr.main_symbol);
        if (!r.error.empty()) std::cerr << "    interp: " << r.error << "\n";
        return r;
    }

    static bool ran_clean_(const lir::InterpResult& r) {
        bool ok = true;
        ok &= require_(r.ok && r.error.empty(), "program must run to the end");
        ok &= require_(!r.uncaught, "no uncaught exception expected");
        ok &= require_(r.leaked == 0, "every heap cell must be freed");
        return ok;
    }

    static bool expect_output_(const lir::InterpResult& r, const std::string& want) {
        if (r.output == want) return true;
        std::cerr << "  - output mismatch\n    want: [" << want << "]\n    got:  [" << r.output << "]\n";
        return false;
    }

    static bool test_scalar_echo_formatting() {
        ast::Unit u{};
        u.name = "app";
        ast::Builder b(u);
        b.emit(b.echo({b.int_(42), b.str(" ")}));
        b.emit(b.echo({b.float_(2.5), b.str(" ")}));
        b.emit(b.echo({b.bin(BinOp::kAdd, b.float_(0.1), b.float_(0.2)), b.str(" ")}));
        b.emit(b.echo({b.bin(BinOp::kDiv, b.int_(7), b.int_(2)), b.str(" ")}));
        b.emit(b.echo({b.bool_(true), b.str("|"), b.bool_(false), b.str("|")}));
        b.emit(b.echo({b.bin(BinOp::kPow, b.int_(2), b.int_(10))}));

        const auto r = run_(u);
        bool ok = ran_clean_(r);
        ok &= expect_output_(r, "42 2.5 0.3 3.5 1||1024");
        return ok;
    }

    static bool test_strings_concat_and_interp() {
        ast::Unit u{};
        u.name = "app";
        ast::Builder b(u);
        b.emit(b.expr(b.assign(b.var("name"), b.str("world"))));
        b.emit(b.expr(b.assign(b.var("n"), b.int_(3))));
        b.emit(b.echo({b.bin(BinOp::kConcat, b.str("hello "), b.var("name")), b.str("\n")}));
        b.emit(b.echo({b.interp({b.str("n="), b.var("n"), b.str(" name="), b.var("name")}), b.str("\n")}));
        b.emit(b.expr(b.assign_op(BinOp::kConcat, b.var("name"), b.str("!"))));
        b.emit(b.echo({b.var("name"), b.str(" "), b.call("strlen", {b.var("name")})}));

        const auto r = run_(u);
        bool ok = ran_clean_(r);
        ok &= expect_output_(r, "hello world\nn=3 name=world\nworld! 6");
        return ok;
    }

    static bool test_loops_and_branches() {
        ast::Unit u{};
        u.name = "app";
        ast::Builder b(u);
        b.emit(b.fn_stmt(b.function("sum_to", {b.param("n", "int")}, "int", {
            b.expr(b.assign(b.var("s"), b.int_(0))),
            b.for_({b.assign(b.var("i"), b.int_(1))}, {b.bin(BinOp::kLe, b.var("i"), b.var("n"))},
                   {b.incdec(IncDec::kPostInc, b.var("i"))},
                   {b.expr(b.assign_op(BinOp::kAdd, b.var("s"), b.var("i")))}),
            b.ret(b.var("s")),
        })));
        b.emit(b.expr(b.assign(b.var("k"), b.int_(0))));
        b.emit(b.while_(b.bool_(true), {
            b.expr(b.incdec(IncDec::kPreInc, b.var("k"))),
            b.if_(b.bin(BinOp::kGe, b.var("k"), b.int_(4)), {b.break_()}),
        }));
        b.emit(b.echo({b.call("sum_to", {b.int_(10)}), b.str(" "), b.var("k")}));

        const auto r = run_(u);
        bool ok = ran_clean_(r);
        ok &= expect_output_(r, "55 4");
        return ok;
    }

    static bool test_arrays() {
        ast::Unit u{};
        u.name = "app";
        ast::Builder b(u);
        b.emit(b.expr(b.assign(b.var("m"), b.map({b.str("a"), b.str("b")}, {b.int_(1), b.int_(2)}))));
        b.emit(b.expr(b.assign(b.index(b.var("m"), b.str("c")), b.int_(3))));
        b.emit(b.expr(b.assign(b.var("xs"), b.list({b.str("x"), b.str("y")}))));
        b.emit(b.expr(b.assign(b.push_target(b.var("xs")), b.str("z"))));
        b.emit(b.echo({b.index(b.var("m"), b.str("b")), b.str(" "), b.call("count", {b.var("m")}), b.str(" ")}));
        b.emit(b.echo({b.call("implode", {b.str(","), b.var("xs")}), b.str(" ")}));
        b.emit(b.foreach(b.var("m"), "k", "v", {b.echo({b.var("k"), b.var("v")})}));

        const auto r = run_(u);
        bool ok = ran_clean_(r);
        ok &= expect_output_(r, "2 3 x,y,z a1b2c3");
        return ok;
    }

    static bool test_array_copy_on_assignment() {
        ast::Unit u{};
        u.name = "app";
        ast::Builder b(u);
        b.emit(b.expr(b.assign(b.var("a"), b.list({b.int_(1), b.int_(2)}))));
        b.emit(b.expr(b.assign(b.var("b"), b.var("a"))));
        b.emit(b.expr(b.assign(b.push_target(b.var("b")), b.int_(3))));
        b.emit(b.echo({b.call("count", {b.var("a")}), b.str(" "), b.call("count", {b.var("b")})}));

        const auto r = run_(u);
        bool ok = ran_clean_(r);
        ok &= expect_output_(r, "2 3");
        return ok;
    }

    static bool test_objects_and_virtual_calls() {
        ast::Unit u{};
        u.name = "app";
        ast::Builder b(u);
        b.emit(b.class_stmt(b.class_("Animal", "", {b.property(Visibility::kProtected, "name", "string", b.str(""))}, {
            b.method(Visibility::kPublic, "__construct", {b.param("name", "string")}, "",
                     {b.expr(b.assign(b.prop(b.this_(), "name"), b.var("name")))}),
            b.method(Visibility::kPublic, "speak", {}, "string", {b.ret(b.str("..."))}),
            b.method(Visibility::kPublic, "intro", {}, "string",
                     {b.ret(b.bin(BinOp::kConcat, b.prop(b.this_(), "name"),
                                  b.bin(BinOp::kConcat, b.str(" says "), b.mcall(b.this_(), "speak", {}))))}),
        })));
        b.emit(b.class_stmt(b.class_("Dog", "Animal", {}, {
            b.method(Visibility::kPublic, "speak", {}, "string", {b.ret(b.str("woof"))}),
        })));
        b.emit(b.fn_stmt(b.function("describe", {b.param("a", "Animal")}, "string",
                                    {b.ret(b.mcall(b.var("a"), "intro", {}))})));
        b.emit(b.echo({b.call("describe", {b.new_("Dog", {b.str("rex")})}), b.str("\n")}));
        b.emit(b.echo({b.call("describe", {b.new_("Animal", {b.str("cat")})}), b.str("\n")}));
        b.emit(b.expr(b.assign(b.var("d"), b.new_("Dog", {b.str("fido")}))));
        b.emit(b.echo({b.instance_of(b.var("d"), "Animal"), b.str("|"), b.instance_of(b.var("d"), "Exception")}));

        const auto r = run_(u);
        bool ok = ran_clean_(r);
        ok &= expect_output_(r, "rex says woof\ncat says ...\n1|");
        return ok;
    }

    static bool test_exception_caught() {
        ast::Unit u{};
        u.name = "app";
        ast::Builder b(u);
        b.emit(b.try_({b.throw_(b.new_("Exception", {b.str("boom")})), b.echo({b.str("unreached")})},
                      {CatchSpec{{"Exception"}, "e", {b.echo({b.str("caught "), b.mcall(b.var("e"), "getMessage", {})})}}}));
        b.emit(b.echo({b.str(" after")}));

        const auto r = run_(u);
        bool ok = ran_clean_(r);
        ok &= expect_output_(r, "caught boom after");
        return ok;
    }

    static bool test_catch_by_parent_class() {
        ast::Unit u{};
        u.name = "app";
        ast::Builder b(u);
        b.emit(b.fn_stmt(b.function("modulo", {b.param("a", "int"), b.param("b", "int")}, "int",
                                    {b.ret(b.bin(BinOp::kMod, b.var("a"), b.var("b")))})));
        b.emit(b.try_finally(
            {b.echo({b.call("modulo", {b.int_(7), b.int_(0)})})},
            {
                CatchSpec{{"TypeError"}, "e", {b.echo({b.str("type")})}},
                CatchSpec{{"ArithmeticError"}, "e", {b.echo({b.str("arith: "), b.mcall(b.var("e"), "getMessage", {})})}},
            },
            {b.echo({b.str(" / finally")})}));

        const auto r = run_(u);
        bool ok = ran_clean_(r);
        ok &= expect_output_(r, "arith: Modulo by zero / finally");
        return ok;
    }

    static bool test_exception_crosses_functions() {
        ast::Unit u{};
        u.name = "app";
        ast::Builder b(u);
        b.emit(b.fn_stmt(b.function("inner", {}, "int", {
            b.throw_(b.new_("Exception", {b.str("deep"), b.int_(7)})),
        })));
        b.emit(b.fn_stmt(b.function("outer", {}, "int", {
            b.expr(b.assign(b.var("s"), b.str("held"))),
            b.ret(b.bin(BinOp::kAdd, b.call("inner", {}), b.int_(1))),
        })));
        b.emit(b.try_({b.echo({b.call("outer", {})})},
                      {CatchSpec{{"Exception"}, "e", {b.echo({b.mcall(b.var("e"), "getCode", {})})}}}));

        const auto r = run_(u);
        bool ok = ran_clean_(r);
        ok &= expect_output_(r, "7");
        return ok;
    }

    static bool test_match_expression() {
        ast::Unit u{};
        u.name = "app";
        ast::Builder b(u);
        b.emit(b.fn_stmt(b.function("size", {b.param("n", "int")}, "string", {
            b.ret(b.match(b.var("n"), {
                ast::ArmSpec{{b.int_(1), b.int_(2)}, b.str("small"), false},
                ast::ArmSpec{{b.int_(3)}, b.str("three"), false},
                ast::ArmSpec{{}, b.str("big"), true},
            })),
        })));
        b.emit(b.echo({b.call("size", {b.int_(2)}), b.str(" "), b.call("size", {b.int_(3)}), b.str(" "),
                       b.call("size", {b.int_(9)})}));

        const auto r = run_(u);
        bool ok = ran_clean_(r);
        ok &= expect_output_(r, "small three big");
        return ok;
    }

    static bool test_missing_array_key_reads_null() {
        ast::Unit u{};
        u.name = "app";
        ast::Builder b(u);
        b.emit(b.expr(b.assign(b.var("m"), b.map({b.str("a")}, {b.int_(1)}))));
        b.emit(b.expr(b.assign(b.var("l"), b.list({b.int_(1), b.int_(2)}))));
        b.emit(b.echo({b.ternary(b.call("is_null", {b.index(b.var("m"), b.str("zz"))}), b.str("N"), b.str("V"))}));
        b.emit(b.echo({b.ternary(b.bin(BinOp::kIdentical, b.index(b.var("m"), b.str("zz")), b.null_()),
                                 b.str("N"), b.str("V"))}));
        b.emit(b.echo({b.str("["), b.index(b.var("m"), b.str("zz")), b.str("]")}));
        b.emit(b.echo({b.ternary(b.call("is_null", {b.index(b.var("l"), b.int_(5))}), b.str("N"), b.str("V"))}));
        b.emit(b.echo({b.ternary(b.call("is_null", {b.index(b.var("m"), b.str("a"))}), b.str("N"), b.str("V"))}));
        b.emit(b.echo({b.index(b.var("l"), b.int_(1))}));

        const auto r = run_(u);
        bool ok = ran_clean_(r);
        ok &= expect_output_(r, "NN[]NV2");
        return ok;
    }

    static bool test_unmatched_match_throws() {
        ast::Unit u{};
        u.name = "app";
        ast::Builder b(u);
        b.emit(b.fn_stmt(b.function("size", {b.param("n", "int")}, "string", {
            b.ret(b.match(b.var("n"), {
                ast::ArmSpec{{b.int_(1)}, b.str("one"), false},
                ast::ArmSpec{{b.int_(2)}, b.str("two"), false},
            })),
        })));
        b.emit(b.echo({b.call("size", {b.int_(2)})}));
        b.emit(b.echo({b.call("size", {b.int_(5)})}));
        b.emit(b.echo({b.str("unreached")}));

        const auto r = run_(u);
        bool ok = true;
        ok &= require_(r.ok && r.error.empty(), "run ends normally");
        ok &= require_(r.uncaught, "no arm matches and there is no default");
        ok &= require_(r.uncaught_class == "UnhandledMatchError", "error class");
        ok &= require_(r.uncaught_message.find("Unhandled match case") != std::string::npos, "error message");
        ok &= expect_output_(r, "two");
        ok &= require_(r.leaked == 0, "no leaks");
        return ok;
    }

    static bool test_uncaught_exception_exit_code() {
        ast::Unit u{};
        u.name = "app";
        ast::Builder b(u);
        b.emit(b.echo({b.str("before")}));
        b.emit(b.throw_(b.new_("Exception", {b.str("fatal")})));
        b.emit(b.echo({b.str("after")}));

        const auto r = run_(u);
        bool ok = true;
        ok &= require_(r.ok && r.error.empty(), "an uncaught exception still ends the run normally");
        ok &= require_(r.uncaught, "uncaught exception is reported");
        ok &= require_(r.exit_code == 255, "uncaught exit code");
        ok &= require_(r.uncaught_class == "Exception", "class is reported");
        ok &= require_(r.uncaught_message == "fatal", "message is reported");
        ok &= expect_output_(r, "before");
        ok &= require_(r.leaked == 0, "pending exception is released at shutdown");
        return ok;
    }

} // namespace

int main() {
    struct Case {
        const char* name;
        bool (*fn)();
    };

    const Case cases[] = {
        {"scalar_echo_formatting", test_scalar_echo_formatting},
        {"strings_concat_and_interp", test_strings_concat_and_interp},
        {"loops_and_branches", test_loops_and_branches},
        {"arrays", test_arrays},
        {"array_copy_on_assignment", test_array_copy_on_assignment},
        {"objects_and_virtual_calls", test_objects_and_virtual_calls},
        {"exception_caught", test_exception_caught},
        {"catch_by_parent_class", test_catch_by_parent_class},
        {"exception_crosses_functions", test_exception_crosses_functions},
        {"match_expression", test_match_expression},
        {"unmatched_match_throws", test_unmatched_match_throws},
        {"missing_array_key_reads_null", test_missing_array_key_reads_null},
        {"uncaught_exception_exit_code", test_uncaught_exception_exit_code},
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
    std::cout << "ALL INTERP TESTS PASSED\n";
    return 0;
}
