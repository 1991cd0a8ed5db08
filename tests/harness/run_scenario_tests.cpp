#include <php2ir/ast/Builder.hpp>
#include <php2ir/diag/Render.hpp>
#include <php2ir/driver/Pipeline.hpp>
#include <php2ir/lir/Interp.hpp>
#include <php2ir/rt/RuntimeABI.hpp>

#include <iostream>
#include <string>
#include <vector>

namespace {

    using namespace php2ir;
    using ast::BinOp;
    using ast::CaseSpec;
    using ast::IncDec;
    using ast::Visibility;

    static bool require_(bool cond, const char* msg) {
        if (cond) return true;
        std::cerr << "  - " << msg << "\n";
        return false;
    }

    static driver::PipelineResult compile_(const ast::Unit& u) {
        driver::UnitSource src{};
        src.unit = &u;
        src.entry = true;
        driver::PipelineResult pr = driver::compile_program({src});
        for (const auto& r : pr.units) {
            for (const auto& d : r.bag.diags()) {
                std::cerr << "    " << r.name << ": " << diag::render_message(d, diag::Language::kEn) << "\n";
            }
        }
        for (const auto& e : pr.internal_errors) std::cerr << "    internal: " << e << "\n";
        return pr;
    }

    static bool check_run_(const driver::PipelineResult& pr, const std::string& want) {
        bool ok = true;
        ok &= require_(pr.ok, "program must compile");
        if (!pr.ok) return false;

        const lir::InterpResult r = lir::run_program(pr.modules(), pr.main_symbol);
        ok &= require_(r.ok && r.error.empty(), "program must run to the end");
        if (!r.error.empty()) std::cerr << "    interp: " << r.error << "\n";
        ok &= require_(!r.uncaught, "no uncaught exception expected");
        ok &= require_(r.leaked == 0, "every heap cell must be freed");
        if (r.output != want) {
            std::cerr << "  - output mismatch\n    want: [" << want << "]\n    got:  [" << r.output << "]\n";
            ok = false;
        }
        return ok;
    }

    static ast::FnDecl int_binop_(ast::Builder& b, const char* name, BinOp op) {
        return b.function(name, {b.param("a", "int"), b.param("b", "int")}, "int",
                          {b.ret(b.bin(op, b.var("a"), b.var("b")))});
    }

    static ast::StmtId result_line_(ast::Builder& b, const char* label, const char* var) {
        return b.echo({b.interp({b.str(label), b.var(var)}), b.konst("PHP_EOL")});
    }

    /// @brief 산술 fixture: 여섯 함수 호출 결과를 PHP_EOL로 끝나는 줄로 출력한다.
    static bool test_arithmetic_fixture() {
        ast::Unit u{};
        u.name = "basic_arithmetic";
        ast::Builder b(u);
        b.emit(b.fn_stmt(int_binop_(b, "add", BinOp::kAdd)));
        b.emit(b.fn_stmt(int_binop_(b, "subtract", BinOp::kSub)));
        b.emit(b.fn_stmt(int_binop_(b, "multiply", BinOp::kMul)));
        b.emit(b.fn_stmt(int_binop_(b, "divide", BinOp::kDiv)));
        b.emit(b.fn_stmt(int_binop_(b, "modulo", BinOp::kMod)));
        b.emit(b.fn_stmt(int_binop_(b, "power", BinOp::kPow)));

        b.emit(b.expr(b.assign(b.var("result1"), b.call("add", {b.int_(10), b.int_(5)}))));
        b.emit(b.expr(b.assign(b.var("result2"), b.call("subtract", {b.int_(10), b.int_(5)}))));
        b.emit(b.expr(b.assign(b.var("result3"), b.call("multiply", {b.int_(10), b.int_(5)}))));
        b.emit(b.expr(b.assign(b.var("result4"), b.call("divide", {b.int_(10), b.int_(5)}))));
        b.emit(b.expr(b.assign(b.var("result5"), b.call("modulo", {b.int_(10), b.int_(3)}))));
        b.emit(b.expr(b.assign(b.var("result6"), b.call("power", {b.int_(2), b.int_(3)}))));

        b.emit(b.echo({b.str("Basic arithmetic test results:"), b.konst("PHP_EOL")}));
        b.emit(result_line_(b, "10 + 5 = ", "result1"));
        b.emit(result_line_(b, "10 - 5 = ", "result2"));
        b.emit(result_line_(b, "10 * 5 = ", "result3"));
        b.emit(result_line_(b, "10 / 5 = ", "result4"));
        b.emit(result_line_(b, "10 % 3 = ", "result5"));
        b.emit(result_line_(b, "2 ^ 3 = ", "result6"));

        const auto pr = compile_(u);
        bool ok = check_run_(pr,
                             "Basic arithmetic test results:\n"
                             "10 + 5 = 15\n"
                             "10 - 5 = 5\n"
                             "10 * 5 = 50\n"
                             "10 / 5 = 2\n"
                             "10 % 3 = 1\n"
                             "2 ^ 3 = 8\n");

        const driver::UnitResult* unit = pr.find("basic_arithmetic");
        ok &= require_(unit != nullptr, "unit result is recorded");
        if (unit == nullptr) return false;
        bool has_srem = false;
        for (const auto& f : unit->module.functions) {
            if (f.name != rt::mangle_function("modulo")) continue;
            for (const auto& blk : f.blocks) {
                for (const auto& inst : blk.insts) has_srem = has_srem || inst.op == lir::Opcode::kSRem;
            }
        }
        ok &= require_(has_srem, "modulo lowers to an integer remainder");
        return ok;
    }

    /// @brief foreach는 시작 시점의 배열을 돈다: 본문에서 늘려도 반복 횟수는 그대로다.
    static bool test_foreach_snapshot_length() {
        ast::Unit u{};
        u.name = "app";
        ast::Builder b(u);
        b.emit(b.expr(b.assign(b.var("xs"), b.list({b.int_(1), b.int_(2), b.int_(3), b.int_(4), b.int_(5)}))));
        b.emit(b.expr(b.assign(b.var("n"), b.int_(0))));
        b.emit(b.foreach(b.var("xs"), "", "v", {
            b.expr(b.assign(b.push_target(b.var("xs")), b.var("v"))),
            b.expr(b.incdec(IncDec::kPostInc, b.var("n"))),
        }));
        b.emit(b.echo({b.var("n"), b.str(" "), b.call("count", {b.var("xs")})}));

        return check_run_(compile_(u), "5 10");
    }

    static bool test_switch_default_once() {
        ast::Unit u{};
        u.name = "app";
        ast::Builder b(u);
        b.emit(b.expr(b.assign(b.var("x"), b.int_(5))));
        b.emit(b.switch_(b.var("x"), {
            CaseSpec{b.int_(1), {b.echo({b.str("one")}), b.break_()}},
            CaseSpec{b.int_(2), {b.echo({b.str("two")}), b.break_()}},
            CaseSpec{ast::k_invalid_expr, {b.echo({b.str("default")}), b.break_()}},
        }));
        b.emit(b.echo({b.str(";")}));

        return check_run_(compile_(u), "default;");
    }

    static bool test_switch_fallthrough() {
        ast::Unit u{};
        u.name = "app";
        ast::Builder b(u);
        b.emit(b.expr(b.assign(b.var("x"), b.int_(1))));
        b.emit(b.switch_(b.var("x"), {
            CaseSpec{b.int_(1), {b.echo({b.str("one ")})}},
            CaseSpec{b.int_(2), {b.echo({b.str("two ")}), b.break_()}},
            CaseSpec{ast::k_invalid_expr, {b.echo({b.str("default")})}},
        }));

        return check_run_(compile_(u), "one two ");
    }

    /// @brief parent::는 상속 깊이와 상관없이 바로 위 구현으로 정적 결합한다.
    static bool test_parent_call_through_depth() {
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
        b.emit(b.class_stmt(b.class_("D", "C", {}, {
            b.method(Visibility::kPublic, "name", {}, "string",
                     {b.ret(b.bin(BinOp::kConcat, b.scall("parent", "name", {}), b.str("D")))}),
        })));
        b.emit(b.class_stmt(b.class_("E", "D", {}, {
            b.method(Visibility::kPublic, "name", {}, "string",
                     {b.ret(b.bin(BinOp::kConcat, b.scall("parent", "name", {}), b.str("E")))}),
        })));
        b.emit(b.expr(b.assign(b.var("d"), b.new_("D", {}))));
        b.emit(b.expr(b.assign(b.var("e"), b.new_("E", {}))));
        b.emit(b.echo({b.mcall(b.var("d"), "name", {}), b.str(" "), b.mcall(b.var("e"), "name", {})}));

        return check_run_(compile_(u), "BD BDE");
    }

    static bool test_return_inside_try_runs_finally_once() {
        ast::Unit u{};
        u.name = "app";
        ast::Builder b(u);
        b.emit(b.fn_stmt(b.function("f", {}, "int", {
            b.try_finally({b.echo({b.str("body ")}), b.ret(b.int_(1))}, {}, {b.echo({b.str("finally ")})}),
            b.ret(b.int_(2)),
        })));
        b.emit(b.echo({b.call("f", {})}));

        return check_run_(compile_(u), "body finally 1");
    }

    static bool test_return_value_is_fixed_before_finally() {
        ast::Unit u{};
        u.name = "app";
        ast::Builder b(u);
        b.emit(b.fn_stmt(b.function("h", {}, "int", {
            b.expr(b.assign(b.var("x"), b.int_(1))),
            b.try_finally({b.ret(b.var("x"))}, {}, {b.expr(b.assign(b.var("x"), b.int_(99)))}),
            b.ret(b.int_(0)),
        })));
        b.emit(b.fn_stmt(b.function("grow", {}, "array", {
            b.expr(b.assign(b.var("a"), b.list({b.str("s")}))),
            b.try_finally({
                b.expr(b.assign(b.push_target(b.var("a")), b.str("x"))),
                b.ret(b.var("a")),
            }, {}, {b.expr(b.assign(b.push_target(b.var("a")), b.str("y")))}),
            b.ret(b.var("a")),
        })));
        b.emit(b.echo({b.call("h", {}), b.str(" "), b.call("implode", {b.str(","), b.call("grow", {})})}));

        return check_run_(compile_(u), "1 s,x");
    }

    static bool test_finally_runs_when_exception_escapes() {
        ast::Unit u{};
        u.name = "app";
        ast::Builder b(u);
        b.emit(b.fn_stmt(b.function("g", {}, "int", {
            b.try_finally({b.throw_(b.new_("Exception", {b.str("x")}))}, {}, {b.echo({b.str("cleanup ")})}),
            b.ret(b.int_(0)),
        })));
        b.emit(b.try_({b.echo({b.call("g", {})})},
                      {ast::CatchSpec{{"Exception"}, "e", {b.echo({b.str("caught")})}}}));

        return check_run_(compile_(u), "cleanup caught");
    }

    static bool test_uncaught_division_by_zero() {
        ast::Unit u{};
        u.name = "app";
        ast::Builder b(u);
        b.emit(b.fn_stmt(b.function("divide", {b.param("a", "int"), b.param("b", "int")}, "int",
                                    {b.ret(b.bin(BinOp::kDiv, b.var("a"), b.var("b")))})));
        b.emit(b.echo({b.call("divide", {b.int_(1), b.int_(0)})}));

        const auto pr = compile_(u);
        bool ok = require_(pr.ok, "program must compile");
        if (!pr.ok) return false;
        const lir::InterpResult r = lir::run_program(pr.modules(), pr.main_symbol);
        ok &= require_(r.error.empty(), "no interpreter fault");
        ok &= require_(r.uncaught, "division by zero escapes");
        ok &= require_(r.exit_code == rt::kUncaughtExitCode, "uncaught exit code");
        ok &= require_(r.uncaught_class == "DivisionByZeroError", "error class");
        ok &= require_(r.uncaught_message == "Division by zero", "error message");
        ok &= require_(r.output.empty(), "nothing was echoed");
        ok &= require_(r.leaked == 0, "every heap cell must be freed");
        return ok;
    }

} // namespace

int main() {
    struct Case {
        const char* name;
        bool (*fn)();
    };

    const Case cases[] = {
        {"arithmetic_fixture", test_arithmetic_fixture},
        {"foreach_snapshot_length", test_foreach_snapshot_length},
        {"switch_default_once", test_switch_default_once},
        {"switch_fallthrough", test_switch_fallthrough},
        {"parent_call_through_depth", test_parent_call_through_depth},
        {"return_inside_try_runs_finally_once", test_return_inside_try_runs_finally_once},
        {"return_value_is_fixed_before_finally", test_return_value_is_fixed_before_finally},
        {"finally_runs_when_exception_escapes", test_finally_runs_when_exception_escapes},
        {"uncaught_division_by_zero", test_uncaught_division_by_zero},
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
    std::cout << "ALL SCENARIO TESTS PASSED\n";
    return 0;
}
