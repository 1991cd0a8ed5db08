#include <php2ir/ast/Builder.hpp>
#include <php2ir/driver/Pipeline.hpp>
#include <php2ir/lir/LIR.hpp>
#include <php2ir/lir/RefCount.hpp>
#include <php2ir/resolve/Prelude.hpp>
#include <php2ir/rt/RuntimeABI.hpp>

#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace {

    using namespace php2ir;
    using ast::BinOp;
    using ast::Visibility;
    using lir::Opcode;
    using lir::Type;

    static bool require_(bool cond, const char* msg) {
        if (cond) return true;
        std::cerr << "  - " << msg << "\n";
        return false;
    }

    static driver::UnitResult compile_(const ast::Unit& u) {
        return driver::compile_unit(u, {resolve::prelude_exports()}, false);
    }

    static const lir::Function* find_fn_(const lir::Module& m, std::string_view name) {
        for (const auto& f : m.functions) {
            if (f.name == name) return &f;
        }
        return nullptr;
    }

    static uint32_t count_ops_(const lir::Function& f, Opcode op) {
        uint32_t n = 0;
        for (const auto& b : f.blocks) {
            for (const auto& inst : b.insts) {
                if (inst.op == op) ++n;
            }
        }
        return n;
    }

    static bool clean_(const driver::UnitResult& r) {
        bool ok = true;
        for (const auto& e : r.internal_errors) {
            std::cerr << "    internal: " << e << "\n";
            ok = false;
        }
        for (const auto& e : lir::verify(r.module)) {
            std::cerr << "    verify: " << e.msg << "\n";
            ok = false;
        }
        for (const auto& e : lir::check_refcounts(r.module)) {
            std::cerr << "    rc: " << e.msg << "\n";
            ok = false;
        }
        return ok;
    }

    static void add_inst_(lir::Function& f, lir::BlockId b, lir::Inst inst) {
        f.blocks[b].insts.push_back(std::move(inst));
    }

    /// @brief const.str %0 -> echo(%0) -> ret. echo는 빌리기만 한다.
    static lir::Function echo_literal_fn_() {
        lir::Function f{};
        f.name = "hand";
        f.blocks.resize(1);
        const lir::ValueId v = f.new_value(Type::kStr);

        lir::Inst k{};
        k.op = Opcode::kConstStr;
        k.dst = v;
        k.type = Type::kStr;
        k.s = "hi";
        add_inst_(f, 0, k);

        lir::Inst e{};
        e.op = Opcode::kCallRt;
        e.rt = rt::RtFn::kEcho;
        e.type = Type::kVoid;
        e.args = {v};
        add_inst_(f, 0, e);

        f.blocks[0].term.kind = lir::TermKind::kRet;
        return f;
    }

    static bool test_integer_ops_lower_directly() {
        ast::Unit u{};
        u.name = "app";
        ast::Builder b(u);
        b.emit(b.fn_stmt(b.function("add", {b.param("a", "int"), b.param("b", "int")}, "int",
                                    {b.ret(b.bin(BinOp::kAdd, b.var("a"), b.var("b")))})));
        b.emit(b.fn_stmt(b.function("modulo", {b.param("a", "int"), b.param("b", "int")}, "int",
                                    {b.ret(b.bin(BinOp::kMod, b.var("a"), b.var("b")))})));

        const auto r = compile_(u);
        const lir::Function* add = find_fn_(r.module, rt::mangle_function("add"));
        const lir::Function* mod = find_fn_(r.module, rt::mangle_function("modulo"));

        bool ok = true;
        ok &= require_(r.ok, "unit must compile");
        ok &= require_(clean_(r), "verify and rc check must pass");
        ok &= require_(add != nullptr && mod != nullptr, "both functions are lowered under mangled names");
        if (add == nullptr || mod == nullptr) return false;

        ok &= require_(add->ret == Type::kI64, "int return is i64");
        ok &= require_(add->param_types.size() == 2 && add->param_types[0] == Type::kI64, "int params are i64");
        ok &= require_(add->blocks.size() == 1, "add stays one block");
        ok &= require_(count_ops_(*add, Opcode::kIAdd) == 1, "one iadd");
        ok &= require_(count_ops_(*add, Opcode::kCallRt) == 0, "no runtime call for int add");

        ok &= require_(count_ops_(*mod, Opcode::kSRem) == 1, "modulo lowers to srem");
        ok &= require_(lir::print(*mod).find("srem") != std::string::npos, "printer spells srem");
        ok &= require_(lir::opcode_name(Opcode::kSRem) == "srem", "opcode name");
        return ok;
    }

    static bool test_printer_shape() {
        ast::Unit u{};
        u.name = "app";
        ast::Builder b(u);
        b.emit(b.echo({b.str("hello")}));

        const auto r = compile_(u);
        const std::string text = lir::print(r.module);

        bool ok = true;
        ok &= require_(r.ok, "unit must compile");
        ok &= require_(clean_(r), "verify and rc check must pass");
        ok &= require_(r.module.main_symbol == "php_main_app", "main symbol follows the unit name");
        ok &= require_(text.find("define ") != std::string::npos, "functions print as define");
        ok &= require_(text.find("@php_main_app(") != std::string::npos, "main is printed");
        ok &= require_(text.find("bb0:") != std::string::npos, "blocks are labelled");
        return ok;
    }

    static bool test_mangling() {
        bool ok = true;
        ok &= require_(rt::mangle_function("Add") == "php_fn_add", "functions fold case");
        ok &= require_(rt::mangle_method("Person", "greet") == "php_m_person__greet", "method symbol");
        ok &= require_(rt::mangle_adapter("Person", "greet") == "php_dyn_person__greet", "adapter symbol");
        ok &= require_(rt::mangle_class("Person") == "php_class_person", "class symbol");
        ok &= require_(rt::mangle_main("my-app") == "php_main_my_app", "unit names are sanitized");
        return ok;
    }

    static bool test_class_lowering() {
        ast::Unit u{};
        u.name = "app";
        ast::Builder b(u);
        b.emit(b.class_stmt(b.class_("Person", "", {b.property(Visibility::kPublic, "name", "string", b.str("x"))}, {
            b.method(Visibility::kPublic, "greet", {}, "string",
                     {b.ret(b.bin(BinOp::kConcat, b.str("hi "), b.prop(b.this_(), "name")))}),
        })));
        b.emit(b.expr(b.assign(b.var("p"), b.new_("Person", {}))));
        b.emit(b.echo({b.mcall(b.var("p"), "greet", {})}));

        const auto r = compile_(u);

        bool ok = true;
        ok &= require_(r.ok, "unit must compile");
        ok &= require_(clean_(r), "verify and rc check must pass");
        ok &= require_(find_fn_(r.module, "php_m_person__greet") != nullptr, "method body is lowered");
        const lir::Function* dyn = find_fn_(r.module, "php_dyn_person__greet");
        ok &= require_(dyn != nullptr && dyn->is_adapter, "public method gets a by-name adapter");
        if (dyn != nullptr) {
            ok &= require_(dyn->ret == Type::kBox, "adapter returns a box");
            ok &= require_(dyn->param_types.size() == 2 && dyn->param_types[1] == Type::kArr,
                           "adapter takes (obj, arr)");
        }

        const lir::ClassDesc* cls = nullptr;
        for (const auto& c : r.module.classes) {
            if (c.symbol == "php_class_person") cls = &c;
        }
        ok &= require_(cls != nullptr, "class descriptor is emitted");
        if (cls == nullptr) return false;
        ok &= require_(cls->defined_here, "descriptor is defined in this unit");
        ok &= require_(cls->slots.size() == 1 && cls->slots[0].type == Type::kStr, "typed slot");
        ok &= require_(cls->vtable.size() == 1 && cls->vtable[0] == "php_m_person__greet", "vtable slot");
        ok &= require_(cls->methods.size() == 1 && cls->methods[0].adapter == "php_dyn_person__greet",
                       "by-name table");
        ok &= require_(r.lower_stats.adapters == 1, "stats count adapters");
        return ok;
    }

    static bool test_release_after_last_borrow() {
        lir::Function f = echo_literal_fn_();
        const lir::RcStats st = lir::insert_refcounts(f);

        bool ok = true;
        ok &= require_(st.retains == 0, "no retain needed");
        ok &= require_(st.releases == 1, "literal is released once");
        ok &= require_(f.blocks[0].insts.size() == 3, "release appended after echo");
        ok &= require_(f.blocks[0].insts.back().op == Opcode::kRelease, "last inst is the release");
        ok &= require_(lir::verify(f).empty(), "verify must pass");
        ok &= require_(lir::check_refcounts(f).empty(), "rc check must pass");
        return ok;
    }

    static bool test_missing_release_is_a_leak() {
        const lir::Function f = echo_literal_fn_();
        const auto errs = lir::check_refcounts(f);

        bool ok = true;
        ok &= require_(errs.size() == 1, "exactly one rc error");
        if (!errs.empty()) {
            ok &= require_(errs[0].msg.find("at ret") != std::string::npos, "leak is reported at ret");
        }
        return ok;
    }

    static bool test_retain_before_consumed_live_use() {
        lir::Function f{};
        f.name = "hand2";
        f.blocks.resize(1);
        const lir::ValueId s = f.new_value(Type::kStr);
        const lir::ValueId bx = f.new_value(Type::kBox);

        lir::Inst k{};
        k.op = Opcode::kConstStr;
        k.dst = s;
        k.type = Type::kStr;
        k.s = "x";
        add_inst_(f, 0, k);

        lir::Inst box{};
        box.op = Opcode::kCallRt;
        box.rt = rt::RtFn::kBoxStr;
        box.dst = bx;
        box.type = Type::kBox;
        box.args = {s};
        add_inst_(f, 0, box);

        lir::Inst e{};
        e.op = Opcode::kCallRt;
        e.rt = rt::RtFn::kEcho;
        e.type = Type::kVoid;
        e.args = {s};
        add_inst_(f, 0, e);

        f.blocks[0].term.kind = lir::TermKind::kRet;

        const lir::RcStats st = lir::insert_refcounts(f);

        bool ok = true;
        ok &= require_(st.retains == 1, "box.str consumes a value that is still read");
        ok &= require_(st.releases == 2, "dead box and last borrow are released");
        ok &= require_(lir::verify(f).empty(), "verify must pass");
        ok &= require_(lir::check_refcounts(f).empty(), "rc check must pass");

        bool retain_first = false;
        for (const auto& inst : f.blocks[0].insts) {
            if (inst.op == Opcode::kRetain) {
                retain_first = true;
                break;
            }
            if (inst.op == Opcode::kCallRt) break;
        }
        ok &= require_(retain_first, "retain comes before the consuming call");
        return ok;
    }

    static bool test_handle_uses_follow_runtime_table() {
        lir::Function f{};
        const lir::ValueId a = f.new_value(Type::kArr);
        const lir::ValueId v = f.new_value(Type::kBox);
        lir::Inst push{};
        push.op = Opcode::kCallRt;
        push.rt = rt::RtFn::kArrPush;
        push.type = rt::rt_info(rt::RtFn::kArrPush).ret;
        push.args = {a, v};

        const auto uses = lir::handle_uses(f, push);
        bool ok = true;
        ok &= require_(uses.size() == 2, "both operands are handles");
        if (uses.size() == 2) {
            ok &= require_(uses[0].value == a && uses[0].consumed, "array is consumed");
            ok &= require_(uses[1].value == v && uses[1].consumed, "pushed value is consumed");
        }
        ok &= require_(!rt::consumes_param(rt::rt_info(rt::RtFn::kEcho), 0), "echo borrows");
        return ok;
    }

    static bool test_verify_flags_unchecked_call() {
        lir::Function f{};
        f.name = "bad";
        f.blocks.resize(1);
        lir::Inst c{};
        c.op = Opcode::kCall;
        c.s = "php_fn_g";
        c.type = Type::kVoid;
        f.blocks[0].insts.push_back(c);
        f.blocks[0].term.kind = lir::TermKind::kRet;

        const auto errs = lir::verify(f);
        bool ok = true;
        ok &= require_(!errs.empty(), "a call must end in an exception check");
        if (!errs.empty()) {
            ok &= require_(errs[0].msg.find("may throw") != std::string::npos, "message names the rule");
        }
        return ok;
    }

    static bool test_program_is_refcount_clean() {
        ast::Unit u{};
        u.name = "app";
        ast::Builder b(u);
        b.emit(b.expr(b.assign(b.var("xs"), b.list({b.int_(1), b.int_(2)}))));
        b.emit(b.expr(b.assign(b.push_target(b.var("xs")), b.str("three"))));
        b.emit(b.foreach(b.var("xs"), "k", "v", {b.echo({b.var("k"), b.str("="), b.var("v"), b.str("\n")})}));
        b.emit(b.if_(b.bin(BinOp::kGt, b.call("count", {b.var("xs")}), b.int_(2)),
                     {b.echo({b.str("many")})}, b.block({b.echo({b.str("few")})})));

        const auto r = compile_(u);
        bool ok = true;
        ok &= require_(r.ok, "unit must compile");
        ok &= require_(clean_(r), "verify and rc check must pass");
        ok &= require_(r.rc_stats.releases > 0, "handles are released");
        return ok;
    }

} // namespace

int main() {
    struct Case {
        const char* name;
        bool (*fn)();
    };

    const Case cases[] = {
        {"integer_ops_lower_directly", test_integer_ops_lower_directly},
        {"printer_shape", test_printer_shape},
        {"mangling", test_mangling},
        {"class_lowering", test_class_lowering},
        {"release_after_last_borrow", test_release_after_last_borrow},
        {"missing_release_is_a_leak", test_missing_release_is_a_leak},
        {"retain_before_consumed_live_use", test_retain_before_consumed_live_use},
        {"handle_uses_follow_runtime_table", test_handle_uses_follow_runtime_table},
        {"verify_flags_unchecked_call", test_verify_flags_unchecked_call},
        {"program_is_refcount_clean", test_program_is_refcount_clean},
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
    std::cout << "ALL LIR TESTS PASSED\n";
    return 0;
}
