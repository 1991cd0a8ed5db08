#include <php2ir/ast/Builder.hpp>
#include <php2ir/cfg/CFG.hpp>
#include <php2ir/resolve/Prelude.hpp>
#include <php2ir/resolve/Resolve.hpp>

#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace {

    using namespace php2ir;
    using ast::BinOp;

    static bool require_(bool cond, const char* msg) {
        if (cond) return true;
        std::cerr << "  - " << msg << "\n";
        return false;
    }

    struct Normalized {
        resolve::ResolvedUnit ru;
        cfg::Unit cu;
    };

    static Normalized normalize_(const ast::Unit& u, diag::Bag& bag) {
        resolve::UnitInput in{};
        in.deps.push_back(resolve::prelude_exports());
        Normalized n{resolve::resolve_unit(u, in, bag), cfg::Unit{}};
        n.cu = cfg::normalize_unit(u.ast, n.ru, n.ru.types, bag);
        return n;
    }

    static const cfg::Function* find_fn_(const cfg::Unit& cu, std::string_view name) {
        for (const auto& f : cu.functions) {
            if (f.name == name) return &f;
        }
        return nullptr;
    }

    static uint32_t count_ops_(const cfg::Function& f, cfg::OpKind k) {
        uint32_t n = 0;
        for (const auto& b : f.blocks) {
            for (const auto& op : b.ops) {
                if (op.kind == k) ++n;
            }
        }
        return n;
    }

    static bool all_verify_(const cfg::Unit& cu) {
        bool ok = true;
        for (const auto& f : cu.functions) {
            for (const auto& e : cfg::verify(f)) {
                std::cerr << "    verify: " << e.msg << "\n";
                ok = false;
            }
        }
        return ok;
    }

    static bool no_critical_edges_(const cfg::Function& f) {
        for (const auto& b : f.blocks) {
            const auto succs = cfg::successors(b.term);
            if (succs.size() < 2) continue;
            for (cfg::BlockId s : succs) {
                if (f.blocks[s].preds.size() >= 2) return false;
            }
        }
        return true;
    }

    static ast::FnDecl add_fn_(ast::Builder& b) {
        return b.function("add", {b.param("a", "int"), b.param("b", "int")}, "int",
                          {b.ret(b.bin(BinOp::kAdd, b.var("a"), b.var("b")))});
    }

    static bool test_straight_line_function_is_one_block() {
        ast::Unit u{};
        u.name = "app";
        ast::Builder b(u);
        b.emit(b.fn_stmt(add_fn_(b)));

        diag::Bag bag;
        const auto n = normalize_(u, bag);
        const cfg::Function* f = find_fn_(n.cu, "add");

        bool ok = true;
        ok &= require_(!bag.has_error(), "unit must normalize cleanly");
        ok &= require_(f != nullptr, "add must be normalized");
        if (f == nullptr) return false;
        ok &= require_(f->blocks.size() == 1, "nothing can throw: unwind exit is pruned");
        ok &= require_(f->unwind_exit == cfg::kInvalidBlock, "pruned unwind exit is invalidated");
        ok &= require_(f->blocks[f->entry].term.kind == cfg::TermKind::kReturn, "single block returns");
        ok &= require_(f->param_count == 2, "two parameters");
        ok &= require_(count_ops_(*f, cfg::OpKind::kParam) == 2, "one param op per parameter");
        ok &= require_(all_verify_(n.cu), "verify must pass");
        return ok;
    }

    static bool test_may_throw_ops_end_their_block() {
        ast::Unit u{};
        u.name = "app";
        ast::Builder b(u);
        b.emit(b.fn_stmt(add_fn_(b)));
        b.emit(b.expr(b.assign(b.var("x"), b.call("add", {b.int_(1), b.int_(2)}))));
        b.emit(b.expr(b.assign(b.var("y"), b.call("add", {b.var("x"), b.int_(3)}))));
        b.emit(b.echo({b.var("y")}));

        diag::Bag bag;
        const auto n = normalize_(u, bag);
        const cfg::Function* f = find_fn_(n.cu, "__main");

        bool ok = true;
        ok &= require_(f != nullptr && f->is_main, "__main must be normalized");
        if (f == nullptr) return false;
        ok &= require_(count_ops_(*f, cfg::OpKind::kCall) == 2, "two direct calls");

        uint32_t checks = 0;
        for (const auto& blk : f->blocks) {
            for (size_t i = 0; i < blk.ops.size(); ++i) {
                if (!cfg::may_throw(*f, blk.ops[i])) continue;
                ok &= require_(i + 1 == blk.ops.size(), "may-throw op must be last in its block");
                ok &= require_(blk.term.kind == cfg::TermKind::kExcCheck, "may-throw op must end in excheck");
                // the exception edge may pass through a split landing block
                cfg::BlockId handler = blk.term.alt;
                if (handler != f->unwind_exit && handler < f->blocks.size() &&
                    f->blocks[handler].term.kind == cfg::TermKind::kJump) {
                    handler = f->blocks[handler].term.target;
                }
                ok &= require_(handler == f->unwind_exit, "outside try the handler is the unwind exit");
                ++checks;
            }
        }
        ok &= require_(checks == 2, "each call is guarded");
        ok &= require_(f->unwind_exit != cfg::kInvalidBlock, "unwind exit is reachable");
        if (f->unwind_exit != cfg::kInvalidBlock) {
            ok &= require_(f->blocks[f->unwind_exit].term.kind == cfg::TermKind::kUnwindExit,
                           "unwind exit terminator");
        }
        ok &= require_(n.cu.stats.exc_checks >= 2, "stats count exc checks");
        ok &= require_(all_verify_(n.cu), "verify must pass");
        return ok;
    }

    static bool test_if_without_else_splits_critical_edge() {
        ast::Unit u{};
        u.name = "app";
        ast::Builder b(u);
        b.emit(b.fn_stmt(b.function(
            "clamp", {b.param("x", "int")}, "int",
            {
                b.if_(b.bin(BinOp::kLt, b.var("x"), b.int_(0)), {b.expr(b.assign(b.var("x"), b.int_(0)))}),
                b.ret(b.var("x")),
            })));

        diag::Bag bag;
        const auto n = normalize_(u, bag);
        const cfg::Function* f = find_fn_(n.cu, "clamp");

        bool ok = true;
        ok &= require_(f != nullptr, "clamp must be normalized");
        if (f == nullptr) return false;
        ok &= require_(n.cu.stats.split_edges >= 1, "cond -> join is critical and must be split");
        ok &= require_(no_critical_edges_(*f), "no critical edge may remain");
        ok &= require_(all_verify_(n.cu), "verify must pass");
        return ok;
    }

    /// @brief 손으로 만든 CFG에서 prune / split 동작을 확인한다.
    static bool test_prune_and_split_by_hand() {
        cfg::Function f{};
        f.name = "hand";
        cfg::Var c{};
        c.name = "%t0";
        c.repr = cfg::Repr::kBool;
        c.is_temp = true;
        f.vars.push_back(c);
        f.blocks.resize(4);

        cfg::Op k{};
        k.kind = cfg::OpKind::kConst;
        k.dst = 0;
        k.lit.kind = cfg::Literal::Kind::kBool;
        k.lit.b = true;
        f.blocks[0].ops.push_back(k);
        f.blocks[0].term.kind = cfg::TermKind::kBranch;
        f.blocks[0].term.value = 0;
        f.blocks[0].term.target = 1;
        f.blocks[0].term.alt = 2;
        f.blocks[1].term.kind = cfg::TermKind::kJump;
        f.blocks[1].term.target = 2;
        f.blocks[2].term.kind = cfg::TermKind::kReturn;
        f.blocks[3].term.kind = cfg::TermKind::kReturn;     // unreachable
        f.entry = 0;
        f.unwind_exit = 3;

        bool ok = true;
        ok &= require_(cfg::prune_unreachable(f) == 1, "one unreachable block");
        ok &= require_(f.unwind_exit == cfg::kInvalidBlock, "pruned unwind exit");
        ok &= require_(f.blocks.size() == 3, "three blocks kept");
        ok &= require_(f.blocks[2].preds.size() == 2, "join has two preds");

        ok &= require_(cfg::split_critical_edges(f) == 1, "exactly bb0 -> bb2 is critical");
        ok &= require_(f.blocks.size() == 4, "one landing block added");
        ok &= require_(f.blocks[0].term.alt == 3, "branch now goes through the new block");
        ok &= require_(f.blocks[3].term.kind == cfg::TermKind::kJump && f.blocks[3].term.target == 2,
                       "new block jumps to the old target");
        ok &= require_(cfg::verify(f).empty(), "verify must pass after split");
        return ok;
    }

    static bool test_verify_reports_missing_terminator() {
        cfg::Function f{};
        f.name = "broken";
        f.blocks.resize(1);
        f.entry = 0;

        const auto errs = cfg::verify(f);
        bool ok = true;
        ok &= require_(!errs.empty(), "block without terminator must be reported");
        if (!errs.empty()) {
            ok &= require_(errs.front().msg.find("no terminator") != std::string::npos, "message names the problem");
        }
        return ok;
    }

    static bool test_switch_tests_cases_with_loose_eq() {
        ast::Unit u{};
        u.name = "app";
        ast::Builder b(u);
        b.emit(b.fn_stmt(b.function(
            "name_of", {b.param("x", "int")}, "string",
            {
                b.switch_(b.var("x"), {
                    ast::CaseSpec{b.int_(1), {b.ret(b.str("one"))}},
                    ast::CaseSpec{b.int_(2), {b.ret(b.str("two"))}},
                    ast::CaseSpec{ast::k_invalid_expr, {b.ret(b.str("other"))}},
                }),
            })));

        diag::Bag bag;
        const auto n = normalize_(u, bag);
        const cfg::Function* f = find_fn_(n.cu, "name_of");

        bool ok = true;
        ok &= require_(!bag.has_error(), "switch must normalize");
        ok &= require_(f != nullptr, "name_of must be normalized");
        if (f == nullptr) return false;

        uint32_t eq = 0;
        uint32_t returns = 0;
        for (const auto& blk : f->blocks) {
            for (const auto& op : blk.ops) {
                if (op.kind == cfg::OpKind::kBinary && op.bin == cfg::BinKind::kEq) ++eq;
            }
            if (blk.term.kind == cfg::TermKind::kReturn) ++returns;
        }
        ok &= require_(eq == 2, "one loose comparison per non-default case");
        ok &= require_(returns == 3, "every case body survives");
        ok &= require_(all_verify_(n.cu), "verify must pass");
        return ok;
    }

    static bool test_finally_copied_per_exit_path() {
        ast::Unit u{};
        u.name = "app";
        ast::Builder b(u);
        b.emit(b.fn_stmt(b.function("g", {}, "", {b.echo({b.str("g")})})));
        b.emit(b.fn_stmt(b.function(
            "f", {}, "int",
            {
                b.try_finally({b.expr(b.call("g", {})), b.ret(b.int_(1))}, {}, {b.echo({b.str("fin")})}),
            })));

        diag::Bag bag;
        const auto n = normalize_(u, bag);
        const cfg::Function* f = find_fn_(n.cu, "f");

        bool ok = true;
        ok &= require_(!bag.has_error(), "try/finally must normalize");
        ok &= require_(f != nullptr, "f must be normalized");
        if (f == nullptr) return false;

        // return path + exception path; the catch-escape copy has no way in and is pruned
        ok &= require_(count_ops_(*f, cfg::OpKind::kEcho) == 2, "finally body appears once per live exit");
        ok &= require_(count_ops_(*f, cfg::OpKind::kLandingPad) == 1, "one landing pad for the try body");
        ok &= require_(n.cu.stats.finally_copies >= 2, "stats count finally copies");

        bool raises = false;
        for (const auto& blk : f->blocks) {
            if (blk.term.kind == cfg::TermKind::kRaise) raises = true;
        }
        ok &= require_(raises, "exception path re-raises after finally");
        ok &= require_(all_verify_(n.cu), "verify must pass");
        return ok;
    }

    static bool test_division_gets_zero_check() {
        ast::Unit u{};
        u.name = "app";
        ast::Builder b(u);
        b.emit(b.fn_stmt(b.function(
            "modulo", {b.param("a", "int"), b.param("b", "int")}, "int",
            {b.ret(b.bin(BinOp::kMod, b.var("a"), b.var("b")))})));
        b.emit(b.fn_stmt(b.function(
            "half", {b.param("a", "int")}, "int",
            {b.ret(b.bin(BinOp::kMod, b.var("a"), b.int_(2)))})));

        diag::Bag bag;
        const auto n = normalize_(u, bag);
        const cfg::Function* m = find_fn_(n.cu, "modulo");
        const cfg::Function* h = find_fn_(n.cu, "half");

        bool ok = true;
        ok &= require_(m != nullptr && h != nullptr, "both functions normalized");
        if (m == nullptr || h == nullptr) return false;
        ok &= require_(count_ops_(*m, cfg::OpKind::kNew) == 1, "variable divisor raises DivisionByZeroError");
        ok &= require_(count_ops_(*h, cfg::OpKind::kNew) == 0, "nonzero literal divisor needs no check");
        ok &= require_(h->blocks.size() == 1, "checked-free modulo stays straight-line");
        ok &= require_(n.cu.stats.runtime_checks >= 1, "runtime check counted");
        ok &= require_(all_verify_(n.cu), "verify must pass");
        return ok;
    }

    static bool test_foreach_walks_a_snapshot() {
        ast::Unit u{};
        u.name = "app";
        ast::Builder b(u);
        b.emit(b.expr(b.assign(b.var("xs"), b.list({b.int_(1), b.int_(2)}))));
        b.emit(b.foreach(b.var("xs"), "", "v", {
            b.expr(b.assign(b.push_target(b.var("xs")), b.var("v"))),
        }));

        diag::Bag bag;
        const auto n = normalize_(u, bag);
        const cfg::Function* f = find_fn_(n.cu, "__main");

        bool ok = true;
        ok &= require_(!bag.has_error(), "foreach must normalize");
        ok &= require_(f != nullptr, "__main must be normalized");
        if (f == nullptr) return false;
        ok &= require_(count_ops_(*f, cfg::OpKind::kArrayCount) == 1, "count is taken once, before the loop");
        ok &= require_(count_ops_(*f, cfg::OpKind::kArrayValueAt) == 1, "value fetched by position");
        ok &= require_(count_ops_(*f, cfg::OpKind::kArrayPush) >= 1, "body appends to the source");
        ok &= require_(all_verify_(n.cu), "verify must pass");
        return ok;
    }

    static bool test_missing_return_raises_type_error() {
        ast::Unit u{};
        u.name = "app";
        ast::Builder b(u);
        b.emit(b.fn_stmt(b.function(
            "maybe", {b.param("x", "int")}, "int",
            {b.if_(b.var("x"), {b.ret(b.int_(1))})})));

        diag::Bag bag;
        const auto n = normalize_(u, bag);
        const cfg::Function* f = find_fn_(n.cu, "maybe");

        bool ok = true;
        ok &= require_(f != nullptr, "maybe must be normalized");
        if (f == nullptr) return false;
        ok &= require_(count_ops_(*f, cfg::OpKind::kNew) == 1, "fall-off path builds a TypeError");
        bool raises = false;
        for (const auto& blk : f->blocks) {
            if (blk.term.kind == cfg::TermKind::kRaise) raises = true;
        }
        ok &= require_(raises, "fall-off path raises");
        ok &= require_(all_verify_(n.cu), "verify must pass");
        return ok;
    }

    static bool test_dump_names_blocks() {
        ast::Unit u{};
        u.name = "app";
        ast::Builder b(u);
        b.emit(b.fn_stmt(add_fn_(b)));

        diag::Bag bag;
        const auto n = normalize_(u, bag);
        const std::string text = cfg::dump(n.cu, n.ru.types);

        bool ok = true;
        ok &= require_(text.find("add") != std::string::npos, "dump names the function");
        ok &= require_(text.find("bb0") != std::string::npos, "dump names the entry block");
        ok &= require_(text == cfg::dump(n.cu, n.ru.types), "dump is deterministic");
        return ok;
    }

} // namespace

int main() {
    struct Case {
        const char* name;
        bool (*fn)();
    };

    const Case cases[] = {
        {"straight_line_function_is_one_block", test_straight_line_function_is_one_block},
        {"may_throw_ops_end_their_block", test_may_throw_ops_end_their_block},
        {"if_without_else_splits_critical_edge", test_if_without_else_splits_critical_edge},
        {"prune_and_split_by_hand", test_prune_and_split_by_hand},
        {"verify_reports_missing_terminator", test_verify_reports_missing_terminator},
        {"switch_tests_cases_with_loose_eq", test_switch_tests_cases_with_loose_eq},
        {"finally_copied_per_exit_path", test_finally_copied_per_exit_path},
        {"division_gets_zero_check", test_division_gets_zero_check},
        {"foreach_walks_a_snapshot", test_foreach_walks_a_snapshot},
        {"missing_return_raises_type_error", test_missing_return_raises_type_error},
        {"dump_names_blocks", test_dump_names_blocks},
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
    std::cout << "ALL CFG TESTS PASSED\n";
    return 0;
}
