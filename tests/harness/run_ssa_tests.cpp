#include <php2ir/ast/Builder.hpp>
#include <php2ir/cfg/CFG.hpp>
#include <php2ir/resolve/Prelude.hpp>
#include <php2ir/resolve/Resolve.hpp>
#include <php2ir/ssa/Dominance.hpp>
#include <php2ir/ssa/SSA.hpp>

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

    struct Built {
        resolve::ResolvedUnit ru;
        cfg::Unit cu;
        ssa::Unit su;
    };

    static Built build_(const ast::Unit& u, diag::Bag& bag) {
        resolve::UnitInput in{};
        in.deps.push_back(resolve::prelude_exports());
        Built out{resolve::resolve_unit(u, in, bag), cfg::Unit{}, ssa::Unit{}};
        out.cu = cfg::normalize_unit(u.ast, out.ru, out.ru.types, bag);
        out.su = ssa::build_unit(out.cu, bag);
        return out;
    }

    static const ssa::Function* find_fn_(const ssa::Unit& su, std::string_view name) {
        for (const auto& f : su.functions) {
            if (f.name == name) return &f;
        }
        return nullptr;
    }

    static uint32_t count_phis_(const ssa::Function& f) {
        uint32_t n = 0;
        for (const auto& b : f.blocks) n += static_cast<uint32_t>(b.phis.size());
        return n;
    }

    static bool all_verify_(const ssa::Unit& su) {
        bool ok = true;
        for (const auto& f : su.functions) {
            for (const auto& e : ssa::verify(f)) {
                std::cerr << "    verify: " << e.msg << "\n";
                ok = false;
            }
        }
        return ok;
    }

    static bool phi_arity_matches_preds_(const ssa::Function& f) {
        for (const auto& b : f.blocks) {
            for (const auto& p : b.phis) {
                if (p.incoming.size() != b.preds.size()) return false;
                for (size_t i = 0; i < p.incoming.size(); ++i) {
                    if (p.incoming[i].pred != b.preds[i]) return false;
                }
            }
        }
        return true;
    }

    static bool test_straight_line_has_no_phis() {
        ast::Unit u{};
        u.name = "app";
        ast::Builder b(u);
        b.emit(b.fn_stmt(b.function("add", {b.param("a", "int"), b.param("b", "int")}, "int",
                                    {b.ret(b.bin(BinOp::kAdd, b.var("a"), b.var("b")))})));

        diag::Bag bag;
        const auto r = build_(u, bag);
        const ssa::Function* f = find_fn_(r.su, "add");

        bool ok = true;
        ok &= require_(r.su.ok && !bag.has_error(), "add must build");
        ok &= require_(f != nullptr, "add must be present");
        if (f == nullptr) return false;
        ok &= require_(count_phis_(*f) == 0, "one block needs no phi");
        ok &= require_(f->params.size() == 2, "two parameter values");
        for (ssa::ValueId p : f->params) {
            ok &= require_(p < f->values.size() && f->values[p].def == ssa::DefKind::kParam,
                           "parameter values are param definitions");
        }
        ok &= require_(all_verify_(r.su), "verify must pass");
        return ok;
    }

    static bool test_loop_places_header_phis() {
        ast::Unit u{};
        u.name = "app";
        ast::Builder b(u);
        b.emit(b.fn_stmt(b.function(
            "sum", {b.param("n", "int")}, "int",
            {
                b.expr(b.assign(b.var("s"), b.int_(0))),
                b.expr(b.assign(b.var("i"), b.int_(0))),
                b.while_(b.bin(BinOp::kLt, b.var("i"), b.var("n")), {
                    b.expr(b.assign(b.var("s"), b.bin(BinOp::kAdd, b.var("s"), b.var("i")))),
                    b.expr(b.assign(b.var("i"), b.bin(BinOp::kAdd, b.var("i"), b.int_(1)))),
                }),
                b.ret(b.var("s")),
            })));

        diag::Bag bag;
        const auto r = build_(u, bag);
        const ssa::Function* f = find_fn_(r.su, "sum");

        bool ok = true;
        ok &= require_(r.su.ok && !bag.has_error(), "sum must build");
        ok &= require_(f != nullptr, "sum must be present");
        if (f == nullptr) return false;

        // $s and $i both change inside the loop; $n does not
        bool s_phi = false;
        bool i_phi = false;
        bool n_phi = false;
        for (const auto& blk : f->blocks) {
            for (const auto& p : blk.phis) {
                const std::string& name = f->vars[p.var].name;
                if (name == "$s") s_phi = true;
                if (name == "$i") i_phi = true;
                if (name == "$n") n_phi = true;
                ok &= require_(blk.preds.size() == 2, "loop header has entry and back edge");
            }
        }
        ok &= require_(s_phi && i_phi, "loop-carried variables get phis");
        ok &= require_(!n_phi, "loop-invariant parameter needs no phi");
        ok &= require_(phi_arity_matches_preds_(*f), "phi arity must equal pred count");
        ok &= require_(r.su.stats.copies_folded > 0, "copies become aliases");
        ok &= require_(all_verify_(r.su), "verify must pass");
        return ok;
    }

    static bool test_conditional_assignment_is_use_before_def() {
        ast::Unit u{};
        u.name = "app";
        ast::Builder b(u);
        b.emit(b.fn_stmt(b.function(
            "pick", {b.param("c", "bool")}, "int",
            {
                b.if_(b.var("c"), {b.expr(b.assign(b.var("x"), b.int_(1)))}),
                b.ret(b.var("x")),
            })));

        diag::Bag bag;
        const auto r = build_(u, bag);

        bool ok = true;
        ok &= require_(!r.su.ok, "unit must fail SSA construction");
        ok &= require_(bag.has_code(diag::Code::kUseBeforeDef), "expected UseBeforeDef");
        ok &= require_(bag.count_kind(diag::ErrorKind::kUseBeforeDef) == 1, "reported once per variable");
        return ok;
    }

    static bool test_never_assigned_is_use_before_def() {
        ast::Unit u{};
        u.name = "app";
        ast::Builder b(u);
        b.emit(b.echo({b.var("never")}));

        diag::Bag bag;
        const auto r = build_(u, bag);

        bool ok = true;
        ok &= require_(!r.su.ok, "unit must fail SSA construction");
        ok &= require_(bag.count_kind(diag::ErrorKind::kUseBeforeDef) == 1, "reported once");
        for (const auto& d : bag.diags()) {
            if (d.code() != diag::Code::kUseBeforeDef) continue;
            ok &= require_(!d.args().empty() && d.args()[0] == "never", "diagnostic names the variable");
        }
        return ok;
    }

    static bool test_both_branches_assign_is_fine() {
        ast::Unit u{};
        u.name = "app";
        ast::Builder b(u);
        b.emit(b.fn_stmt(b.function(
            "pick", {b.param("c", "bool")}, "int",
            {
                b.if_(b.var("c"), {b.expr(b.assign(b.var("x"), b.int_(1)))},
                      b.block({b.expr(b.assign(b.var("x"), b.int_(2)))})),
                b.ret(b.var("x")),
            })));

        diag::Bag bag;
        const auto r = build_(u, bag);
        const ssa::Function* f = find_fn_(r.su, "pick");

        bool ok = true;
        ok &= require_(r.su.ok && !bag.has_error(), "every path defines $x");
        ok &= require_(f != nullptr, "pick must be present");
        if (f == nullptr) return false;
        ok &= require_(count_phis_(*f) == 1, "one join phi for $x");
        ok &= require_(phi_arity_matches_preds_(*f), "phi arity must equal pred count");
        ok &= require_(all_verify_(r.su), "verify must pass");
        return ok;
    }

    static bool test_dead_phis_removed() {
        ast::Unit u{};
        u.name = "app";
        ast::Builder b(u);
        // $x is redefined on both arms but never read after the join
        b.emit(b.fn_stmt(b.function(
            "noop", {b.param("c", "bool")}, "int",
            {
                b.expr(b.assign(b.var("x"), b.int_(0))),
                b.if_(b.var("c"), {b.expr(b.assign(b.var("x"), b.int_(1)))}),
                b.ret(b.int_(7)),
            })));

        diag::Bag bag;
        const auto r = build_(u, bag);
        const ssa::Function* f = find_fn_(r.su, "noop");

        bool ok = true;
        ok &= require_(r.su.ok, "noop must build");
        ok &= require_(f != nullptr, "noop must be present");
        if (f == nullptr) return false;
        ok &= require_(count_phis_(*f) == 0, "unread phi is dropped");
        ok &= require_(r.su.stats.phis_removed >= 1, "removal counted");
        return ok;
    }

    static bool test_verify_rejects_bad_phi_arity() {
        ssa::Function f{};
        f.name = "hand";
        f.blocks.resize(2);
        f.entry = 0;
        f.blocks[0].term.kind = cfg::TermKind::kJump;
        f.blocks[0].term.target = 1;
        f.blocks[1].preds = {0};
        f.blocks[1].term.kind = cfg::TermKind::kReturn;

        ssa::Value v{};
        v.def = ssa::DefKind::kPhi;
        v.block = 1;
        f.values.push_back(v);

        ssa::Phi p{};
        p.dst = 0;
        p.incoming = {ssa::PhiIncoming{0, ssa::kUndef}, ssa::PhiIncoming{0, ssa::kUndef}};
        f.blocks[1].phis.push_back(p);

        const auto errs = ssa::verify(f);
        bool ok = true;
        ok &= require_(!errs.empty(), "two inputs for one pred must be reported");
        if (!errs.empty()) ok &= require_(errs.front().msg.find("inputs") != std::string::npos, "message names phi inputs");
        return ok;
    }

    static bool test_verify_rejects_non_dominating_def() {
        // bb0 -> bb1 | bb2 ; bb1, bb2 -> bb3 ; %0 defined in bb1 and read in bb3
        ssa::Function f{};
        f.name = "hand";
        f.blocks.resize(4);
        f.entry = 0;

        ssa::Value cond{};
        cond.repr = cfg::Repr::kBool;
        cond.block = 0;
        ssa::Value x{};
        x.repr = cfg::Repr::kInt;
        x.block = 1;
        f.values = {cond, x};

        cfg::Op c{};
        c.kind = cfg::OpKind::kConst;
        c.dst = 0;
        c.lit.kind = cfg::Literal::Kind::kBool;
        f.blocks[0].ops.push_back(c);
        f.blocks[0].term.kind = cfg::TermKind::kBranch;
        f.blocks[0].term.value = 0;
        f.blocks[0].term.target = 1;
        f.blocks[0].term.alt = 2;

        cfg::Op k{};
        k.kind = cfg::OpKind::kConst;
        k.dst = 1;
        k.lit.kind = cfg::Literal::Kind::kInt;
        k.lit.i = 5;
        f.blocks[1].ops.push_back(k);
        f.blocks[1].term.kind = cfg::TermKind::kJump;
        f.blocks[1].term.target = 3;
        f.blocks[2].term.kind = cfg::TermKind::kJump;
        f.blocks[2].term.target = 3;
        f.blocks[3].term.kind = cfg::TermKind::kReturn;
        f.blocks[3].term.value = 1;

        f.blocks[1].preds = {0};
        f.blocks[2].preds = {0};
        f.blocks[3].preds = {1, 2};

        const auto errs = ssa::verify(f);
        bool ok = true;
        ok &= require_(errs.size() == 1, "exactly the return read is reported");
        if (!errs.empty()) ok &= require_(errs.front().msg.find("dominate") != std::string::npos, "message names dominance");
        return ok;
    }

    static bool test_dominance_of_diamond() {
        std::vector<std::vector<cfg::BlockId>> preds{{}, {0}, {0}, {1, 2}};
        std::vector<std::vector<cfg::BlockId>> succs{{1, 2}, {3}, {3}, {}};
        const ssa::DomInfo dom = ssa::build_dom_info(preds, succs, 0);

        bool ok = true;
        ok &= require_(dom.idom[3] == 0, "join is immediately dominated by the fork");
        ok &= require_(dom.idom[1] == 0 && dom.idom[2] == 0, "arms are dominated by the fork");
        ok &= require_(ssa::dominates(dom, 0, 3), "entry dominates join");
        ok &= require_(!ssa::dominates(dom, 1, 3), "one arm does not dominate join");
        ok &= require_(ssa::dominates(dom, 2, 2), "dominance is reflexive");
        ok &= require_(dom.df[1].size() == 1 && dom.df[1][0] == 3, "arm frontier is the join");
        ok &= require_(dom.df[0].empty(), "entry has empty frontier");
        return ok;
    }

    /// @brief 긴 직선 체인 + 맨 끝에서 header로 돌아가는 back edge, 그리고 도달 불가 블록 하나.
    static bool test_dominance_of_long_loop() {
        const uint32_t n = 4000;
        std::vector<std::vector<cfg::BlockId>> preds(n + 1);
        std::vector<std::vector<cfg::BlockId>> succs(n + 1);
        for (uint32_t b = 0; b + 1 < n; ++b) {
            succs[b].push_back(b + 1);
            preds[b + 1].push_back(b);
        }
        // n-1 -> 1 back edge
        succs[n - 1].push_back(1);
        preds[1].push_back(n - 1);
        // n: unreachable, jumps into the loop
        succs[n].push_back(2);
        preds[2].push_back(n);

        const ssa::DomInfo dom = ssa::build_dom_info(preds, succs, 0);

        bool ok = true;
        ok &= require_(dom.rpo.size() == n, "unreachable block is not ordered");
        ok &= require_(dom.idom[0] == -1, "entry has no idom");
        bool chain = true;
        for (uint32_t b = 1; b < n; ++b) chain &= dom.idom[b] == static_cast<int32_t>(b - 1);
        ok &= require_(chain, "every block is immediately dominated by its predecessor");
        ok &= require_(dom.idom[n] == -1, "unreachable block has no idom");
        ok &= require_(ssa::dominates(dom, 0, n - 1), "entry dominates the loop tail");
        ok &= require_(ssa::dominates(dom, 1, n - 1), "header dominates the loop tail");
        ok &= require_(!ssa::dominates(dom, n - 1, 1), "tail does not dominate the header");
        ok &= require_(!ssa::dominates(dom, n, 2), "unreachable pred dominates nothing");
        ok &= require_(dom.df[n - 1].size() == 1 && dom.df[n - 1][0] == 1, "tail frontier is the header");
        ok &= require_(dom.df[1].size() == 1 && dom.df[1][0] == 1, "header is in its own frontier");
        ok &= require_(dom.df[n].empty(), "unreachable block has no frontier");
        return ok;
    }

    static bool test_dump_mentions_phi() {
        ast::Unit u{};
        u.name = "app";
        ast::Builder b(u);
        b.emit(b.expr(b.assign(b.var("i"), b.int_(0))));
        b.emit(b.while_(b.bin(BinOp::kLt, b.var("i"), b.int_(3)), {
            b.expr(b.incdec(ast::IncDec::kPostInc, b.var("i"))),
        }));
        b.emit(b.echo({b.var("i")}));

        diag::Bag bag;
        const auto r = build_(u, bag);
        const std::string text = ssa::dump(r.su);

        bool ok = true;
        ok &= require_(r.su.ok, "main loop must build");
        ok &= require_(text.find("phi") != std::string::npos, "dump prints phis");
        ok &= require_(text.find("__main") != std::string::npos, "dump names __main");
        ok &= require_(all_verify_(r.su), "verify must pass");
        return ok;
    }

} // namespace

int main() {
    struct Case {
        const char* name;
        bool (*fn)();
    };

    const Case cases[] = {
        {"straight_line_has_no_phis", test_straight_line_has_no_phis},
        {"loop_places_header_phis", test_loop_places_header_phis},
        {"conditional_assignment_is_use_before_def", test_conditional_assignment_is_use_before_def},
        {"never_assigned_is_use_before_def", test_never_assigned_is_use_before_def},
        {"both_branches_assign_is_fine", test_both_branches_assign_is_fine},
        {"dead_phis_removed", test_dead_phis_removed},
        {"verify_rejects_bad_phi_arity", test_verify_rejects_bad_phi_arity},
        {"verify_rejects_non_dominating_def", test_verify_rejects_non_dominating_def},
        {"dominance_of_diamond", test_dominance_of_diamond},
        {"dominance_of_long_loop", test_dominance_of_long_loop},
        {"dump_mentions_phi", test_dump_mentions_phi},
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
    std::cout << "ALL SSA TESTS PASSED\n";
    return 0;
}
