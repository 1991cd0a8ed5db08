// frontend/src/ssa/ssa_builder.cpp
#include <php2ir/ssa/Dominance.hpp>
#include <php2ir/ssa/SSA.hpp>

#include <deque>
#include <functional>


namespace php2ir::ssa {

    namespace {

        struct UseSite {
            ValueId value = kInvalidValue;
            cfg::VarId var = cfg::kInvalidVar;
            Span span{};
        };

        ValueId new_value_(Function& fn, cfg::VarId var, DefKind def, BlockId block) {
            Value v{};
            v.var = var;
            v.def = def;
            v.block = block;
            if (var != cfg::kInvalidVar) {
                v.repr = fn.vars[var].repr;
                v.type = fn.vars[var].type;
            }
            fn.values.push_back(v);
            return static_cast<ValueId>(fn.values.size() - 1);
        }

    } // namespace

    BuildResult build(const cfg::Function& f, diag::Bag& bag) {
        BuildResult res{};
        Function& out = res.fn;
        out.name = f.name;
        out.sym = f.sym;
        out.cls = f.cls;
        out.is_main = f.is_main;
        out.ret = f.ret;
        out.ret_repr = f.ret_repr;
        out.vars = f.vars;
        out.entry = f.entry;
        out.unwind_exit = f.unwind_exit;
        out.span = f.span;
        out.params.assign(f.param_count, kInvalidValue);

        const uint32_t nb = static_cast<uint32_t>(f.blocks.size());
        const uint32_t nv = static_cast<uint32_t>(f.vars.size());
        out.blocks.resize(nb);
        for (BlockId b = 0; b < nb; ++b) out.blocks[b].preds = f.blocks[b].preds;

        const DomInfo dom = build_dom_info(f);

        // ---- phi placement: iterated dominance frontier per variable ----
        std::vector<std::vector<BlockId>> def_blocks(nv);
        for (BlockId b = 0; b < nb; ++b) {
            for (const auto& op : f.blocks[b].ops) {
                if (op.dst == cfg::kInvalidVar) continue;
                auto& db = def_blocks[op.dst];
                if (db.empty() || db.back() != b) db.push_back(b);
            }
        }

        for (cfg::VarId var = 0; var < nv; ++var) {
            if (def_blocks[var].empty()) continue;
            std::vector<uint8_t> has_phi(nb, 0);
            std::vector<uint8_t> queued(nb, 0);
            std::deque<BlockId> work;
            for (BlockId b : def_blocks[var]) {
                queued[b] = 1;
                work.push_back(b);
            }
            while (!work.empty()) {
                const BlockId b = work.front();
                work.pop_front();
                for (uint32_t d : dom.df[b]) {
                    if (has_phi[d]) continue;
                    has_phi[d] = 1;
                    Phi p{};
                    p.var = var;
                    p.dst = new_value_(out, var, DefKind::kPhi, d);
                    p.incoming.resize(f.blocks[d].preds.size());
                    for (size_t i = 0; i < p.incoming.size(); ++i) p.incoming[i].pred = f.blocks[d].preds[i];
                    out.blocks[d].phis.push_back(std::move(p));
                    res.stats.phis_placed += 1;
                    if (!queued[d]) {
                        queued[d] = 1;
                        work.push_back(d);
                    }
                }
            }
        }

        // ---- rename over the dominator tree ----
        std::vector<std::vector<ValueId>> stacks(nv);
        std::vector<UseSite> uses;

        auto top = [&](cfg::VarId v) -> ValueId {
            if (v == cfg::kInvalidVar) return kInvalidValue;
            return stacks[v].empty() ? kUndef : stacks[v].back();
        };
        auto use = [&](cfg::VarId v, const Span& sp) -> ValueId {
            const ValueId id = top(v);
            if (v != cfg::kInvalidVar) uses.push_back(UseSite{id, v, sp});
            return id;
        };

        std::function<void(uint32_t)> rename = [&](uint32_t b) {
            std::vector<cfg::VarId> pushed;
            Block& blk = out.blocks[b];

            for (auto& p : blk.phis) {
                stacks[p.var].push_back(p.dst);
                pushed.push_back(p.var);
            }

            for (const cfg::Op& src : f.blocks[b].ops) {
                cfg::Op op = src;
                op.a = use(src.a, src.span);
                op.b = use(src.b, src.span);
                op.c = use(src.c, src.span);
                for (auto& x : op.args) x = use(x, src.span);

                if (src.kind == cfg::OpKind::kCopy) {
                    // copies become aliases of their source value
                    stacks[src.dst].push_back(op.a);
                    pushed.push_back(src.dst);
                    res.stats.copies_folded += 1;
                    continue;
                }
                if (src.dst != cfg::kInvalidVar) {
                    const DefKind dk = (src.kind == cfg::OpKind::kParam) ? DefKind::kParam : DefKind::kOp;
                    op.dst = new_value_(out, src.dst, dk, b);
                    if (src.kind == cfg::OpKind::kParam && src.imm < out.params.size()) out.params[src.imm] = op.dst;
                    stacks[src.dst].push_back(op.dst);
                    pushed.push_back(src.dst);
                }
                blk.ops.push_back(std::move(op));
            }

            blk.term = f.blocks[b].term;
            blk.term.value = use(f.blocks[b].term.value, f.blocks[b].term.span);

            for (BlockId s : dom.succs_by_block[b]) {
                for (auto& p : out.blocks[s].phis) {
                    for (auto& in : p.incoming) {
                        if (in.pred == b) in.value = top(p.var);
                    }
                }
            }

            for (uint32_t child : dom.dom_tree[b]) rename(child);

            for (auto it = pushed.rbegin(); it != pushed.rend(); ++it) stacks[*it].pop_back();
        };
        rename(f.entry);

        // ---- drop phis no real use reaches ----
        const uint32_t nvals = static_cast<uint32_t>(out.values.size());
        std::vector<const Phi*> phi_of(nvals, nullptr);
        for (const auto& blk : out.blocks) {
            for (const auto& p : blk.phis) phi_of[p.dst] = &p;
        }
        std::vector<uint8_t> useful(nvals, 0);
        std::deque<ValueId> work;
        for (const auto& u : uses) {
            if (u.value < nvals && phi_of[u.value] != nullptr && !useful[u.value]) {
                useful[u.value] = 1;
                work.push_back(u.value);
            }
        }
        while (!work.empty()) {
            const ValueId v = work.front();
            work.pop_front();
            for (const auto& in : phi_of[v]->incoming) {
                if (in.value < nvals && phi_of[in.value] != nullptr && !useful[in.value]) {
                    useful[in.value] = 1;
                    work.push_back(in.value);
                }
            }
        }

        // maybe-undef: a live phi with an undefined input on some path
        std::vector<uint8_t> maybe_undef(nvals, 0);
        bool changed = true;
        while (changed) {
            changed = false;
            for (const auto& blk : out.blocks) {
                for (const auto& p : blk.phis) {
                    if (!useful[p.dst] || maybe_undef[p.dst]) continue;
                    for (const auto& in : p.incoming) {
                        if (in.value == kUndef || (in.value < nvals && maybe_undef[in.value])) {
                            maybe_undef[p.dst] = 1;
                            changed = true;
                            break;
                        }
                    }
                }
            }
        }

        for (auto& blk : out.blocks) {
            const size_t before = blk.phis.size();
            std::vector<Phi> kept;
            for (auto& p : blk.phis) {
                if (useful[p.dst]) kept.push_back(std::move(p));
            }
            res.stats.phis_removed += static_cast<uint32_t>(before - kept.size());
            blk.phis = std::move(kept);
        }

        // ---- report reads that may see no definition, once per variable ----
        std::vector<uint8_t> reported(nv, 0);
        res.ok = true;
        for (const auto& u : uses) {
            const bool bad = (u.value == kUndef) || (u.value < nvals && maybe_undef[u.value]);
            if (!bad) continue;
            res.ok = false;
            if (reported[u.var]) continue;
            reported[u.var] = 1;

            std::string name = out.vars[u.var].name;
            if (!name.empty() && name.front() == '$') name.erase(0, 1);
            diag::Diagnostic d(diag::Severity::kError, diag::Code::kUseBeforeDef, u.span);
            d.add_arg(name);
            bag.add(std::move(d));
        }

        res.stats.values = static_cast<uint32_t>(out.values.size());
        return res;
    }

    Unit build_unit(const cfg::Unit& u, diag::Bag& bag) {
        Unit out{};
        out.name = u.name;
        out.ok = true;
        out.functions.reserve(u.functions.size());
        for (const auto& f : u.functions) {
            BuildResult r = build(f, bag);
            out.ok = out.ok && r.ok;
            out.stats.phis_placed += r.stats.phis_placed;
            out.stats.phis_removed += r.stats.phis_removed;
            out.stats.copies_folded += r.stats.copies_folded;
            out.stats.values += r.stats.values;
            out.functions.push_back(std::move(r.fn));
        }
        return out;
    }

} // namespace php2ir::ssa
