// frontend/src/lir/refcount.cpp
#include <php2ir/lir/RefCount.hpp>

#include <algorithm>
#include <sstream>


namespace php2ir::lir {

    namespace {

        using Bits = std::vector<uint8_t>;

        bool is_rc_(const Function& f, ValueId v) {
            return v != kInvalidValue && v < f.value_types.size() && is_handle(f.value_types[v]);
        }

        bool is_rc_inst_(const Inst& i) {
            return i.op == Opcode::kRetain || i.op == Opcode::kRelease;
        }

        Inst rc_inst_(Opcode op, ValueId v, Span sp) {
            Inst i{};
            i.op = op;
            i.type = Type::kVoid;
            i.args = {v};
            i.span = sp;
            return i;
        }

        /// @brief 한 지점에서 값 하나에 대한 사용 요약.
        struct UseCount {
            ValueId value = kInvalidValue;
            uint32_t consumed = 0;
            bool borrowed = false;
        };

        void add_use_(std::vector<UseCount>& out, ValueId v, bool consumed) {
            for (auto& u : out) {
                if (u.value != v) continue;
                if (consumed) ++u.consumed;
                else u.borrowed = true;
                return;
            }
            out.push_back(UseCount{v, consumed ? 1u : 0u, !consumed});
        }

        std::vector<UseCount> inst_uses_(const Function& f, const Inst& inst) {
            std::vector<UseCount> out;
            for (const auto& h : handle_uses(f, inst)) add_use_(out, h.value, h.consumed);
            return out;
        }

        /// @brief succ의 phi들이 pred에서 받는 핸들 값(phi 하나당 참조 하나).
        void phi_uses_(const Function& f, BlockId pred, BlockId succ, std::vector<UseCount>& out) {
            if (succ >= f.blocks.size()) return;
            for (const auto& p : f.blocks[succ].phis) {
                if (!is_handle(p.type)) continue;
                for (const auto& in : p.incoming) {
                    if (in.pred == pred && is_rc_(f, in.value)) add_use_(out, in.value, true);
                }
            }
        }

        /// @brief 종결자가 가져가는 값. ret/raise 값과 phi 간선.
        std::vector<UseCount> term_uses_(const Function& f, BlockId b) {
            std::vector<UseCount> out;
            const Term& t = f.blocks[b].term;
            switch (t.kind) {
                case TermKind::kRet:
                    if (is_rc_(f, t.value)) add_use_(out, t.value, true);
                    break;
                case TermKind::kRaise:
                    if (is_rc_(f, t.value)) add_use_(out, t.value, true);
                    phi_uses_(f, b, t.target, out);
                    break;
                case TermKind::kBr:
                    phi_uses_(f, b, t.target, out);
                    break;
                default:
                    break;
            }
            return out;
        }

        struct Liveness {
            std::vector<Bits> in;   // live at block entry, phi dsts / params excluded
        };

        /// @brief 간선 b -> s 위에서 살아 있어야 하는 값. 예외 간선에서는 g가 빠진다.
        Bits edge_live_(const Function& f, const Liveness& lv, BlockId b, BlockId s) {
            Bits out = lv.in[s];
            std::vector<UseCount> inc;
            phi_uses_(f, b, s, inc);
            for (const auto& u : inc) out[u.value] = 1;
            const Term& t = f.blocks[b].term;
            if (t.kind == TermKind::kExcCheck && s == t.alt) {
                const ValueId g = guarded_value(f, b);
                if (g != kInvalidValue) out[g] = 0;
            }
            return out;
        }

        Bits live_out_(const Function& f, const Liveness& lv, BlockId b) {
            Bits out(f.value_types.size(), 0);
            for (BlockId s : successors(f.blocks[b].term)) {
                if (s >= f.blocks.size()) continue;
                const Bits e = edge_live_(f, lv, b, s);
                for (size_t v = 0; v < out.size(); ++v) out[v] |= e[v];
            }
            return out;
        }

        /// @brief 종결자 바로 뒤에 살아 있는 값. br/raise는 phi로 넘겨준 값을 뺀 후속 블록 live-in.
        Bits after_term_(const Function& f, const Liveness& lv, BlockId b) {
            const Term& t = f.blocks[b].term;
            switch (t.kind) {
                case TermKind::kBr:
                case TermKind::kRaise:
                    if (t.target < f.blocks.size()) return lv.in[t.target];
                    return Bits(f.value_types.size(), 0);
                case TermKind::kCondBr:
                case TermKind::kExcCheck:
                    return live_out_(f, lv, b);
                default:
                    return Bits(f.value_types.size(), 0);
            }
        }

        Liveness compute_liveness_(const Function& f) {
            Liveness lv{};
            const size_t nv = f.value_types.size();
            lv.in.assign(f.blocks.size(), Bits(nv, 0));

            bool changed = true;
            while (changed) {
                changed = false;
                for (size_t bi = f.blocks.size(); bi-- > 0;) {
                    const BlockId b = static_cast<BlockId>(bi);
                    const Block& blk = f.blocks[b];

                    Bits live = after_term_(f, lv, b);
                    for (const auto& u : term_uses_(f, b)) live[u.value] = 1;
                    for (size_t k = blk.insts.size(); k-- > 0;) {
                        const Inst& inst = blk.insts[k];
                        if (is_rc_(f, inst.dst)) live[inst.dst] = 0;
                        for (const auto& u : inst_uses_(f, inst)) live[u.value] = 1;
                    }
                    for (const auto& p : blk.phis) {
                        if (p.dst < nv) live[p.dst] = 0;
                    }
                    if (b == f.entry) {
                        for (ValueId p : f.params) {
                            if (p < nv) live[p] = 0;
                        }
                    }
                    if (live != lv.in[b]) {
                        lv.in[b] = std::move(live);
                        changed = true;
                    }
                }
            }
            return lv;
        }

        void push_error_(std::vector<VerifyError>& out, const Function& f, BlockId b, const std::string& msg) {
            std::ostringstream oss;
            oss << f.name << ": bb" << b << ": " << msg;
            out.push_back(VerifyError{oss.str()});
        }

    } // namespace

    std::vector<HandleUse> handle_uses(const Function& f, const Inst& inst) {
        std::vector<HandleUse> out;
        for (uint32_t i = 0; i < inst.args.size(); ++i) {
            const ValueId v = inst.args[i];
            if (!is_rc_(f, v)) continue;
            bool consumed = false;
            switch (inst.op) {
                case Opcode::kCallRt:
                    consumed = rt::consumes_param(rt::rt_info(inst.rt), i);
                    break;
                case Opcode::kCall:
                case Opcode::kCallIndirect:
                    consumed = true;
                    break;
                case Opcode::kStoreSlot:
                    consumed = (i == 1);
                    break;
                case Opcode::kRetain:
                case Opcode::kRelease:
                    continue;
                default:
                    break;
            }
            out.push_back(HandleUse{v, consumed});
        }
        return out;
    }

    ValueId guarded_value(const Function& f, BlockId b) {
        if (b >= f.blocks.size()) return kInvalidValue;
        const Block& blk = f.blocks[b];
        if (blk.term.kind != TermKind::kExcCheck) return kInvalidValue;
        for (auto it = blk.insts.rbegin(); it != blk.insts.rend(); ++it) {
            if (is_rc_inst_(*it)) continue;
            return is_rc_(f, it->dst) ? it->dst : kInvalidValue;
        }
        return kInvalidValue;
    }

    RcStats insert_refcounts(Function& f) {
        RcStats st{};
        for (auto& blk : f.blocks) {
            blk.insts.erase(std::remove_if(blk.insts.begin(), blk.insts.end(), is_rc_inst_), blk.insts.end());
        }

        const Liveness lv = compute_liveness_(f);
        const size_t nv = f.value_types.size();
        std::vector<std::vector<Inst>> rebuilt(f.blocks.size());

        for (BlockId b = 0; b < f.blocks.size(); ++b) {
            const Block& blk = f.blocks[b];
            std::vector<Inst> rev;      // built back to front

            Bits live = after_term_(f, lv, b);
            for (const auto& u : term_uses_(f, b)) {
                const uint32_t need = u.consumed + (live[u.value] ? 1u : 0u);
                for (uint32_t k = 1; k < need; ++k) {
                    rev.push_back(rc_inst_(Opcode::kRetain, u.value, blk.term.span));
                    ++st.retains;
                }
            }
            for (const auto& u : term_uses_(f, b)) live[u.value] = 1;

            for (size_t k = blk.insts.size(); k-- > 0;) {
                const Inst& inst = blk.insts[k];
                if (is_rc_(f, inst.dst)) {
                    if (!live[inst.dst]) {
                        rev.push_back(rc_inst_(Opcode::kRelease, inst.dst, inst.span));
                        ++st.releases;
                    }
                    live[inst.dst] = 0;
                }

                const std::vector<UseCount> uses = inst_uses_(f, inst);
                for (const auto& u : uses) {
                    if (u.borrowed && !live[u.value]) {
                        rev.push_back(rc_inst_(Opcode::kRelease, u.value, inst.span));
                        ++st.releases;
                    }
                }
                rev.push_back(inst);
                for (const auto& u : uses) {
                    const uint32_t need = u.consumed + ((live[u.value] || u.borrowed) ? 1u : 0u);
                    for (uint32_t r = 1; r < need; ++r) {
                        rev.push_back(rc_inst_(Opcode::kRetain, u.value, inst.span));
                        ++st.retains;
                    }
                }
                for (const auto& u : uses) live[u.value] = 1;
            }

            // block head: edge releases, then defs nobody reads
            std::vector<Inst> head;
            if (blk.preds.size() == 1) {
                const BlockId p = blk.preds[0];
                const Term& pt = f.blocks[p].term;
                if (pt.kind == TermKind::kCondBr || pt.kind == TermKind::kExcCheck) {
                    const Bits out = live_out_(f, lv, p);
                    const Bits edge = edge_live_(f, lv, p, b);
                    const ValueId g = (pt.kind == TermKind::kExcCheck && b == pt.alt) ? guarded_value(f, p)
                                                                                      : kInvalidValue;
                    for (ValueId v = 0; v < nv; ++v) {
                        if (!out[v] || edge[v] || v == g) continue;
                        head.push_back(rc_inst_(Opcode::kRelease, v, pt.span));
                        ++st.edge_releases;
                    }
                }
            }
            for (const auto& p : blk.phis) {
                if (is_rc_(f, p.dst) && !live[p.dst]) {
                    head.push_back(rc_inst_(Opcode::kRelease, p.dst, blk.term.span));
                    ++st.releases;
                }
            }
            if (b == f.entry) {
                for (ValueId p : f.params) {
                    if (is_rc_(f, p) && !live[p]) {
                        head.push_back(rc_inst_(Opcode::kRelease, p, f.span));
                        ++st.releases;
                    }
                }
            }

            std::reverse(rev.begin(), rev.end());
            head.insert(head.end(), std::make_move_iterator(rev.begin()), std::make_move_iterator(rev.end()));
            rebuilt[b] = std::move(head);
        }

        for (BlockId b = 0; b < f.blocks.size(); ++b) f.blocks[b].insts = std::move(rebuilt[b]);
        return st;
    }

    RcStats insert_refcounts(Module& m) {
        RcStats total{};
        for (auto& f : m.functions) {
            const RcStats s = insert_refcounts(f);
            total.retains += s.retains;
            total.releases += s.releases;
            total.edge_releases += s.edge_releases;
        }
        return total;
    }

    // ---- checker ----

    std::vector<VerifyError> check_refcounts(const Function& f) {
        std::vector<VerifyError> errs;
        const size_t nv = f.value_types.size();
        const size_t nb = f.blocks.size();
        if (nb == 0) return errs;

        using State = std::vector<int32_t>;
        std::vector<State> entry_state(nb);
        std::vector<uint8_t> has_state(nb, 0);
        std::vector<uint8_t> join_reported(nb, 0);
        std::vector<BlockId> work;

        auto arrive = [&](BlockId from, BlockId s, const State& st) {
            if (s >= nb) return;
            if (!has_state[s]) {
                entry_state[s] = st;
                has_state[s] = 1;
                work.push_back(s);
                return;
            }
            if (entry_state[s] != st && !join_reported[s]) {
                join_reported[s] = 1;
                for (ValueId v = 0; v < nv; ++v) {
                    if (entry_state[s][v] == st[v]) continue;
                    std::ostringstream oss;
                    oss << "count of %" << v << " differs at join (" << entry_state[s][v]
                        << " vs " << st[v] << " from bb" << from << ")";
                    push_error_(errs, f, s, oss.str());
                    break;
                }
            }
        };

        State init(nv, 0);
        for (ValueId p : f.params) {
            if (is_rc_(f, p)) init[p] = 1;
        }
        arrive(f.entry, f.entry, init);

        while (!work.empty()) {
            const BlockId b = work.back();
            work.pop_back();
            const Block& blk = f.blocks[b];
            State st = entry_state[b];

            auto define = [&](ValueId v) {
                if (!is_rc_(f, v)) return;
                if (st[v] != 0) {
                    std::ostringstream oss;
                    oss << "%" << v << " redefined while it still holds " << st[v] << " reference(s)";
                    push_error_(errs, f, b, oss.str());
                }
                st[v] = 1;
            };
            auto consume = [&](const UseCount& u, const char* what) {
                const int32_t need = static_cast<int32_t>(u.consumed) + (u.borrowed ? 1 : 0);
                if (st[u.value] < need || st[u.value] < 1) {
                    std::ostringstream oss;
                    oss << what << " uses %" << u.value << " with count " << st[u.value]
                        << " (needs " << need << ")";
                    push_error_(errs, f, b, oss.str());
                }
                st[u.value] -= static_cast<int32_t>(u.consumed);
            };

            for (const auto& p : blk.phis) define(p.dst);

            for (const auto& inst : blk.insts) {
                if (is_rc_inst_(inst)) {
                    const ValueId v = inst.args.empty() ? kInvalidValue : inst.args[0];
                    if (!is_rc_(f, v)) {
                        push_error_(errs, f, b, std::string(opcode_name(inst.op)) + " on a non-handle value");
                        continue;
                    }
                    if (st[v] < 1) {
                        std::ostringstream oss;
                        oss << opcode_name(inst.op) << " %" << v << " with count " << st[v];
                        push_error_(errs, f, b, oss.str());
                    }
                    st[v] += (inst.op == Opcode::kRetain) ? 1 : -1;
                    continue;
                }
                for (const auto& u : inst_uses_(f, inst)) consume(u, std::string(opcode_name(inst.op)).c_str());
                define(inst.dst);
            }

            for (const auto& u : term_uses_(f, b)) consume(u, "terminator");

            auto check_all_zero = [&](const char* where) {
                for (ValueId v = 0; v < nv; ++v) {
                    if (st[v] == 0) continue;
                    std::ostringstream oss;
                    oss << "%" << v << " holds " << st[v] << " reference(s) at " << where;
                    push_error_(errs, f, b, oss.str());
                }
            };

            const Term& t = blk.term;
            switch (t.kind) {
                case TermKind::kRet:
                    check_all_zero("ret");
                    break;
                case TermKind::kUnwindRet:
                    check_all_zero("unwind");
                    break;
                case TermKind::kExcCheck: {
                    arrive(b, t.target, st);
                    State unwind = st;
                    const ValueId g = guarded_value(f, b);
                    if (g != kInvalidValue) unwind[g] = 0;
                    arrive(b, t.alt, unwind);
                    break;
                }
                default:
                    for (BlockId s : successors(t)) arrive(b, s, st);
                    break;
            }
        }
        return errs;
    }

    std::vector<VerifyError> check_refcounts(const Module& m) {
        std::vector<VerifyError> all;
        for (const auto& f : m.functions) {
            auto e = check_refcounts(f);
            all.insert(all.end(), e.begin(), e.end());
        }
        return all;
    }

} // namespace php2ir::lir
