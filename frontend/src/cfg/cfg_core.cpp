// frontend/src/cfg/cfg_core.cpp
#include <php2ir/cfg/CFG.hpp>
#include <php2ir/resolve/Builtins.hpp>

#include <sstream>


namespace php2ir::cfg {

    Repr repr_of(const ty::TypePool& types, ty::TypeId t) {
        if (types.is_error(t)) return Repr::kBox;
        const ty::Type& x = types.get(t);
        switch (x.kind) {
            case ty::Kind::kError:    return Repr::kBox;
            case ty::Kind::kNullable: return Repr::kBox;
            case ty::Kind::kArray:    return Repr::kArr;
            case ty::Kind::kObject:   return Repr::kObj;
            case ty::Kind::kBuiltin:
                switch (x.builtin) {
                    case ty::Builtin::kVoid:   return Repr::kVoid;
                    case ty::Builtin::kBool:   return Repr::kBool;
                    case ty::Builtin::kInt:    return Repr::kInt;
                    case ty::Builtin::kFloat:  return Repr::kFloat;
                    case ty::Builtin::kString: return Repr::kStr;
                    case ty::Builtin::kNull:
                    case ty::Builtin::kNever:
                    case ty::Builtin::kMixed:  return Repr::kBox;
                }
        }
        return Repr::kBox;
    }

    std::string_view repr_name(Repr r) {
        switch (r) {
            case Repr::kVoid:  return "void";
            case Repr::kBool:  return "bool";
            case Repr::kInt:   return "int";
            case Repr::kFloat: return "float";
            case Repr::kStr:   return "str";
            case Repr::kArr:   return "arr";
            case Repr::kObj:   return "obj";
            case Repr::kBox:   return "box";
        }
        return "?";
    }

    std::string_view bin_name(BinKind k) {
        switch (k) {
            case BinKind::kAdd: return "add";
            case BinKind::kSub: return "sub";
            case BinKind::kMul: return "mul";
            case BinKind::kDiv: return "div";
            case BinKind::kRem: return "rem";
            case BinKind::kPow: return "pow";
            case BinKind::kBitAnd: return "and";
            case BinKind::kBitOr: return "or";
            case BinKind::kBitXor: return "xor";
            case BinKind::kShl: return "shl";
            case BinKind::kShr: return "shr";
            case BinKind::kEq: return "eq";
            case BinKind::kNe: return "ne";
            case BinKind::kLt: return "lt";
            case BinKind::kLe: return "le";
            case BinKind::kGt: return "gt";
            case BinKind::kGe: return "ge";
            case BinKind::kIdentical: return "identical";
            case BinKind::kNotIdentical: return "not_identical";
            case BinKind::kSpaceship: return "cmp";
        }
        return "?";
    }

    std::string_view un_name(UnKind k) {
        switch (k) {
            case UnKind::kNeg: return "neg";
            case UnKind::kNot: return "not";
            case UnKind::kBitNot: return "bitnot";
        }
        return "?";
    }

    bool is_compare(BinKind k) {
        switch (k) {
            case BinKind::kEq: case BinKind::kNe:
            case BinKind::kLt: case BinKind::kLe:
            case BinKind::kGt: case BinKind::kGe:
            case BinKind::kIdentical: case BinKind::kNotIdentical:
                return true;
            default:
                return false;
        }
    }

    std::vector<BlockId> successors(const Term& t) {
        switch (t.kind) {
            case TermKind::kJump:
            case TermKind::kRaise:
                return {t.target};
            case TermKind::kBranch:
            case TermKind::kExcCheck:
                return {t.target, t.alt};
            default:
                return {};
        }
    }

    bool is_exception_edge(const Term& t, uint32_t succ_index) {
        if (t.kind == TermKind::kRaise) return true;
        if (t.kind == TermKind::kExcCheck) return succ_index == 1;
        return false;
    }

    bool may_throw(const Function& f, const Op& op) {
        switch (op.kind) {
            case OpKind::kCall:
            case OpKind::kCallVirtual:
            case OpKind::kCallDyn:
            case OpKind::kGetPropDyn:
            case OpKind::kSetPropDyn:
                return true;
            case OpKind::kCallBuiltin:
                return resolve::builtin_info(op.builtin).may_throw;
            case OpKind::kCast: {
                // box -> obj / arr fails with a TypeError when the tag does not match
                if (op.a == kInvalidVar || op.dst == kInvalidVar) return false;
                const Repr from = f.vars[op.a].repr;
                const Repr to = f.vars[op.dst].repr;
                return from == Repr::kBox && (to == Repr::kObj || to == Repr::kArr);
            }
            default:
                return false;
        }
    }

    std::vector<VarId> op_uses(const Op& op) {
        std::vector<VarId> out;
        if (op.a != kInvalidVar) out.push_back(op.a);
        if (op.b != kInvalidVar) out.push_back(op.b);
        if (op.c != kInvalidVar) out.push_back(op.c);
        for (VarId v : op.args) out.push_back(v);
        return out;
    }

    // ---- cleanup ----

    void compute_preds(Function& f) {
        for (auto& b : f.blocks) b.preds.clear();
        for (BlockId bi = 0; bi < f.blocks.size(); ++bi) {
            for (BlockId s : successors(f.blocks[bi].term)) {
                if (s < f.blocks.size()) f.blocks[s].preds.push_back(bi);
            }
        }
    }

    uint32_t prune_unreachable(Function& f) {
        const uint32_t n = static_cast<uint32_t>(f.blocks.size());
        std::vector<uint8_t> seen(n, 0);
        std::vector<BlockId> order;
        std::vector<BlockId> work{f.entry};
        seen[f.entry] = 1;
        while (!work.empty()) {
            const BlockId b = work.back();
            work.pop_back();
            order.push_back(b);
            for (BlockId s : successors(f.blocks[b].term)) {
                if (s < n && !seen[s]) {
                    seen[s] = 1;
                    work.push_back(s);
                }
            }
        }

        // keep original relative order so dumps stay readable
        std::vector<BlockId> remap(n, kInvalidBlock);
        std::vector<Block> kept;
        kept.reserve(order.size());
        for (BlockId b = 0; b < n; ++b) {
            if (!seen[b]) continue;
            remap[b] = static_cast<BlockId>(kept.size());
            kept.push_back(std::move(f.blocks[b]));
        }
        for (auto& b : kept) {
            if (b.term.target != kInvalidBlock) b.term.target = remap[b.term.target];
            if (b.term.alt != kInvalidBlock) b.term.alt = remap[b.term.alt];
        }
        const uint32_t removed = n - static_cast<uint32_t>(kept.size());
        f.entry = remap[f.entry];
        f.unwind_exit = (f.unwind_exit == kInvalidBlock) ? kInvalidBlock : remap[f.unwind_exit];
        f.blocks = std::move(kept);
        compute_preds(f);
        return removed;
    }

    uint32_t split_critical_edges(Function& f) {
        compute_preds(f);
        uint32_t split = 0;
        const uint32_t n = static_cast<uint32_t>(f.blocks.size());
        for (BlockId bi = 0; bi < n; ++bi) {
            const auto succs = successors(f.blocks[bi].term);
            if (succs.size() < 2) continue;
            for (uint32_t k = 0; k < succs.size(); ++k) {
                const BlockId s = succs[k];
                if (f.blocks[s].preds.size() < 2) continue;

                Block mid{};
                mid.term.kind = TermKind::kJump;
                mid.term.target = s;
                mid.term.span = f.blocks[bi].term.span;
                const BlockId mid_id = static_cast<BlockId>(f.blocks.size());
                f.blocks.push_back(std::move(mid));

                Term& t = f.blocks[bi].term;
                if (k == 0) t.target = mid_id;
                else t.alt = mid_id;
                ++split;
            }
        }
        compute_preds(f);
        return split;
    }

    // ---- verify ----

    namespace {

        void push_error_(std::vector<VerifyError>& out, const std::string& msg) {
            out.push_back(VerifyError{msg});
        }

    } // namespace

    std::vector<VerifyError> verify(const Function& f) {
        std::vector<VerifyError> errs;
        const uint32_t nb = static_cast<uint32_t>(f.blocks.size());
        const uint32_t nv = static_cast<uint32_t>(f.vars.size());

        auto check_var = [&](BlockId b, VarId v, const char* what) {
            if (v == kInvalidVar || v < nv) return;
            std::ostringstream oss;
            oss << f.name << ": bb" << b << " " << what << " references invalid var #" << v;
            push_error_(errs, oss.str());
        };

        std::vector<uint32_t> pred_count(nb, 0);
        for (BlockId b = 0; b < nb; ++b) {
            const Block& blk = f.blocks[b];
            for (uint32_t i = 0; i < blk.ops.size(); ++i) {
                const Op& op = blk.ops[i];
                check_var(b, op.dst, "op dst");
                for (VarId u : op_uses(op)) check_var(b, u, "op operand");
                if (op.kind == OpKind::kLandingPad && i != 0) {
                    std::ostringstream oss;
                    oss << f.name << ": bb" << b << " landing pad is not the first op";
                    push_error_(errs, oss.str());
                }
                const bool last = (i + 1 == blk.ops.size());
                if (may_throw(f, op) && !(last && blk.term.kind == TermKind::kExcCheck)) {
                    std::ostringstream oss;
                    oss << f.name << ": bb" << b << " may-throw op #" << i << " is not followed by excheck";
                    push_error_(errs, oss.str());
                }
            }

            if (blk.term.kind == TermKind::kNone) {
                std::ostringstream oss;
                oss << f.name << ": bb" << b << " has no terminator";
                push_error_(errs, oss.str());
                continue;
            }
            check_var(b, blk.term.value, "terminator");
            if (blk.term.kind == TermKind::kBranch && blk.term.value != kInvalidVar && blk.term.value < nv &&
                f.vars[blk.term.value].repr != Repr::kBool) {
                std::ostringstream oss;
                oss << f.name << ": bb" << b << " branch condition is not bool";
                push_error_(errs, oss.str());
            }
            const auto succs = successors(blk.term);
            for (BlockId s : succs) {
                if (s >= nb) {
                    std::ostringstream oss;
                    oss << f.name << ": bb" << b << " targets invalid block bb" << s;
                    push_error_(errs, oss.str());
                    continue;
                }
                ++pred_count[s];
            }
            if (succs.size() >= 2) {
                for (BlockId s : succs) {
                    if (s < nb && f.blocks[s].preds.size() >= 2) {
                        std::ostringstream oss;
                        oss << f.name << ": critical edge bb" << b << " -> bb" << s;
                        push_error_(errs, oss.str());
                    }
                }
            }
        }

        for (BlockId b = 0; b < nb; ++b) {
            if (pred_count[b] != f.blocks[b].preds.size()) {
                std::ostringstream oss;
                oss << f.name << ": bb" << b << " pred list is stale (" << f.blocks[b].preds.size()
                    << " recorded, " << pred_count[b] << " actual)";
                push_error_(errs, oss.str());
            }
            if (b != f.entry && pred_count[b] == 0) {
                std::ostringstream oss;
                oss << f.name << ": bb" << b << " is unreachable";
                push_error_(errs, oss.str());
            }
        }
        return errs;
    }

} // namespace php2ir::cfg
