// frontend/src/ssa/ssa_verify.cpp
#include <php2ir/ssa/Dominance.hpp>
#include <php2ir/ssa/SSA.hpp>

#include <cstdint>
#include <sstream>


namespace php2ir::ssa {

    namespace {

        void push_error_(std::vector<VerifyError>& out, const std::string& msg) {
            out.push_back(VerifyError{msg});
        }

        struct DefSite {
            BlockId block = cfg::kInvalidBlock;
            int32_t pos = -2;   // -1: phi, >= 0: op index
        };

    } // namespace

    std::vector<VerifyError> verify(const Function& f) {
        std::vector<VerifyError> errs;
        const uint32_t nb = static_cast<uint32_t>(f.blocks.size());
        const uint32_t nvals = static_cast<uint32_t>(f.values.size());

        std::vector<std::vector<BlockId>> preds(nb);
        std::vector<std::vector<BlockId>> succs(nb);
        for (BlockId b = 0; b < nb; ++b) {
            preds[b] = f.blocks[b].preds;
            succs[b] = cfg::successors(f.blocks[b].term);
        }
        const DomInfo dom = build_dom_info(std::move(preds), std::move(succs), f.entry);

        // def sites, each value defined exactly once
        std::vector<DefSite> def(nvals);
        auto define = [&](ValueId v, BlockId b, int32_t pos) {
            if (v >= nvals) {
                std::ostringstream oss;
                oss << f.name << ": bb" << b << " defines invalid value %" << v;
                push_error_(errs, oss.str());
                return;
            }
            if (def[v].block != cfg::kInvalidBlock) {
                std::ostringstream oss;
                oss << f.name << ": value %" << v << " defined twice";
                push_error_(errs, oss.str());
                return;
            }
            def[v] = DefSite{b, pos};
        };
        for (BlockId b = 0; b < nb; ++b) {
            for (const auto& p : f.blocks[b].phis) define(p.dst, b, -1);
            for (size_t i = 0; i < f.blocks[b].ops.size(); ++i) {
                const auto& op = f.blocks[b].ops[i];
                if (op.dst != kInvalidValue) define(op.dst, b, static_cast<int32_t>(i));
            }
        }

        auto check_use = [&](ValueId v, BlockId b, int32_t pos, const char* what) {
            if (v == kInvalidValue) return;
            std::ostringstream oss;
            if (v == kUndef) {
                oss << f.name << ": bb" << b << " " << what << " reads an undefined value";
                push_error_(errs, oss.str());
                return;
            }
            if (v >= nvals || def[v].block == cfg::kInvalidBlock) {
                oss << f.name << ": bb" << b << " " << what << " reads unknown value %" << v;
                push_error_(errs, oss.str());
                return;
            }
            const DefSite& d = def[v];
            const bool ok = (d.block == b) ? (d.pos < pos) : dominates(dom, d.block, b);
            if (!ok) {
                oss << f.name << ": bb" << b << " " << what << " reads %" << v
                    << " whose definition (bb" << d.block << ") does not dominate it";
                push_error_(errs, oss.str());
            }
        };

        for (BlockId b = 0; b < nb; ++b) {
            const Block& blk = f.blocks[b];

            for (const auto& p : blk.phis) {
                if (p.incoming.size() != blk.preds.size()) {
                    std::ostringstream oss;
                    oss << f.name << ": bb" << b << " phi %" << p.dst << " has " << p.incoming.size()
                        << " inputs for " << blk.preds.size() << " preds";
                    push_error_(errs, oss.str());
                    continue;
                }
                for (size_t i = 0; i < p.incoming.size(); ++i) {
                    const PhiIncoming& in = p.incoming[i];
                    if (in.pred != blk.preds[i]) {
                        std::ostringstream oss;
                        oss << f.name << ": bb" << b << " phi %" << p.dst << " input " << i << " names bb"
                            << in.pred << ", pred is bb" << blk.preds[i];
                        push_error_(errs, oss.str());
                        continue;
                    }
                    // an input is read at the end of its pred
                    if (in.value == kUndef) continue;
                    check_use(in.value, in.pred, INT32_MAX, "phi input");
                }
            }

            for (size_t i = 0; i < blk.ops.size(); ++i) {
                const auto& op = blk.ops[i];
                const int32_t pos = static_cast<int32_t>(i);
                check_use(op.a, b, pos, "op operand");
                check_use(op.b, b, pos, "op operand");
                check_use(op.c, b, pos, "op operand");
                for (ValueId a : op.args) check_use(a, b, pos, "call argument");
            }
            check_use(blk.term.value, b, INT32_MAX, "terminator");
        }
        return errs;
    }

} // namespace php2ir::ssa
