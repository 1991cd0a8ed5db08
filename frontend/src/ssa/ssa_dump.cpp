// frontend/src/ssa/ssa_dump.cpp
#include <php2ir/ssa/SSA.hpp>

#include <sstream>


namespace php2ir::ssa {

    namespace {

        void val_(std::ostream& os, const Function& f, ValueId v) {
            if (v == kInvalidValue) {
                os << "_";
                return;
            }
            if (v == kUndef) {
                os << "undef";
                return;
            }
            os << "%" << v;
            const cfg::VarId var = (v < f.values.size()) ? f.values[v].var : cfg::kInvalidVar;
            if (var != cfg::kInvalidVar && !f.vars[var].is_temp) os << "(" << f.vars[var].name << ")";
        }

    } // namespace

    std::string dump(const Function& f) {
        std::ostringstream os;
        os << "ssa " << f.name << "(";
        for (size_t i = 0; i < f.params.size(); ++i) {
            if (i) os << ", ";
            val_(os, f, f.params[i]);
        }
        os << ") -> " << cfg::repr_name(f.ret_repr) << "\n";

        for (BlockId b = 0; b < f.blocks.size(); ++b) {
            const Block& blk = f.blocks[b];
            os << "bb" << b << ":";
            if (b == f.entry) os << " ; entry";
            if (b == f.unwind_exit) os << " ; unwind";
            os << "\n";

            for (const auto& p : blk.phis) {
                os << "  ";
                val_(os, f, p.dst);
                os << " = phi";
                for (size_t i = 0; i < p.incoming.size(); ++i) {
                    os << (i ? ", [" : " [");
                    val_(os, f, p.incoming[i].value);
                    os << ", bb" << p.incoming[i].pred << "]";
                }
                os << "\n";
            }

            for (const auto& op : blk.ops) {
                os << "  ";
                if (op.dst != kInvalidValue) {
                    val_(os, f, op.dst);
                    os << ":" << cfg::repr_name(f.values[op.dst].repr) << " = ";
                }
                os << cfg::op_name(op.kind);
                if (op.kind == cfg::OpKind::kBinary) os << "." << cfg::bin_name(op.bin);
                if (op.kind == cfg::OpKind::kUnary) os << "." << cfg::un_name(op.un);
                const auto uses = cfg::op_uses(op);
                for (size_t i = 0; i < uses.size(); ++i) {
                    os << (i ? ", " : " ");
                    val_(os, f, uses[i]);
                }
                os << "\n";
            }

            const cfg::Term& t = blk.term;
            os << "  ";
            switch (t.kind) {
                case cfg::TermKind::kNone: os << "<no terminator>"; break;
                case cfg::TermKind::kJump: os << "jump bb" << t.target; break;
                case cfg::TermKind::kBranch:
                    os << "br ";
                    val_(os, f, t.value);
                    os << ", bb" << t.target << ", bb" << t.alt;
                    break;
                case cfg::TermKind::kReturn:
                    os << "ret";
                    if (t.value != kInvalidValue) {
                        os << " ";
                        val_(os, f, t.value);
                    }
                    break;
                case cfg::TermKind::kRaise:
                    os << "raise ";
                    val_(os, f, t.value);
                    os << " -> bb" << t.target;
                    break;
                case cfg::TermKind::kExcCheck: os << "excheck bb" << t.target << ", unwind bb" << t.alt; break;
                case cfg::TermKind::kUnwindExit: os << "unwind.exit"; break;
            }
            os << "\n";
        }
        return os.str();
    }

    std::string dump(const Unit& u) {
        std::ostringstream os;
        os << "unit " << u.name << "\n";
        for (const auto& f : u.functions) os << "\n" << dump(f);
        return os.str();
    }

} // namespace php2ir::ssa
