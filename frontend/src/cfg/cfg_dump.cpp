// frontend/src/cfg/cfg_dump.cpp
#include <php2ir/cfg/CFG.hpp>
#include <php2ir/resolve/Builtins.hpp>

#include <iomanip>
#include <sstream>


namespace php2ir::cfg {

    std::string_view op_name(OpKind k) {
        switch (k) {
            case OpKind::kParam: return "param";
            case OpKind::kConst: return "const";
            case OpKind::kCopy: return "copy";
            case OpKind::kCast: return "cast";
            case OpKind::kBinary: return "bin";
            case OpKind::kUnary: return "un";
            case OpKind::kConcat: return "concat";
            case OpKind::kEcho: return "echo";
            case OpKind::kArrayNew: return "array.new";
            case OpKind::kArrayGet: return "array.get";
            case OpKind::kArraySet: return "array.set";
            case OpKind::kArrayPush: return "array.push";
            case OpKind::kArrayCount: return "array.count";
            case OpKind::kArrayKeyAt: return "array.key_at";
            case OpKind::kArrayValueAt: return "array.value_at";
            case OpKind::kStrAt: return "str.at";
            case OpKind::kNew: return "new";
            case OpKind::kGetProp: return "getprop";
            case OpKind::kSetProp: return "setprop";
            case OpKind::kGetPropDyn: return "getprop.dyn";
            case OpKind::kSetPropDyn: return "setprop.dyn";
            case OpKind::kCall: return "call";
            case OpKind::kCallVirtual: return "call.virtual";
            case OpKind::kCallForeign: return "call.foreign";
            case OpKind::kCallBuiltin: return "call.builtin";
            case OpKind::kCallDyn: return "call.dyn";
            case OpKind::kInstanceOf: return "instanceof";
            case OpKind::kIsNull: return "isnull";
            case OpKind::kLandingPad: return "landingpad";
        }
        return "?";
    }

    namespace {

        void lit_(std::ostream& os, const Literal& l) {
            switch (l.kind) {
                case Literal::Kind::kNull:  os << "null"; break;
                case Literal::Kind::kBool:  os << (l.b ? "true" : "false"); break;
                case Literal::Kind::kInt:   os << l.i; break;
                case Literal::Kind::kFloat: os << std::setprecision(17) << l.f; break;
                case Literal::Kind::kStr:   os << std::quoted(l.s); break;
            }
        }

        void var_(std::ostream& os, const Function& f, VarId v) {
            if (v == kInvalidVar) {
                os << "_";
                return;
            }
            os << f.vars[v].name;
        }

        std::string sym_ref_(resolve::SymbolId s) {
            if (s == resolve::kInvalidSymbol) return "<none>";
            std::ostringstream oss;
            oss << "@" << s;
            return oss.str();
        }

    } // namespace

    std::string dump(const Function& f, const ty::TypePool& types) {
        std::ostringstream os;
        os << "fn " << f.name << "(";
        for (uint32_t i = 0; i < f.param_count; ++i) {
            if (i) os << ", ";
            os << f.vars[i].name << ": " << repr_name(f.vars[i].repr);
        }
        os << ") -> " << repr_name(f.ret_repr);
        if (f.ret != ty::kInvalidType) os << " [" << types.to_string(f.ret) << "]";
        os << "\n";

        for (BlockId b = 0; b < f.blocks.size(); ++b) {
            const Block& blk = f.blocks[b];
            os << "bb" << b << ":";
            if (b == f.entry) os << " ; entry";
            if (b == f.unwind_exit) os << " ; unwind";
            if (!blk.preds.empty()) {
                os << " ; preds=";
                for (size_t i = 0; i < blk.preds.size(); ++i) {
                    if (i) os << ",";
                    os << "bb" << blk.preds[i];
                }
            }
            os << "\n";

            for (const Op& op : blk.ops) {
                os << "  ";
                if (op.dst != kInvalidVar) {
                    var_(os, f, op.dst);
                    os << ":" << repr_name(f.vars[op.dst].repr) << " = ";
                }
                os << op_name(op.kind);
                switch (op.kind) {
                    case OpKind::kParam: os << " #" << op.imm; break;
                    case OpKind::kConst: os << " "; lit_(os, op.lit); break;
                    case OpKind::kBinary: os << "." << bin_name(op.bin); break;
                    case OpKind::kUnary: os << "." << un_name(op.un); break;
                    case OpKind::kGetProp:
                    case OpKind::kSetProp: os << " slot" << op.imm; break;
                    case OpKind::kCallVirtual: os << " slot" << op.imm << " " << sym_ref_(op.sym); break;
                    case OpKind::kCall:
                    case OpKind::kCallForeign:
                    case OpKind::kNew:
                    case OpKind::kInstanceOf: os << " " << sym_ref_(op.sym); break;
                    case OpKind::kCallBuiltin: os << " " << resolve::builtin_info(op.builtin).name; break;
                    case OpKind::kGetPropDyn:
                    case OpKind::kSetPropDyn:
                    case OpKind::kCallDyn: os << " '" << op.name << "'"; break;
                    default: break;
                }
                const auto uses = op_uses(op);
                for (size_t i = 0; i < uses.size(); ++i) {
                    os << (i ? ", " : " ");
                    var_(os, f, uses[i]);
                }
                os << "\n";
            }

            const Term& t = blk.term;
            os << "  ";
            switch (t.kind) {
                case TermKind::kNone: os << "<no terminator>"; break;
                case TermKind::kJump: os << "jump bb" << t.target; break;
                case TermKind::kBranch:
                    os << "br ";
                    var_(os, f, t.value);
                    os << ", bb" << t.target << ", bb" << t.alt;
                    break;
                case TermKind::kReturn:
                    os << "ret";
                    if (t.value != kInvalidVar) {
                        os << " ";
                        var_(os, f, t.value);
                    }
                    break;
                case TermKind::kRaise:
                    os << "raise ";
                    var_(os, f, t.value);
                    os << " -> bb" << t.target;
                    break;
                case TermKind::kExcCheck: os << "excheck bb" << t.target << ", unwind bb" << t.alt; break;
                case TermKind::kUnwindExit: os << "unwind.exit"; break;
            }
            os << "\n";
        }
        return os.str();
    }

    std::string dump(const Unit& u, const ty::TypePool& types) {
        std::ostringstream os;
        os << "unit " << u.name << "\n";
        for (const auto& f : u.functions) {
            os << "\n" << dump(f, types);
        }
        return os.str();
    }

} // namespace php2ir::cfg
