// frontend/src/lir/lir_print.cpp
#include <php2ir/lir/LIR.hpp>

#include <sstream>


namespace php2ir::lir {

    namespace {

        void quote_(std::ostream& os, std::string_view s) {
            os << '"';
            for (char c : s) {
                switch (c) {
                    case '"':  os << "\\\""; break;
                    case '\\': os << "\\\\"; break;
                    case '\n': os << "\\n"; break;
                    case '\t': os << "\\t"; break;
                    default:
                        if (static_cast<unsigned char>(c) < 0x20) {
                            const char* hex = "0123456789abcdef";
                            os << "\\x" << hex[(c >> 4) & 0xF] << hex[c & 0xF];
                        } else {
                            os << c;
                        }
                }
            }
            os << '"';
        }

        void value_(std::ostream& os, ValueId v) {
            if (v == kInvalidValue) os << "%?";
            else os << "%" << v;
        }

        void args_(std::ostream& os, const std::vector<ValueId>& args, size_t from = 0) {
            for (size_t i = from; i < args.size(); ++i) {
                if (i != from) os << ", ";
                value_(os, args[i]);
            }
        }

        void inst_(std::ostream& os, const Function& f, const Inst& i) {
            os << "  ";
            if (i.dst != kInvalidValue) {
                value_(os, i.dst);
                os << ":" << type_name(f.value_types[i.dst]) << " = ";
            }
            os << opcode_name(i.op);
            switch (i.op) {
                case Opcode::kConstInt:   os << " " << i.i; break;
                case Opcode::kConstBool:  os << (i.i ? " true" : " false"); break;
                case Opcode::kConstFloat: os << " " << rt::format_float(i.f); break;
                case Opcode::kConstStr:   os << " "; quote_(os, i.s); break;
                case Opcode::kConstNull:  break;
                case Opcode::kClassRef:   os << " @" << i.s; break;
                case Opcode::kICmp:
                case Opcode::kFCmp:
                    os << " " << pred_name(i.pred) << " ";
                    args_(os, i.args);
                    break;
                case Opcode::kCallRt:
                    os << " " << rt::rt_info(i.rt).symbol << "(";
                    args_(os, i.args);
                    os << ")";
                    break;
                case Opcode::kCall:
                case Opcode::kCallForeign:
                    os << " @" << i.s << "(";
                    args_(os, i.args);
                    os << ")";
                    break;
                case Opcode::kCallIndirect:
                    os << " ";
                    value_(os, i.args.empty() ? kInvalidValue : i.args[0]);
                    os << "(";
                    args_(os, i.args, 1);
                    os << ")";
                    if (!i.s.empty()) os << "  ; " << i.s;
                    break;
                case Opcode::kLoadVSlot:
                case Opcode::kLoadSlot:
                case Opcode::kStoreSlot:
                    os << " ";
                    args_(os, i.args);
                    os << ", #" << i.imm;
                    break;
                default:
                    os << " ";
                    args_(os, i.args);
                    break;
            }
            os << "\n";
        }

        void term_(std::ostream& os, const Term& t) {
            os << "  ";
            switch (t.kind) {
                case TermKind::kNone:      os << "<no terminator>"; break;
                case TermKind::kBr:        os << "br bb" << t.target; break;
                case TermKind::kCondBr:
                    os << "condbr ";
                    value_(os, t.value);
                    os << ", bb" << t.target << ", bb" << t.alt;
                    break;
                case TermKind::kRet:
                    os << "ret";
                    if (t.value != kInvalidValue) {
                        os << " ";
                        value_(os, t.value);
                    }
                    break;
                case TermKind::kRaise:
                    os << "raise ";
                    value_(os, t.value);
                    os << " -> bb" << t.target;
                    break;
                case TermKind::kExcCheck:  os << "exccheck bb" << t.target << ", unwind bb" << t.alt; break;
                case TermKind::kUnwindRet: os << "unwindret"; break;
            }
            os << "\n";
        }

        void slot_init_(std::ostream& os, const SlotInit& s) {
            switch (s.kind) {
                case SlotInit::Kind::kZero:       os << "zero"; break;
                case SlotInit::Kind::kNull:       os << "null"; break;
                case SlotInit::Kind::kInt:        os << s.i; break;
                case SlotInit::Kind::kFloat:      os << rt::format_float(s.f); break;
                case SlotInit::Kind::kBool:       os << (s.i ? "true" : "false"); break;
                case SlotInit::Kind::kStr:        quote_(os, s.s); break;
                case SlotInit::Kind::kEmptyArray: os << "[]"; break;
            }
        }

    } // namespace

    std::string print(const Function& f) {
        std::ostringstream os;
        os << "define " << type_name(f.ret) << " @" << f.name << "(";
        for (size_t i = 0; i < f.params.size(); ++i) {
            if (i) os << ", ";
            os << type_name(f.param_types[i]) << " ";
            value_(os, f.params[i]);
        }
        os << ") {";
        if (!f.source_name.empty()) os << "  ; " << f.source_name;
        os << "\n";

        for (BlockId b = 0; b < f.blocks.size(); ++b) {
            const Block& blk = f.blocks[b];
            os << "bb" << b << ":";
            if (!blk.preds.empty()) {
                os << "  ; preds";
                for (BlockId p : blk.preds) os << " bb" << p;
            }
            os << "\n";
            for (const auto& p : blk.phis) {
                os << "  ";
                value_(os, p.dst);
                os << ":" << type_name(p.type) << " = phi";
                for (size_t k = 0; k < p.incoming.size(); ++k) {
                    os << (k ? ", [" : " [");
                    value_(os, p.incoming[k].value);
                    os << ", bb" << p.incoming[k].pred << "]";
                }
                os << "\n";
            }
            for (const auto& i : blk.insts) inst_(os, f, i);
            term_(os, blk.term);
        }
        os << "}\n";
        return os.str();
    }

    std::string print(const Module& m) {
        std::ostringstream os;
        os << "; module " << m.unit << "\n";
        if (m.emit_entry) os << "; entry -> @" << m.main_symbol << "\n";

        for (const auto& c : m.classes) {
            os << (c.defined_here ? "" : "external ") << (c.is_interface ? "interface @" : "class @") << c.symbol;
            os << " ";
            quote_(os, c.name);
            if (!c.parent.empty()) os << " extends @" << c.parent;
            for (size_t i = 0; i < c.interfaces.size(); ++i) {
                os << (i ? ", @" : " implements @") << c.interfaces[i];
            }
            if (!c.defined_here || c.is_interface) {
                os << "\n";
                continue;
            }
            os << " {\n";
            for (size_t i = 0; i < c.slots.size(); ++i) {
                const SlotDesc& s = c.slots[i];
                os << "  slot #" << i << " " << (s.is_public ? "public " : "") << s.name << ":" << type_name(s.type)
                   << " = ";
                slot_init_(os, s.init);
                os << "\n";
            }
            for (size_t i = 0; i < c.vtable.size(); ++i) {
                os << "  vslot #" << i << " " << (c.vtable[i].empty() ? "<abstract>" : "@" + c.vtable[i]) << "\n";
            }
            for (const auto& md : c.methods) {
                os << "  method " << md.name << "/" << md.required << ".." << md.arity << " @" << md.adapter << "\n";
            }
            if (!c.ctor.empty()) os << "  ctor @" << c.ctor << "\n";
            os << "}\n";
        }

        for (const auto& e : m.externs) {
            os << "declare " << (e.foreign ? "c " : "") << type_name(e.ret) << " @" << e.name << "(";
            for (size_t i = 0; i < e.params.size(); ++i) {
                if (i) os << ", ";
                os << type_name(e.params[i]);
            }
            os << ")";
            if (!e.lib.empty()) os << "  ; lib " << e.lib;
            os << "\n";
        }

        for (const auto& f : m.functions) {
            os << "\n" << print(f);
        }
        return os.str();
    }

} // namespace php2ir::lir
