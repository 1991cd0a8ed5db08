// frontend/src/lir/lir_core.cpp
#include <php2ir/lir/LIR.hpp>


namespace php2ir::lir {

    std::string_view type_name(Type t) {
        switch (t) {
            case Type::kVoid: return "void";
            case Type::kI1:   return "i1";
            case Type::kI64:  return "i64";
            case Type::kF64:  return "f64";
            case Type::kPtr:  return "ptr";
            case Type::kStr:  return "str";
            case Type::kArr:  return "arr";
            case Type::kObj:  return "obj";
            case Type::kBox:  return "box";
        }
        return "?";
    }

    Type type_of(cfg::Repr r) {
        switch (r) {
            case cfg::Repr::kVoid:  return Type::kVoid;
            case cfg::Repr::kBool:  return Type::kI1;
            case cfg::Repr::kInt:   return Type::kI64;
            case cfg::Repr::kFloat: return Type::kF64;
            case cfg::Repr::kStr:   return Type::kStr;
            case cfg::Repr::kArr:   return Type::kArr;
            case cfg::Repr::kObj:   return Type::kObj;
            case cfg::Repr::kBox:   return Type::kBox;
        }
        return Type::kBox;
    }

    std::string_view opcode_name(Opcode op) {
        switch (op) {
            case Opcode::kConstInt:     return "const.i64";
            case Opcode::kConstFloat:   return "const.f64";
            case Opcode::kConstBool:    return "const.i1";
            case Opcode::kConstStr:     return "const.str";
            case Opcode::kConstNull:    return "const.null";
            case Opcode::kClassRef:     return "classref";
            case Opcode::kIAdd:         return "add";
            case Opcode::kISub:         return "sub";
            case Opcode::kIMul:         return "mul";
            case Opcode::kSDiv:         return "sdiv";
            case Opcode::kSRem:         return "srem";
            case Opcode::kAnd:          return "and";
            case Opcode::kOr:           return "or";
            case Opcode::kXor:          return "xor";
            case Opcode::kShl:          return "shl";
            case Opcode::kAShr:         return "ashr";
            case Opcode::kICmp:         return "icmp";
            case Opcode::kFAdd:         return "fadd";
            case Opcode::kFSub:         return "fsub";
            case Opcode::kFMul:         return "fmul";
            case Opcode::kFDiv:         return "fdiv";
            case Opcode::kFNeg:         return "fneg";
            case Opcode::kFCmp:         return "fcmp";
            case Opcode::kSIToFP:       return "sitofp";
            case Opcode::kFPToSI:       return "fptosi";
            case Opcode::kZExt:         return "zext";
            case Opcode::kCallRt:       return "call.rt";
            case Opcode::kCall:         return "call";
            case Opcode::kLoadVSlot:    return "load.vslot";
            case Opcode::kCallIndirect: return "call.indirect";
            case Opcode::kCallForeign:  return "call.c";
            case Opcode::kLoadSlot:     return "load.slot";
            case Opcode::kStoreSlot:    return "store.slot";
            case Opcode::kRetain:       return "retain";
            case Opcode::kRelease:      return "release";
        }
        return "?";
    }

    std::string_view pred_name(Pred p) {
        switch (p) {
            case Pred::kEq: return "eq";
            case Pred::kNe: return "ne";
            case Pred::kLt: return "lt";
            case Pred::kLe: return "le";
            case Pred::kGt: return "gt";
            case Pred::kGe: return "ge";
        }
        return "?";
    }

    std::vector<BlockId> successors(const Term& t) {
        switch (t.kind) {
            case TermKind::kBr:
            case TermKind::kRaise:
                return {t.target};
            case TermKind::kCondBr:
            case TermKind::kExcCheck:
                return {t.target, t.alt};
            default:
                return {};
        }
    }

} // namespace php2ir::lir
