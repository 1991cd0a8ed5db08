// frontend/include/php2ir/lir/LIR.hpp
#pragma once
#include <php2ir/cfg/CFG.hpp>
#include <php2ir/lir/Type.hpp>
#include <php2ir/rt/RuntimeABI.hpp>
#include <php2ir/text/Span.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>


namespace php2ir::lir {

    using ValueId = uint32_t;
    using BlockId = uint32_t;
    inline constexpr ValueId kInvalidValue = 0xFFFF'FFFFu;
    inline constexpr BlockId kInvalidBlock = 0xFFFF'FFFFu;

    enum class Opcode : uint8_t {
        // constants
        kConstInt,      // i
        kConstFloat,    // f
        kConstBool,     // i (0/1)
        kConstStr,      // s -> owned str
        kConstNull,     // null box
        kClassRef,      // s = class symbol -> ptr

        // integer
        kIAdd, kISub, kIMul, kSDiv, kSRem,
        kAnd, kOr, kXor, kShl, kAShr,
        kICmp,          // pred; also pointer equality on handles
        // float
        kFAdd, kFSub, kFMul, kFDiv, kFNeg,
        kFCmp,          // pred (ordered)
        // conversions
        kSIToFP,
        kFPToSI,
        kZExt,          // i1 -> i64

        // calls
        kCallRt,        // rt, args per RtFnInfo
        kCall,          // s = callee symbol
        kLoadVSlot,     // dst(ptr) = vtable of args[0], slot imm
        kCallIndirect,  // args[0] = code ptr, args[1..] = call args
        kCallForeign,   // s = C symbol

        // object slots (header + 8-byte slots)
        kLoadSlot,      // dst = args[0]->slot[imm], owned (+1)
        kStoreSlot,     // args[0]->slot[imm] = args[1]; value consumed, object borrowed

        // reference counting
        kRetain,
        kRelease,
    };

    enum class Pred : uint8_t { kEq, kNe, kLt, kLe, kGt, kGe };

    std::string_view opcode_name(Opcode op);
    std::string_view pred_name(Pred p);

    struct Inst {
        Opcode op = Opcode::kConstInt;
        ValueId dst = kInvalidValue;
        Type type = Type::kVoid;            // result type (call: return type)
        std::vector<ValueId> args{};

        int64_t i = 0;
        double f = 0.0;
        std::string s{};
        Pred pred = Pred::kEq;
        rt::RtFn rt{};
        uint32_t imm = 0;
        Span span{};
    };

    struct PhiIncoming {
        BlockId pred = kInvalidBlock;
        ValueId value = kInvalidValue;
    };

    struct Phi {
        ValueId dst = kInvalidValue;
        Type type = Type::kVoid;
        std::vector<PhiIncoming> incoming{};
    };

    enum class TermKind : uint8_t {
        kNone,
        kBr,            // -> target
        kCondBr,        // value(i1) ? target : alt
        kRet,           // value or void
        kRaise,         // pending = value (consumed); -> target
        kExcCheck,      // pending ? alt : target
        kUnwindRet,     // leave with the exception pending
    };

    struct Term {
        TermKind kind = TermKind::kNone;
        ValueId value = kInvalidValue;
        BlockId target = kInvalidBlock;
        BlockId alt = kInvalidBlock;
        Span span{};
    };

    std::vector<BlockId> successors(const Term& t);

    struct Block {
        std::vector<Phi> phis{};
        std::vector<Inst> insts{};
        Term term{};
        std::vector<BlockId> preds{};
    };

    struct Function {
        std::string name{};                 // mangled symbol
        std::string source_name{};          // "Person::greet"
        bool is_main = false;
        bool is_adapter = false;            // by-name call trampoline
        bool exported = true;

        std::vector<Type> param_types{};
        std::vector<ValueId> params{};
        Type ret = Type::kVoid;

        std::vector<Type> value_types{};    // by ValueId
        std::vector<Block> blocks{};
        BlockId entry = 0;
        Span span{};

        ValueId new_value(Type t) {
            value_types.push_back(t);
            return static_cast<ValueId>(value_types.size() - 1);
        }
    };

    /// @brief 슬롯 초기값. 클래스 선언 순서대로 객체 생성 시 채운다.
    struct SlotInit {
        enum class Kind : uint8_t { kZero, kNull, kInt, kFloat, kBool, kStr, kEmptyArray };
        Kind kind = Kind::kZero;
        int64_t i = 0;
        double f = 0.0;
        std::string s{};
    };

    struct SlotDesc {
        std::string name{};                 // property name without '$'
        Type type = Type::kBox;
        bool is_public = true;
        SlotInit init{};
    };

    struct MethodDesc {
        std::string name{};                 // folded method name
        std::string adapter{};              // by-name trampoline symbol; empty: not reachable by name
        uint32_t arity = 0;
        uint32_t required = 0;
    };

    /// @brief 런타임 클래스 기술자 내용. 백엔드는 @php_class_<name> 전역으로 만든다.
    struct ClassDesc {
        std::string symbol{};               // php_class_...
        std::string name{};                 // source name
        std::string parent{};               // parent descriptor symbol, empty: root
        std::vector<std::string> interfaces{}; // transitive interface descriptor symbols
        bool is_interface = false;
        bool defined_here = true;           // false: imported reference only
        std::vector<SlotDesc> slots{};
        std::vector<std::string> vtable{};  // implementation symbol per slot
        std::vector<MethodDesc> methods{};  // public methods reachable by name
        std::string ctor{};                 // implementation symbol, empty: none
    };

    /// @brief 다른 단위에 정의된 함수 선언(호출에 필요한 서명만).
    struct ExternDecl {
        std::string name{};
        Type ret = Type::kVoid;
        std::vector<Type> params{};
        bool foreign = false;
        std::string lib{};
    };

    struct Module {
        std::string unit{};
        std::vector<Function> functions{};
        std::vector<ClassDesc> classes{};
        std::vector<ExternDecl> externs{};
        std::string main_symbol{};          // php_main_<unit>
        bool emit_entry = false;            // C main wrapper for this unit
        rt::RuntimeConfig runtime{};        // php2ir_rt_init arguments of the wrapper
    };

    struct VerifyError {
        std::string msg;
    };

    /// @brief SSA 형태, 타입, 종결자, 핸들 ownership 규칙과 무관한 구조 검사.
    std::vector<VerifyError> verify(const Module& m);
    std::vector<VerifyError> verify(const Function& f);

    std::string print(const Function& f);
    std::string print(const Module& m);

} // namespace php2ir::lir
