// backend/src/aot/LLVMIRLowering.cpp
#include <php2ir/backend/aot/LLVMIRLowering.hpp>

#include <cstdint>
#include <cstring>
#include <map>
#include <set>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace php2ir::backend::aot {

    namespace {

        using php2ir::lir::BlockId;
        using php2ir::lir::Opcode;
        using php2ir::lir::TermKind;
        using php2ir::lir::Type;
        using php2ir::lir::ValueId;
        using php2ir::rt::RtFn;

        constexpr std::string_view kClassTy = "%php2ir.class";
        constexpr std::string_view kMethodTy = "%php2ir.method";

        struct Signature {
            Type ret = Type::kVoid;
            std::vector<Type> params{};
        };

        /// @brief LLVM 식별자로 그대로 쓸 수 있는 문자인지.
        bool plain_symbol_char_(char c) {
            const unsigned char u = static_cast<unsigned char>(c);
            return (u >= 'a' && u <= 'z') || (u >= 'A' && u <= 'Z') || (u >= '0' && u <= '9') ||
                   c == '_' || c == '$' || c == '.';
        }

        /// @brief raw bytes를 LLVM c"..." 상수 리터럴 본문으로 이스케이프한다.
        std::string llvm_escape_c_bytes_(std::string_view bytes) {
            static constexpr char kHex[] = "0123456789ABCDEF";
            std::string out;
            out.reserve(bytes.size() * 4 + 4);
            for (unsigned char b : bytes) {
                if (b >= 0x20 && b <= 0x7E && b != '\\' && b != '"') {
                    out.push_back(static_cast<char>(b));
                    continue;
                }
                out.push_back('\\');
                out.push_back(kHex[(b >> 4) & 0x0F]);
                out.push_back(kHex[b & 0x0F]);
            }
            return out;
        }

        /// @brief 전역 심볼 참조. 평범하지 않은 이름은 @"..."로 감싼다.
        std::string gref_(std::string_view sym) {
            bool plain = !sym.empty() && !(sym[0] >= '0' && sym[0] <= '9');
            for (char c : sym) plain = plain && plain_symbol_char_(c);
            if (plain) return "@" + std::string(sym);
            return "@\"" + llvm_escape_c_bytes_(sym) + "\"";
        }

        std::string vref_(ValueId v) {
            return "%v" + std::to_string(v);
        }

        std::string bref_(BlockId b) {
            return "bb" + std::to_string(b);
        }

        /// @brief double은 비트 패턴 그대로 16진수로 적는다(십진 표기는 정확하지 않을 수 있다).
        std::string f64_literal_(double d) {
            static constexpr char kHex[] = "0123456789ABCDEF";
            uint64_t bits = 0;
            std::memcpy(&bits, &d, sizeof(d));
            std::string s = "0x";
            for (int i = 15; i >= 0; --i) s.push_back(kHex[(bits >> (i * 4)) & 0xF]);
            return s;
        }

        /// @brief LIR 모듈 하나를 LLVM-IR 텍스트로 만든다.
        class ModuleEmitter {
        public:
            ModuleEmitter(const php2ir::lir::Module& m, const LLVMIRLoweringOptions& opt)
                : m_(m), opaque_(opt.llvm_lane_major >= 15) {
                for (const auto& f : m_.functions) {
                    defined_.insert(f.name);
                    sigs_[f.name] = Signature{f.ret, f.param_types};
                }
                for (const auto& e : m_.externs) {
                    if (sigs_.count(e.name) == 0) sigs_[e.name] = Signature{e.ret, e.params};
                }
            }

            bool emit(std::string& out, std::vector<CompileMessage>& msgs) {
                std::ostringstream body;
                for (const auto& c : m_.classes) emit_class_(c);
                for (const auto& f : m_.functions) emit_function_(body, f);
                if (m_.emit_entry) emit_entry_(body);

                if (!errors_.empty()) {
                    for (auto& e : errors_) msgs.push_back(CompileMessage{true, std::move(e)});
                    return false;
                }

                std::ostringstream os;
                os << "; Generated by php2ir AOT LLVM lane (" << (opaque_ ? "opaque" : "typed") << " pointers)\n";
                os << "; ModuleID = '" << llvm_escape_c_bytes_(m_.unit) << "'\n";
                os << "source_filename = \"" << llvm_escape_c_bytes_(m_.unit) << "\"\n\n";

                const std::string p = ptr_();
                os << kClassTy << " = type { " << p << ", " << p << ", i64, " << p << ", " << p << ", " << p << ", "
                   << p << ", i64, " << p << ", i64, " << p << ", i64, i64 }\n";
                os << kMethodTy << " = type { " << p << ", " << p << ", i64, i64 }\n\n";

                for (const auto& [bytes, sym] : cstrings_) {
                    os << gref_(sym) << " = private unnamed_addr constant [" << bytes.size() + 1 << " x i8] c\""
                       << llvm_escape_c_bytes_(bytes) << "\\00\", align 1\n";
                }
                if (!cstrings_.empty()) os << "\n";

                os << globals_.str();
                if (!globals_.str().empty()) os << "\n";

                // runtime ABI
                for (RtFn fn : used_rt_) {
                    const auto& info = php2ir::rt::rt_info(fn);
                    os << "declare " << ty_(info.ret) << " " << gref_(info.symbol) << "(";
                    for (size_t i = 0; i < info.params.size(); ++i) {
                        if (i) os << ", ";
                        os << ty_(info.params[i]);
                    }
                    os << ")\n";
                }
                // other units / C libraries
                for (const auto& e : m_.externs) {
                    if (defined_.count(e.name) != 0) continue;
                    os << "declare " << ty_(e.ret) << " " << gref_(e.name) << "(";
                    for (size_t i = 0; i < e.params.size(); ++i) {
                        if (i) os << ", ";
                        os << ty_(e.params[i]);
                    }
                    os << ")";
                    if (!e.lib.empty()) os << "  ; lib " << e.lib;
                    os << "\n";
                }
                os << "\n" << body.str();

                out = os.str();
                return true;
            }

        private:
            const php2ir::lir::Module& m_;
            const bool opaque_;

            std::set<std::string> defined_{};
            std::unordered_map<std::string, Signature> sigs_{};
            std::set<RtFn> used_rt_{};
            std::map<std::string, std::string> cstrings_{};     // bytes -> symbol
            std::ostringstream globals_{};
            std::vector<std::string> errors_{};

            // per function
            const php2ir::lir::Function* f_ = nullptr;
            std::unordered_map<ValueId, std::string> lit_{};
            uint32_t temp_seq_ = 0;

            // ---- types ----

            std::string ptr_() const {
                return opaque_ ? "ptr" : "i8*";
            }

            std::string ptr_of_(std::string_view pointee) const {
                return opaque_ ? std::string("ptr") : std::string(pointee) + "*";
            }

            std::string ty_(Type t) const {
                switch (t) {
                    case Type::kVoid: return "void";
                    case Type::kI1:   return "i1";
                    case Type::kI64:  return "i64";
                    case Type::kF64:  return "double";
                    default:          return ptr_();
                }
            }

            /// @brief 객체 슬롯은 전부 8바이트다. i1은 i64로 넓혀 저장한다.
            std::string slot_mem_ty_(Type t) const {
                return (t == Type::kI1) ? std::string("i64") : ty_(t);
            }

            std::string zero_(Type t) const {
                switch (t) {
                    case Type::kI1:  return "false";
                    case Type::kI64: return "0";
                    case Type::kF64: return "0.0";
                    default:         return "null";
                }
            }

            std::string fn_type_(const Signature& s) const {
                std::string out = ty_(s.ret) + " (";
                for (size_t i = 0; i < s.params.size(); ++i) {
                    if (i) out += ", ";
                    out += ty_(s.params[i]);
                }
                return out + ")";
            }

            /// @brief 전역을 가리키는 범용 포인터 상수식(typed 모드에서는 i8*로 bitcast).
            std::string const_ptr_ref_(std::string_view sym, std::string_view pointee) const {
                if (opaque_) return gref_(sym);
                return "bitcast (" + std::string(pointee) + "* " + gref_(sym) + " to i8*)";
            }

            /// @brief NUL로 끝나는 바이트 상수를 풀에 넣고 첫 바이트를 가리키는 상수식을 돌려준다.
            std::string cstr_(const std::string& bytes) {
                auto it = cstrings_.find(bytes);
                if (it == cstrings_.end()) {
                    it = cstrings_.emplace(bytes, ".str." + std::to_string(cstrings_.size())).first;
                }
                const std::string arr = "[" + std::to_string(bytes.size() + 1) + " x i8]";
                if (opaque_) return gref_(it->second);
                return "getelementptr inbounds (" + arr + ", " + arr + "* " + gref_(it->second) + ", i64 0, i64 0)";
            }

            std::string fn_ref_(const std::string& sym) {
                auto it = sigs_.find(sym);
                if (it == sigs_.end()) {
                    errors_.push_back("function @" + sym + " is referenced but neither defined nor declared");
                    return "null";
                }
                return const_ptr_ref_(sym, fn_type_(it->second));
            }

            // ---- class descriptors ----

            void emit_class_(const php2ir::lir::ClassDesc& c) {
                const std::string p = ptr_();
                std::ostream& g = globals_;

                if (!c.defined_here) {
                    g << gref_(c.symbol) << " = external constant " << kClassTy << "\n";
                    return;
                }

                auto array_global = [&](const std::string& suffix, const std::string& elem_ty,
                                        const std::vector<std::string>& elems) -> std::string {
                    if (elems.empty()) return "null";
                    const std::string sym = c.symbol + "." + suffix;
                    const std::string arr = "[" + std::to_string(elems.size()) + " x " + elem_ty + "]";
                    g << gref_(sym) << " = private unnamed_addr constant " << arr << " [";
                    for (size_t i = 0; i < elems.size(); ++i) {
                        if (i) g << ", ";
                        g << elem_ty << " " << elems[i];
                    }
                    g << "], align 8\n";
                    return const_ptr_ref_(sym, arr);
                };

                std::vector<std::string> kinds, names, pub;
                for (const auto& s : c.slots) {
                    kinds.push_back(std::to_string(static_cast<uint32_t>(php2ir::rt::slot_kind(s.type))));
                    names.push_back(cstr_(s.name));
                    pub.push_back(s.is_public ? "1" : "0");
                }
                std::vector<std::string> vtable;
                for (const auto& v : c.vtable) vtable.push_back(v.empty() ? std::string("null") : fn_ref_(v));

                std::vector<std::string> methods;
                for (const auto& md : c.methods) {
                    methods.push_back(std::string("{ ") + p + " " + cstr_(md.name) + ", " + p + " " + fn_ref_(md.adapter) +
                                      ", i64 " + std::to_string(md.arity) + ", i64 " + std::to_string(md.required) + " }");
                }
                std::vector<std::string> ifaces;
                for (const auto& i : c.interfaces) ifaces.push_back(const_ptr_ref_(i, kClassTy));

                const std::string kinds_ref = array_global("slot_kinds", "i8", kinds);
                const std::string names_ref = array_global("slot_names", p, names);
                const std::string pub_ref = array_global("slot_public", "i8", pub);
                const std::string vt_ref = array_global("vtable", p, vtable);
                const std::string md_ref = array_global("methods", std::string(kMethodTy), methods);
                const std::string if_ref = array_global("interfaces", p, ifaces);

                g << gref_(c.symbol) << " = constant " << kClassTy << " { "
                  << p << " " << cstr_(c.name) << ", "
                  << p << " " << (c.parent.empty() ? std::string("null") : const_ptr_ref_(c.parent, kClassTy)) << ", "
                  << "i64 " << c.slots.size() << ", "
                  << p << " " << kinds_ref << ", "
                  << p << " " << names_ref << ", "
                  << p << " " << pub_ref << ", "
                  << p << " " << vt_ref << ", "
                  << "i64 " << c.vtable.size() << ", "
                  << p << " " << md_ref << ", "
                  << "i64 " << c.methods.size() << ", "
                  << p << " " << if_ref << ", "
                  << "i64 " << c.interfaces.size() << ", "
                  << "i64 " << (c.is_interface ? 1 : 0) << " }, align 8\n";
            }

            // ---- functions ----

            std::string tmp_() {
                return "%t" + std::to_string(temp_seq_++);
            }

            std::string ref_(ValueId v) const {
                auto it = lit_.find(v);
                return (it == lit_.end()) ? vref_(v) : it->second;
            }

            Type vty_(ValueId v) const {
                return (v < f_->value_types.size()) ? f_->value_types[v] : Type::kI64;
            }

            std::string arg_(ValueId v) const {
                return ty_(vty_(v)) + " " + ref_(v);
            }

            std::string rt_call_(RtFn fn, const std::vector<std::string>& args) {
                used_rt_.insert(fn);
                const auto& info = php2ir::rt::rt_info(fn);
                std::string s = "call " + ty_(info.ret) + " " + gref_(info.symbol) + "(";
                for (size_t i = 0; i < args.size(); ++i) {
                    if (i) s += ", ";
                    s += (i < info.params.size() ? ty_(info.params[i]) : std::string("i64")) + " " + args[i];
                }
                return s + ")";
            }

            /// @brief 상수는 명령 대신 리터럴로 바로 쓴다.
            void collect_literals_(const php2ir::lir::Function& f) {
                for (const auto& b : f.blocks) {
                    for (const auto& i : b.insts) {
                        if (i.dst == php2ir::lir::kInvalidValue) continue;
                        switch (i.op) {
                            case Opcode::kConstInt:   lit_[i.dst] = std::to_string(i.i); break;
                            case Opcode::kConstFloat: lit_[i.dst] = f64_literal_(i.f); break;
                            case Opcode::kConstBool:  lit_[i.dst] = i.i ? "true" : "false"; break;
                            case Opcode::kConstNull:  lit_[i.dst] = "null"; break;
                            case Opcode::kClassRef:   lit_[i.dst] = const_ptr_ref_(i.s, kClassTy); break;
                            default: break;
                        }
                    }
                }
            }

            /// @brief 객체 슬롯 주소: header(16) + 8 * slot, 메모리 타입의 포인터로.
            std::string slot_addr_(std::ostream& os, ValueId obj, uint32_t slot, const std::string& mem_ty) {
                const std::string a = tmp_();
                os << "  " << a << " = getelementptr inbounds i8, " << ptr_() << " " << ref_(obj) << ", i64 "
                   << (php2ir::rt::kObjHeaderBytes + php2ir::rt::kSlotBytes * slot) << "\n";
                if (opaque_) return a;
                const std::string c = tmp_();
                os << "  " << c << " = bitcast i8* " << a << " to " << mem_ty << "*\n";
                return c;
            }

            void emit_inst_(std::ostream& os, const php2ir::lir::Inst& i) {
                const bool has_dst = (i.dst != php2ir::lir::kInvalidValue);
                const std::string dst = has_dst ? vref_(i.dst) : std::string{};
                auto assign = [&]() -> std::string { return has_dst ? "  " + dst + " = " : std::string("  "); };
                auto a = [&](size_t k) { return ref_(i.args[k]); };

                switch (i.op) {
                    case Opcode::kConstInt:
                    case Opcode::kConstFloat:
                    case Opcode::kConstBool:
                    case Opcode::kConstNull:
                    case Opcode::kClassRef:
                        return;

                    case Opcode::kConstStr:
                        os << assign()
                           << rt_call_(RtFn::kStrLiteral, {cstr_(i.s), std::to_string(i.s.size())}) << "\n";
                        return;

                    case Opcode::kIAdd: os << assign() << "add i64 " << a(0) << ", " << a(1) << "\n"; return;
                    case Opcode::kISub: os << assign() << "sub i64 " << a(0) << ", " << a(1) << "\n"; return;
                    case Opcode::kIMul: os << assign() << "mul i64 " << a(0) << ", " << a(1) << "\n"; return;
                    case Opcode::kSDiv:
                    case Opcode::kSRem: {
                        // x / -1 and x % -1 never reach the instruction: INT64_MIN would trap
                        const std::string neg1 = tmp_();
                        const std::string safe = tmp_();
                        const std::string raw = tmp_();
                        const bool div = (i.op == Opcode::kSDiv);
                        os << "  " << neg1 << " = icmp eq i64 " << a(1) << ", -1\n";
                        os << "  " << safe << " = select i1 " << neg1 << ", i64 1, i64 " << a(1) << "\n";
                        os << "  " << raw << " = " << (div ? "sdiv" : "srem") << " i64 " << a(0) << ", " << safe << "\n";
                        if (div) {
                            const std::string neg = tmp_();
                            os << "  " << neg << " = sub i64 0, " << a(0) << "\n";
                            os << assign() << "select i1 " << neg1 << ", i64 " << neg << ", i64 " << raw << "\n";
                        } else {
                            os << assign() << "select i1 " << neg1 << ", i64 0, i64 " << raw << "\n";
                        }
                        return;
                    }
                    case Opcode::kAnd:  os << assign() << "and i64 " << a(0) << ", " << a(1) << "\n"; return;
                    case Opcode::kOr:   os << assign() << "or i64 " << a(0) << ", " << a(1) << "\n"; return;
                    case Opcode::kXor:  os << assign() << "xor i64 " << a(0) << ", " << a(1) << "\n"; return;
                    case Opcode::kShl:  os << assign() << "shl i64 " << a(0) << ", " << a(1) << "\n"; return;
                    case Opcode::kAShr: os << assign() << "ashr i64 " << a(0) << ", " << a(1) << "\n"; return;

                    case Opcode::kICmp: {
                        const Type t = vty_(i.args[0]);
                        const bool is_signed = (t == Type::kI64);
                        std::string_view pred = "eq";
                        switch (i.pred) {
                            case php2ir::lir::Pred::kEq: pred = "eq"; break;
                            case php2ir::lir::Pred::kNe: pred = "ne"; break;
                            case php2ir::lir::Pred::kLt: pred = is_signed ? "slt" : "ult"; break;
                            case php2ir::lir::Pred::kLe: pred = is_signed ? "sle" : "ule"; break;
                            case php2ir::lir::Pred::kGt: pred = is_signed ? "sgt" : "ugt"; break;
                            case php2ir::lir::Pred::kGe: pred = is_signed ? "sge" : "uge"; break;
                        }
                        os << assign() << "icmp " << pred << " " << ty_(t) << " " << a(0) << ", " << a(1) << "\n";
                        return;
                    }

                    case Opcode::kFAdd: os << assign() << "fadd double " << a(0) << ", " << a(1) << "\n"; return;
                    case Opcode::kFSub: os << assign() << "fsub double " << a(0) << ", " << a(1) << "\n"; return;
                    case Opcode::kFMul: os << assign() << "fmul double " << a(0) << ", " << a(1) << "\n"; return;
                    case Opcode::kFDiv: os << assign() << "fdiv double " << a(0) << ", " << a(1) << "\n"; return;
                    case Opcode::kFNeg: os << assign() << "fneg double " << a(0) << "\n"; return;
                    case Opcode::kFCmp: {
                        std::string_view pred = "oeq";
                        switch (i.pred) {
                            case php2ir::lir::Pred::kEq: pred = "oeq"; break;
                            case php2ir::lir::Pred::kNe: pred = "une"; break;
                            case php2ir::lir::Pred::kLt: pred = "olt"; break;
                            case php2ir::lir::Pred::kLe: pred = "ole"; break;
                            case php2ir::lir::Pred::kGt: pred = "ogt"; break;
                            case php2ir::lir::Pred::kGe: pred = "oge"; break;
                        }
                        os << assign() << "fcmp " << pred << " double " << a(0) << ", " << a(1) << "\n";
                        return;
                    }

                    case Opcode::kSIToFP: os << assign() << "sitofp i64 " << a(0) << " to double\n"; return;
                    case Opcode::kFPToSI: os << assign() << "fptosi double " << a(0) << " to i64\n"; return;
                    case Opcode::kZExt:   os << assign() << "zext i1 " << a(0) << " to i64\n"; return;

                    case Opcode::kCallRt: {
                        std::vector<std::string> args;
                        for (ValueId v : i.args) args.push_back(ref_(v));
                        const bool void_ret = php2ir::rt::rt_info(i.rt).ret == Type::kVoid;
                        os << (void_ret ? std::string("  ") : assign()) << rt_call_(i.rt, args) << "\n";
                        return;
                    }

                    case Opcode::kCall:
                    case Opcode::kCallForeign: {
                        os << (i.type == Type::kVoid ? std::string("  ") : assign());
                        os << "call " << ty_(i.type) << " " << gref_(i.s) << "(";
                        for (size_t k = 0; k < i.args.size(); ++k) {
                            if (k) os << ", ";
                            os << arg_(i.args[k]);
                        }
                        os << ")\n";
                        return;
                    }

                    case Opcode::kLoadVSlot: {
                        // obj -> class descriptor -> vtable[imm]
                        const std::string p = ptr_();
                        const std::string cls_addr = tmp_();
                        os << "  " << cls_addr << " = getelementptr inbounds i8, " << p << " " << a(0) << ", i64 8\n";
                        std::string cls_slot = cls_addr;
                        if (!opaque_) {
                            cls_slot = tmp_();
                            os << "  " << cls_slot << " = bitcast i8* " << cls_addr << " to i8**\n";
                        }
                        const std::string cls = tmp_();
                        os << "  " << cls << " = load " << p << ", " << ptr_of_(p) << " " << cls_slot << ", align 8\n";
                        std::string cls_typed = cls;
                        if (!opaque_) {
                            cls_typed = tmp_();
                            os << "  " << cls_typed << " = bitcast i8* " << cls << " to " << kClassTy << "*\n";
                        }
                        const std::string vt_field = tmp_();
                        os << "  " << vt_field << " = getelementptr inbounds " << kClassTy << ", " << ptr_of_(kClassTy)
                           << " " << cls_typed << ", i32 0, i32 6\n";
                        const std::string vt = tmp_();
                        os << "  " << vt << " = load " << p << ", " << ptr_of_(p) << " " << vt_field << ", align 8\n";
                        std::string vt_typed = vt;
                        if (!opaque_) {
                            vt_typed = tmp_();
                            os << "  " << vt_typed << " = bitcast i8* " << vt << " to i8**\n";
                        }
                        const std::string entry = tmp_();
                        os << "  " << entry << " = getelementptr inbounds " << p << ", " << ptr_of_(p) << " " << vt_typed
                           << ", i64 " << i.imm << "\n";
                        os << assign() << "load " << p << ", " << ptr_of_(p) << " " << entry << ", align 8\n";
                        return;
                    }

                    case Opcode::kCallIndirect: {
                        Signature s{};
                        s.ret = i.type;
                        for (size_t k = 1; k < i.args.size(); ++k) s.params.push_back(vty_(i.args[k]));
                        std::string callee = a(0);
                        if (!opaque_) {
                            callee = tmp_();
                            os << "  " << callee << " = bitcast i8* " << a(0) << " to " << fn_type_(s) << "*\n";
                        }
                        os << (i.type == Type::kVoid ? std::string("  ") : assign());
                        os << "call " << ty_(i.type) << " " << callee << "(";
                        for (size_t k = 1; k < i.args.size(); ++k) {
                            if (k > 1) os << ", ";
                            os << arg_(i.args[k]);
                        }
                        os << ")";
                        if (!i.s.empty()) os << "  ; " << i.s;
                        os << "\n";
                        return;
                    }

                    case Opcode::kLoadSlot: {
                        const Type t = has_dst ? vty_(i.dst) : i.type;
                        const std::string mem = slot_mem_ty_(t);
                        const std::string addr = slot_addr_(os, i.args[0], i.imm, mem);
                        if (t == Type::kI1) {
                            const std::string w = tmp_();
                            os << "  " << w << " = load i64, " << ptr_of_("i64") << " " << addr << ", align 8\n";
                            os << assign() << "trunc i64 " << w << " to i1\n";
                            return;
                        }
                        os << assign() << "load " << mem << ", " << ptr_of_(mem) << " " << addr << ", align 8\n";
                        return;
                    }

                    case Opcode::kStoreSlot: {
                        const Type t = vty_(i.args[1]);
                        const std::string mem = slot_mem_ty_(t);
                        std::string v = a(1);
                        if (t == Type::kI1) {
                            v = tmp_();
                            os << "  " << v << " = zext i1 " << a(1) << " to i64\n";
                        }
                        const std::string addr = slot_addr_(os, i.args[0], i.imm, mem);
                        os << "  store " << mem << " " << v << ", " << ptr_of_(mem) << " " << addr << ", align 8\n";
                        return;
                    }

                    case Opcode::kRetain:
                        os << "  " << rt_call_(RtFn::kRetain, {a(0)}) << "\n";
                        return;
                    case Opcode::kRelease:
                        os << "  " << rt_call_(RtFn::kRelease, {a(0)}) << "\n";
                        return;
                }
            }

            void emit_term_(std::ostream& os, const php2ir::lir::Term& t) {
                switch (t.kind) {
                    case TermKind::kBr:
                        os << "  br label %" << bref_(t.target) << "\n";
                        return;
                    case TermKind::kCondBr:
                        os << "  br i1 " << ref_(t.value) << ", label %" << bref_(t.target) << ", label %"
                           << bref_(t.alt) << "\n";
                        return;
                    case TermKind::kRet:
                        if (f_->ret == Type::kVoid || t.value == php2ir::lir::kInvalidValue) {
                            if (f_->ret == Type::kVoid) os << "  ret void\n";
                            else os << "  ret " << ty_(f_->ret) << " " << zero_(f_->ret) << "\n";
                        } else {
                            os << "  ret " << ty_(f_->ret) << " " << ref_(t.value) << "\n";
                        }
                        return;
                    case TermKind::kRaise:
                        os << "  " << rt_call_(RtFn::kRaise, {ref_(t.value)}) << "\n";
                        os << "  br label %" << bref_(t.target) << "\n";
                        return;
                    case TermKind::kExcCheck: {
                        const std::string p = tmp_();
                        os << "  " << p << " = " << rt_call_(RtFn::kExcPending, {}) << "\n";
                        os << "  br i1 " << p << ", label %" << bref_(t.alt) << ", label %" << bref_(t.target) << "\n";
                        return;
                    }
                    case TermKind::kUnwindRet:
                        if (f_->ret == Type::kVoid) os << "  ret void\n";
                        else os << "  ret " << ty_(f_->ret) << " " << zero_(f_->ret) << "\n";
                        return;
                    case TermKind::kNone:
                        errors_.push_back("@" + f_->name + ": block without terminator");
                        os << "  unreachable\n";
                        return;
                }
            }

            void emit_block_(std::ostream& os, BlockId b) {
                const auto& blk = f_->blocks[b];
                os << bref_(b) << ":\n";
                for (const auto& p : blk.phis) {
                    os << "  " << vref_(p.dst) << " = phi " << ty_(p.type);
                    for (size_t k = 0; k < p.incoming.size(); ++k) {
                        os << (k ? ", [ " : " [ ") << ref_(p.incoming[k].value) << ", %" << bref_(p.incoming[k].pred)
                           << " ]";
                    }
                    os << "\n";
                }
                for (const auto& i : blk.insts) emit_inst_(os, i);
                emit_term_(os, blk.term);
            }

            void emit_function_(std::ostream& os, const php2ir::lir::Function& f) {
                f_ = &f;
                lit_.clear();
                temp_seq_ = 0;
                collect_literals_(f);

                if (f.entry >= f.blocks.size()) {
                    errors_.push_back("@" + f.name + ": entry block out of range");
                    return;
                }
                if (!f.blocks[f.entry].preds.empty()) {
                    errors_.push_back("@" + f.name + ": entry block has predecessors");
                    return;
                }

                os << "define " << (f.exported ? "" : "internal ") << ty_(f.ret) << " " << gref_(f.name) << "(";
                for (size_t k = 0; k < f.params.size(); ++k) {
                    if (k) os << ", ";
                    os << ty_(f.param_types[k]) << " " << vref_(f.params[k]);
                }
                os << ") {";
                if (!f.source_name.empty()) os << "  ; " << f.source_name;
                os << "\n";

                emit_block_(os, f.entry);
                for (BlockId b = 0; b < f.blocks.size(); ++b) {
                    if (b == f.entry) continue;
                    emit_block_(os, b);
                }
                os << "}\n\n";
                f_ = nullptr;
            }

            // ---- C entry ----

            void emit_entry_(std::ostream& os) {
                Type main_ret = Type::kVoid;
                bool found = false;
                for (const auto& f : m_.functions) {
                    if (f.name == m_.main_symbol) {
                        main_ret = f.ret;
                        found = true;
                    }
                }
                if (!found) {
                    errors_.push_back("entry requested but @" + m_.main_symbol + " is not defined in this module");
                    return;
                }

                const auto& rc = m_.runtime;
                os << "define i32 @main() {\n";
                os << "entry:\n";
                os << "  " << rt_call_(RtFn::kInit, {std::to_string(rc.sso_threshold),
                                                     std::to_string(rc.initial_array_capacity),
                                                     std::to_string(static_cast<uint32_t>(rc.hash))}) << "\n";
                os << "  " << (main_ret == Type::kVoid ? "" : "%main_ret = ") << "call " << ty_(main_ret) << " "
                   << gref_(m_.main_symbol) << "()\n";
                os << "  %pending = " << rt_call_(RtFn::kExcPending, {}) << "\n";
                os << "  br i1 %pending, label %uncaught, label %done\n";
                os << "uncaught:\n";
                os << "  " << rt_call_(RtFn::kReportUncaught, {}) << "\n";
                os << "  " << rt_call_(RtFn::kShutdown, {}) << "\n";
                os << "  ret i32 " << php2ir::rt::kUncaughtExitCode << "\n";
                os << "done:\n";
                os << "  " << rt_call_(RtFn::kShutdown, {}) << "\n";
                os << "  ret i32 0\n";
                os << "}\n";
            }
        };

    } // namespace

    LLVMIRLoweringResult lower_lir_to_llvm_ir_text(
        const php2ir::lir::Module& m,
        const LLVMIRLoweringOptions& opt
    ) {
        LLVMIRLoweringResult out{};
        ModuleEmitter em(m, opt);
        if (!em.emit(out.llvm_ir, out.messages)) {
            out.ok = false;
            out.messages.push_back(CompileMessage{
                true,
                "LIR->LLVM lowering aborted for unit '" + m.unit + "'."
            });
            return out;
        }
        out.ok = true;
        out.messages.push_back(CompileMessage{
            false,
            "lowered LIR to LLVM-IR text successfully."
        });
        return out;
    }

} // namespace php2ir::backend::aot
