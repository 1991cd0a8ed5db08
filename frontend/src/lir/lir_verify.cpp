// frontend/src/lir/lir_verify.cpp
#include <php2ir/lir/LIR.hpp>
#include <php2ir/ssa/Dominance.hpp>

#include <sstream>
#include <unordered_map>
#include <unordered_set>


namespace php2ir::lir {

    namespace {

        struct Signature {
            Type ret = Type::kVoid;
            std::vector<Type> params{};
            bool foreign = false;
        };

        /// @brief 모듈 안에서 이름으로 찾을 수 있는 호출 대상과 클래스.
        struct ModuleScope {
            std::unordered_map<std::string, Signature> callees{};
            std::unordered_set<std::string> classes{};
        };

        struct DefSite {
            BlockId block = kInvalidBlock;
            int32_t pos = -2;   // -1: phi / param, >= 0: inst index
        };

        class FunctionVerifier {
        public:
            FunctionVerifier(const Function& f, const ModuleScope* scope, std::vector<VerifyError>& errs)
                : f_(f), scope_(scope), errs_(errs) {}

            void run();

        private:
            void error_(BlockId b, const std::string& msg) {
                std::ostringstream oss;
                oss << f_.name << ": bb" << b << ": " << msg;
                errs_.push_back(VerifyError{oss.str()});
            }
            Type type_(ValueId v) const {
                return (v < f_.value_types.size()) ? f_.value_types[v] : Type::kVoid;
            }
            void define_(ValueId v, Type t, BlockId b, int32_t pos);
            void use_(ValueId v, BlockId b, int32_t pos, const char* what);
            void expect_(BlockId b, ValueId v, Type t, const char* what);
            void check_inst_(BlockId b, const Inst& inst);
            void check_call_(BlockId b, const Inst& inst, size_t first_arg);
            bool may_throw_(const Inst& inst) const;

            const Function& f_;
            const ModuleScope* scope_;
            std::vector<VerifyError>& errs_;
            std::vector<DefSite> def_{};
            ssa::DomInfo dom_{};
        };

        void FunctionVerifier::define_(ValueId v, Type t, BlockId b, int32_t pos) {
            if (v >= f_.value_types.size()) {
                error_(b, "defines unknown value %" + std::to_string(v));
                return;
            }
            if (def_[v].block != kInvalidBlock) {
                error_(b, "value %" + std::to_string(v) + " defined twice");
                return;
            }
            if (f_.value_types[v] != t) {
                std::ostringstream oss;
                oss << "%" << v << " is " << type_name(f_.value_types[v]) << " but its definition yields "
                    << type_name(t);
                error_(b, oss.str());
            }
            def_[v] = DefSite{b, pos};
        }

        void FunctionVerifier::use_(ValueId v, BlockId b, int32_t pos, const char* what) {
            if (v >= f_.value_types.size() || def_[v].block == kInvalidBlock) {
                std::ostringstream oss;
                oss << what << " reads undefined value %" << v;
                error_(b, oss.str());
                return;
            }
            const DefSite& d = def_[v];
            const bool ok = (d.block == b) ? (d.pos < pos) : ssa::dominates(dom_, d.block, b);
            if (!ok) {
                std::ostringstream oss;
                oss << what << " reads %" << v << " whose definition (bb" << d.block << ") does not dominate it";
                error_(b, oss.str());
            }
        }

        void FunctionVerifier::expect_(BlockId b, ValueId v, Type t, const char* what) {
            const Type got = type_(v);
            if (got == t) return;
            if (t == Type::kPtr && is_handle(got)) return;
            std::ostringstream oss;
            oss << what << ": expected " << type_name(t) << ", got " << type_name(got) << " (%" << v << ")";
            error_(b, oss.str());
        }

        bool FunctionVerifier::may_throw_(const Inst& inst) const {
            switch (inst.op) {
                case Opcode::kCall:
                case Opcode::kCallIndirect:
                    return true;
                case Opcode::kCallRt:
                    return rt::rt_info(inst.rt).may_throw;
                default:
                    return false;
            }
        }

        void FunctionVerifier::check_call_(BlockId b, const Inst& inst, size_t first_arg) {
            if (scope_ == nullptr) return;
            auto it = scope_->callees.find(inst.s);
            if (it == scope_->callees.end()) {
                error_(b, "call to unknown symbol @" + inst.s);
                return;
            }
            const Signature& sig = it->second;
            if (inst.op == Opcode::kCallForeign && !sig.foreign) error_(b, "call.c to non-foreign @" + inst.s);
            if (inst.args.size() - first_arg != sig.params.size()) {
                std::ostringstream oss;
                oss << "@" << inst.s << " takes " << sig.params.size() << " argument(s), got "
                    << (inst.args.size() - first_arg);
                error_(b, oss.str());
                return;
            }
            for (size_t i = 0; i < sig.params.size(); ++i) {
                expect_(b, inst.args[first_arg + i], sig.params[i], "call argument");
            }
            if (sig.ret != inst.type) {
                error_(b, "@" + inst.s + " returns " + std::string(type_name(sig.ret)));
            }
        }

        void FunctionVerifier::check_inst_(BlockId b, const Inst& inst) {
            const std::string what(opcode_name(inst.op));
            auto arity = [&](size_t n) {
                if (inst.args.size() == n) return true;
                error_(b, what + ": expected " + std::to_string(n) + " operand(s)");
                return false;
            };

            switch (inst.op) {
                case Opcode::kConstInt:
                    if (inst.type != Type::kI64) error_(b, "const.i64 must be i64");
                    break;
                case Opcode::kConstFloat:
                    if (inst.type != Type::kF64) error_(b, "const.f64 must be f64");
                    break;
                case Opcode::kConstBool:
                    if (inst.type != Type::kI1) error_(b, "const.i1 must be i1");
                    break;
                case Opcode::kConstStr:
                    if (inst.type != Type::kStr) error_(b, "const.str must be str");
                    break;
                case Opcode::kConstNull:
                    if (!is_handle(inst.type)) error_(b, "const.null must be a handle");
                    break;
                case Opcode::kClassRef:
                    if (inst.type != Type::kPtr) error_(b, "classref must be ptr");
                    if (scope_ != nullptr && scope_->classes.count(inst.s) == 0) {
                        error_(b, "classref to unknown descriptor @" + inst.s);
                    }
                    break;

                case Opcode::kIAdd: case Opcode::kISub: case Opcode::kIMul:
                case Opcode::kSDiv: case Opcode::kSRem: case Opcode::kShl: case Opcode::kAShr:
                    if (!arity(2)) break;
                    if (inst.type != Type::kI64) error_(b, what + " must be i64");
                    expect_(b, inst.args[0], Type::kI64, what.c_str());
                    expect_(b, inst.args[1], Type::kI64, what.c_str());
                    break;
                case Opcode::kAnd: case Opcode::kOr: case Opcode::kXor:
                    if (!arity(2)) break;
                    if (inst.type != Type::kI64 && inst.type != Type::kI1) error_(b, what + " must be i64 or i1");
                    expect_(b, inst.args[0], inst.type, what.c_str());
                    expect_(b, inst.args[1], inst.type, what.c_str());
                    break;
                case Opcode::kICmp:
                    if (!arity(2)) break;
                    if (inst.type != Type::kI1) error_(b, "icmp must be i1");
                    if (type_(inst.args[0]) != type_(inst.args[1])) error_(b, "icmp operands differ in type");
                    if (type_(inst.args[0]) == Type::kF64) error_(b, "icmp on f64");
                    break;
                case Opcode::kFAdd: case Opcode::kFSub: case Opcode::kFMul: case Opcode::kFDiv:
                    if (!arity(2)) break;
                    if (inst.type != Type::kF64) error_(b, what + " must be f64");
                    expect_(b, inst.args[0], Type::kF64, what.c_str());
                    expect_(b, inst.args[1], Type::kF64, what.c_str());
                    break;
                case Opcode::kFNeg:
                    if (!arity(1)) break;
                    expect_(b, inst.args[0], Type::kF64, "fneg");
                    break;
                case Opcode::kFCmp:
                    if (!arity(2)) break;
                    if (inst.type != Type::kI1) error_(b, "fcmp must be i1");
                    expect_(b, inst.args[0], Type::kF64, "fcmp");
                    expect_(b, inst.args[1], Type::kF64, "fcmp");
                    break;
                case Opcode::kSIToFP:
                    if (!arity(1)) break;
                    expect_(b, inst.args[0], Type::kI64, "sitofp");
                    if (inst.type != Type::kF64) error_(b, "sitofp must be f64");
                    break;
                case Opcode::kFPToSI:
                    if (!arity(1)) break;
                    expect_(b, inst.args[0], Type::kF64, "fptosi");
                    if (inst.type != Type::kI64) error_(b, "fptosi must be i64");
                    break;
                case Opcode::kZExt:
                    if (!arity(1)) break;
                    expect_(b, inst.args[0], Type::kI1, "zext");
                    if (inst.type != Type::kI64) error_(b, "zext must be i64");
                    break;

                case Opcode::kCallRt: {
                    const rt::RtFnInfo& info = rt::rt_info(inst.rt);
                    if (!arity(info.params.size())) break;
                    for (size_t i = 0; i < info.params.size(); ++i) {
                        expect_(b, inst.args[i], info.params[i], std::string(info.symbol).c_str());
                    }
                    if (inst.type != info.ret) error_(b, std::string(info.symbol) + ": wrong result type");
                    break;
                }
                case Opcode::kCall:
                case Opcode::kCallForeign:
                    check_call_(b, inst, 0);
                    break;
                case Opcode::kLoadVSlot:
                    if (!arity(1)) break;
                    expect_(b, inst.args[0], Type::kObj, "load.vslot");
                    if (inst.type != Type::kPtr) error_(b, "load.vslot must be ptr");
                    break;
                case Opcode::kCallIndirect:
                    if (inst.args.empty()) {
                        error_(b, "call.indirect without code pointer");
                        break;
                    }
                    expect_(b, inst.args[0], Type::kPtr, "call.indirect target");
                    if (inst.args.size() < 2 || type_(inst.args[1]) != Type::kObj) {
                        error_(b, "call.indirect needs an obj receiver");
                    }
                    break;
                case Opcode::kLoadSlot:
                    if (!arity(1)) break;
                    expect_(b, inst.args[0], Type::kObj, "load.slot");
                    break;
                case Opcode::kStoreSlot:
                    if (!arity(2)) break;
                    expect_(b, inst.args[0], Type::kObj, "store.slot");
                    if (inst.type != Type::kVoid) error_(b, "store.slot yields no value");
                    break;
                case Opcode::kRetain:
                case Opcode::kRelease:
                    if (!arity(1)) break;
                    if (!is_handle(type_(inst.args[0]))) error_(b, what + " on a non-handle value");
                    break;
            }
        }

        void FunctionVerifier::run() {
            const size_t nb = f_.blocks.size();
            if (nb == 0) {
                errs_.push_back(VerifyError{f_.name + ": function has no blocks"});
                return;
            }
            if (f_.entry >= nb) {
                errs_.push_back(VerifyError{f_.name + ": entry block out of range"});
                return;
            }
            if (f_.params.size() != f_.param_types.size()) {
                errs_.push_back(VerifyError{f_.name + ": parameter count mismatch"});
                return;
            }

            // terminators and edges
            std::vector<std::vector<BlockId>> preds(nb);
            std::vector<std::vector<BlockId>> succs(nb);
            bool edges_ok = true;
            for (BlockId b = 0; b < nb; ++b) {
                const Term& t = f_.blocks[b].term;
                if (t.kind == TermKind::kNone) {
                    error_(b, "block without terminator");
                    edges_ok = false;
                    continue;
                }
                for (BlockId s : successors(t)) {
                    if (s >= nb) {
                        error_(b, "branch to missing block");
                        edges_ok = false;
                        continue;
                    }
                    succs[b].push_back(s);
                    preds[s].push_back(b);
                }
            }
            if (!edges_ok) return;

            for (BlockId b = 0; b < nb; ++b) {
                if (preds[b] != f_.blocks[b].preds) error_(b, "stale predecessor list");
            }
            dom_ = ssa::build_dom_info(preds, succs, f_.entry);

            def_.assign(f_.value_types.size(), DefSite{});
            for (size_t i = 0; i < f_.params.size(); ++i) define_(f_.params[i], f_.param_types[i], f_.entry, -1);
            for (BlockId b = 0; b < nb; ++b) {
                const Block& blk = f_.blocks[b];
                for (const auto& p : blk.phis) define_(p.dst, p.type, b, -1);
                for (size_t i = 0; i < blk.insts.size(); ++i) {
                    const Inst& inst = blk.insts[i];
                    if (inst.type == Type::kVoid) {
                        if (inst.dst != kInvalidValue) error_(b, "void instruction defines a value");
                        continue;
                    }
                    if (inst.dst == kInvalidValue) {
                        error_(b, std::string(opcode_name(inst.op)) + " drops its result");
                        continue;
                    }
                    define_(inst.dst, inst.type, b, static_cast<int32_t>(i));
                }
            }

            for (BlockId b = 0; b < nb; ++b) {
                const Block& blk = f_.blocks[b];

                for (const auto& p : blk.phis) {
                    if (p.incoming.size() != blk.preds.size()) {
                        error_(b, "phi %" + std::to_string(p.dst) + " has wrong incoming count");
                        continue;
                    }
                    for (const auto& in : p.incoming) {
                        bool found = false;
                        for (BlockId pr : blk.preds) found = found || (pr == in.pred);
                        if (!found) {
                            error_(b, "phi incoming from non-predecessor bb" + std::to_string(in.pred));
                            continue;
                        }
                        expect_(b, in.value, p.type, "phi incoming");
                        // the value must be available at the end of the predecessor
                        use_(in.value, in.pred, static_cast<int32_t>(f_.blocks[in.pred].insts.size()), "phi incoming");
                    }
                }

                int32_t last_real = -1;
                for (size_t i = 0; i < blk.insts.size(); ++i) {
                    const Inst& inst = blk.insts[i];
                    for (ValueId a : inst.args) use_(a, b, static_cast<int32_t>(i), opcode_name(inst.op).data());
                    check_inst_(b, inst);
                    if (inst.op != Opcode::kRetain && inst.op != Opcode::kRelease) last_real = static_cast<int32_t>(i);
                }
                for (size_t i = 0; i < blk.insts.size(); ++i) {
                    if (!may_throw_(blk.insts[i])) continue;
                    if (static_cast<int32_t>(i) != last_real || blk.term.kind != TermKind::kExcCheck) {
                        error_(b, std::string(opcode_name(blk.insts[i].op)) +
                                  " may throw but is not the last instruction before an exception check");
                    }
                }

                const Term& t = blk.term;
                const int32_t end = static_cast<int32_t>(blk.insts.size());
                switch (t.kind) {
                    case TermKind::kCondBr:
                        use_(t.value, b, end, "condbr");
                        expect_(b, t.value, Type::kI1, "condbr");
                        break;
                    case TermKind::kRet:
                        if (f_.ret == Type::kVoid) {
                            if (t.value != kInvalidValue) error_(b, "ret with a value in a void function");
                        } else if (t.value == kInvalidValue) {
                            error_(b, "ret without a value");
                        } else {
                            use_(t.value, b, end, "ret");
                            expect_(b, t.value, f_.ret, "ret");
                        }
                        break;
                    case TermKind::kRaise:
                        use_(t.value, b, end, "raise");
                        expect_(b, t.value, Type::kObj, "raise");
                        break;
                    default:
                        break;
                }
            }
        }

        ModuleScope build_scope_(const Module& m) {
            ModuleScope s{};
            for (const auto& f : m.functions) s.callees[f.name] = Signature{f.ret, f.param_types, false};
            for (const auto& e : m.externs) {
                if (s.callees.count(e.name) == 0) s.callees[e.name] = Signature{e.ret, e.params, e.foreign};
            }
            for (const auto& c : m.classes) s.classes.insert(c.symbol);
            return s;
        }

    } // namespace

    std::vector<VerifyError> verify(const Function& f) {
        std::vector<VerifyError> errs;
        FunctionVerifier(f, nullptr, errs).run();
        return errs;
    }

    std::vector<VerifyError> verify(const Module& m) {
        std::vector<VerifyError> errs;
        const ModuleScope scope = build_scope_(m);

        std::unordered_set<std::string> names;
        for (const auto& f : m.functions) {
            if (!names.insert(f.name).second) errs.push_back(VerifyError{"duplicate function @" + f.name});
            FunctionVerifier(f, &scope, errs).run();
        }

        auto require_fn = [&](const std::string& owner, const std::string& sym) {
            if (sym.empty() || scope.callees.count(sym) != 0) return;
            errs.push_back(VerifyError{"class @" + owner + " refers to unknown function @" + sym});
        };
        auto require_class = [&](const std::string& owner, const std::string& sym) {
            if (sym.empty() || scope.classes.count(sym) != 0) return;
            errs.push_back(VerifyError{"class @" + owner + " refers to unknown descriptor @" + sym});
        };
        for (const auto& c : m.classes) {
            if (!c.defined_here) continue;
            require_class(c.symbol, c.parent);
            for (const auto& i : c.interfaces) require_class(c.symbol, i);
            for (const auto& v : c.vtable) require_fn(c.symbol, v);
            for (const auto& md : c.methods) require_fn(c.symbol, md.adapter);
            require_fn(c.symbol, c.ctor);
        }
        return errs;
    }

} // namespace php2ir::lir
