// frontend/src/lir/lower.cpp
#include <php2ir/lir/Lower.hpp>
#include <php2ir/resolve/Builtins.hpp>

#include <functional>
#include <unordered_set>


namespace php2ir::lir {

    namespace {

        using resolve::SymbolId;
        using sema::Symbol;
        using sema::SymbolKind;

        Pred pred_of_(cfg::BinKind k) {
            switch (k) {
                case cfg::BinKind::kNe: case cfg::BinKind::kNotIdentical: return Pred::kNe;
                case cfg::BinKind::kLt: return Pred::kLt;
                case cfg::BinKind::kLe: return Pred::kLe;
                case cfg::BinKind::kGt: return Pred::kGt;
                case cfg::BinKind::kGe: return Pred::kGe;
                default:                return Pred::kEq;
            }
        }

        bool is_ordering_(cfg::BinKind k) {
            return k == cfg::BinKind::kLt || k == cfg::BinKind::kLe ||
                   k == cfg::BinKind::kGt || k == cfg::BinKind::kGe;
        }

        void compute_preds_(Function& f) {
            for (auto& b : f.blocks) b.preds.clear();
            for (BlockId b = 0; b < f.blocks.size(); ++b) {
                for (BlockId s : successors(f.blocks[b].term)) {
                    if (s < f.blocks.size()) f.blocks[s].preds.push_back(b);
                }
            }
        }

        /// @brief SSA 함수 하나와 모듈 수준 표(클래스, extern)를 같이 채우는 작업 상태.
        class Lowerer {
        public:
            Lowerer(const resolve::ResolvedUnit& ru, const ty::TypePool& types,
                    const LowerOptions& opt, LowerResult& out)
                : ru_(ru), types_(types), opt_(opt), out_(out) {}

            void run(const ssa::Unit& u);

        private:
            // ---- module level ----
            const Symbol& sym_(SymbolId id) const { return ru_.table.symbol(id); }
            Type repr_type_(ty::TypeId t) const {
                return type_of(cfg::repr_of(types_, t));
            }
            std::string function_symbol_(SymbolId s) const;
            std::string class_symbol_(SymbolId cls) const { return rt::mangle_class(sym_(cls).name); }
            void note_callee_(SymbolId s);
            void note_class_(SymbolId cls);
            void note_extern_(ExternDecl d);
            Type sym_ret_(const Symbol& s) const;
            std::vector<Type> sym_params_(const Symbol& s) const;
            SlotInit slot_init_(const sema::DefaultValue& d, Type t) const;
            ClassDesc class_desc_(SymbolId cls);
            void build_adapter_(SymbolId cls, SymbolId method);
            void internal_(Span sp, const std::string& detail);

            // ---- function level ----
            void function_(const ssa::Function& f);
            ValueId val_(ssa::ValueId v, Span sp);
            Type vt_(ValueId v) const { return fn_->value_types[v]; }
            BlockId new_block_();
            ValueId emit_(Inst inst);
            ValueId inst_(Opcode op, Type t, std::vector<ValueId> args, Span sp);
            ValueId rt_(rt::RtFn f, std::vector<ValueId> args, Span sp);
            ValueId const_int_(int64_t v, Span sp);
            ValueId const_float_(double v, Span sp);
            ValueId const_bool_(bool v, Span sp);
            ValueId const_str_(std::string_view s, Span sp);
            ValueId const_null_(Span sp);
            ValueId zero_of_(Type t, Span sp);
            ValueId class_ref_(SymbolId cls, Span sp);
            ValueId cmp_(Opcode op, Pred p, ValueId a, ValueId b, Span sp);
            ValueId not_(ValueId v, Span sp);
            ValueId spaceship_(ValueId gt, ValueId lt, Span sp);
            ValueId cast_(ValueId v, Type to, Span sp);
            ValueId default_box_(const sema::DefaultValue& d, Span sp);
            ValueId slot_value_(const SlotInit& init, Type t, Span sp);
            void terminate_(Term t) { fn_->blocks[cur_].term = t; }
            void guard_(Span sp);

            void op_(const cfg::Op& op, const ssa::Function& f);
            ValueId binary_(cfg::BinKind k, ValueId a, ValueId b, Span sp);
            ValueId unary_(cfg::UnKind k, ValueId a, Span sp);
            ValueId builtin_(const cfg::Op& op, std::vector<ValueId> args);
            void new_(const cfg::Op& op, ValueId dst_hint, ValueId& out);
            void term_(const cfg::Term& t, const ssa::Function& f);

            const resolve::ResolvedUnit& ru_;
            const ty::TypePool& types_;
            const LowerOptions& opt_;
            LowerResult& out_;

            std::unordered_set<std::string> externs_seen_;
            std::unordered_set<SymbolId> classes_seen_;
            std::vector<SymbolId> imported_classes_;

            Function* fn_ = nullptr;
            BlockId cur_ = kInvalidBlock;
            std::vector<ValueId> vmap_;
        };

        // ---- module level ----

        std::string Lowerer::function_symbol_(SymbolId s) const {
            const Symbol& x = sym_(s);
            if (x.kind == SymbolKind::kForeign) return x.foreign_symbol.empty() ? x.name : x.foreign_symbol;
            if (x.kind == SymbolKind::kMethod && x.owner != resolve::kInvalidSymbol) {
                return rt::mangle_method(sym_(x.owner).name, x.name);
            }
            return rt::mangle_function(x.name);
        }

        Type Lowerer::sym_ret_(const Symbol& s) const {
            return type_of(cfg::repr_of(types_, s.type));
        }

        std::vector<Type> Lowerer::sym_params_(const Symbol& s) const {
            std::vector<Type> out;
            if (s.kind == SymbolKind::kMethod && !s.is_static) out.push_back(Type::kObj);
            for (const auto& p : s.params) out.push_back(repr_type_(p.type));
            return out;
        }

        void Lowerer::note_extern_(ExternDecl d) {
            if (!externs_seen_.insert(d.name).second) return;
            out_.module.externs.push_back(std::move(d));
        }

        void Lowerer::note_callee_(SymbolId s) {
            const Symbol& x = sym_(s);
            if (x.kind != SymbolKind::kForeign && !x.imported) return;
            ExternDecl d{};
            d.name = function_symbol_(s);
            d.ret = sym_ret_(x);
            d.params = sym_params_(x);
            d.foreign = (x.kind == SymbolKind::kForeign);
            d.lib = x.foreign_lib;
            note_extern_(std::move(d));
        }

        void Lowerer::note_class_(SymbolId cls) {
            if (!sym_(cls).imported) return;
            if (!classes_seen_.insert(cls).second) return;
            imported_classes_.push_back(cls);
        }

        void Lowerer::internal_(Span sp, const std::string& detail) {
            diag::Diagnostic d(diag::Severity::kFatal, diag::Code::kInternalFailure, sp);
            d.add_arg("lower");
            d.add_arg(detail);
            out_.bag.add(std::move(d));
            out_.ok = false;
        }

        SlotInit Lowerer::slot_init_(const sema::DefaultValue& d, Type t) const {
            using K = sema::DefaultValue::Kind;
            SlotInit s{};
            switch (d.kind) {
                case K::kNone:
                    if (t == Type::kStr) s.kind = SlotInit::Kind::kStr;
                    else if (t == Type::kArr) s.kind = SlotInit::Kind::kEmptyArray;
                    else if (t == Type::kBox) s.kind = SlotInit::Kind::kNull;
                    break;
                case K::kNull:       s.kind = SlotInit::Kind::kNull; break;
                case K::kInt:        s.kind = SlotInit::Kind::kInt; s.i = d.i; break;
                case K::kFloat:      s.kind = SlotInit::Kind::kFloat; s.f = d.f; break;
                case K::kBool:       s.kind = SlotInit::Kind::kBool; s.i = d.b ? 1 : 0; break;
                case K::kString:     s.kind = SlotInit::Kind::kStr; s.s = d.s; break;
                case K::kEmptyArray: s.kind = SlotInit::Kind::kEmptyArray; break;
            }
            // typed slots take the declared representation up front
            if (t == Type::kF64 && s.kind == SlotInit::Kind::kInt) {
                s.kind = SlotInit::Kind::kFloat;
                s.f = static_cast<double>(s.i);
            }
            return s;
        }

        ClassDesc Lowerer::class_desc_(SymbolId cls) {
            const Symbol& cs = sym_(cls);
            ClassDesc d{};
            d.symbol = class_symbol_(cls);
            d.name = cs.name;
            d.is_interface = (cs.kind == SymbolKind::kInterface);

            const sema::ClassLayout* lay = ru_.table.layout(cls);
            if (lay == nullptr) return d;

            if (lay->parent != resolve::kInvalidSymbol) {
                d.parent = class_symbol_(lay->parent);
                note_class_(lay->parent);
            }
            for (SymbolId i : lay->interfaces) {
                d.interfaces.push_back(class_symbol_(i));
                note_class_(i);
            }
            if (d.is_interface) return d;

            for (SymbolId p : lay->slots) {
                const Symbol& ps = sym_(p);
                SlotDesc sd{};
                sd.name = ps.name;
                sd.type = repr_type_(ps.type);
                sd.is_public = (ps.vis == sema::Visibility::kPublic);
                sd.init = slot_init_(ps.init, sd.type);
                d.slots.push_back(std::move(sd));
            }

            for (SymbolId m : lay->vtable) {
                if (m == resolve::kInvalidSymbol || sym_(m).is_abstract) {
                    d.vtable.emplace_back();
                    continue;
                }
                d.vtable.push_back(function_symbol_(m));
                note_callee_(m);
            }

            // by-name table: nearest declaration wins
            std::unordered_set<std::string> seen;
            std::vector<SymbolId> chain{cls};
            chain.insert(chain.end(), lay->ancestors.begin(), lay->ancestors.end());
            for (SymbolId owner : chain) {
                for (SymbolId m : ru_.table.members_in_order(owner)) {
                    const Symbol& ms = sym_(m);
                    if (ms.kind != SymbolKind::kMethod || ms.is_static || ms.is_abstract) continue;
                    const std::string key = sema::fold_name(ms.name);
                    if (!seen.insert(key).second) continue;
                    if (ms.vis != sema::Visibility::kPublic) continue;

                    MethodDesc md{};
                    md.name = key;
                    md.adapter = rt::mangle_adapter(sym_(owner).name, ms.name);
                    md.arity = static_cast<uint32_t>(ms.params.size());
                    for (const auto& p : ms.params) {
                        if (p.def.kind == sema::DefaultValue::Kind::kNone) ++md.required;
                    }
                    if (sym_(owner).imported) {
                        ExternDecl e{};
                        e.name = md.adapter;
                        e.ret = Type::kBox;
                        e.params = {Type::kObj, Type::kArr};
                        note_extern_(std::move(e));
                    }
                    d.methods.push_back(std::move(md));
                }
            }

            if (lay->ctor != resolve::kInvalidSymbol) {
                d.ctor = function_symbol_(lay->ctor);
                note_callee_(lay->ctor);
            }
            return d;
        }

        void Lowerer::run(const ssa::Unit& u) {
            Module& m = out_.module;
            m.unit = u.name;
            m.main_symbol = rt::mangle_main(u.name);
            m.emit_entry = opt_.emit_entry;
            m.runtime = opt_.runtime;

            for (const auto& f : u.functions) function_(f);
            out_.stats.functions = static_cast<uint32_t>(u.functions.size());

            for (SymbolId cls : ru_.local_classes) {
                m.classes.push_back(class_desc_(cls));
                const Symbol& cs = sym_(cls);
                if (cs.kind != SymbolKind::kClass) continue;
                for (SymbolId meth : ru_.table.members_in_order(cls)) {
                    const Symbol& ms = sym_(meth);
                    if (ms.kind != SymbolKind::kMethod || ms.is_static || ms.is_abstract) continue;
                    if (ms.vis != sema::Visibility::kPublic || ms.decl == ast::k_invalid_decl) continue;
                    build_adapter_(cls, meth);
                }
            }

            // imported descriptors referenced by this unit; the list can grow while we walk it
            for (size_t i = 0; i < imported_classes_.size(); ++i) {
                ClassDesc d{};
                d.symbol = class_symbol_(imported_classes_[i]);
                d.name = sym_(imported_classes_[i]).name;
                d.is_interface = (sym_(imported_classes_[i]).kind == SymbolKind::kInterface);
                d.defined_here = false;
                m.classes.push_back(std::move(d));
            }
        }

        // ---- function level helpers ----

        BlockId Lowerer::new_block_() {
            fn_->blocks.emplace_back();
            return static_cast<BlockId>(fn_->blocks.size() - 1);
        }

        ValueId Lowerer::emit_(Inst inst) {
            if (inst.type != Type::kVoid) inst.dst = fn_->new_value(inst.type);
            const ValueId d = inst.dst;
            fn_->blocks[cur_].insts.push_back(std::move(inst));
            ++out_.stats.insts;
            return d;
        }

        ValueId Lowerer::inst_(Opcode op, Type t, std::vector<ValueId> args, Span sp) {
            Inst i{};
            i.op = op;
            i.type = t;
            i.args = std::move(args);
            i.span = sp;
            return emit_(std::move(i));
        }

        ValueId Lowerer::rt_(rt::RtFn f, std::vector<ValueId> args, Span sp) {
            Inst i{};
            i.op = Opcode::kCallRt;
            i.rt = f;
            i.type = rt::rt_info(f).ret;
            i.args = std::move(args);
            i.span = sp;
            ++out_.stats.rt_calls;
            return emit_(std::move(i));
        }

        ValueId Lowerer::const_int_(int64_t v, Span sp) {
            Inst i{};
            i.op = Opcode::kConstInt;
            i.type = Type::kI64;
            i.i = v;
            i.span = sp;
            return emit_(std::move(i));
        }

        ValueId Lowerer::const_float_(double v, Span sp) {
            Inst i{};
            i.op = Opcode::kConstFloat;
            i.type = Type::kF64;
            i.f = v;
            i.span = sp;
            return emit_(std::move(i));
        }

        ValueId Lowerer::const_bool_(bool v, Span sp) {
            Inst i{};
            i.op = Opcode::kConstBool;
            i.type = Type::kI1;
            i.i = v ? 1 : 0;
            i.span = sp;
            return emit_(std::move(i));
        }

        ValueId Lowerer::const_str_(std::string_view s, Span sp) {
            Inst i{};
            i.op = Opcode::kConstStr;
            i.type = Type::kStr;
            i.s = std::string(s);
            i.span = sp;
            return emit_(std::move(i));
        }

        ValueId Lowerer::const_null_(Span sp) {
            return inst_(Opcode::kConstNull, Type::kBox, {}, sp);
        }

        ValueId Lowerer::zero_of_(Type t, Span sp) {
            switch (t) {
                case Type::kI1:  return const_bool_(false, sp);
                case Type::kI64: return const_int_(0, sp);
                case Type::kF64: return const_float_(0.0, sp);
                case Type::kStr: return const_str_("", sp);
                case Type::kArr: return rt_(rt::RtFn::kArrNew, {}, sp);
                default:         return inst_(Opcode::kConstNull, t, {}, sp);   // null handle
            }
        }

        ValueId Lowerer::class_ref_(SymbolId cls, Span sp) {
            note_class_(cls);
            Inst i{};
            i.op = Opcode::kClassRef;
            i.type = Type::kPtr;
            i.s = class_symbol_(cls);
            i.span = sp;
            return emit_(std::move(i));
        }

        ValueId Lowerer::cmp_(Opcode op, Pred p, ValueId a, ValueId b, Span sp) {
            Inst i{};
            i.op = op;
            i.type = Type::kI1;
            i.pred = p;
            i.args = {a, b};
            i.span = sp;
            return emit_(std::move(i));
        }

        ValueId Lowerer::not_(ValueId v, Span sp) {
            return inst_(Opcode::kXor, Type::kI1, {v, const_bool_(true, sp)}, sp);
        }

        ValueId Lowerer::spaceship_(ValueId gt, ValueId lt, Span sp) {
            const ValueId g = inst_(Opcode::kZExt, Type::kI64, {gt}, sp);
            const ValueId l = inst_(Opcode::kZExt, Type::kI64, {lt}, sp);
            return inst_(Opcode::kISub, Type::kI64, {g, l}, sp);
        }

        /// @brief 표현 변환. 직접 규칙이 없는 쌍은 box를 거친다.
        ValueId Lowerer::cast_(ValueId v, Type to, Span sp) {
            const Type from = vt_(v);
            if (from == to) return v;
            using rt::RtFn;

            switch (to) {
                case Type::kI64:
                    if (from == Type::kI1) return inst_(Opcode::kZExt, Type::kI64, {v}, sp);
                    if (from == Type::kF64) return inst_(Opcode::kFPToSI, Type::kI64, {v}, sp);
                    if (from == Type::kStr) return rt_(RtFn::kStrToInt, {v}, sp);
                    if (from == Type::kBox) return rt_(RtFn::kUnboxInt, {v}, sp);
                    break;
                case Type::kF64:
                    if (from == Type::kI1) return cast_(cast_(v, Type::kI64, sp), Type::kF64, sp);
                    if (from == Type::kI64) return inst_(Opcode::kSIToFP, Type::kF64, {v}, sp);
                    if (from == Type::kStr) return rt_(RtFn::kStrToFloat, {v}, sp);
                    if (from == Type::kBox) return rt_(RtFn::kUnboxFloat, {v}, sp);
                    break;
                case Type::kI1:
                    if (from == Type::kI64) return cmp_(Opcode::kICmp, Pred::kNe, v, const_int_(0, sp), sp);
                    if (from == Type::kF64) return cmp_(Opcode::kFCmp, Pred::kNe, v, const_float_(0.0, sp), sp);
                    if (from == Type::kStr) return rt_(RtFn::kStrToBool, {v}, sp);
                    if (from == Type::kBox) return rt_(RtFn::kUnboxBool, {v}, sp);
                    if (from == Type::kArr) {
                        const ValueId n = rt_(RtFn::kArrCount, {v}, sp);
                        return cmp_(Opcode::kICmp, Pred::kNe, n, const_int_(0, sp), sp);
                    }
                    if (from == Type::kObj) return const_bool_(true, sp);
                    break;
                case Type::kStr:
                    if (from == Type::kI64) return rt_(RtFn::kStrFromInt, {v}, sp);
                    if (from == Type::kF64) return rt_(RtFn::kStrFromFloat, {v}, sp);
                    if (from == Type::kI1) return rt_(RtFn::kStrFromBool, {v}, sp);
                    if (from == Type::kBox) return rt_(RtFn::kUnboxStr, {v}, sp);
                    break;
                case Type::kArr:
                    if (from == Type::kBox) return rt_(RtFn::kUnboxArr, {v}, sp);
                    break;
                case Type::kObj:
                    if (from == Type::kBox) return rt_(RtFn::kUnboxObj, {v}, sp);
                    break;
                case Type::kBox:
                    if (from == Type::kI64) return rt_(RtFn::kBoxInt, {v}, sp);
                    if (from == Type::kF64) return rt_(RtFn::kBoxFloat, {v}, sp);
                    if (from == Type::kI1) return rt_(RtFn::kBoxBool, {v}, sp);
                    if (from == Type::kStr) return rt_(RtFn::kBoxStr, {v}, sp);
                    if (from == Type::kArr) return rt_(RtFn::kBoxArr, {v}, sp);
                    if (from == Type::kObj) return rt_(RtFn::kBoxObj, {v}, sp);
                    break;
                default:
                    break;
            }
            if (from != Type::kBox && from != Type::kVoid && from != Type::kPtr &&
                to != Type::kVoid && to != Type::kPtr) {
                return cast_(cast_(v, Type::kBox, sp), to, sp);
            }
            internal_(sp, "no conversion from " + std::string(type_name(from)) + " to " +
                          std::string(type_name(to)));
            return v;
        }

        ValueId Lowerer::default_box_(const sema::DefaultValue& d, Span sp) {
            using K = sema::DefaultValue::Kind;
            switch (d.kind) {
                case K::kNone:
                case K::kNull:       return const_null_(sp);
                case K::kInt:        return cast_(const_int_(d.i, sp), Type::kBox, sp);
                case K::kFloat:      return cast_(const_float_(d.f, sp), Type::kBox, sp);
                case K::kBool:       return cast_(const_bool_(d.b, sp), Type::kBox, sp);
                case K::kString:     return cast_(const_str_(d.s, sp), Type::kBox, sp);
                case K::kEmptyArray: return cast_(rt_(rt::RtFn::kArrNew, {}, sp), Type::kBox, sp);
            }
            return const_null_(sp);
        }

        /// @brief 슬롯 초기값. obj_new가 0으로 채운 상태 그대로면 kInvalidValue.
        ValueId Lowerer::slot_value_(const SlotInit& init, Type t, Span sp) {
            using K = SlotInit::Kind;
            switch (t) {
                case Type::kI64:
                    if (init.kind == K::kInt || init.kind == K::kBool) {
                        return (init.i == 0) ? kInvalidValue : const_int_(init.i, sp);
                    }
                    if (init.kind == K::kFloat && static_cast<int64_t>(init.f) != 0) {
                        return const_int_(static_cast<int64_t>(init.f), sp);
                    }
                    return kInvalidValue;
                case Type::kF64:
                    if (init.kind == K::kFloat && init.f != 0.0) return const_float_(init.f, sp);
                    return kInvalidValue;
                case Type::kI1:
                    return (init.kind == K::kBool && init.i != 0) ? const_bool_(true, sp) : kInvalidValue;
                case Type::kStr:
                    return const_str_(init.kind == K::kStr ? init.s : std::string{}, sp);
                case Type::kArr:
                    return rt_(rt::RtFn::kArrNew, {}, sp);
                case Type::kBox:
                    switch (init.kind) {
                        case K::kInt:        return cast_(const_int_(init.i, sp), Type::kBox, sp);
                        case K::kFloat:      return cast_(const_float_(init.f, sp), Type::kBox, sp);
                        case K::kBool:       return cast_(const_bool_(init.i != 0, sp), Type::kBox, sp);
                        case K::kStr:        return cast_(const_str_(init.s, sp), Type::kBox, sp);
                        case K::kEmptyArray: return cast_(rt_(rt::RtFn::kArrNew, {}, sp), Type::kBox, sp);
                        default:             return kInvalidValue;
                    }
                default:
                    return kInvalidValue;
            }
        }

        /// @brief 방금 낸 inst가 예외를 던질 수 있으면 블록을 ExcCheck로 끊는다(어댑터 전용).
        void Lowerer::guard_(Span sp) {
            const BlockId next = new_block_();
            const BlockId unwind = new_block_();
            fn_->blocks[unwind].term = Term{TermKind::kUnwindRet, kInvalidValue, kInvalidBlock, kInvalidBlock, sp};
            terminate_(Term{TermKind::kExcCheck, kInvalidValue, next, unwind, sp});
            cur_ = next;
        }

        ValueId Lowerer::val_(ssa::ValueId v, Span sp) {
            if (v == ssa::kInvalidValue) return kInvalidValue;
            if (v == ssa::kUndef || v >= vmap_.size() || vmap_[v] == kInvalidValue) {
                internal_(sp, "value used before it was lowered");
                return const_null_(sp);
            }
            return vmap_[v];
        }

        // ---- functions ----

        void Lowerer::function_(const ssa::Function& f) {
            Function lf{};
            lf.source_name = f.name;
            lf.is_main = f.is_main;
            lf.span = f.span;
            if (f.is_main) lf.name = rt::mangle_main(ru_.unit_name);
            else if (f.sym != resolve::kInvalidSymbol) lf.name = function_symbol_(f.sym);
            else lf.name = rt::mangle_function(f.name);
            lf.ret = type_of(f.ret_repr);

            for (size_t i = 0; i < f.params.size(); ++i) {
                const Type t = type_of(f.vars[i].repr);
                lf.param_types.push_back(t);
                lf.params.push_back(lf.new_value(t));
            }

            lf.blocks.resize(f.blocks.size());
            lf.entry = f.entry;
            fn_ = &lf;
            vmap_.assign(f.values.size(), kInvalidValue);

            for (BlockId b = 0; b < f.blocks.size(); ++b) {
                for (const auto& p : f.blocks[b].phis) {
                    Phi lp{};
                    lp.type = type_of(f.values[p.dst].repr);
                    lp.dst = lf.new_value(lp.type);
                    vmap_[p.dst] = lp.dst;
                    lf.blocks[b].phis.push_back(std::move(lp));
                }
            }

            // reverse post-order: every def is lowered before its dominated uses
            std::vector<uint8_t> seen(f.blocks.size(), 0);
            std::vector<BlockId> post;
            std::function<void(BlockId)> dfs = [&](BlockId b) {
                seen[b] = 1;
                for (BlockId s : cfg::successors(f.blocks[b].term)) {
                    if (s < f.blocks.size() && !seen[s]) dfs(s);
                }
                post.push_back(b);
            };
            dfs(f.entry);

            for (auto it = post.rbegin(); it != post.rend(); ++it) {
                cur_ = *it;
                for (const auto& op : f.blocks[cur_].ops) op_(op, f);
                term_(f.blocks[*it].term, f);
            }

            for (BlockId b = 0; b < f.blocks.size(); ++b) {
                for (size_t k = 0; k < f.blocks[b].phis.size(); ++k) {
                    const ssa::Phi& sp = f.blocks[b].phis[k];
                    for (const auto& in : sp.incoming) {
                        ValueId v = kInvalidValue;
                        if (in.value == ssa::kUndef) {
                            // 그 경로에서는 읽히지 않는 값: pred 끝에 0을 둔다
                            cur_ = in.pred;
                            v = zero_of_(lf.blocks[b].phis[k].type, f.span);
                        } else {
                            v = val_(in.value, f.span);
                        }
                        lf.blocks[b].phis[k].incoming.push_back(PhiIncoming{in.pred, v});
                    }
                }
            }

            compute_preds_(lf);
            fn_ = nullptr;
            out_.module.functions.push_back(std::move(lf));
        }

        void Lowerer::term_(const cfg::Term& t, const ssa::Function& f) {
            Term lt{};
            lt.span = t.span;
            lt.target = t.target;
            lt.alt = t.alt;
            switch (t.kind) {
                case cfg::TermKind::kNone:
                    internal_(t.span, "block without terminator");
                    lt.kind = TermKind::kUnwindRet;
                    break;
                case cfg::TermKind::kJump:     lt.kind = TermKind::kBr; break;
                case cfg::TermKind::kBranch:
                    lt.kind = TermKind::kCondBr;
                    lt.value = cast_(val_(t.value, t.span), Type::kI1, t.span);
                    break;
                case cfg::TermKind::kReturn:
                    lt.kind = TermKind::kRet;
                    if (fn_->ret != Type::kVoid) {
                        lt.value = (t.value == ssa::kInvalidValue) ? const_null_(t.span) : val_(t.value, t.span);
                        lt.value = cast_(lt.value, fn_->ret, t.span);
                    }
                    break;
                case cfg::TermKind::kRaise:
                    lt.kind = TermKind::kRaise;
                    lt.value = cast_(val_(t.value, t.span), Type::kObj, t.span);
                    break;
                case cfg::TermKind::kExcCheck:   lt.kind = TermKind::kExcCheck; break;
                case cfg::TermKind::kUnwindExit: lt.kind = TermKind::kUnwindRet; break;
            }
            (void)f;
            terminate_(lt);
        }

        // ---- ops ----

        ValueId Lowerer::binary_(cfg::BinKind k, ValueId a, ValueId b, Span sp) {
            using cfg::BinKind;
            using rt::RtFn;
            const Type t = vt_(a);

            switch (t) {
                case Type::kI64:
                    switch (k) {
                        case BinKind::kAdd:    return inst_(Opcode::kIAdd, Type::kI64, {a, b}, sp);
                        case BinKind::kSub:    return inst_(Opcode::kISub, Type::kI64, {a, b}, sp);
                        case BinKind::kMul:    return inst_(Opcode::kIMul, Type::kI64, {a, b}, sp);
                        case BinKind::kDiv:    return inst_(Opcode::kSDiv, Type::kI64, {a, b}, sp);
                        case BinKind::kRem:    return inst_(Opcode::kSRem, Type::kI64, {a, b}, sp);
                        case BinKind::kPow:    return rt_(RtFn::kIPow, {a, b}, sp);
                        case BinKind::kBitAnd: return inst_(Opcode::kAnd, Type::kI64, {a, b}, sp);
                        case BinKind::kBitOr:  return inst_(Opcode::kOr, Type::kI64, {a, b}, sp);
                        case BinKind::kBitXor: return inst_(Opcode::kXor, Type::kI64, {a, b}, sp);
                        case BinKind::kShl:    return inst_(Opcode::kShl, Type::kI64, {a, b}, sp);
                        case BinKind::kShr:    return inst_(Opcode::kAShr, Type::kI64, {a, b}, sp);
                        case BinKind::kSpaceship:
                            return spaceship_(cmp_(Opcode::kICmp, Pred::kGt, a, b, sp),
                                              cmp_(Opcode::kICmp, Pred::kLt, a, b, sp), sp);
                        default:
                            return cmp_(Opcode::kICmp, pred_of_(k), a, b, sp);
                    }

                case Type::kF64:
                    switch (k) {
                        case BinKind::kAdd: return inst_(Opcode::kFAdd, Type::kF64, {a, b}, sp);
                        case BinKind::kSub: return inst_(Opcode::kFSub, Type::kF64, {a, b}, sp);
                        case BinKind::kMul: return inst_(Opcode::kFMul, Type::kF64, {a, b}, sp);
                        case BinKind::kDiv: return inst_(Opcode::kFDiv, Type::kF64, {a, b}, sp);
                        case BinKind::kPow: return rt_(RtFn::kFPow, {a, b}, sp);
                        case BinKind::kSpaceship:
                            return spaceship_(cmp_(Opcode::kFCmp, Pred::kGt, a, b, sp),
                                              cmp_(Opcode::kFCmp, Pred::kLt, a, b, sp), sp);
                        default:
                            if (cfg::is_compare(k)) return cmp_(Opcode::kFCmp, pred_of_(k), a, b, sp);
                            // % and bit ops work on the integer view
                            return binary_(k, cast_(a, Type::kI64, sp), cast_(b, Type::kI64, sp), sp);
                    }

                case Type::kI1:
                    if (k == BinKind::kEq || k == BinKind::kIdentical || k == BinKind::kNe ||
                        k == BinKind::kNotIdentical) {
                        return cmp_(Opcode::kICmp, pred_of_(k), a, b, sp);
                    }
                    return binary_(k, cast_(a, Type::kI64, sp), cast_(b, Type::kI64, sp), sp);

                case Type::kStr:
                    if (k == BinKind::kIdentical) return rt_(RtFn::kStrEq, {a, b}, sp);
                    if (k == BinKind::kNotIdentical) return not_(rt_(RtFn::kStrEq, {a, b}, sp), sp);
                    if (k == BinKind::kSpaceship) return rt_(RtFn::kStrCmp, {a, b}, sp);
                    if (cfg::is_compare(k)) {
                        const ValueId c = rt_(RtFn::kStrCmp, {a, b}, sp);
                        return cmp_(Opcode::kICmp, pred_of_(k), c, const_int_(0, sp), sp);
                    }
                    break;

                case Type::kArr:
                    if (k == BinKind::kIdentical) return rt_(RtFn::kArrIdentical, {a, b}, sp);
                    if (k == BinKind::kNotIdentical) return not_(rt_(RtFn::kArrIdentical, {a, b}, sp), sp);
                    break;

                case Type::kObj:
                    if (k == BinKind::kIdentical || k == BinKind::kNotIdentical) {
                        return cmp_(Opcode::kICmp, pred_of_(k), a, b, sp);
                    }
                    break;

                case Type::kBox:
                    switch (k) {
                        case BinKind::kAdd: return rt_(RtFn::kBoxAdd, {a, b}, sp);
                        case BinKind::kSub: return rt_(RtFn::kBoxSub, {a, b}, sp);
                        case BinKind::kMul: return rt_(RtFn::kBoxMul, {a, b}, sp);
                        case BinKind::kDiv: return rt_(RtFn::kBoxDiv, {a, b}, sp);
                        case BinKind::kPow: return rt_(RtFn::kBoxPow, {a, b}, sp);
                        case BinKind::kEq:  return rt_(RtFn::kBoxLooseEq, {a, b}, sp);
                        case BinKind::kNe:  return not_(rt_(RtFn::kBoxLooseEq, {a, b}, sp), sp);
                        case BinKind::kIdentical:    return rt_(RtFn::kBoxIdentical, {a, b}, sp);
                        case BinKind::kNotIdentical: return not_(rt_(RtFn::kBoxIdentical, {a, b}, sp), sp);
                        case BinKind::kSpaceship:    return rt_(RtFn::kBoxCmp, {a, b}, sp);
                        default:
                            if (is_ordering_(k)) {
                                const ValueId c = rt_(RtFn::kBoxCmp, {a, b}, sp);
                                return cmp_(Opcode::kICmp, pred_of_(k), c, const_int_(0, sp), sp);
                            }
                            return binary_(k, cast_(a, Type::kI64, sp), cast_(b, Type::kI64, sp), sp);
                    }

                default:
                    break;
            }
            // remaining handle combinations compare through boxes
            if (t != Type::kBox) return binary_(k, cast_(a, Type::kBox, sp), cast_(b, Type::kBox, sp), sp);
            internal_(sp, "unsupported binary operand " + std::string(type_name(t)));
            return const_null_(sp);
        }

        ValueId Lowerer::unary_(cfg::UnKind k, ValueId a, Span sp) {
            const Type t = vt_(a);
            switch (k) {
                case cfg::UnKind::kNot:
                    return not_(cast_(a, Type::kI1, sp), sp);
                case cfg::UnKind::kBitNot:
                    return inst_(Opcode::kXor, Type::kI64, {cast_(a, Type::kI64, sp), const_int_(-1, sp)}, sp);
                case cfg::UnKind::kNeg:
                    if (t == Type::kI64) return inst_(Opcode::kISub, Type::kI64, {const_int_(0, sp), a}, sp);
                    if (t == Type::kF64) return inst_(Opcode::kFNeg, Type::kF64, {a}, sp);
                    return rt_(rt::RtFn::kBoxNeg, {cast_(a, Type::kBox, sp)}, sp);
            }
            return a;
        }

        ValueId Lowerer::builtin_(const cfg::Op& op, std::vector<ValueId> args) {
            using resolve::BuiltinFn;
            using rt::RtFn;
            const Span sp = op.span;
            switch (op.builtin) {
                case BuiltinFn::kStrlen:     return rt_(RtFn::kStrLen, std::move(args), sp);
                case BuiltinFn::kImplode:    return rt_(RtFn::kImplode, std::move(args), sp);
                case BuiltinFn::kStrRepeat:  return rt_(RtFn::kStrRepeat, std::move(args), sp);
                case BuiltinFn::kStrtoupper: return rt_(RtFn::kStrUpper, std::move(args), sp);
                case BuiltinFn::kSqrt:       return rt_(RtFn::kSqrt, std::move(args), sp);
                case BuiltinFn::kSin:        return rt_(RtFn::kSin, std::move(args), sp);
                case BuiltinFn::kCos:        return rt_(RtFn::kCos, std::move(args), sp);
                case BuiltinFn::kFloor:      return rt_(RtFn::kFloor, std::move(args), sp);
                case BuiltinFn::kAbs:
                    if (!args.empty() && vt_(args[0]) == Type::kI64) return rt_(RtFn::kAbsInt, std::move(args), sp);
                    return rt_(RtFn::kAbsFloat, std::move(args), sp);
                case BuiltinFn::kCount:
                    return rt_(RtFn::kArrCount, std::move(args), sp);
                default:
                    internal_(sp, "builtin has no runtime entry");
                    return const_null_(sp);
            }
        }

        void Lowerer::op_(const cfg::Op& op, const ssa::Function& f) {
            using cfg::OpKind;
            using rt::RtFn;
            const Span sp = op.span;
            const Type dst_t = (op.dst == ssa::kInvalidValue) ? Type::kVoid : type_of(f.values[op.dst].repr);
            auto a = [&] { return val_(op.a, sp); };
            auto b = [&] { return val_(op.b, sp); };
            auto c = [&] { return val_(op.c, sp); };
            ValueId res = kInvalidValue;

            switch (op.kind) {
                case OpKind::kParam:
                    res = (op.imm < fn_->params.size()) ? fn_->params[op.imm] : const_null_(sp);
                    break;

                case OpKind::kConst:
                    switch (op.lit.kind) {
                        case cfg::Literal::Kind::kNull:  res = const_null_(sp); break;
                        case cfg::Literal::Kind::kBool:  res = const_bool_(op.lit.b, sp); break;
                        case cfg::Literal::Kind::kInt:   res = const_int_(op.lit.i, sp); break;
                        case cfg::Literal::Kind::kFloat: res = const_float_(op.lit.f, sp); break;
                        case cfg::Literal::Kind::kStr:   res = const_str_(op.lit.s, sp); break;
                    }
                    break;

                case OpKind::kCopy:
                case OpKind::kCast:
                    res = a();
                    break;

                case OpKind::kBinary:
                    res = binary_(op.bin, a(), b(), sp);
                    break;
                case OpKind::kUnary:
                    res = unary_(op.un, a(), sp);
                    break;

                case OpKind::kConcat:
                    res = rt_(RtFn::kStrConcat, {cast_(a(), Type::kStr, sp), cast_(b(), Type::kStr, sp)}, sp);
                    break;
                case OpKind::kEcho:
                    (void)rt_(RtFn::kEcho, {cast_(a(), Type::kStr, sp)}, sp);
                    break;

                // ---- arrays ----
                case OpKind::kArrayNew:
                    res = rt_(RtFn::kArrNew, {}, sp);
                    break;
                case OpKind::kArrayGet: {
                    const ValueId arr = a();
                    const ValueId key = b();
                    if (vt_(key) == Type::kI64) res = rt_(RtFn::kArrGetInt, {arr, key}, sp);
                    else res = rt_(RtFn::kArrGet, {arr, cast_(key, Type::kBox, sp)}, sp);
                    break;
                }
                case OpKind::kArraySet: {
                    const ValueId arr = a();
                    const ValueId key = b();
                    const ValueId v = cast_(c(), Type::kBox, sp);
                    if (vt_(key) == Type::kI64) res = rt_(RtFn::kArrSetInt, {arr, key, v}, sp);
                    else res = rt_(RtFn::kArrSet, {arr, cast_(key, Type::kBox, sp), v}, sp);
                    break;
                }
                case OpKind::kArrayPush:
                    res = rt_(RtFn::kArrPush, {a(), cast_(c(), Type::kBox, sp)}, sp);
                    break;
                case OpKind::kArrayCount:
                    res = rt_(RtFn::kArrCount, {a()}, sp);
                    break;
                case OpKind::kArrayKeyAt:
                    res = rt_(RtFn::kArrKeyAt, {a(), cast_(b(), Type::kI64, sp)}, sp);
                    break;
                case OpKind::kArrayValueAt:
                    res = rt_(RtFn::kArrValueAt, {a(), cast_(b(), Type::kI64, sp)}, sp);
                    break;
                case OpKind::kStrAt:
                    res = rt_(RtFn::kStrAt, {a(), cast_(b(), Type::kI64, sp)}, sp);
                    break;

                // ---- objects ----
                case OpKind::kNew: {
                    const ValueId obj = rt_(RtFn::kObjNew, {class_ref_(op.sym, sp)}, sp);
                    const sema::ClassLayout* lay = ru_.table.layout(op.sym);
                    if (lay != nullptr) {
                        for (uint32_t i = 0; i < lay->slots.size(); ++i) {
                            const Symbol& ps = sym_(lay->slots[i]);
                            const Type st = repr_type_(ps.type);
                            const ValueId v = slot_value_(slot_init_(ps.init, st), st, sp);
                            if (v == kInvalidValue) continue;
                            Inst store{};
                            store.op = Opcode::kStoreSlot;
                            store.args = {obj, v};
                            store.imm = i;
                            store.span = sp;
                            (void)emit_(std::move(store));
                        }
                    }
                    res = obj;
                    break;
                }
                case OpKind::kGetProp: {
                    Inst load{};
                    load.op = Opcode::kLoadSlot;
                    load.type = dst_t;
                    load.args = {a()};
                    load.imm = op.imm;
                    load.span = sp;
                    res = emit_(std::move(load));
                    break;
                }
                case OpKind::kSetProp: {
                    Inst store{};
                    store.op = Opcode::kStoreSlot;
                    store.args = {a(), b()};
                    store.imm = op.imm;
                    store.span = sp;
                    (void)emit_(std::move(store));
                    break;
                }
                case OpKind::kGetPropDyn:
                    res = rt_(RtFn::kPropGetDyn, {a(), const_str_(op.name, sp)}, sp);
                    break;
                case OpKind::kSetPropDyn:
                    (void)rt_(RtFn::kPropSetDyn, {a(), const_str_(op.name, sp), cast_(c(), Type::kBox, sp)}, sp);
                    break;

                // ---- calls ----
                case OpKind::kCall:
                case OpKind::kCallForeign: {
                    std::vector<ValueId> args;
                    for (ssa::ValueId x : op.args) args.push_back(val_(x, sp));
                    note_callee_(op.sym);
                    Inst call{};
                    call.op = (op.kind == OpKind::kCallForeign) ? Opcode::kCallForeign : Opcode::kCall;
                    call.s = function_symbol_(op.sym);
                    call.type = dst_t;
                    call.args = std::move(args);
                    call.span = sp;
                    res = emit_(std::move(call));
                    break;
                }
                case OpKind::kCallVirtual: {
                    std::vector<ValueId> args;
                    for (ssa::ValueId x : op.args) args.push_back(val_(x, sp));
                    Inst slot{};
                    slot.op = Opcode::kLoadVSlot;
                    slot.type = Type::kPtr;
                    slot.args = {args.empty() ? kInvalidValue : args[0]};
                    slot.imm = op.imm;
                    slot.span = sp;
                    const ValueId code = emit_(std::move(slot));

                    Inst call{};
                    call.op = Opcode::kCallIndirect;
                    call.type = dst_t;
                    call.args.push_back(code);
                    call.args.insert(call.args.end(), args.begin(), args.end());
                    call.s = sym_(op.sym).name;
                    call.span = sp;
                    res = emit_(std::move(call));
                    ++out_.stats.virtual_calls;
                    break;
                }
                case OpKind::kCallBuiltin: {
                    std::vector<ValueId> args;
                    for (ssa::ValueId x : op.args) args.push_back(val_(x, sp));
                    res = builtin_(op, std::move(args));
                    break;
                }
                case OpKind::kCallDyn: {
                    const ValueId recv = a();
                    ValueId pack = rt_(RtFn::kArrNew, {}, sp);
                    for (ssa::ValueId x : op.args) {
                        pack = rt_(RtFn::kArrPush, {pack, cast_(val_(x, sp), Type::kBox, sp)}, sp);
                    }
                    res = rt_(RtFn::kCallDyn, {recv, const_str_(op.name, sp), pack}, sp);
                    break;
                }

                case OpKind::kInstanceOf: {
                    const ValueId v = a();
                    const ValueId cls = class_ref_(op.sym, sp);
                    if (vt_(v) == Type::kObj) res = rt_(RtFn::kObjInstanceOf, {v, cls}, sp);
                    else res = rt_(RtFn::kBoxInstanceOf, {cast_(v, Type::kBox, sp), cls}, sp);
                    break;
                }
                case OpKind::kIsNull: {
                    const ValueId v = a();
                    if (vt_(v) != Type::kBox) res = const_bool_(false, sp);
                    else res = cmp_(Opcode::kICmp, Pred::kEq, v, const_null_(sp), sp);
                    break;
                }
                case OpKind::kLandingPad:
                    res = rt_(RtFn::kExcTake, {}, sp);
                    break;
            }

            if (op.dst == ssa::kInvalidValue) return;
            if (res == kInvalidValue) {
                internal_(sp, "op " + std::string(cfg::op_name(op.kind)) + " produced no value");
                res = const_null_(sp);
            }
            vmap_[op.dst] = cast_(res, dst_t, sp);
        }

        // ---- by-name adapters ----

        /// @brief php_dyn_<cls>__<m>(obj this, arr args) -> box.
        ///        인자 수는 런타임이 MethodDesc.required로 먼저 확인한다.
        void Lowerer::build_adapter_(SymbolId cls, SymbolId method) {
            const Symbol& ms = sym_(method);
            const Span sp = ms.decl_span;

            Function a{};
            a.name = rt::mangle_adapter(sym_(cls).name, ms.name);
            a.source_name = sym_(cls).name + "::" + ms.name;
            a.is_adapter = true;
            a.param_types = {Type::kObj, Type::kArr};
            a.params = {a.new_value(Type::kObj), a.new_value(Type::kArr)};
            a.ret = Type::kBox;
            a.span = sp;
            fn_ = &a;
            cur_ = new_block_();
            a.entry = cur_;

            const ValueId self = a.params[0];
            const ValueId pack = a.params[1];
            ValueId count = kInvalidValue;
            for (const auto& p : ms.params) {
                if (p.def.kind != sema::DefaultValue::Kind::kNone) {
                    count = rt_(rt::RtFn::kArrCount, {pack}, sp);
                    break;
                }
            }

            std::vector<ValueId> args{self};
            for (uint32_t i = 0; i < ms.params.size(); ++i) {
                const sema::ParamSig& p = ms.params[i];
                ValueId boxed = kInvalidValue;
                if (p.def.kind == sema::DefaultValue::Kind::kNone) {
                    boxed = rt_(rt::RtFn::kArrGetInt, {pack, const_int_(i, sp)}, sp);
                } else {
                    const ValueId given = cmp_(Opcode::kICmp, Pred::kGt, count, const_int_(i, sp), sp);
                    const BlockId has = new_block_();
                    const BlockId dflt = new_block_();
                    const BlockId join = new_block_();
                    terminate_(Term{TermKind::kCondBr, given, has, dflt, sp});

                    cur_ = has;
                    const ValueId from_args = rt_(rt::RtFn::kArrGetInt, {pack, const_int_(i, sp)}, sp);
                    terminate_(Term{TermKind::kBr, kInvalidValue, join, kInvalidBlock, sp});

                    cur_ = dflt;
                    const ValueId from_default = default_box_(p.def, sp);
                    terminate_(Term{TermKind::kBr, kInvalidValue, join, kInvalidBlock, sp});

                    cur_ = join;
                    Phi phi{};
                    phi.type = Type::kBox;
                    phi.dst = a.new_value(Type::kBox);
                    phi.incoming = {PhiIncoming{has, from_args}, PhiIncoming{dflt, from_default}};
                    boxed = phi.dst;
                    a.blocks[join].phis.push_back(std::move(phi));
                }

                const Type pt = repr_type_(p.type);
                args.push_back(cast_(boxed, pt, sp));
                if (pt == Type::kArr || pt == Type::kObj) guard_(sp);
            }

            Inst call{};
            call.op = Opcode::kCall;
            call.s = function_symbol_(method);
            call.type = sym_ret_(ms);
            call.args = std::move(args);
            call.span = sp;
            const ValueId ret = emit_(std::move(call));
            guard_(sp);

            const ValueId result = (ret == kInvalidValue) ? const_null_(sp) : cast_(ret, Type::kBox, sp);
            terminate_(Term{TermKind::kRet, result, kInvalidBlock, kInvalidBlock, sp});

            compute_preds_(a);
            fn_ = nullptr;
            out_.module.functions.push_back(std::move(a));
            ++out_.stats.adapters;
        }

    } // namespace

    LowerResult lower_unit(const ssa::Unit& unit, const resolve::ResolvedUnit& ru,
                           const ty::TypePool& types, const LowerOptions& opt) {
        LowerResult out{};
        out.ok = true;
        if (!unit.ok) {
            diag::Diagnostic d(diag::Severity::kFatal, diag::Code::kInternalFailure, Span{});
            d.add_arg("lower");
            d.add_arg("unit " + unit.name + " did not pass SSA construction");
            out.bag.add(std::move(d));
            out.ok = false;
            return out;
        }
        Lowerer l(ru, types, opt, out);
        l.run(unit);
        return out;
    }

} // namespace php2ir::lir
