// frontend/src/sema/export_table.cpp
#include <php2ir/sema/ExportTable.hpp>

#include <sstream>
#include <unordered_map>


namespace php2ir::sema {

    namespace {

        const char* kind_name_(SymbolKind k) {
            switch (k) {
                case SymbolKind::kFunction:  return "function";
                case SymbolKind::kForeign:   return "foreign";
                case SymbolKind::kClass:     return "class";
                case SymbolKind::kInterface: return "interface";
                case SymbolKind::kMethod:    return "method";
                case SymbolKind::kProperty:  return "property";
            }
            return "?";
        }

        const char* vis_name_(Visibility v) {
            switch (v) {
                case Visibility::kPublic:    return "public";
                case Visibility::kProtected: return "protected";
                case Visibility::kPrivate:   return "private";
            }
            return "?";
        }

        void dump_default_(const DefaultValue& d, std::ostream& os) {
            switch (d.kind) {
                case DefaultValue::Kind::kNone: return;
                case DefaultValue::Kind::kNull: os << " = null"; return;
                case DefaultValue::Kind::kInt: os << " = " << d.i; return;
                case DefaultValue::Kind::kFloat: os << " = " << d.f; return;
                case DefaultValue::Kind::kBool: os << " = " << (d.b ? "true" : "false"); return;
                case DefaultValue::Kind::kString: os << " = \"" << d.s << "\""; return;
                case DefaultValue::Kind::kEmptyArray: os << " = []"; return;
            }
        }

        std::string name_of_(const SymbolTable& t, SymbolId id) {
            if (id == kInvalidSymbol) return "-";
            const Symbol& s = t.symbol(id);
            if (s.owner != kInvalidSymbol) return t.symbol(s.owner).name + "::" + s.name;
            return s.name;
        }

        void dump_symbol_(const ExportTable& t, SymbolId id, std::ostream& os) {
            const Symbol& s = t.table.symbol(id);
            os << "  " << kind_name_(s.kind) << " " << name_of_(t.table, id);
            if (s.kind == SymbolKind::kMethod || s.kind == SymbolKind::kProperty) {
                os << " " << vis_name_(s.vis);
                if (s.is_static) os << " static";
            }
            if (s.is_final) os << " final";
            if (s.is_abstract) os << " abstract";

            if (s.kind == SymbolKind::kFunction || s.kind == SymbolKind::kForeign || s.kind == SymbolKind::kMethod) {
                os << " (";
                for (size_t i = 0; i < s.params.size(); ++i) {
                    if (i) os << ", ";
                    os << t.types.to_string(s.params[i].type) << " $" << s.params[i].name;
                    dump_default_(s.params[i].def, os);
                }
                os << ") : " << t.types.to_string(s.type);
            } else if (s.kind == SymbolKind::kProperty) {
                os << " : " << t.types.to_string(s.type);
                dump_default_(s.init, os);
                os << " slot=" << s.prop_slot;
            }
            if (s.kind == SymbolKind::kMethod) {
                if (s.vtable_slot != kNoSlot) os << " vslot=" << s.vtable_slot;
                if (s.override_target != kInvalidSymbol) os << " overrides " << name_of_(t.table, s.override_target);
            }
            if (s.kind == SymbolKind::kForeign) {
                os << " from \"" << s.foreign_lib << "\" as " << s.foreign_symbol;
            }
            os << " @" << s.origin_unit << "\n";

            if (s.kind != SymbolKind::kClass && s.kind != SymbolKind::kInterface) return;

            if (s.parent != kInvalidSymbol) os << "    extends " << t.table.symbol(s.parent).name << "\n";
            for (SymbolId i : s.interfaces) os << "    implements " << t.table.symbol(i).name << "\n";
            for (SymbolId m : t.table.members_in_order(id)) {
                os << "  ";
                dump_symbol_(t, m, os);
            }
            if (const ClassLayout* lay = t.table.layout(id)) {
                os << "    layout slots=[";
                for (size_t i = 0; i < lay->slots.size(); ++i) {
                    if (i) os << ", ";
                    os << name_of_(t.table, lay->slots[i]);
                }
                os << "] vtable=[";
                for (size_t i = 0; i < lay->vtable.size(); ++i) {
                    if (i) os << ", ";
                    os << name_of_(t.table, lay->vtable[i]);
                }
                os << "] ctor=" << name_of_(t.table, lay->ctor) << "\n";
            }
        }

    } // namespace

    void dump_export_table(const ExportTable& t, std::ostream& os) {
        os << "unit " << t.unit_name << "\n";
        for (SymbolId id : t.exported) dump_symbol_(t, id, os);
    }

    std::string dump_export_table(const ExportTable& t) {
        std::ostringstream oss;
        dump_export_table(t, oss);
        return oss.str();
    }

    bool import_symbols(const ExportTable& dep, SymbolTable& local, ty::TypePool& local_types,
                        std::vector<std::string>* conflicts) {
        bool clean = true;
        std::unordered_map<SymbolId, SymbolId> remap;
        std::vector<SymbolId> fresh;   // dependency ids inserted by this call

        auto map_type = [&](ty::TypeId t) -> ty::TypeId {
            if (t == ty::kInvalidType) return t;
            return local_types.parse(dep.types.to_string(t));
        };
        auto map_id = [&](SymbolId id) -> SymbolId {
            if (id == kInvalidSymbol) return id;
            auto it = remap.find(id);
            return (it == remap.end()) ? kInvalidSymbol : it->second;
        };

        // pass 1: globals and members, in dependency id order
        const auto& syms = dep.table.symbols();
        for (SymbolId id = 0; id < syms.size(); ++id) {
            const Symbol& s = syms[id];
            if (s.owner != kInvalidSymbol) continue;

            if (auto existing = local.lookup_global(s.name)) {
                const Symbol& ex = local.symbol(*existing);
                if (ex.origin_unit != s.origin_unit) {
                    clean = false;
                    if (conflicts != nullptr) conflicts->push_back(s.name);
                }
                remap[id] = *existing;
                for (SymbolId m : dep.table.members_in_order(id)) {
                    const Symbol& ms = dep.table.symbol(m);
                    if (auto lm = local.lookup_own_member(*existing, ms.kind, ms.name)) remap[m] = *lm;
                }
                continue;
            }

            Symbol copy = s;
            copy.imported = true;
            copy.decl = ast::k_invalid_decl;
            copy.type = map_type(s.type);
            for (auto& p : copy.params) p.type = map_type(p.type);
            const auto ins = local.insert_global(copy);
            remap[id] = ins.symbol_id;
            fresh.push_back(id);

            for (SymbolId m : dep.table.members_in_order(id)) {
                Symbol mc = dep.table.symbol(m);
                mc.imported = true;
                mc.decl = ast::k_invalid_decl;
                mc.type = map_type(mc.type);
                for (auto& p : mc.params) p.type = map_type(p.type);
                const auto mins = local.insert_member(ins.symbol_id, mc);
                remap[m] = mins.symbol_id;
                fresh.push_back(m);
            }
        }

        // pass 2: cross references and layouts
        for (SymbolId dep_id : fresh) {
            const SymbolId local_id = remap[dep_id];
            const Symbol& s = dep.table.symbol(dep_id);
            Symbol& ls = local.symbol_mut(local_id);
            ls.owner = map_id(s.owner);
            ls.override_target = map_id(s.override_target);
            ls.parent = map_id(s.parent);
            ls.interfaces.clear();
            for (SymbolId i : s.interfaces) ls.interfaces.push_back(map_id(i));

            const ClassLayout* dl = dep.table.layout(dep_id);
            ClassLayout* ll = local.layout_mut(local_id);
            if (dl == nullptr || ll == nullptr) continue;
            ll->cls = local_id;
            ll->parent = map_id(dl->parent);
            ll->ancestors.clear();
            for (SymbolId a : dl->ancestors) ll->ancestors.push_back(map_id(a));
            ll->interfaces.clear();
            for (SymbolId i : dl->interfaces) ll->interfaces.push_back(map_id(i));
            ll->slots.clear();
            for (SymbolId p : dl->slots) ll->slots.push_back(map_id(p));
            ll->vtable.clear();
            for (SymbolId m : dl->vtable) ll->vtable.push_back(map_id(m));
            ll->ctor = map_id(dl->ctor);
            ll->finalized = dl->finalized;
        }
        return clean;
    }

} // namespace php2ir::sema
