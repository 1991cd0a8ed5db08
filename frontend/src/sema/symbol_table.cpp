// frontend/src/sema/symbol_table.cpp
#include <php2ir/sema/SymbolTable.hpp>

#include <cctype>


namespace php2ir::sema {

    std::string fold_name(std::string_view s) {
        std::string out;
        out.reserve(s.size());
        for (char c : s) out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        return out;
    }

    std::optional<SymbolId> SymbolTable::lookup_member(SymbolId cls, SymbolKind kind, std::string_view name) const {
        // class chain first (nearest declaration wins)
        SymbolId cur = cls;
        uint32_t guard = 0;
        while (cur != kInvalidSymbol && guard++ < 1024) {
            if (auto m = lookup_own_member(cur, kind, name)) return m;
            cur = symbols_[cur].parent;
        }

        // interface methods (declarations only)
        if (kind == SymbolKind::kMethod) {
            if (const ClassLayout* lay = layout(cls)) {
                for (SymbolId iface : lay->interfaces) {
                    if (auto m = lookup_own_member(iface, kind, name)) return m;
                }
            }
        }
        return std::nullopt;
    }

    bool SymbolTable::is_subclass_of(SymbolId cls, SymbolId ancestor) const {
        if (cls == kInvalidSymbol || ancestor == kInvalidSymbol) return false;
        if (cls == ancestor) return true;
        const ClassLayout* lay = layout(cls);
        if (lay == nullptr) return false;
        for (SymbolId a : lay->ancestors) {
            if (a == ancestor) return true;
        }
        for (SymbolId i : lay->interfaces) {
            if (i == ancestor) return true;
        }
        return false;
    }

} // namespace php2ir::sema
