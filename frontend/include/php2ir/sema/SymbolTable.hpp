// frontend/include/php2ir/sema/SymbolTable.hpp
#pragma once
#include <php2ir/ast/Nodes.hpp>
#include <php2ir/text/Span.hpp>
#include <php2ir/ty/TypePool.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>


namespace php2ir::sema {

    using SymbolId = uint32_t;
    inline constexpr SymbolId kInvalidSymbol = 0xFFFF'FFFFu;
    inline constexpr uint32_t kNoSlot = 0xFFFF'FFFFu;

    using ast::Visibility;

    enum class SymbolKind : uint8_t {
        kFunction,
        kForeign,     // #[ffi] 선언
        kClass,
        kInterface,
        kMethod,
        kProperty,
    };

    /// @brief 매개변수 기본값. 상수 식만 허용되며 호출 지점에서 채워진다.
    struct DefaultValue {
        enum class Kind : uint8_t { kNone, kNull, kInt, kFloat, kBool, kString, kEmptyArray };
        Kind kind = Kind::kNone;
        int64_t i = 0;
        double f = 0.0;
        bool b = false;
        std::string s{};
    };

    struct ParamSig {
        std::string name{};
        ty::TypeId type = ty::kInvalidType;   // mixed when the parameter has no hint
        bool has_hint = false;
        DefaultValue def{};
    };

    // 심볼 1개 엔트리
    struct Symbol {
        SymbolKind kind = SymbolKind::kFunction;
        std::string name{};

        // function/method: return type, property: slot type, class: object type
        ty::TypeId type = ty::kInvalidType;
        bool has_hint = false;

        Visibility vis = Visibility::kPublic;
        bool is_static = false;
        bool is_final = false;
        bool is_abstract = false;

        SymbolId owner = kInvalidSymbol;            // owning class (members)
        SymbolId override_target = kInvalidSymbol;  // overridden parent method
        SymbolId parent = kInvalidSymbol;           // class: direct parent
        std::vector<SymbolId> interfaces{};         // class: declared interfaces

        std::vector<ParamSig> params{};
        DefaultValue init{};                        // property initializer
        uint32_t vtable_slot = kNoSlot;             // method
        uint32_t prop_slot = kNoSlot;               // property

        // foreign functions
        std::string foreign_lib{};
        std::string foreign_symbol{};
        std::string foreign_proto{};                // C prototype text

        Span decl_span{};
        std::string origin_unit{};
        bool imported = false;
        uint32_t decl = ast::k_invalid_decl;        // FnId / ClassId for local declarations
    };

    /// @brief 클래스 한 개의 확정된 레이아웃. 해석 단계에서 한 번 만들고 이후 바꾸지 않는다.
    struct ClassLayout {
        SymbolId cls = kInvalidSymbol;
        SymbolId parent = kInvalidSymbol;
        std::vector<SymbolId> ancestors{};   // nearest first, excluding cls
        std::vector<SymbolId> interfaces{};  // transitive, sorted by id
        std::vector<SymbolId> slots{};       // property symbols in slot order
        std::vector<SymbolId> vtable{};      // implementing method per slot
        SymbolId ctor = kInvalidSymbol;      // nearest __construct
        bool finalized = false;
    };

    // case-insensitive keys, PHP rules for functions and classes
    std::string fold_name(std::string_view s);

    class SymbolTable {
    public:
        struct InsertResult {
            bool ok = false;
            bool is_duplicate = false;
            SymbolId symbol_id = kInvalidSymbol;
        };

        InsertResult insert_global(const Symbol& sym) {
            InsertResult r{};
            const std::string key = fold_name(sym.name);
            auto it = globals_.find(key);
            if (it != globals_.end()) {
                r.is_duplicate = true;
                r.symbol_id = it->second;
                return r;
            }
            symbols_.push_back(sym);
            r.symbol_id = static_cast<SymbolId>(symbols_.size() - 1);
            globals_.emplace(key, r.symbol_id);
            if (sym.kind == SymbolKind::kClass || sym.kind == SymbolKind::kInterface) {
                layouts_.emplace(r.symbol_id, ClassLayout{});
                layouts_[r.symbol_id].cls = r.symbol_id;
            }
            r.ok = true;
            return r;
        }

        // methods fold case, properties do not
        InsertResult insert_member(SymbolId cls, const Symbol& sym) {
            InsertResult r{};
            const std::string key = member_key_(sym.kind, sym.name);
            auto& members = members_[cls];
            auto it = members.find(key);
            if (it != members.end()) {
                r.is_duplicate = true;
                r.symbol_id = it->second;
                return r;
            }
            Symbol s = sym;
            s.owner = cls;
            symbols_.push_back(std::move(s));
            r.symbol_id = static_cast<SymbolId>(symbols_.size() - 1);
            members.emplace(key, r.symbol_id);
            member_order_[cls].push_back(r.symbol_id);
            r.ok = true;
            return r;
        }

        std::optional<SymbolId> lookup_global(std::string_view name) const {
            auto it = globals_.find(fold_name(name));
            if (it == globals_.end()) return std::nullopt;
            return it->second;
        }

        std::optional<SymbolId> lookup_class(std::string_view name) const {
            auto id = lookup_global(name);
            if (!id) return std::nullopt;
            const auto k = symbols_[*id].kind;
            if (k != SymbolKind::kClass && k != SymbolKind::kInterface) return std::nullopt;
            return id;
        }

        std::optional<SymbolId> lookup_function(std::string_view name) const {
            auto id = lookup_global(name);
            if (!id) return std::nullopt;
            const auto k = symbols_[*id].kind;
            if (k != SymbolKind::kFunction && k != SymbolKind::kForeign) return std::nullopt;
            return id;
        }

        /// @brief cls에 직접 선언된 멤버만 찾는다.
        std::optional<SymbolId> lookup_own_member(SymbolId cls, SymbolKind kind, std::string_view name) const {
            auto mit = members_.find(cls);
            if (mit == members_.end()) return std::nullopt;
            auto it = mit->second.find(member_key_(kind, name));
            if (it == mit->second.end()) return std::nullopt;
            return it->second;
        }

        /// @brief cls부터 부모 방향으로 올라가며 멤버를 찾는다. 인터페이스도 본다.
        std::optional<SymbolId> lookup_member(SymbolId cls, SymbolKind kind, std::string_view name) const;

        bool is_subclass_of(SymbolId cls, SymbolId ancestor) const;   // reflexive, interfaces included

        const Symbol& symbol(SymbolId id) const { return symbols_[id]; }
        Symbol& symbol_mut(SymbolId id) { return symbols_[id]; }
        const std::vector<Symbol>& symbols() const { return symbols_; }

        const ClassLayout* layout(SymbolId cls) const {
            auto it = layouts_.find(cls);
            return (it == layouts_.end()) ? nullptr : &it->second;
        }
        ClassLayout* layout_mut(SymbolId cls) {
            auto it = layouts_.find(cls);
            return (it == layouts_.end()) ? nullptr : &it->second;
        }

        const std::vector<SymbolId>& members_in_order(SymbolId cls) const {
            static const std::vector<SymbolId> empty{};
            auto it = member_order_.find(cls);
            return (it == member_order_.end()) ? empty : it->second;
        }

    private:
        static std::string member_key_(SymbolKind kind, std::string_view name) {
            if (kind == SymbolKind::kProperty) return "$" + std::string(name);
            return fold_name(name);
        }

        std::vector<Symbol> symbols_;
        std::unordered_map<std::string, SymbolId> globals_;
        std::unordered_map<SymbolId, std::unordered_map<std::string, SymbolId>> members_;
        std::unordered_map<SymbolId, std::vector<SymbolId>> member_order_;
        std::unordered_map<SymbolId, ClassLayout> layouts_;
    };

} // namespace php2ir::sema
