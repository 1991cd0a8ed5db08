// frontend/src/resolve/builtins.cpp
#include <php2ir/resolve/Builtins.hpp>

#include <cctype>
#include <cstdint>
#include <limits>
#include <string>


namespace php2ir::resolve {

    namespace {

        constexpr BuiltinInfo k_builtins[] = {
            {"count",      BuiltinFn::kCount,      1, 1, false},
            {"strlen",     BuiltinFn::kStrlen,     1, 1, false},
            {"implode",    BuiltinFn::kImplode,    2, 2, false},
            {"abs",        BuiltinFn::kAbs,        1, 1, false},
            {"sqrt",       BuiltinFn::kSqrt,       1, 1, false},
            {"sin",        BuiltinFn::kSin,        1, 1, false},
            {"cos",        BuiltinFn::kCos,        1, 1, false},
            {"floor",      BuiltinFn::kFloor,      1, 1, false},
            {"intdiv",     BuiltinFn::kIntdiv,     2, 2, false},
            {"str_repeat", BuiltinFn::kStrRepeat,  2, 2, false},
            {"strtoupper", BuiltinFn::kStrtoupper, 1, 1, false},
            {"is_null",    BuiltinFn::kIsNull,     1, 1, false},
        };

        bool ieq_(std::string_view a, std::string_view b) {
            if (a.size() != b.size()) return false;
            for (size_t i = 0; i < a.size(); ++i) {
                if (std::tolower(static_cast<unsigned char>(a[i])) !=
                    std::tolower(static_cast<unsigned char>(b[i]))) {
                    return false;
                }
            }
            return true;
        }

        // ---- C prototype tokenizer ----

        struct CursorC {
            std::string_view s;
            size_t i = 0;

            void ws() { while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i; }

            std::string_view word() {
                ws();
                const size_t b = i;
                while (i < s.size() && (std::isalnum(static_cast<unsigned char>(s[i])) || s[i] == '_')) ++i;
                return s.substr(b, i - b);
            }

            bool eat(char c) {
                ws();
                if (i < s.size() && s[i] == c) { ++i; return true; }
                return false;
            }

            bool at_end() { ws(); return i >= s.size(); }
        };

        // consumes a full C type spelling ("long long", "int64_t", "double") and returns its kind
        bool read_ctype_(CursorC& c, CType& out, std::string& err) {
            std::string_view w = c.word();
            if (w.empty()) { err = "expected a C type"; return false; }
            if (w == "const") w = c.word();

            if (w == "double") { out = CType::kDouble; return true; }
            if (w == "void") { out = CType::kVoid; return true; }
            if (w == "bool" || w == "_Bool") { out = CType::kBool; return true; }
            if (w == "int64_t") { out = CType::kInt64; return true; }
            if (w == "int" || w == "int32_t") { out = CType::kInt32; return true; }
            if (w == "long") {
                // "long", "long long", "long int"
                const size_t save = c.i;
                const std::string_view next = c.word();
                if (next != "long" && next != "int") c.i = save;
                out = CType::kInt64;
                return true;
            }
            err = "unsupported C type '" + std::string(w) + "'";
            return false;
        }

    } // namespace

    const BuiltinInfo* find_builtin(std::string_view name) {
        for (const auto& b : k_builtins) {
            if (ieq_(b.name, name)) return &b;
        }
        return nullptr;
    }

    const BuiltinInfo& builtin_info(BuiltinFn id) {
        for (const auto& b : k_builtins) {
            if (b.id == id) return b;
        }
        static const BuiltinInfo none{};
        return none;
    }

    bool find_constant(std::string_view name, sema::DefaultValue& out) {
        using K = sema::DefaultValue::Kind;
        out = sema::DefaultValue{};
        if (name == "PHP_EOL")           { out.kind = K::kString; out.s = "\n"; return true; }
        if (name == "PHP_INT_MAX")       { out.kind = K::kInt; out.i = std::numeric_limits<int64_t>::max(); return true; }
        if (name == "PHP_INT_MIN")       { out.kind = K::kInt; out.i = std::numeric_limits<int64_t>::min(); return true; }
        if (name == "PHP_INT_SIZE")      { out.kind = K::kInt; out.i = 8; return true; }
        if (name == "PHP_FLOAT_EPSILON") { out.kind = K::kFloat; out.f = std::numeric_limits<double>::epsilon(); return true; }
        if (name == "M_PI")              { out.kind = K::kFloat; out.f = 3.14159265358979323846; return true; }
        if (name == "M_E")               { out.kind = K::kFloat; out.f = 2.7182818284590452354; return true; }
        if (ieq_(name, "true"))          { out.kind = K::kBool; out.b = true; return true; }
        if (ieq_(name, "false"))         { out.kind = K::kBool; out.b = false; return true; }
        if (ieq_(name, "null"))          { out.kind = K::kNull; return true; }
        return false;
    }

    CPrototype parse_c_prototype(std::string_view text) {
        CPrototype p{};
        CursorC c{text};

        if (!read_ctype_(c, p.ret, p.error)) return p;
        const std::string_view name = c.word();
        if (name.empty()) {
            p.error = "expected a function name";
            return p;
        }
        p.name = std::string(name);
        if (!c.eat('(')) {
            p.error = "expected '('";
            return p;
        }

        if (!c.eat(')')) {
            for (;;) {
                CType t{};
                if (!read_ctype_(c, t, p.error)) return p;
                // optional parameter name
                const size_t save = c.i;
                const std::string_view pname = c.word();
                if (pname.empty()) c.i = save;

                if (t == CType::kVoid) {
                    if (!p.params.empty() || !c.eat(')')) {
                        p.error = "'void' must be the only parameter";
                        return p;
                    }
                    break;
                }
                p.params.push_back(t);
                if (c.eat(')')) break;
                if (!c.eat(',')) {
                    p.error = "expected ',' or ')'";
                    return p;
                }
            }
        }
        c.eat(';');
        if (!c.at_end()) {
            p.error = "trailing text after prototype";
            return p;
        }
        p.ok = true;
        return p;
    }

    std::string_view ctype_name(CType t) {
        switch (t) {
            case CType::kVoid:   return "void";
            case CType::kDouble: return "double";
            case CType::kInt64:  return "long";
            case CType::kInt32:  return "int";
            case CType::kBool:   return "bool";
        }
        return "?";
    }

} // namespace php2ir::resolve
