// frontend/src/ty/type_pool.cpp
#include <php2ir/ty/TypePool.hpp>

#include <cctype>


namespace php2ir::ty {

    namespace {

        bool same_type_(const Type& a, const Type& b) {
            return a.kind == b.kind &&
                   a.builtin == b.builtin &&
                   a.elem == b.elem &&
                   a.shape == b.shape &&
                   a.exact == b.exact &&
                   a.class_name == b.class_name;
        }

        std::string_view builtin_name_(Builtin b) {
            switch (b) {
                case Builtin::kNull:   return "null";
                case Builtin::kVoid:   return "void";
                case Builtin::kNever:  return "never";
                case Builtin::kBool:   return "bool";
                case Builtin::kInt:    return "int";
                case Builtin::kFloat:  return "float";
                case Builtin::kString: return "string";
                case Builtin::kMixed:  return "mixed";
            }
            return "mixed";
        }

        void skip_ws_(std::string_view& s) {
            while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
        }

    } // namespace

    TypePool::TypePool() {
        Type err{};
        err.kind = Kind::kError;
        types_.push_back(err);
        error_ = 0;

        for (uint32_t i = 0; i < 8; ++i) {
            Type t{};
            t.kind = Kind::kBuiltin;
            t.builtin = static_cast<Builtin>(i);
            builtin_ids_[i] = intern_(t);
        }
    }

    TypeId TypePool::intern_(const Type& t) {
        for (uint32_t i = 0; i < types_.size(); ++i) {
            if (same_type_(types_[i], t)) return i;
        }
        types_.push_back(t);
        return static_cast<TypeId>(types_.size() - 1);
    }

    TypeId TypePool::nullable(TypeId elem) {
        if (elem == kInvalidType || is_error(elem)) return error_;
        const Type& e = types_[elem];
        if (e.kind == Kind::kNullable) return elem;
        if (e.kind == Kind::kBuiltin &&
            (e.builtin == Builtin::kNull || e.builtin == Builtin::kMixed)) {
            return elem;
        }
        Type t{};
        t.kind = Kind::kNullable;
        t.elem = inexact(elem);
        return intern_(t);
    }

    TypeId TypePool::array(TypeId elem, ArrayShape shape) {
        Type t{};
        t.kind = Kind::kArray;
        t.elem = (elem == kInvalidType) ? mixed() : elem;
        t.shape = shape;
        return intern_(t);
    }

    TypeId TypePool::object(std::string_view class_name, bool exact) {
        Type t{};
        t.kind = Kind::kObject;
        t.class_name = std::string(class_name);
        t.exact = exact;
        return intern_(t);
    }

    bool TypePool::is_error(TypeId id) const {
        return id == kInvalidType || id >= types_.size() || types_[id].kind == Kind::kError;
    }

    bool TypePool::is_builtin(TypeId id, Builtin b) const {
        if (is_error(id)) return false;
        return types_[id].kind == Kind::kBuiltin && types_[id].builtin == b;
    }

    bool TypePool::is_scalar(TypeId id) const {
        return is_builtin(id, Builtin::kBool) || is_numeric(id);
    }

    bool TypePool::is_numeric(TypeId id) const {
        return is_builtin(id, Builtin::kInt) || is_builtin(id, Builtin::kFloat);
    }

    bool TypePool::is_array(TypeId id) const {
        return !is_error(id) && types_[id].kind == Kind::kArray;
    }

    bool TypePool::is_object(TypeId id) const {
        if (is_error(id)) return false;
        const Type& t = types_[id];
        if (t.kind == Kind::kObject) return true;
        return t.kind == Kind::kNullable && types_[t.elem].kind == Kind::kObject;
    }

    bool TypePool::is_nullable(TypeId id) const {
        return !is_error(id) && types_[id].kind == Kind::kNullable;
    }

    bool TypePool::can_be_null(TypeId id) const {
        return is_nullable(id) || is_builtin(id, Builtin::kNull) || is_mixed(id);
    }

    TypeId TypePool::non_null(TypeId id) const {
        if (is_nullable(id)) return types_[id].elem;
        return id;
    }

    TypeId TypePool::inexact(TypeId id) {
        if (is_error(id)) return id;
        const Type& t = types_[id];
        if (t.kind != Kind::kObject || !t.exact) return id;
        return object(t.class_name, false);
    }

    TypeId TypePool::elem_of(TypeId id) const {
        if (is_array(id)) return types_[id].elem;
        return mixed();
    }

    std::string_view TypePool::class_of(TypeId id) const {
        if (is_error(id)) return {};
        const Type* t = &types_[id];
        if (t->kind == Kind::kNullable) t = &types_[t->elem];
        if (t->kind != Kind::kObject) return {};
        return t->class_name;
    }

    TypeId TypePool::join(TypeId a, TypeId b) {
        if (a == kInvalidType) return b;
        if (b == kInvalidType) return a;
        if (a == b) return a;
        if (is_error(a)) return b;
        if (is_error(b)) return a;
        if (is_builtin(a, Builtin::kNever)) return b;
        if (is_builtin(b, Builtin::kNever)) return a;

        // exact/inexact of the same class
        const Type& ta = types_[a];
        const Type& tb = types_[b];
        if (ta.kind == Kind::kObject && tb.kind == Kind::kObject && ta.class_name == tb.class_name) {
            return inexact(a);
        }

        // null joins into ?T
        if (is_builtin(a, Builtin::kNull) && !is_mixed(b) && !is_builtin(b, Builtin::kVoid)) return nullable(b);
        if (is_builtin(b, Builtin::kNull) && !is_mixed(a) && !is_builtin(a, Builtin::kVoid)) return nullable(a);
        if (is_nullable(a) && non_null(a) == inexact(b)) return a;
        if (is_nullable(b) && non_null(b) == inexact(a)) return b;

        // arrays of any shape merge into array<join(elem)>
        if (ta.kind == Kind::kArray && tb.kind == Kind::kArray) {
            const TypeId ea = ta.elem;
            const TypeId eb = tb.elem;
            const ArrayShape sa = ta.shape;
            const ArrayShape sb = tb.shape;
            const TypeId e = join(ea, eb);
            return array(e, (sa == sb) ? sa : ArrayShape::kAny);
        }
        return mixed();
    }

    std::string TypePool::to_string(TypeId id) const {
        if (is_error(id)) return "<error>";
        const Type& t = types_[id];
        switch (t.kind) {
            case Kind::kError:
                return "<error>";
            case Kind::kBuiltin:
                return std::string(builtin_name_(t.builtin));
            case Kind::kNullable:
                return "?" + to_string(t.elem);
            case Kind::kArray: {
                const char* head = (t.shape == ArrayShape::kList) ? "list<" :
                                   (t.shape == ArrayShape::kMap)  ? "map<"  : "array<";
                return head + to_string(t.elem) + ">";
            }
            case Kind::kObject:
                return t.exact ? (t.class_name + "!") : t.class_name;
        }
        return "<error>";
    }

    TypeId TypePool::parse_rec_(std::string_view& s) {
        skip_ws_(s);
        if (s.empty()) return error_;

        if (s.front() == '?') {
            s.remove_prefix(1);
            const TypeId inner = parse_rec_(s);
            return is_error(inner) ? error_ : nullable(inner);
        }

        size_t n = 0;
        while (n < s.size()) {
            const char c = s[n];
            if (std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '\\') { ++n; continue; }
            break;
        }
        if (n == 0) return error_;
        const std::string_view word = s.substr(0, n);
        s.remove_prefix(n);

        if (!s.empty() && s.front() == '<') {
            ArrayShape shape = ArrayShape::kAny;
            if (word == "list") shape = ArrayShape::kList;
            else if (word == "map") shape = ArrayShape::kMap;
            else if (word != "array") return error_;

            s.remove_prefix(1);
            const TypeId elem = parse_rec_(s);
            skip_ws_(s);
            if (s.empty() || s.front() != '>' || is_error(elem)) return error_;
            s.remove_prefix(1);
            return array(elem, shape);
        }

        for (uint32_t i = 0; i < 8; ++i) {
            if (word == builtin_name_(static_cast<Builtin>(i))) return builtin_ids_[i];
        }
        if (word == "array") return array(mixed(), ArrayShape::kAny);
        if (word == "bool" || word == "boolean") return bool_();
        if (word == "double") return float_();

        bool exact = false;
        if (!s.empty() && s.front() == '!') {
            exact = true;
            s.remove_prefix(1);
        }
        return object(word, exact);
    }

    TypeId TypePool::parse(std::string_view text) {
        std::string_view s = text;
        const TypeId t = parse_rec_(s);
        skip_ws_(s);
        if (!s.empty()) return error_;
        return t;
    }

} // namespace php2ir::ty
