// frontend/src/lir/interp.cpp
#include <php2ir/lir/Interp.hpp>
#include <php2ir/sema/SymbolTable.hpp>

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <deque>
#include <limits>
#include <map>
#include <unordered_map>


namespace php2ir::lir {

    namespace {

        using Handle = uint64_t;

        // ---- heap model ----

        struct Key {
            bool is_int = true;
            int64_t i = 0;
            std::string s{};

            bool operator<(const Key& o) const {
                if (is_int != o.is_int) return is_int;
                return is_int ? (i < o.i) : (s < o.s);
            }
            bool operator==(const Key& o) const {
                return is_int == o.is_int && (is_int ? i == o.i : s == o.s);
            }
        };

        enum class CellKind : uint8_t { kFree, kStr, kArr, kObj, kBox };
        enum class Tag : uint8_t { kNull, kBool, kInt, kFloat, kStr, kArr, kObj };

        /// @brief 힙 셀 하나. kind에 따라 일부 필드만 쓴다.
        struct Cell {
            CellKind kind = CellKind::kFree;
            int64_t rc = 0;

            std::string str{};

            // array: insertion ordered, values are box handles
            std::vector<std::pair<Key, Handle>> items{};
            std::map<Key, size_t> index{};
            int64_t next_index = 0;

            // object
            int32_t cls = -1;
            std::vector<uint64_t> slots{};

            // box
            Tag tag = Tag::kNull;
            int64_t i = 0;
            double f = 0.0;
            Handle h = 0;
        };

        /// @brief box를 풀어 본 값. 핸들은 빌린 것이다.
        struct Dyn {
            Tag tag = Tag::kNull;
            int64_t i = 0;
            double f = 0.0;
            Handle h = 0;
        };

        struct ClassInfo {
            const ClassDesc* desc = nullptr;
            int32_t parent = -1;
        };

        double as_f64_(uint64_t bits) {
            double d = 0.0;
            std::memcpy(&d, &bits, sizeof(d));
            return d;
        }

        uint64_t from_f64_(double d) {
            uint64_t bits = 0;
            std::memcpy(&bits, &d, sizeof(d));
            return bits;
        }

        int sign_(int64_t a, int64_t b) { return (a < b) ? -1 : (a > b ? 1 : 0); }
        int sign_(double a, double b) { return (a < b) ? -1 : (a > b ? 1 : 0); }

        int64_t f64_to_i64_(double x) {
            if (!std::isfinite(x)) return 0;
            if (x >= 9.2233720368547758e18 || x < -9.2233720368547758e18) return 0;
            return static_cast<int64_t>(x);
        }

        bool is_space_(char c) {
            return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
        }

        /// @brief PHP numeric string. whole=false면 앞부분 숫자만 읽는다("12abc" -> 12).
        bool parse_numeric_(std::string_view s, bool whole, bool& is_int, int64_t& iv, double& fv) {
            size_t p = 0;
            while (p < s.size() && is_space_(s[p])) ++p;
            const size_t start = p;
            if (p < s.size() && (s[p] == '+' || s[p] == '-')) ++p;

            size_t digits = 0;
            while (p < s.size() && std::isdigit(static_cast<unsigned char>(s[p]))) {
                ++p;
                ++digits;
            }
            bool frac = false;
            if (p < s.size() && s[p] == '.') {
                size_t q = p + 1;
                size_t fd = 0;
                while (q < s.size() && std::isdigit(static_cast<unsigned char>(s[q]))) {
                    ++q;
                    ++fd;
                }
                if (digits + fd > 0) {
                    frac = true;
                    digits += fd;
                    p = q;
                }
            }
            if (digits == 0) return false;
            if (p < s.size() && (s[p] == 'e' || s[p] == 'E')) {
                size_t q = p + 1;
                if (q < s.size() && (s[q] == '+' || s[q] == '-')) ++q;
                size_t ed = 0;
                while (q < s.size() && std::isdigit(static_cast<unsigned char>(s[q]))) {
                    ++q;
                    ++ed;
                }
                if (ed > 0) {
                    frac = true;
                    p = q;
                }
            }
            const size_t end = p;
            if (whole) {
                while (p < s.size() && is_space_(s[p])) ++p;
                if (p != s.size()) return false;
            }

            const std::string num(s.substr(start, end - start));
            if (!frac) {
                errno = 0;
                const long long v = std::strtoll(num.c_str(), nullptr, 10);
                if (errno != ERANGE) {
                    is_int = true;
                    iv = v;
                    fv = static_cast<double>(v);
                    return true;
                }
            }
            is_int = false;
            iv = 0;
            fv = std::strtod(num.c_str(), nullptr);
            return true;
        }

        /// @brief "12", "-3" 같은 정규 정수 문자열이면 배열 키로 정수를 쓴다.
        bool canonical_int_key_(const std::string& s, int64_t& out) {
            if (s.empty() || s.size() > 20) return false;
            size_t p = (s[0] == '-') ? 1 : 0;
            if (p == s.size()) return false;
            if (s[p] == '0' && s.size() > p + 1) return false;
            for (size_t k = p; k < s.size(); ++k) {
                if (!std::isdigit(static_cast<unsigned char>(s[k]))) return false;
            }
            if (s == "-0") return false;
            errno = 0;
            const long long v = std::strtoll(s.c_str(), nullptr, 10);
            if (errno == ERANGE) return false;
            out = v;
            return true;
        }

        class Machine {
        public:
            Machine(const InterpOptions& opt, InterpResult& out) : opt_(opt), out_(out) {}

            bool link(const std::vector<const Module*>& modules);
            void run_main(std::string_view main_symbol);

        private:
            void fault_(std::string msg) {
                if (!ok_) return;
                ok_ = false;
                out_.error = std::move(msg);
            }

            // ---- heap ----
            Handle alloc_(CellKind k);
            Cell* cell_(Handle h);
            void retain_(Handle h);
            void release_(Handle h);
            void free_(Handle h);
            Handle new_str_(std::string s);
            const std::string& str_(Handle h);
            Handle new_arr_();
            Handle box_(Tag t, int64_t i, double f, Handle h);
            Handle box_int_(int64_t v) { return box_(Tag::kInt, v, 0.0, 0); }
            Handle box_float_(double v) { return box_(Tag::kFloat, 0, v, 0); }
            Handle box_bool_(bool v) { return box_(Tag::kBool, v ? 1 : 0, 0.0, 0); }
            Dyn dyn_(Handle box);
            Handle box_key_(const Key& k);

            // ---- php value semantics ----
            bool truthy_(const Dyn& d);
            int64_t to_int_(const Dyn& d);
            double to_float_(const Dyn& d);
            std::string to_str_(const Dyn& d);
            std::string type_label_(const Dyn& d);
            void to_number_(const Dyn& d, bool& is_int, int64_t& i, double& f);
            bool loose_eq_(const Dyn& a, const Dyn& b);
            int compare_(const Dyn& a, const Dyn& b);
            bool identical_(const Dyn& a, const Dyn& b);
            int compare_strings_(const std::string& a, const std::string& b);
            bool arr_identical_(Handle a, Handle b);
            Handle arith_(rt::RtFn op, const Dyn& a, const Dyn& b);

            // ---- arrays ----
            Key key_of_(const Dyn& d);
            Handle arr_unique_(Handle arr);
            Handle arr_get_(Handle arr, const Key& k);
            Handle arr_set_(Handle arr, const Key& k, Handle v);
            Handle arr_push_(Handle arr, Handle v);

            // ---- objects ----
            int32_t class_index_(std::string_view symbol) const;
            bool instance_of_(int32_t cls, std::string_view target) const;
            Handle obj_new_(int32_t cls);
            Type slot_type_(int32_t cls, uint32_t slot) const;
            int32_t slot_by_name_(int32_t cls, std::string_view name) const;
            void throw_(std::string_view cls_name, const std::string& msg);
            Handle prop_get_dyn_(Handle box, const std::string& name);
            void prop_set_dyn_(Handle box, const std::string& name, Handle v);
            Handle call_dyn_(Handle box, const std::string& name, Handle args);

            // ---- execution ----
            const Function* function_(std::string_view name);
            bool call_(const Function& f, const std::vector<uint64_t>& args, uint64_t& ret);
            bool exec_(const Function& f, const Inst& inst, std::vector<uint64_t>& regs);
            uint64_t rt_(rt::RtFn fn, const std::vector<uint64_t>& a);
            uint64_t foreign_(const Function& f, const Inst& inst, const std::vector<uint64_t>& regs);

            const InterpOptions& opt_;
            InterpResult& out_;
            bool ok_ = true;

            std::deque<Cell> cells_{};
            uint64_t live_ = 0;
            Handle pending_ = 0;
            uint64_t steps_ = 0;
            uint32_t depth_ = 0;

            std::unordered_map<std::string, uint32_t> fn_index_{};
            std::vector<const Function*> fns_{};
            std::unordered_map<std::string, int32_t> class_index_map_{};
            std::vector<ClassInfo> classes_{};
        };

        // ---- linking ----

        bool Machine::link(const std::vector<const Module*>& modules) {
            for (const Module* m : modules) {
                if (m == nullptr) continue;
                for (const auto& f : m->functions) {
                    if (fn_index_.count(f.name) != 0) {
                        fault_("duplicate function @" + f.name);
                        return false;
                    }
                    fn_index_[f.name] = static_cast<uint32_t>(fns_.size());
                    fns_.push_back(&f);
                }
                for (const auto& c : m->classes) {
                    if (!c.defined_here) continue;
                    if (class_index_map_.count(c.symbol) != 0) {
                        fault_("duplicate class @" + c.symbol);
                        return false;
                    }
                    class_index_map_[c.symbol] = static_cast<int32_t>(classes_.size());
                    classes_.push_back(ClassInfo{&c, -1});
                }
            }
            for (auto& ci : classes_) {
                if (ci.desc->parent.empty()) continue;
                ci.parent = class_index_(ci.desc->parent);
                if (ci.parent < 0) {
                    fault_("class @" + ci.desc->symbol + " extends unknown @" + ci.desc->parent);
                    return false;
                }
            }
            return true;
        }

        const Function* Machine::function_(std::string_view name) {
            auto it = fn_index_.find(std::string(name));
            if (it == fn_index_.end()) {
                fault_("call to unlinked function @" + std::string(name));
                return nullptr;
            }
            return fns_[it->second];
        }

        // ---- heap ----

        Handle Machine::alloc_(CellKind k) {
            cells_.emplace_back();
            Cell& c = cells_.back();
            c.kind = k;
            c.rc = 1;
            ++live_;
            ++out_.allocations;
            return static_cast<Handle>(cells_.size());
        }

        Cell* Machine::cell_(Handle h) {
            if (h == 0 || h > cells_.size()) {
                fault_("invalid handle " + std::to_string(h));
                return nullptr;
            }
            Cell& c = cells_[h - 1];
            if (c.kind == CellKind::kFree) {
                fault_("use of freed handle " + std::to_string(h));
                return nullptr;
            }
            return &c;
        }

        void Machine::retain_(Handle h) {
            if (h == 0) return;
            if (Cell* c = cell_(h)) ++c->rc;
        }

        void Machine::release_(Handle h) {
            if (h == 0) return;
            Cell* c = cell_(h);
            if (c == nullptr) return;
            if (--c->rc > 0) return;
            free_(h);
        }

        void Machine::free_(Handle h) {
            Cell& c = cells_[h - 1];
            std::vector<Handle> children;
            switch (c.kind) {
                case CellKind::kArr:
                    for (const auto& it : c.items) children.push_back(it.second);
                    break;
                case CellKind::kObj:
                    for (uint32_t s = 0; s < c.slots.size(); ++s) {
                        if (is_handle(slot_type_(c.cls, s))) children.push_back(c.slots[s]);
                    }
                    break;
                case CellKind::kBox:
                    if (c.tag == Tag::kStr || c.tag == Tag::kArr || c.tag == Tag::kObj) children.push_back(c.h);
                    break;
                default:
                    break;
            }
            c = Cell{};
            --live_;
            for (Handle ch : children) release_(ch);
        }

        Handle Machine::new_str_(std::string s) {
            const Handle h = alloc_(CellKind::kStr);
            cells_[h - 1].str = std::move(s);
            return h;
        }

        const std::string& Machine::str_(Handle h) {
            static const std::string empty{};
            if (h == 0) return empty;
            Cell* c = cell_(h);
            if (c == nullptr || c->kind != CellKind::kStr) {
                if (c != nullptr) fault_("handle " + std::to_string(h) + " is not a string");
                return empty;
            }
            return c->str;
        }

        Handle Machine::new_arr_() {
            return alloc_(CellKind::kArr);
        }

        Handle Machine::box_(Tag t, int64_t i, double f, Handle h) {
            const Handle b = alloc_(CellKind::kBox);
            Cell& c = cells_[b - 1];
            c.tag = t;
            c.i = i;
            c.f = f;
            c.h = h;
            return b;
        }

        Dyn Machine::dyn_(Handle box) {
            Dyn d{};
            if (box == 0) return d;
            Cell* c = cell_(box);
            if (c == nullptr) return d;
            if (c->kind != CellKind::kBox) {
                fault_("handle " + std::to_string(box) + " is not a box");
                return d;
            }
            d.tag = c->tag;
            d.i = c->i;
            d.f = c->f;
            d.h = c->h;
            return d;
        }

        Handle Machine::box_key_(const Key& k) {
            if (k.is_int) return box_int_(k.i);
            return box_(Tag::kStr, 0, 0.0, new_str_(k.s));
        }

        // ---- php value semantics ----

        std::string Machine::type_label_(const Dyn& d) {
            switch (d.tag) {
                case Tag::kNull:  return "null";
                case Tag::kBool:  return "bool";
                case Tag::kInt:   return "int";
                case Tag::kFloat: return "float";
                case Tag::kStr:   return "string";
                case Tag::kArr:   return "array";
                case Tag::kObj: {
                    Cell* c = cell_(d.h);
                    if (c == nullptr || c->cls < 0) return "object";
                    return classes_[c->cls].desc->name;
                }
            }
            return "mixed";
        }

        bool Machine::truthy_(const Dyn& d) {
            switch (d.tag) {
                case Tag::kNull:  return false;
                case Tag::kBool:
                case Tag::kInt:   return d.i != 0;
                case Tag::kFloat: return d.f != 0.0;
                case Tag::kStr: {
                    const std::string& s = str_(d.h);
                    return !(s.empty() || s == "0");
                }
                case Tag::kArr: {
                    Cell* c = cell_(d.h);
                    return c != nullptr && !c->items.empty();
                }
                case Tag::kObj:   return true;
            }
            return false;
        }

        void Machine::to_number_(const Dyn& d, bool& is_int, int64_t& i, double& f) {
            is_int = true;
            i = 0;
            f = 0.0;
            switch (d.tag) {
                case Tag::kNull:  return;
                case Tag::kBool:
                case Tag::kInt:   i = d.i; f = static_cast<double>(d.i); return;
                case Tag::kFloat: is_int = false; f = d.f; return;
                case Tag::kStr:
                    if (!parse_numeric_(str_(d.h), false, is_int, i, f)) {
                        is_int = true;
                        i = 0;
                        f = 0.0;
                    }
                    return;
                case Tag::kArr:
                case Tag::kObj:
                    i = truthy_(d) ? 1 : 0;
                    f = static_cast<double>(i);
                    return;
            }
        }

        int64_t Machine::to_int_(const Dyn& d) {
            bool is_int = true;
            int64_t i = 0;
            double f = 0.0;
            to_number_(d, is_int, i, f);
            return is_int ? i : f64_to_i64_(f);
        }

        double Machine::to_float_(const Dyn& d) {
            bool is_int = true;
            int64_t i = 0;
            double f = 0.0;
            to_number_(d, is_int, i, f);
            return is_int ? static_cast<double>(i) : f;
        }

        std::string Machine::to_str_(const Dyn& d) {
            switch (d.tag) {
                case Tag::kNull:  return "";
                case Tag::kBool:  return d.i ? "1" : "";
                case Tag::kInt:   return std::to_string(d.i);
                case Tag::kFloat: return rt::format_float(d.f);
                case Tag::kStr:   return str_(d.h);
                case Tag::kArr:   return "Array";
                case Tag::kObj:   return "Object";
            }
            return "";
        }

        int Machine::compare_strings_(const std::string& a, const std::string& b) {
            bool ai = true, bi = true;
            int64_t an = 0, bn = 0;
            double af = 0.0, bf = 0.0;
            if (parse_numeric_(a, true, ai, an, af) && parse_numeric_(b, true, bi, bn, bf)) {
                if (ai && bi) return sign_(an, bn);
                return sign_(af, bf);
            }
            const int c = a.compare(b);
            return (c < 0) ? -1 : (c > 0 ? 1 : 0);
        }

        bool Machine::loose_eq_(const Dyn& a, const Dyn& b) {
            if (a.tag == Tag::kNull && b.tag == Tag::kNull) return true;
            if (a.tag == Tag::kBool || b.tag == Tag::kBool) return truthy_(a) == truthy_(b);
            if (a.tag == Tag::kNull) return (b.tag == Tag::kStr) ? str_(b.h).empty() : !truthy_(b);
            if (b.tag == Tag::kNull) return (a.tag == Tag::kStr) ? str_(a.h).empty() : !truthy_(a);

            const bool an = (a.tag == Tag::kInt || a.tag == Tag::kFloat);
            const bool bn = (b.tag == Tag::kInt || b.tag == Tag::kFloat);
            if (an && bn) {
                if (a.tag == Tag::kInt && b.tag == Tag::kInt) return a.i == b.i;
                return to_float_(a) == to_float_(b);
            }
            if ((an && b.tag == Tag::kStr) || (bn && a.tag == Tag::kStr)) {
                const Dyn& num = an ? a : b;
                const std::string& s = str_(an ? b.h : a.h);
                bool si = true;
                int64_t sv = 0;
                double sf = 0.0;
                if (parse_numeric_(s, true, si, sv, sf)) {
                    if (num.tag == Tag::kInt && si) return num.i == sv;
                    return to_float_(num) == sf;
                }
                return to_str_(num) == s;
            }
            if (a.tag == Tag::kStr && b.tag == Tag::kStr) return compare_strings_(str_(a.h), str_(b.h)) == 0;
            if (a.tag == Tag::kArr && b.tag == Tag::kArr) return compare_(a, b) == 0;
            if (a.tag == Tag::kObj && b.tag == Tag::kObj) {
                if (a.h == b.h) return true;
                Cell* x = cell_(a.h);
                Cell* y = cell_(b.h);
                if (x == nullptr || y == nullptr || x->cls != y->cls) return false;
                for (uint32_t s = 0; s < x->slots.size(); ++s) {
                    const Type t = slot_type_(x->cls, s);
                    if (!is_handle(t)) {
                        if (x->slots[s] != y->slots[s]) return false;
                        continue;
                    }
                    if (t == Type::kStr) {
                        if (str_(x->slots[s]) != str_(y->slots[s])) return false;
                        continue;
                    }
                    if (x->slots[s] != y->slots[s]) return false;
                }
                return true;
            }
            return false;
        }

        int Machine::compare_(const Dyn& a, const Dyn& b) {
            if (a.tag == Tag::kNull && b.tag == Tag::kStr) return str_(b.h).empty() ? 0 : -1;
            if (b.tag == Tag::kNull && a.tag == Tag::kStr) return str_(a.h).empty() ? 0 : 1;
            if (a.tag == Tag::kBool || b.tag == Tag::kBool || a.tag == Tag::kNull || b.tag == Tag::kNull) {
                return sign_(static_cast<int64_t>(truthy_(a)), static_cast<int64_t>(truthy_(b)));
            }

            const bool an = (a.tag == Tag::kInt || a.tag == Tag::kFloat);
            const bool bn = (b.tag == Tag::kInt || b.tag == Tag::kFloat);
            if (an && bn) {
                if (a.tag == Tag::kInt && b.tag == Tag::kInt) return sign_(a.i, b.i);
                return sign_(to_float_(a), to_float_(b));
            }
            if ((an && b.tag == Tag::kStr) || (bn && a.tag == Tag::kStr)) {
                const std::string& s = str_(an ? b.h : a.h);
                bool si = true;
                int64_t sv = 0;
                double sf = 0.0;
                int r = 0;
                if (parse_numeric_(s, true, si, sv, sf)) {
                    const Dyn& num = an ? a : b;
                    r = (num.tag == Tag::kInt && si) ? sign_(num.i, sv) : sign_(to_float_(num), sf);
                } else {
                    const int c = to_str_(an ? a : b).compare(s);
                    r = (c < 0) ? -1 : (c > 0 ? 1 : 0);
                }
                return an ? r : -r;
            }
            if (a.tag == Tag::kStr && b.tag == Tag::kStr) return compare_strings_(str_(a.h), str_(b.h));

            if (a.tag == Tag::kArr && b.tag == Tag::kArr) {
                Cell* x = cell_(a.h);
                Cell* y = cell_(b.h);
                if (x == nullptr || y == nullptr) return 0;
                if (x->items.size() != y->items.size()) {
                    return sign_(static_cast<int64_t>(x->items.size()), static_cast<int64_t>(y->items.size()));
                }
                for (const auto& it : x->items) {
                    auto jt = y->index.find(it.first);
                    if (jt == y->index.end()) return 1;
                    const int c = compare_(dyn_(it.second), dyn_(y->items[jt->second].second));
                    if (c != 0) return c;
                }
                return 0;
            }
            if (a.tag == Tag::kArr) return 1;
            if (b.tag == Tag::kArr) return -1;
            if (a.tag == Tag::kObj && b.tag == Tag::kObj) return loose_eq_(a, b) ? 0 : 1;
            return (a.tag == Tag::kObj) ? 1 : -1;
        }

        bool Machine::arr_identical_(Handle a, Handle b) {
            if (a == b) return true;
            Cell* x = cell_(a);
            Cell* y = cell_(b);
            if (x == nullptr || y == nullptr) return false;
            if (x->items.size() != y->items.size()) return false;
            for (size_t k = 0; k < x->items.size(); ++k) {
                if (!(x->items[k].first == y->items[k].first)) return false;
                if (!identical_(dyn_(x->items[k].second), dyn_(y->items[k].second))) return false;
            }
            return true;
        }

        bool Machine::identical_(const Dyn& a, const Dyn& b) {
            if (a.tag != b.tag) return false;
            switch (a.tag) {
                case Tag::kNull:  return true;
                case Tag::kBool:
                case Tag::kInt:   return a.i == b.i;
                case Tag::kFloat: return a.f == b.f;
                case Tag::kStr:   return str_(a.h) == str_(b.h);
                case Tag::kArr:   return arr_identical_(a.h, b.h);
                case Tag::kObj:   return a.h == b.h;
            }
            return false;
        }

        Handle Machine::arith_(rt::RtFn op, const Dyn& a, const Dyn& b) {
            using rt::RtFn;
            if (op == RtFn::kBoxAdd && a.tag == Tag::kArr && b.tag == Tag::kArr) {
                // array union: left keys win
                Handle out = new_arr_();
                Cell* src = cell_(a.h);
                if (src == nullptr) return 0;
                const auto left = src->items;
                for (const auto& it : left) {
                    retain_(it.second);
                    out = arr_set_(out, it.first, it.second);
                }
                Cell* rhs = cell_(b.h);
                if (rhs == nullptr) return out;
                const auto right = rhs->items;
                for (const auto& it : right) {
                    Cell* o = cell_(out);
                    if (o == nullptr || o->index.count(it.first) != 0) continue;
                    retain_(it.second);
                    out = arr_set_(out, it.first, it.second);
                }
                return out;
            }

            bool ai = true, bi = true;
            int64_t av = 0, bv = 0;
            double af = 0.0, bf = 0.0;
            to_number_(a, ai, av, af);
            to_number_(b, bi, bv, bf);

            switch (op) {
                case RtFn::kBoxAdd:
                case RtFn::kBoxSub:
                case RtFn::kBoxMul: {
                    if (ai && bi) {
                        int64_t r = 0;
                        bool overflow = false;
                        if (op == RtFn::kBoxAdd) overflow = __builtin_add_overflow(av, bv, &r);
                        else if (op == RtFn::kBoxSub) overflow = __builtin_sub_overflow(av, bv, &r);
                        else overflow = __builtin_mul_overflow(av, bv, &r);
                        if (!overflow) return box_int_(r);
                    }
                    if (op == RtFn::kBoxAdd) return box_float_(af + bf);
                    if (op == RtFn::kBoxSub) return box_float_(af - bf);
                    return box_float_(af * bf);
                }
                case RtFn::kBoxDiv:
                    if (bf == 0.0) {
                        fault_("box division by zero reached the runtime");
                        return 0;
                    }
                    if (ai && bi && !(av == std::numeric_limits<int64_t>::min() && bv == -1) && av % bv == 0) {
                        return box_int_(av / bv);
                    }
                    return box_float_(af / bf);
                case RtFn::kBoxPow:
                    if (ai && bi && bv >= 0) {
                        int64_t r = 1;
                        int64_t base = av;
                        int64_t e = bv;
                        bool overflow = false;
                        while (e > 0 && !overflow) {
                            if (e & 1) overflow = __builtin_mul_overflow(r, base, &r);
                            e >>= 1;
                            if (e > 0 && !overflow) overflow = __builtin_mul_overflow(base, base, &base);
                        }
                        if (!overflow) return box_int_(r);
                    }
                    return box_float_(std::pow(af, bf));
                default:
                    fault_("unexpected box arithmetic");
                    return 0;
            }
        }

        // ---- arrays ----

        Key Machine::key_of_(const Dyn& d) {
            Key k{};
            switch (d.tag) {
                case Tag::kNull:
                    k.is_int = false;
                    break;
                case Tag::kBool:
                case Tag::kInt:
                    k.i = d.i;
                    break;
                case Tag::kFloat:
                    k.i = f64_to_i64_(d.f);
                    break;
                case Tag::kStr: {
                    const std::string& s = str_(d.h);
                    int64_t v = 0;
                    if (canonical_int_key_(s, v)) {
                        k.i = v;
                    } else {
                        k.is_int = false;
                        k.s = s;
                    }
                    break;
                }
                default:
                    // arrays and objects are illegal offsets; they land on ""
                    k.is_int = false;
                    break;
            }
            return k;
        }

        /// @brief 쓰기 전에 단독 소유 배열을 만든다(copy-on-write). arr를 가져간다.
        Handle Machine::arr_unique_(Handle arr) {
            Cell* c = cell_(arr);
            if (c == nullptr) return 0;
            if (c->kind != CellKind::kArr) {
                fault_("handle " + std::to_string(arr) + " is not an array");
                return 0;
            }
            if (c->rc == 1) return arr;

            const Handle copy = new_arr_();
            Cell& src = cells_[arr - 1];
            Cell& dst = cells_[copy - 1];
            dst.items = src.items;
            dst.index = src.index;
            dst.next_index = src.next_index;
            for (const auto& it : dst.items) retain_(it.second);
            release_(arr);
            return copy;
        }

        Handle Machine::arr_get_(Handle arr, const Key& k) {
            Cell* c = cell_(arr);
            if (c == nullptr) return 0;
            auto it = c->index.find(k);
            if (it == c->index.end()) return 0;
            const Handle v = c->items[it->second].second;
            retain_(v);
            return v;
        }

        Handle Machine::arr_set_(Handle arr, const Key& k, Handle v) {
            arr = arr_unique_(arr);
            if (arr == 0) {
                release_(v);
                return 0;
            }
            Cell& c = cells_[arr - 1];
            auto it = c.index.find(k);
            if (it != c.index.end()) {
                const Handle old = c.items[it->second].second;
                c.items[it->second].second = v;
                release_(old);
                return arr;
            }
            c.index.emplace(k, c.items.size());
            c.items.emplace_back(k, v);
            if (k.is_int && k.i >= c.next_index) {
                c.next_index = (k.i == std::numeric_limits<int64_t>::max()) ? k.i : k.i + 1;
            }
            return arr;
        }

        Handle Machine::arr_push_(Handle arr, Handle v) {
            Cell* c = cell_(arr);
            if (c == nullptr) {
                release_(v);
                return 0;
            }
            Key k{};
            k.i = c->next_index;
            return arr_set_(arr, k, v);
        }

        // ---- objects ----

        int32_t Machine::class_index_(std::string_view symbol) const {
            auto it = class_index_map_.find(std::string(symbol));
            return (it == class_index_map_.end()) ? -1 : it->second;
        }

        bool Machine::instance_of_(int32_t cls, std::string_view target) const {
            for (int32_t c = cls; c >= 0; c = classes_[c].parent) {
                const ClassDesc* d = classes_[c].desc;
                if (d->symbol == target) return true;
                for (const auto& i : d->interfaces) {
                    if (i == target) return true;
                }
            }
            return false;
        }

        Type Machine::slot_type_(int32_t cls, uint32_t slot) const {
            if (cls < 0) return Type::kI64;
            const ClassDesc* d = classes_[cls].desc;
            return (slot < d->slots.size()) ? d->slots[slot].type : Type::kI64;
        }

        int32_t Machine::slot_by_name_(int32_t cls, std::string_view name) const {
            const ClassDesc* d = classes_[cls].desc;
            for (size_t s = 0; s < d->slots.size(); ++s) {
                if (d->slots[s].name == name) return static_cast<int32_t>(s);
            }
            return -1;
        }

        Handle Machine::obj_new_(int32_t cls) {
            const Handle h = alloc_(CellKind::kObj);
            Cell& c = cells_[h - 1];
            c.cls = cls;
            c.slots.assign(classes_[cls].desc->slots.size(), 0);
            return h;
        }

        /// @brief 런타임 검사 실패. prelude의 예외 객체를 만들어 pending 슬롯에 건다.
        void Machine::throw_(std::string_view cls_name, const std::string& msg) {
            const int32_t cls = class_index_(rt::mangle_class(cls_name));
            if (cls < 0) {
                fault_("runtime error without a linked prelude: " + msg);
                return;
            }
            const Handle obj = obj_new_(cls);
            for (uint32_t s = 0; s < classes_[cls].desc->slots.size(); ++s) {
                const SlotDesc& sd = classes_[cls].desc->slots[s];
                if (sd.type == Type::kStr) cells_[obj - 1].slots[s] = new_str_(sd.name == "message" ? msg : "");
                else if (sd.type == Type::kArr) cells_[obj - 1].slots[s] = new_arr_();
            }
            release_(pending_);
            pending_ = obj;
        }

        Handle Machine::prop_get_dyn_(Handle box, const std::string& name) {
            const Dyn d = dyn_(box);
            if (d.tag != Tag::kObj) {
                throw_("Error", "Attempt to read property \"" + name + "\" on " + type_label_(d));
                return 0;
            }
            const int32_t cls = cells_[d.h - 1].cls;
            const int32_t s = slot_by_name_(cls, name);
            if (s < 0) return 0;
            const SlotDesc& sd = classes_[cls].desc->slots[s];
            if (!sd.is_public) {
                throw_("Error", "Cannot access non-public property " + classes_[cls].desc->name + "::$" + name);
                return 0;
            }
            const uint64_t raw = cells_[d.h - 1].slots[s];
            switch (sd.type) {
                case Type::kI1:  return box_bool_(raw != 0);
                case Type::kI64: return box_int_(static_cast<int64_t>(raw));
                case Type::kF64: return box_float_(as_f64_(raw));
                case Type::kStr:
                    retain_(raw);
                    return box_(Tag::kStr, 0, 0.0, raw);
                case Type::kArr:
                    retain_(raw);
                    return box_(Tag::kArr, 0, 0.0, raw);
                case Type::kObj:
                    if (raw == 0) return 0;
                    retain_(raw);
                    return box_(Tag::kObj, 0, 0.0, raw);
                default:
                    retain_(raw);
                    return raw;
            }
        }

        void Machine::prop_set_dyn_(Handle box, const std::string& name, Handle v) {
            const Dyn d = dyn_(box);
            if (d.tag != Tag::kObj) {
                throw_("Error", "Attempt to assign property \"" + name + "\" on " + type_label_(d));
                release_(v);
                return;
            }
            const int32_t cls = cells_[d.h - 1].cls;
            const std::string& cname = classes_[cls].desc->name;
            const int32_t s = slot_by_name_(cls, name);
            if (s < 0) {
                throw_("Error", "Cannot create dynamic property " + cname + "::$" + name);
                release_(v);
                return;
            }
            const SlotDesc& sd = classes_[cls].desc->slots[s];
            if (!sd.is_public) {
                throw_("Error", "Cannot access non-public property " + cname + "::$" + name);
                release_(v);
                return;
            }

            const Dyn val = dyn_(v);
            uint64_t raw = 0;
            bool fits = true;
            switch (sd.type) {
                case Type::kI1:  raw = truthy_(val) ? 1 : 0; break;
                case Type::kI64: raw = static_cast<uint64_t>(to_int_(val)); break;
                case Type::kF64: raw = from_f64_(to_float_(val)); break;
                case Type::kStr: raw = new_str_(to_str_(val)); break;
                case Type::kArr:
                    fits = (val.tag == Tag::kArr);
                    if (fits) {
                        raw = val.h;
                        retain_(raw);
                    }
                    break;
                case Type::kObj:
                    fits = (val.tag == Tag::kObj);
                    if (fits) {
                        raw = val.h;
                        retain_(raw);
                    }
                    break;
                default:
                    raw = v;
                    retain_(raw);
                    break;
            }
            if (!fits) {
                throw_("TypeError", "Cannot assign " + type_label_(val) + " to property " + cname + "::$" + name +
                                    " of type " + std::string(type_name(sd.type)));
                release_(v);
                return;
            }
            Cell& obj = cells_[d.h - 1];
            const uint64_t old = obj.slots[s];
            obj.slots[s] = raw;
            if (is_handle(sd.type)) release_(old);
            release_(v);
        }

        Handle Machine::call_dyn_(Handle box, const std::string& name, Handle args) {
            const Dyn d = dyn_(box);
            if (d.tag != Tag::kObj) {
                throw_("Error", "Call to a member function " + name + "() on " + type_label_(d));
                release_(args);
                return 0;
            }
            const int32_t cls = cells_[d.h - 1].cls;
            const ClassDesc* desc = classes_[cls].desc;
            const std::string key = sema::fold_name(name);
            const MethodDesc* md = nullptr;
            for (const auto& m : desc->methods) {
                if (m.name == key) md = &m;
            }
            if (md == nullptr) {
                throw_("Error", "Call to undefined method " + desc->name + "::" + name + "()");
                release_(args);
                return 0;
            }
            Cell* ac = cell_(args);
            const uint64_t given = (ac == nullptr) ? 0 : ac->items.size();
            if (given < md->required) {
                throw_("Error", "Too few arguments to function " + desc->name + "::" + name + "(), " +
                                std::to_string(given) + " passed and " +
                                (md->required == md->arity ? "exactly " : "at least ") +
                                std::to_string(md->required) + " expected");
                release_(args);
                return 0;
            }
            const Function* adapter = function_(md->adapter);
            if (adapter == nullptr) {
                release_(args);
                return 0;
            }
            retain_(d.h);
            uint64_t ret = 0;
            if (!call_(*adapter, {d.h, args}, ret)) return 0;
            return ret;
        }

        // ---- runtime entry points ----

        uint64_t Machine::rt_(rt::RtFn fn, const std::vector<uint64_t>& a) {
            using rt::RtFn;
            auto i64 = [&](size_t k) { return static_cast<int64_t>(a[k]); };

            switch (fn) {
                case RtFn::kInit:
                case RtFn::kShutdown:
                    return 0;
                case RtFn::kRetain:
                    retain_(a[0]);
                    return 0;
                case RtFn::kRelease:
                    release_(a[0]);
                    return 0;
                case RtFn::kRaise:
                    release_(pending_);
                    pending_ = a[0];
                    return 0;
                case RtFn::kExcPending:
                    return pending_ != 0 ? 1 : 0;
                case RtFn::kExcTake: {
                    const Handle h = pending_;
                    pending_ = 0;
                    return h;
                }
                case RtFn::kReportUncaught:
                    return 0;

                // ---- strings ----
                case RtFn::kStrLiteral:
                    fault_("str_literal is a backend-only entry point");
                    return 0;
                case RtFn::kStrConcat:
                    return new_str_(str_(a[0]) + str_(a[1]));
                case RtFn::kStrEq:
                    return str_(a[0]) == str_(a[1]) ? 1 : 0;
                case RtFn::kStrCmp:
                    return static_cast<uint64_t>(static_cast<int64_t>(compare_strings_(str_(a[0]), str_(a[1]))));
                case RtFn::kStrLen:
                    return str_(a[0]).size();
                case RtFn::kStrAt: {
                    const std::string& s = str_(a[0]);
                    int64_t k = i64(1);
                    if (k < 0) k += static_cast<int64_t>(s.size());
                    if (k < 0 || k >= static_cast<int64_t>(s.size())) return new_str_("");
                    return new_str_(std::string(1, s[static_cast<size_t>(k)]));
                }
                case RtFn::kStrRepeat: {
                    std::string out;
                    const std::string& s = str_(a[0]);
                    for (int64_t k = 0; k < i64(1); ++k) out += s;
                    return new_str_(std::move(out));
                }
                case RtFn::kStrUpper: {
                    std::string s = str_(a[0]);
                    for (char& c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
                    return new_str_(std::move(s));
                }
                case RtFn::kImplode: {
                    std::string out;
                    const std::string glue = str_(a[0]);
                    Cell* c = cell_(a[1]);
                    if (c == nullptr) return 0;
                    const auto items = c->items;
                    for (size_t k = 0; k < items.size(); ++k) {
                        if (k) out += glue;
                        out += to_str_(dyn_(items[k].second));
                    }
                    return new_str_(std::move(out));
                }
                case RtFn::kStrFromInt:
                    return new_str_(std::to_string(i64(0)));
                case RtFn::kStrFromFloat:
                    return new_str_(rt::format_float(as_f64_(a[0])));
                case RtFn::kStrFromBool:
                    return new_str_(a[0] ? "1" : "");
                case RtFn::kStrToInt: {
                    bool is_int = true;
                    int64_t v = 0;
                    double f = 0.0;
                    if (!parse_numeric_(str_(a[0]), false, is_int, v, f)) return 0;
                    return static_cast<uint64_t>(is_int ? v : f64_to_i64_(f));
                }
                case RtFn::kStrToFloat: {
                    bool is_int = true;
                    int64_t v = 0;
                    double f = 0.0;
                    if (!parse_numeric_(str_(a[0]), false, is_int, v, f)) return from_f64_(0.0);
                    return from_f64_(f);
                }
                case RtFn::kStrToBool: {
                    const std::string& s = str_(a[0]);
                    return (s.empty() || s == "0") ? 0 : 1;
                }
                case RtFn::kEcho:
                    out_.output += str_(a[0]);
                    return 0;

                // ---- boxes ----
                case RtFn::kBoxInt:   return box_int_(i64(0));
                case RtFn::kBoxFloat: return box_float_(as_f64_(a[0]));
                case RtFn::kBoxBool:  return box_bool_(a[0] != 0);
                case RtFn::kBoxStr:   return box_(Tag::kStr, 0, 0.0, a[0]);
                case RtFn::kBoxArr:   return box_(Tag::kArr, 0, 0.0, a[0]);
                case RtFn::kBoxObj:   return a[0] == 0 ? 0 : box_(Tag::kObj, 0, 0.0, a[0]);
                case RtFn::kUnboxInt:   return static_cast<uint64_t>(to_int_(dyn_(a[0])));
                case RtFn::kUnboxFloat: return from_f64_(to_float_(dyn_(a[0])));
                case RtFn::kUnboxBool:  return truthy_(dyn_(a[0])) ? 1 : 0;
                case RtFn::kUnboxStr:   return new_str_(to_str_(dyn_(a[0])));
                case RtFn::kUnboxArr: {
                    const Dyn d = dyn_(a[0]);
                    if (d.tag == Tag::kArr) {
                        retain_(d.h);
                        return d.h;
                    }
                    if (d.tag == Tag::kNull) return new_arr_();
                    throw_("TypeError", "Value of type " + type_label_(d) + " is not an array");
                    return 0;
                }
                case RtFn::kUnboxObj: {
                    const Dyn d = dyn_(a[0]);
                    if (d.tag == Tag::kObj) {
                        retain_(d.h);
                        return d.h;
                    }
                    throw_("TypeError", "Value of type " + type_label_(d) + " is not an object");
                    return 0;
                }
                case RtFn::kBoxIdentical: return identical_(dyn_(a[0]), dyn_(a[1])) ? 1 : 0;
                case RtFn::kBoxLooseEq:   return loose_eq_(dyn_(a[0]), dyn_(a[1])) ? 1 : 0;
                case RtFn::kBoxCmp:
                    return static_cast<uint64_t>(static_cast<int64_t>(compare_(dyn_(a[0]), dyn_(a[1]))));
                case RtFn::kBoxAdd:
                case RtFn::kBoxSub:
                case RtFn::kBoxMul:
                case RtFn::kBoxDiv:
                case RtFn::kBoxPow:
                    return arith_(fn, dyn_(a[0]), dyn_(a[1]));
                case RtFn::kBoxNeg: {
                    const Dyn d = dyn_(a[0]);
                    Dyn minus_one{};
                    minus_one.tag = Tag::kInt;
                    minus_one.i = -1;
                    return arith_(RtFn::kBoxMul, d, minus_one);
                }
                case RtFn::kBoxInstanceOf: {
                    const Dyn d = dyn_(a[0]);
                    if (d.tag != Tag::kObj || a[1] == 0) return 0;
                    Cell* c = cell_(d.h);
                    if (c == nullptr) return 0;
                    return instance_of_(c->cls, classes_[a[1] - 1].desc->symbol) ? 1 : 0;
                }

                // ---- arrays ----
                case RtFn::kArrNew:    return new_arr_();
                case RtFn::kArrGet:    return arr_get_(a[0], key_of_(dyn_(a[1])));
                case RtFn::kArrGetInt: {
                    Key k{};
                    k.i = i64(1);
                    return arr_get_(a[0], k);
                }
                case RtFn::kArrSet:    return arr_set_(a[0], key_of_(dyn_(a[1])), a[2]);
                case RtFn::kArrSetInt: {
                    Key k{};
                    k.i = i64(1);
                    return arr_set_(a[0], k, a[2]);
                }
                case RtFn::kArrPush:   return arr_push_(a[0], a[1]);
                case RtFn::kArrCount: {
                    Cell* c = cell_(a[0]);
                    return (c == nullptr) ? 0 : c->items.size();
                }
                case RtFn::kArrKeyAt:
                case RtFn::kArrValueAt: {
                    Cell* c = cell_(a[0]);
                    if (c == nullptr || i64(1) < 0 || static_cast<uint64_t>(i64(1)) >= c->items.size()) return 0;
                    const auto& item = c->items[static_cast<size_t>(i64(1))];
                    if (fn == RtFn::kArrKeyAt) return box_key_(Key(item.first));
                    retain_(item.second);
                    return item.second;
                }
                case RtFn::kArrIdentical:
                    return arr_identical_(a[0], a[1]) ? 1 : 0;

                // ---- objects ----
                case RtFn::kObjNew:
                    if (a[0] == 0 || a[0] > classes_.size()) {
                        fault_("obj_new with an unknown class");
                        return 0;
                    }
                    return obj_new_(static_cast<int32_t>(a[0] - 1));
                case RtFn::kObjInstanceOf: {
                    Cell* c = cell_(a[0]);
                    if (c == nullptr || a[1] == 0) return 0;
                    return instance_of_(c->cls, classes_[a[1] - 1].desc->symbol) ? 1 : 0;
                }
                case RtFn::kPropGetDyn:
                    return prop_get_dyn_(a[0], str_(a[1]));
                case RtFn::kPropSetDyn:
                    prop_set_dyn_(a[0], str_(a[1]), a[2]);
                    return 0;
                case RtFn::kCallDyn:
                    return call_dyn_(a[0], str_(a[1]), a[2]);

                // ---- math ----
                case RtFn::kIPow: {
                    const int64_t base = i64(0);
                    const int64_t e = i64(1);
                    if (e < 0) return static_cast<uint64_t>(f64_to_i64_(std::pow(static_cast<double>(base), static_cast<double>(e))));
                    uint64_t r = 1;
                    uint64_t b = static_cast<uint64_t>(base);
                    for (int64_t k = e; k > 0; k >>= 1) {
                        if (k & 1) r *= b;
                        b *= b;
                    }
                    return r;
                }
                case RtFn::kFPow:     return from_f64_(std::pow(as_f64_(a[0]), as_f64_(a[1])));
                case RtFn::kAbsInt:   return static_cast<uint64_t>(i64(0) < 0 ? (0 - a[0]) : a[0]);
                case RtFn::kAbsFloat: return from_f64_(std::fabs(as_f64_(a[0])));
                case RtFn::kSqrt:     return from_f64_(std::sqrt(as_f64_(a[0])));
                case RtFn::kSin:      return from_f64_(std::sin(as_f64_(a[0])));
                case RtFn::kCos:      return from_f64_(std::cos(as_f64_(a[0])));
                case RtFn::kFloor:    return from_f64_(std::floor(as_f64_(a[0])));

                case RtFn::kCount_:
                    break;
            }
            fault_("unknown runtime entry");
            return 0;
        }

        /// @brief #[ffi] 호출. 시뮬레이션 런타임은 libm 일부만 안다.
        uint64_t Machine::foreign_(const Function& f, const Inst& inst, const std::vector<uint64_t>& regs) {
            std::vector<double> x;
            for (ValueId v : inst.args) {
                const Type t = f.value_types[v];
                x.push_back(t == Type::kF64 ? as_f64_(regs[v]) : static_cast<double>(static_cast<int64_t>(regs[v])));
            }
            auto arg = [&](size_t k) { return k < x.size() ? x[k] : 0.0; };

            static const std::unordered_map<std::string, double (*)(double)> unary = {
                {"sqrt", [](double v) { return std::sqrt(v); }},
                {"sin", [](double v) { return std::sin(v); }},
                {"cos", [](double v) { return std::cos(v); }},
                {"tan", [](double v) { return std::tan(v); }},
                {"floor", [](double v) { return std::floor(v); }},
                {"ceil", [](double v) { return std::ceil(v); }},
                {"fabs", [](double v) { return std::fabs(v); }},
                {"exp", [](double v) { return std::exp(v); }},
                {"log", [](double v) { return std::log(v); }},
                {"log10", [](double v) { return std::log10(v); }},
                {"round", [](double v) { return std::round(v); }},
                {"abs", [](double v) { return std::fabs(v); }},
                {"labs", [](double v) { return std::fabs(v); }},
            };

            double r = 0.0;
            if (inst.s == "pow" || inst.s == "fmod" || inst.s == "atan2") {
                if (inst.s == "pow") r = std::pow(arg(0), arg(1));
                else if (inst.s == "fmod") r = std::fmod(arg(0), arg(1));
                else r = std::atan2(arg(0), arg(1));
            } else {
                auto it = unary.find(inst.s);
                if (it == unary.end()) {
                    fault_("foreign symbol " + inst.s + " is not available in the simulated runtime");
                    return 0;
                }
                r = it->second(arg(0));
            }
            if (inst.type == Type::kF64) return from_f64_(r);
            return static_cast<uint64_t>(f64_to_i64_(r));
        }

        // ---- execution ----

        bool Machine::exec_(const Function& f, const Inst& inst, std::vector<uint64_t>& regs) {
            auto A = [&](size_t k) { return regs[inst.args[k]]; };
            auto I = [&](size_t k) { return static_cast<int64_t>(regs[inst.args[k]]); };
            auto F = [&](size_t k) { return as_f64_(regs[inst.args[k]]); };
            auto set = [&](uint64_t v) {
                if (inst.dst != kInvalidValue) regs[inst.dst] = v;
            };

            switch (inst.op) {
                case Opcode::kConstInt:   set(static_cast<uint64_t>(inst.i)); break;
                case Opcode::kConstFloat: set(from_f64_(inst.f)); break;
                case Opcode::kConstBool:  set(inst.i ? 1 : 0); break;
                case Opcode::kConstStr:   set(new_str_(inst.s)); break;
                case Opcode::kConstNull:  set(0); break;
                case Opcode::kClassRef: {
                    const int32_t c = class_index_(inst.s);
                    if (c < 0) {
                        fault_("classref to unlinked class @" + inst.s);
                        break;
                    }
                    set(static_cast<uint64_t>(c) + 1);
                    break;
                }

                case Opcode::kIAdd: set(A(0) + A(1)); break;
                case Opcode::kISub: set(A(0) - A(1)); break;
                case Opcode::kIMul: set(A(0) * A(1)); break;
                case Opcode::kSDiv:
                case Opcode::kSRem: {
                    const int64_t x = I(0);
                    const int64_t y = I(1);
                    if (y == 0) {
                        fault_("integer division by zero reached " + std::string(opcode_name(inst.op)));
                        break;
                    }
                    if (y == -1) {
                        set(inst.op == Opcode::kSDiv ? 0 - static_cast<uint64_t>(x) : 0);
                        break;
                    }
                    set(static_cast<uint64_t>(inst.op == Opcode::kSDiv ? x / y : x % y));
                    break;
                }
                case Opcode::kAnd: set(A(0) & A(1)); break;
                case Opcode::kOr:  set(A(0) | A(1)); break;
                case Opcode::kXor: set(A(0) ^ A(1)); break;
                case Opcode::kShl:
                    set((I(1) < 0 || I(1) >= 64) ? 0 : (A(0) << I(1)));
                    break;
                case Opcode::kAShr:
                    if (I(1) < 0 || I(1) >= 64) set(I(0) < 0 ? ~uint64_t{0} : 0);
                    else set(static_cast<uint64_t>(I(0) >> I(1)));
                    break;
                case Opcode::kICmp: {
                    const bool is_int = f.value_types[inst.args[0]] == Type::kI64;
                    int c = 0;
                    if (is_int) c = sign_(I(0), I(1));
                    else c = (A(0) < A(1)) ? -1 : (A(0) > A(1) ? 1 : 0);
                    bool r = false;
                    switch (inst.pred) {
                        case Pred::kEq: r = (c == 0); break;
                        case Pred::kNe: r = (c != 0); break;
                        case Pred::kLt: r = (c < 0); break;
                        case Pred::kLe: r = (c <= 0); break;
                        case Pred::kGt: r = (c > 0); break;
                        case Pred::kGe: r = (c >= 0); break;
                    }
                    set(r ? 1 : 0);
                    break;
                }

                case Opcode::kFAdd: set(from_f64_(F(0) + F(1))); break;
                case Opcode::kFSub: set(from_f64_(F(0) - F(1))); break;
                case Opcode::kFMul: set(from_f64_(F(0) * F(1))); break;
                case Opcode::kFDiv: set(from_f64_(F(0) / F(1))); break;
                case Opcode::kFNeg: set(from_f64_(-F(0))); break;
                case Opcode::kFCmp: {
                    const double x = F(0);
                    const double y = F(1);
                    bool r = false;
                    switch (inst.pred) {
                        case Pred::kEq: r = (x == y); break;
                        case Pred::kNe: r = !(x == y); break;
                        case Pred::kLt: r = (x < y); break;
                        case Pred::kLe: r = (x <= y); break;
                        case Pred::kGt: r = (x > y); break;
                        case Pred::kGe: r = (x >= y); break;
                    }
                    set(r ? 1 : 0);
                    break;
                }
                case Opcode::kSIToFP: set(from_f64_(static_cast<double>(I(0)))); break;
                case Opcode::kFPToSI: set(static_cast<uint64_t>(f64_to_i64_(F(0)))); break;
                case Opcode::kZExt:   set(A(0) & 1u); break;

                case Opcode::kCallRt: {
                    std::vector<uint64_t> args;
                    for (ValueId v : inst.args) args.push_back(regs[v]);
                    set(rt_(inst.rt, args));
                    break;
                }
                case Opcode::kCall: {
                    const Function* callee = function_(inst.s);
                    if (callee == nullptr) break;
                    std::vector<uint64_t> args;
                    for (ValueId v : inst.args) args.push_back(regs[v]);
                    uint64_t ret = 0;
                    if (!call_(*callee, args, ret)) break;
                    set(ret);
                    break;
                }
                case Opcode::kLoadVSlot: {
                    Cell* c = cell_(A(0));
                    if (c == nullptr) break;
                    const ClassDesc* d = classes_[c->cls].desc;
                    if (inst.imm >= d->vtable.size() || d->vtable[inst.imm].empty()) {
                        fault_("empty vtable slot " + std::to_string(inst.imm) + " in @" + d->symbol);
                        break;
                    }
                    auto it = fn_index_.find(d->vtable[inst.imm]);
                    if (it == fn_index_.end()) {
                        fault_("vtable entry @" + d->vtable[inst.imm] + " is not linked");
                        break;
                    }
                    set(static_cast<uint64_t>(it->second) + 1);
                    break;
                }
                case Opcode::kCallIndirect: {
                    const uint64_t code = A(0);
                    if (code == 0 || code > fns_.size()) {
                        fault_("indirect call through a bad code pointer");
                        break;
                    }
                    std::vector<uint64_t> args;
                    for (size_t k = 1; k < inst.args.size(); ++k) args.push_back(regs[inst.args[k]]);
                    uint64_t ret = 0;
                    if (!call_(*fns_[code - 1], args, ret)) break;
                    set(ret);
                    break;
                }
                case Opcode::kCallForeign:
                    set(foreign_(f, inst, regs));
                    break;

                case Opcode::kLoadSlot: {
                    Cell* c = cell_(A(0));
                    if (c == nullptr || inst.imm >= c->slots.size()) {
                        if (c != nullptr) fault_("load.slot out of range");
                        break;
                    }
                    const uint64_t v = c->slots[inst.imm];
                    if (is_handle(slot_type_(c->cls, inst.imm))) retain_(v);
                    set(v);
                    break;
                }
                case Opcode::kStoreSlot: {
                    Cell* c = cell_(A(0));
                    if (c == nullptr || inst.imm >= c->slots.size()) {
                        if (c != nullptr) fault_("store.slot out of range");
                        break;
                    }
                    const uint64_t old = c->slots[inst.imm];
                    c->slots[inst.imm] = A(1);
                    if (is_handle(slot_type_(c->cls, inst.imm))) release_(old);
                    break;
                }
                case Opcode::kRetain:  retain_(A(0)); break;
                case Opcode::kRelease: release_(A(0)); break;
            }
            return ok_;
        }

        bool Machine::call_(const Function& f, const std::vector<uint64_t>& args, uint64_t& ret) {
            struct DepthGuard {
                uint32_t& d;
                explicit DepthGuard(uint32_t& x) : d(x) { ++d; }
                ~DepthGuard() { --d; }
            } guard(depth_);

            if (depth_ > opt_.max_call_depth) {
                fault_("call depth limit exceeded in @" + f.name);
                return false;
            }
            if (args.size() != f.params.size()) {
                fault_("@" + f.name + " called with " + std::to_string(args.size()) + " argument(s)");
                return false;
            }

            std::vector<uint64_t> regs(f.value_types.size(), 0);
            for (size_t k = 0; k < args.size(); ++k) regs[f.params[k]] = args[k];

            BlockId b = f.entry;
            BlockId prev = kInvalidBlock;
            std::vector<uint64_t> incoming;
            while (true) {
                if (b >= f.blocks.size()) {
                    fault_("@" + f.name + " branched to a missing block");
                    return false;
                }
                const Block& blk = f.blocks[b];

                if (!blk.phis.empty()) {
                    incoming.clear();
                    for (const auto& p : blk.phis) {
                        const PhiIncoming* hit = nullptr;
                        for (const auto& in : p.incoming) {
                            if (in.pred == prev) hit = &in;
                        }
                        if (hit == nullptr) {
                            fault_("@" + f.name + " bb" + std::to_string(b) + ": phi has no input for bb" +
                                   std::to_string(prev));
                            return false;
                        }
                        incoming.push_back(regs[hit->value]);
                    }
                    for (size_t k = 0; k < blk.phis.size(); ++k) regs[blk.phis[k].dst] = incoming[k];
                }

                for (const auto& inst : blk.insts) {
                    if (++steps_ > opt_.step_limit) {
                        fault_("step limit exceeded");
                        return false;
                    }
                    if (!exec_(f, inst, regs)) return false;
                }

                const Term& t = blk.term;
                prev = b;
                switch (t.kind) {
                    case TermKind::kBr:
                        b = t.target;
                        break;
                    case TermKind::kCondBr:
                        b = regs[t.value] ? t.target : t.alt;
                        break;
                    case TermKind::kRet:
                        ret = (t.value == kInvalidValue) ? 0 : regs[t.value];
                        return true;
                    case TermKind::kRaise:
                        release_(pending_);
                        pending_ = regs[t.value];
                        b = t.target;
                        break;
                    case TermKind::kExcCheck:
                        b = (pending_ != 0) ? t.alt : t.target;
                        break;
                    case TermKind::kUnwindRet:
                        ret = 0;
                        return true;
                    case TermKind::kNone:
                        fault_("@" + f.name + " bb" + std::to_string(b) + " has no terminator");
                        return false;
                }
            }
        }

        void Machine::run_main(std::string_view main_symbol) {
            (void)rt_(rt::RtFn::kInit, {});
            const Function* main_fn = function_(main_symbol);
            if (main_fn == nullptr) return;

            uint64_t ret = 0;
            if (!call_(*main_fn, {}, ret)) return;

            if (pending_ != 0) {
                Cell* c = cell_(pending_);
                out_.uncaught = true;
                out_.exit_code = rt::kUncaughtExitCode;
                if (c != nullptr && c->cls >= 0) {
                    out_.uncaught_class = classes_[c->cls].desc->name;
                    const int32_t s = slot_by_name_(c->cls, "message");
                    if (s >= 0 && slot_type_(c->cls, static_cast<uint32_t>(s)) == Type::kStr) {
                        out_.uncaught_message = str_(c->slots[s]);
                    }
                }
                release_(pending_);
                pending_ = 0;
            }
            (void)rt_(rt::RtFn::kShutdown, {});
            out_.leaked = live_;
            out_.ok = ok_;
        }

    } // namespace

    InterpResult run_program(const std::vector<const Module*>& modules, std::string_view main_symbol,
                             const InterpOptions& opt) {
        InterpResult out{};
        Machine m(opt, out);
        if (!m.link(modules)) return out;
        m.run_main(main_symbol);
        return out;
    }

} // namespace php2ir::lir
