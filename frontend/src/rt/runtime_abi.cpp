// frontend/src/rt/runtime_abi.cpp
#include <php2ir/rt/RuntimeABI.hpp>
#include <php2ir/sema/SymbolTable.hpp>

#include <cctype>
#include <cstdio>


namespace php2ir::rt {

    namespace {

        using T = lir::Type;

        std::vector<RtFnInfo> build_table_() {
            std::vector<RtFnInfo> t(static_cast<size_t>(RtFn::kCount_));
            auto def = [&](RtFn id, std::string_view sym, T ret, std::vector<T> params,
                           uint32_t consumes = 0, bool may_throw = false) {
                RtFnInfo& e = t[static_cast<size_t>(id)];
                e.id = id;
                e.symbol = sym;
                e.ret = ret;
                e.params = std::move(params);
                e.consumes = consumes;
                e.may_throw = may_throw;
            };

            def(RtFn::kInit, "php2ir_rt_init", T::kVoid, {T::kI64, T::kI64, T::kI64});
            def(RtFn::kShutdown, "php2ir_rt_shutdown", T::kVoid, {});
            def(RtFn::kRetain, "php2ir_rt_retain", T::kVoid, {T::kPtr});
            def(RtFn::kRelease, "php2ir_rt_release", T::kVoid, {T::kPtr});
            def(RtFn::kRaise, "php2ir_rt_raise", T::kVoid, {T::kObj}, 0b1);
            def(RtFn::kExcPending, "php2ir_rt_exc_pending", T::kI1, {});
            def(RtFn::kExcTake, "php2ir_rt_exc_take", T::kObj, {});
            def(RtFn::kReportUncaught, "php2ir_rt_report_uncaught", T::kVoid, {});

            def(RtFn::kStrLiteral, "php2ir_rt_str_literal", T::kStr, {T::kPtr, T::kI64});
            def(RtFn::kStrConcat, "php2ir_rt_str_concat", T::kStr, {T::kStr, T::kStr});
            def(RtFn::kStrEq, "php2ir_rt_str_eq", T::kI1, {T::kStr, T::kStr});
            def(RtFn::kStrCmp, "php2ir_rt_str_cmp", T::kI64, {T::kStr, T::kStr});
            def(RtFn::kStrLen, "php2ir_rt_str_len", T::kI64, {T::kStr});
            def(RtFn::kStrAt, "php2ir_rt_str_at", T::kStr, {T::kStr, T::kI64});
            def(RtFn::kStrRepeat, "php2ir_rt_str_repeat", T::kStr, {T::kStr, T::kI64});
            def(RtFn::kStrUpper, "php2ir_rt_str_upper", T::kStr, {T::kStr});
            def(RtFn::kImplode, "php2ir_rt_implode", T::kStr, {T::kStr, T::kArr});
            def(RtFn::kStrFromInt, "php2ir_rt_str_from_int", T::kStr, {T::kI64});
            def(RtFn::kStrFromFloat, "php2ir_rt_str_from_float", T::kStr, {T::kF64});
            def(RtFn::kStrFromBool, "php2ir_rt_str_from_bool", T::kStr, {T::kI1});
            def(RtFn::kStrToInt, "php2ir_rt_str_to_int", T::kI64, {T::kStr});
            def(RtFn::kStrToFloat, "php2ir_rt_str_to_float", T::kF64, {T::kStr});
            def(RtFn::kStrToBool, "php2ir_rt_str_to_bool", T::kI1, {T::kStr});
            def(RtFn::kEcho, "php2ir_rt_echo", T::kVoid, {T::kStr});

            def(RtFn::kBoxInt, "php2ir_rt_box_int", T::kBox, {T::kI64});
            def(RtFn::kBoxFloat, "php2ir_rt_box_float", T::kBox, {T::kF64});
            def(RtFn::kBoxBool, "php2ir_rt_box_bool", T::kBox, {T::kI1});
            def(RtFn::kBoxStr, "php2ir_rt_box_str", T::kBox, {T::kStr}, 0b1);
            def(RtFn::kBoxArr, "php2ir_rt_box_arr", T::kBox, {T::kArr}, 0b1);
            def(RtFn::kBoxObj, "php2ir_rt_box_obj", T::kBox, {T::kObj}, 0b1);
            def(RtFn::kUnboxInt, "php2ir_rt_unbox_int", T::kI64, {T::kBox});
            def(RtFn::kUnboxFloat, "php2ir_rt_unbox_float", T::kF64, {T::kBox});
            def(RtFn::kUnboxBool, "php2ir_rt_unbox_bool", T::kI1, {T::kBox});
            def(RtFn::kUnboxStr, "php2ir_rt_unbox_str", T::kStr, {T::kBox});
            def(RtFn::kUnboxArr, "php2ir_rt_unbox_arr", T::kArr, {T::kBox}, 0, true);
            def(RtFn::kUnboxObj, "php2ir_rt_unbox_obj", T::kObj, {T::kBox}, 0, true);
            def(RtFn::kBoxIdentical, "php2ir_rt_box_identical", T::kI1, {T::kBox, T::kBox});
            def(RtFn::kBoxLooseEq, "php2ir_rt_box_loose_eq", T::kI1, {T::kBox, T::kBox});
            def(RtFn::kBoxCmp, "php2ir_rt_box_cmp", T::kI64, {T::kBox, T::kBox});
            def(RtFn::kBoxAdd, "php2ir_rt_box_add", T::kBox, {T::kBox, T::kBox});
            def(RtFn::kBoxSub, "php2ir_rt_box_sub", T::kBox, {T::kBox, T::kBox});
            def(RtFn::kBoxMul, "php2ir_rt_box_mul", T::kBox, {T::kBox, T::kBox});
            def(RtFn::kBoxDiv, "php2ir_rt_box_div", T::kBox, {T::kBox, T::kBox});
            def(RtFn::kBoxPow, "php2ir_rt_box_pow", T::kBox, {T::kBox, T::kBox});
            def(RtFn::kBoxNeg, "php2ir_rt_box_neg", T::kBox, {T::kBox});
            def(RtFn::kBoxInstanceOf, "php2ir_rt_box_instanceof", T::kI1, {T::kBox, T::kPtr});

            def(RtFn::kArrNew, "php2ir_rt_arr_new", T::kArr, {});
            def(RtFn::kArrGet, "php2ir_rt_arr_get", T::kBox, {T::kArr, T::kBox});
            def(RtFn::kArrGetInt, "php2ir_rt_arr_get_int", T::kBox, {T::kArr, T::kI64});
            def(RtFn::kArrSet, "php2ir_rt_arr_set", T::kArr, {T::kArr, T::kBox, T::kBox}, 0b101);
            def(RtFn::kArrSetInt, "php2ir_rt_arr_set_int", T::kArr, {T::kArr, T::kI64, T::kBox}, 0b101);
            def(RtFn::kArrPush, "php2ir_rt_arr_push", T::kArr, {T::kArr, T::kBox}, 0b11);
            def(RtFn::kArrCount, "php2ir_rt_arr_count", T::kI64, {T::kArr});
            def(RtFn::kArrKeyAt, "php2ir_rt_arr_key_at", T::kBox, {T::kArr, T::kI64});
            def(RtFn::kArrValueAt, "php2ir_rt_arr_value_at", T::kBox, {T::kArr, T::kI64});
            def(RtFn::kArrIdentical, "php2ir_rt_arr_identical", T::kI1, {T::kArr, T::kArr});

            def(RtFn::kObjNew, "php2ir_rt_obj_new", T::kObj, {T::kPtr});
            def(RtFn::kObjInstanceOf, "php2ir_rt_obj_instanceof", T::kI1, {T::kObj, T::kPtr});
            def(RtFn::kPropGetDyn, "php2ir_rt_prop_get_dyn", T::kBox, {T::kBox, T::kStr}, 0, true);
            def(RtFn::kPropSetDyn, "php2ir_rt_prop_set_dyn", T::kVoid, {T::kBox, T::kStr, T::kBox}, 0b100, true);
            def(RtFn::kCallDyn, "php2ir_rt_call_dyn", T::kBox, {T::kBox, T::kStr, T::kArr}, 0b100, true);

            def(RtFn::kIPow, "php2ir_rt_ipow", T::kI64, {T::kI64, T::kI64});
            def(RtFn::kFPow, "php2ir_rt_fpow", T::kF64, {T::kF64, T::kF64});
            def(RtFn::kAbsInt, "php2ir_rt_abs_int", T::kI64, {T::kI64});
            def(RtFn::kAbsFloat, "php2ir_rt_abs_float", T::kF64, {T::kF64});
            def(RtFn::kSqrt, "php2ir_rt_sqrt", T::kF64, {T::kF64});
            def(RtFn::kSin, "php2ir_rt_sin", T::kF64, {T::kF64});
            def(RtFn::kCos, "php2ir_rt_cos", T::kF64, {T::kF64});
            def(RtFn::kFloor, "php2ir_rt_floor", T::kF64, {T::kF64});
            return t;
        }

    } // namespace

    const std::vector<RtFnInfo>& rt_table() {
        static const std::vector<RtFnInfo> table = build_table_();
        return table;
    }

    const RtFnInfo& rt_info(RtFn f) {
        return rt_table()[static_cast<size_t>(f)];
    }

    SlotKind slot_kind(lir::Type t) {
        switch (t) {
            case lir::Type::kI1:  return SlotKind::kBool;
            case lir::Type::kI64: return SlotKind::kInt;
            case lir::Type::kF64: return SlotKind::kFloat;
            case lir::Type::kStr: return SlotKind::kStr;
            case lir::Type::kArr: return SlotKind::kArr;
            case lir::Type::kObj: return SlotKind::kObj;
            default:              return SlotKind::kBox;
        }
    }

    // ---- mangling ----

    std::string sanitize(std::string_view s) {
        std::string out;
        out.reserve(s.size());
        for (char c : s) {
            const unsigned char u = static_cast<unsigned char>(c);
            out.push_back((std::isalnum(u) || c == '_') ? static_cast<char>(std::tolower(u)) : '_');
        }
        return out;
    }

    std::string mangle_function(std::string_view name) {
        return "php_fn_" + sanitize(sema::fold_name(name));
    }

    std::string mangle_method(std::string_view cls, std::string_view method) {
        return "php_m_" + sanitize(cls) + "__" + sanitize(method);
    }

    std::string mangle_adapter(std::string_view cls, std::string_view method) {
        return "php_dyn_" + sanitize(cls) + "__" + sanitize(method);
    }

    std::string mangle_class(std::string_view cls) {
        return "php_class_" + sanitize(cls);
    }

    std::string mangle_main(std::string_view unit) {
        return "php_main_" + sanitize(unit);
    }

    std::string format_float(double v) {
        char buf[64];
        std::snprintf(buf, sizeof(buf), "%.14G", v);
        std::string s(buf);
        // PHP spells exponents as 1.0E+25
        const size_t e = s.find('E');
        if (e != std::string::npos && s.find('.') == std::string::npos) s.insert(e, ".0");
        return s;
    }

} // namespace php2ir::rt
