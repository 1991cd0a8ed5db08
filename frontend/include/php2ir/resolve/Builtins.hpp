// frontend/include/php2ir/resolve/Builtins.hpp
#pragma once
#include <php2ir/resolve/Resolve.hpp>
#include <php2ir/sema/SymbolTable.hpp>

#include <cstdint>
#include <string_view>
#include <vector>


namespace php2ir::resolve {

    struct BuiltinInfo {
        std::string_view name{};
        BuiltinFn id = BuiltinFn::kNone;
        uint32_t min_args = 0;
        uint32_t max_args = 0;
        bool may_throw = false;
    };

    /// @brief 내장 함수 표. 이름은 대소문자를 구분하지 않는다.
    const BuiltinInfo* find_builtin(std::string_view name);
    const BuiltinInfo& builtin_info(BuiltinFn id);

    /// @brief PHP_EOL, PHP_INT_MAX, M_PI 같은 전역 상수.
    bool find_constant(std::string_view name, sema::DefaultValue& out);

    // ---- C prototypes for #[ffi] ----

    enum class CType : uint8_t {
        kVoid,
        kDouble,
        kInt64,     // long, int64_t, long long
        kInt32,     // int
        kBool,
    };

    struct CPrototype {
        bool ok = false;
        CType ret = CType::kVoid;
        std::string name{};
        std::vector<CType> params{};
        std::string error{};
    };

    /// @brief "double pow(double, double)" 형태의 C 선언 한 줄을 읽는다.
    CPrototype parse_c_prototype(std::string_view text);

    std::string_view ctype_name(CType t);

} // namespace php2ir::resolve
