// frontend/include/php2ir/lir/Type.hpp
#pragma once
#include <php2ir/cfg/CFG.hpp>

#include <cstdint>
#include <string_view>


namespace php2ir::lir {

    /// @brief 기계 수준 타입. str/arr/obj/box는 참조 카운트되는 포인터 크기 핸들이다.
    ///        null box는 nullptr 핸들이고, 여기에 대한 retain/release는 아무 일도 하지 않는다.
    enum class Type : uint8_t {
        kVoid,
        kI1,
        kI64,
        kF64,
        kPtr,   // class descriptor / code pointer (not counted)
        kStr,
        kArr,
        kObj,
        kBox,
    };

    inline bool is_handle(Type t) {
        return t == Type::kStr || t == Type::kArr || t == Type::kObj || t == Type::kBox;
    }
    std::string_view type_name(Type t);
    Type type_of(cfg::Repr r);

} // namespace php2ir::lir
