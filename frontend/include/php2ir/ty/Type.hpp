// frontend/include/php2ir/ty/Type.hpp
#pragma once
#include <cstdint>
#include <string>


namespace php2ir::ty {

    using TypeId = uint32_t;
    inline constexpr TypeId kInvalidType = 0xFFFF'FFFFu;

    enum class Builtin : uint8_t {
        kNull,
        kVoid,
        kNever,

        kBool,
        kInt,     // 64-bit signed
        kFloat,   // IEEE double
        kString,

        // dynamic fallback. values of this type are boxed at runtime.
        kMixed,
    };

    enum class Kind : uint8_t {
        kError,
        kBuiltin,
        kNullable,  // ?T
        kArray,     // array<T>, list<T>, map<T>
        kObject,    // class / interface instance
    };

    /// @brief 배열 값의 모양. 힌트 `array`는 kAny, 리터럴은 키 유무로 정해진다.
    enum class ArrayShape : uint8_t {
        kAny,
        kList,   // packed vector, int keys 0..n-1
        kMap,    // ordered hash table
    };

    struct Type {
        Kind kind = Kind::kError;

        // kBuiltin
        Builtin builtin = Builtin::kNull;

        // kNullable / kArray
        TypeId elem = kInvalidType;

        // kArray
        ArrayShape shape = ArrayShape::kAny;

        // kObject
        std::string class_name{};
        // kObject: the value is known to be an instance of exactly class_name
        // (it came straight from `new`), so method calls can bind statically.
        bool exact = false;
    };

} // namespace php2ir::ty
