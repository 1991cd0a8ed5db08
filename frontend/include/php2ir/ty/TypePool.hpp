// frontend/include/php2ir/ty/TypePool.hpp
#pragma once
#include <php2ir/ty/Type.hpp>

#include <string>
#include <string_view>
#include <vector>


namespace php2ir::ty {

    /// @brief 번역 단위 하나의 타입 인터너. 같은 구조는 같은 TypeId를 받는다.
    ///        다른 단위와 타입을 주고받을 때는 to_string()/parse() 표기를 쓴다.
    class TypePool {
    public:
        TypePool();

        TypeId error() const { return error_; }
        TypeId builtin(Builtin b) const { return builtin_ids_[static_cast<uint32_t>(b)]; }

        TypeId null()   const { return builtin(Builtin::kNull); }
        TypeId void_()  const { return builtin(Builtin::kVoid); }
        TypeId never()  const { return builtin(Builtin::kNever); }
        TypeId bool_()  const { return builtin(Builtin::kBool); }
        TypeId int_()   const { return builtin(Builtin::kInt); }
        TypeId float_() const { return builtin(Builtin::kFloat); }
        TypeId string() const { return builtin(Builtin::kString); }
        TypeId mixed()  const { return builtin(Builtin::kMixed); }

        TypeId nullable(TypeId elem);
        TypeId array(TypeId elem, ArrayShape shape = ArrayShape::kAny);
        TypeId object(std::string_view class_name, bool exact = false);

        const Type& get(TypeId id) const { return types_[id]; }
        uint32_t count() const { return static_cast<uint32_t>(types_.size()); }

        bool is_error(TypeId id) const;
        bool is_builtin(TypeId id, Builtin b) const;
        bool is_mixed(TypeId id) const { return is_builtin(id, Builtin::kMixed); }
        bool is_scalar(TypeId id) const;       // bool/int/float
        bool is_numeric(TypeId id) const;      // int/float
        bool is_array(TypeId id) const;
        bool is_object(TypeId id) const;       // T or ?T where T is object
        bool is_nullable(TypeId id) const;
        bool can_be_null(TypeId id) const;     // null, ?T, mixed

        /// @brief ?T -> T, 나머지는 그대로.
        TypeId non_null(TypeId id) const;
        /// @brief exact 표시를 지운 object 타입. object가 아니면 그대로.
        TypeId inexact(TypeId id);
        /// @brief 배열 원소 타입. 배열이 아니면 mixed.
        TypeId elem_of(TypeId id) const;
        /// @brief object / ?object 의 클래스 이름. 아니면 빈 문자열.
        std::string_view class_of(TypeId id) const;

        /// @brief 로컬 추론 격자에서의 합류. 다르면 mixed로 떨어진다.
        TypeId join(TypeId a, TypeId b);

        /// @brief 정규 표기: int, ?string, list<int>, map<mixed>, array<int>, Foo, Foo!
        std::string to_string(TypeId id) const;

        /// @brief to_string() 표기를 다시 intern 한다. 실패 시 error().
        TypeId parse(std::string_view text);

    private:
        TypeId intern_(const Type& t);
        TypeId parse_rec_(std::string_view& s);

        std::vector<Type> types_;
        TypeId error_ = kInvalidType;
        TypeId builtin_ids_[8]{};
    };

} // namespace php2ir::ty
